/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_CAS_HPP
#define BLOBSYNC_CAS_HPP

#include <chrono>
#include <compare>
#include <filesystem>
#include <optional>
#include <string>
#include <blobsync/file.hpp>
#include <blobsync/progress.hpp>
#include <blobsync/sha2.hpp>

namespace blobsync::cas {
    // Content identifier: the lowercase hex SHA-256 of an object's bytes.
    struct oid {
        static constexpr size_t hex_size = sizeof(sha2::hash_256) * 2;

        static oid from_hex(std::string_view hex);
        static oid from_hash(const sha2::hash_256 &hash);
        static bool valid(std::string_view hex);

        const std::string &hex() const
        {
            return _hex;
        }

        bool operator==(const oid &o) const =default;
        std::strong_ordering operator<=>(const oid &o) const =default;
    private:
        std::string _hex;

        explicit oid(std::string hex): _hex { std::move(hex) }
        {
        }
    };

    struct store;

    // A partially written object. Bytes are hashed while they are written so that the identifier is
    // known without a second pass. The file is removed on destruction unless committed.
    struct staging {
        staging(store &s, std::filesystem::path path);
        staging(staging &&) =default;
        staging(const staging &) =delete;

        const std::filesystem::path &path() const
        {
            return _tmp.path();
        }

        uint64_t size() const
        {
            return _size;
        }

        bool committed() const
        {
            return _oid.has_value();
        }

        void write(std::span<const uint8_t> data);
        // copies the whole source into the staging file, returns the number of bytes copied
        uint64_t write_all(file::source &src, const copy_callback &cb={}, uint64_t expected_size=0);
        // finalizes into the store under the computed identifier
        oid commit();
        // same as commit but fails with error_integrity when the content does not match the expected identifier
        oid commit(const oid &expected);
        // releases the staging file; safe to call on any path and more than once
        void teardown() noexcept;
    private:
        store &_store;
        file::tmp _tmp;
        std::optional<file::write_stream> _os {};
        std::optional<sha2::hasher> _hasher {};
        uint64_t _size = 0;
        std::optional<oid> _oid {};

        oid _finalize();
        void _install(const oid &id);
    };

    struct store {
        static constexpr size_t copy_chunk_size = 1 << 16;

        explicit store(const std::filesystem::path &root);

        const std::filesystem::path &root() const
        {
            return _root;
        }

        // <root>/objects/<oid[0:2]>/<oid[2:4]>/<oid>; pure, no I/O
        std::filesystem::path locate(const oid &id) const;
        bool exists(const oid &id) const;
        uint64_t size(const oid &id) const;
        staging stage();
        uint64_t write(const oid &id, file::source &src, const copy_callback &cb={});
        file::read_stream open(const oid &id) const;
        // rehashes the stored content
        bool verify(const oid &id) const;
        // removes staging files of crashed or aborted writers older than the given age
        size_t remove_stale_staging(std::chrono::seconds age);

        const std::filesystem::path &staging_dir() const
        {
            return _staging_dir;
        }
    private:
        const std::filesystem::path _root;
        const std::filesystem::path _objects_dir;
        const std::filesystem::path _staging_dir;
    };
}

namespace fmt {
    template<>
    struct formatter<blobsync::cas::oid>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const blobsync::cas::oid &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return formatter<std::string_view>::format(v.hex(), ctx);
        }
    };
}

#endif // !BLOBSYNC_CAS_HPP
