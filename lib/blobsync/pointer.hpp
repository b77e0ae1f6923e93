/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_POINTER_HPP
#define BLOBSYNC_POINTER_HPP

#include <optional>
#include <string>
#include <blobsync/cas.hpp>

namespace blobsync {
    // The stub that replaces large content in tracked history:
    //   version https://git-lfs.github.com/spec/v1
    //   oid sha256:<hex>
    //   size <bytes>
    struct pointer {
        static constexpr std::string_view version_latest { "https://git-lfs.github.com/spec/v1" };
        static constexpr std::string_view oid_type { "sha256" };
        // anything larger than this cannot be a stub
        static constexpr size_t max_size = 1024;

        static pointer decode(std::string_view text);
        static std::optional<pointer> try_decode(std::string_view text);

        cas::oid oid;
        uint64_t size = 0;
        std::string version { version_latest };

        std::string encode() const;
        bool operator==(const pointer &o) const =default;
    };

    // The result of cleaning a stream. Owns the staging resource used while hashing; teardown runs
    // at the latest on destruction so that every exit path releases it.
    struct cleaned {
        cleaned(pointer p, cas::staging &&st): ptr { std::move(p) }, _staging { std::move(st) }
        {
        }

        cleaned(cleaned &&) =default;

        ~cleaned()
        {
            teardown();
        }

        const std::filesystem::path &staging_path() const
        {
            return _staging.path();
        }

        void teardown() noexcept
        {
            _staging.teardown();
        }

        pointer ptr;
    private:
        cas::staging _staging;
    };

    // Streams the input once, computing its identifier while storing the bytes. Content already present
    // in the store is not written twice. The declared size is informational only, the result carries
    // the number of bytes actually read.
    extern cleaned clean(cas::store &store, file::source &src, const std::string &name, uint64_t size, const copy_callback &cb={});
    extern file::read_stream smudge(const cas::store &store, const cas::oid &oid);
    // copies the content of the pointed-to object into the output and returns the number of bytes copied
    extern uint64_t smudge_to(const cas::store &store, const pointer &ptr, file::write_stream &os, const copy_callback &cb={});
    // Confirms that the store has the object the tracked stub names; when it does not, the working copy is cleaned
    // and must hash to the expected identifier, otherwise error_integrity is thrown.
    extern void reconcile(cas::store &store, const cas::oid &expected, const std::filesystem::path &working_path);
}

namespace fmt {
    template<>
    struct formatter<blobsync::pointer>: formatter<int> {
        template<typename FormatContext>
        auto format(const blobsync::pointer &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "pointer(oid: {} size: {})", v.oid, v.size);
        }
    };
}

#endif // !BLOBSYNC_POINTER_HPP
