/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_FILE_HPP
#define BLOBSYNC_FILE_HPP

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <blobsync/error.hpp>

namespace blobsync::file {
    using bytes = std::vector<uint8_t>;

    // Abstract byte source so that transfers can be fed from files, network bodies, or memory.
    struct source {
        virtual ~source() =default;

        // returns the number of bytes read; zero means the end of the stream
        size_t try_read(const std::span<uint8_t> buf)
        {
            return _try_read_impl(buf);
        }
    private:
        virtual size_t _try_read_impl(std::span<uint8_t> buf) =0;
    };

    struct read_stream: source {
        explicit read_stream(const std::string &path);
        read_stream(read_stream &&o) noexcept;
        read_stream(const read_stream &) =delete;
        ~read_stream() override;

        const std::string &path() const
        {
            return _path;
        }

        uint64_t size() const;
        void seek(uint64_t off);
        void close();
    private:
        std::string _path;
        std::FILE *_f = nullptr;

        size_t _try_read_impl(std::span<uint8_t> buf) override;
    };

    struct write_stream {
        explicit write_stream(const std::string &path);
        write_stream(write_stream &&o) noexcept;
        write_stream(const write_stream &) =delete;
        ~write_stream();

        const std::string &path() const
        {
            return _path;
        }

        void write(std::span<const uint8_t> data);
        void write(std::string_view data);
        // flushes user-space buffers and forces the content to the disk
        void sync();
        void close();
    private:
        std::string _path;
        std::FILE *_f = nullptr;
    };

    // In-memory source, used for the content of small stubs and by tests.
    struct memory_source: source {
        explicit memory_source(const std::span<const uint8_t> data): _data { data }
        {
        }

        explicit memory_source(const std::string_view data):
            _data { reinterpret_cast<const uint8_t *>(data.data()), data.size() }
        {
        }
    private:
        std::span<const uint8_t> _data;
        size_t _pos = 0;

        size_t _try_read_impl(std::span<uint8_t> buf) override;
    };

    // Removes the file on destruction unless it was released.
    struct tmp {
        explicit tmp(std::filesystem::path path): _path { std::move(path) }
        {
        }

        tmp(tmp &&o) noexcept: _path { std::move(o._path) }, _active { o._active }
        {
            o._active = false;
        }

        tmp(const tmp &) =delete;

        ~tmp()
        {
            remove();
        }

        const std::filesystem::path &path() const
        {
            return _path;
        }

        bool active() const
        {
            return _active;
        }

        void release()
        {
            _active = false;
        }

        void remove() noexcept;
    private:
        std::filesystem::path _path;
        bool _active = true;
    };

    extern bytes read(const std::string &path);
    extern std::string read_string(const std::string &path);
    extern void write(const std::string &path, std::span<const uint8_t> data);
    extern void write(const std::string &path, std::string_view data);
    // a random file name in the given directory; the file is not created
    extern std::filesystem::path unique_path(const std::filesystem::path &dir, std::string_view prefix);
}

#endif // !BLOBSYNC_FILE_HPP
