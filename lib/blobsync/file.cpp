/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <iostream>
#include <random>
#include <unistd.h>
#include <blobsync/file.hpp>
#include <blobsync/logger.hpp>

namespace blobsync::file {
    read_stream::read_stream(const std::string &path): _path { path }, _f { std::fopen(path.c_str(), "rb") }
    {
        if (!_f)
            throw error_sys("failed to open for reading: {}", path);
    }

    read_stream::read_stream(read_stream &&o) noexcept: _path { std::move(o._path) }, _f { o._f }
    {
        o._f = nullptr;
    }

    read_stream::~read_stream()
    {
        if (_f)
            std::fclose(_f);
    }

    uint64_t read_stream::size() const
    {
        return std::filesystem::file_size(_path);
    }

    void read_stream::seek(const uint64_t off)
    {
        if (fseeko(_f, static_cast<off_t>(off), SEEK_SET) != 0)
            throw error_sys("failed to seek to offset {} in {}", off, _path);
    }

    void read_stream::close()
    {
        if (_f) {
            const auto res = std::fclose(_f);
            _f = nullptr;
            if (res != 0)
                throw error_sys("failed to close {}", _path);
        }
    }

    size_t read_stream::_try_read_impl(const std::span<uint8_t> buf)
    {
        if (!_f)
            throw error("read_stream for {} has been already closed", _path);
        const auto num_read = std::fread(buf.data(), 1, buf.size(), _f);
        if (num_read < buf.size() && std::ferror(_f))
            throw error_sys("failed to read from {}", _path);
        return num_read;
    }

    write_stream::write_stream(const std::string &path): _path { path }, _f { std::fopen(path.c_str(), "wb") }
    {
        if (!_f)
            throw error_sys("failed to open for writing: {}", path);
    }

    write_stream::write_stream(write_stream &&o) noexcept: _path { std::move(o._path) }, _f { o._f }
    {
        o._f = nullptr;
    }

    write_stream::~write_stream()
    {
        if (_f)
            std::fclose(_f);
    }

    void write_stream::write(const std::span<const uint8_t> data)
    {
        if (!_f)
            throw error("write_stream for {} has been already closed", _path);
        if (!data.empty() && std::fwrite(data.data(), 1, data.size(), _f) != data.size())
            throw error_sys("failed to write {} bytes to {}", data.size(), _path);
    }

    void write_stream::write(const std::string_view data)
    {
        write(std::span { reinterpret_cast<const uint8_t *>(data.data()), data.size() });
    }

    void write_stream::sync()
    {
        if (!_f)
            throw error("write_stream for {} has been already closed", _path);
        if (std::fflush(_f) != 0)
            throw error_sys("failed to flush {}", _path);
        if (fsync(fileno(_f)) != 0)
            throw error_sys("failed to fsync {}", _path);
    }

    void write_stream::close()
    {
        if (_f) {
            const auto res = std::fclose(_f);
            _f = nullptr;
            if (res != 0)
                throw error_sys("failed to close {}", _path);
        }
    }

    size_t memory_source::_try_read_impl(const std::span<uint8_t> buf)
    {
        const auto n = std::min(buf.size(), _data.size() - _pos);
        if (n > 0) {
            std::memcpy(buf.data(), _data.data() + _pos, n);
            _pos += n;
        }
        return n;
    }

    void tmp::remove() noexcept
    {
        if (_active) {
            _active = false;
            std::error_code ec {};
            std::filesystem::remove(_path, ec);
            if (ec) {
                // runs in destructors, so a failing logger must not propagate
                try {
                    logger::warn("failed to remove the temporary file {}: {}", _path.string(), ec.message());
                } catch (const std::exception &ex) {
                    std::cerr << "failed to remove the temporary file " << _path.string() << ": " << ec.message()
                        << " (logging failed: " << ex.what() << ")\n";
                }
            }
        }
    }

    bytes read(const std::string &path)
    {
        read_stream is { path };
        bytes buf(is.size());
        size_t off = 0;
        while (off < buf.size()) {
            const auto n = is.try_read(std::span { buf.data() + off, buf.size() - off });
            if (n == 0)
                throw error("file {} was truncated while being read: expected {} bytes but got {}", path, buf.size(), off);
            off += n;
        }
        return buf;
    }

    std::string read_string(const std::string &path)
    {
        const auto buf = read(path);
        return { reinterpret_cast<const char *>(buf.data()), buf.size() };
    }

    void write(const std::string &path, const std::span<const uint8_t> data)
    {
        write_stream os { path };
        os.write(data);
        os.close();
    }

    void write(const std::string &path, const std::string_view data)
    {
        write(path, std::span { reinterpret_cast<const uint8_t *>(data.data()), data.size() });
    }

    std::filesystem::path unique_path(const std::filesystem::path &dir, const std::string_view prefix)
    {
        static std::atomic_uint64_t counter { 0 };
        thread_local std::mt19937_64 rnd { std::random_device {}() };
        const auto ts = std::chrono::system_clock::now().time_since_epoch().count();
        return dir / fmt::format("{}-{}-{}-{:016x}.tmp", prefix, getpid(), ts, rnd() ^ counter.fetch_add(1));
    }
}
