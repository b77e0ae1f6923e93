/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <array>
#include <blobsync/cas.hpp>
#include <blobsync/logger.hpp>

namespace blobsync::cas {
    bool oid::valid(const std::string_view hex)
    {
        if (hex.size() != hex_size)
            return false;
        for (const char c: hex) {
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')))
                return false;
        }
        return true;
    }

    oid oid::from_hex(const std::string_view hex)
    {
        if (!valid(hex))
            throw error("invalid object id: '{}'", hex);
        return oid { std::string { hex } };
    }

    oid oid::from_hash(const sha2::hash_256 &hash)
    {
        return oid { sha2::to_hex(hash) };
    }

    staging::staging(store &s, std::filesystem::path path):
        _store { s }, _tmp { std::move(path) }
    {
        _os.emplace(_tmp.path().string());
        _hasher.emplace();
    }

    void staging::write(const std::span<const uint8_t> data)
    {
        if (!_os)
            throw error("staging file {} is no longer writable", path().string());
        _os->write(data);
        _hasher->update(data);
        _size += data.size();
    }

    uint64_t staging::write_all(file::source &src, const copy_callback &cb, const uint64_t expected_size)
    {
        std::array<uint8_t, store::copy_chunk_size> buf;
        const auto start_size = _size;
        for (;;) {
            const auto n = src.try_read(buf);
            if (n == 0)
                break;
            write(std::span { buf.data(), n });
            if (cb)
                cb(expected_size, _size - start_size, n);
        }
        return _size - start_size;
    }

    oid staging::commit()
    {
        const auto id = _finalize();
        _install(id);
        return id;
    }

    oid staging::commit(const oid &expected)
    {
        const auto id = _finalize();
        if (id != expected) {
            teardown();
            throw error_integrity("content written for object {} hashes to {}", expected, id);
        }
        _install(id);
        return id;
    }

    void staging::teardown() noexcept
    {
        if (_os) {
            // the file is removed right after, so close errors are of no interest
            _os.reset();
        }
        _tmp.remove();
    }

    oid staging::_finalize()
    {
        if (_oid)
            throw error("staging file {} has been already committed", path().string());
        if (!_os)
            throw error("staging file {} has been torn down", path().string());
        _os->close();
        _os.reset();
        return oid::from_hash(_hasher->finalize());
    }

    void staging::_install(const oid &id)
    {
        const auto target = _store.locate(id);
        if (std::filesystem::exists(target)) {
            logger::trace("object {} is already present, dropping the staged copy", id);
            _tmp.remove();
        } else {
            std::filesystem::create_directories(target.parent_path());
            // rename is atomic within one file system, so readers never observe a partial object
            std::filesystem::rename(_tmp.path(), target);
            _tmp.release();
            logger::trace("stored object {} of {} bytes", id, _size);
        }
        _oid.emplace(id);
    }

    store::store(const std::filesystem::path &root):
        _root { std::filesystem::absolute(root) }, _objects_dir { _root / "objects" }, _staging_dir { _root / "tmp" }
    {
        std::filesystem::create_directories(_objects_dir);
        std::filesystem::create_directories(_staging_dir);
    }

    std::filesystem::path store::locate(const oid &id) const
    {
        const auto &hex = id.hex();
        return _objects_dir / hex.substr(0, 2) / hex.substr(2, 2) / hex;
    }

    bool store::exists(const oid &id) const
    {
        std::error_code ec {};
        return std::filesystem::is_regular_file(locate(id), ec);
    }

    uint64_t store::size(const oid &id) const
    {
        std::error_code ec {};
        const auto sz = std::filesystem::file_size(locate(id), ec);
        if (ec)
            throw error_not_found("object {} is not present in the local store: {}", id, ec.message());
        return sz;
    }

    staging store::stage()
    {
        return staging { *this, file::unique_path(_staging_dir, "stage") };
    }

    uint64_t store::write(const oid &id, file::source &src, const copy_callback &cb)
    {
        auto st = stage();
        const auto sz = st.write_all(src, cb);
        st.commit(id);
        return sz;
    }

    file::read_stream store::open(const oid &id) const
    {
        if (!exists(id))
            throw error_not_found("object {} is not present in the local store", id);
        return file::read_stream { locate(id).string() };
    }

    bool store::verify(const oid &id) const
    {
        auto is = open(id);
        sha2::hasher h {};
        std::array<uint8_t, copy_chunk_size> buf;
        for (;;) {
            const auto n = is.try_read(buf);
            if (n == 0)
                break;
            h.update(std::span { buf.data(), n });
        }
        const auto ok = oid::from_hash(h.finalize()) == id;
        if (!ok)
            logger::warn("stored object {} is corrupted", id);
        return ok;
    }

    size_t store::remove_stale_staging(const std::chrono::seconds age)
    {
        size_t num_removed = 0;
        const auto now = std::filesystem::file_time_type::clock::now();
        for (const auto &entry: std::filesystem::directory_iterator(_staging_dir)) {
            if (!entry.is_regular_file())
                continue;
            if (now - entry.last_write_time() >= age) {
                std::error_code ec {};
                if (std::filesystem::remove(entry.path(), ec))
                    ++num_removed;
                else if (ec)
                    logger::warn("failed to remove a stale staging file {}: {}", entry.path().string(), ec.message());
            }
        }
        if (num_removed)
            logger::debug("removed {} stale staging files from {}", num_removed, _staging_dir.string());
        return num_removed;
    }
}
