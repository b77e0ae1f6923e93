/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <array>
#include <charconv>
#include <blobsync/logger.hpp>
#include <blobsync/pointer.hpp>

namespace blobsync {
    static constexpr std::array<std::string_view, 2> legacy_versions {
        "https://hawser.github.com/spec/v1",
        "http://git-media.io/v/2"
    };

    static uint64_t parse_size(const std::string_view text)
    {
        uint64_t sz = 0;
        if (text.empty() || text.front() == '+' || text.front() == '-')
            throw error("invalid pointer size: '{}'", text);
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), sz);
        if (ec != std::errc {} || ptr != text.data() + text.size())
            throw error("invalid pointer size: '{}'", text);
        return sz;
    }

    pointer pointer::decode(const std::string_view text)
    {
        if (text.size() > max_size)
            throw error("pointer data is too large: {} bytes", text.size());
        std::optional<std::string> version {};
        std::optional<cas::oid> id {};
        std::optional<uint64_t> size {};
        std::string_view prev_key {};
        size_t line_no = 0;
        for (size_t pos = 0; pos < text.size(); ) {
            auto end = text.find('\n', pos);
            if (end == text.npos)
                end = text.size();
            const auto line = text.substr(pos, end - pos);
            pos = end + 1;
            ++line_no;
            const auto sep = line.find(' ');
            if (sep == line.npos || sep == 0)
                throw error("pointer line {} is not a key-value pair: '{}'", line_no, line);
            const auto key = line.substr(0, sep);
            const auto val = line.substr(sep + 1);
            if (line_no == 1) {
                if (key != "version")
                    throw error("pointer must start with a version but got '{}'", key);
                if (val == version_latest || std::find(legacy_versions.begin(), legacy_versions.end(), val) != legacy_versions.end())
                    version.emplace(version_latest);
                else
                    throw error("unsupported pointer version: '{}'", val);
                continue;
            }
            if (key <= prev_key)
                throw error("pointer keys are out of order: '{}' after '{}'", key, prev_key);
            prev_key = key;
            if (key == "oid") {
                const auto type_sep = val.find(':');
                if (type_sep == val.npos || val.substr(0, type_sep) != oid_type)
                    throw error("unsupported pointer oid: '{}'", val);
                id.emplace(cas::oid::from_hex(val.substr(type_sep + 1)));
            } else if (key == "size") {
                size.emplace(parse_size(val));
            } else {
                throw error("unsupported pointer key: '{}'", key);
            }
        }
        if (!version)
            throw error("pointer data is empty");
        if (!id)
            throw error("pointer does not have an oid");
        if (!size)
            throw error("pointer does not have a size");
        return pointer { std::move(*id), *size, std::move(*version) };
    }

    std::optional<pointer> pointer::try_decode(const std::string_view text)
    {
        try {
            return decode(text);
        } catch (const error &ex) {
            logger::trace("not a pointer: {}", ex.what());
            return {};
        }
    }

    std::string pointer::encode() const
    {
        return fmt::format("version {}\noid {}:{}\nsize {}\n", version, oid_type, oid, size);
    }

    cleaned clean(cas::store &store, file::source &src, const std::string &name, const uint64_t size, const copy_callback &cb)
    {
        auto st = store.stage();
        const auto num_read = st.write_all(src, cb, size);
        if (size != 0 && num_read != size)
            logger::debug("{}: declared size {} differs from the {} bytes read", name, size, num_read);
        auto id = st.commit();
        logger::debug("cleaned {}: {} bytes with oid {}", name, num_read, id);
        return cleaned { pointer { std::move(id), num_read }, std::move(st) };
    }

    file::read_stream smudge(const cas::store &store, const cas::oid &oid)
    {
        return store.open(oid);
    }

    uint64_t smudge_to(const cas::store &store, const pointer &ptr, file::write_stream &os, const copy_callback &cb)
    {
        auto is = smudge(store, ptr.oid);
        std::array<uint8_t, cas::store::copy_chunk_size> buf;
        uint64_t num_copied = 0;
        for (;;) {
            const auto n = is.try_read(buf);
            if (n == 0)
                break;
            os.write(std::span { buf.data(), n });
            num_copied += n;
            if (cb)
                cb(ptr.size, num_copied, n);
        }
        if (num_copied != ptr.size)
            throw error_integrity("object {} has {} bytes but its pointer declares {}", ptr.oid, num_copied, ptr.size);
        return num_copied;
    }

    void reconcile(cas::store &store, const cas::oid &expected, const std::filesystem::path &working_path)
    {
        if (store.exists(expected))
            return;
        file::read_stream is { working_path.string() };
        auto res = clean(store, is, working_path.string(), is.size());
        res.teardown();
        if (res.ptr.oid != expected)
            throw error_integrity("trying to push {} with oid {} but its content hashes to {}; the object is not found in {}",
                working_path.string(), expected, res.ptr.oid, store.root().string());
    }
}
