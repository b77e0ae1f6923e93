/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_JSON_HPP
#define BLOBSYNC_JSON_HPP

#include <boost/json.hpp>
#include <blobsync/file.hpp>

namespace blobsync::json {
    using namespace boost::json;

    inline json::value parse(const std::string_view buf, json::storage_ptr sp={})
    {
        return boost::json::parse(buf, sp);
    }

    inline json::value load(const std::string &path, json::storage_ptr sp={})
    {
        return parse(file::read_string(path), sp);
    }

    // Typed accessors that report the missing or mistyped key instead of a generic boost::json failure.
    template<typename T>
    T value_at(const json::object &obj, const std::string_view key)
    {
        const auto *v = obj.if_contains(key);
        if (!v)
            throw error("json object does not contain the required key '{}'", key);
        try {
            return json::value_to<T>(*v);
        } catch (const std::exception &ex) {
            throw error(fmt::format("json key '{}' has an unexpected type", key), ex);
        }
    }

    template<typename T>
    T value_or(const json::object &obj, const std::string_view key, const T &def)
    {
        if (!obj.contains(key))
            return def;
        return value_at<T>(obj, key);
    }
}

#endif // !BLOBSYNC_JSON_HPP
