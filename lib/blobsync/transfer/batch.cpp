/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <blobsync/json.hpp>
#include <blobsync/logger.hpp>
#include <blobsync/transfer/batch.hpp>

namespace blobsync::transfer {
    std::string_view direction_name(const direction dir)
    {
        switch (dir) {
            case direction::upload: return "upload";
            case direction::download: return "download";
            default: throw error(fmt::format("unsupported direction: {}", static_cast<int>(dir)));
        }
    }

    time_point parse_timestamp(const std::string_view ts)
    {
        std::tm tm {};
        std::istringstream is { std::string { ts } };
        is >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (is.fail())
            throw error("invalid timestamp: '{}'", ts);
        if (is.peek() == '.') {
            is.get();
            while (std::isdigit(is.peek()))
                is.get();
        }
        long offset = 0;
        const auto zone = is.get();
        if (zone == '+' || zone == '-') {
            int hh = 0, mm = 0;
            char sep = 0;
            is >> hh >> sep >> mm;
            if (is.fail() || sep != ':')
                throw error("invalid timezone offset in timestamp: '{}'", ts);
            offset = (hh * 3600L + mm * 60L) * (zone == '+' ? 1 : -1);
        } else if (zone != 'Z' && zone != 'z') {
            throw error("timestamp must end with a timezone designator: '{}'", ts);
        }
        if (is.peek() != std::char_traits<char>::eof())
            throw error("unexpected trailing characters in timestamp: '{}'", ts);
        const auto utc = timegm(&tm);
        if (utc == static_cast<std::time_t>(-1))
            throw error("timestamp is out of the supported range: '{}'", ts);
        return std::chrono::system_clock::from_time_t(utc - offset);
    }

    std::string encode_request(const direction dir, const std::vector<object_spec> &objects)
    {
        json::array j_objects {};
        for (const auto &obj: objects) {
            j_objects.emplace_back(json::object {
                { "oid", obj.oid },
                { "size", obj.size }
            });
        }
        return json::serialize(json::object {
            { "operation", direction_name(dir) },
            { "transfers", json::array { "basic" } },
            { "objects", std::move(j_objects) }
        });
    }

    static action decode_action(const json::object &j_act, const time_point now)
    {
        action act { json::value_at<std::string>(j_act, "href") };
        if (const auto *j_hdr = j_act.if_contains("header"); j_hdr && !j_hdr->is_null()) {
            for (const auto &kv: j_hdr->as_object())
                act.header.emplace(kv.key(), json::value_to<std::string>(kv.value()));
        }
        // a relative lifetime is immune to clock skew between the client and the server
        if (const auto *j_in = j_act.if_contains("expires_in"); j_in && !j_in->is_null()) {
            const auto secs = json::value_to<int64_t>(*j_in);
            if (secs > 0)
                act.expires_at = now + std::chrono::seconds { secs };
        }
        if (!act.expires_at) {
            if (const auto *j_at = j_act.if_contains("expires_at"); j_at && !j_at->is_null()) {
                const auto ts = json::value_to<std::string>(*j_at);
                // the zero time means "no expiry"
                if (!ts.empty() && !ts.starts_with("0001-01-01"))
                    act.expires_at = parse_timestamp(ts);
            }
        }
        return act;
    }

    batch_response decode_response(const std::string_view body, const time_point now)
    {
        const auto j = json::parse(body);
        if (!j.is_object())
            throw error("batch response must be a JSON object");
        const auto *j_objects = j.as_object().if_contains("objects");
        if (!j_objects || !j_objects->is_array())
            throw error("batch response does not contain an objects array");
        batch_response res {};
        for (const auto &j_item: j_objects->as_array()) {
            const auto &j_obj = j_item.as_object();
            object_resource obj { json::value_at<std::string>(j_obj, "oid"), json::value_or<uint64_t>(j_obj, "size", 0) };
            if (!cas::oid::valid(obj.oid))
                throw error("batch response contains an invalid oid: '{}'", obj.oid);
            if (const auto *j_acts = j_obj.if_contains("actions"); j_acts && !j_acts->is_null()) {
                for (const auto &kv: j_acts->as_object())
                    obj.actions.emplace(kv.key(), decode_action(kv.value().as_object(), now));
            }
            if (const auto *j_err = j_obj.if_contains("error"); j_err && !j_err->is_null()) {
                const auto &j_err_obj = j_err->as_object();
                obj.error = object_error { json::value_or<int>(j_err_obj, "code", 0), json::value_or<std::string>(j_err_obj, "message", "") };
            }
            auto oid = obj.oid;
            res.insert_or_assign(std::move(oid), std::move(obj));
        }
        return res;
    }

    batch_client::batch_client(http::transport &transport, std::string endpoint, http::header_map headers):
        _transport { transport },
        _url { fmt::format("{}/objects/batch", endpoint.ends_with('/') ? endpoint.substr(0, endpoint.size() - 1) : endpoint) },
        _headers { std::move(headers) }
    {
    }

    batch_response batch_client::_authorize_impl(const direction dir, const std::vector<object_spec> &objects)
    {
        auto headers = _headers;
        headers.insert_or_assign("Accept", std::string { media_type });
        headers.insert_or_assign("Content-Type", std::string { media_type });
        logger::debug("batch {} request for {} objects to {}", dir, objects.size(), _url);
        http::response resp {};
        try {
            resp = _transport.post_json(_url, headers, encode_request(dir, objects));
        } catch (const std::exception &ex) {
            throw error_authorization(fmt::format("batch {} request to {} failed", dir, _url), ex);
        }
        if (!resp.ok()) {
            std::string msg {};
            try {
                const auto j = json::parse(resp.body);
                if (j.is_object())
                    msg = json::value_or<std::string>(j.as_object(), "message", "");
            } catch (const std::exception &ex) {
                logger::debug("batch error response from {} is not valid JSON: {}", _url, ex.what());
            }
            throw error_authorization("batch {} request to {} failed with HTTP status {}{}{}", dir, _url, resp.status,
                msg.empty() ? "" : ": ", msg);
        }
        try {
            auto res = decode_response(resp.body);
            logger::debug("batch {} response from {} describes {} objects", dir, _url, res.size());
            return res;
        } catch (const std::exception &ex) {
            throw error_authorization(fmt::format("batch {} response from {} is malformed", dir, _url), ex);
        }
    }
}
