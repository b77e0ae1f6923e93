/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_TRANSFER_BATCH_HPP
#define BLOBSYNC_TRANSFER_BATCH_HPP

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <blobsync/cas.hpp>
#include <blobsync/http/client.hpp>

namespace blobsync::transfer {
    enum class direction { upload, download };

    using time_point = std::chrono::system_clock::time_point;

    // A single authorized operation granted by the remote: where to send the request and with which headers.
    struct action {
        std::string href {};
        http::header_map header {};
        std::optional<time_point> expires_at {};

        bool expired(const time_point now=std::chrono::system_clock::now()) const
        {
            return expires_at && now >= *expires_at;
        }

        bool operator==(const action &o) const =default;
    };

    struct object_error {
        int code = 0;
        std::string message {};

        bool operator==(const object_error &o) const =default;
    };

    // The remote's answer for one object: either a set of named actions or an object-level error.
    // An upload resource without actions means the remote already has the object.
    struct object_resource {
        std::string oid {};
        uint64_t size = 0;
        std::map<std::string, action> actions {};
        std::optional<object_error> error {};

        const action *find_action(const std::string_view name) const
        {
            const auto it = actions.find(std::string { name });
            return it != actions.end() ? &it->second : nullptr;
        }
    };

    struct object_spec {
        std::string oid {};
        uint64_t size = 0;
    };

    using batch_response = std::map<std::string, object_resource>;

    struct batch_authorizer {
        virtual ~batch_authorizer() =default;

        // one round-trip for all given objects; a failure of the request as a whole throws error_authorization
        batch_response authorize(const direction dir, const std::vector<object_spec> &objects)
        {
            return _authorize_impl(dir, objects);
        }
    private:
        virtual batch_response _authorize_impl(direction dir, const std::vector<object_spec> &objects) =0;
    };

    extern std::string encode_request(direction dir, const std::vector<object_spec> &objects);
    extern batch_response decode_response(std::string_view body, time_point now=std::chrono::system_clock::now());
    // parses RFC 3339 UTC timestamps of the form 2006-01-02T15:04:05Z with an optional fraction
    extern time_point parse_timestamp(std::string_view ts);

    // Talks to <endpoint>/objects/batch over the given transport.
    struct batch_client: batch_authorizer {
        static constexpr std::string_view media_type { "application/vnd.git-lfs+json" };

        batch_client(http::transport &transport, std::string endpoint, http::header_map headers={});

        const std::string &url() const
        {
            return _url;
        }
    private:
        http::transport &_transport;
        const std::string _url;
        const http::header_map _headers;

        batch_response _authorize_impl(direction dir, const std::vector<object_spec> &objects) override;
    };

    extern std::string_view direction_name(direction dir);
}

namespace fmt {
    template<>
    struct formatter<blobsync::transfer::direction>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const blobsync::transfer::direction &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", blobsync::transfer::direction_name(v));
        }
    };
}

#endif // !BLOBSYNC_TRANSFER_BATCH_HPP
