/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_HTTP_CLIENT_HPP
#define BLOBSYNC_HTTP_CLIENT_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <blobsync/file.hpp>

namespace blobsync::http {
    using header_map = std::map<std::string, std::string>;
    using chunk_sink = std::function<void(std::span<const uint8_t>)>;
    // bytes sent so far and the size of the last chunk
    using send_progress = std::function<void(uint64_t so_far, size_t chunk)>;

    struct response {
        unsigned status = 0;
        std::string body {};

        bool ok() const
        {
            return status >= 200 && status < 300;
        }
    };

    struct url_parts {
        std::string host {};
        std::string port {};
        std::string target {};
    };

    extern url_parts parse_url(const std::string &url);

    // Raw HTTP operations needed by transfers. Network-level failures are reported as exceptions,
    // HTTP-level failures as a non-2xx status of the response.
    struct transport {
        virtual ~transport() =default;

        response post_json(const std::string &url, const header_map &headers, const std::string &body)
        {
            return _post_json_impl(url, headers, body);
        }

        // the sink receives the body only for successful responses; otherwise the body is returned
        response get(const std::string &url, const header_map &headers, const chunk_sink &sink)
        {
            return _get_impl(url, headers, sink);
        }

        response put(const std::string &url, const header_map &headers, const uint64_t size, file::source &src, const send_progress &progress)
        {
            return _put_impl(url, headers, size, src, progress);
        }
    private:
        virtual response _post_json_impl(const std::string &url, const header_map &headers, const std::string &body) =0;
        virtual response _get_impl(const std::string &url, const header_map &headers, const chunk_sink &sink) =0;
        virtual response _put_impl(const std::string &url, const header_map &headers, uint64_t size, file::source &src, const send_progress &progress) =0;
    };

    // Synchronous HTTP/1.1 client. Every request uses its own connection and I/O context,
    // so a single instance can be shared by many worker threads.
    struct client: transport {
        static constexpr size_t chunk_size = 1 << 16;

        explicit client(std::chrono::seconds timeout=std::chrono::seconds { 30 });
        ~client() override;
    private:
        struct impl;
        std::unique_ptr<impl> _impl;

        response _post_json_impl(const std::string &url, const header_map &headers, const std::string &body) override;
        response _get_impl(const std::string &url, const header_map &headers, const chunk_sink &sink) override;
        response _put_impl(const std::string &url, const header_map &headers, uint64_t size, file::source &src, const send_progress &progress) override;
    };
}

#endif // !BLOBSYNC_HTTP_CLIENT_HPP
