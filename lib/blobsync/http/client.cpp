/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <array>
#include <limits>
#include <optional>
#ifdef __clang__
#   pragma GCC diagnostic push
#   pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#define BOOST_ASIO_HAS_STD_INVOKE_RESULT 1
#ifndef BOOST_ALLOW_DEPRECATED_HEADERS
#   define BOOST_ALLOW_DEPRECATED_HEADERS
#   define BLOBSYNC_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#ifdef BLOBSYNC_CLEAR_BOOST_DEPRECATED_HEADERS
#   undef BOOST_ALLOW_DEPRECATED_HEADERS
#   undef BLOBSYNC_CLEAR_BOOST_DEPRECATED_HEADERS
#endif
#ifdef __clang__
#   pragma GCC diagnostic pop
#endif
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/url.hpp>
#include <blobsync/http/client.hpp>
#include <blobsync/logger.hpp>

namespace blobsync::http {
    namespace beast = boost::beast;
    namespace bhttp = beast::http;
    namespace net = boost::asio;
    using tcp = boost::asio::ip::tcp;

    template<typename S>
    static std::string as_string(const S &s)
    {
        return std::string { s.data(), s.size() };
    }

    url_parts parse_url(const std::string &url)
    {
        const auto parsed = boost::urls::parse_uri(url);
        if (parsed.has_error())
            throw error("invalid url {}: {}", url, parsed.error().message());
        const auto &uri = *parsed;
        if (uri.scheme() != "http")
            throw error("only http urls are supported but got {}", url);
        url_parts res {};
        res.host = as_string(uri.encoded_host());
        if (res.host.empty())
            throw error("host component of the url cannot be empty but got {}", url);
        res.port = uri.has_port() ? as_string(uri.port()) : std::string { "80" };
        res.target = as_string(uri.encoded_path());
        if (res.target.empty())
            res.target = "/";
        if (uri.has_query())
            res.target += "?" + as_string(uri.encoded_query());
        return res;
    }

    // One request-response exchange over a fresh connection. Operations are asynchronous under the hood
    // so that beast's stream timeouts apply; each call runs the private I/O context until the operation completes.
    struct session {
        session(const std::string &url, const std::chrono::seconds timeout):
            _url { url }, _parts { parse_url(url) }, _timeout { timeout }
        {
            tcp::resolver resolver { _ioc };
            beast::error_code ec {};
            const auto endpoints = resolver.resolve(_parts.host, _parts.port, ec);
            if (ec)
                throw error("{}: failed to resolve {}:{}: {}", _url, _parts.host, _parts.port, ec.message());
            logger::trace("{}: connecting to {}:{}", _url, _parts.host, _parts.port);
            _run("connect", [&](auto &&handler) {
                _stream.async_connect(endpoints, [handler](const beast::error_code &ec, const tcp::endpoint &) mutable {
                    handler(ec, 0);
                });
            });
        }

        ~session()
        {
            beast::error_code ec {};
            _stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

        template<typename Req>
        void prepare(Req &req, const header_map &headers) const
        {
            req.set(bhttp::field::host, _parts.host);
            req.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
            for (const auto &[name, val]: headers)
                req.set(name, val);
        }

        const url_parts &parts() const
        {
            return _parts;
        }

        void send(bhttp::request<bhttp::string_body> &req)
        {
            _run("write", [&](auto &&handler) {
                bhttp::async_write(_stream, req, std::move(handler));
            });
        }

        response read_response()
        {
            bhttp::response<bhttp::string_body> res {};
            _run("read", [&](auto &&handler) {
                bhttp::async_read(_stream, _buffer, res, std::move(handler));
            });
            return { res.result_int(), std::move(res.body()) };
        }

        response read_streaming(const chunk_sink &sink)
        {
            bhttp::response_parser<bhttp::buffer_body> parser {};
            parser.body_limit(std::numeric_limits<std::uint64_t>::max());
            _run("read header", [&](auto &&handler) {
                bhttp::async_read_header(_stream, _buffer, parser, std::move(handler));
            });
            response res { parser.get().result_int() };
            std::array<uint8_t, client::chunk_size> buf;
            while (!parser.is_done()) {
                parser.get().body().data = buf.data();
                parser.get().body().size = buf.size();
                _run("read body", [&](auto &&handler) {
                    bhttp::async_read(_stream, _buffer, parser, std::move(handler));
                }, true);
                const auto n = buf.size() - parser.get().body().size;
                if (n == 0)
                    continue;
                if (res.ok())
                    sink(std::span<const uint8_t> { buf.data(), n });
                else
                    res.body.append(reinterpret_cast<const char *>(buf.data()), n);
            }
            return res;
        }

        void write_streaming(bhttp::request<bhttp::buffer_body> &req, const uint64_t size, file::source &src, const send_progress &progress)
        {
            req.body().data = nullptr;
            req.body().more = true;
            bhttp::request_serializer<bhttp::buffer_body> sr { req };
            _run("write header", [&](auto &&handler) {
                bhttp::async_write_header(_stream, sr, std::move(handler));
            });
            std::array<uint8_t, client::chunk_size> buf;
            uint64_t sent = 0;
            for (;;) {
                const auto n = src.try_read(buf);
                if (n == 0 && sent != size)
                    throw error("{}: the source ended after {} bytes but {} were announced", _url, sent, size);
                if (sent + n > size)
                    throw error("{}: the source has more than the announced {} bytes", _url, size);
                req.body().data = n ? buf.data() : nullptr;
                req.body().size = n;
                req.body().more = n != 0;
                _run("write body", [&](auto &&handler) {
                    bhttp::async_write(_stream, sr, std::move(handler));
                }, true);
                if (n == 0)
                    break;
                sent += n;
                if (progress)
                    progress(sent, n);
            }
        }
    private:
        const std::string _url;
        const url_parts _parts;
        const std::chrono::seconds _timeout;
        net::io_context _ioc {};
        beast::tcp_stream _stream { _ioc };
        beast::flat_buffer _buffer {};

        template<typename F>
        void _run(const std::string_view what, const F &initiate, const bool need_buffer_ok=false)
        {
            std::optional<beast::error_code> res {};
            _stream.expires_after(_timeout);
            initiate([&res](const beast::error_code &ec, std::size_t) {
                res.emplace(ec);
            });
            _ioc.restart();
            _ioc.run();
            if (!res)
                throw error("{}: {} has not completed", _url, what);
            if (*res && !(need_buffer_ok && *res == bhttp::error::need_buffer))
                throw error("{}: {} failed: {}", _url, what, res->message());
        }
    };

    struct client::impl {
        explicit impl(const std::chrono::seconds timeout): _timeout { timeout }
        {
        }

        response post_json(const std::string &url, const header_map &headers, const std::string &body)
        {
            session s { url, _timeout };
            bhttp::request<bhttp::string_body> req { bhttp::verb::post, s.parts().target, 11 };
            s.prepare(req, headers);
            if (req.find(bhttp::field::content_type) == req.end())
                req.set(bhttp::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
            logger::trace("POST {} with {} bytes", url, body.size());
            s.send(req);
            return s.read_response();
        }

        response get(const std::string &url, const header_map &headers, const chunk_sink &sink)
        {
            session s { url, _timeout };
            bhttp::request<bhttp::string_body> req { bhttp::verb::get, s.parts().target, 11 };
            s.prepare(req, headers);
            req.prepare_payload();
            logger::trace("GET {}", url);
            s.send(req);
            return s.read_streaming(sink);
        }

        response put(const std::string &url, const header_map &headers, const uint64_t size, file::source &src, const send_progress &progress)
        {
            session s { url, _timeout };
            bhttp::request<bhttp::buffer_body> req { bhttp::verb::put, s.parts().target, 11 };
            s.prepare(req, headers);
            if (req.find(bhttp::field::content_type) == req.end())
                req.set(bhttp::field::content_type, "application/octet-stream");
            req.content_length(size);
            logger::trace("PUT {} with {} bytes", url, size);
            s.write_streaming(req, size, src, progress);
            return s.read_response();
        }
    private:
        const std::chrono::seconds _timeout;
    };

    client::client(const std::chrono::seconds timeout): _impl { std::make_unique<impl>(timeout) }
    {
    }

    client::~client() =default;

    response client::_post_json_impl(const std::string &url, const header_map &headers, const std::string &body)
    {
        return _impl->post_json(url, headers, body);
    }

    response client::_get_impl(const std::string &url, const header_map &headers, const chunk_sink &sink)
    {
        return _impl->get(url, headers, sink);
    }

    response client::_put_impl(const std::string &url, const header_map &headers, const uint64_t size, file::source &src, const send_progress &progress)
    {
        return _impl->put(url, headers, size, src, progress);
    }
}
