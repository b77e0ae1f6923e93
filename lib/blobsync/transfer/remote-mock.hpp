/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_TRANSFER_REMOTE_MOCK_HPP
#define BLOBSYNC_TRANSFER_REMOTE_MOCK_HPP

#include <algorithm>
#include <condition_variable>
#include <map>
#include <optional>
#include <set>
#include <thread>
#include <blobsync/json.hpp>
#include <blobsync/mutex.hpp>
#include <blobsync/transfer/batch.hpp>

namespace blobsync::transfer {
    // An in-memory remote speaking the batch protocol and serving object transfers.
    // Behaves like a well-functioning server unless one of the fault hooks is used.
    struct remote_mock: http::transport {
        static constexpr std::string_view endpoint { "http://remote.mock/api" };
        static constexpr std::string_view objects_url { "http://remote.mock/objects/" };
        static constexpr std::string_view verify_url { "http://remote.mock/verify/" };

        size_t chunk_size = 4096;
        std::chrono::milliseconds chunk_delay { 0 };
        // grant a verify action along with every upload
        bool with_verify = false;
        std::optional<std::string> expires_at {};

        std::string add(const std::string_view content)
        {
            const auto oid = sha2::to_hex(sha2::digest(content));
            mutex::scoped_lock lk { _mutex };
            _objects.insert_or_assign(oid, std::string { content });
            return oid;
        }

        bool has(const std::string &oid) const
        {
            mutex::scoped_lock lk { _mutex };
            return _objects.contains(oid);
        }

        std::string content(const std::string &oid) const
        {
            mutex::scoped_lock lk { _mutex };
            const auto it = _objects.find(oid);
            if (it == _objects.end())
                throw error("remote_mock does not have {}", oid);
            return it->second;
        }

        // the batch endpoint answers with the given status
        void fail_batch(const unsigned status, std::string message={})
        {
            mutex::scoped_lock lk { _mutex };
            _batch_status = status;
            _batch_message = std::move(message);
        }

        // transfers of the object answer with the given status
        void fail_transfer(const std::string &oid, const unsigned status)
        {
            mutex::scoped_lock lk { _mutex };
            _transfer_status.insert_or_assign(oid, status);
        }

        // transfers of the object fail as if the connection dropped
        void break_transfer(const std::string &oid)
        {
            mutex::scoped_lock lk { _mutex };
            _broken.emplace(oid);
        }

        // downloads of the object serve different bytes of the same size
        void corrupt(const std::string &oid)
        {
            mutex::scoped_lock lk { _mutex };
            _corrupt.emplace(oid);
        }

        // the batch response carries an object-level error for the object
        void reject(const std::string &oid, const int code, std::string message)
        {
            mutex::scoped_lock lk { _mutex };
            _rejected.insert_or_assign(oid, object_error { code, std::move(message) });
        }

        // transfers block before their first chunk until release is called
        void hold()
        {
            mutex::scoped_lock lk { _mutex };
            _held = true;
        }

        void release()
        {
            {
                mutex::scoped_lock lk { _mutex };
                _held = false;
            }
            _cv.notify_all();
        }

        // waits until at least n transfers are in progress, false on timeout
        bool wait_in_flight(const size_t n, const std::chrono::seconds timeout=std::chrono::seconds { 10 })
        {
            mutex::unique_lock lk { _mutex };
            return _cv.wait_for(lk, timeout, [&] { return _in_flight >= n; });
        }

        size_t max_in_flight() const
        {
            mutex::scoped_lock lk { _mutex };
            return _max_in_flight;
        }

        size_t batch_requests() const
        {
            mutex::scoped_lock lk { _mutex };
            return _batch_requests;
        }

        size_t batch_objects() const
        {
            mutex::scoped_lock lk { _mutex };
            return _batch_objects;
        }

        size_t transfers() const
        {
            mutex::scoped_lock lk { _mutex };
            return _transfers;
        }

        size_t verifications() const
        {
            mutex::scoped_lock lk { _mutex };
            return _verifications;
        }
    private:
        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _mutex {};
        alignas(mutex::padding) std::condition_variable_any _cv {};
        std::map<std::string, std::string> _objects {};
        std::map<std::string, unsigned> _transfer_status {};
        std::map<std::string, object_error> _rejected {};
        std::set<std::string> _broken {};
        std::set<std::string> _corrupt {};
        unsigned _batch_status = 200;
        std::string _batch_message {};
        bool _held = false;
        size_t _in_flight = 0;
        size_t _max_in_flight = 0;
        size_t _batch_requests = 0;
        size_t _batch_objects = 0;
        size_t _transfers = 0;
        size_t _verifications = 0;

        struct in_flight_guard {
            explicit in_flight_guard(remote_mock &m): _m { m }
            {
                mutex::unique_lock lk { _m._mutex };
                ++_m._transfers;
                _m._max_in_flight = std::max(_m._max_in_flight, ++_m._in_flight);
                _m._cv.notify_all();
                _m._cv.wait(lk, [&] { return !_m._held; });
            }

            ~in_flight_guard()
            {
                {
                    mutex::scoped_lock lk { _m._mutex };
                    --_m._in_flight;
                }
                _m._cv.notify_all();
            }
        private:
            remote_mock &_m;
        };

        json::object _action(const std::string &href) const
        {
            json::object act {
                { "href", href },
                { "header", json::object { { "Authorization", "Basic bW9jazptb2Nr" } } }
            };
            if (expires_at)
                act.emplace("expires_at", *expires_at);
            return act;
        }

        http::response _batch(const std::string &body)
        {
            mutex::scoped_lock lk { _mutex };
            ++_batch_requests;
            if (_batch_status != 200) {
                json::object j_err { { "message", _batch_message } };
                return { _batch_status, json::serialize(j_err) };
            }
            const auto j_req = json::parse(body).as_object();
            const auto op = json::value_at<std::string>(j_req, "operation");
            json::array j_objs {};
            for (const auto &j_item: j_req.at("objects").as_array()) {
                ++_batch_objects;
                const auto oid = json::value_at<std::string>(j_item.as_object(), "oid");
                const auto size = json::value_at<uint64_t>(j_item.as_object(), "size");
                json::object j_obj { { "oid", oid }, { "size", size } };
                if (const auto rej_it = _rejected.find(oid); rej_it != _rejected.end()) {
                    j_obj.emplace("error", json::object { { "code", rej_it->second.code }, { "message", rej_it->second.message } });
                } else if (op == "upload") {
                    if (!_objects.contains(oid)) {
                        json::object j_acts { { "upload", _action(fmt::format("{}{}", objects_url, oid)) } };
                        if (with_verify)
                            j_acts.emplace("verify", _action(fmt::format("{}{}", verify_url, oid)));
                        j_obj.emplace("actions", std::move(j_acts));
                    }
                } else if (_objects.contains(oid)) {
                    j_obj.emplace("actions", json::object { { "download", _action(fmt::format("{}{}", objects_url, oid)) } });
                } else {
                    j_obj.emplace("error", json::object { { "code", 404 }, { "message", "Object does not exist" } });
                }
                j_objs.emplace_back(std::move(j_obj));
            }
            return { 200, json::serialize(json::object { { "objects", std::move(j_objs) } }) };
        }

        http::response _verify(const std::string &body)
        {
            mutex::scoped_lock lk { _mutex };
            ++_verifications;
            const auto j_req = json::parse(body).as_object();
            const auto oid = json::value_at<std::string>(j_req, "oid");
            const auto size = json::value_at<uint64_t>(j_req, "size");
            const auto it = _objects.find(oid);
            if (it == _objects.end() || it->second.size() != size)
                return { 422, "verification failed" };
            return { 200, "" };
        }

        // returns the status to answer with for the object's transfer or throws when the transfer is broken
        std::optional<http::response> _fault(const std::string &oid) const
        {
            mutex::scoped_lock lk { _mutex };
            if (_broken.contains(oid))
                throw error("connection to remote.mock reset while transferring {}", oid);
            if (const auto it = _transfer_status.find(oid); it != _transfer_status.end())
                return http::response { it->second, "injected failure" };
            return {};
        }

        static std::string _oid_from(const std::string &url)
        {
            if (!url.starts_with(objects_url))
                throw error("remote_mock does not serve {}", url);
            return url.substr(objects_url.size());
        }

        http::response _post_json_impl(const std::string &url, const http::header_map &, const std::string &body) override
        {
            if (url == fmt::format("{}/objects/batch", endpoint))
                return _batch(body);
            if (url.starts_with(verify_url))
                return _verify(body);
            return { 404, "not found" };
        }

        http::response _get_impl(const std::string &url, const http::header_map &, const http::chunk_sink &sink) override
        {
            const auto oid = _oid_from(url);
            in_flight_guard g { *this };
            if (auto resp = _fault(oid); resp)
                return *resp;
            auto data = content(oid);
            {
                mutex::scoped_lock lk { _mutex };
                if (_corrupt.contains(oid) && !data.empty())
                    data[0] ^= 0xFF;
            }
            for (size_t off = 0; off < data.size(); off += chunk_size) {
                if (chunk_delay.count() > 0)
                    std::this_thread::sleep_for(chunk_delay);
                const auto n = std::min(chunk_size, data.size() - off);
                sink(std::span<const uint8_t> { reinterpret_cast<const uint8_t *>(data.data()) + off, n });
            }
            return { 200, "" };
        }

        http::response _put_impl(const std::string &url, const http::header_map &, const uint64_t size, file::source &src, const http::send_progress &progress) override
        {
            const auto oid = _oid_from(url);
            in_flight_guard g { *this };
            if (auto resp = _fault(oid); resp)
                return *resp;
            std::string data {};
            std::vector<uint8_t> buf(chunk_size);
            for (;;) {
                if (chunk_delay.count() > 0)
                    std::this_thread::sleep_for(chunk_delay);
                const auto n = src.try_read(buf);
                if (n == 0)
                    break;
                data.append(reinterpret_cast<const char *>(buf.data()), n);
                if (progress)
                    progress(data.size(), n);
            }
            if (data.size() != size || sha2::to_hex(sha2::digest(data)) != oid)
                return { 422, "content does not match the object id" };
            mutex::scoped_lock lk { _mutex };
            _objects.insert_or_assign(oid, std::move(data));
            return { 200, "" };
        }
    };
}

#endif // !BLOBSYNC_TRANSFER_REMOTE_MOCK_HPP
