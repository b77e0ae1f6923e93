/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <set>
#include <boost/thread.hpp>
#include <blobsync/logger.hpp>
#include <blobsync/mutex.hpp>
#include <blobsync/progress.hpp>
#include <blobsync/timer.hpp>
#include <blobsync/transfer/queue.hpp>

namespace blobsync::transfer {
    std::vector<std::string> summary::retryable() const
    {
        std::vector<std::string> res {};
        for (const auto &f: errors) {
            if (f.retryable)
                res.emplace_back(f.oid);
        }
        return res;
    }

    std::vector<std::string> summary::needs_reauthorization() const
    {
        std::vector<std::string> res {};
        for (const auto &f: errors) {
            if (f.kind == failure_kind::auth_expired)
                res.emplace_back(f.oid);
        }
        return res;
    }

    std::string_view queue_state_name(const queue_state st)
    {
        switch (st) {
            case queue_state::collecting: return "collecting";
            case queue_state::authorizing: return "authorizing";
            case queue_state::running: return "running";
            case queue_state::draining: return "draining";
            case queue_state::done: return "done";
            default: throw error(fmt::format("unsupported queue state: {}", static_cast<int>(st)));
        }
    }

    struct queue::impl {
        impl(const direction dir, batch_authorizer &auth, options &&opts, const bool dry_run, const size_t expected_files, const uint64_t expected_bytes):
            _dir { dir }, _auth { auth }, _opts { std::move(opts) }, _dry_run { dry_run }, _expected_bytes { expected_bytes }
        {
            if (_opts.workers == 0)
                throw error("the number of transfer workers must be greater than zero");
            if (_opts.workers > settings::max_concurrent_transfers)
                throw error("the number of transfer workers must not exceed {} but got {}", settings::max_concurrent_transfers, _opts.workers);
            if (_opts.progress_name.empty())
                _opts.progress_name = std::string { direction_name(_dir) };
            _items.reserve(expected_files);
        }

        direction dir() const
        {
            return _dir;
        }

        bool dry_run() const
        {
            return _dry_run;
        }

        queue_state current_state() const
        {
            return _state.load();
        }

        size_t size() const
        {
            mutex::scoped_lock lk { _items_mutex };
            return _items.size();
        }

        void add(std::shared_ptr<transferable> &&t)
        {
            if (!t)
                throw error("cannot add an empty transferable to a {} queue", _dir);
            if (t->dir() != _dir)
                throw error("cannot add {} to a {} queue", t->describe(), _dir);
            mutex::scoped_lock lk { _items_mutex };
            if (_state.load() != queue_state::collecting)
                throw error("{} cannot be added: the {} queue is already {}", t->describe(), _dir, _state.load());
            if (!_oids.emplace(t->oid().hex()).second) {
                logger::debug("{}: the object is already queued, skipping", t->describe());
                ++_skipped;
                return;
            }
            _items.emplace_back(std::move(t));
        }

        summary wait()
        {
            {
                mutex::scoped_lock lk { _items_mutex };
                if (_state.load() != queue_state::collecting)
                    throw error("the {} queue has already been started", _dir);
                _state = queue_state::authorizing;
            }
            timer t { fmt::format("{} queue with {} objects", _dir, _items.size()), logger::level::debug };
            progress_guard pg { _opts.progress_name };
            auto ready = _authorize();
            if (_dry_run) {
                for (const auto &tr: ready)
                    _would_transfer.emplace_back(planned { tr->oid().hex(), tr->name(), tr->size() });
                logger::info("{} queue dry run: {} objects with {} bytes would be transferred", _dir, ready.size(), _bytes_expected.load());
                _state = queue_state::done;
                return _make_summary();
            }
            _run(std::move(ready));
            _state = queue_state::done;
            auto res = _make_summary();
            logger::info("{} queue finished: succeeded: {} failed: {} skipped: {} cancelled: {} bytes: {} of {}",
                _dir, res.succeeded, res.failed, res.skipped, res.cancelled, res.bytes_transferred, res.bytes_expected);
            return res;
        }

        void cancel()
        {
            logger::info("{} queue: cancellation requested in state {}", _dir, _state.load());
            _token.cancel();
        }
    private:
        using item_list = std::vector<std::shared_ptr<transferable>>;

        const direction _dir;
        batch_authorizer &_auth;
        options _opts;
        const bool _dry_run;
        const uint64_t _expected_bytes;
        std::atomic<queue_state> _state { queue_state::collecting };
        cancel_token _token {};

        alignas(mutex::padding) mutable mutex::unique_lock::mutex_type _items_mutex {};
        item_list _items {};
        std::set<std::string> _oids {};

        alignas(mutex::padding) mutex::unique_lock::mutex_type _pending_mutex {};
        std::deque<std::shared_ptr<transferable>> _pending {};

        alignas(mutex::padding) mutex::unique_lock::mutex_type _errors_mutex {};
        std::vector<failure> _errors {};
        std::vector<planned> _would_transfer {};

        alignas(mutex::padding) mutex::unique_lock::mutex_type _done_mutex {};
        alignas(mutex::padding) std::condition_variable_any _done_cv {};
        std::atomic_size_t _active_workers { 0 };

        std::atomic_size_t _succeeded { 0 };
        std::atomic_size_t _failed { 0 };
        std::atomic_size_t _skipped { 0 };
        std::atomic_size_t _cancelled { 0 };
        std::atomic<uint64_t> _bytes_expected { 0 };
        std::atomic<uint64_t> _bytes_transferred { 0 };

        item_list _authorize()
        {
            item_list ready {};
            if (_items.empty())
                return ready;
            if (_token.cancelled()) {
                logger::info("{} queue: cancelled before the authorization", _dir);
                _cancelled += _items.size();
                return ready;
            }
            std::vector<object_spec> specs {};
            specs.reserve(_items.size());
            for (const auto &t: _items)
                specs.emplace_back(object_spec { t->oid().hex(), t->size() });
            batch_response resp {};
            try {
                resp = _auth.authorize(_dir, specs);
            } catch (const error_authorization &) {
                _state = queue_state::done;
                throw;
            } catch (const std::exception &ex) {
                _state = queue_state::done;
                throw error_authorization(fmt::format("batch {} authorization of {} objects failed", _dir, specs.size()), ex);
            }
            for (auto &t: _items) {
                const auto it = resp.find(t->oid().hex());
                if (it == resp.end()) {
                    _record(*t, error_authorization("{}: the remote did not describe the object", t->describe()));
                    continue;
                }
                const auto &obj = it->second;
                if (obj.error) {
                    _record(*t, error_object { obj.error->code, obj.error->message });
                    continue;
                }
                // the transfer must use the actions this batch granted, not an earlier authorization
                t->reauthorize(obj);
                if (_dir == direction::upload && !obj.find_action("upload")) {
                    logger::debug("{}: the remote already has the object", t->describe());
                    ++_succeeded;
                    continue;
                }
                if (_dir == direction::download && !obj.find_action("download")) {
                    _record(*t, error_not_found("{}: the remote did not grant a download action", t->describe()));
                    continue;
                }
                _bytes_expected += t->size();
                ready.emplace_back(t);
            }
            return ready;
        }

        void _run(item_list &&ready)
        {
            {
                mutex::scoped_lock lk { _pending_mutex };
                for (auto &t: ready)
                    _pending.emplace_back(std::move(t));
            }
            _state = queue_state::running;
            const auto num_workers = std::min(_opts.workers, ready.size());
            if (num_workers > 0) {
                logger::info("{} queue: transferring {} objects with {} bytes using {} workers", _dir, ready.size(), _bytes_expected.load(), num_workers);
                std::vector<boost::thread> workers {};
                // started workers always drain the pending list, so they are joined on every exit path
                const auto join_workers = [&workers] {
                    for (auto &w: workers) {
                        if (w.joinable())
                            w.join();
                    }
                };
                _active_workers = num_workers;
                try {
                    for (size_t i = 0; i < num_workers; ++i)
                        workers.emplace_back([this] { _worker_thread(); });
                } catch (const std::exception &ex) {
                    logger::error("{} queue: failed to start the transfer workers: {}", _dir, ex.what());
                    join_workers();
                    throw;
                }
                {
                    mutex::unique_lock lk { _done_mutex };
                    while (!_done_cv.wait_for(lk, _opts.report_interval, [&] { return _active_workers.load() == 0; })) {
                        logger::debug("{} queue: active workers: {} transferred {} of {} bytes", _dir, _active_workers.load(),
                            _bytes_transferred.load(), _bytes_expected.load());
                        progress::get().inform();
                    }
                }
                _state = queue_state::draining;
                join_workers();
            } else {
                _state = queue_state::draining;
            }
            progress::get().done(_opts.progress_name);
        }

        void _worker_thread()
        {
            for (;;) {
                std::shared_ptr<transferable> t {};
                {
                    mutex::scoped_lock lk { _pending_mutex };
                    if (_pending.empty())
                        break;
                    t = std::move(_pending.front());
                    _pending.pop_front();
                }
                if (_token.cancelled()) {
                    logger::debug("{}: cancelled before the start", t->describe());
                    ++_cancelled;
                    continue;
                }
                _transfer(*t);
            }
            {
                mutex::scoped_lock lk { _done_mutex };
                --_active_workers;
            }
            _done_cv.notify_all();
        }

        void _transfer(transferable &t)
        {
            try {
                t.transfer([&](const uint64_t total, const uint64_t so_far, const size_t chunk) {
                    const auto done = _bytes_transferred.fetch_add(chunk, std::memory_order_relaxed) + chunk;
                    progress::get().update(_opts.progress_name, done, std::max(_bytes_expected.load(), _expected_bytes));
                    if (_opts.on_progress)
                        _opts.on_progress(t, total, so_far, chunk);
                }, _token);
                ++_succeeded;
            } catch (const std::exception &ex) {
                _record(t, ex, classify(std::current_exception()));
            }
        }

        template<typename E>
        void _record(const transferable &t, const E &ex)
        {
            _record(t, ex, classify(std::make_exception_ptr(ex)));
        }

        void _record(const transferable &t, const std::exception &ex, const failure_class cls)
        {
            if (cls.kind == failure_kind::cancelled)
                logger::debug("{}: {}", t.describe(), ex.what());
            else
                logger::warn("{}: failed: {}", t.describe(), ex.what());
            mutex::scoped_lock lk { _errors_mutex };
            _errors.emplace_back(failure { t.oid().hex(), t.name(), cls.kind, ex.what(), cls.retryable });
            ++_failed;
        }

        summary _make_summary()
        {
            summary res {};
            res.succeeded = _succeeded.load();
            res.failed = _failed.load();
            res.skipped = _skipped.load();
            res.cancelled = _cancelled.load();
            res.bytes_expected = _bytes_expected.load();
            res.bytes_transferred = _bytes_transferred.load();
            mutex::scoped_lock lk { _errors_mutex };
            res.errors = _errors;
            res.would_transfer = _would_transfer;
            return res;
        }
    };

    queue::queue(const direction dir, batch_authorizer &auth, options opts, const bool dry_run, const size_t expected_files, const uint64_t expected_bytes):
        _impl { std::make_unique<impl>(dir, auth, std::move(opts), dry_run, expected_files, expected_bytes) }
    {
    }

    queue::queue(queue &&) noexcept =default;
    queue::~queue() =default;

    direction queue::dir() const
    {
        return _impl->dir();
    }

    bool queue::dry_run() const
    {
        return _impl->dry_run();
    }

    queue_state queue::current_state() const
    {
        return _impl->current_state();
    }

    size_t queue::size() const
    {
        return _impl->size();
    }

    void queue::add(std::shared_ptr<transferable> t)
    {
        _impl->add(std::move(t));
    }

    summary queue::wait()
    {
        return _impl->wait();
    }

    void queue::cancel()
    {
        _impl->cancel();
    }

    queue make_upload_queue(const size_t files, const uint64_t size, const bool dry_run, batch_authorizer &auth, queue::options opts)
    {
        return queue { direction::upload, auth, std::move(opts), dry_run, files, size };
    }

    queue make_download_queue(const size_t files, const uint64_t size, const bool dry_run, batch_authorizer &auth, queue::options opts)
    {
        return queue { direction::download, auth, std::move(opts), dry_run, files, size };
    }
}
