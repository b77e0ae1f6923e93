/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_TRANSFER_QUEUE_HPP
#define BLOBSYNC_TRANSFER_QUEUE_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <blobsync/config.hpp>
#include <blobsync/transfer/transferable.hpp>

namespace blobsync::transfer {
    enum class queue_state { collecting, authorizing, running, draining, done };

    struct failure {
        std::string oid {};
        std::string name {};
        failure_kind kind = failure_kind::other;
        std::string message {};
        bool retryable = false;
    };

    struct planned {
        std::string oid {};
        std::string name {};
        uint64_t size = 0;
    };

    struct summary {
        size_t succeeded = 0;
        size_t failed = 0;
        // duplicates of already queued objects
        size_t skipped = 0;
        size_t cancelled = 0;
        uint64_t bytes_expected = 0;
        uint64_t bytes_transferred = 0;
        // in the order the failures occurred
        std::vector<failure> errors {};
        // filled only by dry runs
        std::vector<planned> would_transfer {};

        std::vector<std::string> retryable() const;
        std::vector<std::string> needs_reauthorization() const;

        size_t total() const
        {
            return succeeded + failed + skipped + cancelled;
        }

        bool ok() const
        {
            return failed == 0 && cancelled == 0;
        }
    };

    using progress_callback = std::function<void(const transferable &t, uint64_t total, uint64_t so_far, size_t chunk)>;

    struct queue_options {
        size_t workers = settings::default_concurrent_transfers;
        progress_callback on_progress {};
        // the key under which the aggregate progress is published; defaults to the direction's name
        std::string progress_name {};
        std::chrono::milliseconds report_interval { 5000 };
    };

    // Moves a set of objects in one direction: a single batch authorization followed by a fixed pool of workers.
    // Every object ends up in exactly one of succeeded, failed, skipped, or cancelled.
    struct queue {
        using options = queue_options;

        queue(direction dir, batch_authorizer &auth, options opts={}, bool dry_run=false, size_t expected_files=0, uint64_t expected_bytes=0);
        queue(queue &&) noexcept;
        queue(const queue &) =delete;
        ~queue();

        direction dir() const;
        bool dry_run() const;
        queue_state current_state() const;
        // the number of distinct objects added so far
        size_t size() const;

        void add(std::shared_ptr<transferable> t);
        // runs the queue to completion; a failed batch authorization is rethrown as error_authorization
        summary wait();
        // cancels what has not started; in-flight transfers stop at the next chunk boundary
        void cancel();
    private:
        struct impl;
        std::unique_ptr<impl> _impl;
    };

    extern queue make_upload_queue(size_t files, uint64_t size, bool dry_run, batch_authorizer &auth, queue::options opts={});
    extern queue make_download_queue(size_t files, uint64_t size, bool dry_run, batch_authorizer &auth, queue::options opts={});
    extern std::string_view queue_state_name(queue_state st);
}

namespace fmt {
    template<>
    struct formatter<blobsync::transfer::queue_state>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const blobsync::transfer::queue_state &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", blobsync::transfer::queue_state_name(v));
        }
    };
}

#endif // !BLOBSYNC_TRANSFER_QUEUE_HPP
