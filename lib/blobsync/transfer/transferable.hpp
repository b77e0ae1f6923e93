/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_TRANSFER_TRANSFERABLE_HPP
#define BLOBSYNC_TRANSFER_TRANSFERABLE_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <blobsync/pointer.hpp>
#include <blobsync/transfer/batch.hpp>

namespace blobsync::transfer {
    // Shared cancellation flag. Copies observe the same state.
    struct cancel_token {
        void cancel()
        {
            _flag->store(true, std::memory_order_relaxed);
        }

        bool cancelled() const
        {
            return _flag->load(std::memory_order_relaxed);
        }

        void check(const std::string_view what) const
        {
            if (cancelled())
                throw error_cancelled("{} has been cancelled", what);
        }
    private:
        std::shared_ptr<std::atomic_bool> _flag = std::make_shared<std::atomic_bool>(false);
    };

    struct transferable {
        virtual ~transferable() =default;

        const cas::oid &oid() const
        {
            return _oid;
        }

        uint64_t size() const
        {
            return _size;
        }

        const std::string &name() const
        {
            return _name;
        }

        direction dir() const
        {
            return _dir;
        }

        // empty until the object is authorized
        const std::optional<object_resource> &object() const
        {
            return _object;
        }

        // accepts the first authorization, throws when one is already set
        void set_object(object_resource obj);
        // replaces the current authorization with a fresh one, e.g., after its actions have expired
        void reauthorize(object_resource obj);
        std::string describe() const;
        // authorizes this object alone, for transfers that are not part of a batch
        void check(batch_authorizer &auth);

        // Progress is reported after every chunk. The cancellation token and the expiry of the action
        // are checked at every chunk boundary as well.
        void transfer(const copy_callback &cb, const cancel_token &token={})
        {
            _transfer_impl(cb, token);
        }
    protected:
        cas::store &_store;
        http::transport &_transport;

        transferable(cas::store &store, http::transport &transport, direction dir, cas::oid oid, uint64_t size, std::string name);
        // the named action of the authorized object or nullptr when the remote did not grant it
        const action *_find_action(std::string_view name) const;
        void _check_expiry(const action &act) const;
    private:
        const direction _dir;
        const cas::oid _oid;
        const uint64_t _size;
        const std::string _name;
        std::optional<object_resource> _object {};

        void _accept(object_resource &&obj);
        virtual void _transfer_impl(const copy_callback &cb, const cancel_token &token) =0;
    };

    struct uploadable: transferable {
        // Verifies that the store has the object; when a file name is given the working copy is reconciled first
        // so that a stale or modified file fails here and not in the middle of a batch.
        static std::shared_ptr<uploadable> make(cas::store &store, http::transport &transport, const cas::oid &oid,
            const std::string &filename={}, const std::filesystem::path &working_dir=".");

        uploadable(cas::store &store, http::transport &transport, const cas::oid &oid, uint64_t size, std::string name);
    private:
        void _transfer_impl(const copy_callback &cb, const cancel_token &token) override;
        void _verify();
    };

    struct downloadable: transferable {
        downloadable(cas::store &store, http::transport &transport, const pointer &ptr, std::string name={});
    private:
        void _transfer_impl(const copy_callback &cb, const cancel_token &token) override;
    };
}

#endif // !BLOBSYNC_TRANSFER_TRANSFERABLE_HPP
