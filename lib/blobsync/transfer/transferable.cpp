/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/json.hpp>
#include <blobsync/logger.hpp>
#include <blobsync/transfer/transferable.hpp>

namespace blobsync::transfer {
    transferable::transferable(cas::store &store, http::transport &transport, const direction dir, cas::oid oid, const uint64_t size, std::string name):
        _store { store }, _transport { transport }, _dir { dir }, _oid { std::move(oid) }, _size { size },
        _name { name.empty() ? _oid.hex() : std::move(name) }
    {
    }

    void transferable::set_object(object_resource obj)
    {
        if (_object)
            throw error("{}: the authorized object has already been set", describe());
        _accept(std::move(obj));
    }

    void transferable::reauthorize(object_resource obj)
    {
        _accept(std::move(obj));
    }

    void transferable::_accept(object_resource &&obj)
    {
        if (obj.oid != _oid.hex())
            throw error("{}: cannot accept an authorization for a different object {}", describe(), obj.oid);
        _object.emplace(std::move(obj));
    }

    std::string transferable::describe() const
    {
        if (_name == _oid.hex())
            return fmt::format("{} {} ({} bytes)", _dir, _oid, _size);
        return fmt::format("{} {} ({}, {} bytes)", _dir, _name, _oid.hex().substr(0, 10), _size);
    }

    void transferable::check(batch_authorizer &auth)
    {
        auto resp = auth.authorize(_dir, { object_spec { _oid.hex(), _size } });
        const auto it = resp.find(_oid.hex());
        if (it == resp.end())
            throw error_authorization("{}: the remote did not describe the object", describe());
        const auto obj_err = it->second.error;
        reauthorize(std::move(it->second));
        if (obj_err)
            throw error_object(obj_err->code, obj_err->message);
    }

    const action *transferable::_find_action(const std::string_view name) const
    {
        if (!_object)
            throw error("{}: the object has not been authorized", describe());
        return _object->find_action(name);
    }

    void transferable::_check_expiry(const action &act) const
    {
        if (act.expired())
            throw error_auth_expired("{}: the authorization for {} has expired", describe(), act.href);
    }

    namespace {
        // Feeds a transport from a store object while watching the cancellation token and the action's expiry.
        struct guarded_source: file::source {
            guarded_source(file::source &src, const cancel_token &token, const transferable &owner, const action &act):
                _src { src }, _token { token }, _owner { owner }, _act { act }
            {
            }
        private:
            file::source &_src;
            const cancel_token &_token;
            const transferable &_owner;
            const action &_act;

            size_t _try_read_impl(const std::span<uint8_t> buf) override
            {
                _token.check(_owner.describe());
                if (_act.expired())
                    throw error_auth_expired("{}: the authorization for {} expired during the transfer", _owner.describe(), _act.href);
                return _src.try_read(buf);
            }
        };
    }

    std::shared_ptr<uploadable> uploadable::make(cas::store &store, http::transport &transport, const cas::oid &oid,
        const std::string &filename, const std::filesystem::path &working_dir)
    {
        if (!filename.empty())
            reconcile(store, oid, working_dir / filename);
        const auto size = store.size(oid);
        return std::make_shared<uploadable>(store, transport, oid, size, filename);
    }

    uploadable::uploadable(cas::store &store, http::transport &transport, const cas::oid &oid, const uint64_t size, std::string name):
        transferable { store, transport, direction::upload, oid, size, std::move(name) }
    {
    }

    void uploadable::_transfer_impl(const copy_callback &cb, const cancel_token &token)
    {
        const auto *act = _find_action("upload");
        if (!act) {
            logger::debug("{}: the remote already has the object", describe());
            return;
        }
        _check_expiry(*act);
        token.check(describe());
        auto is = _store.open(oid());
        guarded_source src { is, token, *this, *act };
        auto headers = act->header;
        headers.try_emplace("Content-Type", "application/octet-stream");
        http::response resp {};
        try {
            resp = _transport.put(act->href, headers, size(), src, [&](const uint64_t so_far, const size_t chunk) {
                if (cb)
                    cb(size(), so_far, chunk);
            });
        } catch (const error_cancelled &) {
            throw;
        } catch (const error_auth_expired &) {
            throw;
        } catch (const std::exception &ex) {
            throw error_upload(fmt::format("{}: upload to {} failed", describe(), act->href), ex);
        }
        if (!resp.ok())
            throw error_upload("{}: upload to {} failed with HTTP status {}", describe(), act->href, resp.status);
        _verify();
        logger::trace("{}: uploaded", describe());
    }

    void uploadable::_verify()
    {
        const auto *act = _find_action("verify");
        if (!act)
            return;
        _check_expiry(*act);
        auto headers = act->header;
        headers.insert_or_assign("Accept", std::string { batch_client::media_type });
        headers.insert_or_assign("Content-Type", std::string { batch_client::media_type });
        const auto body = json::serialize(json::object {
            { "oid", oid().hex() },
            { "size", size() }
        });
        http::response resp {};
        try {
            resp = _transport.post_json(act->href, headers, body);
        } catch (const std::exception &ex) {
            throw error_upload(fmt::format("{}: verification at {} failed", describe(), act->href), ex);
        }
        if (!resp.ok())
            throw error_upload("{}: verification at {} failed with HTTP status {}", describe(), act->href, resp.status);
    }

    downloadable::downloadable(cas::store &store, http::transport &transport, const pointer &ptr, std::string name):
        transferable { store, transport, direction::download, ptr.oid, ptr.size, std::move(name) }
    {
    }

    void downloadable::_transfer_impl(const copy_callback &cb, const cancel_token &token)
    {
        const auto *act = _find_action("download");
        if (!act)
            throw error_not_found("{}: the remote did not grant a download action", describe());
        if (_store.exists(oid())) {
            logger::debug("{}: the object is already present in the local store", describe());
            return;
        }
        _check_expiry(*act);
        token.check(describe());
        auto st = _store.stage();
        uint64_t so_far = 0;
        http::response resp {};
        try {
            resp = _transport.get(act->href, act->header, [&](const std::span<const uint8_t> chunk) {
                token.check(describe());
                if (act->expired())
                    throw error_auth_expired("{}: the authorization for {} expired during the transfer", describe(), act->href);
                st.write(chunk);
                so_far += chunk.size();
                if (cb)
                    cb(size(), so_far, chunk.size());
            });
        } catch (const error_cancelled &) {
            throw;
        } catch (const error_auth_expired &) {
            throw;
        } catch (const error_sys &) {
            throw;
        } catch (const std::exception &ex) {
            throw error_download(fmt::format("{}: download from {} failed", describe(), act->href), ex);
        }
        if (!resp.ok())
            throw error_download("{}: download from {} failed with HTTP status {}", describe(), act->href, resp.status);
        if (so_far != size())
            throw error_integrity("{}: received {} bytes but expected {}", describe(), so_far, size());
        st.commit(oid());
        logger::trace("{}: downloaded", describe());
    }
}
