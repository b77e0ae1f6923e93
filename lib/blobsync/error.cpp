/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/error.hpp>

namespace blobsync {
    failure_class classify(const std::exception_ptr &ex)
    {
        if (!ex)
            throw error("classify requires a non-empty exception pointer");
        try {
            std::rethrow_exception(ex);
        } catch (const error_not_found &) {
            return { failure_kind::not_found, false };
        } catch (const error_integrity &) {
            return { failure_kind::integrity, false };
        } catch (const error_authorization &) {
            return { failure_kind::authorization, true };
        } catch (const error_auth_expired &) {
            return { failure_kind::auth_expired, true };
        } catch (const error_upload &) {
            return { failure_kind::upload, true };
        } catch (const error_download &) {
            return { failure_kind::download, true };
        } catch (const error_object &) {
            return { failure_kind::object, false };
        } catch (const error_cancelled &) {
            return { failure_kind::cancelled, true };
        } catch (const error_sys &) {
            return { failure_kind::io, false };
        } catch (const std::exception &) {
            return { failure_kind::other, false };
        }
    }

    std::string_view failure_kind_name(const failure_kind kind)
    {
        switch (kind) {
            case failure_kind::io: return "io";
            case failure_kind::not_found: return "not_found";
            case failure_kind::integrity: return "integrity";
            case failure_kind::authorization: return "authorization";
            case failure_kind::auth_expired: return "auth_expired";
            case failure_kind::upload: return "upload";
            case failure_kind::download: return "download";
            case failure_kind::object: return "object";
            case failure_kind::cancelled: return "cancelled";
            case failure_kind::other: return "other";
            default: throw error(fmt::format("unsupported failure kind: {}", static_cast<int>(kind)));
        }
    }
}
