/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_ERROR_HPP
#define BLOBSYNC_ERROR_HPP

#include <exception>
#include <string_view>
#include <blobsync/common/error.hpp>
#include <blobsync/common/format.hpp>

namespace blobsync {
    // a requested object is not present in the local store
    struct error_not_found: error {
        using error::error;
    };

    // content does not hash to the identifier it is stored or announced under
    struct error_integrity: error {
        using error::error;
    };

    // the batch negotiation with the remote failed as a whole
    struct error_authorization: error {
        using error::error;
    };

    // a transfer action expired before the transfer completed
    struct error_auth_expired: error {
        using error::error;
    };

    struct error_upload: error {
        using error::error;
    };

    struct error_download: error {
        using error::error;
    };

    // the remote refused a single object, e.g. due to a quota or permissions
    struct error_object: error {
        explicit error_object(const int code, const std::string_view msg):
            error { fmt::format("remote rejected the object with code {}: {}", code, msg) }, _code { code }
        {
        }

        int code() const noexcept
        {
            return _code;
        }
    private:
        int _code;
    };

    struct error_cancelled: error {
        using error::error;
    };

    enum class failure_kind {
        io, not_found, integrity, authorization, auth_expired, upload, download, object, cancelled, other
    };

    struct failure_class {
        failure_kind kind = failure_kind::other;
        bool retryable = false;
    };

    // Maps an exception to its kind and tells if resending the same request can succeed.
    // integrity, object-level and not-found failures are never retryable; an expired
    // authorization is retryable only after a new authorization round-trip.
    extern failure_class classify(const std::exception_ptr &ex);
    extern std::string_view failure_kind_name(failure_kind kind);
}

namespace fmt {
    template<>
    struct formatter<blobsync::failure_kind>: formatter<std::string_view> {
        template<typename FormatContext>
        auto format(const blobsync::failure_kind &v, FormatContext &ctx) const -> decltype(ctx.out()) {
            return fmt::format_to(ctx.out(), "{}", blobsync::failure_kind_name(v));
        }
    };
}

#endif // !BLOBSYNC_ERROR_HPP
