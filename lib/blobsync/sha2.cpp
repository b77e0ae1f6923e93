/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/sha2.hpp>

namespace blobsync::sha2 {
    void ensure_initialized()
    {
        // libsodium's initialization is thread-safe and idempotent
        static const int res = sodium_init();
        if (res < 0)
            throw error("libsodium initialization failed!");
    }

    std::string to_hex(const hash_256 &h)
    {
        std::string res(h.size() * 2, '\0');
        sodium_bin2hex(res.data(), res.size() + 1, h.data(), h.size());
        return res;
    }
}
