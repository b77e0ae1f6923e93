/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_SHA2_HPP
#define BLOBSYNC_SHA2_HPP

extern "C" {
#   include <sodium.h>
};
#include <array>
#include <span>
#include <string>
#include <string_view>
#include <blobsync/error.hpp>

namespace blobsync::sha2
{
    using hash_256 = std::array<uint8_t, crypto_hash_sha256_BYTES>;

    extern void ensure_initialized();

    // Incremental SHA-256 for content that arrives in chunks.
    struct hasher {
        hasher()
        {
            ensure_initialized();
            if (crypto_hash_sha256_init(&_state) != 0)
                throw error("sha2 state initialization failed!");
        }

        void update(const std::span<const uint8_t> data)
        {
            if (_finalized)
                throw error("sha2::hasher cannot be updated after finalization!");
            if (crypto_hash_sha256_update(&_state, data.data(), data.size()) != 0)
                throw error("sha2 update failed!");
        }

        hash_256 finalize()
        {
            if (_finalized)
                throw error("sha2::hasher has been already finalized!");
            hash_256 out;
            if (crypto_hash_sha256_final(&_state, out.data()) != 0)
                throw error("sha2 finalization failed!");
            _finalized = true;
            return out;
        }
    private:
        crypto_hash_sha256_state _state {};
        bool _finalized = false;
    };

    inline hash_256 digest(const std::span<const uint8_t> in)
    {
        ensure_initialized();
        hash_256 out;
        if (crypto_hash_sha256(out.data(), in.data(), in.size()) != 0)
            throw error("sha2 computation hash failed!");
        return out;
    }

    inline hash_256 digest(const std::string_view in)
    {
        return digest(std::span { reinterpret_cast<const uint8_t *>(in.data()), in.size() });
    }

    extern std::string to_hex(const hash_256 &h);
}

#endif // !BLOBSYNC_SHA2_HPP
