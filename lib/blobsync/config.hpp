/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */
#ifndef BLOBSYNC_CONFIG_HPP
#define BLOBSYNC_CONFIG_HPP

#include <chrono>
#include <map>
#include <blobsync/json.hpp>

namespace blobsync {
    struct config {
        virtual ~config() =default;

        [[nodiscard]] const json::value &at(const std::string_view &name) const
        {
            return _at_impl(name);
        }

        [[nodiscard]] bool contains(const std::string_view &name) const
        {
            return json().contains(name);
        }

        [[nodiscard]] const json::object &json() const
        {
            return _json_impl();
        }
    private:
        virtual const json::value &_at_impl(const std::string_view &name) const =0;
        virtual const json::object &_json_impl() const =0;
    };

    // Used as a config mock
    struct config_json: config {
        explicit config_json(json::object &&json)
            : _json { std::move(json) }
        {
        }
    private:
        const json::object _json;

        const json::value &_at_impl(const std::string_view &name) const override
        {
            const auto it = _json.find(name);
            if (it == _json.end())
                throw error("Config does not have the requested {} element!", name);
            return it->value();
        }

        const json::object &_json_impl() const override
        {
            return _json;
        }
    };

    struct config_file: config {
        // the path of the config file used when none is given explicitly: BLOBSYNC_CONFIG or ./etc/blobsync.json
        static std::string default_path();

        explicit config_file(const std::string &path=default_path());
    private:
        std::string _path;
        json::object _parsed;

        const json::value &_at_impl(const std::string_view &name) const override;
        const json::object &_json_impl() const override
        {
            return _parsed;
        }
    };

    // Typed and validated view over the transfer-related configuration keys.
    struct settings {
        static constexpr size_t default_concurrent_transfers = 3;
        static constexpr size_t max_concurrent_transfers = 64;
        static constexpr std::chrono::seconds default_timeout { 30 };

        std::string endpoint {};
        std::string storage_dir { ".git/lfs" };
        std::string working_dir { "." };
        size_t concurrent_transfers = default_concurrent_transfers;
        std::chrono::seconds timeout = default_timeout;
        std::map<std::string, std::string> headers {};

        static settings from(const config &cfg);
    };
}

#endif // !BLOBSYNC_CONFIG_HPP
