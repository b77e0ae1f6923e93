/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <cstdlib>
#include <filesystem>
#include <blobsync/config.hpp>
#include <blobsync/logger.hpp>

namespace blobsync {
    std::string config_file::default_path()
    {
        if (const char *env_path = std::getenv("BLOBSYNC_CONFIG"); env_path)
            return env_path;
        return "./etc/blobsync.json";
    }

    config_file::config_file(const std::string &path): _path { path }
    {
        try {
            _parsed = json::load(path).as_object();
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to load the configuration file {}", path), ex);
        }
        logger::debug("loaded configuration from {}", path);
    }

    const json::value &config_file::_at_impl(const std::string_view &name) const
    {
        const auto it = _parsed.find(name);
        if (it == _parsed.end())
            throw error("configuration file {} does not have the element {}!", _path, name);
        return it->value();
    }

    settings settings::from(const config &cfg)
    {
        const auto &j = cfg.json();
        settings s {};
        s.endpoint = json::value_at<std::string>(j, "endpoint");
        if (s.endpoint.empty())
            throw error("the endpoint configuration value must not be empty");
        while (s.endpoint.ends_with('/'))
            s.endpoint.pop_back();
        s.storage_dir = json::value_or<std::string>(j, "storageDir", s.storage_dir);
        s.working_dir = json::value_or<std::string>(j, "workingDir", s.working_dir);
        s.concurrent_transfers = json::value_or<size_t>(j, "concurrentTransfers", s.concurrent_transfers);
        if (s.concurrent_transfers == 0 || s.concurrent_transfers > max_concurrent_transfers)
            throw error("concurrentTransfers must be between 1 and {} but got {}", max_concurrent_transfers, s.concurrent_transfers);
        const auto timeout_secs = json::value_or<uint64_t>(j, "timeoutSecs", static_cast<uint64_t>(s.timeout.count()));
        if (timeout_secs == 0)
            throw error("timeoutSecs must be positive");
        s.timeout = std::chrono::seconds { timeout_secs };
        if (const auto *j_headers = j.if_contains("headers"); j_headers) {
            if (!j_headers->is_object())
                throw error("the headers configuration value must be an object");
            for (const auto &kv: j_headers->get_object())
                s.headers.emplace(std::string { kv.key().data(), kv.key().size() }, json::value_to<std::string>(kv.value()));
        }
        logger::debug("transfer settings: endpoint: {} storage: {} workers: {} timeout: {}",
            s.endpoint, s.storage_dir, s.concurrent_transfers, s.timeout);
        return s;
    }
}
