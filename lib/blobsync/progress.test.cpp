/* This file is part of the blobsync project.
 * Copyright (c) 2026 The blobsync authors
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the source tree */

#include <blobsync/progress.hpp>
#include <blobsync/test.hpp>

using namespace blobsync;

suite progress_suite = [] {
    "progress"_test = [] {
        "guard"_test = [] {
            auto &p = progress::get();
            {
                progress_guard pg { "test-upload", "test-download" };
                const auto state = p.copy();
                test_same(0.0, state.at("test-upload"));
                test_same(0.0, state.at("test-download"));
                p.update("test-upload", 25, 100);
                test_same(0.25, p.copy().at("test-upload"));
                // progress never goes back
                p.update("test-upload", 10, 100);
                test_same(0.25, p.copy().at("test-upload"));
                p.update("test-download", 0, 0);
                test_same(1.0, p.copy().at("test-download"));
                p.done("test-upload");
                test_same(1.0, p.copy().at("test-upload"));
                p.inform();
            }
            const auto state = p.copy();
            expect(!state.contains("test-upload"));
            expect(!state.contains("test-download"));
        };
        "format"_test = [] {
            const progress_state st { { "download", 0.5 } };
            test_same(std::string { "download: 50.000%" }, fmt::format("{}", st));
        };
    };
};
