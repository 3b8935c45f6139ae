/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The zksnap project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <thread>
#include "snapshot/load_worker.h"
#include "test_helpers.h"

using namespace zksnap::snapshot;
using namespace zksnap::snapshot::test;

class LoadWorkerTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = create_temp_dir("zksnap_worker_test");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
        unsetenv("ZKSNAP_MAX_BUFFER_LEN");
        unsetenv("ZKSNAP_PROGRESS_INTERVAL");
    }

    std::string large_snapshot(int nodes) {
        SnapshotWriter w;
        w.header().sessions({}).acl_cache({}).node("", std::nullopt);
        for (int i = 0; i < nodes; i++) {
            w.node("/n" + std::to_string(i), std::vector<uint8_t>(256, 7));
        }
        w.end_nodes();
        std::string path = test_dir + "/large";
        w.write_to(path);
        return path;
    }

    static DecoderConfig chatty() {
        DecoderConfig cfg;
        cfg.progress_interval = 512;
        return cfg;
    }
};

TEST_F(LoadWorkerTest, DeliversTree) {
    std::string path = test_dir + "/scenario";
    scenario_body().write_to(path);

    LoadWorker worker(path);
    EXPECT_EQ(worker.path(), path);

    int done = 0;
    std::shared_ptr<const Tree> tree;
    while (auto ev = worker.next()) {
        if (ev->is_done()) {
            done++;
            ASSERT_TRUE(ev->ok()) << ev->error;
            tree = ev->tree;
        }
    }
    EXPECT_EQ(done, 1);
    ASSERT_NE(tree, nullptr);
    EXPECT_EQ(tree->node_count(), 4u);
    EXPECT_EQ(tree->find("/a/b")->parent(), tree->find("/a"));
}

TEST_F(LoadWorkerTest, DeliversError) {
    std::string path = test_dir + "/bad";
    SnapshotWriter w;
    w.header().sessions({}).acl_cache({}).node("", std::nullopt).node("/x/y", std::nullopt).end_nodes();
    w.write_to(path);

    LoadWorker worker(path, DecoderConfig());
    std::optional<LoadEvent> last;
    while (auto ev = worker.next()) {
        last = std::move(ev);
    }
    ASSERT_TRUE(last.has_value());
    EXPECT_TRUE(last->is_done());
    EXPECT_FALSE(last->ok());
    EXPECT_EQ(last->tree, nullptr);
    EXPECT_EQ(last->error_kind, ErrorKind::Integrity);
    EXPECT_GT(last->error_offset, 0u);
    EXPECT_NE(last->error.find("/x"), std::string::npos);
}

TEST_F(LoadWorkerTest, MissingFile) {
    LoadWorker worker(test_dir + "/nothing-here", DecoderConfig());
    auto ev = worker.next();
    ASSERT_TRUE(ev.has_value());
    ASSERT_TRUE(ev->is_done());
    EXPECT_EQ(ev->error_kind, ErrorKind::Io);
    EXPECT_FALSE(worker.next().has_value());
}

TEST_F(LoadWorkerTest, ProgressIsOrderedAndEndsBeforeDone) {
    std::string path = large_snapshot(200);
    const uint64_t size = std::filesystem::file_size(path);

    LoadWorker worker(path, chatty(), 1024);
    uint64_t last = 0;
    size_t progress = 0;
    bool done = false;
    while (auto ev = worker.next()) {
        if (ev->is_done()) {
            EXPECT_TRUE(ev->ok());
            done = true;
            continue;
        }
        EXPECT_FALSE(done) << "progress after completion";
        EXPECT_GE(ev->bytes_read, last);
        EXPECT_EQ(ev->total_bytes, size);
        last = ev->bytes_read;
        progress++;
    }
    EXPECT_TRUE(done);
    EXPECT_GT(progress, 0u);
    EXPECT_EQ(last, size);
    EXPECT_EQ(worker.dropped(), 0u);
}

TEST_F(LoadWorkerTest, SlowConsumerDropsProgressNotCompletion) {
    std::string path = large_snapshot(400);

    LoadWorker worker(path, chatty(), 2);
    // Let the load finish with nobody draining
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    size_t progress = 0;
    int done = 0;
    while (auto ev = worker.next()) {
        if (ev->is_done()) {
            done++;
            EXPECT_TRUE(ev->ok());
        } else {
            progress++;
        }
    }
    EXPECT_EQ(done, 1);
    EXPECT_GT(worker.dropped(), 0u);
    EXPECT_LE(progress, 400u);
}

TEST_F(LoadWorkerTest, NextAfterDoneIsEmpty) {
    std::string path = test_dir + "/scenario";
    scenario_body().write_to(path);

    LoadWorker worker(path, DecoderConfig());
    while (worker.next()) {}
    EXPECT_FALSE(worker.next().has_value());
    EXPECT_FALSE(worker.next().has_value());
}

TEST_F(LoadWorkerTest, DestroyWithoutConsuming) {
    std::string path = large_snapshot(100);
    {
        LoadWorker worker(path, chatty(), 1);
    }
    SUCCEED();
}

TEST_F(LoadWorkerTest, RejectsZeroCapacity) {
    EXPECT_THROW(LoadWorker(test_dir + "/x", DecoderConfig(), 0), std::invalid_argument);
}

TEST_F(LoadWorkerTest, RejectsInvalidConfig) {
    DecoderConfig cfg;
    cfg.max_string_len = -1;
    EXPECT_THROW(LoadWorker(test_dir + "/x", cfg), std::invalid_argument);
}

TEST_F(LoadWorkerTest, DefaultConfigIgnoresEnvironment) {
    std::string path = test_dir + "/scenario";
    scenario_body().write_to(path);
    setenv("ZKSNAP_MAX_BUFFER_LEN", "3", 1);
    setenv("ZKSNAP_PROGRESS_INTERVAL", "abc", 1);

    LoadWorker worker(path);
    std::optional<LoadEvent> last;
    while (auto ev = worker.next()) {
        last = std::move(ev);
    }
    ASSERT_TRUE(last.has_value());
    ASSERT_TRUE(last->ok()) << last->error;
    EXPECT_EQ(last->tree->node_count(), 4u);
}
