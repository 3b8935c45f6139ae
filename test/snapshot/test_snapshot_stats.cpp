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
#include "snapshot/snapshot_stats.h"
#include "test_helpers.h"

using namespace zksnap::snapshot;
using namespace zksnap::snapshot::test;

namespace {

StatPersisted ephemeral(int64_t owner) {
    StatPersisted s;
    s.ephemeral_owner = owner;
    return s;
}

} // namespace

TEST(SnapshotStatsTest, Scenario) {
    Tree tree = parse_bytes(scenario_body());
    SnapshotStats s = collect_stats(tree);

    EXPECT_EQ(s.total_nodes, 4u);
    EXPECT_EQ(s.ephemeral_nodes, 0u);
    EXPECT_EQ(s.empty_nodes, 1u);                    // root has no payload
    EXPECT_EQ(s.total_bytes, 7u + 5u + 5u);
    EXPECT_EQ(s.biggest_size, 7u);
    EXPECT_EQ(s.biggest_path, "/a");
    EXPECT_EQ(s.max_depth, 2u);
}

TEST(SnapshotStatsTest, OnlyRoot) {
    SnapshotWriter w;
    w.header().sessions({}).acl_cache({}).node("", payload("")).end_nodes();
    SnapshotStats s = collect_stats(parse_bytes(w));

    EXPECT_EQ(s.total_nodes, 1u);
    EXPECT_EQ(s.empty_nodes, 1u);
    EXPECT_EQ(s.biggest_size, 0u);
    EXPECT_EQ(s.biggest_path, "/");
    EXPECT_EQ(s.max_depth, 0u);
}

TEST(SnapshotStatsTest, BiggestRootPrintsSlash) {
    SnapshotWriter w;
    w.header().sessions({}).acl_cache({})
     .node("", payload("0123456789"))
     .node("/small", payload("x"))
     .end_nodes();
    EXPECT_EQ(collect_stats(parse_bytes(w)).biggest_path, "/");
}

TEST(SnapshotStatsTest, EphemeralAndTies) {
    SnapshotWriter w;
    w.header().sessions({{1, 1000}}).acl_cache({})
     .node("", std::nullopt)
     .node("/first", payload("abc"), -1, ephemeral(1))
     .node("/second", payload("xyz"), -1, ephemeral(1))
     .node("/second/deep", std::vector<uint8_t>{})
     .end_nodes();
    SnapshotStats s = collect_stats(parse_bytes(w));

    EXPECT_EQ(s.ephemeral_nodes, 2u);
    EXPECT_EQ(s.empty_nodes, 2u);
    EXPECT_EQ(s.biggest_path, "/first");
    EXPECT_EQ(s.max_depth, 2u);
}

TEST(SnapshotStatsTest, DeepChain) {
    const int kDepth = 500;
    SnapshotWriter w;
    w.header().sessions({}).acl_cache({}).node("", std::nullopt);
    std::string path;
    for (int i = 0; i < kDepth; i++) {
        path += "/n";
        w.node(path, std::nullopt);
    }
    w.end_nodes();

    SnapshotStats s = collect_stats(parse_bytes(w));
    EXPECT_EQ(s.total_nodes, static_cast<size_t>(kDepth + 1));
    EXPECT_EQ(s.max_depth, static_cast<size_t>(kDepth));
}

TEST(SnapshotStatsTest, PrintablePath) {
    EXPECT_EQ(printable_path(""), "/");
    EXPECT_EQ(printable_path("/a/b"), "/a/b");
}
