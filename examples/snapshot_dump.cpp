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

/**
 * snapshot_dump - print the contents of a coordination-service snapshot
 *
 *   snapshot_dump [--json] [--stats] [--log-level L] [--log-file F] <snapshot>
 *
 * Decoder limits and policies come from the ZKSNAP_* environment variables.
 * Exit codes: 0 ok, 1 load failure, 2 usage error.
 */

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../src/util/log.h"
#include "../src/util/logmanager.h"
#include "../src/snapshot/acl.h"
#include "../src/snapshot/load_worker.h"
#include "../src/snapshot/snapshot_stats.h"
#include "../src/snapshot/tree_json.h"

using namespace std;
using namespace zksnap;
using namespace zksnap::snapshot;

namespace {

void usage(ostream& os) {
    os << "usage: snapshot_dump [--json] [--stats] [--log-level LEVEL] [--log-file FILE] <snapshot>\n";
}

void print_tree(const Tree& tree) {
    const Header& h = tree.header();
    cout << "snapshot version " << h.version << ", dbid " << h.dbid
         << ", " << tree.node_count() << " nodes, " << tree.session_count() << " sessions\n";

    vector<pair<const Node*, size_t>> stack;
    stack.emplace_back(&tree.root(), 0);
    while (!stack.empty()) {
        auto [node, depth] = stack.back();
        stack.pop_back();

        const string indent(depth * 2, ' ');
        const StatPersisted& st = node->stat();
        cout << indent << (node->is_root() ? "/" : node->id());
        if (node->has_payload()) {
            cout << "  [" << node->payload_size() << " bytes]";
        } else {
            cout << "  [no data]";
        }
        cout << " czxid=0x" << hex << st.czxid << " mzxid=0x" << st.mzxid << dec
             << " version=" << st.version;
        if (node->is_ephemeral()) {
            cout << " ephemeral=0x" << hex << st.ephemeral_owner << dec;
        }
        cout << '\n';

        if (const AclList* acls = tree.acl_for(*node)) {
            for (const Acl& acl : *acls) {
                cout << indent << "    acl " << describe_acl(acl) << '\n';
            }
        } else if (node->acl_ref() == node::kOpenAclRef) {
            cout << indent << "    acl open\n";
        } else {
            cout << indent << "    acl ref " << node->acl_ref() << " not in cache\n";
        }

        const auto& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(it->get(), depth + 1);
        }
    }
}

void print_stats(const Tree& tree) {
    SnapshotStats s = collect_stats(tree);
    cout << "Total nodes    : " << s.total_nodes << '\n'
         << "Ephemeral nodes: " << s.ephemeral_nodes << '\n'
         << "Empty nodes    : " << s.empty_nodes << '\n'
         << "Total size     : " << s.total_bytes << " bytes\n"
         << "Biggest node   : " << s.biggest_size << " bytes at " << s.biggest_path << '\n'
         << "Max depth      : " << s.max_depth << '\n';
}

} // namespace

int main(int argc, char** argv) {
    initLoggingFromEnv();

    bool json = false;
    bool stats = false;
    string log_file;
    string snapshot_path;

    for (int i = 1; i < argc; i++) {
        string arg = argv[i];
        if (arg == "--json") {
            json = true;
        } else if (arg == "--stats") {
            stats = true;
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!setLogLevelFromString(argv[++i])) {
                cerr << "invalid log level '" << argv[i] << "'\n";
                return 2;
            }
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            usage(cout);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            cerr << "unknown option " << arg << '\n';
            usage(cerr);
            return 2;
        } else if (snapshot_path.empty()) {
            snapshot_path = arg;
        } else {
            usage(cerr);
            return 2;
        }
    }
    if (snapshot_path.empty() || (json && stats)) {
        usage(cerr);
        return 2;
    }

    unique_ptr<LogManager> log_manager;
    if (!log_file.empty()) {
        try {
            log_manager.reset(new LogManager(log_file));
        } catch (const std::exception& e) {
            cerr << e.what() << '\n';
            return 2;
        }
    }

    DecoderConfig config;
    try {
        config = DecoderConfig::defaults();
    } catch (const std::exception& e) {
        cerr << "snapshot_dump: invalid ZKSNAP_* setting: " << e.what() << '\n';
        return 2;
    }

    shared_ptr<const Tree> tree;
    try {
        LoadWorker worker(snapshot_path, config);
        while (auto ev = worker.next()) {
            if (!ev->is_done()) {
                if (ev->total_bytes > 0) {
                    cerr << "\rloading " << ev->bytes_read * 100 / ev->total_bytes << "%" << flush;
                } else {
                    cerr << "\rloading " << ev->bytes_read << " bytes" << flush;
                }
                continue;
            }
            cerr << '\r' << string(24, ' ') << '\r' << flush;
            if (!ev->ok()) {
                cerr << "snapshot_dump: " << ev->error << '\n';
                return 1;
            }
            tree = ev->tree;
        }
    } catch (const std::exception& e) {
        cerr << "snapshot_dump: " << e.what() << '\n';
        return 2;
    }

    if (json) {
        write_tree_json(*tree, cout, true);
    } else if (stats) {
        print_stats(*tree);
    } else {
        print_tree(*tree);
    }
    return 0;
}
