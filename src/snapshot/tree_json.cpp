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

#include "tree_json.h"
#include <algorithm>
#include <utility>
#include <vector>
#include "rapidjson/writer.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
#include "acl.h"
#include "snapshot_stats.h"

namespace zksnap {
namespace snapshot {

namespace {

template <typename Writer>
void put_string(Writer& w, const std::string& s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

template <typename Writer>
void write_stat(Writer& w, const StatPersisted& s) {
    w.StartObject();
    w.Key("czxid");           w.Int64(s.czxid);
    w.Key("mzxid");           w.Int64(s.mzxid);
    w.Key("ctime");           w.Int64(s.ctime);
    w.Key("mtime");           w.Int64(s.mtime);
    w.Key("version");         w.Int(s.version);
    w.Key("cversion");        w.Int(s.cversion);
    w.Key("aversion");        w.Int(s.aversion);
    w.Key("ephemeral_owner"); w.Int64(s.ephemeral_owner);
    w.Key("pzxid");           w.Int64(s.pzxid);
    w.EndObject();
}

template <typename Writer>
void open_node(Writer& w, const Node& n) {
    w.StartObject();
    w.Key("path");
    put_string(w, printable_path(n.path()));
    w.Key("id");
    put_string(w, n.id());
    w.Key("acl_ref");
    w.Int64(n.acl_ref());
    w.Key("payload_size");
    if (n.has_payload()) {
        w.Uint64(n.payload_size());
    } else {
        w.Null();
    }
    w.Key("stat");
    write_stat(w, n.stat());
    w.Key("children");
    w.StartArray();
}

// Iterative, path depth is unbounded
template <typename Writer>
void write_node(Writer& w, const Node& root) {
    // (node, index of the next child to emit)
    std::vector<std::pair<const Node*, size_t>> stack;
    open_node(w, root);
    stack.emplace_back(&root, 0);

    while (!stack.empty()) {
        auto& top = stack.back();
        const auto& children = top.first->children();
        if (top.second < children.size()) {
            const Node* child = children[top.second++].get();
            open_node(w, *child);
            stack.emplace_back(child, 0);
        } else {
            w.EndArray();
            w.EndObject();
            stack.pop_back();
        }
    }
}

template <typename Writer>
void write_tree(Writer& w, const Tree& tree) {
    w.StartObject();

    w.Key("header");
    w.StartObject();
    w.Key("magic");   w.Int(tree.header().magic);
    w.Key("version"); w.Int(tree.header().version);
    w.Key("dbid");    w.Int64(tree.header().dbid);
    w.EndObject();

    w.Key("sessions");
    w.Int(tree.session_count());

    // Sorted by ref for stable output
    std::vector<int64_t> refs;
    refs.reserve(tree.acls().size());
    for (const auto& entry : tree.acls()) {
        refs.push_back(entry.first);
    }
    std::sort(refs.begin(), refs.end());

    w.Key("acls");
    w.StartArray();
    for (int64_t ref : refs) {
        w.StartObject();
        w.Key("ref");
        w.Int64(ref);
        w.Key("entries");
        w.StartArray();
        for (const Acl& acl : tree.acls().at(ref)) {
            w.StartObject();
            w.Key("perms");  w.Int(acl.perms);
            w.Key("scheme"); put_string(w, acl.scheme);
            w.Key("id");     put_string(w, acl.id);
            w.Key("text");   put_string(w, describe_acl(acl));
            w.EndObject();
        }
        w.EndArray();
        w.EndObject();
    }
    w.EndArray();

    const TrailerInfo& t = tree.trailer();
    w.Key("trailer");
    if (t.present) {
        w.StartObject();
        w.Key("stored_checksum");   w.Int64(t.stored_checksum);
        w.Key("computed_checksum"); w.Uint(t.computed_checksum);
        w.Key("matches");           w.Bool(t.checksum_matches());
        w.Key("path");              put_string(w, t.path);
        w.EndObject();
    } else {
        w.Null();
    }

    w.Key("root");
    write_node(w, tree.root());

    w.EndObject();
}

} // namespace

std::string tree_to_json(const Tree& tree, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        write_tree(writer, tree);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        write_tree(writer, tree);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

void write_tree_json(const Tree& tree, std::ostream& out, bool pretty) {
    out << tree_to_json(tree, pretty) << '\n';
}

} // namespace snapshot
} // namespace zksnap
