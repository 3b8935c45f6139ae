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

#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "decoder_config.h"
#include "snapshot_error.h"
#include "snapshot_reader.h"
#include "snapshot_types.h"

namespace zksnap {
namespace snapshot {

struct LoadEvent {
    enum class Type { Progress, Done };

    Type type = Type::Progress;

    // Progress
    uint64_t bytes_read = 0;
    uint64_t total_bytes = 0;   // 0 when unknown

    // Done: exactly one of tree / error is set
    std::shared_ptr<const Tree> tree;
    std::string error;
    ErrorKind error_kind = ErrorKind::Io;
    uint64_t error_offset = 0;

    bool is_done() const { return type == Type::Done; }
    bool ok() const { return is_done() && tree != nullptr; }
};

/**
 * LoadWorker - decodes one snapshot file on a background thread
 *
 * Progress events go through a bounded buffer and are dropped when the
 * consumer falls behind. The single Done event has its own slot and is
 * always delivered, after any progress still buffered.
 *
 * The worker never blocks on the consumer, so destroying it only waits
 * for the decode itself to finish.
 */
class LoadWorker {
public:
    static constexpr size_t kDefaultCapacity = 64;

    // Throws std::invalid_argument for an invalid config or zero capacity
    explicit LoadWorker(std::string path,
                        const DecoderConfig& config = DecoderConfig(),
                        size_t capacity = kDefaultCapacity);
    ~LoadWorker();

    LoadWorker(const LoadWorker&) = delete;
    LoadWorker& operator=(const LoadWorker&) = delete;

    // Blocks for the next event; nullopt once Done has been consumed
    std::optional<LoadEvent> next();

    // Progress events discarded because the buffer was full
    size_t dropped() const;

    const std::string& path() const { return path_; }

private:
    void run();
    bool try_push(LoadEvent ev);
    void finish(LoadEvent ev);

    const std::string path_;
    const SnapshotReader reader_;
    const size_t capacity_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    std::deque<LoadEvent> progress_;
    std::optional<LoadEvent> done_;
    bool done_taken_ = false;
    size_t dropped_ = 0;

    std::thread th_;
};

} // namespace snapshot
} // namespace zksnap
