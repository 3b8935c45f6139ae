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

#include "load_worker.h"
#include <stdexcept>
#include "../util/log.h"

namespace zksnap {
namespace snapshot {

LoadWorker::LoadWorker(std::string path, const DecoderConfig& config, size_t capacity)
    : path_(std::move(path)), reader_(config), capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("LoadWorker capacity must be positive");
    }
    th_ = std::thread([this]{ run(); });
}

LoadWorker::~LoadWorker() {
    if (th_.joinable()) {
        th_.join();
    }
}

void LoadWorker::run() {
    Logger::get().setThreadName("loader");

    LoadEvent done;
    done.type = LoadEvent::Type::Done;

    try {
        auto on_progress = [this](uint64_t read, uint64_t total) {
            LoadEvent ev;
            ev.type = LoadEvent::Type::Progress;
            ev.bytes_read = read;
            ev.total_bytes = total;
            try_push(std::move(ev));
        };
        done.tree = std::make_shared<const Tree>(reader_.read_file(path_, on_progress));
    } catch (const SnapshotError& e) {
        done.error = e.what();
        done.error_kind = e.kind();
        done.error_offset = e.offset();
    } catch (const std::exception& e) {
        // Allocation failures and the like; no format offset applies
        error() << "snapshot load of " << path_ << " aborted: " << e.what();
        done.error = e.what();
        done.error_kind = ErrorKind::Io;
    }

    finish(std::move(done));
}

bool LoadWorker::try_push(LoadEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (progress_.size() >= capacity_) {
            dropped_++;
            return false;
        }
        progress_.push_back(std::move(ev));
    }
    cv_.notify_one();
    return true;
}

void LoadWorker::finish(LoadEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        done_ = std::move(ev);
    }
    cv_.notify_all();
}

std::optional<LoadEvent> LoadWorker::next() {
    std::unique_lock<std::mutex> lk(mu_);
    if (done_taken_) {
        return std::nullopt;
    }
    cv_.wait(lk, [this]{ return !progress_.empty() || done_.has_value(); });

    if (!progress_.empty()) {
        LoadEvent ev = std::move(progress_.front());
        progress_.pop_front();
        return ev;
    }

    done_taken_ = true;
    LoadEvent ev = std::move(*done_);
    done_.reset();
    return ev;
}

size_t LoadWorker::dropped() const {
    std::lock_guard<std::mutex> lk(mu_);
    return dropped_;
}

} // namespace snapshot
} // namespace zksnap
