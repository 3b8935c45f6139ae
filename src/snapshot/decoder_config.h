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
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include "config.h"  // For defaults

namespace zksnap {
namespace snapshot {

enum class VersionPolicy {
    AcceptAll,      // unknown versions are logged and decoded anyway
    RejectUnknown   // unknown versions fail with a format error
};

/**
 * Runtime configuration for the snapshot decoder
 */
struct DecoderConfig {
    // Length ceilings for string and buffer fields
    int32_t max_string_len   = limits::kMaxStringLen;
    int32_t max_buffer_len   = limits::kMaxBufferLen;

    // Minimum bytes consumed between two progress callbacks
    size_t progress_interval = limits::kProgressInterval;

    VersionPolicy version_policy = VersionPolicy::AcceptAll;

    // Fail on a trailer checksum mismatch instead of only warning
    bool verify_checksum = false;

    /**
     * Create config with defaults plus ZKSNAP_* environment overrides.
     * The library never calls this; front ends opt in explicitly.
     * Throws std::invalid_argument or std::out_of_range on a malformed value.
     */
    static DecoderConfig defaults() {
        DecoderConfig cfg;

        if (const char* env = std::getenv("ZKSNAP_MAX_STRING_LEN")) {
            cfg.max_string_len = clamp_len(std::stoull(env));
        }

        if (const char* env = std::getenv("ZKSNAP_MAX_BUFFER_LEN")) {
            cfg.max_buffer_len = clamp_len(std::stoull(env));
        }

        if (const char* env = std::getenv("ZKSNAP_PROGRESS_INTERVAL")) {
            cfg.progress_interval = std::stoull(env);
        }

        if (const char* env = std::getenv("ZKSNAP_STRICT_VERSION")) {
            if (std::string(env) != "0") {
                cfg.version_policy = VersionPolicy::RejectUnknown;
            }
        }

        if (const char* env = std::getenv("ZKSNAP_VERIFY_CHECKSUM")) {
            cfg.verify_checksum = (std::string(env) != "0");
        }

        return cfg;
    }

    /**
     * Config that rejects anything but the known format version and
     * verifies the trailer checksum
     */
    static DecoderConfig strict() {
        DecoderConfig cfg;
        cfg.version_policy = VersionPolicy::RejectUnknown;
        cfg.verify_checksum = true;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (max_string_len <= 0 || max_buffer_len <= 0) {
            return false;
        }
        if (progress_interval == 0) {
            return false;
        }
        return true;
    }

private:
    static int32_t clamp_len(unsigned long long v) {
        if (v > static_cast<unsigned long long>(std::numeric_limits<int32_t>::max())) {
            return 0;  // rejected by validate()
        }
        return static_cast<int32_t>(v);
    }
};

} // namespace snapshot
} // namespace zksnap
