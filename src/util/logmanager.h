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

#include "log.h"
#include <stdexcept>
#include <boost/filesystem.hpp>

namespace zksnap {

    /**
     * Routes all Logger output to a file for the lifetime of the manager.
     * The previous destination (stderr) is restored on destruction.
     */
    class LogManager {
    public:
        explicit LogManager(const string& logpath, bool append = true) : _file(0) {
            start(logpath, append);
        }

        ~LogManager() {
            Logger::setLogFile(nullptr);
            if (_file) {
                fclose(_file);
            }
        }

        const string& path() const { return _path; }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

    private:
        void start(const string& lp, bool append) {
            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }

            bool exists = boost::filesystem::exists(lp);

            FILE* f = fopen(lp.c_str(), append ? "a" : "w");
            if (!f) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists) {
                const string msg = "\n***** LOG REOPENED *****\n\n";
                if (fwrite(msg.data(), 1, msg.size(), f) != msg.size()) {
                    int x = errno;
                    fclose(f);
                    throw std::runtime_error("can't write to [" + lp + "]: " + errnoWithDescription(x));
                }
            }

            _path = lp;
            _file = f;
            Logger::setLogFile(_file);
        }

        string _path;
        FILE* _file;
    };
}
