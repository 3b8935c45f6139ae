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

#include "log.h"

namespace zksnap {

    std::atomic<int> logLevel(LOG_WARNING);

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    const char* logLevelToString(LogLevel l) {
        switch (l) {
        case LOG_TRACE:
            return "TRACE";
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARNING:
            return "WARNING";
        case LOG_ERROR:
            return "ERROR";
        case LOG_SEVERE:
            return "SEVERE";
        default:
            return "UNKNOWN";
        }
    }

    static string currentTimestamp() {
        time_t t = time(0);
        struct tm buf;
        gmtime_r(&t, &buf);
        char out[32];
        if (strftime(out, sizeof(out), "%Y-%m-%dT%H:%M:%SZ", &buf) == 0)
            return "";
        return out;
    }

    void Logger::flush() {
        ostringstream oss;
        oss << currentTimestamp();
        oss << " [" << logLevelToString(logLevel) << "]";
        oss << " [" << getThreadName() << "] ";
        oss << ss.str() << '\n';
        string out = oss.str();

        {
            boost::mutex::scoped_lock lk(sm);
            FILE* target = logfile ? logfile : stderr;
            if (fputs(out.c_str(), target) >= 0) {
                fflush(target);
            }
            else {
                int x = errno;
                cerr << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out;
            }
        }
        _init();
    }

    void Logger::setLogFile(FILE* f) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }
}
