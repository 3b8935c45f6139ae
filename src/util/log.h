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

#include "../pch.h"
#include <cctype>
#include <atomic>
#include <type_traits>
#include <boost/filesystem/path.hpp>

namespace zksnap {

    enum LogLevel {
        LOG_TRACE,    // per-record decoding detail
        LOG_DEBUG,    // section boundaries
        LOG_INFO,     // load summaries
        LOG_WARNING,  // tolerated anomalies in a snapshot
        LOG_ERROR,    // failed loads
        LOG_SEVERE
    };

    const char* logLevelToString(LogLevel l);

    /**
     * Per-thread message accumulator. Text is buffered in a stringstream
     * and written as one line on flush, so concurrent loaders never
     * interleave partial messages.
     */
    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream ss;
        LogLevel logLevel;
        string _threadName;

    public:
        /**
         * set the log file, nullptr routes output back to stderr
         */
        static void setLogFile(FILE* f);

        void flush();

        inline const string& getThreadName() const { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        template<typename T>
        typename std::enable_if<!std::is_same<T, boost::filesystem::path>::value, Logger&>::type
        operator<<(const T& x) {
            ss << x;
            return *this;
        }

        Logger& operator<<(const boost::filesystem::path& p) {
            ss << p.string();
            return *this;
        }

        Logger& operator<<(ostream& (*_endl)(ostream&)) {
            flush();
            return *this;
        }

        Logger& operator<<(ios_base& (*_manip)(ios_base&)) {
            ss << _manip;
            return *this;
        }

        static Logger& get() {
            Logger* p = tsp.get();
            if (p == 0)
                tsp.reset(p = new Logger());
            return *p;
        }

    private:
        Logger() : _threadName("ZKSNAP") {
            _init();
        }
        void _init() {
            ss.str("");
            ss.clear();
            logLevel = LOG_INFO;
        }
    };

    extern std::atomic<int> logLevel;

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        LoggerWrapper(LoggerWrapper&& other) noexcept
            : logger_(other.logger_), should_flush_(other.should_flush_) {
            other.should_flush_ = false;
        }

        ~LoggerWrapper() {
            // filtered messages carry a null logger
            if (should_flush_ && logger_) {
                logger_->flush();
            }
        }

        template<typename T>
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false; // endl already flushes
            }
            return *this;
        }
    };

    inline bool isLogEnabled(LogLevel l) {
        return l >= logLevel.load(std::memory_order_relaxed);
    }

    inline LoggerWrapper log(LogLevel l) {
        if (!isLogEnabled(l))
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().setLogLevel(l), true);
    }

    inline LoggerWrapper trace()   { return log(LOG_TRACE); }
    inline LoggerWrapper debug()   { return log(LOG_DEBUG); }
    inline LoggerWrapper info()    { return log(LOG_INFO); }
    inline LoggerWrapper warning() { return log(LOG_WARNING); }
    inline LoggerWrapper error()   { return log(LOG_ERROR); }
    inline LoggerWrapper severe()  { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        if (upper == "TRACE")   { logLevel.store(LOG_TRACE, std::memory_order_relaxed); return true; }
        if (upper == "DEBUG")   { logLevel.store(LOG_DEBUG, std::memory_order_relaxed); return true; }
        if (upper == "INFO")    { logLevel.store(LOG_INFO, std::memory_order_relaxed); return true; }
        if (upper == "WARNING" || upper == "WARN") { logLevel.store(LOG_WARNING, std::memory_order_relaxed); return true; }
        if (upper == "ERROR")   { logLevel.store(LOG_ERROR, std::memory_order_relaxed); return true; }
        if (upper == "SEVERE" || upper == "FATAL") { logLevel.store(LOG_SEVERE, std::memory_order_relaxed); return true; }

        return false;
    }

    // Initialize logging from environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("ZKSNAP_LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid ZKSNAP_LOG_LEVEL '" << env_level
                          << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}
