/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
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
#include <cstdlib>
#include <cerrno>
#include <algorithm>
#include <type_traits>
#include <atomic>
#include <boost/filesystem/path.hpp>

namespace pathstore {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // Support engineering: detailed tracing
        LOG_DEBUG,    // Developer: debug information
        LOG_INFO,     // Production: normal operation
        LOG_WARNING,  // Production: warning conditions
        LOG_ERROR,    // Production: error conditions
        LOG_SEVERE    // Production: fatal errors
    };

    const char* logLevelToString(LogLevel l);

    /**
     * No-op sink returned when a message is filtered by level.
     */
    class ILogger {
    public:
        virtual ~ILogger() {}

        virtual ILogger& operator<<(const char*) { return *this; }
        virtual ILogger& operator<<(const string&) { return *this; }
        virtual ILogger& operator<<(char) { return *this; }
        virtual ILogger& operator<<(int) { return *this; }
        virtual ILogger& operator<<(unsigned long) { return *this; }
        virtual ILogger& operator<<(long) { return *this; }
        virtual ILogger& operator<<(unsigned) { return *this; }
        virtual ILogger& operator<<(double) { return *this; }
        virtual ILogger& operator<<(const void *) { return *this; }
        virtual ILogger& operator<<(long long) { return *this; }
        virtual ILogger& operator<<(unsigned long long) { return *this; }
        virtual ILogger& operator<<(bool) { return *this; }
        virtual ILogger& operator<< (ostream& ( *endl )(ostream&)) { return *this; }
        virtual void flush() {}
    };
    extern ILogger iLogger;

    /**
     * Per-thread message buffer. A message is formatted as
     * "<time> [<thread>] [<LEVEL>] <text>" and written under one lock,
     * to the log file when LogManager opened one, stderr otherwise.
     */
    class Logger : public ILogger {
        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream ss;
        LogLevel level_;
        string threadName_;

        Logger() : level_(LOG_INFO), threadName_("pathstore") {}

    public:
        friend class LogManager;

        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }

        static void setLogFile(FILE* f);
        static FILE* getLogFile();

        void flush() override;

        const string& threadName() const { return threadName_; }
        void setThreadName(const string& name) { threadName_ = name; }

        Logger& setLogLevel(LogLevel l) {
            level_ = l;
            return *this;
        }

        bool hasPending() const { return !ss.str().empty(); }

        Logger& operator<<(const char *x) override { ss << x; return *this; }
        Logger& operator<<(const string& x) override { ss << x; return *this; }
        Logger& operator<<(char x) override        { ss << x; return *this; }
        Logger& operator<<(int x) override         { ss << x; return *this; }
        Logger& operator<<(long x) override          { ss << x; return *this; }
        Logger& operator<<(unsigned long x) override { ss << x; return *this; }
        Logger& operator<<(unsigned x) override      { ss << x; return *this; }
        Logger& operator<<(double x) override        { ss << x; return *this; }
        Logger& operator<<(const void *x) override   { ss << x; return *this; }
        Logger& operator<<(long long x) override     { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) override { ss << x; return *this; }
        Logger& operator<<(bool x) override               { ss << x; return *this; }

        template<typename PathType>
        typename std::enable_if<
            std::is_same<PathType, boost::filesystem::path>::value,
            Logger&
        >::type operator<<(const PathType& p) {
            ss << p.string();
            return *this;
        }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) override {
            ss << '\n';
            flush();
            return *this;
        }
    };

    extern std::atomic<int> logLevel;

    // Flushes the buffered message when the statement ends
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        __attribute__((always_inline))
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        ~LoggerWrapper() {
            // Filtered messages carry a null logger
            if (should_flush_ && logger_ && logger_->hasPending()) {
                (*logger_) << '\n';
                logger_->flush();
            }
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_) {
                (*logger_) << value;
            }
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                should_flush_ = false;
            }
            return *this;
        }
    };

    inline LoggerWrapper log( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr, false);
        return LoggerWrapper(&Logger::get().setLogLevel( l ), true);
    }

    __attribute__((always_inline))
    inline LoggerWrapper trace() { return log(LOG_TRACE); }

    __attribute__((always_inline))
    inline LoggerWrapper debug() { return log(LOG_DEBUG); }

    __attribute__((always_inline))
    inline LoggerWrapper info() { return log(LOG_INFO); }

    __attribute__((always_inline))
    inline LoggerWrapper warn() { return log(LOG_WARNING); }

    __attribute__((always_inline))
    inline LoggerWrapper error() { return log(LOG_ERROR); }

    __attribute__((always_inline))
    inline LoggerWrapper severe() { return log(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    // Set log level from string (for configuration)
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = std::toupper(c);

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
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level) {
            if (!setLogLevelFromString(env_level)) {
                std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                         << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
            }
        }
    }

}
