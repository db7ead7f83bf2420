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
#include <atomic>

namespace dualwrite {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // per-attempt detail
        LOG_DEBUG,    // successful writes, queue movement
        LOG_INFO,     // lifecycle, recoveries
        LOG_WARNING,  // partial writes, retries, drift
        LOG_ERROR,    // failed writes, abandoned retries
        LOG_SEVERE    // broken invariants
    };

    const char* logLevelToString(LogLevel l);

    // Sink for filtered messages; every insertion is a no-op.
    class ILogger {
    public:
        virtual ~ILogger() {}

        virtual ILogger& operator<<(const char*)        { return *this; }
        virtual ILogger& operator<<(const string&)      { return *this; }
        virtual ILogger& operator<<(char)               { return *this; }
        virtual ILogger& operator<<(int)                { return *this; }
        virtual ILogger& operator<<(long)               { return *this; }
        virtual ILogger& operator<<(unsigned long)      { return *this; }
        virtual ILogger& operator<<(unsigned)           { return *this; }
        virtual ILogger& operator<<(double)             { return *this; }
        virtual ILogger& operator<<(const void*)        { return *this; }
        virtual ILogger& operator<<(long long)          { return *this; }
        virtual ILogger& operator<<(unsigned long long) { return *this; }
        virtual ILogger& operator<<(bool)               { return *this; }
        virtual ILogger& operator<< (ostream& ( *endl )(ostream&)) { return *this; }
        virtual void flush() {}
    };
    extern ILogger iLogger;

    /**
     * Per-thread line buffer. Each complete line is prefixed with a local
     * timestamp (millisecond precision), the thread name and the level, then
     * written under one process-wide lock so lines from different threads
     * never interleave.
     */
    class Logger : public ILogger {
        static boost::mutex sm;
        static FILE* logfile;
        mutable stringstream ss;
        LogLevel logLevel;
        string _threadName;
    public:

        friend class LogManager;

        // nullptr routes output back to stderr
        static void setLogFile(FILE* f);

        void flush() override;

        inline const string& getThreadName() const { return _threadName; }
        inline void setThreadName(const string& name) { _threadName = name; }

        inline Logger& setLogLevel(LogLevel l) {
            logLevel = l;
            return *this;
        }

        Logger& operator<<(const char* x) override         { ss << x; return *this; }
        Logger& operator<<(const string& x) override       { ss << x; return *this; }
        Logger& operator<<(char x) override                { ss << x; return *this; }
        Logger& operator<<(int x) override                 { ss << x; return *this; }
        Logger& operator<<(long x) override                { ss << x; return *this; }
        Logger& operator<<(unsigned long x) override       { ss << x; return *this; }
        Logger& operator<<(unsigned x) override            { ss << x; return *this; }
        Logger& operator<<(double x) override              { ss << x; return *this; }
        Logger& operator<<(const void* x) override         { ss << x; return *this; }
        Logger& operator<<(long long x) override           { ss << x; return *this; }
        Logger& operator<<(unsigned long long x) override  { ss << x; return *this; }
        Logger& operator<<(bool x) override                { ss << (x ? "true" : "false"); return *this; }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) override {
            flush();
            return *this;
        }

        bool hasPending() const { return ss.tellp() > 0; }

        static Logger& get() {
            Logger* p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }

    private:
        static boost::thread_specific_ptr<Logger> tsp;
        Logger() : logLevel(LOG_INFO), _threadName("main") {}
        void reset() {
            ss.str("");
            ss.clear();
        }
    };

    extern std::atomic<int> logLevel;

    // Flushes one line when the statement ends
    class LoggerWrapper {
        Logger* logger_;
        bool should_flush_;
    public:
        LoggerWrapper(Logger* logger, bool should_flush)
            : logger_(logger), should_flush_(should_flush) {}

        LoggerWrapper(LoggerWrapper&& other) noexcept
            : logger_(other.logger_), should_flush_(other.should_flush_) {
            other.logger_ = nullptr;
            other.should_flush_ = false;
        }

        ~LoggerWrapper() {
            // filtered messages carry a null logger
            if (should_flush_ && logger_ && logger_->hasPending()) {
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
                should_flush_ = false;
            }
            return *this;
        }
    };

    inline bool logEnabled(LogLevel l) {
        return l >= logLevel.load(std::memory_order_relaxed);
    }

    inline LoggerWrapper log( LogLevel l ) {
        if ( !logEnabled(l) )
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

    // Names the calling thread in every line it logs
    inline void setLogThreadName(const string& name) {
        Logger::get().setThreadName(name);
    }

    // Accepts TRACE..SEVERE in any case, plus WARN and FATAL
    inline bool setLogLevelFromString(const std::string& level) {
        std::string upper = level;
        for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

        LogLevel l;
        if (upper == "TRACE") l = LOG_TRACE;
        else if (upper == "DEBUG") l = LOG_DEBUG;
        else if (upper == "INFO") l = LOG_INFO;
        else if (upper == "WARNING" || upper == "WARN") l = LOG_WARNING;
        else if (upper == "ERROR") l = LOG_ERROR;
        else if (upper == "SEVERE" || upper == "FATAL") l = LOG_SEVERE;
        else return false;

        logLevel.store(l, std::memory_order_relaxed);
        return true;
    }

    // Applies LOG_LEVEL when set; an unknown value leaves the level alone
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "ignoring LOG_LEVEL '" << env_level
                      << "'; expected TRACE, DEBUG, INFO, WARNING, ERROR or SEVERE\n";
        }
    }

}
