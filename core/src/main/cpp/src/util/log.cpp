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

#include "log.h"
#include "logmanager.h"

#include <chrono>

namespace dualwrite {

    ILogger iLogger;
    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;
    std::atomic<int> logLevel{LOG_WARNING};

    namespace {

        // 2026-03-01 12:00:00.123
        string timestamp() {
            auto now = std::chrono::system_clock::now();
            time_t secs = std::chrono::system_clock::to_time_t(now);
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
            struct tm tmv;
            localtime_r(&secs, &tmv);
            char buf[32];
            size_t n = strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
            snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
            return buf;
        }

    }

    const char* logLevelToString( LogLevel l ) {
        switch(l) {
        case LOG_TRACE:   return "TRACE";
        case LOG_DEBUG:   return "DEBUG";
        case LOG_INFO:    return "INFO";
        case LOG_WARNING: return "WARNING";
        case LOG_ERROR:   return "ERROR";
        case LOG_SEVERE:  return "SEVERE";
        }
        return "UNKNOWN";
    }

    void Logger::flush() {
        string msg = ss.str();
        reset();
        if ( msg.empty() )
            return;
        if ( msg.back() != '\n' )
            msg.push_back('\n');

        string out = timestamp() + " [" + _threadName + "] [" + logLevelToString(logLevel) + "] " + msg;

        boost::mutex::scoped_lock lk(sm);
        FILE* f = logfile ? logfile : stderr;
        if (fputs(out.c_str(), f) >= 0) {
            fflush(f);
        }
        else {
            int x = errno;
            cerr << "failed to write log line: " << errnoWithDescription(x) << ": " << out;
        }
    }

    void Logger::setLogFile( FILE* f ) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }
}
