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

#include "log.h"
#include <boost/filesystem.hpp>

namespace dualwrite {

    /**
     * Routes all Logger output to <logdir>/dualwrite.log.  The previous file
     * is renamed to a timestamped name on rotate().
     */
    class LogManager {
    public:

        explicit LogManager(string logdir = "", bool append = true) : _enabled(false), _append(append), _file(0) {
            if (logdir.empty()) {
                const char* env = getenv("DUALWRITE_LOG_DIR");
                logdir = env ? env : "logs";
            }
            boost::system::error_code ec;
            boost::filesystem::create_directories(logdir, ec);
            if (ec) {
                throw std::runtime_error("can't create log directory [" + logdir + "]: " + ec.message());
            }
            start((boost::filesystem::path(logdir) / "dualwrite.log").string());
        }

        ~LogManager() {
            if (_file) {
                Logger::setLogFile(nullptr);
                fclose(_file);
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t now = time(0);
            gmtime_r(&now, &t);

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if (strftime(buf, sizeof(buf), fmt, &t) == 0) {
                return "unknown-time";
            }
            return buf;
        }

        // Rotate once the active file has grown past max_bytes
        bool rotateIfLarger(uintmax_t max_bytes) {
            boost::system::error_code ec;
            uintmax_t size = boost::filesystem::file_size(_path, ec);
            if (ec || size < max_bytes) {
                return false;
            }
            rotate();
            return true;
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            FILE* old = _file;
            if ( old ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                boost::system::error_code ec;
                boost::filesystem::rename(_path, ss.str(), ec);
                if (ec) {
                    cerr << "can't rotate log file " << _path << ": " << ec.message() << endl;
                }
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file: " + errnoWithDescription());
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file
            if ( old )
                fclose( old );
            _file = tmp;
        }

    private:
        void start( const string& lp ) {
            bool exists = boost::filesystem::exists(lp);

            FILE* test = fopen( lp.c_str(), _append ? "a" : "w" );
            if ( !test ) {
                if (boost::filesystem::is_directory(lp)) {
                    throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
                }
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (_append && exists) {
                // two blank lines before and after
                const string msg = "\n\n***** SERVICE RESTARTED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), test) != msg.size()) {
                    cerr << "can't write restart banner to " << lp << endl;
                }
            }
            fclose( test );

            _path = lp;
            _enabled = true;
            _file = fopen(_path.c_str(), "a");
            if ( !_file ) {
                throw std::runtime_error("can't open: " + _path + " for log file: " + errnoWithDescription());
            }
            Logger::setLogFile(_file);
        }

        bool _enabled;
        bool _append;
        string _path;
        FILE* _file;
    };
}
