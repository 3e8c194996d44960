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
#include <sys/file.h>
#include <boost/filesystem.hpp>
#include "../persistence/config.h"

namespace pathstore {

    /**
     * Routes all Logger output to a file under the given directory.
     * Falls back to $PATHSTORE_LOG_DIR, then the current directory.
     */
    class LogManager {
    public:

        explicit LogManager(string logdir="", bool append=true) : _enabled(false), _append(append), _file(0) {
            string dir = logdir;
            if(dir.empty()) {
                const char* env = getenv(persist::env::kLogDir);
                dir = env ? string(env) : string(".");
            }
            boost::filesystem::path lp = boost::filesystem::path(dir) / "pathstore.log";
            start(lp.string(), append);
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(0);
                fclose( _file );
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
            if (strftime(buf, sizeof(buf), fmt, &t) == 0)
                return string();
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            if (boost::filesystem::is_directory(lp)) {
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");
            }
            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test ) {
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());
            }

            if (append && exists){
                const string msg = "\n\n***** STORAGE REOPENED *****\n\n\n";
                fwrite(msg.data(), 1, msg.size(), test);
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
                // Rename the (open) existing log file to a timestamped name
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                rename( _path.c_str() , s.c_str() );
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp ) {
                throw std::runtime_error("can't open: " + _path + " for log file");
            }

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );
            _file = tmp;
        }

    private:
        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
