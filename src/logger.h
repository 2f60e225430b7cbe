/**
 * Multiparty Off-the-Record Messaging library
 * Copyright (C) 2014, eQualit.ie
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of version 3 of the GNU Lesser General
 * Public License as published by the Free Software Foundation.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA
 */
#ifndef TMPGUARD_LOGGER_H_
#define TMPGUARD_LOGGER_H_

#include <chrono>
#include <fstream>
#include <mutex>
#include <string>

#include <boost/optional.hpp>

#include "namespaces.h"
#include "util/str.h"

// The message is only built if it is going to be logged.
#define TMPGUARD_LOG(level, ...) \
    do { \
        if (::tmpguard::logger.would_log(::tmpguard::level)) \
            ::tmpguard::logger.log(::tmpguard::level, ::tmpguard::util::str(__VA_ARGS__)); \
    } while (false)

#define LOG_SILLY(...)   TMPGUARD_LOG(SILLY, __VA_ARGS__)
#define LOG_DEBUG(...)   TMPGUARD_LOG(DEBUG, __VA_ARGS__)
#define LOG_VERBOSE(...) TMPGUARD_LOG(VERBOSE, __VA_ARGS__)
#define LOG_INFO(...)    TMPGUARD_LOG(INFO, __VA_ARGS__)
#define LOG_WARN(...)    TMPGUARD_LOG(WARN, __VA_ARGS__)
#define LOG_ERROR(...)   TMPGUARD_LOG(ERROR, __VA_ARGS__)
#define LOG_ABORT(...)   ::tmpguard::logger.abort(::tmpguard::util::str(__VA_ARGS__))

namespace tmpguard {

// Standard log levels, ascending order of specificity.
enum log_level_t { SILLY, DEBUG, VERBOSE, INFO, WARN, ERROR, ABORT };

log_level_t default_log_level();

// Parse an upper case level name like "DEBUG".
boost::optional<log_level_t> log_level_from_string(const std::string&);

std::ostream& operator<<(std::ostream&, log_level_t);

class Logger
{
  public:
    // An invalid threshold falls back to `default_log_level()`.
    Logger(log_level_t threshold);

    log_level_t get_threshold() const { return _threshold; }
    // Invalid levels are ignored.
    void set_threshold(log_level_t);
    bool would_log(log_level_t level) const { return _threshold <= level; }

    // Prefix messages on standard error with the seconds since creation.
    // Messages to the log file always have it.
    void enable_timestamp() { _stamp_with_time = true; }
    void disable_timestamp() { _stamp_with_time = false; }

    // Name shown in messages logged from the calling thread.
    static void set_thread_tag(std::string);

    // Start logging to the given file, or stop (and remove it) if empty.
    // Once it grows too big it starts over.
    void log_to_file(std::string fname);
    std::string current_log_file() const { return _log_filename; }
    std::fstream* get_log_file();

    void log(log_level_t, const std::string& msg);

    void silly  (const std::string& msg) { log(SILLY, msg); }
    void debug  (const std::string& msg) { log(DEBUG, msg); }
    void verbose(const std::string& msg) { log(VERBOSE, msg); }
    void info   (const std::string& msg) { log(INFO, msg); }
    void warn   (const std::string& msg) { log(WARN, msg); }
    void error  (const std::string& msg) { log(ERROR, msg); }
    // Log and exit the program.
    [[noreturn]] void abort(const std::string& msg);

  private:
    void open_log_file(bool truncate);

  private:
    log_level_t _threshold;
    bool _stamp_with_time = false;
    std::chrono::steady_clock::time_point _start;

    std::string _log_filename;
    boost::optional<std::fstream> _log_file;

    // Messages may come from the filesystem worker thread.
    std::mutex _output_mutex;
};

extern Logger logger;

} // tmpguard namespace

#endif // TMPGUARD_LOGGER_H_
