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

#include <cstdlib>
#include <iomanip>
#include <iostream>

#include <boost/filesystem.hpp>

#include "logger.h"

namespace tmpguard {

// The log file starts over once bigger than this.
static const std::streamoff log_file_max_size = 4 * 1024 * 1024;

static const char* level_names[] = {"SILLY", "DEBUG", "VERBOSE", "INFO", "WARN", "ERROR", "ABORT"};
static const char* level_colors[] = {"\033[1;35m", "\033[1;32m", "\033[1;37m", "\033[1;34m", "\033[90;103m", "\033[31;40m", "\033[1;31;40m"};
static const char* color_end = "\033[0m";

static thread_local std::string thread_tag;

static bool is_valid(log_level_t level) {
    return level >= SILLY && level <= ABORT;
}

log_level_t default_log_level() {
    return INFO;
}

boost::optional<log_level_t> log_level_from_string(const std::string& name)
{
    for (int l = SILLY; l <= ABORT; ++l)
        if (name == level_names[l]) return static_cast<log_level_t>(l);
    return boost::none;
}

std::ostream& operator<<(std::ostream& os, log_level_t level)
{
    if (!is_valid(level)) return os << "???";
    return os << level_names[level];
}

Logger logger(default_log_level());

Logger::Logger(log_level_t threshold)
    : _threshold(is_valid(threshold) && threshold != ABORT ? threshold : default_log_level())
    , _start(std::chrono::steady_clock::now())
{}

void Logger::set_threshold(log_level_t level)
{
    if (is_valid(level)) _threshold = level;
}

void Logger::set_thread_tag(std::string tag)
{
    thread_tag = std::move(tag);
}

void Logger::open_log_file(bool truncate)
{
    using std::ios;

    _log_file.emplace();
    _log_file->open(_log_filename, ios::out | (truncate ? ios::trunc : ios::app));

    if (!_log_file->is_open()) {
        std::cerr << "Failed to open log file " << _log_filename << std::endl;
        _log_filename.clear();
        _log_file = boost::none;
        return;
    }

    *_log_file << "\nTMPGUARD START\n";
}

void Logger::log_to_file(std::string fname)
{
    std::lock_guard<std::mutex> lock(_output_mutex);

    if (fname.empty()) {
        _log_file = boost::none;
        if (!_log_filename.empty()) {
            sys::error_code ignored_ec;
            fs::remove(_log_filename, ignored_ec);
        }
        _log_filename.clear();
        return;
    }

    if (_log_file && fname == _log_filename) return;

    _log_filename = std::move(fname);
    open_log_file(false);
}

std::fstream* Logger::get_log_file()
{
    if (!_log_file) return nullptr;
    return &*_log_file;
}

// `<seconds>: [LEVEL] <thread tag>: <message>`
static
void write_line( std::ostream& os
               , log_level_t level
               , bool with_color
               , boost::optional<double> ts
               , const std::string& msg)
{
    if (ts) os << std::fixed << std::setprecision(4) << *ts << ": ";
    if (with_color) os << level_colors[level];
    os << "[" << level_names[level] << "]";
    if (with_color) os << color_end;
    os << " ";
    if (!thread_tag.empty()) os << thread_tag << ": ";
    os << msg << "\n";
}

void Logger::log(log_level_t level, const std::string& msg)
{
    if (!is_valid(level) || !would_log(level)) return;

    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _start;
    double ts = elapsed.count();

    std::lock_guard<std::mutex> lock(_output_mutex);

    boost::optional<double> stderr_ts;
    if (_stamp_with_time) stderr_ts = ts;

    write_line(std::cerr, level, true, stderr_ts, msg);

    if (!_log_file) return;

    write_line(*_log_file, level, false, ts, msg);

    if (_log_file->tellp() > log_file_max_size) open_log_file(true);
}

void Logger::abort(const std::string& msg)
{
    log(ABORT, msg);
    std::exit(1);
}

} // tmpguard namespace
