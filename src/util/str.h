#pragma once

#include <sstream>
#include <string>

#include <boost/system/error_code.hpp>

namespace tmpguard { namespace util {

// How `str` prints a value, overload for types whose `operator<<`
// does not suit log messages.
template<class Arg>
inline
void arg_to_stream(std::ostream& s, const Arg& arg) {
    s << arg;
}

// `"No such file or directory" (system:2)`
inline
void arg_to_stream(std::ostream& s, const boost::system::error_code& ec) {
    s << '"' << ec.message() << "\" (" << ec.category().name() << ':' << ec.value() << ')';
}

// Concatenate the printed form of all arguments.
template<class... Args>
inline
std::string str(const Args&... args) {
    std::ostringstream ss;
    (arg_to_stream(ss, args), ...);
    return ss.str();
}

}} // namespaces
