#pragma once

namespace boost {
    namespace asio  {}
    namespace system {};
    namespace filesystem {};
}

namespace tmpguard {

namespace asio  = boost::asio;
namespace sys   = boost::system;
namespace fs    = boost::filesystem;

} // tmpguard namespace
