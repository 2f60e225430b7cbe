#pragma once

#include <boost/version.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/spawn.hpp>

#include "../namespaces.h"

namespace tmpguard { namespace util {

using AsioExecutor = asio::any_io_executor;

// The executor running the coroutine behind `yield`.
inline
AsioExecutor yield_executor(const asio::yield_context& yield)
{
#if BOOST_VERSION >= 108000
    return yield.get_executor();
#else
    return yield.handler_.get_executor();
#endif
}

}} // namespaces
