#pragma once

#include <boost/asio/spawn.hpp>
#include <boost/system/system_error.hpp>

#include "namespaces.h"

namespace tmpguard {

// Report `ec` to the caller of a coroutine based operation:
// stored in `ec` for `op(yield[ec])`, thrown as `sys::system_error` for `op(yield)`.
//
// Use it after `return` so that both cases leave the function:
//
//     if (ec) return or_throw<OptFile>(yield, ec);
//
inline
void or_throw(asio::yield_context yield, const sys::error_code& ec)
{
    if (!ec) return;
    if (!yield.ec_) throw sys::system_error(ec);
    *yield.ec_ = ec;
}

// Same as above, returning `ret` (the value of an empty result on error).
template<class Ret>
inline
Ret or_throw( asio::yield_context yield
            , const sys::error_code& ec
            , Ret&& ret = {})
{
    or_throw(yield, ec);
    return std::forward<Ret>(ret);
}

} // tmpguard namespace
