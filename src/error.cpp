#include <cstdio>

#include "error.h"

namespace tmpguard { namespace error {

class TmpguardErrorCategory: public sys::error_category {
public:
    const char* name() const noexcept {
        return "tmpguard error";
    }

    std::string message( int ev ) const {
        char buffer[ 64 ];
        return this->message( ev, buffer, sizeof(buffer));
    }

    char const* message(int ev, char * buffer, std::size_t len) const noexcept {
        switch(static_cast<errc>(ev))
        {
            case invalid_input:            return "invalid directory or entry name";
            case not_found:                return "no such entry to wrap";
            case name_collision_exhausted: return "too many name collisions";
            case already_consumed:         return "handle already removed or released";
            case removal_incomplete:       return "some entries could not be removed";
        }

        if (ev == 0) return "no error";
        std::snprintf(buffer, len, "Unknown error %d", ev );
        return buffer;
    }
};

sys::error_category const& tmpguard_category() {
    static const TmpguardErrorCategory instance;
    return instance;
}

}} // namespaces
