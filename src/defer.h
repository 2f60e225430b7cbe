#pragma once

#include <utility>

namespace tmpguard {

// Run a function when going out of scope, unless dismissed before.
template<class F>
class Defer {
public:
    Defer(F on_destruct)
        : _on_destruct(std::move(on_destruct))
    {}

    Defer(const Defer&) = delete;
    Defer& operator=(const Defer&) = delete;

    Defer(Defer&& other)
        : _on_destruct(std::move(other._on_destruct))
        , _dismissed(other._dismissed)
    {
        other._dismissed = true;
    }

    ~Defer() {
        if (!_dismissed) _on_destruct();
    }

    void dismiss() { _dismissed = true; }

private:
    F _on_destruct;
    bool _dismissed = false;
};

template<class F> Defer<F> defer(F f) {
    return Defer<F>(std::move(f));
}

} // namespace
