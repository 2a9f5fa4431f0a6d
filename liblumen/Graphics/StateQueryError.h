#pragma once

#include <stdexcept>
#include <string>

namespace lum
{
    // thrown when a `GraphicsState` cannot determine the initial state or
    // capabilities of its backend
    //
    // this is fatal to context construction: a context cannot cache state that
    // it cannot query
    class StateQueryError final : public std::runtime_error {
    public:
        explicit StateQueryError(const std::string& what) :
            std::runtime_error{"cannot query the initial state of the graphics backend: " + what}
        {}
    };
}
