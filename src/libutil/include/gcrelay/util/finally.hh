#pragma once
///@file

#include <cassert>
#include <exception>
#include <type_traits>
#include <utility>

/**
 * A trivial class to run a function at the end of a scope.
 */
template<typename Fn>
class [[nodiscard("Finally values must be used")]] Finally
{
private:
    Fn fun;
    bool movedFrom = false;

public:
    Finally(Fn fun)
        : fun(std::move(fun))
    {
    }

    // Copying a Finally would run the function twice.
    Finally(Finally & other) = delete;

    Finally(Finally && other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : fun(std::move(other.fun))
    {
        other.movedFrom = true;
    }

    ~Finally() noexcept(false)
    {
        try {
            if (!movedFrom)
                fun();
        } catch (...) {
            // A cleanup function must not throw while another exception
            // is already propagating.
            if (std::uncaught_exceptions()) {
                assert(false && "Finally function threw an exception during exception handling.");
            }
            throw;
        }
    }
};
