#pragma once

#include <utility>
#include <variant>
#include "error.hpp"

namespace hdwif {

// Result holds either a value produced by a pipeline stage or the DeriveError
// that stopped it. Stages return it instead of throwing on bad input.
template <typename T>
class Result {
public:
    Result(T value) : state_(std::in_place_index<0>, std::move(value)) {}
    Result(DeriveError error) : state_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return state_.index() == 0; }
    explicit operator bool() const { return ok(); }

    // Throws the held error when called on a failed result
    const T& value() const& {
        if (!ok()) {
            throw std::get<1>(state_);
        }
        return std::get<0>(state_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::get<1>(state_);
        }
        return std::get<0>(std::move(state_));
    }

    // Only valid when ok() is false
    const DeriveError& error() const { return std::get<1>(state_); }

private:
    std::variant<T, DeriveError> state_;
};

} // namespace hdwif
