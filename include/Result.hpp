#pragma once

#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace schemaforge {

// Value-or-error carrier returned by validators and managers.
// T and E must be distinct types.
template <typename T, typename E>
class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return m_data.index() == 0; }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(m_data);
    }

    T& value() {
        if (!ok()) {
            throw std::logic_error("Result::value() called on an error result");
        }
        return std::get<0>(m_data);
    }

    const E& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on a success result");
        }
        return std::get<1>(m_data);
    }

    T valueOr(T fallback) const {
        return ok() ? std::get<0>(m_data) : std::move(fallback);
    }

    // Carry the error of another result kind over unchanged
    template <typename U>
    static Result fromError(const Result<U, E>& other) {
        return Result(other.error());
    }

private:
    std::variant<T, E> m_data;
};

// Success-or-error form
template <typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    bool ok() const { return !m_error.has_value(); }
    explicit operator bool() const { return ok(); }

    const E& error() const {
        if (ok()) {
            throw std::logic_error("Result::error() called on a success result");
        }
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

}  // namespace schemaforge
