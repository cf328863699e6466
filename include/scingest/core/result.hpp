#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace scingest {

// Tagged carriers so Ok/Err stay distinct even when T == E.
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

struct OkUnit {};

/**
 * @brief Value-or-error return type used across module boundaries
 *
 * Built from the helpers below:
 * @code
 * Result<std::size_t, UploadError> count() {
 *     if (broken) return Err(UploadError{ErrorCode::IoError, "disk gone"});
 *     return Ok(42u);
 * }
 * @endcode
 */
template<typename T, typename E = std::string>
class Result {
public:
    template<typename U>
    Result(OkValue<U> ok) : data_(std::in_place_index<0>, T(std::move(ok.value))) {}

    template<typename U>
    Result(ErrValue<U> err) : data_(std::in_place_index<1>, E(std::move(err.error))) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(OkUnit) {}

    template<typename U>
    Result(ErrValue<U> err) : error_(E(std::move(err.error))) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<std::decay_t<T>> Ok(T&& value) {
    return OkValue<std::decay_t<T>>(std::forward<T>(value));
}

inline OkUnit Ok() { return {}; }

template<typename E>
ErrValue<std::decay_t<E>> Err(E&& error) {
    return ErrValue<std::decay_t<E>>(std::forward<E>(error));
}

/**
 * @brief The earliest error among results already evaluated, or Ok
 *
 * The elements of a braced list are evaluated left to right, so
 * @code
 * auto read = first_error({read_key(s, "host", host), read_key(s, "port", port)});
 * if (read.is_error()) return Err(std::move(read.error()));
 * @endcode
 * reports the first key that failed.
 */
template<typename E>
Result<void, E> first_error(std::initializer_list<Result<void, E>> results) {
    for (const auto& result : results) {
        if (result.is_error()) {
            return Err(result.error());
        }
    }
    return Ok();
}

} // namespace scingest
