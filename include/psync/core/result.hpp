/**
 * @file result.hpp
 * @brief Value-or-error return type of every fallible psync call
 *
 * Backends and engines never throw for expected failures (missing paths,
 * I/O faults, bad configuration). They return a Result that holds either
 * the produced value or the error explaining why there is none, and the
 * caller decides whether to propagate, collect or log it.
 *
 * Result<void, E> is the plain success-or-error form. error.hpp names the
 * two instantiations used throughout: Status and TransferResult<T>.
 *
 * EXAMPLE:
 * TransferResult<std::uint64_t> size = Ok<TransferError>(std::uint64_t{42});
 * Status failed = Err<void>(TransferError::not_found("/missing"));
 */

#pragma once

#include <optional>
#include <utility>
#include <variant>

namespace psync {

// Select the alternative explicitly, so Result<T, E> works even when T and E coincide
struct ok_tag_t {
    explicit ok_tag_t() = default;
};
struct err_tag_t {
    explicit err_tag_t() = default;
};
inline constexpr ok_tag_t ok_tag{};
inline constexpr err_tag_t err_tag{};

template<typename T, typename E>
class Result {
public:
    Result(ok_tag_t, T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(err_tag_t, E error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return data_.index() == 1; }

    /// Throws std::bad_variant_access when called on an error
    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    E& error() & { return std::get<1>(data_); }
    const E& error() const& { return std::get<1>(data_); }

private:
    std::variant<T, E> data_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(err_tag_t, E error) : error_(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    /// Throws std::bad_optional_access on success
    E& error() & { return error_.value(); }
    const E& error() const& { return error_.value(); }

private:
    std::optional<E> error_;
};

/// Success carrying `value`; the error type is named first, e.g. Ok<TransferError>(bytes)
template<typename E, typename T>
Result<T, E> Ok(T value) {
    return Result<T, E>(ok_tag, std::move(value));
}

template<typename E>
Result<void, E> Ok() {
    return Result<void, E>();
}

/// Failure of a call that would have produced a T (void for Status)
template<typename T, typename E>
Result<T, E> Err(E error) {
    return Result<T, E>(err_tag, std::move(error));
}

} // namespace psync
