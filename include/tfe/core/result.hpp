#pragma once

/// @file result.hpp
/// @brief Result<T,E> type for explicit error handling without exceptions.

#include <string>
#include <utility>
#include <variant>

namespace tfe {

/// Minimal error payload for Result when no richer type is needed.
struct Error {
    int code = 0;
    std::string message;

    Error() = default;
    explicit Error(std::string msg) : code(-1), message(std::move(msg)) {}
    Error(int c, std::string msg) : code(c), message(std::move(msg)) {}
};

/// Either a value of type T or an error of type E.
///
/// Every library function that can fail returns a Result instead of
/// throwing, so a replay that fails halfway is visible at the call site.
///
/// Example:
/// @code
///   auto prepared = MatchStream::prepare(records);
///   if (!prepared) {
///       TFE_LOG_ERROR(LogCategory::Ingest, prepared.error().message());
///       return;
///   }
///   for (const auto& match : prepared.value().matches) { ... }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    /// Construct a success result.
    static Result ok(T value) { return Result(std::in_place_index<0>, std::move(value)); }

    /// Construct an error result.
    static Result err(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }

    /// True on success.
    explicit operator bool() const noexcept { return hasValue(); }

    /// Access the success value (throws std::bad_variant_access on error).
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Access the error (throws std::bad_variant_access on success).
    [[nodiscard]] const E& error() const& { return std::get<1>(data_); }
    [[nodiscard]] E& error() & { return std::get<1>(data_); }

    /// Value on success, @p fallback otherwise.
    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : data_(tag, std::forward<U>(payload)) {}

    std::variant<T, E> data_;
};

/// Specialization for operations that only report success or failure.
template <typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(); }
    static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return success_; }
    [[nodiscard]] bool hasError() const noexcept { return !success_; }
    explicit operator bool() const noexcept { return success_; }

    [[nodiscard]] const E& error() const& { return error_; }

private:
    Result() : success_(true) {}
    explicit Result(E error) : success_(false), error_(std::move(error)) {}

    bool success_ = false;
    E error_;
};

}  // namespace tfe
