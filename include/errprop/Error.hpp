#ifndef ERRPROP_ERROR_HPP
#define ERRPROP_ERROR_HPP

#include <cstdint>
#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>
#include <magic_enum.hpp>

namespace errprop {

enum class ErrorKind : std::uint8_t {
    UnsupportedOperation,  ///< floor division or any other explicitly disallowed operator
    ShapeMismatch,         ///< array operands (or value/uncertainty pair) with different extents
    DivisionByZero,        ///< weighted combination of two zero-uncertainty measurements
    UndefinedResult,       ///< percent error of a zero nominal value
    CapabilityUnavailable, ///< array-valued instance requested while array support is disabled
};

struct exception : public std::exception {
    ErrorKind            kind;
    std::string          message;
    std::source_location sourceLocation;

    exception(ErrorKind kind_, std::string_view msg, std::source_location location = std::source_location::current()) noexcept : kind(kind_), message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{}: {} at {}:{}", magic_enum::enum_name(kind), message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

struct Error {
    ErrorKind            kind = ErrorKind::UnsupportedOperation;
    std::string          message;
    std::source_location sourceLocation;

    Error(ErrorKind kind_ = ErrorKind::UnsupportedOperation, std::string_view msg = "unknown error", std::source_location location = std::source_location::current()) noexcept //
        : kind(kind_), message(msg), sourceLocation(location) {}

    explicit Error(const errprop::exception& ex) noexcept : Error(ex.kind, ex.message, ex.sourceLocation) {}

    [[nodiscard]] std::string_view kindName() const noexcept { return magic_enum::enum_name(kind); }
    [[nodiscard]] std::string      srcLoc() const noexcept { return fmt::format("{}:{}", sourceLocation.file_name(), sourceLocation.line()); }
    [[nodiscard]] std::string      methodName() const noexcept { return {sourceLocation.function_name()}; }
};

static_assert(std::is_default_constructible_v<Error>);
static_assert(!std::is_trivially_copyable_v<Error>); // because of the usage of std::string

} // namespace errprop

#endif // ERRPROP_ERROR_HPP
