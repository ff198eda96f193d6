#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace protoplan {

enum class ErrorKind {
    MissingRequiredField,
    MissingDependentField,
    MalformedOptionsString,
    MalformedLabel,
    DuplicateSource,
    DuplicateOutput,
    Cycle,
    ParseError,
    Io,
};

constexpr std::string_view to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::MissingRequiredField:
        return "MissingRequiredField";
    case ErrorKind::MissingDependentField:
        return "MissingDependentField";
    case ErrorKind::MalformedOptionsString:
        return "MalformedOptionsString";
    case ErrorKind::MalformedLabel:
        return "MalformedLabel";
    case ErrorKind::DuplicateSource:
        return "DuplicateSource";
    case ErrorKind::DuplicateOutput:
        return "DuplicateOutput";
    case ErrorKind::Cycle:
        return "Cycle";
    case ErrorKind::ParseError:
        return "ParseError";
    case ErrorKind::Io:
        return "Io";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Builds an unexpected `Error` from a kind and a format string.
 */
template <typename... Args>
std::unexpected<Error> fail(ErrorKind kind, std::format_string<Args...> fmt, Args &&...args) {
    return std::unexpected(Error{kind, std::format(fmt, std::forward<Args>(args)...)});
}

} // namespace protoplan

template <>
struct std::formatter<protoplan::Error> : std::formatter<std::string_view> {
    auto format(const protoplan::Error &err, std::format_context &ctx) const {
        return std::format_to(ctx.out(), "{}: {}", protoplan::to_string(err.kind), err.message);
    }
};
