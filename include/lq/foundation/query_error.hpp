#pragma once

/// @file query_error.hpp
/// @brief Error value returned by sources, operators and the object system.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "lq/foundation/error_code.hpp"

namespace lq::foundation {

/// Failure reported through QueryResult<T>.
///
/// Adapters and operators that reject an argument attach the argument's
/// lq::ValueKind as context, so callers can tell a string passed to
/// fromMapping() from a nil one without parsing the message:
///
/// @code
///   auto q = lq::query::fromMapping(lq::Value("oops"));
///   if (auto* kind = q.error().context<lq::ValueKind>()) {
///       // *kind == lq::ValueKind::String
///   }
/// @endcode
///
/// Object errors (MemberNotFound, NotCallable) name the member and class in
/// the message; NotCallable also carries the member's kind.  Config and
/// logger errors carry no context.
class QueryError {
public:
    QueryError() = default;

    explicit QueryError(ErrorCode code) : code_(code) {}

    QueryError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    QueryError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// "Source", "Query", "Object", ... derived from the code range.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Context of type @p T, or nullptr when absent or of another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept { return code_ == ErrorCode::Success; }

    /// "<subsystem>: <message>", or just the subsystem when there is no
    /// message.  Suitable for log lines.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        if (!message_.empty()) {
            out.append(": ").append(message_);
        }
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace lq::foundation
