#pragma once

#include <stdexcept>
#include <string>

namespace geoshard {

/**
 * Structured error reporting for the shard build pipeline.
 * Every failure carries a code, the function it was raised from and,
 * where one exists, a hint for the operator.
 */

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,

    // Build-time errors
    CONFIGURATION = 100,
    BUILD_INVARIANT = 101,

    // I/O errors
    IO = 300,

    INTERNAL_ERROR = 500
};

class GeoshardException : public std::runtime_error {
public:
    explicit GeoshardException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "Geoshard error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

class InvalidArgumentError : public GeoshardException {
public:
    explicit InvalidArgumentError(const std::string& message,
                                  const std::string& context = "",
                                  const std::string& suggestion = "")
        : GeoshardException(ErrorCode::INVALID_ARGUMENT, message, context, suggestion) {}
};

// Invalid shard-count bounds, storage level or config file contents
class ConfigurationError : public GeoshardException {
public:
    explicit ConfigurationError(const std::string& message,
                                const std::string& context = "",
                                const std::string& suggestion = "")
        : GeoshardException(ErrorCode::CONFIGURATION, message, context, suggestion) {}
};

// Fatal, never retried: the build inputs contradict each other
class BuildInvariantError : public GeoshardException {
public:
    explicit BuildInvariantError(const std::string& message,
                                 const std::string& context = "",
                                 const std::string& suggestion = "")
        : GeoshardException(ErrorCode::BUILD_INVARIANT, message, context, suggestion) {}
};

class IOError : public GeoshardException {
public:
    explicit IOError(const std::string& message,
                     const std::string& context = "",
                     const std::string& suggestion = "")
        : GeoshardException(ErrorCode::IO, message, context, suggestion) {}
};

#define GEOSHARD_CHECK_CONFIG(condition, message) \
    do { if (!(condition)) throw geoshard::ConfigurationError(message, __func__); } while (0)

#define GEOSHARD_CHECK_INVARIANT(condition, message) \
    do { if (!(condition)) throw geoshard::BuildInvariantError(message, __func__); } while (0)

#define GEOSHARD_THROW_IO(message) \
    throw geoshard::IOError(message, __func__)

} // namespace geoshard
