#ifndef QORSENSE_ERRORS_HPP
#define QORSENSE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace qorsense {

enum class ErrorKind {
    kBadInput,
    kInternal,
};

std::string error_kind_name(ErrorKind kind);

// Root of every failure that escapes the engine. Hosting layers branch on kind(),
// never on the message text.
class AnalysisError : public std::runtime_error {
public:
    AnalysisError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidInputError : public AnalysisError {
public:
    explicit InvalidInputError(const std::string& message);
};

class ConfigError : public InvalidInputError {
public:
    explicit ConfigError(const std::string& message);
};

class ComputationError : public AnalysisError {
public:
    explicit ComputationError(const std::string& message);
};

}  // namespace qorsense

#endif  // QORSENSE_ERRORS_HPP
