#include "qorsense/errors.hpp"

namespace qorsense {

std::string error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kBadInput:
            return "bad_input";
        case ErrorKind::kInternal:
            return "internal";
    }
    return "internal";
}

AnalysisError::AnalysisError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

InvalidInputError::InvalidInputError(const std::string& message)
    : AnalysisError(ErrorKind::kBadInput, message) {}

ConfigError::ConfigError(const std::string& message) : InvalidInputError("config: " + message) {}

ComputationError::ComputationError(const std::string& message)
    : AnalysisError(ErrorKind::kInternal, message) {}

}  // namespace qorsense
