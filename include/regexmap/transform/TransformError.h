#pragma once

#include <stdexcept>
#include <string>

namespace regexmap::transform {

/**
 * Base exception class for all transformation errors
 */
class TransformError : public std::runtime_error {
  public:
    explicit TransformError(const std::string &message)
        : std::runtime_error(message) {}
    virtual ~TransformError() = default;
};

/**
 * Configuration errors
 * Raised once, while the operation list is loaded. A module that hits one
 * must not start.
 */
class ConfigError : public TransformError {
  public:
    explicit ConfigError(const std::string &message)
        : TransformError("Config error: " + message) {}
};

/**
 * Per-record errors
 * The payload is not UTF-8 text or not a JSON document. Only the current
 * record is aborted.
 */
class RecordError : public TransformError {
  public:
    explicit RecordError(const std::string &message)
        : TransformError("Record error: " + message) {}
};

/**
 * Module lifecycle errors (used before initialization)
 */
class ModuleStateError : public TransformError {
  public:
    explicit ModuleStateError(const std::string &message)
        : TransformError(message) {}
};

/**
 * Utility functions for error handling
 */
namespace error_utils {
/**
 * Create config error for a missing host parameter
 */
ConfigError createMissingParamError(const std::string &param_name);

/**
 * Create config error from a pattern that failed to compile
 */
ConfigError createRegexError(const std::string &pattern,
                             const std::string &details);

/**
 * Create record error from a payload decoding step
 */
RecordError createRecordError(const std::string &stage,
                              const std::string &details);
}  // namespace error_utils

}  // namespace regexmap::transform
