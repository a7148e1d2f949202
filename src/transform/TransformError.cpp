#include "regexmap/transform/TransformError.h"

namespace regexmap::transform {

namespace error_utils {

ConfigError createMissingParamError(const std::string &param_name) {
    return ConfigError("missing required parameter '" + param_name + "'");
}

ConfigError createRegexError(const std::string &pattern,
                             const std::string &details) {
    return ConfigError("invalid regex '" + pattern + "': " + details);
}

RecordError createRecordError(const std::string &stage,
                              const std::string &details) {
    return RecordError(stage + " failed: " + details);
}

}  // namespace error_utils

}  // namespace regexmap::transform
