#include "regexmap/rules/OperationConfig.h"

#include "regexmap/transform/TransformError.h"

namespace regexmap::rules {

using regexmap::transform::ConfigError;

namespace {

std::string requireString(const nlohmann::json &j, const std::string &variant,
                          const std::string &field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string()) {
        throw ConfigError(variant + " operation requires string field '" +
                          field + "'");
    }
    return it->get<std::string>();
}

void requireObject(const nlohmann::json &j, const std::string &variant) {
    if (!j.is_object()) {
        throw ConfigError(variant + " operation must be an object, got " +
                          std::string(j.type_name()));
    }
}

}  // namespace

void from_json(const nlohmann::json &j, CaptureOperation &o) {
    requireObject(j, CAPTURE_KEY);
    o = makeCapture(requireString(j, CAPTURE_KEY, "regex"),
                    requireString(j, CAPTURE_KEY, "target"),
                    requireString(j, CAPTURE_KEY, "output"));
}

void from_json(const nlohmann::json &j, ReplaceOperation &o) {
    requireObject(j, REPLACE_KEY);
    o = makeReplace(requireString(j, REPLACE_KEY, "regex"),
                    requireString(j, REPLACE_KEY, "target"),
                    requireString(j, REPLACE_KEY, "with"));
}

Operation parseOperation(const nlohmann::json &spec) {
    if (!spec.is_object() || spec.size() != 1) {
        throw ConfigError(
            "operation must be an object with exactly one of '" +
            std::string(CAPTURE_KEY) + "' or '" + REPLACE_KEY + "'");
    }

    auto entry = spec.begin();
    if (entry.key() == CAPTURE_KEY) {
        return entry.value().get<CaptureOperation>();
    }
    if (entry.key() == REPLACE_KEY) {
        return entry.value().get<ReplaceOperation>();
    }
    throw ConfigError("unknown operation '" + entry.key() + "', expected '" +
                      CAPTURE_KEY + "' or '" + REPLACE_KEY + "'");
}

OperationList loadOperations(const nlohmann::json &spec) {
    if (!spec.is_array()) {
        throw ConfigError("operation list must be a JSON array, got " +
                          std::string(spec.type_name()));
    }

    OperationList operations;
    operations.reserve(spec.size());
    for (const auto &element : spec) {
        operations.push_back(parseOperation(element));
    }
    return operations;
}

OperationList parseOperations(const std::string &spec_text) {
    nlohmann::json spec;
    try {
        spec = nlohmann::json::parse(spec_text);
    } catch (const nlohmann::json::parse_error &e) {
        throw ConfigError("cannot parse operation list: " +
                          std::string(e.what()));
    }
    return loadOperations(spec);
}

}  // namespace regexmap::rules
