#include "regexmap/transform/RecordTransformer.h"

#include <stdexcept>
#include <utility>

#include "regexmap/json/JsonMerge.h"
#include "regexmap/json/JsonPointer.h"
#include "regexmap/transform/TransformError.h"

namespace regexmap::transform {

RecordTransformer::RecordTransformer(
    std::shared_ptr<const rules::OperationList> operations)
    : operations_(std::move(operations)) {
    if (!operations_) {
        throw std::invalid_argument("Cannot create transformer without operations");
    }
}

nlohmann::json RecordTransformer::transform(
    const std::vector<uint8_t> &payload) const {
    return transform(std::string(payload.begin(), payload.end()));
}

nlohmann::json RecordTransformer::transform(const std::string &payload) const {
    // The parser also rejects ill-formed UTF-8 inside strings
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(payload);
    } catch (const nlohmann::json::parse_error &e) {
        throw error_utils::createRecordError("JSON parsing", e.what());
    }

    apply(document);
    return document;
}

void RecordTransformer::apply(nlohmann::json &document) const {
    for (const auto &operation : *operations_) {
        // Absent source field
        std::string value = json::readField(document, rules::sourcePath(operation));
        if (value.empty()) {
            continue;
        }

        // No match or empty capture
        std::string result = rules::runOperation(operation, value);
        if (result.empty()) {
            continue;
        }

        json::writeAtPath(document, rules::destinationPath(operation),
                          nlohmann::json(std::move(result)));
    }
}

const rules::OperationList &RecordTransformer::getOperations() const {
    return *operations_;
}

}  // namespace regexmap::transform
