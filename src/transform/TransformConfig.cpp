#include "regexmap/transform/TransformConfig.h"

#include "regexmap/rules/OperationConfig.h"
#include "regexmap/transform/TransformError.h"

namespace regexmap::transform {

std::shared_ptr<const rules::OperationList> loadOperationsFromParams(
    const TransformParams &params) {
    auto it = params.find(SPEC_PARAM_NAME);
    if (it == params.end()) {
        throw error_utils::createMissingParamError(SPEC_PARAM_NAME);
    }

    return std::make_shared<const rules::OperationList>(
        rules::parseOperations(it->second));
}

}  // namespace regexmap::transform
