#include "regexmap/transform/RegexMapModule.h"

#include "regexmap/transform/TransformError.h"

namespace regexmap::transform {

Record Record::fromString(const std::string &value) {
    return Record(std::nullopt,
                  std::vector<uint8_t>(value.begin(), value.end()));
}

std::string Record::valueAsString() const {
    return std::string(value.begin(), value.end());
}

void RegexMapModule::init(const TransformParams &params) {
    // Build outside the lock, a bad spec must not leave partial state
    auto transformer = std::make_shared<const RecordTransformer>(
        loadOperationsFromParams(params));

    std::lock_guard<std::mutex> lock(mutex_);
    if (transformer_) {
        throw ConfigError("regex operations already initialized");
    }
    transformer_ = std::move(transformer);
}

bool RegexMapModule::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transformer_ != nullptr;
}

std::shared_ptr<const RecordTransformer> RegexMapModule::getTransformer()
    const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transformer_;
}

Record RegexMapModule::map(const Record &record) const {
    auto transformer = getTransformer();
    if (!transformer) {
        throw ModuleStateError("regex operations not initialized");
    }

    nlohmann::json document = transformer->transform(record.value);
    std::string output = document.dump();
    return Record(record.key,
                  std::vector<uint8_t>(output.begin(), output.end()));
}

namespace global_module {

RegexMapModule &getInstance() {
    static RegexMapModule instance;
    return instance;
}

void init(const TransformParams &params) { getInstance().init(params); }

Record map(const Record &record) { return getInstance().map(record); }

}  // namespace global_module

}  // namespace regexmap::transform
