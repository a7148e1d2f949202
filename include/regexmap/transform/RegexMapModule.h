/**
 * RegexMapModule
 * Host entry point: initialized once from parameters, then maps records
 */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "regexmap/transform/RecordTransformer.h"
#include "regexmap/transform/TransformConfig.h"

namespace regexmap::transform {

/**
 * A record as delivered by the streaming host. The key is opaque and is
 * passed through unchanged.
 */
struct Record {
    std::optional<std::vector<uint8_t>> key;
    std::vector<uint8_t> value;

    Record() = default;
    Record(std::optional<std::vector<uint8_t>> k, std::vector<uint8_t> v)
        : key(std::move(k)), value(std::move(v)) {}

    static Record fromString(const std::string &value);
    std::string valueAsString() const;
};

class RegexMapModule {
  public:
    RegexMapModule() = default;
    ~RegexMapModule() = default;

    /**
     * Load the operation list from the `spec` parameter
     *
     * Throws ConfigError on a missing or invalid spec, and when the module
     * has already been initialized.
     */
    void init(const TransformParams &params);

    bool isInitialized() const;

    /**
     * Transform one record and serialize the result back to JSON text
     *
     * Throws ModuleStateError before init and RecordError for payloads
     * that are not UTF-8 JSON.
     */
    Record map(const Record &record) const;

    std::shared_ptr<const RecordTransformer> getTransformer() const;

    // Copy/move operations - deleted due to mutex
    RegexMapModule(const RegexMapModule &) = delete;
    RegexMapModule &operator=(const RegexMapModule &) = delete;
    RegexMapModule(RegexMapModule &&) = delete;
    RegexMapModule &operator=(RegexMapModule &&) = delete;

  private:
    mutable std::mutex mutex_;
    std::shared_ptr<const RecordTransformer> transformer_;
};

/**
 * Process-wide module instance
 */
namespace global_module {
RegexMapModule &getInstance();

void init(const TransformParams &params);

Record map(const Record &record);
}  // namespace global_module

}  // namespace regexmap::transform
