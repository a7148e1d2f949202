/**
 * RecordTransformer
 * Applies a configured operation list to one JSON record at a time
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "regexmap/rules/RegexOperation.h"

namespace regexmap::transform {

/**
 * Runs every operation, in configured order, against a record:
 * read the source field, run the regex, and write non-empty results to the
 * destination path. Later operations see the writes of earlier ones.
 *
 * The transformer keeps no per-record state; one instance can serve any
 * number of threads.
 */
class RecordTransformer {
  public:
    explicit RecordTransformer(
        std::shared_ptr<const rules::OperationList> operations);

    /**
     * Decode a UTF-8 JSON payload and transform it
     *
     * Throws RecordError if the payload is not UTF-8 or not JSON.
     */
    nlohmann::json transform(const std::vector<uint8_t> &payload) const;
    nlohmann::json transform(const std::string &payload) const;

    /**
     * Transform an already decoded document in place
     */
    void apply(nlohmann::json &document) const;

    const rules::OperationList &getOperations() const;

  private:
    std::shared_ptr<const rules::OperationList> operations_;
};

}  // namespace regexmap::transform
