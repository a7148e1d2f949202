#include "regexmap/json/JsonMerge.h"

#include <utility>
#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "regexmap/json/JsonPointer.h"

namespace regexmap::json {

void mergeJson(nlohmann::json &into, nlohmann::json from) {
    if (into.is_object() && from.is_object()) {
        for (auto it = from.begin(); it != from.end(); ++it) {
            mergeJson(into[it.key()], std::move(it.value()));
        }
        return;
    }

    into = std::move(from);
}

void writeAtPath(nlohmann::json &document, const std::string &path,
                 nlohmann::json value) {
    // Malformed destinations leave the document untouched
    if (path.find('/') == std::string::npos) {
        return;
    }

    std::string current_path = path;
    while (true) {
        nlohmann::json *existing = resolvePointer(document, current_path);
        if (existing != nullptr) {
            mergeJson(*existing, std::move(value));
            return;
        }

        // Drop everything before the first separator, it is the root marker
        std::vector<std::string> segments = absl::StrSplit(current_path, '/');
        segments.erase(segments.begin());
        if (segments.empty()) {
            mergeJson(document, std::move(value));
            return;
        }

        std::string key = unescapeToken(segments.back());
        segments.pop_back();

        nlohmann::json wrapped = nlohmann::json::object();
        wrapped[key] = std::move(value);
        value = std::move(wrapped);

        if (segments.empty()) {
            mergeJson(document, std::move(value));
            return;
        }

        current_path = absl::StrCat("/", absl::StrJoin(segments, "/"));
    }
}

}  // namespace regexmap::json
