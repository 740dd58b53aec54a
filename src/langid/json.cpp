#include <langid/json.hpp>

namespace langid {

using json = nlohmann::json;

void to_json(json& j, const EntityHint& hint) {
    j = json{
        {"tag", hint.tag},
        {"category", hint_category_name(hint.category)},
        {"language", hint.language},
        {"matched", hint.matched},
        {"priority", hint.priority},
        {"offset", hint.offset}
    };
}

void to_json(json& j, const LanguageCandidate& candidate) {
    j = json{
        {"language", candidate.language},
        {"probability", candidate.probability}
    };
}

void to_json(json& j, const Diagnostics& diagnostics) {
    j = json{
        {"hints", diagnostics.hints},
        {"candidates", diagnostics.candidates},
        {"timed_out", diagnostics.timed_out}
    };
    if (diagnostics.top_candidate) {
        j["top_candidate"] = *diagnostics.top_candidate;
    } else {
        j["top_candidate"] = nullptr;
    }
    if (!diagnostics.reason.empty()) {
        j["reason"] = diagnostics.reason;
    }
}

void to_json(json& j, const DetectionResult& result) {
    j = json{
        {"language", result.language},
        {"confidence", result.confidence},
        {"method", method_name(result.method)}
    };
    if (result.diagnostics) {
        j["diagnostics"] = *result.diagnostics;
    }
}

void to_json(json& j, const CacheStats& stats) {
    j = json{
        {"size", stats.size},
        {"capacity", stats.capacity},
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"evictions", stats.evictions}
    };
}

void to_json(json& j, const DetectorStats& stats) {
    j = json{
        {"cache", stats.cache},
        {"requests", stats.requests},
        {"entity_hint", stats.entity_hint},
        {"statistical", stats.statistical},
        {"fallback", stats.fallback},
        {"timeouts", stats.timeouts}
    };
}

}  // namespace langid
