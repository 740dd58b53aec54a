#include <langid/types.hpp>

namespace langid {

const char* hint_category_name(HintCategory category) {
    switch (category) {
        case HintCategory::NATIONAL_ID: return "national_id";
        case HintCategory::AMBIGUOUS_NUMERIC_ID: return "ambiguous_numeric_id";
        case HintCategory::DOCUMENT_ID: return "document_id";
        case HintCategory::KEYWORD: return "keyword";
    }
    return "unknown";
}

std::optional<HintCategory> parse_hint_category(const std::string& name) {
    if (name == "national_id") return HintCategory::NATIONAL_ID;
    if (name == "ambiguous_numeric_id") return HintCategory::AMBIGUOUS_NUMERIC_ID;
    if (name == "document_id") return HintCategory::DOCUMENT_ID;
    if (name == "keyword") return HintCategory::KEYWORD;
    return std::nullopt;
}

const char* method_name(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::ENTITY_HINT: return "entity-hint-based";
        case DetectionMethod::STATISTICAL: return "statistical";
        case DetectionMethod::DEFAULT_FALLBACK: return "default-fallback";
    }
    return "unknown";
}

}  // namespace langid
