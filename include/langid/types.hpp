#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace langid {

// ============================================================================
// Entity Hints
// ============================================================================

enum class HintCategory {
    NATIONAL_ID,            // Checksummed national identifier (PESEL, DNI)
    AMBIGUOUS_NUMERIC_ID,   // Digit run whose length is shared by other ids
    DOCUMENT_ID,            // Identity document number
    KEYWORD                 // Lexical cue
};

const char* hint_category_name(HintCategory category);
std::optional<HintCategory> parse_hint_category(const std::string& name);

/**
 * A deterministic marker found in the text that is strongly associated with
 * one language.
 */
struct EntityHint {
    std::string tag;        // "PESEL", "keyword:pesel", ...
    HintCategory category = HintCategory::KEYWORD;
    std::string language;   // Target language code
    std::string matched;    // Matched span as it appears in the text
    int priority = 0;       // Higher wins when hints disagree
    size_t offset = 0;      // Byte offset of the match

    bool operator==(const EntityHint& other) const {
        return tag == other.tag && category == other.category &&
               language == other.language && matched == other.matched &&
               priority == other.priority && offset == other.offset;
    }
};

// ============================================================================
// Statistical Candidates
// ============================================================================

struct LanguageCandidate {
    std::string language;
    double probability = 0.0;   // 0.0 - 1.0

    bool operator==(const LanguageCandidate& other) const {
        return language == other.language && probability == other.probability;
    }
};

// ============================================================================
// Detection Result
// ============================================================================

enum class DetectionMethod {
    ENTITY_HINT,
    STATISTICAL,
    DEFAULT_FALLBACK
};

// "entity-hint-based", "statistical", "default-fallback"
const char* method_name(DetectionMethod method);

struct Diagnostics {
    std::vector<EntityHint> hints;
    std::vector<LanguageCandidate> candidates;
    std::optional<LanguageCandidate> top_candidate;
    bool timed_out = false;
    // Why the fallback was taken: empty, numeric, too_short, no_candidates,
    // low_confidence, timeout, classifier_error. Empty otherwise.
    std::string reason;

    bool operator==(const Diagnostics& other) const {
        return hints == other.hints && candidates == other.candidates &&
               top_candidate == other.top_candidate &&
               timed_out == other.timed_out && reason == other.reason;
    }
};

struct DetectionResult {
    std::string language;
    double confidence = 0.0;    // Always within [0, 1]
    DetectionMethod method = DetectionMethod::DEFAULT_FALLBACK;
    std::optional<Diagnostics> diagnostics;

    bool operator==(const DetectionResult& other) const {
        return language == other.language && confidence == other.confidence &&
               method == other.method && diagnostics == other.diagnostics;
    }
    bool operator!=(const DetectionResult& other) const {
        return !(*this == other);
    }
};

struct DetectionRequest {
    std::string text;
    bool detailed = false;
};

}  // namespace langid
