#pragma once

#include <langid/config.hpp>
#include <langid/result.hpp>
#include <langid/types.hpp>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace langid {

// ============================================================================
// Abstract Scanner Interface
// ============================================================================

class HintScanner {
public:
    virtual ~HintScanner() = default;

    /**
     * Find every entity hint in text. Never fails; no match yields an
     * empty vector. Must be safe to call concurrently.
     */
    virtual std::vector<EntityHint> scan(const std::string& text) const = 0;
};

using HintScannerPtr = std::unique_ptr<HintScanner>;

// ============================================================================
// Regex + Keyword Scanner
// ============================================================================

/**
 * EntityHintScanner - Finds structured identifiers and keyword cues.
 *
 * Patterns are compiled once at construction. A pattern match only becomes a
 * hint when its checksum validator accepts it. Keywords match
 * case-insensitively on folded code points, optionally as whole words.
 *
 * Hints come back in scan order: patterns in configuration order (each
 * left to right), then keywords in configuration order.
 */
class EntityHintScanner : public HintScanner {
public:
    /**
     * Compile patterns and fold keywords.
     *
     * @return The scanner, or INVALID_ARGUMENT if a pattern fails to compile
     *         or names an unknown validator
     */
    static Result<std::unique_ptr<EntityHintScanner>> create(
        const std::vector<EntityPatternConfig>& patterns,
        const std::vector<KeywordConfig>& keywords);

    std::vector<EntityHint> scan(const std::string& text) const override;

    /**
     * Pick the deciding hint: highest priority, first in scan order on ties.
     *
     * @return The winning hint, or std::nullopt for an empty list
     */
    static std::optional<EntityHint> strongest(const std::vector<EntityHint>& hints);

    size_t pattern_count() const { return patterns_.size(); }
    size_t keyword_count() const { return keywords_.size(); }

private:
    struct CompiledPattern {
        EntityPatternConfig config;
        std::regex regex;
    };

    struct CompiledKeyword {
        KeywordConfig config;
        std::u32string folded;
    };

    EntityHintScanner() = default;

    void scan_patterns(const std::string& text, std::vector<EntityHint>& out) const;
    void scan_keywords(const std::string& text, std::vector<EntityHint>& out) const;

    std::vector<CompiledPattern> patterns_;
    std::vector<CompiledKeyword> keywords_;
};

}  // namespace langid
