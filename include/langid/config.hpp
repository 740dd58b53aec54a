#pragma once

#include <langid/result.hpp>
#include <langid/types.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace langid {

// ============================================================================
// Entity Configuration
// ============================================================================

struct EntityPatternConfig {
    std::string tag;                // Reported as EntityHint::tag
    std::string pattern;            // ECMAScript regular expression
    std::string language;           // Target language code
    HintCategory category = HintCategory::NATIONAL_ID;
    int priority = 100;
    std::string validator = "none"; // Checksum run on the match
};

struct KeywordConfig {
    std::string keyword;            // Matched case-insensitively
    std::string language;
    int priority = 50;
    bool whole_word = true;         // Require non-alphanumeric neighbours
};

// ============================================================================
// Classifier Configuration
// ============================================================================

struct ClassifierConfig {
    uint32_t seed = 0;
    int trials = 7;                     // Independent sampling runs
    int max_iterations = 1000;          // N-gram draws per trial
    double alpha = 0.5;                 // Smoothing for unseen n-grams
    double alpha_width = 0.05;          // Per-trial jitter on alpha
    double convergence_threshold = 0.99999;
    double candidate_floor = 0.1;       // Candidates at or below are dropped

    // Restrict the built-in languages (empty = all)
    std::vector<std::string> languages;

    // Additional language profiles: code -> training samples
    std::map<std::string, std::vector<std::string>> profiles;
};

// ============================================================================
// Detector Configuration
// ============================================================================

struct DetectorConfig {
    std::string default_language = "en";
    double min_confidence = 0.5;        // (0, 1]
    size_t min_length = 10;             // Code points before statistics apply
    size_t cache_capacity = 5000;
    std::chrono::milliseconds timeout{10};

    std::vector<EntityPatternConfig> patterns;
    std::vector<KeywordConfig> keywords;
    ClassifierConfig classifier;

    // Defaults include the built-in patterns and keywords
    DetectorConfig();
};

/**
 * Built-in national identifier patterns: PESEL, NIP, REGON, Polish ID
 * card (pl) and DNI/NIE (es).
 */
std::vector<EntityPatternConfig> default_entity_patterns();

/**
 * Built-in keyword cues for pl, es and de.
 */
std::vector<KeywordConfig> default_keywords();

/**
 * Parse a JSON configuration document.
 * Missing keys keep their defaults; "patterns" and "keywords" replace the
 * built-in lists when present.
 *
 * @return The parsed and validated configuration, or PARSE_ERROR /
 *         INVALID_ARGUMENT
 */
Result<DetectorConfig> parse_config(const std::string& json_text);

/**
 * Load and parse a JSON configuration file.
 */
Result<DetectorConfig> load_config(const std::filesystem::path& path);

/**
 * Check value ranges, validator names and that every pattern compiles.
 */
Result<void> validate_config(const DetectorConfig& config);

/**
 * Override fields from LANGID_DEFAULT_LANGUAGE, LANGID_MIN_CONFIDENCE,
 * LANGID_MIN_LENGTH, LANGID_CACHE_CAPACITY and LANGID_TIMEOUT_MS.
 */
Result<void> apply_env_overrides(DetectorConfig& config);

}  // namespace langid
