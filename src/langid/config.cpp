#include <langid/config.hpp>
#include <langid/util/checksums.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace langid {

using json = nlohmann::json;

namespace {

// Parse a double from an environment value; the whole string must be used
std::optional<double> parse_double(const char* value) {
    if (!value || !*value) return std::nullopt;
    char* end = nullptr;
    errno = 0;
    double result = std::strtod(value, &end);
    if (end == value || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return result;
}

// Counts must not be negative; nlohmann::json would wrap them on conversion
size_t read_count(const json& j, const char* key, size_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    const json& value = j.at(key);
    if (value.is_number_integer() && !value.is_number_unsigned()) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return value.get<size_t>();
}

std::optional<unsigned long long> parse_unsigned(const char* value) {
    if (!value || !*value || *value == '-') return std::nullopt;
    char* end = nullptr;
    errno = 0;
    unsigned long long result = std::strtoull(value, &end, 10);
    if (end == value || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return result;
}

EntityPatternConfig parse_pattern(const json& j) {
    EntityPatternConfig p;
    p.tag = j.at("tag").get<std::string>();
    p.pattern = j.at("pattern").get<std::string>();
    p.language = j.at("language").get<std::string>();
    p.priority = j.value("priority", p.priority);
    p.validator = j.value("validator", p.validator);

    if (j.contains("category")) {
        auto name = j.at("category").get<std::string>();
        auto category = parse_hint_category(name);
        if (!category) {
            throw std::invalid_argument("unknown hint category '" + name + "'");
        }
        p.category = *category;
    }
    return p;
}

KeywordConfig parse_keyword(const json& j) {
    KeywordConfig k;
    k.keyword = j.at("keyword").get<std::string>();
    k.language = j.at("language").get<std::string>();
    k.priority = j.value("priority", k.priority);
    k.whole_word = j.value("whole_word", k.whole_word);
    return k;
}

void parse_classifier(const json& j, ClassifierConfig& c) {
    c.seed = static_cast<uint32_t>(read_count(j, "seed", c.seed));
    c.trials = j.value("trials", c.trials);
    c.max_iterations = j.value("max_iterations", c.max_iterations);
    c.alpha = j.value("alpha", c.alpha);
    c.alpha_width = j.value("alpha_width", c.alpha_width);
    c.convergence_threshold = j.value("convergence_threshold", c.convergence_threshold);
    c.candidate_floor = j.value("candidate_floor", c.candidate_floor);

    if (j.contains("languages")) {
        c.languages = j.at("languages").get<std::vector<std::string>>();
    }
    if (j.contains("profiles")) {
        c.profiles = j.at("profiles").get<std::map<std::string, std::vector<std::string>>>();
    }
}

}  // namespace

// ============================================================================
// Defaults
// ============================================================================

DetectorConfig::DetectorConfig()
    : patterns(default_entity_patterns())
    , keywords(default_keywords()) {}

std::vector<EntityPatternConfig> default_entity_patterns() {
    return {
        {"PESEL", R"(\b\d{11}\b)", "pl",
         HintCategory::NATIONAL_ID, 100, "pesel"},
        {"NIP", R"(\b\d{3}-?\d{3}-?\d{2}-?\d{2}\b|\b\d{3}-\d{2}-\d{2}-\d{3}\b)", "pl",
         HintCategory::AMBIGUOUS_NUMERIC_ID, 90, "nip"},
        {"REGON", R"(\b\d{9}\b|\b\d{14}\b)", "pl",
         HintCategory::AMBIGUOUS_NUMERIC_ID, 80, "regon"},
        {"PL_ID_CARD", R"(\b[A-Z]{3}\s?\d{6}\b)", "pl",
         HintCategory::DOCUMENT_ID, 90, "pl_id_card"},
        {"ES_DNI", R"(\b(?:\d{8}|[XYZ]\d{7})-?[A-Z]\b)", "es",
         HintCategory::NATIONAL_ID, 100, "es_dni"},
    };
}

std::vector<KeywordConfig> default_keywords() {
    return {
        {"pesel", "pl", 50, true},
        {"regon", "pl", 50, true},
        {"dowód osobisty", "pl", 50, true},
        {"województwo", "pl", 50, true},
        {"dziękuję", "pl", 50, true},
        {"proszę", "pl", 50, true},
        {"documento nacional de identidad", "es", 50, true},
        {"número de identificación", "es", 50, true},
        {"personalausweis", "de", 50, true},
        {"steuernummer", "de", 50, true},
        {"steueridentifikationsnummer", "de", 50, true},
    };
}

// ============================================================================
// Validation
// ============================================================================

Result<void> validate_config(const DetectorConfig& config) {
    if (config.default_language.empty()) {
        return Err(ErrorCode::INVALID_ARGUMENT, "default_language must not be empty");
    }
    if (!(config.min_confidence > 0.0 && config.min_confidence <= 1.0)) {
        return Err(ErrorCode::INVALID_ARGUMENT, "min_confidence must be in (0, 1]");
    }
    if (config.cache_capacity == 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "cache_capacity must be at least 1");
    }
    if (config.timeout.count() <= 0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "timeout must be positive");
    }

    for (const auto& p : config.patterns) {
        if (p.tag.empty() || p.pattern.empty() || p.language.empty()) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       "pattern entries need tag, pattern and language");
        }
        if (!checksums::is_known_validator(p.validator)) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       "pattern " + p.tag + ": unknown validator '" + p.validator + "'");
        }
        try {
            std::regex compiled(p.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       "pattern " + p.tag + ": " + e.what());
        }
    }

    for (const auto& k : config.keywords) {
        if (k.keyword.empty() || k.language.empty()) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       "keyword entries need keyword and language");
        }
    }

    const auto& c = config.classifier;
    if (c.trials < 1 || c.max_iterations < 1) {
        return Err(ErrorCode::INVALID_ARGUMENT,
                   "classifier trials and max_iterations must be at least 1");
    }
    if (c.alpha <= 0.0 || c.alpha_width < 0.0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "classifier alpha must be positive");
    }
    if (c.candidate_floor < 0.0 || c.candidate_floor >= 1.0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "candidate_floor must be in [0, 1)");
    }
    if (c.convergence_threshold <= 0.0 || c.convergence_threshold > 1.0) {
        return Err(ErrorCode::INVALID_ARGUMENT, "convergence_threshold must be in (0, 1]");
    }

    return Ok();
}

// ============================================================================
// Loading
// ============================================================================

Result<DetectorConfig> parse_config(const std::string& json_text) {
    DetectorConfig config;

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            return Error(ErrorCode::PARSE_ERROR, "configuration must be a JSON object");
        }

        config.default_language = j.value("default_language", config.default_language);
        config.min_confidence = j.value("min_confidence", config.min_confidence);
        config.min_length = read_count(j, "min_length", config.min_length);
        config.cache_capacity = read_count(j, "cache_capacity", config.cache_capacity);
        if (j.contains("timeout_ms")) {
            config.timeout = std::chrono::milliseconds(j.at("timeout_ms").get<int64_t>());
        }

        if (j.contains("patterns")) {
            config.patterns.clear();
            for (const auto& entry : j.at("patterns")) {
                config.patterns.push_back(parse_pattern(entry));
            }
        }
        if (j.contains("keywords")) {
            config.keywords.clear();
            for (const auto& entry : j.at("keywords")) {
                config.keywords.push_back(parse_keyword(entry));
            }
        }
        if (j.contains("classifier")) {
            parse_classifier(j.at("classifier"), config.classifier);
        }
    } catch (const json::exception& e) {
        return Error(ErrorCode::PARSE_ERROR, e.what());
    } catch (const std::invalid_argument& e) {
        return Error(ErrorCode::INVALID_ARGUMENT, e.what());
    }

    auto valid = validate_config(config);
    if (!valid.ok()) {
        return valid.error();
    }
    return config;
}

Result<DetectorConfig> load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "cannot open " + path.string());
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "cannot read " + path.string());
    }
    return parse_config(ss.str());
}

Result<void> apply_env_overrides(DetectorConfig& config) {
    if (const char* lang = std::getenv("LANGID_DEFAULT_LANGUAGE")) {
        if (*lang) config.default_language = lang;
    }

    if (const char* value = std::getenv("LANGID_MIN_CONFIDENCE")) {
        auto parsed = parse_double(value);
        if (!parsed) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       std::string("LANGID_MIN_CONFIDENCE: not a number: ") + value);
        }
        config.min_confidence = *parsed;
    }

    if (const char* value = std::getenv("LANGID_MIN_LENGTH")) {
        auto parsed = parse_unsigned(value);
        if (!parsed) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       std::string("LANGID_MIN_LENGTH: not a count: ") + value);
        }
        config.min_length = static_cast<size_t>(*parsed);
    }

    if (const char* value = std::getenv("LANGID_CACHE_CAPACITY")) {
        auto parsed = parse_unsigned(value);
        if (!parsed) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       std::string("LANGID_CACHE_CAPACITY: not a count: ") + value);
        }
        config.cache_capacity = static_cast<size_t>(*parsed);
    }

    if (const char* value = std::getenv("LANGID_TIMEOUT_MS")) {
        auto parsed = parse_unsigned(value);
        if (!parsed) {
            return Err(ErrorCode::INVALID_ARGUMENT,
                       std::string("LANGID_TIMEOUT_MS: not a duration: ") + value);
        }
        config.timeout = std::chrono::milliseconds(*parsed);
    }

    return validate_config(config);
}

}  // namespace langid
