#include <langid/detect/hybrid_detector.hpp>
#include <langid/classifier/ngram_classifier.hpp>
#include <langid/util/utf8.hpp>

#include <algorithm>
#include <cstring>
#include <sstream>

namespace langid {

namespace {

constexpr const char* NUMERIC_SEPARATORS = "+-./,()#";

std::string describe(const DetectionResult& result, const std::string& key) {
    std::ostringstream ss;
    ss << "detect: method=" << method_name(result.method)
       << " language=" << result.language
       << " confidence=" << result.confidence
       << " chars=" << utf8::length(key);
    if (result.diagnostics && !result.diagnostics->reason.empty()) {
        ss << " reason=" << result.diagnostics->reason;
    }
    return ss.str();
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

Result<std::unique_ptr<HybridDetector>> HybridDetector::create(
    const DetectorConfig& config,
    LoggerPtr logger) {

    auto valid = validate_config(config);
    if (!valid.ok()) {
        return valid.error();
    }

    auto scanner = EntityHintScanner::create(config.patterns, config.keywords);
    if (!scanner.ok()) {
        return scanner.error();
    }

    auto classifier = NgramClassifier::create(config.classifier);
    if (!classifier.ok()) {
        return classifier.error();
    }

    return std::make_unique<HybridDetector>(
        config,
        std::move(scanner.value()),
        std::move(classifier.value()),
        nullptr,
        std::move(logger));
}

HybridDetector::HybridDetector(DetectorConfig config,
                               HintScannerPtr scanner,
                               LanguageClassifierPtr classifier,
                               std::shared_ptr<DetectionCache> cache,
                               LoggerPtr logger)
    : config_(std::move(config))
    , scanner_(std::move(scanner))
    , classifier_(std::move(classifier))
    , cache_(std::move(cache))
    , logger_(std::move(logger))
    , guard_(std::make_unique<TimeoutGuard>()) {
    if (!cache_) {
        cache_ = std::make_shared<DetectionCache>(config_.cache_capacity);
    }
    if (!logger_) {
        logger_ = std::make_shared<NullLogger>();
    }
}

HybridDetector::~HybridDetector() {
    // Wait for abandoned classifications while the classifier still exists
    guard_.reset();
}

// ============================================================================
// Detection
// ============================================================================

DetectionResult HybridDetector::detect(const std::string& text, bool detailed) {
    return detect(DetectionRequest{text, detailed});
}

DetectionResult HybridDetector::detect(const DetectionRequest& request) {
    requests_.fetch_add(1);

    // Whitespace never changes the outcome, so it is not part of the key
    std::string key = utf8::trim(request.text);
    if (key.empty()) {
        return finish(fallback(0.0, Diagnostics{}, "empty"), request.detailed);
    }

    if (auto cached = cache_->get(key)) {
        return finish(std::move(*cached), request.detailed);
    }

    bool cacheable = true;
    DetectionResult result = evaluate(key, cacheable);

    if (logger_->get_min_level() <= LogLevel::DEBUG) {
        logger_->debug(describe(result, key));
    }

    if (cacheable) {
        cache_->put(key, result);
    }
    return finish(std::move(result), request.detailed);
}

DetectionResult HybridDetector::evaluate(const std::string& key, bool& cacheable) {
    Diagnostics diagnostics;

    // Entity stage: any hint decides, the classifier is never consulted
    diagnostics.hints = scanner_->scan(key);
    if (auto best = EntityHintScanner::strongest(diagnostics.hints)) {
        DetectionResult result;
        result.language = best->language;
        result.confidence = 1.0;
        result.method = DetectionMethod::ENTITY_HINT;
        result.diagnostics = std::move(diagnostics);
        return result;
    }

    if (is_numeric(key)) {
        return fallback(0.0, std::move(diagnostics), "numeric");
    }

    if (utf8::length(key) < config_.min_length) {
        return fallback(0.0, std::move(diagnostics), "too_short");
    }

    // Statistical stage
    const LanguageClassifier* classifier = classifier_.get();
    std::string text = key;
    auto classified = guard_->run<std::vector<LanguageCandidate>>(
        [classifier, text](const CancellationToken& token) {
            return classifier->classify(text, token);
        },
        config_.timeout);

    if (!classified.ok()) {
        cacheable = false;
        if (classified.error_code() == ErrorCode::TIMEOUT) {
            timeouts_.fetch_add(1);
            logger_->warning("classifier timed out after " +
                             std::to_string(config_.timeout.count()) + "ms (" +
                             std::to_string(utf8::length(key)) + " chars)");
            diagnostics.timed_out = true;
            return fallback(0.0, std::move(diagnostics), "timeout");
        }
        logger_->error("classifier failed: " + classified.error().to_string());
        return fallback(0.0, std::move(diagnostics), "classifier_error");
    }

    diagnostics.candidates = std::move(classified.value());
    if (diagnostics.candidates.empty()) {
        return fallback(0.0, std::move(diagnostics), "no_candidates");
    }

    // Confidence policy
    const LanguageCandidate top = diagnostics.candidates.front();
    diagnostics.top_candidate = top;
    double confidence = std::clamp(top.probability, 0.0, 1.0);

    if (confidence < config_.min_confidence) {
        return fallback(confidence, std::move(diagnostics), "low_confidence");
    }

    DetectionResult result;
    result.language = top.language;
    result.confidence = confidence;
    result.method = DetectionMethod::STATISTICAL;
    result.diagnostics = std::move(diagnostics);
    return result;
}

DetectionResult HybridDetector::fallback(double confidence, Diagnostics diagnostics,
                                         const std::string& reason) const {
    diagnostics.reason = reason;

    DetectionResult result;
    result.language = config_.default_language;
    result.confidence = std::clamp(confidence, 0.0, 1.0);
    result.method = DetectionMethod::DEFAULT_FALLBACK;
    result.diagnostics = std::move(diagnostics);
    return result;
}

DetectionResult HybridDetector::finish(DetectionResult result, bool detailed) {
    switch (result.method) {
        case DetectionMethod::ENTITY_HINT: entity_hint_.fetch_add(1); break;
        case DetectionMethod::STATISTICAL: statistical_.fetch_add(1); break;
        case DetectionMethod::DEFAULT_FALLBACK: fallback_.fetch_add(1); break;
    }

    if (!detailed) {
        result.diagnostics.reset();
    }
    return result;
}

std::vector<DetectionResult> HybridDetector::detect_batch(
    const std::vector<std::string>& texts,
    bool detailed) {

    std::vector<DetectionResult> results;
    results.reserve(texts.size());
    for (const auto& text : texts) {
        results.push_back(detect(text, detailed));
    }
    return results;
}

bool HybridDetector::is_numeric(const std::string& text) {
    bool has_digit = false;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc >= '0' && uc <= '9') {
            has_digit = true;
        } else if (!utf8::is_space(uc) &&
                   (c == '\0' || std::strchr(NUMERIC_SEPARATORS, c) == nullptr)) {
            return false;
        }
    }
    return has_digit;
}

// ============================================================================
// Statistics
// ============================================================================

DetectorStats HybridDetector::stats() const {
    DetectorStats s;
    s.cache = cache_->stats();
    s.requests = requests_.load();
    s.entity_hint = entity_hint_.load();
    s.statistical = statistical_.load();
    s.fallback = fallback_.load();
    s.timeouts = timeouts_.load();
    return s;
}

void HybridDetector::clear_cache() {
    cache_->clear();
    logger_->info("detection cache cleared");
}

std::vector<std::string> HybridDetector::supported_languages() const {
    return classifier_->languages();
}

}  // namespace langid
