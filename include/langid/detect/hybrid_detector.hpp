#pragma once

#include <langid/classifier/language_classifier.hpp>
#include <langid/config.hpp>
#include <langid/detect/detection_cache.hpp>
#include <langid/detect/entity_hint_scanner.hpp>
#include <langid/detect/timeout_guard.hpp>
#include <langid/result.hpp>
#include <langid/types.hpp>
#include <langid/util/logger.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace langid {

struct DetectorStats {
    CacheStats cache;
    uint64_t requests = 0;
    uint64_t entity_hint = 0;
    uint64_t statistical = 0;
    uint64_t fallback = 0;
    uint64_t timeouts = 0;
};

/**
 * HybridDetector - Decides the language of a text fragment.
 *
 * Pipeline for one request:
 *   1. Empty text (after trimming) -> default-fallback, confidence 0
 *   2. Cache lookup on the trimmed text
 *   3. Entity hints -> entity-hint-based, confidence 1.0
 *   4. Digits-only or shorter than min_length -> default-fallback, the
 *      classifier is not called
 *   5. Classifier under the timeout guard; a timeout -> default-fallback
 *   6. Top candidate at or above min_confidence -> statistical, otherwise
 *      default-fallback carrying the top probability
 *
 * Results of steps 3-6 are cached, except timeouts and classifier errors.
 * detect() is safe to call from many threads at once.
 */
class HybridDetector {
public:
    /**
     * Build a detector with the regex scanner and the n-gram classifier
     * described by config.
     *
     * @return The detector, or INVALID_ARGUMENT for a bad configuration
     */
    static Result<std::unique_ptr<HybridDetector>> create(
        const DetectorConfig& config,
        LoggerPtr logger = nullptr);

    /**
     * Assemble a detector from explicit parts.
     *
     * @param config Policy values (patterns and classifier sections unused)
     * @param scanner Entity hint source
     * @param classifier Statistical stage
     * @param cache Result cache; a private one of config.cache_capacity is
     *              created when null
     * @param logger Diagnostics sink; NullLogger when null
     */
    HybridDetector(DetectorConfig config,
                   HintScannerPtr scanner,
                   LanguageClassifierPtr classifier,
                   std::shared_ptr<DetectionCache> cache = nullptr,
                   LoggerPtr logger = nullptr);

    ~HybridDetector();

    HybridDetector(const HybridDetector&) = delete;
    HybridDetector& operator=(const HybridDetector&) = delete;

    DetectionResult detect(const DetectionRequest& request);
    DetectionResult detect(const std::string& text, bool detailed = false);

    // Detect each text in order
    std::vector<DetectionResult> detect_batch(const std::vector<std::string>& texts,
                                              bool detailed = false);

    DetectorStats stats() const;
    void clear_cache();

    std::vector<std::string> supported_languages() const;
    const DetectorConfig& config() const { return config_; }

    /**
     * Whether text holds digits and separators only ("+-./,()#" and
     * whitespace) with at least one digit.
     */
    static bool is_numeric(const std::string& text);

private:
    // Full pipeline below the cache; sets cacheable to false for outcomes
    // that must not be memoized
    DetectionResult evaluate(const std::string& key, bool& cacheable);

    DetectionResult fallback(double confidence, Diagnostics diagnostics,
                             const std::string& reason) const;

    DetectionResult finish(DetectionResult result, bool detailed);

    DetectorConfig config_;
    HintScannerPtr scanner_;
    LanguageClassifierPtr classifier_;
    std::shared_ptr<DetectionCache> cache_;
    LoggerPtr logger_;

    // Declared after the classifier: destroyed first, so abandoned
    // classifications finish before the classifier goes away
    std::unique_ptr<TimeoutGuard> guard_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> entity_hint_{0};
    std::atomic<uint64_t> statistical_{0};
    std::atomic<uint64_t> fallback_{0};
    std::atomic<uint64_t> timeouts_{0};
};

}  // namespace langid
