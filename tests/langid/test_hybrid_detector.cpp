#include <gtest/gtest.h>
#include <langid/detect/hybrid_detector.hpp>
#include <langid/json.hpp>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace langid;
using namespace std::chrono_literals;

namespace {

// Returns a fixed ranking and counts how often it is asked
class CountingClassifier : public LanguageClassifier {
public:
    CountingClassifier(std::vector<LanguageCandidate> candidates,
                       std::shared_ptr<std::atomic<int>> calls)
        : candidates_(std::move(candidates)), calls_(std::move(calls)) {}

    std::vector<LanguageCandidate> classify(const std::string&,
                                            const CancellationToken&) const override {
        calls_->fetch_add(1);
        return candidates_;
    }

    std::vector<std::string> languages() const override { return {"de", "en", "pl"}; }

private:
    std::vector<LanguageCandidate> candidates_;
    std::shared_ptr<std::atomic<int>> calls_;
};

// Never finishes on its own before the token is cancelled
class StallingClassifier : public LanguageClassifier {
public:
    explicit StallingClassifier(std::shared_ptr<std::atomic<int>> calls)
        : calls_(std::move(calls)) {}

    std::vector<LanguageCandidate> classify(const std::string&,
                                            const CancellationToken& token) const override {
        calls_->fetch_add(1);
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (!token.is_cancelled() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        return {{"de", 0.99}};
    }

    std::vector<std::string> languages() const override { return {"de"}; }

private:
    std::shared_ptr<std::atomic<int>> calls_;
};

class ThrowingClassifier : public LanguageClassifier {
public:
    std::vector<LanguageCandidate> classify(const std::string&,
                                            const CancellationToken&) const override {
        throw std::runtime_error("profile table corrupted");
    }

    std::vector<std::string> languages() const override { return {}; }
};

// Wraps the default scanner and counts scans
class CountingScanner : public HintScanner {
public:
    explicit CountingScanner(std::shared_ptr<std::atomic<int>> scans) : scans_(std::move(scans)) {
        auto scanner = EntityHintScanner::create(default_entity_patterns(), default_keywords());
        inner_ = std::move(scanner.value());
    }

    std::vector<EntityHint> scan(const std::string& text) const override {
        scans_->fetch_add(1);
        return inner_->scan(text);
    }

private:
    std::unique_ptr<EntityHintScanner> inner_;
    std::shared_ptr<std::atomic<int>> scans_;
};

// Records every message so tests can check what was logged
class RecordingLogger : public Logger {
public:
    RecordingLogger() { min_level_ = LogLevel::DEBUG; }

    void log(LogLevel level, const std::string& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.emplace_back(level, message);
    }

    size_t count(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& e : entries) {
            if (e.first == level) ++n;
        }
        return n;
    }

    std::vector<std::pair<LogLevel, std::string>> entries;

private:
    std::mutex mutex_;
};

DetectorConfig test_config() {
    DetectorConfig config;
    // Generous budget so scheduling noise never looks like a breach
    config.timeout = 2000ms;
    return config;
}

}  // namespace

class HybridDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        calls_ = std::make_shared<std::atomic<int>>(0);
    }

    std::unique_ptr<HybridDetector> make_detector(LanguageClassifierPtr classifier,
                                                  DetectorConfig config = test_config(),
                                                  LoggerPtr logger = nullptr) {
        auto scanner = EntityHintScanner::create(config.patterns, config.keywords);
        EXPECT_TRUE(scanner.ok());
        return std::make_unique<HybridDetector>(
            config, std::move(scanner.value()), std::move(classifier), nullptr, logger);
    }

    std::unique_ptr<HybridDetector> make_counting(std::vector<LanguageCandidate> candidates,
                                                  DetectorConfig config = test_config()) {
        return make_detector(
            std::make_unique<CountingClassifier>(std::move(candidates), calls_), config);
    }

    std::shared_ptr<std::atomic<int>> calls_;
};

// ============================================================================
// Entity stage
// ============================================================================

TEST_F(HybridDetectorTest, PeselDecidesPolish) {
    auto detector = make_counting({{"en", 0.99}});

    auto result = detector->detect("PESEL 92032100157", true);
    EXPECT_EQ(result.language, "pl");
    EXPECT_DOUBLE_EQ(result.confidence, 1.0);
    EXPECT_EQ(result.method, DetectionMethod::ENTITY_HINT);
    EXPECT_EQ(calls_->load(), 0);

    ASSERT_TRUE(result.diagnostics.has_value());
    EXPECT_FALSE(result.diagnostics->hints.empty());
    EXPECT_TRUE(result.diagnostics->candidates.empty());
}

TEST_F(HybridDetectorTest, HintBeatsConfidentClassifier) {
    auto detector = make_counting({{"en", 0.99}});

    auto result = detector->detect("Please send the form with DNI 12345678Z today");
    EXPECT_EQ(result.language, "es");
    EXPECT_EQ(result.method, DetectionMethod::ENTITY_HINT);
    EXPECT_EQ(calls_->load(), 0);
}

TEST_F(HybridDetectorTest, KeywordHintIsEnough) {
    auto detector = make_counting({{"en", 0.99}});

    auto result = detector->detect("Where do I renew my Personalausweis");
    EXPECT_EQ(result.language, "de");
    EXPECT_EQ(result.method, DetectionMethod::ENTITY_HINT);
}

TEST_F(HybridDetectorTest, ShortTextWithHintStillDetected) {
    auto detector = make_counting({{"en", 0.99}});

    // Shorter than min_length, but the hint wins before the length check
    auto result = detector->detect("PESEL");
    EXPECT_EQ(result.language, "pl");
    EXPECT_EQ(result.method, DetectionMethod::ENTITY_HINT);
}

TEST_F(HybridDetectorTest, CommonWordsReachClassifier) {
    auto detector = make_counting({{"pl", 0.9}});

    auto polish = detector->detect("Ile dni trwa wysyłka?");
    EXPECT_EQ(polish.method, DetectionMethod::STATISTICAL);
    EXPECT_EQ(polish.language, "pl");

    auto english = detector->detect("Please nip this problem in the bud");
    EXPECT_EQ(english.method, DetectionMethod::STATISTICAL);
    EXPECT_EQ(calls_->load(), 2);
}

// ============================================================================
// Guards before the classifier
// ============================================================================

TEST_F(HybridDetectorTest, EmptyText) {
    auto detector = make_counting({{"de", 0.99}});

    for (const std::string text : {"", "   ", "\t\n"}) {
        auto result = detector->detect(text, true);
        EXPECT_EQ(result.language, "en");
        EXPECT_DOUBLE_EQ(result.confidence, 0.0);
        EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
        ASSERT_TRUE(result.diagnostics.has_value());
        EXPECT_EQ(result.diagnostics->reason, "empty");
    }
    EXPECT_EQ(calls_->load(), 0);
    EXPECT_EQ(detector->stats().cache.size, 0u);
}

TEST_F(HybridDetectorTest, NumericText) {
    auto detector = make_counting({{"de", 0.99}});

    auto result = detector->detect("4111111111111111", true);
    EXPECT_EQ(result.language, "en");
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "numeric");

    result = detector->detect("+48 600 700 800", true);
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "numeric");

    EXPECT_EQ(calls_->load(), 0);
}

TEST_F(HybridDetectorTest, ShortTextSkipsClassifier) {
    auto detector = make_counting({{"de", 0.99}});

    auto result = detector->detect("Hallo du", true);
    EXPECT_EQ(result.language, "en");
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "too_short");
    EXPECT_EQ(calls_->load(), 0);
}

TEST_F(HybridDetectorTest, MinLengthCountsCodePoints) {
    DetectorConfig config = test_config();
    config.min_length = 5;
    auto detector = make_counting({{"pl", 0.9}}, config);

    // 5 code points, 10 bytes
    auto result = detector->detect("żółćź");
    EXPECT_EQ(result.method, DetectionMethod::STATISTICAL);
    EXPECT_EQ(calls_->load(), 1);
}

TEST(HybridDetectorStaticTest, IsNumeric) {
    EXPECT_TRUE(HybridDetector::is_numeric("4111111111111111"));
    EXPECT_TRUE(HybridDetector::is_numeric("+48 (22) 555-01-23"));
    EXPECT_TRUE(HybridDetector::is_numeric("12.5, 13/4 #7"));
    EXPECT_FALSE(HybridDetector::is_numeric("--- ..."));
    EXPECT_FALSE(HybridDetector::is_numeric("room 12"));
    EXPECT_FALSE(HybridDetector::is_numeric(""));
    EXPECT_FALSE(HybridDetector::is_numeric(std::string("123\0" "456", 7)));
}

// ============================================================================
// Statistical stage and confidence policy
// ============================================================================

TEST_F(HybridDetectorTest, ConfidentClassifierWins) {
    auto detector = make_counting({{"de", 0.92}, {"nl", 0.05}});

    auto result = detector->detect("Wie komme ich zum Bahnhof", true);
    EXPECT_EQ(result.language, "de");
    EXPECT_DOUBLE_EQ(result.confidence, 0.92);
    EXPECT_EQ(result.method, DetectionMethod::STATISTICAL);

    ASSERT_TRUE(result.diagnostics.has_value());
    ASSERT_TRUE(result.diagnostics->top_candidate.has_value());
    EXPECT_EQ(result.diagnostics->top_candidate->language, "de");
    EXPECT_EQ(result.diagnostics->candidates.size(), 2u);
    EXPECT_TRUE(result.diagnostics->reason.empty());
}

TEST_F(HybridDetectorTest, ConfidenceAtThresholdIsAccepted) {
    auto detector = make_counting({{"de", 0.5}});

    auto result = detector->detect("Wie komme ich zum Bahnhof");
    EXPECT_EQ(result.method, DetectionMethod::STATISTICAL);
    EXPECT_DOUBLE_EQ(result.confidence, 0.5);
}

TEST_F(HybridDetectorTest, LowConfidenceFallsBack) {
    DetectorConfig config = test_config();
    config.default_language = "pl";
    auto detector = make_counting({{"de", 0.4}, {"nl", 0.35}}, config);

    auto result = detector->detect("Wie komme ich zum Bahnhof", true);
    EXPECT_EQ(result.language, "pl");
    EXPECT_DOUBLE_EQ(result.confidence, 0.4);
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "low_confidence");
    ASSERT_TRUE(result.diagnostics->top_candidate.has_value());
    EXPECT_EQ(result.diagnostics->top_candidate->language, "de");
}

TEST_F(HybridDetectorTest, NoCandidatesFallsBack) {
    auto detector = make_counting({});

    auto result = detector->detect("Something unclassifiable here", true);
    EXPECT_EQ(result.language, "en");
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "no_candidates");
}

TEST_F(HybridDetectorTest, DiagnosticsOnlyWhenRequested) {
    auto detector = make_counting({{"de", 0.92}});

    auto plain = detector->detect("Wie komme ich zum Bahnhof");
    EXPECT_FALSE(plain.diagnostics.has_value());

    // Served from the cache, still detailed
    auto detailed = detector->detect(DetectionRequest{"Wie komme ich zum Bahnhof", true});
    EXPECT_TRUE(detailed.diagnostics.has_value());
    EXPECT_EQ(calls_->load(), 1);
}

// ============================================================================
// Caching
// ============================================================================

TEST_F(HybridDetectorTest, RepeatedCallsAreIdempotent) {
    auto detector = make_counting({{"de", 0.92}});

    auto first = detector->detect("Wie komme ich zum Bahnhof", true);
    auto second = detector->detect("Wie komme ich zum Bahnhof", true);
    auto padded = detector->detect("  Wie komme ich zum Bahnhof\n", true);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, padded);
    EXPECT_EQ(calls_->load(), 1);

    DetectorStats s = detector->stats();
    EXPECT_EQ(s.cache.hits, 2u);
    EXPECT_EQ(s.cache.misses, 1u);
}

TEST_F(HybridDetectorTest, CacheHitSkipsBothStages) {
    auto scans = std::make_shared<std::atomic<int>>(0);
    HybridDetector detector(test_config(),
                            std::make_unique<CountingScanner>(scans),
                            std::make_unique<CountingClassifier>(
                                std::vector<LanguageCandidate>{{"de", 0.92}}, calls_));

    auto cold = detector.detect("Wie komme ich zum Bahnhof", true);
    auto warm = detector.detect("Wie komme ich zum Bahnhof", true);
    EXPECT_EQ(cold, warm);
    EXPECT_EQ(scans->load(), 1);
    EXPECT_EQ(calls_->load(), 1);

    auto hint_cold = detector.detect("PESEL 92032100157", true);
    auto hint_warm = detector.detect("PESEL 92032100157", true);
    EXPECT_EQ(hint_cold, hint_warm);
    EXPECT_EQ(scans->load(), 2);
}

TEST_F(HybridDetectorTest, CacheIsBounded) {
    DetectorConfig config = test_config();
    config.cache_capacity = 3;
    auto detector = make_counting({{"de", 0.92}}, config);

    for (int i = 0; i < 5; ++i) {
        detector->detect("Sentence number " + std::to_string(i));
    }
    EXPECT_EQ(calls_->load(), 5);
    EXPECT_EQ(detector->stats().cache.size, 3u);
    EXPECT_EQ(detector->stats().cache.evictions, 2u);

    // Oldest entry was evicted, newest is still cached
    detector->detect("Sentence number 0");
    EXPECT_EQ(calls_->load(), 6);
    detector->detect("Sentence number 4");
    EXPECT_EQ(calls_->load(), 6);
}

TEST_F(HybridDetectorTest, ClearCache) {
    auto detector = make_counting({{"de", 0.92}});

    detector->detect("Wie komme ich zum Bahnhof");
    detector->clear_cache();
    detector->detect("Wie komme ich zum Bahnhof");

    EXPECT_EQ(calls_->load(), 2);
}

TEST_F(HybridDetectorTest, SharedCache) {
    auto cache = std::make_shared<DetectionCache>(10);
    DetectorConfig config = test_config();

    auto scanner = EntityHintScanner::create(config.patterns, config.keywords);
    ASSERT_TRUE(scanner.ok());
    HybridDetector detector(config, std::move(scanner.value()),
                            std::make_unique<CountingClassifier>(
                                std::vector<LanguageCandidate>{{"de", 0.92}}, calls_),
                            cache);

    detector.detect("Wie komme ich zum Bahnhof");
    EXPECT_TRUE(cache->contains("Wie komme ich zum Bahnhof"));
}

// ============================================================================
// Timeout and classifier failure
// ============================================================================

TEST_F(HybridDetectorTest, TimeoutFallsBackWithinBudget) {
    DetectorConfig config = test_config();
    config.timeout = 50ms;
    auto logger = std::make_shared<RecordingLogger>();
    auto detector = make_detector(std::make_unique<StallingClassifier>(calls_), config, logger);

    auto start = std::chrono::steady_clock::now();
    auto result = detector->detect("Wie komme ich zum Bahnhof", true);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, config.timeout * 2);
    EXPECT_EQ(result.language, "en");
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    ASSERT_TRUE(result.diagnostics.has_value());
    EXPECT_TRUE(result.diagnostics->timed_out);
    EXPECT_EQ(result.diagnostics->reason, "timeout");

    EXPECT_EQ(detector->stats().timeouts, 1u);
    EXPECT_EQ(logger->count(LogLevel::WARNING), 1u);
}

TEST_F(HybridDetectorTest, TimeoutIsNotCached) {
    DetectorConfig config = test_config();
    config.timeout = 10ms;
    auto detector = make_detector(std::make_unique<StallingClassifier>(calls_), config);

    detector->detect("Wie komme ich zum Bahnhof");
    detector->detect("Wie komme ich zum Bahnhof");

    EXPECT_EQ(calls_->load(), 2);
    EXPECT_EQ(detector->stats().cache.size, 0u);
}

TEST_F(HybridDetectorTest, ClassifierErrorFallsBack) {
    auto logger = std::make_shared<RecordingLogger>();
    auto detector = make_detector(std::make_unique<ThrowingClassifier>(), test_config(), logger);

    auto result = detector->detect("Wie komme ich zum Bahnhof", true);
    EXPECT_EQ(result.language, "en");
    EXPECT_EQ(result.method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(result.diagnostics->reason, "classifier_error");
    EXPECT_FALSE(result.diagnostics->timed_out);
    EXPECT_EQ(detector->stats().cache.size, 0u);
    EXPECT_EQ(logger->count(LogLevel::ERROR), 1u);
}

TEST_F(HybridDetectorTest, DestroyWhileClassifierRuns) {
    DetectorConfig config = test_config();
    config.timeout = 5ms;
    auto detector = make_detector(std::make_unique<StallingClassifier>(calls_), config);

    detector->detect("Wie komme ich zum Bahnhof");
    detector.reset();  // Must wait for the abandoned worker

    EXPECT_EQ(calls_->load(), 1);
}

// ============================================================================
// Batch, stats, concurrency
// ============================================================================

TEST_F(HybridDetectorTest, DetectBatchKeepsOrder) {
    auto detector = make_counting({{"de", 0.92}});

    auto results = detector->detect_batch({
        "PESEL 92032100157",
        "",
        "Wie komme ich zum Bahnhof",
        "4111111111111111",
    });

    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].method, DetectionMethod::ENTITY_HINT);
    EXPECT_EQ(results[1].method, DetectionMethod::DEFAULT_FALLBACK);
    EXPECT_EQ(results[2].method, DetectionMethod::STATISTICAL);
    EXPECT_EQ(results[3].method, DetectionMethod::DEFAULT_FALLBACK);
}

TEST_F(HybridDetectorTest, StatsCountMethods) {
    auto detector = make_counting({{"de", 0.92}});

    detector->detect("PESEL 92032100157");
    detector->detect("Wie komme ich zum Bahnhof");
    detector->detect("Wie komme ich zum Bahnhof");
    detector->detect("");

    DetectorStats s = detector->stats();
    EXPECT_EQ(s.requests, 4u);
    EXPECT_EQ(s.entity_hint, 1u);
    EXPECT_EQ(s.statistical, 2u);
    EXPECT_EQ(s.fallback, 1u);
    EXPECT_EQ(s.timeouts, 0u);
    EXPECT_EQ(s.cache.capacity, 5000u);
}

TEST_F(HybridDetectorTest, ConcurrentCallers) {
    auto detector = make_counting({{"de", 0.92}});
    std::atomic<int> mismatches{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&detector, &mismatches, t]() {
            for (int i = 0; i < 100; ++i) {
                int n = (i + t) % 20;
                std::string text = "Satz Nummer " + std::to_string(n) + " ist hier";
                auto result = detector->detect(text);
                if (result.language != "de" || result.method != DetectionMethod::STATISTICAL) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
    DetectorStats s = detector->stats();
    EXPECT_EQ(s.requests, 800u);
    EXPECT_EQ(s.statistical, 800u);
    EXPECT_EQ(s.cache.size, 20u);
    // Racing first lookups may classify a text more than once, never more
    // than once per caller
    EXPECT_GE(calls_->load(), 20);
    EXPECT_LE(calls_->load(), 160);
}

// ============================================================================
// Built-in stack
// ============================================================================

TEST(HybridDetectorCreateTest, DefaultStack) {
    DetectorConfig config = test_config();
    auto created = HybridDetector::create(config);
    ASSERT_TRUE(created.ok()) << created.error().to_string();
    auto& detector = created.value();

    auto pesel = detector->detect("PESEL 92032100157");
    EXPECT_EQ(pesel.language, "pl");
    EXPECT_EQ(pesel.method, DetectionMethod::ENTITY_HINT);

    auto english = detector->detect("Please help me", true);
    EXPECT_EQ(english.language, "en");
    EXPECT_EQ(english.method, DetectionMethod::STATISTICAL);
    ASSERT_TRUE(english.diagnostics.has_value());
    ASSERT_TRUE(english.diagnostics->top_candidate.has_value());
    EXPECT_DOUBLE_EQ(english.confidence, english.diagnostics->top_candidate->probability);

    auto card = detector->detect("4111111111111111");
    EXPECT_EQ(card.language, "en");
    EXPECT_EQ(card.method, DetectionMethod::DEFAULT_FALLBACK);

    EXPECT_FALSE(detector->supported_languages().empty());
}

TEST(HybridDetectorCreateTest, RejectsInvalidConfig) {
    DetectorConfig config = test_config();
    config.min_confidence = 0.0;
    auto created = HybridDetector::create(config);
    ASSERT_FALSE(created.ok());
    EXPECT_EQ(created.error_code(), ErrorCode::INVALID_ARGUMENT);

    config = test_config();
    config.classifier.languages = {"xx"};
    EXPECT_EQ(HybridDetector::create(config).error_code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(HybridDetectorJsonTest, ResultShape) {
    auto created = HybridDetector::create(test_config());
    ASSERT_TRUE(created.ok());

    nlohmann::json plain = created.value()->detect("PESEL 92032100157");
    EXPECT_EQ(plain["language"], "pl");
    EXPECT_EQ(plain["method"], "entity-hint-based");
    EXPECT_DOUBLE_EQ(plain["confidence"].get<double>(), 1.0);
    EXPECT_FALSE(plain.contains("diagnostics"));

    nlohmann::json detailed = created.value()->detect("PESEL 92032100157", true);
    ASSERT_TRUE(detailed.contains("diagnostics"));
    const auto& hints = detailed["diagnostics"]["hints"];
    ASSERT_TRUE(hints.is_array());
    ASSERT_FALSE(hints.empty());
    EXPECT_EQ(detailed["diagnostics"]["timed_out"], false);
}
