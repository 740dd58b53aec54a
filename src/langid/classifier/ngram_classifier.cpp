#include <langid/classifier/ngram_classifier.hpp>
#include <langid/classifier/builtin_corpus.hpp>
#include <langid/util/utf8.hpp>

#include <algorithm>
#include <random>
#include <set>

namespace langid {

NgramClassifier::NgramClassifier(ClassifierConfig config)
    : config_(std::move(config)) {}

Result<std::unique_ptr<NgramClassifier>> NgramClassifier::create(const ClassifierConfig& config) {
    std::unique_ptr<NgramClassifier> classifier(new NgramClassifier(config));

    const auto& corpus = builtin_corpus();
    std::set<std::string> wanted(config.languages.begin(), config.languages.end());

    // Every requested language must come from somewhere
    for (const auto& code : wanted) {
        bool builtin = std::any_of(corpus.begin(), corpus.end(),
            [&code](const CorpusEntry& e) { return e.code == code; });
        if (!builtin && config.profiles.find(code) == config.profiles.end()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "unknown language: " + code);
        }
    }

    for (const auto& entry : corpus) {
        if (!wanted.empty() && wanted.count(entry.code) == 0) {
            continue;
        }
        classifier->add_profile(entry.code, entry.samples);
    }

    for (const auto& [code, samples] : config.profiles) {
        if (code.empty() || samples.empty()) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "profile '" + code + "' needs a code and at least one sample");
        }
        classifier->add_profile(code, samples);
    }

    if (classifier->languages_.empty()) {
        return Error(ErrorCode::INVALID_ARGUMENT, "no language profiles configured");
    }

    classifier->finalize_profiles();
    return classifier;
}

// ============================================================================
// Profile Construction
// ============================================================================

std::vector<std::string> NgramClassifier::extract_ngrams(const std::string& text) {
    std::vector<std::string> grams;
    std::u32string decoded = utf8::decode(text);

    std::u32string word;
    auto flush_word = [&grams, &word]() {
        if (word.empty()) {
            return;
        }
        std::u32string padded = U" " + word + U" ";
        for (size_t n = 1; n <= static_cast<size_t>(MAX_NGRAM); ++n) {
            for (size_t i = 0; i + n <= padded.size(); ++i) {
                if (n == 1 && padded[i] == U' ') {
                    continue;
                }
                grams.push_back(utf8::encode(padded.substr(i, n)));
            }
        }
        word.clear();
    };

    for (char32_t cp : decoded) {
        if (utf8::is_letter(cp)) {
            word.push_back(utf8::fold_case(cp));
        } else {
            flush_word();
        }
    }
    flush_word();

    return grams;
}

void NgramClassifier::add_profile(const std::string& language,
                                  const std::vector<std::string>& samples) {
    size_t index = 0;
    auto it = std::find(languages_.begin(), languages_.end(), language);
    if (it == languages_.end()) {
        index = languages_.size();
        languages_.push_back(language);
        counts_.emplace_back();
        totals_.push_back({0, 0, 0});
    } else {
        index = static_cast<size_t>(it - languages_.begin());
    }

    for (const auto& sample : samples) {
        for (auto& gram : extract_ngrams(sample)) {
            size_t n = utf8::length(gram);
            totals_[index][n - 1]++;
            counts_[index][std::move(gram)]++;
        }
    }
}

void NgramClassifier::finalize_profiles() {
    const size_t num_languages = languages_.size();

    for (size_t lang = 0; lang < num_languages; ++lang) {
        for (const auto& [gram, count] : counts_[lang]) {
            size_t n = utf8::length(gram);
            uint64_t total = totals_[lang][n - 1];
            if (total == 0) {
                continue;
            }

            auto& probs = ngram_probs_[gram];
            if (probs.empty()) {
                probs.assign(num_languages, 0.0);
            }
            probs[lang] = static_cast<double>(count) / static_cast<double>(total);
        }
    }

    // Counts are only needed while building
    counts_.clear();
    totals_.clear();
}

// ============================================================================
// Classification
// ============================================================================

double NgramClassifier::normalize(std::vector<double>& probs) {
    double sum = 0.0;
    for (double p : probs) {
        sum += p;
    }

    if (sum <= 0.0) {
        double uniform = 1.0 / static_cast<double>(probs.size());
        std::fill(probs.begin(), probs.end(), uniform);
        return uniform;
    }

    double max_prob = 0.0;
    for (double& p : probs) {
        p /= sum;
        max_prob = std::max(max_prob, p);
    }
    return max_prob;
}

std::vector<LanguageCandidate> NgramClassifier::classify(
    const std::string& text,
    const CancellationToken& token) const {

    std::vector<const std::vector<double>*> known;
    for (const auto& gram : extract_ngrams(text)) {
        auto it = ngram_probs_.find(gram);
        if (it != ngram_probs_.end()) {
            known.push_back(&it->second);
        }
    }

    if (known.empty()) {
        return {};
    }

    const size_t num_languages = languages_.size();
    std::mt19937 rng(config_.seed);
    std::normal_distribution<double> gauss(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick(0, known.size() - 1);

    std::vector<double> averaged(num_languages, 0.0);

    for (int trial = 0; trial < config_.trials; ++trial) {
        if (token.is_cancelled()) {
            return {};
        }

        std::vector<double> probs(num_languages, 1.0 / static_cast<double>(num_languages));

        double alpha = config_.alpha + gauss(rng) * config_.alpha_width;
        if (alpha <= 0.0) {
            alpha = config_.alpha;
        }
        const double weight = alpha / BASE_FREQ;

        for (int i = 0; i < config_.max_iterations; ++i) {
            const auto& likelihood = *known[pick(rng)];
            for (size_t lang = 0; lang < num_languages; ++lang) {
                probs[lang] *= weight + likelihood[lang];
            }

            if (i % CONVERGENCE_CHECK_INTERVAL == 0) {
                if (normalize(probs) > config_.convergence_threshold) {
                    break;
                }
                if (token.is_cancelled()) {
                    return {};
                }
            }
        }

        normalize(probs);
        for (size_t lang = 0; lang < num_languages; ++lang) {
            averaged[lang] += probs[lang] / static_cast<double>(config_.trials);
        }
    }

    std::vector<LanguageCandidate> candidates;
    for (size_t lang = 0; lang < num_languages; ++lang) {
        if (averaged[lang] > config_.candidate_floor) {
            candidates.push_back({languages_[lang], std::min(averaged[lang], 1.0)});
        }
    }

    std::sort(candidates.begin(), candidates.end(),
        [](const LanguageCandidate& a, const LanguageCandidate& b) {
            if (a.probability != b.probability) {
                return a.probability > b.probability;
            }
            return a.language < b.language;
        });

    return candidates;
}

}  // namespace langid
