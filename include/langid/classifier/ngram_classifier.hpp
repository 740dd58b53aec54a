#pragma once

#include <langid/classifier/language_classifier.hpp>
#include <langid/config.hpp>
#include <langid/result.hpp>

#include <array>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace langid {

/**
 * NgramClassifier - Naive Bayes over character 1- to 3-grams.
 *
 * Profiles are built once from training samples: every word is padded with
 * spaces and all of its 1-, 2- and 3-grams are counted, giving
 * P(ngram | language) per n-gram length.
 *
 * Classification runs several trials. Each trial starts from a uniform
 * prior, draws n-grams of the input at random and multiplies in their
 * smoothed likelihoods until one language exceeds the convergence threshold
 * or the draw budget is spent. Trial results are averaged.
 *
 * Every call seeds its own generator from the configured seed, so equal
 * input always yields equal output and concurrent calls share no state.
 */
class NgramClassifier : public LanguageClassifier {
public:
    /**
     * Build profiles from the built-in corpus (restricted to
     * config.languages when non-empty) plus config.profiles.
     *
     * @return The classifier, or INVALID_ARGUMENT if a requested language is
     *         unknown or no profile remains
     */
    static Result<std::unique_ptr<NgramClassifier>> create(const ClassifierConfig& config);

    std::vector<LanguageCandidate> classify(
        const std::string& text,
        const CancellationToken& token) const override;

    std::vector<std::string> languages() const override { return languages_; }

    /**
     * Extract the padded 1- to 3-grams of text, in text order. Non-letters
     * act as word separators and letters are case folded.
     */
    static std::vector<std::string> extract_ngrams(const std::string& text);

    // Number of distinct n-grams across all profiles
    size_t vocabulary_size() const { return ngram_probs_.size(); }

private:
    static constexpr int MAX_NGRAM = 3;
    static constexpr double BASE_FREQ = 10000.0;
    static constexpr int CONVERGENCE_CHECK_INTERVAL = 5;

    explicit NgramClassifier(ClassifierConfig config);

    void add_profile(const std::string& language, const std::vector<std::string>& samples);
    void finalize_profiles();

    // Normalize in place; returns the largest probability
    static double normalize(std::vector<double>& probs);

    ClassifierConfig config_;
    std::vector<std::string> languages_;

    // Training counts: per language, per n-gram length
    std::vector<std::map<std::string, uint32_t>> counts_;
    std::vector<std::array<uint64_t, MAX_NGRAM>> totals_;

    // n-gram -> P(n-gram | language) for every language index
    std::unordered_map<std::string, std::vector<double>> ngram_probs_;
};

}  // namespace langid
