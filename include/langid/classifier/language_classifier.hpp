#pragma once

#include <langid/detect/cancellation_token.hpp>
#include <langid/types.hpp>

#include <memory>
#include <string>
#include <vector>

namespace langid {

// ============================================================================
// Abstract Classifier Interface
// ============================================================================

class LanguageClassifier {
public:
    virtual ~LanguageClassifier() = default;

    /**
     * Rank candidate languages for text.
     *
     * Must be deterministic for a given configuration and safe to call
     * concurrently. Unclassifiable input (empty, digits only, unknown
     * script) yields an empty vector, never an error.
     *
     * @param text UTF-8 input
     * @param token Polled between units of work; once cancelled the
     *              classifier may return early with an empty vector
     * @return Candidates ordered by descending probability
     */
    virtual std::vector<LanguageCandidate> classify(
        const std::string& text,
        const CancellationToken& token) const = 0;

    // Language codes this classifier can return
    virtual std::vector<std::string> languages() const = 0;
};

using LanguageClassifierPtr = std::unique_ptr<LanguageClassifier>;

}  // namespace langid
