#pragma once

#include <string>
#include <vector>

namespace langid {

/**
 * Training samples for one built-in language profile.
 */
struct CorpusEntry {
    std::string code;                   // ISO 639-1
    std::string name;                   // English name, for listings
    std::vector<std::string> samples;   // Representative sentences
};

/**
 * The built-in training corpus, ordered by language code.
 */
const std::vector<CorpusEntry>& builtin_corpus();

}  // namespace langid
