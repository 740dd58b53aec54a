#include <langid/detect/entity_hint_scanner.hpp>
#include <langid/util/checksums.hpp>
#include <langid/util/utf8.hpp>

#include <algorithm>

namespace langid {

namespace {

bool is_word_char(char32_t cp) {
    return utf8::is_letter(cp) || utf8::is_digit(cp) || cp == '_';
}

}  // namespace

Result<std::unique_ptr<EntityHintScanner>> EntityHintScanner::create(
    const std::vector<EntityPatternConfig>& patterns,
    const std::vector<KeywordConfig>& keywords) {

    std::unique_ptr<EntityHintScanner> scanner(new EntityHintScanner());

    scanner->patterns_.reserve(patterns.size());
    for (const auto& p : patterns) {
        if (!checksums::is_known_validator(p.validator)) {
            return Error(ErrorCode::INVALID_ARGUMENT,
                         "pattern " + p.tag + ": unknown validator '" + p.validator + "'");
        }
        try {
            scanner->patterns_.push_back({p, std::regex(p.pattern, std::regex::ECMAScript)});
        } catch (const std::regex_error& e) {
            return Error(ErrorCode::INVALID_ARGUMENT, "pattern " + p.tag + ": " + e.what());
        }
    }

    scanner->keywords_.reserve(keywords.size());
    for (const auto& k : keywords) {
        std::u32string folded = utf8::decode(utf8::fold_case(k.keyword));
        if (folded.empty()) {
            return Error(ErrorCode::INVALID_ARGUMENT, "empty keyword");
        }
        scanner->keywords_.push_back({k, std::move(folded)});
    }

    return scanner;
}

std::vector<EntityHint> EntityHintScanner::scan(const std::string& text) const {
    std::vector<EntityHint> hints;
    if (text.empty()) {
        return hints;
    }

    scan_patterns(text, hints);
    scan_keywords(text, hints);

    // Overlapping alternatives of one pattern can report the same span twice
    std::vector<EntityHint> unique;
    unique.reserve(hints.size());
    for (auto& h : hints) {
        bool seen = std::any_of(unique.begin(), unique.end(), [&h](const EntityHint& u) {
            return u.tag == h.tag && u.offset == h.offset;
        });
        if (!seen) {
            unique.push_back(std::move(h));
        }
    }
    return unique;
}

void EntityHintScanner::scan_patterns(const std::string& text,
                                      std::vector<EntityHint>& out) const {
    for (const auto& p : patterns_) {
        auto begin = std::sregex_iterator(text.begin(), text.end(), p.regex);
        for (auto it = begin; it != std::sregex_iterator(); ++it) {
            const std::smatch& m = *it;
            if (m.length(0) == 0) {
                continue;
            }
            std::string matched = m.str(0);
            if (!checksums::validate(p.config.validator, matched)) {
                continue;
            }

            EntityHint hint;
            hint.tag = p.config.tag;
            hint.category = p.config.category;
            hint.language = p.config.language;
            hint.matched = std::move(matched);
            hint.priority = p.config.priority;
            hint.offset = static_cast<size_t>(m.position(0));
            out.push_back(std::move(hint));
        }
    }
}

void EntityHintScanner::scan_keywords(const std::string& text,
                                      std::vector<EntityHint>& out) const {
    if (keywords_.empty()) {
        return;
    }

    // Folding maps one code point to one code point, so offsets line up
    std::vector<size_t> offsets;
    std::u32string folded = utf8::decode(text, &offsets);
    for (auto& cp : folded) {
        cp = utf8::fold_case(cp);
    }

    for (const auto& k : keywords_) {
        size_t pos = folded.find(k.folded);
        while (pos != std::u32string::npos) {
            size_t end = pos + k.folded.size();

            bool accepted = true;
            if (k.config.whole_word) {
                bool left_ok = pos == 0 || !is_word_char(folded[pos - 1]);
                bool right_ok = end >= folded.size() || !is_word_char(folded[end]);
                accepted = left_ok && right_ok;
            }

            if (accepted) {
                EntityHint hint;
                hint.tag = "keyword:" + k.config.keyword;
                hint.category = HintCategory::KEYWORD;
                hint.language = k.config.language;
                hint.matched = text.substr(offsets[pos], offsets[end] - offsets[pos]);
                hint.priority = k.config.priority;
                hint.offset = offsets[pos];
                out.push_back(std::move(hint));
            }

            pos = folded.find(k.folded, pos + 1);
        }
    }
}

std::optional<EntityHint> EntityHintScanner::strongest(const std::vector<EntityHint>& hints) {
    if (hints.empty()) {
        return std::nullopt;
    }

    // max_element keeps the first of equal elements
    auto it = std::max_element(hints.begin(), hints.end(),
        [](const EntityHint& a, const EntityHint& b) {
            return a.priority < b.priority;
        });
    return *it;
}

}  // namespace langid
