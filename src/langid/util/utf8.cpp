#include <langid/util/utf8.hpp>

namespace langid::utf8 {

namespace {

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

}  // namespace

std::u32string decode(const std::string& text, std::vector<size_t>* byte_offsets) {
    std::u32string out;
    out.reserve(text.size());
    if (byte_offsets) {
        byte_offsets->clear();
        byte_offsets->reserve(text.size() + 1);
    }

    size_t i = 0;
    const size_t n = text.size();
    while (i < n) {
        unsigned char b0 = static_cast<unsigned char>(text[i]);
        if (byte_offsets) {
            byte_offsets->push_back(i);
        }

        if (b0 < 0x80) {
            out.push_back(b0);
            ++i;
            continue;
        }

        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;
        if ((b0 & 0xE0) == 0xC0) {
            len = 2; cp = b0 & 0x1F; min_cp = 0x80;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3; cp = b0 & 0x0F; min_cp = 0x800;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4; cp = b0 & 0x07; min_cp = 0x10000;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + len > n) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            unsigned char b = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation(b)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        // Reject overlong forms, surrogates and out-of-range values
        if (!valid || cp < min_cp || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        out.push_back(cp);
        i += len;
    }

    if (byte_offsets) {
        byte_offsets->push_back(n);
    }
    return out;
}

void append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        append(out, cp);
    }
    return out;
}

size_t length(const std::string& text) {
    return decode(text).size();
}

char32_t fold_case(char32_t cp) {
    // ASCII
    if (cp >= 'A' && cp <= 'Z') {
        return cp + 0x20;
    }
    if (cp < 0x80) {
        return cp;
    }

    // Latin-1 Supplement: U+00C0..U+00DE except the multiplication sign
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
        return cp + 0x20;
    }

    // Latin Extended-A: pairs alternate upper/lower
    if (cp >= 0x0100 && cp <= 0x0137) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if (cp >= 0x0139 && cp <= 0x0148) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp >= 0x014A && cp <= 0x0177) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if (cp == 0x0178) {
        return 0x00FF;
    }
    if (cp >= 0x0179 && cp <= 0x017E) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }

    // Greek capitals (U+03A2 is unassigned)
    if (cp >= 0x0391 && cp <= 0x03A9 && cp != 0x03A2) {
        return cp + 0x20;
    }

    // Cyrillic
    if (cp >= 0x0400 && cp <= 0x040F) {
        return cp + 0x50;
    }
    if (cp >= 0x0410 && cp <= 0x042F) {
        return cp + 0x20;
    }

    return cp;
}

std::string fold_case(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : decode(text)) {
        append(out, fold_case(cp));
    }
    return out;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\n\r\f\v");
    return text.substr(start, end - start + 1);
}

bool is_digit(char32_t cp) {
    return cp >= '0' && cp <= '9';
}

bool is_space(char32_t cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' ||
           cp == '\f' || cp == '\v' || cp == 0x00A0 || cp == 0x3000;
}

bool is_letter(char32_t cp) {
    if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z')) {
        return true;
    }
    if (cp < 0x00C0) {
        return false;
    }
    if (cp == 0x00D7 || cp == 0x00F7 || cp == REPLACEMENT_CHAR) {
        return false;
    }
    // General punctuation through misc symbols and arrows
    if (cp >= 0x2000 && cp <= 0x2BFF) {
        return false;
    }
    // CJK symbols and punctuation
    if (cp >= 0x3000 && cp <= 0x303F) {
        return false;
    }
    // Fullwidth ASCII punctuation and digits
    if (cp >= 0xFF00 && cp <= 0xFF20) {
        return false;
    }
    // Emoji and pictographs
    if (cp >= 0x1F000 && cp <= 0x1FAFF) {
        return false;
    }
    return true;
}

}  // namespace langid::utf8
