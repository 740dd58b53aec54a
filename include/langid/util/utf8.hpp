#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace langid::utf8 {

// Substituted for malformed byte sequences during decoding
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

/**
 * Decode a UTF-8 string into code points.
 * Malformed or truncated sequences decode to REPLACEMENT_CHAR, one per
 * offending lead byte, so decoding never fails.
 *
 * @param text UTF-8 input
 * @param byte_offsets If given, receives the byte offset of every decoded
 *                     code point plus a final entry equal to text.size()
 */
std::u32string decode(const std::string& text,
                      std::vector<size_t>* byte_offsets = nullptr);

// Encode a single code point (appends to out)
void append(std::string& out, char32_t cp);

// Encode a code point sequence
std::string encode(const std::u32string& text);

/**
 * Number of code points in text (malformed bytes count as one each).
 */
size_t length(const std::string& text);

/**
 * Simple case folding for ASCII, Latin-1, Latin Extended-A, Greek and
 * Cyrillic. Other code points are returned unchanged.
 */
char32_t fold_case(char32_t cp);
std::string fold_case(const std::string& text);

// Strip ASCII whitespace from both ends
std::string trim(const std::string& text);

bool is_digit(char32_t cp);
bool is_space(char32_t cp);

/**
 * Approximate letter test: ASCII letters plus every code point above
 * U+00BF that is not a known symbol or punctuation block.
 */
bool is_letter(char32_t cp);

}  // namespace langid::utf8
