#pragma once

#include <string>

namespace langid::checksums {

/**
 * Check-digit validators for national identifiers.
 *
 * Each validator receives the matched text with separators (spaces, dashes)
 * already removed and returns true only when the format and the check digit
 * are both correct.
 */

// PESEL: 11 digits, weights 1-3-7-9, encoded birth month must be valid
bool is_valid_pesel(const std::string& digits);

// NIP: 10 digits, weights 6-5-7-2-3-4-5-6-7, mod 11 (10 is never valid)
bool is_valid_nip(const std::string& digits);

// REGON: 9 or 14 digits, mod 11 with 10 mapped to 0
bool is_valid_regon(const std::string& digits);

// Polish ID card: 3 letters + 6 digits, first digit is the check digit
bool is_valid_pl_id_card(const std::string& value);

// Spanish DNI (8 digits + letter) or NIE (X/Y/Z + 7 digits + letter)
bool is_valid_es_dni(const std::string& value);

/**
 * Remove everything except ASCII letters and digits, uppercasing letters.
 */
std::string strip_separators(const std::string& text);

/**
 * Dispatch by validator name ("pesel", "nip", "regon", "pl_id_card",
 * "es_dni"). "none" and the empty name accept everything.
 */
bool validate(const std::string& validator, const std::string& matched);

// Whether validate() knows the validator name
bool is_known_validator(const std::string& validator);

}  // namespace langid::checksums
