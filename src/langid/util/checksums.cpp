#include <langid/util/checksums.hpp>

#include <array>
#include <cctype>

namespace langid::checksums {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

int digit_at(const std::string& s, size_t i) {
    return s[i] - '0';
}

// Letters count from A=10 as in ICAO document numbers
int letter_value(char c) {
    return c - 'A' + 10;
}

constexpr const char* DNI_LETTERS = "TRWAGMYFPDXBNJZSQVHLCKE";

}  // namespace

std::string strip_separators(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isdigit(uc)) {
            result += c;
        } else if (std::isalpha(uc)) {
            result += static_cast<char>(std::toupper(uc));
        }
    }
    return result;
}

bool is_valid_pesel(const std::string& digits) {
    if (digits.size() != 11 || !all_digits(digits)) {
        return false;
    }

    static constexpr std::array<int, 10> weights = {1, 3, 7, 9, 1, 3, 7, 9, 1, 3};
    int sum = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        sum += digit_at(digits, i) * weights[i];
    }
    int check = (10 - sum % 10) % 10;
    if (check != digit_at(digits, 10)) {
        return false;
    }

    // Month carries the century offset (+20, +40, +60, +80)
    int month = digit_at(digits, 2) * 10 + digit_at(digits, 3);
    int base_month = month % 20;
    int day = digit_at(digits, 4) * 10 + digit_at(digits, 5);
    return base_month >= 1 && base_month <= 12 && day >= 1 && day <= 31;
}

bool is_valid_nip(const std::string& digits) {
    if (digits.size() != 10 || !all_digits(digits)) {
        return false;
    }

    static constexpr std::array<int, 9> weights = {6, 5, 7, 2, 3, 4, 5, 6, 7};
    int sum = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        sum += digit_at(digits, i) * weights[i];
    }
    int check = sum % 11;
    return check != 10 && check == digit_at(digits, 9);
}

bool is_valid_regon(const std::string& digits) {
    if (!all_digits(digits)) {
        return false;
    }

    if (digits.size() == 9) {
        static constexpr std::array<int, 8> weights = {8, 9, 2, 3, 4, 5, 6, 7};
        int sum = 0;
        for (size_t i = 0; i < weights.size(); ++i) {
            sum += digit_at(digits, i) * weights[i];
        }
        return (sum % 11) % 10 == digit_at(digits, 8);
    }

    if (digits.size() == 14) {
        static constexpr std::array<int, 13> weights =
            {2, 4, 8, 5, 0, 9, 7, 3, 6, 1, 2, 4, 8};
        int sum = 0;
        for (size_t i = 0; i < weights.size(); ++i) {
            sum += digit_at(digits, i) * weights[i];
        }
        return (sum % 11) % 10 == digit_at(digits, 13);
    }

    return false;
}

bool is_valid_pl_id_card(const std::string& value) {
    if (value.size() != 9) {
        return false;
    }
    for (size_t i = 0; i < 3; ++i) {
        if (value[i] < 'A' || value[i] > 'Z') return false;
    }
    if (!all_digits(value.substr(3))) {
        return false;
    }

    // Position 3 holds the check digit and is skipped in the sum
    static constexpr std::array<int, 9> weights = {7, 3, 1, 0, 7, 3, 1, 7, 3};
    int sum = 0;
    for (size_t i = 0; i < 3; ++i) {
        sum += letter_value(value[i]) * weights[i];
    }
    for (size_t i = 4; i < 9; ++i) {
        sum += digit_at(value, i) * weights[i];
    }
    return sum % 10 == digit_at(value, 3);
}

bool is_valid_es_dni(const std::string& value) {
    if (value.size() != 9) {
        return false;
    }

    std::string number = value.substr(0, 8);
    char letter = value[8];

    // NIE prefix maps onto a leading digit
    switch (number[0]) {
        case 'X': number[0] = '0'; break;
        case 'Y': number[0] = '1'; break;
        case 'Z': number[0] = '2'; break;
        default: break;
    }

    if (!all_digits(number)) {
        return false;
    }

    unsigned long n = std::stoul(number);
    return DNI_LETTERS[n % 23] == letter;
}

bool validate(const std::string& validator, const std::string& matched) {
    if (validator.empty() || validator == "none") {
        return true;
    }

    std::string value = strip_separators(matched);
    if (validator == "pesel") return is_valid_pesel(value);
    if (validator == "nip") return is_valid_nip(value);
    if (validator == "regon") return is_valid_regon(value);
    if (validator == "pl_id_card") return is_valid_pl_id_card(value);
    if (validator == "es_dni") return is_valid_es_dni(value);
    return false;
}

bool is_known_validator(const std::string& validator) {
    return validator.empty() || validator == "none" ||
           validator == "pesel" || validator == "nip" ||
           validator == "regon" || validator == "pl_id_card" ||
           validator == "es_dni";
}

}  // namespace langid::checksums
