#include "fnr/control_digits.h"
#include "fnr/types.h"
#include <stdexcept>

namespace fnr {
namespace checksum {

int controlDigit(const uint8_t* digits, const int* weights, size_t count) {
    int sum = 0;
    for (size_t i = 0; i < count; i++) {
        sum += digits[i] * weights[i];
    }

    int rest = sum % 11;
    if (rest == 0) {
        return 0;
    }

    // rest == 1 would need a control digit of 10
    int digit = 11 - rest;
    return digit == 10 ? -1 : digit;
}

ControlDigits computeControlDigits(const std::string& prefix) {
    if (prefix.size() != PREFIX_LENGTH) {
        throw std::invalid_argument("control digits: prefix must be 9 digits");
    }

    uint8_t digits[PREFIX_LENGTH + 1];
    for (size_t i = 0; i < PREFIX_LENGTH; i++) {
        char c = prefix[i];
        if (c < '0' || c > '9') {
            throw std::invalid_argument("control digits: prefix must be 9 digits");
        }
        digits[i] = static_cast<uint8_t>(c - '0');
    }

    ControlDigits result;

    int first = controlDigit(digits, FIRST_WEIGHTS, PREFIX_LENGTH);
    if (first < 0) {
        return result;
    }
    digits[PREFIX_LENGTH] = static_cast<uint8_t>(first);

    int second = controlDigit(digits, SECOND_WEIGHTS, PREFIX_LENGTH + 1);
    if (second < 0) {
        return result;
    }

    result.valid = true;
    result.first = static_cast<uint8_t>(first);
    result.second = static_cast<uint8_t>(second);
    return result;
}

bool completeIdentifier(const std::string& prefix, std::string& out) {
    ControlDigits digits = computeControlDigits(prefix);
    if (!digits.valid) {
        return false;
    }

    out.reserve(IDENTIFIER_LENGTH);
    out.assign(prefix);
    out.push_back(static_cast<char>('0' + digits.first));
    out.push_back(static_cast<char>('0' + digits.second));
    return true;
}

} // namespace checksum
} // namespace fnr
