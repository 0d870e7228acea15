#ifndef FNR_CONTROL_DIGITS_H
#define FNR_CONTROL_DIGITS_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace fnr {
namespace checksum {

// MOD-11 weights for the first control digit (digits 0-8)
constexpr int FIRST_WEIGHTS[] = {3, 7, 6, 1, 8, 9, 4, 5, 2};
// MOD-11 weights for the second control digit (digits 0-8 + first control digit)
constexpr int SECOND_WEIGHTS[] = {5, 4, 3, 2, 7, 6, 5, 4, 3, 2};

// Result of a control digit computation.
// valid is false when either digit would have to be 10.
struct ControlDigits {
    bool valid = false;
    uint8_t first = 0;
    uint8_t second = 0;
};

/**
 * Compute one MOD-11 control digit.
 * @param digits Digit values (0-9)
 * @param weights Weight per digit
 * @param count Number of digits
 * @return 0-9, or -1 if the digit would be 10
 */
int controlDigit(const uint8_t* digits, const int* weights, size_t count);

/**
 * Compute both control digits for a 9-digit prefix (DDMMYY + individual number).
 * @throws std::invalid_argument if prefix is not exactly 9 ASCII digits
 */
ControlDigits computeControlDigits(const std::string& prefix);

/**
 * Append the control digits to a 9-digit prefix.
 * @param prefix DDMMYY + individual number
 * @param out Receives the 11-digit identifier on success
 * @return false if no valid control digits exist for this prefix
 * @throws std::invalid_argument if prefix is not exactly 9 ASCII digits
 */
bool completeIdentifier(const std::string& prefix, std::string& out);

} // namespace checksum
} // namespace fnr

#endif // FNR_CONTROL_DIGITS_H
