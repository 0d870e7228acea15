#ifndef FNR_TYPES_H
#define FNR_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fnr {

constexpr size_t IDENTIFIER_LENGTH = 11;    // DDMMYY + individual + 2 control
constexpr size_t PREFIX_LENGTH = 9;         // Digits covered by the control digits

constexpr int D_NUMBER_OFFSET = 40;         // Added to the day field
constexpr int H_NUMBER_OFFSET = 40;         // Added to the month field

// Why an identifier was rejected. Values are stable (exposed through the C API).
enum class RejectReason : uint8_t {
    NONE = 0,
    MALFORMED = 1,              // Not exactly 11 ASCII digits
    D_NUMBER_NOT_ALLOWED = 2,   // Day field in 41-71 but D-numbers disabled
    DAY_OUT_OF_RANGE = 3,
    H_NUMBER_NOT_ALLOWED = 4,   // Month field in 41-52 but H-numbers disabled
    MONTH_OUT_OF_RANGE = 5,
    INVALID_DATE = 6,           // e.g. 30 February
    FUTURE_DATE = 7,
    CHECKSUM_MISMATCH = 8
};

// Stable upper-case token for a reason, e.g. "CHECKSUM_MISMATCH"
const char* rejectReasonName(RejectReason reason);

// Fields decoded from an identifier
struct DecodedIdentifier {
    std::string value;
    bool is_d_number = false;
    bool is_h_number = false;
    int individual_number = 0;      // 000-999
    std::chrono::year_month_day birth_date{};
};

// Outcome of a validation run
struct ValidationResult {
    bool valid = false;
    RejectReason reason = RejectReason::NONE;
    std::string error;              // Human-readable reason, empty if valid

    // Filled as far as decoding progressed; birth_date is only
    // meaningful once the date rules have passed.
    DecodedIdentifier identifier;
};

} // namespace fnr

#endif // FNR_TYPES_H
