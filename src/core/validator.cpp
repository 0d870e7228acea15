#include "fnr/validator.h"
#include "fnr/control_digits.h"
#include <spdlog/spdlog.h>
#include <utility>

namespace fnr {

namespace {

bool isDigits(const std::string& value) {
    for (char c : value) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

int readNumber(const std::string& value, size_t pos, size_t count) {
    int number = 0;
    for (size_t i = pos; i < pos + count; i++) {
        number = number * 10 + (value[i] - '0');
    }
    return number;
}

std::string padded(int value, size_t width) {
    std::string text = std::to_string(value);
    if (text.size() < width) {
        text.insert(0, width - text.size(), '0');
    }
    return text;
}

ValidationResult& reject(ValidationResult& result, RejectReason reason, std::string message) {
    result.valid = false;
    result.reason = reason;
    result.error = std::move(message);
    spdlog::trace("Identifier rejected: {}", rejectReasonName(reason));
    return result;
}

} // namespace

const char* rejectReasonName(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "NONE";
        case RejectReason::MALFORMED: return "MALFORMED";
        case RejectReason::D_NUMBER_NOT_ALLOWED: return "D_NUMBER_NOT_ALLOWED";
        case RejectReason::DAY_OUT_OF_RANGE: return "DAY_OUT_OF_RANGE";
        case RejectReason::H_NUMBER_NOT_ALLOWED: return "H_NUMBER_NOT_ALLOWED";
        case RejectReason::MONTH_OUT_OF_RANGE: return "MONTH_OUT_OF_RANGE";
        case RejectReason::INVALID_DATE: return "INVALID_DATE";
        case RejectReason::FUTURE_DATE: return "FUTURE_DATE";
        case RejectReason::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
    }
    return "UNKNOWN";
}

std::chrono::year_month_day utcToday() {
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

IdentifierValidator::IdentifierValidator()
    : IdentifierValidator(ValidatorConfig{}) {}

IdentifierValidator::IdentifierValidator(const ValidatorConfig& config)
    : config_(config) {}

std::chrono::year_month_day IdentifierValidator::today() const {
    return config_.today ? config_.today() : utcToday();
}

ValidationResult IdentifierValidator::inspect(const std::string& value) const {
    ValidationResult result;
    result.identifier.value = value;

    if (value.size() != IDENTIFIER_LENGTH || !isDigits(value)) {
        return reject(result, RejectReason::MALFORMED,
                      "Identifier must be exactly 11 digits");
    }

    int day = readNumber(value, 0, 2);
    int month = readNumber(value, 2, 2);
    int year = readNumber(value, 4, 2);
    int individual = readNumber(value, 6, 3);
    result.identifier.individual_number = individual;

    // Day 41-71 is a D-number
    if (day >= 1 + D_NUMBER_OFFSET && day <= 31 + D_NUMBER_OFFSET) {
        if (!config_.accept_d_numbers) {
            return reject(result, RejectReason::D_NUMBER_NOT_ALLOWED,
                          "D-numbers are not accepted");
        }
        result.identifier.is_d_number = true;
        day -= D_NUMBER_OFFSET;
    }

    if (day < 1 || day > 31) {
        return reject(result, RejectReason::DAY_OUT_OF_RANGE,
                      "Day out of range in identifier");
    }

    // Month 41-52 is an H-number
    if (month >= 1 + H_NUMBER_OFFSET && month <= 12 + H_NUMBER_OFFSET) {
        if (!config_.accept_h_numbers) {
            return reject(result, RejectReason::H_NUMBER_NOT_ALLOWED,
                          "H-numbers are not accepted");
        }
        result.identifier.is_h_number = true;
        month -= H_NUMBER_OFFSET;
    }

    if (month < 1 || month > 12) {
        return reject(result, RejectReason::MONTH_OUT_OF_RANGE,
                      "Month out of range in identifier");
    }

    // Individual numbers 000-499 belong to the 1900s, 500-999 to the 2000s.
    // 900-999 was also issued to people born 1940-1999.
    year += individual <= 499 ? 1900 : 2000;
    if (individual >= 900 && year >= 2040) {
        year -= 100;
    }

    std::chrono::year_month_day birth_date{
        std::chrono::year{year},
        std::chrono::month{static_cast<unsigned>(month)},
        std::chrono::day{static_cast<unsigned>(day)}};

    if (!birth_date.ok()) {
        return reject(result, RejectReason::INVALID_DATE,
                      padded(year, 4) + "-" + padded(month, 2) + "-" + padded(day, 2) +
                      " is not a valid date");
    }

    if (std::chrono::sys_days{birth_date} > std::chrono::sys_days{today()}) {
        return reject(result, RejectReason::FUTURE_DATE,
                      "Date of birth is later than the current date");
    }
    result.identifier.birth_date = birth_date;

    std::string expected;
    if (!checksum::completeIdentifier(value.substr(0, PREFIX_LENGTH), expected) ||
        expected != value) {
        return reject(result, RejectReason::CHECKSUM_MISMATCH,
                      "Control digits do not match identifier");
    }

    result.valid = true;
    return result;
}

bool IdentifierValidator::validate(const std::string& value) const {
    ValidationResult result = inspect(value);
    if (!result.valid) {
        throw IdentifierError(result.reason, result.error);
    }
    return true;
}

bool IdentifierValidator::check(const std::string& value, const RejectCallback& on_reject) const {
    std::string reason;
    try {
        ValidationResult result = inspect(value);
        if (result.valid) {
            return true;
        }
        reason = std::move(result.error);
    } catch (const std::exception& e) {
        reason = e.what();
    }

    if (on_reject) {
        try {
            on_reject(reason);
        } catch (const std::exception& e) {
            spdlog::warn("Reject callback threw: {}", e.what());
        }
    }
    return false;
}

bool validateIdentifier(const std::string& value,
                        bool accept_d_numbers,
                        bool accept_h_numbers) {
    ValidatorConfig config;
    config.accept_d_numbers = accept_d_numbers;
    config.accept_h_numbers = accept_h_numbers;
    return IdentifierValidator(config).validate(value);
}

bool checkIdentifier(const std::string& value,
                     bool accept_d_numbers,
                     bool accept_h_numbers,
                     const RejectCallback& on_reject) {
    ValidatorConfig config;
    config.accept_d_numbers = accept_d_numbers;
    config.accept_h_numbers = accept_h_numbers;
    return IdentifierValidator(config).check(value, on_reject);
}

} // namespace fnr
