#ifndef FNR_VALIDATOR_H
#define FNR_VALIDATOR_H

#include "fnr/types.h"
#include <chrono>
#include <functional>
#include <stdexcept>
#include <string>

namespace fnr {

// Supplies the date that birth dates must not exceed
using TodayProvider = std::function<std::chrono::year_month_day()>;

// Receives the human-readable reason when check() rejects an identifier
using RejectCallback = std::function<void(const std::string&)>;

// Current date in UTC
std::chrono::year_month_day utcToday();

// Configuration options for validation
struct ValidatorConfig {
    bool accept_d_numbers = true;    // Day field + 40 (temporary residents)
    bool accept_h_numbers = false;   // Month field + 40 (healthcare numbers)

    // Reference date for the future-birth-date rule (defaults to utcToday)
    TodayProvider today;
};

// Thrown by the strict validation API
class IdentifierError : public std::runtime_error {
public:
    IdentifierError(RejectReason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    RejectReason reason() const noexcept { return reason_; }

private:
    RejectReason reason_;
};

// Validates fødselsnummer strings. Immutable once constructed, so a
// single instance may be shared between threads.
class IdentifierValidator {
public:
    IdentifierValidator();
    explicit IdentifierValidator(const ValidatorConfig& config);

    const ValidatorConfig& config() const { return config_; }

    // Run all rules and report the first failure as data.
    // Does not throw for any input string.
    ValidationResult inspect(const std::string& value) const;

    // Strict form: returns true, or throws IdentifierError for the
    // first failing rule
    bool validate(const std::string& value) const;

    // Non-throwing form: returns false and passes the reason to
    // on_reject (if set) when the identifier is invalid
    bool check(const std::string& value, const RejectCallback& on_reject = nullptr) const;

private:
    std::chrono::year_month_day today() const;

    ValidatorConfig config_;
};

/**
 * Validate an identifier.
 * @return true if valid
 * @throws IdentifierError describing the first failing rule
 */
bool validateIdentifier(const std::string& value,
                        bool accept_d_numbers = true,
                        bool accept_h_numbers = false);

/**
 * Check an identifier without throwing.
 * @param on_reject Called with the reason when the identifier is invalid
 * @return true if valid
 */
bool checkIdentifier(const std::string& value,
                     bool accept_d_numbers = true,
                     bool accept_h_numbers = false,
                     const RejectCallback& on_reject = nullptr);

} // namespace fnr

#endif // FNR_VALIDATOR_H
