#include "fnr/fnr_c.h"
#include "fnr/fnr.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

/* ============================================================================
 * Helper functions
 * ============================================================================ */

static fnr::ValidatorConfig convert_options_from_c(const fnr_options_t* options) {
    fnr::ValidatorConfig config;
    if (options) {
        config.accept_d_numbers = options->accept_d_numbers != 0;
        config.accept_h_numbers = options->accept_h_numbers != 0;
    }
    return config;
}

static void convert_result_to_c(const fnr::ValidationResult& src, fnr_result_t* dest) {
    std::memset(dest, 0, sizeof(fnr_result_t));

    dest->valid = src.valid ? 1 : 0;
    dest->reason = static_cast<fnr_reason_t>(src.reason);
    if (!src.error.empty()) {
        std::strncpy(dest->error, src.error.c_str(), sizeof(dest->error) - 1);
    }

    dest->is_d_number = src.identifier.is_d_number ? 1 : 0;
    dest->is_h_number = src.identifier.is_h_number ? 1 : 0;
    dest->individual_number = src.identifier.individual_number;

    if (src.valid) {
        const auto& date = src.identifier.birth_date;
        dest->birth_year = static_cast<int>(date.year());
        dest->birth_month = static_cast<int>(static_cast<unsigned>(date.month()));
        dest->birth_day = static_cast<int>(static_cast<unsigned>(date.day()));
    }
}

static size_t copy_identifiers(const std::vector<std::string>& src,
                               fnr_identifier_t* out,
                               size_t max_count,
                               size_t* total) {
    if (total) {
        *total = src.size();
    }
    if (!out) {
        return 0;
    }

    size_t count = std::min(src.size(), max_count);
    for (size_t i = 0; i < count; i++) {
        std::memcpy(out[i], src[i].c_str(), FNR_IDENTIFIER_LENGTH);
        out[i][FNR_IDENTIFIER_LENGTH] = '\0';
    }
    return count;
}

/* ============================================================================
 * Library functions implementation
 * ============================================================================ */

extern "C" {

const char* fnr_version(void) {
    return fnr::VERSION;
}

fnr_options_t fnr_default_options(void) {
    fnr_options_t options;
    options.accept_d_numbers = 1;
    options.accept_h_numbers = 0;
    return options;
}

int fnr_validate(const char* value,
                 const fnr_options_t* options,
                 fnr_result_t* result) {
    if (!value || !result) {
        return -1;
    }

    std::memset(result, 0, sizeof(fnr_result_t));

    try {
        fnr::IdentifierValidator validator(convert_options_from_c(options));
        convert_result_to_c(validator.inspect(value), result);
        return result->valid ? 0 : static_cast<int>(result->reason);
    } catch (const std::exception& e) {
        spdlog::error("fnr_validate failed: {}", e.what());
        std::strncpy(result->error, "Internal error", sizeof(result->error) - 1);
        return -1;
    }
}

int fnr_check(const char* value,
              const fnr_options_t* options,
              fnr_reject_callback_t callback,
              void* user_data) {
    if (!value) {
        return 0;
    }

    fnr::RejectCallback on_reject;
    if (callback) {
        on_reject = [callback, user_data](const std::string& reason) {
            callback(reason.c_str(), user_data);
        };
    }

    try {
        fnr::IdentifierValidator validator(convert_options_from_c(options));
        return validator.check(value, on_reject) ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("fnr_check failed: {}", e.what());
        return 0;
    }
}

int fnr_complete(const char* prefix, fnr_identifier_t out) {
    if (!prefix || !out) {
        return -1;
    }

    try {
        std::string identifier;
        if (!fnr::checksum::completeIdentifier(prefix, identifier)) {
            return 1;
        }
        std::memcpy(out, identifier.c_str(), FNR_IDENTIFIER_LENGTH);
        out[FNR_IDENTIFIER_LENGTH] = '\0';
        return 0;
    } catch (const std::exception& e) {
        spdlog::debug("fnr_complete rejected prefix: {}", e.what());
        return -1;
    }
}

size_t fnr_generate_for_day(int year, int month, int day,
                            int include_d_numbers,
                            fnr_identifier_t* out,
                            size_t max_count,
                            size_t* total) {
    if (total) {
        *total = 0;
    }
    if (year < fnr::MIN_GENERATION_YEAR || year > fnr::MAX_GENERATION_YEAR ||
        month < 1 || month > 12 || day < 1 || day > 31) {
        return 0;
    }

    try {
        std::chrono::year_month_day date{
            std::chrono::year{year},
            std::chrono::month{static_cast<unsigned>(month)},
            std::chrono::day{static_cast<unsigned>(day)}};
        return copy_identifiers(fnr::generateForDay(date, include_d_numbers != 0),
                                out, max_count, total);
    } catch (const std::exception& e) {
        spdlog::debug("fnr_generate_for_day rejected arguments: {}", e.what());
        return 0;
    }
}

size_t fnr_generate_for_year(int year,
                             int include_d_numbers,
                             fnr_identifier_t* out,
                             size_t max_count,
                             size_t* total) {
    if (total) {
        *total = 0;
    }

    try {
        return copy_identifiers(fnr::generateForYear(year, include_d_numbers != 0),
                                out, max_count, total);
    } catch (const std::exception& e) {
        spdlog::debug("fnr_generate_for_year rejected arguments: {}", e.what());
        return 0;
    }
}

} /* extern "C" */
