#include "fnr/generator.h"
#include "fnr/control_digits.h"
#include "fnr/types.h"
#include <spdlog/spdlog.h>
#include <iterator>
#include <stdexcept>

namespace fnr {

namespace {

// Inclusive range of individual numbers
struct IndividualBand {
    int first;
    int last;
};

void appendTwoDigits(std::string& out, unsigned value) {
    out.push_back(static_cast<char>('0' + value / 10));
    out.push_back(static_cast<char>('0' + value % 10));
}

// DDMMYY
std::string formatDate(const std::chrono::year_month_day& day) {
    std::string text;
    text.reserve(6);
    appendTwoDigits(text, static_cast<unsigned>(day.day()));
    appendTwoDigits(text, static_cast<unsigned>(day.month()));
    appendTwoDigits(text, static_cast<unsigned>(static_cast<int>(day.year()) % 100));
    return text;
}

void generateBand(const std::string& date_string,
                  const std::string& d_date_string,
                  bool include_d_numbers,
                  IndividualBand band,
                  std::vector<std::string>& out) {
    std::string prefix;
    std::string identifier;

    for (int individual = band.first; individual <= band.last; individual++) {
        char digits[3] = {
            static_cast<char>('0' + individual / 100),
            static_cast<char>('0' + individual / 10 % 10),
            static_cast<char>('0' + individual % 10)};

        prefix.assign(date_string).append(digits, 3);
        if (checksum::completeIdentifier(prefix, identifier)) {
            out.push_back(identifier);
        }

        if (include_d_numbers) {
            prefix.assign(d_date_string).append(digits, 3);
            if (checksum::completeIdentifier(prefix, identifier)) {
                out.push_back(identifier);
            }
        }
    }
}

void requireYear(int year) {
    if (year < MIN_GENERATION_YEAR || year > MAX_GENERATION_YEAR) {
        throw std::invalid_argument("generator: year " + std::to_string(year) +
                                    " outside 1900-2099");
    }
}

} // namespace

std::vector<std::string> generateForDay(const std::chrono::year_month_day& day,
                                        bool include_d_numbers) {
    if (!day.ok()) {
        throw std::invalid_argument("generator: not a calendar date");
    }

    int year = static_cast<int>(day.year());
    requireYear(year);

    std::string date_string = formatDate(day);

    // Adding 4 to the tens digit of the day adds the D-number offset of 40
    std::string d_date_string = date_string;
    d_date_string[0] = static_cast<char>(d_date_string[0] + D_NUMBER_OFFSET / 10);

    std::vector<std::string> identifiers;

    if (year <= 1999) {
        identifiers.reserve(include_d_numbers ? 1100 : 550);
        generateBand(date_string, d_date_string, include_d_numbers, {0, 499}, identifiers);

        // Individual numbers 900-999 were reused for births 1940-1999
        if (year >= 1940) {
            generateBand(date_string, d_date_string, include_d_numbers, {900, 999}, identifiers);
        }
    } else {
        // From 2040 the 900-999 band decodes back to the 1900s
        IndividualBand band{500, year >= 2040 ? 899 : 999};
        identifiers.reserve(include_d_numbers ? 1000 : 500);
        generateBand(date_string, d_date_string, include_d_numbers, band, identifiers);
    }

    return identifiers;
}

std::vector<std::string> generateForYear(int year, bool include_d_numbers) {
    requireYear(year);

    std::chrono::sys_days first{std::chrono::year{year} / std::chrono::January / 1};
    std::chrono::sys_days last{std::chrono::year{year} / std::chrono::December / 31};

    std::vector<std::string> identifiers;
    for (std::chrono::sys_days day = first; day <= last; day += std::chrono::days{1}) {
        std::vector<std::string> daily = generateForDay(std::chrono::year_month_day{day},
                                                        include_d_numbers);
        identifiers.insert(identifiers.end(),
                           std::make_move_iterator(daily.begin()),
                           std::make_move_iterator(daily.end()));
    }

    spdlog::debug("Generated {} identifiers for {} (D-numbers: {})",
                  identifiers.size(), year, include_d_numbers);
    return identifiers;
}

} // namespace fnr
