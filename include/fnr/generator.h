#ifndef FNR_GENERATOR_H
#define FNR_GENERATOR_H

#include <chrono>
#include <string>
#include <vector>

namespace fnr {

// Supported birth years. A 2-digit year plus the individual-number
// band can only express 1900-2099.
constexpr int MIN_GENERATION_YEAR = 1900;
constexpr int MAX_GENERATION_YEAR = 2099;

/**
 * Generate every identifier with a valid checksum for one birth date.
 *
 * Ordered by individual number, the plain identifier before its
 * D-number variant. Births in 1940-1999 also get the 900-999 band.
 *
 * @param day Birth date
 * @param include_d_numbers Also produce D-numbers (day + 40)
 * @throws std::invalid_argument if day is not a calendar date or
 *         its year is outside MIN_GENERATION_YEAR..MAX_GENERATION_YEAR
 */
std::vector<std::string> generateForDay(const std::chrono::year_month_day& day,
                                        bool include_d_numbers);

/**
 * Generate every identifier for every day of a year (Jan 1 - Dec 31).
 * @throws std::invalid_argument if year is out of range
 */
std::vector<std::string> generateForYear(int year, bool include_d_numbers);

} // namespace fnr

#endif // FNR_GENERATOR_H
