#include <iostream>
#include <iomanip>
#include "fnr/fnr.h"
#include "fnr/logging.h"

// Example: validating and generating Norwegian identity numbers

int main() {
    std::cout << "fnr - Norwegian identity numbers v" << fnr::VERSION << std::endl;
    std::cout << "========================================" << std::endl;

    fnr::ValidatorConfig config;
    config.accept_d_numbers = true;
    config.accept_h_numbers = true;
    fnr::IdentifierValidator validator(config);

    const char* samples[] = {
        "01019912368",   // Ordinary, born 1999-01-01
        "41019912351",   // D-number for the same day
        "01419912340",   // H-number for the same day
        "01019912369",   // Wrong control digit
        "30029912331",   // 30 February
        "0101991236",    // Too short
    };

    std::cout << "\nValidating samples..." << std::endl;

    for (const char* sample : samples) {
        auto result = validator.inspect(sample);
        std::cout << "  " << std::setw(12) << std::left << sample;

        if (result.valid) {
            const auto& date = result.identifier.birth_date;
            std::cout << "[VALID] born " << static_cast<int>(date.year()) << "-"
                      << std::setw(2) << std::setfill('0') << std::right
                      << static_cast<unsigned>(date.month()) << "-"
                      << std::setw(2) << static_cast<unsigned>(date.day())
                      << std::setfill(' ');
            if (result.identifier.is_d_number) {
                std::cout << " (D-number)";
            }
            if (result.identifier.is_h_number) {
                std::cout << " (H-number)";
            }
            std::cout << std::endl;
        } else {
            std::cout << "[" << fnr::rejectReasonName(result.reason) << "] "
                      << result.error << std::endl;
        }
    }

    // Route rejections through spdlog instead
    std::cout << "\nChecking with a log sink..." << std::endl;
    validator.check("00000000000", fnr::makeLoggerSink());

    using namespace std::chrono;
    auto identifiers = fnr::generateForDay(1999y / January / 1, true);
    std::cout << "\nIdentifiers for 1999-01-01 (incl. D-numbers): "
              << identifiers.size() << std::endl;
    for (size_t i = 0; i < identifiers.size() && i < 5; i++) {
        std::cout << "  " << identifiers[i] << std::endl;
    }

    return 0;
}
