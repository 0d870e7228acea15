// =============================================================================
// FNR Fuzz Target - libFuzzer entry point
// =============================================================================
// Build with: cmake -DFNR_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//
// Run with: ./fuzz_validator fuzz/corpus -max_len=64 -timeout=5
// =============================================================================

#include <cstdint>
#include <cstddef>
#include <cstdlib>
#include <string>

#include "fnr/fnr.h"
#include "fnr/fnr_c.h"

using namespace fnr;

// Validators for the four flag combinations (initialized once)
static IdentifierValidator* g_validators[4] = {nullptr, nullptr, nullptr, nullptr};

extern "C" int LLVMFuzzerInitialize(int* argc, char*** argv) {
    (void)argc;
    (void)argv;

    for (int i = 0; i < 4; i++) {
        ValidatorConfig config;
        config.accept_d_numbers = (i & 1) != 0;
        config.accept_h_numbers = (i & 2) != 0;
        g_validators[i] = new IdentifierValidator(config);
    }

    return 0;
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size > 64) {
        return 0;
    }

    std::string value(reinterpret_cast<const char*>(data), size);

    // Structured, boolean and throwing forms must agree
    for (IdentifierValidator* validator : g_validators) {
        auto result = validator->inspect(value);
        bool checked = validator->check(value);

        bool validated = false;
        try {
            validated = validator->validate(value);
        } catch (const IdentifierError& e) {
            if (e.reason() != result.reason) {
                std::abort();
            }
        }

        if (checked != result.valid || validated != result.valid) {
            std::abort();
        }

        // A valid identifier carries correct control digits
        if (result.valid) {
            std::string completed;
            if (!checksum::completeIdentifier(value.substr(0, PREFIX_LENGTH), completed) ||
                completed != value) {
                std::abort();
            }
        }
    }

    // C API with a NUL-terminated copy
    {
        fnr_result_t result;
        int rc = fnr_validate(value.c_str(), nullptr, &result);
        (void)rc;
    }

    return 0;
}
