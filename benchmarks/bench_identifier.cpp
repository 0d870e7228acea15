// =============================================================================
// FNR Performance Benchmarks
// =============================================================================
// This file contains performance benchmarks for validation, control digit
// computation and generation using Google Benchmark framework.
//
// Run with: ./fnr_benchmarks --benchmark_format=console
// =============================================================================

#include <benchmark/benchmark.h>
#include "fnr/fnr.h"
#include <chrono>
#include <string>
#include <vector>

using namespace fnr;
using namespace std::chrono;

// =============================================================================
// Control digits
// =============================================================================

static void BM_ComputeControlDigits(benchmark::State& state) {
    const std::string prefix = "010199123";

    for (auto _ : state) {
        auto digits = checksum::computeControlDigits(prefix);
        benchmark::DoNotOptimize(digits);
    }
}
BENCHMARK(BM_ComputeControlDigits);

// =============================================================================
// Validation
// =============================================================================

static void BM_Inspect_Valid(benchmark::State& state) {
    IdentifierValidator validator;
    const std::string value = "01019912368";

    for (auto _ : state) {
        auto result = validator.inspect(value);
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Inspect_Valid);

static void BM_Check_ChecksumMismatch(benchmark::State& state) {
    IdentifierValidator validator;
    const std::string value = "01019912369";

    for (auto _ : state) {
        bool valid = validator.check(value);
        benchmark::DoNotOptimize(valid);
    }
}
BENCHMARK(BM_Check_ChecksumMismatch);

static void BM_Check_Malformed(benchmark::State& state) {
    IdentifierValidator validator;
    const std::string value = "0101991236";

    for (auto _ : state) {
        bool valid = validator.check(value);
        benchmark::DoNotOptimize(valid);
    }
}
BENCHMARK(BM_Check_Malformed);

static void BM_Validate_Throwing(benchmark::State& state) {
    IdentifierValidator validator;
    const std::string value = "01019912369";

    for (auto _ : state) {
        try {
            validator.validate(value);
        } catch (const IdentifierError& e) {
            benchmark::DoNotOptimize(e.reason());
        }
    }
}
BENCHMARK(BM_Validate_Throwing);

// =============================================================================
// Generation
// =============================================================================

static void BM_GenerateForDay(benchmark::State& state) {
    const bool include_d = state.range(0) != 0;
    size_t produced = 0;

    for (auto _ : state) {
        auto identifiers = generateForDay(1985y / July / 17, include_d);
        produced += identifiers.size();
        benchmark::DoNotOptimize(identifiers);
    }

    state.SetItemsProcessed(static_cast<int64_t>(produced));
}
BENCHMARK(BM_GenerateForDay)->Arg(0)->Arg(1);

static void BM_GenerateForYear(benchmark::State& state) {
    for (auto _ : state) {
        auto identifiers = generateForYear(1999, true);
        benchmark::DoNotOptimize(identifiers);
    }
}
BENCHMARK(BM_GenerateForYear)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
