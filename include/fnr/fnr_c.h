#ifndef FNR_C_H
#define FNR_C_H

/**
 * FNR C API - Pure C interface for cross-language bindings
 *
 * This header provides a C-compatible API for use with:
 * - JNI (Android/Java)
 * - Python ctypes/cffi
 * - Other FFI systems
 */

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* ============================================================================
 * Enumerations
 * ============================================================================ */

typedef enum {
    FNR_REASON_NONE = 0,
    FNR_REASON_MALFORMED = 1,
    FNR_REASON_D_NUMBER_NOT_ALLOWED = 2,
    FNR_REASON_DAY_OUT_OF_RANGE = 3,
    FNR_REASON_H_NUMBER_NOT_ALLOWED = 4,
    FNR_REASON_MONTH_OUT_OF_RANGE = 5,
    FNR_REASON_INVALID_DATE = 6,
    FNR_REASON_FUTURE_DATE = 7,
    FNR_REASON_CHECKSUM_MISMATCH = 8
} fnr_reason_t;

/* ============================================================================
 * Data structures (C-compatible, fixed-size)
 * ============================================================================ */

#define FNR_IDENTIFIER_LENGTH 11
#define FNR_IDENTIFIER_BUFFER 12    /* 11 digits + NUL */
#define FNR_MAX_ERROR_LENGTH 128

typedef char fnr_identifier_t[FNR_IDENTIFIER_BUFFER];

typedef struct {
    int accept_d_numbers;
    int accept_h_numbers;
} fnr_options_t;

typedef struct {
    int valid;
    fnr_reason_t reason;
    char error[FNR_MAX_ERROR_LENGTH];

    /* Decoded fields (birth date only set when valid) */
    int is_d_number;
    int is_h_number;
    int individual_number;
    int birth_year;
    int birth_month;
    int birth_day;
} fnr_result_t;

/* ============================================================================
 * Callback types
 * ============================================================================ */

typedef void (*fnr_reject_callback_t)(const char* reason, void* user_data);

/* ============================================================================
 * Library functions
 * ============================================================================ */

/**
 * Get library version string
 */
const char* fnr_version(void);

/**
 * Get default options (D-numbers accepted, H-numbers rejected)
 */
fnr_options_t fnr_default_options(void);

/**
 * Validate an identifier
 * @param value NUL-terminated identifier
 * @param options Options, or NULL for defaults
 * @param result Output result structure
 * @return 0 if valid, the fnr_reason_t code if rejected, -1 on bad arguments
 */
int fnr_validate(const char* value,
                 const fnr_options_t* options,
                 fnr_result_t* result);

/**
 * Check an identifier
 * @param value NUL-terminated identifier
 * @param options Options, or NULL for defaults
 * @param callback Called with the reason when rejected (may be NULL)
 * @param user_data User data passed to callback
 * @return 1 if valid, 0 otherwise
 */
int fnr_check(const char* value,
              const fnr_options_t* options,
              fnr_reject_callback_t callback,
              void* user_data);

/**
 * Append control digits to a 9-digit prefix
 * @param prefix NUL-terminated DDMMYY + individual number
 * @param out Output identifier
 * @return 0 on success, 1 if no valid control digits exist, -1 on bad arguments
 */
int fnr_complete(const char* prefix, fnr_identifier_t out);

/**
 * Generate all identifiers for a birth date
 * @param out Output array (caller allocated, may be NULL if max_count is 0)
 * @param max_count Capacity of out
 * @param total Receives the number of identifiers produced (may be NULL)
 * @return Number of identifiers copied to out, 0 on bad arguments
 */
size_t fnr_generate_for_day(int year, int month, int day,
                            int include_d_numbers,
                            fnr_identifier_t* out,
                            size_t max_count,
                            size_t* total);

/**
 * Generate all identifiers for every day of a year
 * @param out Output array (caller allocated, may be NULL if max_count is 0)
 * @param max_count Capacity of out
 * @param total Receives the number of identifiers produced (may be NULL)
 * @return Number of identifiers copied to out, 0 on bad arguments
 */
size_t fnr_generate_for_year(int year,
                             int include_d_numbers,
                             fnr_identifier_t* out,
                             size_t max_count,
                             size_t* total);

#ifdef __cplusplus
}
#endif

#endif /* FNR_C_H */
