#ifndef CPAMM_CAPI_H
#define CPAMM_CAPI_H

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/*
 * C API over the pure pair math for scripting and cross-checking.
 * Amounts are base-10 strings. Every call returns NULL on failure and leaves
 * a message for cpamm_last_error() on the calling thread. Returned strings and
 * arrays are owned by the caller: release them with cpamm_free_string and
 * cpamm_free_string_array.
 */

/* {return_amount, spread_amount, commission_amount} */
char** cpamm_compute_swap(const char* offer_pool, const char* ask_pool, const char* offer_amount,
                          const char* commission_rate_nom, const char* commission_rate_denom);

/* {offer_amount, spread_amount, commission_amount} */
char** cpamm_compute_offer_amount(const char* offer_pool, const char* ask_pool, const char* ask_amount,
                                  const char* commission_rate_nom, const char* commission_rate_denom);

char* cpamm_initial_shares(const char* deposit0, const char* deposit1);
char* cpamm_additional_shares(const char* deposit0, const char* deposit1,
                              const char* pool0, const char* pool1, const char* total_share);
char* cpamm_withdrawal(const char* reserve, const char* burn_amount, const char* total_share);

/* {reserve0, reserve1, total_share} as observed under `draw` */
char** cpamm_obfuscate(const char* reserve0, const char* reserve1, const char* total_share, uint64_t draw);

/* Message of the last failure on this thread; empty when none. */
const char* cpamm_last_error(void);

void cpamm_free_string(char* p);
void cpamm_free_string_array(char** arr, int n);

#ifdef __cplusplus
}
#endif

#endif /* CPAMM_CAPI_H */
