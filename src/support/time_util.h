#ifndef _PKARR_TIME_UTIL_H
#define _PKARR_TIME_UTIL_H
//! ----------------------------------------------------------------------------
//! Includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! Prototypes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// wall clock
// ---------------------------------------------------------
uint64_t get_time_us(void);
// ---------------------------------------------------------
// monotonic clock -for elapsed/expiry arithmetic only
// ---------------------------------------------------------
uint64_t get_mono_time_ms(void);
uint64_t get_mono_time_us(void);
uint64_t get_delta_time_ms(uint64_t a_start_time_ms);
} //namespace ns_pkarr {
#endif
