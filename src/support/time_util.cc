//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "support/time_util.h"
#include <time.h>
#include <sys/time.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: microseconds since unix epoch
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t get_time_us(void)
{
        struct timespec l_ts;
        clock_gettime(CLOCK_REALTIME, &l_ts);
        return (((uint64_t)l_ts.tv_sec) * 1000000) + (((uint64_t)l_ts.tv_nsec) / 1000);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t get_mono_time_ms(void)
{
        struct timespec l_ts;
        clock_gettime(CLOCK_MONOTONIC, &l_ts);
        return (((uint64_t)l_ts.tv_sec) * 1000) + (((uint64_t)l_ts.tv_nsec) / 1000000);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t get_mono_time_us(void)
{
        struct timespec l_ts;
        clock_gettime(CLOCK_MONOTONIC, &l_ts);
        return (((uint64_t)l_ts.tv_sec) * 1000000) + (((uint64_t)l_ts.tv_nsec) / 1000);
}
//! ----------------------------------------------------------------------------
//! \details: elapsed ms on the monotonic clock
//! \return:  TODO
//! \param:   a_start_time_ms start from get_mono_time_ms
//! ----------------------------------------------------------------------------
uint64_t get_delta_time_ms(uint64_t a_start_time_ms)
{
        uint64_t l_now = get_mono_time_ms();
        if (l_now < a_start_time_ms)
        {
                return 0;
        }
        return l_now - a_start_time_ms;
}
}
