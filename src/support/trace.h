#ifndef _PKARR_TRACE_H
#define _PKARR_TRACE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stdint.h>
#include <string>
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#define TRC_PRINT(_level, ...) do { \
        if (ns_pkarr::g_trc_log_file && \
            (ns_pkarr::g_trc_log_level >= _level)) { \
                ns_pkarr::trc_log(_level, __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
} while(0)
#define TRC_ERROR(...)   TRC_PRINT(ns_pkarr::TRC_LOG_LEVEL_ERROR, __VA_ARGS__)
#define TRC_WARN(...)    TRC_PRINT(ns_pkarr::TRC_LOG_LEVEL_WARN, __VA_ARGS__)
#define TRC_DEBUG(...)   TRC_PRINT(ns_pkarr::TRC_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define TRC_VERBOSE(...) TRC_PRINT(ns_pkarr::TRC_LOG_LEVEL_VERBOSE, __VA_ARGS__)
// ---------------------------------------------------------
// raw output (no prefix)
// ---------------------------------------------------------
#define TRC_OUTPUT(...) do { \
        if (ns_pkarr::g_trc_log_file) { \
                ns_pkarr::trc_output(__VA_ARGS__); \
        } \
} while(0)
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! trace levels
//! ----------------------------------------------------------------------------
typedef enum trc_level_enum {
        TRC_LOG_LEVEL_NONE = 0,
        TRC_LOG_LEVEL_ERROR,
        TRC_LOG_LEVEL_WARN,
        TRC_LOG_LEVEL_DEBUG,
        TRC_LOG_LEVEL_VERBOSE,
        TRC_LOG_LEVEL_ALL
} trc_log_level_t;
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
extern trc_log_level_t g_trc_log_level;
extern FILE* g_trc_log_file;
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
void trc_log_level_set(trc_log_level_t a_level);
const char* trc_log_level_str(trc_log_level_t a_level);
int32_t trc_log_file_open(const std::string& a_file);
int32_t trc_log_file_close(void);
void trc_log(trc_log_level_t a_level,
             const char* a_file,
             int a_line,
             const char* a_func,
             const char* a_fmt, ...) __attribute__((format(printf, 5, 6)));
void trc_output(const char* a_fmt, ...) __attribute__((format(printf, 1, 2)));
}
#endif
