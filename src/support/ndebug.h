#ifndef _PKARR_NDEBUG_H
#define _PKARR_NDEBUG_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stddef.h>
#include <stdint.h>
//! ----------------------------------------------------------------------------
//! ANSI color
//! ----------------------------------------------------------------------------
#define ANSI_COLOR_OFF          "\033[0m"
#define ANSI_COLOR_FG_BLACK     "\033[01;30m"
#define ANSI_COLOR_FG_RED       "\033[01;31m"
#define ANSI_COLOR_FG_GREEN     "\033[01;32m"
#define ANSI_COLOR_FG_YELLOW    "\033[01;33m"
#define ANSI_COLOR_FG_BLUE      "\033[01;34m"
#define ANSI_COLOR_FG_MAGENTA   "\033[01;35m"
#define ANSI_COLOR_FG_CYAN      "\033[01;36m"
#define ANSI_COLOR_FG_WHITE     "\033[01;37m"
#define ANSI_COLOR_BG_RED       "\033[01;41m"
#define ANSI_COLOR_BG_BLUE      "\033[01;44m"
//! ----------------------------------------------------------------------------
//! output
//! ----------------------------------------------------------------------------
#ifndef NDBG_OUTPUT
#define NDBG_OUTPUT(...) do { \
        fprintf(stdout, __VA_ARGS__); \
        fflush(stdout); \
} while(0)
#endif
#ifndef NDBG_PRINT
#define NDBG_PRINT(...) do { \
        fprintf(stdout, "%s:%s.%d: ", __FILE__, __FUNCTION__, __LINE__); \
        fprintf(stdout, __VA_ARGS__); \
        fflush(stdout); \
} while(0)
#endif
#ifndef NDBG_ERROR_AT
#define NDBG_ERROR_AT(...) do { \
        fprintf(stderr, "%s:%s.%d: %sError:%s ", __FILE__, __FUNCTION__, __LINE__, \
                ANSI_COLOR_FG_RED, ANSI_COLOR_OFF); \
        fprintf(stderr, __VA_ARGS__); \
        fflush(stderr); \
} while(0)
#endif
#ifndef NDBG_HEXDUMP
#define NDBG_HEXDUMP(_buf, _len) do { \
        ns_pkarr::mem_display((const uint8_t*)(_buf), (size_t)(_len)); \
} while(0)
#endif
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
void mem_display(const uint8_t* a_buf, size_t a_len);
}
#endif
