//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "support/trace.h"
#include <errno.h>
#include <stdarg.h>
#include <string.h>
#include <time.h>
#include <pthread.h>
#include <sys/time.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
trc_log_level_t g_trc_log_level = TRC_LOG_LEVEL_NONE;
FILE* g_trc_log_file = nullptr;
static pthread_mutex_t g_trc_mutex = PTHREAD_MUTEX_INITIALIZER;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void trc_log_level_set(trc_log_level_t a_level)
{
        g_trc_log_level = a_level;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* trc_log_level_str(trc_log_level_t a_level)
{
        switch (a_level)
        {
        case TRC_LOG_LEVEL_ERROR:   { return "ERROR"; }
        case TRC_LOG_LEVEL_WARN:    { return "WARN"; }
        case TRC_LOG_LEVEL_DEBUG:   { return "DEBUG"; }
        case TRC_LOG_LEVEL_VERBOSE: { return "VERBOSE"; }
        case TRC_LOG_LEVEL_ALL:     { return "ALL"; }
        default:                    { break; }
        }
        return "NONE";
}
//! ----------------------------------------------------------------------------
//! \details: open trace output file -"/dev/stdout" and "/dev/stderr" map to
//!           the std streams and are never closed.
//! \return:  PKARR_STATUS_OK on success
//! \param:   a_file path to log file
//! ----------------------------------------------------------------------------
int32_t trc_log_file_open(const std::string& a_file)
{
        trc_log_file_close();
        if (a_file == "/dev/stdout")
        {
                g_trc_log_file = stdout;
                return PKARR_STATUS_OK;
        }
        if (a_file == "/dev/stderr")
        {
                g_trc_log_file = stderr;
                return PKARR_STATUS_OK;
        }
        errno = 0;
        FILE* l_file = fopen(a_file.c_str(), "a");
        if (!l_file)
        {
                fprintf(stderr, "error opening trace log file: %s.  Reason: %s\n",
                        a_file.c_str(),
                        strerror(errno));
                return PKARR_STATUS_ERROR;
        }
        g_trc_log_file = l_file;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t trc_log_file_close(void)
{
        pthread_mutex_lock(&g_trc_mutex);
        if (g_trc_log_file &&
            (g_trc_log_file != stdout) &&
            (g_trc_log_file != stderr))
        {
                fclose(g_trc_log_file);
        }
        g_trc_log_file = nullptr;
        pthread_mutex_unlock(&g_trc_mutex);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: write one prefixed trace line
//! \return:  NA
//! \param:   TODO
//! ----------------------------------------------------------------------------
void trc_log(trc_log_level_t a_level,
             const char* a_file,
             int a_line,
             const char* a_func,
             const char* a_fmt, ...)
{
        // -------------------------------------------------
        // date prefix
        // -------------------------------------------------
        char l_date[64];
        struct timeval l_tv;
        struct tm l_tm;
        gettimeofday(&l_tv, nullptr);
        time_t l_sec = l_tv.tv_sec;
        localtime_r(&l_sec, &l_tm);
        strftime(l_date, sizeof(l_date), CONFIG_DATE_FORMAT, &l_tm);
        // -------------------------------------------------
        // strip path from file
        // -------------------------------------------------
        const char* l_file = strrchr(a_file, '/');
        l_file = l_file ? l_file + 1 : a_file;
        pthread_mutex_lock(&g_trc_mutex);
        if (!g_trc_log_file)
        {
                pthread_mutex_unlock(&g_trc_mutex);
                return;
        }
        fprintf(g_trc_log_file, "%s.%06ld [%7s] %s:%d %s: ",
                l_date,
                (long)l_tv.tv_usec,
                trc_log_level_str(a_level),
                l_file,
                a_line,
                a_func);
        va_list l_args;
        va_start(l_args, a_fmt);
        vfprintf(g_trc_log_file, a_fmt, l_args);
        va_end(l_args);
        fputc('\n', g_trc_log_file);
        fflush(g_trc_log_file);
        pthread_mutex_unlock(&g_trc_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void trc_output(const char* a_fmt, ...)
{
        pthread_mutex_lock(&g_trc_mutex);
        if (!g_trc_log_file)
        {
                pthread_mutex_unlock(&g_trc_mutex);
                return;
        }
        va_list l_args;
        va_start(l_args, a_fmt);
        vfprintf(g_trc_log_file, a_fmt, l_args);
        va_end(l_args);
        fflush(g_trc_log_file);
        pthread_mutex_unlock(&g_trc_mutex);
}
}
