//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <strings.h>
#include <inttypes.h>
#include <string>
// ---------------------------------------------------------
// external pkarr includes
// ---------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/pkarr.h"
// ---------------------------------------------------------
// internal pkarr includes
// ---------------------------------------------------------
#include "core/client.h"
#include "core/keypair.h"
#include "core/public_key.h"
#include "core/signed_packet.h"
#include "support/trace.h"
#include "support/ndebug.h"
#include "support/util.h"
#include "support/time_util.h"
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef STATUS_OK
#define STATUS_OK 0
#endif
#ifndef STATUS_ERROR
#define STATUS_ERROR -1
#endif
#define _CLI_DEFAULT_MAX_ATTEMPTS 200
#define _CLI_DEFAULT_TIMEOUT_S 60
//! ----------------------------------------------------------------------------
//! \details: show packet -as json or in plain form w/ optional name filter
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _show(const ns_pkarr::signed_packet& a_pkt,
                     bool a_json,
                     const std::string& a_name)
{
        if (a_json)
        {
                std::string l_json;
                int32_t l_s;
                l_s = a_pkt.to_json(l_json);
                if (l_s != PKARR_STATUS_OK)
                {
                        NDBG_ERROR_AT("error performing signed_packet::to_json\n");
                        return STATUS_ERROR;
                }
                NDBG_OUTPUT("%s\n", l_json.c_str());
                return STATUS_OK;
        }
        if (a_name.empty())
        {
                a_pkt.display();
                return STATUS_OK;
        }
        ns_pkarr::rr_vector_t l_rrs;
        a_pkt.fresh_resource_records(l_rrs, a_name);
        NDBG_OUTPUT("    records (%s%s%s):\n",
                    ANSI_COLOR_FG_YELLOW, a_name.c_str(), ANSI_COLOR_OFF);
        for (auto && i_rr : l_rrs)
        {
                NDBG_OUTPUT("        %s\n", i_rr.to_str().c_str());
        }
        return STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: single timed lookup
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _resolve(ns_pkarr::client& a_client,
                        const ns_pkarr::public_key& a_key,
                        uint32_t a_max_attempts,
                        uint32_t a_timeout_s,
                        bool a_json,
                        const std::string& a_name)
{
        uint64_t l_start_ms = ns_pkarr::get_mono_time_ms();
        ns_pkarr::signed_packet l_pkt;
        ns_pkarr::lookup_stats_t l_stats;
        int32_t l_s;
        l_s = a_client.lookup(a_key, a_max_attempts, a_timeout_s, l_pkt, &l_stats);
        uint64_t l_elapsed_ms = ns_pkarr::get_delta_time_ms(l_start_ms);
        if (l_s == PKARR_STATUS_NOT_FOUND)
        {
                NDBG_OUTPUT("\n%sFailed to resolve%s %s (%s after %u attempts)\n",
                            ANSI_COLOR_FG_RED, ANSI_COLOR_OFF,
                            a_key.to_z32().c_str(),
                            ns_pkarr::lookup_term_str(l_stats.m_term),
                            l_stats.m_attempts);
                return STATUS_OK;
        }
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_OUTPUT("Got error: %s\n", ns_pkarr::status_str(l_s));
                return STATUS_ERROR;
        }
        NDBG_OUTPUT("\n%sResolved%s in %" PRIu64 " milliseconds ",
                    ANSI_COLOR_FG_GREEN, ANSI_COLOR_OFF,
                    l_elapsed_ms);
        return _show(l_pkt, a_json, a_name);
}
//! ----------------------------------------------------------------------------
//! \details: verify signed packet file and display
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _verify_file(const std::string& a_file,
                            bool a_json,
                            const std::string& a_name)
{
        char* l_buf = NULL;
        size_t l_len = 0;
        int32_t l_s;
        l_s = ns_pkarr::read_file(a_file.c_str(), &l_buf, &l_len);
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_ERROR_AT("error reading file: %s\n", a_file.c_str());
                return STATUS_ERROR;
        }
        ns_pkarr::signed_packet l_pkt;
        l_s = l_pkt.from_bytes((const uint8_t*)l_buf, l_len);
        free(l_buf);
        l_buf = NULL;
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_ERROR_AT("invalid signed packet in %s: %s\n",
                              a_file.c_str(),
                              ns_pkarr::status_str(l_s));
                return STATUS_ERROR;
        }
        return _show(l_pkt, a_json, a_name);
}
//! ----------------------------------------------------------------------------
//! \details: Print the version.
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void print_version(FILE* a_stream, int a_exit_code)
{
        // print out the version information
        fprintf(a_stream, "pkarr resolver.\n");
        fprintf(a_stream, "    Version: %s\n", PKARR_VERSION);
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details: Print the command line help.
//! \return:  NA
//! \param:   a_stream FILE *
//! \param:   a_exit_code exit code
//! ----------------------------------------------------------------------------
static void print_usage(FILE* a_stream, int a_exit_code)
{
        fprintf(a_stream, "Usage: pkarr [options] <public-key (z-base-32)>\n");
        fprintf(a_stream, "Options:\n");
        fprintf(a_stream, "  -h, --help           display this help and exit.\n");
        fprintf(a_stream, "  -v, --version        display the version number and exit.\n");
        fprintf(a_stream, "  -b, --bootstrap      bootstrap node host:port (repeatable or comma separated)\n");
        fprintf(a_stream, "  -a, --attempts       max nodes queried per lookup (default: %d)\n", _CLI_DEFAULT_MAX_ATTEMPTS);
        fprintf(a_stream, "  -t, --timeout        lookup timeout in seconds (default: %d)\n", _CLI_DEFAULT_TIMEOUT_S);
        fprintf(a_stream, "  -m, --min-ttl        minimum cache ttl in seconds (default: %d)\n", PKARR_DEFAULT_MIN_TTL_S);
        fprintf(a_stream, "  -x, --max-ttl        maximum cache ttl in seconds (default: %d)\n", PKARR_DEFAULT_MAX_TTL_S);
        fprintf(a_stream, "  -j, --json           display signed packet as json\n");
        fprintf(a_stream, "  -n, --name           only show fresh records for name\n");
        fprintf(a_stream, "  -f, --file           verify + display signed packet file and exit\n");
        fprintf(a_stream, "  \n");
        fprintf(a_stream, "Debug Options:\n");
        fprintf(a_stream, "  -T, --trace          tracing (none/error/warn/debug/verbose/all) (default: none)\n");
        fprintf(a_stream, "  -E, --error-log      log errors to file <file>\n");
        fprintf(a_stream, "  \n");
        exit(a_exit_code);
}
//! ----------------------------------------------------------------------------
//! \details: parse unsigned option value
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _parse_uint(uint32_t& ao_val, const std::string& a_str)
{
        if (a_str.empty())
        {
                return STATUS_ERROR;
        }
        char* l_end = NULL;
        errno = 0;
        unsigned long l_val = strtoul(a_str.c_str(), &l_end, 10);
        if ((errno != 0) ||
            (*l_end != '\0') ||
            (a_str[0] == '-') ||
            (l_val > UINT32_MAX))
        {
                return STATUS_ERROR;
        }
        ao_val = (uint32_t)l_val;
        return STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details main
//! \return  0 on success
//!          -1 on error
//! \param   argc/argv...
//! ----------------------------------------------------------------------------
int main(int argc, char** argv)
{
        // -------------------------------------------------
        // vars
        // -------------------------------------------------
        bool l_trace = false;
        bool l_json = false;
        ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_NONE);
        uint32_t l_max_attempts = _CLI_DEFAULT_MAX_ATTEMPTS;
        uint32_t l_timeout_s = _CLI_DEFAULT_TIMEOUT_S;
        uint32_t l_min_ttl = PKARR_DEFAULT_MIN_TTL_S;
        uint32_t l_max_ttl = PKARR_DEFAULT_MAX_TTL_S;
        ns_pkarr::str_vector_t l_bootstrap;
        std::string l_key_str;
        std::string l_file;
        std::string l_name;
        std::string l_error_log;
        // -------------------------------------------------
        // Get args...
        // -------------------------------------------------
        char l_opt = '\0';
        std::string l_arg;
        int l_opt_index = 0;
        static struct option l_long_opt[] = {
                { "help",        no_argument,       0, 'h' },
                { "version",     no_argument,       0, 'v' },
                { "bootstrap",   required_argument, 0, 'b' },
                { "attempts",    required_argument, 0, 'a' },
                { "timeout",     required_argument, 0, 't' },
                { "min-ttl",     required_argument, 0, 'm' },
                { "max-ttl",     required_argument, 0, 'x' },
                { "json",        no_argument,       0, 'j' },
                { "name",        required_argument, 0, 'n' },
                { "file",        required_argument, 0, 'f' },
                { "trace",       required_argument, 0, 'T' },
                { "error-log",   required_argument, 0, 'E' },
                // Sentinel
                { 0,             0,                 0,  0  }
        };
        // -------------------------------------------------
        // args...
        // -------------------------------------------------
        std::string l_short_arg_list;
        l_short_arg_list += "hvb:a:t:m:x:jn:f:";
        l_short_arg_list += "T:E:";
        while(((unsigned char)l_opt != 255))
        {
                l_opt = getopt_long_only(argc, argv, l_short_arg_list.c_str(), l_long_opt, &l_opt_index);
                if (optarg)
                {
                        l_arg = std::string(optarg);
                }
                else
                {
                        l_arg.clear();
                }
                switch (l_opt)
                {
                // -----------------------------------------
                // *****************************************
                // options
                // *****************************************
                // -----------------------------------------
                // -----------------------------------------
                // Help
                // -----------------------------------------
                case 'h':
                {
                        print_usage(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // version
                // -----------------------------------------
                case 'v':
                {
                        print_version(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // bootstrap
                // -----------------------------------------
                case 'b':
                {
                        ns_pkarr::str_vector_t l_nodes;
                        ns_pkarr::split_str(l_nodes, l_arg, ',');
                        for (auto && i_n : l_nodes)
                        {
                                if (!i_n.empty())
                                {
                                        l_bootstrap.push_back(i_n);
                                }
                        }
                        break;
                }
                // -----------------------------------------
                // attempts
                // -----------------------------------------
                case 'a':
                {
                        if (_parse_uint(l_max_attempts, l_arg) != STATUS_OK)
                        {
                                NDBG_OUTPUT("Error bad attempts value: %s.\n", l_arg.c_str());
                                print_usage(stdout, STATUS_ERROR);
                        }
                        break;
                }
                // -----------------------------------------
                // timeout
                // -----------------------------------------
                case 't':
                {
                        if (_parse_uint(l_timeout_s, l_arg) != STATUS_OK)
                        {
                                NDBG_OUTPUT("Error bad timeout value: %s.\n", l_arg.c_str());
                                print_usage(stdout, STATUS_ERROR);
                        }
                        break;
                }
                // -----------------------------------------
                // min ttl
                // -----------------------------------------
                case 'm':
                {
                        if (_parse_uint(l_min_ttl, l_arg) != STATUS_OK)
                        {
                                NDBG_OUTPUT("Error bad min-ttl value: %s.\n", l_arg.c_str());
                                print_usage(stdout, STATUS_ERROR);
                        }
                        break;
                }
                // -----------------------------------------
                // max ttl
                // -----------------------------------------
                case 'x':
                {
                        if (_parse_uint(l_max_ttl, l_arg) != STATUS_OK)
                        {
                                NDBG_OUTPUT("Error bad max-ttl value: %s.\n", l_arg.c_str());
                                print_usage(stdout, STATUS_ERROR);
                        }
                        break;
                }
                // -----------------------------------------
                // json
                // -----------------------------------------
                case 'j':
                {
                        l_json = true;
                        break;
                }
                // -----------------------------------------
                // name
                // -----------------------------------------
                case 'n':
                {
                        l_name = l_arg;
                        break;
                }
                // -----------------------------------------
                // file
                // -----------------------------------------
                case 'f':
                {
                        l_file = l_arg;
                        break;
                }
                // -----------------------------------------
                // trace
                // -----------------------------------------
#define ELIF_TRACE_STR(_level) else if (strncasecmp(_level, l_arg.c_str(), sizeof(_level)) == 0)
                case 'T':
                {
                        if (0) {}
                        ELIF_TRACE_STR("error") { ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_ERROR); l_trace = true; }
                        ELIF_TRACE_STR("warn") { ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_WARN); l_trace = true; }
                        ELIF_TRACE_STR("debug") { ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_DEBUG); l_trace = true; }
                        ELIF_TRACE_STR("verbose") { ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_VERBOSE); l_trace = true; }
                        ELIF_TRACE_STR("all") { ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_ALL); l_trace = true; }
                        else
                        {
                                ns_pkarr::trc_log_level_set(ns_pkarr::TRC_LOG_LEVEL_NONE);
                        }
                        break;
                }
                // -----------------------------------------
                // error-log
                // -----------------------------------------
                case 'E':
                {
                        l_error_log = l_arg;
                        break;
                }
                // -----------------------------------------
                // ?
                // -----------------------------------------
                case '?':
                {
                        // ---------------------------------
                        // Required argument was missing
                        // '?' is provided when the 3rd arg
                        // to getopt_long does not begin with
                        //':', and preceeded by an automatic
                        // error message.
                        // ---------------------------------
                        NDBG_ERROR_AT("unrecognized argument.  Exiting.\n");
                        return STATUS_ERROR;
                }
                // -----------------------------------------
                // default
                // -----------------------------------------
                default:
                {
                        // ---------------------------------
                        // get the public key...
                        // ---------------------------------
                        if (argv[optind])
                        {
                                l_key_str = argv[optind];
                        }
                        break;
                }
                }
        }
        // -------------------------------------------------
        // error logging
        // -------------------------------------------------
        if (!l_error_log.empty())
        {
                ns_pkarr::trc_log_file_open(l_error_log);
        }
        else if (l_trace)
        {
                ns_pkarr::trc_log_file_open("/dev/stdout");
        }
        // -------------------------------------------------
        // verify file
        // -------------------------------------------------
        if (!l_file.empty())
        {
                int32_t l_ret = _verify_file(l_file, l_json, l_name);
                ns_pkarr::trc_log_file_close();
                return l_ret;
        }
        // -------------------------------------------------
        // check for key
        // -------------------------------------------------
        if (l_key_str.empty())
        {
                NDBG_ERROR_AT("Error public key must be specified.\n");
                print_usage(stdout, STATUS_ERROR);
        }
        ns_pkarr::public_key l_key;
        int32_t l_s;
        l_s = l_key.init(l_key_str);
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_ERROR_AT("Invalid public key: %s\n", l_key_str.c_str());
                return STATUS_ERROR;
        }
        if (l_min_ttl > l_max_ttl)
        {
                NDBG_ERROR_AT("Error min-ttl (%u) > max-ttl (%u)\n", l_min_ttl, l_max_ttl);
                return STATUS_ERROR;
        }
        if (l_bootstrap.empty())
        {
                const char* l_defaults[] = PKARR_DEFAULT_BOOTSTRAP_NODES;
                for (size_t i_n = 0; i_n < sizeof(l_defaults)/sizeof(l_defaults[0]); ++i_n)
                {
                        l_bootstrap.push_back(l_defaults[i_n]);
                }
        }
        // -------------------------------------------------
        // client w/ ephemeral identity
        // -------------------------------------------------
        int32_t l_ret = STATUS_OK;
        ns_pkarr::keypair l_keypair;
        ns_pkarr::client l_client;
        l_s = l_keypair.init_random();
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_ERROR_AT("error performing keypair::init_random\n");
                l_ret = STATUS_ERROR;
                goto cleanup;
        }
        l_s = l_client.init(l_keypair, l_bootstrap);
        if (l_s != PKARR_STATUS_OK)
        {
                NDBG_ERROR_AT("error performing client::init: %s\n", ns_pkarr::get_err_msg());
                l_ret = STATUS_ERROR;
                goto cleanup;
        }
        l_client.set_min_ttl(l_min_ttl);
        l_client.set_max_ttl(l_max_ttl);
        // -------------------------------------------------
        // cold lookup
        // -------------------------------------------------
        NDBG_OUTPUT("Resolving Pkarr: %s\n", l_key.to_z32().c_str());
        NDBG_OUTPUT("\n=== COLD LOOKUP ===\n");
        l_ret = _resolve(l_client, l_key, l_max_attempts, l_timeout_s, l_json, l_name);
        if (l_ret != STATUS_OK)
        {
                goto cleanup;
        }
        sleep(1);
        // -------------------------------------------------
        // subsequent lookup
        // -------------------------------------------------
        NDBG_OUTPUT("\n=== SUBSEQUENT LOOKUP ===\n");
        l_ret = _resolve(l_client, l_key, l_max_attempts, l_timeout_s, l_json, l_name);
        // -------------------------------------------------
        // cleanup...
        // -------------------------------------------------
cleanup:
        ns_pkarr::trc_log_file_close();
        return l_ret;
}
