//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string>
#include <stdio.h>
#include <stdlib.h>
#include <getopt.h>
#include <unistd.h>
#include <errno.h>
#include <string.h>
// ---------------------------------------------------------
// external pkarr includes
// ---------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/pkarr.h"
// ---------------------------------------------------------
// internal pkarr includes
// ---------------------------------------------------------
#include "core/keypair.h"
#include "core/signed_packet.h"
#include "crypto/crypto.h"
#include "dns/packet.h"
#include "dns/resource_record.h"
#include "support/ndebug.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#ifndef STATUS_OK
#define STATUS_OK 0
#endif
#ifndef STATUS_ERROR
#define STATUS_ERROR -1
#endif
//! ----------------------------------------------------------------------------
//! \details: Print the version.
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void print_version(FILE* a_stream, int a_exit_code)
{
        // print out the version information
        fprintf(a_stream, "pkarr_keygen keypair + signed packet generator.\n");
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
        fprintf(a_stream, "Usage: pkarr_keygen [options]\n");
        fprintf(a_stream, "Options:\n");
        fprintf(a_stream, "  -h, --help           display this help and exit.\n");
        fprintf(a_stream, "  -V, --version        display the version number and exit.\n");
        fprintf(a_stream, "  -s, --secret         32 byte secret key (hex) (default: random)\n");
        fprintf(a_stream, "  -p, --passphrase     derive secret key as sha256(passphrase)\n");
        fprintf(a_stream, "  -r, --record         record \"name ttl [class] type rdata\" (repeatable)\n");
        fprintf(a_stream, "                       names are relative to the public key (\"@\" for apex)\n");
        fprintf(a_stream, "  -o, --output         write signed packet bytes to file\n");
        fprintf(a_stream, "  -j, --json           display signed packet as json\n");
        fprintf(a_stream, "  -x, --hexdump        hexdump signed packet bytes\n");
        fprintf(a_stream, "  \n");
        exit(a_exit_code);
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
        int32_t l_s;
        bool l_json = false;
        bool l_hexdump = false;
        std::string l_secret_hex;
        std::string l_passphrase;
        std::string l_out_file;
        ns_pkarr::str_vector_t l_records;
        // -------------------------------------------------
        // Get args...
        // -------------------------------------------------
        char l_opt = '\0';
        std::string l_arg;
        int l_opt_index = 0;
        static struct option l_long_opt[] = {
                { "help",       no_argument,       0, 'h' },
                { "version",    no_argument,       0, 'V' },
                { "secret",     required_argument, 0, 's' },
                { "passphrase", required_argument, 0, 'p' },
                { "record",     required_argument, 0, 'r' },
                { "output",     required_argument, 0, 'o' },
                { "json",       no_argument,       0, 'j' },
                { "hexdump",    no_argument,       0, 'x' },
                // Sentinel
                { 0,            0,                 0,  0  }
        };
        // -------------------------------------------------
        // args...
        // -------------------------------------------------
        char l_short_arg_list[] = "hVs:p:r:o:jx";
        while(((unsigned char)l_opt != 255))
        {
                l_opt = getopt_long_only(argc, argv, l_short_arg_list, l_long_opt, &l_opt_index);
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
                case 'V':
                {
                        print_version(stdout, 0);
                        break;
                }
                // -----------------------------------------
                // secret
                // -----------------------------------------
                case 's':
                {
                        l_secret_hex = l_arg;
                        break;
                }
                // -----------------------------------------
                // passphrase
                // -----------------------------------------
                case 'p':
                {
                        l_passphrase = l_arg;
                        break;
                }
                // -----------------------------------------
                // record
                // -----------------------------------------
                case 'r':
                {
                        l_records.push_back(l_arg);
                        break;
                }
                // -----------------------------------------
                // output
                // -----------------------------------------
                case 'o':
                {
                        l_out_file = l_arg;
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
                // hexdump
                // -----------------------------------------
                case 'x':
                {
                        l_hexdump = true;
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
                        fprintf(stderr, "  Exiting.\n");
                        return STATUS_ERROR;
                }
                // -----------------------------------------
                // default
                // -----------------------------------------
                default:
                {
                        break;
                }
                }
        }
        if (!l_secret_hex.empty() &&
            !l_passphrase.empty())
        {
                fprintf(stderr, "Error specify one of --secret or --passphrase.\n");
                return STATUS_ERROR;
        }
        // -------------------------------------------------
        // keypair
        // -------------------------------------------------
        ns_pkarr::keypair l_keypair;
        if (!l_secret_hex.empty())
        {
                std::string l_secret;
                l_s = ns_pkarr::hex2bin_str(l_secret, l_secret_hex);
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr, "Error invalid secret hex.\n");
                        return STATUS_ERROR;
                }
                l_s = l_keypair.init((const uint8_t*)l_secret.data(), l_secret.length());
        }
        else if (!l_passphrase.empty())
        {
                uint8_t l_secret[PKARR_SECRET_KEY_SIZE];
                l_s = ns_pkarr::sha256_hash(l_secret,
                                            (const uint8_t*)l_passphrase.data(),
                                            l_passphrase.length());
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr, "Error performing sha256_hash.\n");
                        return STATUS_ERROR;
                }
                l_s = l_keypair.init(l_secret, sizeof(l_secret));
        }
        else
        {
                l_s = l_keypair.init_random();
        }
        if (l_s != PKARR_STATUS_OK)
        {
                fprintf(stderr,
                        "Error creating keypair.  Reason: %s.\n",
                        ns_pkarr::get_err_msg());
                return STATUS_ERROR;
        }
        std::string l_z32 = l_keypair.get_public_key().to_z32();
        std::string l_sk_hex;
        l_s = ns_pkarr::bin2hex_str(l_sk_hex, l_keypair.get_secret(), PKARR_SECRET_KEY_SIZE);
        if (l_s != PKARR_STATUS_OK)
        {
                fprintf(stderr, "Error performing bin2hex_str.\n");
                return STATUS_ERROR;
        }
        NDBG_OUTPUT("public key: %s%s%s\n", ANSI_COLOR_FG_CYAN, l_z32.c_str(), ANSI_COLOR_OFF);
        NDBG_OUTPUT("secret key: %s\n", l_sk_hex.c_str());
        if (l_records.empty())
        {
                return STATUS_OK;
        }
        // -------------------------------------------------
        // records -names relative to origin
        // -------------------------------------------------
        ns_pkarr::packet l_pkt;
        for (auto && i_r : l_records)
        {
                ns_pkarr::resource_record l_rr;
                l_s = l_rr.parse(i_r);
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr,
                                "Error parsing record '%s'.  Reason: %s.\n",
                                i_r.c_str(),
                                ns_pkarr::get_err_msg());
                        return STATUS_ERROR;
                }
                std::string l_name = ns_pkarr::signed_packet::normalize_name(l_z32, l_rr.get_name());
                l_s = l_rr.init(l_name, l_rr.get_type(), l_rr.get_rdata(), l_rr.get_ttl(), l_rr.get_class());
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr,
                                "Error with record '%s'.  Reason: %s.\n",
                                i_r.c_str(),
                                ns_pkarr::get_err_msg());
                        return STATUS_ERROR;
                }
                l_pkt.add_answer(l_rr);
        }
        // -------------------------------------------------
        // sign
        // -------------------------------------------------
        ns_pkarr::signed_packet l_spkt;
        l_s = l_spkt.sign(l_keypair, l_pkt);
        if (l_s != PKARR_STATUS_OK)
        {
                fprintf(stderr,
                        "Error signing packet.  Reason: %s.\n",
                        ns_pkarr::status_str(l_s));
                return STATUS_ERROR;
        }
        if (l_json)
        {
                std::string l_out;
                l_s = l_spkt.to_json(l_out);
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr, "Error performing signed_packet::to_json.\n");
                        return STATUS_ERROR;
                }
                NDBG_OUTPUT("%s\n", l_out.c_str());
        }
        else
        {
                l_spkt.display();
        }
        std::string l_relay;
        l_spkt.to_relay_payload(l_relay);
        std::string l_relay_hex;
        l_s = ns_pkarr::bin2hex_str(l_relay_hex, (const uint8_t*)l_relay.data(), l_relay.length());
        if (l_s != PKARR_STATUS_OK)
        {
                fprintf(stderr, "Error performing bin2hex_str.\n");
                return STATUS_ERROR;
        }
        NDBG_OUTPUT("relay payload: %s\n", l_relay_hex.c_str());
        std::string l_bytes;
        l_spkt.to_bytes(l_bytes);
        if (l_hexdump)
        {
                NDBG_HEXDUMP(l_bytes.data(), l_bytes.length());
        }
        // -------------------------------------------------
        // write out
        // -------------------------------------------------
        if (!l_out_file.empty())
        {
                l_s = ns_pkarr::write_file(l_out_file.c_str(), l_bytes.data(), l_bytes.length());
                if (l_s != PKARR_STATUS_OK)
                {
                        fprintf(stderr,
                                "Error writing %s.  Reason: %s.\n",
                                l_out_file.c_str(),
                                ns_pkarr::get_err_msg());
                        return STATUS_ERROR;
                }
                NDBG_OUTPUT("wrote %zu bytes to %s\n", l_bytes.length(), l_out_file.c_str());
        }
        return STATUS_OK;
}
