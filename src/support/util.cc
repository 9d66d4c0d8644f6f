//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// internal
// ---------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/pkarr.h"
#include "support/util.h"
#include "support/trace.h"
#include "support/ndebug.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stdio.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <ctype.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <time.h>
//! ----------------------------------------------------------------------------
//! globals
//! ----------------------------------------------------------------------------
thread_local char g_pkarr_err_msg[PKARR_ERR_LEN] = "\0";
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
// z-base-32 -see: https://philzimmermann.com/docs/human-oriented-base-32-encoding.txt
static const char s_z32_alphabet[] = "ybndrfg8ejkmcpqxot1uwisza345h769";
namespace ns_pkarr
{
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* status_str(int32_t a_status)
{
        switch (a_status)
        {
        case PKARR_STATUS_OK:                   { return "ok"; }
        case PKARR_STATUS_ERROR:                { return "error"; }
        case PKARR_STATUS_AGAIN:                { return "again"; }
        case PKARR_STATUS_BUSY:                 { return "busy"; }
        case PKARR_STATUS_DONE:                 { return "done"; }
        case PKARR_STATUS_NOT_FOUND:            { return "not found"; }
        case PKARR_STATUS_ERR_IDENTITY:         { return "invalid public key"; }
        case PKARR_STATUS_ERR_SIGNATURE:        { return "invalid signature"; }
        case PKARR_STATUS_ERR_PACKET:           { return "invalid packet"; }
        case PKARR_STATUS_ERR_PACKET_LENGTH:    { return "invalid signed packet bytes length"; }
        case PKARR_STATUS_ERR_PACKET_TOO_LARGE: { return "packet too large"; }
        case PKARR_STATUS_ERR_RELAY_PAYLOAD:    { return "invalid relay payload size"; }
        case PKARR_STATUS_ERR_DHT:              { return "dht error"; }
        case PKARR_STATUS_ERR_TIMEOUT:          { return "timeout"; }
        case PKARR_STATUS_ERR_UNSUPPORTED:      { return "unsupported"; }
        default:                                { break; }
        }
        return "unknown";
}
//! ----------------------------------------------------------------------------
//! \details: last error message recorded by PKARR_PERROR on this thread
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* get_err_msg(void)
{
        return g_pkarr_err_msg;
}
//! ----------------------------------------------------------------------------
//! \brief   write contents of buffer to the file
//! \details writes contents of a_buf to a_file
//! \return  0 on Success
//!          -1 on Failure
//! ----------------------------------------------------------------------------
int32_t write_file(const char *a_file, const char *a_buf, size_t a_len)
{
        int32_t l_s;
        FILE * l_file;
        errno = 0;
        l_file = fopen(a_file,"w");
        if (l_file == NULL)
        {
                PKARR_PERROR("error opening file: %s.  Reason: %s", a_file, strerror(errno));
                return PKARR_STATUS_ERROR;
        }
        size_t l_write_size;
        l_write_size = fwrite(a_buf, 1, a_len, l_file);
        if(l_write_size != a_len)
        {
                PKARR_PERROR("error performing fwrite.  Reason: %s [%zu:%zu]",
                             strerror(errno),
                             l_write_size,
                             a_len);
                fclose(l_file);
                return PKARR_STATUS_ERROR;
        }
        l_s = fclose(l_file);
        if (l_s != 0)
        {
                PKARR_PERROR("error performing fclose.  Reason: %s", strerror(errno));
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: read whole file into malloc'd buffer -caller frees *a_buf
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t read_file(const char *a_file, char **a_buf, size_t *a_len)
{
        struct stat l_stat;
        int32_t l_status = PKARR_STATUS_OK;
        l_status = stat(a_file, &l_stat);
        if (l_status != 0)
        {
                PKARR_PERROR("error performing stat on file: %s.  Reason: %s", a_file, strerror(errno));
                return PKARR_STATUS_ERROR;
        }
        if (!(l_stat.st_mode & S_IFREG))
        {
                PKARR_PERROR("error opening file: %s.  Reason: is NOT a regular file", a_file);
                return PKARR_STATUS_ERROR;
        }
        FILE * l_file;
        l_file = fopen(a_file,"r");
        if (NULL == l_file)
        {
                PKARR_PERROR("error opening file: %s.  Reason: %s", a_file, strerror(errno));
                return PKARR_STATUS_ERROR;
        }
        size_t l_size = l_stat.st_size;
        char *l_buf;
        l_buf = (char *)malloc(sizeof(char)*l_size+1);
        size_t l_read_size;
        l_read_size = fread(l_buf, 1, l_size, l_file);
        if (l_read_size != l_size)
        {
                PKARR_PERROR("error performing fread.  Reason: %s [%zu:%zu]", strerror(errno), l_read_size, l_size);
                free(l_buf);
                fclose(l_file);
                return PKARR_STATUS_ERROR;
        }
        l_buf[l_size] = '\0';
        l_status = fclose(l_file);
        if (PKARR_STATUS_OK != l_status)
        {
                PKARR_PERROR("error performing fclose.  Reason: %s", strerror(errno));
                free(l_buf);
                return PKARR_STATUS_ERROR;
        }
        *a_buf = l_buf;
        *a_len = l_size;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bin2hex(char** ao_out, const uint8_t* a_bin, size_t a_len)
{
        if ((a_bin == NULL) ||
            (a_len == 0))
        {
                return PKARR_STATUS_ERROR;
        }
        *ao_out = (char*)malloc(a_len*2+1);
        char* l_out = *ao_out;
        size_t j = 0;
        for (size_t i=0; i < a_len; ++i, j+=2)
        {
                l_out[j]   = "0123456789abcdef"[a_bin[i] >> 4];
                l_out[j+1] = "0123456789abcdef"[a_bin[i] & 0x0F];
        }
        l_out[a_len*2] = '\0';
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bin2hex_str(std::string& ao_out, const uint8_t* a_bin, size_t a_len)
{
        ao_out.clear();
        if (!a_len)
        {
                return PKARR_STATUS_OK;
        }
        char* l_buf = nullptr;
        int32_t l_s = 0;
        l_s = bin2hex(&l_buf, a_bin, a_len);
        if (l_s != PKARR_STATUS_OK)
        {
                if (l_buf) { free(l_buf); l_buf = nullptr; }
                return PKARR_STATUS_ERROR;
        }
        ao_out.assign(l_buf);
        if (l_buf) { free(l_buf); l_buf = nullptr; }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: decode hex -ao_bin must hold a_hex_len/2 bytes
//! \return:  PKARR_STATUS_OK on success
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t hex2bin(uint8_t* ao_bin,
                size_t& ao_bin_len,
                const char* a_hex,
                const size_t a_hex_len)
{
        if ((a_hex == NULL) ||
            (a_hex_len == 0) ||
            (a_hex_len % 2))
        {
                return PKARR_STATUS_ERROR;
        }
        uint8_t* l_bin = ao_bin;
        const char* l_hex = a_hex;
        ao_bin_len = 0;
#define _HEX_TO_INT(_c) ((_c & 0xf) + (_c >> 6) * 9)
        size_t j = 0;
        for (size_t i=0; i < a_hex_len; i+=2)
        {
                if (!isxdigit((int)l_hex[0]) ||
                    !isxdigit((int)l_hex[1]))
                {
                        return PKARR_STATUS_ERROR;
                }
                uint8_t l_hi = _HEX_TO_INT(l_hex[0]);
                uint8_t l_lo = _HEX_TO_INT(l_hex[1]);
                l_bin[j] = (l_hi << 4) | l_lo;
                ++j;
                l_hex += 2;
                ao_bin_len += 1;
        }
#undef _HEX_TO_INT
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t hex2bin_str(std::string& ao_out, const std::string& a_hex)
{
        ao_out.assign(a_hex.length()/2, '\0');
        size_t l_len = 0;
        int32_t l_s;
        l_s = hex2bin((uint8_t*)(&ao_out[0]), l_len, a_hex.c_str(), a_hex.length());
        if (l_s != PKARR_STATUS_OK)
        {
                ao_out.clear();
                return PKARR_STATUS_ERROR;
        }
        ao_out.resize(l_len);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: z-base-32 encode -5 bit groups msb first, final group zero padded
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t z32_encode(std::string& ao_out, const uint8_t* a_bin, size_t a_len)
{
        ao_out.clear();
        if (!a_bin &&
            a_len)
        {
                return PKARR_STATUS_ERROR;
        }
        ao_out.reserve((a_len*8 + 4)/5);
        uint32_t l_acc = 0;
        uint32_t l_bits = 0;
        for (size_t i_b = 0; i_b < a_len; ++i_b)
        {
                l_acc = (l_acc << 8) | a_bin[i_b];
                l_bits += 8;
                while (l_bits >= 5)
                {
                        l_bits -= 5;
                        ao_out += s_z32_alphabet[(l_acc >> l_bits) & 0x1f];
                }
                l_acc &= ((1U << l_bits) - 1);
        }
        if (l_bits)
        {
                ao_out += s_z32_alphabet[(l_acc << (5 - l_bits)) & 0x1f];
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: z-base-32 decode -trailing partial byte bits must be zero
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERROR on symbol outside alphabet or
//!           non-canonical trailing bits
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t z32_decode(std::string& ao_out, const char* a_z32, size_t a_len)
{
        ao_out.clear();
        if (!a_z32 &&
            a_len)
        {
                return PKARR_STATUS_ERROR;
        }
        ao_out.reserve((a_len*5)/8);
        uint32_t l_acc = 0;
        uint32_t l_bits = 0;
        for (size_t i_c = 0; i_c < a_len; ++i_c)
        {
                char l_c = (char)tolower((unsigned char)a_z32[i_c]);
                const char* l_pos = (const char*)memchr(s_z32_alphabet, l_c, 32);
                if (!l_pos ||
                    (l_c == '\0'))
                {
                        return PKARR_STATUS_ERROR;
                }
                l_acc = (l_acc << 5) | (uint32_t)(l_pos - s_z32_alphabet);
                l_bits += 5;
                if (l_bits >= 8)
                {
                        l_bits -= 8;
                        ao_out += (char)((l_acc >> l_bits) & 0xff);
                        l_acc &= ((1U << l_bits) - 1);
                }
        }
        if (l_acc != 0)
        {
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string id2str(const id_t& a_id)
{
        std::string l_str;
        int32_t l_s_b2;
        l_s_b2 = bin2hex_str(l_str, a_id.m_data, sizeof(a_id));
        UNUSED(l_s_b2);
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string epoch_to_str(uint64_t a_ts)
{
        std::string l_str;
        char l_buf[256];
        struct tm l_et;
        time_t l_es = a_ts;
        localtime_r(&l_es, &l_et);
        strftime(l_buf, sizeof(l_buf), "%a, %d %b %Y %H:%M:%S %Z", &l_et);
        l_str = l_buf;
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string to_lower(const std::string& a_str)
{
        std::string l_str = a_str;
        for (size_t i_c = 0; i_c < l_str.length(); ++i_c)
        {
                l_str[i_c] = (char)tolower((unsigned char)l_str[i_c]);
        }
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string to_upper(const std::string& a_str)
{
        std::string l_str = a_str;
        for (size_t i_c = 0; i_c < l_str.length(); ++i_c)
        {
                l_str[i_c] = (char)toupper((unsigned char)l_str[i_c]);
        }
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: split on separator -empty tokens are skipped
//! \return:  NA
//! \param:   TODO
//! ----------------------------------------------------------------------------
void split_str(str_vector_t& ao_vec, const std::string& a_str, char a_sep)
{
        ao_vec.clear();
        size_t l_begin = 0;
        while (l_begin <= a_str.length())
        {
                size_t l_end = a_str.find(a_sep, l_begin);
                if (l_end == std::string::npos)
                {
                        l_end = a_str.length();
                }
                if (l_end > l_begin)
                {
                        ao_vec.push_back(a_str.substr(l_begin, l_end - l_begin));
                }
                l_begin = l_end + 1;
        }
}
}
