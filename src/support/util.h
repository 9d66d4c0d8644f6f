#ifndef _PKARR_UTIL_H
#define _PKARR_UTIL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/types.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
//! ----------------------------------------------------------------------------
//! methods
//! ----------------------------------------------------------------------------
namespace ns_pkarr
{
int32_t write_file(const char *a_file, const char *a_buf, size_t a_len);
int32_t read_file(const char* a_file, char** a_buf, size_t* a_len);
int32_t bin2hex(char** ao_out, const uint8_t* a_bin, size_t a_len);
int32_t bin2hex_str(std::string& ao_out, const uint8_t* a_bin, size_t a_len);
int32_t hex2bin(uint8_t* ao_bin, size_t& ao_bin_len, const char* a_hex, const size_t a_hex_len);
int32_t hex2bin_str(std::string& ao_out, const std::string& a_hex);
int32_t z32_encode(std::string& ao_out, const uint8_t* a_bin, size_t a_len);
int32_t z32_decode(std::string& ao_out, const char* a_z32, size_t a_len);
std::string id2str(const id_t& a_id);
std::string epoch_to_str(uint64_t a_ts);
std::string to_lower(const std::string& a_str);
std::string to_upper(const std::string& a_str);
void split_str(str_vector_t& ao_vec, const std::string& a_str, char a_sep);
}
#endif
