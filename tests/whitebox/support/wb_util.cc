//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string.h>
#include <string>
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "support/ndebug.h"
#include "support/util.h"
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("util test", "[util]") {
  // -------------------------------------------------
  // hex to binary
  // -------------------------------------------------
  SECTION("hex2bin") {
    std::string l_hex = "7d8f057f09bd5cc4fc3577603577119728974b9a";
    uint8_t l_buf[20];
    size_t l_buf_len = 0;
    int32_t l_s;
    // -----------------------------------------
    // convert hex to binary
    // -----------------------------------------
    l_s = ns_pkarr::hex2bin(l_buf, l_buf_len, l_hex.c_str(), l_hex.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    REQUIRE((l_buf_len == 20));
    // -----------------------------------------
    // convert binary back to hex
    // -----------------------------------------
    char* l_hex_out = nullptr;
    l_s = ns_pkarr::bin2hex(&l_hex_out, l_buf, l_buf_len);
    REQUIRE((l_s == PKARR_STATUS_OK));
    std::string l_cmp = l_hex_out;
    REQUIRE((l_cmp == l_hex));
    if (l_hex_out) {
      free(l_hex_out);
      l_hex_out = nullptr;
    }
  }
  // -------------------------------------------------
  // bad hex
  // -------------------------------------------------
  SECTION("hex2bin invalid") {
    std::string l_out;
    REQUIRE((ns_pkarr::hex2bin_str(l_out, "abc") == PKARR_STATUS_ERROR));
    REQUIRE((ns_pkarr::hex2bin_str(l_out, "zz") == PKARR_STATUS_ERROR));
    REQUIRE((ns_pkarr::hex2bin_str(l_out, "") == PKARR_STATUS_ERROR));
    REQUIRE((ns_pkarr::hex2bin_str(l_out, "DEADbeef") == PKARR_STATUS_OK));
    REQUIRE((l_out == std::string("\xde\xad\xbe\xef", 4)));
  }
  // -------------------------------------------------
  // z-base-32
  // -------------------------------------------------
  SECTION("z32") {
    uint8_t l_key[32];
    std::string l_z32;
    std::string l_dec;
    int32_t l_s;
    // -----------------------------------------
    // all zero -> first symbol
    // -----------------------------------------
    memset(l_key, 0, sizeof(l_key));
    l_s = ns_pkarr::z32_encode(l_z32, l_key, sizeof(l_key));
    REQUIRE((l_s == PKARR_STATUS_OK));
    REQUIRE((l_z32.length() == PKARR_PUBLIC_KEY_Z32_LEN));
    REQUIRE((l_z32 == std::string(52, 'y')));
    // -----------------------------------------
    // all ones -> last symbol, padded tail
    // -----------------------------------------
    memset(l_key, 0xff, sizeof(l_key));
    l_s = ns_pkarr::z32_encode(l_z32, l_key, sizeof(l_key));
    REQUIRE((l_s == PKARR_STATUS_OK));
    REQUIRE((l_z32 == std::string(51, '9') + "o"));
    // -----------------------------------------
    // round trip (case insensitive decode)
    // -----------------------------------------
    for (size_t i_b = 0; i_b < sizeof(l_key); ++i_b) {
      l_key[i_b] = (uint8_t)(i_b*7 + 3);
    }
    l_s = ns_pkarr::z32_encode(l_z32, l_key, sizeof(l_key));
    REQUIRE((l_s == PKARR_STATUS_OK));
    std::string l_upper = ns_pkarr::to_upper(l_z32);
    l_s = ns_pkarr::z32_decode(l_dec, l_upper.c_str(), l_upper.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    REQUIRE((l_dec == std::string((const char*)l_key, sizeof(l_key))));
    // -----------------------------------------
    // symbols outside alphabet
    // -----------------------------------------
    l_s = ns_pkarr::z32_decode(l_dec, "yyyl", 4);
    REQUIRE((l_s == PKARR_STATUS_ERROR));
    l_s = ns_pkarr::z32_decode(l_dec, "yy0y", 4);
    REQUIRE((l_s == PKARR_STATUS_ERROR));
    l_s = ns_pkarr::z32_decode(l_dec, "yy\xe9y", 4);
    REQUIRE((l_s == PKARR_STATUS_ERROR));
    // -----------------------------------------
    // trailing bits past the last byte must be zero
    // -----------------------------------------
    l_z32 = std::string(52, 'y');
    l_s = ns_pkarr::z32_decode(l_dec, l_z32.c_str(), l_z32.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    REQUIRE((l_dec == std::string(32, '\0')));
    l_z32 = std::string(51, 'y') + "b";
    l_s = ns_pkarr::z32_decode(l_dec, l_z32.c_str(), l_z32.length());
    REQUIRE((l_s == PKARR_STATUS_ERROR));
    l_z32 = std::string(51, '9') + "o";
    l_s = ns_pkarr::z32_decode(l_dec, l_z32.c_str(), l_z32.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    l_z32 = std::string(51, '9') + "x";
    l_s = ns_pkarr::z32_decode(l_dec, l_z32.c_str(), l_z32.length());
    REQUIRE((l_s == PKARR_STATUS_ERROR));
  }
  // -------------------------------------------------
  // strings
  // -------------------------------------------------
  SECTION("split_str") {
    ns_pkarr::str_vector_t l_vec;
    ns_pkarr::split_str(l_vec, "a:1,,b:2,", ',');
    REQUIRE((l_vec.size() == 2));
    REQUIRE((l_vec[0] == "a:1"));
    REQUIRE((l_vec[1] == "b:2"));
    REQUIRE((ns_pkarr::to_lower("FoO.Bar") == "foo.bar"));
  }
}
