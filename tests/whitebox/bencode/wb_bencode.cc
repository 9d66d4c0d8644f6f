//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "bencode/bencode.h"
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "support/ndebug.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("bencode", "[bencode]") {
  SECTION("bencode_writer") {
    // -----------------------------------------
    // write to buffer
    // -----------------------------------------
    ns_pkarr::bencode_writer l_bw;
    l_bw.w_key("t");
    l_bw.w_string("aa");
    l_bw.w_key("y");
    l_bw.w_string("q");
    l_bw.w_key("q");
    l_bw.w_string("get_peers");
    l_bw.w_key("a");
    l_bw.w_start_dict();
    l_bw.w_key("id");
    l_bw.w_string(std::string("\x00\x01\x02", 3));
    l_bw.w_key("n");
    l_bw.w_int(-42);
    l_bw.w_end_dict();
    std::string l_buf;
    l_bw.serialize(l_buf);
    // -----------------------------------------
    // keys sorted, strings binary safe
    // -----------------------------------------
    static const char l_raw[] = "d1:ad2:id3:\x00\x01\x02" "1:ni-42ee1:q9:get_peers1:t2:aa1:y1:qe";
    std::string l_expect(l_raw, sizeof(l_raw) - 1);
    REQUIRE((l_buf == l_expect));
    // -----------------------------------------
    // parse
    // -----------------------------------------
    int32_t l_s;
    ns_pkarr::bdecode l_bd;
    l_s = l_bd.init(l_buf.data(), l_buf.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    const ns_pkarr::be_string_t* l_q = ns_pkarr::be_dict_get_string(l_bd.m_dict, "q");
    REQUIRE((l_q != nullptr));
    REQUIRE((std::string(l_q->m_data, l_q->m_len) == "get_peers"));
    const ns_pkarr::be_dict_t* l_a = ns_pkarr::be_dict_get_dict(l_bd.m_dict, "a");
    REQUIRE((l_a != nullptr));
    const ns_pkarr::be_string_t* l_id = ns_pkarr::be_dict_get_string(*l_a, "id");
    REQUIRE((l_id != nullptr));
    REQUIRE((std::string(l_id->m_data, l_id->m_len) == std::string("\x00\x01\x02", 3)));
    const ns_pkarr::be_int_t* l_n = ns_pkarr::be_dict_get_int(*l_a, "n");
    REQUIRE((l_n != nullptr));
    REQUIRE((*l_n == -42));
    // -----------------------------------------
    // wrong type/missing
    // -----------------------------------------
    REQUIRE((ns_pkarr::be_dict_get_int(l_bd.m_dict, "q") == nullptr));
    REQUIRE((ns_pkarr::be_dict_get_list(l_bd.m_dict, "missing") == nullptr));
  }
  SECTION("bdecode list") {
    std::string l_buf = "d5:nodesl4:abcdi7eee";
    int32_t l_s;
    ns_pkarr::bdecode l_bd;
    l_s = l_bd.init(l_buf.data(), l_buf.length());
    REQUIRE((l_s == PKARR_STATUS_OK));
    const ns_pkarr::be_list_t* l_list = ns_pkarr::be_dict_get_list(l_bd.m_dict, "nodes");
    REQUIRE((l_list != nullptr));
    REQUIRE((l_list->size() == 2));
    REQUIRE((l_list->front().m_type == ns_pkarr::BE_OBJ_STRING));
    REQUIRE((l_list->back().m_type == ns_pkarr::BE_OBJ_INT));
  }
  SECTION("bdecode malformed") {
    const char* l_bad[] = {
      "",
      "d",
      "d1:a",
      "d1:ai1e",
      "d1:a5:abce",
      "d1:ai01ee",
      "d1:ai-0ee",
      "d1:aiee",
      "d1:ai1ee trailing",
      "l1:ae",
      "i1e",
      "d1:ax1:be",
    };
    for (size_t i_b = 0; i_b < sizeof(l_bad)/sizeof(l_bad[0]); ++i_b) {
      ns_pkarr::bdecode l_bd;
      INFO("input: " << l_bad[i_b]);
      REQUIRE((l_bd.init(l_bad[i_b], strlen(l_bad[i_b])) != PKARR_STATUS_OK));
    }
  }
  SECTION("bdecode depth limit") {
    std::string l_buf = "d1:a";
    for (int i_d = 0; i_d < PKARR_BENCODE_MAX_DEPTH + 2; ++i_d) {
      l_buf += "l";
    }
    for (int i_d = 0; i_d < PKARR_BENCODE_MAX_DEPTH + 2; ++i_d) {
      l_buf += "e";
    }
    l_buf += "e";
    ns_pkarr::bdecode l_bd;
    REQUIRE((l_bd.init(l_buf.data(), l_buf.length()) != PKARR_STATUS_OK));
  }
}
