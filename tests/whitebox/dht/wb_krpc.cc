//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "bencode/bencode.h"
#include "dht/krpc.h"
#include "support/net_util.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! \details: compact node record id[20] ip[4] port[2]
//! ----------------------------------------------------------------------------
static std::string _compact_node(uint8_t a_fill, const char* a_ip, uint16_t a_port)
{
  std::string l_rec(PKARR_DHT_ID_SIZE, (char)a_fill);
  struct in_addr l_addr;
  REQUIRE((inet_pton(AF_INET, a_ip, &l_addr) == 1));
  l_rec.append((const char*)&l_addr, 4);
  l_rec += (char)(a_port >> 8);
  l_rec += (char)(a_port & 0xff);
  return l_rec;
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "krpc", "[krpc]" ) {
  ns_pkarr::id_t l_id;
  memset(l_id.m_data, 0x11, sizeof(l_id.m_data));
  // -------------------------------------------------
  // queries
  // -------------------------------------------------
  SECTION("get_peers query") {
    ns_pkarr::id_t l_ih;
    memset(l_ih.m_data, 0x22, sizeof(l_ih.m_data));
    std::string l_msg;
    std::string l_tid;
    REQUIRE((ns_pkarr::krpc_create_get_peers(l_msg, l_tid, l_id, l_ih) == PKARR_STATUS_OK));
    REQUIRE((l_tid.length() == PKARR_KRPC_TID_LEN));
    ns_pkarr::krpc_msg l_q;
    REQUIRE((l_q.parse(l_msg.data(), l_msg.length()) == PKARR_STATUS_OK));
    REQUIRE((l_q.m_type == ns_pkarr::KRPC_MSG_TYPE_QUERY));
    REQUIRE((l_q.m_query == "get_peers"));
    REQUIRE((l_q.m_tid == l_tid));
    REQUIRE(l_q.m_has_id);
    REQUIRE((memcmp(l_q.m_id.m_data, l_id.m_data, PKARR_DHT_ID_SIZE) == 0));
    REQUIRE((l_msg.find("9:info_hash20:") != std::string::npos));
    REQUIRE((ns_pkarr::krpc_create_ping(l_msg, l_tid, l_id) == PKARR_STATUS_OK));
    REQUIRE((l_q.parse(l_msg.data(), l_msg.length()) == PKARR_STATUS_OK));
    REQUIRE((l_q.m_query == "ping"));
    REQUIRE((ns_pkarr::krpc_create_find_node(l_msg, l_tid, l_id, l_id) == PKARR_STATUS_OK));
    REQUIRE((l_msg.find("6:target20:") != std::string::npos));
  }
  // -------------------------------------------------
  // reply w/ nodes + values
  // -------------------------------------------------
  SECTION("reply") {
    std::string l_nodes;
    l_nodes += _compact_node(0xaa, "10.0.0.3", 6881);
    l_nodes += _compact_node(0xbb, "10.0.0.4", 0);
    l_nodes += _compact_node(0xcc, "10.0.0.5", 6882);
    l_nodes += "xyz";
    ns_pkarr::bencode_writer l_bw;
    l_bw.w_key("t");
    l_bw.w_string("ab");
    l_bw.w_key("y");
    l_bw.w_string("r");
    l_bw.w_key("r");
    l_bw.w_start_dict();
    l_bw.w_key("id");
    l_bw.w_string((const char*)l_id.m_data, PKARR_DHT_ID_SIZE);
    l_bw.w_key("nodes");
    l_bw.w_string(l_nodes);
    l_bw.w_key("token");
    l_bw.w_string("tok");
    l_bw.w_key("values");
    l_bw.w_start_list();
    l_bw.w_string(std::string("\x0a\x00\x01\x01\x1b\x58", 6));
    l_bw.w_string(std::string("short", 5));
    l_bw.w_end_list();
    l_bw.w_end_dict();
    std::string l_buf;
    l_bw.serialize(l_buf);
    ns_pkarr::krpc_msg l_r;
    REQUIRE((l_r.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_OK));
    REQUIRE((l_r.m_type == ns_pkarr::KRPC_MSG_TYPE_REPLY));
    REQUIRE((l_r.m_tid == "ab"));
    REQUIRE((l_r.m_token == "tok"));
    REQUIRE((l_r.m_values.size() == 1));
    REQUIRE((ns_pkarr::sas_to_str(l_r.m_values[0]) == "10.0.1.1:7000"));
    // -----------------------------------------
    // port 0 + trailing partial dropped
    // -----------------------------------------
    ns_pkarr::dht_node_vector_t l_dec;
    REQUIRE((ns_pkarr::decode_compact_nodes(l_dec, l_r.m_nodes) == PKARR_STATUS_OK));
    REQUIRE((l_dec.size() == 2));
    REQUIRE((l_dec[0].m_addr == "10.0.0.3:6881"));
    REQUIRE(l_dec[0].m_has_id);
    REQUIRE((l_dec[0].m_id.m_data[0] == 0xaa));
    REQUIRE((l_dec[1].m_addr == "10.0.0.5:6882"));
    std::string l_json;
    REQUIRE((l_r.to_json(l_json) == PKARR_STATUS_OK));
    REQUIRE((l_json.find("reply") != std::string::npos));
  }
  // -------------------------------------------------
  // error reply
  // -------------------------------------------------
  SECTION("error") {
    ns_pkarr::bencode_writer l_bw;
    l_bw.w_key("t");
    l_bw.w_string("ab");
    l_bw.w_key("y");
    l_bw.w_string("e");
    l_bw.w_key("e");
    l_bw.w_start_list();
    l_bw.w_int(PKARR_KRPC_ERR_PROTOCOL);
    l_bw.w_string("Protocol Error");
    l_bw.w_end_list();
    std::string l_buf;
    l_bw.serialize(l_buf);
    ns_pkarr::krpc_msg l_e;
    REQUIRE((l_e.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_OK));
    REQUIRE((l_e.m_type == ns_pkarr::KRPC_MSG_TYPE_ERROR));
    REQUIRE((l_e.m_err_code == 203));
    REQUIRE((l_e.m_err_msg == "Protocol Error"));
  }
  // -------------------------------------------------
  // malformed
  // -------------------------------------------------
  SECTION("malformed") {
    ns_pkarr::krpc_msg l_m;
    std::string l_buf = "d1:t2:ab1:y1:re";
    REQUIRE((l_m.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_DHT));
    l_buf = "d1:t2:ab1:y1:ze";
    REQUIRE((l_m.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_DHT));
    l_buf = "d1:t2:ab";
    REQUIRE((l_m.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_DHT));
    l_buf = "garbage";
    REQUIRE((l_m.parse(l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_DHT));
  }
  // -------------------------------------------------
  // xor distance
  // -------------------------------------------------
  SECTION("xorcmp") {
    ns_pkarr::id_t l_ref;
    ns_pkarr::id_t l_a;
    ns_pkarr::id_t l_b;
    memset(l_ref.m_data, 0, sizeof(l_ref.m_data));
    memset(l_a.m_data, 0, sizeof(l_a.m_data));
    memset(l_b.m_data, 0, sizeof(l_b.m_data));
    l_a.m_data[19] = 0x01;
    l_b.m_data[0] = 0x01;
    REQUIRE((ns_pkarr::xorcmp(l_a, l_b, l_ref) < 0));
    REQUIRE((ns_pkarr::xorcmp(l_b, l_a, l_ref) > 0));
    REQUIRE((ns_pkarr::xorcmp(l_a, l_a, l_ref) == 0));
    memset(l_ref.m_data, 0xff, sizeof(l_ref.m_data));
    REQUIRE((ns_pkarr::xorcmp(l_a, l_b, l_ref) > 0));
  }
}
