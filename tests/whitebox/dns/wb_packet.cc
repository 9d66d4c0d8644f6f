//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "dns/packet.h"
#include "dns/resource_record.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE("dns packet", "[packet]") {
  // -------------------------------------------------
  // wire form of single A record
  // -------------------------------------------------
  SECTION("encode A") {
    ns_pkarr::packet l_pkt;
    ns_pkarr::resource_record l_rr;
    REQUIRE((l_rr.init("Foo.Example.", "A", "1.2.3.4", 60) == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_name() == "foo.example"));
    l_pkt.add_answer(l_rr);
    std::string l_buf;
    REQUIRE((l_pkt.encode(l_buf) == PKARR_STATUS_OK));
    static const uint8_t l_expect[] = {
      0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
      0x03, 'f', 'o', 'o', 0x07, 'e', 'x', 'a', 'm', 'p', 'l', 'e', 0x00,
      0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x3c, 0x00, 0x04,
      0x01, 0x02, 0x03, 0x04
    };
    REQUIRE((l_buf.length() == sizeof(l_expect)));
    REQUIRE((memcmp(l_buf.data(), l_expect, sizeof(l_expect)) == 0));
  }
  // -------------------------------------------------
  // compression pointers
  // -------------------------------------------------
  SECTION("name compression") {
    ns_pkarr::packet l_pkt;
    ns_pkarr::resource_record l_rr;
    REQUIRE((l_rr.init("foo.example", "A", "1.2.3.4", 60) == PKARR_STATUS_OK));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("foo.example", "A", "5.6.7.8", 60) == PKARR_STATUS_OK));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("bar.foo.example", "CNAME", "foo.example", 60) == PKARR_STATUS_OK));
    l_pkt.add_answer(l_rr);
    std::string l_buf;
    REQUIRE((l_pkt.encode(l_buf) == PKARR_STATUS_OK));
    // second owner name is pointer to offset 12
    size_t l_off = 12 + 13 + 10 + 4;
    REQUIRE(((uint8_t)l_buf[l_off] == 0xc0));
    REQUIRE(((uint8_t)l_buf[l_off + 1] == 0x0c));
    ns_pkarr::packet l_dec;
    REQUIRE((l_dec.decode((const uint8_t*)l_buf.data(), l_buf.length()) == PKARR_STATUS_OK));
    REQUIRE((l_dec.m_answers == l_pkt.m_answers));
  }
  // -------------------------------------------------
  // record types round trip
  // -------------------------------------------------
  SECTION("round trip types") {
    ns_pkarr::packet l_pkt;
    ns_pkarr::resource_record l_rr;
    REQUIRE((l_rr.init("v6.example", "AAAA", "2001:DB8::1", 300) == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_rdata() == "2001:db8::1"));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("_txt.example", "TXT", std::string(300, 'z'), 300) == PKARR_STATUS_OK));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("_q.example", "TXT", "\"quoted text\"", 300) == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_rdata() == "quoted text"));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("www.example", "CNAME", "Example.", 300) == PKARR_STATUS_OK));
    l_pkt.add_answer(l_rr);
    REQUIRE((l_rr.init("svc.example", "TYPE65", "\\# 4 0a0b0c0d", 300) == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_type() == "HTTPS"));
    l_pkt.add_answer(l_rr);
    std::string l_buf;
    REQUIRE((l_pkt.encode(l_buf) == PKARR_STATUS_OK));
    ns_pkarr::packet l_dec;
    REQUIRE((l_dec.decode((const uint8_t*)l_buf.data(), l_buf.length()) == PKARR_STATUS_OK));
    REQUIRE((l_dec.m_answers.size() == 5));
    REQUIRE((l_dec.m_answers == l_pkt.m_answers));
    REQUIRE((l_dec.m_answers[1].get_rdata().length() == 300));
    REQUIRE((l_dec.m_answers[3].get_rdata() == "example"));
  }
  // -------------------------------------------------
  // records from text
  // -------------------------------------------------
  SECTION("record parse") {
    ns_pkarr::resource_record l_rr;
    REQUIRE((l_rr.parse("_foo 300 IN TXT hello  world") == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_name() == "_foo"));
    REQUIRE((l_rr.get_ttl() == 300));
    REQUIRE((l_rr.get_type() == "TXT"));
    REQUIRE((l_rr.get_rdata() == "hello  world"));
    REQUIRE((l_rr.to_str() == "_foo 300 IN TXT \"hello  world\""));
    REQUIRE((l_rr.parse("@ 60 A 10.0.0.1") == PKARR_STATUS_OK));
    REQUIRE((l_rr.get_class() == "IN"));
    REQUIRE((l_rr.parse("@ 60 A 10.0.0") == PKARR_STATUS_ERR_PACKET));
    REQUIRE((l_rr.parse("@ sixty A 10.0.0.1") == PKARR_STATUS_ERR_PACKET));
    REQUIRE((l_rr.parse("@ 60 BOGUS 10.0.0.1") == PKARR_STATUS_ERR_PACKET));
    REQUIRE((l_rr.parse("@ 60") == PKARR_STATUS_ERR_PACKET));
  }
  // -------------------------------------------------
  // malformed wire input
  // -------------------------------------------------
  SECTION("decode malformed") {
    ns_pkarr::packet l_pkt;
    REQUIRE((l_pkt.decode(nullptr, 0) == PKARR_STATUS_OK));
    REQUIRE((l_pkt.m_answers.empty()));
    static const uint8_t l_short[] = { 0x00, 0x00, 0x84, 0x00, 0x00 };
    REQUIRE((l_pkt.decode(l_short, sizeof(l_short)) != PKARR_STATUS_OK));
    // -----------------------------------------
    // answer count past end of buffer
    // -----------------------------------------
    static const uint8_t l_trunc[] = {
      0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
      0x03, 'f', 'o'
    };
    REQUIRE((l_pkt.decode(l_trunc, sizeof(l_trunc)) != PKARR_STATUS_OK));
    // -----------------------------------------
    // self referencing pointer
    // -----------------------------------------
    static const uint8_t l_loop[] = {
      0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00,
      0xc0, 0x0c,
      0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x3c, 0x00, 0x04,
      0x01, 0x02, 0x03, 0x04
    };
    REQUIRE((l_pkt.decode(l_loop, sizeof(l_loop)) != PKARR_STATUS_OK));
  }
}
