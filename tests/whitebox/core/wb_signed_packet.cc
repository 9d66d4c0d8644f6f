//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "core/keypair.h"
#include "core/signed_packet.h"
#include "dns/packet.h"
#include "dns/resource_record.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! \details: add record to packet
//! ----------------------------------------------------------------------------
static void _add_rr(ns_pkarr::packet& ao_pkt,
                    const std::string& a_name,
                    const std::string& a_type,
                    const std::string& a_rdata,
                    uint32_t a_ttl)
{
        ns_pkarr::resource_record l_rr;
        REQUIRE((l_rr.init(a_name, a_type, a_rdata, a_ttl) == PKARR_STATUS_OK));
        ao_pkt.add_answer(l_rr);
}
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "signed packet", "[signed_packet]" ) {
        ns_pkarr::keypair l_kp;
        REQUIRE((l_kp.init_random() == PKARR_STATUS_OK));
        std::string l_origin = l_kp.get_public_key().to_z32();
        // -------------------------------------------------
        // sign + verify
        // -------------------------------------------------
        SECTION("round trip") {
                ns_pkarr::packet l_pkt;
                _add_rr(l_pkt, "_foo." + l_origin, "TXT", "hello world", 30);
                _add_rr(l_pkt, l_origin, "A", "1.1.1.1", 3600);
                ns_pkarr::signed_packet l_sp;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                std::string l_bytes;
                l_sp.to_bytes(l_bytes);
                REQUIRE((l_bytes.length() == PKARR_SIGNED_PACKET_MIN_SIZE + l_sp.get_encoded_packet().length()));
                ns_pkarr::signed_packet l_rt;
                REQUIRE((l_rt.from_bytes((const uint8_t*)l_bytes.data(), l_bytes.length()) == PKARR_STATUS_OK));
                REQUIRE((l_rt.get_public_key() == l_kp.get_public_key()));
                REQUIRE((l_rt.get_timestamp() == l_sp.get_timestamp()));
                REQUIRE((l_rt.get_packet().m_answers == l_pkt.m_answers));
                REQUIRE((l_rt.get_signature_hex() == l_sp.get_signature_hex()));
                // -----------------------------------------
                // relay payload
                // -----------------------------------------
                std::string l_relay;
                l_rt.to_relay_payload(l_relay);
                REQUIRE((l_relay == l_bytes.substr(PKARR_PUBLIC_KEY_SIZE)));
                ns_pkarr::signed_packet l_rp;
                REQUIRE((l_rp.from_relay_payload(l_kp.get_public_key(),
                                                 (const uint8_t*)l_relay.data(),
                                                 l_relay.length()) == PKARR_STATUS_OK));
                REQUIRE((l_rp.get_timestamp() == l_sp.get_timestamp()));
        }
        // -------------------------------------------------
        // timestamps strictly increase
        // -------------------------------------------------
        SECTION("timestamps") {
                ns_pkarr::packet l_pkt;
                ns_pkarr::signed_packet l_a;
                ns_pkarr::signed_packet l_b;
                REQUIRE((l_a.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                REQUIRE((l_b.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                REQUIRE((l_b.get_timestamp() > l_a.get_timestamp()));
        }
        // -------------------------------------------------
        // tamper
        // -------------------------------------------------
        SECTION("tamper") {
                ns_pkarr::packet l_pkt;
                _add_rr(l_pkt, l_origin, "TXT", "v=1", 300);
                ns_pkarr::signed_packet l_sp;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                std::string l_bytes;
                l_sp.to_bytes(l_bytes);
                size_t l_offs[] = {
                        PKARR_PUBLIC_KEY_SIZE,                                      // signature
                        PKARR_PUBLIC_KEY_SIZE + PKARR_SIGNATURE_SIZE + 7,           // timestamp
                        PKARR_SIGNED_PACKET_MIN_SIZE + 2,                           // encoded packet
                        l_bytes.length() - 1
                };
                for (size_t i_o = 0; i_o < sizeof(l_offs)/sizeof(l_offs[0]); ++i_o) {
                        std::string l_bad = l_bytes;
                        l_bad[l_offs[i_o]] ^= 0x01;
                        ns_pkarr::signed_packet l_rt;
                        INFO("offset: " << l_offs[i_o]);
                        REQUIRE((l_rt.from_bytes((const uint8_t*)l_bad.data(), l_bad.length()) == PKARR_STATUS_ERR_SIGNATURE));
                        REQUIRE_FALSE(l_rt.is_valid());
                }
        }
        // -------------------------------------------------
        // length boundaries
        // -------------------------------------------------
        SECTION("lengths") {
                ns_pkarr::signed_packet l_sp;
                std::string l_buf(103, '\0');
                REQUIRE((l_sp.from_bytes((const uint8_t*)l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_PACKET_LENGTH));
                l_buf.assign(1105, '\0');
                REQUIRE((l_sp.from_bytes((const uint8_t*)l_buf.data(), l_buf.length()) == PKARR_STATUS_ERR_PACKET_TOO_LARGE));
                // -----------------------------------------
                // 104 bytes: empty encoded packet, valid sig
                // -----------------------------------------
                uint64_t l_ts = 1700000000000000ULL;
                std::string l_signable;
                ns_pkarr::signed_packet::signable(l_signable, l_ts, std::string());
                REQUIRE((l_signable == "3:seqi1700000000000000e1:v0:"));
                uint8_t l_sig[PKARR_SIGNATURE_SIZE];
                REQUIRE((l_kp.sign(l_sig, (const uint8_t*)l_signable.data(), l_signable.length()) == PKARR_STATUS_OK));
                l_buf.assign((const char*)l_kp.get_public_key().get_bytes(), PKARR_PUBLIC_KEY_SIZE);
                l_buf.append((const char*)l_sig, sizeof(l_sig));
                for (int i_b = 7; i_b >= 0; --i_b) {
                        l_buf += (char)((l_ts >> (8*i_b)) & 0xff);
                }
                REQUIRE((l_buf.length() == 104));
                REQUIRE((l_sp.from_bytes((const uint8_t*)l_buf.data(), l_buf.length()) == PKARR_STATUS_OK));
                REQUIRE((l_sp.get_timestamp() == l_ts));
                REQUIRE((l_sp.get_packet().m_answers.empty()));
                // -----------------------------------------
                // relay payload lower bound
                // -----------------------------------------
                std::string l_relay = l_buf.substr(PKARR_PUBLIC_KEY_SIZE);
                REQUIRE((l_relay.length() == PKARR_RELAY_PAYLOAD_MIN_SIZE));
                REQUIRE((l_sp.from_relay_payload(l_kp.get_public_key(),
                                                 (const uint8_t*)l_relay.data(),
                                                 l_relay.length()) == PKARR_STATUS_OK));
                REQUIRE((l_sp.from_relay_payload(l_kp.get_public_key(),
                                                 (const uint8_t*)l_relay.data(),
                                                 71) == PKARR_STATUS_ERR_RELAY_PAYLOAD));
        }
        // -------------------------------------------------
        // too large to sign
        // -------------------------------------------------
        SECTION("too large") {
                ns_pkarr::packet l_pkt;
                for (int i_r = 0; i_r < 5; ++i_r) {
                        _add_rr(l_pkt, "big", "TXT", std::string(250, 'x'), 300);
                }
                ns_pkarr::signed_packet l_sp;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_ERR_PACKET_TOO_LARGE));
                REQUIRE_FALSE(l_sp.is_valid());
        }
        // -------------------------------------------------
        // ttl clamp
        // -------------------------------------------------
        SECTION("ttl") {
                ns_pkarr::signed_packet l_sp;
                ns_pkarr::packet l_pkt;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                REQUIRE((l_sp.ttl(PKARR_DEFAULT_MIN_TTL_S, PKARR_DEFAULT_MAX_TTL_S) == 300));
                _add_rr(l_pkt, "a", "A", "10.0.0.1", 10);
                _add_rr(l_pkt, "b", "A", "10.0.0.2", 50);
                _add_rr(l_pkt, "c", "A", "10.0.0.3", 7);
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                REQUIRE((l_sp.ttl(300, 86400) == 300));
                REQUIRE((l_sp.ttl(1, 86400) == 7));
                REQUIRE((l_sp.ttl(1, 5) == 5));
                REQUIRE((l_sp.expires_in(300, 86400) <= 300));
                ns_pkarr::packet l_big;
                _add_rr(l_big, "a", "A", "10.0.0.1", 200000);
                REQUIRE((l_sp.sign(l_kp, l_big) == PKARR_STATUS_OK));
                REQUIRE((l_sp.ttl(300, 86400) == 86400));
        }
        // -------------------------------------------------
        // names
        // -------------------------------------------------
        SECTION("normalize name") {
                std::string l_o = l_origin;
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, "@") == l_o));
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, "") == l_o));
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, "_foo") == "_foo." + l_o));
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, "_Foo.") == "_foo." + l_o));
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, "_foo." + l_o) == "_foo." + l_o));
                REQUIRE((ns_pkarr::signed_packet::normalize_name(l_o, l_o) == l_o));
        }
        SECTION("records by name") {
                ns_pkarr::packet l_pkt;
                _add_rr(l_pkt, "_foo." + l_origin, "TXT", "one", 30);
                _add_rr(l_pkt, "_foo." + l_origin, "TXT", "two", 0);
                _add_rr(l_pkt, l_origin, "A", "1.2.3.4", 30);
                ns_pkarr::signed_packet l_sp;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                ns_pkarr::rr_vector_t l_rrs;
                l_sp.resource_records(l_rrs, "_foo");
                REQUIRE((l_rrs.size() == 2));
                l_sp.resource_records(l_rrs, "@");
                REQUIRE((l_rrs.size() == 1));
                REQUIRE((l_rrs[0].get_rdata() == "1.2.3.4"));
                // -----------------------------------------
                // ttl 0 record is never fresh
                // -----------------------------------------
                l_sp.fresh_resource_records(l_rrs, "_foo");
                REQUIRE((l_rrs.size() == 1));
                REQUIRE((l_rrs[0].get_rdata() == "one"));
                // -----------------------------------------
                // age past record ttl
                // -----------------------------------------
                l_sp.set_last_seen_us(l_sp.get_last_seen_us() - 60*1000000LL);
                REQUIRE((l_sp.elapsed() >= 60));
                l_sp.fresh_resource_records(l_rrs, "_foo");
                REQUIRE((l_rrs.empty()));
        }
        SECTION("json") {
                ns_pkarr::packet l_pkt;
                _add_rr(l_pkt, l_origin, "A", "1.2.3.4", 30);
                ns_pkarr::signed_packet l_sp;
                REQUIRE((l_sp.sign(l_kp, l_pkt) == PKARR_STATUS_OK));
                std::string l_json;
                REQUIRE((l_sp.to_json(l_json) == PKARR_STATUS_OK));
                REQUIRE((l_json.find(l_origin) != std::string::npos));
                REQUIRE((l_json.find(l_sp.get_signature_hex()) != std::string::npos));
        }
}
