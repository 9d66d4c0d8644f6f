//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "core/keypair.h"
#include "core/public_key.h"
#include "crypto/crypto.h"
#include "support/util.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "public key", "[public_key]" ) {
        SECTION("z32 text") {
                ns_pkarr::keypair l_kp;
                REQUIRE((l_kp.init_random() == PKARR_STATUS_OK));
                const ns_pkarr::public_key& l_pk = l_kp.get_public_key();
                std::string l_z32 = l_pk.to_z32();
                REQUIRE((l_z32.length() == PKARR_PUBLIC_KEY_Z32_LEN));
                // -----------------------------------------
                // text round trip
                // -----------------------------------------
                ns_pkarr::public_key l_cpy;
                REQUIRE((l_cpy.init(l_z32) == PKARR_STATUS_OK));
                REQUIRE((l_cpy == l_pk));
                REQUIRE((memcmp(l_cpy.get_bytes(), l_pk.get_bytes(), PKARR_PUBLIC_KEY_SIZE) == 0));
                // -----------------------------------------
                // upper case accepted
                // -----------------------------------------
                ns_pkarr::public_key l_up;
                REQUIRE((l_up.init(ns_pkarr::to_upper(l_z32)) == PKARR_STATUS_OK));
                REQUIRE((l_up == l_pk));
        }
        SECTION("invalid text") {
                ns_pkarr::public_key l_pk;
                REQUIRE((l_pk.init(std::string("")) == PKARR_STATUS_ERR_IDENTITY));
                REQUIRE((l_pk.init(std::string(51, 'y')) == PKARR_STATUS_ERR_IDENTITY));
                REQUIRE((l_pk.init(std::string(53, 'y')) == PKARR_STATUS_ERR_IDENTITY));
                REQUIRE((l_pk.init(std::string(51, 'y') + "l") == PKARR_STATUS_ERR_IDENTITY));
                REQUIRE_FALSE(l_pk.is_valid());
                uint8_t l_short[31];
                memset(l_short, 0, sizeof(l_short));
                REQUIRE((l_pk.init(l_short, sizeof(l_short)) == PKARR_STATUS_ERR_IDENTITY));
        }
        SECTION("deterministic derivation") {
                uint8_t l_secret[PKARR_SECRET_KEY_SIZE];
                memset(l_secret, 0x2a, sizeof(l_secret));
                ns_pkarr::keypair l_a;
                ns_pkarr::keypair l_b;
                REQUIRE((l_a.init(l_secret, sizeof(l_secret)) == PKARR_STATUS_OK));
                REQUIRE((l_b.init(l_secret, sizeof(l_secret)) == PKARR_STATUS_OK));
                REQUIRE((l_a.get_public_key() == l_b.get_public_key()));
                REQUIRE((l_a.init(l_secret, 16) != PKARR_STATUS_OK));
        }
        SECTION("sign/verify") {
                ns_pkarr::keypair l_kp;
                REQUIRE((l_kp.init_random() == PKARR_STATUS_OK));
                const uint8_t* l_msg = (const uint8_t*)"hello pkarr";
                uint8_t l_sig[PKARR_SIGNATURE_SIZE];
                REQUIRE((l_kp.sign(l_sig, l_msg, 11) == PKARR_STATUS_OK));
                const ns_pkarr::public_key& l_pk = l_kp.get_public_key();
                REQUIRE((l_pk.verify(l_sig, sizeof(l_sig), l_msg, 11) == PKARR_STATUS_OK));
                REQUIRE((l_pk.verify(l_sig, sizeof(l_sig), l_msg, 10) == PKARR_STATUS_ERR_SIGNATURE));
                REQUIRE((l_pk.verify(l_sig, 63, l_msg, 11) == PKARR_STATUS_ERR_SIGNATURE));
                // -----------------------------------------
                // other key
                // -----------------------------------------
                ns_pkarr::keypair l_other;
                REQUIRE((l_other.init_random() == PKARR_STATUS_OK));
                REQUIRE((l_other.get_public_key() != l_pk));
                REQUIRE((l_other.get_public_key().verify(l_sig, sizeof(l_sig), l_msg, 11) == PKARR_STATUS_ERR_SIGNATURE));
        }
        SECTION("info hash") {
                ns_pkarr::keypair l_kp;
                REQUIRE((l_kp.init_random() == PKARR_STATUS_OK));
                const ns_pkarr::public_key& l_pk = l_kp.get_public_key();
                ns_pkarr::id_t l_ih;
                ns_pkarr::id_t l_expect;
                REQUIRE((l_pk.get_info_hash(l_ih) == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::sha1_hash(l_expect, l_pk.get_bytes(), PKARR_PUBLIC_KEY_SIZE) == PKARR_STATUS_OK));
                REQUIRE((memcmp(l_ih.m_data, l_expect.m_data, PKARR_DHT_ID_SIZE) == 0));
        }
}
