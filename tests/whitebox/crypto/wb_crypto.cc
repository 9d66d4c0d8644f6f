//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "crypto/crypto.h"
#include "support/util.h"
#include <openssl/evp.h>
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! RFC 8032 7.1 test 1
//! ----------------------------------------------------------------------------
#define _SECRET_HEX "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"
#define _PUBLIC_HEX "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"
#define _SIG_HEX "e5564300c360ac729086e2cc806e828a84877f1eb8e5d974d873e06522490155" \
                 "5fb8821590a33bacc61e39701cf9b46bd25bf5f0595bbe24655141438e7a100b"
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "crypto", "[crypto]" ) {
        // -------------------------------------------------
        // digests
        // -------------------------------------------------
        SECTION("sha1/sha256") {
                const uint8_t* l_abc = (const uint8_t*)"abc";
                ns_pkarr::id_t l_id;
                int32_t l_s;
                l_s = ns_pkarr::sha1_hash(l_id, l_abc, 3);
                REQUIRE((l_s == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::id2str(l_id) == "a9993e364706816aba3e25717850c26c9cd0d89d"));
                uint8_t l_h[PKARR_SHA256_SIZE];
                l_s = ns_pkarr::sha256_hash(l_h, l_abc, 3);
                REQUIRE((l_s == PKARR_STATUS_OK));
                std::string l_hex;
                REQUIRE((ns_pkarr::bin2hex_str(l_hex, l_h, sizeof(l_h)) == PKARR_STATUS_OK));
                REQUIRE((l_hex == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
                // -----------------------------------------
                // incremental
                // -----------------------------------------
                ns_pkarr::digest l_d(EVP_sha1());
                l_d.update((const uint8_t*)"a", 1);
                l_d.update((const uint8_t*)"bc", 2);
                REQUIRE((l_d.get_hash_len() == PKARR_SHA1_SIZE));
                REQUIRE((l_d.get_hash_hex() == "a9993e364706816aba3e25717850c26c9cd0d89d"));
        }
        // -------------------------------------------------
        // ed25519 known answer
        // -------------------------------------------------
        SECTION("ed25519") {
                std::string l_secret;
                std::string l_sig_expect;
                REQUIRE((ns_pkarr::hex2bin_str(l_secret, _SECRET_HEX) == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::hex2bin_str(l_sig_expect, _SIG_HEX) == PKARR_STATUS_OK));
                uint8_t l_pub[PKARR_PUBLIC_KEY_SIZE];
                int32_t l_s;
                l_s = ns_pkarr::ed25519_derive_public(l_pub, (const uint8_t*)l_secret.data());
                REQUIRE((l_s == PKARR_STATUS_OK));
                std::string l_pub_hex;
                REQUIRE((ns_pkarr::bin2hex_str(l_pub_hex, l_pub, sizeof(l_pub)) == PKARR_STATUS_OK));
                REQUIRE((l_pub_hex == _PUBLIC_HEX));
                uint8_t l_sig[PKARR_SIGNATURE_SIZE];
                l_s = ns_pkarr::ed25519_sign(l_sig, (const uint8_t*)l_secret.data(), (const uint8_t*)"", 0);
                REQUIRE((l_s == PKARR_STATUS_OK));
                REQUIRE((memcmp(l_sig, l_sig_expect.data(), sizeof(l_sig)) == 0));
                l_s = ns_pkarr::ed25519_verify(l_pub, l_sig, (const uint8_t*)"", 0);
                REQUIRE((l_s == PKARR_STATUS_OK));
                // -----------------------------------------
                // wrong message
                // -----------------------------------------
                l_s = ns_pkarr::ed25519_verify(l_pub, l_sig, (const uint8_t*)"x", 1);
                REQUIRE((l_s == PKARR_STATUS_ERR_SIGNATURE));
                l_sig[0] ^= 0x01;
                l_s = ns_pkarr::ed25519_verify(l_pub, l_sig, (const uint8_t*)"", 0);
                REQUIRE((l_s == PKARR_STATUS_ERR_SIGNATURE));
        }
        // -------------------------------------------------
        // random
        // -------------------------------------------------
        SECTION("random bytes") {
                uint8_t l_a[32];
                uint8_t l_b[32];
                REQUIRE((ns_pkarr::random_bytes(l_a, sizeof(l_a)) == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::random_bytes(l_b, sizeof(l_b)) == PKARR_STATUS_OK));
                REQUIRE((memcmp(l_a, l_b, sizeof(l_a)) != 0));
        }
}
