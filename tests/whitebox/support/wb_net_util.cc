//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <catch2/catch.hpp>
#include "pkarr/def.h"
#include "support/net_util.h"
#include "support/ndebug.h"
#include <string.h>
#include <string>
//! ----------------------------------------------------------------------------
//! Tests
//! ----------------------------------------------------------------------------
TEST_CASE( "net util test", "[net_util]" ) {
        // -------------------------------------------------
        // string conversion tests
        // -------------------------------------------------
        SECTION("sockaddr string conversions ipv6") {
                struct sockaddr_storage l_sas;
                std::string l_str;
                std::string l_str_cvt;
                int32_t l_s;
                // -----------------------------------------
                // ipv4
                // -----------------------------------------
                l_str = "122.4.45.122:12345";
                l_s = ns_pkarr::str_to_sas(l_str, l_sas);
                REQUIRE((l_s == PKARR_STATUS_OK));
                l_str_cvt = ns_pkarr::sas_to_str(l_sas);
                REQUIRE((l_str_cvt == l_str));
                // -----------------------------------------
                // ipv6
                // -----------------------------------------
                l_str = "[2001:db8:1234:ffff:ffff:ffff:ffff:ffff]:12345";
                l_s = ns_pkarr::str_to_sas(l_str, l_sas);
                REQUIRE((l_s == PKARR_STATUS_OK));
                l_str_cvt = ns_pkarr::sas_to_str(l_sas);
                REQUIRE((l_str_cvt == l_str));
        }
        // -------------------------------------------------
        // equality
        // -------------------------------------------------
        SECTION("sockaddr equal") {
                struct sockaddr_storage l_a;
                struct sockaddr_storage l_b;
                REQUIRE((ns_pkarr::str_to_sas("10.0.0.1:6881", l_a) == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::str_to_sas("10.0.0.1:6881", l_b) == PKARR_STATUS_OK));
                REQUIRE(ns_pkarr::sas_equal(l_a, l_b));
                REQUIRE((ns_pkarr::str_to_sas("10.0.0.1:6882", l_b) == PKARR_STATUS_OK));
                REQUIRE_FALSE(ns_pkarr::sas_equal(l_a, l_b));
        }
        // -------------------------------------------------
        // host:port
        // -------------------------------------------------
        SECTION("split host port") {
                std::string l_host;
                uint16_t l_port = 0;
                int32_t l_s;
                l_s = ns_pkarr::split_host_port("router.bittorrent.com:6881", l_host, l_port);
                REQUIRE((l_s == PKARR_STATUS_OK));
                REQUIRE((l_host == "router.bittorrent.com"));
                REQUIRE((l_port == 6881));
                l_s = ns_pkarr::split_host_port("[::1]:25401", l_host, l_port);
                REQUIRE((l_s == PKARR_STATUS_OK));
                REQUIRE((l_host == "::1"));
                REQUIRE((l_port == 25401));
                REQUIRE((ns_pkarr::split_host_port("nohost", l_host, l_port) == PKARR_STATUS_ERROR));
                REQUIRE((ns_pkarr::split_host_port("host:0", l_host, l_port) == PKARR_STATUS_ERROR));
                REQUIRE((ns_pkarr::split_host_port("host:70000", l_host, l_port) == PKARR_STATUS_ERROR));
                REQUIRE((ns_pkarr::split_host_port(":6881", l_host, l_port) == PKARR_STATUS_ERROR));
        }
        // -------------------------------------------------
        // numeric lookup (no dns)
        // -------------------------------------------------
        SECTION("nlookup numeric") {
                struct sockaddr_storage l_sas;
                int32_t l_s;
                l_s = ns_pkarr::nlookup("127.0.0.1", 6881, l_sas);
                REQUIRE((l_s == PKARR_STATUS_OK));
                REQUIRE((ns_pkarr::sas_to_str(l_sas) == "127.0.0.1:6881"));
        }
}
