#ifndef _PKARR_SIGNED_PACKET_H
#define _PKARR_SIGNED_PACKET_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "core/public_key.h"
#include "dns/packet.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class keypair;
//! ----------------------------------------------------------------------------
//! \details: dns packet signed by an ed25519 key
//!           wire form: pubkey[32] sig[64] timestamp[8 BE] encoded[<=1000]
//! ----------------------------------------------------------------------------
class signed_packet
{
public:
        // -------------------------------------------------
        // public static methods
        // -------------------------------------------------
        static void signable(std::string& ao_out,
                             uint64_t a_timestamp,
                             const std::string& a_encoded);
        static std::string normalize_name(const std::string& a_origin,
                                          const std::string& a_name);
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        signed_packet(void);
        int32_t sign(const keypair& a_keypair, const packet& a_packet);
        int32_t sign(const keypair& a_keypair, const packet& a_packet, uint64_t a_timestamp);
        int32_t from_bytes(const uint8_t* a_buf, size_t a_len);
        int32_t from_relay_payload(const public_key& a_public_key,
                                   const uint8_t* a_buf,
                                   size_t a_len);
        void to_bytes(std::string& ao_out) const;
        void to_relay_payload(std::string& ao_out) const;
        // -------------------------------------------------
        // ttl/freshness
        // -------------------------------------------------
        uint32_t ttl(uint32_t a_min_ttl, uint32_t a_max_ttl) const;
        uint64_t elapsed(void) const;
        uint64_t expires_in(uint32_t a_min_ttl, uint32_t a_max_ttl) const;
        // -------------------------------------------------
        // records
        // -------------------------------------------------
        void resource_records(rr_vector_t& ao_rrs, const std::string& a_name) const;
        void fresh_resource_records(rr_vector_t& ao_rrs, const std::string& a_name) const;
        // -------------------------------------------------
        // display
        // -------------------------------------------------
        int32_t to_json(std::string& ao_json) const;
        void display(void) const;
        // -------------------------------------------------
        // getters
        // -------------------------------------------------
        bool is_valid(void) const { return m_valid; }
        const public_key& get_public_key(void) const { return m_public_key; }
        const uint8_t* get_signature(void) const { return m_signature; }
        std::string get_signature_hex(void) const;
        uint64_t get_timestamp(void) const { return m_timestamp; }
        const packet& get_packet(void) const { return m_packet; }
        const std::string& get_encoded_packet(void) const { return m_encoded; }
        int64_t get_last_seen_us(void) const { return m_last_seen_us; }
        // backdate/forward-date last seen (monotonic us)
        void set_last_seen_us(int64_t a_us) { m_last_seen_us = a_us; }
private:
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        bool m_valid;
        public_key m_public_key;
        uint8_t m_signature[PKARR_SIGNATURE_SIZE];
        uint64_t m_timestamp;
        packet m_packet;
        std::string m_encoded;
        int64_t m_last_seen_us;
};
}
#endif
