#ifndef _PKARR_PUBLIC_KEY_H
#define _PKARR_PUBLIC_KEY_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/types.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: ed25519 verifying key -32 raw bytes, 52 symbol z-base-32 text
//! ----------------------------------------------------------------------------
class public_key
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        public_key(void);
        int32_t init(const uint8_t* a_buf, size_t a_len);
        int32_t init(const std::string& a_z32);
        bool is_valid(void) const { return m_valid; }
        const uint8_t* get_bytes(void) const { return m_key; }
        std::string to_z32(void) const;
        std::string to_hex(void) const;
        int32_t get_info_hash(id_t& ao_hash) const;
        int32_t verify(const uint8_t* a_sig,
                       size_t a_sig_len,
                       const uint8_t* a_msg,
                       size_t a_msg_len) const;
        bool operator==(const public_key& a_rhs) const;
        bool operator!=(const public_key& a_rhs) const { return !(*this == a_rhs); }
private:
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        uint8_t m_key[PKARR_PUBLIC_KEY_SIZE];
        bool m_valid;
};
}
#endif
