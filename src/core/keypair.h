#ifndef _PKARR_KEYPAIR_H
#define _PKARR_KEYPAIR_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "core/public_key.h"
#include <stddef.h>
#include <stdint.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: ed25519 secret seed with its derived public key
//! ----------------------------------------------------------------------------
class keypair
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        keypair(void);
        ~keypair(void);
        int32_t init_random(void);
        int32_t init(const uint8_t* a_secret, size_t a_len);
        bool is_valid(void) const { return m_valid; }
        const public_key& get_public_key(void) const { return m_public_key; }
        const uint8_t* get_secret(void) const { return m_secret; }
        int32_t sign(uint8_t* ao_sig, const uint8_t* a_msg, size_t a_msg_len) const;
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // disallow copy/assign
        keypair(const keypair&);
        keypair& operator=(const keypair&);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        uint8_t m_secret[PKARR_SECRET_KEY_SIZE];
        public_key m_public_key;
        bool m_valid;
};
}
#endif
