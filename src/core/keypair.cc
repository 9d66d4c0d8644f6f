//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "core/keypair.h"
#include "crypto/crypto.h"
#include "support/trace.h"
#include <string.h>
// ---------------------------------------------------------
// openssl
// ---------------------------------------------------------
#include <openssl/crypto.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
keypair::keypair(void):
        m_secret(),
        m_public_key(),
        m_valid(false)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
keypair::~keypair(void)
{
        OPENSSL_cleanse(m_secret, sizeof(m_secret));
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t keypair::init_random(void)
{
        uint8_t l_secret[PKARR_SECRET_KEY_SIZE];
        int32_t l_s;
        l_s = random_bytes(l_secret, sizeof(l_secret));
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("error generating keypair secret");
                return PKARR_STATUS_ERROR;
        }
        l_s = init(l_secret, sizeof(l_secret));
        OPENSSL_cleanse(l_secret, sizeof(l_secret));
        return l_s;
}
//! ----------------------------------------------------------------------------
//! \details: init from 32 byte secret seed -public key is derived
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_IDENTITY on bad secret
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t keypair::init(const uint8_t* a_secret, size_t a_len)
{
        if (!a_secret ||
            (a_len != PKARR_SECRET_KEY_SIZE))
        {
                PKARR_PERROR("invalid secret key length: %zu", a_len);
                return PKARR_STATUS_ERR_IDENTITY;
        }
        uint8_t l_public[PKARR_PUBLIC_KEY_SIZE];
        int32_t l_s;
        l_s = ed25519_derive_public(l_public, a_secret);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("error deriving public key from secret");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        l_s = m_public_key.init(l_public, sizeof(l_public));
        if (l_s != PKARR_STATUS_OK)
        {
                return l_s;
        }
        memcpy(m_secret, a_secret, PKARR_SECRET_KEY_SIZE);
        m_valid = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   ao_sig must hold PKARR_SIGNATURE_SIZE bytes
//! ----------------------------------------------------------------------------
int32_t keypair::sign(uint8_t* ao_sig, const uint8_t* a_msg, size_t a_msg_len) const
{
        if (!m_valid)
        {
                PKARR_PERROR("sign with uninitialized keypair");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        return ed25519_sign(ao_sig, m_secret, a_msg, a_msg_len);
}
}
