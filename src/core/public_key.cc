//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "core/public_key.h"
#include "crypto/crypto.h"
#include "support/trace.h"
#include "support/util.h"
#include <string.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
public_key::public_key(void):
        m_key(),
        m_valid(false)
{
}
//! ----------------------------------------------------------------------------
//! \details: init from raw bytes
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_IDENTITY on bad length
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t public_key::init(const uint8_t* a_buf, size_t a_len)
{
        if (!a_buf ||
            (a_len != PKARR_PUBLIC_KEY_SIZE))
        {
                PKARR_PERROR("invalid public key length: %zu", a_len);
                return PKARR_STATUS_ERR_IDENTITY;
        }
        memcpy(m_key, a_buf, PKARR_PUBLIC_KEY_SIZE);
        m_valid = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: init from z-base-32 text
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_IDENTITY on bad text
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t public_key::init(const std::string& a_z32)
{
        if (a_z32.length() != PKARR_PUBLIC_KEY_Z32_LEN)
        {
                PKARR_PERROR("invalid public key: expected %d z-base-32 symbols got %zu",
                             PKARR_PUBLIC_KEY_Z32_LEN,
                             a_z32.length());
                return PKARR_STATUS_ERR_IDENTITY;
        }
        std::string l_raw;
        int32_t l_s;
        l_s = z32_decode(l_raw, a_z32.c_str(), a_z32.length());
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid public key: not z-base-32: %s", a_z32.c_str());
                return PKARR_STATUS_ERR_IDENTITY;
        }
        return init((const uint8_t*)l_raw.data(), l_raw.length());
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string public_key::to_z32(void) const
{
        std::string l_str;
        z32_encode(l_str, m_key, PKARR_PUBLIC_KEY_SIZE);
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string public_key::to_hex(void) const
{
        std::string l_str;
        bin2hex_str(l_str, m_key, PKARR_PUBLIC_KEY_SIZE);
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: dht info hash (sha1 of raw key bytes)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t public_key::get_info_hash(id_t& ao_hash) const
{
        return sha1_hash(ao_hash, m_key, PKARR_PUBLIC_KEY_SIZE);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  PKARR_STATUS_OK if valid
//!           PKARR_STATUS_ERR_SIGNATURE if not
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t public_key::verify(const uint8_t* a_sig,
                           size_t a_sig_len,
                           const uint8_t* a_msg,
                           size_t a_msg_len) const
{
        if (!m_valid)
        {
                return PKARR_STATUS_ERR_IDENTITY;
        }
        if (!a_sig ||
            (a_sig_len != PKARR_SIGNATURE_SIZE))
        {
                return PKARR_STATUS_ERR_SIGNATURE;
        }
        return ed25519_verify(m_key, a_sig, a_msg, a_msg_len);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool public_key::operator==(const public_key& a_rhs) const
{
        return (m_valid == a_rhs.m_valid) &&
               (memcmp(m_key, a_rhs.m_key, PKARR_PUBLIC_KEY_SIZE) == 0);
}
}
