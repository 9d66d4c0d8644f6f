//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "crypto/crypto.h"
#include "support/trace.h"
#include "support/util.h"
#include <string.h>
// ---------------------------------------------------------
// openssl
// ---------------------------------------------------------
#include <openssl/err.h>
#include <openssl/rand.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static const char* _ssl_err_str(void)
{
        static thread_local char s_buf[256];
        unsigned long l_err = ERR_get_error();
        if (!l_err)
        {
                return "unknown";
        }
        ERR_error_string_n(l_err, s_buf, sizeof(s_buf));
        return s_buf;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
digest::digest(const EVP_MD* a_md):
        m_ctx(nullptr),
        m_finished(false),
        m_hash(),
        m_hash_len(0)
{
#if OPENSSL_VERSION_NUMBER >= 0x10100000L
        m_ctx = EVP_MD_CTX_new();
#else
        m_ctx = EVP_MD_CTX_create();
#endif
        EVP_DigestInit_ex(m_ctx, a_md, nullptr);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
digest::~digest()
{
        if (nullptr != m_ctx)
        {
#if OPENSSL_VERSION_NUMBER >= 0x10100000L
                EVP_MD_CTX_free(m_ctx);
#else
                EVP_MD_CTX_destroy(m_ctx);
#endif
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void digest::update(const uint8_t* a_buf, size_t a_len)
{
        EVP_DigestUpdate(m_ctx, a_buf, a_len);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void digest::finish()
{
        if(m_finished)
        {
                return;
        }
        unsigned int l_len = 0;
        EVP_DigestFinal_ex(m_ctx, m_hash, &l_len);
        m_hash_len = l_len;
        m_finished = true;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const uint8_t* digest::get_hash()
{
        finish();
        return m_hash;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string digest::get_hash_hex()
{
        finish();
        std::string l_hex;
        bin2hex_str(l_hex, m_hash, m_hash_len);
        return l_hex;
}
//! ----------------------------------------------------------------------------
//! \details: sha1 into 20 byte dht id
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t sha1_hash(id_t& ao_hash, const uint8_t* a_buf, size_t a_len)
{
        digest l_sha(EVP_sha1());
        l_sha.update(a_buf, a_len);
        l_sha.finish();
        if (l_sha.get_hash_len() != PKARR_SHA1_SIZE)
        {
                TRC_ERROR("unexpected sha1 length: %zu", l_sha.get_hash_len());
                return PKARR_STATUS_ERROR;
        }
        memcpy(ao_hash.m_data, l_sha.get_hash(), PKARR_SHA1_SIZE);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   ao_hash must hold PKARR_SHA256_SIZE bytes
//! ----------------------------------------------------------------------------
int32_t sha256_hash(uint8_t* ao_hash, const uint8_t* a_buf, size_t a_len)
{
        digest l_sha(EVP_sha256());
        l_sha.update(a_buf, a_len);
        l_sha.finish();
        if (l_sha.get_hash_len() != PKARR_SHA256_SIZE)
        {
                TRC_ERROR("unexpected sha256 length: %zu", l_sha.get_hash_len());
                return PKARR_STATUS_ERROR;
        }
        memcpy(ao_hash, l_sha.get_hash(), PKARR_SHA256_SIZE);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t random_bytes(uint8_t* ao_buf, size_t a_len)
{
        int l_s;
        l_s = RAND_bytes(ao_buf, (int)a_len);
        if (l_s != 1)
        {
                TRC_ERROR("performing RAND_bytes: %s", _ssl_err_str());
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: derive the 32 byte public key for a 32 byte secret seed
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t ed25519_derive_public(uint8_t* ao_public, const uint8_t* a_secret)
{
        EVP_PKEY* l_pkey = nullptr;
        l_pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519,
                                              nullptr,
                                              a_secret,
                                              PKARR_SECRET_KEY_SIZE);
        if (!l_pkey)
        {
                TRC_ERROR("performing EVP_PKEY_new_raw_private_key: %s", _ssl_err_str());
                return PKARR_STATUS_ERROR;
        }
        size_t l_len = PKARR_PUBLIC_KEY_SIZE;
        int l_s;
        l_s = EVP_PKEY_get_raw_public_key(l_pkey, ao_public, &l_len);
        EVP_PKEY_free(l_pkey);
        if ((l_s != 1) ||
            (l_len != PKARR_PUBLIC_KEY_SIZE))
        {
                TRC_ERROR("performing EVP_PKEY_get_raw_public_key: %s", _ssl_err_str());
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   ao_sig must hold PKARR_SIGNATURE_SIZE bytes
//! ----------------------------------------------------------------------------
int32_t ed25519_sign(uint8_t* ao_sig,
                     const uint8_t* a_secret,
                     const uint8_t* a_msg,
                     size_t a_msg_len)
{
        int32_t l_ret = PKARR_STATUS_OK;
        EVP_PKEY* l_pkey = nullptr;
        EVP_MD_CTX* l_ctx = nullptr;
        size_t l_sig_len = PKARR_SIGNATURE_SIZE;
        int l_s;
        l_pkey = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519,
                                              nullptr,
                                              a_secret,
                                              PKARR_SECRET_KEY_SIZE);
        if (!l_pkey)
        {
                TRC_ERROR("performing EVP_PKEY_new_raw_private_key: %s", _ssl_err_str());
                return PKARR_STATUS_ERROR;
        }
        l_ctx = EVP_MD_CTX_new();
        if (!l_ctx)
        {
                TRC_ERROR("performing EVP_MD_CTX_new");
                l_ret = PKARR_STATUS_ERROR;
                goto cleanup;
        }
        // -------------------------------------------------
        // ed25519 is one-shot -no digest
        // -------------------------------------------------
        l_s = EVP_DigestSignInit(l_ctx, nullptr, nullptr, nullptr, l_pkey);
        if (l_s != 1)
        {
                TRC_ERROR("performing EVP_DigestSignInit: %s", _ssl_err_str());
                l_ret = PKARR_STATUS_ERROR;
                goto cleanup;
        }
        l_s = EVP_DigestSign(l_ctx, ao_sig, &l_sig_len, a_msg, a_msg_len);
        if ((l_s != 1) ||
            (l_sig_len != PKARR_SIGNATURE_SIZE))
        {
                TRC_ERROR("performing EVP_DigestSign: %s", _ssl_err_str());
                l_ret = PKARR_STATUS_ERROR;
                goto cleanup;
        }
cleanup:
        if (l_ctx) { EVP_MD_CTX_free(l_ctx); l_ctx = nullptr; }
        if (l_pkey) { EVP_PKEY_free(l_pkey); l_pkey = nullptr; }
        return l_ret;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  PKARR_STATUS_OK if signature verifies
//!           PKARR_STATUS_ERR_SIGNATURE if not
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t ed25519_verify(const uint8_t* a_public,
                       const uint8_t* a_sig,
                       const uint8_t* a_msg,
                       size_t a_msg_len)
{
        int32_t l_ret = PKARR_STATUS_OK;
        EVP_PKEY* l_pkey = nullptr;
        EVP_MD_CTX* l_ctx = nullptr;
        int l_s;
        l_pkey = EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519,
                                             nullptr,
                                             a_public,
                                             PKARR_PUBLIC_KEY_SIZE);
        if (!l_pkey)
        {
                TRC_ERROR("performing EVP_PKEY_new_raw_public_key: %s", _ssl_err_str());
                return PKARR_STATUS_ERR_IDENTITY;
        }
        l_ctx = EVP_MD_CTX_new();
        if (!l_ctx)
        {
                TRC_ERROR("performing EVP_MD_CTX_new");
                l_ret = PKARR_STATUS_ERROR;
                goto cleanup;
        }
        l_s = EVP_DigestVerifyInit(l_ctx, nullptr, nullptr, nullptr, l_pkey);
        if (l_s != 1)
        {
                TRC_ERROR("performing EVP_DigestVerifyInit: %s", _ssl_err_str());
                l_ret = PKARR_STATUS_ERROR;
                goto cleanup;
        }
        l_s = EVP_DigestVerify(l_ctx, a_sig, PKARR_SIGNATURE_SIZE, a_msg, a_msg_len);
        if (l_s != 1)
        {
                // clear queued openssl errors from failed verify
                ERR_clear_error();
                l_ret = PKARR_STATUS_ERR_SIGNATURE;
                goto cleanup;
        }
cleanup:
        if (l_ctx) { EVP_MD_CTX_free(l_ctx); l_ctx = nullptr; }
        if (l_pkey) { EVP_PKEY_free(l_pkey); l_pkey = nullptr; }
        return l_ret;
}
}
