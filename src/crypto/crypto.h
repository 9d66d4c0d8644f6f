#ifndef _PKARR_CRYPTO_H
#define _PKARR_CRYPTO_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/types.h"
#include <stddef.h>
#include <stdint.h>
#include <string>
// ---------------------------------------------------------
// openssl
// ---------------------------------------------------------
#include <openssl/evp.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PKARR_SHA1_SIZE 20
#define PKARR_SHA256_SIZE 32
#define PKARR_DIGEST_MAX_SIZE EVP_MAX_MD_SIZE
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: message digest over openssl EVP (sha1/sha256)
//! ----------------------------------------------------------------------------
class digest
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        digest(const EVP_MD* a_md);
        ~digest();
        void update(const uint8_t* a_buf, size_t a_len);
        void finish();
        const uint8_t* get_hash();
        size_t get_hash_len() const { return m_hash_len; }
        std::string get_hash_hex();
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        digest(const digest&);
        digest& operator=(const digest&);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        EVP_MD_CTX* m_ctx;
        bool m_finished;
        uint8_t m_hash[PKARR_DIGEST_MAX_SIZE];
        size_t m_hash_len;
};
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
int32_t sha1_hash(id_t& ao_hash, const uint8_t* a_buf, size_t a_len);
int32_t sha256_hash(uint8_t* ao_hash, const uint8_t* a_buf, size_t a_len);
int32_t random_bytes(uint8_t* ao_buf, size_t a_len);
// ---------------------------------------------------------
// ed25519
// ---------------------------------------------------------
int32_t ed25519_derive_public(uint8_t* ao_public, const uint8_t* a_secret);
int32_t ed25519_sign(uint8_t* ao_sig,
                     const uint8_t* a_secret,
                     const uint8_t* a_msg,
                     size_t a_msg_len);
int32_t ed25519_verify(const uint8_t* a_public,
                       const uint8_t* a_sig,
                       const uint8_t* a_msg,
                       size_t a_msg_len);
}
#endif
