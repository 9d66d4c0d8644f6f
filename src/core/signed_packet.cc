//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "core/signed_packet.h"
#include "core/keypair.h"
#include "support/trace.h"
#include "support/ndebug.h"
#include "support/time_util.h"
#include "support/util.h"
#include <string.h>
#include <inttypes.h>
#include <pthread.h>
// ---------------------------------------------------------
// rapidjson
// ---------------------------------------------------------
#include "rapidjson/rapidjson.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! last timestamp issued by sign -keeps timestamps strictly increasing
//! ----------------------------------------------------------------------------
static pthread_mutex_t g_ts_mutex = PTHREAD_MUTEX_INITIALIZER;
static uint64_t g_last_ts = 0;
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static uint64_t next_timestamp(void)
{
        uint64_t l_ts = get_time_us();
        pthread_mutex_lock(&g_ts_mutex);
        if (l_ts <= g_last_ts)
        {
                l_ts = g_last_ts + 1;
        }
        g_last_ts = l_ts;
        pthread_mutex_unlock(&g_ts_mutex);
        return l_ts;
}
//! ----------------------------------------------------------------------------
//! \details: bencoded-dict-shaped prefix followed by encoded packet:
//!           "3:seqi<ts>e1:v<len>:" + encoded
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::signable(std::string& ao_out,
                             uint64_t a_timestamp,
                             const std::string& a_encoded)
{
        char l_prefix[64];
        int l_len = snprintf(l_prefix,
                             sizeof(l_prefix),
                             "3:seqi%" PRIu64 "e1:v%zu:",
                             a_timestamp,
                             a_encoded.length());
        ao_out.assign(l_prefix, l_len);
        ao_out += a_encoded;
}
//! ----------------------------------------------------------------------------
//! \details: resolve name relative to origin (signer z32)
//! \return:  normalized (lower case) name
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string signed_packet::normalize_name(const std::string& a_origin,
                                          const std::string& a_name)
{
        std::string l_origin = to_lower(a_origin);
        std::string l_name = to_lower(a_name);
        if (!l_name.empty() &&
            (l_name[l_name.length() - 1] == '.'))
        {
                l_name.erase(l_name.length() - 1);
        }
        std::string l_last;
        size_t l_dot = l_name.rfind('.');
        if (l_dot == std::string::npos)
        {
                l_last = l_name;
        }
        else
        {
                l_last = l_name.substr(l_dot + 1);
        }
        if (l_last == l_origin)
        {
                return l_name;
        }
        if (l_last.empty() ||
            (l_last == "@"))
        {
                return l_origin;
        }
        return l_name + "." + l_origin;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
signed_packet::signed_packet(void):
        m_valid(false),
        m_public_key(),
        m_signature(),
        m_timestamp(0),
        m_packet(),
        m_encoded(),
        m_last_seen_us(0)
{
}
//! ----------------------------------------------------------------------------
//! \details: sign with current wall clock time (us)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t signed_packet::sign(const keypair& a_keypair, const packet& a_packet)
{
        return sign(a_keypair, a_packet, next_timestamp());
}
//! ----------------------------------------------------------------------------
//! \details: encode + sign packet
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_PACKET_TOO_LARGE if encoded > 1000 bytes
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t signed_packet::sign(const keypair& a_keypair,
                            const packet& a_packet,
                            uint64_t a_timestamp)
{
        if (!a_keypair.is_valid())
        {
                PKARR_PERROR("sign with invalid keypair");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        std::string l_encoded;
        int32_t l_s;
        l_s = a_packet.encode(l_encoded);
        if (l_s != PKARR_STATUS_OK)
        {
                return l_s;
        }
        if (l_encoded.length() > PKARR_MAX_ENCODED_PACKET_SIZE)
        {
                PKARR_PERROR("packet too large: %zu > %d",
                             l_encoded.length(),
                             PKARR_MAX_ENCODED_PACKET_SIZE);
                return PKARR_STATUS_ERR_PACKET_TOO_LARGE;
        }
        std::string l_signable;
        signable(l_signable, a_timestamp, l_encoded);
        l_s = a_keypair.sign(m_signature,
                             (const uint8_t*)l_signable.data(),
                             l_signable.length());
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("error signing packet");
                m_valid = false;
                return PKARR_STATUS_ERR_SIGNATURE;
        }
        m_public_key = a_keypair.get_public_key();
        m_timestamp = a_timestamp;
        m_packet = a_packet;
        m_encoded = l_encoded;
        m_last_seen_us = (int64_t)get_mono_time_us();
        m_valid = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: verify and parse signed packet bytes
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_PACKET_LENGTH if < 104 bytes
//!           PKARR_STATUS_ERR_PACKET_TOO_LARGE if > 1104 bytes
//!           PKARR_STATUS_ERR_SIGNATURE on bad signature
//!           PKARR_STATUS_ERR_PACKET if encoded packet is malformed
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t signed_packet::from_bytes(const uint8_t* a_buf, size_t a_len)
{
        m_valid = false;
        if (!a_buf ||
            (a_len < PKARR_SIGNED_PACKET_MIN_SIZE))
        {
                PKARR_PERROR("invalid signed packet bytes length: %zu", a_len);
                return PKARR_STATUS_ERR_PACKET_LENGTH;
        }
        if (a_len > PKARR_SIGNED_PACKET_MAX_SIZE)
        {
                PKARR_PERROR("signed packet too large: %zu", a_len);
                return PKARR_STATUS_ERR_PACKET_TOO_LARGE;
        }
        // -------------------------------------------------
        // split
        // -------------------------------------------------
        const uint8_t* l_cur = a_buf;
        public_key l_pk;
        int32_t l_s;
        l_s = l_pk.init(l_cur, PKARR_PUBLIC_KEY_SIZE);
        if (l_s != PKARR_STATUS_OK)
        {
                return l_s;
        }
        l_cur += PKARR_PUBLIC_KEY_SIZE;
        const uint8_t* l_sig = l_cur;
        l_cur += PKARR_SIGNATURE_SIZE;
        uint64_t l_ts = 0;
        for (uint32_t i_b = 0; i_b < PKARR_TIMESTAMP_SIZE; ++i_b)
        {
                l_ts = (l_ts << 8) | l_cur[i_b];
        }
        l_cur += PKARR_TIMESTAMP_SIZE;
        std::string l_encoded((const char*)l_cur, a_len - PKARR_SIGNED_PACKET_MIN_SIZE);
        // -------------------------------------------------
        // verify
        // -------------------------------------------------
        std::string l_signable;
        signable(l_signable, l_ts, l_encoded);
        l_s = l_pk.verify(l_sig,
                          PKARR_SIGNATURE_SIZE,
                          (const uint8_t*)l_signable.data(),
                          l_signable.length());
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid signature for signer: %s", l_pk.to_z32().c_str());
                return PKARR_STATUS_ERR_SIGNATURE;
        }
        // -------------------------------------------------
        // decode
        // -------------------------------------------------
        packet l_pkt;
        l_s = l_pkt.decode((const uint8_t*)l_encoded.data(), l_encoded.length());
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERR_PACKET;
        }
        m_public_key = l_pk;
        memcpy(m_signature, l_sig, PKARR_SIGNATURE_SIZE);
        m_timestamp = l_ts;
        m_packet = l_pkt;
        m_encoded = l_encoded;
        m_last_seen_us = (int64_t)get_mono_time_us();
        m_valid = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: relay payload is signed packet bytes without the public key
//! \return:  PKARR_STATUS_ERR_RELAY_PAYLOAD if < 72 bytes else see from_bytes
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t signed_packet::from_relay_payload(const public_key& a_public_key,
                                          const uint8_t* a_buf,
                                          size_t a_len)
{
        m_valid = false;
        if (!a_buf ||
            (a_len < PKARR_RELAY_PAYLOAD_MIN_SIZE))
        {
                PKARR_PERROR("invalid relay payload size: %zu", a_len);
                return PKARR_STATUS_ERR_RELAY_PAYLOAD;
        }
        if (!a_public_key.is_valid())
        {
                PKARR_PERROR("invalid public key for relay payload");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        std::string l_buf((const char*)a_public_key.get_bytes(), PKARR_PUBLIC_KEY_SIZE);
        l_buf.append((const char*)a_buf, a_len);
        return from_bytes((const uint8_t*)l_buf.data(), l_buf.length());
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::to_bytes(std::string& ao_out) const
{
        ao_out.clear();
        ao_out.reserve(PKARR_SIGNED_PACKET_MIN_SIZE + m_encoded.length());
        ao_out.append((const char*)m_public_key.get_bytes(), PKARR_PUBLIC_KEY_SIZE);
        ao_out.append((const char*)m_signature, PKARR_SIGNATURE_SIZE);
        for (int i_b = PKARR_TIMESTAMP_SIZE - 1; i_b >= 0; --i_b)
        {
                ao_out += (char)((m_timestamp >> (8*i_b)) & 0xff);
        }
        ao_out += m_encoded;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::to_relay_payload(std::string& ao_out) const
{
        to_bytes(ao_out);
        ao_out.erase(0, PKARR_PUBLIC_KEY_SIZE);
}
//! ----------------------------------------------------------------------------
//! \details: min record ttl clamped to [min, max] -min if no records
//! \return:  ttl in seconds
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint32_t signed_packet::ttl(uint32_t a_min_ttl, uint32_t a_max_ttl) const
{
        const rr_vector_t& l_rrs = m_packet.m_answers;
        if (l_rrs.empty())
        {
                return a_min_ttl;
        }
        uint32_t l_ttl = l_rrs.front().get_ttl();
        for (rr_vector_t::const_iterator i_rr = l_rrs.begin();
             i_rr != l_rrs.end();
             ++i_rr)
        {
                if (i_rr->get_ttl() < l_ttl)
                {
                        l_ttl = i_rr->get_ttl();
                }
        }
        if (l_ttl > a_max_ttl)
        {
                l_ttl = a_max_ttl;
        }
        if (l_ttl < a_min_ttl)
        {
                l_ttl = a_min_ttl;
        }
        return l_ttl;
}
//! ----------------------------------------------------------------------------
//! \details: whole seconds since last seen (monotonic)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t signed_packet::elapsed(void) const
{
        int64_t l_now_us = (int64_t)get_mono_time_us();
        if (l_now_us <= m_last_seen_us)
        {
                return 0;
        }
        return (uint64_t)((l_now_us - m_last_seen_us) / 1000000);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint64_t signed_packet::expires_in(uint32_t a_min_ttl, uint32_t a_max_ttl) const
{
        uint64_t l_ttl = ttl(a_min_ttl, a_max_ttl);
        uint64_t l_elapsed = elapsed();
        if (l_elapsed >= l_ttl)
        {
                return 0;
        }
        return l_ttl - l_elapsed;
}
//! ----------------------------------------------------------------------------
//! \details: records matching name (relative to signer origin)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::resource_records(rr_vector_t& ao_rrs, const std::string& a_name) const
{
        ao_rrs.clear();
        std::string l_name = normalize_name(m_public_key.to_z32(), a_name);
        for (auto && i_rr : m_packet.m_answers)
        {
                if (to_lower(i_rr.get_name()) == l_name)
                {
                        ao_rrs.push_back(i_rr);
                }
        }
}
//! ----------------------------------------------------------------------------
//! \details: records matching name whose own ttl has not elapsed
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::fresh_resource_records(rr_vector_t& ao_rrs, const std::string& a_name) const
{
        ao_rrs.clear();
        std::string l_name = normalize_name(m_public_key.to_z32(), a_name);
        uint64_t l_elapsed = elapsed();
        for (auto && i_rr : m_packet.m_answers)
        {
                if ((to_lower(i_rr.get_name()) == l_name) &&
                    ((uint64_t)i_rr.get_ttl() > l_elapsed))
                {
                        ao_rrs.push_back(i_rr);
                }
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string signed_packet::get_signature_hex(void) const
{
        std::string l_hex;
        int32_t l_s;
        l_s = bin2hex_str(l_hex, m_signature, PKARR_SIGNATURE_SIZE);
        if (l_s != PKARR_STATUS_OK)
        {
                return std::string();
        }
        return to_upper(l_hex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t signed_packet::to_json(std::string& ao_json) const
{
        if (!m_valid)
        {
                return PKARR_STATUS_ERROR;
        }
        rapidjson::StringBuffer l_strbuf;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> l_writer(l_strbuf);
        l_writer.StartObject();
        l_writer.Key("public_key");
        l_writer.String(m_public_key.to_z32().c_str());
        l_writer.Key("last_seen_s");
        l_writer.Uint64(elapsed());
        l_writer.Key("timestamp");
        l_writer.Uint64(m_timestamp);
        l_writer.Key("timestamp_str");
        l_writer.String(epoch_to_str(m_timestamp / 1000000).c_str());
        l_writer.Key("signature");
        l_writer.String(get_signature_hex().c_str());
        l_writer.Key("records");
        l_writer.StartArray();
        for (auto && i_rr : m_packet.m_answers)
        {
                l_writer.StartObject();
                l_writer.Key("name");
                l_writer.String(i_rr.get_name().c_str());
                l_writer.Key("class");
                l_writer.String(i_rr.get_class().c_str());
                l_writer.Key("type");
                l_writer.String(i_rr.get_type().c_str());
                l_writer.Key("ttl");
                l_writer.Uint(i_rr.get_ttl());
                l_writer.Key("rdata");
                l_writer.String(i_rr.get_rdata().c_str(), (rapidjson::SizeType)i_rr.get_rdata().length());
                l_writer.EndObject();
        }
        l_writer.EndArray();
        l_writer.EndObject();
        ao_json.assign(l_strbuf.GetString(), l_strbuf.GetSize());
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void signed_packet::display(void) const
{
        NDBG_OUTPUT("SignedPacket (%s%s%s):\n",
                    ANSI_COLOR_FG_CYAN, m_public_key.to_z32().c_str(), ANSI_COLOR_OFF);
        NDBG_OUTPUT("    last_seen: %" PRIu64 " seconds ago\n", elapsed());
        NDBG_OUTPUT("    timestamp: %" PRIu64 ",\n", m_timestamp);
        NDBG_OUTPUT("    signature: %s\n", get_signature_hex().c_str());
        NDBG_OUTPUT("    records:\n");
        for (auto && i_rr : m_packet.m_answers)
        {
                NDBG_OUTPUT("        %s\n", i_rr.to_str().c_str());
        }
}
}
