//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "dns/packet.h"
#include "support/trace.h"
#include "support/util.h"
#include <string.h>
#include <arpa/inet.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _DNS_PTR_MASK       0xC0
#define _DNS_PTR_MAX_OFF  0x3FFF
#define _DNS_MAX_JUMPS        64
#define _DNS_MAX_WIRE_NAME   255
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#define _R_U16(_buf, _off) ((uint16_t)(((uint16_t)(_buf)[(_off)] << 8) | (uint16_t)(_buf)[(_off)+1]))
#define _R_U32(_buf, _off) (((uint32_t)(_buf)[(_off)] << 24) | \
                            ((uint32_t)(_buf)[(_off)+1] << 16) | \
                            ((uint32_t)(_buf)[(_off)+2] << 8) | \
                            ((uint32_t)(_buf)[(_off)+3]))
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: defaults: response (qr) + authoritative (aa)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
packet::packet(void):
        m_id(0),
        m_qr(true),
        m_opcode(0),
        m_aa(true),
        m_tc(false),
        m_rd(false),
        m_ra(false),
        m_z(0),
        m_rcode(0),
        m_answers()
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void packet::clear(void)
{
        m_id = 0;
        m_qr = true;
        m_opcode = 0;
        m_aa = true;
        m_tc = false;
        m_rd = false;
        m_ra = false;
        m_z = 0;
        m_rcode = 0;
        m_answers.clear();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void packet::w_u16(std::string& ao_buf, uint16_t a_val)
{
        ao_buf += (char)((a_val >> 8) & 0xff);
        ao_buf += (char)(a_val & 0xff);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void packet::w_u32(std::string& ao_buf, uint32_t a_val)
{
        w_u16(ao_buf, (uint16_t)(a_val >> 16));
        w_u16(ao_buf, (uint16_t)(a_val & 0xffff));
}
//! ----------------------------------------------------------------------------
//! \details: write name with compression -every suffix written is recorded
//!           and later occurrences become pointers
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t packet::w_name(std::string& ao_buf,
                       name_offset_map_t& ao_offsets,
                       const std::string& a_name)
{
        size_t l_pos = 0;
        while (l_pos < a_name.length())
        {
                std::string l_suffix = a_name.substr(l_pos);
                name_offset_map_t::const_iterator i_o = ao_offsets.find(l_suffix);
                if (i_o != ao_offsets.end())
                {
                        w_u16(ao_buf, (uint16_t)(0xC000 | i_o->second));
                        return PKARR_STATUS_OK;
                }
                if (ao_buf.length() <= _DNS_PTR_MAX_OFF)
                {
                        ao_offsets[l_suffix] = (uint16_t)ao_buf.length();
                }
                size_t l_dot = a_name.find('.', l_pos);
                if (l_dot == std::string::npos)
                {
                        l_dot = a_name.length();
                }
                size_t l_label_len = l_dot - l_pos;
                if (!l_label_len ||
                    (l_label_len > PKARR_DNS_MAX_LABEL_LEN))
                {
                        TRC_ERROR("invalid label in name: %s", a_name.c_str());
                        return PKARR_STATUS_ERROR;
                }
                ao_buf += (char)l_label_len;
                ao_buf.append(a_name, l_pos, l_label_len);
                l_pos = l_dot + 1;
        }
        ao_buf += '\0';
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t packet::w_rdata(std::string& ao_buf,
                        name_offset_map_t& ao_offsets,
                        const resource_record& a_rr)
{
        int l_s;
        const std::string& l_rdata = a_rr.get_rdata();
        switch (a_rr.get_type_code())
        {
        case PKARR_DNS_TYPE_A:
        {
                struct in_addr l_addr;
                l_s = inet_pton(AF_INET, l_rdata.c_str(), &l_addr);
                if (l_s != 1)
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_buf.append((const char*)&l_addr, 4);
                return PKARR_STATUS_OK;
        }
        case PKARR_DNS_TYPE_AAAA:
        {
                struct in6_addr l_addr;
                l_s = inet_pton(AF_INET6, l_rdata.c_str(), &l_addr);
                if (l_s != 1)
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_buf.append((const char*)&l_addr, 16);
                return PKARR_STATUS_OK;
        }
        case PKARR_DNS_TYPE_CNAME:
        case PKARR_DNS_TYPE_NS:
        case PKARR_DNS_TYPE_PTR:
        {
                return w_name(ao_buf, ao_offsets, l_rdata);
        }
        case PKARR_DNS_TYPE_TXT:
        {
                // -----------------------------------------
                // <character-string>s of <= 255 bytes
                // -----------------------------------------
                size_t l_off = 0;
                do
                {
                        size_t l_chunk = l_rdata.length() - l_off;
                        if (l_chunk > PKARR_DNS_MAX_STRING_LEN)
                        {
                                l_chunk = PKARR_DNS_MAX_STRING_LEN;
                        }
                        ao_buf += (char)l_chunk;
                        ao_buf.append(l_rdata, l_off, l_chunk);
                        l_off += l_chunk;
                } while (l_off < l_rdata.length());
                return PKARR_STATUS_OK;
        }
        default:
        {
                std::string l_bytes;
                l_s = parse_generic_rdata(l_bytes, l_rdata);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_buf += l_bytes;
                return PKARR_STATUS_OK;
        }
        }
        return PKARR_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: encode to dns wire format
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_PACKET on failure
//! \param:   ao_buf output
//! ----------------------------------------------------------------------------
int32_t packet::encode(std::string& ao_buf) const
{
        ao_buf.clear();
        if (m_answers.size() > 0xffff)
        {
                PKARR_PERROR("too many answers: %zu", m_answers.size());
                return PKARR_STATUS_ERR_PACKET;
        }
        // -------------------------------------------------
        // header
        // -------------------------------------------------
        uint16_t l_flags = 0;
        l_flags |= (m_qr ? 1 : 0) << 15;
        l_flags |= (m_opcode & 0x0f) << 11;
        l_flags |= (m_aa ? 1 : 0) << 10;
        l_flags |= (m_tc ? 1 : 0) << 9;
        l_flags |= (m_rd ? 1 : 0) << 8;
        l_flags |= (m_ra ? 1 : 0) << 7;
        l_flags |= (m_z & 0x07) << 4;
        l_flags |= (m_rcode & 0x0f);
        w_u16(ao_buf, m_id);
        w_u16(ao_buf, l_flags);
        w_u16(ao_buf, 0);
        w_u16(ao_buf, (uint16_t)m_answers.size());
        w_u16(ao_buf, 0);
        w_u16(ao_buf, 0);
        // -------------------------------------------------
        // answers
        // -------------------------------------------------
        name_offset_map_t l_offsets;
        int32_t l_s;
        for (rr_vector_t::const_iterator i_rr = m_answers.begin();
             i_rr != m_answers.end();
             ++i_rr)
        {
                l_s = w_name(ao_buf, l_offsets, i_rr->get_name());
                if (l_s != PKARR_STATUS_OK)
                {
                        PKARR_PERROR("error encoding name: %s", i_rr->get_name().c_str());
                        return PKARR_STATUS_ERR_PACKET;
                }
                w_u16(ao_buf, i_rr->get_type_code());
                w_u16(ao_buf, i_rr->get_class_code());
                w_u32(ao_buf, i_rr->get_ttl());
                size_t l_rdlen_off = ao_buf.length();
                w_u16(ao_buf, 0);
                l_s = w_rdata(ao_buf, l_offsets, *i_rr);
                if (l_s != PKARR_STATUS_OK)
                {
                        PKARR_PERROR("error encoding rdata: %s", i_rr->to_str().c_str());
                        return PKARR_STATUS_ERR_PACKET;
                }
                size_t l_rdlen = ao_buf.length() - l_rdlen_off - 2;
                if (l_rdlen > 0xffff)
                {
                        PKARR_PERROR("rdata too long: %zu", l_rdlen);
                        return PKARR_STATUS_ERR_PACKET;
                }
                ao_buf[l_rdlen_off] = (char)((l_rdlen >> 8) & 0xff);
                ao_buf[l_rdlen_off + 1] = (char)(l_rdlen & 0xff);
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: read (possibly compressed) name at ao_off -ao_off is advanced
//!           past the name as it appears in place
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t packet::r_name(std::string& ao_name,
                       const uint8_t* a_buf,
                       size_t a_len,
                       size_t& ao_off)
{
        ao_name.clear();
        size_t l_off = ao_off;
        size_t l_wire_len = 0;
        uint32_t l_jumps = 0;
        bool l_jumped = false;
        while (true)
        {
                if (l_off >= a_len)
                {
                        TRC_DEBUG("name runs past end of buffer");
                        return PKARR_STATUS_ERROR;
                }
                uint8_t l_len = a_buf[l_off];
                // -----------------------------------------
                // pointer
                // -----------------------------------------
                if ((l_len & _DNS_PTR_MASK) == _DNS_PTR_MASK)
                {
                        if ((l_off + 1) >= a_len)
                        {
                                return PKARR_STATUS_ERROR;
                        }
                        size_t l_ptr = ((size_t)(l_len & 0x3f) << 8) | a_buf[l_off + 1];
                        if (!l_jumped)
                        {
                                ao_off = l_off + 2;
                                l_jumped = true;
                        }
                        if ((++l_jumps > _DNS_MAX_JUMPS) ||
                            (l_ptr >= a_len))
                        {
                                TRC_DEBUG("bad compression pointer: %zu", l_ptr);
                                return PKARR_STATUS_ERROR;
                        }
                        l_off = l_ptr;
                        continue;
                }
                if (l_len & _DNS_PTR_MASK)
                {
                        TRC_DEBUG("unsupported label type: 0x%02x", l_len);
                        return PKARR_STATUS_ERROR;
                }
                // -----------------------------------------
                // root -end
                // -----------------------------------------
                if (!l_len)
                {
                        if (!l_jumped)
                        {
                                ao_off = l_off + 1;
                        }
                        break;
                }
                if ((l_off + 1 + l_len) > a_len)
                {
                        return PKARR_STATUS_ERROR;
                }
                l_wire_len += l_len + 1;
                if (l_wire_len > _DNS_MAX_WIRE_NAME)
                {
                        TRC_DEBUG("name too long");
                        return PKARR_STATUS_ERROR;
                }
                if (!ao_name.empty())
                {
                        ao_name += '.';
                }
                ao_name.append((const char*)(a_buf + l_off + 1), l_len);
                l_off += 1 + l_len;
        }
        ao_name = to_lower(ao_name);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t packet::r_rdata(std::string& ao_rdata,
                        uint16_t a_type,
                        const uint8_t* a_buf,
                        size_t a_len,
                        size_t a_off,
                        size_t a_rdlen)
{
        const uint8_t* l_rd = a_buf + a_off;
        switch (a_type)
        {
        case PKARR_DNS_TYPE_A:
        {
                if (a_rdlen != 4)
                {
                        return PKARR_STATUS_ERROR;
                }
                char l_buf[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, l_rd, l_buf, sizeof(l_buf));
                ao_rdata = l_buf;
                return PKARR_STATUS_OK;
        }
        case PKARR_DNS_TYPE_AAAA:
        {
                if (a_rdlen != 16)
                {
                        return PKARR_STATUS_ERROR;
                }
                char l_buf[INET6_ADDRSTRLEN];
                inet_ntop(AF_INET6, l_rd, l_buf, sizeof(l_buf));
                ao_rdata = l_buf;
                return PKARR_STATUS_OK;
        }
        case PKARR_DNS_TYPE_CNAME:
        case PKARR_DNS_TYPE_NS:
        case PKARR_DNS_TYPE_PTR:
        {
                size_t l_off = a_off;
                int32_t l_s;
                l_s = r_name(ao_rdata, a_buf, a_len, l_off);
                if ((l_s != PKARR_STATUS_OK) ||
                    (l_off != (a_off + a_rdlen)))
                {
                        return PKARR_STATUS_ERROR;
                }
                if (ao_rdata.empty())
                {
                        ao_rdata = ".";
                }
                return PKARR_STATUS_OK;
        }
        case PKARR_DNS_TYPE_TXT:
        {
                ao_rdata.clear();
                size_t l_off = 0;
                while (l_off < a_rdlen)
                {
                        size_t l_chunk = l_rd[l_off];
                        if ((l_off + 1 + l_chunk) > a_rdlen)
                        {
                                return PKARR_STATUS_ERROR;
                        }
                        ao_rdata.append((const char*)(l_rd + l_off + 1), l_chunk);
                        l_off += 1 + l_chunk;
                }
                return PKARR_STATUS_OK;
        }
        default:
        {
                to_generic_rdata(ao_rdata, l_rd, a_rdlen);
                return PKARR_STATUS_OK;
        }
        }
        return PKARR_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: decode from dns wire format -an empty buffer is an empty packet
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_PACKET on malformed input
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t packet::decode(const uint8_t* a_buf, size_t a_len)
{
        clear();
        if (!a_len)
        {
                return PKARR_STATUS_OK;
        }
        if (!a_buf ||
            (a_len < PKARR_DNS_HEADER_SIZE))
        {
                PKARR_PERROR("dns packet too short: %zu", a_len);
                return PKARR_STATUS_ERR_PACKET;
        }
        // -------------------------------------------------
        // header
        // -------------------------------------------------
        m_id = _R_U16(a_buf, 0);
        uint16_t l_flags = _R_U16(a_buf, 2);
        m_qr = (l_flags >> 15) & 0x1;
        m_opcode = (l_flags >> 11) & 0x0f;
        m_aa = (l_flags >> 10) & 0x1;
        m_tc = (l_flags >> 9) & 0x1;
        m_rd = (l_flags >> 8) & 0x1;
        m_ra = (l_flags >> 7) & 0x1;
        m_z = (l_flags >> 4) & 0x07;
        m_rcode = l_flags & 0x0f;
        uint16_t l_qdcount = _R_U16(a_buf, 4);
        uint16_t l_ancount = _R_U16(a_buf, 6);
        size_t l_off = PKARR_DNS_HEADER_SIZE;
        int32_t l_s;
        // -------------------------------------------------
        // skip questions
        // -------------------------------------------------
        for (uint16_t i_q = 0; i_q < l_qdcount; ++i_q)
        {
                std::string l_name;
                l_s = r_name(l_name, a_buf, a_len, l_off);
                if ((l_s != PKARR_STATUS_OK) ||
                    ((l_off + 4) > a_len))
                {
                        PKARR_PERROR("malformed question section");
                        return PKARR_STATUS_ERR_PACKET;
                }
                l_off += 4;
        }
        // -------------------------------------------------
        // answers
        // -------------------------------------------------
        for (uint16_t i_a = 0; i_a < l_ancount; ++i_a)
        {
                std::string l_name;
                l_s = r_name(l_name, a_buf, a_len, l_off);
                if ((l_s != PKARR_STATUS_OK) ||
                    ((l_off + 10) > a_len))
                {
                        PKARR_PERROR("malformed answer %u", i_a);
                        return PKARR_STATUS_ERR_PACKET;
                }
                uint16_t l_type = _R_U16(a_buf, l_off);
                uint16_t l_class = _R_U16(a_buf, l_off + 2);
                uint32_t l_ttl = _R_U32(a_buf, l_off + 4);
                uint16_t l_rdlen = _R_U16(a_buf, l_off + 8);
                l_off += 10;
                if ((l_off + l_rdlen) > a_len)
                {
                        PKARR_PERROR("answer %u rdata runs past end of packet", i_a);
                        return PKARR_STATUS_ERR_PACKET;
                }
                std::string l_rdata;
                l_s = r_rdata(l_rdata, l_type, a_buf, a_len, l_off, l_rdlen);
                if (l_s != PKARR_STATUS_OK)
                {
                        PKARR_PERROR("malformed rdata in answer %u (type: %u)", i_a, l_type);
                        return PKARR_STATUS_ERR_PACKET;
                }
                l_off += l_rdlen;
                resource_record l_rr;
                l_s = l_rr.init(l_name,
                                resource_record::code_to_type(l_type),
                                l_rdata,
                                l_ttl,
                                resource_record::code_to_class(l_class));
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERR_PACKET;
                }
                m_answers.push_back(l_rr);
        }
        return PKARR_STATUS_OK;
}
}
