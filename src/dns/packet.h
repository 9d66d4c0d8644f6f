#ifndef _PKARR_PACKET_H
#define _PKARR_PACKET_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "dns/resource_record.h"
#include <stddef.h>
#include <stdint.h>
#include <map>
#include <string>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PKARR_DNS_HEADER_SIZE 12
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: dns message -header flags + answer section (RFC 1035)
//! ----------------------------------------------------------------------------
class packet
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        packet(void);
        void clear(void);
        void add_answer(const resource_record& a_rr) { m_answers.push_back(a_rr); }
        int32_t encode(std::string& ao_buf) const;
        int32_t decode(const uint8_t* a_buf, size_t a_len);
        // -------------------------------------------------
        // header
        // -------------------------------------------------
        uint16_t m_id;
        bool m_qr;
        uint8_t m_opcode;
        bool m_aa;
        bool m_tc;
        bool m_rd;
        bool m_ra;
        uint8_t m_z;
        uint8_t m_rcode;
        // -------------------------------------------------
        // answers
        // -------------------------------------------------
        rr_vector_t m_answers;
private:
        // -------------------------------------------------
        // types
        // -------------------------------------------------
        typedef std::map<std::string, uint16_t> name_offset_map_t;
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        static void w_u16(std::string& ao_buf, uint16_t a_val);
        static void w_u32(std::string& ao_buf, uint32_t a_val);
        static int32_t w_name(std::string& ao_buf,
                              name_offset_map_t& ao_offsets,
                              const std::string& a_name);
        static int32_t w_rdata(std::string& ao_buf,
                               name_offset_map_t& ao_offsets,
                               const resource_record& a_rr);
        static int32_t r_name(std::string& ao_name,
                              const uint8_t* a_buf,
                              size_t a_len,
                              size_t& ao_off);
        static int32_t r_rdata(std::string& ao_rdata,
                               uint16_t a_type,
                               const uint8_t* a_buf,
                               size_t a_len,
                               size_t a_off,
                               size_t a_rdlen);
};
}
#endif
