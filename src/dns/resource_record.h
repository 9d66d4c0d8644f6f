#ifndef _PKARR_RESOURCE_RECORD_H
#define _PKARR_RESOURCE_RECORD_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include <stdint.h>
#include <string>
#include <vector>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PKARR_DNS_TYPE_A           1
#define PKARR_DNS_TYPE_NS          2
#define PKARR_DNS_TYPE_CNAME       5
#define PKARR_DNS_TYPE_PTR        12
#define PKARR_DNS_TYPE_TXT        16
#define PKARR_DNS_TYPE_AAAA       28
#define PKARR_DNS_CLASS_IN         1
#define PKARR_DNS_MAX_NAME_LEN   253
#define PKARR_DNS_MAX_LABEL_LEN   63
#define PKARR_DNS_MAX_STRING_LEN 255
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: single dns answer record
//!           name: lower case, no trailing dot ("" is the root)
//!           class/type: upper case mnemonic (or CLASS<n>/TYPE<n>)
//!           rdata: presentation form -A/AAAA address, CNAME/NS/PTR name,
//!                  TXT raw text, anything else RFC 3597 "\# <len> <hex>"
//! ----------------------------------------------------------------------------
class resource_record
{
public:
        // -------------------------------------------------
        // public static methods
        // -------------------------------------------------
        static int32_t type_to_code(const std::string& a_type, uint16_t& ao_code);
        static std::string code_to_type(uint16_t a_code);
        static int32_t class_to_code(const std::string& a_class, uint16_t& ao_code);
        static std::string code_to_class(uint16_t a_code);
        static int32_t normalize_domain_name(std::string& ao_name, const std::string& a_name);
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        resource_record(void);
        int32_t init(const std::string& a_name,
                     const std::string& a_type,
                     const std::string& a_rdata,
                     uint32_t a_ttl,
                     const std::string& a_class = "IN");
        int32_t parse(const std::string& a_str);
        const std::string& get_name(void) const { return m_name; }
        const std::string& get_class(void) const { return m_class; }
        const std::string& get_type(void) const { return m_type; }
        const std::string& get_rdata(void) const { return m_rdata; }
        uint32_t get_ttl(void) const { return m_ttl; }
        uint16_t get_type_code(void) const { return m_type_code; }
        uint16_t get_class_code(void) const { return m_class_code; }
        std::string to_str(void) const;
        bool operator==(const resource_record& a_rhs) const;
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        int32_t validate_rdata(std::string& ao_rdata, const std::string& a_rdata);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        std::string m_name;
        std::string m_class;
        std::string m_type;
        uint32_t m_ttl;
        std::string m_rdata;
        uint16_t m_type_code;
        uint16_t m_class_code;
};
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef std::vector<resource_record> rr_vector_t;
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
int32_t parse_generic_rdata(std::string& ao_bytes, const std::string& a_rdata);
void to_generic_rdata(std::string& ao_rdata, const uint8_t* a_buf, size_t a_len);
}
#endif
