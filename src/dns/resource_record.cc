//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "dns/resource_record.h"
#include "support/trace.h"
#include "support/util.h"
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <arpa/inet.h>
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef struct _mnemonic {
        const char* m_str;
        uint16_t m_code;
} mnemonic_t;
//! ----------------------------------------------------------------------------
//! tables
//! ----------------------------------------------------------------------------
static const mnemonic_t s_type_table[] = {
        { "A",      PKARR_DNS_TYPE_A },
        { "NS",     PKARR_DNS_TYPE_NS },
        { "CNAME",  PKARR_DNS_TYPE_CNAME },
        { "SOA",    6 },
        { "PTR",    PKARR_DNS_TYPE_PTR },
        { "MX",     15 },
        { "TXT",    PKARR_DNS_TYPE_TXT },
        { "AAAA",   PKARR_DNS_TYPE_AAAA },
        { "SRV",    33 },
        { "SVCB",   64 },
        { "HTTPS",  65 },
};
static const mnemonic_t s_class_table[] = {
        { "IN",     PKARR_DNS_CLASS_IN },
        { "CH",     3 },
        { "HS",     4 },
};
#define _ARRAY_SIZE(_a) (sizeof(_a)/sizeof((_a)[0]))
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: lookup mnemonic or "<prefix><n>" form
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _mnemonic_to_code(const mnemonic_t* a_table,
                                 size_t a_table_len,
                                 const char* a_prefix,
                                 const std::string& a_str,
                                 uint16_t& ao_code)
{
        std::string l_str = to_upper(a_str);
        for (size_t i_m = 0; i_m < a_table_len; ++i_m)
        {
                if (l_str == a_table[i_m].m_str)
                {
                        ao_code = a_table[i_m].m_code;
                        return PKARR_STATUS_OK;
                }
        }
        size_t l_prefix_len = strlen(a_prefix);
        if ((l_str.length() <= l_prefix_len) ||
            (l_str.compare(0, l_prefix_len, a_prefix) != 0))
        {
                return PKARR_STATUS_ERROR;
        }
        const char* l_num = l_str.c_str() + l_prefix_len;
        char* l_end = nullptr;
        errno = 0;
        unsigned long l_val = strtoul(l_num, &l_end, 10);
        if ((errno != 0) ||
            (*l_end != '\0') ||
            !isdigit((int)l_num[0]) ||
            (l_val > 65535))
        {
                return PKARR_STATUS_ERROR;
        }
        ao_code = (uint16_t)l_val;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static std::string _code_to_mnemonic(const mnemonic_t* a_table,
                                     size_t a_table_len,
                                     const char* a_prefix,
                                     uint16_t a_code)
{
        for (size_t i_m = 0; i_m < a_table_len; ++i_m)
        {
                if (a_table[i_m].m_code == a_code)
                {
                        return a_table[i_m].m_str;
                }
        }
        char l_buf[32];
        snprintf(l_buf, sizeof(l_buf), "%s%u", a_prefix, (unsigned int)a_code);
        return l_buf;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::type_to_code(const std::string& a_type, uint16_t& ao_code)
{
        return _mnemonic_to_code(s_type_table, _ARRAY_SIZE(s_type_table), "TYPE", a_type, ao_code);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string resource_record::code_to_type(uint16_t a_code)
{
        return _code_to_mnemonic(s_type_table, _ARRAY_SIZE(s_type_table), "TYPE", a_code);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::class_to_code(const std::string& a_class, uint16_t& ao_code)
{
        return _mnemonic_to_code(s_class_table, _ARRAY_SIZE(s_class_table), "CLASS", a_class, ao_code);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string resource_record::code_to_class(uint16_t a_code)
{
        return _code_to_mnemonic(s_class_table, _ARRAY_SIZE(s_class_table), "CLASS", a_code);
}
//! ----------------------------------------------------------------------------
//! \details: lower case, strip trailing dot, check label/name lengths
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::normalize_domain_name(std::string& ao_name, const std::string& a_name)
{
        std::string l_name = to_lower(a_name);
        if (!l_name.empty() &&
            (l_name[l_name.length() - 1] == '.'))
        {
                l_name.erase(l_name.length() - 1);
        }
        if (l_name.length() > PKARR_DNS_MAX_NAME_LEN)
        {
                TRC_DEBUG("name too long: %zu", l_name.length());
                return PKARR_STATUS_ERROR;
        }
        size_t l_label_len = 0;
        for (size_t i_c = 0; i_c < l_name.length(); ++i_c)
        {
                unsigned char l_c = (unsigned char)l_name[i_c];
                if (l_c == '.')
                {
                        if (!l_label_len)
                        {
                                TRC_DEBUG("empty label in name: %s", a_name.c_str());
                                return PKARR_STATUS_ERROR;
                        }
                        l_label_len = 0;
                        continue;
                }
                if (!isgraph(l_c))
                {
                        TRC_DEBUG("invalid character in name: %s", a_name.c_str());
                        return PKARR_STATUS_ERROR;
                }
                if (++l_label_len > PKARR_DNS_MAX_LABEL_LEN)
                {
                        TRC_DEBUG("label too long in name: %s", a_name.c_str());
                        return PKARR_STATUS_ERROR;
                }
        }
        ao_name = l_name;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: parse RFC 3597 "\# <len> <hex...>" into raw bytes
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t parse_generic_rdata(std::string& ao_bytes, const std::string& a_rdata)
{
        str_vector_t l_toks;
        split_str(l_toks, a_rdata, ' ');
        if ((l_toks.size() < 2) ||
            (l_toks[0] != "\\#"))
        {
                return PKARR_STATUS_ERROR;
        }
        char* l_end = nullptr;
        errno = 0;
        unsigned long l_len = strtoul(l_toks[1].c_str(), &l_end, 10);
        if ((errno != 0) ||
            (*l_end != '\0') ||
            (l_len > 65535))
        {
                return PKARR_STATUS_ERROR;
        }
        std::string l_hex;
        for (size_t i_t = 2; i_t < l_toks.size(); ++i_t)
        {
                l_hex += l_toks[i_t];
        }
        if (l_hex.length() != l_len*2)
        {
                return PKARR_STATUS_ERROR;
        }
        if (!l_len)
        {
                ao_bytes.clear();
                return PKARR_STATUS_OK;
        }
        return hex2bin_str(ao_bytes, l_hex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void to_generic_rdata(std::string& ao_rdata, const uint8_t* a_buf, size_t a_len)
{
        char l_len_str[16];
        snprintf(l_len_str, sizeof(l_len_str), "%zu", a_len);
        ao_rdata = "\\# ";
        ao_rdata += l_len_str;
        if (a_len)
        {
                std::string l_hex;
                bin2hex_str(l_hex, a_buf, a_len);
                ao_rdata += " ";
                ao_rdata += l_hex;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
resource_record::resource_record(void):
        m_name(),
        m_class("IN"),
        m_type(),
        m_ttl(0),
        m_rdata(),
        m_type_code(0),
        m_class_code(PKARR_DNS_CLASS_IN)
{
}
//! ----------------------------------------------------------------------------
//! \details: validate and set all fields
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_PACKET on invalid field
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::init(const std::string& a_name,
                              const std::string& a_type,
                              const std::string& a_rdata,
                              uint32_t a_ttl,
                              const std::string& a_class)
{
        int32_t l_s;
        std::string l_name;
        l_s = normalize_domain_name(l_name, a_name);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid record name: %s", a_name.c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        uint16_t l_type_code = 0;
        l_s = type_to_code(a_type, l_type_code);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid record type: %s", a_type.c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        uint16_t l_class_code = 0;
        l_s = class_to_code(a_class, l_class_code);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid record class: %s", a_class.c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        m_type_code = l_type_code;
        m_class_code = l_class_code;
        m_type = code_to_type(l_type_code);
        m_class = code_to_class(l_class_code);
        std::string l_rdata;
        l_s = validate_rdata(l_rdata, a_rdata);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("invalid rdata for %s record: '%s'", m_type.c_str(), a_rdata.c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        m_name = l_name;
        m_ttl = a_ttl;
        m_rdata = l_rdata;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: type specific rdata checks -sets normalized form
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::validate_rdata(std::string& ao_rdata, const std::string& a_rdata)
{
        int l_s;
        switch (m_type_code)
        {
        // -------------------------------------------------
        // A
        // -------------------------------------------------
        case PKARR_DNS_TYPE_A:
        {
                struct in_addr l_addr;
                l_s = inet_pton(AF_INET, a_rdata.c_str(), &l_addr);
                if (l_s != 1)
                {
                        return PKARR_STATUS_ERROR;
                }
                char l_buf[INET_ADDRSTRLEN];
                inet_ntop(AF_INET, &l_addr, l_buf, sizeof(l_buf));
                ao_rdata = l_buf;
                return PKARR_STATUS_OK;
        }
        // -------------------------------------------------
        // AAAA
        // -------------------------------------------------
        case PKARR_DNS_TYPE_AAAA:
        {
                struct in6_addr l_addr;
                l_s = inet_pton(AF_INET6, a_rdata.c_str(), &l_addr);
                if (l_s != 1)
                {
                        return PKARR_STATUS_ERROR;
                }
                char l_buf[INET6_ADDRSTRLEN];
                inet_ntop(AF_INET6, &l_addr, l_buf, sizeof(l_buf));
                ao_rdata = l_buf;
                return PKARR_STATUS_OK;
        }
        // -------------------------------------------------
        // names
        // -------------------------------------------------
        case PKARR_DNS_TYPE_CNAME:
        case PKARR_DNS_TYPE_NS:
        case PKARR_DNS_TYPE_PTR:
        {
                if (a_rdata.empty())
                {
                        return PKARR_STATUS_ERROR;
                }
                return normalize_domain_name(ao_rdata, a_rdata);
        }
        // -------------------------------------------------
        // TXT
        // -------------------------------------------------
        case PKARR_DNS_TYPE_TXT:
        {
                std::string l_txt = a_rdata;
                if ((l_txt.length() >= 2) &&
                    (l_txt[0] == '"') &&
                    (l_txt[l_txt.length() - 1] == '"'))
                {
                        l_txt = l_txt.substr(1, l_txt.length() - 2);
                }
                // chunked on encode: each chunk <= 255 bytes
                if (l_txt.length() > PKARR_MAX_ENCODED_PACKET_SIZE)
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_rdata = l_txt;
                return PKARR_STATUS_OK;
        }
        // -------------------------------------------------
        // everything else -RFC 3597 generic
        // -------------------------------------------------
        default:
        {
                std::string l_bytes;
                l_s = parse_generic_rdata(l_bytes, a_rdata);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                to_generic_rdata(ao_rdata, (const uint8_t*)l_bytes.data(), l_bytes.length());
                return PKARR_STATUS_OK;
        }
        }
        return PKARR_STATUS_ERROR;
}
//! ----------------------------------------------------------------------------
//! \details: parse "name ttl [class] type rdata"
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t resource_record::parse(const std::string& a_str)
{
        // -------------------------------------------------
        // tokenize -keep offsets so rdata keeps its spaces
        // -------------------------------------------------
        std::vector<size_t> l_offs;
        str_vector_t l_toks;
        size_t i_c = 0;
        while (i_c < a_str.length())
        {
                while ((i_c < a_str.length()) && isspace((unsigned char)a_str[i_c])) { ++i_c; }
                if (i_c >= a_str.length())
                {
                        break;
                }
                size_t l_begin = i_c;
                while ((i_c < a_str.length()) && !isspace((unsigned char)a_str[i_c])) { ++i_c; }
                l_offs.push_back(l_begin);
                l_toks.push_back(a_str.substr(l_begin, i_c - l_begin));
        }
        if (l_toks.size() < 4)
        {
                PKARR_PERROR("invalid record: '%s' (expect: name ttl [class] type rdata)", a_str.c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        // -------------------------------------------------
        // ttl
        // -------------------------------------------------
        char* l_end = nullptr;
        errno = 0;
        unsigned long long l_ttl = strtoull(l_toks[1].c_str(), &l_end, 10);
        if ((errno != 0) ||
            (*l_end != '\0') ||
            !isdigit((int)l_toks[1][0]) ||
            (l_ttl > 0xffffffffULL))
        {
                PKARR_PERROR("invalid record ttl: '%s'", l_toks[1].c_str());
                return PKARR_STATUS_ERR_PACKET;
        }
        // -------------------------------------------------
        // optional class
        // -------------------------------------------------
        std::string l_class = "IN";
        size_t l_type_idx = 2;
        uint16_t l_code;
        if ((l_toks.size() >= 5) &&
            (class_to_code(l_toks[2], l_code) == PKARR_STATUS_OK))
        {
                l_class = l_toks[2];
                l_type_idx = 3;
        }
        std::string l_rdata = a_str.substr(l_offs[l_type_idx + 1]);
        while (!l_rdata.empty() &&
               isspace((unsigned char)l_rdata[l_rdata.length() - 1]))
        {
                l_rdata.erase(l_rdata.length() - 1);
        }
        return init(l_toks[0], l_toks[l_type_idx], l_rdata, (uint32_t)l_ttl, l_class);
}
//! ----------------------------------------------------------------------------
//! \details: "name ttl class type rdata"
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string resource_record::to_str(void) const
{
        char l_ttl_str[16];
        snprintf(l_ttl_str, sizeof(l_ttl_str), "%u", m_ttl);
        std::string l_str;
        l_str += m_name.empty() ? "." : m_name;
        l_str += " ";
        l_str += l_ttl_str;
        l_str += " ";
        l_str += m_class;
        l_str += " ";
        l_str += m_type;
        l_str += " ";
        if (m_type_code == PKARR_DNS_TYPE_TXT)
        {
                l_str += "\"";
                l_str += m_rdata;
                l_str += "\"";
        }
        else
        {
                l_str += m_rdata;
        }
        return l_str;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool resource_record::operator==(const resource_record& a_rhs) const
{
        return (m_name == a_rhs.m_name) &&
               (m_type_code == a_rhs.m_type_code) &&
               (m_class_code == a_rhs.m_class_code) &&
               (m_ttl == a_rhs.m_ttl) &&
               (m_rdata == a_rhs.m_rdata);
}
}
