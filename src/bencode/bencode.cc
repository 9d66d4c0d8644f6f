//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "bencode/bencode.h"
#include "support/trace.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stdlib.h>
#include <string.h>
#include <errno.h>
#include <ctype.h>
#include <inttypes.h>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define _MAX_LEN_DIGITS 10
#define _MAX_INT_DIGITS 20
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! "bencoding types"
//! ref: http://www.bittorrent.org/beps/bep_0003.html
//! ----------------------------------------------------------------------------
//! strings:      <len>:<bytes>          4:spam
//! integers:     i<base 10>e            i3e i-3e (no i-0e, no leading zeros)
//! lists:        l<elements>e           l4:spam4:eggse
//! dictionaries: d<key><value>...e      d3:cow3:mooe (keys sorted raw strings)
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! static util
//! ----------------------------------------------------------------------------
static void delete_obj(be_obj_t& ao_obj);
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_list(be_list_t& ao_list)
{
        for(auto && i_m : ao_list)
        {
                delete_obj(i_m);
        }
        ao_list.clear();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_dict(be_dict_t& ao_dict)
{
        for(auto && i_m : ao_dict)
        {
                delete_obj(i_m.second);
        }
        ao_dict.clear();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static void delete_obj(be_obj_t& ao_obj)
{
        switch (ao_obj.m_type)
        {
        case BE_OBJ_INT:
        {
                delete (be_int_t*)ao_obj.m_obj;
                break;
        }
        case BE_OBJ_STRING:
        {
                delete (be_string_t*)ao_obj.m_obj;
                break;
        }
        case BE_OBJ_MUTABLE_STRING:
        {
                be_mutable_string_t* l_obj = (be_mutable_string_t*)ao_obj.m_obj;
                if (l_obj->m_data)
                {
                        free(l_obj->m_data);
                        l_obj->m_data = nullptr;
                }
                delete l_obj;
                break;
        }
        case BE_OBJ_LIST:
        {
                be_list_t* l_obj = (be_list_t*)ao_obj.m_obj;
                delete_list(*l_obj);
                delete l_obj;
                break;
        }
        case BE_OBJ_DICT:
        {
                be_dict_t* l_obj = (be_dict_t*)ao_obj.m_obj;
                delete_dict(*l_obj);
                delete l_obj;
                break;
        }
        default:
        {
                break;
        }
        }
        ao_obj.m_type = BE_OBJ_NONE;
        ao_obj.m_obj = nullptr;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static const be_obj_t* dict_get(const be_dict_t& a_dict,
                                const std::string& a_key,
                                be_obj_type_t a_type)
{
        be_dict_t::const_iterator i_obj = a_dict.find(a_key);
        if ((i_obj == a_dict.end()) ||
            (i_obj->second.m_type != a_type))
        {
                return nullptr;
        }
        return &(i_obj->second);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const be_string_t* be_dict_get_string(const be_dict_t& a_dict, const std::string& a_key)
{
        const be_obj_t* l_obj = dict_get(a_dict, a_key, BE_OBJ_STRING);
        return l_obj ? (const be_string_t*)l_obj->m_obj : nullptr;
}
const be_int_t* be_dict_get_int(const be_dict_t& a_dict, const std::string& a_key)
{
        const be_obj_t* l_obj = dict_get(a_dict, a_key, BE_OBJ_INT);
        return l_obj ? (const be_int_t*)l_obj->m_obj : nullptr;
}
const be_list_t* be_dict_get_list(const be_dict_t& a_dict, const std::string& a_key)
{
        const be_obj_t* l_obj = dict_get(a_dict, a_key, BE_OBJ_LIST);
        return l_obj ? (const be_list_t*)l_obj->m_obj : nullptr;
}
const be_dict_t* be_dict_get_dict(const be_dict_t& a_dict, const std::string& a_key)
{
        const be_obj_t* l_obj = dict_get(a_dict, a_key, BE_OBJ_DICT);
        return l_obj ? (const be_dict_t*)l_obj->m_obj : nullptr;
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                          B D E C O D E
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bdecode::bdecode(void):
        m_dict(),
        m_buf(nullptr),
        m_buf_len(0),
        m_cur_off(0)
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bdecode::~bdecode(void)
{
        reset();
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bdecode::reset(void)
{
        delete_dict(m_dict);
        if (m_buf)
        {
                free(m_buf);
                m_buf = nullptr;
        }
        m_buf_len = 0;
        m_cur_off = 0;
}
//! ----------------------------------------------------------------------------
//! \details: decode buffer (copied) -must hold exactly one dictionary
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERROR on malformed/truncated input
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::init(const char* a_buf, size_t a_len)
{
        reset();
        if (!a_buf ||
            !a_len)
        {
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // copy in
        // -------------------------------------------------
        m_buf = (char *)malloc(sizeof(char)*a_len);
        if (!m_buf)
        {
                return PKARR_STATUS_ERROR;
        }
        memcpy(m_buf, a_buf, a_len);
        m_buf_len = a_len;
        // -------------------------------------------------
        // verify dict
        // -------------------------------------------------
        if (cur() != 'd')
        {
                TRC_DEBUG("buffer does not appear to bdecode a dict -no preceding 'd'");
                reset();
                return PKARR_STATUS_ERROR;
        }
        ++m_cur_off;
        int32_t l_s;
        l_s = parse_dict(m_dict, 1);
        if (l_s != PKARR_STATUS_OK)
        {
                reset();
                return PKARR_STATUS_ERROR;
        }
        if (!at_end())
        {
                TRC_DEBUG("trailing data after dict: %zu bytes", m_buf_len - m_cur_off);
                reset();
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_len(size_t& ao_len)
{
        // -------------------------------------------------
        // digits
        // -------------------------------------------------
        size_t l_begin = m_cur_off;
        while (!at_end() &&
               isdigit((unsigned char)cur()))
        {
                ++m_cur_off;
        }
        size_t l_digits = m_cur_off - l_begin;
        if (!l_digits ||
            (l_digits > _MAX_LEN_DIGITS))
        {
                TRC_DEBUG("bad string length at offset: %zu", l_begin);
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // find skip delim
        // -------------------------------------------------
        if (at_end() ||
            (cur() != ':'))
        {
                TRC_DEBUG("missing ':' at offset: %zu", m_cur_off);
                return PKARR_STATUS_ERROR;
        }
        ++m_cur_off;
        // -------------------------------------------------
        // convert len
        // -------------------------------------------------
        std::string l_str(m_buf + l_begin, l_digits);
        errno = 0;
        unsigned long long l_len = strtoull(l_str.c_str(), nullptr, 10);
        if (errno != 0)
        {
                TRC_DEBUG("errno != 0 [%d]", errno);
                return PKARR_STATUS_ERROR;
        }
        if (l_len > (m_buf_len - m_cur_off))
        {
                TRC_DEBUG("string length %llu exceeds remaining %zu bytes",
                          l_len, m_buf_len - m_cur_off);
                return PKARR_STATUS_ERROR;
        }
        ao_len = (size_t)l_len;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_obj(be_obj_t& ao_obj, uint32_t a_depth)
{
        if (at_end())
        {
                TRC_DEBUG("truncated input");
                return PKARR_STATUS_ERROR;
        }
        if (a_depth > PKARR_BENCODE_MAX_DEPTH)
        {
                TRC_DEBUG("nesting too deep: %u", a_depth);
                return PKARR_STATUS_ERROR;
        }
        int32_t l_s = PKARR_STATUS_OK;
        ao_obj.m_ptr = m_buf + m_cur_off;
        char l_type = cur();
        // -------------------------------------------------
        // string
        // -------------------------------------------------
        if (isdigit((unsigned char)l_type))
        {
                be_string_t* l_str = new be_string_t();
                l_s = parse_string(*l_str);
                if (l_s != PKARR_STATUS_OK)
                {
                        delete l_str;
                        return PKARR_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_STRING;
                ao_obj.m_obj = l_str;
        }
        // -------------------------------------------------
        // integer
        // -------------------------------------------------
        else if (l_type == 'i')
        {
                ++m_cur_off;
                be_int_t* l_int = new be_int_t();
                l_s = parse_int(*l_int);
                if (l_s != PKARR_STATUS_OK)
                {
                        delete l_int;
                        return PKARR_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_INT;
                ao_obj.m_obj = l_int;
        }
        // -------------------------------------------------
        // list
        // -------------------------------------------------
        else if (l_type == 'l')
        {
                ++m_cur_off;
                be_list_t* l_list = new be_list_t();
                l_s = parse_list(*l_list, a_depth + 1);
                if (l_s != PKARR_STATUS_OK)
                {
                        delete_list(*l_list);
                        delete l_list;
                        return PKARR_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_LIST;
                ao_obj.m_obj = l_list;
        }
        // -------------------------------------------------
        // dictionary
        // -------------------------------------------------
        else if (l_type == 'd')
        {
                ++m_cur_off;
                be_dict_t* l_dict = new be_dict_t();
                l_s = parse_dict(*l_dict, a_depth + 1);
                if (l_s != PKARR_STATUS_OK)
                {
                        delete_dict(*l_dict);
                        delete l_dict;
                        return PKARR_STATUS_ERROR;
                }
                ao_obj.m_type = BE_OBJ_DICT;
                ao_obj.m_obj = l_dict;
        }
        else
        {
                TRC_DEBUG("unexpected type char '%c' at offset: %zu", l_type, m_cur_off);
                return PKARR_STATUS_ERROR;
        }
        ao_obj.m_len = (m_buf + m_cur_off) - ao_obj.m_ptr;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_int(be_int_t& ao_int)
{
        size_t l_begin = m_cur_off;
        if (!at_end() &&
            (cur() == '-'))
        {
                ++m_cur_off;
        }
        size_t l_digit_begin = m_cur_off;
        while (!at_end() &&
               isdigit((unsigned char)cur()))
        {
                ++m_cur_off;
        }
        size_t l_digits = m_cur_off - l_digit_begin;
        if (at_end() ||
            (cur() != 'e'))
        {
                TRC_DEBUG("missing 'e' after int at offset: %zu", m_cur_off);
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // validate: no empty, no leading zeros, no -0
        // -------------------------------------------------
        if (!l_digits ||
            (l_digits > _MAX_INT_DIGITS) ||
            ((l_digits > 1) && (m_buf[l_digit_begin] == '0')) ||
            ((l_digit_begin != l_begin) && (m_buf[l_digit_begin] == '0')))
        {
                TRC_DEBUG("invalid int at offset: %zu", l_begin);
                return PKARR_STATUS_ERROR;
        }
        std::string l_str(m_buf + l_begin, m_cur_off - l_begin);
        ++m_cur_off;
        errno = 0;
        long long l_val = strtoll(l_str.c_str(), nullptr, 10);
        if (errno != 0)
        {
                TRC_DEBUG("errno != 0 [%d]", errno);
                return PKARR_STATUS_ERROR;
        }
        ao_int = (be_int_t)l_val;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: string references decoder's buffer (no copy)
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_string(be_string_t& ao_string)
{
        size_t l_len;
        int32_t l_s;
        l_s = parse_len(l_len);
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        ao_string.m_data = m_buf + m_cur_off;
        ao_string.m_len = (uint32_t)l_len;
        m_cur_off += l_len;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_list(be_list_t& ao_list, uint32_t a_depth)
{
        int32_t l_s;
        while (true)
        {
                if (at_end())
                {
                        TRC_DEBUG("truncated list");
                        return PKARR_STATUS_ERROR;
                }
                if (cur() == 'e')
                {
                        ++m_cur_off;
                        break;
                }
                be_obj_t l_be_obj;
                l_s = parse_obj(l_be_obj, a_depth);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_list.push_back(l_be_obj);
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t bdecode::parse_dict(be_dict_t& ao_dict, uint32_t a_depth)
{
        int32_t l_s;
        while (true)
        {
                if (at_end())
                {
                        TRC_DEBUG("truncated dict");
                        return PKARR_STATUS_ERROR;
                }
                if (cur() == 'e')
                {
                        ++m_cur_off;
                        break;
                }
                // -----------------------------------------
                // key
                // -----------------------------------------
                be_string_t l_key;
                l_s = parse_string(l_key);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                std::string l_key_str(l_key.m_data, l_key.m_len);
                // -----------------------------------------
                // value
                // -----------------------------------------
                be_obj_t l_be_obj;
                l_s = parse_obj(l_be_obj, a_depth);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                // -----------------------------------------
                // last duplicate wins
                // -----------------------------------------
                be_dict_t::iterator i_obj = ao_dict.find(l_key_str);
                if (i_obj != ao_dict.end())
                {
                        delete_obj(i_obj->second);
                }
                ao_dict[l_key_str] = l_be_obj;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                    B E N C O D E   W R I T E R
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bencode_writer::bencode_writer(void):
        m_root(),
        m_dict(),
        m_cur_key(),
        m_cur_obj(nullptr),
        m_data()
{
        m_root.m_obj = (be_obj_ptr_t)(&m_dict);
        m_root.m_type = BE_OBJ_DICT;
        m_cur_obj = &m_root;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bencode_writer::~bencode_writer(void)
{
        delete_dict(m_dict);
}
//! ----------------------------------------------------------------------------
//! \details: add obj to current container -under pending key for dicts
//!           (replacing any existing value)
//! \return:  pointer to stored obj or nullptr (obj is deleted) on error
//! \param:   TODO
//! ----------------------------------------------------------------------------
be_obj_t* bencode_writer::append(be_obj_t& a_obj)
{
        a_obj.m_parent = m_cur_obj;
        if (m_cur_obj->m_type == BE_OBJ_LIST)
        {
                be_list_t* l_plist = (be_list_t*)(m_cur_obj->m_obj);
                l_plist->push_back(a_obj);
                return &(l_plist->back());
        }
        if ((m_cur_obj->m_type == BE_OBJ_DICT) &&
            !m_cur_key.empty())
        {
                be_dict_t* l_pdict = (be_dict_t*)(m_cur_obj->m_obj);
                be_dict_t::iterator i_obj = l_pdict->find(m_cur_key);
                if (i_obj != l_pdict->end())
                {
                        delete_obj(i_obj->second);
                }
                be_obj_t& l_stored = (*l_pdict)[m_cur_key];
                l_stored = a_obj;
                m_cur_key.clear();
                return &l_stored;
        }
        TRC_ERROR("no key set for dict value");
        delete_obj(a_obj);
        return nullptr;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_start_dict(void)
{
        be_obj_t l_obj;
        l_obj.m_obj = new be_dict_t();
        l_obj.m_type = BE_OBJ_DICT;
        be_obj_t* l_stored = append(l_obj);
        if (l_stored)
        {
                m_cur_obj = l_stored;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_end_dict(void)
{
        if ((m_cur_obj == &m_root) ||
            (m_cur_obj->m_type != BE_OBJ_DICT))
        {
                TRC_ERROR("unbalanced end dict");
                return;
        }
        m_cur_obj = m_cur_obj->m_parent;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_start_list(void)
{
        be_obj_t l_obj;
        l_obj.m_obj = new be_list_t();
        l_obj.m_type = BE_OBJ_LIST;
        be_obj_t* l_stored = append(l_obj);
        if (l_stored)
        {
                m_cur_obj = l_stored;
        }
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_end_list(void)
{
        if (m_cur_obj->m_type != BE_OBJ_LIST)
        {
                TRC_ERROR("unbalanced end list");
                return;
        }
        m_cur_obj = m_cur_obj->m_parent;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_key(const std::string& a_key)
{
        m_cur_key = a_key;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_string(const std::string& a_str)
{
        w_string(a_str.data(), a_str.length());
}
//! ----------------------------------------------------------------------------
//! \details: binary safe
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_string(const char* a_buf, size_t a_len)
{
        be_mutable_string_t* l_str = new be_mutable_string_t();
        if (a_len)
        {
                l_str->m_data = (char*)malloc(a_len);
                memcpy(l_str->m_data, a_buf, a_len);
        }
        l_str->m_len = (uint32_t)a_len;
        be_obj_t l_obj;
        l_obj.m_obj = l_str;
        l_obj.m_type = BE_OBJ_MUTABLE_STRING;
        append(l_obj);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::w_int(int64_t a_val)
{
        be_int_t* l_int = new be_int_t();
        *l_int = a_val;
        be_obj_t l_obj;
        l_obj.m_obj = l_int;
        l_obj.m_type = BE_OBJ_INT;
        append(l_obj);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::serialize(std::string& ao_buf)
{
        m_data.clear();
        s_dict(m_dict);
        ao_buf = m_data;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::s_dict(const be_dict_t& a_dict)
{
        m_data += 'd';
        for(auto && i_m : a_dict)
        {
                char l_len_str[32];
                snprintf(l_len_str, sizeof(l_len_str), "%zu:", i_m.first.length());
                m_data += l_len_str;
                m_data += i_m.first;
                s_obj(i_m.second);
        }
        m_data += 'e';
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::s_list(const be_list_t& a_list)
{
        m_data += 'l';
        for(auto && i_m : a_list)
        {
                s_obj(i_m);
        }
        m_data += 'e';
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void bencode_writer::s_obj(const be_obj_t& a_obj)
{
        switch (a_obj.m_type)
        {
        case BE_OBJ_INT:
        {
                const be_int_t& l_obj = *((const be_int_t*)a_obj.m_obj);
                char l_int_str[32];
                snprintf(l_int_str, sizeof(l_int_str), "i%" PRId64 "e", l_obj);
                m_data += l_int_str;
                break;
        }
        case BE_OBJ_MUTABLE_STRING:
        {
                const be_mutable_string_t& l_obj = *((const be_mutable_string_t*)a_obj.m_obj);
                char l_len_str[32];
                snprintf(l_len_str, sizeof(l_len_str), "%u:", l_obj.m_len);
                m_data += l_len_str;
                if (l_obj.m_len)
                {
                        m_data.append(l_obj.m_data, l_obj.m_len);
                }
                break;
        }
        case BE_OBJ_LIST:
        {
                s_list(*((const be_list_t*)a_obj.m_obj));
                break;
        }
        case BE_OBJ_DICT:
        {
                s_dict(*((const be_dict_t*)a_obj.m_obj));
                break;
        }
        default:
        {
                break;
        }
        }
}
}
