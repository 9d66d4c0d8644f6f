#ifndef _PKARR_BENCODE_H
#define _PKARR_BENCODE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// pkarr external
// ---------------------------------------------------------
#include "pkarr/def.h"
// ---------------------------------------------------------
// pkarr internal
// ---------------------------------------------------------
#include "support/data.h"
// ---------------------------------------------------------
// std libs
// ---------------------------------------------------------
#include <stddef.h>
#include <stdint.h>
#include <list>
#include <map>
#include <string>
#include <vector>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PKARR_BENCODE_MAX_DEPTH 32
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! enum
//! ----------------------------------------------------------------------------
typedef enum {
  BE_OBJ_NONE = 0,
  BE_OBJ_STRING,
  BE_OBJ_INT,
  BE_OBJ_LIST,
  BE_OBJ_DICT,
  BE_OBJ_MUTABLE_STRING,
} be_obj_type_t;
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef void* be_obj_ptr_t;
// -----------------------------------------------
// obj
// -----------------------------------------------
typedef struct _be_obj {
  be_obj_type_t m_type;
  be_obj_ptr_t m_obj;
  char* m_ptr;
  size_t m_len;
  _be_obj* m_parent;
  _be_obj():
    m_type(BE_OBJ_NONE),
    m_obj(nullptr),
    m_ptr(nullptr),
    m_len(0),
    m_parent(nullptr)
  {}
} be_obj_t;
typedef std::map<std::string, be_obj_t> be_dict_t;
typedef std::list<be_obj_t> be_list_t;
typedef data_t be_string_t;
typedef mutable_data_t be_mutable_string_t;
typedef int64_t be_int_t;
//! ----------------------------------------------------------------------------
//! dict accessors -return nullptr if missing or of another type
//! ----------------------------------------------------------------------------
const be_string_t* be_dict_get_string(const be_dict_t& a_dict, const std::string& a_key);
const be_int_t* be_dict_get_int(const be_dict_t& a_dict, const std::string& a_key);
const be_list_t* be_dict_get_list(const be_dict_t& a_dict, const std::string& a_key);
const be_dict_t* be_dict_get_dict(const be_dict_t& a_dict, const std::string& a_key);
//! ----------------------------------------------------------------------------
//! \details: bencode decoder -top level object must be a dictionary
//! ----------------------------------------------------------------------------
class bdecode {
 public:
  // -------------------------------------------------
  // public methods
  // -------------------------------------------------
  bdecode(void);
  ~bdecode(void);
  int32_t init(const char* a_buf, size_t a_len);
  // -------------------------------------------------
  // public members
  // -------------------------------------------------
  be_dict_t m_dict;

 private:
  // -------------------------------------------------
  // private methods
  // -------------------------------------------------
  // disallow copy/assign
  bdecode(const bdecode&);
  bdecode& operator=(const bdecode&);
  void reset(void);
  // -------------------------------------------------
  // parsing
  // -------------------------------------------------
  bool at_end(void) const { return m_cur_off >= m_buf_len; }
  char cur(void) const { return m_buf[m_cur_off]; }
  int32_t parse_obj(be_obj_t& ao_obj, uint32_t a_depth);
  int32_t parse_dict(be_dict_t& ao_dict, uint32_t a_depth);
  int32_t parse_string(be_string_t& ao_string);
  int32_t parse_list(be_list_t& ao_list, uint32_t a_depth);
  int32_t parse_int(be_int_t& ao_int);
  int32_t parse_len(size_t& ao_len);
  // -------------------------------------------------
  // private members
  // -------------------------------------------------
  char* m_buf;
  size_t m_buf_len;
  size_t m_cur_off;
};
//! ----------------------------------------------------------------------------
//! \details: bencode writer -builds a top level dictionary
//! ----------------------------------------------------------------------------
class bencode_writer {
 public:
  // -------------------------------------------------
  // public methods
  // -------------------------------------------------
  bencode_writer(void);
  ~bencode_writer(void);
  void w_start_dict(void);
  void w_end_dict(void);
  void w_start_list(void);
  void w_end_list(void);
  void w_key(const std::string& a_key);
  void w_string(const std::string& a_str);
  void w_string(const char* a_buf, size_t a_len);
  void w_int(int64_t a_val);
  void serialize(std::string& ao_buf);

 private:
  // -------------------------------------------------
  // private methods
  // -------------------------------------------------
  // disallow copy/assign
  bencode_writer(const bencode_writer&);
  bencode_writer& operator=(const bencode_writer&);
  be_obj_t* append(be_obj_t& a_obj);
  void s_dict(const be_dict_t& a_dict);
  void s_list(const be_list_t& a_list);
  void s_obj(const be_obj_t& ao_obj);
  // -------------------------------------------------
  // private members
  // -------------------------------------------------
  be_obj_t m_root;
  be_dict_t m_dict;
  std::string m_cur_key;
  be_obj_t* m_cur_obj;
  std::string m_data;
};
}  // namespace ns_pkarr
#endif
