#ifndef _PKARR_TYPES_H
#define _PKARR_TYPES_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <string>
#include <list>
#include <vector>
#include <cstdint>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef std::list<std::string> str_list_t;
typedef std::vector<std::string> str_vector_t;
// ---------------------------------------------------------
// dht node id/info hash
// ---------------------------------------------------------
typedef struct { uint8_t m_data[20]; } id_t;
typedef std::vector<id_t> id_vector_t;
}
#endif
