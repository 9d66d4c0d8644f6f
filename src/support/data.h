#ifndef _PKARR_DATA_H
#define _PKARR_DATA_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <stdint.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: non-owning view into a buffer
//! ----------------------------------------------------------------------------
typedef struct _data {
        char* m_data;
        uint32_t m_len;
        _data():
                m_data(nullptr),
                m_len(0)
        {}
} data_t;
//! ----------------------------------------------------------------------------
//! \details: owned (malloc'd) buffer -owner must free m_data
//! ----------------------------------------------------------------------------
typedef struct _mutable_data {
        char* m_data;
        uint32_t m_len;
        _mutable_data():
                m_data(nullptr),
                m_len(0)
        {}
} mutable_data_t;
}
#endif
