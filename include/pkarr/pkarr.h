#ifndef _PKARR_PKARR_H
#define _PKARR_PKARR_H
//! ----------------------------------------------------------------------------
//! version
//! ----------------------------------------------------------------------------
#ifndef PKARR_VERSION
#define PKARR_VERSION "0.1.0"
#endif
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/types.h"
#include <stdint.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
const char* status_str(int32_t a_status);
const char* get_err_msg(void);
}
#endif
