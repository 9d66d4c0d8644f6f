#ifndef _PKARR_PEER_FETCHER_H
#define _PKARR_PEER_FETCHER_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include <sys/socket.h>
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class public_key;
//! ----------------------------------------------------------------------------
//! \details: retrieves signed packet bytes for a target from a peer found
//!           through get_peers values
//! ----------------------------------------------------------------------------
class peer_fetcher
{
public:
        virtual ~peer_fetcher(void) {}
        virtual int32_t fetch(const struct sockaddr_storage& a_peer,
                              const public_key& a_target,
                              std::string& ao_bytes) = 0;
};
//! ----------------------------------------------------------------------------
//! \details: no peer wire protocol -every fetch is unsupported
//! ----------------------------------------------------------------------------
class null_peer_fetcher: public peer_fetcher
{
public:
        null_peer_fetcher(void) {}
        int32_t fetch(const struct sockaddr_storage& a_peer,
                      const public_key& a_target,
                      std::string& ao_bytes);
};
}
#endif
