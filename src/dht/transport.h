#ifndef _PKARR_TRANSPORT_H
#define _PKARR_TRANSPORT_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: single request/response exchange with a dht node
//! ----------------------------------------------------------------------------
class transport
{
public:
        virtual ~transport(void) {}
        // -------------------------------------------------
        // send a_req to a_addr ("host:port") and wait up to
        // a_timeout_ms for one reply datagram from it
        // returns:
        //   PKARR_STATUS_OK on reply
        //   PKARR_STATUS_ERR_TIMEOUT on no reply
        //   PKARR_STATUS_ERR_DHT on resolve/socket errors
        // -------------------------------------------------
        virtual int32_t request(const std::string& a_addr,
                                const std::string& a_req,
                                uint32_t a_timeout_ms,
                                std::string& ao_resp) = 0;
};
//! ----------------------------------------------------------------------------
//! \details: udp implementation -one ephemeral socket per request
//! ----------------------------------------------------------------------------
class udp_transport: public transport
{
public:
        udp_transport(void) {}
        ~udp_transport(void) {}
        int32_t request(const std::string& a_addr,
                        const std::string& a_req,
                        uint32_t a_timeout_ms,
                        std::string& ao_resp);
private:
        // disallow copy/assign
        udp_transport(const udp_transport&);
        udp_transport& operator=(const udp_transport&);
};
}
#endif
