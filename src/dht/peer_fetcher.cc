//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "dht/peer_fetcher.h"
#include "core/public_key.h"
#include "support/trace.h"
#include "support/net_util.h"
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  PKARR_STATUS_ERR_UNSUPPORTED
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t null_peer_fetcher::fetch(const struct sockaddr_storage& a_peer,
                                 const public_key& a_target,
                                 std::string& ao_bytes)
{
        ao_bytes.clear();
        TRC_DEBUG("no peer protocol for peer %s (target: %s)",
                  sas_to_str(a_peer).c_str(),
                  a_target.to_z32().c_str());
        return PKARR_STATUS_ERR_UNSUPPORTED;
}
}
