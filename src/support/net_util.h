#ifndef _PKARR_NET_UTIL_H
#define _PKARR_NET_UTIL_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include <arpa/inet.h>
#include <sys/socket.h>
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! inline
//! ----------------------------------------------------------------------------
inline socklen_t sas_size(const sockaddr_storage& a_sas) {
  if (a_sas.ss_family == AF_INET) {
    return sizeof(sockaddr_in);
  } else if (a_sas.ss_family == AF_INET6) {
    return sizeof(sockaddr_in6);
  }
  return 0;
}
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
std::string sas_to_str(const struct sockaddr_storage& a_ss);
int32_t str_to_sas(const std::string& a_str, struct sockaddr_storage& a_sas);
bool sas_equal(const struct sockaddr_storage& a_lhs, const struct sockaddr_storage& a_rhs);
int32_t split_host_port(const std::string& a_str, std::string& ao_host, uint16_t& ao_port);
int32_t nlookup(const std::string& a_host, uint16_t a_port, struct sockaddr_storage& ao_sas);
}  // namespace ns_pkarr
#endif
