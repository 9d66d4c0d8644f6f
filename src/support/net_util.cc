//! ----------------------------------------------------------------------------
//! include
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// internal
// ---------------------------------------------------------
#include "pkarr/def.h"
#include "support/net_util.h"
#include "support/trace.h"
// ---------------------------------------------------------
// std includes
// ---------------------------------------------------------
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <errno.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
std::string sas_to_str(const struct sockaddr_storage& a_ss)
{
        char l_addr_tmp[INET6_ADDRSTRLEN];
        char l_addr_str[64];
        uint16_t l_port = 0;
        std::string l_ip;
        if (a_ss.ss_family == AF_INET)
        {
                const struct sockaddr_in* l_sin = (const struct sockaddr_in*) &(a_ss);
                inet_ntop(AF_INET, &l_sin->sin_addr, l_addr_tmp, sizeof(l_addr_tmp));
                l_port = ntohs(l_sin->sin_port);
                snprintf(l_addr_str, 64, "%s:%u", l_addr_tmp, l_port);
                l_ip = l_addr_str;
        }
        else if(a_ss.ss_family == AF_INET6)
        {
                const struct sockaddr_in6* l_sin6 = (const struct sockaddr_in6*) &(a_ss);
                inet_ntop(AF_INET6, &l_sin6->sin6_addr, l_addr_tmp, sizeof(l_addr_tmp));
                l_port = ntohs(l_sin6->sin6_port);
                snprintf(l_addr_str, 64, "[%s]:%u", l_addr_tmp, l_port);
                l_ip = l_addr_str;
        }
        return l_ip;
}
//! ----------------------------------------------------------------------------
//! \details: parse numeric "a.b.c.d:port" or "[v6]:port"
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t str_to_sas(const std::string& a_str, struct sockaddr_storage& a_sas)
{
        memset(&a_sas, 0, sizeof(struct sockaddr_storage));
        std::string l_host;
        uint16_t l_port = 0;
        int32_t l_s;
        l_s = split_host_port(a_str, l_host, l_port);
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // ipv6
        // -------------------------------------------------
        if (!a_str.empty() &&
            (a_str[0] == '['))
        {
                a_sas.ss_family = AF_INET6;
                struct sockaddr_in6* l_sa = (struct sockaddr_in6*)(&a_sas);
                l_s = inet_pton(AF_INET6, l_host.c_str(), &(l_sa->sin6_addr));
                if (l_s != 1)
                {
                        return PKARR_STATUS_ERROR;
                }
                l_sa->sin6_port = htons(l_port);
                return PKARR_STATUS_OK;
        }
        // -------------------------------------------------
        // ipv4
        // -------------------------------------------------
        a_sas.ss_family = AF_INET;
        struct sockaddr_in* l_sa = (struct sockaddr_in*)(&a_sas);
        l_s = inet_pton(AF_INET, l_host.c_str(), &(l_sa->sin_addr));
        if (l_s != 1)
        {
                return PKARR_STATUS_ERROR;
        }
        l_sa->sin_port = htons(l_port);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: compare family, address and port
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool sas_equal(const struct sockaddr_storage& a_lhs, const struct sockaddr_storage& a_rhs)
{
        if (a_lhs.ss_family != a_rhs.ss_family)
        {
                return false;
        }
        if (a_lhs.ss_family == AF_INET)
        {
                const struct sockaddr_in* l_l = (const struct sockaddr_in*)&a_lhs;
                const struct sockaddr_in* l_r = (const struct sockaddr_in*)&a_rhs;
                return (l_l->sin_port == l_r->sin_port) &&
                       (l_l->sin_addr.s_addr == l_r->sin_addr.s_addr);
        }
        if (a_lhs.ss_family == AF_INET6)
        {
                const struct sockaddr_in6* l_l = (const struct sockaddr_in6*)&a_lhs;
                const struct sockaddr_in6* l_r = (const struct sockaddr_in6*)&a_rhs;
                return (l_l->sin6_port == l_r->sin6_port) &&
                       (memcmp(&l_l->sin6_addr, &l_r->sin6_addr, sizeof(l_l->sin6_addr)) == 0);
        }
        return false;
}
//! ----------------------------------------------------------------------------
//! \details: split "host:port" / "[v6]:port" -host may be a name
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t split_host_port(const std::string& a_str, std::string& ao_host, uint16_t& ao_port)
{
        size_t l_colon = a_str.rfind(':');
        if ((l_colon == std::string::npos) ||
            (l_colon == 0) ||
            (l_colon + 1 >= a_str.length()))
        {
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // port
        // -------------------------------------------------
        const char* l_port_str = a_str.c_str() + l_colon + 1;
        char* l_end = nullptr;
        errno = 0;
        long l_val = strtol(l_port_str, &l_end, 10);
        if ((errno != 0) ||
            (*l_end != '\0') ||
            (l_val < 1) ||
            (l_val > 65535))
        {
                return PKARR_STATUS_ERROR;
        }
        ao_port = (uint16_t)l_val;
        // -------------------------------------------------
        // host -skip [ ... ] chars
        // -------------------------------------------------
        if (a_str[0] == '[')
        {
                if ((l_colon < 2) ||
                    (a_str[l_colon - 1] != ']'))
                {
                        return PKARR_STATUS_ERROR;
                }
                ao_host = a_str.substr(1, l_colon - 2);
        }
        else
        {
                ao_host = a_str.substr(0, l_colon);
        }
        if (ao_host.empty())
        {
                return PKARR_STATUS_ERROR;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: resolve host for datagram use -prefer ipv4
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t nlookup(const std::string& a_host, uint16_t a_port, struct sockaddr_storage& ao_sas)
{
        memset(&ao_sas, 0, sizeof(ao_sas));
        struct addrinfo l_hints;
        memset(&l_hints, 0, sizeof(l_hints));
        l_hints.ai_family = PF_UNSPEC;
        l_hints.ai_socktype = SOCK_DGRAM;
        char l_port_str[10];
        snprintf(l_port_str, sizeof(l_port_str), "%u", (unsigned int)a_port);
        struct addrinfo* l_addrinfo = nullptr;
        int l_gaierr;
        l_gaierr = getaddrinfo(a_host.c_str(), l_port_str, &l_hints, &l_addrinfo);
        if (l_gaierr != 0)
        {
                TRC_ERROR("performing getaddrinfo '%s': %s", a_host.c_str(), gai_strerror(l_gaierr));
                return PKARR_STATUS_ERROR;
        }
        // -------------------------------------------------
        // find the first IPv4 and IPv6 entries.
        // -------------------------------------------------
        struct addrinfo* l_addrinfo_v4 = nullptr;
        struct addrinfo* l_addrinfo_v6 = nullptr;
        for (struct addrinfo* i_ai = l_addrinfo; i_ai != nullptr; i_ai = i_ai->ai_next)
        {
                if ((i_ai->ai_family == AF_INET) &&
                    !l_addrinfo_v4)
                {
                        l_addrinfo_v4 = i_ai;
                }
                else if ((i_ai->ai_family == AF_INET6) &&
                         !l_addrinfo_v6)
                {
                        l_addrinfo_v6 = i_ai;
                }
        }
        struct addrinfo* l_use = l_addrinfo_v4 ? l_addrinfo_v4 : l_addrinfo_v6;
        if (!l_use ||
            (l_use->ai_addrlen > sizeof(ao_sas)))
        {
                TRC_ERROR("no valid address found for host %s", a_host.c_str());
                freeaddrinfo(l_addrinfo);
                return PKARR_STATUS_ERROR;
        }
        memcpy(&ao_sas, l_use->ai_addr, l_use->ai_addrlen);
        freeaddrinfo(l_addrinfo);
        return PKARR_STATUS_OK;
}
}
