//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "dht/transport.h"
#include "support/trace.h"
#include "support/net_util.h"
#include "support/time_util.h"
#include <errno.h>
#include <string.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: wait for reply datagram from a_to
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _recv_reply(int a_fd,
                           const struct sockaddr_storage& a_to,
                           uint32_t a_timeout_ms,
                           std::string& ao_resp)
{
        uint64_t l_start_ms = get_mono_time_ms();
        char l_buf[PKARR_DHT_RECV_BUF_SIZE];
        while (true)
        {
                uint64_t l_delta_ms = get_delta_time_ms(l_start_ms);
                if (l_delta_ms >= a_timeout_ms)
                {
                        return PKARR_STATUS_ERR_TIMEOUT;
                }
                struct pollfd l_pfd;
                l_pfd.fd = a_fd;
                l_pfd.events = POLLIN;
                l_pfd.revents = 0;
                int l_s;
                l_s = poll(&l_pfd, 1, (int)(a_timeout_ms - l_delta_ms));
                if (l_s == 0)
                {
                        return PKARR_STATUS_ERR_TIMEOUT;
                }
                if (l_s < 0)
                {
                        if (errno == EINTR)
                        {
                                continue;
                        }
                        TRC_ERROR("error performing poll. Reason: %s", strerror(errno));
                        return PKARR_STATUS_ERR_DHT;
                }
                struct sockaddr_storage l_from;
                socklen_t l_from_len = sizeof(l_from);
                ssize_t l_read;
                l_read = recvfrom(a_fd,
                                  l_buf,
                                  sizeof(l_buf),
                                  0,
                                  (struct sockaddr*)&l_from,
                                  &l_from_len);
                if (l_read < 0)
                {
                        if ((errno == EAGAIN) ||
                            (errno == EINTR))
                        {
                                continue;
                        }
                        TRC_ERROR("error performing recvfrom. Reason: %s", strerror(errno));
                        return PKARR_STATUS_ERR_DHT;
                }
                if (!sas_equal(l_from, a_to))
                {
                        TRC_DEBUG("ignoring datagram from unexpected address: %s",
                                  sas_to_str(l_from).c_str());
                        continue;
                }
                ao_resp.assign(l_buf, (size_t)l_read);
                return PKARR_STATUS_OK;
        }
        return PKARR_STATUS_ERR_DHT;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t udp_transport::request(const std::string& a_addr,
                               const std::string& a_req,
                               uint32_t a_timeout_ms,
                               std::string& ao_resp)
{
        ao_resp.clear();
        // -------------------------------------------------
        // resolve -numeric addresses skip getaddrinfo
        // -------------------------------------------------
        struct sockaddr_storage l_to;
        int32_t l_s;
        l_s = str_to_sas(a_addr, l_to);
        if (l_s != PKARR_STATUS_OK)
        {
                std::string l_host;
                uint16_t l_port;
                l_s = split_host_port(a_addr, l_host, l_port);
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_ERROR("invalid node address: %s", a_addr.c_str());
                        return PKARR_STATUS_ERR_DHT;
                }
                l_s = nlookup(l_host, l_port, l_to);
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_ERROR("error resolving node: %s", a_addr.c_str());
                        return PKARR_STATUS_ERR_DHT;
                }
        }
        // -------------------------------------------------
        // socket
        // -------------------------------------------------
        int l_fd;
        l_fd = socket(l_to.ss_family, SOCK_DGRAM, 0);
        if (l_fd < 0)
        {
                TRC_ERROR("error performing socket. Reason: %s", strerror(errno));
                return PKARR_STATUS_ERR_DHT;
        }
        // -------------------------------------------------
        // sendto
        // -------------------------------------------------
        ssize_t l_sent;
        l_sent = sendto(l_fd,
                        a_req.data(),
                        a_req.length(),
                        0,
                        (const struct sockaddr*)&l_to,
                        sas_size(l_to));
        if (l_sent < 0)
        {
                TRC_ERROR("error performing sendto %s. Reason: %s",
                          sas_to_str(l_to).c_str(), strerror(errno));
                close(l_fd);
                return PKARR_STATUS_ERR_DHT;
        }
        TRC_VERBOSE("sent %zd bytes to %s (%s)", l_sent, a_addr.c_str(), sas_to_str(l_to).c_str());
        // -------------------------------------------------
        // recv
        // -------------------------------------------------
        l_s = _recv_reply(l_fd, l_to, a_timeout_ms, ao_resp);
        close(l_fd);
        if (l_s == PKARR_STATUS_ERR_TIMEOUT)
        {
                TRC_WARN("timeout waiting for reply from %s", a_addr.c_str());
        }
        return l_s;
}
}
