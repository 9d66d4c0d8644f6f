//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "core/client.h"
#include "pkarr/pkarr.h"
#include "core/keypair.h"
#include "support/trace.h"
#include "support/util.h"
#include "support/time_util.h"
#include "support/net_util.h"
#include <errno.h>
#include <inttypes.h>
#include <string.h>
#include <time.h>
#include <set>
#include <vector>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                          F R O N T I E R
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: per lookup candidate set -nodes with ids are taken closest to
//!           the info hash first, nodes without ids (bootstrap) follow in
//!           insertion order. a node is only ever added once.
//! ----------------------------------------------------------------------------
class frontier
{
public:
        frontier(const id_t& a_ref):
                m_ref(a_ref),
                m_entries(),
                m_seen(),
                m_seq(0)
        {}
        bool add(const dht_node_t& a_node)
        {
                if (!m_seen.insert(a_node.m_addr).second)
                {
                        return false;
                }
                entry_t l_e;
                l_e.m_node = a_node;
                l_e.m_seq = m_seq++;
                m_entries.push_back(l_e);
                return true;
        }
        bool empty(void) const { return m_entries.empty(); }
        size_t size(void) const { return m_entries.size(); }
        int32_t pop(dht_node_t& ao_node)
        {
                if (m_entries.empty())
                {
                        return PKARR_STATUS_NOT_FOUND;
                }
                size_t l_best = 0;
                for (size_t i_e = 1; i_e < m_entries.size(); ++i_e)
                {
                        if (better(m_entries[i_e], m_entries[l_best]))
                        {
                                l_best = i_e;
                        }
                }
                ao_node = m_entries[l_best].m_node;
                m_entries.erase(m_entries.begin() + l_best);
                return PKARR_STATUS_OK;
        }
private:
        typedef struct _entry {
                dht_node_t m_node;
                uint64_t m_seq;
        } entry_t;
        bool better(const entry_t& a_lhs, const entry_t& a_rhs) const
        {
                if (a_lhs.m_node.m_has_id != a_rhs.m_node.m_has_id)
                {
                        return a_lhs.m_node.m_has_id;
                }
                if (a_lhs.m_node.m_has_id)
                {
                        int l_cmp = xorcmp(a_lhs.m_node.m_id, a_rhs.m_node.m_id, m_ref);
                        if (l_cmp != 0)
                        {
                                return (l_cmp < 0);
                        }
                }
                return a_lhs.m_seq < a_rhs.m_seq;
        }
        id_t m_ref;
        std::vector<entry_t> m_entries;
        std::set<std::string> m_seen;
        uint64_t m_seq;
};
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* lookup_term_str(lookup_term_t a_term)
{
        switch (a_term)
        {
        case LOOKUP_TERM_FOUND:    return "found";
        case LOOKUP_TERM_CACHE:    return "cache";
        case LOOKUP_TERM_ATTEMPTS: return "attempts";
        case LOOKUP_TERM_TIMEOUT:  return "timeout";
        case LOOKUP_TERM_FRONTIER: return "frontier";
        default: break;
        }
        return "none";
}
//! ----------------------------------------------------------------------------
//! \details: numeric "ip:port" form of a node address -hostnames are resolved
//!           so a bootstrap node and its compact node entry are the same key
//! \return:  canonical address or a_addr as given if it cannot be resolved
//! \param:   a_addr "host:port"
//! ----------------------------------------------------------------------------
static std::string _canonical_addr(const std::string& a_addr)
{
        struct sockaddr_storage l_sas;
        int32_t l_s;
        l_s = str_to_sas(a_addr, l_sas);
        if (l_s == PKARR_STATUS_OK)
        {
                return sas_to_str(l_sas);
        }
        std::string l_host;
        uint16_t l_port = 0;
        l_s = split_host_port(a_addr, l_host, l_port);
        if (l_s != PKARR_STATUS_OK)
        {
                return a_addr;
        }
        l_s = nlookup(l_host, l_port, l_sas);
        if (l_s != PKARR_STATUS_OK)
        {
                TRC_WARN("error resolving bootstrap node %s", a_addr.c_str());
                return a_addr;
        }
        return sas_to_str(l_sas);
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                            C L I E N T
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
client::client(void):
        m_is_initd(false),
        m_id(),
        m_min_ttl_s(PKARR_DEFAULT_MIN_TTL_S),
        m_max_ttl_s(PKARR_DEFAULT_MAX_TTL_S),
        m_node_store(),
        m_udp_transport(),
        m_null_peer_fetcher(),
        m_transport(&m_udp_transport),
        m_peer_fetcher(&m_null_peer_fetcher),
        m_stats_mutex(),
        m_last_stats(),
        m_t_maintenance(),
        m_maintenance_mutex(),
        m_maintenance_cond(),
        m_maintenance_running(false),
        m_maintenance_stop(false),
        m_maintenance_interval_s(PKARR_MAINTENANCE_INTERVAL_S)
{
        pthread_mutex_init(&m_stats_mutex, NULL);
        pthread_mutex_init(&m_maintenance_mutex, NULL);
        pthread_condattr_t l_attr;
        pthread_condattr_init(&l_attr);
        pthread_condattr_setclock(&l_attr, CLOCK_MONOTONIC);
        pthread_cond_init(&m_maintenance_cond, &l_attr);
        pthread_condattr_destroy(&l_attr);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
client::~client(void)
{
        stop_maintenance();
        pthread_cond_destroy(&m_maintenance_cond);
        pthread_mutex_destroy(&m_maintenance_mutex);
        pthread_mutex_destroy(&m_stats_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: node id is sha1 of own public key
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::init(const keypair& a_keypair, const str_vector_t& a_bootstrap)
{
        if (!a_keypair.is_valid())
        {
                PKARR_PERROR("client init with invalid keypair");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        int32_t l_s;
        l_s = a_keypair.get_public_key().get_info_hash(m_id);
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        for (auto && i_b : a_bootstrap)
        {
                m_node_store.add_bootstrap(i_b);
        }
        TRC_DEBUG("client id: %s bootstrap nodes: %zu",
                  id2str(m_id).c_str(), a_bootstrap.size());
        m_is_initd = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: nullptr restores the default
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void client::set_transport(transport* a_transport)
{
        m_transport = a_transport ? a_transport : &m_udp_transport;
}
//! ----------------------------------------------------------------------------
//! \details: nullptr restores the default
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void client::set_peer_fetcher(peer_fetcher* a_fetcher)
{
        m_peer_fetcher = a_fetcher ? a_fetcher : &m_null_peer_fetcher;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
lookup_stats_t client::get_last_stats(void) const
{
        pthread_mutex_lock(&m_stats_mutex);
        lookup_stats_t l_stats = m_last_stats;
        pthread_mutex_unlock(&m_stats_mutex);
        return l_stats;
}
//! ----------------------------------------------------------------------------
//! \details: one krpc exchange -any failure is a dead end for that node
//! \return:  PKARR_STATUS_OK on reply
//!           PKARR_STATUS_ERR_TIMEOUT/PKARR_STATUS_ERR_DHT on failure
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::query(const std::string& a_addr,
                      const std::string& a_req,
                      const std::string& a_tid,
                      uint32_t a_timeout_ms,
                      krpc_msg& ao_msg)
{
        std::string l_resp;
        int32_t l_s;
        l_s = m_transport->request(a_addr, a_req, a_timeout_ms, l_resp);
        if (l_s != PKARR_STATUS_OK)
        {
                return l_s;
        }
        l_s = ao_msg.parse(l_resp.data(), l_resp.length());
        if (l_s != PKARR_STATUS_OK)
        {
                TRC_ERROR("malformed reply from node %s", a_addr.c_str());
                return PKARR_STATUS_ERR_DHT;
        }
        if (g_trc_log_level >= TRC_LOG_LEVEL_VERBOSE)
        {
                std::string l_json;
                if (ao_msg.to_json(l_json) == PKARR_STATUS_OK)
                {
                        TRC_VERBOSE("decoded response from %s:\n%s", a_addr.c_str(), l_json.c_str());
                }
        }
        if (ao_msg.m_tid != a_tid)
        {
                TRC_ERROR("transaction id mismatch from node %s", a_addr.c_str());
                return PKARR_STATUS_ERR_DHT;
        }
        if (ao_msg.m_type == KRPC_MSG_TYPE_ERROR)
        {
                TRC_ERROR("received error response from %s: code %d, message: %s",
                          a_addr.c_str(),
                          (int)ao_msg.m_err_code,
                          ao_msg.m_err_msg.c_str());
                return PKARR_STATUS_ERR_DHT;
        }
        if (ao_msg.m_type != KRPC_MSG_TYPE_REPLY)
        {
                TRC_ERROR("unexpected %s message from node %s",
                          krpc_msg::type_str(ao_msg.m_type), a_addr.c_str());
                return PKARR_STATUS_ERR_DHT;
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: fetch + verify from peers -first valid packet signed by target
//! \return:  PKARR_STATUS_OK on success else PKARR_STATUS_NOT_FOUND
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::resolve_peers(const sas_vector_t& a_peers,
                              const public_key& a_target,
                              signed_packet& ao_pkt)
{
        for (auto && i_p : a_peers)
        {
                std::string l_peer = sas_to_str(i_p);
                TRC_DEBUG("connecting to peer %s", l_peer.c_str());
                std::string l_bytes;
                int32_t l_s;
                l_s = m_peer_fetcher->fetch(i_p, a_target, l_bytes);
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_DEBUG("error fetching from peer %s: %s", l_peer.c_str(), status_str(l_s));
                        continue;
                }
                signed_packet l_pkt;
                l_s = l_pkt.from_bytes((const uint8_t*)l_bytes.data(), l_bytes.length());
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_WARN("rejected packet from peer %s: %s", l_peer.c_str(), status_str(l_s));
                        continue;
                }
                if (l_pkt.get_public_key() != a_target)
                {
                        TRC_WARN("rejected packet from peer %s: signer %s is not target",
                                 l_peer.c_str(),
                                 l_pkt.get_public_key().to_z32().c_str());
                        continue;
                }
                ao_pkt = l_pkt;
                return PKARR_STATUS_OK;
        }
        return PKARR_STATUS_NOT_FOUND;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::lookup(const std::string& a_target_z32,
                       uint32_t a_max_attempts,
                       uint32_t a_timeout_s,
                       signed_packet& ao_pkt,
                       lookup_stats_t* ao_stats)
{
        public_key l_target;
        int32_t l_s;
        l_s = l_target.init(a_target_z32);
        if (l_s != PKARR_STATUS_OK)
        {
                return l_s;
        }
        return lookup(l_target, a_max_attempts, a_timeout_s, ao_pkt, ao_stats);
}
//! ----------------------------------------------------------------------------
//! \details: cache check then iterative get_peers over the node frontier
//! \return:  PKARR_STATUS_OK with verified packet
//!           PKARR_STATUS_NOT_FOUND if attempts, time or nodes run out
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::lookup(const public_key& a_target,
                       uint32_t a_max_attempts,
                       uint32_t a_timeout_s,
                       signed_packet& ao_pkt,
                       lookup_stats_t* ao_stats)
{
        if (!m_is_initd)
        {
                PKARR_PERROR("lookup on uninitialized client");
                return PKARR_STATUS_ERROR;
        }
        if (!a_target.is_valid())
        {
                PKARR_PERROR("lookup with invalid public key");
                return PKARR_STATUS_ERR_IDENTITY;
        }
        uint64_t l_start_ms = get_mono_time_ms();
        std::string l_key = a_target.to_z32();
        lookup_stats_t l_stats;
        int32_t l_s;
        // -------------------------------------------------
        // cache
        // -------------------------------------------------
        signed_packet l_cached;
        uint64_t l_expires_ms = 0;
        l_s = m_node_store.cache_get(l_key, l_cached, l_expires_ms);
        if ((l_s == PKARR_STATUS_OK) &&
            (l_start_ms < l_expires_ms))
        {
                TRC_DEBUG("have fresh signed packet in cache. expires_in=%" PRIu64 "s",
                          (l_expires_ms - l_start_ms) / 1000);
                ao_pkt = l_cached;
                l_stats.m_term = LOOKUP_TERM_CACHE;
                goto done;
        }
        {
        // -------------------------------------------------
        // frontier
        // -------------------------------------------------
        id_t l_info_hash;
        l_s = a_target.get_info_hash(l_info_hash);
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        frontier l_frontier(l_info_hash);
        str_vector_t l_bootstrap;
        m_node_store.get_bootstrap(l_bootstrap);
        for (auto && i_b : l_bootstrap)
        {
                dht_node_t l_node;
                l_node.m_addr = _canonical_addr(i_b);
                l_frontier.add(l_node);
        }
        std::string l_req;
        std::string l_tid;
        uint64_t l_timeout_ms = (uint64_t)a_timeout_s * 1000;
        while (true)
        {
                uint64_t l_delta_ms = get_delta_time_ms(l_start_ms);
                if (l_stats.m_attempts >= a_max_attempts)
                {
                        TRC_WARN("lookup terminated: maximum attempts reached");
                        l_stats.m_term = LOOKUP_TERM_ATTEMPTS;
                        break;
                }
                if (l_delta_ms >= l_timeout_ms)
                {
                        TRC_WARN("lookup terminated: timeout reached");
                        l_stats.m_term = LOOKUP_TERM_TIMEOUT;
                        break;
                }
                dht_node_t l_node;
                l_s = l_frontier.pop(l_node);
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_WARN("lookup terminated: no more nodes to query");
                        l_stats.m_term = LOOKUP_TERM_FRONTIER;
                        break;
                }
                ++l_stats.m_attempts;
                ++l_stats.m_queried;
                TRC_DEBUG("attempt %u: querying node %s", l_stats.m_attempts, l_node.m_addr.c_str());
                // -----------------------------------------
                // get_peers
                // -----------------------------------------
                l_s = krpc_create_get_peers(l_req, l_tid, m_id, l_info_hash);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                uint64_t l_req_timeout_ms = l_timeout_ms - l_delta_ms;
                if (l_req_timeout_ms > PKARR_DHT_REQUEST_TIMEOUT_MS)
                {
                        l_req_timeout_ms = PKARR_DHT_REQUEST_TIMEOUT_MS;
                }
                krpc_msg l_msg;
                l_s = query(l_node.m_addr, l_req, l_tid, (uint32_t)l_req_timeout_ms, l_msg);
                if (l_s != PKARR_STATUS_OK)
                {
                        TRC_ERROR("error with node %s: %s", l_node.m_addr.c_str(), status_str(l_s));
                        continue;
                }
                // -----------------------------------------
                // values
                // -----------------------------------------
                if (!l_msg.m_values.empty())
                {
                        TRC_DEBUG("found %zu peer values", l_msg.m_values.size());
                        signed_packet l_pkt;
                        l_s = resolve_peers(l_msg.m_values, a_target, l_pkt);
                        if (l_s == PKARR_STATUS_OK)
                        {
                                uint64_t l_ttl_s = l_pkt.ttl(m_min_ttl_s, m_max_ttl_s);
                                m_node_store.cache_put(l_key, l_pkt, get_mono_time_ms() + l_ttl_s*1000);
                                ao_pkt = l_pkt;
                                l_stats.m_term = LOOKUP_TERM_FOUND;
                                TRC_DEBUG("found result after %u attempts and %" PRIu64 " ms",
                                          l_stats.m_attempts, get_delta_time_ms(l_start_ms));
                                break;
                        }
                }
                // -----------------------------------------
                // nodes
                // -----------------------------------------
                if (!l_msg.m_nodes.empty())
                {
                        dht_node_vector_t l_nodes;
                        decode_compact_nodes(l_nodes, l_msg.m_nodes);
                        uint32_t l_added = 0;
                        for (auto && i_n : l_nodes)
                        {
                                if (l_frontier.add(i_n))
                                {
                                        ++l_added;
                                }
                        }
                        m_node_store.merge_nodes(l_nodes);
                        TRC_DEBUG("added %u new nodes to query. frontier: %zu total known nodes: %zu",
                                  l_added, l_frontier.size(), m_node_store.get_num_nodes());
                }
        }
        }
done:
        l_stats.m_elapsed_ms = get_delta_time_ms(l_start_ms);
        TRC_DEBUG("lookup completed (%s) after %u attempts and %" PRIu64 " ms",
                  lookup_term_str(l_stats.m_term),
                  l_stats.m_attempts,
                  l_stats.m_elapsed_ms);
        pthread_mutex_lock(&m_stats_mutex);
        m_last_stats = l_stats;
        pthread_mutex_unlock(&m_stats_mutex);
        if (ao_stats)
        {
                *ao_stats = l_stats;
        }
        if ((l_stats.m_term == LOOKUP_TERM_FOUND) ||
            (l_stats.m_term == LOOKUP_TERM_CACHE))
        {
                return PKARR_STATUS_OK;
        }
        return PKARR_STATUS_NOT_FOUND;
}
//! ----------------------------------------------------------------------------
//! \details: true once stop_maintenance has been requested
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
bool client::maintenance_stopping(void)
{
        pthread_mutex_lock(&m_maintenance_mutex);
        bool l_stop = m_maintenance_stop;
        pthread_mutex_unlock(&m_maintenance_mutex);
        return l_stop;
}
//! ----------------------------------------------------------------------------
//! \details: ping known nodes, drop unresponsive non-bootstrap nodes and
//!           refresh from one responsive node with find_node(own id)
//! \return:  PKARR_STATUS_OK if any node responded else PKARR_STATUS_ERR_DHT
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::maintain(void)
{
        if (!m_is_initd)
        {
                return PKARR_STATUS_ERROR;
        }
        dht_node_vector_t l_nodes;
        m_node_store.get_nodes(l_nodes);
        std::string l_responsive;
        dht_node_vector_t l_learned;
        uint32_t l_dropped = 0;
        std::string l_req;
        std::string l_tid;
        int32_t l_s;
        bool l_stopped = false;
        for (auto && i_n : l_nodes)
        {
                if (maintenance_stopping())
                {
                        TRC_DEBUG("maintenance: stopped before pinging %s", i_n.m_addr.c_str());
                        l_stopped = true;
                        break;
                }
                l_s = krpc_create_ping(l_req, l_tid, m_id);
                if (l_s != PKARR_STATUS_OK)
                {
                        return PKARR_STATUS_ERROR;
                }
                krpc_msg l_msg;
                l_s = query(i_n.m_addr, l_req, l_tid, PKARR_DHT_REQUEST_TIMEOUT_MS, l_msg);
                if (l_s != PKARR_STATUS_OK)
                {
                        if (m_node_store.remove_node(i_n.m_addr) == PKARR_STATUS_OK)
                        {
                                TRC_DEBUG("dropped unresponsive node %s", i_n.m_addr.c_str());
                                ++l_dropped;
                        }
                        continue;
                }
                if (l_responsive.empty())
                {
                        l_responsive = i_n.m_addr;
                }
                if (l_msg.m_has_id &&
                    !i_n.m_has_id)
                {
                        dht_node_t l_node = i_n;
                        l_node.m_has_id = true;
                        l_node.m_id = l_msg.m_id;
                        l_learned.push_back(l_node);
                }
        }
        if (!l_learned.empty())
        {
                m_node_store.merge_nodes(l_learned);
        }
        if (l_stopped)
        {
                return PKARR_STATUS_OK;
        }
        if (l_responsive.empty())
        {
                TRC_WARN("maintenance: no responsive nodes (dropped: %u)", l_dropped);
                return PKARR_STATUS_ERR_DHT;
        }
        // -------------------------------------------------
        // discover
        // -------------------------------------------------
        if (maintenance_stopping())
        {
                return PKARR_STATUS_OK;
        }
        l_s = krpc_create_find_node(l_req, l_tid, m_id, m_id);
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        krpc_msg l_msg;
        l_s = query(l_responsive, l_req, l_tid, PKARR_DHT_REQUEST_TIMEOUT_MS, l_msg);
        if (l_s != PKARR_STATUS_OK)
        {
                TRC_WARN("maintenance: find_node to %s failed: %s",
                         l_responsive.c_str(), status_str(l_s));
                return PKARR_STATUS_OK;
        }
        dht_node_vector_t l_found;
        decode_compact_nodes(l_found, l_msg.m_nodes);
        uint32_t l_added = m_node_store.merge_nodes(l_found);
        TRC_DEBUG("maintenance: dropped %u nodes, discovered %u nodes (known: %zu)",
                  l_dropped, l_added, m_node_store.get_num_nodes());
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void* client::t_maintenance(void* a_data)
{
        client* l_c = static_cast<client*>(a_data);
        pthread_mutex_lock(&l_c->m_maintenance_mutex);
        while (!l_c->m_maintenance_stop)
        {
                struct timespec l_ts;
                clock_gettime(CLOCK_MONOTONIC, &l_ts);
                l_ts.tv_sec += l_c->m_maintenance_interval_s;
                int l_s = 0;
                while (!l_c->m_maintenance_stop &&
                       (l_s != ETIMEDOUT))
                {
                        l_s = pthread_cond_timedwait(&l_c->m_maintenance_cond,
                                                     &l_c->m_maintenance_mutex,
                                                     &l_ts);
                }
                if (l_c->m_maintenance_stop)
                {
                        break;
                }
                pthread_mutex_unlock(&l_c->m_maintenance_mutex);
                int32_t l_ms;
                l_ms = l_c->maintain();
                if (l_ms != PKARR_STATUS_OK)
                {
                        TRC_WARN("performing maintenance: %s", status_str(l_ms));
                }
                pthread_mutex_lock(&l_c->m_maintenance_mutex);
        }
        pthread_mutex_unlock(&l_c->m_maintenance_mutex);
        return NULL;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::start_maintenance(uint32_t a_interval_s)
{
        if (!m_is_initd)
        {
                return PKARR_STATUS_ERROR;
        }
        if (m_maintenance_running)
        {
                return PKARR_STATUS_BUSY;
        }
        m_maintenance_interval_s = a_interval_s ? a_interval_s : 1;
        m_maintenance_stop = false;
        int l_s;
        l_s = pthread_create(&m_t_maintenance, NULL, t_maintenance, this);
        if (l_s != 0)
        {
                PKARR_PERROR("error creating maintenance thread. Reason: %s", strerror(l_s));
                return PKARR_STATUS_ERROR;
        }
        m_maintenance_running = true;
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t client::stop_maintenance(void)
{
        if (!m_maintenance_running)
        {
                return PKARR_STATUS_OK;
        }
        pthread_mutex_lock(&m_maintenance_mutex);
        m_maintenance_stop = true;
        pthread_cond_signal(&m_maintenance_cond);
        pthread_mutex_unlock(&m_maintenance_mutex);
        pthread_join(m_t_maintenance, NULL);
        m_maintenance_running = false;
        m_maintenance_stop = false;
        return PKARR_STATUS_OK;
}
}
