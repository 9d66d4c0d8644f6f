#ifndef _PKARR_CLIENT_H
#define _PKARR_CLIENT_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/types.h"
#include "core/public_key.h"
#include "core/signed_packet.h"
#include "core/node_store.h"
#include "dht/krpc.h"
#include "dht/transport.h"
#include "dht/peer_fetcher.h"
#include <pthread.h>
#include <stdint.h>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! fwd decl's
//! ----------------------------------------------------------------------------
class keypair;
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef enum {
        LOOKUP_TERM_NONE = 0,
        LOOKUP_TERM_FOUND,
        LOOKUP_TERM_CACHE,
        LOOKUP_TERM_ATTEMPTS,
        LOOKUP_TERM_TIMEOUT,
        LOOKUP_TERM_FRONTIER
} lookup_term_t;
typedef struct _lookup_stats {
        uint32_t m_attempts;
        uint32_t m_queried;
        uint64_t m_elapsed_ms;
        lookup_term_t m_term;
        _lookup_stats():
                m_attempts(0),
                m_queried(0),
                m_elapsed_ms(0),
                m_term(LOOKUP_TERM_NONE)
        {}
} lookup_stats_t;
const char* lookup_term_str(lookup_term_t a_term);
//! ----------------------------------------------------------------------------
//! \details: resolves public keys to signed packets over the dht
//! ----------------------------------------------------------------------------
class client
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        client(void);
        ~client(void);
        int32_t init(const keypair& a_keypair, const str_vector_t& a_bootstrap);
        // -------------------------------------------------
        // collaborators (not owned) and ttl policy
        // setup only: call before the first lookup and
        // before start_maintenance, not concurrently
        // -------------------------------------------------
        void set_transport(transport* a_transport);
        void set_peer_fetcher(peer_fetcher* a_fetcher);
        void set_min_ttl(uint32_t a_ttl_s) { m_min_ttl_s = a_ttl_s; }
        void set_max_ttl(uint32_t a_ttl_s) { m_max_ttl_s = a_ttl_s; }
        uint32_t get_min_ttl(void) const { return m_min_ttl_s; }
        uint32_t get_max_ttl(void) const { return m_max_ttl_s; }
        // -------------------------------------------------
        // lookup
        // -------------------------------------------------
        int32_t lookup(const public_key& a_target,
                       uint32_t a_max_attempts,
                       uint32_t a_timeout_s,
                       signed_packet& ao_pkt,
                       lookup_stats_t* ao_stats = nullptr);
        int32_t lookup(const std::string& a_target_z32,
                       uint32_t a_max_attempts,
                       uint32_t a_timeout_s,
                       signed_packet& ao_pkt,
                       lookup_stats_t* ao_stats = nullptr);
        lookup_stats_t get_last_stats(void) const;
        // -------------------------------------------------
        // maintenance
        // -------------------------------------------------
        int32_t maintain(void);
        int32_t start_maintenance(uint32_t a_interval_s = PKARR_MAINTENANCE_INTERVAL_S);
        int32_t stop_maintenance(void);
        // -------------------------------------------------
        // getters
        // -------------------------------------------------
        const id_t& get_id(void) const { return m_id; }
        node_store& get_node_store(void) { return m_node_store; }
private:
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // disallow copy/assign
        client(const client&);
        client& operator=(const client&);
        int32_t query(const std::string& a_addr,
                      const std::string& a_req,
                      const std::string& a_tid,
                      uint32_t a_timeout_ms,
                      krpc_msg& ao_msg);
        int32_t resolve_peers(const sas_vector_t& a_peers,
                              const public_key& a_target,
                              signed_packet& ao_pkt);
        bool maintenance_stopping(void);
        static void* t_maintenance(void* a_data);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        bool m_is_initd;
        id_t m_id;
        uint32_t m_min_ttl_s;
        uint32_t m_max_ttl_s;
        node_store m_node_store;
        udp_transport m_udp_transport;
        null_peer_fetcher m_null_peer_fetcher;
        transport* m_transport;
        peer_fetcher* m_peer_fetcher;
        // -------------------------------------------------
        // stats
        // -------------------------------------------------
        mutable pthread_mutex_t m_stats_mutex;
        lookup_stats_t m_last_stats;
        // -------------------------------------------------
        // maintenance thread
        // -------------------------------------------------
        pthread_t m_t_maintenance;
        pthread_mutex_t m_maintenance_mutex;
        pthread_cond_t m_maintenance_cond;
        bool m_maintenance_running;
        bool m_maintenance_stop;
        uint32_t m_maintenance_interval_s;
};
}
#endif
