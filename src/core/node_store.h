#ifndef _PKARR_NODE_STORE_H
#define _PKARR_NODE_STORE_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/types.h"
#include "core/signed_packet.h"
#include "dht/krpc.h"
#include <pthread.h>
#include <stdint.h>
#include <map>
#include <set>
#include <string>
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: known dht nodes + resolved packet cache shared by lookups
//! ----------------------------------------------------------------------------
class node_store
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        node_store(uint32_t a_max_nodes = PKARR_NODE_STORE_MAX_NODES);
        ~node_store(void);
        // -------------------------------------------------
        // nodes
        // -------------------------------------------------
        void add_bootstrap(const std::string& a_addr);
        void get_bootstrap(str_vector_t& ao_addrs) const;
        uint32_t merge_nodes(const dht_node_vector_t& a_nodes);
        void get_nodes(dht_node_vector_t& ao_nodes) const;
        int32_t remove_node(const std::string& a_addr);
        size_t get_num_nodes(void) const;
        // -------------------------------------------------
        // cache
        // -------------------------------------------------
        void cache_put(const std::string& a_key,
                       const signed_packet& a_pkt,
                       uint64_t a_expires_ms);
        int32_t cache_get(const std::string& a_key,
                          signed_packet& ao_pkt,
                          uint64_t& ao_expires_ms) const;
        size_t get_cache_size(void) const;
private:
        // -------------------------------------------------
        // types
        // -------------------------------------------------
        typedef struct _cache_entry {
                signed_packet m_pkt;
                uint64_t m_expires_ms;
                _cache_entry():
                        m_pkt(),
                        m_expires_ms(0)
                {}
        } cache_entry_t;
        typedef std::map<std::string, dht_node_t> node_map_t;
        typedef std::map<std::string, cache_entry_t> cache_map_t;
        typedef std::set<std::string> str_set_t;
        // -------------------------------------------------
        // private methods
        // -------------------------------------------------
        // disallow copy/assign
        node_store(const node_store&);
        node_store& operator=(const node_store&);
        // -------------------------------------------------
        // private members
        // -------------------------------------------------
        mutable pthread_mutex_t m_mutex;
        uint32_t m_max_nodes;
        str_vector_t m_bootstrap_list;
        str_set_t m_bootstrap_set;
        node_map_t m_nodes;
        cache_map_t m_cache;
};
}
#endif
