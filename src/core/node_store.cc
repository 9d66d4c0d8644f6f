//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "core/node_store.h"
#include "support/trace.h"
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
node_store::node_store(uint32_t a_max_nodes):
        m_mutex(),
        m_max_nodes(a_max_nodes),
        m_bootstrap_list(),
        m_bootstrap_set(),
        m_nodes(),
        m_cache()
{
        pthread_mutex_init(&m_mutex, NULL);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
node_store::~node_store(void)
{
        pthread_mutex_destroy(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: bootstrap nodes are known nodes that are never dropped
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void node_store::add_bootstrap(const std::string& a_addr)
{
        pthread_mutex_lock(&m_mutex);
        if (m_bootstrap_set.insert(a_addr).second)
        {
                m_bootstrap_list.push_back(a_addr);
                dht_node_t l_node;
                l_node.m_addr = a_addr;
                m_nodes[a_addr] = l_node;
        }
        pthread_mutex_unlock(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void node_store::get_bootstrap(str_vector_t& ao_addrs) const
{
        pthread_mutex_lock(&m_mutex);
        ao_addrs = m_bootstrap_list;
        pthread_mutex_unlock(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: add nodes not yet known -bounded by max nodes
//! \return:  number of nodes added
//! \param:   TODO
//! ----------------------------------------------------------------------------
uint32_t node_store::merge_nodes(const dht_node_vector_t& a_nodes)
{
        uint32_t l_added = 0;
        pthread_mutex_lock(&m_mutex);
        for (auto && i_n : a_nodes)
        {
                node_map_t::iterator i_k = m_nodes.find(i_n.m_addr);
                if (i_k != m_nodes.end())
                {
                        // learn id for nodes known by address only
                        if (!i_k->second.m_has_id &&
                            i_n.m_has_id)
                        {
                                i_k->second.m_has_id = true;
                                i_k->second.m_id = i_n.m_id;
                        }
                        continue;
                }
                if (m_nodes.size() >= m_max_nodes)
                {
                        break;
                }
                m_nodes[i_n.m_addr] = i_n;
                ++l_added;
        }
        size_t l_total = m_nodes.size();
        pthread_mutex_unlock(&m_mutex);
        TRC_DEBUG("updated known nodes. added: %u total known nodes: %zu", l_added, l_total);
        return l_added;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
void node_store::get_nodes(dht_node_vector_t& ao_nodes) const
{
        ao_nodes.clear();
        pthread_mutex_lock(&m_mutex);
        for (auto && i_n : m_nodes)
        {
                ao_nodes.push_back(i_n.second);
        }
        pthread_mutex_unlock(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  PKARR_STATUS_OK if removed
//!           PKARR_STATUS_ERROR for bootstrap nodes
//!           PKARR_STATUS_NOT_FOUND if unknown
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t node_store::remove_node(const std::string& a_addr)
{
        int32_t l_ret = PKARR_STATUS_OK;
        pthread_mutex_lock(&m_mutex);
        if (m_bootstrap_set.find(a_addr) != m_bootstrap_set.end())
        {
                l_ret = PKARR_STATUS_ERROR;
        }
        else if (!m_nodes.erase(a_addr))
        {
                l_ret = PKARR_STATUS_NOT_FOUND;
        }
        pthread_mutex_unlock(&m_mutex);
        return l_ret;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
size_t node_store::get_num_nodes(void) const
{
        pthread_mutex_lock(&m_mutex);
        size_t l_num = m_nodes.size();
        pthread_mutex_unlock(&m_mutex);
        return l_num;
}
//! ----------------------------------------------------------------------------
//! \details: create or overwrite entry
//! \return:  TODO
//! \param:   a_expires_ms monotonic expiry
//! ----------------------------------------------------------------------------
void node_store::cache_put(const std::string& a_key,
                           const signed_packet& a_pkt,
                           uint64_t a_expires_ms)
{
        pthread_mutex_lock(&m_mutex);
        cache_entry_t& l_entry = m_cache[a_key];
        l_entry.m_pkt = a_pkt;
        l_entry.m_expires_ms = a_expires_ms;
        pthread_mutex_unlock(&m_mutex);
}
//! ----------------------------------------------------------------------------
//! \details: entries are never evicted -caller compares expiry to now
//! \return:  PKARR_STATUS_OK if present else PKARR_STATUS_NOT_FOUND
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t node_store::cache_get(const std::string& a_key,
                              signed_packet& ao_pkt,
                              uint64_t& ao_expires_ms) const
{
        int32_t l_ret = PKARR_STATUS_NOT_FOUND;
        pthread_mutex_lock(&m_mutex);
        cache_map_t::const_iterator i_e = m_cache.find(a_key);
        if (i_e != m_cache.end())
        {
                ao_pkt = i_e->second.m_pkt;
                ao_expires_ms = i_e->second.m_expires_ms;
                l_ret = PKARR_STATUS_OK;
        }
        pthread_mutex_unlock(&m_mutex);
        return l_ret;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
size_t node_store::get_cache_size(void) const
{
        pthread_mutex_lock(&m_mutex);
        size_t l_num = m_cache.size();
        pthread_mutex_unlock(&m_mutex);
        return l_num;
}
}
