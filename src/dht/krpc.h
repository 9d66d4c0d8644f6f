#ifndef _PKARR_KRPC_H
#define _PKARR_KRPC_H
//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "pkarr/def.h"
#include "pkarr/types.h"
#include <sys/socket.h>
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>
//! ----------------------------------------------------------------------------
//! constants
//! ----------------------------------------------------------------------------
#define PKARR_KRPC_TID_LEN 2
// ---------------------------------------------------------
// BEP 5 error codes
// ---------------------------------------------------------
#define PKARR_KRPC_ERR_GENERIC   201
#define PKARR_KRPC_ERR_SERVER    202
#define PKARR_KRPC_ERR_PROTOCOL  203
#define PKARR_KRPC_ERR_METHOD    204
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! types
//! ----------------------------------------------------------------------------
typedef enum {
        KRPC_MSG_TYPE_NONE = 0,
        KRPC_MSG_TYPE_QUERY,
        KRPC_MSG_TYPE_REPLY,
        KRPC_MSG_TYPE_ERROR
} krpc_msg_type_t;
// ---------------------------------------------------------
// node: "ip:port" (or "host:port" for bootstrap) + optional id
// ---------------------------------------------------------
typedef struct _dht_node {
        std::string m_addr;
        bool m_has_id;
        id_t m_id;
        _dht_node():
                m_addr(),
                m_has_id(false),
                m_id()
        {}
} dht_node_t;
typedef std::vector<dht_node_t> dht_node_vector_t;
typedef std::vector<struct sockaddr_storage> sas_vector_t;
//! ----------------------------------------------------------------------------
//! \details: decoded krpc datagram
//! ----------------------------------------------------------------------------
class krpc_msg
{
public:
        // -------------------------------------------------
        // public methods
        // -------------------------------------------------
        krpc_msg(void);
        int32_t parse(const char* a_buf, size_t a_len);
        int32_t to_json(std::string& ao_json) const;
        static const char* type_str(krpc_msg_type_t a_type);
        // -------------------------------------------------
        // public members
        // -------------------------------------------------
        krpc_msg_type_t m_type;
        std::string m_tid;
        // query
        std::string m_query;
        // query/reply
        bool m_has_id;
        id_t m_id;
        // reply
        std::string m_nodes;
        std::string m_token;
        sas_vector_t m_values;
        // error
        int64_t m_err_code;
        std::string m_err_msg;
};
//! ----------------------------------------------------------------------------
//! prototypes
//! ----------------------------------------------------------------------------
// ---------------------------------------------------------
// queries
// ---------------------------------------------------------
int32_t krpc_create_ping(std::string& ao_msg,
                         std::string& ao_tid,
                         const id_t& a_id);
int32_t krpc_create_find_node(std::string& ao_msg,
                              std::string& ao_tid,
                              const id_t& a_id,
                              const id_t& a_target);
int32_t krpc_create_get_peers(std::string& ao_msg,
                              std::string& ao_tid,
                              const id_t& a_id,
                              const id_t& a_info_hash);
// ---------------------------------------------------------
// compact info
// ---------------------------------------------------------
int32_t decode_compact_nodes(dht_node_vector_t& ao_nodes, const std::string& a_buf);
int32_t decode_compact_peer(struct sockaddr_storage& ao_sas, const char* a_buf, size_t a_len);
// ---------------------------------------------------------
// distance
// ---------------------------------------------------------
int xorcmp(const id_t& a_id1, const id_t& a_id2, const id_t& a_ref);
}
#endif
