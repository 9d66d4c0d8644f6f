//! ----------------------------------------------------------------------------
//! includes
//! ----------------------------------------------------------------------------
#include "dht/krpc.h"
#include "bencode/bencode.h"
#include "crypto/crypto.h"
#include "support/trace.h"
#include "support/util.h"
#include "support/net_util.h"
#include <string.h>
#include <arpa/inet.h>
#include <netinet/in.h>
// ---------------------------------------------------------
// rapidjson
// ---------------------------------------------------------
#include "rapidjson/rapidjson.h"
#include "rapidjson/stringbuffer.h"
#include "rapidjson/prettywriter.h"
namespace ns_pkarr {
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                       S T A T I C   U T I L
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: random transaction id
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static int32_t _make_tid(std::string& ao_tid)
{
        uint8_t l_tid[PKARR_KRPC_TID_LEN];
        int32_t l_s;
        l_s = random_bytes(l_tid, sizeof(l_tid));
        if (l_s != PKARR_STATUS_OK)
        {
                return PKARR_STATUS_ERROR;
        }
        ao_tid.assign((const char*)l_tid, sizeof(l_tid));
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: d1:ad<args>e1:q<method>1:t<tid>1:y1:qe
//! \return:  TODO
//! \param:   a_arg_key optional second 20 byte argument (target/info_hash)
//! ----------------------------------------------------------------------------
static int32_t _create_query(std::string& ao_msg,
                             std::string& ao_tid,
                             const char* a_method,
                             const id_t& a_id,
                             const char* a_arg_key,
                             const id_t* a_arg)
{
        int32_t l_s;
        l_s = _make_tid(ao_tid);
        if (l_s != PKARR_STATUS_OK)
        {
                PKARR_PERROR("error generating transaction id");
                return PKARR_STATUS_ERROR;
        }
        bencode_writer l_w;
        l_w.w_key("a");
        l_w.w_start_dict();
        l_w.w_key("id");
        l_w.w_string((const char*)a_id.m_data, sizeof(a_id.m_data));
        if (a_arg_key &&
            a_arg)
        {
                l_w.w_key(a_arg_key);
                l_w.w_string((const char*)a_arg->m_data, sizeof(a_arg->m_data));
        }
        l_w.w_end_dict();
        l_w.w_key("q");
        l_w.w_string(a_method);
        l_w.w_key("t");
        l_w.w_string(ao_tid);
        l_w.w_key("y");
        l_w.w_string("q");
        l_w.serialize(ao_msg);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static std::string _to_hex(const std::string& a_buf)
{
        std::string l_hex;
        int32_t l_s;
        l_s = bin2hex_str(l_hex, (const uint8_t*)a_buf.data(), a_buf.length());
        if (l_s != PKARR_STATUS_OK)
        {
                return std::string();
        }
        return l_hex;
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
static bool _get_id(id_t& ao_id, const be_dict_t& a_dict)
{
        const be_string_t* l_id = be_dict_get_string(a_dict, "id");
        if (!l_id ||
            (l_id->m_len != sizeof(ao_id.m_data)))
        {
                return false;
        }
        memcpy(ao_id.m_data, l_id->m_data, sizeof(ao_id.m_data));
        return true;
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                          Q U E R I E S
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t krpc_create_ping(std::string& ao_msg,
                         std::string& ao_tid,
                         const id_t& a_id)
{
        return _create_query(ao_msg, ao_tid, "ping", a_id, nullptr, nullptr);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t krpc_create_find_node(std::string& ao_msg,
                              std::string& ao_tid,
                              const id_t& a_id,
                              const id_t& a_target)
{
        return _create_query(ao_msg, ao_tid, "find_node", a_id, "target", &a_target);
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t krpc_create_get_peers(std::string& ao_msg,
                              std::string& ao_tid,
                              const id_t& a_id,
                              const id_t& a_info_hash)
{
        return _create_query(ao_msg, ao_tid, "get_peers", a_id, "info_hash", &a_info_hash);
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                          K R P C   M S G
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
krpc_msg::krpc_msg(void):
        m_type(KRPC_MSG_TYPE_NONE),
        m_tid(),
        m_query(),
        m_has_id(false),
        m_id(),
        m_nodes(),
        m_token(),
        m_values(),
        m_err_code(0),
        m_err_msg()
{
}
//! ----------------------------------------------------------------------------
//! \details: TODO
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
const char* krpc_msg::type_str(krpc_msg_type_t a_type)
{
        switch (a_type)
        {
        case KRPC_MSG_TYPE_QUERY: return "query";
        case KRPC_MSG_TYPE_REPLY: return "reply";
        case KRPC_MSG_TYPE_ERROR: return "error";
        default: break;
        }
        return "none";
}
//! ----------------------------------------------------------------------------
//! \details: decode datagram
//! \return:  PKARR_STATUS_OK on success
//!           PKARR_STATUS_ERR_DHT if malformed
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t krpc_msg::parse(const char* a_buf, size_t a_len)
{
        m_type = KRPC_MSG_TYPE_NONE;
        bdecode l_bd;
        int32_t l_s;
        l_s = l_bd.init(a_buf, a_len);
        if (l_s != PKARR_STATUS_OK)
        {
                TRC_DEBUG("krpc message is not a bencoded dict (len: %zu)", a_len);
                return PKARR_STATUS_ERR_DHT;
        }
        const be_dict_t& l_dict = l_bd.m_dict;
        // -------------------------------------------------
        // transaction id
        // -------------------------------------------------
        const be_string_t* l_t = be_dict_get_string(l_dict, "t");
        if (l_t)
        {
                m_tid.assign(l_t->m_data, l_t->m_len);
        }
        // -------------------------------------------------
        // type
        // -------------------------------------------------
        const be_string_t* l_y = be_dict_get_string(l_dict, "y");
        if (!l_y ||
            (l_y->m_len != 1))
        {
                TRC_DEBUG("krpc message missing 'y'");
                return PKARR_STATUS_ERR_DHT;
        }
        switch (l_y->m_data[0])
        {
        // -------------------------------------------------
        // query
        // -------------------------------------------------
        case 'q':
        {
                const be_string_t* l_q = be_dict_get_string(l_dict, "q");
                const be_dict_t* l_a = be_dict_get_dict(l_dict, "a");
                if (!l_q ||
                    !l_a)
                {
                        TRC_DEBUG("krpc query missing 'q' or 'a'");
                        return PKARR_STATUS_ERR_DHT;
                }
                m_query.assign(l_q->m_data, l_q->m_len);
                m_has_id = _get_id(m_id, *l_a);
                m_type = KRPC_MSG_TYPE_QUERY;
                break;
        }
        // -------------------------------------------------
        // reply
        // -------------------------------------------------
        case 'r':
        {
                const be_dict_t* l_r = be_dict_get_dict(l_dict, "r");
                if (!l_r)
                {
                        TRC_DEBUG("krpc reply missing 'r'");
                        return PKARR_STATUS_ERR_DHT;
                }
                m_has_id = _get_id(m_id, *l_r);
                const be_string_t* l_nodes = be_dict_get_string(*l_r, "nodes");
                if (l_nodes)
                {
                        m_nodes.assign(l_nodes->m_data, l_nodes->m_len);
                }
                const be_string_t* l_token = be_dict_get_string(*l_r, "token");
                if (l_token)
                {
                        m_token.assign(l_token->m_data, l_token->m_len);
                }
                const be_list_t* l_values = be_dict_get_list(*l_r, "values");
                if (l_values)
                {
                        for (auto && i_v : *l_values)
                        {
                                if (i_v.m_type != BE_OBJ_STRING)
                                {
                                        continue;
                                }
                                const be_string_t& l_v = *((const be_string_t*)i_v.m_obj);
                                struct sockaddr_storage l_sas;
                                l_s = decode_compact_peer(l_sas, l_v.m_data, l_v.m_len);
                                if (l_s != PKARR_STATUS_OK)
                                {
                                        TRC_VERBOSE("skipping peer value of length: %u", l_v.m_len);
                                        continue;
                                }
                                m_values.push_back(l_sas);
                        }
                }
                m_type = KRPC_MSG_TYPE_REPLY;
                break;
        }
        // -------------------------------------------------
        // error: [code, message]
        // -------------------------------------------------
        case 'e':
        {
                const be_list_t* l_e = be_dict_get_list(l_dict, "e");
                if (l_e)
                {
                        be_list_t::const_iterator i_e = l_e->begin();
                        if ((i_e != l_e->end()) &&
                            (i_e->m_type == BE_OBJ_INT))
                        {
                                m_err_code = *((const be_int_t*)i_e->m_obj);
                                ++i_e;
                        }
                        if ((i_e != l_e->end()) &&
                            (i_e->m_type == BE_OBJ_STRING))
                        {
                                const be_string_t& l_m = *((const be_string_t*)i_e->m_obj);
                                m_err_msg.assign(l_m.m_data, l_m.m_len);
                        }
                }
                m_type = KRPC_MSG_TYPE_ERROR;
                break;
        }
        default:
        {
                TRC_DEBUG("krpc message unknown type: %c", l_y->m_data[0]);
                return PKARR_STATUS_ERR_DHT;
        }
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: human readable rendering for debug logging
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t krpc_msg::to_json(std::string& ao_json) const
{
        rapidjson::StringBuffer l_strbuf;
        rapidjson::PrettyWriter<rapidjson::StringBuffer> l_writer(l_strbuf);
        l_writer.StartObject();
        l_writer.Key("y");
        l_writer.String(type_str(m_type));
        l_writer.Key("t");
        l_writer.String(_to_hex(m_tid).c_str());
        if (m_type == KRPC_MSG_TYPE_QUERY)
        {
                l_writer.Key("q");
                l_writer.String(m_query.c_str(), (rapidjson::SizeType)m_query.length());
        }
        if (m_has_id)
        {
                l_writer.Key("id");
                l_writer.String(id2str(m_id).c_str());
        }
        if (m_type == KRPC_MSG_TYPE_REPLY)
        {
                l_writer.Key("token");
                l_writer.String(_to_hex(m_token).c_str());
                dht_node_vector_t l_nodes;
                decode_compact_nodes(l_nodes, m_nodes);
                l_writer.Key("nodes");
                l_writer.StartArray();
                for (auto && i_n : l_nodes)
                {
                        l_writer.StartObject();
                        l_writer.Key("id");
                        l_writer.String(id2str(i_n.m_id).c_str());
                        l_writer.Key("addr");
                        l_writer.String(i_n.m_addr.c_str());
                        l_writer.EndObject();
                }
                l_writer.EndArray();
                l_writer.Key("values");
                l_writer.StartArray();
                for (auto && i_v : m_values)
                {
                        l_writer.String(sas_to_str(i_v).c_str());
                }
                l_writer.EndArray();
        }
        if (m_type == KRPC_MSG_TYPE_ERROR)
        {
                l_writer.Key("e");
                l_writer.StartArray();
                l_writer.Int64(m_err_code);
                l_writer.String(m_err_msg.c_str(), (rapidjson::SizeType)m_err_msg.length());
                l_writer.EndArray();
        }
        l_writer.EndObject();
        ao_json.assign(l_strbuf.GetString(), l_strbuf.GetSize());
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! ****************************************************************************
//!                       C O M P A C T   I N F O
//! ****************************************************************************
//! ----------------------------------------------------------------------------
//! ----------------------------------------------------------------------------
//! \details: 6 bytes: ipv4[4] port[2 BE]
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t decode_compact_peer(struct sockaddr_storage& ao_sas, const char* a_buf, size_t a_len)
{
        if (!a_buf ||
            (a_len != PKARR_COMPACT_PEER_SIZE))
        {
                return PKARR_STATUS_ERROR;
        }
        memset(&ao_sas, 0, sizeof(ao_sas));
        struct sockaddr_in* l_sin = (struct sockaddr_in*)(&ao_sas);
        l_sin->sin_family = AF_INET;
        memcpy(&(l_sin->sin_addr), a_buf, 4);
        memcpy(&(l_sin->sin_port), a_buf + 4, 2);
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: 26 byte records: id[20] ipv4[4] port[2 BE]
//!           trailing partial record is ignored, port 0 is skipped
//! \return:  TODO
//! \param:   TODO
//! ----------------------------------------------------------------------------
int32_t decode_compact_nodes(dht_node_vector_t& ao_nodes, const std::string& a_buf)
{
        ao_nodes.clear();
        if (a_buf.length() % PKARR_COMPACT_NODE_SIZE)
        {
                TRC_DEBUG("compact nodes length %zu not a multiple of %d",
                          a_buf.length(), PKARR_COMPACT_NODE_SIZE);
        }
        size_t l_num = a_buf.length() / PKARR_COMPACT_NODE_SIZE;
        for (size_t i_n = 0; i_n < l_num; ++i_n)
        {
                const char* l_rec = a_buf.data() + (i_n * PKARR_COMPACT_NODE_SIZE);
                struct sockaddr_storage l_sas;
                int32_t l_s;
                l_s = decode_compact_peer(l_sas,
                                          l_rec + PKARR_DHT_ID_SIZE,
                                          PKARR_COMPACT_PEER_SIZE);
                if (l_s != PKARR_STATUS_OK)
                {
                        continue;
                }
                if (((struct sockaddr_in*)&l_sas)->sin_port == 0)
                {
                        continue;
                }
                dht_node_t l_node;
                memcpy(l_node.m_id.m_data, l_rec, PKARR_DHT_ID_SIZE);
                l_node.m_has_id = true;
                l_node.m_addr = sas_to_str(l_sas);
                ao_nodes.push_back(l_node);
        }
        return PKARR_STATUS_OK;
}
//! ----------------------------------------------------------------------------
//! \details: determine whether id1 or id2 is closer to ref
//! \return:  -1 if id1 closer, 1 if id2 closer, 0 if equal
//! \param:   TODO
//! ----------------------------------------------------------------------------
int xorcmp(const id_t& a_id1, const id_t& a_id2, const id_t& a_ref)
{
        for (int i_c = 0; i_c < PKARR_DHT_ID_SIZE; ++i_c)
        {
                if (a_id1.m_data[i_c] == a_id2.m_data[i_c])
                {
                        continue;
                }
                uint8_t l_xor1 = a_id1.m_data[i_c] ^ a_ref.m_data[i_c];
                uint8_t l_xor2 = a_id2.m_data[i_c] ^ a_ref.m_data[i_c];
                return (l_xor1 < l_xor2) ? -1 : 1;
        }
        return 0;
}
}
