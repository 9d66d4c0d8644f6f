#ifndef _PKARR_DEF_H_
#define _PKARR_DEF_H_
//! ----------------------------------------------------------------------------
//! status
//! ----------------------------------------------------------------------------
#ifndef PKARR_STATUS_OK
  #define PKARR_STATUS_OK 0
#endif
#ifndef PKARR_STATUS_ERROR
  #define PKARR_STATUS_ERROR -1
#endif
#ifndef PKARR_STATUS_AGAIN
  #define PKARR_STATUS_AGAIN -2
#endif
#ifndef PKARR_STATUS_BUSY
  #define PKARR_STATUS_BUSY -3
#endif
#ifndef PKARR_STATUS_DONE
  #define PKARR_STATUS_DONE -4
#endif
#ifndef PKARR_STATUS_NOT_FOUND
  #define PKARR_STATUS_NOT_FOUND -5
#endif
// ---------------------------------------------------------
// error specific status
// ---------------------------------------------------------
#define PKARR_STATUS_ERR_IDENTITY           -10
#define PKARR_STATUS_ERR_SIGNATURE          -11
#define PKARR_STATUS_ERR_PACKET             -12
#define PKARR_STATUS_ERR_PACKET_LENGTH      -13
#define PKARR_STATUS_ERR_PACKET_TOO_LARGE   -14
#define PKARR_STATUS_ERR_RELAY_PAYLOAD      -15
#define PKARR_STATUS_ERR_DHT                -16
#define PKARR_STATUS_ERR_TIMEOUT            -17
#define PKARR_STATUS_ERR_UNSUPPORTED        -18
#ifndef PKARR_ERR_LEN
  #define PKARR_ERR_LEN 4096
#endif
#ifndef CONFIG_DATE_FORMAT
  #if defined(__APPLE__) || defined(__darwin__)
    #define CONFIG_DATE_FORMAT "%Y-%m-%dT%H:%M:%S"
  #else
    #define CONFIG_DATE_FORMAT "%Y-%m-%dT%H:%M:%S%Z"
  #endif
#endif
//! ----------------------------------------------------------------------------
//! sizes
//! ----------------------------------------------------------------------------
#define PKARR_PUBLIC_KEY_SIZE                     32
#define PKARR_PUBLIC_KEY_Z32_LEN                  52
#define PKARR_SECRET_KEY_SIZE                     32
#define PKARR_SIGNATURE_SIZE                      64
#define PKARR_TIMESTAMP_SIZE                       8
#define PKARR_DHT_ID_SIZE                         20
#define PKARR_MAX_ENCODED_PACKET_SIZE           1000
#define PKARR_SIGNED_PACKET_MIN_SIZE             104
#define PKARR_SIGNED_PACKET_MAX_SIZE            1104
#define PKARR_RELAY_PAYLOAD_MIN_SIZE              72
#define PKARR_COMPACT_NODE_SIZE                   26
#define PKARR_COMPACT_PEER_SIZE                    6
//! ----------------------------------------------------------------------------
//! defaults
//! ----------------------------------------------------------------------------
#define PKARR_DEFAULT_MIN_TTL_S                  300
#define PKARR_DEFAULT_MAX_TTL_S                86400
#define PKARR_DEFAULT_MAX_ATTEMPTS               100
#define PKARR_DEFAULT_LOOKUP_TIMEOUT_S            30
#define PKARR_DHT_REQUEST_TIMEOUT_MS            5000
#define PKARR_DHT_RECV_BUF_SIZE                 1500
#define PKARR_MAINTENANCE_INTERVAL_S              60
#define PKARR_NODE_STORE_MAX_NODES               256
// ---------------------------------------------------------
// bootstrap
// ---------------------------------------------------------
#define PKARR_DEFAULT_BOOTSTRAP_NODES { \
        "router.bittorrent.com:6881", \
        "router.utorrent.com:6881", \
        "dht.transmissionbt.com:6881", \
        "dht.libtorrent.org:25401" \
}
//! ----------------------------------------------------------------------------
//! macros
//! ----------------------------------------------------------------------------
#ifndef PKARR_PERROR
#define PKARR_PERROR(...) do { \
    TRC_ERROR(__VA_ARGS__); \
    snprintf(g_pkarr_err_msg, PKARR_ERR_LEN, __VA_ARGS__); \
} while(0)
#endif
#ifndef UNUSED
#define UNUSED(x) ( (void)(x) )
#endif
//! ----------------------------------------------------------------------------
//! global extern
//! ----------------------------------------------------------------------------
extern thread_local char g_pkarr_err_msg[PKARR_ERR_LEN];
#endif
