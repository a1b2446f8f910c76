#pragma once

#define DBC_API_VERSION "DBC/C++ v4.7.0"

#define DBC_DEFAULT_TIMEOUT 60 // seconds, image captchas
#define DBC_DEFAULT_TOKEN_TIMEOUT 120 // seconds, token based captchas
#define DBC_DEFAULT_POLL_INTERVAL 3 // seconds, once the interval table runs out

#define DBC_HTTP_BASE_URL "http://api.dbcapi.me/api"
#define DBC_HTTP_RESPONSE_TYPE "application/json"
#define DBC_HTTP_REQUEST_TIMEOUT 30 // seconds

#define DBC_SOCKET_HOST "api.dbcapi.me"
#define DBC_SOCKET_FIRST_PORT 8123
#define DBC_SOCKET_LAST_PORT 8130
#define DBC_SOCKET_TERMINATOR "\r\n"
#define DBC_SOCKET_RECONNECTS 2
#define DBC_SOCKET_IO_TIMEOUT 30 // seconds

#define DBC_MAX_UPLOAD_SIZE (180 * 1024)
