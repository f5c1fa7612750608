#pragma once

namespace claimscan {
namespace obs {

inline constexpr const char* kErrHttpBadRequest = "E_HTTP_BAD_REQUEST";
inline constexpr const char* kErrHttpNotFound = "E_HTTP_NOT_FOUND";
inline constexpr const char* kErrHttpInvalidArgument = "E_HTTP_INVALID_ARGUMENT";
inline constexpr const char* kErrHttpJsonParseError = "E_HTTP_JSON_PARSE_ERROR";

inline constexpr const char* kErrDbConnectFailed = "E_DB_CONNECT_FAILED";
inline constexpr const char* kErrDbQueryFailed = "E_DB_QUERY_FAILED";
inline constexpr const char* kErrDbInsertFailed = "E_DB_INSERT_FAILED";

inline constexpr const char* kErrDataUnavailable = "E_DATA_UNAVAILABLE";
inline constexpr const char* kErrEntityNotFound = "E_ENTITY_NOT_FOUND";
inline constexpr const char* kErrScanRunNotFound = "E_SCAN_RUN_NOT_FOUND";
inline constexpr const char* kErrConfigInvalid = "E_CONFIG_INVALID";

inline constexpr const char* kErrInternal = "E_INTERNAL";

} // namespace obs
} // namespace claimscan
