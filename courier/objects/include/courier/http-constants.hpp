#pragma once

#include <cstdint>
#include <string_view>

namespace courier::http {

// Header field names are case-insensitive (RFC 9110). They are stored here in their canonical form for emission,
// lookups in http::Headers ignore case.

// Methods
inline constexpr std::string_view GET = "GET";
inline constexpr std::string_view HEAD = "HEAD";
inline constexpr std::string_view POST = "POST";
inline constexpr std::string_view PUT = "PUT";
inline constexpr std::string_view DELETE = "DELETE";
inline constexpr std::string_view CONNECT = "CONNECT";
inline constexpr std::string_view OPTIONS = "OPTIONS";
inline constexpr std::string_view TRACE = "TRACE";
inline constexpr std::string_view PATCH = "PATCH";

// Header field names
inline constexpr std::string_view Accept = "Accept";
inline constexpr std::string_view AcceptEncoding = "Accept-Encoding";
inline constexpr std::string_view Authorization = "Authorization";
inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentDispositionHeader = "Content-Disposition";
inline constexpr std::string_view ContentEncoding = "Content-Encoding";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Expect = "Expect";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view LinkHeader = "Link";
inline constexpr std::string_view ProxyAuthorization = "Proxy-Authorization";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";
inline constexpr std::string_view UserAgent = "User-Agent";

// Header values
inline constexpr std::string_view chunked = "chunked";
inline constexpr std::string_view keepalive = "keep-alive";
inline constexpr std::string_view close = "close";
inline constexpr std::string_view h100continue = "100-continue";

inline constexpr std::string_view ContentTypeOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeTextPlainUtf8 = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

inline constexpr std::string_view CRLF = "\r\n";

// Default ports
inline constexpr uint16_t kHttpPort = 80;
inline constexpr uint16_t kHttpsPort = 443;

}  // namespace courier::http
