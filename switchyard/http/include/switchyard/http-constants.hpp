#pragma once

#include <string_view>

namespace switchyard::http {

// Header names are stored in their canonical form for emission; lookups in requests are case insensitive.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view ContentLength = "Content-Length";
inline constexpr std::string_view ContentType = "Content-Type";
inline constexpr std::string_view Cookie = "Cookie";
inline constexpr std::string_view Host = "Host";
inline constexpr std::string_view Location = "Location";
inline constexpr std::string_view SetCookie = "Set-Cookie";
inline constexpr std::string_view TransferEncoding = "Transfer-Encoding";

inline constexpr std::string_view ConnectionClose = "close";
inline constexpr std::string_view ConnectionKeepAlive = "keep-alive";
inline constexpr std::string_view TransferEncodingChunked = "chunked";

inline constexpr std::string_view ContentTypeTextPlain = "text/plain";
inline constexpr std::string_view ContentTypeTextHtml = "text/html";
inline constexpr std::string_view ContentTypeApplicationOctetStream = "application/octet-stream";
inline constexpr std::string_view ContentTypeFormUrlEncoded = "application/x-www-form-urlencoded";

inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";
inline constexpr std::string_view HeaderSep = ": ";

}  // namespace switchyard::http
