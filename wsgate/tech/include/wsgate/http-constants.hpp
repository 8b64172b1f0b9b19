#pragma once

#include <cstddef>
#include <string_view>

namespace wsgate::http {

// Header names are stored in their conventional canonical form for emission.
// Comparisons against received names must stay case-insensitive.

inline constexpr std::string_view HTTP10Sv = "HTTP/1.0";
inline constexpr std::string_view HTTP11Sv = "HTTP/1.1";

inline constexpr std::string_view GET = "GET";

inline constexpr std::string_view Connection = "Connection";
inline constexpr std::string_view Upgrade = "Upgrade";

// Lowercase token expected in the Connection header of an upgrade request
inline constexpr std::string_view UpgradeToken = "upgrade";

inline constexpr std::string_view HeaderSep = ": ";
inline constexpr std::string_view CRLF = "\r\n";
inline constexpr std::string_view DoubleCRLF = "\r\n\r\n";

inline constexpr std::string_view SwitchingProtocolsStatusLine = "HTTP/1.1 101 Switching Protocols\r\n";

// Shortest request line we accept: "GET / HTTP/1.1\r\n"
inline constexpr std::size_t kHttpReqLineMinLen = GET.size() + 3UL + HTTP11Sv.size() + CRLF.size();

}  // namespace wsgate::http
