#pragma once

#include <cstdint>
#include <string>

namespace webgate {
namespace protocol {

// Absolute URL of one of the special web schemes (http, https, ws, wss).
// Parsing follows what browsers accept for these schemes: scheme and host are
// lower-cased, a port equal to the scheme default is dropped, backslashes count
// as slashes and the path is dot-segment normalized.
struct Url {
    std::string scheme;
    std::string userinfo;
    std::string host;       // IPv6 literals without brackets
    uint16_t port = 0;      // 0 means the scheme default
    std::string path = "/";
    std::string query;      // with the leading '?', empty if none
    std::string fragment;   // with the leading '#', empty if none

    static bool Parse(const std::string& input, Url* out);
    static uint16_t DefaultPort(const std::string& scheme);
    static bool IsSpecialScheme(const std::string& scheme);

    // Resolves ref (absolute, scheme relative, path absolute or relative) against this URL.
    bool Resolve(const std::string& ref, Url* out) const;

    std::string Href() const;
    // host[:port] as sent in a Host header.
    std::string Authority() const;
    std::string PathAndQuery() const;
    uint16_t EffectivePort() const { return port != 0 ? port : DefaultPort(scheme); }
    bool IsSecure() const { return scheme == "https" || scheme == "wss"; }
};

} // namespace protocol
} // namespace webgate
