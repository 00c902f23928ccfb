#include "webgate/protocol/Url.h"

#include <cctype>
#include <vector>

namespace webgate {
namespace protocol {

namespace {

bool IsC0OrSpace(char ch) {
    return static_cast<unsigned char>(ch) <= 0x20;
}

std::string ToLowerAscii(std::string value) {
    for (char& ch : value) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return value;
}

// Leading/trailing C0 controls and spaces go, inner tabs and newlines go.
std::string CleanInput(const std::string& input) {
    size_t b = 0;
    size_t e = input.size();
    while (b < e && IsC0OrSpace(input[b])) ++b;
    while (e > b && IsC0OrSpace(input[e - 1])) --e;
    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i) {
        const char ch = input[i];
        if (ch == '\t' || ch == '\n' || ch == '\r') continue;
        out += ch;
    }
    return out;
}

bool IsSchemeChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '+' || ch == '-' || ch == '.';
}

bool ExtractScheme(const std::string& value, std::string* scheme, size_t* rest) {
    const size_t colon = value.find(':');
    if (colon == std::string::npos || colon == 0) return false;
    if (!std::isalpha(static_cast<unsigned char>(value[0]))) return false;
    for (size_t i = 1; i < colon; ++i) {
        if (!IsSchemeChar(value[i])) return false;
    }
    *scheme = ToLowerAscii(value.substr(0, colon));
    *rest = colon + 1;
    return true;
}

bool IsSlash(char ch) {
    return ch == '/' || ch == '\\';
}

char HexUpper(unsigned value) {
    static const char kHexDigits[] = "0123456789ABCDEF";
    return kHexDigits[value & 0x0F];
}

bool InPathEncodeSet(unsigned char ch) {
    return ch < 0x20 || ch >= 0x7F || ch == ' ' || ch == '"' || ch == '#' || ch == '<' ||
           ch == '>' || ch == '?' || ch == '`' || ch == '{' || ch == '}';
}

bool InQueryEncodeSet(unsigned char ch) {
    return ch < 0x20 || ch >= 0x7F || ch == ' ' || ch == '"' || ch == '#' || ch == '<' ||
           ch == '>' || ch == '\'';
}

bool InFragmentEncodeSet(unsigned char ch) {
    return ch < 0x20 || ch >= 0x7F || ch == ' ' || ch == '"' || ch == '<' || ch == '>' || ch == '`';
}

template <typename Pred>
std::string PercentEncode(const std::string& in, size_t from, Pred inSet) {
    std::string out(in, 0, from);
    for (size_t i = from; i < in.size(); ++i) {
        const unsigned char ch = static_cast<unsigned char>(in[i]);
        if (inSet(ch)) {
            out += '%';
            out += HexUpper(ch >> 4);
            out += HexUpper(ch);
        } else {
            out += static_cast<char>(ch);
        }
    }
    return out;
}

// RFC 3986 section 5.2.4, keeping empty segments.
std::string RemoveDotSegments(const std::string& path) {
    std::vector<std::string> segments;
    size_t pos = 1; // path always starts with '/'
    bool trailingSlash = false;
    while (true) {
        const size_t slash = path.find('/', pos);
        const std::string segment =
            (slash == std::string::npos) ? path.substr(pos) : path.substr(pos, slash - pos);
        const std::string lower = ToLowerAscii(segment);
        const bool last = (slash == std::string::npos);
        if (lower == "." || lower == "%2e") {
            trailingSlash = last;
        } else if (lower == ".." || lower == ".%2e" || lower == "%2e." || lower == "%2e%2e") {
            if (!segments.empty()) segments.pop_back();
            trailingSlash = last;
        } else {
            segments.push_back(segment);
            trailingSlash = false;
        }
        if (last) break;
        pos = slash + 1;
    }

    std::string out;
    for (const auto& s : segments) {
        out += '/';
        out += s;
    }
    if (trailingSlash || out.empty()) out += '/';
    return out;
}

std::string DirectoryOf(const std::string& path) {
    const size_t slash = path.rfind('/');
    if (slash == std::string::npos) return "/";
    return path.substr(0, slash + 1);
}

bool IsForbiddenHostChar(char ch) {
    switch (ch) {
        case ' ': case '#': case '/': case '<': case '>': case '?': case '@':
        case '[': case '\\': case ']': case '^': case '|': case '%':
            return true;
        default:
            return static_cast<unsigned char>(ch) < 0x20 || ch == 0x7F;
    }
}

// "path?query#fragment" split into its three parts; backslashes become slashes in the path.
void SplitReference(const std::string& ref, std::string* path, std::string* query, std::string* fragment) {
    const size_t hash = ref.find('#');
    const std::string withoutFragment = (hash == std::string::npos) ? ref : ref.substr(0, hash);
    *fragment = (hash == std::string::npos) ? std::string() : ref.substr(hash);
    const size_t q = withoutFragment.find('?');
    *path = (q == std::string::npos) ? withoutFragment : withoutFragment.substr(0, q);
    *query = (q == std::string::npos) ? std::string() : withoutFragment.substr(q);
    for (char& ch : *path) {
        if (ch == '\\') ch = '/';
    }
}

bool ParseAuthority(const std::string& authority, Url* url) {
    std::string hostport = authority;
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        url->userinfo = authority.substr(0, at);
        hostport = authority.substr(at + 1);
    }

    std::string portStr;
    if (!hostport.empty() && hostport.front() == '[') {
        const size_t close = hostport.find(']');
        if (close == std::string::npos) return false;
        url->host = ToLowerAscii(hostport.substr(1, close - 1));
        const std::string after = hostport.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return false;
            portStr = after.substr(1);
        }
        if (url->host.empty() || url->host.find_first_not_of("0123456789abcdef:.") != std::string::npos) {
            return false;
        }
    } else {
        const size_t colon = hostport.find(':');
        url->host = ToLowerAscii(hostport.substr(0, colon));
        if (colon != std::string::npos) portStr = hostport.substr(colon + 1);
        if (url->host.empty()) return false;
        for (char ch : url->host) {
            if (IsForbiddenHostChar(ch)) return false;
        }
    }

    url->port = 0;
    if (!portStr.empty()) {
        unsigned long value = 0;
        for (char ch : portStr) {
            if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
            value = value * 10 + static_cast<unsigned long>(ch - '0');
            if (value > 65535) return false;
        }
        if (value != Url::DefaultPort(url->scheme)) url->port = static_cast<uint16_t>(value);
    }
    return true;
}

} // namespace

uint16_t Url::DefaultPort(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    return 0;
}

bool Url::IsSpecialScheme(const std::string& scheme) {
    return DefaultPort(scheme) != 0;
}

bool Url::Parse(const std::string& input, Url* out) {
    const std::string value = CleanInput(input);
    Url url;
    size_t pos = 0;
    if (!ExtractScheme(value, &url.scheme, &pos)) return false;
    if (!IsSpecialScheme(url.scheme)) return false;

    // Any run of slashes after the scheme introduces the authority.
    while (pos < value.size() && IsSlash(value[pos])) ++pos;

    size_t authorityEnd = pos;
    while (authorityEnd < value.size() && !IsSlash(value[authorityEnd]) && value[authorityEnd] != '?' &&
           value[authorityEnd] != '#') {
        ++authorityEnd;
    }
    if (!ParseAuthority(value.substr(pos, authorityEnd - pos), &url)) return false;

    std::string path;
    SplitReference(value.substr(authorityEnd), &path, &url.query, &url.fragment);
    url.path = RemoveDotSegments(path.empty() ? std::string("/") : path);

    *out = std::move(url);
    return true;
}

bool Url::Resolve(const std::string& refInput, Url* out) const {
    const std::string ref = CleanInput(refInput);

    std::string refScheme;
    size_t rest = 0;
    if (ExtractScheme(ref, &refScheme, &rest)) {
        // "http:foo" with the base's own scheme is a relative reference.
        if (refScheme != scheme || (rest < ref.size() && IsSlash(ref[rest]))) {
            return Parse(ref, out);
        }
        return Resolve(ref.substr(rest), out);
    }

    if (ref.size() >= 2 && IsSlash(ref[0]) && IsSlash(ref[1])) {
        return Parse(scheme + ":" + ref, out);
    }

    Url url = *this;
    url.fragment.clear();
    if (ref.empty()) {
        *out = std::move(url);
        return true;
    }

    std::string refPath;
    std::string refQuery;
    std::string refFragment;
    SplitReference(ref, &refPath, &refQuery, &refFragment);

    if (refPath.empty()) {
        if (!refQuery.empty()) url.query = refQuery;
    } else if (refPath.front() == '/') {
        url.path = RemoveDotSegments(refPath);
        url.query = refQuery;
    } else {
        url.path = RemoveDotSegments(DirectoryOf(path) + refPath);
        url.query = refQuery;
    }
    url.fragment = refFragment;
    *out = std::move(url);
    return true;
}

std::string Url::Authority() const {
    std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != 0) out += ":" + std::to_string(port);
    return out;
}

std::string Url::PathAndQuery() const {
    std::string out = PercentEncode(path.empty() ? std::string("/") : path, 0, InPathEncodeSet);
    if (!query.empty()) out += PercentEncode(query, 1, InQueryEncodeSet);
    return out;
}

std::string Url::Href() const {
    std::string out = scheme + "://";
    if (!userinfo.empty()) out += userinfo + "@";
    out += Authority();
    out += PathAndQuery();
    if (!fragment.empty()) out += PercentEncode(fragment, 1, InFragmentEncodeSet);
    return out;
}

} // namespace protocol
} // namespace webgate
