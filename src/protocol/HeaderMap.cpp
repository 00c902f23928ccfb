#include "webgate/protocol/HeaderMap.h"

#include <algorithm>
#include <cctype>

namespace webgate {
namespace protocol {

namespace {

char LowerChar(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

std::string TrimWs(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return s.substr(b, e - b);
}

} // namespace

bool HeaderMap::EqualsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (LowerChar(a[i]) != LowerChar(b[i])) return false;
    }
    return true;
}

bool HeaderMap::ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char x, char y) { return LowerChar(x) == LowerChar(y); });
    return it != haystack.end() || needle.empty();
}

std::string HeaderMap::ToLower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) out.push_back(LowerChar(c));
    return out;
}

const std::string* HeaderMap::Find(const std::string& name) const {
    for (const auto& f : fields_) {
        if (EqualsIgnoreCase(f.first, name)) return &f.second;
    }
    return nullptr;
}

std::string HeaderMap::Get(const std::string& name, const std::string& defaultVal) const {
    const std::string* v = Find(name);
    return v ? *v : defaultVal;
}

std::string HeaderMap::FindKey(const std::string& name) const {
    for (const auto& f : fields_) {
        if (EqualsIgnoreCase(f.first, name)) return f.first;
    }
    return std::string();
}

std::vector<std::string> HeaderMap::GetAll(const std::string& name) const {
    std::vector<std::string> out;
    for (const auto& f : fields_) {
        if (EqualsIgnoreCase(f.first, name)) out.push_back(f.second);
    }
    return out;
}

void HeaderMap::Set(const std::string& name, const std::string& value) {
    // Reuse the exact-case slot if there is one, else the first other-case slot.
    size_t slot = fields_.size();
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].first == name) {
            slot = i;
            break;
        }
        if (slot == fields_.size() && EqualsIgnoreCase(fields_[i].first, name)) slot = i;
    }
    if (slot == fields_.size()) {
        fields_.emplace_back(name, value);
        return;
    }

    std::vector<Field> out;
    out.reserve(fields_.size());
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (i == slot) {
            out.emplace_back(name, value);
        } else if (!EqualsIgnoreCase(fields_[i].first, name)) {
            out.push_back(std::move(fields_[i]));
        }
    }
    fields_.swap(out);
}

void HeaderMap::Add(const std::string& name, const std::string& value) {
    fields_.emplace_back(name, value);
}

size_t HeaderMap::Remove(const std::string& name) {
    const size_t before = fields_.size();
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&name](const Field& f) { return EqualsIgnoreCase(f.first, name); }),
                  fields_.end());
    return before - fields_.size();
}

bool HeaderMap::HasToken(const std::string& name, const std::string& token) const {
    for (const auto& f : fields_) {
        if (!EqualsIgnoreCase(f.first, name)) continue;
        size_t start = 0;
        while (start <= f.second.size()) {
            size_t comma = f.second.find(',', start);
            if (comma == std::string::npos) comma = f.second.size();
            if (EqualsIgnoreCase(TrimWs(f.second.substr(start, comma - start)), token)) return true;
            start = comma + 1;
        }
    }
    return false;
}

} // namespace protocol
} // namespace webgate
