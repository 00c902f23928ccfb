#pragma once

#include <string>
#include <utility>
#include <vector>

namespace webgate {
namespace protocol {

// HTTP header fields in arrival order. Lookups ignore case; entries keep the case
// they were written with, so the same logical header may exist more than once.
class HeaderMap {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    // First value for name, or nullptr.
    const std::string* Find(const std::string& name) const;
    std::string Get(const std::string& name, const std::string& defaultVal = std::string()) const;
    bool Has(const std::string& name) const { return Find(name) != nullptr; }
    // Key of the first entry matching name, exactly as stored. Empty if absent.
    std::string FindKey(const std::string& name) const;
    std::vector<std::string> GetAll(const std::string& name) const;

    // Replaces the value under this exact key (in place when present) and drops
    // every other-case entry for the same name.
    void Set(const std::string& name, const std::string& value);
    // Appends without touching existing entries.
    void Add(const std::string& name, const std::string& value);
    // Removes all entries for name regardless of case. Returns how many were removed.
    size_t Remove(const std::string& name);

    // True when a comma separated header value list contains token, ignoring case.
    bool HasToken(const std::string& name, const std::string& token) const;

    void Clear() { fields_.clear(); }
    bool Empty() const { return fields_.empty(); }
    size_t Size() const { return fields_.size(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    static bool EqualsIgnoreCase(const std::string& a, const std::string& b);
    static bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);
    static std::string ToLower(const std::string& s);

private:
    std::vector<Field> fields_;
};

} // namespace protocol
} // namespace webgate
