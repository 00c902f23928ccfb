#pragma once

#include <string>
#include <map>
#include <vector>
#include <mutex>
#include "webgate/common/noncopyable.h"

namespace webgate {
namespace common {

// INI settings: [section] headers, key = value lines, '#' or ';' comments.
// Keys before the first section header land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings, replacing what was loaded before.
    bool LoadFromString(const std::string& iniText);

    void SetString(const std::string& section, const std::string& key, const std::string& value);
    void Clear();

    // Dump current settings to INI text.
    std::string DumpIni() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "");
    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0);
    // Accepts 1/0, true/false, yes/no, on/off.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false);
    // Comma separated value, items trimmed, empty items dropped.
    std::vector<std::string> GetList(const std::string& section, const std::string& key);

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static bool Parse(std::istream& in, std::map<std::string, std::map<std::string, std::string>>& out);

    mutable std::mutex mutex_;
    // map<section, map<key, value>>
    std::map<std::string, std::map<std::string, std::string>> settings_;
};

} // namespace common
} // namespace webgate
