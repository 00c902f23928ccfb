#include "webgate/common/Config.h"
#include "webgate/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace webgate {
namespace common {

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::string Config::Trim(const std::string& s) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto start = std::find_if(s.begin(), s.end(), notSpace);
    auto end = std::find_if(s.rbegin(), s.rend(), notSpace).base();
    return (start < end) ? std::string(start, end) : std::string();
}

bool Config::Parse(std::istream& in, std::map<std::string, std::map<std::string, std::string>>& out) {
    std::string line, section = "global";
    int lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']' || line.size() < 3) {
                LOG_ERROR << "Config: bad section header at line " << lineNo << ": " << line;
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto delimiterPos = line.find('=');
        if (delimiterPos == std::string::npos) {
            LOG_WARN << "Config: ignoring line " << lineNo << " without '=': " << line;
            continue;
        }
        std::string key = Trim(line.substr(0, delimiterPos));
        std::string value = Trim(line.substr(delimiterPos + 1));
        if (!key.empty()) out[section][key] = value;
    }
    return true;
}

bool Config::Load(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_ERROR << "Failed to open config file: " << filename;
        return false;
    }

    std::map<std::string, std::map<std::string, std::string>> parsed;
    if (!Parse(file, parsed)) return false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_ = std::move(parsed);
    }
    LOG_INFO << "Loaded config file: " << filename;
    return true;
}

bool Config::LoadFromString(const std::string& iniText) {
    std::istringstream in(iniText);
    std::map<std::string, std::map<std::string, std::string>> parsed;
    if (!Parse(in, parsed)) return false;

    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = std::move(parsed);
    return true;
}

void Config::SetString(const std::string& section, const std::string& key, const std::string& value) {
    if (section.empty() || key.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    settings_[section][key] = value;
}

void Config::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.clear();
}

std::string Config::DumpIni() const {
    std::map<std::string, std::map<std::string, std::string>> snap;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap = settings_;
    }

    std::ostringstream f;
    auto writeSection = [&](const std::string& section, const std::map<std::string, std::string>& kv) {
        f << "[" << section << "]\n";
        for (const auto& it : kv) {
            f << it.first << " = " << it.second << "\n";
        }
        f << "\n";
    };

    // [global] first
    auto itg = snap.find("global");
    if (itg != snap.end()) {
        writeSection("global", itg->second);
        snap.erase(itg);
    }
    for (const auto& s : snap) {
        writeSection(s.first, s.second);
    }
    return f.str();
}

std::string Config::GetString(const std::string& section, const std::string& key, const std::string& defaultVal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto sit = settings_.find(section);
    if (sit == settings_.end()) return defaultVal;
    auto kit = sit->second.find(key);
    if (kit == sit->second.end()) return defaultVal;
    return kit->second;
}

int Config::GetInt(const std::string& section, const std::string& key, int defaultVal) {
    std::string val = GetString(section, key, "");
    if (val.empty()) return defaultVal;
    try {
        size_t used = 0;
        int v = std::stoi(val, &used);
        if (used != val.size()) {
            LOG_WARN << "Config: [" << section << "] " << key << " = '" << val << "' is not an integer";
            return defaultVal;
        }
        return v;
    } catch (const std::logic_error&) {
        LOG_WARN << "Config: [" << section << "] " << key << " = '" << val << "' is not an integer";
        return defaultVal;
    }
}

bool Config::GetBool(const std::string& section, const std::string& key, bool defaultVal) {
    std::string val = GetString(section, key, "");
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (val == "1" || val == "true" || val == "yes" || val == "on") return true;
    if (val == "0" || val == "false" || val == "no" || val == "off") return false;
    if (!val.empty()) {
        LOG_WARN << "Config: [" << section << "] " << key << " = '" << val << "' is not a boolean";
    }
    return defaultVal;
}

std::vector<std::string> Config::GetList(const std::string& section, const std::string& key) {
    std::vector<std::string> out;
    std::string val = GetString(section, key, "");
    size_t start = 0;
    while (start <= val.size()) {
        size_t comma = val.find(',', start);
        if (comma == std::string::npos) comma = val.size();
        std::string item = Trim(val.substr(start, comma - start));
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

} // namespace common
} // namespace webgate
