#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "conduit/common/noncopyable.h"

namespace conduit {
namespace common {

// INI settings store: map<section, map<key, value>>. Keys outside any
// section land in "global".
class Config : noncopyable {
public:
    static Config& Instance();

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (forgets any loaded filename).
    bool LoadFromString(const std::string& iniText);

    void Clear();

    // Path given to the last successful Load(); nullopt for string-loaded settings.
    std::optional<std::string> LoadedFilename() const;

    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Accepts 1/0, true/false, yes/no, on/off (case-insensitive). Anything else yields defaultVal.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    Config() = default;
    static std::string Trim(const std::string& s);
    static std::map<std::string, std::map<std::string, std::string>> ParseIni(std::istream& in);

    std::optional<std::string> LookupLocked(const std::string& section, const std::string& key) const;

    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::string>> settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace conduit
