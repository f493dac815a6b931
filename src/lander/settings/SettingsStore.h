/**
 * SettingsStore.h
 * 
 * Key-value persistence for small settings records
 * 
 * Features:
 * - One flat JSON object per key
 * - File-backed store (one <key>.json per record)
 * - In-memory store for tests and environments without storage
 * - Read and write failures are logged and reported, never thrown
 */

#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace Lander {

using json = nlohmann::json;

class SettingsStore {
public:
    virtual ~SettingsStore() = default;
    
    /** Stored record, or nullopt when missing or unreadable */
    virtual std::optional<json> load(const std::string& key) = 0;
    
    /** Replace the whole record. Returns false if it could not be written */
    virtual bool save(const std::string& key, const json& record) = 0;
    
    virtual bool contains(const std::string& key) = 0;
};

/**
 * Settings kept only for the lifetime of the process
 */
class MemorySettingsStore : public SettingsStore {
public:
    std::optional<json> load(const std::string& key) override;
    bool save(const std::string& key, const json& record) override;
    bool contains(const std::string& key) override;
    
    /** Store raw text for a key, as a broken writer would leave it */
    void putRaw(const std::string& key, const std::string& text) { records_[key] = text; }
    const std::string* getRaw(const std::string& key) const;
    
private:
    std::unordered_map<std::string, std::string> records_;
};

/**
 * Settings stored as JSON files in a directory
 */
class FileSettingsStore : public SettingsStore {
public:
    explicit FileSettingsStore(std::string directory);
    
    std::optional<json> load(const std::string& key) override;
    bool save(const std::string& key, const json& record) override;
    bool contains(const std::string& key) override;
    
    std::string getFilePath(const std::string& key) const;
    
private:
    std::string directory_;
};

} // namespace Lander
