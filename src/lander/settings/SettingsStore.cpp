/**
 * SettingsStore.cpp
 */

#include "SettingsStore.h"
#include "../core/Log.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace Lander {

namespace fs = std::filesystem;

namespace {

std::optional<json> parseRecord(const std::string& key, const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const std::exception& e) {
        LANDER_LOG_WARN("Settings '%s' are malformed, using defaults: %s", key.c_str(), e.what());
        return std::nullopt;
    }
    
    if (!doc.is_object()) {
        LANDER_LOG_WARN("Settings '%s' are not an object, using defaults", key.c_str());
        return std::nullopt;
    }
    return doc;
}

} // namespace

// ============================================================================
// MEMORY STORE
// ============================================================================

std::optional<json> MemorySettingsStore::load(const std::string& key) {
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return parseRecord(key, it->second);
}

bool MemorySettingsStore::save(const std::string& key, const json& record) {
    records_[key] = record.dump();
    return true;
}

bool MemorySettingsStore::contains(const std::string& key) {
    return records_.find(key) != records_.end();
}

const std::string* MemorySettingsStore::getRaw(const std::string& key) const {
    auto it = records_.find(key);
    return it != records_.end() ? &it->second : nullptr;
}

// ============================================================================
// FILE STORE
// ============================================================================

FileSettingsStore::FileSettingsStore(std::string directory)
    : directory_(std::move(directory)) {
}

std::string FileSettingsStore::getFilePath(const std::string& key) const {
    return (fs::path(directory_) / (key + ".json")).string();
}

std::optional<json> FileSettingsStore::load(const std::string& key) {
    std::ifstream file(getFilePath(key));
    if (!file.is_open()) return std::nullopt;
    
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseRecord(key, buffer.str());
}

bool FileSettingsStore::save(const std::string& key, const json& record) {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        LANDER_LOG_WARN("Cannot create settings directory %s: %s", directory_.c_str(), ec.message().c_str());
        return false;
    }
    
    std::ofstream file(getFilePath(key));
    if (!file.is_open()) {
        LANDER_LOG_ERROR("Cannot write settings '%s'", key.c_str());
        return false;
    }
    
    file << record.dump(2);
    return static_cast<bool>(file);
}

bool FileSettingsStore::contains(const std::string& key) {
    std::error_code ec;
    return fs::exists(getFilePath(key), ec);
}

} // namespace Lander
