#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <map>
#include <vector>

namespace usb_audio {

using ConfigValue = std::variant<bool, int, double, std::string>;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Configuration access
    bool getBool(const std::string& key, bool defaultValue = false) const;
    int getInt(const std::string& key, int defaultValue = 0) const;
    double getDouble(const std::string& key, double defaultValue = 0.0) const;
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;
    std::vector<std::string> getList(const std::string& key) const;

    void setBool(const std::string& key, bool value);
    void setInt(const std::string& key, int value);
    void setDouble(const std::string& key, double value);
    void setString(const std::string& key, const std::string& value);

    // Device-specific settings, keyed "vvvv:pppp"
    std::map<std::string, ConfigValue> getDeviceSettings(const std::string& vendorId,
                                                         const std::string& productId) const;
    void setDeviceSettings(const std::string& vendorId, const std::string& productId,
                           const std::map<std::string, ConfigValue>& settings);

    // Device override if present, otherwise the global value
    int deviceInt(const std::string& vendorId, const std::string& productId,
                  const std::string& key) const;
    std::string deviceString(const std::string& vendorId, const std::string& productId,
                             const std::string& key) const;

    // File operations
    bool loadFromFile(const std::string& filename);
    bool saveToFile(const std::string& filename) const;

    // First existing file of the standard search path
    static std::optional<std::string> locateConfigFile();
    static std::vector<std::string> searchPaths();

    void resetToDefaults();

private:
    class Private;
    std::unique_ptr<Private> d;
};

}
