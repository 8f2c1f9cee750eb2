#pragma once

#include <ycard/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace ycard {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Built-in defaults, then the config file, then YCARD_* environment
    // variables, then cmdOverrides
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "rendering.fold-lines")
    // Returns nullopt if key doesn't exist or has the wrong type
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the file actually loaded, empty when running on defaults
    const std::string& loadedPath() const { return _loadedPath; }

    static std::filesystem::path getXDGConfigPath();

    // "decorative.path" -> "YCARD_DECORATIVE_PATH"
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "YCARD_";

    static constexpr const char* KEY_DECORATIVE_PATH = "decorative.path";
    static constexpr const char* KEY_RENDERING_FOLD_LINES = "rendering.fold-lines";
    static constexpr const char* KEY_RENDERING_CLAMP_IMAGES = "rendering.clamp-images";
    static constexpr const char* KEY_LOG_LEVEL = "log.level";

    std::string decorativePath() const;
    bool foldLines() const;
    bool clampImages() const;
    std::string logLevel() const;

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // Merge YAML maps (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedPath;
    YAML::Node _cmdOverrides;
};

template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace ycard
