#include <ycard/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <vector>

namespace ycard {

// Split a dotted path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            std::error_code ec;
            if (std::filesystem::exists(xdgPath, ec)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedPath = effectivePath;
                yinfo("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err("Config setup failed: " + std::string(e.what()));
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["decorative"]["path"] = std::string("");
    _config["rendering"]["fold-lines"] = true;
    _config["rendering"]["clamp-images"] = true;
    _config["log"]["level"] = std::string("info");
}

Result<void> Config::loadFile(const std::string& path) {
    YAML::Node fileConfig;
    try {
        fileConfig = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        return Err("Cannot open config file: " + path);
    } catch (const YAML::Exception& e) {
        return Err("YAML parse error: " + std::string(e.what()));
    }
    if (!fileConfig || fileConfig.IsNull()) {
        return Ok();
    }
    if (!fileConfig.IsMap()) {
        return Err("Config root must be a map: " + path);
    }
    mergeNodes(_config, fileConfig);
    return Ok();
}

// Only keys that already exist (defaults or file) can be overridden
void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        YAML::Node value = it->second;

        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }

        std::string envVar = pathToEnvVar(fullPath);
        const char* env = std::getenv(envVar.c_str());
        if (!env) continue;

        std::string s(env);
        if (s == "1") s = "true";
        else if (s == "0" && value.IsScalar() && (value.Scalar() == "true" || value.Scalar() == "false")) s = "false";
        node[key] = s;
        ydebug("Config override from env: {}={}", envVar, env);
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

// const operator[] never inserts into the tree
static YAML::Node lookup(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node();
    return lookup(child, parts, i + 1);
}

YAML::Node Config::getNode(const std::string& path) const {
    const YAML::Node& root = _config;
    return lookup(root, splitPath(path), 0);
}

bool Config::has(const std::string& path) const {
    auto node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;
    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }
    return configDir / "ycard" / "config.yaml";
}

std::string Config::decorativePath() const {
    return get<std::string>(KEY_DECORATIVE_PATH, "");
}

bool Config::foldLines() const {
    return get<bool>(KEY_RENDERING_FOLD_LINES, true);
}

bool Config::clampImages() const {
    return get<bool>(KEY_RENDERING_CLAMP_IMAGES, true);
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOG_LEVEL, "info");
}

} // namespace ycard
