#include <ycard/decorative-library.h>
#include "decorative-expander.h"
#include <fmt/format.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace ycard {

namespace {

Result<DecorativeDefinition> parseDefinition(const YAML::Node& root, const std::string& source) {
    if (!root || !root.IsMap()) {
        return Err<DecorativeDefinition>("definition root must be a map");
    }

    DecorativeDefinition def;
    def.source = source;
    try {
        for (const char* key : {"name", "default_width", "default_height", "color_roles", "shapes"}) {
            if (!root[key]) {
                return Err<DecorativeDefinition>(fmt::format("missing required field '{}'", key));
            }
        }
        def.name = root["name"].as<std::string>();
        if (root["description"]) {
            def.description = root["description"].as<std::string>();
        }
        def.defaultWidth = root["default_width"].as<float>();
        def.defaultHeight = root["default_height"].as<float>();
        def.colorRoles = root["color_roles"].as<std::map<std::string, std::string>>();
    } catch (const YAML::Exception& e) {
        return Err<DecorativeDefinition>(fmt::format("bad field: {}", e.what()));
    }

    if (def.name.empty()) {
        return Err<DecorativeDefinition>("name cannot be empty");
    }
    for (const auto& [role, hex] : def.colorRoles) {
        if (auto color = Color::fromHex(hex); !color) {
            return Err<DecorativeDefinition>(fmt::format("color role '{}'", role), color);
        }
    }
    def.shapes = YAML::Clone(root["shapes"]);
    if (!def.shapes.IsSequence()) {
        return Err<DecorativeDefinition>("'shapes' must be a list");
    }
    return def;
}

} // namespace

class DecorativeLibraryImpl : public DecorativeLibrary {
public:
    explicit DecorativeLibraryImpl(std::filesystem::path directory) noexcept
        : _directory(std::move(directory)) {}

    ~DecorativeLibraryImpl() override = default;

    Result<void> init() noexcept {
        if (_directory.empty()) {
            return Ok();
        }

        std::error_code ec;
        if (!std::filesystem::is_directory(_directory, ec)) {
            ywarn("Decorative library directory not found: {}", _directory.string());
            return Ok();
        }

        std::vector<std::filesystem::path> files;
        for (auto it = std::filesystem::recursive_directory_iterator(_directory, ec);
             !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec) && it->path().extension() == ".yaml") {
                files.push_back(it->path());
            }
        }
        if (ec) {
            ywarn("Error scanning decorative library {}: {}", _directory.string(), ec.message());
        }
        std::sort(files.begin(), files.end());

        for (const auto& file : files) {
            if (auto res = loadFile(file); !res) {
                ywarn("Failed to load decorative element {}: {}", file.string(), error_msg(res));
            }
        }
        yinfo("Decorative library: {} definitions from {}", _definitions.size(), _directory.string());
        return Ok();
    }

    Result<void> addDefinition(const std::string& yaml) override {
        YAML::Node root;
        try {
            root = YAML::Load(yaml);
        } catch (const YAML::Exception& e) {
            return Err(fmt::format("YAML parse error: {}", e.what()));
        }
        auto def = parseDefinition(root, "");
        if (!def) {
            return Err("Invalid decorative definition", def);
        }
        store(std::move(*def));
        return Ok();
    }

    bool has(const std::string& name) const override {
        return _definitions.count(name) > 0;
    }

    Result<const DecorativeDefinition*> find(const std::string& name) const override {
        auto it = _definitions.find(name);
        if (it == _definitions.end()) {
            std::string available;
            for (const auto& n : names()) {
                if (!available.empty()) available += ", ";
                available += n;
            }
            return Err<const DecorativeDefinition*>(fmt::format(
                "Decorative element '{}' not found in library. Available: {}", name, available));
        }
        return &it->second;
    }

    std::vector<std::string> names() const override {
        std::vector<std::string> out;
        out.reserve(_definitions.size());
        for (const auto& [name, _] : _definitions) {
            out.push_back(name);
        }
        return out;
    }

    size_t size() const override { return _definitions.size(); }

    Result<std::vector<Shape>> expand(const DecorativeRef& ref) const override {
        auto def = find(ref.name);
        if (!def) {
            return std::unexpected(def.error());
        }
        return decorative::expandDecorative(**def, ref);
    }

private:
    Result<void> loadFile(const std::filesystem::path& file) {
        YAML::Node root;
        try {
            root = YAML::LoadFile(file.string());
        } catch (const YAML::Exception& e) {
            return Err(fmt::format("YAML parse error: {}", e.what()));
        }
        auto def = parseDefinition(root, file.string());
        if (!def) {
            return Err("Invalid decorative definition", def);
        }
        ydebug("Loaded decorative '{}' from {}", def->name, file.string());
        store(std::move(*def));
        return Ok();
    }

    void store(DecorativeDefinition def) {
        if (has(def.name)) {
            ydebug("Decorative '{}' replaced", def.name);
        }
        std::string name = def.name;
        _definitions[name] = std::move(def);
    }

    std::filesystem::path _directory;
    std::map<std::string, DecorativeDefinition> _definitions;
};

Result<DecorativeLibrary::Ptr> DecorativeLibrary::createImpl(ContextType&,
                                                             const std::filesystem::path& directory) noexcept {
    auto impl = Ptr(new DecorativeLibraryImpl(directory));
    if (auto res = static_cast<DecorativeLibraryImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("Failed to initialize DecorativeLibrary", res);
    }
    return Ok(impl);
}

Result<DecorativeLibrary::Ptr> DecorativeLibrary::createImpl(ContextType& ctx) noexcept {
    return createImpl(ctx, std::filesystem::path());
}

} // namespace ycard
