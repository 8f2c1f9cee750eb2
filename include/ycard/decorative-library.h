#pragma once

#include <ycard/base/factory.h>
#include <ycard/base/object.h>
#include <ycard/result.hpp>
#include <ycard/shape.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace ycard {

// Named composite of primitive shapes. Child shapes stay as YAML until an
// instance is expanded, since {role} color placeholders are not valid colors.
struct DecorativeDefinition {
    std::string name;
    std::string description;
    float defaultWidth = 0.0f;   // inches
    float defaultHeight = 0.0f;  // inches
    std::map<std::string, std::string> colorRoles;  // role -> "#rrggbb"
    YAML::Node shapes;           // sequence of shape maps
    std::string source;          // file it came from, empty for inline definitions
};

/**
 * DecorativeLibrary - lookup and expansion of decorative composites.
 *
 * Owned by the caller and handed to whatever renders cards; there is no
 * shared global instance. Loading a directory never fails on a single bad
 * file: it is logged and skipped.
 */
class DecorativeLibrary : public base::Object,
                          public base::ObjectFactory<DecorativeLibrary> {
public:
    using Ptr = std::shared_ptr<DecorativeLibrary>;
    using base::ObjectFactory<DecorativeLibrary>::create;

    // Loads every **/*.yaml below directory; an empty path gives an empty library
    static Result<Ptr> createImpl(ContextType& ctx, const std::filesystem::path& directory) noexcept;
    static Result<Ptr> createImpl(ContextType& ctx) noexcept;

    ~DecorativeLibrary() override = default;

    const char* typeName() const override { return "DecorativeLibrary"; }

    // Registers (or replaces) a definition from YAML text
    virtual Result<void> addDefinition(const std::string& yaml) = 0;

    virtual bool has(const std::string& name) const = 0;
    // Fails with the list of available names
    virtual Result<const DecorativeDefinition*> find(const std::string& name) const = 0;
    virtual std::vector<std::string> names() const = 0;
    virtual size_t size() const = 0;

    // Primitive shapes for one instance, in definition order
    virtual Result<std::vector<Shape>> expand(const DecorativeRef& ref) const = 0;

protected:
    DecorativeLibrary() = default;
};

} // namespace ycard
