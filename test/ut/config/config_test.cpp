//=============================================================================
// Config Tests
//
// Layering of defaults, config file, YCARD_* environment and overrides.
// XDG_CONFIG_HOME is pointed at a scratch directory so the user's own
// config never leaks in.
//=============================================================================

#include <boost/ut.hpp>
#include <ycard/config.h>
#include "test-helpers.h"
#include <cstdlib>

using namespace boost::ut;
using namespace ycard;

namespace {

std::filesystem::path isolate(const std::string& name) {
    auto dir = ycard::test::scratchDir(name);
    ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
    return dir;
}

} // namespace

suite config_tests = [] {
    "defaults without any file"_test = [] {
        isolate("config-defaults");
        auto config = Config::create();
        expect(config.has_value() >> fatal) << error_msg(config);
        expect((*config)->loadedPath().empty());
        expect((*config)->decorativePath().empty());
        expect((*config)->foldLines());
        expect((*config)->clampImages());
        expect((*config)->logLevel() == "info"_b);
    };

    "xdg path follows XDG_CONFIG_HOME"_test = [] {
        auto dir = isolate("config-xdg-path");
        expect(Config::getXDGConfigPath() == dir / "ycard" / "config.yaml");
    };

    "config file from the xdg location"_test = [] {
        auto dir = isolate("config-xdg-file");
        auto file = dir / "ycard" / "config.yaml";
        ycard::test::writeFile(file, "decorative:\n  path: /usr/share/ycard/decorative\nlog:\n  level: debug\n");

        auto config = Config::create();
        expect(config.has_value() >> fatal);
        expect((*config)->loadedPath() == file.string());
        expect((*config)->decorativePath() == "/usr/share/ycard/decorative"_b);
        expect((*config)->logLevel() == "debug"_b);
        // untouched keys keep their defaults
        expect((*config)->foldLines());
    };

    "explicit file wins over the xdg location"_test = [] {
        auto dir = isolate("config-explicit");
        ycard::test::writeFile(dir / "ycard" / "config.yaml", "log:\n  level: debug\n");
        auto explicitFile = dir / "other.yaml";
        ycard::test::writeFile(explicitFile, "rendering:\n  fold-lines: false\n");

        auto config = Config::create(explicitFile.string());
        expect(config.has_value() >> fatal);
        expect((*config)->loadedPath() == explicitFile.string());
        expect(!(*config)->foldLines());
        expect((*config)->logLevel() == "info"_b);
    };

    "unreadable file falls back to defaults"_test = [] {
        auto dir = isolate("config-missing");
        auto config = Config::create((dir / "nope.yaml").string());
        expect(config.has_value() >> fatal);
        expect((*config)->loadedPath().empty());
        expect((*config)->foldLines());

        ycard::test::writeFile(dir / "list.yaml", "- a\n- b\n");
        auto notMap = Config::create((dir / "list.yaml").string());
        expect(notMap.has_value() >> fatal);
        expect((*notMap)->loadedPath().empty());
    };

    "environment overrides known keys"_test = [] {
        isolate("config-env");
        ::setenv("YCARD_RENDERING_FOLD_LINES", "0", 1);
        ::setenv("YCARD_LOG_LEVEL", "trace", 1);
        ::setenv("YCARD_RENDERING_UNKNOWN", "1", 1);
        auto config = Config::create();
        ::unsetenv("YCARD_RENDERING_FOLD_LINES");
        ::unsetenv("YCARD_LOG_LEVEL");
        ::unsetenv("YCARD_RENDERING_UNKNOWN");

        expect(config.has_value() >> fatal);
        expect(!(*config)->foldLines());
        expect((*config)->logLevel() == "trace"_b);
        expect(!(*config)->has("rendering.unknown"));
    };

    "overrides beat file and environment"_test = [] {
        auto dir = isolate("config-overrides");
        ycard::test::writeFile(dir / "ycard" / "config.yaml", "rendering:\n  clamp-images: false\n");
        ::setenv("YCARD_LOG_LEVEL", "warn", 1);

        YAML::Node overrides;
        overrides["rendering"]["clamp-images"] = true;
        overrides["log"]["level"] = "error";
        auto config = Config::create("", overrides);
        ::unsetenv("YCARD_LOG_LEVEL");

        expect(config.has_value() >> fatal);
        expect((*config)->clampImages());
        expect((*config)->logLevel() == "error"_b);
    };

    "typed lookup"_test = [] {
        isolate("config-get");
        auto config = *Config::create();
        expect(config->has("rendering.fold-lines"));
        expect(!config->has("rendering.missing"));
        expect(config->get<bool>("rendering.fold-lines") == std::optional<bool>(true));
        expect(!config->get<bool>("rendering.missing").has_value());
        expect(!config->get<int>("log.level").has_value());
        expect(config->get<int>("log.level", 3) == 3_i);
        expect(!config->get<std::string>("rendering.fold-lines.deeper").has_value());
        expect(!config->has("rendering.missing")) << "lookups never insert";
    };

    "env var names"_test = [] {
        expect(Config::pathToEnvVar("rendering.fold-lines") == "YCARD_RENDERING_FOLD_LINES"_b);
        expect(Config::pathToEnvVar("decorative.path") == "YCARD_DECORATIVE_PATH"_b);
        expect(Config::pathToEnvVar("log.level") == "YCARD_LOG_LEVEL"_b);
    };
};
