// ycard-dump: render a card description and print the drawing operations
//
// Loads the config and decorative library, parses a card YAML file, renders
// it onto a RecordingSurface and prints the operation log followed by the
// render report (failed elements and text adjustments).

#include <ycard/card-renderer.h>
#include <ycard/config.h>
#include <ycard/decorative-library.h>
#include <ycard/recording-surface.h>
#include <ycard/scene-parser.h>
#include <ytrace/ytrace.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <args.hxx>
#include <filesystem>
#include <iostream>
#include <string>

using namespace ycard;

static void printReport(const RenderReport& report) {
    std::cout << "\n# report\n";
    std::cout << "panels:   " << report.panelsRendered << "\n";
    std::cout << "rendered: " << report.elementsRendered << "\n";
    std::cout << "failed:   " << report.elementsFailed << "\n";

    for (const auto& f : report.failures) {
        std::cout << "  FAILED " << f.panelId << " / " << f.kind << " '" << f.elementId
                  << "': " << f.message << "\n";
    }
    for (const auto& t : report.textAdjustments) {
        if (!t.result.wasAdjusted) continue;
        std::cout << "  ADJUSTED " << t.panelId << " / '" << t.elementId << "': "
                  << toString(t.result.policyApplied) << " "
                  << t.result.originalFontSize << "pt -> " << t.result.finalFontSize << "pt, "
                  << t.result.linesUsed << " line(s)"
                  << (t.result.contentTruncated ? ", truncated" : "") << "\n";
    }
}

int main(int argc, char** argv) {
    args::ArgumentParser parser("ycard-dump - Render a card description and dump drawing operations");
    args::HelpFlag help(parser, "help", "Show help", {'h', "help"});
    args::ValueFlag<std::string> configFlag(parser, "FILE", "Config file", {'c', "config"});
    args::ValueFlag<std::string> decorativeFlag(parser, "DIR", "Decorative element directory", {'d', "decorative"});
    args::ValueFlag<std::string> logFileFlag(parser, "FILE", "Write log to file instead of stderr", {"log-file"});
    args::Flag noFoldLinesFlag(parser, "no-fold-lines", "Do not draw fold guide lines", {"no-fold-lines"});
    args::Positional<std::string> cardFile(parser, "card", "Card description (YAML)");

    try {
        parser.ParseCLI(argc, argv);
    } catch (const args::Help&) {
        std::cout << parser;
        return 0;
    } catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    if (!cardFile) {
        std::cerr << "Error: no card file specified\n";
        return 1;
    }

    if (logFileFlag) {
        auto fileLogger = spdlog::basic_logger_mt("ycard-dump", args::get(logFileFlag), true);
        spdlog::set_default_logger(fileLogger);
    }

    YAML::Node overrides(YAML::NodeType::Map);
    if (decorativeFlag) {
        overrides["decorative"]["path"] = args::get(decorativeFlag);
    }
    if (noFoldLinesFlag) {
        overrides["rendering"]["fold-lines"] = false;
    }

    auto config = Config::create(configFlag ? args::get(configFlag) : "", overrides);
    if (!config) {
        std::cerr << "Error: " << error_msg(config) << "\n";
        return 1;
    }

    auto level = spdlog::level::from_str((*config)->logLevel());
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);

    auto library = DecorativeLibrary::create(std::filesystem::path((*config)->decorativePath()));
    if (!library) {
        std::cerr << "Error: " << error_msg(library) << "\n";
        return 1;
    }

    auto card = loadCard(args::get(cardFile));
    if (!card) {
        std::cerr << "Error: " << error_msg(card) << "\n";
        return 1;
    }

    auto renderer = CardRenderer::create(*config, *library);
    if (!renderer) {
        std::cerr << "Error: " << error_msg(renderer) << "\n";
        return 1;
    }

    auto surface = RecordingSurface::create();
    if (!surface) {
        std::cerr << "Error: " << error_msg(surface) << "\n";
        return 1;
    }

    auto report = (*renderer)->render(**surface, *card);
    if (!report) {
        std::cerr << "Error: " << error_msg(report) << "\n";
        return 1;
    }

    std::cout << "# card '" << card->name << "' (" << toString(card->foldType) << ")\n";
    std::cout << (*surface)->dump();
    printReport(*report);

    yinfo("ycard-dump: {} ops recorded", (*surface)->ops().size());
    return report->elementsFailed > 0 ? 2 : 0;
}
