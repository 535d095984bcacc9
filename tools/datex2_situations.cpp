// datex2_situations.cpp – Command-line front end: DATEX2 file → report + map.
//
//   datex2_situations [options] <datex2.xml>
//
// The payload is read from a local file; fetching it from the publisher is
// left to an external downloader.

#include "DATEX2Parser/MapWriter.hpp"
#include "DATEX2Parser/SituationFeed.hpp"
#include "DATEX2Parser/Statistics.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;
using namespace datex2;

struct Options {
    fs::path                input;
    fs::path                map_output{"mapa_v16.html"};
    std::optional<fs::path> stats_html;
    bool                    print_stats{true};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

static void usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [options] <datex2.xml>\n"
       << "  --no-stats          do not print the statistics report\n"
       << "  --stats-html FILE   write the HTML statistics report to FILE\n"
       << "  --output FILE       map output file (default mapa_v16.html)\n"
       << "  --verbose           debug logging (shows dropped records)\n"
       << "  --quiet             warnings and errors only\n"
       << "  -h, --help          show this help\n";
}

// Returns nullopt on a usage error (already reported).
static std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    bool have_input = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto needValue = [&](std::string_view flag) -> const char* {
            if (i + 1 >= argc) {
                spdlog::error("{} requires a value", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--no-stats") {
            opts.print_stats = false;
        } else if (arg == "--stats-html") {
            const char* v = needValue(arg);
            if (!v) return std::nullopt;
            opts.stats_html = v;
        } else if (arg == "--output") {
            const char* v = needValue(arg);
            if (!v) return std::nullopt;
            opts.map_output = v;
        } else if (arg == "--verbose") {
            opts.log_level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            opts.log_level = spdlog::level::warn;
        } else if (!arg.empty() && arg[0] == '-') {
            spdlog::error("unknown option '{}'", arg);
            return std::nullopt;
        } else if (have_input) {
            spdlog::error("more than one input file given");
            return std::nullopt;
        } else {
            opts.input = fs::path(arg);
            have_input = true;
        }
    }

    if (!have_input) {
        spdlog::error("no input file given");
        return std::nullopt;
    }
    return opts;
}

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            usage(std::cout, argv[0]);
            return 0;
        }
    }

    std::optional<Options> opts = parseArgs(argc, argv);
    if (!opts) {
        usage(std::cerr, argv[0]);
        return 2;
    }
    spdlog::set_level(opts->log_level);

    try {
        SituationFeed feed;
        spdlog::info("loading '{}'", opts->input.string());
        feed.loadFile(opts->input);

        spdlog::info("parsing {} bytes of DATEX2", feed.content().size());
        feed.parse();

        Statistics stats(feed.situations());
        spdlog::info("found {} situations", stats.situations().size());

        if (stats.situations().empty()) {
            spdlog::warn("no situations found, nothing to write");
            return 0;
        }

        if (opts->print_stats) {
            stats.printReport(std::cout);
            if (opts->stats_html) {
                stats.writeHtmlReport(*opts->stats_html);
                spdlog::info("statistics report written to '{}'", opts->stats_html->string());
            }
        }

        writeMap(stats.situations(), opts->map_output);
        spdlog::info("map written to '{}'", opts->map_output.string());
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    return 0;
}
