#include "mapping.hpp"
#include "plan_handler.hpp"
#include "plan_server.hpp"
#include "planner.hpp"
#include "util.hpp"

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

struct Config {
    std::optional<std::string> text;
    std::optional<std::string> locale;
    bool        readStdin = false;
    bool        serve     = false;
    std::string listen    = "127.0.0.1:8787";
    bool        verbose   = false;
};

static void printUsage() {
    std::cout
        << "Usage: bulk_planner [options]\n\n"
        << "Turns a free-form bulk edit request into a JSON plan.\n\n"
        << "Options:\n"
        << "  --text TEXT        Plan TEXT and print the response\n"
        << "  --locale TAG       Locale forwarded with the request\n"
        << "  --stdin            Read a JSON request body {text, locale?} from stdin\n"
        << "  --serve            Serve POST /api/plan over HTTP\n"
        << "  --listen HOST:PORT Address for --serve   (default: 127.0.0.1:8787)\n"
        << "  --verbose          Enable verbose diagnostics\n"
        << "  --help, -h         Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--text") && i + 1 < argc) {
            cfg.text = argv[++i];
        } else if ((arg == "--locale") && i + 1 < argc) {
            cfg.locale = argv[++i];
        } else if (arg == "--stdin") {
            cfg.readStdin = true;
        } else if (arg == "--serve") {
            cfg.serve = true;
        } else if ((arg == "--listen") && i + 1 < argc) {
            cfg.listen = argv[++i];
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }

    const int modes = (cfg.text ? 1 : 0) + (cfg.readStdin ? 1 : 0) + (cfg.serve ? 1 : 0);
    if (modes != 1) {
        std::cerr << "Exactly one of --text, --stdin or --serve is required\n\n";
        printUsage();
        std::exit(1);
    }
    return cfg;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        if (cfg.serve) {
            const auto address = bulk_planner::parseListenAddress(cfg.listen);
            bulk_planner::PlanServer server(address, cfg.verbose);
            std::cout << "bulk_planner listening on " << address.host << ":"
                      << server.port() << "\n";
            server.run();
            return 0;
        }

        if (cfg.readStdin) {
            std::string body{std::istreambuf_iterator<char>(std::cin),
                             std::istreambuf_iterator<char>()};
            const auto result = bulk_planner::handlePlanBody(body, cfg.verbose);
            std::cout << bulk_planner::dumpBody(result.body, 2) << "\n";
            return result.httpStatus == 200 ? 0 : 1;
        }

        bulk_planner::PlanRequest request{*cfg.text, cfg.locale};
        const auto response = bulk_planner::planFromRequest(request);
        std::cout << bulk_planner::dumpBody(bulk_planner::toJson(response), 2) << "\n";
        return std::holds_alternative<bulk_planner::PlanError>(response) ? 1 : 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
