/**
 * Folio - Entry Point
 *
 * CLI:  folio --manifest <path>
 *       folio --list <path>
 *       folio --positions <path>
 *       folio --read <path> --href <href> --output <file>
 *       folio --help
 */

#include "folio/asset.hpp"
#include "folio/config.hpp"
#include "folio/epub_parser.hpp"
#include "folio/files.hpp"
#include "folio/image_parser.hpp"
#include "folio/logging.hpp"
#include "folio/services.hpp"
#include "folio/streamer.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_UNSUPPORTED = 2;

enum class Command {
    None,
    Help,
    Manifest,
    List,
    Positions,
    Read
};

// CLI argument parsing
struct CliArgs {
    Command command = Command::None;
    std::string publication_path;
    std::string href;
    std::string output_path;
    std::string config_path;
    bool verbose = false;
    bool debug_logging = false;
};

void print_help() {
    std::cout << R"(
Folio - Publication manifest tool (EPUB, CBZ, image archives)

Usage:
  folio --help                                   Show this help
  folio --manifest <path>                        Print the publication manifest (JSON)
  folio --list <path>                            List resources of the container
  folio --positions <path>                       Print the publication positions
  folio --read <path> --href <href> --output <file>
                                                 Write one resource, deobfuscated

Options:
  --help, -h             Show this help message
  --manifest, -m         Print the Readium Web Publication Manifest
  --list, -l             List container resources
  --positions, -p        Print positions (count and locators)
  --read, -r             Extract a single resource
  --href <href>          Resource to extract (use with --read)
  --output, -o <file>    Output file (use with --read)
  --config, -c <file>    JSON configuration file
  --verbose, -v          Verbose output
  --debug, -d            Enable debug logging

Exit codes: 0 success, 1 error, 2 unsupported format

Examples:
  folio --manifest book.epub
  folio --list comic.cbz --verbose
  folio --read book.epub --href OEBPS/fonts/font.otf --output font.otf
  folio --config folio.json --positions book.epub

)" << std::endl;
}

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto take_path = [&](int& i, Command command) {
        args.command = command;
        if (i + 1 < argc) {
            args.publication_path = argv[++i];
        }
    };

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.command = Command::Help;
        }
        else if (arg == "--manifest" || arg == "-m") {
            take_path(i, Command::Manifest);
        }
        else if (arg == "--list" || arg == "-l") {
            take_path(i, Command::List);
        }
        else if (arg == "--positions" || arg == "-p") {
            take_path(i, Command::Positions);
        }
        else if (arg == "--read" || arg == "-r") {
            take_path(i, Command::Read);
        }
        else if (arg == "--href") {
            if (i + 1 < argc) {
                args.href = argv[++i];
            }
        }
        else if (arg == "--output" || arg == "-o") {
            if (i + 1 < argc) {
                args.output_path = argv[++i];
            }
        }
        else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) {
                args.config_path = argv[++i];
            }
        }
        else if (arg == "--verbose" || arg == "-v") {
            args.verbose = true;
        }
        else if (arg == "--debug" || arg == "-d") {
            args.debug_logging = true;
        }
        else {
            std::cerr << "Warning: Ignoring unknown argument: " << arg << "\n";
        }
    }

    return args;
}

int exit_code_for(const folio::Error& error) {
    return error.code == folio::Error::Code::NotSupported ? EXIT_UNSUPPORTED : EXIT_ERROR;
}

int report(const folio::Error& error) {
    std::cerr << "Error: " << error.full_message() << "\n";
    LOG_ERROR("Main", error.full_message());
    return exit_code_for(error);
}

folio::Result<std::unique_ptr<folio::Publication>> open_publication(const folio::Config& config,
                                                                    const folio::PublicationAsset& asset) {
    std::vector<folio::PublicationParserPtr> parsers;
    parsers.push_back(std::make_unique<folio::EpubParser>(config.positions));
    parsers.push_back(std::make_unique<folio::ImageParser>());
    folio::Streamer streamer(std::move(parsers));
    return streamer.open(asset);
}

int run_list(const CliArgs& args, const folio::PublicationAsset& asset) {
    auto fetcher = asset.create_fetcher();
    if (!fetcher) return report(fetcher.error());

    auto links = (*fetcher)->links();
    if (!links) return report(links.error());

    std::cout << "Publication: " << asset.name() << " (" << asset.media_type().string() << ")\n";
    for (const auto& link : *links) {
        std::cout << link.href;
        if (args.verbose) {
            std::cout << " [" << link.media_type().string() << "]";
            if (link.properties.archive) {
                std::cout << " (" << folio::format_file_size(link.properties.archive->entry_length)
                          << (link.properties.archive->is_entry_compressed ? ", deflated" : ", stored")
                          << ")";
            }
        }
        std::cout << "\n";
    }
    std::cout << "\nResources: " << links->size() << "\n";
    return EXIT_OK;
}

int run_positions(const folio::Publication& publication) {
    auto* service = publication.find_service<folio::PositionsService>();
    if (!service) {
        std::cerr << "Error: Publication has no positions service\n";
        return EXIT_ERROR;
    }
    auto positions = service->positions();
    if (!positions) return report(positions.error());

    nlohmann::json j;
    j["total"] = positions->size();
    j["positions"] = nlohmann::json::array();
    for (const auto& locator : *positions) {
        j["positions"].push_back(locator.to_json());
    }
    std::cout << j.dump(2) << std::endl;
    return EXIT_OK;
}

int run_read(const CliArgs& args, const folio::Publication& publication) {
    if (args.href.empty()) {
        std::cerr << "Error: No resource specified (use --href)\n";
        return EXIT_ERROR;
    }
    if (args.output_path.empty()) {
        std::cerr << "Error: No output file specified (use --output)\n";
        return EXIT_ERROR;
    }

    auto data = publication.get(args.href)->read();
    if (!data) return report(data.error());

    if (!folio::write_file(args.output_path, *data)) {
        std::cerr << "Error: Failed to write " << args.output_path << "\n";
        return EXIT_ERROR;
    }
    if (args.verbose) {
        std::cout << "Wrote " << args.href << " -> " << args.output_path
                  << " (" << folio::format_file_size(data->size()) << ")\n";
    }
    return EXIT_OK;
}

int run_cli(const CliArgs& args) {
    if (args.command == Command::Help) {
        print_help();
        return EXIT_OK;
    }
    if (args.command == Command::None) {
        print_help();
        return EXIT_ERROR;
    }

    folio::Config config;
    if (!args.config_path.empty()) {
        auto loaded = folio::load_config(args.config_path);
        if (!loaded) return report(loaded.error());
        config = std::move(loaded.value());
    }
    if (args.debug_logging) {
        config.log_level = folio::LogLevel::Debug;
    }
    auto logging = folio::apply_logging(config);
    if (!logging) {
        std::cerr << "Warning: " << logging.error().full_message() << "\n";
    }

    if (args.publication_path.empty()) {
        std::cerr << "Error: No publication specified\n";
        print_help();
        return EXIT_ERROR;
    }
    if (!std::filesystem::exists(args.publication_path)) {
        std::cerr << "Error: Publication not found: " << args.publication_path << "\n";
        return EXIT_ERROR;
    }

    folio::FileAsset asset(args.publication_path);

    if (args.command == Command::List) {
        return run_list(args, asset);
    }

    auto publication = open_publication(config, asset);
    if (!publication) return report(publication.error());

    switch (args.command) {
        case Command::Manifest:
            std::cout << (*publication)->manifest().to_json().dump(2) << std::endl;
            return EXIT_OK;
        case Command::Positions:
            return run_positions(**publication);
        case Command::Read:
            return run_read(args, **publication);
        default:
            return EXIT_ERROR;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CliArgs args = parse_args(argc, argv);

    try {
        return run_cli(args);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return EXIT_ERROR;
    }
}
