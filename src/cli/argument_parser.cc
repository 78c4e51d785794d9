#include <algorithm>
#include <cctype>
#include <cli/argument_parser.h>
#include <iostream>
#include <stdexcept>

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (!arg.empty() && arg[0] == '-') {
            parseOption(arg, options);
        } else if (!options.command) {
            options.command = arg;
        } else {
            throw std::runtime_error("Unexpected argument: " + arg);
        }
        i++;
    }

    validateOptions(options);
    return options;
}

std::string ArgumentParser::nextValue(const std::string& arg) {
    if (++i >= argc_) {
        throw std::runtime_error("Missing value for " + arg);
    }
    return argv_[i];
}

void ArgumentParser::parseOption(const std::string& arg, CliOptions& options) {
    if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue(arg);
    } else if (arg == "-l" || arg == "--log-level") {
        // Stored lowercased so spdlog::level::from_str accepts "INFO" as well.
        std::string level = nextValue(arg);
        std::transform(level.begin(), level.end(), level.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        options.log_level = std::move(level);
    } else if (arg == "--cert") {
        options.cert = nextValue(arg);
    } else if (arg == "--key") {
        options.key = nextValue(arg);
    } else if (arg == "--known-clients") {
        options.known_clients = nextValue(arg);
    } else if (arg == "--addr") {
        options.addr = nextValue(arg);
    } else if (arg == "--server-cert") {
        options.server_cert = nextValue(arg);
    } else if (arg == "--url") {
        options.url = nextValue(arg);
    } else if (arg == "--dir") {
        options.dir = nextValue(arg);
    } else if (arg == "--no-verify-hostname") {
        options.no_verify_hostname = true;
    } else if (arg == "-h" || arg == "--help") {
        options.command = "help";
    } else {
        throw std::runtime_error("Unknown option: " + arg);
    }
}

void ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.log_level) {
        const std::string& level = *options.log_level;
        if (level != "trace" && level != "debug" && level != "info" && level != "warning"
            && level != "warn" && level != "error") {
            throw std::runtime_error("Invalid log level: " + *options.log_level);
        }
    }

    if (!options.command) {
        throw std::runtime_error("Missing command");
    }
    const std::string& command = *options.command;
    if (command != "server" && command != "client" && command != "provision"
        && command != "help") {
        throw std::runtime_error("Unknown command: " + command);
    }
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: peerpin [options] <command>\n\n"
              << "Mutual TLS between self-signed endpoints: the server admits clients\n"
              << "listed by CN and SHA-256 fingerprint, the client pins the server certificate.\n\n"
              << "Commands:\n"
              << "  server                    Run the HTTPS server with known client verification\n"
              << "  client                    Send one request to the server and print the reply\n"
              << "  provision                 Generate self-signed certificates and knownClients.txt\n"
              << "  help                      Show this help message\n\n"
              << "Options:\n"
              << "  -c, --config PATH         TOML config file\n"
              << "  -l, --log-level LVL       trace|debug|info|warning|error\n"
              << "  --cert PATH               Own certificate (server or client)\n"
              << "  --key PATH                Own private key (server or client)\n"
              << "  --known-clients PATH      Authorized client CNs and fingerprints (server)\n"
              << "  --addr [HOST]:PORT        Address to listen on (server, default :8443)\n"
              << "  --server-cert PATH        Server certificate to pin (client)\n"
              << "  --url URL                 Server URL (client)\n"
              << "  --no-verify-hostname      Skip the host name check against the pinned certificate\n"
              << "  --dir PATH                Output directory (provision, default certs)\n"
              << "  -h, --help                Show this help message\n";
}
