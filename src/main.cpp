#include <iostream>
#include <filesystem>
#include <string>
#include <vector>

#include "network/advertisement.hpp"
#include "network/p2p_config.hpp"

#include "utils/logger.hpp"
#include "utils/config.hpp"
#include "murmur/common.hpp"
#include "murmur/time_utils.hpp"

namespace {

void print_usage(const char* program) {
    std::cerr << "Murmur v" << MURMUR_VERSION_MAJOR << "." << MURMUR_VERSION_MINOR << "."
              << MURMUR_VERSION_PATCH << "\n\n"
              << "Usage:\n"
              << "  " << program << " [--config <file>] parse <advertisement>...\n"
              << "  " << program << " [--config <file>] encode <nodeId> <address> <port> <publicKey> [capabilities]\n"
              << "  " << program << " [--config <file>] config\n";
}

// Decode each payload and print it as JSON; returns the number of rejects
int run_parse(const std::vector<std::string>& payloads) {
    int rejected = 0;
    for (const auto& payload : payloads) {
        auto result = murmur::network::parse_advertisement(payload);
        if (result.is_err()) {
            MURMUR_LOG_WARN("Rejected advertisement: {}", result.error().to_string());
            std::cout << nlohmann::json{{"error", result.error().to_string()}}.dump() << "\n";
            ++rejected;
            continue;
        }
        nlohmann::json j = result.value();
        std::cout << j.dump() << "\n";
    }
    return rejected;
}

int run_encode(const std::vector<std::string>& args) {
    if (args.size() < 4 || args.size() > 5) {
        return -1;
    }

    murmur::network::PeerAdvertisement adv;
    adv.node_id = args[0];
    adv.address = args[1];

    auto port = murmur::network::parse_port(args[2]);
    if (!port) {
        MURMUR_LOG_ERROR("Invalid port: {}", args[2]);
        return 1;
    }
    adv.port = *port;
    adv.public_key = args[3];
    if (args.size() == 5) {
        adv.capabilities = murmur::network::split_capabilities(args[4]);
    }
    adv.timestamp = murmur::time::timestamp_milliseconds();

    using murmur::network::AdvertisementFormat;
    for (auto format : {AdvertisementFormat::Json, AdvertisementFormat::Uri, AdvertisementFormat::Delimited}) {
        try {
            std::cout << murmur::network::advertisement_format_to_string(format) << ": "
                      << murmur::network::encode_advertisement(adv, format) << "\n";
        } catch (const murmur::ProtocolException& e) {
            MURMUR_LOG_WARN("Cannot encode as {}: {}",
                            murmur::network::advertisement_format_to_string(format), e.what());
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        // Determine config file path
        std::string config_path = "murmur.conf";
        if (args.size() >= 2 && args[0] == "--config") {
            config_path = args[1];
            args.erase(args.begin(), args.begin() + 2);
        }

        // Load configuration (or use defaults if file doesn't exist)
        murmur::utils::Config config;
        if (std::filesystem::exists(config_path)) {
            config = murmur::utils::Config::load_from_file(config_path);
        } else {
            config.set("log_level", "warn");
            config.set("log_to_file", false);
        }

        auto log_level = config.get_or<std::string>("log_level", "warn");
        auto log_to_file = config.get_or<bool>("log_to_file", false);
        murmur::utils::Logger::init(log_level, log_to_file);

        if (args.empty()) {
            print_usage(argv[0]);
            return 2;
        }

        const std::string command = args[0];
        std::vector<std::string> rest(args.begin() + 1, args.end());

        if (command == "parse") {
            if (rest.empty()) {
                print_usage(argv[0]);
                return 2;
            }
            return run_parse(rest) == 0 ? 0 : 1;
        }

        if (command == "encode") {
            int rc = run_encode(rest);
            if (rc < 0) {
                print_usage(argv[0]);
                return 2;
            }
            return rc;
        }

        if (command == "config") {
            // Effective network settings after applying the file over the defaults
            auto p2p = murmur::network::P2PConfig{}.merged(
                murmur::network::P2PConfigPatch::from_config(config));
            p2p.validate();
            nlohmann::json j = p2p;
            std::cout << j.dump(2) << "\n";
            return 0;
        }

        MURMUR_LOG_ERROR("Unknown command: {}", command);
        print_usage(argv[0]);
        return 2;

    } catch (const std::exception& e) {
        MURMUR_LOG_ERROR("Fatal error: {}", e.what());
        return 1;
    }
}
