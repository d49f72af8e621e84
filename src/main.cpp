#include <iostream>
#include <string>
#include <vector>
#include "ondd/core/logger.hpp"
#include "ondd/core/config.hpp"
#include "ondd/core/cli.hpp"
#include "ondd/core/utils.hpp"
#include "ondd/core/command_registry.hpp"
#include "ondd/ipc/errors.hpp"
#include "ondd/ipc/protocol_client.hpp"

int main(int argc, char* argv[]) {
    ondd::core::CommandLineParser parser("onddctl");
    ondd::core::CommandRegistry command_registry;

    if (!parser.parse(argc, argv)) {
        std::cerr << "Error: " << parser.get_error() << "\n\n";
        parser.print_help(std::cerr);
        return 1;
    }

    if (parser.has_option("help")) {
        parser.print_help(std::cout);
        command_registry.print_help(std::cout);
        return 0;
    }

    if (parser.has_option("version")) {
        parser.print_version(std::cout);
        return 0;
    }

    auto& config = ondd::core::Config::instance();
    config.set_defaults();

    auto config_file = ondd::core::utils::FileUtils::expand_home(parser.get_option("config"));
    if (ondd::core::utils::FileUtils::exists(config_file) && !config.load_from_file(config_file.string())) {
        std::cerr << "Error: could not read " << config_file << "\n";
        return 1;
    }

    if (parser.has_option("socket")) {
        config.set("ondd.socket", parser.get_option("socket"));
    }
    if (parser.has_option("timeout")) {
        config.set("ondd.timeout_ms", parser.get_option("timeout"));
    }

    auto log_level = ondd::core::parse_log_level(config.get_string("log.level", "info"))
                         .value_or(ondd::core::LogLevel::Info);
    if (parser.has_option("verbose")) {
        log_level = ondd::core::LogLevel::Debug;
    }
    ondd::core::Logger::initialize(config.get_string("log.file"), log_level);

    auto& args = parser.get_positional_args();
    if (args.empty()) {
        parser.print_help(std::cout);
        command_registry.print_help(std::cout);
        return 0;
    }

    if (!command_registry.has_command(args[0])) {
        std::cerr << "Error: Unknown command: " << args[0] << "\n";
        command_registry.print_help(std::cerr);
        return 1;
    }

    ondd::core::CommandResult result;
    try {
        ondd::ipc::ProtocolClient client(ondd::ipc::ClientOptions::from_config(config));
        result = command_registry.execute_command(client, args, std::cout);
    } catch (const ondd::ipc::IpcError& e) {
        result = ondd::core::CommandResult::error(e.what());
    }

    if (!result.success) {
        std::cerr << "Error: " << result.message << "\n";
        ondd::core::Logger::shutdown();
        return 1;
    }

    if (!result.message.empty()) {
        std::cout << result.message << "\n";
    }

    ondd::core::Logger::shutdown();
    return 0;
}
