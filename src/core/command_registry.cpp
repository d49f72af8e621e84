#include "ondd/core/command_registry.hpp"
#include "ondd/core/logger.hpp"
#include "ondd/ipc/errors.hpp"
#include <iomanip>

namespace ondd::core {

CommandRegistry::CommandRegistry() {
    register_command("ping", std::make_unique<PingCommandHandler>());
    register_command("status", std::make_unique<StatusCommandHandler>());
    register_command("transfers", std::make_unique<TransfersCommandHandler>());
    register_command("files", std::make_unique<FilesCommandHandler>());
    register_command("streams", std::make_unique<StreamsCommandHandler>());
    register_command("tuner", std::make_unique<TunerCommandHandler>());
    register_command("cache", std::make_unique<CacheCommandHandler>());
    register_command("cache-reset", std::make_unique<CacheResetCommandHandler>());
    register_command("settings", std::make_unique<SettingsCommandHandler>());
    register_command("set-settings", std::make_unique<SetSettingsCommandHandler>());
    register_command("output", std::make_unique<OutputCommandHandler>());
    register_command("set-output", std::make_unique<SetOutputCommandHandler>());
    register_command("events", std::make_unique<EventsCommandHandler>());
}

void CommandRegistry::register_command(const std::string& name, std::unique_ptr<CommandHandler> handler) {
    handlers_[name] = std::move(handler);
}

CommandResult CommandRegistry::execute_command(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                               std::ostream& out) {
    if (args.empty()) {
        return CommandResult::error("No command given");
    }

    auto it = handlers_.find(args[0]);
    if (it == handlers_.end()) {
        return CommandResult::error("Unknown command: " + args[0]);
    }

    try {
        return it->second->execute(client, args, out);
    } catch (const ipc::IpcError& e) {
        LOG_DEBUG("Command {} failed: {}", args[0], e.what());
        return CommandResult::error(e.what());
    }
}

bool CommandRegistry::has_command(const std::string& command) const {
    return handlers_.find(command) != handlers_.end();
}

void CommandRegistry::print_help(std::ostream& out) const {
    out << "\nCommands:\n";

    for (const auto& [name, handler] : handlers_) {
        out << "  " << std::left << std::setw(15) << name
            << handler->get_description() << "\n";
        out << "  " << std::left << std::setw(15) << " "
            << "Usage: " << handler->get_usage() << "\n\n";
    }
}

}
