#pragma once

#include "ondd/core/command_handler.hpp"
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace ondd::core {

class CommandRegistry {
public:
    CommandRegistry();

    void register_command(const std::string& name, std::unique_ptr<CommandHandler> handler);

    // Daemon and validation errors are reported through the result, not thrown.
    CommandResult execute_command(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                  std::ostream& out);
    bool has_command(const std::string& command) const;
    void print_help(std::ostream& out) const;

private:
    std::map<std::string, std::unique_ptr<CommandHandler>> handlers_;
};

}
