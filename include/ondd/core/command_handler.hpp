#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace ondd::ipc {
    class ProtocolClient;
}

namespace ondd::core {

struct CommandResult {
    bool success;
    std::string message;

    static CommandResult ok(const std::string& msg = "") { return {true, msg}; }
    static CommandResult error(const std::string& msg) { return {false, msg}; }
};

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // args[0] is the command name.
    virtual CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                  std::ostream& out) = 0;
    virtual std::string get_description() const = 0;
    virtual std::string get_usage() const = 0;
};

class PingCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Check that ONDD accepts connections"; }
    std::string get_usage() const override { return "ping"; }
};

class StatusCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show the current transfer state"; }
    std::string get_usage() const override { return "status"; }
};

class TransfersCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "List transfers in progress"; }
    std::string get_usage() const override { return "transfers"; }
};

class FilesCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "List files announced on the carrier"; }
    std::string get_usage() const override { return "files"; }
};

class StreamsCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "List received data streams"; }
    std::string get_usage() const override { return "streams"; }
};

class TunerCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show tuner lock and signal quality"; }
    std::string get_usage() const override { return "tuner"; }
};

class CacheCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show cache storage usage"; }
    std::string get_usage() const override { return "cache"; }
};

class CacheResetCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Discard the download cache"; }
    std::string get_usage() const override { return "cache-reset"; }
};

class SettingsCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show tuner settings"; }
    std::string get_usage() const override { return "settings"; }
};

class SetSettingsCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Tune to a transponder"; }
    std::string get_usage() const override {
        return "set-settings frequency=<MHz> symbolrate=<kS/s> [lnb=k|c|u] [delivery=dvb-s|dvb-s2] "
               "[modulation=qpsk|8psk] [voltage=0|13|18] [tone=yes|no] [azimuth=<deg>]";
    }
};

class OutputCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show the download output directory"; }
    std::string get_usage() const override { return "output"; }
};

class SetOutputCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Change the download output directory"; }
    std::string get_usage() const override { return "set-output <path>"; }
};

class EventsCommandHandler : public CommandHandler {
public:
    CommandResult execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                          std::ostream& out) override;
    std::string get_description() const override { return "Show recent daemon events"; }
    std::string get_usage() const override { return "events"; }
};

}
