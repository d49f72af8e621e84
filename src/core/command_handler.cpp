#include "ondd/core/command_handler.hpp"
#include "ondd/core/logger.hpp"
#include "ondd/core/utils.hpp"
#include "ondd/ipc/lnb.hpp"
#include "ondd/ipc/protocol_client.hpp"
#include <charconv>
#include <iomanip>
#include <map>
#include <optional>
#include <sstream>

namespace ondd::core {

using utils::StringUtils;

namespace {

std::optional<int> parse_int(const std::string& value) {
    int result = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
        return std::nullopt;
    }
    return result;
}

void print_field(std::ostream& out, const std::string& label, const std::string& value) {
    out << std::left << std::setw(16) << (label + ":") << value << "\n";
}

}

CommandResult PingCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                          std::ostream& out) {
    if (!client.ping()) {
        return CommandResult::error("ONDD is not reachable at " + client.options().endpoint);
    }

    out << "ONDD is reachable at " << client.options().endpoint << "\n";
    return CommandResult::ok();
}

CommandResult StatusCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                            std::ostream& out) {
    auto status = client.status();

    print_field(out, "State", status.state);
    print_field(out, "Progress", std::to_string(status.progress) + "%");
    if (!status.path.empty()) {
        print_field(out, "File", status.filename());
    }
    if (status.size > 0) {
        print_field(out, "Received", StringUtils::format_bytes(status.received) + " of " +
                                     StringUtils::format_bytes(status.size));
    }
    return CommandResult::ok();
}

CommandResult TransfersCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                               std::ostream& out) {
    auto transfers = client.list_transfers();

    if (transfers.empty()) {
        out << "No transfers in progress\n";
        return CommandResult::ok();
    }

    for (const auto& transfer : transfers) {
        out << std::left << std::setw(12) << transfer.id << " "
            << std::right << std::setw(3) << transfer.progress << "% "
            << StringUtils::format_bytes(transfer.received) << " / "
            << StringUtils::format_bytes(transfer.size);
        if (!transfer.path.empty()) {
            out << "  " << transfer.filename();
        }
        out << (transfer.complete ? "  [complete]" : "") << "\n";
    }
    return CommandResult::ok();
}

CommandResult FilesCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                           std::ostream& out) {
    auto files = client.list_files();

    if (files.empty()) {
        out << "No files announced\n";
        return CommandResult::ok();
    }

    for (const auto& file : files) {
        out << std::left << std::setw(12) << StringUtils::format_bytes(file.size) << " " << file.path << "\n";
    }
    return CommandResult::ok();
}

CommandResult StreamsCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                             std::ostream& out) {
    auto streams = client.list_streams();

    if (streams.empty()) {
        out << "No streams\n";
        return CommandResult::ok();
    }

    for (const auto& stream : streams) {
        out << std::left << std::setw(24) << stream.ident << " " << stream.bitrate << " bps\n";
    }
    return CommandResult::ok();
}

CommandResult TunerCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                           std::ostream& out) {
    auto tuner = client.tuner_status();

    std::ostringstream snr;
    snr << std::fixed << std::setprecision(2) << tuner.snr << " dB";

    print_field(out, "Lock", tuner.lock ? "yes" : "no");
    print_field(out, "Signal", std::to_string(tuner.signal));
    print_field(out, "SNR", snr.str());
    return CommandResult::ok();
}

CommandResult CacheCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                           std::ostream& out) {
    auto cache = client.cache_info();

    print_field(out, "Used", StringUtils::format_bytes(cache.used));
    print_field(out, "Free", StringUtils::format_bytes(cache.free));
    print_field(out, "Total", StringUtils::format_bytes(cache.total()));
    return CommandResult::ok();
}

CommandResult CacheResetCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                                std::ostream& out) {
    client.reset_cache();
    return CommandResult::ok("Cache reset");
}

CommandResult SettingsCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                              std::ostream& out) {
    auto settings = client.tuner_settings();

    print_field(out, "Frequency", std::to_string(settings.frequency) + " MHz");
    print_field(out, "Symbol rate", std::to_string(settings.symbol_rate) + " kS/s");
    print_field(out, "Delivery", settings.delivery);
    print_field(out, "Modulation", settings.modulation);
    print_field(out, "Polarization", std::string(1, settings.polarization));
    print_field(out, "Tone", settings.tone ? "yes" : "no");
    print_field(out, "Azimuth", std::to_string(settings.azimuth));
    return CommandResult::ok();
}

CommandResult SetSettingsCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                                 std::ostream& out) {
    std::map<std::string, std::string> values;
    for (size_t i = 1; i < args.size(); ++i) {
        auto eq_pos = args[i].find('=');
        if (eq_pos == std::string::npos) {
            return CommandResult::error("Expected key=value, got '" + args[i] + "'");
        }
        values[StringUtils::to_lower(args[i].substr(0, eq_pos))] = args[i].substr(eq_pos + 1);
    }

    ipc::TunerParameters parameters;

    for (const auto& [key, value] : values) {
        if (key == "frequency" || key == "symbolrate" || key == "voltage" || key == "azimuth") {
            auto number = parse_int(value);
            if (!number) {
                return CommandResult::error(key + " must be an integer, got '" + value + "'");
            }
            if (key == "frequency") parameters.frequency = *number;
            else if (key == "symbolrate") parameters.symbol_rate = *number;
            else if (key == "voltage") parameters.voltage = *number;
            else parameters.azimuth = *number;
        } else if (key == "delivery") {
            auto delivery = ipc::parse_delivery(value);
            if (!delivery) {
                return CommandResult::error("Unknown delivery system '" + value + "'");
            }
            parameters.delivery = *delivery;
        } else if (key == "modulation") {
            auto modulation = ipc::parse_modulation(value);
            if (!modulation) {
                return CommandResult::error("Unknown modulation '" + value + "'");
            }
            parameters.modulation = *modulation;
        } else if (key == "tone") {
            auto tone = StringUtils::to_lower(value);
            if (tone != "yes" && tone != "no") {
                return CommandResult::error("tone must be yes or no, got '" + value + "'");
            }
            parameters.tone = tone == "yes";
        } else if (key != "lnb") {
            return CommandResult::error("Unknown setting '" + key + "'");
        }
    }

    // With an LNB type the frequency is the transponder frequency.
    if (auto lnb_code = values.find("lnb"); lnb_code != values.end()) {
        auto type = ipc::lnb::parse_lnb_type(lnb_code->second);
        if (!type) {
            return CommandResult::error("LNB type must be k, c or u, got '" + lnb_code->second + "'");
        }

        auto transponder = parameters.frequency;
        parameters.frequency = ipc::lnb::to_l_band(transponder, *type);
        if (values.find("tone") == values.end()) {
            parameters.tone = ipc::lnb::needs_tone(transponder, *type);
        }
        LOG_DEBUG("Transponder {} MHz maps to L-band {} MHz", transponder, parameters.frequency);
    }

    client.set_tuner_settings(parameters);
    return CommandResult::ok("Tuner settings applied");
}

CommandResult OutputCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                            std::ostream& out) {
    out << client.output_path() << "\n";
    return CommandResult::ok();
}

CommandResult SetOutputCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                               std::ostream& out) {
    if (args.size() != 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    client.set_output_path(args[1]);
    return CommandResult::ok("Output path set to " + args[1]);
}

CommandResult EventsCommandHandler::execute(ipc::ProtocolClient& client, const std::vector<std::string>& args,
                                            std::ostream& out) {
    auto events = client.events();

    if (events.empty()) {
        out << "No events\n";
        return CommandResult::ok();
    }

    for (const auto& event : events) {
        out << utils::TimeUtils::to_iso_string(event.time) << " "
            << std::left << std::setw(12) << event.type << " " << event.message << "\n";
    }
    return CommandResult::ok();
}

}
