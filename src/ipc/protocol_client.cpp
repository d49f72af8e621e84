#include "ondd/ipc/protocol_client.hpp"
#include "ondd/ipc/errors.hpp"
#include "ondd/core/config.hpp"
#include "ondd/core/logger.hpp"
#include "ondd/core/utils.hpp"
#include <algorithm>

namespace ondd::ipc {

namespace {

constexpr int MAX_FREQUENCY = 20000;
constexpr int MAX_SYMBOL_RATE = 100000;

std::string kv(const std::string& key, const std::string& value) {
    return key + "=" + value;
}

// Re-throws transport failures with the command they interrupted.
template<typename Fn>
auto with_command(const std::string& command, Fn&& fn) {
    try {
        return fn();
    } catch (const CancelledError& e) {
        throw CancelledError(e.what(), command);
    } catch (const ConnectionError& e) {
        throw ConnectionError(e.what(), command);
    } catch (const TimeoutError& e) {
        throw TimeoutError(e.what(), command);
    }
}

// Tags record mapping failures with the command whose response was mapped.
template<typename Fn>
auto map_for(const std::string& command, Fn&& fn) {
    try {
        return fn();
    } catch (RecordError& e) {
        e.set_command(command);
        throw;
    }
}

}

std::optional<ConnectionMode> parse_connection_mode(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);

    if (lower == "persistent") return ConnectionMode::Persistent;
    if (lower == "per-call" || lower == "per_call") return ConnectionMode::PerCall;
    return std::nullopt;
}

ClientOptions ClientOptions::from_config(const core::Config& config) {
    ClientOptions options;

    auto endpoint = config.get_string("ondd.socket");
    if (!endpoint.empty()) {
        options.endpoint = endpoint;
    }

    if (auto timeout = config.get_as<long long>("ondd.timeout_ms"); timeout && *timeout > 0) {
        options.timeout = std::chrono::milliseconds(*timeout);
    }
    if (auto timeout = config.get_as<long long>("ondd.connect_timeout_ms"); timeout && *timeout > 0) {
        options.connect_timeout = std::chrono::milliseconds(*timeout);
    }

    if (auto mode_name = config.get("ondd.connection_mode")) {
        if (auto mode = parse_connection_mode(*mode_name)) {
            options.mode = *mode;
        } else {
            LOG_WARN("Unknown connection mode '{}', using per-call", *mode_name);
        }
    }

    options.auto_open = config.get_bool("ondd.auto_open", options.auto_open);

    if (auto max_size = config.get_as<std::size_t>("ondd.max_response_bytes"); max_size && *max_size > 0) {
        options.max_response_size = *max_size;
    }

    return options;
}

std::string to_string(Delivery delivery) {
    switch (delivery) {
        case Delivery::DvbS: return "dvb-s";
        case Delivery::DvbS2: return "dvb-s2";
    }
    return "dvb-s";
}

std::string to_string(Modulation modulation) {
    switch (modulation) {
        case Modulation::Qpsk: return "qpsk";
        case Modulation::Psk8: return "8psk";
    }
    return "qpsk";
}

std::optional<Delivery> parse_delivery(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);

    if (lower == "dvb-s") return Delivery::DvbS;
    if (lower == "dvb-s2") return Delivery::DvbS2;
    return std::nullopt;
}

std::optional<Modulation> parse_modulation(const std::string& name) {
    auto lower = core::utils::StringUtils::to_lower(name);

    if (lower == "qpsk") return Modulation::Qpsk;
    if (lower == "8psk") return Modulation::Psk8;
    return std::nullopt;
}

void TunerParameters::validate() const {
    if (frequency <= 0 || frequency > MAX_FREQUENCY) {
        throw InvalidArgumentError("frequency " + std::to_string(frequency) +
                                   " MHz is outside 1.." + std::to_string(MAX_FREQUENCY));
    }
    if (symbol_rate <= 0 || symbol_rate > MAX_SYMBOL_RATE) {
        throw InvalidArgumentError("symbol rate " + std::to_string(symbol_rate) +
                                   " kS/s is outside 1.." + std::to_string(MAX_SYMBOL_RATE));
    }
    if (voltage != 0 && voltage != 13 && voltage != 18) {
        throw InvalidArgumentError("voltage must be 0, 13 or 18, got " + std::to_string(voltage));
    }
    if (azimuth < 0 || azimuth >= 360) {
        throw InvalidArgumentError("azimuth " + std::to_string(azimuth) + " is outside 0..359");
    }
}

// Registers a transport as in flight so cancel() can reach it.
class ProtocolClient::ActiveExchange {
public:
    ActiveExchange(ProtocolClient& client, Transport& transport)
        : client_(client), transport_(transport) {
        std::lock_guard<std::mutex> lock(client_.active_mutex_);
        client_.active_.push_back(&transport_);
    }

    ~ActiveExchange() {
        std::lock_guard<std::mutex> lock(client_.active_mutex_);
        auto& active = client_.active_;
        active.erase(std::remove(active.begin(), active.end(), &transport_), active.end());
    }

    ActiveExchange(const ActiveExchange&) = delete;
    ActiveExchange& operator=(const ActiveExchange&) = delete;

private:
    ProtocolClient& client_;
    Transport& transport_;
};

ProtocolClient::ProtocolClient(ClientOptions options)
    : ProtocolClient(std::move(options), nullptr) {
}

ProtocolClient::ProtocolClient(ClientOptions options, TransportFactory factory)
    : options_(std::move(options))
    , factory_(std::move(factory)) {

    if (!factory_) {
        TransportOptions transport_options;
        transport_options.connect_timeout = options_.connect_timeout;
        transport_options.write_timeout = options_.timeout;
        transport_options.max_response_size = options_.max_response_size;

        factory_ = [transport_options]() -> std::unique_ptr<Transport> {
            return std::make_unique<SocketTransport>(transport_options);
        };
    }

    if (options_.mode == ConnectionMode::Persistent) {
        connection_ = make_transport();
    }

    LOG_DEBUG("ONDD client for {} ({} mode)", options_.endpoint,
              options_.mode == ConnectionMode::Persistent ? "persistent" : "per-call");
}

ProtocolClient::~ProtocolClient() {
    close();
}

void ProtocolClient::open() {
    if (!connection_) {
        return;
    }

    std::lock_guard<std::mutex> lock(exchange_mutex_);
    connection_->open(options_.endpoint);
}

void ProtocolClient::close() {
    if (!connection_) {
        return;
    }

    std::lock_guard<std::mutex> lock(exchange_mutex_);
    connection_->close();
}

bool ProtocolClient::is_open() const {
    return connection_ && connection_->is_open();
}

void ProtocolClient::cancel() {
    std::lock_guard<std::mutex> lock(active_mutex_);
    for (auto* transport : active_) {
        transport->cancel();
    }
}

bool ProtocolClient::ping() {
    try {
        if (connection_) {
            std::lock_guard<std::mutex> lock(exchange_mutex_);
            connection_->open(options_.endpoint);
            return true;
        }

        auto transport = make_transport();
        transport->open(options_.endpoint);
        transport->close();
        return true;
    } catch (const ConnectionError& e) {
        LOG_DEBUG("Could not connect to ONDD socket: {}", e.what());
        return false;
    }
}

TransferStatus ProtocolClient::status() {
    return query_one(Command("STATUS"), transfer_status_schema());
}

std::vector<TransferStatus> ProtocolClient::list_transfers() {
    return query_all(Command("LIST"), transfer_entry_schema());
}

std::vector<FileInfo> ProtocolClient::list_files() {
    return query_all(Command("FILES"), file_info_schema());
}

std::vector<StreamInfo> ProtocolClient::list_streams() {
    return query_all(Command("STREAMS"), stream_info_schema());
}

TunerStatus ProtocolClient::tuner_status() {
    return query_one(Command("TUNER"), tuner_status_schema());
}

CacheInfo ProtocolClient::cache_info() {
    return query_one(Command("CACHE"), cache_info_schema());
}

void ProtocolClient::reset_cache() {
    run_control(Command("CACHE-RESET"));
}

TunerSettings ProtocolClient::tuner_settings() {
    return query_one(Command("SETTINGS"), tuner_settings_schema());
}

void ProtocolClient::set_tuner_settings(const TunerParameters& parameters) {
    parameters.validate();

    run_control(Command("SET-SETTINGS", {
        kv("frequency", std::to_string(parameters.frequency)),
        kv("symbolrate", std::to_string(parameters.symbol_rate)),
        kv("delivery", to_string(parameters.delivery)),
        kv("modulation", to_string(parameters.modulation)),
        kv("tone", parameters.tone ? "yes" : "no"),
        kv("voltage", std::to_string(parameters.voltage)),
        kv("azimuth", std::to_string(parameters.azimuth))
    }));
}

std::string ProtocolClient::output_path() {
    return query_one(Command("OUTPUT"), output_path_schema()).path;
}

void ProtocolClient::set_output_path(const std::string& path) {
    if (path.empty()) {
        throw InvalidArgumentError("output path must not be empty", "SET-OUTPUT");
    }

    run_control(Command("SET-OUTPUT", {kv("path", path)}));
}

std::vector<Event> ProtocolClient::events() {
    return query_all(Command("EVENTS"), event_schema());
}

std::vector<Stanza> ProtocolClient::exchange(const Command& command) {
    return exchange(command, options_.timeout);
}

std::vector<Stanza> ProtocolClient::exchange(const Command& command, std::chrono::milliseconds timeout) {
    auto request = StanzaCodec::encode(command);
    std::string response;

    if (connection_) {
        std::lock_guard<std::mutex> lock(exchange_mutex_);

        if (!connection_->is_open()) {
            if (!options_.auto_open) {
                throw ConnectionError("not connected to " + options_.endpoint, command.name);
            }
            with_command(command.name, [this] { connection_->open(options_.endpoint); });
        }

        response = with_command(command.name, [&] {
            return round_trip(*connection_, request, timeout);
        });
    } else {
        auto transport = make_transport();
        response = with_command(command.name, [&] {
            transport->open(options_.endpoint);
            auto reply = round_trip(*transport, request, timeout);
            transport->close();
            return reply;
        });
    }

    auto stanzas = StanzaCodec::decode(response, command.name);
    LOG_DEBUG("{} returned {} stanza(s)", command.name, stanzas.size());
    return stanzas;
}

std::string ProtocolClient::round_trip(Transport& transport, const std::string& request,
                                       std::chrono::milliseconds timeout) {
    ActiveExchange active(*this, transport);
    transport.send(request);
    return transport.receive_response(timeout);
}

template<typename Record>
Record ProtocolClient::query_one(const Command& command, const RecordSchema<Record>& schema) {
    auto stanzas = exchange(command);
    if (stanzas.size() != 1) {
        throw MalformedResponseError("expected one " + schema.name() + " stanza, got " +
                                     std::to_string(stanzas.size()), command.name);
    }
    return map_for(command.name, [&] { return schema.map(stanzas.front()); });
}

template<typename Record>
std::vector<Record> ProtocolClient::query_all(const Command& command, const RecordSchema<Record>& schema) {
    auto stanzas = exchange(command);
    return map_for(command.name, [&] { return schema.map_all(stanzas); });
}

void ProtocolClient::run_control(const Command& command) {
    auto stanzas = exchange(command);
    if (stanzas.empty()) {
        return;
    }

    if (stanzas.size() > 1) {
        throw MalformedResponseError("expected at most one acknowledgement stanza, got " +
                                     std::to_string(stanzas.size()), command.name);
    }

    auto ack = map_for(command.name, [&] { return command_ack_schema().map(stanzas.front()); });
    if (ack.is_error()) {
        LOG_ERROR("ONDD rejected {}: {} {}", command.name, ack.code, ack.message);
        throw CommandRejectedError(command.name, ack.code, ack.message);
    }

    LOG_DEBUG("{} acknowledged with code {}", command.name, ack.code);
}

std::unique_ptr<Transport> ProtocolClient::make_transport() const {
    return factory_();
}

}
