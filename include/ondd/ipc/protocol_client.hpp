#pragma once

#include "ondd/ipc/records.hpp"
#include "ondd/ipc/stanza.hpp"
#include "ondd/ipc/transport.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ondd::core {
    class Config;
}

namespace ondd::ipc {

enum class ConnectionMode {
    // One connection shared by all calls, guarded across each send/receive pair.
    Persistent,
    // A fresh connection for every exchange, closed when the exchange ends.
    PerCall
};

std::optional<ConnectionMode> parse_connection_mode(const std::string& name);

struct ClientOptions {
    std::string endpoint = "/var/run/ondd.ctrl";
    std::chrono::milliseconds timeout{20000};
    std::chrono::milliseconds connect_timeout{5000};
    ConnectionMode mode = ConnectionMode::PerCall;
    bool auto_open = true;
    std::size_t max_response_size = 1024 * 1024;

    // Reads the ondd.* keys; missing or unparseable keys keep their defaults.
    static ClientOptions from_config(const core::Config& config);
};

enum class Delivery {
    DvbS,
    DvbS2
};

enum class Modulation {
    Qpsk,
    Psk8
};

std::string to_string(Delivery delivery);
std::string to_string(Modulation modulation);
std::optional<Delivery> parse_delivery(const std::string& name);
std::optional<Modulation> parse_modulation(const std::string& name);

struct TunerParameters {
    int frequency = 0;          // MHz, L-band
    int symbol_rate = 0;        // kS/s
    Delivery delivery = Delivery::DvbS;
    Modulation modulation = Modulation::Qpsk;
    bool tone = true;
    int voltage = 13;
    int azimuth = 0;

    // Throws InvalidArgumentError naming the first out-of-range parameter.
    void validate() const;
};

class ProtocolClient {
public:
    using TransportFactory = std::function<std::unique_ptr<Transport>()>;

    explicit ProtocolClient(ClientOptions options = {});
    ProtocolClient(ClientOptions options, TransportFactory factory);
    ~ProtocolClient();

    ProtocolClient(const ProtocolClient&) = delete;
    ProtocolClient& operator=(const ProtocolClient&) = delete;

    // Persistent mode only; per-call mode opens a connection for each exchange.
    void open();
    void close();
    bool is_open() const;
    // Aborts every exchange in flight; the blocked callers get CancelledError.
    void cancel();

    const ClientOptions& options() const { return options_; }

    // True if the daemon endpoint accepts a connection.
    bool ping();

    TransferStatus status();
    std::vector<TransferStatus> list_transfers();
    std::vector<FileInfo> list_files();
    std::vector<StreamInfo> list_streams();
    TunerStatus tuner_status();
    CacheInfo cache_info();
    void reset_cache();
    TunerSettings tuner_settings();
    void set_tuner_settings(const TunerParameters& parameters);
    std::string output_path();
    void set_output_path(const std::string& path);
    std::vector<Event> events();

    std::vector<Stanza> exchange(const Command& command);
    std::vector<Stanza> exchange(const Command& command, std::chrono::milliseconds timeout);

private:
    class ActiveExchange;

    template<typename Record>
    Record query_one(const Command& command, const RecordSchema<Record>& schema);

    template<typename Record>
    std::vector<Record> query_all(const Command& command, const RecordSchema<Record>& schema);

    void run_control(const Command& command);

    std::string round_trip(Transport& transport, const std::string& request,
                           std::chrono::milliseconds timeout);
    std::unique_ptr<Transport> make_transport() const;

    ClientOptions options_;
    TransportFactory factory_;

    std::unique_ptr<Transport> connection_;
    std::mutex exchange_mutex_;

    mutable std::mutex active_mutex_;
    std::vector<Transport*> active_;
};

}
