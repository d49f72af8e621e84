#include "ondd/ipc/records.hpp"
#include "ondd/ipc/lnb.hpp"
#include <filesystem>

namespace ondd::ipc {

namespace {

int transfer_percentage(const TransferStatus& transfer) {
    if (transfer.complete) {
        return 100;
    }
    if (transfer.size == 0) {
        return 0;
    }
    auto percent = transfer.received * 100 / transfer.size;
    return static_cast<int>(percent > 100 ? 100 : percent);
}

}

std::string TransferStatus::filename() const {
    return std::filesystem::path(path).filename().string();
}

const RecordSchema<TransferStatus>& transfer_status_schema() {
    static const auto schema = RecordSchema<TransferStatus>("TransferStatus")
        .required("state", "state", &TransferStatus::state, coerce::to_string)
        .required("progress", "progress", &TransferStatus::progress, coerce::to_percent)
        .optional("id", "id", &TransferStatus::id, coerce::to_string)
        .optional("path", "path", &TransferStatus::path, coerce::to_string)
        .optional("hash", "hash", &TransferStatus::hash, coerce::to_string)
        .optional("size", "size", &TransferStatus::size, coerce::to_uint)
        .optional("received", "received", &TransferStatus::received, coerce::to_uint)
        .optional("complete", "complete", &TransferStatus::complete, coerce::to_bool);
    return schema;
}

const RecordSchema<TransferStatus>& transfer_entry_schema() {
    static const auto schema = RecordSchema<TransferStatus>("TransferStatus")
        .required("id", "id", &TransferStatus::id, coerce::to_string)
        .required("size", "size", &TransferStatus::size, coerce::to_uint)
        .required("received", "received", &TransferStatus::received, coerce::to_uint)
        .optional("path", "path", &TransferStatus::path, coerce::to_string)
        .optional("hash", "hash", &TransferStatus::hash, coerce::to_string)
        .optional("state", "state", &TransferStatus::state, coerce::to_string)
        .optional("complete", "complete", &TransferStatus::complete, coerce::to_bool)
        .optional("progress", "progress", &TransferStatus::progress, coerce::to_percent)
        .finalize([](TransferStatus& transfer, const Stanza& stanza) {
            if (!stanza.contains("progress")) {
                transfer.progress = transfer_percentage(transfer);
            }
        });
    return schema;
}

const RecordSchema<CacheInfo>& cache_info_schema() {
    static const auto schema = RecordSchema<CacheInfo>("CacheInfo")
        .required("used", "used", &CacheInfo::used, coerce::to_uint)
        .required("free", "free", &CacheInfo::free, coerce::to_uint);
    return schema;
}

const RecordSchema<TunerStatus>& tuner_status_schema() {
    static const auto schema = RecordSchema<TunerStatus>("TunerStatus")
        .required("lock", "lock", &TunerStatus::lock, coerce::to_bool)
        .required("signal", "signal", &TunerStatus::signal, coerce::to_int)
        .optional("snr", "snr", &TunerStatus::snr, coerce::to_double, 0.0);
    return schema;
}

const RecordSchema<TunerSettings>& tuner_settings_schema() {
    static const auto schema = RecordSchema<TunerSettings>("TunerSettings")
        .required("frequency", "frequency", &TunerSettings::frequency, coerce::to_int)
        .required("delivery", "delivery", &TunerSettings::delivery, coerce::to_string)
        .required("modulation", "modulation", &TunerSettings::modulation, coerce::to_string)
        .optional("symbol_rate", "symbolrate", &TunerSettings::symbol_rate, coerce::to_int)
        .optional("voltage", "voltage", &TunerSettings::voltage, coerce::to_int)
        .optional("tone", "tone", &TunerSettings::tone, coerce::to_bool)
        .optional("azimuth", "azimuth", &TunerSettings::azimuth, coerce::to_int)
        .finalize([](TunerSettings& settings, const Stanza&) {
            settings.polarization = lnb::voltage_to_polarization(settings.voltage);
        });
    return schema;
}

const RecordSchema<StreamInfo>& stream_info_schema() {
    static const auto schema = RecordSchema<StreamInfo>("StreamInfo")
        .required("ident", "ident", &StreamInfo::ident, coerce::to_string)
        .optional("bitrate", "bitrate", &StreamInfo::bitrate, coerce::to_uint);
    return schema;
}

const RecordSchema<FileInfo>& file_info_schema() {
    static const auto schema = RecordSchema<FileInfo>("FileInfo")
        .required("path", "path", &FileInfo::path, coerce::to_string)
        .optional("size", "size", &FileInfo::size, coerce::to_uint);
    return schema;
}

const RecordSchema<Event>& event_schema() {
    static const auto schema = RecordSchema<Event>("Event")
        .required("time", "time", &Event::time, coerce::to_timestamp)
        .required("type", "type", &Event::type, coerce::to_string)
        .optional("message", "message", &Event::message, coerce::to_string);
    return schema;
}

const RecordSchema<CommandAck>& command_ack_schema() {
    static const auto schema = RecordSchema<CommandAck>("CommandAck")
        .required("code", "code", &CommandAck::code, coerce::to_int)
        .optional("message", "message", &CommandAck::message, coerce::to_string);
    return schema;
}

const RecordSchema<OutputPath>& output_path_schema() {
    static const auto schema = RecordSchema<OutputPath>("OutputPath")
        .required("path", "path", &OutputPath::path, coerce::to_string);
    return schema;
}

}
