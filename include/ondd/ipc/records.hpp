#pragma once

#include "ondd/ipc/record_mapper.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace ondd::ipc {

struct TransferStatus {
    std::string id;
    std::string path;
    std::string hash;
    std::string state;
    std::uint64_t size = 0;        // bytes
    std::uint64_t received = 0;    // bytes
    int progress = 0;              // percent
    bool complete = false;

    std::string filename() const;

    bool operator==(const TransferStatus&) const = default;
};

struct CacheInfo {
    std::uint64_t used = 0;
    std::uint64_t free = 0;

    std::uint64_t total() const { return used + free; }

    bool operator==(const CacheInfo&) const = default;
};

struct TunerStatus {
    bool lock = false;
    int signal = 0;
    double snr = 0.0;

    bool operator==(const TunerStatus&) const = default;
};

struct TunerSettings {
    int frequency = 0;      // MHz, L-band
    int symbol_rate = 0;    // kS/s
    std::string delivery;
    std::string modulation;
    int voltage = 0;
    char polarization = '0';
    bool tone = false;
    int azimuth = 0;

    bool operator==(const TunerSettings&) const = default;
};

struct StreamInfo {
    std::string ident;
    std::uint64_t bitrate = 0;

    bool operator==(const StreamInfo&) const = default;
};

struct FileInfo {
    std::string path;
    std::uint64_t size = 0;

    bool operator==(const FileInfo&) const = default;
};

struct Event {
    std::chrono::system_clock::time_point time;
    std::string type;
    std::string message;

    bool operator==(const Event&) const = default;
};

struct CommandAck {
    int code = 0;
    std::string message;

    bool is_error() const { return code >= 400; }

    bool operator==(const CommandAck&) const = default;
};

struct OutputPath {
    std::string path;

    bool operator==(const OutputPath&) const = default;
};

// Reply to STATUS: requires state and progress.
const RecordSchema<TransferStatus>& transfer_status_schema();
// One stanza of the LIST reply: requires id, size and received.
const RecordSchema<TransferStatus>& transfer_entry_schema();
const RecordSchema<CacheInfo>& cache_info_schema();
const RecordSchema<TunerStatus>& tuner_status_schema();
const RecordSchema<TunerSettings>& tuner_settings_schema();
const RecordSchema<StreamInfo>& stream_info_schema();
const RecordSchema<FileInfo>& file_info_schema();
const RecordSchema<Event>& event_schema();
const RecordSchema<CommandAck>& command_ack_schema();
const RecordSchema<OutputPath>& output_path_schema();

}
