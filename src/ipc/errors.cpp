#include "ondd/ipc/errors.hpp"

namespace ondd::ipc {

namespace {

std::string describe(const std::string& message, const std::string& command) {
    return command.empty() ? message : command + ": " + message;
}

}

IpcError::IpcError(const std::string& message, std::string command)
    : std::runtime_error(message)
    , message_(message)
    , command_(std::move(command))
    , what_(describe(message_, command_)) {
}

void IpcError::set_command(const std::string& command) {
    if (!command_.empty()) {
        return;
    }
    command_ = command;
    what_ = describe(message_, command_);
}

MalformedResponseError::MalformedResponseError(const std::string& message, std::string command,
                                               std::size_t line_number, std::string raw_line)
    : IpcError(line_number > 0
                   ? message + " (line " + std::to_string(line_number) + ": '" + raw_line + "')"
                   : message,
               std::move(command))
    , line_number_(line_number)
    , raw_line_(std::move(raw_line)) {
}

RecordError::RecordError(const std::string& message, std::string record, std::string field)
    : IpcError(message)
    , record_(std::move(record))
    , field_(std::move(field)) {
}

MissingFieldError::MissingFieldError(const std::string& record, const std::string& field,
                                     const std::string& key)
    : RecordError(record + " is missing required field '" + field + "' (key '" + key + "')",
                  record, field) {
}

FieldTypeError::FieldTypeError(const std::string& record, const std::string& field,
                               const std::string& raw_value)
    : RecordError(record + " field '" + field + "' has invalid value '" + raw_value + "'",
                  record, field)
    , raw_value_(raw_value) {
}

CommandRejectedError::CommandRejectedError(const std::string& command, int code,
                                           const std::string& daemon_message)
    : IpcError("daemon rejected command with code " + std::to_string(code) +
                   (daemon_message.empty() ? "" : " (" + daemon_message + ")"),
               command)
    , code_(code)
    , daemon_message_(daemon_message) {
}

}
