#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ondd::ipc {

// Root of everything the client throws. command() is empty when the failure
// happened outside an exchange (opening, local validation without a command).
class IpcError : public std::runtime_error {
public:
    IpcError(const std::string& message, std::string command = "");

    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& command() const { return command_; }

    // Names the exchange an error raised without one belongs to. An error that
    // already names its command keeps it.
    void set_command(const std::string& command);

private:
    std::string message_;
    std::string command_;
    std::string what_;
};

class ConnectionError : public IpcError {
public:
    using IpcError::IpcError;
};

class CancelledError : public ConnectionError {
public:
    using ConnectionError::ConnectionError;
};

class TimeoutError : public IpcError {
public:
    using IpcError::IpcError;
};

class InvalidArgumentError : public IpcError {
public:
    using IpcError::IpcError;
};

class MalformedResponseError : public IpcError {
public:
    MalformedResponseError(const std::string& message, std::string command = "",
                           std::size_t line_number = 0, std::string raw_line = "");

    std::size_t line_number() const { return line_number_; }
    const std::string& raw_line() const { return raw_line_; }

private:
    std::size_t line_number_;
    std::string raw_line_;
};

class RecordError : public IpcError {
public:
    RecordError(const std::string& message, std::string record, std::string field);

    const std::string& record() const { return record_; }
    const std::string& field() const { return field_; }

private:
    std::string record_;
    std::string field_;
};

class MissingFieldError : public RecordError {
public:
    MissingFieldError(const std::string& record, const std::string& field, const std::string& key);
};

class FieldTypeError : public RecordError {
public:
    FieldTypeError(const std::string& record, const std::string& field, const std::string& raw_value);

    const std::string& raw_value() const { return raw_value_; }

private:
    std::string raw_value_;
};

class CommandRejectedError : public IpcError {
public:
    CommandRejectedError(const std::string& command, int code, const std::string& daemon_message);

    int code() const { return code_; }
    const std::string& daemon_message() const { return daemon_message_; }

private:
    int code_;
    std::string daemon_message_;
};

}
