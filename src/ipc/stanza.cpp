#include "ondd/ipc/stanza.hpp"
#include "ondd/ipc/errors.hpp"
#include <algorithm>
#include <sstream>

namespace ondd::ipc {

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

void validate_token(const std::string& token, const std::string& what, const std::string& command) {
    if (token.empty()) {
        throw InvalidArgumentError(what + " must not be empty", command);
    }

    for (char c : token) {
        if (c == LINE_TERMINATOR || c == '\r' || c == RESPONSE_TERMINATOR) {
            throw InvalidArgumentError(what + " contains a line or response terminator", command);
        }
        if (c == ' ' || c == '\t' || c == '\v' || c == '\f') {
            throw InvalidArgumentError(what + " '" + token + "' contains whitespace", command);
        }
    }
}

}

Stanza::Stanza(std::initializer_list<Field> fields) {
    for (const auto& [key, value] : fields) {
        if (!add(key, value)) {
            throw InvalidArgumentError("duplicate key '" + key + "' in stanza");
        }
    }
}

bool Stanza::add(std::string key, std::string value) {
    if (contains(key)) {
        return false;
    }
    fields_.emplace_back(std::move(key), std::move(value));
    return true;
}

std::optional<std::string> Stanza::get(const std::string& key) const {
    for (const auto& [k, v] : fields_) {
        if (k == key) {
            return v;
        }
    }
    return std::nullopt;
}

bool Stanza::contains(const std::string& key) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&key](const Field& field) { return field.first == key; });
}

std::string StanzaCodec::encode(const Command& command) {
    validate_token(command.name, "command name", command.name);

    std::string line = command.name;
    for (const auto& argument : command.arguments) {
        validate_token(argument, "argument", command.name);
        line += ' ';
        line += argument;
    }
    line += LINE_TERMINATOR;
    return line;
}

std::vector<Stanza> StanzaCodec::decode(const std::string& response, const std::string& command) {
    std::vector<Stanza> stanzas;
    Stanza current;
    std::size_t line_number = 0;
    std::size_t pos = 0;

    while (pos < response.size()) {
        auto eol = response.find(LINE_TERMINATOR, pos);
        if (eol == std::string::npos) {
            eol = response.size();
        }

        std::string line = response.substr(pos, eol - pos);
        pos = eol + 1;
        ++line_number;

        // CRLF line endings
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (is_blank(line)) {
            if (!current.empty()) {
                stanzas.push_back(std::move(current));
                current = Stanza();
            }
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string::npos) {
            throw MalformedResponseError("line has no key separator", command, line_number, line);
        }

        auto key_start = line.find_first_not_of(" \t");
        if (key_start >= colon) {
            throw MalformedResponseError("line has an empty key", command, line_number, line);
        }

        auto key_end = line.find_last_not_of(" \t", colon - 1);
        std::string key = line.substr(key_start, key_end - key_start + 1);
        auto value_start = line.find_first_not_of(" \t", colon + 1);
        std::string value = value_start == std::string::npos ? "" : line.substr(value_start);

        if (!current.add(key, std::move(value))) {
            throw MalformedResponseError("duplicate key '" + key + "' in stanza", command,
                                         line_number, line);
        }
    }

    if (!current.empty()) {
        stanzas.push_back(std::move(current));
    }

    return stanzas;
}

std::string StanzaCodec::format(const std::vector<Stanza>& stanzas) {
    std::ostringstream oss;
    for (const auto& stanza : stanzas) {
        for (const auto& [key, value] : stanza) {
            oss << key << ": " << value << LINE_TERMINATOR;
        }
        oss << LINE_TERMINATOR;
    }
    return oss.str();
}

}
