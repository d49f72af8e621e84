#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ondd::ipc {

constexpr char LINE_TERMINATOR = '\n';
constexpr char RESPONSE_TERMINATOR = '\0';

// One block of "key: value" lines. Insertion order is preserved and keys are
// unique.
class Stanza {
public:
    using Field = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Field>::const_iterator;

    Stanza() = default;
    // Throws InvalidArgumentError on a repeated key.
    Stanza(std::initializer_list<Field> fields);

    // Returns false and leaves the stanza untouched if the key already exists.
    bool add(std::string key, std::string value);

    std::optional<std::string> get(const std::string& key) const;
    bool contains(const std::string& key) const;

    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }
    const_iterator begin() const { return fields_.begin(); }
    const_iterator end() const { return fields_.end(); }

    bool operator==(const Stanza& other) const = default;

private:
    std::vector<Field> fields_;
};

struct Command {
    std::string name;
    std::vector<std::string> arguments;

    Command() = default;
    Command(std::string command_name, std::vector<std::string> args = {})
        : name(std::move(command_name)), arguments(std::move(args)) {}
};

class StanzaCodec {
public:
    // Throws InvalidArgumentError if the name or an argument is empty or holds
    // whitespace, the line terminator or the response terminator.
    static std::string encode(const Command& command);

    // Lines may end in CRLF. Keys are stripped of surrounding blanks, values of
    // leading blanks.
    // Throws MalformedResponseError on a line without a ':' separator, an
    // empty key or a key repeated within one stanza.
    static std::vector<Stanza> decode(const std::string& response, const std::string& command = "");

    static std::string format(const std::vector<Stanza>& stanzas);
};

}
