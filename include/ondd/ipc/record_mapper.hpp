#pragma once

#include "ondd/ipc/errors.hpp"
#include "ondd/ipc/stanza.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace ondd::ipc {

namespace coerce {

// Each coercion returns std::nullopt when the raw value does not fit.
std::optional<std::int64_t> to_int(const std::string& raw);
std::optional<std::uint64_t> to_uint(const std::string& raw);
// Integer percentage, 0..100 inclusive.
std::optional<int> to_percent(const std::string& raw);
std::optional<double> to_double(const std::string& raw);
std::optional<bool> to_bool(const std::string& raw);
std::optional<std::chrono::system_clock::time_point> to_timestamp(const std::string& raw);
std::optional<std::string> to_string(const std::string& raw);

}

// Declarative field table mapping one stanza to one Record. Keys present in
// the stanza but absent from the table are ignored.
template<typename Record>
class RecordSchema {
public:
    explicit RecordSchema(std::string record_name)
        : record_name_(std::move(record_name)) {}

    template<typename Member, typename Value>
    RecordSchema& required(std::string field, std::string key, Member Record::*member,
                           std::optional<Value> (*coercion)(const std::string&)) {
        fields_.push_back(make_field(std::move(field), std::move(key), member, coercion, true,
                                     std::optional<Member>()));
        return *this;
    }

    template<typename Member, typename Value>
    RecordSchema& optional(std::string field, std::string key, Member Record::*member,
                           std::optional<Value> (*coercion)(const std::string&),
                           std::type_identity_t<Member> default_value = Member()) {
        fields_.push_back(make_field(std::move(field), std::move(key), member, coercion, false,
                                     std::optional<Member>(std::move(default_value))));
        return *this;
    }

    // Runs after all fields are assigned, for values derived from other fields.
    RecordSchema& finalize(std::function<void(Record&, const Stanza&)> finalizer) {
        finalizer_ = std::move(finalizer);
        return *this;
    }

    Record map(const Stanza& stanza) const {
        Record record{};
        for (const auto& apply : fields_) {
            apply(record, stanza);
        }
        if (finalizer_) {
            finalizer_(record, stanza);
        }
        return record;
    }

    std::vector<Record> map_all(const std::vector<Stanza>& stanzas) const {
        std::vector<Record> records;
        records.reserve(stanzas.size());
        for (const auto& stanza : stanzas) {
            records.push_back(map(stanza));
        }
        return records;
    }

    const std::string& name() const { return record_name_; }

private:
    using Field = std::function<void(Record&, const Stanza&)>;

    template<typename Member, typename Value>
    Field make_field(std::string field, std::string key, Member Record::*member,
                     std::optional<Value> (*coercion)(const std::string&), bool is_required,
                     std::optional<Member> default_value) const {
        auto record_name = record_name_;
        return [record_name, field, key, member, coercion, is_required, default_value](
                   Record& record, const Stanza& stanza) {
            auto raw = stanza.get(key);
            if (!raw) {
                if (is_required) {
                    throw MissingFieldError(record_name, field, key);
                }
                record.*member = *default_value;
                return;
            }

            auto value = coercion(*raw);
            if (!value) {
                throw FieldTypeError(record_name, field, *raw);
            }
            if constexpr (std::is_integral_v<Member> && std::is_integral_v<Value> &&
                          !std::is_same_v<Member, bool> && !std::is_same_v<Value, bool>) {
                if (!std::in_range<Member>(*value)) {
                    throw FieldTypeError(record_name, field, *raw);
                }
            }
            record.*member = static_cast<Member>(*value);
        };
    }

    std::string record_name_;
    std::vector<Field> fields_;
    std::function<void(Record&, const Stanza&)> finalizer_;
};

}
