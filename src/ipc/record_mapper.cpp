#include "ondd/ipc/record_mapper.hpp"
#include "ondd/core/utils.hpp"
#include <charconv>

namespace ondd::ipc::coerce {

namespace {

template<typename T>
std::optional<T> parse_number(const std::string& raw) {
    if (raw.empty()) {
        return std::nullopt;
    }

    T value{};
    const char* first = raw.data();
    const char* last = raw.data() + raw.size();
    if (*first == '+') {
        ++first;
        if (first != last && *first == '-') {
            return std::nullopt;
        }
    }

    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}

std::optional<std::int64_t> to_int(const std::string& raw) {
    return parse_number<std::int64_t>(raw);
}

std::optional<std::uint64_t> to_uint(const std::string& raw) {
    return parse_number<std::uint64_t>(raw);
}

std::optional<int> to_percent(const std::string& raw) {
    auto value = parse_number<int>(raw);
    if (!value || *value < 0 || *value > 100) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> to_double(const std::string& raw) {
    return parse_number<double>(raw);
}

std::optional<bool> to_bool(const std::string& raw) {
    auto lower = core::utils::StringUtils::to_lower(raw);

    if (lower == "yes" || lower == "true" || lower == "1" || lower == "on") return true;
    if (lower == "no" || lower == "false" || lower == "0" || lower == "off") return false;
    return std::nullopt;
}

std::optional<std::chrono::system_clock::time_point> to_timestamp(const std::string& raw) {
    auto seconds = parse_number<std::int64_t>(raw);
    if (!seconds || *seconds < 0) {
        return std::nullopt;
    }
    return std::chrono::system_clock::time_point(std::chrono::seconds(*seconds));
}

std::optional<std::string> to_string(const std::string& raw) {
    return raw;
}

}
