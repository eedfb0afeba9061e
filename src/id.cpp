#include "id.hpp"
#include "util.hpp"

#include <random>
#include <stdexcept>

namespace linkagent {

namespace {

std::string random_base62(size_t length) {
    static const char* chars =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 61);

    std::string out;
    out.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(chars[dist(gen)]);
    }
    return out;
}

std::string checked_given(IdPrefix prefix, const std::string& id) {
    const std::string expected = id_prefix_str(prefix);
    if (id.compare(0, expected.size(), expected) != 0) {
        throw std::invalid_argument("ID " + id + " does not start with " + expected);
    }
    return id;
}

} // namespace

const char* id_prefix_str(IdPrefix prefix) {
    switch (prefix) {
        case IdPrefix::Session:    return "ses";
        case IdPrefix::Message:    return "msg";
        case IdPrefix::Permission: return "per";
        case IdPrefix::User:       return "usr";
        case IdPrefix::Part:       return "prt";
    }
    return "unk";
}

IdGenerator& IdGenerator::instance() {
    static IdGenerator generator;
    return generator;
}

uint64_t IdGenerator::next_value(uint64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timestamp_ms != last_timestamp_) {
        last_timestamp_ = timestamp_ms;
        counter_ = 1;
    } else {
        ++counter_;
    }
    return timestamp_ms * 0x1000 + counter_;
}

std::string IdGenerator::create(IdPrefix prefix, bool descending,
                                std::optional<uint64_t> timestamp_ms) {
    uint64_t value = next_value(timestamp_ms.value_or(epoch_millis()));
    if (descending) {
        value = ~value;
    }

    // Low 48 bits, big-endian, two hex digits per byte
    static const char* hex = "0123456789abcdef";
    std::string time_hex;
    time_hex.reserve(kTimeHexLength);
    for (int i = 0; i < 6; ++i) {
        auto byte = static_cast<unsigned>((value >> (40 - 8 * i)) & 0xff);
        time_hex.push_back(hex[byte >> 4]);
        time_hex.push_back(hex[byte & 0x0f]);
    }

    return std::string(id_prefix_str(prefix)) + "_" + time_hex + random_base62(kRandomLength);
}

std::string IdGenerator::ascending(IdPrefix prefix, const std::optional<std::string>& given) {
    if (given) return checked_given(prefix, *given);
    return create(prefix, false);
}

std::string IdGenerator::descending(IdPrefix prefix, const std::optional<std::string>& given) {
    if (given) return checked_given(prefix, *given);
    return create(prefix, true);
}

std::string ascending_id(IdPrefix prefix, const std::optional<std::string>& given) {
    return IdGenerator::instance().ascending(prefix, given);
}

std::string descending_id(IdPrefix prefix, const std::optional<std::string>& given) {
    return IdGenerator::instance().descending(prefix, given);
}

} // namespace linkagent
