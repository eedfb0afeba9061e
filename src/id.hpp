#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace linkagent {

enum class IdPrefix {
    Session,
    Message,
    Permission,
    User,
    Part
};

// "ses", "msg", "per", "usr", "prt"
const char* id_prefix_str(IdPrefix prefix);

// Monotonic, time-ordered identifiers: prefix_ + 12 hex + 14 base62.
// Ascending ids of one prefix sort lexicographically in creation order;
// descending ids sort in reverse. All methods are thread-safe.
class IdGenerator {
public:
    static IdGenerator& instance();

    // timestamp_ms defaults to the current wall clock
    std::string create(IdPrefix prefix, bool descending,
                       std::optional<uint64_t> timestamp_ms = std::nullopt);

    // Return `given` unchanged if present (throws std::invalid_argument on a
    // prefix mismatch), otherwise mint a fresh id.
    std::string ascending(IdPrefix prefix, const std::optional<std::string>& given = std::nullopt);
    std::string descending(IdPrefix prefix, const std::optional<std::string>& given = std::nullopt);

    static constexpr size_t kTimeHexLength = 12;
    static constexpr size_t kRandomLength = 14;

private:
    IdGenerator() = default;

    uint64_t next_value(uint64_t timestamp_ms);

    std::mutex mutex_;
    uint64_t last_timestamp_ = 0;
    uint32_t counter_ = 0;
};

// Shorthands over IdGenerator::instance()
std::string ascending_id(IdPrefix prefix, const std::optional<std::string>& given = std::nullopt);
std::string descending_id(IdPrefix prefix, const std::optional<std::string>& given = std::nullopt);

} // namespace linkagent
