/**
 * @file   types.hpp
 * @brief  Value types exchanged between a provider, the bridge endpoint and
 *         the caller: timestamps, message records, message batches, topic
 *         requests and the initialization result.
 *
 * Raw records are views (offset + length) into a shared physical buffer.
 * Several records may view the same buffer; buffer identity is pointer
 * identity of the ByteBuffer.
 *
 * @date   2026-10-19
 */

#ifndef PROVIDER_BRIDGE_TYPES_HPP
#define PROVIDER_BRIDGE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace provider_bridge {

/**
 * @struct Time
 * @brief  Seconds + nanoseconds timestamp (ROS-style).
 */
struct Time {
    std::uint32_t sec{0};   ///< Whole seconds
    std::uint32_t nsec{0};  ///< Nanoseconds, expected < 1e9

    static constexpr std::uint64_t NSEC_PER_SEC = 1000000000ULL;

    static Time fromNanoseconds(std::uint64_t ns) noexcept {
        return Time{static_cast<std::uint32_t>(ns / NSEC_PER_SEC),
                    static_cast<std::uint32_t>(ns % NSEC_PER_SEC)};
    }

    std::uint64_t toNanoseconds() const noexcept {
        return static_cast<std::uint64_t>(sec) * NSEC_PER_SEC + nsec;
    }
};

inline bool operator==(const Time& a, const Time& b) noexcept {
    return a.sec == b.sec && a.nsec == b.nsec;
}
inline bool operator!=(const Time& a, const Time& b) noexcept { return !(a == b); }
inline bool operator<(const Time& a, const Time& b) noexcept {
    return a.sec != b.sec ? a.sec < b.sec : a.nsec < b.nsec;
}
inline bool operator>(const Time& a, const Time& b) noexcept  { return b < a; }
inline bool operator<=(const Time& a, const Time& b) noexcept { return !(b < a); }
inline bool operator>=(const Time& a, const Time& b) noexcept { return !(a < b); }

/// Physical byte buffer. Identity is the pointer, not the contents.
using ByteBuffer = std::shared_ptr<std::vector<std::uint8_t>>;

/**
 * @struct RawMessage
 * @brief  An unparsed, byte-exact record: a view into a physical buffer
 *         plus its topic and receive time.
 */
struct RawMessage {
    std::string topic;
    Time        receiveTime;
    ByteBuffer  buffer;         ///< Physical buffer (may be shared by records)
    std::size_t offset{0};      ///< First byte of the record inside buffer
    std::size_t length{0};      ///< Record length in bytes

    /** @return Pointer to the first byte of the record, or nullptr. */
    const std::uint8_t* data() const noexcept {
        return buffer ? buffer->data() + offset : nullptr;
    }

    /** @return True when the view lies entirely inside its buffer. */
    bool isValidView() const noexcept {
        return buffer && offset <= buffer->size() && length <= buffer->size() - offset;
    }
};

/**
 * @struct ParsedMessage
 * @brief  A record already decoded into a JSON object.
 */
struct ParsedMessage {
    std::string    topic;
    Time           receiveTime;
    nlohmann::json message;
};

/**
 * @struct ObjectMessage
 * @brief  A record decoded into a lazily-read in-memory object.
 */
struct ObjectMessage {
    std::string                 topic;
    Time                        receiveTime;
    std::string                 datatype;
    std::shared_ptr<const void> object;
};

/**
 * @struct MessageBatch
 * @brief  Result of Provider::getMessages().
 *
 * A field is present when its optional is engaged, even if the vector is
 * empty. Only rawMessages may cross the bridge.
 */
struct MessageBatch {
    std::optional<std::vector<RawMessage>>    rawMessages;
    std::optional<std::vector<ParsedMessage>> parsedMessages;
    std::optional<std::vector<ObjectMessage>> objects;
};

/**
 * @struct GetMessagesTopics
 * @brief  Topics requested per representation.
 */
struct GetMessagesTopics {
    std::optional<std::vector<std::string>> rawMessages;
    std::optional<std::vector<std::string>> parsedMessages;
    std::optional<std::vector<std::string>> objects;
};

/**
 * @struct Topic
 * @brief  A topic name with its message datatype.
 */
struct Topic {
    std::string name;
    std::string datatype;
};

inline bool operator==(const Topic& a, const Topic& b) noexcept {
    return a.name == b.name && a.datatype == b.datatype;
}

/**
 * @struct InitializationResult
 * @brief  Metadata a provider resolves its initialize() with.
 */
struct InitializationResult {
    Time                     start;
    Time                     end;
    std::vector<Topic>       topics;
    nlohmann::json           messageDefinitions = nlohmann::json::object(); ///< datatype -> definition
    bool                     providesParsedMessages{false};
    std::vector<std::string> problems;
};

/**
 * @struct FractionRange
 * @brief  A fully loaded interval, as fractions [0, 1] of the time range.
 */
struct FractionRange {
    double start{0.0};
    double end{0.0};
};

/**
 * @struct Progress
 * @brief  Loading progress reported through the progress callback.
 */
struct Progress {
    std::vector<FractionRange> fullyLoadedFractionRanges;
};

/// Provider metadata event payload; a JSON object with a "type" field.
using ProviderMetadata = nlohmann::json;

/// Upstream notification payload; a JSON object with a "type" field.
using NotifyPlayerManagerData = nlohmann::json;

} // namespace provider_bridge

// ----------------------------------------------------------------------------
// nlohmann::json ADL serializers
// ----------------------------------------------------------------------------
namespace nlohmann {

template <>
struct adl_serializer<provider_bridge::Time> {
    static void to_json(json& j, provider_bridge::Time const& t) {
        j = json{{"sec", t.sec}, {"nsec", t.nsec}};
    }
    /// @throws std::out_of_range for fields that are not integers in range
    static void from_json(json const& j, provider_bridge::Time& t) {
        t.sec  = field(j, "sec",  UINT32_MAX);
        t.nsec = field(j, "nsec", provider_bridge::Time::NSEC_PER_SEC - 1);
    }

private:
    static std::uint32_t field(json const& j, const char* key, std::uint64_t max) {
        json const& v = j.at(key);
        if (!v.is_number_integer())
            throw std::out_of_range(std::string("Time field '") + key + "' is not an integer");
        const bool inRange = v.is_number_unsigned()
            ? v.get<std::uint64_t>() <= max
            : v.get<std::int64_t>() >= 0 && static_cast<std::uint64_t>(v.get<std::int64_t>()) <= max;
        if (!inRange)
            throw std::out_of_range(std::string("Time field '") + key + "' out of range: " + v.dump());
        return static_cast<std::uint32_t>(v.get<std::uint64_t>());
    }
};

template <>
struct adl_serializer<provider_bridge::Topic> {
    static void to_json(json& j, provider_bridge::Topic const& t) {
        j = json{{"name", t.name}, {"datatype", t.datatype}};
    }
    static void from_json(json const& j, provider_bridge::Topic& t) {
        j.at("name").get_to(t.name);
        j.at("datatype").get_to(t.datatype);
    }
};

template <>
struct adl_serializer<provider_bridge::InitializationResult> {
    static void to_json(json& j, provider_bridge::InitializationResult const& r) {
        j = json{
            {"start",                  r.start},
            {"end",                    r.end},
            {"topics",                 r.topics},
            {"messageDefinitions",     r.messageDefinitions},
            {"providesParsedMessages", r.providesParsedMessages}
        };
        if (!r.problems.empty()) j["problems"] = r.problems;
    }
    static void from_json(json const& j, provider_bridge::InitializationResult& r) {
        j.at("start").get_to(r.start);
        j.at("end").get_to(r.end);
        j.at("topics").get_to(r.topics);
        if (j.contains("messageDefinitions"))     r.messageDefinitions = j.at("messageDefinitions");
        if (j.contains("providesParsedMessages")) j.at("providesParsedMessages").get_to(r.providesParsedMessages);
        if (j.contains("problems"))               j.at("problems").get_to(r.problems);
    }
};

template <>
struct adl_serializer<provider_bridge::Progress> {
    static void to_json(json& j, provider_bridge::Progress const& p) {
        json ranges = json::array();
        for (auto const& r : p.fullyLoadedFractionRanges)
            ranges.push_back({{"start", r.start}, {"end", r.end}});
        j = json{{"fullyLoadedFractionRanges", std::move(ranges)}};
    }
    static void from_json(json const& j, provider_bridge::Progress& p) {
        p.fullyLoadedFractionRanges.clear();
        if (!j.contains("fullyLoadedFractionRanges")) return;
        for (auto const& r : j.at("fullyLoadedFractionRanges"))
            p.fullyLoadedFractionRanges.push_back({r.at("start").get<double>(),
                                                   r.at("end").get<double>()});
    }
};

} // namespace nlohmann

#endif // PROVIDER_BRIDGE_TYPES_HPP
