#include <algorithm>
#include <memory>

#include <json/json.h>

#include "macros/logger.hpp"
#include "signal-message.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_WARN(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_signal");
}

namespace sdrop {
namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

auto string_member(const Json::Value& object, const char* const key) -> std::optional<std::string> {
    const auto& value = object[key];
    ensure(value.isString(), "member {} is not a string", key);
    return value.asString();
}

auto parse_payload(const std::string_view type, const Json::Value& data) -> std::optional<SignalPayload> {
    if(type == "join") {
        return signal::Join{};
    } else if(type == "leave") {
        return signal::Leave{};
    } else if(type == "offer") {
        ensure(data.isObject());
        unwrap_mut(sdp, string_member(data, "sdp"));
        return signal::Offer{std::move(sdp)};
    } else if(type == "answer") {
        ensure(data.isObject());
        unwrap_mut(sdp, string_member(data, "sdp"));
        return signal::Answer{std::move(sdp)};
    } else if(type == "ice-candidate") {
        ensure(data.isObject());
        unwrap_mut(candidate, string_member(data, "candidate"));
        return signal::IceCandidate{std::move(candidate)};
    }
    bail("unknown message type {}", type);
}
} // namespace

auto SignalMessage::is_addressed_to(const std::string_view peer_id) const -> bool {
    return to == peer_id || to == broadcast_id;
}

auto SignalMessage::was_processed_by(const std::string_view peer_id) const -> bool {
    return std::ranges::find(processed_by, peer_id) != processed_by.end();
}

auto type_name(const SignalPayload& payload) -> std::string_view {
    return std::visit(Overloaded{
                          [](const signal::Join&) { return std::string_view("join"); },
                          [](const signal::Leave&) { return std::string_view("leave"); },
                          [](const signal::Offer&) { return std::string_view("offer"); },
                          [](const signal::Answer&) { return std::string_view("answer"); },
                          [](const signal::IceCandidate&) { return std::string_view("ice-candidate"); },
                      },
                      payload);
}

auto encode(const SignalMessage& message) -> std::string {
    auto data = Json::Value(Json::objectValue);
    std::visit(Overloaded{
                   [](const signal::Join&) {},
                   [](const signal::Leave&) {},
                   [&data](const signal::Offer& o) { data["sdp"] = o.sdp; },
                   [&data](const signal::Answer& a) { data["sdp"] = a.sdp; },
                   [&data](const signal::IceCandidate& c) { data["candidate"] = c.candidate; },
               },
               message.payload);

    auto root         = Json::Value(Json::objectValue);
    root["type"]      = std::string(type_name(message.payload));
    root["from"]      = message.from;
    root["to"]        = message.to;
    root["data"]      = std::move(data);
    root["timestamp"] = Json::Int64(message.timestamp);
    if(message.from_name) {
        root["fromName"] = *message.from_name;
    }

    auto builder            = Json::StreamWriterBuilder();
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

auto decode(const LogEntry& entry) -> std::optional<SignalMessage> {
    auto root   = Json::Value();
    auto errors = std::string();
    {
        auto       builder = Json::CharReaderBuilder();
        const auto reader  = std::unique_ptr<Json::CharReader>(builder.newCharReader());
        const auto begin   = entry.body.data();
        const auto end     = begin + entry.body.size();
        // the reader throws on nesting beyond its stack limit
        try {
            ensure(reader->parse(begin, end, &root, &errors), "seq={} is not json: {}", entry.seq, errors);
        } catch(const Json::Exception& e) {
            bail("seq={} is not json: {}", entry.seq, e.what());
        }
    }
    ensure(root.isObject(), "seq={} is not an object", entry.seq);

    unwrap(type, string_member(root, "type"));
    unwrap_mut(from, string_member(root, "from"));
    unwrap_mut(to, string_member(root, "to"));
    // asInt64 throws on anything outside int64
    ensure(root["timestamp"].isInt64(), "seq={} has no valid timestamp", entry.seq);
    unwrap_mut(payload, parse_payload(type, root["data"]));

    auto message = SignalMessage{
        .payload      = std::move(payload),
        .from         = std::move(from),
        .to           = std::move(to),
        .from_name    = std::nullopt,
        .timestamp    = root["timestamp"].asInt64(),
        .seq          = entry.seq,
        .processed_by = entry.processed_by,
    };
    if(const auto& name = root["fromName"]; name.isString()) {
        message.from_name = name.asString();
    }
    return message;
}
} // namespace sdrop
