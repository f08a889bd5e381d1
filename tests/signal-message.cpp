#include <array>
#include <print>
#include <string>

#include <json/json.h>

#include "macros/unwrap.hpp"
#include "signal-message.hpp"

namespace {
auto entry(const std::string_view body, const uint64_t seq = 7) -> sdrop::LogEntry {
    return sdrop::LogEntry{.seq = seq, .body = std::string(body), .processed_by = {"someone"}};
}

auto parse(const std::string_view text) -> std::optional<Json::Value> {
    auto       root    = Json::Value();
    auto       errors  = std::string();
    auto       builder = Json::CharReaderBuilder();
    const auto reader  = std::unique_ptr<Json::CharReader>(builder.newCharReader());
    ensure(reader->parse(text.data(), text.data() + text.size(), &root, &errors), "{}", errors);
    return root;
}

auto wire_format_test() -> bool {
    const auto body = sdrop::encode(sdrop::SignalMessage{
        .payload   = sdrop::signal::Offer{"v=0 offer"},
        .from      = "alice",
        .to        = "bob",
        .from_name = "Alice",
        .timestamp = 1700000000123,
    });
    unwrap(root, parse(body));
    ensure(root["type"].asString() == "offer");
    ensure(root["from"].asString() == "alice");
    ensure(root["to"].asString() == "bob");
    ensure(root["fromName"].asString() == "Alice");
    ensure(root["timestamp"].asInt64() == 1700000000123);
    ensure(root["data"]["sdp"].asString() == "v=0 offer");

    // no name, no member
    const auto anonymous = sdrop::encode(sdrop::SignalMessage{
        .payload = sdrop::signal::Join{},
        .from    = "carol",
        .to      = std::string(sdrop::broadcast_id),
    });
    unwrap(root2, parse(anonymous));
    ensure(!root2.isMember("fromName"));
    ensure(root2["to"].asString() == "broadcast");
    ensure(root2["type"].asString() == "join");
    return true;
}

auto decode_test() -> bool {
    {
        const auto body = sdrop::encode(sdrop::SignalMessage{
            .payload   = sdrop::signal::IceCandidate{"candidate:1 1 UDP 2122252543 192.0.2.1 5000 typ host"},
            .from      = "bob",
            .to        = "alice",
            .from_name = "Bob",
            .timestamp = 42,
        });
        unwrap(message, sdrop::decode(entry(body)));
        ensure(message.seq == 7);
        ensure(message.processed_by == std::vector<std::string>{"someone"});
        ensure(message.from == "bob" && message.to == "alice");
        ensure(message.from_name == "Bob");
        ensure(message.timestamp == 42);
        unwrap(candidate, std::get_if<sdrop::signal::IceCandidate>(&message.payload));
        ensure(candidate.candidate.starts_with("candidate:1"));
        ensure(sdrop::type_name(message.payload) == "ice-candidate");
    }
    {
        // end of candidates
        unwrap(message, sdrop::decode(entry(R"({"type":"ice-candidate","from":"a","to":"b","timestamp":1,"data":{"candidate":""}})")));
        unwrap(candidate, std::get_if<sdrop::signal::IceCandidate>(&message.payload));
        ensure(candidate.candidate.empty());
    }
    {
        unwrap(message, sdrop::decode(entry(R"({"type":"leave","from":"a","to":"broadcast","timestamp":1,"data":null})")));
        ensure(std::holds_alternative<sdrop::signal::Leave>(message.payload));
        ensure(!message.from_name);
        ensure(message.is_addressed_to("anyone"));
    }
    return true;
}

auto addressing_test() -> bool {
    auto message = sdrop::SignalMessage{.payload = sdrop::signal::Answer{"x"}, .from = "a", .to = "b", .processed_by = {"b"}};
    ensure(message.is_addressed_to("b"));
    ensure(!message.is_addressed_to("c"));
    ensure(message.was_processed_by("b"));
    ensure(!message.was_processed_by("a"));
    return true;
}

auto malformed_test() -> bool {
    const auto bad = std::array{
        "not json",
        "[1,2,3]",
        R"({"from":"a","to":"b","timestamp":1,"data":{}})",                                  // no type
        R"({"type":"wave","from":"a","to":"b","timestamp":1,"data":{}})",                    // unknown type
        R"({"type":"join","to":"b","timestamp":1,"data":{}})",                               // no sender
        R"({"type":"join","from":"a","to":"b","data":{}})",                                  // no timestamp
        R"({"type":"join","from":"a","to":"b","timestamp":"noon","data":{}})",               // bad timestamp
        R"({"type":"offer","from":"a","to":"b","timestamp":1,"data":{}})",                   // no sdp
        R"({"type":"offer","from":"a","to":"b","timestamp":1,"data":{"sdp":5}})",            // sdp not a string
        R"({"type":"answer","from":"a","to":"b","timestamp":1,"data":"sdp"})",               // data not an object
        R"({"type":"ice-candidate","from":"a","to":"b","timestamp":1,"data":{"sdp":"x"}})",  // shape of another type
        R"({"type":"offer","from":"a","to":7,"timestamp":1,"data":{"sdp":"x"}})",            // bad recipient
        R"({"type":"join","from":"a","to":"b","timestamp":1e30,"data":{}})",                 // timestamp beyond int64
        R"({"type":"join","from":"a","to":"b","timestamp":18446744073709551615,"data":{}})", // unsigned beyond int64
        R"({"type":"join","from":"a","to":"b","timestamp":-1e300,"data":{}})",
        R"({"type":"join","from":"a","to":"b","timestamp":1.5,"data":{}})",
    };
    for(const auto body : bad) {
        ensure(!sdrop::decode(entry(body)), "accepted {}", body);
    }

    // nesting deeper than the json reader's stack limit
    const auto deep = std::string(5000, '[') + std::string(5000, ']');
    ensure(!sdrop::decode(entry(deep)));

    // integral values in range are still accepted, whatever their spelling
    unwrap(message, sdrop::decode(entry(R"({"type":"join","from":"a","to":"b","timestamp":9223372036854775807,"data":{}})")));
    ensure(message.timestamp == 9223372036854775807);
    return true;
}

auto run() -> bool {
    ensure(wire_format_test());
    ensure(decode_test());
    ensure(addressing_test());
    ensure(malformed_test());
    return true;
}
} // namespace

auto main() -> int {
    if(run()) {
        std::println("pass");
        return 0;
    } else {
        return -1;
    }
}
