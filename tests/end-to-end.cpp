#include <print>

#include "drop-client.hpp"
#include "loopback-transport.hpp"
#include "macros/unwrap.hpp"
#include "memory-mailbox.hpp"
#include "test-util.hpp"

namespace {
using namespace std::chrono_literals;
using sdrop::test::Recorder;
using sdrop::test::wait_until;

struct Member {
    Recorder          events;
    sdrop::DropClient client;

    Member(sdrop::MailboxStore& store, sdrop::TransportFactory& factory, const std::string_view id, const std::string_view name)
        : client({
              .store             = &store,
              .transport_factory = &factory,
              .local_name        = std::string(name),
              .local_id          = std::string(id),
              .poll_interval     = 20ms,
          }) {
        client.add_peer_observer(&events);
        client.add_transfer_observer(&events);
    }

    ~Member() {
        client.disconnect();
    }
};

auto connected_to(const Member& member, const std::string_view peer) -> bool {
    return wait_until([&member, peer] {
        for(const auto& summary : member.client.peers()) {
            if(summary.id == peer) {
                return true;
            }
        }
        return false;
    });
}

// creator, joiner, one file, then the joiner leaves
auto room_scenario_test() -> bool {
    auto network = sdrop::test::LoopbackNetwork();
    auto store   = sdrop::MemoryMailbox([] { return std::string("r1"); });

    auto wire_lock = std::mutex();
    auto chunks    = std::vector<std::pair<uint64_t, size_t>>();
    auto announced = std::optional<uint64_t>();
    auto ends      = 0;

    auto alice = Member(store, network, "alice", "Alice");
    auto bob   = Member(store, network, "bob", "Bob");

    // alice sees bob's join, so her transport comes first
    network.tap = [&](const std::string_view from, const std::span<const std::byte> payload) {
        if(from != "t1") {
            return;
        }
        const auto message = sdrop::proto::parse(payload);
        if(!message) {
            return;
        }
        auto guard = std::lock_guard(wire_lock);
        if(const auto start = std::get_if<sdrop::proto::FileStart>(&*message)) {
            announced = start->size;
        } else if(const auto chunk = std::get_if<sdrop::proto::FileChunk>(&*message)) {
            chunks.emplace_back(chunk->seq, chunk->bytes.size());
        } else if(std::holds_alternative<sdrop::proto::FileEnd>(*message)) {
            ends += 1;
        }
    };

    unwrap(room, alice.client.create_room());
    ensure(room == "r1");
    ensure(alice.client.current_room() == "r1");
    ensure(bob.client.join_room("r1"));
    ensure(bob.client.current_room() == "r1");

    unwrap(members, store.read_room("r1"));
    ensure(members.info.creator_id == "alice" && members.info.creator_name == "Alice");
    ensure(members.peers.size() == 2 && members.peers[1].id == "bob" && members.peers[1].name == "Bob");

    ensure(connected_to(alice, "bob"));
    ensure(connected_to(bob, "alice"));
    ensure(alice.client.peers()[0].name == "Bob");
    ensure(bob.client.peers()[0].name == "Alice");
    ensure(alice.events.with([](const Recorder& r) { return r.connected.size() == 1 && r.connected[0].second == "Bob"; }));

    const auto content = sdrop::test::pattern_bytes(40000, 5);
    const auto source  = std::make_shared<sdrop::MemoryFileSource>("photo.jpg", content);
    unwrap(id, alice.client.send_file(source, "bob"));

    ensure(wait_until([&bob] { return bob.events.with([](const Recorder& r) { return r.completed.size() == 1; }); }));
    ensure(wait_until([&alice] { return alice.events.with([](const Recorder& r) { return r.completed.size() == 1; }); }));
    ensure(bob.events.with([&](const Recorder& r) {
        return r.received.at(id) == content && r.incoming[0].name == "photo.jpg" && r.incoming[0].mime_type == "image/jpeg";
    }));
    {
        auto guard = std::lock_guard(wire_lock);
        ensure(announced == 40000u);
        const auto expected = std::vector<std::pair<uint64_t, size_t>>{{0, 16384}, {1, 16384}, {2, 7232}};
        ensure(chunks == expected);
        ensure(ends == 1);
    }
    const auto sent = alice.client.transfers();
    ensure(sent.size() == 1 && sent[0].status == sdrop::TransferStatus::Completed && sent[0].direction == sdrop::Direction::Send);
    const auto got = bob.client.transfers();
    ensure(got.size() == 1 && got[0].status == sdrop::TransferStatus::Completed && got[0].id == id);

    // leaving is seen once by the other side
    bob.client.disconnect();
    ensure(bob.client.peers().empty());
    ensure(wait_until([&alice] { return alice.client.peers().empty(); }));
    std::this_thread::sleep_for(200ms);
    ensure(alice.events.with([](const Recorder& r) { return r.disconnected == std::vector<std::string>{"bob"}; }));
    ensure(bob.events.with([](const Recorder& r) { return r.disconnected == std::vector<std::string>{"alice"}; }));

    // a disconnected client stays out
    ensure(bob.client.join_room("r1").error() == sdrop::Error::AlreadyInRoom);
    ensure(bob.client.create_room().error() == sdrop::Error::AlreadyInRoom);
    ensure(bob.client.send_file(source, "alice").error() == sdrop::Error::ChannelNotReady);
    return true;
}

auto join_errors_test() -> bool {
    auto network = sdrop::test::LoopbackNetwork();
    auto store   = sdrop::MemoryMailbox();
    auto alice   = Member(store, network, "alice", "Alice");
    auto carol   = Member(store, network, "carol", "Carol");

    unwrap(room, alice.client.create_room());
    ensure(alice.client.create_room().error() == sdrop::Error::AlreadyInRoom);
    ensure(alice.client.join_room(room).error() == sdrop::Error::AlreadyInRoom);

    ensure(carol.client.join_room("Not An Id!").error() == sdrop::Error::InvalidId);
    ensure(carol.client.join_room("").error() == sdrop::Error::InvalidId);
    ensure(carol.client.join_room("nowhere").error() == sdrop::Error::RoomNotFound);
    ensure(carol.client.current_room().empty());

    // failed attempts leave the client free to join
    ensure(carol.client.join_room(room));
    ensure(carol.client.join_room(room).error() == sdrop::Error::AlreadyInRoom);
    ensure(connected_to(alice, "carol"));
    ensure(carol.client.send_file(std::make_shared<sdrop::MemoryFileSource>("a", sdrop::test::pattern_bytes(1)), "dave").error() == sdrop::Error::ChannelNotReady);
    return true;
}

// late joiners and renames
auto names_test() -> bool {
    auto network = sdrop::test::LoopbackNetwork();
    auto store   = sdrop::MemoryMailbox();
    auto alice   = Member(store, network, "alice", "Alice");
    auto bob     = Member(store, network, "bob", "Bob");
    auto carol   = Member(store, network, "carol", "Carol");

    ensure(alice.client.local_id() == "alice");
    unwrap(room, alice.client.create_room());
    ensure(bob.client.join_room(room));
    ensure(connected_to(alice, "bob"));

    carol.client.set_local_name("Caroline");
    ensure(carol.client.local_name() == "Caroline");
    ensure(carol.client.join_room(room));
    ensure(connected_to(alice, "carol"));
    // everyone before the join offers to the newcomer
    ensure(connected_to(bob, "carol"));
    ensure(connected_to(carol, "bob"));
    ensure(alice.events.with([](const Recorder& r) {
        for(const auto& [peer, name] : r.connected) {
            if(peer == "carol") {
                return name == "Caroline";
            }
        }
        return false;
    }));

    // a file from the newest member to the creator
    const auto content = sdrop::test::pattern_bytes(3000, 9);
    unwrap(id, carol.client.send_file(std::make_shared<sdrop::MemoryFileSource>("notes.md", content), "alice"));
    ensure(wait_until([&alice] { return alice.events.with([](const Recorder& r) { return r.completed.size() == 1; }); }));
    ensure(alice.events.with([&](const Recorder& r) { return r.received.at(id) == content && r.incoming[0].peer_id == "carol"; }));
    // nothing reached bob
    ensure(bob.events.with([](const Recorder& r) { return r.incoming.empty(); }));

    // a renamed peer is announced under its new name from then on
    alice.client.set_local_name("Alicia");
    ensure(alice.client.local_name() == "Alicia");
    auto dave = Member(store, network, "dave", "Dave");
    ensure(dave.client.join_room(room));
    ensure(connected_to(dave, "alice"));
    ensure(dave.events.with([](const Recorder& r) {
        for(const auto& [peer, name] : r.connected) {
            if(peer == "alice") {
                return name == "Alicia";
            }
        }
        return false;
    }));
    return true;
}

auto run() -> bool {
    ensure(room_scenario_test());
    ensure(join_errors_test());
    ensure(names_test());
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
