#include <algorithm>
#include <filesystem>
#include <fstream>
#include <print>
#include <thread>

#include "event-manager.hpp"
#include "file-source.hpp"
#include "ids.hpp"
#include "macros/unwrap.hpp"
#include "room-link.hpp"
#include "test-util.hpp"
#include "transport.hpp"
#include "util/cleaner.hpp"

namespace {
using namespace std::chrono_literals;

auto ids_test() -> bool {
    for(auto i = 0; i < 100; i += 1) {
        const auto id = sdrop::generate_id();
        ensure(id.size() == 9);
        ensure(sdrop::is_valid_id(id), "generated {}", id);
    }
    ensure(sdrop::generate_id(20).size() == 20);
    ensure(sdrop::generate_id() != sdrop::generate_id());

    ensure(sdrop::is_valid_id("r1"));
    ensure(sdrop::is_valid_id("a-b_c"));
    ensure(sdrop::is_valid_id(std::string(64, 'x')));
    ensure(!sdrop::is_valid_id(std::string(65, 'x')));
    ensure(!sdrop::is_valid_id(""));
    ensure(!sdrop::is_valid_id("ABC"));
    ensure(!sdrop::is_valid_id("../etc"));
    ensure(!sdrop::is_valid_id("a b"));
    ensure(sdrop::now_millis() > 1600000000000);
    return true;
}

auto room_link_test() -> bool {
    ensure(sdrop::make_room_link("https://drop.example", "abc123") == "https://drop.example?room=abc123");
    ensure(sdrop::make_room_link("https://drop.example/?lang=en", "abc123") == "https://drop.example/?lang=en&room=abc123");
    ensure(sdrop::make_room_link("/srv/mailbox", "r1") == "/srv/mailbox?room=r1");

    ensure(sdrop::parse_room_link("abc123") == "abc123");
    ensure(sdrop::parse_room_link("  abc123\n") == "abc123");
    ensure(sdrop::parse_room_link("https://drop.example?room=abc123") == "abc123");
    ensure(sdrop::parse_room_link("https://drop.example/?lang=en&room=x9#top") == "x9");
    ensure(sdrop::parse_room_link("https://drop.example/?room=x9&lang=en") == "x9");
    ensure(!sdrop::parse_room_link("https://drop.example/?lang=en"));
    ensure(!sdrop::parse_room_link("https://drop.example/?room=Bad!"));
    ensure(!sdrop::parse_room_link("https://drop.example/"));
    ensure(!sdrop::parse_room_link(""));

    const auto link = sdrop::make_room_link("https://drop.example", "k2j4");
    ensure(sdrop::parse_room_link(link) == "k2j4");
    return true;
}

auto format_test() -> bool {
    ensure(sdrop::format_size(0) == "0 Bytes");
    ensure(sdrop::format_size(1) == "1 Bytes");
    ensure(sdrop::format_size(1023) == "1023 Bytes");
    ensure(sdrop::format_size(1024) == "1 KB");
    ensure(sdrop::format_size(1536) == "1.5 KB");
    ensure(sdrop::format_size(40000) == "39.06 KB");
    ensure(sdrop::format_size(uint64_t(5) << 20) == "5 MB");
    ensure(sdrop::format_size(uint64_t(3) << 40) == "3072 GB");

    ensure(sdrop::guess_mime_type("notes.txt") == "text/plain");
    ensure(sdrop::guess_mime_type("PHOTO.JPG") == "image/jpeg");
    ensure(sdrop::guess_mime_type("archive.tar.gz") == "application/gzip");
    ensure(sdrop::guess_mime_type("Makefile") == "application/octet-stream");
    ensure(sdrop::guess_mime_type("data.unknownext") == "application/octet-stream");
    return true;
}

auto file_source_test() -> bool {
    const auto dir = std::filesystem::temp_directory_path() / ("sdrop-util-" + sdrop::generate_id());
    std::filesystem::create_directories(dir);
    const auto cleaner = Cleaner{[&dir] {
        auto ec = std::error_code();
        std::filesystem::remove_all(dir, ec);
    }};

    const auto content = sdrop::test::pattern_bytes(5000, 3);
    {
        auto file = std::ofstream(dir / "report.pdf", std::ios::binary);
        file.write((const char*)content.data(), std::streamsize(content.size()));
        ensure(file);
    }
    unwrap_mut(source, sdrop::DiskFileSource::open(dir / "report.pdf"));
    ensure(source.get_name() == "report.pdf");
    ensure(source.get_size() == 5000);
    ensure(source.get_mime_type() == "application/pdf");

    auto buffer = std::vector<std::byte>(1000);
    ensure(source.read(4000, buffer));
    ensure(std::equal(buffer.begin(), buffer.end(), content.begin() + 4000));
    ensure(source.read(0, buffer));
    ensure(std::equal(buffer.begin(), buffer.end(), content.begin()));
    ensure(!source.read(4500, buffer));
    ensure(!sdrop::DiskFileSource::open(dir / "missing.bin"));

    auto memory = sdrop::MemoryFileSource("blob", content, "application/x-custom");
    ensure(memory.get_mime_type() == "application/x-custom");
    ensure(memory.read(4000, buffer));
    ensure(!memory.read(4001, buffer));
    return true;
}

auto events_test() -> bool {
    constexpr auto kind_a = uint32_t(1);
    constexpr auto kind_b = uint32_t(2);

    auto events = sdrop::Events();

    // a notification that nobody waits for yet is kept
    events.invoke(kind_a, 7, 42);
    ensure(events.wait_for(kind_a, 7, 100ms) == 42u);

    // timed out waits leave nothing behind
    ensure(!events.wait_for(kind_b, sdrop::no_id, 20ms));
    events.invoke(kind_b, sdrop::no_id, 5);
    ensure(events.wait_for(kind_b, sdrop::no_id, 100ms) == 5u);

    auto thread = std::thread([&events] {
        std::this_thread::sleep_for(20ms);
        events.invoke(kind_a, 1, 9);
    });
    const auto value = events.wait_for(kind_a, 1, 5000ms);
    thread.join();
    ensure(value == 9u);

    auto called = uint32_t(0);
    ensure(events.register_callback(kind_b, 3, [&called](const uint32_t v) { called = v; }));
    events.invoke(kind_b, 3, 11);
    ensure(called == 11);

    // draining releases the callbacks still registered
    ensure(events.register_callback(kind_b, 4, [&called](const uint32_t v) { called = v; }));
    ensure(events.drain());
    ensure(called == sdrop::drained_value);
    ensure(events.is_drained());
    ensure(!events.drain());
    ensure(!events.register_callback(kind_b, 5, [](uint32_t) {}));
    return true;
}

auto transport_defaults_test() -> bool {
    const auto params = sdrop::TransportParams();
    ensure(params.stun_server.address == "stun.l.google.com" && params.stun_server.port == 19302);
    ensure(params.turn_servers.empty());
    ensure(params.channel_label == "fileTransfer");
    ensure(params.ordered && params.reliable);
    return true;
}

auto run() -> bool {
    ensure(ids_test());
    ensure(room_link_test());
    ensure(format_test());
    ensure(file_source_test());
    ensure(events_test());
    ensure(transport_defaults_test());
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
