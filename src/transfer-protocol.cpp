#include <concepts>
#include <cstring>

#include "macros/logger.hpp"
#include "transfer-protocol.hpp"

#define CUTIL_MACROS_PRINT_FUNC(...) LOG_WARN(logger, __VA_ARGS__)
#include "macros/unwrap.hpp"

namespace {
auto logger = Logger("sdrop_proto");
}

namespace sdrop::proto {
namespace {
template <std::unsigned_integral T>
auto add_parameter(std::vector<std::byte>& buffer, const T num) -> void {
    for(auto i = size_t(0); i < sizeof(T); i += 1) {
        buffer.push_back(std::byte(num >> (i * 8)));
    }
}

// u16 length prefixed
auto add_parameter(std::vector<std::byte>& buffer, const std::string_view str) -> void {
    add_parameter(buffer, uint16_t(str.size()));
    const auto prev_size = buffer.size();
    buffer.resize(prev_size + str.size());
    std::memcpy(buffer.data() + prev_size, str.data(), str.size());
}

// u32 length prefixed
auto add_parameter(std::vector<std::byte>& buffer, const std::span<const std::byte> data) -> void {
    add_parameter(buffer, uint32_t(data.size()));
    buffer.insert(buffer.end(), data.begin(), data.end());
}

auto add_parameters(std::vector<std::byte>&) -> void {
}

template <class Arg, class... Args>
auto add_parameters(std::vector<std::byte>& buffer, const Arg& arg, const Args&... args) -> void {
    add_parameter(buffer, arg);
    add_parameters(buffer, args...);
}

template <class... Args>
auto build_packet(const uint16_t type, const Args&... args) -> std::vector<std::byte> {
    auto buffer = std::vector<std::byte>();
    add_parameter(buffer, type);
    add_parameter(buffer, uint32_t(0));
    add_parameters(buffer, args...);

    const auto size = uint32_t(buffer.size());
    for(auto i = 0; i < 4; i += 1) {
        buffer[2 + i] = std::byte(size >> (i * 8));
    }
    return buffer;
}

class Reader {
  private:
    std::span<const std::byte> data;
    size_t                     pos = 0;

  public:
    template <std::unsigned_integral T>
    auto read() -> std::optional<T> {
        ensure(data.size() - pos >= sizeof(T), "truncated integer");
        auto value = T(0);
        for(auto i = size_t(0); i < sizeof(T); i += 1) {
            value |= T(T(data[pos + i]) << (i * 8));
        }
        pos += sizeof(T);
        return value;
    }

    auto read_string() -> std::optional<std::string> {
        unwrap(len, read<uint16_t>());
        ensure(data.size() - pos >= len, "truncated string");
        auto str = std::string((const char*)(data.data() + pos), len);
        pos += len;
        return str;
    }

    auto read_bytes() -> std::optional<std::vector<std::byte>> {
        unwrap(len, read<uint32_t>());
        ensure(data.size() - pos >= len, "truncated byte array");
        auto bytes = std::vector<std::byte>(data.begin() + pos, data.begin() + pos + len);
        pos += len;
        return bytes;
    }

    auto at_end() const -> bool {
        return pos == data.size();
    }

    Reader(const std::span<const std::byte> data)
        : data(data) {
    }
};

auto parse_body(const uint16_t type, Reader& reader) -> std::optional<Message> {
    switch(type) {
    case Type::FileStart: {
        unwrap_mut(id, reader.read_string());
        unwrap_mut(name, reader.read_string());
        unwrap(size, reader.read<uint64_t>());
        unwrap_mut(mime_type, reader.read_string());
        return FileStart{std::move(id), std::move(name), size, std::move(mime_type)};
    }
    case Type::FileChunk: {
        unwrap_mut(id, reader.read_string());
        unwrap(seq, reader.read<uint64_t>());
        unwrap_mut(bytes, reader.read_bytes());
        return FileChunk{std::move(id), seq, std::move(bytes)};
    }
    case Type::FileEnd: {
        unwrap_mut(id, reader.read_string());
        return FileEnd{std::move(id)};
    }
    case Type::FileAbort: {
        unwrap_mut(id, reader.read_string());
        unwrap_mut(reason, reader.read_string());
        return FileAbort{std::move(id), std::move(reason)};
    }
    }
    bail("unknown packet type {}", type);
}
} // namespace

auto build_file_start(const FileStart& message) -> std::vector<std::byte> {
    return build_packet(Type::FileStart, std::string_view(message.id), std::string_view(message.name), message.size, std::string_view(message.mime_type));
}

auto build_file_chunk(const std::string_view id, const uint64_t seq, const std::span<const std::byte> bytes) -> std::vector<std::byte> {
    return build_packet(Type::FileChunk, id, seq, bytes);
}

auto build_file_end(const std::string_view id) -> std::vector<std::byte> {
    return build_packet(Type::FileEnd, id);
}

auto build_file_abort(const std::string_view id, const std::string_view reason) -> std::vector<std::byte> {
    return build_packet(Type::FileAbort, id, reason);
}

auto parse(const std::span<const std::byte> packet) -> std::optional<Message> {
    auto reader = Reader(packet);
    unwrap(type, reader.read<uint16_t>());
    unwrap(size, reader.read<uint32_t>());
    ensure(size == packet.size(), "packet size mismatch header={} actual={}", size, packet.size());
    unwrap_mut(message, parse_body(type, reader));
    ensure(reader.at_end(), "trailing bytes in packet type={}", type);
    return std::move(message);
}
} // namespace sdrop::proto
