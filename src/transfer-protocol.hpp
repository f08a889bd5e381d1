#pragma once
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace sdrop::proto {
// every packet starts with this, integers are little endian
// u16 type, u32 size(including header)
constexpr auto header_size = size_t(6);

struct Type {
    enum : uint16_t {
        FileStart = 0x01, // (id, name, size, mime_type)
        FileChunk,        // (id, seq, bytes)
        FileEnd,          // (id)
        FileAbort,        // (id, reason) either side gives up the transfer

        Limit,
    };
};

struct FileStart {
    std::string id;
    std::string name;
    uint64_t    size;
    std::string mime_type;
};

struct FileChunk {
    std::string            id;
    uint64_t               seq;
    std::vector<std::byte> bytes;
};

struct FileEnd {
    std::string id;
};

struct FileAbort {
    std::string id;
    std::string reason;
};

using Message = std::variant<FileStart, FileChunk, FileEnd, FileAbort>;

auto build_file_start(const FileStart& message) -> std::vector<std::byte>;
auto build_file_chunk(std::string_view id, uint64_t seq, std::span<const std::byte> bytes) -> std::vector<std::byte>;
auto build_file_end(std::string_view id) -> std::vector<std::byte>;
auto build_file_abort(std::string_view id, std::string_view reason) -> std::vector<std::byte>;

auto parse(std::span<const std::byte> packet) -> std::optional<Message>;
} // namespace sdrop::proto
