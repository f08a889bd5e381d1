#pragma once
#include <cstdint>
#include <string>
#include <string_view>

namespace sdrop {
enum class Direction {
    Send,
    Receive,
};

enum class TransferStatus {
    Pending,
    Transferring,
    Completed,
    Failed,
};

struct FileTransfer {
    std::string    id;
    std::string    name;
    uint64_t       size;
    std::string    mime_type;
    Direction      direction;
    TransferStatus status            = TransferStatus::Pending;
    uint64_t       bytes_transferred = 0;
    std::string    peer_id;

    // 0 to 100, an empty file counts as done
    auto progress() const -> double {
        if(size == 0) {
            return 100;
        }
        const auto percent = double(bytes_transferred) / double(size) * 100;
        return percent < 0 ? 0 : percent > 100 ? 100 : percent;
    }
};

auto to_string(Direction direction) -> std::string_view;
auto to_string(TransferStatus status) -> std::string_view;
} // namespace sdrop
