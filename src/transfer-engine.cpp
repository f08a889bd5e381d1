#include <algorithm>
#include <utility>

#include "ids.hpp"
#include "macros/logger.hpp"
#include "transfer-engine.hpp"
#include "util/cleaner.hpp"

namespace {
auto logger = Logger("sdrop_transfer");

auto is_terminal(const sdrop::TransferStatus status) -> bool {
    return status == sdrop::TransferStatus::Completed || status == sdrop::TransferStatus::Failed;
}
} // namespace

namespace sdrop {
namespace {
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
} // namespace

auto TransferEngine::fail_record(Record& record, const Error error, Notices& notices) -> void {
    auto& transfer = record.transfer;
    if(is_terminal(transfer.status)) {
        return;
    }
    LOG_ERROR(logger, "transfer {} ({}) with {} failed: {}", transfer.id, transfer.name, transfer.peer_id, to_string(error));
    transfer.status = TransferStatus::Failed;
    // partial data is never handed out
    record.buffer   = {};
    notices.emplace_back([snapshot = transfer, error](TransferObserver& o) { o.on_transfer_failed(snapshot, error); });
}

auto TransferEngine::find_active(const std::string_view id, const std::string_view peer_id, const Direction direction) -> Record* {
    const auto i = records.find(std::string(id));
    if(i == records.end()) {
        return nullptr;
    }
    auto& transfer = i->second.transfer;
    if(transfer.peer_id != peer_id || transfer.direction != direction || is_terminal(transfer.status)) {
        return nullptr;
    }
    return &i->second;
}

auto TransferEngine::reap_senders() -> void {
    for(auto i = senders.begin(); i != senders.end();) {
        if(*i->done) {
            i->thread.join();
            i = senders.erase(i);
        } else {
            i = std::next(i);
        }
    }
}

auto TransferEngine::prune_history() -> void {
    auto finished = std::vector<std::map<std::string, Record>::iterator>();
    for(auto i = records.begin(); i != records.end(); i = std::next(i)) {
        if(is_terminal(i->second.transfer.status)) {
            finished.push_back(i);
        }
    }
    if(finished.size() <= params.max_history) {
        return;
    }
    std::ranges::sort(finished, {}, [](const auto& i) { return i->second.serial; });
    for(auto n = size_t(0); n < finished.size() - params.max_history; n += 1) {
        records.erase(finished[n]);
    }
}

auto TransferEngine::flush(Notices& notices) -> void {
    if(notices.empty()) {
        return;
    }
    for(const auto& notice : notices) {
        observers.notify(notice);
    }
    notices.clear();

    auto guard = std::lock_guard(lock);
    prune_history();
}

auto TransferEngine::reply_abort(const std::string_view peer_id, const std::string_view id, const std::string_view reason) -> void {
    const auto channel = lookup(peer_id);
    if(!channel) {
        return;
    }
    if(channel->send(proto::build_file_abort(id, reason)) != SendResult::Success) {
        LOG_WARN(logger, "failed to tell {} about aborting {}", peer_id, id);
    }
}

auto TransferEngine::send_blocking(Channel& channel, const std::string_view id, const std::span<const std::byte> packet) -> bool {
    while(true) {
        switch(channel.send(packet)) {
        case SendResult::Success:
            return true;
        case SendResult::WouldBlock: {
            {
                auto guard = std::lock_guard(lock);
                const auto i = records.find(std::string(id));
                if(shut || i == records.end() || is_terminal(i->second.transfer.status)) {
                    return false;
                }
            }
            std::this_thread::sleep_for(params.retry_interval);
            continue;
        }
        case SendResult::MessageTooLarge:
            LOG_ERROR(logger, "channel refused a packet of {} bytes", packet.size());
            return false;
        default:
            return false;
        }
    }
}

auto TransferEngine::sender_main(const std::string id, const std::shared_ptr<Channel> channel, const std::shared_ptr<FileSource> source) -> void {
    auto notices = Notices();
    // no-op if the transfer already ended, e.g. by cancel
    const auto fail = [this, &id, &notices](const Error error) {
        {
            auto guard = std::lock_guard(lock);
            if(const auto i = records.find(id); i != records.end()) {
                fail_record(i->second, error, notices);
            }
        }
        flush(notices);
    };
    const auto size = source->get_size();

    {
        auto guard = std::lock_guard(lock);
        const auto i = records.find(id);
        if(i == records.end() || i->second.transfer.status != TransferStatus::Pending) {
            return;
        }
        i->second.transfer.status = TransferStatus::Transferring;
    }

    const auto start = proto::FileStart{
        .id        = id,
        .name      = std::string(source->get_name()),
        .size      = size,
        .mime_type = std::string(source->get_mime_type()),
    };
    if(!send_blocking(*channel, id, proto::build_file_start(start))) {
        fail(Error::TransferFailed);
        return;
    }

    auto buffer = std::vector<std::byte>(std::min<uint64_t>(params.chunk_size, size));
    auto offset = uint64_t(0);
    for(auto seq = uint64_t(0); offset < size; seq += 1) {
        const auto len   = std::min<uint64_t>(params.chunk_size, size - offset);
        const auto chunk = std::span<std::byte>(buffer.data(), len);
        if(!source->read(offset, chunk)) {
            if(channel->send(proto::build_file_abort(id, "source unreadable")) != SendResult::Success) {
                LOG_WARN(logger, "failed to tell the receiver about aborting {}", id);
            }
            fail(Error::FileUnreadable);
            return;
        }
        if(!send_blocking(*channel, id, proto::build_file_chunk(id, seq, chunk))) {
            fail(Error::TransferFailed);
            return;
        }
        offset += len;
        LOG_DEBUG(logger, "sent chunk {} of {} ({} bytes)", seq, id, len);

        {
            auto guard = std::lock_guard(lock);
            const auto i = records.find(id);
            if(i == records.end() || is_terminal(i->second.transfer.status)) {
                return;
            }
            auto& transfer             = i->second.transfer;
            transfer.bytes_transferred = offset;
            notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_progress(snapshot, snapshot.progress()); });
        }
        flush(notices);
    }

    if(!send_blocking(*channel, id, proto::build_file_end(id))) {
        fail(Error::TransferFailed);
        return;
    }
    {
        auto guard = std::lock_guard(lock);
        const auto i = records.find(id);
        if(i == records.end() || is_terminal(i->second.transfer.status)) {
            return;
        }
        auto& transfer             = i->second.transfer;
        transfer.status            = TransferStatus::Completed;
        transfer.bytes_transferred = size;
        if(size == 0) {
            notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_progress(snapshot, 100); });
        }
        notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_complete(snapshot); });
        LOG_INFO(logger, "sent {} ({}) to {}", transfer.name, format_size(size), transfer.peer_id);
    }
    flush(notices);
}

auto TransferEngine::on_file_start(const std::string_view peer_id, proto::FileStart& message) -> void {
    auto notices = Notices();
    auto refusal = std::string_view();
    {
        auto guard = std::lock_guard(lock);
        if(shut) {
            refusal = "shutting down";
        } else if(message.id.empty() || records.contains(message.id)) {
            refusal = "duplicate transfer id";
        } else if(message.size > params.max_file_size) {
            refusal = "file too large";
        } else {
            auto record = Record{
                .transfer = FileTransfer{
                    .id                = message.id,
                    .name              = std::move(message.name),
                    .size              = message.size,
                    .mime_type         = std::move(message.mime_type),
                    .direction         = Direction::Receive,
                    .status            = TransferStatus::Transferring,
                    .bytes_transferred = 0,
                    .peer_id           = std::string(peer_id),
                },
                .serial   = next_serial += 1,
                .next_seq = 0,
                .buffer   = {},
            };
            record.buffer.reserve(std::min<uint64_t>(message.size, uint64_t(64) * 1024 * 1024));
            LOG_INFO(logger, "incoming {} ({}) from {}", record.transfer.name, format_size(message.size), peer_id);
            notices.emplace_back([snapshot = record.transfer](TransferObserver& o) { o.on_incoming_file(snapshot); });
            records.emplace(message.id, std::move(record));
        }
    }
    if(!refusal.empty()) {
        LOG_WARN(logger, "refused incoming transfer {} from {}: {}", message.id, peer_id, refusal);
        reply_abort(peer_id, message.id, refusal);
        return;
    }
    flush(notices);
}

auto TransferEngine::on_file_chunk(const std::string_view peer_id, proto::FileChunk& message) -> void {
    auto notices = Notices();
    auto failed  = false;
    {
        auto       guard  = std::lock_guard(lock);
        const auto record = find_active(message.id, peer_id, Direction::Receive);
        if(record == nullptr) {
            LOG_DEBUG(logger, "dropped chunk of unknown transfer {}", message.id);
            return;
        }
        auto& transfer = record->transfer;
        if(message.seq != record->next_seq) {
            LOG_ERROR(logger, "chunk {} of {} arrived, expected {}", message.seq, transfer.id, record->next_seq);
            failed = true;
        } else if(message.bytes.size() > transfer.size - record->buffer.size()) {
            LOG_ERROR(logger, "transfer {} overflows its declared size {}", transfer.id, transfer.size);
            failed = true;
        }
        if(failed) {
            fail_record(*record, Error::TransferFailed, notices);
        } else {
            record->buffer.insert(record->buffer.end(), message.bytes.begin(), message.bytes.end());
            record->next_seq += 1;
            transfer.bytes_transferred = record->buffer.size();
            LOG_DEBUG(logger, "received chunk {} of {} ({} bytes)", message.seq, transfer.id, message.bytes.size());
            notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_progress(snapshot, snapshot.progress()); });
        }
    }
    if(failed) {
        reply_abort(peer_id, message.id, "corrupt stream");
    }
    flush(notices);
}

auto TransferEngine::on_file_end(const std::string_view peer_id, proto::FileEnd& message) -> void {
    auto notices = Notices();
    auto failed  = false;
    {
        auto       guard  = std::lock_guard(lock);
        const auto record = find_active(message.id, peer_id, Direction::Receive);
        if(record == nullptr) {
            LOG_DEBUG(logger, "dropped end of unknown transfer {}", message.id);
            return;
        }
        auto& transfer = record->transfer;
        if(record->buffer.size() != transfer.size) {
            LOG_ERROR(logger, "transfer {} ended at {} of {} bytes", transfer.id, record->buffer.size(), transfer.size);
            failed = true;
            fail_record(*record, Error::TransferFailed, notices);
        } else {
            transfer.status = TransferStatus::Completed;
            const auto content = std::make_shared<std::vector<std::byte>>(std::exchange(record->buffer, {}));
            if(transfer.size == 0) {
                notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_progress(snapshot, 100); });
            }
            notices.emplace_back([snapshot = transfer, content](TransferObserver& o) { o.on_file_received(snapshot, *content); });
            notices.emplace_back([snapshot = transfer](TransferObserver& o) { o.on_transfer_complete(snapshot); });
            LOG_INFO(logger, "received {} ({}) from {}", transfer.name, format_size(transfer.size), peer_id);
        }
    }
    if(failed) {
        reply_abort(peer_id, message.id, "size mismatch");
    }
    flush(notices);
}

auto TransferEngine::on_file_abort(const std::string_view peer_id, proto::FileAbort& message) -> void {
    auto notices = Notices();
    {
        auto guard = std::lock_guard(lock);
        auto record = find_active(message.id, peer_id, Direction::Receive);
        if(record == nullptr) {
            record = find_active(message.id, peer_id, Direction::Send);
        }
        if(record == nullptr) {
            return;
        }
        LOG_WARN(logger, "{} aborted transfer {}: {}", peer_id, message.id, message.reason);
        fail_record(*record, Error::TransferCancelled, notices);
    }
    flush(notices);
}

auto TransferEngine::send_file(std::shared_ptr<FileSource> source, const std::string_view peer_id) -> std::expected<std::string, Error> {
    const auto channel = lookup(peer_id);
    if(!channel || !channel->is_open()) {
        return std::unexpected(Error::ChannelNotReady);
    }
    if(source->get_size() > params.max_file_size) {
        return std::unexpected(Error::FileTooLarge);
    }

    auto guard = std::lock_guard(lock);
    if(shut) {
        return std::unexpected(Error::ChannelNotReady);
    }
    reap_senders();

    auto id = generate_id();
    while(records.contains(id)) {
        id = generate_id();
    }
    records.emplace(id, Record{
                            .transfer = FileTransfer{
                                .id                = id,
                                .name              = std::string(source->get_name()),
                                .size              = source->get_size(),
                                .mime_type         = std::string(source->get_mime_type()),
                                .direction         = Direction::Send,
                                .status            = TransferStatus::Pending,
                                .bytes_transferred = 0,
                                .peer_id           = std::string(peer_id),
                            },
                            .serial   = next_serial += 1,
                            .next_seq = 0,
                            .buffer   = {},
                        });

    auto done = std::make_shared<std::atomic_bool>(false);
    auto thread = std::thread([this, id, channel, source = std::move(source), done]() {
        const auto cleaner = Cleaner{[&done] { done->store(true); }};
        sender_main(id, channel, source);
    });
    senders.push_back(Sender{std::move(thread), std::move(done)});
    LOG_DEBUG(logger, "transfer {} to {} queued", id, peer_id);
    return id;
}

auto TransferEngine::cancel(const std::string_view id) -> bool {
    auto notices = Notices();
    auto peer_id = std::string();
    {
        auto       guard = std::lock_guard(lock);
        const auto i     = records.find(std::string(id));
        if(i == records.end() || is_terminal(i->second.transfer.status)) {
            return false;
        }
        peer_id = i->second.transfer.peer_id;
        fail_record(i->second, Error::TransferCancelled, notices);
    }
    reply_abort(peer_id, id, "cancelled");
    flush(notices);
    return true;
}

auto TransferEngine::handle_message(const std::string_view peer_id, const std::span<const std::byte> packet) -> void {
    auto message = proto::parse(packet);
    if(!message) {
        LOG_WARN(logger, "dropped malformed packet from {} size={}", peer_id, packet.size());
        return;
    }
    std::visit(Overloaded{
                   [this, peer_id](proto::FileStart& m) { on_file_start(peer_id, m); },
                   [this, peer_id](proto::FileChunk& m) { on_file_chunk(peer_id, m); },
                   [this, peer_id](proto::FileEnd& m) { on_file_end(peer_id, m); },
                   [this, peer_id](proto::FileAbort& m) { on_file_abort(peer_id, m); },
               },
               *message);
}

auto TransferEngine::abort_peer(const std::string_view peer_id) -> void {
    auto notices = Notices();
    {
        auto guard = std::lock_guard(lock);
        for(auto& [id, record] : records) {
            if(record.transfer.peer_id == peer_id) {
                fail_record(record, Error::TransferFailed, notices);
            }
        }
    }
    flush(notices);
}

auto TransferEngine::shutdown() -> void {
    auto notices = Notices();
    auto threads = std::vector<Sender>();
    {
        auto guard = std::lock_guard(lock);
        shut       = true;
        for(auto& [id, record] : records) {
            fail_record(record, Error::TransferFailed, notices);
        }
        threads = std::exchange(senders, {});
    }
    flush(notices);
    for(auto& sender : threads) {
        sender.thread.join();
    }
}

auto TransferEngine::transfers() -> std::vector<FileTransfer> {
    auto guard  = std::lock_guard(lock);
    auto sorted = std::vector<const Record*>();
    for(const auto& [id, record] : records) {
        sorted.push_back(&record);
    }
    std::ranges::sort(sorted, {}, &Record::serial);

    auto ret = std::vector<FileTransfer>();
    for(const auto record : sorted) {
        ret.push_back(record->transfer);
    }
    return ret;
}

auto TransferEngine::get_transfer(const std::string_view id) -> std::optional<FileTransfer> {
    auto       guard = std::lock_guard(lock);
    const auto i     = records.find(std::string(id));
    if(i == records.end()) {
        return std::nullopt;
    }
    return i->second.transfer;
}

TransferEngine::TransferEngine(ChannelLookup lookup, const TransferEngineParams params)
    : params(params),
      lookup(std::move(lookup)) {
}

TransferEngine::~TransferEngine() {
    shutdown();
}
} // namespace sdrop
