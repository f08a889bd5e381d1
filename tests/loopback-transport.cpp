#include <format>

#include "loopback-transport.hpp"
#include "macros/logger.hpp"

namespace {
auto logger = Logger("sdrop_loopback");

constexpr auto offer_prefix     = std::string_view("loopback-offer:");
constexpr auto answer_prefix    = std::string_view("loopback-answer:");
constexpr auto candidate_prefix = std::string_view("loopback-candidate:");

auto report(const sdrop::TransportState state) -> std::function<void(sdrop::Transport&)> {
    return [state](sdrop::Transport& t) {
        if(t.on_state) {
            t.on_state(state);
        }
    };
}

auto report_candidate(std::string candidate) -> std::function<void(sdrop::Transport&)> {
    return [candidate = std::move(candidate)](sdrop::Transport& t) {
        if(t.on_candidate) {
            t.on_candidate(candidate);
        }
    };
}
} // namespace

namespace sdrop::test {
auto LoopbackTransport::get_id() const -> std::string_view {
    return id;
}

auto LoopbackTransport::send(const std::span<const std::byte> payload) -> SendResult {
    auto peer = std::string();
    {
        auto guard = std::lock_guard(network->lock);
        auto& self = network->endpoints.find(id)->second;
        if(!self.connected || self.closed) {
            return SendResult::Closed;
        }
        if(const auto limit = network->fail_after.load(); limit >= 0 && network->sends >= limit) {
            LOG_INFO(logger, "{}: send limit reached, dropping the connection", id);
            self.closed = true;
            if(const auto i = network->endpoints.find(self.peer); i != network->endpoints.end()) {
                i->second.closed = true;
            }
            network->post(id, report(TransportState::Disconnected));
            network->post(self.peer, report(TransportState::Disconnected));
            return SendResult::Closed;
        }
        network->sends += 1;
        peer = self.peer;
    }
    if(network->tap) {
        network->tap(id, payload);
    }
    network->post(peer, [data = std::vector<std::byte>(payload.begin(), payload.end())](Transport& t) {
        if(t.on_message) {
            t.on_message(data);
        }
    });
    return SendResult::Success;
}

auto LoopbackTransport::is_open() const -> bool {
    auto        guard = std::lock_guard(network->lock);
    const auto& self  = network->endpoints.find(id)->second;
    return self.connected && !self.closed;
}

auto LoopbackTransport::create_offer() -> std::optional<std::string> {
    auto guard = std::lock_guard(network->lock);
    network->endpoints.find(id)->second.offered = true;
    return std::format("{}{}", offer_prefix, id);
}

auto LoopbackTransport::create_answer(const std::string_view remote_desc) -> std::optional<std::string> {
    if(!remote_desc.starts_with(offer_prefix)) {
        return std::nullopt;
    }
    const auto offerer = remote_desc.substr(offer_prefix.size());

    auto       guard = std::lock_guard(network->lock);
    const auto i     = network->endpoints.find(offerer);
    if(i == network->endpoints.end() || !i->second.offered || !i->second.answerer.empty()) {
        return std::nullopt;
    }
    i->second.answerer = id;
    auto& self         = network->endpoints.find(id)->second;
    self.peer          = std::string(offerer);
    self.answered      = true;
    return std::format("{}{}", answer_prefix, id);
}

auto LoopbackTransport::set_remote_answer(const std::string_view remote_desc) -> bool {
    if(!remote_desc.starts_with(answer_prefix)) {
        return false;
    }
    const auto answerer = remote_desc.substr(answer_prefix.size());

    auto  guard = std::lock_guard(network->lock);
    auto& self  = network->endpoints.find(id)->second;
    if(!self.offered || self.answerer != answerer) {
        return false;
    }
    self.peer     = std::string(answerer);
    self.answered = true;
    network->try_connect(id);
    return true;
}

auto LoopbackTransport::add_remote_candidate(const std::string_view candidate) -> bool {
    if(!candidate.empty() && !candidate.starts_with(candidate_prefix)) {
        return false;
    }
    auto guard = std::lock_guard(network->lock);
    network->remote_candidates.emplace_back(candidate);
    return true;
}

auto LoopbackTransport::gather_candidates() -> bool {
    auto guard = std::lock_guard(network->lock);
    network->endpoints.find(id)->second.gathered = true;
    network->post(id, report_candidate(std::format("{}{}", candidate_prefix, id)));
    network->post(id, report_candidate(""));
    network->try_connect(id);
    return true;
}

auto LoopbackTransport::close() -> void {
    auto  guard = std::lock_guard(network->lock);
    auto& self  = network->endpoints.find(id)->second;
    if(self.closed) {
        return;
    }
    self.closed = true;
    if(!self.connected) {
        return;
    }
    if(const auto i = network->endpoints.find(self.peer); i != network->endpoints.end() && !i->second.closed) {
        i->second.closed = true;
        network->post(self.peer, report(TransportState::Closed));
    }
}

LoopbackTransport::LoopbackTransport(LoopbackNetwork& network)
    : network(&network),
      id(network.attach(this)) {
}

LoopbackTransport::~LoopbackTransport() {
    network->detach(id);
}

auto LoopbackNetwork::attach(LoopbackTransport* const transport) -> std::string {
    auto guard = std::lock_guard(lock);
    auto id    = std::format("t{}", next_id += 1);
    endpoints.emplace(id, Endpoint{.transport = transport, .peer = {}, .answerer = {}});
    created += 1;
    return id;
}

auto LoopbackNetwork::detach(const std::string_view id) -> void {
    auto dispatch_guard = std::lock_guard(dispatch_lock);
    auto guard          = std::lock_guard(lock);
    const auto i        = endpoints.find(id);
    if(i == endpoints.end()) {
        return;
    }
    // the peer sees the connection go away
    if(i->second.connected && !i->second.closed) {
        if(const auto p = endpoints.find(i->second.peer); p != endpoints.end() && !p->second.closed) {
            p->second.closed = true;
            post(i->second.peer, report(TransportState::Disconnected));
        }
    }
    endpoints.erase(i);
}

auto LoopbackNetwork::post(const std::string_view id, std::function<void(Transport&)> callback) -> void {
    delivery.push([this, id = std::string(id), callback = std::move(callback)] {
        auto dispatch_guard = std::lock_guard(dispatch_lock);
        auto transport      = (Transport*)(nullptr);
        {
            auto guard = std::lock_guard(lock);
            if(const auto i = endpoints.find(id); i != endpoints.end()) {
                transport = i->second.transport;
            }
        }
        if(transport != nullptr) {
            callback(*transport);
        }
    });
}

auto LoopbackNetwork::try_connect(const std::string_view id) -> void {
    const auto a = endpoints.find(id);
    if(a == endpoints.end() || a->second.peer.empty()) {
        return;
    }
    const auto b = endpoints.find(a->second.peer);
    if(b == endpoints.end() || b->second.peer != id) {
        return;
    }
    auto& x = a->second;
    auto& y = b->second;
    if(!x.answered || !y.answered || !x.gathered || !y.gathered || x.connected || y.connected || x.closed || y.closed) {
        return;
    }
    const auto state = refuse_connections ? TransportState::Failed : TransportState::Connected;
    x.connected      = !refuse_connections;
    y.connected      = !refuse_connections;
    for(const auto& target : {a->first, b->first}) {
        post(target, report(TransportState::Connecting));
        post(target, report(state));
    }
}

auto LoopbackNetwork::create(const TransportParams& /*params*/) -> std::unique_ptr<Transport> {
    return std::make_unique<LoopbackTransport>(*this);
}

auto LoopbackNetwork::accepted_candidates() const -> std::vector<std::string> {
    auto guard = std::lock_guard(lock);
    return remote_candidates;
}

auto LoopbackNetwork::transports_created() const -> int {
    auto guard = std::lock_guard(lock);
    return created;
}

auto LoopbackNetwork::live_transports() const -> size_t {
    auto guard = std::lock_guard(lock);
    return endpoints.size();
}

auto LoopbackNetwork::cut(const std::string_view id) -> void {
    auto       guard = std::lock_guard(lock);
    const auto i     = endpoints.find(id);
    if(i == endpoints.end() || !i->second.connected || i->second.closed) {
        return;
    }
    i->second.closed = true;
    post(id, report(TransportState::Disconnected));
    if(const auto p = endpoints.find(i->second.peer); p != endpoints.end() && !p->second.closed) {
        p->second.closed = true;
        post(i->second.peer, report(TransportState::Disconnected));
    }
}

auto LoopbackNetwork::connected_ids() const -> std::vector<std::string> {
    auto guard = std::lock_guard(lock);
    auto ret   = std::vector<std::string>();
    for(const auto& [id, endpoint] : endpoints) {
        if(endpoint.connected && !endpoint.closed) {
            ret.push_back(id);
        }
    }
    return ret;
}

LoopbackNetwork::LoopbackNetwork() {
    delivery.start();
}

LoopbackNetwork::~LoopbackNetwork() {
    delivery.stop();
}
} // namespace sdrop::test
