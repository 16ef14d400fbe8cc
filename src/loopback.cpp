#include "swiftdrop/loopback.hpp"

#include "swiftdrop/crypto.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"

#include <algorithm>
#include <string>

namespace swiftdrop::loopback {

namespace {

std::string RandomId() {
    static const char kHex[] = "0123456789abcdef";
    std::string out;
    for (std::uint8_t byte : crypto::RandomBytes(8)) {
        out.push_back(kHex[byte >> 4]);
        out.push_back(kHex[byte & 0x0F]);
    }
    return out;
}

std::uint32_t SeedFor(const LoopbackOptions& options) {
    if (options.seed != 0) {
        return options.seed;
    }
    std::random_device rd;
    return rd();
}

}  // namespace

LoopbackChannel::LoopbackChannel(const LoopbackOptions& options, std::string name)
    : options_(options), name_(std::move(name)), rng_(SeedFor(options)) {}

LoopbackChannel::~LoopbackChannel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        destroying_ = true;
        open_ = false;
        stop_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }
}

void LoopbackChannel::Start(const std::shared_ptr<LoopbackChannel>& peer) {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        peer_ = peer;
        open_ = true;
        handler = open_handler_;
    }
    thread_ = std::thread(&LoopbackChannel::DeliveryLoop, this);
    if (handler) {
        handler();
    }
}

void LoopbackChannel::Send(Bytes&& message) {
    ErrorHandler on_error;
    std::string failure;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!open_) {
            throw TransportError("Channel " + name_ + " is not open");
        }
        if (message.size() > options_.max_message_size) {
            throw TransportError("Message of " + std::to_string(message.size()) + " bytes exceeds channel limit");
        }
        if (fail_sends_ > 0) {
            --fail_sends_;
            failure = "injected send failure on " + name_;
            on_error = error_handler_;
        } else {
            buffered_ += message.size();
            ++sent_;
            outbound_.push_back(std::move(message));
        }
    }
    if (!failure.empty()) {
        if (on_error) {
            on_error(failure);
        }
        throw TransportError(failure);
    }
    cv_.notify_all();
}

void LoopbackChannel::Close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        open_ = false;
        stop_ = true;
    }
    log::Get()->debug("loopback {} closing", name_);
    cv_.notify_all();
}

bool LoopbackChannel::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

std::size_t LoopbackChannel::BufferedAmount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffered_;
}

std::size_t LoopbackChannel::BufferedAmountLowThreshold() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return low_threshold_;
}

void LoopbackChannel::SetBufferedAmountLowThreshold(std::size_t threshold) {
    std::lock_guard<std::mutex> lock(mutex_);
    low_threshold_ = threshold;
}

std::size_t LoopbackChannel::MaxMessageSize() const {
    return options_.max_message_size;
}

void LoopbackChannel::OnOpen(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_handler_ = std::move(handler);
}

void LoopbackChannel::OnMessage(MessageHandler handler) {
    std::lock_guard<std::recursive_mutex> lock(inbound_mutex_);
    message_handler_ = std::move(handler);
    while (message_handler_ && !inbox_.empty()) {
        Bytes message = std::move(inbox_.front());
        inbox_.pop_front();
        MessageHandler current = message_handler_;
        current(std::move(message));
    }
}

void LoopbackChannel::OnClose(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    close_handler_ = std::move(handler);
}

void LoopbackChannel::OnError(ErrorHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_handler_ = std::move(handler);
}

void LoopbackChannel::OnBufferedAmountLow(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffered_low_handler_ = std::move(handler);
}

void LoopbackChannel::FailNextSends(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_sends_ = count;
}

std::size_t LoopbackChannel::sent_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sent_;
}

void LoopbackChannel::Receive(Bytes message) {
    std::lock_guard<std::recursive_mutex> lock(inbound_mutex_);
    if (!message_handler_) {
        inbox_.push_back(std::move(message));
        return;
    }
    MessageHandler current = message_handler_;
    current(std::move(message));
}

void LoopbackChannel::PeerClosed() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return;
        }
        open_ = false;
        stop_ = true;
    }
    cv_.notify_all();
}

void LoopbackChannel::FireClose() {
    EventHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (close_fired_ || destroying_) {
            return;
        }
        close_fired_ = true;
        handler = close_handler_;
    }
    if (handler) {
        handler();
    }
}

void LoopbackChannel::DeliveryLoop() {
    while (true) {
        Bytes message;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stop_ || !outbound_.empty(); });
            if (outbound_.empty()) {
                break;
            }
            std::size_t pick = 0;
            if (!options_.ordered) {
                std::size_t window = std::max<std::size_t>(1, std::min(options_.reorder_window, outbound_.size()));
                pick = std::uniform_int_distribution<std::size_t>(0, window - 1)(rng_);
            }
            message = std::move(outbound_[pick]);
            outbound_.erase(outbound_.begin() + static_cast<std::ptrdiff_t>(pick));
        }
        if (options_.per_message_delay.count() > 0) {
            std::this_thread::sleep_for(options_.per_message_delay);
        }
        EventHandler low;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            bool was_above = buffered_ > low_threshold_;
            buffered_ -= message.size();
            if (was_above && buffered_ <= low_threshold_) {
                low = buffered_low_handler_;
            }
        }
        if (low) {
            low();
        }
        if (auto peer = peer_.lock()) {
            peer->Receive(std::move(message));
        }
    }
    if (auto peer = peer_.lock()) {
        peer->PeerClosed();
    }
    FireClose();
}

std::pair<LoopbackChannelPtr, LoopbackChannelPtr> CreatePair(const LoopbackOptions& options) {
    auto a = std::make_shared<LoopbackChannel>(options, "a");
    auto b = std::make_shared<LoopbackChannel>(options, "b");
    a->Start(b);
    b->Start(a);
    return {a, b};
}

LoopbackNegotiator::LoopbackNegotiator(LoopbackOptions options) : options_(std::move(options)) {}

std::string LoopbackNegotiator::CreateOffer() {
    std::string offer = "loopback-offer:" + RandomId();
    std::lock_guard<std::mutex> lock(mutex_);
    offers_[offer] = true;
    return offer;
}

std::string LoopbackNegotiator::CreateAnswer(const std::string& offer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (offers_.find(offer) == offers_.end()) {
        throw ValidationError("Unknown offer");
    }
    std::string answer = "loopback-answer:" + RandomId();
    Link link;
    link.offer = offer;
    links_.emplace(answer, std::move(link));
    return answer;
}

std::string LoopbackNegotiator::OfferFor(const std::string& answer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(answer);
    if (it == links_.end()) {
        throw ValidationError("Unknown answer");
    }
    return it->second.offer;
}

ChannelPtr LoopbackNegotiator::OpenAsAnswerer(const std::string& answer, std::chrono::milliseconds timeout) {
    return Open(answer, true, timeout);
}

ChannelPtr LoopbackNegotiator::OpenAsOfferer(const std::string& answer, std::chrono::milliseconds timeout) {
    return Open(answer, false, timeout);
}

ChannelPtr LoopbackNegotiator::Open(const std::string& answer, bool as_answerer, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (fail_opens_ > 0) {
        --fail_opens_;
        throw TransportError("injected negotiation failure");
    }
    auto it = links_.find(answer);
    if (it == links_.end()) {
        throw ValidationError("Unknown answer");
    }
    Link& link = it->second;
    (as_answerer ? link.answerer_waiting : link.offerer_waiting) = true;
    if (link.answerer_waiting && link.offerer_waiting && !link.answerer) {
        auto pair = CreatePair(options_);
        link.answerer = pair.first;
        link.offerer = pair.second;
        cv_.notify_all();
    }
    bool ready = cv_.wait_for(lock, timeout, [&link] { return static_cast<bool>(link.answerer); });
    if (!ready) {
        (as_answerer ? link.answerer_waiting : link.offerer_waiting) = false;
        throw TimeoutError("Peer did not connect within " + std::to_string(timeout.count()) + " ms");
    }
    return as_answerer ? ChannelPtr(link.answerer) : ChannelPtr(link.offerer);
}

void LoopbackNegotiator::FailNextOpens(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_opens_ = count;
}

LoopbackChannelPtr LoopbackNegotiator::answerer_channel(const std::string& answer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(answer);
    return it == links_.end() ? nullptr : it->second.answerer;
}

LoopbackChannelPtr LoopbackNegotiator::offerer_channel(const std::string& answer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(answer);
    return it == links_.end() ? nullptr : it->second.offerer;
}

void MemoryRendezvousStore::Connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connects_;
}

void MemoryRendezvousStore::Publish(const SessionKeyRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    record_ = record;
}

std::optional<SessionKeyRecord> MemoryRendezvousStore::Fetch() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_fetch_) {
        fail_fetch_ = false;
        throw TransportError("rendezvous store unreachable");
    }
    return record_;
}

void MemoryRendezvousStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    record_.reset();
}

std::size_t MemoryRendezvousStore::connect_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connects_;
}

void MemoryRendezvousStore::FailNextFetch() {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_fetch_ = true;
}

}  // namespace swiftdrop::loopback
