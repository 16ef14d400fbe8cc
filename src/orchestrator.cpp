#include "swiftdrop/orchestrator.hpp"

#include "swiftdrop/chunk.hpp"
#include "swiftdrop/cipher.hpp"
#include "swiftdrop/constants.hpp"
#include "swiftdrop/errors.hpp"
#include "swiftdrop/log.hpp"
#include "swiftdrop/receiver.hpp"
#include "swiftdrop/rendezvous.hpp"
#include "swiftdrop/retry.hpp"
#include "swiftdrop/sender.hpp"

#include <utility>

namespace swiftdrop {

namespace {

RendezvousStore& RequireStore(const std::shared_ptr<RendezvousStore>& store) {
    if (!store) {
        throw ValidationError("TransferContext needs a rendezvous store");
    }
    return *store;
}

bool IsHandshakeRetryable(const Error& error) {
    return error.kind() == ErrorKind::Transport || error.kind() == ErrorKind::Timeout;
}

}  // namespace

TransferContext::TransferContext(std::shared_ptr<RendezvousStore> store, keys::Clock clock)
    : store_(std::move(store)), session_keys_(RequireStore(store_), key_cache_, std::move(clock)) {}

void TransferContext::Connect() {
    std::call_once(connect_once_, [this] {
        log::Get()->info("connecting to rendezvous store");
        store_->Connect();
    });
}

Orchestrator::Orchestrator(TransferContext& context, std::shared_ptr<Negotiator> negotiator)
    : context_(context), negotiator_(std::move(negotiator)) {
    if (!negotiator_) {
        throw ValidationError("Orchestrator needs a negotiator");
    }
}

Orchestrator::~Orchestrator() {
    std::vector<Worker> workers;
    std::vector<TransferSessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        workers = std::move(workers_);
        workers_.clear();
        for (const auto& entry : active_) {
            sessions.push_back(entry.second);
        }
    }
    for (const auto& session : sessions) {
        session->RequestCancel();
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

template <typename Fn>
void Orchestrator::Spawn(const TransferSessionPtr& session, Fn&& body) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, session, done, body = std::forward<Fn>(body)]() mutable {
        try {
            body();
        } catch (const Error& ex) {
            session->Fail(ex);
        } catch (const std::exception& ex) {
            session->Fail(ErrorKind::None, ex.what());
        }
        Unregister(session->id());
        done->store(true);
    });
    std::lock_guard<std::mutex> lock(mutex_);
    workers_.push_back(Worker{std::move(thread), done});
}

ReceiveTicket Orchestrator::CreateReceiveCode(const ReceiveOptions& options) {
    options.Validate();
    keys::KeyPair pair = keys::GenerateAsymmetricKeyPair();
    std::string offer = negotiator_->CreateOffer();

    rendezvous::RendezvousCode code;
    code.negotiation_blob = offer;
    code.ice_server = options.ice_server;
    code.chunk_size = options.high_performance ? constants::kCodeHighPerformanceAdvertised
                                               : constants::kCodeHighPerformanceChunk;
    code.public_key = keys::ExportPublicKey(pair.public_key.get());
    code.high_performance = options.high_performance;

    ReceiveTicket ticket;
    ticket.id = file_source::NewTransferId();
    ticket.code = rendezvous::Encode(code);

    std::lock_guard<std::mutex> lock(mutex_);
    tickets_[offer] = PendingTicket{ticket.id, std::move(pair)};
    log::Get()->info("receive ticket {} created", ticket.id);
    return ticket;
}

TransferSessionPtr Orchestrator::InitiateSend(const file_source::FilePayload& file,
                                              const std::string& peer_code,
                                              SendOptions options) {
    options.Validate();
    if (!file.data) {
        throw ValidationError("File payload has no data");
    }
    rendezvous::RendezvousCode peer = rendezvous::Parse(peer_code);

    crypto::PKey recipient;
    if (options.encrypt) {
        if (peer.public_key.empty()) {
            throw ValidationError("Peer code carries no public key");
        }
        recipient = keys::ImportPublicKey(peer.public_key);
    }
    context_.Connect();
    keys::SessionKeyPtr session_key = context_.session_keys().EnsureFresh(constants::kSessionKeyTtl);

    SendPlan plan;
    plan.file = file;
    plan.file.metadata.size = file.data->size();
    plan.session_key_id = session_key->id;
    if (options.encrypt) {
        plan.transfer_key = keys::GenerateSymmetricKey();
        plan.wrapped_key = cipher::WrapTransferKey(plan.transfer_key, recipient.get());
    }

    std::string id = options.session_id.empty() ? file_source::NewTransferId() : options.session_id;
    auto session = std::make_shared<TransferSession>(id, Role::Sender);
    session->SetFile(plan.file.metadata);
    Register(session);

    std::string answer;
    try {
        answer = negotiator_->CreateAnswer(peer.negotiation_blob);
        rendezvous::RendezvousCode reply;
        reply.negotiation_blob = answer;
        reply.ice_server = options.ice_server;
        std::uint64_t size = plan.file.metadata.size;
        reply.chunk_size = options.chunk_size != 0 ? options.chunk_size : chunk::OptimalChunkSize(size);
        reply.high_performance = chunk::ShouldUseHighPerformanceMode(size);
        session->set_local_code(rendezvous::Encode(reply));
        session->Transition(TransferStatus::WaitingAccept);
    } catch (const std::exception&) {
        Unregister(id);
        throw;
    }

    Spawn(session, [this, session, answer, options, plan = std::move(plan)]() mutable {
        CancellationSource source = session->cancel_source();
        CancellationRegistration link(options.cancel, [source]() mutable { source.Cancel(); });
        ChannelPtr channel = RetryIf(options.retry, session->cancel_token(), "channel open", IsHandshakeRetryable,
                                     [&] { return negotiator_->OpenAsAnswerer(answer, options.timeout); });
        session->Transition(TransferStatus::Processing);
        SenderEngine engine(session, channel, options);
        engine.Run(std::move(plan));
        session->Transition(TransferStatus::Success);
    });
    return session;
}

TransferSessionPtr Orchestrator::AcceptIncoming(const std::string& code, ReceiveOptions options) {
    options.Validate();
    rendezvous::RendezvousCode peer = rendezvous::Parse(code);
    std::string offer = negotiator_->OfferFor(peer.negotiation_blob);

    PendingTicket ticket;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tickets_.find(offer);
        if (it == tickets_.end()) {
            throw ValidationError("No receive ticket matches this code");
        }
        ticket = std::move(it->second);
        tickets_.erase(it);
    }

    auto session = std::make_shared<TransferSession>(ticket.id, Role::Receiver);
    Register(session);
    session->Transition(TransferStatus::WaitingAccept);

    std::string answer = peer.negotiation_blob;
    crypto::PKey private_key = ticket.keys.private_key;
    Spawn(session, [this, session, answer, options, private_key]() {
        CancellationSource source = session->cancel_source();
        CancellationRegistration link(options.cancel, [source]() mutable { source.Cancel(); });
        RetryPolicy handshake;
        ChannelPtr channel = RetryIf(handshake, session->cancel_token(), "channel open", IsHandshakeRetryable,
                                     [&] { return negotiator_->OpenAsOfferer(answer, options.handshake_timeout); });
        ReceiverEngine engine(session, channel, options, private_key);
        engine.Start();
        engine.AwaitCompletion();
        session->Transition(TransferStatus::Success);
    });
    return session;
}

void Orchestrator::Cancel(const TransferSessionPtr& session) {
    if (session) {
        log::Get()->info("cancel requested for session {}", session->id());
        session->RequestCancel();
    }
}

int Orchestrator::Progress(const TransferSessionPtr& session) const {
    return session ? session->Progress() : 0;
}

TransferSessionPtr Orchestrator::Find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    return it == active_.end() ? nullptr : it->second;
}

std::size_t Orchestrator::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void Orchestrator::Register(const TransferSessionPtr& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    ReapWorkers();
    if (!active_.emplace(session->id(), session).second) {
        throw ValidationError("Session " + session->id() + " is already active");
    }
}

void Orchestrator::Unregister(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(id);
}

// Called with mutex_ held. Finished workers no longer need the mutex.
void Orchestrator::ReapWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace swiftdrop
