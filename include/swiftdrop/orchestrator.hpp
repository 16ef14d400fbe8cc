#pragma once

#include "swiftdrop/channel.hpp"
#include "swiftdrop/file_source.hpp"
#include "swiftdrop/keys.hpp"
#include "swiftdrop/options.hpp"
#include "swiftdrop/rendezvous_store.hpp"
#include "swiftdrop/session.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace swiftdrop {

// Process-wide state shared by every session: the key cache, the rotating
// session key and the rendezvous connection. Connect() reaches the store
// once no matter how many sessions start concurrently; a failed attempt may
// be repeated.
class TransferContext {
public:
    explicit TransferContext(std::shared_ptr<RendezvousStore> store, keys::Clock clock = {});

    TransferContext(const TransferContext&) = delete;
    TransferContext& operator=(const TransferContext&) = delete;

    void Connect();

    keys::KeyCache& key_cache() { return key_cache_; }
    keys::SessionKeyStore& session_keys() { return session_keys_; }
    RendezvousStore& store() { return *store_; }

private:
    std::shared_ptr<RendezvousStore> store_;
    keys::KeyCache key_cache_;
    keys::SessionKeyStore session_keys_;
    std::once_flag connect_once_;
};

// What a receiver shares with its peer. The matching private key stays in
// the Orchestrator that created it.
struct ReceiveTicket {
    std::string id;
    std::string code;
};

class Orchestrator {
public:
    Orchestrator(TransferContext& context, std::shared_ptr<Negotiator> negotiator);
    // Cancels every active session and joins its worker.
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Receiver: key pair + offer, encoded as a rendezvous code.
    ReceiveTicket CreateReceiveCode(const ReceiveOptions& options = {});

    // Sender: answers peer_code and starts the transfer on a worker thread.
    // The returned session carries the answer code in local_code().
    TransferSessionPtr InitiateSend(const file_source::FilePayload& file,
                                    const std::string& peer_code,
                                    SendOptions options = {});

    // Receiver: consumes the sender's answer code for a ticket created here.
    TransferSessionPtr AcceptIncoming(const std::string& code, ReceiveOptions options = {});

    void Cancel(const TransferSessionPtr& session);
    int Progress(const TransferSessionPtr& session) const;

    TransferSessionPtr Find(const std::string& id) const;
    std::size_t active_count() const;

private:
    struct PendingTicket {
        std::string id;
        keys::KeyPair keys;
    };

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void Register(const TransferSessionPtr& session);
    void Unregister(const std::string& id);
    template <typename Fn>
    void Spawn(const TransferSessionPtr& session, Fn&& body);
    void ReapWorkers();

    TransferContext& context_;
    std::shared_ptr<Negotiator> negotiator_;

    mutable std::mutex mutex_;
    std::map<std::string, TransferSessionPtr> active_;
    std::map<std::string, PendingTicket> tickets_;  // keyed by offer
    std::vector<Worker> workers_;
};

}  // namespace swiftdrop
