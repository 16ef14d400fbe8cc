#pragma once

#include <optional>
#include <string>

namespace swiftdrop {

// Published form of the rotating session key.
struct SessionKeyRecord {
    std::string key;        // base64 of the raw key bytes
    std::string timestamp;  // creation time, decimal milliseconds since epoch
};

// Key store reachable through the rendezvous point. Establishing and securing
// the connection behind it is up to the implementation.
class RendezvousStore {
public:
    virtual ~RendezvousStore() = default;

    virtual void Connect() = 0;
    virtual void Publish(const SessionKeyRecord& record) = 0;
    virtual std::optional<SessionKeyRecord> Fetch() = 0;
    virtual void Clear() = 0;
};

}  // namespace swiftdrop
