#pragma once

#include <cstdint>
#include <string>

namespace swiftdrop::rendezvous {

// Everything one peer hands the other out of band.
struct RendezvousCode {
    std::string negotiation_blob;  // "s": opaque offer/answer from the Negotiator
    std::string ice_server;        // "i"
    std::uint64_t chunk_size = 0;  // "c", decimal string on the wire
    std::string public_key;        // "p": base64 DER SPKI, empty on answers
    bool high_performance = false; // "h": "0" | "1"
};

// base64url(JSON{s, i, c, p, h}).
std::string Encode(const RendezvousCode& code);

// Missing "c" defaults to 64 MiB; high performance is implied when c > 16 MiB.
// Throws ValidationError("Invalid code format") on any malformed input.
RendezvousCode Parse(const std::string& text);

}  // namespace swiftdrop::rendezvous
