#pragma once

#include <stdexcept>
#include <string>

namespace ferry {

// Base class for every error raised by the protocol engine
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Structural violation in a wire frame
class MalformedFrame : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Unknown or incomplete session, invalid key material, authentication failure
class CryptoException : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Peer rejected during discovery (capabilities, version, stale payload)
class DiscoveryException : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Key exchange or verification failed
class HandshakeException : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Handshake deadline passed
class TimeoutException : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

// Retry budget exhausted, integrity mismatch, unreadable source file
class TransferException : public ProtocolError {
public:
    using ProtocolError::ProtocolError;
};

}  // namespace ferry
