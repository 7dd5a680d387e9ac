#pragma once

#include <mixprov/crypto/types.hpp>

#include <optional>
#include <string>

namespace mixprov::wire
{
  /// What the link layer learned about a client during the handshake.
  struct PeerCredentials
  {
    /// the username the client supplied as additional handshake data
    std::string additional_data;
    /// the client's link public key; absent if the handshake did not provide one
    std::optional<PubKey> public_key;
  };
}  // namespace mixprov::wire
