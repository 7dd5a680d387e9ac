#pragma once

#include <cstddef>

namespace mixprov
{
  /// X25519 link/user public keys and Ed25519 identity public keys
  inline constexpr size_t PUBKEYSIZE = 32;
  /// libsodium "secret key" layout: 32 byte seed (or scalar) followed by the 32 byte public key
  inline constexpr size_t SECKEYSIZE = 64;
}  // namespace mixprov
