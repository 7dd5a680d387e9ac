#pragma once

#include "constants.hpp"

#include <mixprov/util/aligned.hpp>

#include <string>

namespace mixprov
{
  struct PubKey final : public AlignedBuffer<PUBKEYSIZE>
  {
    PubKey() = default;

    explicit PubKey(const byte_t* ptr) : AlignedBuffer<SIZE>(ptr)
    {}

    explicit PubKey(const std::array<byte_t, SIZE>& data) : AlignedBuffer<SIZE>(data)
    {}

    std::string
    ToString() const
    {
      return ToHex();
    }

    static PubKey
    from_hex(std::string_view hex);
  };

  /// Stores a libsodium style secret key: the private seed (Ed25519) or scalar (X25519) followed
  /// by the matching public key.  The buffer is wiped on destruction.
  struct SecretKey final : public AlignedBuffer<SECKEYSIZE>
  {
    SecretKey() = default;

    explicit SecretKey(const byte_t* ptr) : AlignedBuffer<SECKEYSIZE>(ptr)
    {}

    ~SecretKey();

    SecretKey(const SecretKey&) = default;
    SecretKey&
    operator=(const SecretKey&) = default;

    std::string_view
    ToString() const
    {
      return "[secretkey]";
    }

    PubKey
    toPublic() const
    {
      return PubKey(data() + 32);
    }

    /// overwrite the key material with zeros
    void
    Reset();
  };
}  // namespace mixprov
