#pragma once

#include "types.hpp"

#include <mixprov/util/types.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

namespace mixprov
{
  namespace crypto
  {
    /// compare two equally sized buffers in time that depends only on `size`, never on the
    /// contents or on the position of the first difference
    bool
    constant_time_equal(const byte_t* a, const byte_t* b, size_t size);

    /// overwrite a buffer holding sensitive material with zeros; the compiler may not elide it
    void
    wipe(void* ptr, size_t size);

    inline void
    wipe(std::string& str)
    {
      wipe(str.data(), str.size());
    }

    /// randomize buffer
    void
    randbytes(byte_t*, size_t);

    /// generate Ed25519 signing keypair
    void
    identity_keygen(SecretKey&);

    /// generate X25519 key agreement keypair
    void
    encryption_keygen(SecretKey&);

    /// check that the public half of an Ed25519 secret key matches its seed
    bool
    check_identity_privkey(const SecretKey&);

    /// check that the public half of an X25519 secret key matches its scalar
    bool
    check_encryption_privkey(const SecretKey&);
  }  // namespace crypto
}  // namespace mixprov
