#include "crypto.hpp"

#include <mixprov/util/logging.hpp>

#include <sodium/core.h>
#include <sodium/crypto_scalarmult_curve25519.h>
#include <sodium/crypto_sign.h>
#include <sodium/randombytes.h>
#include <sodium/utils.h>

#include <cstdlib>

namespace mixprov
{
  bool
  crypto::constant_time_equal(const byte_t* a, const byte_t* b, size_t size)
  {
    return sodium_memcmp(a, b, size) == 0;
  }

  void
  crypto::wipe(void* ptr, size_t size)
  {
    if (size)
      sodium_memzero(ptr, size);
  }

  void
  crypto::randbytes(byte_t* ptr, size_t sz)
  {
    randombytes_buf(ptr, sz);
  }

  void
  crypto::identity_keygen(SecretKey& keys)
  {
    PubKey pk;
    crypto_sign_keypair(pk.data(), keys.data());
  }

  void
  crypto::encryption_keygen(SecretKey& keys)
  {
    auto d = keys.data();
    randbytes(d, 32);
    crypto_scalarmult_curve25519_base(d + 32, d);
  }

  bool
  crypto::check_identity_privkey(const SecretKey& keys)
  {
    AlignedBuffer<crypto_sign_SEEDBYTES> seed;
    PubKey pk;
    SecretKey sk;
    if (crypto_sign_ed25519_sk_to_seed(seed.data(), keys.data()) == -1)
      return false;
    const bool ok = crypto_sign_seed_keypair(pk.data(), sk.data(), seed.data()) != -1
        and keys.toPublic() == pk and sk == keys;
    wipe(seed.data(), seed.size());
    return ok;
  }

  bool
  crypto::check_encryption_privkey(const SecretKey& keys)
  {
    PubKey pk;
    if (crypto_scalarmult_curve25519_base(pk.data(), keys.data()) != 0)
      return false;
    return keys.toPublic() == pk;
  }

  // Called during static initialization so that libsodium is ready before any other code in the
  // library touches it.
  static bool
  _initialize_crypto()
  {
    if (sodium_init() == -1)
    {
      log::critical(log::Cat("initialization"), "sodium_init() failed, unable to continue!");
      std::abort();
    }
    return true;
  }

  [[maybe_unused]] static const bool crypto_initialized = _initialize_crypto();

}  // namespace mixprov
