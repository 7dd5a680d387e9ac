#include "types.hpp"

#include <sodium/utils.h>

#include <stdexcept>

namespace mixprov
{
  PubKey
  PubKey::from_hex(std::string_view hex)
  {
    PubKey pk;
    if (not pk.FromHex(hex))
      throw std::invalid_argument{
          "invalid public key hex: expected {} hex digits"_format(2 * SIZE)};
    return pk;
  }

  SecretKey::~SecretKey()
  {
    Reset();
  }

  void
  SecretKey::Reset()
  {
    sodium_memzero(data(), size());
  }
}  // namespace mixprov
