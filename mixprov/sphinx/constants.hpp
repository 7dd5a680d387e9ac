#pragma once

#include <cstddef>

namespace mixprov::sphinx
{
  /// length of a node identifier (the hash of a node's identity key)
  inline constexpr size_t NODE_ID_LENGTH = 32;
  /// length of the NUL padded recipient field of a Recipient routing command
  inline constexpr size_t RECIPIENT_ID_LENGTH = 64;
  /// length of a SURB reply identifier
  inline constexpr size_t SURB_ID_LENGTH = 16;

  /// length of the Sphinx packet header
  inline constexpr size_t HEADER_LENGTH = 460;
  /// length of the key material a SURB carries for decrypting the reply payload
  inline constexpr size_t SPRP_KEY_MATERIAL_LENGTH = 64;
  /// length of a single use reply block: a header, the first hop, and the payload key material
  inline constexpr size_t SURB_LENGTH = HEADER_LENGTH + NODE_ID_LENGTH + SPRP_KEY_MATERIAL_LENGTH;

  /// length of the plaintext block header (flags and reserved bytes)
  inline constexpr size_t PLAINTEXT_HEADER_LENGTH = 2;
  /// length of the user payload carried by a forward packet
  inline constexpr size_t FORWARD_PAYLOAD_LENGTH = 50 * 1024;
}  // namespace mixprov::sphinx
