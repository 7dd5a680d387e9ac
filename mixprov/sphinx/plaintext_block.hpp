#pragma once

#include "constants.hpp"

#include <mixprov/util/types.hpp>

#include <optional>
#include <string_view>

namespace mixprov::sphinx
{
  /// header length of a plaintext block: flags, reserved, and room for a SURB
  inline constexpr size_t PLAINTEXT_BLOCK_HEADER_LENGTH = PLAINTEXT_HEADER_LENGTH + SURB_LENGTH;

  enum class BlockFlags : uint8_t
  {
    Padding = 0,
    HasSURB = 1,
  };

  inline constexpr uint8_t PLAINTEXT_RESERVED = 0;

  /// A decoded user message block.  The views point into the packet payload it was decoded from
  /// and are only valid for as long as that payload.
  struct PlaintextBlock
  {
    BlockFlags flags;
    /// the SURB (exactly SURB_LENGTH bytes) when flags is HasSURB
    std::optional<ustring_view> surb;
    ustring_view ciphertext;
  };

  /// Decodes the plaintext block layout:
  ///
  ///   byte 0                          flags, 0 = padding only, 1 = has SURB
  ///   byte 1                          reserved, must be 0
  ///   [2, PLAINTEXT_BLOCK_HEADER)     SURB when flags is 1, ignored otherwise
  ///   [PLAINTEXT_BLOCK_HEADER, end)   ciphertext
  ///
  /// Returns nullopt for a truncated block, a non-zero reserved byte, or unknown flags.  If `why`
  /// is given it is set to a short description of the rejection.
  std::optional<PlaintextBlock>
  decode_plaintext_block(ustring_view b, std::string_view* why = nullptr);

  /// Builds a plaintext block; the inverse of decode_plaintext_block.  A SURB must be exactly
  /// SURB_LENGTH bytes; without one the SURB area is zero filled.
  ustring
  encode_plaintext_block(ustring_view ciphertext, std::optional<ustring_view> surb = std::nullopt);
}  // namespace mixprov::sphinx
