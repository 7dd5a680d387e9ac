#include "plaintext_block.hpp"

#include <algorithm>
#include <stdexcept>

namespace mixprov::sphinx
{
  std::optional<PlaintextBlock>
  decode_plaintext_block(ustring_view b, std::string_view* why)
  {
    auto reject = [why](std::string_view reason) -> std::optional<PlaintextBlock> {
      if (why)
        *why = reason;
      return std::nullopt;
    };

    if (b.size() < PLAINTEXT_BLOCK_HEADER_LENGTH)
      return reject("truncated message block"sv);
    if (b[1] != PLAINTEXT_RESERVED)
      return reject("invalid message reserved byte"sv);

    PlaintextBlock block;
    switch (b[0])
    {
      case static_cast<uint8_t>(BlockFlags::Padding):
        block.flags = BlockFlags::Padding;
        break;
      case static_cast<uint8_t>(BlockFlags::HasSURB):
        block.flags = BlockFlags::HasSURB;
        block.surb = b.substr(PLAINTEXT_HEADER_LENGTH, SURB_LENGTH);
        break;
      default:
        return reject("invalid message flags"sv);
    }
    block.ciphertext = b.substr(PLAINTEXT_BLOCK_HEADER_LENGTH);
    return block;
  }

  ustring
  encode_plaintext_block(ustring_view ciphertext, std::optional<ustring_view> surb)
  {
    if (surb and surb->size() != SURB_LENGTH)
      throw std::invalid_argument{
          "SURB must be {} bytes, got {}"_format(SURB_LENGTH, surb->size())};

    ustring b(PLAINTEXT_BLOCK_HEADER_LENGTH, 0);
    b[0] = static_cast<uint8_t>(surb ? BlockFlags::HasSURB : BlockFlags::Padding);
    b[1] = PLAINTEXT_RESERVED;
    if (surb)
      std::copy(surb->begin(), surb->end(), b.begin() + PLAINTEXT_HEADER_LENGTH);
    b.append(ciphertext);
    return b;
  }
}  // namespace mixprov::sphinx
