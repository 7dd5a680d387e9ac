#pragma once

#include "constants.hpp"

#include <array>
#include <cstdint>
#include <string_view>
#include <variant>
#include <vector>

#include <mixprov/util/types.hpp>

namespace mixprov::sphinx
{
  using NodeID = std::array<byte_t, NODE_ID_LENGTH>;
  using RecipientID = std::array<byte_t, RECIPIENT_ID_LENGTH>;
  using SURBID = std::array<byte_t, SURB_ID_LENGTH>;

  /// Routing commands carried in (or synthesized for) a Sphinx packet header.
  namespace commands
  {
    /// forward the packet to the given node
    struct NextNodeHop
    {
      NodeID id{};
    };

    /// the mix delay, in milliseconds, the current hop must apply
    struct NodeDelay
    {
      uint32_t delay{0};
    };

    /// the packet terminates here and is addressed to a local user
    struct Recipient
    {
      RecipientID id{};

      /// the recipient with the NUL padding stripped off
      std::string_view
      name() const;
    };

    /// the packet is a reply sent back along a SURB
    struct SURBReply
    {
      SURBID id{};
    };
  }  // namespace commands

  using RoutingCommand = std::variant<
      commands::NextNodeHop,
      commands::NodeDelay,
      commands::Recipient,
      commands::SURBReply>;

  using RoutingCommands = std::vector<RoutingCommand>;
}  // namespace mixprov::sphinx
