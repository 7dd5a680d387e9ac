#pragma once

#include "commands.hpp"

#include <mixprov/util/types.hpp>

#include <optional>

namespace mixprov::sphinx
{
  /// a forward packet built from a SURB, and the node it has to be sent to first
  struct SURBPacket
  {
    ustring raw;
    NodeID first_hop;
  };

  /// The Sphinx engine as seen by the provider: the only operation needed is turning a SURB into
  /// a routable packet.
  struct ISURBCrypto
  {
    virtual ~ISURBCrypto() = default;

    /// Builds a forward packet carrying `payload` along the route encoded in `surb`.  Returns
    /// nullopt if the SURB is invalid.
    virtual std::optional<SURBPacket>
    new_packet_from_surb(ustring_view surb, ustring_view payload) = 0;
  };
}  // namespace mixprov::sphinx
