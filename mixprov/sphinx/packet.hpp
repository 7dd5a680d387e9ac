#pragma once

#include "commands.hpp"

#include <mixprov/util/time.hpp>
#include <mixprov/util/types.hpp>

#include <cstdint>
#include <memory>

namespace mixprov::sphinx
{
  /// A packet that has been unwrapped (or synthesized) by this node.
  ///
  /// A Packet is owned through a std::unique_ptr from the moment the network layer hands it over
  /// until it is disposed.  Disposal wipes the raw and payload buffers and releases them; it runs
  /// from the destructor, so every path that drops the owning pointer disposes the packet.
  struct Packet
  {
    /// process-unique, monotonically assigned identifier (for log correlation only)
    const uint64_t id;

    ustring raw;
    ustring payload;
    RoutingCommands cmds;

    /// the scheduling delay the mix strategy assigned to this packet
    Duration_t delay{0};
    /// when the packet was received by this node
    Duration_t recv_at{0};
    /// if set the packet has to be forwarded even if it is late
    bool must_forward{false};

    Packet();
    ~Packet();

    Packet(const Packet&) = delete;
    Packet&
    operator=(const Packet&) = delete;

    static std::unique_ptr<Packet>
    make();

    /// Copies a raw (still encrypted) packet into this packet's raw buffer.
    void
    copy_to_raw(ustring_view b);

    /// Wipes and releases all buffers.  Safe to call more than once.
    void
    dispose();

    bool
    disposed() const
    {
      return _disposed;
    }

    const commands::NextNodeHop*
    next_node_hop() const;

    const commands::NodeDelay*
    node_delay() const;

    const commands::Recipient*
    recipient() const;

    const commands::SURBReply*
    surb_reply() const;

    bool
    is_surb_reply() const
    {
      return surb_reply() != nullptr;
    }

    /// a packet terminating at a local user that is not a SURB reply
    bool
    is_to_user() const
    {
      return recipient() != nullptr and not is_surb_reply();
    }

   private:
    template <typename Command>
    const Command*
    find_command() const
    {
      for (const auto& cmd : cmds)
        if (auto* ptr = std::get_if<Command>(&cmd))
          return ptr;
      return nullptr;
    }

    bool _disposed{false};
  };
}  // namespace mixprov::sphinx
