#pragma once

#include <mixprov/sphinx/packet.hpp>

#include <memory>

namespace mixprov
{
  /// The mix scheduler: takes ownership of packets that are to be forwarded after their delay.
  struct IScheduler
  {
    virtual ~IScheduler() = default;

    virtual void
    on_packet(std::unique_ptr<sphinx::Packet> pkt) = 0;
  };
}  // namespace mixprov
