#include "packet.hpp"

#include <mixprov/crypto/crypto.hpp>
#include <mixprov/util/str.hpp>

#include <atomic>

namespace mixprov::sphinx
{
  static std::atomic<uint64_t> next_packet_id{0};

  std::string_view
  commands::Recipient::name() const
  {
    return trim_trailing_nuls({reinterpret_cast<const char*>(id.data()), id.size()});
  }

  Packet::Packet() : id{next_packet_id.fetch_add(1, std::memory_order_relaxed)}
  {}

  Packet::~Packet()
  {
    dispose();
  }

  std::unique_ptr<Packet>
  Packet::make()
  {
    return std::make_unique<Packet>();
  }

  void
  Packet::copy_to_raw(ustring_view b)
  {
    raw.assign(b.begin(), b.end());
  }

  void
  Packet::dispose()
  {
    if (_disposed)
      return;
    crypto::wipe(raw.data(), raw.size());
    crypto::wipe(payload.data(), payload.size());
    raw.clear();
    raw.shrink_to_fit();
    payload.clear();
    payload.shrink_to_fit();
    cmds.clear();
    _disposed = true;
  }

  const commands::NextNodeHop*
  Packet::next_node_hop() const
  {
    return find_command<commands::NextNodeHop>();
  }

  const commands::NodeDelay*
  Packet::node_delay() const
  {
    return find_command<commands::NodeDelay>();
  }

  const commands::Recipient*
  Packet::recipient() const
  {
    return find_command<commands::Recipient>();
  }

  const commands::SURBReply*
  Packet::surb_reply() const
  {
    return find_command<commands::SURBReply>();
  }
}  // namespace mixprov::sphinx
