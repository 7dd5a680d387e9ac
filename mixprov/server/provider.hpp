#pragma once

#include "i_scheduler.hpp"

#include <mixprov/config/config.hpp>
#include <mixprov/sphinx/i_surb_crypto.hpp>
#include <mixprov/sphinx/packet.hpp>
#include <mixprov/spool/spool.hpp>
#include <mixprov/userdb/user_db.hpp>
#include <mixprov/util/status.hpp>
#include <mixprov/util/thread/drain_barrier.hpp>
#include <mixprov/util/thread/queue.hpp>
#include <mixprov/wire/peer_credentials.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace mixprov
{
  /// The provider backend: authenticates clients against the user database and spools packets
  /// addressed to local users, answering SURB carrying messages with a SURB-ACK.
  ///
  /// Packets are handed over with on_packet() and processed in order by a single worker thread.
  class Provider
  {
   public:
    /// Opens the user database, then the spool, then starts the worker.  `scheduler` and
    /// `surb_crypto` are not owned and must outlive the provider.
    ///
    /// @throws if either store cannot be opened
    Provider(const ProviderConfig& conf, IScheduler& scheduler, sphinx::ISURBCrypto& surb_crypto);

    /// Same, with already opened stores.
    Provider(
        const ProviderConfig& conf,
        std::unique_ptr<userdb::UserDB> user_db,
        std::unique_ptr<spool::Spool> spool,
        IScheduler& scheduler,
        sphinx::ISURBCrypto& surb_crypto);

    ~Provider();

    Provider(const Provider&) = delete;
    Provider&
    operator=(const Provider&) = delete;

    /// Queues a packet for spooling.  Never blocks; the packet is dropped (and disposed) if the
    /// provider is halting or the queue is full.
    void
    on_packet(std::unique_ptr<sphinx::Packet> pkt);

    /// Returns true if the client's credentials match a registered user.  Safe to call from any
    /// thread; returns false once the provider is halting.
    bool
    authenticate_client(const wire::PeerCredentials& creds);

    /// Stops accepting packets, lets the worker finish everything already queued, then closes the
    /// spool and the user database.  Only the first call does anything.
    void
    halt();

    bool
    halted() const
    {
      return _barrier.closed();
    }

    /// The user database, for provisioning users.
    userdb::UserDB&
    user_db()
    {
      return *_user_db;
    }

    /// The spool, for fetching spooled messages.
    spool::Spool&
    spool()
    {
      return *_spool;
    }

    util::StatusObject
    extract_status() const;

   private:
    void
    start();

    void
    worker();

    void
    process(const sphinx::Packet& pkt);

    void
    on_surb_reply(const sphinx::Packet& pkt, std::string_view recipient);

    void
    on_to_user(const sphinx::Packet& pkt, std::string_view recipient);

    void
    send_surb_ack(const sphinx::Packet& pkt, ustring_view surb);

    IScheduler& _scheduler;
    sphinx::ISURBCrypto& _surb_crypto;

    std::unique_ptr<userdb::UserDB> _user_db;
    std::unique_ptr<spool::Spool> _spool;

    thread::Queue<std::unique_ptr<sphinx::Packet>> _queue;
    util::DrainBarrier _barrier;
    std::thread _worker;
    std::once_flag _halt_once;

    struct Stats
    {
      std::atomic<uint64_t> received{0};
      std::atomic<uint64_t> dropped_halted{0};
      std::atomic<uint64_t> dropped_queue_full{0};
      std::atomic<uint64_t> dropped_invalid_recipient{0};
      std::atomic<uint64_t> dropped_malformed{0};
      std::atomic<uint64_t> messages_stored{0};
      std::atomic<uint64_t> surb_replies_stored{0};
      std::atomic<uint64_t> store_failures{0};
      std::atomic<uint64_t> acks_sent{0};
      std::atomic<uint64_t> ack_failures{0};
    };
    Stats _stats;
  };
}  // namespace mixprov
