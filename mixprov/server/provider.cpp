#include "provider.hpp"

#include <mixprov/sphinx/plaintext_block.hpp>
#include <mixprov/userdb/sqlite_user_db.hpp>
#include <mixprov/util/logging.hpp>
#include <mixprov/util/str.hpp>
#include <mixprov/util/thread/threading.hpp>

namespace mixprov
{
  static auto logcat = log::Cat("provider");

  Provider::Provider(
      const ProviderConfig& conf, IScheduler& scheduler, sphinx::ISURBCrypto& surb_crypto)
      : _scheduler{scheduler}, _surb_crypto{surb_crypto}, _queue{conf.queue_size}
  {
    _user_db = std::make_unique<userdb::SqliteUserDB>(conf.user_db, conf.max_username_size);
    _spool = spool::make_spool(conf);
    start();
  }

  Provider::Provider(
      const ProviderConfig& conf,
      std::unique_ptr<userdb::UserDB> user_db,
      std::unique_ptr<spool::Spool> spool,
      IScheduler& scheduler,
      sphinx::ISURBCrypto& surb_crypto)
      : _scheduler{scheduler}
      , _surb_crypto{surb_crypto}
      , _user_db{std::move(user_db)}
      , _spool{std::move(spool)}
      , _queue{conf.queue_size}
  {
    if (not _user_db or not _spool)
      throw std::invalid_argument{"provider requires a user db and a spool"};
    start();
  }

  Provider::~Provider()
  {
    halt();
  }

  void
  Provider::start()
  {
    if (_queue.capacity() == 0)
      log::info(logcat, "Starting provider backend (unbounded queue)");
    else
      log::info(logcat, "Starting provider backend (queue size {})", _queue.capacity());
    _worker = std::thread{[this] { worker(); }};
  }

  void
  Provider::halt()
  {
    std::call_once(_halt_once, [this] {
      log::info(logcat, "Halting provider backend, {} packets queued", _queue.size());

      // every queued packet holds the barrier, so this returns once the worker has drained them
      _barrier.close_and_wait();
      _queue.disable();
      if (_worker.joinable())
        _worker.join();

      _spool->close();
      _user_db->close();
      log::info(logcat, "Provider backend halted");
    });
  }

  void
  Provider::on_packet(std::unique_ptr<sphinx::Packet> pkt)
  {
    if (not pkt)
      return;
    _stats.received.fetch_add(1, std::memory_order_relaxed);
    if (not _barrier.enter())
    {
      log::debug(logcat, "Dropping packet: {} (Provider halting)", pkt->id);
      _stats.dropped_halted.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    const auto id = pkt->id;
    if (auto ret = _queue.tryPushBack(std::move(pkt)); ret != thread::QueueReturn::Success)
    {
      log::debug(logcat, "Dropping packet: {} ({})", id, thread::to_string(ret));
      if (ret == thread::QueueReturn::QueueFull)
        _stats.dropped_queue_full.fetch_add(1, std::memory_order_relaxed);
      else
        _stats.dropped_halted.fetch_add(1, std::memory_order_relaxed);
      _barrier.leave();
    }
  }

  bool
  Provider::authenticate_client(const wire::PeerCredentials& creds)
  {
    util::DrainGuard guard{_barrier};
    if (not guard)
    {
      log::debug(
          logcat,
          "Auth: rejecting '{}' (Provider halting)",
          printable_bytes(creds.additional_data));
      return false;
    }

    const PubKey* key = creds.public_key ? &*creds.public_key : nullptr;
    const bool valid = _user_db->is_valid(creds.additional_data, key);
    log::debug(
        logcat,
        "Auth: User: '{}', Key: '{}': {}",
        printable_bytes(creds.additional_data),
        key ? key->ToString() : "[none]",
        valid);
    return valid;
  }

  void
  Provider::worker()
  {
    util::SetThreadName("mixprov-spool");

    while (auto pkt = _queue.popFront())
    {
      try
      {
        process(**pkt);
      }
      catch (const std::exception& e)
      {
        log::error(logcat, "Failed to process packet {}: {}", (*pkt)->id, e.what());
      }
      (*pkt)->dispose();
      pkt->reset();
      _barrier.leave();
    }

    log::debug(logcat, "Halting provider worker");
  }

  void
  Provider::process(const sphinx::Packet& pkt)
  {
    const auto* rcpt = pkt.recipient();
    if (not rcpt)
    {
      log::debug(logcat, "Dropping packet: {} (No recipient)", pkt.id);
      _stats.dropped_malformed.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    const auto recipient = rcpt->name();

    if (not _user_db->exists(recipient))
    {
      log::debug(
          logcat,
          "Dropping packet: {} (Invalid Recipient: '{}')",
          pkt.id,
          printable_bytes(recipient));
      _stats.dropped_invalid_recipient.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    if (pkt.is_surb_reply())
      on_surb_reply(pkt, recipient);
    else
      on_to_user(pkt, recipient);
  }

  void
  Provider::on_surb_reply(const sphinx::Packet& pkt, std::string_view recipient)
  {
    try
    {
      _spool->store_surb_reply(recipient, pkt.surb_reply()->id, pkt.payload);
    }
    catch (const std::exception& e)
    {
      log::debug(logcat, "Failed to store SURBReply: {} ({})", pkt.id, e.what());
      _stats.store_failures.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    _stats.surb_replies_stored.fetch_add(1, std::memory_order_relaxed);
    log::debug(logcat, "Stored SURBReply: {}", pkt.id);
  }

  void
  Provider::on_to_user(const sphinx::Packet& pkt, std::string_view recipient)
  {
    std::string_view why;
    auto block = sphinx::decode_plaintext_block(pkt.payload, &why);
    if (not block)
    {
      log::debug(logcat, "Dropping packet: {} ({})", pkt.id, why);
      _stats.dropped_malformed.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    try
    {
      _spool->store_message(recipient, block->ciphertext);
    }
    catch (const std::exception& e)
    {
      log::debug(logcat, "Failed to store message payload: {} ({})", pkt.id, e.what());
      _stats.store_failures.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    _stats.messages_stored.fetch_add(1, std::memory_order_relaxed);

    if (block->surb)
      send_surb_ack(pkt, *block->surb);
    else
      log::debug(logcat, "Stored Message: {} (No SURB)", pkt.id);
  }

  void
  Provider::send_surb_ack(const sphinx::Packet& pkt, ustring_view surb)
  {
    const ustring ack_payload(sphinx::FORWARD_PAYLOAD_LENGTH, 0);

    std::optional<sphinx::SURBPacket> ack_raw;
    try
    {
      ack_raw = _surb_crypto.new_packet_from_surb(surb, ack_payload);
    }
    catch (const std::exception& e)
    {
      log::debug(logcat, "Failed to generate SURB-ACK: {} ({})", pkt.id, e.what());
      _stats.ack_failures.fetch_add(1, std::memory_order_relaxed);
      return;
    }
    if (not ack_raw)
    {
      log::debug(logcat, "Failed to generate SURB-ACK: {}", pkt.id);
      _stats.ack_failures.fetch_add(1, std::memory_order_relaxed);
      return;
    }

    auto ack = sphinx::Packet::make();
    ack->copy_to_raw(ack_raw->raw);
    ack->cmds.reserve(2);
    ack->cmds.emplace_back(sphinx::commands::NextNodeHop{ack_raw->first_hop});
    sphinx::commands::NodeDelay delay;
    if (const auto* d = pkt.node_delay())
      delay = *d;
    ack->cmds.emplace_back(delay);

    ack->recv_at = pkt.recv_at;
    ack->delay = pkt.delay;
    ack->must_forward = true;

    log::debug(logcat, "Handing off user destined SURB-ACK: {} (Src:{})", ack->id, pkt.id);
    _stats.acks_sent.fetch_add(1, std::memory_order_relaxed);
    _scheduler.on_packet(std::move(ack));
  }

  util::StatusObject
  Provider::extract_status() const
  {
    auto load = [](const std::atomic<uint64_t>& v) { return v.load(std::memory_order_relaxed); };
    return util::StatusObject{
        {"halted", _barrier.closed()},
        {"queueSize", _queue.size()},
        {"queueCapacity", _queue.capacity()},
        {"users", _user_db->count()},
        {"packetsReceived", load(_stats.received)},
        {"droppedHalted", load(_stats.dropped_halted)},
        {"droppedQueueFull", load(_stats.dropped_queue_full)},
        {"droppedInvalidRecipient", load(_stats.dropped_invalid_recipient)},
        {"droppedMalformed", load(_stats.dropped_malformed)},
        {"messagesStored", load(_stats.messages_stored)},
        {"surbRepliesStored", load(_stats.surb_replies_stored)},
        {"storeFailures", load(_stats.store_failures)},
        {"acksSent", load(_stats.acks_sent)},
        {"ackFailures", load(_stats.ack_failures)},
    };
  }
}  // namespace mixprov
