#include <mixprov/crypto/crypto.hpp>
#include <mixprov/server/provider.hpp>
#include <mixprov/sphinx/plaintext_block.hpp>
#include <mixprov/userdb/sqlite_user_db.hpp>

#include <mocks/mock_scheduler.hpp>
#include <mocks/mock_spool.hpp>
#include <mocks/mock_surb_crypto.hpp>
#include <mocks/mock_user_db.hpp>
#include <test_util.hpp>

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using namespace mixprov;
using namespace mixprov::sphinx;

namespace
{
  PubKey
  random_key()
  {
    SecretKey sk;
    crypto::encryption_keygen(sk);
    return sk.toPublic();
  }

  ustring
  make_surb()
  {
    ustring surb(SURB_LENGTH, 0);
    for (size_t i = 0; i < surb.size(); i++)
      surb[i] = static_cast<byte_t>(i * 7);
    return surb;
  }

  /// a user destined packet as the sphinx layer would hand it over
  std::unique_ptr<Packet>
  to_user(std::string_view user, ustring payload, uint32_t node_delay = 0)
  {
    auto pkt = Packet::make();
    pkt->copy_to_raw(to_usv("encrypted packet"sv));
    pkt->payload = std::move(payload);
    if (node_delay)
      pkt->cmds.emplace_back(commands::NodeDelay{node_delay});
    pkt->cmds.emplace_back(commands::Recipient{test::makeRecipient(user)});
    return pkt;
  }

  std::unique_ptr<Packet>
  surb_reply(std::string_view user, const SURBID& id, ustring payload)
  {
    auto pkt = Packet::make();
    pkt->payload = std::move(payload);
    pkt->cmds.emplace_back(commands::Recipient{test::makeRecipient(user)});
    pkt->cmds.emplace_back(commands::SURBReply{id});
    return pkt;
  }

  struct ProviderFixture
  {
    const fs::path db_file{test::tempPath()};
    test::FileGuard guard{db_file};

    mocks::RecordingScheduler scheduler;
    mocks::ScriptedSURBCrypto surb_crypto;
    mocks::FailingSpool* spool{nullptr};
    userdb::UserDB* users{nullptr};
    std::unique_ptr<Provider> provider;

    const PubKey alice_key{random_key()};

    explicit ProviderFixture(size_t queue_size = 0)
    {
      ProviderConfig conf;
      conf.queue_size = queue_size;

      auto db = std::make_unique<userdb::SqliteUserDB>(db_file);
      db->add("alice", &alice_key);
      users = db.get();

      auto sp = std::make_unique<mocks::FailingSpool>();
      spool = sp.get();

      surb_crypto.first_hop = test::makeArray<NodeID>(0xab);

      provider = std::make_unique<Provider>(
          conf, std::move(db), std::move(sp), scheduler, surb_crypto);
    }

    ~ProviderFixture()
    {
      if (spool)
        spool->release();
    }

    util::StatusObject
    status() const
    {
      return provider->extract_status();
    }
  };
}  // namespace

TEST_CASE("Provider requires its stores", "[provider]")
{
  mocks::RecordingScheduler scheduler;
  mocks::ScriptedSURBCrypto surb_crypto;
  ProviderConfig conf;

  CHECK_THROWS_AS(
      Provider(conf, nullptr, std::make_unique<spool::MemorySpool>(), scheduler, surb_crypto),
      std::invalid_argument);
}

TEST_CASE("Provider opens its stores from the config", "[provider]")
{
  const auto dir = test::tempPath();
  test::FileGuard guard{dir};
  fs::create_directories(dir);

  mocks::RecordingScheduler scheduler;
  mocks::ScriptedSURBCrypto surb_crypto;
  ProviderConfig conf;
  conf.user_db = dir / "users.db";
  conf.spool_db = dir / "spool.db";

  const auto key = random_key();
  {
    Provider provider{conf, scheduler, surb_crypto};
    provider.user_db().add("alice", &key);
    provider.on_packet(to_user("alice", encode_plaintext_block(to_usv("hi"sv))));
    provider.halt();
  }
  CHECK(fs::exists(conf.user_db));
  CHECK(fs::exists(conf.spool_db));

  Provider provider{conf, scheduler, surb_crypto};
  CHECK(provider.authenticate_client({"alice", key}));
  auto head = provider.spool().get("alice", false);
  REQUIRE(head);
  CHECK(head->message == ustring{to_usv("hi"sv)});
}

TEST_CASE("Provider spools user messages", "[provider]")
{
  ProviderFixture f;
  const auto surb = make_surb();

  SECTION("message with SURB is spooled and acknowledged")
  {
    auto pkt = to_user("alice", encode_plaintext_block(to_usv("hello alice"sv), surb), 5000);
    pkt->recv_at = 123456ms;
    pkt->delay = 42ms;
    f.provider->on_packet(std::move(pkt));
    f.provider->halt();

    auto head = f.spool->get("alice", false);
    REQUIRE(head);
    CHECK(head->message == ustring{to_usv("hello alice"sv)});
    CHECK_FALSE(head->surb_id);

    CHECK(f.surb_crypto.calls == 1);
    CHECK(f.surb_crypto.last_payload_size == FORWARD_PAYLOAD_LENGTH);

    auto acks = f.scheduler.take();
    REQUIRE(acks.size() == 1);
    const auto& ack = *acks.front();
    CHECK(ack.raw == surb);
    CHECK(ack.must_forward);
    CHECK(ack.recv_at == 123456ms);
    CHECK(ack.delay == 42ms);
    REQUIRE(ack.cmds.size() == 2);
    REQUIRE(ack.next_node_hop());
    CHECK(ack.next_node_hop()->id == f.surb_crypto.first_hop);
    REQUIRE(ack.node_delay());
    CHECK(ack.node_delay()->delay == 5000);
    CHECK_FALSE(ack.recipient());

    auto st = f.status();
    CHECK(st["messagesStored"] == 1);
    CHECK(st["acksSent"] == 1);
  }

  SECTION("message without SURB is spooled silently")
  {
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("no reply"sv))));
    f.provider->halt();

    auto head = f.spool->get("alice", false);
    REQUIRE(head);
    CHECK(head->message == ustring{to_usv("no reply"sv)});
    CHECK(f.surb_crypto.calls == 0);
    CHECK(f.scheduler.count() == 0);
  }

  SECTION("ack without a node delay command gets a zero delay")
  {
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("x"sv), surb)));
    f.provider->halt();

    auto acks = f.scheduler.take();
    REQUIRE(acks.size() == 1);
    REQUIRE(acks.front()->node_delay());
    CHECK(acks.front()->node_delay()->delay == 0);
  }

  SECTION("messages are spooled in arrival order")
  {
    for (int i = 0; i < 20; i++)
      f.provider->on_packet(
          to_user("alice", encode_plaintext_block(to_usv("msg {}"_format(i)))));
    f.provider->halt();

    auto head = f.spool->get("alice", false);
    for (int i = 0; i < 20; i++)
    {
      REQUIRE(head);
      CHECK(to_sv(head->message) == "msg {}"_format(i));
      head = f.spool->get("alice", true);
    }
    CHECK_FALSE(head);
  }

  SECTION("received packets are counted")
  {
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("x"sv))));
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("y"sv))));
    f.provider->halt();
    auto st = f.status();
    CHECK(st["packetsReceived"] == 2);
    CHECK(st["messagesStored"] == 2);
    CHECK(st["users"] == 1);
    CHECK(st["queueSize"] == 0);
  }
}

TEST_CASE("Provider drops undeliverable packets", "[provider]")
{
  ProviderFixture f;
  const auto surb = make_surb();

  SECTION("unknown recipient")
  {
    f.provider->on_packet(to_user("mallory", encode_plaintext_block(to_usv("x"sv), surb)));
    f.provider->halt();
    CHECK_FALSE(f.spool->get("mallory", false));
    CHECK(f.spool->stores == 0);
    CHECK(f.status()["droppedInvalidRecipient"] == 1);
  }

  SECTION("no recipient")
  {
    auto pkt = Packet::make();
    pkt->payload = encode_plaintext_block(to_usv("x"sv));
    f.provider->on_packet(std::move(pkt));
    f.provider->halt();
    CHECK(f.spool->stores == 0);
    CHECK(f.status()["droppedMalformed"] == 1);
  }

  SECTION("non-zero reserved byte")
  {
    auto payload = encode_plaintext_block(to_usv("x"sv), surb);
    payload[1] = 1;
    f.provider->on_packet(to_user("alice", std::move(payload)));
    f.provider->halt();
    CHECK_FALSE(f.spool->get("alice", false));
    CHECK(f.surb_crypto.calls == 0);
    CHECK(f.status()["droppedMalformed"] == 1);
  }

  SECTION("unknown flags")
  {
    auto payload = encode_plaintext_block(to_usv("x"sv));
    payload[0] = 2;
    f.provider->on_packet(to_user("alice", std::move(payload)));
    f.provider->halt();
    CHECK_FALSE(f.spool->get("alice", false));
  }

  SECTION("truncated block")
  {
    f.provider->on_packet(to_user("alice", ustring(PLAINTEXT_BLOCK_HEADER_LENGTH - 1, 0)));
    f.provider->halt();
    CHECK_FALSE(f.spool->get("alice", false));
    CHECK(f.status()["droppedMalformed"] == 1);
  }

  SECTION("null packet")
  {
    f.provider->on_packet(nullptr);
    f.provider->halt();
    CHECK(f.status()["packetsReceived"] == 0);
  }
}

TEST_CASE("Provider spools SURB replies", "[provider]")
{
  ProviderFixture f;
  const auto id = test::makeArray<SURBID>(0x5a);

  SECTION("known recipient")
  {
    // SURB replies are stored verbatim, the payload is not parsed as a plaintext block
    f.provider->on_packet(surb_reply("alice", id, ustring{to_usv("\x01\x02reply"sv)}));
    f.provider->halt();

    auto head = f.spool->get("alice", false);
    REQUIRE(head);
    CHECK(head->message == ustring{to_usv("\x01\x02reply"sv)});
    REQUIRE(head->surb_id);
    CHECK(*head->surb_id == id);
    CHECK(f.scheduler.count() == 0);
    CHECK(f.status()["surbRepliesStored"] == 1);
  }

  SECTION("unknown recipient")
  {
    f.provider->on_packet(surb_reply("bob", id, ustring{to_usv("reply"sv)}));
    f.provider->halt();
    CHECK(f.spool->stores == 0);
  }
}

TEST_CASE("Provider failure handling", "[provider]")
{
  ProviderFixture f;
  const auto surb = make_surb();

  SECTION("store failure suppresses the ack")
  {
    f.spool->fail = true;
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("x"sv), surb)));
    f.provider->on_packet(surb_reply("alice", test::makeArray<SURBID>(1), ustring{to_usv("r"sv)}));
    f.provider->halt();
    CHECK(f.surb_crypto.calls == 0);
    CHECK(f.scheduler.count() == 0);
    CHECK(f.status()["storeFailures"] == 2);
  }

  SECTION("ack generation failure keeps the message")
  {
    f.surb_crypto.mode = mocks::ScriptedSURBCrypto::Mode::Fail;
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("x"sv), surb)));
    f.provider->halt();
    CHECK(f.spool->get("alice", false));
    CHECK(f.surb_crypto.calls == 1);
    CHECK(f.scheduler.count() == 0);
    CHECK(f.status()["ackFailures"] == 1);
  }

  SECTION("throwing SURB crypto keeps the message and the worker")
  {
    f.surb_crypto.mode = mocks::ScriptedSURBCrypto::Mode::Throw;
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("first"sv), surb)));
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("second"sv))));
    f.provider->halt();
    CHECK(f.spool->stores == 2);
    CHECK(f.scheduler.count() == 0);
    CHECK(f.status()["ackFailures"] == 1);
  }
}

TEST_CASE("Provider client authentication", "[provider]")
{
  ProviderFixture f;

  CHECK(f.provider->authenticate_client({"alice", f.alice_key}));
  CHECK_FALSE(f.provider->authenticate_client({"alice", random_key()}));
  CHECK_FALSE(f.provider->authenticate_client({"alice", std::nullopt}));
  CHECK_FALSE(f.provider->authenticate_client({"bob", f.alice_key}));
  CHECK_FALSE(f.provider->authenticate_client({"", f.alice_key}));

  SECTION("users added at runtime are visible")
  {
    const auto bob = random_key();
    f.provider->user_db().add("bob", &bob);
    CHECK(f.provider->authenticate_client({"bob", bob}));
  }

  SECTION("rejected after halt")
  {
    f.provider->halt();
    CHECK_FALSE(f.provider->authenticate_client({"alice", f.alice_key}));
  }
}

TEST_CASE("Provider teardown races in-flight authentication", "[provider]")
{
  mocks::RecordingScheduler scheduler;
  mocks::ScriptedSURBCrypto surb_crypto;
  constexpr size_t clients = 4;

  for (int round = 0; round < 50; round++)
  {
    auto db = std::make_unique<mocks::GatedUserDB>();
    auto* gate = db.get();
    auto provider = std::make_unique<Provider>(
        ProviderConfig{},
        std::move(db),
        std::make_unique<spool::MemorySpool>(),
        scheduler,
        surb_crypto);

    std::atomic<size_t> accepted{0};
    std::vector<std::thread> threads;
    for (size_t i = 0; i < clients; i++)
      threads.emplace_back([p = provider.get(), &accepted] {
        if (p->authenticate_client({"alice", PubKey{}}))
          ++accepted;
      });

    // every client is inside the provider before it is torn down, and returns while the
    // provider is halting and being destroyed
    gate->wait_waiting(clients);
    gate->open();
    provider->halt();
    CHECK(gate->closed);
    provider.reset();

    for (auto& t : threads)
      t.join();
    CHECK(accepted == clients);
  }
}

TEST_CASE("Provider halt", "[provider]")
{
  ProviderFixture f;

  SECTION("drains accepted packets before closing the stores")
  {
    f.spool->block();
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("one"sv))));
    f.spool->wait_entered();
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("two"sv))));
    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("three"sv))));

    std::thread halter{[&] { f.provider->halt(); }};
    // halting closes the barrier before waiting on the worker
    while (not f.provider->halted())
      std::this_thread::yield();
    CHECK_FALSE(f.spool->closed);

    f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("late"sv))));
    f.spool->release();
    halter.join();

    CHECK(f.spool->closed);
    CHECK(f.spool->stores == 3);
    auto st = f.status();
    CHECK(st["halted"] == true);
    CHECK(st["droppedHalted"] == 1);
    CHECK(st["messagesStored"] == 3);
  }

  SECTION("is idempotent")
  {
    f.provider->halt();
    f.provider->halt();
    CHECK(f.provider->halted());
    CHECK(f.spool->closed);
  }

  SECTION("closes the user db")
  {
    f.provider->halt();
    const auto key = random_key();
    CHECK_THROWS(f.users->add("carol", &key));
  }
}

TEST_CASE("Provider bounded queue", "[provider]")
{
  ProviderFixture f{2};

  f.spool->block();
  f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("in flight"sv))));
  f.spool->wait_entered();

  // the worker is busy, so the queue fills up
  f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("queued 1"sv))));
  f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("queued 2"sv))));
  f.provider->on_packet(to_user("alice", encode_plaintext_block(to_usv("overflow"sv))));

  auto st = f.status();
  CHECK(st["queueCapacity"] == 2);
  CHECK(st["queueSize"] == 2);
  CHECK(st["droppedQueueFull"] == 1);

  f.spool->release();
  f.provider->halt();

  CHECK(f.spool->stores == 3);
  auto head = f.spool->get("alice", false);
  for (auto expected : {"in flight"sv, "queued 1"sv, "queued 2"sv})
  {
    REQUIRE(head);
    CHECK(to_sv(head->message) == expected);
    head = f.spool->get("alice", true);
  }
  CHECK_FALSE(head);
}
