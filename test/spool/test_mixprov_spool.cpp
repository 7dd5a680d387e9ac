#include <mixprov/spool/memory_spool.hpp>
#include <mixprov/spool/orm.hpp>
#include <mixprov/spool/sqlite_spool.hpp>

#include <test_util.hpp>

#include <catch2/catch.hpp>

#include <thread>
#include <vector>

using namespace mixprov;
using namespace mixprov::spool;

namespace
{
  ustring
  msg(std::string_view s)
  {
    return ustring{to_usv(s)};
  }

  void
  check_fifo(Spool& spool)
  {
    CHECK_FALSE(spool.get("alice", false));
    CHECK_FALSE(spool.get("alice", true));

    spool.store_message("alice", to_usv("one"sv));
    spool.store_message("bob", to_usv("bob's"sv));
    const auto surb_id = test::makeArray<sphinx::SURBID>(0x42);
    spool.store_surb_reply("alice", surb_id, to_usv("two"sv));
    spool.store_message("alice", to_usv("three"sv));

    // peeking does not consume
    auto head = spool.get("alice", false);
    REQUIRE(head);
    CHECK(head->message == msg("one"));
    CHECK_FALSE(head->surb_id);
    head = spool.get("alice", false);
    REQUIRE(head);
    CHECK(head->message == msg("one"));

    // advancing drops the head and returns the next entry
    head = spool.get("alice", true);
    REQUIRE(head);
    CHECK(head->message == msg("two"));
    REQUIRE(head->surb_id);
    CHECK(*head->surb_id == surb_id);

    head = spool.get("alice", true);
    REQUIRE(head);
    CHECK(head->message == msg("three"));
    CHECK_FALSE(head->surb_id);

    CHECK_FALSE(spool.get("alice", true));
    CHECK_FALSE(spool.get("alice", false));

    // other users are untouched
    head = spool.get("bob", false);
    REQUIRE(head);
    CHECK(head->message == msg("bob's"));
  }

  void
  check_binary_messages(Spool& spool)
  {
    ustring payload;
    for (int i = 0; i < 256; i++)
      payload.push_back(static_cast<byte_t>(i));
    spool.store_message("alice", payload);
    auto head = spool.get("alice", false);
    REQUIRE(head);
    CHECK(head->message == payload);
  }

  void
  check_closed(Spool& spool)
  {
    spool.close();
    CHECK_THROWS(spool.store_message("alice", to_usv("late"sv)));
    CHECK_THROWS(
        spool.store_surb_reply("alice", test::makeArray<sphinx::SURBID>(1), to_usv("late"sv)));
    CHECK_THROWS(spool.get("alice", false));
    // closing twice is harmless
    CHECK_NOTHROW(spool.close());
  }

  void
  check_concurrent_writers(Spool& spool)
  {
    constexpr int writers = 4;
    constexpr int per_writer = 50;
    std::vector<std::thread> threads;
    for (int w = 0; w < writers; w++)
      threads.emplace_back([&spool, w] {
        const auto user = "user{}"_format(w);
        for (int i = 0; i < per_writer; i++)
          spool.store_message(user, to_usv("{}"_format(i)));
      });
    for (auto& t : threads)
      t.join();

    for (int w = 0; w < writers; w++)
    {
      const auto user = "user{}"_format(w);
      auto head = spool.get(user, false);
      for (int i = 0; i < per_writer; i++)
      {
        REQUIRE(head);
        CHECK(head->message == msg("{}"_format(i)));
        head = spool.get(user, true);
      }
      CHECK_FALSE(head);
    }
  }
}  // namespace

TEST_CASE("Memory spool", "[spool]")
{
  MemorySpool spool;

  SECTION("fifo")
  {
    check_fifo(spool);
  }
  SECTION("binary")
  {
    check_binary_messages(spool);
  }
  SECTION("closed")
  {
    check_closed(spool);
  }
  SECTION("concurrent")
  {
    check_concurrent_writers(spool);
  }
}

TEST_CASE("Sqlite spool", "[spool]")
{
  const auto file = test::tempPath();
  test::FileGuard guard{file};
  SqliteSpool spool{file};

  SECTION("fifo")
  {
    check_fifo(spool);
  }
  SECTION("binary")
  {
    check_binary_messages(spool);
  }
  SECTION("closed")
  {
    check_closed(spool);
  }
  SECTION("concurrent")
  {
    check_concurrent_writers(spool);
  }
}

TEST_CASE("Sqlite spool persistence", "[spool]")
{
  const auto file = test::tempPath();
  test::FileGuard guard{file};
  const auto surb_id = test::makeArray<sphinx::SURBID>(7);
  {
    SqliteSpool spool{file};
    spool.store_message("alice", to_usv("one"sv));
    spool.store_surb_reply("alice", surb_id, to_usv("two"sv));
    spool.store_message("alice", to_usv("three"sv));
    CHECK(spool.get("alice", true));
  }

  const auto perms = fs::status(file).permissions() & fs::perms::mask;
  CHECK(perms == (fs::perms::owner_read | fs::perms::owner_write));

  SqliteSpool spool{file};
  auto head = spool.get("alice", false);
  REQUIRE(head);
  CHECK(head->message == msg("two"));
  REQUIRE(head->surb_id);
  CHECK(*head->surb_id == surb_id);

  SECTION("malformed SURB id")
  {
    auto storage = init_storage(file.string());
    auto rows = storage.get_all<SpoolRow>();
    REQUIRE(rows.size() == 2);
    auto& row = rows.front();
    row.surb_id.resize(3);
    storage.replace(row);
    CHECK_THROWS_AS(spool.get("alice", false), SpoolError);
  }
}

TEST_CASE("Spool factory", "[spool]")
{
  const auto dir = test::tempPath();
  test::FileGuard guard{dir};
  fs::create_directories(dir);

  ProviderConfig conf;
  conf.spool_db = dir / "spool.db";

  SECTION("sqlite")
  {
    auto spool = make_spool(conf);
    REQUIRE(spool);
    CHECK(dynamic_cast<SqliteSpool*>(spool.get()));
    CHECK(fs::exists(conf.spool_db));
  }
  SECTION("memory")
  {
    conf.spool_type = SpoolType::memory;
    auto spool = make_spool(conf);
    REQUIRE(spool);
    CHECK(dynamic_cast<MemorySpool*>(spool.get()));
    CHECK_FALSE(fs::exists(conf.spool_db));
  }
}
