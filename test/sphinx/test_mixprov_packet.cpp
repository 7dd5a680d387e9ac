#include <mixprov/sphinx/packet.hpp>

#include <test_util.hpp>

#include <catch2/catch.hpp>

using namespace mixprov;
using namespace mixprov::sphinx;

TEST_CASE("Packet ids are unique and increasing", "[sphinx]")
{
  auto a = Packet::make();
  auto b = Packet::make();
  CHECK(b->id > a->id);
}

TEST_CASE("Packet command accessors", "[sphinx]")
{
  auto pkt = Packet::make();
  CHECK_FALSE(pkt->recipient());
  CHECK_FALSE(pkt->is_to_user());

  pkt->cmds.emplace_back(commands::NodeDelay{1234});
  pkt->cmds.emplace_back(commands::Recipient{test::makeRecipient("alice")});

  REQUIRE(pkt->node_delay());
  CHECK(pkt->node_delay()->delay == 1234);
  REQUIRE(pkt->recipient());
  CHECK(pkt->recipient()->name() == "alice");
  CHECK(pkt->is_to_user());
  CHECK_FALSE(pkt->is_surb_reply());
  CHECK_FALSE(pkt->next_node_hop());

  pkt->cmds.emplace_back(commands::SURBReply{test::makeArray<SURBID>(7)});
  CHECK(pkt->is_surb_reply());
  CHECK_FALSE(pkt->is_to_user());
  CHECK(pkt->surb_reply()->id == test::makeArray<SURBID>(7));
}

TEST_CASE("Recipient name strips only trailing NULs", "[sphinx]")
{
  auto id = test::makeRecipient(std::string_view{"a\0b", 3});
  CHECK(commands::Recipient{id}.name() == std::string_view{"a\0b", 3});

  CHECK(commands::Recipient{}.name().empty());

  RecipientID full;
  full.fill('x');
  CHECK(commands::Recipient{full}.name().size() == RECIPIENT_ID_LENGTH);
}

TEST_CASE("Packet dispose", "[sphinx]")
{
  auto pkt = Packet::make();
  pkt->copy_to_raw(to_usv("raw packet bytes"));
  pkt->payload = ustring(100, 0x33);
  pkt->cmds.emplace_back(commands::NodeDelay{1});

  CHECK_FALSE(pkt->disposed());
  pkt->dispose();
  CHECK(pkt->disposed());
  CHECK(pkt->raw.empty());
  CHECK(pkt->payload.empty());
  CHECK(pkt->cmds.empty());

  // idempotent
  pkt->dispose();
  CHECK(pkt->disposed());
}
