// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Anticone and pruning point queries answered to peers

#include <catch2/catch_test_macros.hpp>
#include "chain/chainparams.hpp"
#include "chain/dag_traversal.hpp"
#include "consensus/consensus.hpp"
#include "network/anticone_sync_manager.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/protocol.hpp"
#include "test_blocks.hpp"
#include "test_router.hpp"
#include <boost/asio/io_context.hpp>
#include <optional>

using namespace blockdag;
using namespace blockdag::test;
using network::ProtocolErrorKind;
using DispatchResult = network::MessageDispatcher::Result;

namespace {

struct CapturedError {
  uint64_t peer_id;
  ProtocolErrorKind kind;
};

// Consensus with a small fork:
//   G <- A
//   G <- B1 <- B2
//   C = {A, B2}
struct ForkFixture {
  std::unique_ptr<chain::ChainParams> params{chain::ChainParams::CreateRegTest()};
  consensus::Consensus consensus{*params, TestConfig()};
  TestDag dag{*params};
  CBlock a, b1, b2, c;

  ForkFixture() {
    a = dag.Block({dag.Genesis()});
    b1 = dag.Block({dag.Genesis()});
    b2 = dag.Block({b1.GetHash()});
    c = dag.Block({a.GetHash(), b2.GetHash()});
    for (const auto *block : {&a, &b1, &b2, &c}) {
      SubmitAndWait(consensus, *block);
    }
    consensus.WaitIdle();
  }
};

} // namespace

TEST_CASE("Anticone request is answered in blue work order", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  auto router = std::make_shared<FakeRouter>(1);

  message::RequestAnticoneMessage request(fx.a.GetHash(), fx.c.GetHash());
  sync.HandleRequestAnticone(router, request);
  io.run();

  REQUIRE(router->Commands() == std::vector<std::string>{protocol::commands::BLOCK_HEADERS,
                                                         protocol::commands::DONE_HEADERS});
  const auto *headers = router->Sent<message::BlockHeadersMessage>(0);
  REQUIRE(headers != nullptr);
  REQUIRE(headers->headers.size() == 2);
  REQUIRE(headers->headers[0].GetHash() == fx.b1.GetHash());
  REQUIRE(headers->headers[1].GetHash() == fx.b2.GetHash());

  // Non-decreasing blue work across the answer
  for (size_t i = 1; i < headers->headers.size(); ++i) {
    auto prev = fx.consensus.GetGhostdagData(headers->headers[i - 1].GetHash());
    auto next = fx.consensus.GetGhostdagData(headers->headers[i].GetHash());
    REQUIRE(prev->blue_work <= next->blue_work);
  }

  REQUIRE(sync.RequestsAnswered() == 1);
  REQUIRE(sync.PeerCount() == 1);
  REQUIRE_FALSE(router->IsClosed());
}

TEST_CASE("Anticone inside the block's own future is empty", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  auto router = std::make_shared<FakeRouter>(2);

  // past(b2) is b1 and genesis, none of which is in the anticone of b1
  message::RequestAnticoneMessage request(fx.b1.GetHash(), fx.b2.GetHash());
  sync.HandleRequestAnticone(router, request);
  io.run();

  REQUIRE(router->SentCount() == 2);
  const auto *headers = router->Sent<message::BlockHeadersMessage>(0);
  REQUIRE(headers != nullptr);
  REQUIRE(headers->headers.empty());
  REQUIRE(router->Sent<message::DoneHeadersMessage>(1) != nullptr);
}

TEST_CASE("Unknown block in an anticone request disconnects the peer", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  auto router = std::make_shared<FakeRouter>(3);

  SECTION("Default handler closes the route") {
    message::RequestAnticoneMessage request(uint256S("0xdead"), fx.c.GetHash());
    sync.HandleRequestAnticone(router, request);
    io.run();

    REQUIRE(router->SentCount() == 0);
    REQUIRE(router->IsClosed());
    REQUIRE_FALSE(router->CloseReason().empty());
    REQUIRE(sync.RequestsAnswered() == 0);
  }

  SECTION("Custom handler sees the error kind") {
    std::optional<CapturedError> captured;
    sync.SetErrorHandler([&](const network::RouterPtr &r, const network::ProtocolError &e) {
      captured = CapturedError{r->id(), e.kind()};
    });

    message::RequestAnticoneMessage request(fx.a.GetHash(), uint256S("0xbeef"));
    sync.HandleRequestAnticone(router, request);
    io.run();

    REQUIRE(captured.has_value());
    REQUIRE(captured->peer_id == 3);
    REQUIRE(captured->kind == ProtocolErrorKind::UnknownBlock);
    REQUIRE_FALSE(router->IsClosed());
  }
}

TEST_CASE("Anticone requests past the traversal bound are refused", "[network][anticone]") {
  auto params = chain::ChainParams::CreateRegTest();
  params->SetGhostdagK(1); // Traversal bound becomes 2 * 10
  consensus::Consensus consensus(*params, TestConfig());
  TestDag dag(*params);

  CBlock side = dag.Block({dag.Genesis()});
  SubmitAndWait(consensus, side);
  auto chain_blocks = dag.Chain(dag.Genesis(), 25);
  for (const auto &block : chain_blocks) {
    SubmitAndWait(consensus, block);
  }
  consensus.WaitIdle();

  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, consensus, 1);
  std::optional<ProtocolErrorKind> kind;
  sync.SetErrorHandler(
      [&](const network::RouterPtr &, const network::ProtocolError &e) { kind = e.kind(); });
  auto router = std::make_shared<FakeRouter>(4);

  message::RequestAnticoneMessage request(side.GetHash(), chain_blocks.back().GetHash());
  sync.HandleRequestAnticone(router, request);
  io.run();

  REQUIRE(kind == ProtocolErrorKind::TraversalLimit);
  REQUIRE(router->SentCount() == 0);
}

TEST_CASE("Anticone exactly at the traversal bound is answered", "[network][anticone]") {
  auto params = chain::ChainParams::CreateRegTest();
  params->SetGhostdagK(1); // Traversal bound becomes 2 * 10
  consensus::Consensus consensus(*params, TestConfig());
  TestDag dag(*params);

  //   G <- A
  //   G <- S1 <- ... <- S20
  //   C = {A, S20}
  CBlock a = dag.Block({dag.Genesis()});
  SubmitAndWait(consensus, a);
  auto side_chain = dag.Chain(dag.Genesis(), 20);
  for (const auto &block : side_chain) {
    SubmitAndWait(consensus, block);
  }
  CBlock c = dag.Block({a.GetHash(), side_chain.back().GetHash()});
  REQUIRE(SubmitAndWait(consensus, c).state.IsValid());
  consensus.WaitIdle();

  {
    consensus::Consensus::Session session(consensus);
    REQUIRE(session.GetAnticone(a.GetHash(), c.GetHash(), 20).size() == 20);
    REQUIRE_THROWS_AS(session.GetAnticone(a.GetHash(), c.GetHash(), 19),
                      chain::TraversalLimitError);
  }

  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, consensus, 1);
  auto router = std::make_shared<FakeRouter>(5);

  message::RequestAnticoneMessage request(a.GetHash(), c.GetHash());
  sync.HandleRequestAnticone(router, request);
  io.run();

  const auto *headers = router->Sent<message::BlockHeadersMessage>(0);
  REQUIRE(headers != nullptr);
  REQUIRE(headers->headers.size() == 20);
  REQUIRE_FALSE(router->IsClosed());
}

TEST_CASE("Pruning point request reports the current pruning point", "[network][pruning]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  auto router = std::make_shared<FakeRouter>(5);

  message::RequestPruningPointMessage request;
  sync.HandleRequestPruningPoint(router, request);
  io.run();

  const auto *answer = router->Sent<message::PruningPointMessage>(0);
  REQUIRE(answer != nullptr);
  REQUIRE(answer->hash == fx.dag.Genesis());
  REQUIRE(answer->blue_score == 0);
}

TEST_CASE("Requests from one peer are answered in order", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 2);
  network::MessageDispatcher dispatcher;
  sync.RegisterHandlers(dispatcher);
  REQUIRE(dispatcher.HasRoute(protocol::commands::REQUEST_ANTICONE));
  REQUIRE(dispatcher.HasRoute(protocol::commands::REQUEST_PRUNING_POINT));

  auto router = std::make_shared<FakeRouter>(6);
  message::RequestAnticoneMessage anticone(fx.a.GetHash(), fx.c.GetHash());
  message::RequestPruningPointMessage pruning_point;

  REQUIRE(dispatcher.Dispatch(router, anticone) == DispatchResult::Handled);
  REQUIRE(dispatcher.Dispatch(router, pruning_point) == DispatchResult::Handled);
  REQUIRE(dispatcher.Dispatch(router, anticone) == DispatchResult::Handled);
  io.run();

  REQUIRE(router->Commands() ==
          std::vector<std::string>{protocol::commands::BLOCK_HEADERS,
                                   protocol::commands::DONE_HEADERS,
                                   protocol::commands::PRUNING_POINT,
                                   protocol::commands::BLOCK_HEADERS,
                                   protocol::commands::DONE_HEADERS});
  REQUIRE(sync.RequestsAnswered() == 3);
}

TEST_CASE("Wrong message type is a protocol error", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  network::MessageDispatcher dispatcher;
  sync.RegisterHandlers(dispatcher);
  auto router = std::make_shared<FakeRouter>(7);

  // Claims the anticone command without carrying a request
  struct MislabeledMessage : message::Message {
    std::string command() const override { return protocol::commands::REQUEST_ANTICONE; }
  };
  MislabeledMessage wrong;

  REQUIRE(dispatcher.Dispatch(router, wrong) == DispatchResult::Rejected);
  REQUIRE(dispatcher.RejectedCount() == 1);
  REQUIRE(router->IsClosed());
  REQUIRE(sync.PeerCount() == 0);
  REQUIRE(io.run() == 0);
}

TEST_CASE("Closed routes get no answers", "[network][anticone]") {
  ForkFixture fx;
  boost::asio::io_context io;
  network::AnticoneSyncManager sync(io, fx.consensus, 1);
  auto router = std::make_shared<FakeRouter>(8);
  router->Close("gone");

  message::RequestPruningPointMessage request;
  sync.HandleRequestPruningPoint(router, request);
  io.run();

  REQUIRE(router->SentCount() == 0);
  REQUIRE(sync.RequestsAnswered() == 0);

  sync.RemovePeer(router->id());
  REQUIRE(sync.PeerCount() == 0);

  sync.Stop();
  io.restart();
  sync.HandleRequestPruningPoint(router, request);
  REQUIRE(io.run() == 0);
}
