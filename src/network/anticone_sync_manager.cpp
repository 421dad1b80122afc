// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/anticone_sync_manager.hpp"
#include "chain/chainparams.hpp"
#include "chain/dag_traversal.hpp"
#include "chain/stores.hpp"
#include "consensus/consensus.hpp"
#include "network/message.hpp"
#include "network/message_dispatcher.hpp"
#include "network/protocol.hpp"
#include "util/logging.hpp"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/post.hpp>

namespace blockdag {
namespace network {

AnticoneSyncManager::AnticoneSyncManager(boost::asio::io_context &io_context,
                                         consensus::Consensus &consensus,
                                         size_t blocking_threads)
    : io_context_(io_context), consensus_(consensus),
      blocking_pool_(blocking_threads == 0 ? protocol::DEFAULT_SYNC_BLOCKING_THREADS
                                           : blocking_threads) {
  error_handler_ = [](const RouterPtr &router, const ProtocolError &error) {
    LOG_SYNC_WARN("Disconnecting peer={} ({}): {} [{}]", router->id(), router->address(),
                  error.what(), ProtocolErrorKindToString(error.kind()));
    router->Close(error.what());
  };
}

AnticoneSyncManager::~AnticoneSyncManager() { Stop(); }

void AnticoneSyncManager::RegisterHandlers(MessageDispatcher &dispatcher) {
  dispatcher.Route<message::RequestAnticoneMessage>(
      [this](const RouterPtr &router, const message::RequestAnticoneMessage &request) {
        HandleRequestAnticone(router, request);
      });
  dispatcher.Route<message::RequestPruningPointMessage>(
      [this](const RouterPtr &router, const message::RequestPruningPointMessage &request) {
        HandleRequestPruningPoint(router, request);
      });
}

void AnticoneSyncManager::SetErrorHandler(ErrorHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_handler_ = std::move(handler);
}

void AnticoneSyncManager::HandleRequestAnticone(const RouterPtr &router,
                                                const message::RequestAnticoneMessage &request) {
  LOG_SYNC_DEBUG("Received anticone request block={} context={} from peer={}",
                 request.block.ToShortString(), request.context.ToShortString(), router->id());
  Enqueue(router, Request{Request::Kind::Anticone, request.block, request.context});
}

void AnticoneSyncManager::HandleRequestPruningPoint(
    const RouterPtr &router, const message::RequestPruningPointMessage & /*request*/) {
  LOG_SYNC_DEBUG("Received pruning point request from peer={}", router->id());
  Enqueue(router, Request{Request::Kind::PruningPoint, uint256(), uint256()});
}

std::shared_ptr<AnticoneSyncManager::PeerFlow>
AnticoneSyncManager::GetFlow(const RouterPtr &router) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    return nullptr;
  }
  auto it = flows_.find(router->id());
  if (it != flows_.end()) {
    return it->second;
  }
  auto flow = std::make_shared<PeerFlow>(io_context_, router);
  flows_.emplace(router->id(), flow);
  return flow;
}

void AnticoneSyncManager::Enqueue(const RouterPtr &router, Request request) {
  auto flow = GetFlow(router);
  if (!flow) {
    LOG_SYNC_DEBUG("Sync manager stopped, ignoring request from peer={}", router->id());
    return;
  }
  boost::asio::post(flow->strand, [this, flow, request]() {
    flow->queue.push_back(request);
    StartNext(flow);
  });
}

void AnticoneSyncManager::StartNext(const std::shared_ptr<PeerFlow> &flow) {
  if (flow->busy || flow->queue.empty()) {
    return;
  }
  if (flow->router->IsClosed()) {
    flow->queue.clear();
    return;
  }

  const Request request = flow->queue.front();
  flow->queue.pop_front();
  flow->busy = true;

  // Keeps io_context::run() alive until the answer is back on the strand
  auto work = boost::asio::make_work_guard(io_context_);
  boost::asio::post(blocking_pool_, [this, flow, request, work = std::move(work)]() mutable {
    auto answer = std::make_shared<Answer>();
    std::shared_ptr<ProtocolError> error;
    try {
      *answer = request.kind == Request::Kind::Anticone
                    ? AnswerAnticone(request.block, request.context)
                    : AnswerPruningPoint();
    } catch (const ProtocolError &e) {
      error = std::make_shared<ProtocolError>(e);
    } catch (const std::exception &e) {
      error = std::make_shared<ProtocolError>(ProtocolErrorKind::ConsensusError, e.what());
    }
    boost::asio::post(flow->strand,
                      [this, flow, answer, error]() { Complete(flow, answer, error); });
    work.reset();
  });
}

void AnticoneSyncManager::Complete(const std::shared_ptr<PeerFlow> &flow,
                                   std::shared_ptr<Answer> answer,
                                   std::shared_ptr<ProtocolError> error) {
  flow->busy = false;

  if (error) {
    ReportError(flow->router, *error);
  } else {
    bool delivered = true;
    for (auto &msg : *answer) {
      if (!flow->router->Enqueue(std::move(msg))) {
        delivered = false;
        ReportError(flow->router, ProtocolError(ProtocolErrorKind::RouteClosed,
                                                "route to peer " +
                                                    std::to_string(flow->router->id()) +
                                                    " closed"));
        break;
      }
    }
    if (delivered) {
      requests_answered_.fetch_add(1, std::memory_order_relaxed);
    }
  }

  StartNext(flow);
}

AnticoneSyncManager::Answer AnticoneSyncManager::AnswerAnticone(const uint256 &block,
                                                                const uint256 &context) const {
  consensus::Consensus::Session session(consensus_);

  for (const uint256 *hash : {&block, &context}) {
    auto status = session.GetBlockStatus(*hash);
    if (!status || *status == chain::BlockStatus::Invalid) {
      throw ProtocolError(ProtocolErrorKind::UnknownBlock, "unknown block " + hash->ToString());
    }
  }

  // Bounded by the mergeset limit since relayed blocks enter the virtual
  // mergeset; the factor covers blocks added while the peer syncs
  const size_t limit = static_cast<size_t>(
      consensus_.GetParams().GetConsensus().mergesetSizeLimit * protocol::ANTICONE_LIMIT_FACTOR);

  std::vector<CBlockHeader> headers;
  try {
    const std::vector<uint256> hashes = session.GetAnticone(block, context, limit);
    headers.reserve(hashes.size());
    for (const auto &hash : hashes) {
      headers.push_back(*session.GetHeader(hash));
    }
  } catch (const chain::TraversalLimitError &e) {
    throw ProtocolError(ProtocolErrorKind::TraversalLimit, e.what());
  } catch (const chain::StoreError &e) {
    throw ProtocolError(ProtocolErrorKind::ConsensusError, e.what());
  }

  LOG_SYNC_DEBUG("Got {} headers in anticone({}) cap past({})", headers.size(),
                 block.ToShortString(), context.ToShortString());

  Answer answer;
  answer.push_back(std::make_unique<message::BlockHeadersMessage>(std::move(headers)));
  answer.push_back(std::make_unique<message::DoneHeadersMessage>());
  return answer;
}

AnticoneSyncManager::Answer AnticoneSyncManager::AnswerPruningPoint() const {
  consensus::Consensus::Session session(consensus_);
  const auto pruning_point = session.GetPruningPoint();

  Answer answer;
  answer.push_back(
      std::make_unique<message::PruningPointMessage>(pruning_point.hash, pruning_point.blue_score));
  return answer;
}

void AnticoneSyncManager::ReportError(const RouterPtr &router, const ProtocolError &error) {
  ErrorHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = error_handler_;
  }
  if (handler) {
    handler(router, error);
  }
}

void AnticoneSyncManager::RemovePeer(uint64_t peer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  flows_.erase(peer_id);
}

size_t AnticoneSyncManager::PeerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return flows_.size();
}

uint64_t AnticoneSyncManager::RequestsAnswered() const {
  return requests_answered_.load(std::memory_order_relaxed);
}

void AnticoneSyncManager::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    flows_.clear();
  }
  blocking_pool_.join();
}

} // namespace network
} // namespace blockdag
