// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/protocol_error.hpp"
#include "network/router.hpp"
#include "util/uint.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace blockdag {

namespace consensus {
class Consensus;
} // namespace consensus

namespace message {
class Message;
class RequestAnticoneMessage;
class RequestPruningPointMessage;
} // namespace message

namespace network {

class MessageDispatcher;

/**
 * AnticoneSyncManager - answers peer DAG queries
 *
 * Handles:
 * - REQUESTANTICONE(block, context): anticone(block) within past(context),
 *   answered with BLOCKHEADERS (ascending blue work) then DONEHEADERS
 * - REQUESTPRUNINGPOINT: answered with PRUNINGPOINT(hash, blue_score)
 *
 * Threading:
 * - Each peer gets a strand on the protocol io_context and a FIFO of
 *   requests; one request per peer is in flight, so answers keep request
 *   order
 * - Consensus queries run inside a Consensus::Session on a separate
 *   boost::asio::thread_pool so the io_context never blocks on traversal
 * - Results are posted back to the peer's strand and queued on its Router
 *
 * Errors reach the error handler as ProtocolError; the default handler
 * closes the route.
 *
 * LIFETIME: Consensus must outlive this manager, and the io_context must be
 * drained or stopped before the manager is destroyed.
 */
class AnticoneSyncManager {
public:
  using ErrorHandler = std::function<void(const RouterPtr &, const ProtocolError &)>;

  AnticoneSyncManager(boost::asio::io_context &io_context, consensus::Consensus &consensus,
                      size_t blocking_threads);
  ~AnticoneSyncManager();

  AnticoneSyncManager(const AnticoneSyncManager &) = delete;
  AnticoneSyncManager &operator=(const AnticoneSyncManager &) = delete;

  // Route REQUESTANTICONE and REQUESTPRUNINGPOINT to this manager
  void RegisterHandlers(MessageDispatcher &dispatcher);

  // Replace the default (disconnecting) error handler
  void SetErrorHandler(ErrorHandler handler);

  // Queue a request for the peer; answers arrive on its Router
  void HandleRequestAnticone(const RouterPtr &router,
                             const message::RequestAnticoneMessage &request);
  void HandleRequestPruningPoint(const RouterPtr &router,
                                 const message::RequestPruningPointMessage &request);

  // Drop per-peer state (requests already in flight still complete)
  void RemovePeer(uint64_t peer_id);

  size_t PeerCount() const;
  uint64_t RequestsAnswered() const;

  // Wait for blocking work to finish and stop accepting more
  void Stop();

private:
  struct Request {
    enum class Kind { Anticone, PruningPoint };
    Kind kind;
    uint256 block;
    uint256 context;
  };

  struct PeerFlow {
    explicit PeerFlow(boost::asio::io_context &io, RouterPtr r)
        : strand(boost::asio::make_strand(io)), router(std::move(r)) {}

    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    RouterPtr router;
    std::deque<Request> queue; // Strand-only
    bool busy{false};          // Strand-only
  };

  using Answer = std::vector<std::unique_ptr<message::Message>>;

  std::shared_ptr<PeerFlow> GetFlow(const RouterPtr &router);
  void Enqueue(const RouterPtr &router, Request request);

  // Strand: start the next queued request if none is in flight
  void StartNext(const std::shared_ptr<PeerFlow> &flow);

  // Strand: hand an answer (or error) to the router
  void Complete(const std::shared_ptr<PeerFlow> &flow, std::shared_ptr<Answer> answer,
                std::shared_ptr<ProtocolError> error);

  // Blocking pool: run the consensus query
  Answer AnswerAnticone(const uint256 &block, const uint256 &context) const;
  Answer AnswerPruningPoint() const;

  void ReportError(const RouterPtr &router, const ProtocolError &error);

  boost::asio::io_context &io_context_;
  consensus::Consensus &consensus_;
  boost::asio::thread_pool blocking_pool_;

  mutable std::mutex mutex_;
  std::unordered_map<uint64_t, std::shared_ptr<PeerFlow>> flows_;
  ErrorHandler error_handler_;
  bool stopped_{false};

  std::atomic<uint64_t> requests_answered_{0};
};

} // namespace network
} // namespace blockdag
