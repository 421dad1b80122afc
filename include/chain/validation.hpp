// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdint.h>
#include <string>
#include <vector>

// Forward declarations
class CBlockHeader;
class CBlock;
class CTransaction;

namespace blockdag {

namespace chain {
class ChainParams;
} // namespace chain

namespace validation {

/**
 * ============================================================================
 * BLOCK VALIDATION LAYERS
 * ============================================================================
 *
 * LAYER 1: Header in isolation (before the dependency gate)
 * - CheckBlockHeader()           : version, parent layout, nBits range, PoW,
 *                                  future timestamp
 *
 * LAYER 2: Header in context (all parents known, GHOSTDAG computed)
 * - ContextualCheckBlockHeader() : timestamp vs past median time of the
 *                                  selected parent chain
 *   Parent presence/topology and mergeset size are checked by the header
 *   processor itself since they need the DAG stores.
 *
 * LAYER 3: Body (header committed)
 * - CheckBlockBody()             : merkle commitment, tx count, mass,
 *                                  per-tx well-formedness, duplicates,
 *                                  in-block double spends
 *
 * UTXO-level checks (missing inputs, cross-block double spends) belong to
 * the virtual processor and never make a block Invalid.
 * ============================================================================
 */

/**
 * Validation state - tracks why validation failed
 * Simplified from Bitcoin Core's BlockValidationState
 */
class ValidationState {
public:
  enum class Result {
    VALID,
    INVALID, // Invalid block (permanent)
    ERROR    // System error (internal failure, shutdown)
  };

  ValidationState() : result_(Result::VALID) {}

  bool IsValid() const { return result_ == Result::VALID; }
  bool IsInvalid() const { return result_ == Result::INVALID; }
  bool IsError() const { return result_ == Result::ERROR; }

  bool Invalid(const std::string &reject_reason,
               const std::string &debug_message = "") {
    result_ = Result::INVALID;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  bool Error(const std::string &reject_reason,
             const std::string &debug_message = "") {
    result_ = Result::ERROR;
    reject_reason_ = reject_reason;
    debug_message_ = debug_message;
    return false;
  }

  const std::string& GetRejectReason() const { return reject_reason_; }
  const std::string& GetDebugMessage() const { return debug_message_; }

  std::string ToString() const;

private:
  Result result_;
  std::string reject_reason_;
  std::string debug_message_;
};

// CONSENSUS-CRITICAL: Context-free header rules
// Checks: version, non-empty direct parents, parent count, duplicate and
// null parents, level layout, nBits range, PoW (unless skipped), and
// timestamp <= adjusted_time + max future block time
bool CheckBlockHeader(const CBlockHeader &header,
                      const chain::ChainParams &params, int64_t adjusted_time,
                      ValidationState &state);

// CONSENSUS-CRITICAL: Header rules that need the selected parent chain
// Block timestamp must exceed the past median time
bool ContextualCheckBlockHeader(const CBlockHeader &header,
                                int64_t past_median_time,
                                ValidationState &state);

// Transaction well-formedness: non-empty outputs, output values in range,
// no duplicate inputs
bool CheckTransaction(const CTransaction &tx, ValidationState &state);

// CONSENSUS-CRITICAL: Body rules checked before the block is handed to the
// virtual processor
bool CheckBlockBody(const CBlock &block, const chain::ChainParams &params,
                    ValidationState &state);

// Local wall clock in milliseconds (mockable)
int64_t GetAdjustedTime();

} // namespace validation
} // namespace blockdag
