#ifndef S3MP_LIBTRANSFER_S3MP_MULTIPARTSESSION_H_
#define S3MP_LIBTRANSFER_S3MP_MULTIPARTSESSION_H_

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "s3mp/EventSink.h"
#include "s3mp/ObjectLocator.h"
#include "s3mp/Part.h"
#include "s3mp/Result.h"
#include "s3mp/StorageClient.h"
#include "s3mp/config.h"

namespace s3mp {

/// A MultipartSession is the lifecycle of one multipart transaction on the
/// service:
///
///     Uninitiated -> Active -> Completing -> Closed
///                       \---> Aborting ---/
///
/// A session that is still Active when destroyed is aborted, so a
/// transaction is never left open because of an early return. A session is
/// finalized at most once: exactly one of CompleteMultipart or
/// AbortMultipart is sent for an initiated transaction.
///
/// Only the coordinating thread touches a session; workers report through
/// PartResults.
class S3MP_EXPORT MultipartSession {
public:
  enum class State {
    Uninitiated,
    Active,
    Completing,
    Aborting,
    Closed,
  };

  /// Outcome records how a Closed session ended
  enum class Outcome {
    None,
    Completed,
    FinalizeFailed,
    Aborted,
    AbortFailed,
    InitiateFailed,
  };

  MultipartSession(
      StorageClient* client, ObjectLocator dest, WriteOptions opts,
      EventSink* sink = nullptr)
      : client_(client),
        dest_(std::move(dest)),
        opts_(std::move(opts)),
        sink_(sink) {}

  ~MultipartSession();

  MultipartSession(const MultipartSession&) = delete;
  MultipartSession& operator=(const MultipartSession&) = delete;

  /// Initiate opens the transaction. On failure the session is Closed.
  Result<void> Initiate();

  /// Submit records that a part has been handed to a worker
  Result<void> Submit(uint32_t part_index);

  /// Acknowledge records the result of a submitted part
  Result<void> Acknowledge(const PartResult& result);

  /// ReadyToComplete is true if at least one part was submitted and every
  /// submitted part has succeeded
  bool ReadyToComplete() const;

  /// Complete finalizes the transaction with the acknowledged parts in part
  /// index order.
  ///
  /// If some submitted part has not succeeded, nothing is sent, an
  /// ErrorCode::InvalidState error is returned and the session stays Active
  /// so the caller can Abort. If the service rejects the finalize, the
  /// session is Closed with ErrorCode::TransactionFinalizeError; the
  /// transaction is left for external cleanup.
  Result<void> Complete();

  /// Abort discards the transaction. Abort on a Closed session is a no-op.
  Result<void> Abort();

  State state() const { return state_; }
  Outcome outcome() const { return outcome_; }
  const std::string& transaction_id() const { return transaction_id_; }
  const ObjectLocator& destination() const { return dest_; }
  size_t num_submitted() const { return submitted_.size(); }
  size_t num_acknowledged() const { return acks_.size(); }

private:
  void Emit(Verbosity level, const std::string& name, const std::string& msg);

  StorageClient* client_;
  ObjectLocator dest_;
  WriteOptions opts_;
  EventSink* sink_;

  State state_{State::Uninitiated};
  Outcome outcome_{Outcome::None};
  std::string transaction_id_;
  std::set<uint32_t> submitted_;
  std::set<uint32_t> failed_;
  std::map<uint32_t, std::string> acks_;
};

S3MP_EXPORT const char* SessionStateName(MultipartSession::State state);

}  // namespace s3mp

#endif
