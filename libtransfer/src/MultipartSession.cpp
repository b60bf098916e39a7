#include "s3mp/MultipartSession.h"

#include <fmt/format.h>

#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"

const char*
s3mp::SessionStateName(MultipartSession::State state) {
  switch (state) {
  case MultipartSession::State::Uninitiated:
    return "uninitiated";
  case MultipartSession::State::Active:
    return "active";
  case MultipartSession::State::Completing:
    return "completing";
  case MultipartSession::State::Aborting:
    return "aborting";
  case MultipartSession::State::Closed:
    return "closed";
  }
  return "unknown";
}

s3mp::MultipartSession::~MultipartSession() {
  if (state_ != State::Active) {
    return;
  }
  if (auto res = Abort(); !res) {
    S3MP_LOG_ERROR(
        "abandoning transaction {} for {}: {}", transaction_id_, dest_,
        res.error());
  }
}

void
s3mp::MultipartSession::Emit(
    Verbosity level, const std::string& name, const std::string& msg) {
  if (!sink_) {
    return;
  }
  sink_->Emit(
      level, name, msg,
      Tags{
          {"txn", transaction_id_},
          {"dest", dest_.string()},
      });
}

s3mp::Result<void>
s3mp::MultipartSession::Initiate() {
  if (state_ != State::Uninitiated) {
    return S3MP_ERROR(
        ErrorCode::InvalidState, "cannot initiate a session that is {}",
        SessionStateName(state_));
  }

  auto id_res = client_->InitiateMultipart(dest_, opts_);
  if (!id_res) {
    state_ = State::Closed;
    outcome_ = Outcome::InitiateFailed;
    return id_res.error().WithContext("initiating upload to {}", dest_);
  }

  transaction_id_ = std::move(id_res.value());
  state_ = State::Active;
  Emit(
      Verbosity::Verbose, "session.initiated",
      fmt::format("opened transaction {}", transaction_id_));
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MultipartSession::Submit(uint32_t part_index) {
  if (state_ != State::Active) {
    return S3MP_ERROR(
        ErrorCode::InvalidState,
        "cannot submit part {} to a session that is {}", part_index,
        SessionStateName(state_));
  }
  if (!submitted_.emplace(part_index).second) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "part {} submitted twice", part_index);
  }
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MultipartSession::Acknowledge(const PartResult& result) {
  if (state_ != State::Active) {
    return S3MP_ERROR(
        ErrorCode::InvalidState,
        "cannot acknowledge part {} in a session that is {}",
        result.part_index, SessionStateName(state_));
  }
  if (submitted_.count(result.part_index) == 0) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "part {} was never submitted",
        result.part_index);
  }

  if (result.succeeded()) {
    failed_.erase(result.part_index);
    acks_[result.part_index] = result.tag;
  } else {
    acks_.erase(result.part_index);
    failed_.emplace(result.part_index);
  }
  return ResultSuccess();
}

bool
s3mp::MultipartSession::ReadyToComplete() const {
  return state_ == State::Active && !submitted_.empty() && failed_.empty() &&
         acks_.size() == submitted_.size();
}

s3mp::Result<void>
s3mp::MultipartSession::Complete() {
  if (state_ != State::Active) {
    return S3MP_ERROR(
        ErrorCode::InvalidState, "cannot complete a session that is {}",
        SessionStateName(state_));
  }
  if (!ReadyToComplete()) {
    return S3MP_ERROR(
        ErrorCode::InvalidState,
        "cannot complete transaction {}: {} of {} parts succeeded",
        transaction_id_, acks_.size(), submitted_.size());
  }

  std::vector<PartAck> parts;
  parts.reserve(acks_.size());
  for (const auto& [index, tag] : acks_) {
    parts.emplace_back(PartAck{index, tag});
  }

  state_ = State::Completing;
  auto res = client_->CompleteMultipart(dest_, transaction_id_, parts);
  state_ = State::Closed;

  if (!res) {
    outcome_ = Outcome::FinalizeFailed;
    return res.error().WithContext(
        ErrorCode::TransactionFinalizeError,
        "completing transaction {} for {}; the parts are left for cleanup",
        transaction_id_, dest_);
  }

  outcome_ = Outcome::Completed;
  Emit(
      Verbosity::Verbose, "session.completed",
      fmt::format(
          "completed transaction {} with {} parts", transaction_id_,
          parts.size()));
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MultipartSession::Abort() {
  if (state_ == State::Closed) {
    return ResultSuccess();
  }
  if (state_ != State::Active) {
    return S3MP_ERROR(
        ErrorCode::InvalidState, "cannot abort a session that is {}",
        SessionStateName(state_));
  }

  state_ = State::Aborting;
  auto res = client_->AbortMultipart(dest_, transaction_id_);
  state_ = State::Closed;

  if (!res) {
    outcome_ = Outcome::AbortFailed;
    return res.error().WithContext(
        ErrorCode::TransactionFinalizeError, "aborting transaction {} for {}",
        transaction_id_, dest_);
  }

  outcome_ = Outcome::Aborted;
  Emit(
      Verbosity::Info, "session.aborted",
      fmt::format("aborted transaction {}", transaction_id_));
  return ResultSuccess();
}
