#include "s3mp/MemoryStorage.h"

#include <cstring>
#include <ctime>
#include <limits>
#include <thread>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "s3mp/Logging.h"
#include "s3mp/Strings.h"

namespace {

constexpr uint32_t kForever = std::numeric_limits<uint32_t>::max();

std::string
TimestampNow() {
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(std::time(nullptr)));
}

bool
TakeFault(uint32_t* remaining) {
  if (*remaining == 0) {
    return false;
  }
  if (*remaining != kForever) {
    --*remaining;
  }
  return true;
}

}  // namespace

const char*
s3mp::StorageOpName(StorageOp op) {
  switch (op) {
  case StorageOp::Head:
    return "HeadObject";
  case StorageOp::Initiate:
    return "InitiateMultipart";
  case StorageOp::UploadPart:
    return "UploadPart";
  case StorageOp::CopyPart:
    return "CopyPart";
  case StorageOp::Complete:
    return "CompleteMultipart";
  case StorageOp::Abort:
    return "AbortMultipart";
  case StorageOp::GetRange:
    return "GetRange";
  case StorageOp::Put:
    return "PutObject";
  case StorageOp::Get:
    return "GetObject";
  case StorageOp::Copy:
    return "CopyObject";
  case StorageOp::List:
    return "ListMultipartTransactions";
  default:
    return "Unknown";
  }
}

void
s3mp::MemoryObjectStore::FailNext(
    StorageOp op, uint32_t count, ErrorCode code) {
  std::lock_guard<std::mutex> lock(mutex_);
  op_faults_[static_cast<int>(op)] = Fault{count, code};
}

void
s3mp::MemoryObjectStore::FailPart(uint32_t part_index, ErrorCode code) {
  std::lock_guard<std::mutex> lock(mutex_);
  part_faults_[part_index] = Fault{kForever, code};
}

void
s3mp::MemoryObjectStore::FailPartTimes(
    uint32_t part_index, uint32_t count, ErrorCode code) {
  std::lock_guard<std::mutex> lock(mutex_);
  part_faults_[part_index] = Fault{count, code};
}

void
s3mp::MemoryObjectStore::ClearFaults() {
  std::lock_guard<std::mutex> lock(mutex_);
  op_faults_.fill(Fault{});
  part_faults_.clear();
}

void
s3mp::MemoryObjectStore::SetLatency(std::chrono::milliseconds latency) {
  latency_ms_.store(latency.count());
}

void
s3mp::MemoryObjectStore::PutBytes(
    const std::string& container, const std::string& key, Bytes data) {
  std::lock_guard<std::mutex> lock(mutex_);
  objects_[ObjectName(container, key)] = std::move(data);
}

bool
s3mp::MemoryObjectStore::Contains(
    const std::string& container, const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.find(ObjectName(container, key)) != objects_.end();
}

s3mp::Result<s3mp::MemoryObjectStore::Bytes>
s3mp::MemoryObjectStore::GetBytes(
    const std::string& container, const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = objects_.find(ObjectName(container, key));
  if (it == objects_.end()) {
    return ErrorCode::NotFound;
  }
  return it->second;
}

uint64_t
s3mp::MemoryObjectStore::num_calls(StorageOp op) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return calls_[static_cast<int>(op)];
}

uint64_t
s3mp::MemoryObjectStore::num_part_attempts(uint32_t part_index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = part_attempts_.find(part_index);
  return it == part_attempts_.end() ? 0 : it->second;
}

size_t
s3mp::MemoryObjectStore::num_open_transactions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return transactions_.size();
}

uint64_t
s3mp::MemoryObjectStore::num_objects() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return objects_.size();
}

std::error_code
s3mp::MemoryObjectStore::BeginCall(StorageOp op, uint32_t part_index) {
  calls_[static_cast<int>(op)]++;

  if (part_index != 0) {
    part_attempts_[part_index]++;
    auto it = part_faults_.find(part_index);
    if (it != part_faults_.end() && TakeFault(&it->second.remaining)) {
      return it->second.code;
    }
  }

  Fault& fault = op_faults_[static_cast<int>(op)];
  if (TakeFault(&fault.remaining)) {
    return fault.code;
  }
  return std::error_code();
}

void
s3mp::MemoryObjectStore::Delay() {
  uint32_t now = ++concurrent_;
  uint32_t peak = peak_concurrent_.load();
  while (now > peak && !peak_concurrent_.compare_exchange_weak(peak, now)) {
  }

  int64_t latency = latency_ms_.load();
  if (latency > 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(latency));
  }
  --concurrent_;
}

s3mp::Result<s3mp::ObjectInfo>
s3mp::MemoryObjectStore::Head(const ObjectLocator& object) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Head); ec) {
    return S3MP_ERROR(ec, "injected fault on head of {}", object);
  }
  auto it = objects_.find(ObjectName(object.container(), object.key()));
  if (it == objects_.end()) {
    return S3MP_ERROR(ErrorCode::NotFound, "no such object {}", object);
  }
  return ObjectInfo{it->second.size(), fmt::format("{:x}", it->second.size())};
}

s3mp::Result<std::string>
s3mp::MemoryObjectStore::Initiate(const ObjectLocator& dest) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Initiate); ec) {
    return S3MP_ERROR(ec, "injected fault on initiate of {}", dest);
  }
  std::string id = fmt::format("mem-txn-{:06d}", next_transaction_++);
  Transaction& txn = transactions_[id];
  txn.container = dest.container();
  txn.key = dest.key();
  txn.started_at = TimestampNow();
  return id;
}

s3mp::Result<std::string>
s3mp::MemoryObjectStore::StorePartLocked(
    const ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, Bytes data) {
  if (part_index < 1 || part_index > kMaxPartCount) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "part index {} out of range", part_index);
  }
  auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return S3MP_ERROR(
        ErrorCode::NotFound, "no such transaction {}", transaction_id);
  }
  Transaction& txn = it->second;
  if (txn.container != dest.container() || txn.key != dest.key()) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "transaction {} does not belong to {}",
        transaction_id, dest);
  }
  std::string tag = fmt::format("\"{:016x}\"", next_tag_++);
  txn.parts[part_index] = std::move(data);
  txn.tags[part_index] = tag;
  return tag;
}

s3mp::Result<std::string>
s3mp::MemoryObjectStore::UploadPart(
    const ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, Bytes data) {
  Delay();

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::UploadPart, part_index); ec) {
    return S3MP_ERROR(ec, "injected fault on upload of part {}", part_index);
  }
  return StorePartLocked(dest, transaction_id, part_index, std::move(data));
}

s3mp::Result<std::string>
s3mp::MemoryObjectStore::CopyPart(
    const ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, const ObjectLocator& source, const ByteRange& range) {
  Delay();

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::CopyPart, part_index); ec) {
    return S3MP_ERROR(ec, "injected fault on copy of part {}", part_index);
  }
  auto it = objects_.find(ObjectName(source.container(), source.key()));
  if (it == objects_.end()) {
    return S3MP_ERROR(ErrorCode::NotFound, "no such object {}", source);
  }
  const Bytes& src = it->second;
  if (range.end >= src.size() || range.start > range.end) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "{} outside of {} ({} bytes)", range,
        source, src.size());
  }
  Bytes data(src.begin() + range.start, src.begin() + range.end + 1);
  return StorePartLocked(dest, transaction_id, part_index, std::move(data));
}

s3mp::Result<void>
s3mp::MemoryObjectStore::Complete(
    const ObjectLocator& dest, const std::string& transaction_id,
    const std::vector<PartAck>& parts) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Complete); ec) {
    return S3MP_ERROR(ec, "injected fault on complete of {}", dest);
  }
  auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return S3MP_ERROR(
        ErrorCode::NotFound, "no such transaction {}", transaction_id);
  }
  Transaction& txn = it->second;
  if (parts.empty()) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "transaction {} completed without parts",
        transaction_id);
  }

  Bytes assembled;
  uint32_t previous = 0;
  for (const PartAck& ack : parts) {
    if (ack.part_index <= previous) {
      return S3MP_ERROR(
          ErrorCode::InvalidArgument, "parts out of order at part {}",
          ack.part_index);
    }
    previous = ack.part_index;
    auto tag_it = txn.tags.find(ack.part_index);
    if (tag_it == txn.tags.end() || tag_it->second != ack.tag) {
      return S3MP_ERROR(
          ErrorCode::InvalidArgument, "part {} has unknown tag {}",
          ack.part_index, ack.tag);
    }
    const Bytes& data = txn.parts[ack.part_index];
    assembled.insert(assembled.end(), data.begin(), data.end());
  }

  objects_[ObjectName(dest.container(), dest.key())] = std::move(assembled);
  transactions_.erase(it);
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MemoryObjectStore::Abort(
    const ObjectLocator& dest, const std::string& transaction_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Abort); ec) {
    return S3MP_ERROR(ec, "injected fault on abort of {}", dest);
  }
  auto it = transactions_.find(transaction_id);
  if (it == transactions_.end()) {
    return S3MP_ERROR(
        ErrorCode::NotFound, "no such transaction {}", transaction_id);
  }
  transactions_.erase(it);
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MemoryObjectStore::GetRange(
    const ObjectLocator& source, const ByteRange& range, uint8_t* data) {
  Delay();

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::GetRange, range.part_index); ec) {
    return S3MP_ERROR(ec, "injected fault on get of {}", range);
  }
  auto it = objects_.find(ObjectName(source.container(), source.key()));
  if (it == objects_.end()) {
    return S3MP_ERROR(ErrorCode::NotFound, "no such object {}", source);
  }
  const Bytes& src = it->second;
  if (range.end >= src.size() || range.start > range.end) {
    return S3MP_ERROR(
        ErrorCode::InvalidArgument, "{} outside of {} ({} bytes)", range,
        source, src.size());
  }
  std::memcpy(data, src.data() + range.start, range.size());
  return ResultSuccess();
}

s3mp::Result<void>
s3mp::MemoryObjectStore::Put(const ObjectLocator& dest, Bytes data) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Put); ec) {
    return S3MP_ERROR(ec, "injected fault on put of {}", dest);
  }
  objects_[ObjectName(dest.container(), dest.key())] = std::move(data);
  return ResultSuccess();
}

s3mp::Result<s3mp::MemoryObjectStore::Bytes>
s3mp::MemoryObjectStore::Get(const ObjectLocator& source) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Get); ec) {
    return S3MP_ERROR(ec, "injected fault on get of {}", source);
  }
  auto it = objects_.find(ObjectName(source.container(), source.key()));
  if (it == objects_.end()) {
    return S3MP_ERROR(ErrorCode::NotFound, "no such object {}", source);
  }
  return it->second;
}

s3mp::Result<void>
s3mp::MemoryObjectStore::Copy(
    const ObjectLocator& source, const ObjectLocator& dest) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::Copy); ec) {
    return S3MP_ERROR(ec, "injected fault on copy of {}", source);
  }
  auto it = objects_.find(ObjectName(source.container(), source.key()));
  if (it == objects_.end()) {
    return S3MP_ERROR(ErrorCode::NotFound, "no such object {}", source);
  }
  Bytes copy = it->second;
  objects_[ObjectName(dest.container(), dest.key())] = std::move(copy);
  return ResultSuccess();
}

s3mp::Result<std::vector<s3mp::MultipartTransaction>>
s3mp::MemoryObjectStore::List(const ObjectLocator& locator) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto ec = BeginCall(StorageOp::List); ec) {
    return S3MP_ERROR(ec, "injected fault on list of {}", locator);
  }
  std::vector<MultipartTransaction> found;
  for (const auto& [id, txn] : transactions_) {
    if (txn.container != locator.container() ||
        !HasPrefix(txn.key, locator.key())) {
      continue;
    }
    found.emplace_back(
        MultipartTransaction{id, txn.key, "s3mp", txn.started_at});
  }
  return found;
}

s3mp::Result<s3mp::ObjectInfo>
s3mp::MemoryStorageClient::HeadObject(const ObjectLocator& object) {
  return store_->Head(object);
}

s3mp::Result<std::string>
s3mp::MemoryStorageClient::InitiateMultipart(
    const ObjectLocator& dest, const WriteOptions&) {
  return store_->Initiate(dest);
}

s3mp::Result<std::string>
s3mp::MemoryStorageClient::UploadPart(
    const ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, const uint8_t* data, uint64_t size) {
  return store_->UploadPart(
      dest, transaction_id, part_index,
      MemoryObjectStore::Bytes(data, data + size));
}

s3mp::Result<std::string>
s3mp::MemoryStorageClient::CopyPart(
    const ObjectLocator& dest, const std::string& transaction_id,
    uint32_t part_index, const ObjectLocator& source, const ByteRange& range) {
  return store_->CopyPart(dest, transaction_id, part_index, source, range);
}

s3mp::Result<void>
s3mp::MemoryStorageClient::CompleteMultipart(
    const ObjectLocator& dest, const std::string& transaction_id,
    const std::vector<PartAck>& parts) {
  return store_->Complete(dest, transaction_id, parts);
}

s3mp::Result<void>
s3mp::MemoryStorageClient::AbortMultipart(
    const ObjectLocator& dest, const std::string& transaction_id) {
  return store_->Abort(dest, transaction_id);
}

s3mp::Result<void>
s3mp::MemoryStorageClient::GetRange(
    const ObjectLocator& source, const ByteRange& range, uint8_t* data) {
  return store_->GetRange(source, range, data);
}

s3mp::Result<void>
s3mp::MemoryStorageClient::PutObject(
    const ObjectLocator& dest, const uint8_t* data, uint64_t size,
    const WriteOptions&) {
  return store_->Put(dest, MemoryObjectStore::Bytes(data, data + size));
}

s3mp::Result<std::vector<uint8_t>>
s3mp::MemoryStorageClient::GetObject(const ObjectLocator& source) {
  return store_->Get(source);
}

s3mp::Result<void>
s3mp::MemoryStorageClient::CopyObject(
    const ObjectLocator& source, const ObjectLocator& dest,
    const WriteOptions&) {
  return store_->Copy(source, dest);
}

s3mp::Result<std::vector<s3mp::MultipartTransaction>>
s3mp::MemoryStorageClient::ListMultipartTransactions(
    const ObjectLocator& locator) {
  return store_->List(locator);
}

s3mp::Result<std::unique_ptr<s3mp::StorageClient>>
s3mp::MemoryStorageProvider::Connect() {
  uint32_t failing = failing_connects_.load();
  while (failing > 0 &&
         !failing_connects_.compare_exchange_weak(failing, failing - 1)) {
  }
  if (failing > 0) {
    return S3MP_ERROR(
        ErrorCode::StorageError, "injected fault on connect to memory store");
  }
  ++num_connections_;
  return std::unique_ptr<StorageClient>(new MemoryStorageClient(store_));
}
