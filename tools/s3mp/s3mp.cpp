#include <cstdlib>
#include <memory>
#include <string>

#include <fmt/format.h>

#include "llvm/Support/CommandLine.h"
#include "s3mp/CancellationToken.h"
#include "s3mp/Cleanup.h"
#include "s3mp/ErrorCode.h"
#include "s3mp/Logging.h"
#include "s3mp/MemoryStorage.h"
#include "s3mp/ObjectLocator.h"
#include "s3mp/S3Storage.h"
#include "s3mp/Signals.h"
#include "s3mp/TextEventSink.h"
#include "s3mp/Time.h"
#include "s3mp/TransferConfig.h"
#include "s3mp/TransferOrchestrator.h"

namespace cll = llvm::cl;

static cll::SubCommand upload_cmd("upload", "Upload a local file to S3");
static cll::SubCommand download_cmd("download", "Download an S3 object");
static cll::SubCommand copy_cmd("copy", "Copy an S3 object to another key");
static cll::SubCommand cleanup_cmd(
    "cleanup", "List or cancel incomplete multipart uploads");

static cll::opt<std::string> upload_src(
    cll::Positional, cll::desc("<file>"), cll::Required, cll::sub(upload_cmd));
static cll::opt<std::string> upload_dest(
    cll::Positional, cll::desc("<s3://bucket/key>"), cll::Required,
    cll::sub(upload_cmd));

static cll::opt<std::string> download_src(
    cll::Positional, cll::desc("<s3://bucket/key>"), cll::Required,
    cll::sub(download_cmd));
static cll::opt<std::string> download_dest(
    cll::Positional, cll::desc("<file>"), cll::Required,
    cll::sub(download_cmd));

static cll::opt<std::string> copy_src(
    cll::Positional, cll::desc("<s3://bucket/key>"), cll::Required,
    cll::sub(copy_cmd));
static cll::opt<std::string> copy_dest(
    cll::Positional, cll::desc("<s3://bucket/key>"), cll::Required,
    cll::sub(copy_cmd));

static cll::opt<std::string> cleanup_uri(
    cll::Positional, cll::desc("<s3://bucket[/prefix]>"), cll::Required,
    cll::sub(cleanup_cmd));
static cll::opt<std::string> cancel_id(
    "cancel", cll::desc("Cancel the multipart upload with this id"),
    cll::init(""), cll::sub(cleanup_cmd));

static cll::opt<uint32_t> num_processes(
    "np", cll::desc("Number of parts to transfer in parallel (default: 2)"),
    cll::init(s3mp::TransferConfig::kDefaultConcurrency), cll::sub(upload_cmd),
    cll::sub(download_cmd), cll::sub(copy_cmd));
static cll::alias num_processes_long(
    "num-processes", cll::desc("Alias for -np"),
    cll::aliasopt(num_processes));
static cll::opt<uint64_t> split_mb(
    "s", cll::desc("Part size in MiB (default: 50)"), cll::init(50),
    cll::sub(upload_cmd), cll::sub(download_cmd), cll::sub(copy_cmd));
static cll::alias split_long(
    "split", cll::desc("Alias for -s"), cll::aliasopt(split_mb));
static cll::opt<bool> force(
    "f", cll::desc("Overwrite an existing destination"), cll::init(false),
    cll::sub(upload_cmd), cll::sub(download_cmd), cll::sub(copy_cmd));
static cll::alias force_long(
    "force", cll::desc("Alias for -f"), cll::aliasopt(force));
static cll::opt<uint32_t> max_attempts(
    "max-attempts",
    cll::desc("Attempts per part before the transfer fails (default: 3)"),
    cll::init(s3mp::TransferConfig::kDefaultMaxAttempts), cll::sub(upload_cmd),
    cll::sub(download_cmd), cll::sub(copy_cmd));
static cll::opt<uint64_t> backoff_ms(
    "backoff-ms", cll::desc("Delay between attempts in ms (default: 1000)"),
    cll::init(1000), cll::sub(upload_cmd), cll::sub(download_cmd),
    cll::sub(copy_cmd));
static cll::opt<uint64_t> timeout_s(
    "timeout", cll::desc("Cancel the transfer after this many seconds"),
    cll::init(0), cll::sub(upload_cmd), cll::sub(download_cmd),
    cll::sub(copy_cmd));
static cll::opt<bool> reduced_redundancy(
    "rrs", cll::desc("Use reduced redundancy storage"), cll::init(false),
    cll::sub(upload_cmd), cll::sub(copy_cmd));
static cll::alias reduced_redundancy_long(
    "reduced-redundancy", cll::desc("Alias for -rrs"),
    cll::aliasopt(reduced_redundancy));

static cll::opt<bool> verbose(
    "v", cll::desc("More output; repeat for debug output"), cll::ZeroOrMore,
    cll::Grouping, cll::sub(*cll::AllSubCommands));
static cll::alias verbose_long(
    "verbose", cll::desc("Alias for -v"), cll::aliasopt(verbose));
static cll::opt<bool> quiet(
    "q", cll::desc("Only report errors"), cll::init(false),
    cll::sub(*cll::AllSubCommands));
static cll::alias quiet_long(
    "quiet", cll::desc("Alias for -q"), cll::aliasopt(quiet));

namespace {

s3mp::Verbosity
GetVerbosity() {
  if (quiet) {
    return s3mp::Verbosity::Error;
  }
  switch (verbose.getNumOccurrences()) {
  case 0:
    return s3mp::Verbosity::Info;
  case 1:
    return s3mp::Verbosity::Verbose;
  default:
    return s3mp::Verbosity::Debug;
  }
}

/// Flags given on the command line override the environment
s3mp::TransferConfig
GetConfig() {
  s3mp::TransferConfig config = s3mp::TransferConfig::FromEnv();
  if (num_processes.getNumOccurrences()) {
    config.concurrency = num_processes;
  }
  if (split_mb.getNumOccurrences()) {
    config.part_size = s3mp::MiB(split_mb);
  }
  if (max_attempts.getNumOccurrences()) {
    config.max_attempts = max_attempts;
  }
  if (backoff_ms.getNumOccurrences()) {
    config.backoff = std::chrono::milliseconds(backoff_ms);
  }
  if (timeout_s.getNumOccurrences()) {
    config.timeout = std::chrono::seconds(timeout_s);
  }
  config.force = force;
  config.reduced_redundancy = reduced_redundancy;
  return config;
}

s3mp::Result<std::unique_ptr<s3mp::StorageProvider>>
MakeProvider(const s3mp::ObjectLocator& remote) {
  if (remote.store() == s3mp::ObjectLocator::kS3Scheme) {
    return std::unique_ptr<s3mp::StorageProvider>(
        S3MP_CHECKED(s3mp::S3StorageProvider::Make()));
  }
  if (remote.store() == s3mp::ObjectLocator::kMemoryScheme) {
    // A process local store, only useful for trying out the tool
    return std::unique_ptr<s3mp::StorageProvider>(
        std::make_unique<s3mp::MemoryStorageProvider>(
            std::make_shared<s3mp::MemoryObjectStore>()));
  }
  return S3MP_ERROR(
      s3mp::ErrorCode::PreconditionError, "no storage for {}", remote);
}

s3mp::Result<void>
RunTransfer(
    const std::string& src_uri, const std::string& dest_uri,
    s3mp::TransferMode mode) {
  s3mp::ObjectLocator source = S3MP_CHECKED(s3mp::ObjectLocator::Make(src_uri));
  s3mp::ObjectLocator dest = S3MP_CHECKED(s3mp::ObjectLocator::Make(dest_uri));

  std::unique_ptr<s3mp::StorageProvider> provider = S3MP_CHECKED(
      MakeProvider(mode == s3mp::TransferMode::Download ? source : dest));

  s3mp::Verbosity verbosity = GetVerbosity();
  auto sink = s3mp::TextEventSink::Make(verbosity);

  s3mp::CancellationToken token;
  if (!s3mp::InstallInterruptHandlers(token.flag())) {
    S3MP_LOG_WARN("could not install interrupt handlers");
  }

  s3mp::TransferOrchestrator orchestrator(
      provider.get(), GetConfig(), sink.get(), &token);
  auto res = orchestrator.Transfer(source, dest, mode);
  s3mp::RestoreInterruptHandlers();

  s3mp::TransferSummary summary = S3MP_CHECKED(std::move(res));
  if (verbosity != s3mp::Verbosity::Error) {
    fmt::print(
        "Transferred {} bytes ({}) in {} parts, {:.2f}s, {}/s\n",
        summary.total_bytes, s3mp::BytesToStr("{:.2f}{}", summary.total_bytes),
        summary.num_parts, summary.elapsed.count() / 1e6,
        s3mp::BytesToStr(
            "{:.2f}{}", static_cast<uint64_t>(summary.throughput())));
  }
  return s3mp::ResultSuccess();
}

s3mp::Result<void>
RunCleanup(const std::string& uri) {
  s3mp::ObjectLocator locator =
      S3MP_CHECKED(s3mp::ObjectLocator::MakeContainer(uri));
  std::unique_ptr<s3mp::StorageProvider> provider =
      S3MP_CHECKED(MakeProvider(locator));
  std::unique_ptr<s3mp::StorageClient> client =
      S3MP_CHECKED(provider->Connect());

  if (!cancel_id.empty()) {
    s3mp::MultipartTransaction txn = S3MP_CHECKED(
        s3mp::CancelIncompleteTransfer(client.get(), locator, cancel_id));
    if (GetVerbosity() != s3mp::Verbosity::Error) {
      fmt::print(
          "Cancelled {} for {}\n", txn.transaction_id,
          locator.WithKey(txn.key));
    }
    return s3mp::ResultSuccess();
  }

  auto txns =
      S3MP_CHECKED(s3mp::ListIncompleteTransfers(client.get(), locator));
  for (const s3mp::MultipartTransaction& txn : txns) {
    fmt::print("{}\n", s3mp::FormatCancelCommand(locator, txn));
  }
  return s3mp::ResultSuccess();
}

}  // namespace

int
main(int argc, char** argv) {
  cll::ParseCommandLineOptions(
      argc, argv, "s3mp: parallel multipart transfers for S3\n");

  s3mp::Result<void> res = s3mp::ResultSuccess();
  if (upload_cmd) {
    res = RunTransfer(upload_src, upload_dest, s3mp::TransferMode::Upload);
  } else if (download_cmd) {
    res =
        RunTransfer(download_src, download_dest, s3mp::TransferMode::Download);
  } else if (copy_cmd) {
    res = RunTransfer(copy_src, copy_dest, s3mp::TransferMode::Copy);
  } else if (cleanup_cmd) {
    res = RunCleanup(cleanup_uri);
  } else {
    cll::PrintHelpMessage();
    return EXIT_FAILURE;
  }

  if (!res) {
    fmt::print(stderr, "s3mp: {}\n", res.error());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
