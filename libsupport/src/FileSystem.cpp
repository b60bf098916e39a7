#include "s3mp/FileSystem.h"

#include <unistd.h>

#include <vector>

#include <boost/filesystem.hpp>
#include <fmt/core.h>

#include "s3mp/ErrorCode.h"

namespace fs = boost::filesystem;

static const std::string_view kExes = "XXXXXX";
static const char kSepChar = '/';

static std::vector<char>
TemplateString(std::string_view pre, std::string_view suf) {
  std::vector<char> res(pre.begin(), pre.end());
  res.insert(res.end(), kExes.begin(), kExes.end());
  res.insert(res.end(), suf.begin(), suf.end());
  res.emplace_back('\0');
  return res;
}

s3mp::Result<std::string>
s3mp::CreateUniqueFile(std::string_view prefix, std::string_view suffix) {
  auto [name, fd] = S3MP_CHECKED(OpenUniqueFile(prefix, suffix));
  close(fd);
  return name;
}

s3mp::Result<std::pair<std::string, int>>
s3mp::OpenUniqueFile(std::string_view prefix, std::string_view suffix) {
  std::vector<char> buf(TemplateString(prefix, suffix));

  int fd = mkstemps(buf.data(), suffix.length());
  if (fd < 0) {
    return S3MP_ERROR(ResultErrno(), "creating file with prefix {}", prefix);
  }

  return std::make_pair(std::string(buf.begin(), buf.end() - 1), fd);
}

s3mp::Result<std::string>
s3mp::CreateUniqueDirectory(std::string_view prefix) {
  std::vector<char> buf(TemplateString(prefix, ""));

  char* ret = mkdtemp(buf.data());
  if (ret == nullptr) {
    return S3MP_ERROR(
        ResultErrno(), "creating directory with prefix {}", prefix);
  }

  return std::string(buf.begin(), buf.end() - 1);
}

s3mp::Result<void>
s3mp::RemoveAll(const std::string& path) {
  boost::system::error_code err;
  fs::remove_all(path, err);
  if (err) {
    return S3MP_ERROR(
        std::error_code(err.value(), err.category()), "removing {}: {}", path,
        err.message());
  }
  return ResultSuccess();
}

std::string
s3mp::JoinPath(std::string_view dir, std::string_view file) {
  if (!dir.empty() && dir.back() == kSepChar) {
    return fmt::format("{}{}", dir, file);
  }
  return fmt::format("{}{}{}", dir, kSepChar, file);
}
