#include <scriptbox/file_server.h>

#include <cctype>
#include <fstream>
#include <charconv>
#include <algorithm>
#include <unordered_map>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

static const int kFileAccessStatusCodeTable[] = {
#define X(name, code, desc) code,
  ENUM_FILE_ACCESS_STATUS_
#undef X
};

static const char* kFileAccessStatusDescTable[] = {
#define X(name, code, desc) desc,
  ENUM_FILE_ACCESS_STATUS_
#undef X
};

const std::unordered_map<std::string, std::string> kContentTypes = {
  {".html", "text/html"},
  {".htm", "text/html"},
  {".css", "text/css"},
  {".js", "text/javascript"},
  {".json", "application/json"},
  {".txt", "text/plain"},
  {".csv", "text/csv"},
  {".md", "text/markdown"},
  {".py", "text/x-python"},
  {".sh", "text/x-shellscript"},
  {".png", "image/png"},
  {".jpg", "image/jpeg"},
  {".jpeg", "image/jpeg"},
  {".gif", "image/gif"},
  {".svg", "image/svg+xml"},
  {".bmp", "image/bmp"},
  {".webp", "image/webp"},
  {".pdf", "application/pdf"},
  {".wasm", "application/wasm"},
  {".zip", "application/zip"},
};

bool ParseUint(std::string_view str, uintmax_t& val) {
  if (str.empty()) return false;
  auto res = std::from_chars(str.data(), str.data() + str.size(), val);
  return res.ec == std::errc() && res.ptr == str.data() + str.size();
}

// true if target is root itself or lies beneath it; both must be canonical
bool IsWithin(const fs::path& root, const fs::path& target) {
  auto [root_it, target_it] = std::mismatch(root.begin(), root.end(), target.begin(), target.end());
  return root_it == root.end();
}

FileSlice Reject(FileAccessStatus status, const std::string& relative) {
  spdlog::info("Reject file request {}: {}", relative, FileAccessStatusDesc(status));
  FileSlice ret;
  ret.status = status;
  return ret;
}

} // namespace

int FileAccessStatusCode(FileAccessStatus status) {
  return kFileAccessStatusCodeTable[(int)status];
}

const char* FileAccessStatusDesc(FileAccessStatus status) {
  return kFileAccessStatusDescTable[(int)status];
}

std::optional<fs::path> ResolveConfined(const fs::path& root, const std::string& relative) {
  std::error_code ec;
  fs::path base = fs::canonical(root, ec);
  if (ec) {
    spdlog::warn("Cannot resolve root {}: {}", root.c_str(), ec.message());
    return std::nullopt;
  }
  // an absolute relative replaces base here and is caught by the containment check
  fs::path target = fs::weakly_canonical(base / relative, ec);
  if (ec) return std::nullopt;
  if (!target.has_filename() && target.has_parent_path()) target = target.parent_path();
  if (!IsWithin(base, target)) return std::nullopt;
  return target;
}

std::optional<ByteRange> ParseByteRange(const std::string& header) {
  std::string_view str(header);
  auto trim = [](std::string_view s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
    return s;
  };
  str = trim(str);
  size_t eq = str.find('=');
  if (eq == std::string_view::npos || trim(str.substr(0, eq)) != "bytes") return std::nullopt;
  str = trim(str.substr(eq + 1));
  if (str.find(',') != std::string_view::npos) return std::nullopt;
  size_t dash = str.find('-');
  if (dash == std::string_view::npos) return std::nullopt;
  std::string_view first_str = trim(str.substr(0, dash)), last_str = trim(str.substr(dash + 1));
  if (first_str.empty() && last_str.empty()) return std::nullopt;

  ByteRange ret{0, std::nullopt};
  if (!first_str.empty() && !ParseUint(first_str, ret.first)) return std::nullopt;
  if (!last_str.empty()) {
    uintmax_t last;
    if (!ParseUint(last_str, last) || last < ret.first) return std::nullopt;
    ret.last = last;
  }
  return ret;
}

FileSlice OpenFile(const fs::path& root, const std::string& relative,
                   AccessMode mode, const std::string& range_header) {
  auto resolved = ResolveConfined(root, relative);
  if (!resolved) return Reject(FileAccessStatus::BAD_PATH, relative);

  std::error_code ec;
  auto status = fs::status(*resolved, ec);
  if (ec || !fs::exists(status)) return Reject(FileAccessStatus::NOT_FOUND, relative);
  if (!fs::is_regular_file(status)) return Reject(FileAccessStatus::NOT_A_FILE, relative);
  uintmax_t size = fs::file_size(*resolved, ec);
  if (ec) return Reject(FileAccessStatus::NOT_FOUND, relative);

  FileSlice ret;
  ret.status = FileAccessStatus::OK;
  ret.path = std::move(*resolved);
  ret.total_size = size;
  ret.offset = 0;
  ret.length = size;
  if (mode == AccessMode::PROBE || range_header.empty()) return ret;

  auto range = ParseByteRange(range_header);
  if (!range) {
    spdlog::debug("Unparseable range \"{}\" for {}, sending whole file", range_header, relative);
    return ret;
  }
  if (range->first >= size) {
    FileSlice rejected = Reject(FileAccessStatus::RANGE_NOT_SATISFIABLE, relative);
    rejected.total_size = size;
    return rejected;
  }
  uintmax_t last = std::min(range->last.value_or(size - 1), size - 1);
  ret.status = FileAccessStatus::PARTIAL;
  ret.offset = range->first;
  ret.length = last - range->first + 1;
  return ret;
}

bool ReadFileRange(const fs::path& path, uintmax_t offset, uintmax_t length, std::string& out) {
  std::ifstream fin(path, std::ios::binary);
  if (!fin) goto err;
  out.resize(length);
  if (length == 0) return true;
  if (!fin.seekg((std::streamoff)offset) || !fin.read(out.data(), (std::streamsize)length)) goto err;
  return true;
err:
  spdlog::warn("Failed reading {} bytes at {} from {}", length, offset, path.c_str());
  out.clear();
  return false;
}

std::string ContentRangeHeader(const FileSlice& slice) {
  if (slice.status == FileAccessStatus::RANGE_NOT_SATISFIABLE) {
    return fmt::format("bytes */{}", slice.total_size);
  }
  return fmt::format("bytes {}-{}/{}", slice.offset, slice.offset + slice.length - 1, slice.total_size);
}

std::string GuessContentType(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return std::tolower(c); });
  if (auto it = kContentTypes.find(ext); it != kContentTypes.end()) return it->second;
  return "application/octet-stream";
}
