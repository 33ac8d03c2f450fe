#ifndef INCLUDE_SCRIPTBOX_FILE_SERVER_H_
#define INCLUDE_SCRIPTBOX_FILE_SERVER_H_

#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace fs = std::filesystem;

#define ENUM_FILE_ACCESS_STATUS_ \
  X(OK, 200, "OK") \
  X(PARTIAL, 206, "Partial Content") \
  X(BAD_PATH, 400, "Invalid path: must be within server working directory") \
  X(NOT_A_FILE, 400, "Path is not a file") \
  X(NOT_FOUND, 404, "File not found") \
  X(RANGE_NOT_SATISFIABLE, 416, "Requested range not satisfiable")
enum class FileAccessStatus {
#define X(name, code, desc) name,
  ENUM_FILE_ACCESS_STATUS_
#undef X
};

int FileAccessStatusCode(FileAccessStatus);
const char* FileAccessStatusDesc(FileAccessStatus);

enum class AccessMode {
  PROBE, // size and range capability only
  TRANSFER, // full body, or a byte span if a range is requested
};

struct ByteRange {
  uintmax_t first;
  std::optional<uintmax_t> last; // inclusive; end of file if absent
};

struct FileSlice {
  FileAccessStatus status = FileAccessStatus::NOT_FOUND;
  fs::path path; // resolved; valid for OK & PARTIAL
  uintmax_t total_size = 0;
  uintmax_t offset = 0;
  uintmax_t length = 0;
};

// Resolves symlinks and ".." on both sides before the containment check.
// Returns nothing if the target escapes root.
std::optional<fs::path> ResolveConfined(const fs::path& root, const std::string& relative);

// "bytes=first-last"; either bound may be omitted (first defaults to 0).
// Returns nothing for anything else, including multiple ranges and first > last.
std::optional<ByteRange> ParseByteRange(const std::string& header);

// range_header is the raw Range header value, empty if absent; an unparseable
// range results in a full transfer
FileSlice OpenFile(const fs::path& root, const std::string& relative,
                   AccessMode mode, const std::string& range_header = "");

bool ReadFileRange(const fs::path& path, uintmax_t offset, uintmax_t length, std::string& out);

// "bytes first-last/total"
std::string ContentRangeHeader(const FileSlice&);
std::string GuessContentType(const fs::path&);

#endif  // INCLUDE_SCRIPTBOX_FILE_SERVER_H_
