#include <scriptbox/dir_diff.h>

#include <iterator>
#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

std::vector<std::string> SetDifference(const std::set<std::string>& after, const std::set<std::string>& before) {
  std::vector<std::string> ret;
  std::set_difference(after.begin(), after.end(), before.begin(), before.end(), std::back_inserter(ret));
  return ret;
}

} // namespace

DirectorySnapshot TakeSnapshot(const fs::path& dir) {
  DirectorySnapshot ret;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    // a broken symlink or an entry removed meanwhile is neither
    std::error_code type_ec;
    std::string name = it->path().filename().string();
    if (it->is_regular_file(type_ec)) {
      ret.files.insert(std::move(name));
    } else if (it->is_directory(type_ec)) {
      ret.dirs.insert(std::move(name));
    }
  }
  if (ec) {
    spdlog::warn("Failed listing directory {}: {}", dir.c_str(), ec.message());
    return {};
  }
  return ret;
}

DirectoryDiff DiffSnapshots(const DirectorySnapshot& before, const DirectorySnapshot& after) {
  return {SetDifference(after.files, before.files), SetDifference(after.dirs, before.dirs)};
}
