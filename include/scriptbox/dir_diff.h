#ifndef INCLUDE_SCRIPTBOX_DIR_DIFF_H_
#define INCLUDE_SCRIPTBOX_DIR_DIFF_H_

#include <set>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// immediate entries of a directory; symlinks are classified by their targets
struct DirectorySnapshot {
  std::set<std::string> files;
  std::set<std::string> dirs;
};

struct DirectoryDiff {
  std::vector<std::string> created_files; // sorted
  std::vector<std::string> created_dirs; // sorted
};

// Never fails; an unreadable directory gives an empty snapshot
DirectorySnapshot TakeSnapshot(const fs::path& dir);

// after - before for each partition; removed or renamed entries are not reported
DirectoryDiff DiffSnapshots(const DirectorySnapshot& before, const DirectorySnapshot& after);

#endif  // INCLUDE_SCRIPTBOX_DIR_DIFF_H_
