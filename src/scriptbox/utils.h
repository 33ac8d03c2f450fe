#ifndef SCRIPTBOX_UTILS_H_
#define SCRIPTBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <scriptbox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// Replaces the file if it exists
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

#endif  // SCRIPTBOX_UTILS_H_
