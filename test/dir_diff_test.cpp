#include <scriptbox/dir_diff.h>

#include "utils.h"

class DirDiffTest : public WorkingDirTest {};

TEST_F(DirDiffTest, PartitionsFilesAndDirectories) {
  WriteText(workdir / "a.txt", "a");
  fs::create_directory(workdir / "sub");
  fs::create_symlink(workdir / "a.txt", workdir / "link");
  fs::create_symlink(workdir / "nowhere", workdir / "broken");
  WriteText(workdir / "sub" / "nested.txt", "n");

  DirectorySnapshot snap = TakeSnapshot(workdir);
  EXPECT_EQ(snap.files, (std::set<std::string>{"a.txt", "link"}));
  EXPECT_EQ(snap.dirs, (std::set<std::string>{"sub"}));
}

TEST_F(DirDiffTest, MissingDirectoryGivesEmptySnapshot) {
  DirectorySnapshot snap = TakeSnapshot(workdir / "missing");
  EXPECT_TRUE(snap.files.empty());
  EXPECT_TRUE(snap.dirs.empty());
}

TEST_F(DirDiffTest, CreatedEntriesOnly) {
  WriteText(workdir / "old.txt", "");
  WriteText(workdir / "removed.txt", "");
  fs::create_directory(workdir / "olddir");
  DirectorySnapshot before = TakeSnapshot(workdir);

  WriteText(workdir / "z.png", "");
  WriteText(workdir / "b.csv", "");
  fs::remove(workdir / "removed.txt");
  fs::rename(workdir / "olddir", workdir / "renamed");
  fs::create_directory(workdir / "plot.figpack");
  DirectoryDiff diff = DiffSnapshots(before, TakeSnapshot(workdir));

  EXPECT_EQ(diff.created_files, (std::vector<std::string>{"b.csv", "z.png"}));
  // a rename shows up as a creation of the new name only
  EXPECT_EQ(diff.created_dirs, (std::vector<std::string>{"plot.figpack", "renamed"}));
}

TEST_F(DirDiffTest, NoChanges) {
  WriteText(workdir / "x", "");
  DirectorySnapshot snap = TakeSnapshot(workdir);
  DirectoryDiff diff = DiffSnapshots(snap, snap);
  EXPECT_TRUE(diff.created_files.empty());
  EXPECT_TRUE(diff.created_dirs.empty());
}
