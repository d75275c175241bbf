#include <cerrno>
#include <unistd.h>

#include <gtest/gtest.h>

#include "fs/list.hpp"
#include "test_util.hpp"

using namespace testutil;

class ListFiles : public TempTree {};

TEST_F(ListFiles, FilesBeforeSubdirsEachSorted){
  write_file(at("t/b.txt"), "b");
  write_file(at("t/a.txt"), "a");
  write_file(at("t/z/inner.txt"), "i");
  write_file(at("t/m/deep/x"), "x");

  std::vector<std::string> got;
  ASSERT_EQ(fs::list_files(at("t"), got), 0);
  std::vector<std::string> want = {
    at("t/a.txt"), at("t/b.txt"), at("t/m/deep/x"), at("t/z/inner.txt"),
  };
  EXPECT_EQ(got, want);
}

TEST_F(ListFiles, HiddenNamesAndSymlinksSkipped){
  write_file(at("t/.hidden"), "h");
  write_file(at("t/.git/config"), "c");
  write_file(at("t/keep"), "k");
  ASSERT_EQ(symlink("keep", at("t/link").c_str()), 0);

  std::vector<std::string> got;
  ASSERT_EQ(fs::list_files(at("t"), got), 0);
  ASSERT_EQ(got.size(), 1u);
  EXPECT_EQ(got[0], at("t/keep"));
}

TEST_F(ListFiles, EmptyDirectoriesContributeNothing){
  write_file(at("t/e/.keep"), "");
  std::vector<std::string> got;
  ASSERT_EQ(fs::list_files(at("t"), got), 0);
  EXPECT_TRUE(got.empty());
}

TEST_F(ListFiles, RootMustBeADirectory){
  write_file(at("file"), "x");
  std::vector<std::string> got;
  EXPECT_EQ(fs::list_files(at("file"), got), -ENOTDIR);
  EXPECT_EQ(fs::list_files(at("missing"), got), -ENOENT);
}
