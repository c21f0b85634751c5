//
// Created by Giuseppe Francione on 23/01/26.
//

#include <gtest/gtest.h>
#include "../liblfskit/include/file_scanner.hpp"
#include "test_utils.hpp"

using namespace lfskit;
using lfskit::test::TempDir;
using lfskit::test::write_text;

using Paths = std::vector<std::string>;

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_text(tmp.path() / "a.bin", "a");
        write_text(tmp.path() / "docs" / "readme.md", "r");
        write_text(tmp.path() / "docs" / "sub" / "deep.md", "d");
        write_text(tmp.path() / "src" / "main.cpp", "m");
        write_text(tmp.path() / "src" / "generated" / "gen.cpp", "g");
        write_text(tmp.path() / ".DS_Store", "junk");
        write_text(tmp.path() / "src" / "._main.cpp", "junk");
        write_text(tmp.path() / "docs" / "Desktop.ini", "junk");
    }

    TempDir tmp;
};

TEST_F(FileScannerTest, RecursiveWithoutFilter) {
    EXPECT_EQ(collect_files(tmp.path(), PathFilter(), true),
              (Paths{"a.bin", "docs/readme.md", "docs/sub/deep.md", "src/generated/gen.cpp", "src/main.cpp"}));
}

TEST_F(FileScannerTest, NonRecursiveListsTopLevelOnly) {
    EXPECT_EQ(collect_files(tmp.path(), PathFilter(), false), (Paths{"a.bin"}));
}

TEST_F(FileScannerTest, IncludeDirectory) {
    const PathFilter filter({"docs"}, {}, PathStyle::Posix);
    EXPECT_EQ(collect_files(tmp.path(), filter, true), (Paths{"docs/readme.md", "docs/sub/deep.md"}));
}

TEST_F(FileScannerTest, IncludeWithExclude) {
    const PathFilter filter({"src", "*.bin"}, {"src/generated"}, PathStyle::Posix);
    EXPECT_EQ(collect_files(tmp.path(), filter, true), (Paths{"a.bin", "src/main.cpp"}));
}

TEST_F(FileScannerTest, GlobDoesNotCrossDirectories) {
    const PathFilter filter({"docs/*.md"}, {}, PathStyle::Posix);
    EXPECT_EQ(collect_files(tmp.path(), filter, true), (Paths{"docs/readme.md"}));
}

TEST_F(FileScannerTest, MissingRootYieldsNothing) {
    EXPECT_TRUE(collect_files(tmp.path() / "missing", PathFilter(), true).empty());
}
