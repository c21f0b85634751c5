//
// Created by Giuseppe Francione on 21/01/26.
//

#include <gtest/gtest.h>
#include "../liblfskit/include/errors.hpp"
#include "../liblfskit/include/progress_log.hpp"
#include "test_utils.hpp"

using namespace lfskit;
using lfskit::test::ChunkedReader;
using lfskit::test::StringWriter;
using lfskit::test::TempDir;
using lfskit::test::read_text;
using lfskit::test::write_text;

namespace fs = std::filesystem;

class ProgressLogTest : public ::testing::Test {
protected:
    TempDir tmp;

    [[nodiscard]] ProgressLogOptions options_for(const fs::path& p) const {
        return ProgressLogOptions{p.string()};
    }
};

TEST_F(ProgressLogTest, DisabledWhenDestinationUnset) {
    const ProgressLogFile result = open_progress_log({}, "download", "file.bin", 1, 1);
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.callback);
    EXPECT_EQ(result.log, nullptr);
}

TEST_F(ProgressLogTest, DisabledWhenEventOrFilenameEmpty) {
    const auto dest = tmp.path() / "logs" / "progress.log";

    EXPECT_FALSE(open_progress_log(options_for(dest), "", "file.bin", 1, 1));
    EXPECT_FALSE(open_progress_log(options_for(dest), "download", "", 1, 1));
    EXPECT_FALSE(fs::exists(dest.parent_path()));
}

TEST_F(ProgressLogTest, RelativeDestinationIsConfigurationError) {
    const std::string relative = "lfskit-relative-" + tmp.path().filename().string() + "/progress.log";

    EXPECT_THROW(open_progress_log(ProgressLogOptions{relative}, "download", "file.bin", 1, 1),
                 ConfigurationError);
    EXPECT_FALSE(fs::exists(fs::path(relative).parent_path()));
}

TEST_F(ProgressLogTest, WritesOneLinePerNewTotal) {
    const auto dest = tmp.path() / "a" / "b" / "progress.log";
    ProgressLogFile result = open_progress_log(options_for(dest), "download", "path/to/file.bin", 2, 5);
    ASSERT_TRUE(result);
    ASSERT_TRUE(result.callback);
    EXPECT_TRUE(fs::exists(dest));

    result.callback(10240, 4096, 4096);
    result.callback(10240, 4096, 0);
    result.callback(10240, 4096, 0);
    result.callback(10240, 10240, 6144);
    EXPECT_EQ(result.log->last_logged_total(), 10240);
    result.log->close();

    EXPECT_EQ(read_text(dest),
              "download 2/5 4096/10240 path/to/file.bin\n"
              "download 2/5 10240/10240 path/to/file.bin\n");
}

TEST_F(ProgressLogTest, ZeroProgressIsNotLogged) {
    const auto dest = tmp.path() / "progress.log";
    ProgressLogFile result = open_progress_log(options_for(dest), "upload", "f", 1, 1);
    ASSERT_TRUE(result);

    result.callback(100, 0, 0);
    result.log->close();
    EXPECT_EQ(read_text(dest), "");
}

TEST_F(ProgressLogTest, AppendsToExistingLog) {
    const auto dest = tmp.path() / "progress.log";
    write_text(dest, "upload 1/1 3/3 earlier.bin\n");

    ProgressLogFile result = open_progress_log(options_for(dest), "download", "later.bin", 1, 1);
    ASSERT_TRUE(result);
    result.callback(7, 7, 7);
    result.log->close();

    EXPECT_EQ(read_text(dest), "upload 1/1 3/3 earlier.bin\ndownload 1/1 7/7 later.bin\n");
}

TEST_F(ProgressLogTest, LogsEveryChunkOfACopy) {
    const auto dest = tmp.path() / "progress.log";
    ProgressLogFile result = open_progress_log(options_for(dest), "download", "obj", 1, 2);
    ASSERT_TRUE(result);

    StringWriter out;
    const auto copied = copy_with_callback(out,
                                           std::make_unique<ChunkedReader>("0123456789", std::vector<std::size_t>{4, 4, 2}),
                                           10, result.callback);
    result.log->close();

    EXPECT_EQ(copied, 10);
    EXPECT_EQ(read_text(dest),
              "download 1/2 4/10 obj\n"
              "download 1/2 8/10 obj\n"
              "download 1/2 10/10 obj\n");
}

TEST_F(ProgressLogTest, DirectoryCreationFailureIsWrapped) {
    write_text(tmp.path() / "blocker", "not a directory");
    const auto dest = tmp.path() / "blocker" / "progress.log";

    try {
        open_progress_log(options_for(dest), "upload", "file.bin", 1, 1);
        FAIL() << "expected ProgressLogError";
    } catch (const ProgressLogError& e) {
        EXPECT_EQ(e.event(), "upload");
        EXPECT_EQ(e.destination(), dest.string());
        EXPECT_NE(std::string(e.what()).find("Error writing Git LFS upload progress to " + dest.string()),
                  std::string::npos);
    }
}

TEST_F(ProgressLogTest, WriteAfterCloseFails) {
    const auto dest = tmp.path() / "progress.log";
    ProgressLogFile result = open_progress_log(options_for(dest), "download", "file.bin", 1, 1);
    ASSERT_TRUE(result);

    result.log->close();
    result.log->close();
    EXPECT_FALSE(result.log->is_open());
    EXPECT_THROW(result.callback(10, 5, 5), ProgressLogError);
}

TEST_F(ProgressLogTest, WriteFailureAbortsCopy) {
    if (!fs::exists("/dev/full")) {
        GTEST_SKIP() << "/dev/full not available";
    }
    ProgressLogFile result = open_progress_log(ProgressLogOptions{"/dev/full"}, "download", "file.bin", 1, 1);
    ASSERT_TRUE(result);

    auto* inner = new ChunkedReader("abcdef", {3, 3});
    ProgressReader reader(std::unique_ptr<ByteReader>(inner), 6, result.callback);
    StringWriter out;
    EXPECT_THROW(copy(out, reader), ProgressLogError);
    EXPECT_EQ(inner->reads(), 1);
    EXPECT_EQ(reader.read_size(), 3);
    EXPECT_EQ(result.log->last_logged_total(), 0);
}
