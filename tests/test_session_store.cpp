#include "session/session_store.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <thread>

namespace {

using namespace ovaup;

class SessionStoreTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;

    UploadSession Make(const std::string& id) {
        UploadSession s;
        s.session_id = id;
        s.ova_file = "/data/" + id + ".ova";
        s.start_time = SessionNow();
        s.last_update = s.start_time;
        return s;
    }
};

TEST_F(SessionStoreTests, FileNaming) {
    EXPECT_EQ(SessionFileName("123"), ".upload-session-123.json");
    EXPECT_EQ(SessionFilePath("/var/x", "9"), "/var/x/.upload-session-9.json");
    EXPECT_EQ(SessionIdFromPath("/var/x/.upload-session-9.json"), "9");
    EXPECT_EQ(SessionIdFromPath("/var/x/upload-session-9.json"), "");
    EXPECT_EQ(SessionIdFromPath(".upload-session-.json"), "");
    EXPECT_EQ(SessionIdFromPath(".upload-session-9.json.tmp"), "");
}

TEST_F(SessionStoreTests, WriteThenLoad) {
    const UploadSession s = Make("100");
    const std::string p = SessionFilePath(tmp.Path(), s.session_id);
    ASSERT_TRUE(WriteSessionFile(p, s).ok);
    EXPECT_FALSE(testutil::FileExists(p + ".tmp"));

    UploadSession loaded;
    auto r = LoadSessionFile(p, loaded);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(loaded, s);
}

TEST_F(SessionStoreTests, LoadErrors) {
    UploadSession out;
    auto r = LoadSessionFile(tmp.Path() + "/missing.json", out);
    EXPECT_EQ(r.code, ErrorCode::Io);

    const std::string p = tmp.Path() + "/.upload-session-1.json";
    testutil::WriteFile(p, std::string("{ broken"));
    r = LoadSessionFile(p, out);
    EXPECT_EQ(r.code, ErrorCode::Parse);
}

TEST_F(SessionStoreTests, FindsSessionsAndIgnoresOtherFiles) {
    ASSERT_TRUE(WriteSessionFile(SessionFilePath(tmp.Path(), "2"), Make("2")).ok);
    ASSERT_TRUE(WriteSessionFile(SessionFilePath(tmp.Path(), "1"), Make("1")).ok);
    testutil::WriteFile(tmp.Path() + "/notes.json", std::string("{}"));

    std::vector<std::string> files;
    ASSERT_TRUE(FindSessionFiles(tmp.Path(), files).ok);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(SessionIdFromPath(files[0]), "1");
    EXPECT_EQ(SessionIdFromPath(files[1]), "2");

    std::string path;
    ASSERT_TRUE(FindSessionById(tmp.Path(), "2", path).ok);
    EXPECT_EQ(path, SessionFilePath(tmp.Path(), "2"));
    EXPECT_EQ(FindSessionById(tmp.Path(), "3", path).code, ErrorCode::NotFound);
}

TEST_F(SessionStoreTests, MostRecentUsesModificationTime) {
    const std::string older = SessionFilePath(tmp.Path(), "9");
    const std::string newer = SessionFilePath(tmp.Path(), "1");
    ASSERT_TRUE(WriteSessionFile(older, Make("9")).ok);
    ASSERT_TRUE(WriteSessionFile(newer, Make("1")).ok);

    namespace fs = std::filesystem;
    fs::last_write_time(older, fs::file_time_type::clock::now() - std::chrono::hours(1));

    std::string path;
    ASSERT_TRUE(FindMostRecentSession(tmp.Path(), path).ok);
    EXPECT_EQ(path, newer);
}

TEST_F(SessionStoreTests, EmptyDirectoryHasNoMostRecent) {
    std::string path;
    EXPECT_EQ(FindMostRecentSession(tmp.Path(), path).code, ErrorCode::NotFound);
}

TEST_F(SessionStoreTests, NewSessionIdSkipsExistingFiles) {
    const std::string first = NewSessionId(tmp.Path());
    ASSERT_TRUE(WriteSessionFile(SessionFilePath(tmp.Path(), first), Make(first)).ok);
    const std::string second = NewSessionId(tmp.Path());
    EXPECT_NE(first, second);
    EXPECT_GT(std::stoll(second), std::stoll(first) - 1);
}

} // namespace
