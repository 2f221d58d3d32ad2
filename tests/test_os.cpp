#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>

#include <sys/stat.h>
#include <unistd.h>

#include "../os.h"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST(OsTest, RunCapturedSeparatesStreams) {
  auto result = os::run_captured(
      {"sh", "-c", "echo out; echo err >&2; exit 7"}, "/", 10s);
  ASSERT_TRUE(result);
  EXPECT_FALSE(result->timedOut);
  EXPECT_EQ(result->exitCode, 7);
  EXPECT_EQ(result->out, "out\n");
  EXPECT_EQ(result->err, "err\n");
}

TEST(OsTest, RunCapturedUsesWorkingDirectory) {
  auto result = os::run_captured({"pwd"}, "/tmp", 10s);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exitCode, 0);
  EXPECT_EQ(fs::canonical(result->out.substr(0, result->out.size() - 1)),
            fs::canonical("/tmp"));
}

TEST(OsTest, RunCapturedLargeOutput) {
  // More than a pipe buffer on both streams
  auto result = os::run_captured(
      {"sh", "-c",
       "head -c 200000 /dev/zero; head -c 100000 /dev/zero >&2"},
      "/", 10s);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exitCode, 0);
  EXPECT_EQ(result->out.size(), 200000u);
  EXPECT_EQ(result->err.size(), 100000u);
}

TEST(OsTest, RunCapturedTimeout) {
  auto start = std::chrono::steady_clock::now();
  auto result = os::run_captured({"sh", "-c", "echo started; sleep 30"}, "/", 500ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result);
  EXPECT_TRUE(result->timedOut);
  EXPECT_LT(elapsed, 10s);
}

TEST(OsTest, RunCapturedTimeoutAfterClosingOutput) {
  auto start = std::chrono::steady_clock::now();
  auto result =
      os::run_captured({"sh", "-c", "exec >&- 2>&-; sleep 5"}, "/", 500ms);
  auto elapsed = std::chrono::steady_clock::now() - start;

  ASSERT_TRUE(result);
  EXPECT_TRUE(result->timedOut);
  EXPECT_EQ(result->exitCode, -SIGKILL);
  EXPECT_LT(elapsed, 3s);
}

TEST(OsTest, RunCapturedHugeTimeout) {
  // More milliseconds than fit into poll()'s int timeout
  auto result = os::run_captured({"sh", "-c", "sleep 0.2; echo done"}, "/",
                                 std::chrono::hours{1000});

  ASSERT_TRUE(result);
  EXPECT_FALSE(result->timedOut);
  EXPECT_EQ(result->exitCode, 0);
  EXPECT_EQ(result->out, "done\n");
}

TEST(OsTest, RunCapturedSignal) {
  auto result = os::run_captured({"sh", "-c", "kill -TERM $$"}, "/", 10s);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exitCode, -SIGTERM);
}

TEST(OsTest, RunCapturedMissingBinary) {
  auto result =
      os::run_captured({"/nonexistent/runbox-test-binary"}, "/", 10s);
  ASSERT_TRUE(result);
  EXPECT_EQ(result->exitCode, 127);
  EXPECT_FALSE(result->err.empty());
}

TEST(OsTest, RunCapturedEmptyCommand) {
  EXPECT_FALSE(os::run_captured({}, "/", 10s));
}

TEST(OsTest, ChangeOwnerIsIdempotent) {
  char tmpl[] = "/tmp/runbox-os-XXXXXX";
  ASSERT_NE(mkdtemp(tmpl), nullptr);
  fs::path dir{tmpl};

  struct stat before{};
  ASSERT_EQ(stat(dir.c_str(), &before), 0);

  // Re-owning to the current owner is allowed without privileges
  EXPECT_TRUE(os::change_owner(dir, getuid(), getgid()));
  EXPECT_TRUE(os::change_owner(dir, getuid(), getgid()));

  struct stat after{};
  ASSERT_EQ(stat(dir.c_str(), &after), 0);
  EXPECT_EQ(after.st_uid, getuid());
  EXPECT_EQ(after.st_gid, getgid());
  EXPECT_EQ(after.st_mode, before.st_mode);

  fs::remove_all(dir);
}

TEST(OsTest, ChangeOwnerMissingPath) {
  EXPECT_FALSE(os::change_owner("/nonexistent/runbox-test", getuid(), getgid()));
}

TEST(OsTest, FindBinary) {
  auto sh = os::find_binary("sh");
  ASSERT_TRUE(sh);
  EXPECT_EQ(sh->filename(), "sh");

  EXPECT_EQ(os::find_binary("/bin/sh"), fs::path{"/bin/sh"});
  EXPECT_FALSE(os::find_binary("runbox-no-such-binary"));
}

TEST(OsTest, WriteToFd) {
  int fds[2];
  ASSERT_EQ(pipe(fds), 0);

  std::string data = "hello";
  EXPECT_TRUE(os::write_to_fd(fds[1], data));
  close(fds[1]);

  char buf[16] = {};
  EXPECT_EQ(read(fds[0], buf, sizeof(buf)), 5);
  EXPECT_STREQ(buf, "hello");
  close(fds[0]);
}
