#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../entrypoint.h"

namespace fs = std::filesystem;

namespace {
// Identity of the test process itself, so no switch is needed
identity::Identity self(const fs::path &shell = "/bin/sh") {
  identity::Identity id;
  id.user = {.name = "self",
             .uid = getuid(),
             .gid = getgid(),
             .home = "/tmp",
             .shell = shell};
  id.group = {.name = "self", .gid = getgid()};
  id.groups = {getgid()};
  return id;
}

// Runs replace_process() in a child and returns its exit status
int runInChild(const identity::Identity &id,
               const std::vector<std::string> &args, bool direct) {
  pid_t pid = fork();
  if (pid == 0) {
    int code = entrypoint::replace_process(id, args, direct);
    _exit(code);
  }

  int wstatus = 0;
  if (waitpid(pid, &wstatus, 0) != pid || !WIFEXITED(wstatus))
    return -1;

  return WEXITSTATUS(wstatus);
}

std::string readFile(const fs::path &path) {
  std::ifstream in{path};
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

class EntrypointTest : public testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/runbox-entrypoint-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir = tmpl;
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path dir;
};
}

TEST(JoinCommandTest, PreservesOrder) {
  std::vector<std::string> args{"python", "server.py"};
  EXPECT_EQ(entrypoint::join_command(args), "python server.py");
}

TEST(JoinCommandTest, EdgeCases) {
  EXPECT_EQ(entrypoint::join_command({}), "");

  std::vector<std::string> single{"ls -l"};
  EXPECT_EQ(entrypoint::join_command(single), "ls -l");

  std::vector<std::string> args{"echo", "a", "", "b"};
  EXPECT_EQ(entrypoint::join_command(args), "echo a  b");
}

TEST(SelectShellTest, FallsBack) {
  identity::User user{.name = "u", .shell = "/bin/sh"};
  EXPECT_EQ(entrypoint::select_shell(user), fs::path{"/bin/sh"});

  user.shell = "/nonexistent/shell";
  EXPECT_EQ(entrypoint::select_shell(user), fs::path{"/bin/sh"});

  user.shell.clear();
  EXPECT_EQ(entrypoint::select_shell(user), fs::path{"/bin/sh"});
}

TEST_F(EntrypointTest, ChangeOwnershipSucceedsForAllPaths) {
  fs::create_directory(dir / "tmp");
  fs::create_directory(dir / "cache");
  std::vector<fs::path> paths{dir / "tmp", dir / "cache"};

  EXPECT_TRUE(entrypoint::change_ownership(paths, self()));
  // Again: already correctly owned paths stay as they are
  EXPECT_TRUE(entrypoint::change_ownership(paths, self()));

  for (auto &path : paths) {
    struct stat st{};
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_uid, getuid());
    EXPECT_EQ(st.st_gid, getgid());
  }
}

TEST_F(EntrypointTest, ChangeOwnershipFailsOnMissingPath) {
  fs::create_directory(dir / "cache");
  std::vector<fs::path> paths{dir / "missing", dir / "cache"};
  EXPECT_FALSE(entrypoint::change_ownership(paths, self()));

  std::vector<fs::path> reversed{dir / "cache", dir / "missing"};
  EXPECT_FALSE(entrypoint::change_ownership(reversed, self()));
}

TEST_F(EntrypointTest, ShellCommandIsJoined) {
  auto out = dir / "out";
  std::vector<std::string> args{"printf", "'%s-%s'", "first", "second",
                                ">", out.string()};

  EXPECT_EQ(runInChild(self(), args, false), 0);
  EXPECT_EQ(readFile(out), "first-second");
}

TEST_F(EntrypointTest, ShellExitCodeIsPropagated) {
  EXPECT_EQ(runInChild(self(), {"exit", "42"}, false), 42);
}

TEST_F(EntrypointTest, EmptyCommandSucceeds) {
  EXPECT_EQ(runInChild(self(), {}, false), 0);
}

TEST_F(EntrypointTest, DirectExecKeepsArguments) {
  auto out = dir / "out";
  // With --direct, ">" is a plain argument and not a redirection
  std::vector<std::string> args{
      "sh", "-c", "printf '%s|' \"$@\" > \"$0\"", out.string(), "a b", ">"};

  EXPECT_EQ(runInChild(self(), args, true), 0);
  EXPECT_EQ(readFile(out), "a b|>|");
}

TEST_F(EntrypointTest, EnvironmentPassesThrough) {
  auto out = dir / "env";
  setenv("RUNBOX_TEST_VARIABLE", "kept", 1);

  std::vector<std::string> args{"echo", "$RUNBOX_TEST_VARIABLE", ">",
                                out.string()};
  EXPECT_EQ(runInChild(self(), args, false), 0);
  EXPECT_EQ(readFile(out), "kept\n");
}

TEST_F(EntrypointTest, ExecFailureExitCodes) {
  EXPECT_EQ(runInChild(self(), {"/nonexistent/runbox-binary"}, true),
            entrypoint::EXIT_NOT_FOUND);

  auto notExecutable = dir / "script";
  std::ofstream{notExecutable} << "#!/bin/sh\n";
  EXPECT_EQ(runInChild(self(), {notExecutable.string()}, true),
            entrypoint::EXIT_NOT_EXECUTABLE);
}

TEST_F(EntrypointTest, DropPrivilegesAsRoot) {
  if (getuid() != 0)
    GTEST_SKIP() << "needs root";

  auto target = identity::resolve("nobody");
  if (!target)
    GTEST_SKIP() << "no user 'nobody'";

  // nobody usually has nologin as shell
  target->user.shell = "/bin/sh";

  fs::permissions(dir, fs::perms::owner_all | fs::perms::group_exec |
                           fs::perms::others_exec);
  auto owned = dir / "owned";
  fs::create_directory(owned);
  std::vector<fs::path> paths{owned};
  ASSERT_TRUE(entrypoint::change_ownership(paths, *target));

  struct stat st{};
  ASSERT_EQ(stat(owned.c_str(), &st), 0);
  EXPECT_EQ(st.st_uid, target->user.uid);
  EXPECT_EQ(st.st_gid, target->group.gid);

  // The command runs as the target user and may write into its directory
  auto out = owned / "id";
  pid_t pid = fork();
  if (pid == 0) {
    if (!entrypoint::drop_privileges(*target))
      _exit(100);

    std::vector<std::string> args{"id", "-u", ">", out.string()};
    _exit(entrypoint::replace_process(*target, args, false));
  }

  int wstatus = 0;
  ASSERT_EQ(waitpid(pid, &wstatus, 0), pid);
  ASSERT_TRUE(WIFEXITED(wstatus));
  ASSERT_EQ(WEXITSTATUS(wstatus), 0);
  EXPECT_EQ(readFile(out), std::to_string(target->user.uid) + "\n");
}
