#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "../identity.h"

namespace fs = std::filesystem;

namespace {
class IdentityTest : public testing::Test {
protected:
  void SetUp() override {
    char tmpl[] = "/tmp/runbox-identity-XXXXXX";
    ASSERT_NE(mkdtemp(tmpl), nullptr);
    dir = tmpl;

    passwd = dir / "passwd";
    group = dir / "group";

    std::ofstream{passwd} << "root:x:0:0:root:/root:/bin/bash\n"
                             "# comment\n"
                             "broken line\n"
                             "appuser:x:1001:1001::/home/appuser:/bin/bash\n"
                             "lonely:x:1002:4242::/home/lonely:\n";

    std::ofstream{group} << "root:x:0:\n"
                            "appuser:x:1001:\n"
                            "audio:x:29:appuser,other\n"
                            "video:x:44:other\n"
                            "docker:x:999:other,appuser\n";
  }

  void TearDown() override { fs::remove_all(dir); }

  fs::path dir;
  fs::path passwd;
  fs::path group;
};
}

TEST_F(IdentityTest, FindUserByName) {
  auto user = identity::find_user("appuser", passwd);
  ASSERT_TRUE(user);
  EXPECT_EQ(user->name, "appuser");
  EXPECT_EQ(user->uid, 1001u);
  EXPECT_EQ(user->gid, 1001u);
  EXPECT_EQ(user->home, fs::path{"/home/appuser"});
  EXPECT_EQ(user->shell, fs::path{"/bin/bash"});
}

TEST_F(IdentityTest, FindUserById) {
  auto user = identity::find_user("1002", passwd);
  ASSERT_TRUE(user);
  EXPECT_EQ(user->name, "lonely");
  EXPECT_TRUE(user->shell.empty());
}

TEST_F(IdentityTest, UnknownUser) {
  EXPECT_FALSE(identity::find_user("nobody", passwd));
  EXPECT_FALSE(identity::find_user("4711", passwd));
  EXPECT_FALSE(identity::find_user("appuser", dir / "missing"));
}

TEST_F(IdentityTest, FindGroup) {
  auto audio = identity::find_group("audio", group);
  ASSERT_TRUE(audio);
  EXPECT_EQ(audio->gid, 29u);
  EXPECT_EQ(audio->members, (std::vector<std::string>{"appuser", "other"}));

  auto byId = identity::find_group("1001", group);
  ASSERT_TRUE(byId);
  EXPECT_EQ(byId->name, "appuser");
  EXPECT_TRUE(byId->members.empty());
}

TEST_F(IdentityTest, SupplementaryGroups) {
  EXPECT_EQ(identity::supplementary_groups("appuser", 1001, group),
            (std::vector<gid_t>{1001, 29, 999}));
  EXPECT_EQ(identity::supplementary_groups("lonely", 4242, group),
            (std::vector<gid_t>{4242}));
}

TEST_F(IdentityTest, ResolveUserAndGroup) {
  auto id = identity::resolve("appuser:appuser", passwd, group);
  ASSERT_TRUE(id);
  EXPECT_EQ(id->user.uid, 1001u);
  EXPECT_EQ(id->group.name, "appuser");
  EXPECT_EQ(id->group.gid, 1001u);
  EXPECT_EQ(id->groups, (std::vector<gid_t>{1001, 29, 999}));
}

TEST_F(IdentityTest, ResolveExplicitGroup) {
  auto id = identity::resolve("appuser:video", passwd, group);
  ASSERT_TRUE(id);
  EXPECT_EQ(id->group.gid, 44u);
  EXPECT_EQ(id->groups.front(), 44u);
}

TEST_F(IdentityTest, ResolvePrimaryGroupWithoutEntry) {
  auto id = identity::resolve("lonely", passwd, group);
  ASSERT_TRUE(id);
  EXPECT_EQ(id->group.gid, 4242u);
  EXPECT_EQ(id->group.name, "4242");
}

TEST_F(IdentityTest, ResolveFailures) {
  EXPECT_FALSE(identity::resolve("", passwd, group));
  EXPECT_FALSE(identity::resolve(":appuser", passwd, group));
  EXPECT_FALSE(identity::resolve("ghost", passwd, group));
  EXPECT_FALSE(identity::resolve("appuser:ghosts", passwd, group));
}

TEST_F(IdentityTest, CurrentUserName) {
  std::ofstream{passwd, std::ios::app}
      << "me:x:" << getuid() << ":" << getgid() << "::/tmp:/bin/sh\n";

  auto name = identity::current_user_name(passwd);
  if (getuid() == 0)
    EXPECT_EQ(name, "root");
  else
    EXPECT_EQ(name, "me");

  EXPECT_EQ(identity::current_user_name(dir / "missing"),
            std::to_string(getuid()));
}

TEST_F(IdentityTest, ExportEnvironment) {
  auto id = identity::resolve("appuser", passwd, group);
  ASSERT_TRUE(id);

  identity::export_environment(*id);
  EXPECT_STREQ(getenv("HOME"), "/home/appuser");
  EXPECT_STREQ(getenv("USER"), "appuser");
  EXPECT_STREQ(getenv("LOGNAME"), "appuser");
  EXPECT_STREQ(getenv("SHELL"), "/bin/bash");
}
