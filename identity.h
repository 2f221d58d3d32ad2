// User/group resolution and identity switching
// Author: Max Schwarz <max.schwarz@online.de>

#ifndef IDENTITY_H
#define IDENTITY_H

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/capability.h>
#include <sys/types.h>

#include "config.h"

namespace identity
{

struct User
{
    std::string name;
    uid_t uid = 0;
    gid_t gid = 0;
    std::filesystem::path home;
    std::filesystem::path shell;
};

struct Group
{
    std::string name;
    gid_t gid = 0;
    std::vector<std::string> members;
};

struct Identity
{
    User user;
    Group group;

    //! Supplementary groups, including the primary group
    std::vector<gid_t> groups;
};

/**
 * Look up a passwd entry by name or by numeric uid.
 **/
[[nodiscard]]
std::optional<User> find_user(std::string_view nameOrId,
    const std::filesystem::path& passwdFile = config::PASSWD_FILE);

[[nodiscard]]
std::optional<Group> find_group(std::string_view nameOrId,
    const std::filesystem::path& groupFile = config::GROUP_FILE);

//! All groups listing @p user as member, plus @p primary
[[nodiscard]]
std::vector<gid_t> supplementary_groups(std::string_view user, gid_t primary,
    const std::filesystem::path& groupFile = config::GROUP_FILE);

/**
 * Resolve a "USER[:GROUP]" specification.
 *
 * Without GROUP, the user's primary group is used. Errors are logged.
 **/
[[nodiscard]]
std::optional<Identity> resolve(std::string_view spec,
    const std::filesystem::path& passwdFile = config::PASSWD_FILE,
    const std::filesystem::path& groupFile = config::GROUP_FILE);

//! Name of the real user of this process, or the uid if it has no entry
[[nodiscard]]
std::string current_user_name(const std::filesystem::path& passwdFile = config::PASSWD_FILE);

[[nodiscard]]
bool has_capability(cap_value_t cap);

/**
 * Switch to the given identity (groups, gid, uid in that order).
 *
 * For an unprivileged target, verifies afterwards that root cannot be
 * regained and no capabilities are left.
 **/
[[nodiscard]]
bool switch_to(const Identity& identity);

//! Set HOME, USER, LOGNAME and SHELL for the target user (like su does)
void export_environment(const Identity& identity);

}

#endif
