// User/group resolution and identity switching
// Author: Max Schwarz <max.schwarz@online.de>

#include "identity.h"

#include <algorithm>
#include <charconv>
#include <fstream>
#include <ranges>

#include <fmt/std.h>

#include <grp.h>
#include <unistd.h>

#include <scope_guard.hpp>

#include "log.h"

namespace fs = std::filesystem;

namespace identity
{

namespace
{
    std::vector<std::string_view> split(std::string_view line, char sep)
    {
        std::vector<std::string_view> fields;
        for(auto part : line | std::views::split(sep))
            fields.push_back(std::string_view{part});

        return fields;
    }

    template<typename T>
    std::optional<T> parse_id(std::string_view str)
    {
        T value{};
        auto [end, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if(str.empty() || ec != std::errc{} || end != str.data() + str.size())
            return {};

        return value;
    }

    // Calls @p func with the fields of each well-formed line
    template<typename Func>
    bool for_each_entry(const fs::path& file, std::size_t numFields, Func&& func)
    {
        std::ifstream in{file};
        if(!in)
        {
            sys_error("Could not open {}", file);
            return false;
        }

        for(std::string line; std::getline(in, line);)
        {
            if(line.empty() || line.starts_with('#'))
                continue;

            auto fields = split(line, ':');
            if(fields.size() != numFields)
            {
                debug("Ignoring malformed line in {}: '{}'", file, line);
                continue;
            }

            if(func(fields))
                break;
        }

        return true;
    }
}

std::optional<User> find_user(std::string_view nameOrId, const fs::path& passwdFile)
{
    auto wantedUID = parse_id<uid_t>(nameOrId);
    std::optional<User> result;

    bool ok = for_each_entry(passwdFile, 7, [&](const std::vector<std::string_view>& fields) {
        auto uid = parse_id<uid_t>(fields[2]);
        auto gid = parse_id<gid_t>(fields[3]);
        if(!uid || !gid)
            return false;

        if(fields[0] != nameOrId && (!wantedUID || *uid != *wantedUID))
            return false;

        result = User{
            .name = std::string{fields[0]},
            .uid = *uid,
            .gid = *gid,
            .home = fs::path{fields[5]},
            .shell = fs::path{fields[6]}
        };
        return true;
    });

    if(!ok)
        return {};

    return result;
}

std::optional<Group> find_group(std::string_view nameOrId, const fs::path& groupFile)
{
    auto wantedGID = parse_id<gid_t>(nameOrId);
    std::optional<Group> result;

    bool ok = for_each_entry(groupFile, 4, [&](const std::vector<std::string_view>& fields) {
        auto gid = parse_id<gid_t>(fields[2]);
        if(!gid)
            return false;

        if(fields[0] != nameOrId && (!wantedGID || *gid != *wantedGID))
            return false;

        Group group{.name = std::string{fields[0]}, .gid = *gid};
        if(!fields[3].empty())
        {
            for(auto member : split(fields[3], ','))
                group.members.emplace_back(member);
        }

        result = std::move(group);
        return true;
    });

    if(!ok)
        return {};

    return result;
}

std::vector<gid_t> supplementary_groups(std::string_view user, gid_t primary, const fs::path& groupFile)
{
    std::vector<gid_t> groups{primary};

    bool ok = for_each_entry(groupFile, 4, [&](const std::vector<std::string_view>& fields) {
        auto gid = parse_id<gid_t>(fields[2]);
        if(!gid || fields[3].empty())
            return false;

        auto members = split(fields[3], ',');
        if(std::ranges::find(members, user) != members.end() && std::ranges::find(groups, *gid) == groups.end())
            groups.push_back(*gid);

        return false;
    });

    if(!ok)
        warning("Could not read supplementary groups of {}, using primary group only", user);

    return groups;
}

std::optional<Identity> resolve(std::string_view spec, const fs::path& passwdFile, const fs::path& groupFile)
{
    std::string_view userPart = spec;
    std::optional<std::string_view> groupPart;

    if(auto sep = spec.find(':'); sep != spec.npos)
    {
        userPart = spec.substr(0, sep);
        groupPart = spec.substr(sep + 1);
    }

    if(userPart.empty())
    {
        error("Empty user name in '{}'", spec);
        return {};
    }

    auto user = find_user(userPart, passwdFile);
    if(!user)
    {
        error("Unknown user '{}'", userPart);
        return {};
    }

    std::optional<Group> group;
    if(groupPart && !groupPart->empty())
    {
        group = find_group(*groupPart, groupFile);
        if(!group)
        {
            error("Unknown group '{}'", *groupPart);
            return {};
        }
    }
    else
    {
        group = find_group(std::to_string(user->gid), groupFile);
        if(!group)
        {
            // A primary gid without a group entry is legal
            debug("Primary group {} of {} has no entry in {}", user->gid, user->name, groupFile);
            group = Group{.name = std::to_string(user->gid), .gid = user->gid};
        }
    }

    Identity identity{.user = std::move(*user), .group = std::move(*group)};
    identity.groups = supplementary_groups(identity.user.name, identity.group.gid, groupFile);

    return identity;
}

std::string current_user_name(const fs::path& passwdFile)
{
    auto uid = std::to_string(getuid());

    auto user = find_user(uid, passwdFile);
    if(!user)
        return uid;

    return user->name;
}

bool has_capability(cap_value_t cap)
{
    cap_t caps = cap_get_proc();
    if(!caps)
    {
        sys_error("Could not get caps");
        return false;
    }

    auto guard = sg::make_scope_guard([&]{ cap_free(caps); });

    cap_flag_value_t value = CAP_CLEAR;
    if(cap_get_flag(caps, cap, CAP_EFFECTIVE, &value) != 0)
    {
        sys_error("Could not query cap {}", cap);
        return false;
    }

    return value == CAP_SET;
}

namespace
{
    bool capabilities_empty()
    {
        cap_t caps = cap_get_proc();
        if(!caps)
        {
            sys_error("Could not get caps");
            return false;
        }
        auto guard = sg::make_scope_guard([&]{ cap_free(caps); });

        cap_t empty = cap_init();
        if(!empty)
        {
            sys_error("Could not allocate cap set");
            return false;
        }
        auto emptyGuard = sg::make_scope_guard([&]{ cap_free(empty); });

        return cap_compare(caps, empty) == 0;
    }
}

bool switch_to(const Identity& identity)
{
    const auto& user = identity.user;
    const gid_t gid = identity.group.gid;

    debug("Switching to {}:{} (uid={}, gid={}, groups={})",
        user.name, identity.group.name, user.uid, gid, identity.groups.size());

    if(setgroups(identity.groups.size(), identity.groups.data()) != 0)
    {
        sys_error("Could not set supplementary groups for {}", user.name);
        return false;
    }

    if(setgid(gid) != 0)
    {
        sys_error("Could not change group to {}", identity.group.name);
        return false;
    }

    if(setuid(user.uid) != 0)
    {
        sys_error("Could not change user to {}", user.name);
        return false;
    }

    if(user.uid == 0)
        return true;

    if(setuid(0) == 0 || seteuid(0) == 0)
    {
        error("Still able to regain root privileges after switching to {}", user.name);
        return false;
    }

    if(!capabilities_empty())
    {
        error("Capabilities left after switching to {}", user.name);
        return false;
    }

    return true;
}

void export_environment(const Identity& identity)
{
    const auto& user = identity.user;

    setenv("HOME", user.home.c_str(), 1);
    setenv("USER", user.name.c_str(), 1);
    setenv("LOGNAME", user.name.c_str(), 1);

    if(!user.shell.empty())
        setenv("SHELL", user.shell.c_str(), 1);
}

}
