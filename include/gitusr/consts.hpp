#pragma once
#include <string_view>

namespace gitusr::consts {

// Program identity
inline constexpr std::string_view kToolName    = "git-usr";
inline constexpr std::string_view kVersion     = "1.0.0";

// Profiles file location
inline constexpr std::string_view kConfigDirName = "git-usr";
inline constexpr std::string_view kProfilesFile  = "profiles.json";

// Environment overrides
inline constexpr std::string_view kEnvProfiles = "GIT_USR_PROFILES";
inline constexpr std::string_view kEnvGit      = "GIT_USR_GIT";

// git collaborator
inline constexpr std::string_view kGitExecutable = "git";
inline constexpr std::string_view kKeyUserName   = "user.name";
inline constexpr std::string_view kKeyUserEmail  = "user.email";

// JSON member names inside a profile entry
inline constexpr std::string_view kFieldName  = "name";
inline constexpr std::string_view kFieldEmail = "email";

} // namespace gitusr::consts
