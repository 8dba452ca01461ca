#pragma once

#include <array>
#include <string_view>

namespace pfs::fs {

// Names the desktop, version control and editor tooling probe for on every
// directory. They never exist remotely, so lookups skip the network.
inline constexpr std::array<std::string_view, 15> JUNK_NAME_PREFIXES = {
    // macOS
    "._",
    ".DS_Store",
    ".Spotlight-",
    ".ql_",
    ".hidden",
    ".metadata_never_index",
    ".nomedia",

    // scm
    ".git",
    ".hg",
    ".bzr",
    ".svn",
    "_darcs",

    // misc
    ".envrc",       // direnv
    ".Trash-",      // nautilus
    ".localized",
};

// True when the final component of path starts with a known probe prefix.
[[nodiscard]] bool isJunkName(std::string_view path) noexcept;

}
