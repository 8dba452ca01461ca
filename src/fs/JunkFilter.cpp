#include "fs/JunkFilter.hpp"

namespace pfs::fs {

bool isJunkName(std::string_view path) noexcept {
    if (const auto slash = path.rfind('/'); slash != std::string_view::npos)
        path.remove_prefix(slash + 1);

    for (const auto prefix : JUNK_NAME_PREFIXES)
        if (path.starts_with(prefix)) return true;

    return false;
}

}
