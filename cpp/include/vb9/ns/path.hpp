#pragma once

#include <string>
#include <string_view>

namespace vb9::ns {

    // Forces a leading '/', collapses runs of '/', drops a trailing '/' except for the root.
    // normalize_path(normalize_path(p)) == normalize_path(p).
    [[nodiscard]] std::string normalize_path(std::string_view path);

    [[nodiscard]] std::string join_path(std::string_view dir, std::string_view name);

} // namespace vb9::ns
