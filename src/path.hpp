#pragma once
#include <string>
#include <string_view>
#include <system_error>

namespace launcher {
// looks name up the way execvp does, without the /bin:/usr/bin fallback
auto resolve_path(std::string_view name, std::error_code& error) -> std::string;
} // namespace launcher
