#include <cstdlib>

#include <sys/stat.h>
#include <unistd.h>

#include "error.hpp"
#include "path.hpp"

namespace launcher {
namespace {
auto check_executable(const std::string& path) -> std::error_code {
    struct stat st;
    if(stat(path.data(), &st) == -1) {
        return last_error();
    }
    if(!S_ISREG(st.st_mode)) {
        return std::make_error_code(std::errc::permission_denied);
    }
    if(access(path.data(), X_OK) == -1) {
        return last_error();
    }
    return {};
}
} // namespace

auto resolve_path(const std::string_view name, std::error_code& error) -> std::string {
    error.clear();
    if(name.empty()) {
        error = Error::NotFound;
        return {};
    }

    if(name.find('/') != name.npos) {
        auto path = std::string(name);
        if(const auto e = check_executable(path); e) {
            error = e == std::errc::no_such_file_or_directory || e == std::errc::not_a_directory ? std::error_code(Error::NotFound) : e;
            return {};
        }
        return path;
    }

    const auto env = getenv("PATH");
    if(env == nullptr || *env == '\0') {
        error = Error::NotFound;
        return {};
    }

    const auto search = std::string_view(env);
    for(auto pos = size_t(0); pos <= search.size();) {
        auto end = search.find(':', pos);
        if(end == search.npos) {
            end = search.size();
        }
        const auto dir  = search.substr(pos, end - pos);
        auto       path = std::string(dir.empty() ? "." : dir);
        path += '/';
        path += name;
        if(!check_executable(path)) {
            return path;
        }
        pos = end + 1;
    }

    error = Error::NotFound;
    return {};
}
} // namespace launcher
