#include "utils.hpp"
#include <platform/platform.hpp>
#include <regex>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

static std::string strip_trailing_slashes(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    return p;
}

std::string posix_dirname(const std::string& path) {
    std::string p = strip_trailing_slashes(path);
    auto slash = p.rfind('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return strip_trailing_slashes(p.substr(0, slash));
}

std::string posix_basename(const std::string& path) {
    std::string p = strip_trailing_slashes(path);
    if (p == "/") return "";
    auto slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

std::string posix_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string resolve_msys_path(const std::string& path) {
    static const std::regex drive(R"(^(\w):\\(.*)$)");
    std::smatch m;
    if (!std::regex_match(path, m, drive)) return path;

    std::string rest = m[2].str();
    for (auto& c : rest) {
        if (c == '\\') c = '/';
    }
    return "/" + m[1].str() + "/" + rest;
}

std::string expand_home(const std::string& path) {
    if (path.rfind("~/", 0) != 0) return path;
    return (platform::home_dir() / path.substr(2)).string();
}
