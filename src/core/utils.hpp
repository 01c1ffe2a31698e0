#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// POSIX-style path helpers. Remote paths are always '/' separated, so these
// work on strings instead of std::filesystem.
//   posix_dirname("/a/b/") == "/a", posix_dirname("a") == "."
//   posix_basename("/a/b/") == "b"
std::string posix_dirname(const std::string& path);
std::string posix_basename(const std::string& path);
std::string posix_join(const std::string& dir, const std::string& name);

// "C:\dir\file" -> "/C/dir/file" for msys builds of rsync/tar/scp.
// Any other path is returned unchanged.
std::string resolve_msys_path(const std::string& path);

// Expand a leading "~/" to the home directory.
std::string expand_home(const std::string& path);
