#pragma once

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>

/* --------------------------------------------- */

class grd_t // path guard: the only check keeping host files outside the working tree out of the sandbox
{
public:
  grd_t() : grd_t(std::filesystem::current_path()) {}
  explicit grd_t(const std::filesystem::path& _workdir)
  {
    std::error_code ec;
    workdir = std::filesystem::canonical(_workdir, ec);
    if (ec)
    {
      throw log_t::get_().fail_(sbx_e_path("Cannot resolve working directory " + _workdir.string() + ": " + ec.message()
        , {{"workdir", _workdir.string()}}));
    }
  }
  inline const std::filesystem::path& workdir_() const noexcept { return workdir; }
  inline std::filesystem::path resolve_(const std::string& _path) const
  {
    if (std::all_of(_path.begin(), _path.end(), [](unsigned char c) { return std::isspace(c); }))
    {
      throw log_t::get_().fail_(sbx_e_path("No file given", {{"path", _path}}));
    }
    std::filesystem::path p(_path);
    if (p.is_relative()) p = workdir / p;
    std::error_code ec;
    if (!std::filesystem::exists(p, ec))
    {
      throw log_t::get_().fail_(sbx_e_path("File does not exist: " + _path, {{"path", _path}}));
    }
    std::filesystem::path resolved = std::filesystem::canonical(p, ec); // follows symlinks before the containment check
    if (ec)
    {
      throw log_t::get_().fail_(sbx_e_path("Cannot resolve " + _path + ": " + ec.message(), {{"path", _path}}));
    }
    if (!within_(workdir, resolved))
    {
      throw log_t::get_().fail_(sbx_e_path("File is outside the working directory: " + _path
        , {{"path", _path}, {"resolved", resolved.string()}, {"workdir", workdir.string()}}));
    }
    if (!std::filesystem::is_regular_file(resolved, ec))
    {
      throw log_t::get_().fail_(sbx_e_path("Not a regular file: " + _path, {{"path", _path}, {"resolved", resolved.string()}}));
    }
    log_t::get_().debug_("Resolved path", {{"path", _path}, {"resolved", resolved.string()}});
    return resolved;
  }
  inline std::filesystem::path relative_(const std::filesystem::path& _resolved) const
  {
    return _resolved.lexically_relative(workdir);
  }
  // component-wise: /work/project-x is not inside /work/project
  static inline bool within_(const std::filesystem::path& _root, const std::filesystem::path& _path)
  {
    auto r = _root.begin();
    auto p = _path.begin();
    for (; r != _root.end(); ++r, ++p)
    {
      if (p == _path.end() || *r != *p) return false;
    }
    return true;
  }
private:
  std::filesystem::path workdir;
};
