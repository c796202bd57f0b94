#pragma once

#include "sbx_a_types.hh"

#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

/* --------------------------------------------- */

struct sbx_i // sandbox invocation: runtime binary + argument vector, never mutated after build
{
  const std::string runtime;
  const std::vector<std::string> args;
  sbx_i(std::string _runtime, std::vector<std::string> _args) : runtime(std::move(_runtime)), args(std::move(_args)) {}
  bool operator==(const sbx_i&) const = default;
  inline std::string dump_() const // for logs only, not shell-safe
  {
    std::string line = runtime;
    for (const auto& a : args)
    {
      line.push_back(' ');
      line += a;
    }
    return line;
  }
};

/* --------------------------------------------- */

class inv_t // invocation builder: pure, no I/O
{
public:
  // fixed notation, trailing zeros dropped but one decimal kept: 1 -> "1.0", 0.25 -> "0.25"
  static inline std::string cpu_text_(double _cpu)
  {
    char buffer[512];
    snprintf(buffer, sizeof(buffer), "%.6f", _cpu);
    std::string text(buffer);
    while (text.size() > 2 && text.back() == '0' && text[text.size() - 2] != '.') text.pop_back();
    return text;
  }
  static inline std::vector<std::string> split_(const std::string& _command) // whitespace only: no quoting
  {
    std::vector<std::string> tokens;
    std::istringstream iss(_command);
    std::string token;
    while (iss >> token) tokens.push_back(token);
    return tokens;
  }
  static inline std::string substitute_(std::string _text, const std::string& _file)
  {
    static const std::string placeholder = "{file}";
    for (size_t pos = _text.find(placeholder); pos != std::string::npos; pos = _text.find(placeholder, pos + _file.size()))
    {
      _text.replace(pos, placeholder.size(), _file);
    }
    return _text;
  }
  static inline std::string sandbox_path_(const sbx_p& _profile, const std::filesystem::path& _file, const std::filesystem::path& _workdir)
  {
    std::string relative = _file.lexically_relative(_workdir).generic_string();
    if (_profile.mount_path == "/") return "/" + relative;
    return _profile.mount_path + "/" + relative;
  }
  static inline sbx_i build_(const std::string& _runtime
    , const sbx_p& _profile
    , const sbx_q& _request
    , const sbx_l& _limits
    , const std::filesystem::path& _workdir
  )
  {
    std::vector<std::string> args = {"run", "--rm"};
    // 1. mount + 2. working directory
    args.insert(args.end(), {"-v", _workdir.string() + ":" + _profile.mount_path});
    args.insert(args.end(), {"-w", _profile.mount_path});
    // 3. resource flags
    args.insert(args.end(), {"--cpus", cpu_text_(_limits.cpu)});
    args.insert(args.end(), {"--memory", _limits.memory});
    // 4. isolation
    args.insert(args.end(), {"--network", "none"});
    if (_profile.harden) args.insert(args.end(), {"--read-only", "--tmpfs", "/tmp"});
    // 5. image
    args.push_back(_profile.image);
    // 6. command with {file} -> in-sandbox path
    std::string file = sandbox_path_(_profile, _request.file, _workdir);
    if (_profile.tokens.empty())
    {
      for (auto& token : split_(substitute_(_profile.command, file))) args.push_back(std::move(token));
    }
    else
    {
      for (const auto& token : _profile.tokens) args.push_back(substitute_(token, file));
    }
    // 7. caller arguments verbatim
    args.insert(args.end(), _request.args.begin(), _request.args.end());
    return sbx_i(_runtime, std::move(args));
  }
};
