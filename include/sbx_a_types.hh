#pragma once

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <unistd.h>
#include <sys/types.h>
#include <sys/time.h>
#include <regex>
#include <string>
#include <vector>
#include <stdexcept>

/* --------------------------------------------- */

inline constexpr double sbx_cpu_default = 0.5;
inline constexpr double sbx_cpu_min = 0.1; // recommended range, not enforced
inline constexpr double sbx_cpu_max = 8.0;
inline constexpr double sbx_cpu_floor = 0.01; // smallest share the runtime accepts
inline constexpr const char* sbx_memory_default = "256m";
inline constexpr uint64_t sbx_timeout_default = 300; // seconds
inline constexpr uint64_t sbx_budget_max_ms = 315360000000; // ten years; a longer budget is waited for without a deadline
inline constexpr const char* sbx_mount_default = "/app";
inline constexpr const char* sbx_tag_default = "latest";
inline constexpr const char* sbx_runtime_default = "docker";

/* --------------------------------------------- */

struct tim_t
{
  time_t   utcs;  // seconds since epoch (UTC)
  int64_t  nsec;  // nanoseconds (0 <= nsec < 1e9)
  uint64_t utcms; // milliseconds since epoch

  tim_t() : utcs(0), nsec(0), utcms(0) {}

  explicit tim_t(const struct timespec& _ts)
  {
    utcs = _ts.tv_sec;
    nsec = _ts.tv_nsec;
    utcms = static_cast<uint64_t>(_ts.tv_sec) * 1000 + _ts.tv_nsec / 1000000;
  }

  static inline tim_t now_()
  {
    tim_t t;
    struct timespec ts;
    if (clock_gettime(CLOCK_REALTIME, &ts) == 0) t = tim_t(ts);
    else
    {
      t.utcs = time(NULL);
      t.utcms = static_cast<uint64_t>(t.utcs) * 1000;
    }
    return t;
  }

  inline std::string iso_() const // 2026-10-19T10:55:03.042Z
  {
    char buffer[64];
    struct tm t;
    gmtime_r(&utcs, &t);
    size_t len = strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &t);
    if (len == 0) return std::string();
    snprintf(buffer + len, sizeof(buffer) - len, ".%03dZ", static_cast<int>(nsec / 1000000));
    return std::string(buffer);
  }
};

/* --------------------------------------------- */

struct sbx_e : public std::runtime_error // error base: every error carries a structured context
{
  std::string kind;
  nlohmann::json context;
  sbx_e(const std::string& _kind, const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : std::runtime_error(_what), kind(_kind), context(std::move(_context)) {}
};

struct sbx_e_config : public sbx_e // bad or missing configuration, fatal to startup
{
  explicit sbx_e_config(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("ConfigError", _what, std::move(_context)) {}
};

struct sbx_e_path : public sbx_e // unsafe or missing file
{
  explicit sbx_e_path(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("PathError", _what, std::move(_context)) {}
};

struct sbx_e_language : public sbx_e
{
  explicit sbx_e_language(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("UnknownLanguageError", _what, std::move(_context)) {}
};

struct sbx_e_extension : public sbx_e
{
  explicit sbx_e_extension(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("UnknownExtensionError", _what, std::move(_context)) {}
};

struct sbx_e_runtime : public sbx_e // container runtime unreachable or pull failure
{
  explicit sbx_e_runtime(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("RuntimeUnavailableError", _what, std::move(_context)) {}
};

struct sbx_e_timeout : public sbx_e
{
  explicit sbx_e_timeout(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("TimeoutError", _what, std::move(_context)) {}
};

struct sbx_e_execution : public sbx_e // spawn failure or non-zero runtime status
{
  explicit sbx_e_execution(const std::string& _what, nlohmann::json _context = nlohmann::json::object())
    : sbx_e("ExecutionError", _what, std::move(_context)) {}
};

/* --------------------------------------------- */

struct sbx_p // language profile
{
  std::string name;
  std::string image;                   // normalized: always carries a tag or digest
  std::string command;                 // "python {file}"; empty when tokens is set
  std::vector<std::string> tokens;     // structured command: ["python", "{file}"]
  std::vector<std::string> extensions; // lowercase alphanumeric, no dot
  std::string mount_path = sbx_mount_default;
  double cpu = sbx_cpu_default;
  std::string memory = sbx_memory_default;
  uint64_t timeout = sbx_timeout_default; // seconds
  bool harden = false;                 // --read-only --tmpfs /tmp
  inline bool claims_(const std::string& _ext) const
  {
    for (const auto& e : extensions) if (e == _ext) return true;
    return false;
  }
};

struct sbx_q // execution request
{
  std::string language;
  std::string file;              // absolute host path once resolved
  std::vector<std::string> args; // extra positional arguments
};

struct sbx_l // resource limits
{
  double cpu = sbx_cpu_default;
  std::string memory = sbx_memory_default;
  uint64_t timeout = sbx_timeout_default; // seconds
};

struct sbx_r // execution result
{
  std::string output; // stdout followed by stderr
  int exit_code = 0;
  uint64_t elapsed_ms = 0;
};

/* --------------------------------------------- */

static inline bool sbx_memory_ok_(const std::string& _memory)
{
  static const std::regex pattern("^[0-9]+[kmgKMG]?$");
  return std::regex_match(_memory, pattern);
}

static inline bool sbx_cpu_recommended_(double _cpu) noexcept
{
  return _cpu >= sbx_cpu_min && _cpu <= sbx_cpu_max;
}
