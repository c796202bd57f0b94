#pragma once

#include "sbx_a_types.hh"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <cctype>
#include <type_traits>

/* --------------------------------------------- */

enum class log_v : uint8_t { error = 0, warn = 1, info = 2, debug = 3 }; // log level

static inline const char* log_v_name_(log_v _level) noexcept
{
  switch (_level)
  {
    case log_v::error: return "ERROR";
    case log_v::warn: return "WARN";
    case log_v::info: return "INFO";
    default: return "DEBUG";
  }
}

static inline log_v log_v_parse_(const std::string& _text, log_v _fallback = log_v::info)
{
  std::string s;
  for (char c : _text) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  if (s == "error") return log_v::error;
  if (s == "warn" || s == "warning") return log_v::warn;
  if (s == "info") return log_v::info;
  if (s == "debug") return log_v::debug;
  return _fallback;
}

/* --------------------------------------------- */

class log_t // process-wide structured event sink: one JSON record per line
{
public:
  static inline log_t& get_()
  {
    static log_t inst;
    return inst;
  }
  log_t(const log_t&) = delete;
  log_t& operator=(const log_t&) = delete;
  log_t(log_t&&) = delete;
  log_t& operator=(log_t&&) = delete;
  ~log_t() { fina_(); }
  // (re)open the sink; empty _path keeps file persistence off
  inline void init_(const std::string& _path, bool _console, log_v _level = log_v::info)
  {
    std::vector<spdlog::sink_ptr> sinks;
    try
    {
      if (!_path.empty()) sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(_path, false)); // append
    }
    catch (const spdlog::spdlog_ex& e)
    {
      throw sbx_e_config("Cannot open log sink " + _path + ": " + e.what(), {{"log_path", _path}});
    }
    if (_console)
    {
      auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console->set_pattern("%^%v%$");
      sinks.push_back(console);
    }
    auto logger = std::make_shared<spdlog::logger>("sbx_a", sinks.begin(), sinks.end());
    logger->set_pattern("%v"); // the record carries its own timestamp, level and pid
    logger->set_level(spd_level_(_level));
    logger->flush_on(spdlog::level::trace);
    std::scoped_lock lock(mtx);
    if (sink) sink->flush();
    sink = std::move(logger);
    level = _level;
    path = _path;
  }
  inline void fina_()
  {
    std::scoped_lock lock(mtx);
    if (sink) sink->flush();
    sink.reset();
  }
  inline bool enabled_(log_v _level) const
  {
    std::scoped_lock lock(mtx);
    return sink && static_cast<uint8_t>(_level) <= static_cast<uint8_t>(level);
  }
  inline std::string path_() const
  {
    std::scoped_lock lock(mtx);
    return path;
  }
  inline void event_(log_v _level, const std::string& _message, const nlohmann::json& _context = nlohmann::json::object())
  {
    std::shared_ptr<spdlog::logger> logger;
    {
      std::scoped_lock lock(mtx);
      if (!sink || static_cast<uint8_t>(_level) > static_cast<uint8_t>(level)) return;
      logger = sink;
    }
    logger->log(spd_level_(_level), "{}", record_(_level, _message, _context));
  }
  inline void error_(const std::string& _message, const nlohmann::json& _context = nlohmann::json::object()) { event_(log_v::error, _message, _context); }
  inline void warn_(const std::string& _message, const nlohmann::json& _context = nlohmann::json::object()) { event_(log_v::warn, _message, _context); }
  inline void info_(const std::string& _message, const nlohmann::json& _context = nlohmann::json::object()) { event_(log_v::info, _message, _context); }
  inline void debug_(const std::string& _message, const nlohmann::json& _context = nlohmann::json::object()) { event_(log_v::debug, _message, _context); }
  // log an error at ERROR with its context, then hand it back for throwing
  template <typename E>
  requires std::is_base_of_v<sbx_e, E>
  inline const E& fail_(const E& _error)
  {
    nlohmann::json context = _error.context;
    context["error"] = _error.kind;
    event_(log_v::error, _error.what(), context);
    return _error;
  }
  static inline std::string record_(log_v _level, const std::string& _message, const nlohmann::json& _context)
  {
    nlohmann::json j;
    j["timestamp"] = tim_t::now_().iso_();
    j["level"] = log_v_name_(_level);
    j["message"] = _message;
    j["context"] = _context.is_null() ? nlohmann::json::object() : _context;
    j["pid"] = static_cast<int64_t>(getpid());
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace); // output may hold invalid UTF-8
  }
private:
  log_t() = default;
  static inline spdlog::level::level_enum spd_level_(log_v _level) noexcept
  {
    switch (_level)
    {
      case log_v::error: return spdlog::level::err;
      case log_v::warn: return spdlog::level::warn;
      case log_v::info: return spdlog::level::info;
      default: return spdlog::level::debug;
    }
  }
  mutable std::mutex mtx;
  std::shared_ptr<spdlog::logger> sink; // null until init_(): events are dropped
  log_v level = log_v::info;
  std::string path;
};
