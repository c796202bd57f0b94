#include "../include/sbx_a_log.hh"

#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::vector<std::string> read_lines(const fs::path& _log)
{
  std::vector<std::string> lines;
  std::ifstream in(_log);
  std::string line;
  while (std::getline(in, line)) if (!line.empty()) lines.push_back(line);
  return lines;
}

int main(int argc, char** argv)
{

fs::path dir = fs::temp_directory_path() / ("sbx_a_test_1_" + std::to_string(getpid()));
fs::create_directories(dir);

std::cout << "=== Test 1: Record Shape ===" << std::endl;
{
  fs::path path = dir / "nested" / "shape.log"; // parent directories are created
  log_t::get_().init_(path.string(), false, log_v::debug);
  assert(log_t::get_().path_() == path.string());
  log_t::get_().info_("Loaded 2 language profiles", {{"count", 2}});
  log_t::get_().debug_("Resolved path", {{"path", "main.go"}, {"resolved", "/work/main.go"}});
  log_t::get_().warn_("no context");
  auto lines = read_lines(path);
  assert(lines.size() == 3);
  auto first = nlohmann::json::parse(lines[0]);
  assert(first["level"] == "INFO");
  assert(first["message"] == "Loaded 2 language profiles");
  assert(first["context"]["count"] == 2);
  assert(first["pid"] == static_cast<int64_t>(getpid()));
  std::string ts = first["timestamp"];
  assert(ts.size() == 24 && ts[10] == 'T' && ts.back() == 'Z'); // 2026-10-19T10:55:03.042Z
  assert(nlohmann::json::parse(lines[1])["level"] == "DEBUG");
  auto third = nlohmann::json::parse(lines[2]);
  assert(third["level"] == "WARN");
  assert(third["context"].is_object() && third["context"].empty());
  std::cout << "✓ timestamp, level, message, context and pid on every line" << std::endl;
}

std::cout << "\n=== Test 2: Level Filter ===" << std::endl;
{
  fs::path path = dir / "filter.log";
  log_t::get_().init_(path.string(), false, log_v::warn);
  assert(!log_t::get_().enabled_(log_v::info));
  assert(log_t::get_().enabled_(log_v::error));
  log_t::get_().debug_("dropped");
  log_t::get_().info_("dropped");
  log_t::get_().warn_("kept");
  log_t::get_().error_("kept");
  auto lines = read_lines(path);
  assert(lines.size() == 2);
  assert(log_v_parse_("WARNING") == log_v::warn);
  assert(log_v_parse_("nonsense", log_v::error) == log_v::error);
  std::cout << "✓ Events below the configured level are dropped" << std::endl;
}

std::cout << "\n=== Test 3: Errors Are Logged With Their Context ===" << std::endl;
{
  fs::path path = dir / "errors.log";
  log_t::get_().init_(path.string(), false, log_v::info);
  try
  {
    throw log_t::get_().fail_(sbx_e_language("Unknown language: cobol", {{"known", nlohmann::json::array({"go", "python"})}}));
  }
  catch (const sbx_e_language& e)
  {
    assert(e.kind == "UnknownLanguageError");
  }
  auto lines = read_lines(path);
  assert(lines.size() == 1);
  auto r = nlohmann::json::parse(lines[0]);
  assert(r["level"] == "ERROR");
  assert(r["message"] == "Unknown language: cobol");
  assert(r["context"]["error"] == "UnknownLanguageError");
  assert(r["context"]["known"].size() == 2);
  std::cout << "✓ fail_() writes an ERROR record and keeps the exception type" << std::endl;
}

std::cout << "\n=== Test 4: Concurrent Appends ===" << std::endl;
{
  fs::path path = dir / "concurrent.log";
  log_t::get_().init_(path.string(), false, log_v::info);
  const int threads = 8;
  const int events = 250;
  {
    std::vector<std::jthread> workers;
    for (int t = 0; t < threads; t++)
    {
      workers.emplace_back([t]()
      {
        for (int i = 0; i < events; i++) log_t::get_().info_("event", {{"thread", t}, {"seq", i}});
      });
    }
  }
  auto lines = read_lines(path);
  assert(lines.size() == static_cast<size_t>(threads * events));
  std::set<std::pair<int, int>> seen;
  for (const auto& line : lines)
  {
    auto r = nlohmann::json::parse(line); // a torn line would not parse
    seen.emplace(r["context"]["thread"].get<int>(), r["context"]["seq"].get<int>());
  }
  assert(seen.size() == static_cast<size_t>(threads * events));
  std::cout << "✓ " << lines.size() << " records from " << threads << " threads, none torn" << std::endl;
}

std::cout << "\n=== Test 5: Appends Across Reopen, Silence After Close ===" << std::endl;
{
  fs::path path = dir / "reopen.log";
  log_t::get_().init_(path.string(), false);
  log_t::get_().info_("first");
  log_t::get_().init_(path.string(), false);
  log_t::get_().info_("second");
  assert(read_lines(path).size() == 2);
  log_t::get_().fina_();
  log_t::get_().error_("after close");
  assert(read_lines(path).size() == 2);
  std::cout << "✓ Reopening appends, closed sink drops events" << std::endl;
}

std::cout << "\n=== Test 6: Unwritable Sink ===" << std::endl;
{
  try
  {
    log_t::get_().init_("/proc/sbx_a/forbidden.log", false);
    assert(false);
  }
  catch (const sbx_e_config& e)
  {
    assert(e.context["log_path"] == "/proc/sbx_a/forbidden.log");
  }
  std::cout << "✓ Opening failure reported as ConfigError" << std::endl;
}

std::cout << "\n=== Test 7: Console Mirror ===" << std::endl;
{
  fs::path path = dir / "mirror.log";
  fs::path console = dir / "console.txt";
  fflush(stderr);
  int saved = dup(STDERR_FILENO);
  int fd = open(console.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  assert(saved >= 0 && fd >= 0);
  dup2(fd, STDERR_FILENO);
  close(fd);
  log_t::get_().init_(path.string(), true, log_v::info);
  log_t::get_().info_("mirrored", {{"sink", "console"}});
  log_t::get_().debug_("below the level");
  log_t::get_().fina_();
  fflush(stderr);
  dup2(saved, STDERR_FILENO);
  close(saved);
  auto file_lines = read_lines(path);
  auto console_lines = read_lines(console);
  assert(file_lines.size() == 1);
  assert(console_lines.size() == 1);
  assert(console_lines[0] == file_lines[0]); // same JSON record, no colour codes off a terminal
  auto r = nlohmann::json::parse(console_lines[0]);
  assert(r["message"] == "mirrored");
  assert(r["context"]["sink"] == "console");
  std::cout << "✓ Records mirrored to stderr as the same JSON line" << std::endl;

  fs::path quiet = dir / "quiet.txt";
  fflush(stderr);
  saved = dup(STDERR_FILENO);
  fd = open(quiet.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  assert(saved >= 0 && fd >= 0);
  dup2(fd, STDERR_FILENO);
  close(fd);
  log_t::get_().init_(path.string(), false, log_v::info);
  log_t::get_().info_("file only");
  log_t::get_().fina_();
  fflush(stderr);
  dup2(saved, STDERR_FILENO);
  close(saved);
  assert(read_lines(quiet).empty());
  assert(read_lines(path).size() == 2);
  std::cout << "✓ Console stays silent when mirroring is off" << std::endl;
}

fs::remove_all(dir);
std::cout << "\nAll log tests passed." << std::endl;
return 0;
}
