#pragma once

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"

#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

/* --------------------------------------------- */

struct env_c // environment overrides
{
  std::string config_path;     // CONFIG_PATH
  std::string log_path;        // LOG_PATH
  bool log_to_console = false; // LOG_TO_CONSOLE
  log_v log_level = log_v::info; // LOG_LEVEL
  std::string runtime = sbx_runtime_default; // CONTAINER_RUNTIME
  static inline bool truthy_(const char* _value)
  {
    if (!_value) return false;
    std::string s;
    for (const char* c = _value; *c; ++c) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*c))));
    return s == "1" || s == "true" || s == "yes" || s == "on";
  }
  static inline std::string state_dir_(const char* _xdg, const char* _home_suffix)
  {
    const char* xdg = getenv(_xdg);
    if (xdg && *xdg) return (std::filesystem::path(xdg) / "sbx_a").string();
    const char* home = getenv("HOME");
    if (home && *home) return (std::filesystem::path(home) / _home_suffix / "sbx_a").string();
    return ".";
  }
  static inline env_c from_env_()
  {
    env_c env;
    const char* v;
    if ((v = getenv("CONFIG_PATH")) != nullptr && *v) env.config_path = v;
    else env.config_path = (std::filesystem::path(state_dir_("XDG_CONFIG_HOME", ".config")) / "languages.json").string();
    if ((v = getenv("LOG_PATH")) != nullptr && *v) env.log_path = v;
    else env.log_path = (std::filesystem::path(state_dir_("XDG_STATE_HOME", ".local/state")) / "sbx_a.log").string();
    env.log_to_console = truthy_(getenv("LOG_TO_CONSOLE"));
    if ((v = getenv("LOG_LEVEL")) != nullptr && *v) env.log_level = log_v_parse_(v);
    if ((v = getenv("CONTAINER_RUNTIME")) != nullptr && *v) env.runtime = v;
    return env;
  }
};

/* --------------------------------------------- */

class sbx_g // profile registry: built once by cfg_t, read-only afterwards
{
public:
  using map_t = std::map<std::string, sbx_p>; // ordered by name: extension scan order is deterministic
  explicit sbx_g(map_t _profiles) : profiles(std::move(_profiles)) {}
  inline const sbx_p* find_(const std::string& _name) const
  {
    auto it = profiles.find(_name);
    return it == profiles.end() ? nullptr : &it->second;
  }
  inline const sbx_p* by_extension_(const std::string& _ext) const
  {
    for (const auto& [name, profile] : profiles)
    {
      if (profile.claims_(_ext)) return &profile;
    }
    return nullptr;
  }
  inline std::vector<std::string> languages_() const
  {
    std::vector<std::string> names;
    names.reserve(profiles.size());
    for (const auto& [name, profile] : profiles) names.push_back(name);
    return names;
  }
  inline std::vector<std::string> extensions_() const
  {
    std::vector<std::string> exts;
    for (const auto& [name, profile] : profiles)
    {
      exts.insert(exts.end(), profile.extensions.begin(), profile.extensions.end());
    }
    return exts;
  }
  inline size_t size_() const noexcept { return profiles.size(); }
  inline const map_t& profiles_() const noexcept { return profiles; }
private:
  const map_t profiles;
};

/* --------------------------------------------- */

class cfg_t // config store: JSON profile source -> validated, normalized registry
{
public:
  explicit cfg_t(std::string _path) : path(std::move(_path)) {}
  inline const std::string& path_() const noexcept { return path; }
  inline std::shared_ptr<const sbx_g> load_() const
  {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec))
    {
      throw log_t::get_().fail_(sbx_e_config("Configuration file not found: " + path, {{"config_path", path}}));
    }
    if (!std::filesystem::is_regular_file(path, ec))
    {
      throw log_t::get_().fail_(sbx_e_config("Configuration path is not a regular file: " + path, {{"config_path", path}}));
    }
    std::ifstream file(path);
    if (!file.is_open())
    {
      throw log_t::get_().fail_(sbx_e_config("Configuration file is unreadable: " + path
        , {{"config_path", path}, {"errno", std::strerror(errno)}}));
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad())
    {
      throw log_t::get_().fail_(sbx_e_config("Failed reading configuration file: " + path, {{"config_path", path}}));
    }
    return parse_(buffer.str(), path);
  }
  // validate an in-memory JSON document; _origin names it in logs and errors
  static inline std::shared_ptr<const sbx_g> parse_(const std::string& _text, const std::string& _origin = "<memory>")
  {
    try
    {
      auto registry = std::make_shared<const sbx_g>(build_(_text, _origin));
      nlohmann::json names = registry->languages_();
      log_t::get_().info_("Loaded " + std::to_string(registry->size_()) + " language profiles"
        , {{"config_path", _origin}, {"count", registry->size_()}, {"languages", names}});
      return registry;
    }
    catch (const sbx_e_config& e)
    {
      log_t::get_().fail_(e);
      throw;
    }
  }
  static inline std::string normalize_image_(const std::string& _image)
  {
    if (_image.find('@') != std::string::npos) return _image; // digest
    size_t slash = _image.rfind('/');
    std::string last = slash == std::string::npos ? _image : _image.substr(slash + 1);
    if (last.find(':') != std::string::npos) return _image; // registry:port/name has its ':' before the slash
    return _image + ":" + sbx_tag_default;
  }
private:
  std::string path;
  static inline bool blank_(const std::string& _s)
  {
    for (char c : _s) if (!std::isspace(static_cast<unsigned char>(c))) return false;
    return true;
  }
  static inline sbx_g::map_t build_(const std::string& _text, const std::string& _origin)
  {
    if (blank_(_text)) throw sbx_e_config("Configuration is empty: " + _origin, {{"config_path", _origin}});
    nlohmann::json root;
    try { root = nlohmann::json::parse(_text); }
    catch (const nlohmann::json::parse_error& e)
    {
      throw sbx_e_config("Configuration is not valid JSON: " + std::string(e.what())
        , {{"config_path", _origin}, {"byte", e.byte}});
    }
    if (!root.is_object())
    {
      throw sbx_e_config("Configuration must map language names to profiles", {{"config_path", _origin}});
    }
    if (root.empty()) throw sbx_e_config("Configuration defines no languages", {{"config_path", _origin}});
    sbx_g::map_t profiles;
    std::map<std::string, std::string> owners; // extension -> language
    for (const auto& item : root.items())
    {
      const std::string& name = item.key();
      sbx_p p = profile_(name, item.value(), _origin);
      for (const auto& ext : p.extensions)
      {
        auto [it, fresh] = owners.emplace(ext, name);
        if (!fresh)
        {
          throw sbx_e_config("Extension '" + ext + "' is claimed by both " + it->second + " and " + name
            , {{"config_path", _origin}, {"extension", ext}, {"languages", nlohmann::json::array({it->second, name})}});
        }
      }
      profiles.emplace(name, std::move(p));
    }
    return profiles;
  }
  static inline sbx_p profile_(const std::string& _name, const nlohmann::json& _node, const std::string& _origin)
  {
    auto fail = [&](const std::string& _why, nlohmann::json _extra = nlohmann::json::object())
    {
      _extra["config_path"] = _origin;
      _extra["language"] = _name;
      return sbx_e_config("Invalid profile '" + _name + "': " + _why, std::move(_extra));
    };
    static const std::set<std::string> known = {"command", "extensions", "image", "mount_path", "cpu", "memory", "timeout", "harden"};
    if (_name.empty() || blank_(_name)) throw fail("language name is blank");
    if (!_node.is_object()) throw fail("profile must be an object");
    for (const auto& item : _node.items())
    {
      if (!known.count(item.key())) throw fail("unknown field '" + item.key() + "'", {{"field", item.key()}});
    }
    sbx_p p;
    p.name = _name;
    // command
    if (!_node.contains("command")) throw fail("missing 'command'");
    const auto& command = _node["command"];
    if (command.is_string())
    {
      p.command = command.get<std::string>();
      if (blank_(p.command)) throw fail("'command' is blank");
    }
    else if (command.is_array() && !command.empty())
    {
      for (const auto& token : command)
      {
        if (!token.is_string() || token.get<std::string>().empty()) throw fail("'command' tokens must be non-empty strings");
        p.tokens.push_back(token.get<std::string>());
      }
    }
    else throw fail("'command' must be a string or a non-empty array of strings");
    bool placeholder = p.command.find("{file}") != std::string::npos;
    for (const auto& token : p.tokens) placeholder = placeholder || token.find("{file}") != std::string::npos;
    if (!placeholder)
    {
      log_t::get_().warn_("Profile command has no {file} placeholder", {{"language", _name}, {"config_path", _origin}});
    }
    // extensions
    if (!_node.contains("extensions")) throw fail("missing 'extensions'");
    const auto& extensions = _node["extensions"];
    if (!extensions.is_array() || extensions.empty()) throw fail("'extensions' must be a non-empty array");
    for (const auto& e : extensions)
    {
      if (!e.is_string()) throw fail("'extensions' entries must be strings");
      std::string ext;
      for (char c : e.get<std::string>())
      {
        if (!std::isalnum(static_cast<unsigned char>(c)))
        {
          throw fail("extension '" + e.get<std::string>() + "' is not alphanumeric", {{"extension", e.get<std::string>()}});
        }
        ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
      }
      if (ext.empty()) throw fail("empty extension");
      if (!p.claims_(ext)) p.extensions.push_back(ext);
    }
    // image
    std::string image = _name;
    if (_node.contains("image"))
    {
      if (!_node["image"].is_string() || blank_(_node["image"].get<std::string>())) throw fail("'image' must be a non-blank string");
      image = _node["image"].get<std::string>();
    }
    p.image = normalize_image_(image);
    // mount_path
    if (_node.contains("mount_path"))
    {
      if (!_node["mount_path"].is_string()) throw fail("'mount_path' must be a string");
      std::string mount = _node["mount_path"].get<std::string>();
      if (mount.empty() || mount.front() != '/') throw fail("'mount_path' must be absolute", {{"mount_path", mount}});
      while (mount.size() > 1 && mount.back() == '/') mount.pop_back();
      p.mount_path = mount;
    }
    // cpu
    if (_node.contains("cpu"))
    {
      if (!_node["cpu"].is_number()) throw fail("'cpu' must be a number");
      p.cpu = _node["cpu"].get<double>();
      if (!(p.cpu >= sbx_cpu_floor)) throw fail("'cpu' must be at least 0.01", {{"cpu", p.cpu}, {"min", sbx_cpu_floor}});
    }
    if (!sbx_cpu_recommended_(p.cpu))
    {
      log_t::get_().warn_("CPU share outside recommended range"
        , {{"language", _name}, {"cpu", p.cpu}, {"min", sbx_cpu_min}, {"max", sbx_cpu_max}});
    }
    // memory
    if (_node.contains("memory"))
    {
      if (!_node["memory"].is_string()) throw fail("'memory' must be a string");
      p.memory = _node["memory"].get<std::string>();
    }
    if (!sbx_memory_ok_(p.memory)) throw fail("'memory' must match ^\\d+[kmgKMG]?$", {{"memory", p.memory}});
    // timeout
    if (_node.contains("timeout"))
    {
      const auto& t = _node["timeout"];
      if (!t.is_number_integer() || t.get<int64_t>() <= 0) throw fail("'timeout' must be a positive integer of seconds");
      p.timeout = t.get<uint64_t>();
    }
    // harden
    if (_node.contains("harden"))
    {
      if (!_node["harden"].is_boolean()) throw fail("'harden' must be a boolean");
      p.harden = _node["harden"].get<bool>();
    }
    return p;
  }
};
