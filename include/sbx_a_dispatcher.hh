#pragma once

/**
 * sbx_a_dispatcher.hh — containerized command execution dispatcher
 *
 * sbx_a app(env) -> app.run_extension_(path, args) | app.run_language_(language, request)
 *
 *   registry (cfg_t) -> path guard (grd_t) -> image (img_t) -> limits (lim_t)
 *     -> invocation (inv_t) -> bounded execution (exe_t)
 *
 * Every step reports to log_t; every failure is logged at ERROR before it is thrown.
 * Nothing is retried.
 */

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"
#include "sbx_a_config.hh"
#include "sbx_a_path.hh"
#include "sbx_a_limit.hh"
#include "sbx_a_image.hh"
#include "sbx_a_invocation.hh"
#include "sbx_a_process_exec.hh"

#include <atomic>
#include <cctype>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

/* --------------------------------------------- */

class sbx_a // dispatcher
{
public:
  // open the log sink named by the environment; call before constructing the dispatcher
  static inline void log_(const env_c& _env) { log_t::get_().init_(_env.log_path, _env.log_to_console, _env.log_level); }
  // loads the registry: a bad configuration aborts construction
  explicit sbx_a(const env_c& _env) : sbx_a(cfg_t(_env.config_path).load_(), _env.runtime) {}
  sbx_a(std::shared_ptr<const sbx_g> _registry
    , const std::string& _runtime = sbx_runtime_default
    , const std::filesystem::path& _workdir = std::filesystem::current_path()
  ) : registry(std::move(_registry)), images(_runtime), guard(_workdir)
  {
    if (!registry) throw log_t::get_().fail_(sbx_e_config("No profile registry"));
  }
  sbx_a(const sbx_a&) = delete;
  sbx_a& operator=(const sbx_a&) = delete;
  inline const sbx_g& registry_() const noexcept { return *registry; }
  inline std::vector<std::string> languages_() const { return registry->languages_(); }
  inline std::vector<std::string> extensions_() const { return registry->extensions_(); }
  inline sbx_r run_language_(const std::string& _language, sbx_q _request)
  {
    require_runtime_();
    const sbx_p& profile = profile_(_language);
    _request.file = guard.resolve_(require_file_(_request.file)).string();
    return dispatch_(profile, std::move(_request));
  }
  inline sbx_r run_language_(const std::string& _language, const std::string& _file, const std::vector<std::string>& _args = {})
  {
    return run_language_(_language, sbx_q{_language, _file, _args});
  }
  inline sbx_r run_extension_(const std::string& _path, const std::vector<std::string>& _args = {})
  {
    std::string resolved;
    const sbx_p& profile = profile_for_(_path, resolved);
    require_runtime_();
    return dispatch_(profile, sbx_q{profile.name, resolved, _args});
  }
  // the invocation run_language_ would execute, without touching the runtime
  inline sbx_i plan_(const std::string& _language, sbx_q _request) const
  {
    const sbx_p& profile = profile_(_language);
    _request.file = guard.resolve_(require_file_(_request.file)).string();
    return build_(profile, _request);
  }
  inline sbx_i plan_extension_(const std::string& _path, const std::vector<std::string>& _args = {}) const
  {
    std::string resolved;
    const sbx_p& profile = profile_for_(_path, resolved);
    return build_(profile, sbx_q{profile.name, resolved, _args});
  }
  static inline std::string extension_(const std::string& _path) // lowercase, no dot
  {
    std::string ext = std::filesystem::path(_path).extension().string();
    if (!ext.empty() && ext.front() == '.') ext.erase(0, 1);
    for (auto& c : ext) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ext;
  }
private:
  std::shared_ptr<const sbx_g> registry;
  img_t images;
  grd_t guard;
  std::atomic<bool> runtime_ok{false}; // a positive check is not repeated
  inline void require_runtime_()
  {
    if (runtime_ok.load(std::memory_order_acquire)) return;
    if (!images.available_())
    {
      throw log_t::get_().fail_(sbx_e_runtime("Container runtime '" + images.runtime_() + "' is not available"
        , {{"runtime", images.runtime_()}}));
    }
    runtime_ok.store(true, std::memory_order_release);
  }
  inline const sbx_p& profile_(const std::string& _language) const
  {
    const sbx_p* profile = registry->find_(_language);
    if (!profile)
    {
      throw log_t::get_().fail_(sbx_e_language("Unknown language: " + _language
        , {{"language", _language}, {"known", registry->languages_()}}));
    }
    return *profile;
  }
  static inline const std::string& require_file_(const std::string& _file)
  {
    for (char c : _file)
    {
      if (!std::isspace(static_cast<unsigned char>(c))) return _file;
    }
    throw log_t::get_().fail_(sbx_e_path("No file given", {{"path", _file}}));
  }
  inline sbx_i build_(const sbx_p& _profile, sbx_q _request) const
  {
    _request.language = _profile.name;
    return inv_t::build_(images.runtime_(), _profile, _request, lim_t::derive_(_profile), guard.workdir_());
  }
  // _request.file is already resolved by the guard
  inline sbx_r dispatch_(const sbx_p& _profile, sbx_q _request)
  {
    _request.language = _profile.name;
    images.ensure_(_profile.image);
    sbx_l limits = lim_t::derive_(_profile);
    sbx_i invocation = inv_t::build_(images.runtime_(), _profile, _request, limits, guard.workdir_());
    log_t::get_().info_("Running " + _request.file + " as " + _profile.name
      , {{"language", _profile.name}, {"file", _request.file}, {"image", _profile.image}
      , {"cpu", limits.cpu}, {"memory", limits.memory}, {"timeout", limits.timeout}});
    exe_t exe;
    return exe.run_(invocation, limits.timeout);
  }
  inline const sbx_p& profile_for_(const std::string& _path, std::string& _resolved) const
  {
    _resolved = guard.resolve_(require_file_(_path)).string();
    std::string ext = extension_(_path); // as named by the caller, not the symlink target
    const sbx_p* profile = ext.empty() ? nullptr : registry->by_extension_(ext);
    if (!profile)
    {
      throw log_t::get_().fail_(sbx_e_extension(ext.empty() ? "File has no extension: " + _path : "Unknown extension: " + ext
        , {{"path", _path}, {"extension", ext}, {"known", registry->extensions_()}}));
    }
    log_t::get_().debug_("Extension dispatch", {{"extension", ext}, {"language", profile->name}});
    return *profile;
  }
};
