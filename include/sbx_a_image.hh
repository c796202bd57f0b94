#pragma once

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"
#include "sbx_a_process_exec.hh"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

/* --------------------------------------------- */

class img_t // image provisioner: pull only when the exact reference is missing locally
{
public:
  uint64_t query_timeout_ms = 60000; // version / images
  uint64_t pull_timeout_ms = 0;      // 0 = a pull may take as long as it needs
  explicit img_t(std::string _runtime = sbx_runtime_default) : runtime(std::move(_runtime)) {}
  inline const std::string& runtime_() const noexcept { return runtime; }
  // runtime binary present and its daemon answering
  inline bool available_() const
  {
    exe_t exe;
    exe_r r = exe.execute_(exe_c(runtime, {"version"}, "", query_timeout_ms));
    bool ok = r.succeeded_();
    log_t::get_().debug_("Container runtime check", {{"runtime", runtime}, {"available", ok}, {"exit_code", r.exit_code}});
    return ok;
  }
  // references of every local image, as name:tag and name@digest, Docker Hub prefixes folded
  inline std::vector<std::string> local_() const
  {
    exe_t exe;
    exe_r r = exe.execute_(exe_c(runtime, {"images", "--format", "{{.Repository}}:{{.Tag}} {{.Repository}}@{{.Digest}}"}, "", query_timeout_ms));
    if (!r.succeeded_())
    {
      throw log_t::get_().fail_(sbx_e_runtime("Cannot list images with " + runtime
        , {{"runtime", runtime}, {"state", r.state_()}, {"exit_code", r.exit_code}, {"output", r.combined_()}}));
    }
    std::vector<std::string> refs;
    std::istringstream iss(r.stdout_text);
    std::string ref;
    while (iss >> ref)
    {
      if (ref.find("<none>") == std::string::npos) refs.push_back(short_ref_(ref));
    }
    return refs;
  }
  inline bool present_(const std::string& _image) const
  {
    auto refs = local_();
    return std::find(refs.begin(), refs.end(), short_ref_(_image)) != refs.end();
  }
  // Docker Hub names as docker prints them: podman lists python:3 as docker.io/library/python:3
  static inline std::string short_ref_(const std::string& _ref)
  {
    for (const char* hub : {"docker.io/library/", "index.docker.io/library/", "docker.io/", "index.docker.io/"})
    {
      std::string prefix(hub);
      if (_ref.size() > prefix.size() && _ref.compare(0, prefix.size(), prefix) == 0) return _ref.substr(prefix.size());
    }
    return _ref;
  }
  // a stale image under the same tag is never refreshed
  inline void ensure_(const std::string& _image) const
  {
    if (present_(_image))
    {
      log_t::get_().debug_("Image already present", {{"image", _image}});
      return;
    }
    log_t::get_().info_("Pulling image", {{"image", _image}, {"runtime", runtime}});
    exe_t exe;
    exe_r r = exe.execute_(exe_c(runtime, {"pull", _image}, "", pull_timeout_ms));
    if (!r.succeeded_())
    {
      throw log_t::get_().fail_(sbx_e_runtime("Failed to pull " + _image
        , {{"image", _image}, {"runtime", runtime}, {"state", r.state_()}, {"exit_code", r.exit_code}, {"output", r.combined_()}}));
    }
    log_t::get_().info_("Pulled image", {{"image", _image}, {"elapsed_ms", r.elapsed_ms_()}});
  }
private:
  std::string runtime;
};
