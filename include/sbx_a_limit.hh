#pragma once

#include "sbx_a_types.hh"
#include "sbx_a_log.hh"

/* --------------------------------------------- */

class lim_t // resource limiter
{
public:
  // zero cpu, empty memory and zero timeout count as unset
  static inline sbx_l derive_(const sbx_p& _profile)
  {
    sbx_l limits;
    limits.cpu = _profile.cpu > 0 ? _profile.cpu : sbx_cpu_default;
    limits.memory = _profile.memory.empty() ? std::string(sbx_memory_default) : _profile.memory;
    limits.timeout = _profile.timeout > 0 ? _profile.timeout : sbx_timeout_default;
    if (limits.cpu < sbx_cpu_floor) // only reachable when a profile was edited after load
    {
      throw log_t::get_().fail_(sbx_e_config("CPU share " + std::to_string(limits.cpu) + " for " + _profile.name + " is below 0.01"
        , {{"language", _profile.name}, {"cpu", limits.cpu}}));
    }
    if (!sbx_memory_ok_(limits.memory))
    {
      throw log_t::get_().fail_(sbx_e_config("Invalid memory limit '" + limits.memory + "' for " + _profile.name
        , {{"language", _profile.name}, {"memory", limits.memory}}));
    }
    if (!sbx_cpu_recommended_(limits.cpu))
    {
      log_t::get_().warn_("CPU share outside recommended range"
        , {{"language", _profile.name}, {"cpu", limits.cpu}, {"min", sbx_cpu_min}, {"max", sbx_cpu_max}});
    }
    return limits;
  }
};
