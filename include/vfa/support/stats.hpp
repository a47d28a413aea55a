#pragma once

#include <vfa/support/os.hpp>

#include <string>

namespace vfa {

extern bool VfaStatsFlag;
void VfaEnableStats(bool v = true);

// Accumulated user time in microseconds.
class Stopwatch {
  long m_started;
  long m_elapsed;
  bool m_running;

public:
  Stopwatch();
  void resume();
  void stop();
  long getTimeElapsed() const;
  void Print(vfa_os &out) const;
};

inline vfa_os &operator<<(vfa_os &o, const Stopwatch &sw) {
  sw.Print(o);
  return o;
}

// Named counters and timers, printed sorted by name.
class VfaStats {
public:
  static void reset();
  static void count(const std::string &name);
  static void resume(const std::string &name);
  static void stop(const std::string &name);
  static void Print(vfa_os &o);
};

// Count name once and time the enclosing scope.
class ScopedVfaStats {
  std::string m_name;

public:
  explicit ScopedVfaStats(const char *name);
  ~ScopedVfaStats();
};
} // namespace vfa

/**
 *  VFA_SCOPED_STATS(name, active)
 *    increase both timer and counter for name if active=1
 **/
#include <vfa/config.h>
#ifdef VFA_STATS
#define VFA_SCOPED_STATS(name, active) VFA_SCOPED_STATS_(name, active)
#define VFA_SCOPED_STATS_(name, active) VFA_SCOPED_STATS_##active(name)
#define VFA_SCOPED_STATS_0(name)
#define VFA_SCOPED_STATS_1(name) vfa::ScopedVfaStats __st__(name);
#else
#define VFA_SCOPED_STATS(name, active)
#endif
