#include <vfa/config.h>
#include <vfa/support/stats.hpp>

#include <map>

#include <sys/resource.h>

namespace vfa {

bool VfaStatsFlag = false;
void VfaEnableStats(bool v) { VfaStatsFlag = v; }

namespace {
long user_time() {
  struct rusage ru;
  getrusage(RUSAGE_SELF, &ru);
  return ru.ru_utime.tv_sec * 1000000L + ru.ru_utime.tv_usec;
}

struct stats_registry {
  std::map<std::string, unsigned> counters;
  std::map<std::string, Stopwatch> timers;
};

stats_registry &registry() {
  static stats_registry r;
  return r;
}
} // namespace

Stopwatch::Stopwatch() : m_started(0), m_elapsed(0), m_running(false) {}

void Stopwatch::resume() {
  if (!m_running) {
    m_started = user_time();
    m_running = true;
  }
}

void Stopwatch::stop() {
  if (m_running) {
    m_elapsed += user_time() - m_started;
    m_running = false;
  }
}

long Stopwatch::getTimeElapsed() const {
  return m_running ? m_elapsed + user_time() - m_started : m_elapsed;
}

void Stopwatch::Print(vfa_os &out) const {
  long time = getTimeElapsed();
  long h = time / 3600000000L;
  long m = time / 60000000L - h * 60;
  double s = (double)time / 1000000L - m * 60 - h * 3600;
  if (h > 0)
    out << h << "h";
  if (m > 0)
    out << m << "m";
  out << s << "s";
}

void VfaStats::reset() {
  registry().counters.clear();
  registry().timers.clear();
}

void VfaStats::count(const std::string &name) {
  if (VfaStatsFlag) {
    ++registry().counters[name];
  }
}

void VfaStats::resume(const std::string &name) {
  if (VfaStatsFlag) {
    registry().timers[name].resume();
  }
}

void VfaStats::stop(const std::string &name) {
  if (VfaStatsFlag) {
    registry().timers[name].stop();
  }
}

void VfaStats::Print(vfa_os &o) {
  o << "\n\n************** STATS ***************** \n";
#ifndef VFA_STATS
  o << "vfa compiled without support for gathering stats. "
    << "Compile with -DVFA_ENABLE_STATS=ON\n";
#else
  if (!VfaStatsFlag) {
    o << "Need to call VfaEnableStats()\n";
  }
  for (auto const &kv : registry().counters) {
    o << kv.first << ": " << kv.second << "\n";
  }
  for (auto const &kv : registry().timers) {
    o << kv.first << ": " << kv.second << "\n";
  }
#endif
  o << "************** STATS END ***************** \n";
}

ScopedVfaStats::ScopedVfaStats(const char *name) : m_name(name) {
  VfaStats::resume(m_name);
  VfaStats::count(m_name);
}

ScopedVfaStats::~ScopedVfaStats() { VfaStats::stop(m_name); }

} // namespace vfa
