#include <vfa/support/debug.hpp>

#ifndef NVFALOG
namespace vfa {
bool VfaLogFlag = false;
std::set<std::string> VfaLog;

void VfaEnableLog(std::string x) {
  if (x.empty())
    return;
  VfaLogFlag = true;
  VfaLog.insert(x);
}
} // namespace vfa
#else
namespace vfa {
void VfaEnableLog(std::string x) {}
} // namespace vfa
#endif

namespace vfa {
unsigned VfaVerbosity = 0;
void VfaEnableVerbosity(unsigned v) { VfaVerbosity = v; }

bool VfaWarningFlag = true;
void VfaEnableWarningMsg(bool v) { VfaWarningFlag = v; }

bool VfaSanityCheckFlag = false;
void VfaEnableSanityChecks(bool v) { VfaSanityCheckFlag = v; }
} // namespace vfa
