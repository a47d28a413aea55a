#pragma once

/* Logging, warnings and error reporting */

#include <vfa/support/os.hpp>

#include <exception>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

namespace vfa {

#ifndef NVFALOG
#define VFA_LOG(TAG, CODE)                                                     \
  do {                                                                         \
    if (::vfa::VfaLogFlag && ::vfa::VfaLog.count(TAG) > 0) {                   \
      CODE;                                                                    \
    }                                                                          \
  } while (0)
extern bool VfaLogFlag;
extern std::set<std::string> VfaLog;
void VfaEnableLog(std::string x);
#else
#define VFA_LOG(TAG, CODE)                                                     \
  do {                                                                         \
  } while (0)
void VfaEnableLog(std::string x);
#endif

extern unsigned VfaVerbosity;
void VfaEnableVerbosity(unsigned v);
#define VFA_VERBOSE_IF(LEVEL, CODE)                                            \
  do {                                                                         \
    if (::vfa::VfaVerbosity >= LEVEL) {                                        \
      CODE;                                                                    \
    }                                                                          \
  } while (0)

extern bool VfaWarningFlag;
void VfaEnableWarningMsg(bool b);

extern bool VfaSanityCheckFlag;
void VfaEnableSanityChecks(bool b);

template <typename OStream, typename... ArgTypes>
inline void ___print___(OStream &os, ArgTypes... args) {
  // trick to expand variadic argument pack without recursion
  using expand_variadic_pack = int[];
  // first zero is to prevent empty braced-init-list
  // void() is to prevent overloaded operator, messing things up
  // trick is to use the side effect of list-initializer to call a function
  // on every argument.
  // (void) is to suppress "statement has no effect" warnings
  (void)expand_variadic_pack{0, ((os << args), void(), 0)...};
}

// Base class of every error raised by the library.
class vfa_exception : public std::exception {
  std::string m_msg;

public:
  explicit vfa_exception(std::string msg) : m_msg(std::move(msg)) {}
  virtual ~vfa_exception() {}
  const char *what() const noexcept override { return m_msg.c_str(); }
};

// Lattice operation between abstract values of different kinds.
class type_mismatch_error : public vfa_exception {
public:
  explicit type_mismatch_error(std::string msg)
      : vfa_exception(std::move(msg)) {}
};

// Memory access through an integer that is not a virtual address.
class invalid_address_error : public vfa_exception {
public:
  explicit invalid_address_error(std::string msg)
      : vfa_exception(std::move(msg)) {}
};

#define VFA_THROW(EXCEPTION, ...)                                              \
  do {                                                                         \
    std::ostringstream __vfa_os__;                                             \
    __vfa_os__ << "VFA ERROR: ";                                               \
    ::vfa::___print___(__vfa_os__, __VA_ARGS__);                               \
    throw EXCEPTION(__vfa_os__.str());                                         \
  } while (0)

#define VFA_ERROR(...) VFA_THROW(::vfa::vfa_exception, __VA_ARGS__)

#define VFA_WARN(...)                                                          \
  do {                                                                         \
    if (::vfa::VfaWarningFlag) {                                               \
      std::cerr << "VFA WARNING: ";                                            \
      ::vfa::___print___(std::cerr, __VA_ARGS__);                              \
      std::cerr << "\n";                                                       \
    }                                                                          \
  } while (0)

} // end namespace vfa
