#pragma once

#include <iosfwd>
#include <string>

namespace vfa {

// Thin wrapper around std::ostream so that every printable object in
// the library writes through the same interface.
class vfa_os {
  std::ostream *m_os;

  static vfa_os *m_cout;
  static vfa_os *m_cerr;

public:
  static vfa_os *cout();
  static vfa_os *cerr();

  vfa_os(std::ostream &os);
  vfa_os(const vfa_os &o) = delete;
  vfa_os &operator=(const vfa_os &o) = delete;
  virtual ~vfa_os() {}

  vfa_os &operator<<(char C);
  vfa_os &operator<<(unsigned char C);
  vfa_os &operator<<(signed char C);
  vfa_os &operator<<(const char *C);
  vfa_os &operator<<(const std::string &Str);
  vfa_os &operator<<(unsigned long N);
  vfa_os &operator<<(long N);
  vfa_os &operator<<(unsigned long long N);
  vfa_os &operator<<(long long N);
  vfa_os &operator<<(const void *P);
  vfa_os &operator<<(unsigned int N);
  vfa_os &operator<<(int N);
  vfa_os &operator<<(double N);
};

extern vfa_os &outs();
extern vfa_os &errs();

} // namespace vfa
