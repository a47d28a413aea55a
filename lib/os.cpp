#include <vfa/support/os.hpp>

#include <iostream>

namespace vfa {

vfa_os &outs() { return *vfa_os::cout(); }
vfa_os &errs() { return *vfa_os::cerr(); }

vfa_os *vfa_os::m_cout = nullptr;
vfa_os *vfa_os::m_cerr = nullptr;

vfa_os::vfa_os(std::ostream &os) : m_os(&os) {}

vfa_os *vfa_os::cout() {
  if (!m_cout)
    m_cout = new vfa_os(std::cout);
  return m_cout;
}

vfa_os *vfa_os::cerr() {
  if (!m_cerr)
    m_cerr = new vfa_os(std::cerr);
  return m_cerr;
}

vfa_os &vfa_os::operator<<(char C) {
  *m_os << C;
  return *this;
}

vfa_os &vfa_os::operator<<(unsigned char C) {
  *m_os << C;
  return *this;
}

vfa_os &vfa_os::operator<<(signed char C) {
  *m_os << C;
  return *this;
}

vfa_os &vfa_os::operator<<(const char *C) {
  *m_os << C;
  return *this;
}

vfa_os &vfa_os::operator<<(const std::string &Str) {
  *m_os << Str;
  return *this;
}

vfa_os &vfa_os::operator<<(unsigned long N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(long N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(unsigned long long N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(long long N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(const void *P) {
  *m_os << P;
  return *this;
}

vfa_os &vfa_os::operator<<(unsigned int N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(int N) {
  *m_os << N;
  return *this;
}

vfa_os &vfa_os::operator<<(double N) {
  *m_os << N;
  return *this;
}

} // end namespace vfa
