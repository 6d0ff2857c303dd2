// file      : libbuildattr/utility.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/utility.hxx>

namespace buildattr
{
  // Diagnostics state (verbosity level, etc). Keep default/disabled until
  // set by the caller.
  //
  uint16_t verb = 1;

  void
  init_diag (uint16_t v)
  {
    verb = v;
  }
}
