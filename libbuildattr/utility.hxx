// file      : libbuildattr/utility.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_UTILITY_HXX
#define LIBBUILDATTR_UTILITY_HXX

#include <string>      // to_string()
#include <utility>     // move()
#include <cassert>     // assert()
#include <algorithm>   // find()
#include <type_traits>

#include <libbutl/utility.hxx>  // combine_hash(), alnum(), etc

#include <libbuildattr/types.hxx>
#include <libbuildattr/forward.hxx>

#include <libbuildattr/version.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  using std::move;
  using std::to_string;

  // <libbutl/utility.hxx>
  //
  using butl::combine_hash;
  using butl::alpha;
  using butl::alnum;

  // Diagnostics state (verbosity level, etc; see
  // <libbuildattr/diagnostics.hxx>).

  // Initialize the diagnostics state. Should be called once early in main()
  // and before any conversion. The default value is for unit tests.
  //
  LIBBUILDATTR_SYMEXPORT void
  init_diag (uint16_t verbosity);

  LIBBUILDATTR_SYMEXPORT extern uint16_t verb;

  // Append all the labels from the second range to the first unless already
  // there, preserving the encounter order.
  //
  template <typename L, typename I>
  void
  append_unique (L&, I begin, I end);
}

#include <libbuildattr/utility.txx>

#endif // LIBBUILDATTR_UTILITY_HXX
