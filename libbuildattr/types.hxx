// file      : libbuildattr/types.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_TYPES_HXX
#define LIBBUILDATTR_TYPES_HXX

#include <map>
#include <set>
#include <vector>
#include <string>
#include <utility>          // pair, move()
#include <cstddef>          // size_t, nullptr_t
#include <cstdint>          // int{8,64}_t, uint{8,16}_t
#include <ostream>
#include <functional>       // hash
#include <initializer_list>

#include <mutex>

#include <exception>     // exception
#include <stdexcept>     // invalid_argument, out_of_range

#include <libbutl/optional.hxx>
#include <libbutl/vector-view.hxx>
#include <libbutl/small-vector.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // Commonly-used types.
  //
  using std::int8_t;
  using std::uint8_t;
  using std::uint16_t;
  using std::int64_t;

  using int64s = std::vector<int64_t>;

  using std::size_t;
  using std::nullptr_t;

  using std::pair;
  using std::string;

  using strings = std::vector<string>;

  using std::hash;

  using std::initializer_list;

  using std::map;
  using std::set;
  using std::vector;
  using butl::vector_view;  // <libbutl/vector-view.hxx>
  using butl::small_vector; // <libbutl/small-vector.hxx>

  using std::ostream;

  // Concurrency.
  //
  using std::mutex;
  using mlock = std::unique_lock<mutex>;

  // Exceptions.
  //
  // While <exception> is included, there is no using for std::exception --
  // use qualified.
  //
  using std::invalid_argument;
  using std::out_of_range;

  // <libbutl/optional.hxx>
  //
  using butl::optional;
  using butl::nullopt;
}

// <libbuildattr/label.hxx>
//
#include <libbuildattr/label.hxx>

#endif // LIBBUILDATTR_TYPES_HXX
