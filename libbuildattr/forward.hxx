// file      : libbuildattr/forward.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_FORWARD_HXX
#define LIBBUILDATTR_FORWARD_HXX

#include <libbuildattr/types.hxx>

namespace buildattr
{
  // <libbuildattr/literal.hxx>
  //
  class literal;
  struct literal_member;
  struct literal_structure;

  // <libbuildattr/value.hxx>
  //
  struct value_type;
  class value;
  template <typename> struct value_traits;
  struct conversion_error;

  // <libbuildattr/fileset-entry.hxx>
  //
  class fileset_entry;

  // <libbuildattr/selector.hxx>
  //
  class selector;
  class selector_list;
  class selectable_value;
}

#endif // LIBBUILDATTR_FORWARD_HXX
