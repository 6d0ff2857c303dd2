// file      : libbuildattr/literal.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_LITERAL_HXX
#define LIBBUILDATTR_LITERAL_HXX

#include <new> // placement new

#include <libbuildattr/types.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // Raw (untyped) value as produced by the build language interpreter.
  //
  // Besides the usual scalars and containers this representation has two
  // kinds for the configurable values: a select is a single select({...})
  // construct while a select list is a `+`-concatenation of one or more
  // elements, each either a select or a plain value (for example,
  // ["//a"] + select({...})). The select members are the condition keys
  // (label strings) and the corresponding branch values.
  //
  // Note also that we don't assume that dict members are in a sorted order
  // (the order is the insertion order and is significant for printing) but
  // do assume there are no duplicates.
  //
  enum class literal_type: uint8_t
  {
    null, // Note: keep first for comparison.
    boolean,
    integer,
    string,
    list,
    dict,
    structure,
    select,
    select_list
  };

  // Return the type as it is called in the build language (NoneType, bool,
  // int, etc).
  //
  LIBBUILDATTR_SYMEXPORT const char*
  to_string (literal_type) noexcept;

  inline ostream&
  operator<< (ostream& os, literal_type t) {return os << to_string (t);}

  struct literal_member;

  // Structure value, such as FilesetEntry(srcdir = "//foo", ...). The fields
  // are in the declaration order.
  //
  struct literal_structure
  {
    string                 name;
    vector<literal_member> fields;
  };

  class LIBBUILDATTR_SYMEXPORT literal
  {
  public:
    using string_type    = buildattr::string;
    using list_type      = vector<literal>;
    using dict_type      = vector<literal_member>;
    using structure_type = literal_structure;

    literal_type type;

    // Unchecked value access.
    //
    // Note that list is also used for select_list and dict for select.
    //
    union
    {
      bool           boolean;
      int64_t        integer;
      string_type    string;
      list_type      list;
      dict_type      dict;
      structure_type structure;
    };

    // Checked value access.
    //
    // If the type matches, return the corresponding member of the union.
    // Otherwise throw std::invalid_argument.
    //
    bool as_bool () const;
    int64_t as_int64 () const;
    const string_type& as_string () const;
    const list_type& as_list () const;
    const dict_type& as_dict () const;
    const structure_type& as_structure () const;
    const dict_type& as_select () const;
    const list_type& as_select_list () const;

    // True if this is a select or a select list, that is, a value that can
    // only be converted with selectable_convert().
    //
    bool
    selectable () const
    {
      return type == literal_type::select ||
             type == literal_type::select_list;
    }

    // Construction.
    //
    // Construct an empty container (or zero/false scalar) of the specified
    // type.
    //
    explicit
    literal (literal_type = literal_type::null) noexcept;

    explicit
    literal (std::nullptr_t) noexcept;

    explicit
    literal (bool) noexcept;

    explicit
    literal (int64_t) noexcept;

    explicit
    literal (int v) noexcept: literal (static_cast<int64_t> (v)) {}

    explicit
    literal (string_type);

    explicit
    literal (const char* s): literal (string_type (s)) {}

    // The type must be list or select_list.
    //
    literal (literal_type, list_type);

    // The type must be dict or select.
    //
    literal (literal_type, dict_type);

    explicit
    literal (structure_type);

    // Note that values of different types are never equal. Null is equal to
    // null and is less than any other value. Lists (and select lists) are
    // compared lexicographically. Dict (and select) members as well as
    // structure fields are compared in the insertion order.
    //
    int
    compare (const literal&) const noexcept;

    // Dict, select, or structure member access. Return NULL if there is no
    // member with this name and throw std::invalid_argument if this value is
    // not a dict, select, or structure.
    //
    const literal*
    find (const char*) const;

    const literal*
    find (const string_type& n) const {return find (n.c_str ());}

    // Note that the moved-from value becomes null.
    //
    literal (literal&&) noexcept;
    literal (const literal&);

    literal& operator= (literal&&) noexcept;
    literal& operator= (const literal&);

    ~literal () noexcept;
  };

  LIBBUILDATTR_SYMEXPORT extern const literal null_literal;

  inline bool
  operator== (const literal& x, const literal& y) {return x.compare (y) == 0;}

  inline bool
  operator!= (const literal& x, const literal& y) {return !(x == y);}

  inline bool
  operator< (const literal& x, const literal& y) {return x.compare (y) < 0;}

  // A dict or select member or a structure field.
  //
  struct literal_member
  {
    string  name;
    literal value;
  };

  // Return the name of the value's type as used in diagnostics. This is the
  // same as to_string(literal_type) except for structures where it is the
  // structure name (for example, FilesetEntry).
  //
  LIBBUILDATTR_SYMEXPORT string
  type_name (const literal&);
}

#include <libbuildattr/literal.ixx>

#endif // LIBBUILDATTR_LITERAL_HXX
