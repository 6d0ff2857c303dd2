// file      : libbuildattr/value.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/value.hxx>

#include <cstring> // memcmp(), memcpy()

#include <libbuildattr/printer.hxx>

using namespace std;

namespace buildattr
{
  // tristate
  //
  string
  to_string (tristate t)
  {
    switch (t)
    {
    case tristate::auto_: return "auto";
    case tristate::no:    return "no";
    case tristate::yes:   return "yes";
    }

    return string ();
  }

  // value
  //
  void value::
  reset ()
  {
    if (type->dtor != nullptr)
      type->dtor (*this);

    null = true;
  }

  value::
  value (value&& v) noexcept
      : type (v.type), null (v.null)
  {
    if (!null)
    {
      if (type->copy_ctor != nullptr)
        type->copy_ctor (*this, v, true);
      else
        memcpy (data_, v.data_, size_); // Copy as POD.
    }
  }

  value::
  value (const value& v)
      : type (v.type), null (v.null)
  {
    if (!null)
    {
      if (type->copy_ctor != nullptr)
        type->copy_ctor (*this, v, false);
      else
        memcpy (data_, v.data_, size_); // Copy as POD.
    }
  }

  value& value::
  operator= (value&& v)
  {
    if (this != &v)
    {
      // Prepare the receiving value.
      //
      if (type != v.type)
      {
        *this = nullptr;
        type = v.type;
      }

      // Now our types are the same. If the receiving value is NULL, then call
      // copy_ctor() instead of copy_assign().
      //
      if (v)
      {
        if (auto f = null ? type->copy_ctor : type->copy_assign)
          f (*this, v, true);
        else
          memcpy (data_, v.data_, size_); // Assign as POD.

        null = v.null;
      }
      else
        *this = nullptr;
    }

    return *this;
  }

  value& value::
  operator= (const value& v)
  {
    if (this != &v)
    {
      // Prepare the receiving value.
      //
      if (type != v.type)
      {
        *this = nullptr;
        type = v.type;
      }

      if (v)
      {
        if (auto f = null ? type->copy_ctor : type->copy_assign)
          f (*this, v, false);
        else
          memcpy (data_, v.data_, size_); // Assign as POD.

        null = v.null;
      }
      else
        *this = nullptr;
    }

    return *this;
  }

  bool
  operator== (const value& x, const value& y)
  {
    bool xn (x.null);
    bool yn (y.null);

    assert (x.type == y.type || xn || yn);

    if (xn || yn)
      return xn == yn;

    if (x.type->compare == nullptr)
      return memcmp (&x.data_, &y.data_, x.type->size) == 0;

    return x.type->compare (x, y) == 0;
  }

  bool
  operator< (const value& x, const value& y)
  {
    bool xn (x.null);
    bool yn (y.null);

    assert (x.type == y.type || xn || yn);

    // NULL value is always less than non-NULL.
    //
    if (xn || yn)
      return xn > yn; // !xn < !yn

    if (x.type->compare == nullptr)
      return memcmp (&x.data_, &y.data_, x.type->size) < 0;

    return x.type->compare (x, y) < 0;
  }

  value
  convert (const value_type& t,
           const literal& x,
           const package_id& p,
           const char* what)
  {
    if (x.selectable ())
      throw_conversion_error (x, t.name, what);

    value r (&t);
    t.assign (r, x, p, what);
    r.null = false;
    return r;
  }

  labels
  flatten (const value& v)
  {
    labels r;

    if (v && v.type->flatten != nullptr)
      v.type->flatten (v, r);

    return r;
  }

  literal
  reverse (const value& v)
  {
    return v ? v.type->reverse (v) : literal ();
  }

  [[noreturn]] void
  throw_conversion_error (const literal& x, const char* type, const char* what)
  {
    // Note that the message should be suitable for appending the rule and
    // attribute location by the caller.
    //
    string m ("expected value of type '");
    m += type;
    m += '\'';

    if (what != nullptr)
    {
      m += " for ";
      m += what;
    }

    m += ", but got ";
    m += repr (x);
    m += " (";
    m += type_name (x);
    m += ')';

    throw_conversion_error (type, what, m);
  }

  [[noreturn]] void
  throw_conversion_error (const char* type,
                          const char* what,
                          const string& description)
  {
    throw conversion_error (type,
                            what != nullptr ? what : string (),
                            description);
  }

  // bool value
  //
  bool value_traits<bool>::
  convert (const literal& x, const package_id&, const char* what)
  {
    switch (x.type)
    {
    case literal_type::boolean:
      return x.boolean;
    case literal_type::integer:
      {
        if (x.integer == 0 || x.integer == 1)
          return x.integer == 1;

        break;
      }
    default:
      break;
    }

    throw_conversion_error (x, type_name, what);
  }

  const char* const value_traits<bool>::type_name = "boolean";

  const value_type value_traits<bool>::value_type
  {
    type_name,
    sizeof (bool),
    false,                 // Not container.
    nullptr,               // No element.
    nullptr,               // No dtor (POD).
    nullptr,               // No copy_ctor (POD).
    nullptr,               // No copy_assign (POD).
    &simple_assign<bool>,
    &simple_reverse<bool>,
    nullptr,               // No labels.
    &simple_compare<bool>,
    nullptr                // Never empty.
  };

  // int64_t value
  //
  int64_t value_traits<int64_t>::
  convert (const literal& x, const package_id&, const char* what)
  {
    if (x.type == literal_type::integer)
      return x.integer;

    throw_conversion_error (x, type_name, what);
  }

  const char* const value_traits<int64_t>::type_name = "int";

  const value_type value_traits<int64_t>::value_type
  {
    type_name,
    sizeof (int64_t),
    false,                   // Not container.
    nullptr,                 // No element.
    nullptr,                 // No dtor (POD).
    nullptr,                 // No copy_ctor (POD).
    nullptr,                 // No copy_assign (POD).
    &simple_assign<int64_t>,
    &simple_reverse<int64_t>,
    nullptr,                 // No labels.
    &simple_compare<int64_t>,
    nullptr                  // Never empty.
  };

  // tristate value
  //
  tristate value_traits<tristate>::
  convert (const literal& x, const package_id&, const char* what)
  {
    switch (x.type)
    {
    case literal_type::boolean:
      return x.boolean ? tristate::yes : tristate::no;
    case literal_type::integer:
      {
        if (x.integer >= -1 && x.integer <= 1)
          return static_cast<tristate> (x.integer);

        break;
      }
    default:
      break;
    }

    throw_conversion_error (x, type_name, what);
  }

  const char* const value_traits<tristate>::type_name = "tristate";

  const value_type value_traits<tristate>::value_type
  {
    type_name,
    sizeof (tristate),
    false,                    // Not container.
    nullptr,                  // No element.
    nullptr,                  // No dtor (POD).
    nullptr,                  // No copy_ctor (POD).
    nullptr,                  // No copy_assign (POD).
    &simple_assign<tristate>,
    &simple_reverse<tristate>,
    nullptr,                  // No labels.
    &simple_compare<tristate>,
    nullptr                   // Never empty.
  };

  // string value
  //
  string value_traits<string>::
  convert (const literal& x, const package_id&, const char* what)
  {
    if (x.type == literal_type::string)
      return x.string;

    throw_conversion_error (x, type_name, what);
  }

  const char* const value_traits<string>::type_name = "string";

  const value_type value_traits<string>::value_type
  {
    type_name,
    sizeof (string),
    false,                  // Not container.
    nullptr,                // No element.
    &default_dtor<string>,
    &default_copy_ctor<string>,
    &default_copy_assign<string>,
    &simple_assign<string>,
    &simple_reverse<string>,
    nullptr,                // No labels.
    &simple_compare<string>,
    &default_empty<string>
  };

  // label value
  //
  label value_traits<label>::
  convert (const literal& x, const package_id& p, const char* what)
  {
    if (x.type != literal_type::string)
      throw_conversion_error (x, type_name, what);

    try
    {
      return parse_label (x.string, p);
    }
    catch (const label_syntax_error& e)
    {
      string m ("invalid label '" + x.string + '\'');

      if (what != nullptr)
      {
        m += " in ";
        m += what;
      }

      m += ": ";
      m += e.reason;

      throw_conversion_error (type_name, what, m);
    }
  }

  const char* const value_traits<label>::type_name = "label";

  const value_type value_traits<label>::value_type
  {
    type_name,
    sizeof (label),
    false,                  // Not container.
    nullptr,                // No element.
    &default_dtor<label>,
    &default_copy_ctor<label>,
    &default_copy_assign<label>,
    &simple_assign<label>,
    &simple_reverse<label>,
    &simple_flatten<label>,
    &simple_compare<label>,
    &default_empty<label>
  };

  // Explicit instantiations.
  //
  template struct LIBBUILDATTR_DEFEXPORT value_traits<vector<label>>;
  template struct LIBBUILDATTR_DEFEXPORT value_traits<strings>;
  template struct LIBBUILDATTR_DEFEXPORT value_traits<int64s>;
  template struct LIBBUILDATTR_DEFEXPORT value_traits<vector<fileset_entry>>;

  template struct LIBBUILDATTR_DEFEXPORT
  value_traits<map<string, string>>;

  template struct LIBBUILDATTR_DEFEXPORT
  value_traits<map<string, label>>;
}
