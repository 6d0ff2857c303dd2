// file      : libbuildattr/literal.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace buildattr
{
  [[noreturn]] LIBBUILDATTR_SYMEXPORT void
  literal_as_throw (literal_type actual, literal_type expected);

  inline bool literal::
  as_bool () const
  {
    if (type == literal_type::boolean)
      return boolean;

    literal_as_throw (type, literal_type::boolean);
  }

  inline int64_t literal::
  as_int64 () const
  {
    if (type == literal_type::integer)
      return integer;

    literal_as_throw (type, literal_type::integer);
  }

  inline const string& literal::
  as_string () const
  {
    if (type == literal_type::string)
      return string;

    literal_as_throw (type, literal_type::string);
  }

  inline const literal::list_type& literal::
  as_list () const
  {
    if (type == literal_type::list)
      return list;

    literal_as_throw (type, literal_type::list);
  }

  inline const literal::dict_type& literal::
  as_dict () const
  {
    if (type == literal_type::dict)
      return dict;

    literal_as_throw (type, literal_type::dict);
  }

  inline const literal::structure_type& literal::
  as_structure () const
  {
    if (type == literal_type::structure)
      return structure;

    literal_as_throw (type, literal_type::structure);
  }

  inline const literal::dict_type& literal::
  as_select () const
  {
    if (type == literal_type::select)
      return dict;

    literal_as_throw (type, literal_type::select);
  }

  inline const literal::list_type& literal::
  as_select_list () const
  {
    if (type == literal_type::select_list)
      return list;

    literal_as_throw (type, literal_type::select_list);
  }

  inline literal::
  ~literal () noexcept
  {
    switch (type)
    {
    case literal_type::null:
    case literal_type::boolean:
    case literal_type::integer:                                   break;
    case literal_type::string:      string.~string_type ();       break;
    case literal_type::list:
    case literal_type::select_list: list.~list_type ();           break;
    case literal_type::dict:
    case literal_type::select:      dict.~dict_type ();           break;
    case literal_type::structure:   structure.~structure_type (); break;
    }
  }

  inline literal::
  literal (literal_type t) noexcept
      : type (t)
  {
    switch (type)
    {
    case literal_type::null:                                               break;
    case literal_type::boolean:     boolean = false;                       break;
    case literal_type::integer:     integer = 0;                           break;
    case literal_type::string:      new (&string) string_type ();          break;
    case literal_type::list:
    case literal_type::select_list: new (&list) list_type ();              break;
    case literal_type::dict:
    case literal_type::select:      new (&dict) dict_type ();              break;
    case literal_type::structure:   new (&structure) structure_type ();    break;
    }
  }

  inline literal::
  literal (std::nullptr_t) noexcept
      : type (literal_type::null)
  {
  }

  inline literal::
  literal (bool v) noexcept
      : type (literal_type::boolean), boolean (v)
  {
  }

  inline literal::
  literal (int64_t v) noexcept
      : type (literal_type::integer), integer (v)
  {
  }

  inline literal::
  literal (string_type v)
      : type (literal_type::string), string (move (v))
  {
  }

  inline literal::
  literal (literal_type t, list_type v)
      : type (t), list (move (v))
  {
    assert (t == literal_type::list || t == literal_type::select_list);
  }

  inline literal::
  literal (literal_type t, dict_type v)
      : type (t), dict (move (v))
  {
    assert (t == literal_type::dict || t == literal_type::select);
  }

  inline literal::
  literal (structure_type v)
      : type (literal_type::structure), structure (move (v))
  {
  }

  inline literal::
  literal (literal&& v) noexcept
      : type (v.type)
  {
    switch (type)
    {
    case literal_type::null:
      break;
    case literal_type::boolean:
      boolean = v.boolean;
      break;
    case literal_type::integer:
      integer = v.integer;
      break;
    case literal_type::string:
      new (&string) string_type (move (v.string));
      v.string.~string_type ();
      break;
    case literal_type::list:
    case literal_type::select_list:
      new (&list) list_type (move (v.list));
      v.list.~list_type ();
      break;
    case literal_type::dict:
    case literal_type::select:
      new (&dict) dict_type (move (v.dict));
      v.dict.~dict_type ();
      break;
    case literal_type::structure:
      new (&structure) structure_type (move (v.structure));
      v.structure.~structure_type ();
      break;
    }

    v.type = literal_type::null;
  }

  inline literal::
  literal (const literal& v)
      : type (v.type)
  {
    switch (type)
    {
    case literal_type::null:
      break;
    case literal_type::boolean:
      boolean = v.boolean;
      break;
    case literal_type::integer:
      integer = v.integer;
      break;
    case literal_type::string:
      new (&string) string_type (v.string);
      break;
    case literal_type::list:
    case literal_type::select_list:
      new (&list) list_type (v.list);
      break;
    case literal_type::dict:
    case literal_type::select:
      new (&dict) dict_type (v.dict);
      break;
    case literal_type::structure:
      new (&structure) structure_type (v.structure);
      break;
    }
  }

  inline literal& literal::
  operator= (literal&& v) noexcept
  {
    if (this != &v)
    {
      this->~literal ();
      new (this) literal (move (v));
    }
    return *this;
  }

  inline literal& literal::
  operator= (const literal& v)
  {
    if (this != &v)
    {
      literal t (v); // Copy first in case it throws.
      this->~literal ();
      new (this) literal (move (t));
    }
    return *this;
  }
}
