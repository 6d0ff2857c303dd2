// file      : libbuildattr/literal.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/literal.hxx>

namespace buildattr
{
  // literal_type
  //
  const char*
  to_string (literal_type t) noexcept
  {
    using type = literal_type;

    switch (t)
    {
    case type::null:        return "NoneType";
    case type::boolean:     return "bool";
    case type::integer:     return "int";
    case type::string:      return "string";
    case type::list:        return "list";
    case type::dict:        return "dict";
    case type::structure:   return "struct";
    case type::select:      return "select";
    case type::select_list: return "select";
    }
    return "";
  }

  string
  type_name (const literal& v)
  {
    return v.type == literal_type::structure
      ? v.structure.name
      : string (to_string (v.type));
  }

  // literal
  //
  const literal null_literal (literal_type::null);

  [[noreturn]] void
  literal_as_throw (literal_type t, literal_type e)
  {
    string m;
    m = "expected ";
    m += to_string (e);
    m += " instead of ";
    m += to_string (t);
    throw invalid_argument (move (m));
  }

  static int
  compare_members (const literal::dict_type& x, const literal::dict_type& y)
  {
    int r (0);

    auto i (x.begin ()), ie (x.end ());
    auto j (y.begin ()), je (y.end ());

    for (; i != ie && j != je; ++i, ++j)
    {
      if ((r = i->name.compare (j->name)) != 0 ||
          (r = i->value.compare (j->value)) != 0)
        break;
    }

    if (r == 0)
      r = i == ie ? (j == je ? 0 : -1) : 1; // More members than other?

    return r;
  }

  int literal::
  compare (const literal& v) const noexcept
  {
    if (type != v.type)
      return static_cast<uint8_t> (type) < static_cast<uint8_t> (v.type)
        ? -1
        : 1;

    int r (0);

    switch (type)
    {
    case literal_type::null:
      {
        break;
      }
    case literal_type::boolean:
      {
        r = boolean == v.boolean ? 0 : boolean ? 1 : -1;
        break;
      }
    case literal_type::integer:
      {
        r = integer < v.integer ? -1 : (integer > v.integer ? 1 : 0);
        break;
      }
    case literal_type::string:
      {
        r = string.compare (v.string);
        break;
      }
    case literal_type::list:
    case literal_type::select_list:
      {
        auto i (list.begin ()), ie (list.end ());
        auto j (v.list.begin ()), je (v.list.end ());

        for (; i != ie && j != je; ++i, ++j)
        {
          if ((r = i->compare (*j)) != 0)
            break;
        }

        if (r == 0)
          r = i == ie ? (j == je ? 0 : -1) : 1; // More elements than other?

        break;
      }
    case literal_type::dict:
    case literal_type::select:
      {
        r = compare_members (dict, v.dict);
        break;
      }
    case literal_type::structure:
      {
        r = structure.name.compare (v.structure.name);

        if (r == 0)
          r = compare_members (structure.fields, v.structure.fields);

        break;
      }
    }

    return r;
  }

  const literal* literal::
  find (const char* n) const
  {
    const dict_type* ms;

    switch (type)
    {
    case literal_type::dict:
    case literal_type::select:    ms = &dict;              break;
    case literal_type::structure: ms = &structure.fields;  break;
    default:
      {
        string_type m ("expected dict, select, or struct instead of ");
        m += to_string (type);
        throw invalid_argument (move (m));
      }
    }

    for (const literal_member& m: *ms)
    {
      if (m.name == n)
        return &m.value;
    }

    return nullptr;
  }
}
