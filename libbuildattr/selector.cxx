// file      : libbuildattr/selector.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/selector.hxx>

#include <libbuildattr/printer.hxx>
#include <libbuildattr/diagnostics.hxx>

using namespace std;

namespace buildattr
{
  // selector
  //
  const char* const selector::default_condition_key = "//conditions:default";

  selector::
  selector (const literal& x,
            const package_id& p,
            const value_type& t,
            const char* what)
      : original_ (&t), default_ (entries_type::size_type (-1))
  {
    tracer trace ("selector::selector");

    if (x.type != literal_type::select && x.type != literal_type::dict)
      throw_conversion_error (x, t.name, what);

    const literal::dict_type& ms (x.dict);

    if (ms.empty ())
      throw_conversion_error (
        t.name, what,
        string ("select with no conditions") +
        (what != nullptr ? string (" for ") + what : string ()));

    // Attribute the key errors as "select condition of <what>".
    //
    string kw ("select condition");
    if (what != nullptr)
    {
      kw += " of ";
      kw += what;
    }

    entries_.reserve (ms.size ());

    for (const literal_member& m: ms)
    {
      label k (value_traits<label>::convert (literal (m.name), p, kw.c_str ()));

      if (find (k) != nullptr)
        throw_conversion_error (
          t.name, what,
          "duplicate select condition '" + to_string (k) + '\'' +
          (what != nullptr ? string (" in ") + what : string ()));

      value v (convert (t, m.value, p, what));

      if (reserved_label (k))
        default_ = entries_.size ();

      l6 ([&]{trace << k << ": " << v;});

      entries_.emplace_back (move (k), move (v));
    }

    l5 ([&]{trace << entries_.size () << " conditions of type " << t.name
                  << (has_default () ? " with" : " without") << " default";});
  }

  selector::
  selector (value v)
      : original_ (v.type), default_ (0)
  {
    assert (v);
    entries_.emplace_back (parse_label (default_condition_key), move (v));
  }

  const value* selector::
  find (const label& l) const
  {
    for (const entry_type& e: entries_)
    {
      if (e.first == l)
        return &e.second;
    }

    return nullptr;
  }

  const value& selector::
  default_value () const
  {
    if (!has_default ())
      throw out_of_range ("select has no default condition");

    return entries_[default_].second;
  }

  bool selector::
  reserved_label (const label& l)
  {
    return to_string (l) == default_condition_key;
  }

  literal selector::
  reverse () const
  {
    literal::dict_type r;
    r.reserve (entries_.size ());

    for (const entry_type& e: entries_)
      r.push_back (
        literal_member {to_string (e.first), buildattr::reverse (e.second)});

    return literal (literal_type::select, move (r));
  }

  // selector_list
  //
  selector_list::
  selector_list (const literal& x,
                 const package_id& p,
                 const value_type& t,
                 const char* what)
      : original_ (&t)
  {
    tracer trace ("selector_list::selector_list");

    switch (x.type)
    {
    case literal_type::select:
      {
        selectors_.emplace_back (x, p, t, what);
        break;
      }
    case literal_type::select_list:
      {
        const literal::list_type& es (x.list);

        if (es.empty ())
          throw_conversion_error (x, t.name, what);

        // Only lists and dicts can be concatenated.
        //
        if (es.size () > 1 && !t.container)
          throw_conversion_error (
            t.name, what,
            string ("'+' concatenation of select() values of non-container "
                    "type '") + t.name + '\'' +
            (what != nullptr ? string (" for ") + what : string ()));

        selectors_.reserve (es.size ());

        for (const literal& e: es)
        {
          // Note that every element, select or plain, is converted against
          // the original type so mixing types is diagnosed here.
          //
          if (e.type == literal_type::select)
            selectors_.emplace_back (e, p, t, what);
          else
            selectors_.emplace_back (convert (t, e, p, what));
        }

        break;
      }
    default:
      throw_conversion_error (x, t.name, what);
    }

    l5 ([&]{trace << selectors_.size () << " selectors of type " << t.name;});
  }

  set<label> selector_list::
  key_labels () const
  {
    set<label> r;

    for (const selector& s: selectors_)
    {
      for (const selector::entry_type& e: s.entries ())
        r.insert (e.first);
    }

    return r;
  }

  literal selector_list::
  reverse () const
  {
    literal::list_type r;
    r.reserve (selectors_.size ());

    for (const selector& s: selectors_)
      r.push_back (s.reverse ());

    return literal (literal_type::select_list, move (r));
  }

  // selectable_convert()
  //
  selectable_value
  selectable_convert (const value_type& t,
                      const literal& x,
                      const package_id& p,
                      const char* what)
  {
    tracer trace ("selectable_convert");

    if (x.selectable ())
    {
      l5 ([&]{trace << "configurable " << t.name << " value "
                    << (what != nullptr ? what : "");});

      return selectable_value (selector_list (x, p, t, what));
    }

    return selectable_value (convert (t, x, p, what));
  }
}
