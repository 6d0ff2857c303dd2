// file      : libbuildattr/value.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace buildattr
{
  template <typename T>
  void
  default_dtor (value& v)
  {
    v.as<T> ().~T ();
  }

  template <typename T>
  void
  default_copy_ctor (value& l, const value& r, bool m)
  {
    if (m)
      new (&l.data_) T (move (const_cast<value&> (r).as<T> ()));
    else
      new (&l.data_) T (r.as<T> ());
  }

  template <typename T>
  void
  default_copy_assign (value& l, const value& r, bool m)
  {
    if (m)
      l.as<T> () = move (const_cast<value&> (r).as<T> ());
    else
      l.as<T> () = r.as<T> ();
  }

  template <typename T>
  bool
  default_empty (const value& v)
  {
    return value_traits<T>::empty (v.as<T> ());
  }

  template <typename T>
  void
  simple_assign (value& v,
                 const literal& x,
                 const package_id& p,
                 const char* what)
  {
    value_traits<T>::assign (v, value_traits<T>::convert (x, p, what));
  }

  template <typename T>
  literal
  simple_reverse (const value& v)
  {
    return value_traits<T>::reverse (v.as<T> ());
  }

  template <typename T>
  void
  simple_flatten (const value& v, labels& r)
  {
    value_traits<T>::flatten (v.as<T> (), r);
  }

  template <typename T>
  int
  simple_compare (const value& l, const value& r)
  {
    return value_traits<T>::compare (l.as<T> (), r.as<T> ());
  }

  // vector<T> value
  //
  template <typename T>
  vector<T> value_traits<vector<T>>::
  convert (const literal& x, const package_id& p, const char* what)
  {
    if (x.type != literal_type::list)
      throw_conversion_error (x, value_type.name, what);

    vector<T> r;
    r.reserve (x.list.size ());

    // Attribute the element errors as "element N of <what>".
    //
    string w;
    for (const literal& e: x.list)
    {
      w = "element ";
      w += to_string (r.size ());

      if (what != nullptr)
      {
        w += " of ";
        w += what;
      }

      r.push_back (value_traits<T>::convert (e, p, w.c_str ()));
    }

    return r;
  }

  template <typename T>
  literal value_traits<vector<T>>::
  reverse (const vector<T>& x)
  {
    literal::list_type r;
    r.reserve (x.size ());

    for (const T& e: x)
      r.push_back (value_traits<T>::reverse (e));

    return literal (literal_type::list, move (r));
  }

  template <typename T>
  int value_traits<vector<T>>::
  compare (const vector<T>& x, const vector<T>& y)
  {
    auto xi (x.begin ()), xe (x.end ());
    auto yi (y.begin ()), ye (y.end ());

    for (; xi != xe && yi != ye; ++xi, ++yi)
    {
      if (int r = value_traits<T>::compare (*xi, *yi))
        return r;
    }

    return xi == xe ? (yi == ye ? 0 : -1) : 1;
  }

  template <typename T>
  void value_traits<vector<T>>::
  flatten (const vector<T>& x, labels& r)
  {
    for (const T& e: x)
      value_flatten<T>::flatten (e, r);
  }

  // Make sure these are static-initialized together. Failed that VC will
  // make sure it's done in the wrong order.
  //
  template <typename T>
  struct vector_value_type: value_type
  {
    string type_name;

    vector_value_type (value_type&& v)
        : value_type (move (v))
    {
      type_name  = "list(";
      type_name += value_traits<T>::type_name;
      type_name += ')';
      name = type_name.c_str ();
    }
  };

  template <typename T>
  const vector_value_type<T>
  value_traits<vector<T>>::value_type = buildattr::value_type // VC14 wants =.
  {
    nullptr,                          // Patched above.
    sizeof (vector<T>),
    true,                             // Container.
    &value_traits<T>::value_type,     // Element type.
    &default_dtor<vector<T>>,
    &default_copy_ctor<vector<T>>,
    &default_copy_assign<vector<T>>,
    &simple_assign<vector<T>>,
    &simple_reverse<vector<T>>,
    (value_flatten<T>::value           // No labels in the elements.
     ? &simple_flatten<vector<T>>
     : nullptr),
    &simple_compare<vector<T>>,
    &default_empty<vector<T>>
  };

  // map<K, V> value
  //
  template <typename K, typename V>
  map<K, V> value_traits<map<K, V>>::
  convert (const literal& x, const package_id& p, const char* what)
  {
    if (x.type != literal_type::dict)
      throw_conversion_error (x, value_type.name, what);

    map<K, V> r;

    for (const literal_member& m: x.dict)
    {
      K k (value_traits<K>::convert (literal (m.name), p, "dict key element"));
      V v (value_traits<V>::convert (m.value, p, "dict value element"));

      // Two keys may only become the same after conversion.
      //
      if (!r.emplace (move (k), move (v)).second)
        throw_conversion_error (
          value_type.name, what, "duplicate dict key '" + m.name + '\'');
    }

    return r;
  }

  template <typename K, typename V>
  literal value_traits<map<K, V>>::
  reverse (const map<K, V>& x)
  {
    literal::dict_type r;
    r.reserve (x.size ());

    for (const auto& p: x)
    {
      r.push_back (
        literal_member {value_traits<K>::reverse (p.first).as_string (),
                        value_traits<V>::reverse (p.second)});
    }

    return literal (literal_type::dict, move (r));
  }

  template <typename K, typename V>
  int value_traits<map<K, V>>::
  compare (const map<K, V>& x, const map<K, V>& y)
  {
    auto xi (x.begin ()), xe (x.end ());
    auto yi (y.begin ()), ye (y.end ());

    for (; xi != xe && yi != ye; ++xi, ++yi)
    {
      int r;
      if ((r = value_traits<K>::compare (xi->first, yi->first)) != 0 ||
          (r = value_traits<V>::compare (xi->second, yi->second)) != 0)
        return r;
    }

    return xi == xe ? (yi == ye ? 0 : -1) : 1;
  }

  template <typename K, typename V>
  void value_traits<map<K, V>>::
  flatten (const map<K, V>& x, labels& r)
  {
    for (const auto& p: x)
    {
      value_flatten<K>::flatten (p.first, r);
      value_flatten<V>::flatten (p.second, r);
    }
  }

  template <typename K, typename V>
  struct map_value_type: value_type
  {
    string type_name;

    map_value_type (value_type&& v)
        : value_type (move (v))
    {
      type_name  = "dict(";
      type_name += value_traits<K>::type_name;
      type_name += ", ";
      type_name += value_traits<V>::type_name;
      type_name += ')';
      name = type_name.c_str ();
    }
  };

  template <typename K, typename V>
  const map_value_type<K, V>
  value_traits<map<K, V>>::value_type = buildattr::value_type // VC14 wants =
  {
    nullptr,             // Patched above.
    sizeof (map<K, V>),
    true,                // Container.
    nullptr,             // No element (not named).
    &default_dtor<map<K, V>>,
    &default_copy_ctor<map<K, V>>,
    &default_copy_assign<map<K, V>>,
    &simple_assign<map<K, V>>,
    &simple_reverse<map<K, V>>,
    (value_flatten<K>::value || value_flatten<V>::value
     ? &simple_flatten<map<K, V>>
     : nullptr),
    &simple_compare<map<K, V>>,
    &default_empty<map<K, V>>
  };
}
