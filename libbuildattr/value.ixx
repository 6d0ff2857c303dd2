// file      : libbuildattr/value.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace buildattr
{
  // value_type
  //
  template <typename T>
  inline bool value_type::
  is_a () const
  {
    // Note that here we use the value type address as type identity.
    //
    return this == &value_traits<T>::value_type;
  }

  // value
  //
  inline bool value::
  empty () const
  {
    assert (!null);
    return type->empty == nullptr ? false : type->empty (*this);
  }

  template <typename T>
  inline value::
  value (T v)
      : type (&value_traits<T>::value_type), null (true)
  {
    value_traits<T>::assign (*this, move (v));
    null = false;
  }

  inline bool
  operator!= (const value& x, const value& y)
  {
    return !(x == y);
  }

  template <typename T>
  inline const T&
  cast (const value& v)
  {
    assert (v && v.type->is_a<T> ());
    return v.as<T> ();
  }

  template <typename T>
  inline T&
  cast (value& v)
  {
    // Forward to const T&.
    //
    return const_cast<T&> (cast<T> (static_cast <const value&> (v)));
  }

  template <typename T>
  inline T&&
  cast (value&& v)
  {
    return move (cast<T> (v)); // Forward to T&.
  }

  template <typename T>
  inline const T*
  cast_null (const value& v)
  {
    return v ? &cast<T> (v) : nullptr;
  }

  template <typename T>
  inline T
  convert (const literal& x, const package_id& p, const char* what)
  {
    if (x.selectable ())
      throw_conversion_error (x, value_traits<T>::value_type.name, what);

    return value_traits<T>::convert (x, p, what);
  }

  // bool value
  //
  inline void value_traits<bool>::
  assign (value& v, bool x)
  {
    if (v)
      v.as<bool> () = x;
    else
      new (&v.data_) bool (x);
  }

  inline int value_traits<bool>::
  compare (bool l, bool r)
  {
    return l < r ? -1 : (l > r ? 1 : 0);
  }

  // int64_t value
  //
  inline void value_traits<int64_t>::
  assign (value& v, int64_t x)
  {
    if (v)
      v.as<int64_t> () = x;
    else
      new (&v.data_) int64_t (x);
  }

  inline int value_traits<int64_t>::
  compare (int64_t l, int64_t r)
  {
    return l < r ? -1 : (l > r ? 1 : 0);
  }

  // tristate value
  //
  inline void value_traits<tristate>::
  assign (value& v, tristate x)
  {
    if (v)
      v.as<tristate> () = x;
    else
      new (&v.data_) tristate (x);
  }

  inline int value_traits<tristate>::
  compare (tristate l, tristate r)
  {
    return l < r ? -1 : (l > r ? 1 : 0);
  }

  // string value
  //
  inline void value_traits<string>::
  assign (value& v, string&& x)
  {
    if (v)
      v.as<string> () = move (x);
    else
      new (&v.data_) string (move (x));
  }

  inline int value_traits<string>::
  compare (const string& l, const string& r)
  {
    return l.compare (r);
  }

  // label value
  //
  inline void value_traits<label>::
  assign (value& v, label&& x)
  {
    if (v)
      v.as<label> () = move (x);
    else
      new (&v.data_) label (move (x));
  }

  inline int value_traits<label>::
  compare (const label& l, const label& r)
  {
    return l.compare (r);
  }

  // fileset_entry value
  //
  inline void value_traits<fileset_entry>::
  assign (value& v, fileset_entry&& x)
  {
    if (v)
      v.as<fileset_entry> () = move (x);
    else
      new (&v.data_) fileset_entry (move (x));
  }

  // vector<T> value
  //
  template <typename T>
  inline void value_traits<vector<T>>::
  assign (value& v, vector<T>&& x)
  {
    if (v)
      v.as<vector<T>> () = move (x);
    else
      new (&v.data_) vector<T> (move (x));
  }

  // map<K, V> value
  //
  template <typename K, typename V>
  inline void value_traits<map<K, V>>::
  assign (value& v, map<K, V>&& x)
  {
    if (v)
      v.as<map<K, V>> () = move (x);
    else
      new (&v.data_) map<K, V> (move (x));
  }
}
