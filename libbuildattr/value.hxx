// file      : libbuildattr/value.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_VALUE_HXX
#define LIBBUILDATTR_VALUE_HXX

#include <new>           // placement new
#include <cstddef>       // max_align_t
#include <type_traits>   // is_same

#include <libbuildattr/types.hxx>
#include <libbuildattr/forward.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/literal.hxx>
#include <libbuildattr/fileset-entry.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // Attribute type.
  //
  // Each concrete attribute type (label, list(label), string, etc) is
  // described by an instance of this struct which is normally provided by
  // the value_traits<T> specialization (see below). The type identity is the
  // address of this instance.
  //
  struct value_type
  {
    const char* name;  // Canonical type name for diagnostics.
    const size_t size; // Type size in value::data_.

    template <typename T> bool is_a () const;

    // True if the type is a container (list or dict). Only the containers
    // can be concatenated with `+` in a selector list.
    //
    bool container;

    // Element type, if this is a list.
    //
    const value_type* element_type;

    // Destroy the value. If it is NULL, then the type is assumed to be POD
    // with a trivial destructor.
    //
    void (*const dtor) (value&);

    // Copy/move constructor and copy/move assignment for data_. If NULL, then
    // assume the stored data is POD. If move is true then the second argument
    // can be const_cast and moved from. copy_assign() is only called with
    // non-NULL first argument.
    //
    void (*const copy_ctor) (value&, const value&, bool move);
    void (*const copy_assign) (value&, const value&, bool move);

    // Convert the literal to this type and construct the result in the
    // (NULL) value. Labels are resolved relative to the current package. The
    // what argument is optional and is only used for diagnostics. Throw
    // conversion_error if the literal is not a valid representation.
    //
    void (*const assign) (value&,
                          const literal&,
                          const package_id& current,
                          const char* what);

    // Reverse the value back to a literal. The value cannot be NULL.
    //
    literal (*const reverse) (const value&);

    // Append the labels contained in the value. If NULL, then the type
    // contains no labels.
    //
    void (*const flatten) (const value&, labels&);

    // If NULL, then the types are compared as PODs using memcmp().
    //
    int (*const compare) (const value&, const value&);

    // If NULL, then the value is never empty.
    //
    bool (*const empty) (const value&);
  };

  // Conversion failure: the literal's shape does not match the type, a
  // contained label is malformed, or the select construct is inconsistent.
  // The type member contains the canonical name of the expected type and
  // context -- the what argument of the conversion (empty if unspecified).
  //
  struct LIBBUILDATTR_SYMEXPORT conversion_error: invalid_argument
  {
    string type;
    string context;

    conversion_error (string t, string c, const string& description)
        : invalid_argument (description),
          type (move (t)), context (move (c)) {}
  };

  // Tri-state attribute value. Note that the values are the same as their
  // integer representations.
  //
  enum class tristate: int8_t
  {
    auto_ = -1,
    no    =  0,
    yes   =  1
  };

  LIBBUILDATTR_SYMEXPORT string
  to_string (tristate);

  inline ostream&
  operator<< (ostream& os, tristate t) {return os << to_string (t);}

  // A typed attribute value.
  //
  // A value is constructed by the converter and is not modified afterwards.
  // A default-initialized value is NULL (unset) and untyped.
  //
  class LIBBUILDATTR_SYMEXPORT value
  {
  public:
    const value_type* type;

    // True if there is no value.
    //
    bool null;

    explicit operator bool () const {return !null;}
    bool operator== (nullptr_t) const {return null;}
    bool operator!= (nullptr_t) const {return !null;}

    // Check in a type-independent way if the value is empty. The value must
    // not be NULL.
    //
    bool
    empty () const;

    // Creation. A default-initialzied value is NULL and can be reset back to
    // NULL by assigning nullptr. Values can be copied and copy-assigned.
    //
  public:
    ~value () {*this = nullptr;}

    explicit
    value (nullptr_t = nullptr): type (nullptr), null (true) {}

    explicit
    value (const value_type* t): type (t), null (true) {}

    template <typename T>
    explicit
    value (T); // Create value of value_traits<T>::value_type type.

    // Note: preserves type.
    //
    value&
    operator= (nullptr_t) {if (!null) reset (); return *this;}

    value (value&&) noexcept;
    value (const value&);
    value& operator= (value&&);
    value& operator= (const value&);

    // Implementation details, don't use directly except in representation
    // type implementations.
    //
  public:
    // Fast, unchecked cast of data_ to T.
    //
    template <typename T> T& as () & {return reinterpret_cast<T&> (data_);}
    template <typename T> T&& as () && {return move (as<T> ());}
    template <typename T> const T& as () const& {
      return reinterpret_cast<const T&> (data_);}

  public:
    // The maximum size we can store directly is sufficient for all the
    // attribute types, the largest of which is the fileset entry (each type
    // static asserts this in its value_traits specialization below).
    //
    static constexpr size_t size_ = sizeof (fileset_entry);
    alignas (std::max_align_t) unsigned char data_[size_];

  private:
    void
    reset ();
  };

  // The values should be of the same type. NULL values compare equal and a
  // NULL value is always less than a non-NULL.
  //
  LIBBUILDATTR_SYMEXPORT bool operator== (const value&, const value&);
                         bool operator!= (const value&, const value&);
  LIBBUILDATTR_SYMEXPORT bool operator<  (const value&, const value&);

  // Value cast. The value should not be NULL and should be of type T.
  //
  template <typename T> T& cast (value&);
  template <typename T> T&& cast (value&&);
  template <typename T> const T& cast (const value&);

  // As above but returns NULL if the value is NULL.
  //
  template <typename T> const T* cast_null (const value&);

  // Convert a literal to a value of the specified type resolving the labels
  // relative to the current package. The what argument (for example,
  // "attribute 'srcs' in 'cc_library' rule") is optional and is only used
  // in diagnostics.
  //
  // Throw conversion_error if the literal is not a valid representation of
  // the type. Note that select constructs (select and select list literals)
  // are always rejected: configurable values can only be converted with
  // selectable_convert() (see <libbuildattr/selector.hxx>).
  //
  LIBBUILDATTR_SYMEXPORT value
  convert (const value_type&,
           const literal&,
           const package_id& current,
           const char* what = nullptr);

  template <typename T>
  T
  convert (const literal&,
           const package_id& current,
           const char* what = nullptr);

  // Return all the labels contained in the value in the encounter order. A
  // NULL value or a value of a type that contains no labels yields an empty
  // list.
  //
  LIBBUILDATTR_SYMEXPORT labels
  flatten (const value&);

  // Reverse the value back to a literal. A NULL value reverses to null.
  //
  LIBBUILDATTR_SYMEXPORT literal
  reverse (const value&);

  // Throw conversion_error for a literal that is not a valid representation
  // of the type. The message has the following form:
  //
  // expected value of type '<type>'[ for <what>], but got <literal> (<kind>)
  //
  [[noreturn]] LIBBUILDATTR_SYMEXPORT void
  throw_conversion_error (const literal&, const char* type, const char* what);

  // As above but for an error with custom description.
  //
  [[noreturn]] LIBBUILDATTR_SYMEXPORT void
  throw_conversion_error (const char* type,
                          const char* what,
                          const string& description);

  // Representation types.
  //
  template <typename T>
  struct value_traits;
  // {
  //   static_assert (sizeof (T) <= value::size_, "insufficient space");
  //
  //   // Convert literal to T resolving labels relative to the current
  //   // package. Throw conversion_error (with a message) if the literal is
  //   // not a valid representation of T.
  //   //
  //   static T convert (const literal&, const package_id&, const char* what);
  //
  //   // Assign T to value which is already of type T but is NULL.
  //   //
  //   static void assign (value&, T&&);
  //
  //   // Reverse a value back to literal.
  //   //
  //   static literal reverse (const T&);
  //
  //   // Compare two values.
  //   //
  //   static int compare (const T&, const T&);
  //
  //   // Return true if the value is empty.
  //   //
  //   static bool empty (const T&);
  //
  //   // Append the contained labels. Only provided by the types that contain
  //   // labels.
  //   //
  //   static void flatten (const T&, labels&);
  //
  //   // For simple types (those that can be used as elements of containers),
  //   // type_name must be constant-initialized in order to sidestep the
  //   // static init order issue (in fact, that's the only reason we have it
  //   // both here and in value_type.name -- value_type cannot be constexpr
  //   // because of pointers to function template instantiations).
  //   //
  //   static const char* const type_name;
  //   static const buildattr::value_type value_type;
  // };

  template <typename T>
  struct value_traits<const T>: value_traits<T> {};

  // Default implementations of the dtor/copy_ctor/copy_assing callbacks for
  // types that are stored directly in value::data_ and the provide all the
  // necessary functions (copy/move ctor and assignment operator).
  //
  template <typename T>
  static void
  default_dtor (value&);

  template <typename T>
  static void
  default_copy_ctor (value&, const value&, bool);

  template <typename T>
  static void
  default_copy_assign (value&, const value&, bool);

  // Default implementations of the empty callback that calls
  // value_traits<T>::empty().
  //
  template <typename T>
  static bool
  default_empty (const value&);

  // Default implementation of the assign callback. It calls
  // value_traits<T>::convert() and then constructs the result in the value.
  //
  template <typename T>
  static void
  simple_assign (value&, const literal&, const package_id&, const char*);

  // Default implementations of the reverse, flatten, and compare callbacks
  // that call value_traits<T>::reverse(), flatten(), and compare(),
  // respectively.
  //
  template <typename T>
  static literal
  simple_reverse (const value&);

  template <typename T>
  static void
  simple_flatten (const value&, labels&);

  template <typename T>
  static int
  simple_compare (const value&, const value&);

  // bool
  //
  // Besides the boolean literal also accept integers 0 and 1.
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<bool>
  {
    static_assert (sizeof (bool) <= value::size_, "insufficient space");

    static bool convert (const literal&, const package_id&, const char*);
    static void assign (value&, bool);
    static literal reverse (bool x) {return literal (x);}
    static int compare (bool, bool);
    static bool empty (bool) {return false;}

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // int64_t
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<int64_t>
  {
    static_assert (sizeof (int64_t) <= value::size_, "insufficient space");

    static int64_t convert (const literal&, const package_id&, const char*);
    static void assign (value&, int64_t);
    static literal reverse (int64_t x) {return literal (x);}
    static int compare (int64_t, int64_t);
    static bool empty (int64_t) {return false;}

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // tristate
  //
  // Accept integers -1 (auto), 0 (no), and 1 (yes) as well as booleans.
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<tristate>
  {
    static_assert (sizeof (tristate) <= value::size_, "insufficient space");

    static tristate convert (const literal&, const package_id&, const char*);
    static void assign (value&, tristate);
    static literal reverse (tristate x) {
      return literal (static_cast<int64_t> (x));}
    static int compare (tristate, tristate);
    static bool empty (tristate) {return false;}

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // string
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<string>
  {
    static_assert (sizeof (string) <= value::size_, "insufficient space");

    static string convert (const literal&, const package_id&, const char*);
    static void assign (value&, string&&);
    static literal reverse (const string& x) {return literal (x);}
    static int compare (const string&, const string&);
    static bool empty (const string& x) {return x.empty ();}

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // Treat const char* as string.
  //
  template <>
  struct value_traits<const char*>: value_traits<string> {};

  // label
  //
  // Represented as a string literal in any of the forms accepted by
  // parse_label() and resolved relative to the current package.
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<label>
  {
    static_assert (sizeof (label) <= value::size_, "insufficient space");

    static label convert (const literal&, const package_id&, const char*);
    static void assign (value&, label&&);
    static literal reverse (const label& x) {return literal (to_string (x));}
    static int compare (const label&, const label&);
    static bool empty (const label& x) {return x.empty ();}
    static void flatten (const label& x, labels& r) {r.push_back (x);}

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // fileset_entry
  //
  // Represented as a FilesetEntry(...) structure literal (see
  // <libbuildattr/fileset-entry.cxx> for the fields).
  //
  template <>
  struct LIBBUILDATTR_SYMEXPORT value_traits<fileset_entry>
  {
    static_assert (sizeof (fileset_entry) <= value::size_,
                   "insufficient space");

    static fileset_entry convert (const literal&,
                                  const package_id&,
                                  const char*);
    static void assign (value&, fileset_entry&&);
    static literal reverse (const fileset_entry&);
    static int compare (const fileset_entry& l, const fileset_entry& r) {
      return l.compare (r);}
    static bool empty (const fileset_entry&) {return false;}
    static void flatten (const fileset_entry&, labels&);

    static const char* const type_name;
    static const buildattr::value_type value_type;
  };

  // Flatten dispatch: call value_traits<T>::flatten() if the type has one
  // and do nothing otherwise.
  //
  template <typename T, typename = void>
  struct value_flatten
  {
    static const bool value = false;
    static void flatten (const T&, labels&) {}
  };

  template <typename T>
  struct value_flatten<T,
                       decltype (value_traits<T>::flatten (
                                   std::declval<const T&> (),
                                   std::declval<labels&> ()))>
  {
    static const bool value = true;
    static void flatten (const T& x, labels& r) {
      value_traits<T>::flatten (x, r);}
  };

  // vector<T>
  //
  // Represented as a list literal.
  //
  template <typename T>
  struct vector_value_type;

  template <typename T>
  struct value_traits<vector<T>>
  {
    static_assert (sizeof (vector<T>) <= value::size_, "insufficient space");

    static vector<T> convert (const literal&, const package_id&, const char*);
    static void assign (value&, vector<T>&&);
    static literal reverse (const vector<T>&);
    static int compare (const vector<T>&, const vector<T>&);
    static bool empty (const vector<T>& x) {return x.empty ();}
    static void flatten (const vector<T>&, labels&);

    static const vector_value_type<T> value_type;
  };

  // map<K, V>
  //
  // Represented as a dict literal. Note that the result is ordered by the
  // key and duplicate keys (after conversion) are invalid.
  //
  template <typename K, typename V>
  struct map_value_type;

  template <typename K, typename V>
  struct value_traits<map<K, V>>
  {
    static_assert (sizeof (map<K, V>) <= value::size_, "insufficient space");

    static map<K, V> convert (const literal&, const package_id&, const char*);
    static void assign (value&, map<K, V>&&);
    static literal reverse (const map<K, V>&);
    static int compare (const map<K, V>&, const map<K, V>&);
    static bool empty (const map<K, V>& x) {return x.empty ();}
    static void flatten (const map<K, V>&, labels&);

    static const map_value_type<K, V> value_type;
  };

  // Explicitly pre-instantiate and export value_traits templates for
  // vector/map value types used in the library. This should help speed up
  // compilation as well as to make sure there is a single instance of the
  // value_type object (whose address is the type identity).
  //
  extern template struct LIBBUILDATTR_DECEXPORT value_traits<vector<label>>;
  extern template struct LIBBUILDATTR_DECEXPORT value_traits<strings>;
  extern template struct LIBBUILDATTR_DECEXPORT value_traits<int64s>;
  extern template struct LIBBUILDATTR_DECEXPORT
  value_traits<vector<fileset_entry>>;

  extern template struct LIBBUILDATTR_DECEXPORT
  value_traits<map<string, string>>;

  extern template struct LIBBUILDATTR_DECEXPORT
  value_traits<map<string, label>>;
}

#include <libbuildattr/value.ixx>
#include <libbuildattr/value.txx>

#endif // LIBBUILDATTR_VALUE_HXX
