// file      : libbuildattr/selector.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_SELECTOR_HXX
#define LIBBUILDATTR_SELECTOR_HXX

#include <libbuildattr/types.hxx>
#include <libbuildattr/forward.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/value.hxx>
#include <libbuildattr/literal.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // Configurable attribute values.
  //
  // A configurable value is specified with one or more select({...})
  // constructs, each mapping condition labels to the values of the
  // attribute's (original) type, optionally concatenated with `+` between
  // themselves as well as with plain values, for example:
  //
  // srcs = ["common.cxx"] + select({
  //   "//conditions:linux":   ["linux.cxx"],
  //   "//conditions:default": ["other.cxx"]})
  //
  // Which condition is active is only known during the build graph analysis
  // so here we only validate and convert all the branches.

  // Select construct: an insertion-ordered mapping of condition labels to
  // values of the original type.
  //
  class LIBBUILDATTR_SYMEXPORT selector
  {
  public:
    // The reserved condition key that matches when no other condition
    // does. Note that while it is a valid label syntactically, it does not
    // refer to a real target.
    //
    static const char* const default_condition_key;

    using entry_type = pair<label, value>;
    using entries_type = vector<entry_type>;

    // Convert a select (or dict) literal resolving the condition labels
    // relative to the current package and converting each value to the
    // original type. Throw conversion_error if a key is not a valid label,
    // a value is not of the original type, two keys resolve to the same
    // label, or there are no conditions.
    //
    selector (const literal&,
              const package_id& current,
              const value_type& original,
              const char* what = nullptr);

    // Create a selector with the value as its only (default) entry. This is
    // how plain values in a select list are represented. The value must not
    // be NULL.
    //
    explicit
    selector (value);

    const entries_type&
    entries () const {return entries_;}

    // Return the value for the specified condition or NULL if there is no
    // such condition.
    //
    const value*
    find (const label&) const;

    bool
    has_default () const {return default_ != entries_type::size_type (-1);}

    // Return the value for the default condition. Throw std::out_of_range
    // if there is no default condition.
    //
    const value&
    default_value () const;

    const value_type&
    original_type () const {return *original_;}

    // Return true if the label is the reserved default condition key. The
    // check is textual so that @//conditions:default also qualifies.
    //
    static bool
    reserved_label (const label&);

    // Reverse to the select literal.
    //
    literal
    reverse () const;

  private:
    const value_type*       original_;
    entries_type            entries_;
    entries_type::size_type default_;
  };

  // Ordered sequence of selectors of the same original type combined with
  // `+`. Combining more than one selector is only valid for container
  // types.
  //
  class LIBBUILDATTR_SYMEXPORT selector_list
  {
  public:
    // Convert a select list (or a single select) literal. Each element is
    // either a select construct or a plain value which becomes a selector
    // with a single default entry. Throw conversion_error if any element
    // fails to convert to the original type or if more than one element is
    // specified for a non-container type.
    //
    selector_list (const literal&,
                   const package_id& current,
                   const value_type& original,
                   const char* what = nullptr);

    const vector<selector>&
    selectors () const {return selectors_;}

    // Return the condition labels of all the selectors.
    //
    set<label>
    key_labels () const;

    const value_type&
    original_type () const {return *original_;}

    // Reverse to the select list literal.
    //
    literal
    reverse () const;

  private:
    const value_type* original_;
    vector<selector>  selectors_;
  };

  // Result of converting a potentially configurable attribute value: either
  // a plain (direct) value or a selector list.
  //
  class selectable_value
  {
  public:
    explicit
    selectable_value (value v): direct_ (move (v)) {}

    explicit
    selectable_value (selector_list s): selectors_ (move (s)) {}

    bool
    configurable () const {return selectors_ != nullopt;}

    // The value must not be configurable.
    //
    const value&
    direct () const {assert (!configurable ()); return direct_;}

    // The value must be configurable.
    //
    const selector_list&
    selectors () const {assert (configurable ()); return *selectors_;}

  private:
    value                   direct_;
    optional<selector_list> selectors_;
  };

  // Convert a plain literal to the value of the specified type (as with
  // convert()) and a select or select list literal to a selector list of
  // this type. This is the only conversion that accepts configurable
  // values.
  //
  LIBBUILDATTR_SYMEXPORT selectable_value
  selectable_convert (const value_type&,
                      const literal&,
                      const package_id& current,
                      const char* what = nullptr);

  template <typename T>
  inline selectable_value
  selectable_convert (const literal& x,
                      const package_id& current,
                      const char* what = nullptr)
  {
    return selectable_convert (value_traits<T>::value_type, x, current, what);
  }
}

#endif // LIBBUILDATTR_SELECTOR_HXX
