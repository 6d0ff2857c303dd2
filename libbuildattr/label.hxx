// file      : libbuildattr/label.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

// Note: include <libbuildattr/types.hxx> instead of this file directly.
//

#ifndef LIBBUILDATTR_LABEL_HXX
#define LIBBUILDATTR_LABEL_HXX

// We cannot include <libbuildattr/utility.hxx> since it includes
// <libbuildattr/types.hxx>.
//
#include <utility> // move()

#include <libbutl/utility.hxx> // combine_hash()

#include <libbuildattr/export.hxx>

namespace buildattr
{
  using std::move;

  // Package identifier: repository name and package path.
  //
  // An empty repository name denotes the main repository and an empty path
  // denotes the root package. The path is stored normalized, without the
  // leading // and without trailing slashes (e.g., foo/bar).
  //
  struct package_id
  {
    string repository;
    string path;

    package_id () = default;

    explicit
    package_id (string p): path (move (p)) {}

    package_id (string r, string p)
        : repository (move (r)), path (move (p)) {}

    bool
    main () const {return repository.empty ();}

    int
    compare (const package_id&) const;
  };

  inline bool
  operator== (const package_id& x, const package_id& y) {
    return x.compare (y) == 0;}

  inline bool
  operator!= (const package_id& x, const package_id& y) {return !(x == y);}

  inline bool
  operator< (const package_id& x, const package_id& y) {
    return x.compare (y) < 0;}

  // Return the //foo/bar or @repo//foo/bar representation.
  //
  LIBBUILDATTR_SYMEXPORT string
  to_string (const package_id&);

  inline ostream&
  operator<< (ostream& os, const package_id& p) {return os << to_string (p);}

  // Label: a reference to a build target, that is, a package plus a target
  // name within that package.
  //
  // A label in this form is always resolved: the relative forms (:bar, bar)
  // only exist in the textual representation and are resolved against the
  // current package by parse_label(). Two labels are equal if their
  // repository, package path, and target name are equal, irrespective of
  // the textual form they were parsed from.
  //
  struct label
  {
    package_id package;
    string     name;

    label () = default;

    label (package_id p, string n): package (move (p)), name (move (n)) {}

    // Main repository label.
    //
    label (string p, string n): package (move (p)), name (move (n)) {}

    const string&
    repository () const {return package.repository;}

    bool
    empty () const {return name.empty ();}

    int
    compare (const label&) const;
  };

  inline bool
  operator== (const label& x, const label& y) {return x.compare (y) == 0;}

  inline bool
  operator!= (const label& x, const label& y) {return !(x == y);}

  inline bool
  operator< (const label& x, const label& y) {return x.compare (y) < 0;}

  // Thrown by parse_label() if the text is not a valid label. The text
  // member contains the complete offending text while reason (also returned
  // by what()) describes the problem with the offending component, for
  // example:
  //
  // invalid target name 'not a label': target names may not contain ' '
  //
  struct LIBBUILDATTR_SYMEXPORT label_syntax_error: invalid_argument
  {
    string text;
    string reason;

    label_syntax_error (string t, string r)
        : invalid_argument (r), text (move (t)), reason (move (r)) {}
  };

  // Parse the textual label representation resolving the relative forms
  // against the current package. The recognized forms are:
  //
  // @repo//foo/bar:baz   absolute, in another repository
  // @//foo/bar:baz       absolute, same as //foo/bar:baz
  // //foo/bar:baz        absolute
  // //foo/bar            absolute, same as //foo/bar:bar
  // //:baz               absolute, in the root package
  // :baz                 relative, in the current package
  // baz                  relative, in the current package
  //
  // Note that the absolute forms always refer to the main repository unless
  // qualified, that is, they ignore the current package entirely. The
  // relative forms inherit the repository of the current package. Throw
  // label_syntax_error if the text is malformed.
  //
  LIBBUILDATTR_SYMEXPORT label
  parse_label (const string&, const package_id& current);

  // As above but only the absolute forms are accepted.
  //
  LIBBUILDATTR_SYMEXPORT label
  parse_label (const string&);

  // Return the canonical //foo/bar:baz or @repo//foo/bar:baz representation.
  // The result can be parsed back to an equal label with parse_label().
  //
  LIBBUILDATTR_SYMEXPORT string
  to_string (const label&);

  inline ostream&
  operator<< (ostream& os, const label& l) {return os << to_string (l);}

  // Vector of labels.
  //
  // Quite often it will contain just one element (e.g., the labels of a
  // label value) so we use small_vector<1>. Note also that it must be a
  // separate type rather than an alias for vector<label> in order to
  // distinguish the labels extracted from a value (see flatten()) from the
  // typed list(label) values.
  //
  using labels = small_vector<label, 1>;
  using labels_view = vector_view<const label>;

  // Print space-separated.
  //
  LIBBUILDATTR_SYMEXPORT ostream&
  operator<< (ostream&, const labels_view&);

  inline ostream&
  operator<< (ostream& os, const labels& ls) {return os << labels_view (ls);}

  // Label pool.
  //
  // Labels that are referenced from many rules (conditions, common
  // dependencies, etc) can be interned to share a single instance. The pool
  // is keyed by the canonical textual representation and is MT-safe.
  //
  // Note that insertion is racy and it's possible the entry already exists,
  // in which case we return the existing instance (which is equal to ours by
  // definition).
  //
  class LIBBUILDATTR_SYMEXPORT label_pool
  {
  public:
    const label&
    insert (label);

    const label*
    find (const label&) const;

    size_t
    size () const;

  private:
    map<string, label> map_;
    mutable mutex mutex_;
  };
}

namespace std
{
  template <>
  struct hash<buildattr::label>
  {
    size_t
    operator() (const buildattr::label& l) const noexcept
    {
      hash<string> h;
      return butl::combine_hash (
        butl::combine_hash (h (l.package.repository), h (l.package.path)),
        h (l.name));
    }
  };
}

#include <libbuildattr/label.ixx>

#endif // LIBBUILDATTR_LABEL_HXX
