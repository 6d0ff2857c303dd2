// file      : libbuildattr/fileset-entry.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_FILESET_ENTRY_HXX
#define LIBBUILDATTR_FILESET_ENTRY_HXX

#include <libbuildattr/types.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // How symbolic links in the source are treated when placed into the
  // fileset: copied as links or replaced with what they point to.
  //
  enum class symlink_behavior: uint8_t
  {
    copy,
    dereference
  };

  LIBBUILDATTR_SYMEXPORT string
  to_string (symlink_behavior);

  // Throw invalid_argument if the name is not recognized.
  //
  LIBBUILDATTR_SYMEXPORT symlink_behavior
  to_symlink_behavior (const string&);

  inline ostream&
  operator<< (ostream& os, symlink_behavior b) {return os << to_string (b);}

  // Fileset entry: a description of a set of files (either a source
  // directory or an explicit list of files in it) to be placed into a
  // destination directory of a fileset.
  //
  // Note that the absent files list (the whole srcdir is included, minus the
  // excludes) is semantically different from the empty one (nothing is
  // included). The entry is immutable and validated on construction.
  //
  class LIBBUILDATTR_SYMEXPORT fileset_entry
  {
  public:
    using files_type = optional<vector<label>>;

    // Throw invalid_argument if any of the following holds:
    //
    // - both files and excludes are non-empty
    // - an exclude pattern is empty or contains '/'
    // - destdir or strip_prefix is absolute
    // - strip_prefix is not "." while files are absent
    //
    fileset_entry (label srcdir,
                   files_type files,
                   strings excludes,
                   string destdir,
                   symlink_behavior = symlink_behavior::copy,
                   string strip_prefix = ".");

    const label&
    srcdir () const {return srcdir_;}

    const files_type&
    files () const {return files_;}

    const strings&
    excludes () const {return excludes_;}

    const string&
    destdir () const {return destdir_;}

    symlink_behavior
    symlinks () const {return symlinks_;}

    const string&
    strip_prefix () const {return strip_prefix_;}

    // Return the labels this entry depends on: the files if specified and
    // srcdir otherwise. Duplicates are omitted.
    //
    labels
    all_labels () const;

    int
    compare (const fileset_entry&) const;

  private:
    label            srcdir_;
    files_type       files_;
    strings          excludes_;
    string           destdir_;
    symlink_behavior symlinks_;
    string           strip_prefix_;
  };

  inline bool
  operator== (const fileset_entry& x, const fileset_entry& y) {
    return x.compare (y) == 0;}

  inline bool
  operator!= (const fileset_entry& x, const fileset_entry& y) {
    return !(x == y);}

  inline bool
  operator< (const fileset_entry& x, const fileset_entry& y) {
    return x.compare (y) < 0;}
}

#endif // LIBBUILDATTR_FILESET_ENTRY_HXX
