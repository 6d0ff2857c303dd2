// file      : libbuildattr/fileset-entry.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/fileset-entry.hxx>

#include <libbuildattr/value.hxx>

using namespace std;

namespace buildattr
{
  // symlink_behavior
  //
  string
  to_string (symlink_behavior b)
  {
    switch (b)
    {
    case symlink_behavior::copy:        return "copy";
    case symlink_behavior::dereference: return "dereference";
    }

    return string ();
  }

  symlink_behavior
  to_symlink_behavior (const string& s)
  {
         if (s == "copy")        return symlink_behavior::copy;
    else if (s == "dereference") return symlink_behavior::dereference;
    else throw invalid_argument ("invalid symlink behavior '" + s + '\'');
  }

  // fileset_entry
  //
  fileset_entry::
  fileset_entry (label s,
                 files_type f,
                 strings x,
                 string d,
                 symlink_behavior b,
                 string p)
      : srcdir_ (move (s)),
        files_ (move (f)),
        excludes_ (move (x)),
        destdir_ (move (d)),
        symlinks_ (b),
        strip_prefix_ (move (p))
  {
    if (files_ && !files_->empty () && !excludes_.empty ())
      throw invalid_argument ("both files and excludes specified");

    for (const string& e: excludes_)
    {
      if (e.empty ())
        throw invalid_argument ("empty exclude pattern");

      if (e.find ('/') != string::npos)
        throw invalid_argument ("invalid exclude pattern '" + e +
                                "': must not contain '/'");
    }

    if (!destdir_.empty () && destdir_.front () == '/')
      throw invalid_argument ("absolute destdir '" + destdir_ + '\'');

    if (!strip_prefix_.empty () && strip_prefix_.front () == '/')
      throw invalid_argument ("absolute strip_prefix '" + strip_prefix_ +
                              '\'');

    if (strip_prefix_ != "." && !files_)
      throw invalid_argument ("strip_prefix '" + strip_prefix_ +
                              "' specified without files");
  }

  labels fileset_entry::
  all_labels () const
  {
    labels r;

    if (files_)
      append_unique (r, files_->begin (), files_->end ());
    else
      r.push_back (srcdir_);

    return r;
  }

  int fileset_entry::
  compare (const fileset_entry& x) const
  {
    int r (srcdir_.compare (x.srcdir_));

    if (r == 0)
    {
      bool f (files_), xf (x.files_);

      r = f == xf ? 0 : (f ? 1 : -1);

      if (r == 0 && f)
        r = value_traits<vector<label>>::compare (*files_, *x.files_);
    }

    if (r == 0)
      r = value_traits<strings>::compare (excludes_, x.excludes_);

    if (r == 0)
      r = destdir_.compare (x.destdir_);

    if (r == 0)
      r = symlinks_ < x.symlinks_ ? -1 : (symlinks_ > x.symlinks_ ? 1 : 0);

    if (r == 0)
      r = strip_prefix_.compare (x.strip_prefix_);

    return r;
  }

  // fileset_entry value
  //
  // The FilesetEntry(...) structure fields:
  //
  // srcdir       - label, required
  // files        - list(label), absent if None or unspecified
  // excludes     - list(string)
  // destdir      - string
  // strip_prefix - string, "." by default
  // symlinks     - "copy" (default) or "dereference"
  //
  // Note that an optional field explicitly set to None is the same as
  // unspecified.
  //
  fileset_entry value_traits<fileset_entry>::
  convert (const literal& x, const package_id& p, const char* what)
  {
    if (x.type != literal_type::structure || x.structure.name != type_name)
      throw_conversion_error (x, type_name, what);

    auto in_what = [what] ()
    {
      return what != nullptr ? string (" in ") + what : string ();
    };

    optional<label>          srcdir;
    fileset_entry::files_type files;
    strings                  excludes;
    string                   destdir;
    string                   strip_prefix (".");
    symlink_behavior         symlinks (symlink_behavior::copy);

    set<string> seen;
    for (const literal_member& f: x.structure.fields)
    {
      const string& n (f.name);
      const literal& v (f.value);

      if (!seen.insert (n).second)
        throw_conversion_error (
          type_name, what,
          "duplicate FilesetEntry field '" + n + '\'' + in_what ());

      // Attribute the field errors as "FilesetEntry field 'X'[ in <what>]".
      //
      string w ("FilesetEntry field '" + n + '\'' + in_what ());

      if (n == "srcdir")
      {
        srcdir = value_traits<label>::convert (v, p, w.c_str ());
        continue;
      }

      if (n != "files"        &&
          n != "excludes"     &&
          n != "destdir"      &&
          n != "strip_prefix" &&
          n != "symlinks")
        throw_conversion_error (
          type_name, what,
          "unknown FilesetEntry field '" + n + '\'' + in_what ());

      if (v.type == literal_type::null)
        continue;

      if (n == "files")
        files = value_traits<vector<label>>::convert (v, p, w.c_str ());
      else if (n == "excludes")
        excludes = value_traits<strings>::convert (v, p, w.c_str ());
      else if (n == "destdir")
        destdir = value_traits<string>::convert (v, p, w.c_str ());
      else if (n == "strip_prefix")
        strip_prefix = value_traits<string>::convert (v, p, w.c_str ());
      else
      {
        string s (value_traits<string>::convert (v, p, w.c_str ()));

        try
        {
          symlinks = to_symlink_behavior (s);
        }
        catch (const invalid_argument& e)
        {
          throw_conversion_error (type_name, what, e.what () + (" in " + w));
        }
      }
    }

    if (!srcdir)
      throw_conversion_error (
        type_name, what,
        "missing FilesetEntry field 'srcdir'" + in_what ());

    try
    {
      return fileset_entry (move (*srcdir),
                            move (files),
                            move (excludes),
                            move (destdir),
                            symlinks,
                            move (strip_prefix));
    }
    catch (const invalid_argument& e)
    {
      throw_conversion_error (
        type_name, what,
        "invalid FilesetEntry" + in_what () + ": " + e.what ());
    }
  }

  literal value_traits<fileset_entry>::
  reverse (const fileset_entry& x)
  {
    literal_structure r {type_name, {}};
    r.fields.reserve (6);

    auto add = [&r] (const char* n, literal v)
    {
      r.fields.push_back (literal_member {n, move (v)});
    };

    add ("srcdir", value_traits<label>::reverse (x.srcdir ()));
    add ("files",
         x.files ()
         ? value_traits<vector<label>>::reverse (*x.files ())
         : literal ());
    add ("excludes", value_traits<strings>::reverse (x.excludes ()));
    add ("destdir", literal (x.destdir ()));
    add ("strip_prefix", literal (x.strip_prefix ()));
    add ("symlinks", literal (to_string (x.symlinks ())));

    return literal (move (r));
  }

  void value_traits<fileset_entry>::
  flatten (const fileset_entry& x, labels& r)
  {
    labels ls (x.all_labels ());
    append_unique (r, ls.begin (), ls.end ());
  }

  const char* const value_traits<fileset_entry>::type_name = "FilesetEntry";

  const value_type value_traits<fileset_entry>::value_type
  {
    type_name,
    sizeof (fileset_entry),
    false,                           // Not container.
    nullptr,                         // No element.
    &default_dtor<fileset_entry>,
    &default_copy_ctor<fileset_entry>,
    &default_copy_assign<fileset_entry>,
    &simple_assign<fileset_entry>,
    &simple_reverse<fileset_entry>,
    &simple_flatten<fileset_entry>,
    &simple_compare<fileset_entry>,
    &default_empty<fileset_entry>
  };
}
