// file      : libbuildattr/label.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/types.hxx> // Note: not <libbuildattr/label.hxx>

#include <string.h> // memchr()

#include <libbuildattr/utility.hxx>
#include <libbuildattr/diagnostics.hxx>

namespace buildattr
{
  // Punctuation allowed in target names in addition to alphanumerics and
  // the '/' separator.
  //
  static const char name_punct[] = "!%-@^_\"#$&'()*+,;<=>?[]{|}~.";

  // Punctuation allowed in package names in addition to alphanumerics and
  // the '/' separator.
  //
  static const char package_punct[] = "-._+=,~";

  // Note that the terminating '\0' is not punctuation.
  //
  template <size_t N>
  static inline bool
  punct (const char (&p)[N], char c)
  {
    return memchr (p, c, N - 1) != nullptr;
  }

  // Return the description of the problem or empty string if the target
  // name is valid.
  //
  static string
  validate_target_name (const string& n)
  {
    if (n.empty ())
      return "empty target name";

    for (char c: n)
    {
      if (c != '/' && !alnum (c) && !punct (name_punct, c))
        return string ("target names may not contain '") + c + '\'';
    }

    if (n.front () == '/')
      return "target names may not start with '/'";

    if (n.back () == '/')
      return "target names may not end with '/'";

    if (n.find ("//") != string::npos)
      return "target names may not contain '//' path separators";

    // Check for the '.' and '..' segments.
    //
    for (size_t b (0), e; b != string::npos; b = (e == string::npos ? e : e + 1))
    {
      e = n.find ('/', b);
      size_t s ((e == string::npos ? n.size () : e) - b);

      if (s == 1 && n[b] == '.')
        return "target names may not contain '.' as a path segment";

      if (s == 2 && n[b] == '.' && n[b + 1] == '.')
        return "target names may not contain up-level references '..'";
    }

    return string ();
  }

  static string
  validate_package_name (const string& n)
  {
    // The root package.
    //
    if (n.empty ())
      return string ();

    if (n.front () == '/')
      return "package names may not start with '/'";

    if (n.back () == '/')
      return "package names may not end with '/'";

    if (n.find ("//") != string::npos)
      return "package names may not contain '//' path separators";

    for (char c: n)
    {
      if (c != '/' && !alnum (c) && !punct (package_punct, c))
        return "package names may contain only A-Z, a-z, 0-9, '/', '-', '.', "
               "'_', '+', '=', ',' and '~'";
    }

    for (size_t b (0), e; b != string::npos; b = (e == string::npos ? e : e + 1))
    {
      e = n.find ('/', b);
      size_t s ((e == string::npos ? n.size () : e) - b);

      if ((s == 1 && n[b] == '.') ||
          (s == 2 && n[b] == '.' && n[b + 1] == '.'))
        return "package names may not contain '.' or '..' path segments";
    }

    return string ();
  }

  static string
  validate_repository_name (const string& n)
  {
    // Empty means the main repository (@//foo).
    //
    if (n.empty ())
      return string ();

    bool r (alpha (n.front ()));

    for (size_t i (1); r && i != n.size (); ++i)
    {
      char c (n[i]);
      r = alnum (c) || c == '_' || c == '-' || c == '.';
    }

    return r
      ? string ()
      : string ("repository names must start with a letter and contain only "
                "A-Z, a-z, 0-9, '_', '-' and '.'");
  }

  // Parse the absolute form starting from the // position. Return nullopt
  // if this is not an absolute form.
  //
  static optional<label>
  parse_absolute (const string& s)
  {
    size_t p (0);
    string repo;

    if (s[0] == '@')
    {
      p = s.find ("//");

      if (p == string::npos)
        throw label_syntax_error (
          s, "invalid repository name '" + s + "': repository name must be "
          "followed by '//'");

      repo.assign (s, 1, p - 1);

      string e (validate_repository_name (repo));
      if (!e.empty ())
        throw label_syntax_error (
          s, "invalid repository name '@" + repo + "': " + e);
    }
    else if (s.compare (0, 2, "//") != 0)
      return nullopt;

    p += 2; // Skip //.

    size_t c (s.find (':', p));

    string pkg (s, p, c == string::npos ? string::npos : c - p);
    {
      string e (validate_package_name (pkg));
      if (!e.empty ())
        throw label_syntax_error (
          s, "invalid package name '" + pkg + "': " + e);
    }

    // //foo/bar is a shorthand for //foo/bar:bar.
    //
    string n;
    if (c == string::npos)
    {
      size_t l (pkg.rfind ('/'));
      n.assign (pkg, l == string::npos ? 0 : l + 1, string::npos);
    }
    else
      n.assign (s, c + 1, string::npos);

    string e (validate_target_name (n));
    if (!e.empty ())
      throw label_syntax_error (s, "invalid target name '" + n + "': " + e);

    return label (package_id (move (repo), move (pkg)), move (n));
  }

  label
  parse_label (const string& s, const package_id& cur)
  {
    if (s.empty ())
      throw label_syntax_error (s, "invalid target name '': empty target name");

    if (optional<label> r = parse_absolute (s))
      return move (*r);

    // Relative: :bar or bar.
    //
    string n (s, s[0] == ':' ? 1 : 0, string::npos);

    string e (validate_target_name (n));
    if (!e.empty ())
      throw label_syntax_error (s, "invalid target name '" + n + "': " + e);

    return label (cur, move (n));
  }

  label
  parse_label (const string& s)
  {
    if (!s.empty ())
    {
      if (optional<label> r = parse_absolute (s))
        return move (*r);
    }

    throw label_syntax_error (
      s, "invalid label '" + s + "': absolute label must begin with '//' or "
      "'@'");
  }

  string
  to_string (const package_id& p)
  {
    string r;

    if (!p.repository.empty ())
    {
      r += '@';
      r += p.repository;
    }

    r += "//";
    r += p.path;

    return r;
  }

  string
  to_string (const label& l)
  {
    string r (to_string (l.package));
    r += ':';
    r += l.name;
    return r;
  }

  ostream&
  operator<< (ostream& os, const labels_view& ls)
  {
    for (auto b (ls.begin ()), i (b), e (ls.end ()); i != e; ++i)
    {
      if (i != b)
        os << ' ';

      os << *i;
    }

    return os;
  }

  // label_pool
  //
  const label& label_pool::
  insert (label l)
  {
    tracer trace ("label_pool::insert");

    string k (to_string (l));

    mlock ml (mutex_);

    auto p (map_.emplace (move (k), move (l)));

    if (p.second)
      l6 ([&]{trace << "interned " << p.first->first;});

    return p.first->second;
  }

  const label* label_pool::
  find (const label& l) const
  {
    string k (to_string (l));

    mlock ml (mutex_);

    auto i (map_.find (k));
    return i != map_.end () ? &i->second : nullptr;
  }

  size_t label_pool::
  size () const
  {
    mlock ml (mutex_);
    return map_.size ();
  }
}
