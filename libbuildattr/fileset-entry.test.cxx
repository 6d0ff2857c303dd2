// file      : libbuildattr/fileset-entry.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbuildattr/types.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/value.hxx>
#include <libbuildattr/printer.hxx>
#include <libbuildattr/fileset-entry.hxx>
#include <libbuildattr/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace buildattr
{
  static literal
  list (initializer_list<literal> l)
  {
    return literal (literal_type::list, literal::list_type (l));
  }

  static literal
  entry (initializer_list<literal_member> fs)
  {
    return literal (literal_structure {"FilesetEntry", fs});
  }

  int
  main (int, char*[])
  {
    init_diag (1);

    package_id cur ("pkg");
    label x (parse_label ("//x"));

    auto ts = [] (const fileset_entry& e, char q = '"')
    {
      return repr (value (e), q);
    };

    // Construction failure, return the diagnostics.
    //
    auto fail = [] (label s,
                    fileset_entry::files_type f,
                    strings xs,
                    string d,
                    string p = ".") -> string
    {
      try
      {
        fileset_entry (move (s), move (f), move (xs), move (d),
                       symlink_behavior::copy, move (p));
        assert (false);
      }
      catch (const invalid_argument& e)
      {
        return e.what ();
      }
      return string ();
    };

    // Printing.
    //
    {
      fileset_entry e (parse_label ("//foo:bar"),
                       vector<label> (),
                       strings {"xyz"},
                       "");

      assert (ts (e) ==
              "FilesetEntry(srcdir = \"//foo:bar\", files = [], "
              "excludes = [\"xyz\"], destdir = \"\", strip_prefix = \".\", "
              "symlinks = \"copy\")");

      fileset_entry c (x, vector<label> {x}, strings (), "");

      assert (ts (c) ==
              "FilesetEntry(srcdir = \"//x:x\", files = [\"//x:x\"], "
              "excludes = [], destdir = \"\", strip_prefix = \".\", "
              "symlinks = \"copy\")");

      assert (ts (c, '\'') ==
              "FilesetEntry(srcdir = '//x:x', files = ['//x:x'], "
              "excludes = [], destdir = '', strip_prefix = '.', "
              "symlinks = 'copy')");

      fileset_entry d (x, vector<label> {x}, strings (), "",
                       symlink_behavior::dereference);

      assert (ts (d).find ("symlinks = \"dereference\"") != string::npos);

      fileset_entry o (x, vector<label> {x}, strings (), "",
                       symlink_behavior::dereference, "orange");

      assert (ts (d).find ("strip_prefix = \".\"") != string::npos);
      assert (ts (o).find ("strip_prefix = \"orange\"") != string::npos);

      // Absent files list.
      //
      fileset_entry a (x, nullopt, strings (), "out");
      assert (ts (a).find ("files = None, ") != string::npos);
    }

    // Symlink behavior.
    //
    {
      assert (to_string (symlink_behavior::copy) == "copy");
      assert (to_symlink_behavior ("dereference") ==
              symlink_behavior::dereference);

      try
      {
        to_symlink_behavior ("COPY");
        assert (false);
      }
      catch (const invalid_argument&) {}
    }

    // Invalid field combinations.
    //
    {
      assert (fail (x, vector<label> {x}, strings {"a"}, "") ==
              "both files and excludes specified");

      assert (fail (x, nullopt, strings {"a/b"}, "") ==
              "invalid exclude pattern 'a/b': must not contain '/'");

      assert (fail (x, nullopt, strings {""}, "") == "empty exclude pattern");

      assert (fail (x, nullopt, strings (), "/abs") ==
              "absolute destdir '/abs'");

      assert (fail (x, vector<label> {x}, strings (), "", "/abs") ==
              "absolute strip_prefix '/abs'");

      assert (fail (x, nullopt, strings (), "", "sub") ==
              "strip_prefix 'sub' specified without files");

      // Empty files list with excludes is fine.
      //
      fileset_entry e (x, vector<label> (), strings {"a"}, "");
      assert (e.excludes ().size () == 1);
    }

    // Labels.
    //
    {
      label y (parse_label ("//y"));

      fileset_entry f (x, vector<label> {y, x, y}, strings (), "");
      labels ls (f.all_labels ());
      assert (ls.size () == 2 && ls[0] == y && ls[1] == x);

      fileset_entry s (x, nullopt, strings (), "");
      assert (s.all_labels ().size () == 1 && s.all_labels ()[0] == x);

      assert (flatten (value (f)).size () == 2);

      // Nested in a list.
      //
      value v (vector<fileset_entry> {f, s});
      assert (flatten (v).size () == 2);

      assert (value_traits<vector<fileset_entry>>::value_type.name ==
              string ("list(FilesetEntry)"));
    }

    // Comparison.
    //
    {
      fileset_entry a (x, nullopt, strings (), "");
      fileset_entry b (x, vector<label> (), strings (), "");
      fileset_entry c (x, nullopt, strings (), "d");

      assert (a == fileset_entry (x, nullopt, strings (), ""));
      assert (a != b && a < b);
      assert (a < c);
    }

    // Conversion.
    //
    {
      const value_type& t (value_traits<fileset_entry>::value_type);

      value v (convert (t,
                        entry ({{"srcdir", literal (":src")},
                                {"files", list ({literal ("a")})},
                                {"destdir", literal ("out")},
                                {"strip_prefix", literal ("s")},
                                {"symlinks", literal ("dereference")}}),
                        cur));

      const fileset_entry& e (cast<fileset_entry> (v));
      assert (e.srcdir () == label ("pkg", "src"));
      assert (e.files () && e.files ()->size () == 1);
      assert ((*e.files ())[0] == label ("pkg", "a"));
      assert (e.excludes ().empty ());
      assert (e.destdir () == "out");
      assert (e.strip_prefix () == "s");
      assert (e.symlinks () == symlink_behavior::dereference);

      // Reverse and convert back.
      //
      assert (cast<fileset_entry> (convert (t, reverse (v), cur)) == e);

      // Defaults and None.
      //
      value d (convert (t,
                        entry ({{"srcdir", literal ("//x")},
                                {"files", literal ()}}),
                        cur));

      assert (!cast<fileset_entry> (d).files ());
      assert (cast<fileset_entry> (d).strip_prefix () == ".");

      auto fail = [&t, &cur] (const literal& l) -> string
      {
        try
        {
          convert (t, l, cur, "attribute 'entries'");
          assert (false);
        }
        catch (const conversion_error& e)
        {
          return e.what ();
        }
        return string ();
      };

      assert (fail (literal ("//x")) ==
              "expected value of type 'FilesetEntry' for attribute 'entries', "
              "but got \"//x\" (string)");

      assert (fail (literal (literal_structure {"Other", {}})) ==
              "expected value of type 'FilesetEntry' for attribute 'entries', "
              "but got Other() (Other)");

      assert (fail (entry ({{"files", list ({})}})) ==
              "missing FilesetEntry field 'srcdir' in attribute 'entries'");

      assert (fail (entry ({{"srcdir", literal ("//x")},
                            {"colour", literal ("red")}})) ==
              "unknown FilesetEntry field 'colour' in attribute 'entries'");

      assert (fail (entry ({{"srcdir", literal ("//x")},
                            {"srcdir", literal ("//y")}})) ==
              "duplicate FilesetEntry field 'srcdir' in attribute 'entries'");

      assert (fail (entry ({{"srcdir", literal ("//x")},
                            {"symlinks", literal ("skip")}})) ==
              "invalid symlink behavior 'skip' in FilesetEntry field "
              "'symlinks' in attribute 'entries'");

      assert (fail (entry ({{"srcdir", literal ("//x")},
                            {"files", list ({literal ("a")})},
                            {"excludes", list ({literal ("b")})}})) ==
              "invalid FilesetEntry in attribute 'entries': both files and "
              "excludes specified");

      assert (fail (entry ({{"srcdir", literal ("not a label")}})) ==
              "invalid label 'not a label' in FilesetEntry field 'srcdir' in "
              "attribute 'entries': invalid target name 'not a label': "
              "target names may not contain ' '");

      assert (fail (entry ({{"srcdir", literal ("//x")},
                            {"excludes", literal ("b")}})) ==
              "expected value of type 'list(string)' for FilesetEntry field "
              "'excludes' in attribute 'entries', but got \"b\" (string)");
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return buildattr::main (argc, argv);
}
