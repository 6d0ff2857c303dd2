// file      : libbuildattr/label.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <thread>
#include <sstream>
#include <iostream>

#include <libbuildattr/types.hxx>   // Includes label.
#include <libbuildattr/utility.hxx>

#include <libbuildattr/diagnostics.hxx>

#undef NDEBUG
#include <cassert>

using namespace std;

namespace buildattr
{
  int
  main (int, char*[])
  {
    init_diag (1);

    package_id cur ("foo/bar");

    auto p = [&cur] (const char* s) {return parse_label (s, cur);};
    auto ts = [&p] (const char* s) {return to_string (p (s));};

    // Invalid label, return the reason.
    //
    auto fail = [&cur] (const char* s) -> string
    {
      try
      {
        parse_label (s, cur);
        assert (false);
      }
      catch (const label_syntax_error& e)
      {
        assert (e.text == s);
        assert (e.reason == e.what ());
        return e.reason;
      }
      return string ();
    };

    // Absolute forms.
    //
    {
      assert (ts ("//foo/bar:baz")       == "//foo/bar:baz");
      assert (ts ("//foo/bar")           == "//foo/bar:bar");
      assert (ts ("//foo")               == "//foo:foo");
      assert (ts ("//:baz")              == "//:baz");
      assert (ts ("@//foo/bar:baz")      == "//foo/bar:baz");
      assert (ts ("@repo//foo/bar:baz")  == "@repo//foo/bar:baz");
      assert (ts ("@repo//:baz")         == "@repo//:baz");
      assert (ts ("//foo:baz/fox.cxx")   == "//foo:baz/fox.cxx");

      assert (p ("//x") == label ("x", "x"));
      assert (p ("//x").package.main ());
      assert (p ("@r//x").repository () == "r");
    }

    // Relative forms.
    //
    {
      assert (ts (":baz")        == "//foo/bar:baz");
      assert (ts ("baz")         == "//foo/bar:baz");
      assert (ts ("sub/baz.cxx") == "//foo/bar:sub/baz.cxx");

      assert (p (":baz") == p ("//foo/bar:baz"));
      assert (p ("baz")  == p (":baz"));

      // Inherit the repository.
      //
      package_id rp ("r", "a");
      assert (to_string (parse_label ("b", rp))  == "@r//a:b");
      assert (to_string (parse_label ("//a:b", rp)) == "//a:b");
    }

    // Invalid labels.
    //
    {
      assert (fail ("")            == "invalid target name '': empty target name");
      assert (fail ("not a label") ==
              "invalid target name 'not a label': target names may not "
              "contain ' '");
      assert (fail (":")           == "invalid target name '': empty target name");
      assert (fail ("//foo:")      == "invalid target name '': empty target name");
      assert (fail ("//foo:a//b")  ==
              "invalid target name 'a//b': target names may not contain '//' "
              "path separators");
      assert (fail ("//foo:../a")  ==
              "invalid target name '../a': target names may not contain "
              "up-level references '..'");
      assert (fail ("//foo:a/")    ==
              "invalid target name 'a/': target names may not end with '/'");
      assert (fail ("//foo/:a")    ==
              "invalid package name 'foo/': package names may not end with "
              "'/'");
      assert (fail ("//fo o:a").find ("invalid package name 'fo o'") == 0);
      assert (fail ("@1r//a:b").find ("invalid repository name '@1r'") == 0);
      assert (fail ("@r").find ("invalid repository name '@r'") == 0);

      // Embedded NUL characters.
      //
      auto fail_n = [&cur] (const string& s) -> bool
      {
        try
        {
          parse_label (s, cur);
        }
        catch (const label_syntax_error&)
        {
          return true;
        }
        return false;
      };

      assert (fail_n (string ("//foo:a\0b", 9)));
      assert (fail_n (string ("//fo\0o:a", 8)));
      assert (fail_n (string ("a\0", 2)));
      assert (fail_n (string ("\0", 1)));
    }

    // Absolute-only parsing.
    //
    {
      assert (parse_label ("//a:b") == label ("a", "b"));

      try
      {
        parse_label (":b");
        assert (false);
      }
      catch (const label_syntax_error& e)
      {
        assert (string (e.what ()) ==
                "invalid label ':b': absolute label must begin with '//' or "
                "'@'");
      }
    }

    // Round-trip of the canonical representation.
    //
    for (const char* s: {"//a/b:c", "@r//a:b/c", "//:x"})
      assert (to_string (parse_label (to_string (parse_label (s)))) == s);

    // Comparison and hashing.
    //
    {
      assert (label ("a", "b") < label ("a", "c"));
      assert (label ("a", "z") < label ("b", "a"));
      assert (label (package_id ("", "a"), "b") <
              label (package_id ("r", "a"), "b"));

      hash<label> h;
      assert (h (p ("baz")) == h (p ("//foo/bar:baz")));
    }

    // Label list printing.
    //
    {
      labels ls {p ("a"), p ("//x")};

      ostringstream os;
      os << ls;
      assert (os.str () == "//foo/bar:a //x:x");
    }

    // Label pool.
    //
    {
      label_pool lp;

      const label& a (lp.insert (p ("a")));
      assert (&lp.insert (p (":a")) == &a);
      assert (lp.find (p ("//foo/bar:a")) == &a);
      assert (lp.find (p ("b")) == nullptr);

      vector<thread> threads;
      for (size_t i (0); i != 4; ++i)
      {
        threads.emplace_back ([&lp, &p] ()
                         {
                           for (size_t j (0); j != 100; ++j)
                             lp.insert (p (("t" + to_string (j)).c_str ()));
                         });
      }

      for (thread& t: threads)
        t.join ();

      assert (lp.size () == 101);
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return buildattr::main (argc, argv);
}
