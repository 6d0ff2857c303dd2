// file      : libbuildattr/value.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <iostream>

#include <libbuildattr/types.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/value.hxx>
#include <libbuildattr/printer.hxx>
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
  dict (initializer_list<literal_member> l)
  {
    return literal (literal_type::dict, literal::dict_type (l));
  }

  int
  main (int, char*[])
  {
    init_diag (1);

    package_id cur ("foo");

    // Convert expecting failure and return the diagnostics.
    //
    auto fail = [&cur] (const value_type& t,
                        const literal& x,
                        const char* what = nullptr) -> string
    {
      try
      {
        convert (t, x, cur, what);
        assert (false);
      }
      catch (const conversion_error& e)
      {
        return e.what ();
      }
      return string ();
    };

    // Type names.
    //
    {
      assert (value_traits<bool>::value_type.name == string ("boolean"));
      assert (value_traits<vector<label>>::value_type.name ==
              string ("list(label)"));
      assert (value_traits<strings>::value_type.name ==
              string ("list(string)"));
      assert ((value_traits<map<string, label>>::value_type.name ==
               string ("dict(string, label)")));

      assert (value_traits<strings>::value_type.container);
      assert (value_traits<strings>::value_type.element_type ==
              &value_traits<string>::value_type);
      assert (!value_traits<label>::value_type.container);
    }

    // Scalars.
    //
    {
      assert (convert<bool> (literal (true), cur));
      assert (!convert<bool> (literal (0), cur));
      assert (convert<bool> (literal (1), cur));
      assert (convert<int64_t> (literal (-7), cur) == -7);
      assert (convert<string> (literal ("x"), cur) == "x");

      assert (convert<tristate> (literal (-1), cur) == tristate::auto_);
      assert (convert<tristate> (literal (true), cur) == tristate::yes);
      assert (to_string (tristate::no) == "no");

      assert (fail (value_traits<bool>::value_type, literal (2)) ==
              "expected value of type 'boolean', but got 2 (int)");

      assert (fail (value_traits<int64_t>::value_type,
                    literal ("1"),
                    "attribute 'n'") ==
              "expected value of type 'int' for attribute 'n', but got \"1\" "
              "(string)");

      assert (fail (value_traits<string>::value_type, literal ()) ==
              "expected value of type 'string', but got None (NoneType)");

      assert (fail (value_traits<tristate>::value_type, literal (2)) ==
              "expected value of type 'tristate', but got 2 (int)");

      try
      {
        convert<int64_t> (literal (true), cur, "attribute 'n'");
        assert (false);
      }
      catch (const conversion_error& e)
      {
        assert (e.type == "int" && e.context == "attribute 'n'");
      }
    }

    // Labels.
    //
    {
      assert (convert<label> (literal (":bar"), cur) == label ("foo", "bar"));
      assert (convert<label> (literal ("//x"), cur) == label ("x", "x"));

      assert (fail (value_traits<label>::value_type,
                    literal ("not a label"),
                    "attribute 'dep'") ==
              "invalid label 'not a label' in attribute 'dep': invalid "
              "target name 'not a label': target names may not contain ' '");

      assert (fail (value_traits<label>::value_type, literal (1)) ==
              "expected value of type 'label', but got 1 (int)");
    }

    // Lists.
    //
    {
      value v (convert (value_traits<vector<label>>::value_type,
                        list ({literal ("a"), literal ("//b:c")}),
                        cur));

      assert (v && v.type->is_a<vector<label>> ());
      assert (cast<vector<label>> (v).size () == 2);
      assert (cast<vector<label>> (v)[0] == label ("foo", "a"));

      assert (flatten (v).size () == 2);
      assert (repr (v) == "[\"//foo:a\", \"//b:c\"]");

      assert (fail (value_traits<vector<label>>::value_type,
                    list ({literal ("a"), literal (1)}),
                    "attribute 'deps'") ==
              "expected value of type 'label' for element 1 of attribute "
              "'deps', but got 1 (int)");

      assert (fail (value_traits<strings>::value_type, literal ("a")) ==
              "expected value of type 'list(string)', but got \"a\" (string)");

      // Types without labels flatten to nothing.
      //
      value s (strings {"a", "b"});
      assert (flatten (s).empty ());
      assert (value_traits<strings>::value_type.flatten == nullptr);
    }

    // Dicts.
    //
    {
      const value_type& t (value_traits<map<string, label>>::value_type);

      value v (convert (t,
                        dict ({{"y", literal ("//b")}, {"x", literal ("a")}}),
                        cur));

      const map<string, label>& m (cast<map<string, label>> (v));
      assert (m.size () == 2);
      assert (m.at ("x") == label ("foo", "a"));

      // Ordered by key.
      //
      assert (repr (v, '\'') == "{'x': '//foo:a', 'y': '//b:b'}");

      // Labels in the key order.
      //
      labels ls (flatten (v));
      assert (ls.size () == 2 && ls[0] == label ("foo", "a"));

      assert (fail (t, list ({})) ==
              "expected value of type 'dict(string, label)', but got [] "
              "(list)");

      assert (fail (t, dict ({{"x", literal ("a")}, {"x", literal ("b")}})) ==
              "duplicate dict key 'x'");
    }

    // Select constructs are rejected by the plain conversion.
    //
    {
      literal s (literal_type::select,
                 literal::dict_type {{"//conditions:default", list ({})}});

      assert (fail (value_traits<vector<label>>::value_type, s).find (
                "expected value of type 'list(label)'") == 0);

      try
      {
        convert<vector<label>> (s, cur);
        assert (false);
      }
      catch (const conversion_error& e)
      {
        assert (string (e.what ()).find (
                  "expected value of type 'list(label)'") == 0);
      }
    }

    // Value semantics.
    //
    {
      value n (&value_traits<string>::value_type);
      assert (n.null && !n);
      assert (!reverse (n).selectable () &&
              reverse (n).type == literal_type::null);
      assert (flatten (n).empty ());

      value a ("x");
      value b (a);
      assert (a == b);

      b = value (string ("y"));
      assert (a != b && a < b);
      assert (n < a);

      value c (move (b));
      assert (cast<string> (c) == "y");

      c = nullptr;
      assert (c.null && c.type == &value_traits<string>::value_type);

      assert (value (strings ()).empty ());
      assert (!value (label ("a", "b")).empty ());

      assert (cast_null<string> (n) == nullptr);
      assert (*cast_null<string> (a) == "x");
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return buildattr::main (argc, argv);
}
