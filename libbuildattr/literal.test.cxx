// file      : libbuildattr/literal.test.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <sstream>
#include <iostream>

#include <libbuildattr/types.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/literal.hxx>
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

  static literal
  select (initializer_list<literal_member> l)
  {
    return literal (literal_type::select, literal::dict_type (l));
  }

  int
  main (int, char*[])
  {
    init_diag (1);

    // Construction and type names.
    //
    {
      assert (literal ().type == literal_type::null);
      assert (literal (nullptr).type == literal_type::null);
      assert (literal (true).type == literal_type::boolean);
      assert (literal (1).type == literal_type::integer);
      assert (literal ("a").type == literal_type::string);
      assert (literal (string ("a")).type == literal_type::string);
      assert (literal (literal_type::list).list.empty ());

      assert (type_name (literal ())       == "NoneType");
      assert (type_name (literal (false))  == "bool");
      assert (type_name (literal (-1))     == "int");
      assert (type_name (literal ("x"))    == "string");
      assert (type_name (list ({}))        == "list");
      assert (type_name (dict ({}))        == "dict");
      assert (type_name (select ({}))      == "select");
      assert (type_name (literal (literal_structure {"FilesetEntry", {}})) ==
              "FilesetEntry");

      assert (select ({}).selectable ());
      assert (!dict ({}).selectable ());
    }

    // Checked access.
    //
    {
      assert (literal (true).as_bool ());
      assert (literal (42).as_int64 () == 42);
      assert (literal ("a").as_string () == "a");
      assert (list ({literal (1)}).as_list ().size () == 1);

      try
      {
        literal (1).as_string ();
        assert (false);
      }
      catch (const invalid_argument& e)
      {
        assert (string (e.what ()) == "expected string instead of int");
      }

      try
      {
        dict ({}).as_select ();
        assert (false);
      }
      catch (const invalid_argument& e)
      {
        assert (string (e.what ()) == "expected select instead of dict");
      }
    }

    // Member lookup.
    //
    {
      literal d (dict ({{"a", literal (1)}, {"b", literal ("x")}}));

      assert (d.find ("a") != nullptr && d.find ("a")->as_int64 () == 1);
      assert (d.find (string ("b"))->as_string () == "x");
      assert (d.find ("c") == nullptr);

      try
      {
        literal (1).find ("a");
        assert (false);
      }
      catch (const invalid_argument& e)
      {
        assert (string (e.what ()) ==
                "expected dict, select, or struct instead of int");
      }
    }

    // Copy and move.
    //
    {
      literal l (list ({literal ("a"), dict ({{"k", literal (true)}})}));
      literal c (l);
      assert (c == l);

      literal m (move (c));
      assert (m == l);
      assert (c.type == literal_type::null);

      c = l;
      assert (c == l);

      c = literal (1);
      assert (c != l);
    }

    // Comparison.
    //
    {
      assert (literal () == null_literal);
      assert (literal () < literal (false));
      assert (literal (1) != literal ("1"));
      assert (literal (1) < literal (2));
      assert (list ({literal (1)}) < list ({literal (1), literal (0)}));

      // Members are compared in the insertion order.
      //
      assert (dict ({{"a", literal (1)}, {"b", literal (2)}}) !=
              dict ({{"b", literal (2)}, {"a", literal (1)}}));
    }

    // Printing.
    //
    {
      auto ts = [] (const literal& l, char q = '"') {return repr (l, q);};

      assert (ts (literal ())         == "None");
      assert (ts (literal (true))     == "True");
      assert (ts (literal (false))    == "False");
      assert (ts (literal (-5))       == "-5");
      assert (ts (literal ("a"))      == "\"a\"");
      assert (ts (literal ("a"), '\'') == "'a'");
      assert (ts (literal ("a\"b\\c\n")) == "\"a\\\"b\\\\c\\n\"");
      assert (ts (literal ("a\"b"), '\'') == "'a\"b'");
      assert (ts (literal (string ("a\0b\x1f\x7f", 5))) ==
              "\"a\\x00b\\x1f\\x7f\"");

      assert (ts (list ({}))                          == "[]");
      assert (ts (list ({literal ("a"), literal (1)})) == "[\"a\", 1]");
      assert (ts (dict ({{"k", literal ("v")}}), '\'') == "{'k': 'v'}");

      assert (ts (literal (literal_structure {
                "S", {{"x", literal (1)}, {"y", literal ()}}})) ==
              "S(x = 1, y = None)");

      literal s (select ({{"//conditions:default", list ({})}}));
      assert (ts (s) == "select({\"//conditions:default\": []})");

      literal sl (literal_type::select_list,
                  literal::list_type {s, list ({literal ("//b:b")})});
      assert (ts (sl, '\'') ==
              "select({'//conditions:default': []}) + ['//b:b']");

      ostringstream os;
      os << list ({literal (true)});
      assert (os.str () == "[True]");
    }

    return 0;
  }
}

int
main (int argc, char* argv[])
{
  return buildattr::main (argc, argv);
}
