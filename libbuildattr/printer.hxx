// file      : libbuildattr/printer.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_PRINTER_HXX
#define LIBBUILDATTR_PRINTER_HXX

#include <libbuildattr/types.hxx>
#include <libbuildattr/forward.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/literal.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  // Print the literal in the build language syntax, for example:
  //
  // FilesetEntry(srcdir = "//foo:bar", files = [], excludes = ["xyz"], ...)
  // select({"//conditions:a": ["//a:a"]}) + ["//b:b"]
  //
  // Strings are quoted with the specified quote character (normally " or ')
  // with the quote character itself, backslash, as well as newline, carriage
  // return, and tab escaped. Other control characters (including NUL) are
  // written as \xHH. Null is printed as None and booleans as True and
  // False. The output can be parsed back to an equal literal.
  //
  LIBBUILDATTR_SYMEXPORT ostream&
  to_stream (ostream&, const literal&, char quote = '"');

  inline ostream&
  operator<< (ostream& os, const literal& l) {return to_stream (os, l);}

  // Return the printed representation. Values are printed as their reversed
  // literals (a NULL value as None), selectors as select({...}), and
  // selector lists as their selectors joined with ` + `.
  //
  LIBBUILDATTR_SYMEXPORT string
  repr (const literal&, char quote = '"');

  LIBBUILDATTR_SYMEXPORT string
  repr (const value&, char quote = '"');

  LIBBUILDATTR_SYMEXPORT string
  repr (const selector&, char quote = '"');

  LIBBUILDATTR_SYMEXPORT string
  repr (const selector_list&, char quote = '"');

  LIBBUILDATTR_SYMEXPORT ostream&
  operator<< (ostream&, const value&);
}

#endif // LIBBUILDATTR_PRINTER_HXX
