// file      : libbuildattr/printer.cxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#include <libbuildattr/printer.hxx>

#include <sstream>

#include <libbuildattr/value.hxx>
#include <libbuildattr/selector.hxx>

using namespace std;

namespace buildattr
{
  static void
  write_string (ostream& os, const string& s, char q)
  {
    os << q;

    for (char c: s)
    {
      switch (c)
      {
      case '\\': os << "\\\\"; break;
      case '\n': os << "\\n";  break;
      case '\r': os << "\\r";  break;
      case '\t': os << "\\t";  break;
      default:
        {
          // Other control characters (including NUL) as \xHH.
          //
          unsigned char u (static_cast<unsigned char> (c));

          if (u < 0x20 || u == 0x7f)
          {
            const char* h ("0123456789abcdef");
            os << "\\x" << h[u >> 4] << h[u & 0x0f];
            break;
          }

          if (c == q)
            os << '\\';

          os << c;
        }
      }
    }

    os << q;
  }

  static void
  write_members (ostream& os,
                 const literal::dict_type& ms,
                 char q,
                 bool fields)
  {
    for (auto b (ms.begin ()), i (b), e (ms.end ()); i != e; ++i)
    {
      if (i != b)
        os << ", ";

      if (fields)
        os << i->name << " = ";
      else
      {
        write_string (os, i->name, q);
        os << ": ";
      }

      to_stream (os, i->value, q);
    }
  }

  ostream&
  to_stream (ostream& os, const literal& v, char q)
  {
    switch (v.type)
    {
    case literal_type::null:
      {
        os << "None";
        break;
      }
    case literal_type::boolean:
      {
        os << (v.boolean ? "True" : "False");
        break;
      }
    case literal_type::integer:
      {
        os << v.integer;
        break;
      }
    case literal_type::string:
      {
        write_string (os, v.string, q);
        break;
      }
    case literal_type::list:
      {
        os << '[';

        for (auto b (v.list.begin ()), i (b), e (v.list.end ()); i != e; ++i)
        {
          if (i != b)
            os << ", ";

          to_stream (os, *i, q);
        }

        os << ']';
        break;
      }
    case literal_type::dict:
      {
        os << '{';
        write_members (os, v.dict, q, false /* fields */);
        os << '}';
        break;
      }
    case literal_type::structure:
      {
        os << v.structure.name << '(';
        write_members (os, v.structure.fields, q, true /* fields */);
        os << ')';
        break;
      }
    case literal_type::select:
      {
        os << "select({";
        write_members (os, v.dict, q, false /* fields */);
        os << "})";
        break;
      }
    case literal_type::select_list:
      {
        for (auto b (v.list.begin ()), i (b), e (v.list.end ()); i != e; ++i)
        {
          if (i != b)
            os << " + ";

          to_stream (os, *i, q);
        }

        break;
      }
    }

    return os;
  }

  string
  repr (const literal& v, char q)
  {
    ostringstream os;
    to_stream (os, v, q);
    return os.str ();
  }

  string
  repr (const value& v, char q)
  {
    return repr (reverse (v), q);
  }

  string
  repr (const selector& s, char q)
  {
    return repr (s.reverse (), q);
  }

  string
  repr (const selector_list& s, char q)
  {
    return repr (s.reverse (), q);
  }

  ostream&
  operator<< (ostream& os, const value& v)
  {
    return to_stream (os, reverse (v));
  }
}
