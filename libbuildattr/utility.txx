// file      : libbuildattr/utility.txx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace buildattr
{
  template <typename L, typename I>
  void
  append_unique (L& r, I b, I e)
  {
    for (; b != e; ++b)
    {
      if (std::find (r.begin (), r.end (), *b) == r.end ())
        r.push_back (*b);
    }
  }
}
