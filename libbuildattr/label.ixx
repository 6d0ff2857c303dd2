// file      : libbuildattr/label.ixx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

namespace buildattr
{
  inline int package_id::
  compare (const package_id& x) const
  {
    int r (repository.compare (x.repository));

    if (r == 0)
      r = path.compare (x.path);

    return r;
  }

  inline int label::
  compare (const label& x) const
  {
    int r (package.compare (x.package));

    if (r == 0)
      r = name.compare (x.name);

    return r;
  }
}
