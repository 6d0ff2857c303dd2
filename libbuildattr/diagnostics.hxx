// file      : libbuildattr/diagnostics.hxx -*- C++ -*-
// license   : MIT; see accompanying LICENSE file

#ifndef LIBBUILDATTR_DIAGNOSTICS_HXX
#define LIBBUILDATTR_DIAGNOSTICS_HXX

#include <libbutl/diagnostics.hxx>

#include <libbuildattr/types.hxx>
#include <libbuildattr/forward.hxx>
#include <libbuildattr/utility.hxx>

#include <libbuildattr/export.hxx>

namespace buildattr
{
  struct diag_record;

  // Verbosity level.
  //
  // 0 - disabled
  // 1 - high-level information messages
  // 2 - essential underlying operations
  // 3 - all underlying operations
  // 4 - information helpful to the user (e.g., why a conversion failed)
  // 5 - information helpful to the developer
  // 6 - even more detailed information
  //
  // While uint8 is more than enough, use uint16 for the ease of printing.
  //

  // Forward-declarated in <libbuildattr/utility.hxx>.
  //
  // extern uint16_t verb;

  template <typename F> inline void l1 (const F& f) {if (verb >= 1) f ();}
  template <typename F> inline void l2 (const F& f) {if (verb >= 2) f ();}
  template <typename F> inline void l3 (const F& f) {if (verb >= 3) f ();}
  template <typename F> inline void l4 (const F& f) {if (verb >= 4) f ();}
  template <typename F> inline void l5 (const F& f) {if (verb >= 5) f ();}
  template <typename F> inline void l6 (const F& f) {if (verb >= 6) f ();}

  // Diagnostic facility.
  //
  // Note that this is the "complex" case we we derive from (rather than
  // alias) a number of butl::diag_* types and provide custom operator<<
  // "overrides" in order to make ADL look in the buildattr rather than butl
  // namespace (where, for example, our label and value printing live).
  //
  using butl::diag_epilogue;
  using butl::diag_frame;

  template <typename> struct diag_prologue;
  template <typename> struct diag_mark;

  struct diag_record: butl::diag_record
  {
    template <typename T>
    const diag_record&
    operator<< (const T& x) const
    {
      os << x;
      return *this;
    }

    diag_record () = default;

    template <typename B>
    explicit
    diag_record (const diag_prologue<B>& p): diag_record () { *this << p;}

    template <typename B>
    explicit
    diag_record (const diag_mark<B>& m): diag_record () { *this << m;}
  };

  template <typename B>
  struct diag_prologue: butl::diag_prologue<B>
  {
    using butl::diag_prologue<B>::diag_prologue;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      diag_record r;
      r.append (this->indent, this->epilogue);
      B::operator() (r);
      r << x;
      return r;
    }

    friend const diag_record&
    operator<< (const diag_record& r, const diag_prologue& p)
    {
      r.append (p.indent, p.epilogue);
      p (r);
      return r;
    }
  };

  template <typename B>
  struct diag_mark: butl::diag_mark<B>
  {
    using butl::diag_mark<B>::diag_mark;

    template <typename T>
    diag_record
    operator<< (const T& x) const
    {
      return B::operator() () << x;
    }

    friend const diag_record&
    operator<< (const diag_record& r, const diag_mark& m)
    {
      return r << m ();
    }
  };

  struct LIBBUILDATTR_SYMEXPORT simple_prologue_base
  {
    explicit
    simple_prologue_base (const char* type,
                          const char* mod,
                          const char* name)
        : type_ (type), mod_ (mod), name_ (name) {}

    void
    operator() (const diag_record& r) const;

  private:
    const char* type_;
    const char* mod_;
    const char* name_;
  };

  struct basic_mark_base
  {
    using simple_prologue = diag_prologue<simple_prologue_base>;

    explicit
    basic_mark_base (const char* type,
                     diag_epilogue* epilogue = &diag_frame::apply,
                     const char* mod = nullptr,
                     const char* name = nullptr)
        : type_ (type), mod_ (mod), name_ (name),
          epilogue_ (epilogue) {}

    simple_prologue
    operator() () const
    {
      return simple_prologue (epilogue_, type_, mod_, name_);
    }

  protected:
    const char* type_;
    const char* mod_;
    const char* name_;
    diag_epilogue* const epilogue_;
  };

  // trace
  //
  struct trace_mark_base: basic_mark_base
  {
    explicit
    trace_mark_base (const char* name)
        : trace_mark_base (nullptr, name) {}

    trace_mark_base (const char* mod, const char* name)
        : basic_mark_base ("trace",
                           nullptr, // No diag stack.
                           mod,
                           name) {}
  };
  using trace_mark = diag_mark<trace_mark_base>;
  using tracer = trace_mark;
}

#endif // LIBBUILDATTR_DIAGNOSTICS_HXX
