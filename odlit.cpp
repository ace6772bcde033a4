// This file is part of ODLIT.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#define ODLIT_DETAILS_5E0B7A31_2C94_4F1D_A86E_93D4C0F7B128_
#include "odlit.hpp"
#include <rocket/tinybuf.hpp>
#include <rocket/ascii_numput.hpp>
#include <rocket/ascii_numget.hpp>
#include <utf8proc.h>
#include <algorithm>
#include <limits>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <cstdint>
namespace odlit {
namespace {

constexpr ::std::uint64_t ns_per_second = 1000000000;
constexpr ::std::uint64_t ns_per_minute = ns_per_second * 60;
constexpr ::std::uint64_t ns_per_hour = ns_per_minute * 60;
constexpr ::std::uint64_t ns_per_day = ns_per_hour * 24;

constexpr ROCKET_ALWAYS_INLINE
bool
is_within(int c, int lo, int hi)
  {
    return (c >= lo) && (c <= hi);
  }

template<typename... Ts>
constexpr ROCKET_ALWAYS_INLINE
bool
is_any(int c, Ts... accept_set)
  {
    return (... || (c == accept_set));
  }

constexpr
bool
is_digit(int c)
  {
    return is_within(c, '0', '9');
  }

constexpr
bool
is_hex_digit(int c)
  {
    return is_within(c, '0', '9') || is_within(c, 'A', 'F') || is_within(c, 'a', 'f');
  }

constexpr
bool
is_base64url(int c)
  {
    return is_within(c, 'A', 'Z') || is_within(c, 'a', 'z') || is_within(c, '0', '9')
           || is_any(c, '-', '_');
  }

bool
is_identifier_leading(char32_t c, Options opts)
  {
    if(is_within(c, 'A', 'Z') || is_within(c, 'a', 'z') || (c == '_'))
      return true;
    else if((c < 0x80) || (opts & option_ascii_identifiers))
      return false;

    switch(::utf8proc_category(static_cast<::utf8proc_int32_t>(c)))
      {
      case UTF8PROC_CATEGORY_LU:
      case UTF8PROC_CATEGORY_LL:
      case UTF8PROC_CATEGORY_LT:
      case UTF8PROC_CATEGORY_LM:
      case UTF8PROC_CATEGORY_LO:
      case UTF8PROC_CATEGORY_NL:
        return true;

      default:
        return false;
      }
  }

bool
is_identifier_char(char32_t c, Options opts)
  {
    if(is_within(c, 'A', 'Z') || is_within(c, 'a', 'z') || is_within(c, '0', '9')
       || (c == '_'))
      return true;
    else if((c < 0x80) || (opts & option_ascii_identifiers))
      return false;

    // Letters, combining marks, digits and connectors
    switch(::utf8proc_category(static_cast<::utf8proc_int32_t>(c)))
      {
      case UTF8PROC_CATEGORY_LU:
      case UTF8PROC_CATEGORY_LL:
      case UTF8PROC_CATEGORY_LT:
      case UTF8PROC_CATEGORY_LM:
      case UTF8PROC_CATEGORY_LO:
      case UTF8PROC_CATEGORY_NL:
      case UTF8PROC_CATEGORY_MN:
      case UTF8PROC_CATEGORY_MC:
      case UTF8PROC_CATEGORY_ND:
      case UTF8PROC_CATEGORY_PC:
        return true;

      default:
        return false;
      }
  }

constexpr
bool
is_leap_year(::std::int32_t year)
  {
    return ((year % 4 == 0) && (year % 100 != 0)) || (year % 400 == 0);
  }

::std::uint32_t
do_days_of_month(::std::int32_t year, ::std::uint32_t month)
  {
    static constexpr ::std::uint8_t s_days[] = { 31,28,31,30,31,30,31,31,30,31,30,31 };

    // The month has been validated by the caller.
    ROCKET_ASSERT(is_within(static_cast<int>(month), 1, 12));
    if((month == 2) && is_leap_year(year))
      return 29;
    else
      return s_days[month - 1];
  }

struct Scanner
  {
    const char* bptr;
    const char* sptr;
    const char* eptr;
    Parser_Context* ctx;
    Options opts;
    const char* alt;

    Scanner(Parser_Context& c, const char* s, size_t n, Options o) noexcept
      : bptr(s), sptr(s), eptr(s + n), ctx(&c), opts(o), alt()  { }

    size_t
    consumed() const noexcept
      {
        return static_cast<size_t>(this->sptr - this->bptr);
      }

    bool
    at_end() const noexcept
      {
        return this->sptr == this->eptr;
      }

    // Gets the character at `sptr + k` without consuming it. If it is beyond the
    // end of input, -1 is returned.
    int
    peekc(size_t k = 0) const noexcept
      {
        if(static_cast<size_t>(this->eptr - this->sptr) <= k)
          return -1;

        return static_cast<unsigned char>(this->sptr[k]);
      }

    bool
    take(char c) noexcept
      {
        if(this->peekc() != static_cast<unsigned char>(c))
          return false;

        this->sptr ++;
        return true;
      }

    // Consumes `n` characters if they match `s` exactly.
    bool
    take_cs(const char* s, size_t n) noexcept
      {
        if(static_cast<size_t>(this->eptr - this->sptr) < n)
          return false;

        if(::std::memcmp(this->sptr, s, n) != 0)
          return false;

        this->sptr += n;
        return true;
      }

    // Consumes `n` characters if they match `lower` case-insensitively. Letters
    // in `lower` shall be lowercase.
    bool
    take_ci(const char* lower, size_t n) noexcept
      {
        if(static_cast<size_t>(this->eptr - this->sptr) < n)
          return false;

        for(size_t k = 0;  k != n;  ++k) {
          int c = static_cast<unsigned char>(this->sptr[k]);
          if(is_within(c, 'A', 'Z'))
            c |= 0x20;

          if(c != static_cast<unsigned char>(lower[k]))
            return false;
        }

        this->sptr += n;
        return true;
      }

    // Counts consecutive decimal digits from `sptr + from`, up to `max`.
    size_t
    count_digits(size_t max, size_t from = 0) const noexcept
      {
        size_t n = 0;
        while((n != max) && is_digit(this->peekc(from + n)))
          n ++;
        return n;
      }

    size_t
    count_hex_digits(size_t max) const noexcept
      {
        size_t n = 0;
        while((n != max) && is_hex_digit(this->peekc(n)))
          n ++;
        return n;
      }

    // Counts characters that match `pat`, where `#` matches a decimal digit,
    // `?` matches any character, and others match themselves.
    size_t
    match_pattern(const char* pat) const noexcept
      {
        size_t n = 0;
        while(pat[n] && ((pat[n] == '?') ? (this->peekc(n) >= 0)
                         : (pat[n] == '#') ? is_digit(this->peekc(n))
                         : (this->peekc(n) == static_cast<unsigned char>(pat[n]))))
          n ++;
        return n;
      }
  };

// This restores the position of a scanner upon destruction, unless the
// transaction has been committed. A failed alternative consumes no input.
class Scanner_Transaction
  {
  private:
    Scanner* m_sc;
    const char* m_saved;

  public:
    explicit
    Scanner_Transaction(Scanner& sc) noexcept
      : m_sc(&sc), m_saved(sc.sptr)  { }

    Scanner_Transaction(const Scanner_Transaction&) = delete;
    Scanner_Transaction& operator=(const Scanner_Transaction&) = delete;

    ~Scanner_Transaction()
      {
        if(this->m_sc)
          this->m_sc->sptr = this->m_saved;
      }

    const char*
    start() const noexcept
      { return this->m_saved;  }

    void
    commit() noexcept
      { this->m_sc = nullptr;  }
  };

// Records an error at `pos`, and returns `false`. When several alternatives
// fail, the most informative error is kept: a domain error outweighs a syntax
// error, and among errors of the same kind, the one at the greatest offset
// wins; a later alternative wins a tie.
bool
do_err(Scanner& sc, const char* pos, Error_Kind kind, const char* error)
  {
    auto& ctx = *(sc.ctx);
    ::std::int64_t offset = pos - sc.bptr;
    if(ctx.error && ((ctx.kind > kind) || ((ctx.kind == kind) && (ctx.offset > offset))))
      return false;

    ctx.offset = offset;
    ctx.error = error;
    ctx.alternative = sc.alt;
    ctx.kind = kind;
    return false;
  }

void
do_reset(Parser_Context& ctx)
  {
    ::std::memset(&ctx, 0, sizeof(ctx));
  }

void
do_succeed(Parser_Context& ctx, size_t consumed)
  {
    ctx.offset = static_cast<::std::int64_t>(consumed);
    ctx.error = nullptr;
    ctx.alternative = nullptr;
    ctx.kind = error_none;
  }

// Finalizes the error of a failed top-level parse. `matched` is the length of
// the longest prefix that has been accepted by `alt`, or zero if none.
void
do_finish_error(Scanner& sc, size_t matched, const char* alt)
  {
    auto& ctx = *(sc.ctx);
    if(sc.bptr == sc.eptr) {
      ctx.offset = 0;
      ctx.error = "empty input";
      ctx.alternative = nullptr;
      ctx.kind = error_syntax;
      return;
    }

    // A domain error is more useful than a complaint about trailing garbage, as
    // in `2023-02-29`, where `2023` alone would be a valid integer.
    if(ctx.error && (ctx.kind == error_domain))
      return;

    if(matched != 0) {
      ctx.offset = static_cast<::std::int64_t>(matched);
      ctx.error = "unexpected trailing characters";
      ctx.alternative = alt;
      ctx.kind = error_trailing_input;
      return;
    }

    // If nothing got past the first character, no alternative is more relevant
    // than the others.
    ROCKET_ASSERT(ctx.error);
    if(ctx.offset == 0) {
      ctx.error = "unrecognized token";
      ctx.alternative = nullptr;
    }
  }

bool
do_accumulate_decimal(::std::uint64_t& value, const char* str, size_t len)
  {
    value = 0;
    for(size_t k = 0;  k != len;  ++k)
      if(__builtin_mul_overflow(value, 10U, &value)
         || __builtin_add_overflow(value, static_cast<unsigned>(str[k] - '0'), &value))
        return false;
    return true;
  }

// Converts the digits after a decimal point to nanoseconds. Digits beyond the
// ninth are truncated.
::std::uint32_t
do_nanoseconds_from_fraction(const char* str, size_t len)
  {
    ::std::uint32_t value = 0;
    for(size_t k = 0;  k != 9;  ++k) {
      value *= 10;
      if(k < len)
        value += static_cast<::std::uint32_t>(str[k] - '0');
    }
    return value;
  }

// Checks whether the input matches `pat`, where `#` denotes a decimal digit.
// Nothing is consumed. Fields are range-checked only after the shape has been
// confirmed, so a mismatch is never reported as a domain error.
bool
do_expect_shape(Scanner& sc, const char* pat)
  {
    size_t n = sc.match_pattern(pat);
    if(pat[n] == 0)
      return true;
    else if(pat[n] == '#')
      return do_err(sc, sc.sptr + n, error_syntax, "expected decimal digit");
    else if(pat[n] == '-')
      return do_err(sc, sc.sptr + n, error_syntax, "expected `-`");
    else
      return do_err(sc, sc.sptr + n, error_syntax, "expected `:`");
  }

// Takes exactly `n` decimal digits which have been checked by the caller. The
// value shall be within [min,max]; otherwise, a domain error is reported with
// `range_error`.
bool
do_take_field(::std::uint32_t& value, Scanner& sc, size_t n, ::std::uint32_t min,
              ::std::uint32_t max, const char* range_error)
  {
    ::std::uint32_t temp = 0;
    for(size_t k = 0;  k != n;  ++k) {
      ROCKET_ASSERT(is_digit(sc.peekc(k)));
      temp = temp * 10 + static_cast<::std::uint32_t>(sc.sptr[k] - '0');
    }

    if((temp < min) || (temp > max))
      return do_err(sc, sc.sptr, error_domain, range_error);

    sc.sptr += n;
    value = temp;
    return true;
  }

bool
do_parse_null(V_null& /*value*/, Scanner& sc)
  {
    if(!sc.take_cs("null", 4))
      return do_err(sc, sc.sptr, error_syntax, "expected `null`");

    return true;
  }

bool
do_parse_boolean(V_boolean& value, Scanner& sc)
  {
    if(sc.take_ci("true", 4))
      value = true;
    else if(sc.take_ci("false", 5))
      value = false;
    else
      return do_err(sc, sc.sptr, error_syntax, "expected `true` or `false`");

    return true;
  }

bool
do_parse_integer(V_integer& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    bool neg = false;
    if(is_any(sc.peekc(), '+', '-'))
      neg = *(sc.sptr ++) == '-';

    size_t n = sc.count_digits(SIZE_MAX);
    if(n == 0)
      return do_err(sc, sc.sptr, error_syntax, "expected decimal digit");

    // Strip leading zeroes. A value with more than 19 significant digits can't
    // fit in 64 bits.
    const char* dptr = sc.sptr;
    sc.sptr += n;
    while((sc.sptr - dptr > 1) && (*dptr == '0'))
      dptr ++;

    size_t ndigits = static_cast<size_t>(sc.sptr - dptr);
    if(ndigits > 19)
      return do_err(sc, tr.start(), error_domain, "integer out of range");

    char temp[24];
    size_t ntemp = 0;
    if(neg)
      temp[ntemp++] = '-';
    ::std::memcpy(temp + ntemp, dptr, ndigits);
    ntemp += ndigits;

    ::rocket::ascii_numget numg;
    if(numg.parse_I(temp, ntemp) != ntemp)
      return do_err(sc, tr.start(), error_syntax, "invalid integer");

    numg.cast_I(value, INT64_MIN, INT64_MAX);
    if(numg.overflowed())
      return do_err(sc, tr.start(), error_domain, "integer out of range");

    tr.commit();
    return true;
  }

bool
do_parse_float(V_float& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    if(is_any(sc.peekc(), '+', '-'))
      sc.sptr ++;

    size_t n = sc.count_digits(SIZE_MAX);
    if(n == 0) {
      // These are case-sensitive. There is no `+INF`.
      sc.sptr = tr.start();
      if(sc.take_cs("NaN", 3))
        value = ::std::numeric_limits<double>::quiet_NaN();
      else if(sc.take_cs("INF", 3))
        value = ::std::numeric_limits<double>::infinity();
      else if(sc.take_cs("-INF", 4))
        value = -::std::numeric_limits<double>::infinity();
      else
        return do_err(sc, sc.sptr + is_any(sc.peekc(), '+', '-'), error_syntax,
                      "expected decimal digit");

      tr.commit();
      return true;
    }

    sc.sptr += n;

    // A fraction or an exponent is required, so integers and floating-point
    // numbers are disjoint.
    bool has_frac = false;
    if((sc.peekc() == '.') && is_digit(sc.peekc(1))) {
      sc.sptr += 1 + sc.count_digits(SIZE_MAX, 1);
      has_frac = true;
    }

    bool has_exp = false;
    if(is_any(sc.peekc(), 'e', 'E')) {
      size_t k = is_any(sc.peekc(1), '+', '-') ? 2 : 1;
      size_t nexp = sc.count_digits(SIZE_MAX, k);
      if(nexp == 0)
        return do_err(sc, sc.sptr + k, error_syntax, "expected exponent digit");

      sc.sptr += k + nexp;
      has_exp = true;
    }

    if(!has_frac && !has_exp)
      return do_err(sc, sc.sptr, error_syntax, "expected `.` or exponent");

    // Values that are out of range are converted to infinities and are always
    // accepted.
    const char* dptr = tr.start() + (*(tr.start()) == '+');
    size_t dlen = static_cast<size_t>(sc.sptr - dptr);
    ::rocket::ascii_numget numg;
    if(numg.parse_DD(dptr, dlen) != dlen)
      return do_err(sc, tr.start(), error_syntax, "invalid floating-point number");

    numg.cast_D(value, -HUGE_VAL, HUGE_VAL);
    tr.commit();
    return true;
  }

bool
do_parse_string(V_string& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    if(!sc.take('\''))
      return do_err(sc, sc.sptr, error_syntax, "expected `'`");

    V_string temp;
    for(;;) {
      // Copy everything up to the next apostrophe verbatim.
      auto qptr = static_cast<const char*>(::std::memchr(sc.sptr, '\'',
                                              static_cast<size_t>(sc.eptr - sc.sptr)));
      if(!qptr)
        return do_err(sc, sc.eptr, error_syntax, "unterminated string");

      temp.append(sc.sptr, qptr);
      sc.sptr = qptr + 1;
      if(sc.peekc() != '\'')
        break;

      // A doubled apostrophe denotes a single one.
      temp.push_back('\'');
      sc.sptr ++;
    }

    value = ::std::move(temp);
    tr.commit();
    return true;
  }

bool
do_parse_guid(V_guid& value, Scanner& sc)
  {
    static constexpr size_t s_groups[] = { 8, 4, 4, 4, 12 };

    Scanner_Transaction tr(sc);
    for(size_t g = 0;  g != 5;  ++g) {
      // After `XXXXXXXX-`, this can't be anything else, so a bad group is a
      // domain error.
      if(g != 0)
        if(!sc.take('-'))
          return do_err(sc, sc.sptr, (g == 1) ? error_syntax : error_domain,
                        (g == 1) ? "expected `-`" : "malformed GUID grouping");

      size_t n = sc.count_hex_digits(s_groups[g]);
      if(n != s_groups[g])
        return do_err(sc, sc.sptr + n, (g == 0) ? error_syntax : error_domain,
                      (g == 0) ? "expected hexadecimal digit" : "malformed GUID grouping");

      sc.sptr += n;
    }

    ROCKET_ASSERT(sc.sptr - tr.start() == 36);
    ::std::memcpy(value.text, tr.start(), 36);
    value.text[36] = 0;
    tr.commit();
    return true;
  }

bool
do_parse_year(::std::int32_t& year, Scanner& sc)
  {
    // OData years may be negative, unlike ISO 8601.
    Scanner_Transaction tr(sc);
    bool neg = sc.take('-');
    if(!do_expect_shape(sc, "####"))
      return false;

    ::std::uint32_t abs;
    if(!do_take_field(abs, sc, 4, 0, 9999, "year out of range"))
      return false;

    year = neg ? -static_cast<::std::int32_t>(abs) : static_cast<::std::int32_t>(abs);
    tr.commit();
    return true;
  }

bool
do_parse_date(V_date& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    ::std::int32_t year;
    if(!do_parse_year(year, sc))
      return false;

    if(!do_expect_shape(sc, "-##-##"))
      return false;

    ::std::uint32_t month;
    sc.sptr ++;
    if(!do_take_field(month, sc, 2, 1, 12, "month out of range"))
      return false;

    ::std::uint32_t day;
    sc.sptr ++;
    const char* dpos = sc.sptr;
    if(!do_take_field(day, sc, 2, 1, 31, "day out of range"))
      return false;

    if(day > do_days_of_month(year, month))
      return do_err(sc, dpos, error_domain, "day out of range for month");

    value.year = year;
    value.month = static_cast<::std::uint8_t>(month);
    value.day = static_cast<::std::uint8_t>(day);
    tr.commit();
    return true;
  }

bool
do_parse_time(V_time& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    if(!do_expect_shape(sc, "##:##"))
      return false;

    ::std::uint32_t hour, minute, second = 0, nanosecond = 0;
    if(!do_take_field(hour, sc, 2, 0, 24, "hour out of range"))
      return false;

    sc.sptr ++;
    if(!do_take_field(minute, sc, 2, 0, 59, "minute out of range"))
      return false;

    if(sc.match_pattern(":##") == 3) {
      sc.sptr ++;
      if(!do_take_field(second, sc, 2, 0, 59, "second out of range"))
        return false;

      if((sc.peekc() == '.') && is_digit(sc.peekc(1))) {
        // Take at most 12 digits; only the first 9 are significant.
        size_t n = sc.count_digits(12, 1);
        nanosecond = do_nanoseconds_from_fraction(sc.sptr + 1, n);
        sc.sptr += 1 + n;
      }
    }

    value.hour = static_cast<::std::uint8_t>(hour);
    value.minute = static_cast<::std::uint8_t>(minute);
    value.second = static_cast<::std::uint8_t>(second);
    value.nanosecond = nanosecond;
    tr.commit();
    return true;
  }

bool
do_parse_datetime(V_datetime& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    if(!do_parse_date(value.date, sc))
      return false;

    if(!sc.take_ci("t", 1))
      return do_err(sc, sc.sptr, error_syntax, "expected `T`");

    if(!do_parse_time(value.time, sc))
      return false;

    // The offset is optional, and defaults to UTC. If it looks like `+hh:mm`,
    // then its fields shall be valid.
    value.offset_minutes = 0;
    if(sc.take_ci("z", 1))
      value.offset_minutes = 0;
    else if(is_any(sc.peekc(), '+', '-') && (sc.match_pattern("?##:##") == 6)) {
      bool neg = *(sc.sptr ++) == '-';

      ::std::uint32_t hour, minute;
      if(!do_take_field(hour, sc, 2, 0, 24, "offset hour out of range"))
        return false;

      sc.sptr ++;
      if(!do_take_field(minute, sc, 2, 0, 59, "offset minute out of range"))
        return false;

      value.offset_minutes = static_cast<::std::int32_t>(hour * 60 + minute);
      if(neg)
        value.offset_minutes = -value.offset_minutes;
    }

    tr.commit();
    return true;
  }

bool
do_add_scaled(::std::uint64_t& total, ::std::uint64_t count, ::std::uint64_t scale)
  {
    ::std::uint64_t temp;
    return !__builtin_mul_overflow(count, scale, &temp)
           && !__builtin_add_overflow(total, temp, &total);
  }

// Parses an optional duration component such as `12H`, and adds it to `total`
// in nanoseconds. If `unit` is `s`, a fraction is allowed. An absent component
// is not an error.
bool
do_add_duration_component(::std::uint64_t& total, Scanner& sc, char unit,
                          ::std::uint64_t scale)
  {
    size_t n = sc.count_digits(SIZE_MAX);
    if(n == 0)
      return true;

    size_t nfrac = 0;
    if((unit == 's') && (sc.peekc(n) == '.') && is_digit(sc.peekc(n + 1)))
      nfrac = 1 + sc.count_digits(SIZE_MAX, n + 1);

    int c = sc.peekc(n + nfrac);
    if(is_within(c, 'A', 'Z'))
      c |= 0x20;
    if(c != unit)
      return true;

    ::std::uint64_t count;
    if(!do_accumulate_decimal(count, sc.sptr, n) || !do_add_scaled(total, count, scale))
      return do_err(sc, sc.sptr, error_domain, "duration out of range");

    if(nfrac != 0)
      if(__builtin_add_overflow(total, do_nanoseconds_from_fraction(sc.sptr + n + 1,
                                                                    nfrac - 1), &total))
        return do_err(sc, sc.sptr, error_domain, "duration out of range");

    sc.sptr += n + nfrac + 1;
    return true;
  }

bool
do_parse_duration(V_duration& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    bool has_keyword = sc.take_ci("duration", 8);
    if(!has_keyword && (sc.opts & option_duration_keyword))
      return do_err(sc, sc.sptr, error_syntax, "expected `duration`");

    if(!sc.take('\''))
      return do_err(sc, sc.sptr, error_syntax, "expected `'`");

    bool neg = false;
    if(is_any(sc.peekc(), '+', '-'))
      neg = *(sc.sptr ++) == '-';

    if(!sc.take_ci("p", 1))
      return do_err(sc, sc.sptr, error_syntax, "expected `P`");

    // Sum all components, each of which is optional.
    const char* cpos = sc.sptr;
    ::std::uint64_t total = 0;
    if(!do_add_duration_component(total, sc, 'd', ns_per_day))
      return false;

    if(sc.take_ci("t", 1)) {
      if(!do_add_duration_component(total, sc, 'h', ns_per_hour))
        return false;

      if(!do_add_duration_component(total, sc, 'm', ns_per_minute))
        return false;

      if(!do_add_duration_component(total, sc, 's', ns_per_second))
        return false;
    }

    if(!sc.take('\''))
      return do_err(sc, sc.sptr, error_syntax, "expected `'`");

    // The magnitude of a negative duration may be one greater.
    if(total > static_cast<::std::uint64_t>(INT64_MAX) + neg)
      return do_err(sc, cpos, error_domain, "duration out of range");

    if(neg)
      total = 0 - total;
    value = V_duration(static_cast<::std::int64_t>(total));
    tr.commit();
    return true;
  }

// Decodes base64url data in [bptr,eptr). Padding is optional, but if present,
// it shall complete the last group.
bool
do_decode_base64url(V_binary& bin, Scanner& sc, const char* bptr, const char* eptr)
  {
    const char* dend = eptr;
    while((dend != bptr) && (dend[-1] == '='))
      dend --;

    size_t ndata = static_cast<size_t>(dend - bptr);
    size_t npad = static_cast<size_t>(eptr - dend);

    V_binary temp;
    temp.reserve(ndata / 4 * 3 + 2);
    ::std::uint32_t value = 0;
    for(const char* tptr = bptr;  tptr != dend;  ++tptr) {
      int c = static_cast<unsigned char>(*tptr);
      value <<= 6;
      if(is_within(c, 'A', 'Z'))
        value |= static_cast<::std::uint32_t>(c - 'A');
      else if(is_within(c, 'a', 'z'))
        value |= static_cast<::std::uint32_t>(c - 'a' + 26);
      else if(is_within(c, '0', '9'))
        value |= static_cast<::std::uint32_t>(c - '0' + 52);
      else if(c == '-')
        value |= 62;
      else if(c == '_')
        value |= 63;
      else if(c == '=')
        return do_err(sc, tptr, error_domain, "invalid base64 padding");
      else
        return do_err(sc, tptr, error_domain, "invalid base64 character");

      if((tptr - bptr) % 4 == 3) {
        // 4-character group
        temp.push_back(static_cast<unsigned char>(value >> 16));
        temp.push_back(static_cast<unsigned char>(value >> 8));
        temp.push_back(static_cast<unsigned char>(value));
        value = 0;
      }
    }

    // Unused bits in the last character shall be zero.
    switch(ndata % 4)
      {
      case 1:
        return do_err(sc, dend - 1, error_domain, "invalid base64 length");

      case 2:
        if(value & 0x0F)
          return do_err(sc, dend - 1, error_domain, "invalid base64 trailing bits");

        temp.push_back(static_cast<unsigned char>(value >> 4));
        break;

      case 3:
        if(value & 0x03)
          return do_err(sc, dend - 1, error_domain, "invalid base64 trailing bits");

        temp.push_back(static_cast<unsigned char>(value >> 10));
        temp.push_back(static_cast<unsigned char>(value >> 2));
        break;
      }

    if((npad != 0) && ((npad > 2) || ((ndata + npad) % 4 != 0)))
      return do_err(sc, dend, error_domain, "invalid base64 padding");

    bin = ::std::move(temp);
    return true;
  }

bool
do_parse_binary(V_binary& value, Scanner& sc)
  {
    Scanner_Transaction tr(sc);
    if(!sc.take_ci("binary'", 7))
      return do_err(sc, sc.sptr, error_syntax, "expected `binary'`");

    auto qptr = static_cast<const char*>(::std::memchr(sc.sptr, '\'',
                                            static_cast<size_t>(sc.eptr - sc.sptr)));
    if(!qptr) {
      // Point at the first character that can't be part of the data.
      const char* tptr = sc.sptr;
      while((tptr != sc.eptr) && (is_base64url(static_cast<unsigned char>(*tptr))
                                  || (*tptr == '=')))
        tptr ++;
      return do_err(sc, tptr, error_syntax, "expected `'`");
    }

    if(!do_decode_base64url(value, sc, sc.sptr, qptr))
      return false;

    sc.sptr = qptr + 1;
    tr.commit();
    return true;
  }

// Decodes a UTF-8 character at `sptr + k`, and returns its length. If the
// sequence is invalid or at the end of input, zero is returned.
size_t
do_peek_utf8(char32_t& cp, const Scanner& sc, size_t k)
  {
    int c = sc.peekc(k);
    if(c < 0)
      return 0;

    if(c < 0x80) {
      cp = static_cast<char32_t>(c);
      return 1;
    }

    if(is_within(c, 0x80, 0xBF) || (c >= 0xF8))
      return 0;

    // Parse a multibyte Unicode character.
    int u8len = ROCKET_LZCNT32(static_cast<::std::uint32_t>(c ^ -1) << 24);
    ::std::uint32_t value = static_cast<::std::uint32_t>(c) & ((1U << (7 - u8len)) - 1);
    for(int i = 1;  i < u8len;  ++i) {
      int next = sc.peekc(k + static_cast<size_t>(i));
      if(!is_within(next, 0x80, 0xBF))
        return 0;

      value <<= 6;
      value |= static_cast<::std::uint32_t>(next) & 0x3F;
    }

    if((value < 0x80)  // overlong
        || (value < (1U << (u8len * 5 - 4)))  // overlong
        || is_within(static_cast<int>(value), 0xD800, 0xDFFF)  // surrogates
        || (value > 0x10FFFF))
      return 0;

    cp = static_cast<char32_t>(value);
    return static_cast<size_t>(u8len);
  }

bool
do_parse_identifier(V_identifier& value, Scanner& sc)
  {
    char32_t cp;
    size_t len = do_peek_utf8(cp, sc, 0);
    if((len == 0) || !is_identifier_leading(cp, sc.opts))
      return do_err(sc, sc.sptr, error_syntax, "expected identifier");

    size_t total = len;
    size_t nchars = 1;
    for(;;) {
      len = do_peek_utf8(cp, sc, total);
      if((len == 0) || !is_identifier_char(cp, sc.opts))
        break;

      total += len;
      nchars ++;
    }

    // The leading character plus at most 127 more.
    if(nchars > 128)
      return do_err(sc, sc.sptr, error_domain, "identifier too long");

    value = V_identifier(sc.sptr, total);
    sc.sptr += total;
    return true;
  }

bool
do_parse_name(V_qualified& segs, Scanner& sc)
  {
    V_identifier seg;
    if(!do_parse_identifier(seg, sc))
      return false;

    V_qualified temp;
    temp.emplace_back(::std::move(seg));

    // A dot that is not followed by an identifier is not part of the name.
    while(sc.peekc() == '.') {
      Scanner_Transaction tr(sc);
      sc.sptr ++;
      if(!do_parse_identifier(seg, sc))
        break;

      temp.emplace_back(::std::move(seg));
      tr.commit();
    }

    segs = ::std::move(temp);
    return true;
  }

template<typename valueT, bool (*parseT)(valueT&, Scanner&)>
bool
do_alternative(Literal_Variant& stor, Scanner& sc)
  {
    valueT value = valueT();
    if(!parseT(value, sc))
      return false;

    stor.emplace<valueT>(::std::move(value));
    return true;
  }

struct Literal_Alternative
  {
    const char* name;
    bool (*parse)(Literal_Variant&, Scanner&);
  };

// Alternatives are tried in this order. A bare quoted duration wins over a
// string with the same content.
constexpr Literal_Alternative s_literal_alternatives[] =
  {
    { "null",      do_alternative<V_null,      do_parse_null>      },
    { "duration",  do_alternative<V_duration,  do_parse_duration>  },
    { "boolean",   do_alternative<V_boolean,   do_parse_boolean>   },
    { "string",    do_alternative<V_string,    do_parse_string>    },
    { "datetime",  do_alternative<V_datetime,  do_parse_datetime>  },
    { "date",      do_alternative<V_date,      do_parse_date>      },
    { "time",      do_alternative<V_time,      do_parse_time>      },
    { "GUID",      do_alternative<V_guid,      do_parse_guid>      },
    { "float",     do_alternative<V_float,     do_parse_float>     },
    { "integer",   do_alternative<V_integer,   do_parse_integer>   },
    { "binary",    do_alternative<V_binary,    do_parse_binary>    },
  };

bool
do_parse_literal(Literal_Variant& stor, Scanner& sc)
  {
    for(const auto& alt : s_literal_alternatives) {
      sc.alt = alt.name;
      if(alt.parse(stor, sc))
        return true;

      // Failed alternatives shall not consume input.
      ROCKET_ASSERT(sc.sptr == sc.bptr);
    }
    return false;
  }

struct Unified_Sink
  {
    ::rocket::cow_string* str = nullptr;
    ::rocket::tinybuf* buf = nullptr;
    ::std::FILE* fp = nullptr;

    Unified_Sink(::rocket::cow_string* s) : str(s)  { }
    Unified_Sink(::rocket::tinybuf* b) : buf(b)  { }
    Unified_Sink(::std::FILE* f) : fp(f)  { }

    void
    putc(char c) const
      {
        if(this->str)
          this->str->push_back(c);
        else if(this->buf)
          this->buf->putc(c);
        else if(this->fp)
          ::fputc(c, this->fp);
        else
          ROCKET_UNREACHABLE();
      }

    void
    putn(const char* s, size_t n) const
      {
        if(this->str)
          this->str->append(s, n);
        else if(this->buf)
          this->buf->putn(s, n);
        else if(this->fp)
          ::fwrite(s, 1, n, this->fp);
        else
          ROCKET_UNREACHABLE();
      }
  };

// Writes at least `width` decimal digits, padded with zeroes.
void
do_put_digits(Unified_Sink usink, ::std::uint64_t value, size_t width)
  {
    char temp[24];
    size_t n = 0;
    do {
      temp[sizeof(temp) - 1 - n] = static_cast<char>('0' + value % 10);
      value /= 10;
      n ++;
    }
    while((value != 0) || (n < width));
    usink.putn(temp + sizeof(temp) - n, n);
  }

// Writes a decimal point and a fraction of nanoseconds, without trailing
// zeroes. Nothing is written for zero.
void
do_put_fraction(Unified_Sink usink, ::std::uint32_t nanosecond)
  {
    if(nanosecond == 0)
      return;

    char temp[10];
    temp[0] = '.';
    for(size_t k = 9;  k != 0;  --k) {
      temp[k] = static_cast<char>('0' + nanosecond % 10);
      nanosecond /= 10;
    }

    size_t n = 10;
    while(temp[n - 1] == '0')
      n --;
    usink.putn(temp, n);
  }

void
do_print_date(Unified_Sink usink, const V_date& date)
  {
    ::std::int64_t year = date.year;
    if(year < 0)
      usink.putc('-');
    do_put_digits(usink, static_cast<::std::uint64_t>((year < 0) ? -year : year), 4);
    usink.putc('-');
    do_put_digits(usink, date.month, 2);
    usink.putc('-');
    do_put_digits(usink, date.day, 2);
  }

void
do_print_time(Unified_Sink usink, const V_time& time)
  {
    do_put_digits(usink, time.hour, 2);
    usink.putc(':');
    do_put_digits(usink, time.minute, 2);
    usink.putc(':');
    do_put_digits(usink, time.second, 2);
    do_put_fraction(usink, time.nanosecond);
  }

void
do_print_datetime(Unified_Sink usink, const V_datetime& dt)
  {
    do_print_date(usink, dt.date);
    usink.putc('T');
    do_print_time(usink, dt.time);

    if(dt.offset_minutes == 0) {
      usink.putc('Z');
      return;
    }

    ::std::int64_t minutes = dt.offset_minutes;
    usink.putc((minutes < 0) ? '-' : '+');
    if(minutes < 0)
      minutes = -minutes;
    do_put_digits(usink, static_cast<::std::uint64_t>(minutes / 60), 2);
    usink.putc(':');
    do_put_digits(usink, static_cast<::std::uint64_t>(minutes % 60), 2);
  }

void
do_print_duration(Unified_Sink usink, V_duration dur)
  {
    ::std::int64_t count = dur.count();
    ::std::uint64_t rem = static_cast<::std::uint64_t>(count);
    if(count < 0)
      rem = 0 - rem;

    usink.putn("duration'", 9);
    if(count < 0)
      usink.putc('-');
    usink.putc('P');

    ::std::uint64_t days = rem / ns_per_day;
    rem %= ns_per_day;
    ::std::uint64_t hours = rem / ns_per_hour;
    rem %= ns_per_hour;
    ::std::uint64_t minutes = rem / ns_per_minute;
    rem %= ns_per_minute;
    ::std::uint64_t seconds = rem / ns_per_second;
    auto nanoseconds = static_cast<::std::uint32_t>(rem % ns_per_second);

    if(days != 0) {
      do_put_digits(usink, days, 1);
      usink.putc('D');
    }

    // Zero is `PT0S`.
    bool has_secs = (seconds != 0) || (nanoseconds != 0);
    if((hours != 0) || (minutes != 0) || has_secs || (days == 0)) {
      usink.putc('T');
      if(hours != 0) {
        do_put_digits(usink, hours, 1);
        usink.putc('H');
      }

      if(minutes != 0) {
        do_put_digits(usink, minutes, 1);
        usink.putc('M');
      }

      if(has_secs || ((hours == 0) && (minutes == 0))) {
        do_put_digits(usink, seconds, 1);
        do_put_fraction(usink, nanoseconds);
        usink.putc('S');
      }
    }

    usink.putc('\'');
  }

void
do_print_binary(Unified_Sink usink, const V_binary& bin, Options opts)
  {
    const auto base64_digit = [](::std::uint32_t b)
      {
        if(b < 26)
          return static_cast<char>('A' + b);
        else if(b < 52)
          return static_cast<char>('a' + b - 26);
        else if(b < 62)
          return static_cast<char>('0' + b - 52);
        else if(b < 63)
          return '-';
        else
          return '_';
      };

    usink.putn("binary'", 7);
    auto bptr = bin.data();
    const auto eptr = bptr + bin.size();

    while(eptr - bptr >= 3) {
      // 3-byte group
      char b64_word[4];
      ::std::uint32_t word;

      ::std::memcpy(&word, bptr, 4);  // use the null terminator!
      word = ROCKET_BETOH32(word);
      bptr += 3;

      for(::std::uint32_t t = 0;  t != 4;  ++t) {
        b64_word[t] = base64_digit(word >> 26);
        word <<= 6;
      }

      usink.putn(b64_word, 4);
    }

    if(bptr != eptr) {
      // 1-byte or 2-byte group
      size_t nrem = static_cast<size_t>(eptr - bptr);
      char b64_word[4] = { 0, 0, '=', '=' };
      ::std::uint32_t word = 0;

      ::std::memcpy(&word, bptr, 2);  // use the null terminator!
      word = ROCKET_BETOH32(word);
      bptr += nrem;

      for(::std::uint32_t t = 0;  t != nrem + 1;  ++t) {
        b64_word[t] = base64_digit(word >> 26);
        word <<= 6;
      }

      if(opts & option_binary_no_padding)
        usink.putn(b64_word, nrem + 1);
      else
        usink.putn(b64_word, 4);
    }

    usink.putc('\'');
  }

void
do_print_literal(Unified_Sink usink, const Literal_Variant& stor, Options opts)
  {
    ::rocket::ascii_numput nump;

    switch(static_cast<Type>(stor.index()))
      {
      case t_null:
        usink.putn("null", 4);
        break;

      case t_boolean:
        nump.put_TB(stor.as<V_boolean>());
        usink.putn(nump.data(), nump.size());
        break;

      case t_integer:
        nump.put_DI(stor.as<V_integer>());
        usink.putn(nump.data(), nump.size());
        break;

      case t_float:
        if(::std::isnan(stor.as<V_float>()))
          usink.putn("NaN", 3);
        else if(::std::isinf(stor.as<V_float>())) {
          if(stor.as<V_float>() < 0)
            usink.putn("-INF", 4);
          else
            usink.putn("INF", 3);
        }
        else {
          nump.put_DD(stor.as<V_float>());
          usink.putn(nump.data(), nump.size());

          // Don't let it look like an integer.
          if(::std::none_of(nump.data(), nump.data() + nump.size(),
                            [](char c) { return is_any(c, '.', 'e', 'E');  }))
            usink.putn(".0", 2);
        }
        break;

      case t_string:
        {
          const auto& str = stor.as<V_string>();
          usink.putc('\'');
          auto bptr = str.data();
          const auto eptr = bptr + str.size();
          while(bptr != eptr) {
            auto qptr = static_cast<const char*>(::std::memchr(bptr, '\'',
                                                    static_cast<size_t>(eptr - bptr)));
            if(!qptr) {
              usink.putn(bptr, static_cast<size_t>(eptr - bptr));
              break;
            }

            usink.putn(bptr, static_cast<size_t>(qptr - bptr));
            usink.putn("''", 2);
            bptr = qptr + 1;
          }
          usink.putc('\'');
        }
        break;

      case t_guid:
        usink.putn(stor.as<V_guid>().text, 36);
        break;

      case t_date:
        do_print_date(usink, stor.as<V_date>());
        break;

      case t_time:
        do_print_time(usink, stor.as<V_time>());
        break;

      case t_datetime:
        do_print_datetime(usink, stor.as<V_datetime>());
        break;

      case t_duration:
        do_print_duration(usink, stor.as<V_duration>());
        break;

      case t_binary:
        do_print_binary(usink, stor.as<V_binary>(), opts);
        break;

      default:
        ::rocket::sprintf_and_throw<::std::invalid_argument>(
              "odlit::Literal: unknown type enumeration `%d`",
              static_cast<int>(stor.index()));
      }
  }

void
do_print_name(Unified_Sink usink, const Name& name)
  {
    if(name.is_identifier()) {
      usink.putn(name.as_identifier().data(), name.as_identifier().size());
      return;
    }

    const auto& segs = name.as_qualified();
    for(size_t k = 0;  k != segs.size();  ++k) {
      if(k != 0)
        usink.putc('.');
      usink.putn(segs.at(k).data(), segs.at(k).size());
    }
  }

void
do_print_token(Unified_Sink usink, const Token& token, Options opts)
  {
    if(token.is_literal())
      do_print_literal(usink, token.as_literal().mf_stor(), opts);
    else
      do_print_name(usink, token.as_name());
  }

}  // namespace

bool
operator==(const Guid& lhs, const Guid& rhs) noexcept
  {
    return ::std::memcmp(lhs.text, rhs.text, 36) == 0;
  }

bool
operator==(const Literal& lhs, const Literal& rhs)
  {
    if(lhs.type() != rhs.type())
      return false;

    switch(lhs.type())
      {
      case t_null:
        return true;

      case t_boolean:
        return lhs.as_boolean() == rhs.as_boolean();

      case t_integer:
        return lhs.as_integer() == rhs.as_integer();

      case t_float:
        return lhs.as_float() == rhs.as_float();

      case t_string:
        return lhs.as_string() == rhs.as_string();

      case t_guid:
        return lhs.as_guid() == rhs.as_guid();

      case t_date:
        return lhs.as_date() == rhs.as_date();

      case t_time:
        return lhs.as_time() == rhs.as_time();

      case t_datetime:
        return lhs.as_datetime() == rhs.as_datetime();

      case t_duration:
        return lhs.as_duration() == rhs.as_duration();

      case t_binary:
        return lhs.as_binary() == rhs.as_binary();

      default:
        ROCKET_UNREACHABLE();
      }
  }

size_t
Literal::
parse_prefix_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);
    Literal_Variant stor;
    if(!do_parse_literal(stor, sc)) {
      do_finish_error(sc, 0, nullptr);
      return 0;
    }

    do_succeed(ctx, sc.consumed());
    this->m_stor.swap(stor);
    return sc.consumed();
  }

void
Literal::
parse_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);
    Literal_Variant stor;
    if(!do_parse_literal(stor, sc))
      return do_finish_error(sc, 0, nullptr);

    if(!sc.at_end())
      return do_finish_error(sc, sc.consumed(), sc.alt);

    do_succeed(ctx, sc.consumed());
    this->m_stor.swap(stor);
  }

void
Literal::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    this->parse_with(ctx, str.data(), str.size(), opts);
  }

bool
Literal::
parse(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str.data(), str.size(), opts);
    return !ctx.error;
  }

bool
Literal::
parse(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str, len, opts);
    return !ctx.error;
  }

void
Literal::
print_to(::rocket::tinybuf& buf, Options opts) const
  {
    do_print_literal(&buf, this->m_stor, opts);
  }

void
Literal::
print_to(::rocket::cow_string& str, Options opts) const
  {
    do_print_literal(&str, this->m_stor, opts);
  }

void
Literal::
print_to(::std::FILE* fp, Options opts) const
  {
    do_print_literal(fp, this->m_stor, opts);
  }

::rocket::cow_string
Literal::
to_string(Options opts) const
  {
    ::rocket::cow_string str;
    do_print_literal(&str, this->m_stor, opts);
    return str;
  }

void
Literal::
print_to_stderr(Options opts) const
  {
    do_print_literal(stderr, this->m_stor, opts);
  }

Name::
Name(const V_qualified& segs)
  {
    if(segs.empty())
      ::rocket::sprintf_and_throw<::std::invalid_argument>(
            "odlit::Name: no segments given");

    if(segs.size() == 1)
      this->m_stor.emplace<V_identifier>(segs.at(0));
    else
      this->m_stor.emplace<V_qualified>(segs);
  }

V_qualified
Name::
segments() const
  {
    if(auto pid = this->m_stor.ptr<V_identifier>()) {
      V_qualified segs;
      segs.emplace_back(*pid);
      return segs;
    }
    return this->m_stor.as<V_qualified>();
  }

bool
operator==(const Name& lhs, const Name& rhs)
  {
    if(lhs.type() != rhs.type())
      return false;

    if(lhs.is_identifier())
      return lhs.as_identifier() == rhs.as_identifier();

    const auto& lsegs = lhs.as_qualified();
    const auto& rsegs = rhs.as_qualified();
    if(lsegs.size() != rsegs.size())
      return false;

    for(size_t k = 0;  k != lsegs.size();  ++k)
      if(lsegs.at(k) != rsegs.at(k))
        return false;

    return true;
  }

size_t
Name::
parse_prefix_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);
    sc.alt = "name";
    V_qualified segs;
    if(!do_parse_name(segs, sc)) {
      do_finish_error(sc, 0, nullptr);
      return 0;
    }

    do_succeed(ctx, sc.consumed());
    Name(segs).swap(*this);
    return sc.consumed();
  }

void
Name::
parse_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);
    sc.alt = "name";
    V_qualified segs;
    if(!do_parse_name(segs, sc))
      return do_finish_error(sc, 0, nullptr);

    if(!sc.at_end())
      return do_finish_error(sc, sc.consumed(), sc.alt);

    do_succeed(ctx, sc.consumed());
    Name(segs).swap(*this);
  }

void
Name::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    this->parse_with(ctx, str.data(), str.size(), opts);
  }

bool
Name::
parse(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str.data(), str.size(), opts);
    return !ctx.error;
  }

bool
Name::
parse(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str, len, opts);
    return !ctx.error;
  }

void
Name::
print_to(::rocket::tinybuf& buf) const
  {
    do_print_name(&buf, *this);
  }

void
Name::
print_to(::rocket::cow_string& str) const
  {
    do_print_name(&str, *this);
  }

void
Name::
print_to(::std::FILE* fp) const
  {
    do_print_name(fp, *this);
  }

::rocket::cow_string
Name::
to_string() const
  {
    ::rocket::cow_string str;
    do_print_name(&str, *this);
    return str;
  }

void
Name::
print_to_stderr() const
  {
    do_print_name(stderr, *this);
  }

bool
operator==(const Token& lhs, const Token& rhs)
  {
    if(lhs.type() != rhs.type())
      return false;

    if(lhs.is_literal())
      return lhs.as_literal() == rhs.as_literal();
    else
      return lhs.as_name() == rhs.as_name();
  }

size_t
Token::
parse_prefix_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);
    Literal_Variant lit;
    size_t lit_len = 0;
    if(do_parse_literal(lit, sc))
      lit_len = sc.consumed();

    sc.sptr = sc.bptr;
    sc.alt = "name";
    V_qualified segs;
    size_t name_len = 0;
    if(do_parse_name(segs, sc))
      name_len = sc.consumed();

    if((lit_len == 0) && (name_len == 0)) {
      do_finish_error(sc, 0, nullptr);
      return 0;
    }

    if(lit_len >= name_len) {
      do_succeed(ctx, lit_len);
      this->m_stor.emplace<Literal>().mf_stor().swap(lit);
      return lit_len;
    }

    do_succeed(ctx, name_len);
    this->m_stor.emplace<Name>(segs);
    return name_len;
  }

void
Token::
parse_with(Parser_Context& ctx, const char* str, size_t len, Options opts)
  {
    do_reset(ctx);
    Scanner sc(ctx, str, len, opts);

    // Try a literal first.
    Literal_Variant lit;
    size_t matched = 0;
    const char* matched_alt = nullptr;
    if(do_parse_literal(lit, sc)) {
      if(sc.at_end()) {
        do_succeed(ctx, sc.consumed());
        this->m_stor.emplace<Literal>().mf_stor().swap(lit);
        return;
      }

      matched = sc.consumed();
      matched_alt = sc.alt;
    }

    // Try a name, such as `nullable`, which starts with a literal.
    sc.sptr = sc.bptr;
    sc.alt = "name";
    V_qualified segs;
    if(do_parse_name(segs, sc)) {
      if(sc.at_end()) {
        do_succeed(ctx, sc.consumed());
        this->m_stor.emplace<Name>(segs);
        return;
      }

      if(sc.consumed() > matched) {
        matched = sc.consumed();
        matched_alt = sc.alt;
      }
    }

    do_finish_error(sc, matched, matched_alt);
  }

void
Token::
parse_with(Parser_Context& ctx, const ::rocket::cow_string& str, Options opts)
  {
    this->parse_with(ctx, str.data(), str.size(), opts);
  }

bool
Token::
parse(const ::rocket::cow_string& str, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str.data(), str.size(), opts);
    return !ctx.error;
  }

bool
Token::
parse(const char* str, size_t len, Options opts)
  {
    Parser_Context ctx;
    this->parse_with(ctx, str, len, opts);
    return !ctx.error;
  }

void
Token::
print_to(::rocket::tinybuf& buf, Options opts) const
  {
    do_print_token(&buf, *this, opts);
  }

void
Token::
print_to(::rocket::cow_string& str, Options opts) const
  {
    do_print_token(&str, *this, opts);
  }

void
Token::
print_to(::std::FILE* fp, Options opts) const
  {
    do_print_token(fp, *this, opts);
  }

::rocket::cow_string
Token::
to_string(Options opts) const
  {
    ::rocket::cow_string str;
    do_print_token(&str, *this, opts);
    return str;
  }

void
Token::
print_to_stderr(Options opts) const
  {
    do_print_token(stderr, *this, opts);
  }

}  // namespace odlit
