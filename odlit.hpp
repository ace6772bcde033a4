// This file is part of ODLIT.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#ifndef ODLIT_ODLIT_HPP_
#define ODLIT_ODLIT_HPP_

#include <rocket/cow_string.hpp>
#include <rocket/cow_vector.hpp>
#include <rocket/variant.hpp>
#include <rocket/tinyfmt.hpp>
#include <chrono>
#include <cstdio>
namespace odlit {

struct Parser_Context;
class Literal;
class Name;
class Token;

// Options for parsing and printing. These may be OR'd together.
enum Options : ::std::uint32_t
  {
    options_default           = 0,

    // A duration shall be written as `duration'...'`. By default, a bare quoted
    // duration such as `'P1D'` is accepted too, which takes precedence over a
    // string with the same content.
    option_duration_keyword   = 0b00000001,

    // Only ASCII letters, digits and underscores may occur in identifiers. By
    // default, other characters are classified by their Unicode general
    // categories, regardless of the current locale.
    option_ascii_identifiers  = 0b00000010,

    // Print binary data without trailing `=` padding.
    option_binary_no_padding  = 0b00000100,
  };

constexpr
Options
operator|(Options lhs, Options rhs) noexcept
  {
    return static_cast<Options>(static_cast<::std::uint32_t>(lhs)
                                | static_cast<::std::uint32_t>(rhs));
  }

enum Error_Kind : ::std::uint8_t
  {
    error_none            = 0,
    error_syntax          = 1,  // no alternative matches
    error_trailing_input  = 2,  // a prefix matches, but not the whole input
    error_domain          = 3,  // well-formed, but semantically invalid
  };

// This structure provides storage for parser results. It need not be
// initialized before `parse_with()` or `parse_prefix_with()`.
struct Parser_Context
  {
    // if no error, the number of bytes that have been consumed; otherwise, the
    // offset of the byte where the error was detected
    ::std::int64_t offset;

    // if no error, a null pointer; otherwise, a static string that describes
    // the expected token or the constraint that has been violated
    const char* error;

    // if no error, a null pointer; otherwise, a static string that names the
    // alternative which reported the error, such as `date` or `integer`
    const char* alternative;

    // category of the error
    Error_Kind kind;
  };

// A calendar date in the proleptic Gregorian calendar. Negative years are
// allowed, and year zero is the year before 1 AD, as in ISO 8601.
struct Date
  {
    ::std::int32_t year;
    ::std::uint8_t month;  // 1-12
    ::std::uint8_t day;  // 1-31, valid for `year` and `month`
  };

// Hour 24 is accepted regardless of the other fields.
struct Time_of_Day
  {
    ::std::uint8_t hour;  // 0-24
    ::std::uint8_t minute;  // 0-59
    ::std::uint8_t second;  // 0-59
    ::std::uint32_t nanosecond;  // 0-999999999
  };

struct Date_Time_Offset
  {
    Date date;
    Time_of_Day time;
    ::std::int32_t offset_minutes;  // east of UTC
  };

// A GUID is stored verbatim, with the letter case as written.
struct Guid
  {
    char text[37];  // 8-4-4-4-12 hexadecimal digits, null-terminated
  };

inline
bool
operator==(const Date& lhs, const Date& rhs) noexcept
  {
    return (lhs.year == rhs.year) && (lhs.month == rhs.month) && (lhs.day == rhs.day);
  }

inline
bool
operator!=(const Date& lhs, const Date& rhs) noexcept
  {
    return !(lhs == rhs);
  }

inline
bool
operator==(const Time_of_Day& lhs, const Time_of_Day& rhs) noexcept
  {
    return (lhs.hour == rhs.hour) && (lhs.minute == rhs.minute)
           && (lhs.second == rhs.second) && (lhs.nanosecond == rhs.nanosecond);
  }

inline
bool
operator!=(const Time_of_Day& lhs, const Time_of_Day& rhs) noexcept
  {
    return !(lhs == rhs);
  }

inline
bool
operator==(const Date_Time_Offset& lhs, const Date_Time_Offset& rhs) noexcept
  {
    return (lhs.date == rhs.date) && (lhs.time == rhs.time)
           && (lhs.offset_minutes == rhs.offset_minutes);
  }

inline
bool
operator!=(const Date_Time_Offset& lhs, const Date_Time_Offset& rhs) noexcept
  {
    return !(lhs == rhs);
  }

bool
operator==(const Guid& lhs, const Guid& rhs) noexcept;

inline
bool
operator!=(const Guid& lhs, const Guid& rhs) noexcept
  {
    return !(lhs == rhs);
  }

// Define aliases and enumerators for literal types.
using V_null      = ::std::nullptr_t;
using V_boolean   = bool;
using V_integer   = ::std::int64_t;
using V_float     = double;
using V_string    = ::rocket::cow_string;
using V_guid      = Guid;
using V_date      = Date;
using V_time      = Time_of_Day;
using V_datetime  = Date_Time_Offset;
using V_duration  = ::std::chrono::nanoseconds;
using V_binary    = ::rocket::cow_bstring;

// Expand a sequence of alternatives without a trailing comma.
#define ODLIT_LITERAL_TYPES_UZ4AHQUO_(U)  \
    /*  0 */  U##_null  \
    /*  1 */, U##_boolean  \
    /*  2 */, U##_integer  \
    /*  3 */, U##_float  \
    /*  4 */, U##_string  \
    /*  5 */, U##_guid  \
    /*  6 */, U##_date  \
    /*  7 */, U##_time  \
    /*  8 */, U##_datetime  \
    /*  9 */, U##_duration  \
    /* 10 */, U##_binary

// Define type enumerators such as `t_null`, `t_integer`, `t_date`, and so on.
enum Type : ::std::uint8_t {ODLIT_LITERAL_TYPES_UZ4AHQUO_(t)};
using Literal_Variant = ::rocket::variant<ODLIT_LITERAL_TYPES_UZ4AHQUO_(V)>;

// A primitive literal. Values are immutable; the only way to obtain one is to
// construct it, or to parse it from text.
class Literal
  {
  private:
    Literal_Variant m_stor;

  public:
    // Initializes a null value.
    Literal(V_null = nullptr) noexcept { }

    Literal(bool val) noexcept
      {
        this->m_stor.emplace<V_boolean>(val);
      }

    // Only conversions from signed types are provided, as in `Literal(42)`.
    Literal(int val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Literal(long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Literal(long long val) noexcept
      {
        this->m_stor.emplace<V_integer>(val);
      }

    Literal(double val) noexcept
      {
        this->m_stor.emplace<V_float>(val);
      }

    Literal(const ::rocket::cow_string& val) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    template<size_t N>
    Literal(const char (*val)[N]) noexcept
      {
        this->m_stor.emplace<V_string>(val);
      }

    Literal(const Guid& val) noexcept
      {
        this->m_stor.emplace<V_guid>(val);
      }

    Literal(const Date& val) noexcept
      {
        this->m_stor.emplace<V_date>(val);
      }

    Literal(const Time_of_Day& val) noexcept
      {
        this->m_stor.emplace<V_time>(val);
      }

    Literal(const Date_Time_Offset& val) noexcept
      {
        this->m_stor.emplace<V_datetime>(val);
      }

    Literal(::std::chrono::nanoseconds val) noexcept
      {
        this->m_stor.emplace<V_duration>(val);
      }

    Literal(const ::rocket::cow_bstring& val) noexcept
      {
        this->m_stor.emplace<V_binary>(val);
      }

    // Gets the type of the stored value.
    Type
    type() const noexcept
      { return static_cast<Type>(this->m_stor.index());  }

    // Accessors. If the stored value does not have the requested type, an
    // exception is thrown.
    bool
    is_null() const noexcept
      { return this->m_stor.index() == t_null;  }

    bool
    is_boolean() const noexcept
      { return this->m_stor.index() == t_boolean;  }

    V_boolean
    as_boolean() const
      { return this->m_stor.as<V_boolean>();  }

    bool
    is_integer() const noexcept
      { return this->m_stor.index() == t_integer;  }

    V_integer
    as_integer() const
      { return this->m_stor.as<V_integer>();  }

    // NaN is a valid value and never compares equal to anything; test it with
    // `::std::isnan()`.
    bool
    is_float() const noexcept
      { return this->m_stor.index() == t_float;  }

    V_float
    as_float() const
      { return this->m_stor.as<V_float>();  }

    bool
    is_string() const noexcept
      { return this->m_stor.index() == t_string;  }

    const V_string&
    as_string() const
      { return this->m_stor.as<V_string>();  }

    const char*
    as_string_c_str() const
      { return this->as_string().c_str();  }

    size_t
    as_string_length() const
      { return this->as_string().length();  }

    bool
    is_guid() const noexcept
      { return this->m_stor.index() == t_guid;  }

    const V_guid&
    as_guid() const
      { return this->m_stor.as<V_guid>();  }

    bool
    is_date() const noexcept
      { return this->m_stor.index() == t_date;  }

    const V_date&
    as_date() const
      { return this->m_stor.as<V_date>();  }

    bool
    is_time() const noexcept
      { return this->m_stor.index() == t_time;  }

    const V_time&
    as_time() const
      { return this->m_stor.as<V_time>();  }

    bool
    is_datetime() const noexcept
      { return this->m_stor.index() == t_datetime;  }

    const V_datetime&
    as_datetime() const
      { return this->m_stor.as<V_datetime>();  }

    bool
    is_duration() const noexcept
      { return this->m_stor.index() == t_duration;  }

    V_duration
    as_duration() const
      { return this->m_stor.as<V_duration>();  }

    bool
    is_binary() const noexcept
      { return this->m_stor.index() == t_binary;  }

    const V_binary&
    as_binary() const
      { return this->m_stor.as<V_binary>();  }

    const unsigned char*
    as_binary_data() const
      { return this->as_binary().data();  }

    size_t
    as_binary_size() const
      { return this->as_binary().size();  }

    Literal&
    swap(Literal& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

#ifdef ODLIT_DETAILS_5E0B7A31_2C94_4F1D_A86E_93D4C0F7B128_
    // These are internal functions for the implementation.
    Literal_Variant&
    mf_stor() noexcept
      { return this->m_stor;  }

    const Literal_Variant&
    mf_stor() const noexcept
      { return this->m_stor;  }
#endif

    // Parses a literal at the beginning of a buffer. Alternatives are tried in
    // this order: null, duration, boolean, string, datetime, date, time, GUID,
    // float, integer, binary; the first one that matches wins. Upon success, the
    // current object is replaced with the result, and the number of bytes that
    // have been consumed is returned; trailing characters are left alone. Upon
    // failure, zero is returned, the error is stored into `ctx`, and there is no
    // effect.
    size_t
    parse_prefix_with(Parser_Context& ctx, const char* str, size_t len,
                      Options opts = options_default);

    // Parses a buffer which shall contain exactly one literal. Errors are stored
    // into `ctx`. If the buffer cannot be parsed, there is no effect.
    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const char* str, size_t len,
               Options opts = options_default);

    bool
    parse(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse(const char* str, size_t len, Options opts = options_default);

    // Prints this literal in canonical form, which can be parsed back to an
    // equal value.
    void
    print_to(::rocket::tinybuf& buf, Options opts = options_default) const;

    void
    print_to(::rocket::cow_string& str, Options opts = options_default) const;

    void
    print_to(::std::FILE* fp, Options opts = options_default) const;

    ::rocket::cow_string
    to_string(Options opts = options_default) const;

    void
    print_to_stderr(Options opts = options_default) const;
  };

bool
operator==(const Literal& lhs, const Literal& rhs);

inline
bool
operator!=(const Literal& lhs, const Literal& rhs)
  {
    return !(lhs == rhs);
  }

inline
void
swap(Literal& lhs, Literal& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Literal& lit)
  {
    lit.print_to(fmt.mut_buf());
    return fmt;
  }

// Define aliases and enumerators for names.
using V_identifier  = ::rocket::cow_string;
using V_qualified   = ::rocket::cow_vector<::rocket::cow_string>;
using Name_Variant  = ::rocket::variant<V_identifier, V_qualified>;

enum Name_Type : ::std::uint8_t
  {
    t_identifier  = 0,
    t_qualified   = 1,
  };

// An identifier, or a dot-separated sequence of two or more identifiers.
class Name
  {
  private:
    Name_Variant m_stor;

  public:
    // Initializes an empty identifier. This is not a valid name and cannot be
    // the result of parsing.
    Name() noexcept { }

    Name(const V_identifier& val) noexcept
      {
        this->m_stor.emplace<V_identifier>(val);
      }

    template<size_t N>
    Name(const char (*val)[N]) noexcept
      {
        this->m_stor.emplace<V_identifier>(val);
      }

    // Initializes a name from a sequence of segments. A single segment yields
    // an identifier. If `segs` is empty, an exception is thrown.
    Name(const V_qualified& segs);

    Name_Type
    type() const noexcept
      { return static_cast<Name_Type>(this->m_stor.index());  }

    bool
    is_identifier() const noexcept
      { return this->m_stor.index() == t_identifier;  }

    const V_identifier&
    as_identifier() const
      { return this->m_stor.as<V_identifier>();  }

    bool
    is_qualified() const noexcept
      { return this->m_stor.index() == t_qualified;  }

    const V_qualified&
    as_qualified() const
      { return this->m_stor.as<V_qualified>();  }

    // Gets all segments in order. An identifier yields a single segment.
    V_qualified
    segments() const;

    Name&
    swap(Name& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Parses a name at the beginning of a buffer. Segments are consumed
    // greedily; a dot that is not followed by an identifier is left alone. The
    // semantics of the return value and `ctx` are the same as
    // `Literal::parse_prefix_with()`.
    size_t
    parse_prefix_with(Parser_Context& ctx, const char* str, size_t len,
                      Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const char* str, size_t len,
               Options opts = options_default);

    bool
    parse(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse(const char* str, size_t len, Options opts = options_default);

    void
    print_to(::rocket::tinybuf& buf) const;

    void
    print_to(::rocket::cow_string& str) const;

    void
    print_to(::std::FILE* fp) const;

    ::rocket::cow_string
    to_string() const;

    void
    print_to_stderr() const;
  };

bool
operator==(const Name& lhs, const Name& rhs);

inline
bool
operator!=(const Name& lhs, const Name& rhs)
  {
    return !(lhs == rhs);
  }

inline
void
swap(Name& lhs, Name& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Name& name)
  {
    name.print_to(fmt.mut_buf());
    return fmt;
  }

enum Token_Type : ::std::uint8_t
  {
    t_literal  = 0,
    t_name     = 1,
  };

// A literal or a name. This is the type of a single operand token in a query
// expression, such as `5` or `Address.City`.
class Token
  {
  private:
    ::rocket::variant<Literal, Name> m_stor;

  public:
    // Initializes a null literal.
    Token() noexcept { }

    Token(const Literal& lit) noexcept
      {
        this->m_stor.emplace<Literal>(lit);
      }

    Token(const Name& name) noexcept
      {
        this->m_stor.emplace<Name>(name);
      }

    Token_Type
    type() const noexcept
      { return static_cast<Token_Type>(this->m_stor.index());  }

    bool
    is_literal() const noexcept
      { return this->m_stor.index() == t_literal;  }

    const Literal&
    as_literal() const
      { return this->m_stor.as<Literal>();  }

    bool
    is_name() const noexcept
      { return this->m_stor.index() == t_name;  }

    const Name&
    as_name() const
      { return this->m_stor.as<Name>();  }

    Token&
    swap(Token& other) noexcept
      {
        this->m_stor.swap(other.m_stor);
        return *this;
      }

    // Parses a token at the beginning of a buffer. A literal is tried first,
    // then a name; whichever consumes more characters wins, and a literal wins
    // a tie. The semantics of the return value and `ctx` are the same as
    // `Literal::parse_prefix_with()`.
    size_t
    parse_prefix_with(Parser_Context& ctx, const char* str, size_t len,
                      Options opts = options_default);

    // Parses a buffer which shall contain exactly one token. The first of a
    // literal and a name that consumes the entire buffer wins. If neither does,
    // the error is stored into `ctx`, and there is no effect.
    void
    parse_with(Parser_Context& ctx, const ::rocket::cow_string& str,
               Options opts = options_default);

    void
    parse_with(Parser_Context& ctx, const char* str, size_t len,
               Options opts = options_default);

    bool
    parse(const ::rocket::cow_string& str, Options opts = options_default);

    bool
    parse(const char* str, size_t len, Options opts = options_default);

    void
    print_to(::rocket::tinybuf& buf, Options opts = options_default) const;

    void
    print_to(::rocket::cow_string& str, Options opts = options_default) const;

    void
    print_to(::std::FILE* fp, Options opts = options_default) const;

    ::rocket::cow_string
    to_string(Options opts = options_default) const;

    void
    print_to_stderr(Options opts = options_default) const;
  };

bool
operator==(const Token& lhs, const Token& rhs);

inline
bool
operator!=(const Token& lhs, const Token& rhs)
  {
    return !(lhs == rhs);
  }

inline
void
swap(Token& lhs, Token& rhs) noexcept
  {
    lhs.swap(rhs);
  }

inline
::rocket::tinyfmt&
operator<<(::rocket::tinyfmt& fmt, const Token& token)
  {
    token.print_to(fmt.mut_buf());
    return fmt;
  }

// Values own all their data, so copying is cheap and does not throw.
static_assert(::std::is_nothrow_copy_constructible<Literal>::value, "");
static_assert(::std::is_nothrow_move_constructible<Literal>::value, "");
static_assert(::std::is_nothrow_copy_constructible<Name>::value, "");
static_assert(::std::is_nothrow_copy_constructible<Token>::value, "");

}  // namespace odlit
#endif
