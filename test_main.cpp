// This file is part of ODLIT.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "odlit.hpp"
#include <rocket/tinyfmt_str.hpp>
#include <new>
#include <climits>
#include <clocale>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#undef NDEBUG
#include <assert.h>

::std::size_t alloc_count;

void*
operator new(::std::size_t size)
  {
    void* ptr = ::std::malloc(size);
    if(!ptr)
      ::std::abort();

    ::alloc_count ++;
    return ptr;
  }

void
operator delete(void* ptr) noexcept
  {
    if(!ptr)
      return;

    ::alloc_count --;
    ::std::free(ptr);
  }

void
operator delete(void* ptr, ::std::size_t) noexcept
  {
    operator delete(ptr);
  }

void*
operator new[](::std::size_t size)
  {
    return operator new(size);
  }

void
operator delete[](void* ptr) noexcept
  {
    operator delete(ptr);
  }

void
operator delete[](void* ptr, ::std::size_t) noexcept
  {
    operator delete(ptr);
  }

int
main(void)
  {
    ::setlocale(LC_ALL, "C.UTF-8");
    delete new int;
    ::alloc_count = 0;

    {
      ::odlit::Literal lit;
      assert(lit.type() == ::odlit::t_null);
      assert(lit.is_null());
      assert(lit.to_string() == "null");

      assert(lit.parse(&"null"));
      assert(lit.is_null());
      assert(!lit.parse(&"NULL"));
      assert(!lit.parse(&"Null"));
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"true"));
      assert(lit.is_boolean());
      assert(lit.as_boolean() == true);
      assert(lit.to_string() == "true");

      assert(lit.parse(&"FALSE"));
      assert(lit.as_boolean() == false);
      assert(lit.to_string() == "false");

      assert(lit.parse(&"True"));
      assert(lit.as_boolean() == true);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"123"));
      assert(lit.is_integer());
      assert(lit.as_integer() == 123);
      assert(lit.to_string() == "123");

      assert(lit.parse(&"+42"));
      assert(lit.as_integer() == 42);

      assert(lit.parse(&"-0"));
      assert(lit.as_integer() == 0);

      assert(lit.parse(&"007"));
      assert(lit.as_integer() == 7);

      assert(lit.parse(&"9223372036854775807"));
      assert(lit.is_integer());
      assert(lit.as_integer() == INT64_MAX);
      assert(lit.to_string() == "9223372036854775807");

      assert(lit.parse(&"-9223372036854775808"));
      assert(lit.as_integer() == INT64_MIN);
      assert(lit.to_string() == "-9223372036854775808");

      assert(lit.parse(&"00000000000000000000000000001"));
      assert(lit.as_integer() == 1);
    }

    {
      ::odlit::Parser_Context ctx;
      ::odlit::Literal lit = 42;

      lit.parse_with(ctx, &"9223372036854775808");
      assert(ctx.error);
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 0);
      assert(::std::strcmp(ctx.alternative, "integer") == 0);
      assert(::std::strcmp(ctx.error, "integer out of range") == 0);
      assert(lit.as_integer() == 42);

      lit.parse_with(ctx, &"-9223372036854775809");
      assert(ctx.kind == ::odlit::error_domain);
      assert(::std::strcmp(ctx.error, "integer out of range") == 0);

      lit.parse_with(ctx, &"123456789012345678901234567890");
      assert(ctx.kind == ::odlit::error_domain);
      assert(::std::strcmp(ctx.error, "integer out of range") == 0);
      assert(lit.as_integer() == 42);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"123.0"));
      assert(lit.is_float());
      assert(lit.as_float() == 123.0);

      assert(lit.parse(&"1e5"));
      assert(lit.is_float());
      assert(lit.as_float() == 1.0e5);

      assert(lit.parse(&"-2.5E+2"));
      assert(lit.is_float());
      assert(lit.as_float() == -250.0);

      assert(lit.parse(&"+0.5"));
      assert(lit.as_float() == 0.5);

      assert(lit.parse(&"NaN"));
      assert(lit.is_float());
      assert(::std::isnan(lit.as_float()));
      assert(lit.to_string() == "NaN");
      assert(lit != lit);

      assert(lit.parse(&"INF"));
      assert(lit.as_float() == HUGE_VAL);
      assert(lit.to_string() == "INF");

      assert(lit.parse(&"-INF"));
      assert(lit.as_float() == -HUGE_VAL);
      assert(lit.to_string() == "-INF");

      assert(!lit.parse(&"+INF"));
      assert(!lit.parse(&"inf"));
      assert(!lit.parse(&"nan"));
      assert(!lit.parse(&"1."));
      assert(!lit.parse(&".5"));
      assert(!lit.parse(&"1e"));

      // Floating-point numbers always look like floating-point numbers.
      for(double value : { 123.0, 0.0, -1.5, 0.25, 1.0e20, 0.125 }) {
        ::odlit::Literal src = value;
        auto str = src.to_string();
        assert(::std::strpbrk(str.c_str(), ".eE") != nullptr);
        assert(lit.parse(str));
        assert(lit.is_float());
        assert(lit == src);
      }
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"'g''day sir'"));
      assert(lit.is_string());
      assert(lit.as_string() == "g'day sir");
      assert(lit.to_string() == "'g''day sir'");

      assert(lit.parse(&"''"));
      assert(lit.is_string());
      assert(lit.as_string() == "");
      assert(lit.as_string_length() == 0);
      assert(lit.to_string() == "''");

      assert(lit.parse(&"''''"));
      assert(lit.as_string() == "'");

      assert(lit.parse(&"'caf\xC3\xA9 \\n'"));
      assert(lit.as_string() == "caf\xC3\xA9 \\n");

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"'abc");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 4);
      assert(::std::strcmp(ctx.alternative, "string") == 0);
      assert(::std::strcmp(ctx.error, "unterminated string") == 0);

      lit.parse_with(ctx, &"'a'b'");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 3);
      assert(::std::strcmp(ctx.alternative, "string") == 0);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"AbCdEf01-2345-6789-abcd-EF0123456789"));
      assert(lit.is_guid());
      assert(::std::strcmp(lit.as_guid().text, "AbCdEf01-2345-6789-abcd-EF0123456789") == 0);
      assert(lit.to_string() == "AbCdEf01-2345-6789-abcd-EF0123456789");

      ::odlit::Literal other;
      assert(other.parse(&"abcdef01-2345-6789-abcd-ef0123456789"));
      assert(lit != other);

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"12345678-123-1234-1234-123456789abc");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 12);
      assert(::std::strcmp(ctx.alternative, "GUID") == 0);
      assert(::std::strcmp(ctx.error, "malformed GUID grouping") == 0);

      lit.parse_with(ctx, &"12345678-1234-1234-1234-123456789abX");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 35);
      assert(::std::strcmp(ctx.alternative, "GUID") == 0);
      assert(lit.is_guid());
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"2024-02-29"));
      assert(lit.is_date());
      assert(lit.as_date().year == 2024);
      assert(lit.as_date().month == 2);
      assert(lit.as_date().day == 29);
      assert(lit.to_string() == "2024-02-29");

      assert(lit.parse(&"-0001-01-01"));
      assert(lit.is_date());
      assert(lit.as_date().year == -1);
      assert(lit.as_date().month == 1);
      assert(lit.as_date().day == 1);
      assert(lit.to_string() == "-0001-01-01");

      assert(lit.parse(&"2000-02-29"));
      assert(lit.is_date());

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"2023-02-29");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);
      assert(::std::strcmp(ctx.alternative, "date") == 0);
      assert(::std::strcmp(ctx.error, "day out of range for month") == 0);
      assert(lit.as_date().year == 2000);

      lit.parse_with(ctx, &"1900-02-29");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);

      lit.parse_with(ctx, &"2023-13-01");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 5);
      assert(::std::strcmp(ctx.error, "month out of range") == 0);

      lit.parse_with(ctx, &"2023-00-01");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 5);

      lit.parse_with(ctx, &"2023-04-31");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);

      lit.parse_with(ctx, &"2023-04-32");
      assert(ctx.kind == ::odlit::error_domain);
      assert(::std::strcmp(ctx.error, "day out of range") == 0);

      // `2023` is an integer; the rest is not a date.
      lit.parse_with(ctx, &"2023-4-01");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 4);
      assert(::std::strcmp(ctx.alternative, "integer") == 0);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"13:20"));
      assert(lit.is_time());
      assert(lit.as_time().hour == 13);
      assert(lit.as_time().minute == 20);
      assert(lit.as_time().second == 0);
      assert(lit.as_time().nanosecond == 0);
      assert(lit.to_string() == "13:20:00");

      assert(lit.parse(&"01:02:03.000000001234"));
      assert(lit.is_time());
      assert(lit.as_time().second == 3);
      assert(lit.as_time().nanosecond == 1);
      assert(lit.to_string() == "01:02:03.000000001");

      assert(lit.parse(&"01:02:03.5"));
      assert(lit.as_time().nanosecond == 500000000);
      assert(lit.to_string() == "01:02:03.5");

      assert(lit.parse(&"01:02:03.999999999999"));
      assert(lit.as_time().nanosecond == 999999999);

      assert(lit.parse(&"24:00"));
      assert(lit.as_time().hour == 24);
      assert(lit.parse(&"24:59:59"));
      assert(lit.as_time().hour == 24);

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"12:60");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 3);
      assert(::std::strcmp(ctx.alternative, "time") == 0);
      assert(::std::strcmp(ctx.error, "minute out of range") == 0);

      lit.parse_with(ctx, &"25:00");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 0);
      assert(::std::strcmp(ctx.error, "hour out of range") == 0);

      lit.parse_with(ctx, &"12:00:60");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 6);

      // Thirteen fraction digits are too many.
      lit.parse_with(ctx, &"01:02:03.0000000000001");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 21);

      // Not a time at all.
      lit.parse_with(ctx, &"99x");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 2);
      assert(::std::strcmp(ctx.alternative, "integer") == 0);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"2024-01-02T03:04:05+05:30"));
      assert(lit.is_datetime());
      assert(lit.as_datetime().date.year == 2024);
      assert(lit.as_datetime().date.month == 1);
      assert(lit.as_datetime().date.day == 2);
      assert(lit.as_datetime().time.hour == 3);
      assert(lit.as_datetime().time.minute == 4);
      assert(lit.as_datetime().time.second == 5);
      assert(lit.as_datetime().offset_minutes == 330);
      assert(lit.to_string() == "2024-01-02T03:04:05+05:30");

      assert(lit.parse(&"2024-01-02T03:04:05.25-08:00"));
      assert(lit.as_datetime().time.nanosecond == 250000000);
      assert(lit.as_datetime().offset_minutes == -480);
      assert(lit.to_string() == "2024-01-02T03:04:05.25-08:00");

      assert(lit.parse(&"2024-01-02t03:04z"));
      assert(lit.is_datetime());
      assert(lit.as_datetime().offset_minutes == 0);
      assert(lit.to_string() == "2024-01-02T03:04:00Z");

      assert(lit.parse(&"2024-01-02T03:04"));
      assert(lit.is_datetime());
      assert(lit.as_datetime().offset_minutes == 0);

      assert(lit.parse(&"2024-01-02T03:04:05+00:00"));
      assert(lit.to_string() == "2024-01-02T03:04:05Z");

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"2024-01-02T03:04:05+05:60");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 23);
      assert(::std::strcmp(ctx.alternative, "datetime") == 0);
      assert(::std::strcmp(ctx.error, "offset minute out of range") == 0);

      lit.parse_with(ctx, &"2024-01-02T03:04:05+25:00");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 20);
      assert(::std::strcmp(ctx.error, "offset hour out of range") == 0);

      lit.parse_with(ctx, &"2023-02-29T00:00Z");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);

      lit.parse_with(ctx, &"2024-01-02T03:04+0530");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 16);
      assert(::std::strcmp(ctx.alternative, "datetime") == 0);
    }

    {
      ::odlit::Literal lit;
      assert(lit.parse(&"duration'P1D'"));
      assert(lit.is_duration());
      assert(lit.as_duration() == ::std::chrono::hours(24));
      assert(lit.to_string() == "duration'P1D'");

      ::odlit::Literal bare;
      assert(bare.parse(&"'P1D'"));
      assert(bare.is_duration());
      assert(bare == lit);

      assert(lit.parse(&"DURATION'p1d'"));
      assert(lit == bare);

      assert(lit.parse(&"duration'-P1D'"));
      assert(lit.as_duration() == -::std::chrono::hours(24));
      assert(lit.to_string() == "duration'-P1D'");

      assert(lit.parse(&"duration'PT1.2S'"));
      assert(lit.as_duration() == ::std::chrono::milliseconds(1200));
      assert(lit.to_string() == "duration'PT1.2S'");

      assert(lit.parse(&"duration'P2DT3H4M5.000000006S'"));
      assert(lit.as_duration() == ::std::chrono::hours(51) + ::std::chrono::minutes(4)
                                  + ::std::chrono::seconds(5) + ::std::chrono::nanoseconds(6));
      assert(lit.to_string() == "duration'P2DT3H4M5.000000006S'");

      assert(lit.parse(&"duration'PT90M'"));
      assert(lit.as_duration() == ::std::chrono::minutes(90));
      assert(lit.to_string() == "duration'PT1H30M'");

      assert(lit.parse(&"duration'+PT0S'"));
      assert(lit.as_duration().count() == 0);
      assert(lit.to_string() == "duration'PT0S'");

      assert(lit.parse(&"duration'P'"));
      assert(lit.as_duration().count() == 0);

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"duration'P999999999999D'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 10);
      assert(::std::strcmp(ctx.alternative, "duration") == 0);
      assert(::std::strcmp(ctx.error, "duration out of range") == 0);

      assert(lit.parse(&"duration'-PT9223372036.854775808S'"));
      assert(lit.as_duration().count() == INT64_MIN);
      assert(lit.to_string() == "duration'-P106751DT23H47M16.854775808S'");

      assert(lit.parse(&"duration'PT9223372036.854775807S'"));
      assert(lit.as_duration().count() == INT64_MAX);

      lit.parse_with(ctx, &"duration'PT9223372036.854775808S'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 10);
      assert(::std::strcmp(ctx.error, "duration out of range") == 0);

      lit.parse_with(ctx, &"duration'-PT9223372036.854775809S'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 11);

      lit.parse_with(ctx, &"duration'P1H'");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 10);
      assert(::std::strcmp(ctx.alternative, "duration") == 0);
    }

    {
      // Quoted durations are strings when the keyword is required.
      ::odlit::Literal lit;
      assert(lit.parse(&"'P1D'", ::odlit::option_duration_keyword));
      assert(lit.is_string());
      assert(lit.as_string() == "P1D");

      assert(lit.parse(&"duration'P1D'", ::odlit::option_duration_keyword));
      assert(lit.is_duration());
    }

    {
      ::odlit::V_binary bytes;
      bytes.push_back(1);
      bytes.push_back(2);
      bytes.push_back(3);
      bytes.push_back(4);

      ::odlit::Literal padded;
      assert(padded.parse(&"binary'AQIDBA=='"));
      assert(padded.is_binary());
      assert(padded.as_binary() == bytes);

      ::odlit::Literal unpadded;
      assert(unpadded.parse(&"BINARY'AQIDBA'"));
      assert(unpadded.is_binary());
      assert(unpadded.as_binary() == bytes);
      assert(padded == unpadded);

      assert(padded.to_string() == "binary'AQIDBA=='");
      assert(padded.to_string(::odlit::option_binary_no_padding) == "binary'AQIDBA'");

      bytes.clear();
      bytes.push_back(0xFB);
      bytes.push_back(0xFF);
      ::odlit::Literal lit = bytes;
      assert(lit.to_string() == "binary'-_8='");
      assert(lit.to_string(::odlit::option_binary_no_padding) == "binary'-_8'");
      assert(padded.parse(&"binary'-_8'"));
      assert(padded.as_binary() == bytes);

      assert(lit.parse(&"binary''"));
      assert(lit.is_binary());
      assert(lit.as_binary_size() == 0);
      assert(lit.to_string() == "binary''");

      ::odlit::Parser_Context ctx;
      lit.parse_with(ctx, &"binary'A'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 7);
      assert(::std::strcmp(ctx.alternative, "binary") == 0);
      assert(::std::strcmp(ctx.error, "invalid base64 length") == 0);

      lit.parse_with(ctx, &"binary'AQ=D'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 9);
      assert(::std::strcmp(ctx.error, "invalid base64 padding") == 0);

      lit.parse_with(ctx, &"binary'AQ==='");
      assert(ctx.kind == ::odlit::error_domain);
      assert(::std::strcmp(ctx.error, "invalid base64 padding") == 0);

      lit.parse_with(ctx, &"binary'AQID='");
      assert(ctx.kind == ::odlit::error_domain);
      assert(::std::strcmp(ctx.error, "invalid base64 padding") == 0);

      lit.parse_with(ctx, &"binary'AB=='");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);
      assert(::std::strcmp(ctx.error, "invalid base64 trailing bits") == 0);

      lit.parse_with(ctx, &"binary'A+B/'");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);
      assert(::std::strcmp(ctx.error, "invalid base64 character") == 0);

      lit.parse_with(ctx, &"binary'AQID");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 11);
      assert(::std::strcmp(ctx.alternative, "binary") == 0);
    }

    {
      // canonical round trip
      static constexpr const char* texts[] =
        {
          "null", "true", "false", "0", "-17", "1.5", "'it''s'", "''",
          "0123abcd-ef01-2345-6789-ABCDEF012345", "1999-12-31", "-0044-03-15",
          "23:59:59.999", "2024-06-30T12:00:00-03:30", "duration'-P3DT1M'",
          "duration'PT0.000000001S'", "binary'SGVsbG8'", "binary'SGVsbG8h'",
        };

      for(const char* text : texts) {
        ::odlit::Literal first, second;
        assert(first.parse(text, ::std::strlen(text)));
        auto str = first.to_string();
        assert(second.parse(str));
        assert(first == second);
        assert(second.to_string() == str);
      }
    }

    {
      ::odlit::Parser_Context ctx;
      ::odlit::Literal lit = 1;

      lit.parse_with(ctx, &"");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 0);
      assert(::std::strcmp(ctx.error, "empty input") == 0);
      assert(ctx.alternative == nullptr);

      lit.parse_with(ctx, &"@");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 0);
      assert(::std::strcmp(ctx.error, "unrecognized token") == 0);
      assert(ctx.alternative == nullptr);

      lit.parse_with(ctx, &"123abc");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 3);
      assert(::std::strcmp(ctx.alternative, "integer") == 0);
      assert(::std::strcmp(ctx.error, "unexpected trailing characters") == 0);
      assert(lit.as_integer() == 1);

      lit.parse_with(ctx, &"-12");
      assert(ctx.error == nullptr);
      assert(ctx.kind == ::odlit::error_none);
      assert(ctx.offset == 3);
      assert(lit.as_integer() == -12);
    }

    {
      // prefix parsing
      ::odlit::Parser_Context ctx;
      ::odlit::Literal lit;
      const char text[] = "42 gt 5";
      assert(lit.parse_prefix_with(ctx, text, 7) == 2);
      assert(ctx.error == nullptr);
      assert(ctx.offset == 2);
      assert(lit.as_integer() == 42);

      const char date[] = "2024-05-06)";
      assert(lit.parse_prefix_with(ctx, date, 11) == 10);
      assert(lit.is_date());

      assert(lit.parse_prefix_with(ctx, "@@", 2) == 0);
      assert(ctx.error);
      assert(lit.is_date());
    }

    {
      ::odlit::Name name;
      assert(name.parse(&"a"));
      assert(name.is_identifier());
      assert(name.as_identifier() == "a");
      assert(name.segments().size() == 1);
      assert(name.to_string() == "a");

      assert(name.parse(&"a.b.c"));
      assert(name.is_qualified());
      assert(name.as_qualified().size() == 3);
      assert(name.as_qualified().at(0) == "a");
      assert(name.as_qualified().at(1) == "b");
      assert(name.as_qualified().at(2) == "c");
      assert(name.to_string() == "a.b.c");
      assert(name.segments().size() == 3);

      assert(name.parse(&"_x1.Y_2"));
      assert(name.is_qualified());
      assert(name.as_qualified().at(0) == "_x1");

      ::odlit::Name other;
      assert(other.parse(&"_x1.Y_2"));
      assert(name == other);
      assert(other.parse(&"_x1.Y_3"));
      assert(name != other);

      ::odlit::Parser_Context ctx;
      name.parse_with(ctx, &"a.");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 1);
      assert(::std::strcmp(ctx.alternative, "name") == 0);

      name.parse_with(ctx, &"a..b");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 1);

      name.parse_with(ctx, &"1a");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 0);

      assert(name.parse_prefix_with(ctx, "Address.City eq 'x'", 19) == 12);
      assert(name.to_string() == "Address.City");
    }

    {
      ::odlit::V_qualified segs;
      segs.emplace_back(&"only");
      ::odlit::Name name = segs;
      assert(name.is_identifier());
      assert(name.as_identifier() == "only");

      segs.clear();
      bool thrown = false;
      try {
        ::odlit::Name bad = segs;
        assert(false);
      }
      catch(::std::invalid_argument&) {
        thrown = true;
      }
      assert(thrown);
    }

    {
      // identifier length
      ::rocket::cow_string str;
      str.append(128, 'a');
      ::odlit::Name name;
      assert(name.parse(str));
      assert(name.as_identifier().size() == 128);

      str.push_back('a');
      ::odlit::Parser_Context ctx;
      name.parse_with(ctx, str);
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 0);
      assert(::std::strcmp(ctx.error, "identifier too long") == 0);

      str.assign("x.");
      str.append(129, 'b');
      name.parse_with(ctx, str);
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 2);
    }

    for(const char* locale : { "C", "C.UTF-8" }) {
      // Non-ASCII characters are classified the same way in every locale.
      ::setlocale(LC_ALL, locale);
      ::odlit::Name name;
      ::odlit::Parser_Context ctx;

      assert(name.parse(&"caf\xC3\xA9.\xC3\xA9t\xC3\xA9"));
      assert(name.is_qualified());
      assert(name.as_qualified().at(0) == "caf\xC3\xA9");
      assert(name.as_qualified().at(1) == "\xC3\xA9t\xC3\xA9");

      assert(name.parse(&"\xCE\xA9\xCE\xBC\xCE\xAD\xCE\xB3\xCE\xB1"));
      assert(name.is_identifier());

      assert(name.parse(&"\xE5\x90\x8D\xE5\xAD\x97_1"));
      assert(name.is_identifier());

      // A combining mark may follow a letter, but can't start an identifier.
      assert(name.parse(&"x\xCC\x81"));
      assert(name.as_identifier() == "x\xCC\x81");
      name.parse_with(ctx, &"\xCC\x81x");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(ctx.offset == 0);

      // A currency sign is not an identifier character.
      name.parse_with(ctx, &"a\xE2\x82\xAC");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 1);

      name.parse_with(ctx, &"caf\xC3\xA9", ::odlit::option_ascii_identifiers);
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 3);
    }
    ::setlocale(LC_ALL, "C.UTF-8");

    {
      // Ill-formed UTF-8 never makes an identifier.
      ::odlit::Parser_Context ctx;
      ::odlit::Name name;
      name.parse_with(ctx, &"a\xC3");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 1);

      name.parse_with(ctx, &"a\xC0\x80");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 1);
    }

    {
      ::odlit::Token tok;
      assert(tok.is_literal());
      assert(tok.as_literal().is_null());

      assert(tok.parse(&"5"));
      assert(tok.is_literal());
      assert(tok.as_literal().as_integer() == 5);

      assert(tok.parse(&"Age"));
      assert(tok.is_name());
      assert(tok.as_name().as_identifier() == "Age");

      assert(tok.parse(&"nullable"));
      assert(tok.is_name());
      assert(tok.as_name().as_identifier() == "nullable");

      assert(tok.parse(&"INFO"));
      assert(tok.is_name());

      assert(tok.parse(&"true1"));
      assert(tok.is_name());

      assert(tok.parse(&"true"));
      assert(tok.is_literal());
      assert(tok.as_literal().as_boolean() == true);

      assert(tok.parse(&"INF"));
      assert(tok.is_literal());
      assert(tok.as_literal().is_float());

      assert(tok.parse(&"beef"));
      assert(tok.is_name());

      assert(tok.parse(&"Address.City"));
      assert(tok.is_name());
      assert(tok.as_name().is_qualified());
      assert(tok.to_string() == "Address.City");

      assert(tok.parse(&"binary'AQID'"));
      assert(tok.is_literal());
      assert(tok.as_literal().is_binary());
      assert(tok.to_string() == "binary'AQID'");

      ::odlit::Token other = ::odlit::Literal(&"Age");
      assert(other.is_literal());
      assert(other.to_string() == "'Age'");
      assert(other != ::odlit::Token(::odlit::Name(&"Age")));

      ::odlit::Parser_Context ctx;
      tok.parse_with(ctx, &"2023-02-29");
      assert(ctx.kind == ::odlit::error_domain);
      assert(ctx.offset == 8);
      assert(::std::strcmp(ctx.alternative, "date") == 0);

      tok.parse_with(ctx, &"a.b c");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 3);
      assert(::std::strcmp(ctx.alternative, "name") == 0);

      tok.parse_with(ctx, &"12 ");
      assert(ctx.kind == ::odlit::error_trailing_input);
      assert(ctx.offset == 2);
      assert(::std::strcmp(ctx.alternative, "integer") == 0);

      tok.parse_with(ctx, &"#");
      assert(ctx.kind == ::odlit::error_syntax);
      assert(::std::strcmp(ctx.error, "unrecognized token") == 0);

      // A name that is longer than a literal prefix wins.
      assert(tok.parse_prefix_with(ctx, "nullable eq null", 16) == 8);
      assert(tok.is_name());
      assert(tok.parse_prefix_with(ctx, "null eq x", 9) == 4);
      assert(tok.is_literal());
      assert(tok.as_literal().is_null());
    }

    {
      ::rocket::tinyfmt_str fmt;
      ::odlit::Token tok;
      assert(tok.parse(&"'x''y'"));
      fmt << tok;
      assert(fmt.get_string() == "'x''y'");

      ::odlit::Literal lit = ::odlit::V_duration(-1500000000);
      fmt << ' ' << lit;
      assert(fmt.get_string() == "'x''y' duration'-PT1.5S'");
    }

    // leak check
    assert(::alloc_count == 0);
  }
