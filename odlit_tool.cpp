// This file is part of ODLIT.
// Copyleft 2024-2025, LH_Mouse. All wrongs reserved.

#include "odlit.hpp"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
namespace {

const char*
do_kind_name(const ::odlit::Token& token)
  {
    static constexpr const char* s_literal_names[] =
      {
        "null", "boolean", "integer", "float", "string", "guid", "date", "time",
        "datetime", "duration", "binary",
      };

    if(token.is_name())
      return token.as_name().is_identifier() ? "identifier" : "qualified";

    return s_literal_names[token.as_literal().type()];
  }

// Parses one token and prints the result. Returns whether it has succeeded.
bool
do_process(const char* str, size_t len, ::odlit::Options opts)
  {
    ::odlit::Parser_Context ctx;
    ::odlit::Token token;
    token.parse_with(ctx, str, len, opts);
    if(ctx.error) {
      ::fprintf(stderr, "odlit: `%.*s`: offset %lld: %s%s%s\n",
                static_cast<int>(len), str, static_cast<long long>(ctx.offset),
                ctx.alternative ? ctx.alternative : "",
                ctx.alternative ? ": " : "", ctx.error);
      return false;
    }

    ::fprintf(stdout, "%s ", do_kind_name(token));
    token.print_to(stdout, opts);
    ::fputc('\n', stdout);
    return true;
  }

void
do_usage(const char* self)
  {
    ::fprintf(stderr,
        "Usage: %s [-k] [-a] [-u] [TOKEN ...]\n"
        "\n"
        "Parses OData literal and name tokens, and prints their types and\n"
        "canonical forms. If no token is given, tokens are read from standard\n"
        "input, one per line.\n"
        "\n"
        "  -k  require the `duration` keyword for durations\n"
        "  -a  allow only ASCII characters in identifiers\n"
        "  -u  print binary data without padding\n",
        self);
  }

}  // namespace

int
main(int argc, char** argv)
  {
    ::odlit::Options opts = ::odlit::options_default;
    int opt;
    while((opt = ::getopt(argc, argv, "kauh")) != -1)
      switch(opt)
        {
        case 'k':
          opts = opts | ::odlit::option_duration_keyword;
          break;

        case 'a':
          opts = opts | ::odlit::option_ascii_identifiers;
          break;

        case 'u':
          opts = opts | ::odlit::option_binary_no_padding;
          break;

        case 'h':
          do_usage(argv[0]);
          return 0;

        default:
          do_usage(argv[0]);
          return 2;
        }

    bool all_ok = true;
    if(optind < argc) {
      for(int k = optind;  k < argc;  ++k)
        all_ok &= do_process(argv[k], ::strlen(argv[k]), opts);
    }
    else {
      char* line = nullptr;
      size_t cap = 0;
      ::ssize_t nread;
      while((nread = ::getline(&line, &cap, stdin)) >= 0) {
        size_t len = static_cast<size_t>(nread);
        if((len != 0) && (line[len - 1] == '\n'))
          len --;
        if((len != 0) && (line[len - 1] == '\r'))
          len --;

        all_ok &= do_process(line, len, opts);
      }

      bool read_error = ::ferror(stdin);
      ::free(line);
      if(read_error) {
        ::fprintf(stderr, "odlit: error reading standard input: %s\n", ::strerror(errno));
        return 1;
      }
    }

    ::fflush(stdout);
    return all_ok ? 0 : 1;
  }
