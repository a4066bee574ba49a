#include <unistd.h>

#include <iostream>

#include "Foundational/cmdline/cmdline.h"

using std::cerr;

Option_and_Value::Option_and_Value (int o, const char * val) : _o(o)
{
  if (nullptr == val)
    _has_value = 0;
  else
  {
    _value = val;
    _has_value = 1;
  }

  return;
}

int
Option_and_Value::value (std::string & result) const
{
  if (! _has_value)
    return 0;

  result = _value;

  return 1;
}

std::ostream &
operator << (std::ostream & os, const Option_and_Value & ov)
{
  return os << "Option '" << ov.option() << "', value '" << ov.value() << "'";
}

Command_Line::Command_Line (int argc, char ** argv, const char * options)
{
  optarg = nullptr;
  optind = 1;   // reinitialise in case of multiple invocations
  opterr = 0;     // suppress error messages

  _some_options_start_with_dash = 0;
  _unrecognised_options_encountered = 0;

  int o;

  while ((o = getopt(argc, argv, options)) != -1)
  {
    if ('?' == o)
    {
      cerr << "Command_Line: unrecognised option '" << argv[optind - 1] << "'\n";
      _unrecognised_options_encountered++;
    }
    else
      _options.emplace_back(o, optarg);
  }

  _args.reserve(argc - optind);

  for (int i = optind; i < argc; i++)
  {
    if ('-' == argv[i][0] && '\0' != argv[i][1])
      _some_options_start_with_dash++;
    _args.emplace_back(argv[i]);
  }

  return;
}

int
Command_Line::debug_print (std::ostream & os) const
{
  os << "Command line object contains " << _options.size() << " options and " <<
        _args.size() << " values\n";

  for (const Option_and_Value & oo : _options)
    os << oo << '\n';

  for (const std::string & s : _args)
    os << "Value '" << s << "'\n";

  return 1;
}

int
Command_Line::option_present (const char c) const
{
  for (size_t i = 0; i < _options.size(); i++)
  {
    if (c == _options[i].option())
      return i + 1;
  }

  return 0;
}

int
Command_Line::option_count (const char c) const
{
  int rc = 0;

  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option())
      rc++;
  }

  return rc;
}

int
Command_Line::all_values (const char c, std::vector<std::string> & values) const
{
  int rc = 0;

  for (const Option_and_Value & oo : _options)
  {
    if (c == oo.option())
    {
      values.push_back(oo.value());
      rc++;
    }
  }

  return rc;
}

int
Command_Line::value (const char c, std::string & result, int occurrence) const
{
  int nfound = 0;
  for (const Option_and_Value & oo : _options)
  {
    if (c != oo.option())
      continue;

    if (nfound == occurrence)
      return oo.value(result);

    nfound++;
  }

  return 0;
}

std::string
Command_Line::string_value (const char c, int occurrence) const
{
  std::string result;
  value(c, result, occurrence);

  return result;
}

std::ostream &
operator << (std::ostream & os, const Command_Line & cl)
{
  cl.debug_print(os);

  return os;
}
