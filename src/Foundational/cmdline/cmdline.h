#ifndef IW_CMDLINE_H
#define IW_CMDLINE_H

#include <iostream>
#include <string>
#include <type_traits>
#include <vector>

#include "absl/strings/numbers.h"

class Option_and_Value
{
  friend
    std::ostream &
    operator << (std::ostream &, const Option_and_Value &);

  private:
    int _o;
    std::string _value;
    int _has_value;

  public:
    Option_and_Value (int, const char * = nullptr);

    char option () const { return _o;}
    const std::string & value () const { return _value;}
    int has_value () const { return _has_value;}

    template <typename T> int value (T &) const;

    int value (std::string &) const;
};

// Options are parsed getopt style from a string like "vqC:F:".
// Whatever is left after the options is available via operator[].
class Command_Line
{
  friend
    std::ostream &
      operator << (std::ostream &, const Command_Line &);

  private:
    std::vector<Option_and_Value> _options;
    std::vector<std::string> _args;
    int _some_options_start_with_dash;    // perhaps indicative of an error
    int _unrecognised_options_encountered;

  public:
    Command_Line (int, char **, const char *);

    int debug_print (std::ostream &) const;

    int some_options_start_with_dash () const { return _some_options_start_with_dash;}
    int unrecognised_options_encountered () const { return _unrecognised_options_encountered;}

    int number_elements () const { return _args.size();}
    bool empty () const { return _args.empty();}
    const std::string & operator[] (int i) const { return _args[i];}
    const std::string & item (int i) const { return _args[i];}

    int option_present (const char) const;
    int option_count (const char) const;

    template <typename T> int value (const char, T &, int = 0) const;

    int value (const char, std::string &, int = 0) const;

    std::string string_value (const char, int = 0) const;

    int all_values (const char, std::vector<std::string> &) const;
};

template <typename T>
int
Option_and_Value::value (T & rc) const
{
  if (! _has_value)
    return 0;

  if constexpr (std::is_floating_point_v<T>)
  {
    double tmp;
    if (! absl::SimpleAtod(_value, &tmp))
      return 0;
    rc = static_cast<T>(tmp);
    return 1;
  }
  else
    return absl::SimpleAtoi(_value, &rc);
}

template <typename T>
int
Command_Line::value (const char c, T & result, int occurrence) const
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

#endif
