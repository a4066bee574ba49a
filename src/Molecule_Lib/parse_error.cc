#include <sstream>

#include "Molecule_Lib/parse_error.h"

namespace smigraph {

const char *
parse_error_kind_name(ParseErrorKind kind)
{
  switch (kind)
  {
    case ParseErrorKind::kNone:
      return "NoError";
    case ParseErrorKind::kLexError:
      return "LexError";
    case ParseErrorKind::kSyntaxError:
      return "SyntaxError";
    case ParseErrorKind::kSemanticError:
      return "SemanticError";
  }

  return "Unknown";
}

ParseError::ParseError()
{
  _kind = ParseErrorKind::kNone;
  _column = 0;
  _end = 0;
}

void
ParseError::clear()
{
  _kind = ParseErrorKind::kNone;
  _column = 0;
  _end = 0;
  _message.clear();
}

int
ParseError::Set(ParseErrorKind kind, int column, int end, std::string_view message)
{
  _kind = kind;
  _column = column;
  if (end <= column)
    _end = column + 1;
  else
    _end = end;
  _message = message;

  return 0;
}

std::string
ParseError::Render(std::string_view smiles) const
{
  std::ostringstream output;

  output << smiles << '\n';

  for (int i = 0; i < _column; ++i)
  {
    output << ' ';
  }

  for (int i = _column; i < _end; ++i)
  {
    output << '^';
  }

  output << '\n' << parse_error_kind_name(_kind) << ": " << _message << '\n';

  return output.str();
}

std::ostream &
operator<<(std::ostream & output, const ParseError & e)
{
  output << parse_error_kind_name(e.kind()) << " at column " << e.column() << ": " << e.message();

  return output;
}

}  // namespace smigraph
