#include <cctype>
#include <string>

#include "Molecule_Lib/element.h"
#include "Molecule_Lib/iwmtypes.h"
#include "Molecule_Lib/smiles_lexer.h"

namespace smigraph {

// Longest run of digits we will convert to an int.
static constexpr int kMaxDigits = 9;

const char *
token_kind_name(TokenKind kind)
{
  switch (kind)
  {
    case TokenKind::kEnd:
      return "end";
    case TokenKind::kOrganicAtom:
      return "organic atom";
    case TokenKind::kBracketRequired:
      return "element requiring brackets";
    case TokenKind::kBond:
      return "bond";
    case TokenKind::kRingNumber:
      return "ring number";
    case TokenKind::kOpenBranch:
      return "open branch";
    case TokenKind::kCloseBranch:
      return "close branch";
    case TokenKind::kDot:
      return "dot";
    case TokenKind::kOpenBracket:
      return "open bracket";
    case TokenKind::kCloseBracket:
      return "close bracket";
    case TokenKind::kNumber:
      return "number";
    case TokenKind::kLetter:
      return "letter";
    case TokenKind::kWildcard:
      return "wildcard";
    case TokenKind::kChirality:
      return "chirality";
    case TokenKind::kCharge:
      return "charge";
    case TokenKind::kColon:
      return "colon";
  }

  return "unknown";
}

std::ostream &
operator<<(std::ostream & output, const Token & t)
{
  output << token_kind_name(t.kind) << " '" << t.text << "' col " << t.column;

  return output;
}

static std::string
describe_character(char c)
{
  const unsigned char u = static_cast<unsigned char>(c);

  std::string result;
  if (std::isprint(u))
  {
    result = "'";
    result += c;
    result += '\'';
    return result;
  }

  static const char hex[] = "0123456789abcdef";
  result = "byte 0x";
  result += hex[u >> 4];
  result += hex[u & 0xf];

  return result;
}

static int
unexpected_character(std::string_view smiles, int pos, ParseError & error)
{
  std::string msg("unexpected character ");
  msg += describe_character(smiles[pos]);

  return error.Set(ParseErrorKind::kLexError, pos, msg);
}

static int
is_digit(char c)
{
  return c >= '0' && c <= '9';
}

static int
is_upper(char c)
{
  return c >= 'A' && c <= 'Z';
}

static int
is_lower(char c)
{
  return c >= 'a' && c <= 'z';
}

// Consume a run of digits starting at `pos`, placing the value in
// `value` and the number of digits in `ndigits`.
// Returns 0 if the run is too long to convert.

static int
digit_run(std::string_view smiles, int pos, int & value, int & ndigits, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  value = 0;
  ndigits = 0;

  while (pos + ndigits < n && is_digit(smiles[pos + ndigits]))
  {
    ndigits++;
  }

  if (ndigits > kMaxDigits)
    return error.Set(ParseErrorKind::kLexError, pos, pos + ndigits, "number too long");

  for (int i = 0; i < ndigits; ++i)
  {
    value = value * 10 + smiles[pos + i] - '0';
  }

  return 1;
}

static void
fill_token(std::string_view smiles, int pos, int length, TokenKind kind, Token & token)
{
  token.kind = kind;
  token.column = pos;
  token.length = length;
  token.text = smiles.substr(pos, length);
  token.value = 0;
  token.chiral_tag = std::string_view();
  token.mixed_charge_form = 0;
}

// %nn, always exactly two digits.

static int
percent_ring_number(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  int ndigits = 0;
  while (ndigits < 2 && pos + 1 + ndigits < n && is_digit(smiles[pos + 1 + ndigits]))
  {
    ndigits++;
  }

  if (ndigits < 2)
    return error.Set(ParseErrorKind::kLexError, pos, pos + 1 + ndigits,
                     "incomplete percent-escaped ring number");

  fill_token(smiles, pos, 3, TokenKind::kRingNumber, token);
  token.value = (smiles[pos + 1] - '0') * 10 + (smiles[pos + 2] - '0');

  return 1;
}

// Lowercase letters that can be an atom outside brackets.

static int
is_aromatic_organic(char c)
{
  return 'b' == c || 'c' == c || 'n' == c || 'o' == c || 'p' == c || 's' == c;
}

// An uppercase letter outside brackets. Cl and Br are always read as
// two characters. Other elements must be in brackets, but we recognise
// them so the parser can say what is wrong. An organic atom followed by
// an aromatic atom, "Sc" "Cn", is two atoms.

static int
outside_bracket_uppercase(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  const char c = smiles[pos];
  const char next = (pos + 1 < n) ? smiles[pos + 1] : '\0';

  if (('C' == c && 'l' == next) || ('B' == c && 'r' == next))
  {
    fill_token(smiles, pos, 2, TokenKind::kOrganicAtom, token);
    return 1;
  }

  const int organic = (nullptr != get_organic_subset_element(smiles.substr(pos, 1)));

  if (organic && ! is_lower(next))
  {
    fill_token(smiles, pos, 1, TokenKind::kOrganicAtom, token);
    return 1;
  }

  if (organic && is_aromatic_organic(next))
  {
    fill_token(smiles, pos, 1, TokenKind::kOrganicAtom, token);
    return 1;
  }

  if (is_lower(next) && nullptr != get_element_from_symbol_no_case_conversion(smiles.substr(pos, 2)))
  {
    fill_token(smiles, pos, 2, TokenKind::kBracketRequired, token);
    return 1;
  }

  if (organic)
  {
    fill_token(smiles, pos, 1, TokenKind::kOrganicAtom, token);
    return 1;
  }

  if (nullptr != get_element_from_symbol_no_case_conversion(smiles.substr(pos, 1)))
  {
    fill_token(smiles, pos, 1, TokenKind::kBracketRequired, token);
    return 1;
  }

  return unexpected_character(smiles, pos, error);
}

static int
next_token_outside_bracket(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const char c = smiles[pos];

  switch (c)
  {
    case kOparen:
      fill_token(smiles, pos, 1, TokenKind::kOpenBranch, token);
      return 1;
    case kCparen:
      fill_token(smiles, pos, 1, TokenKind::kCloseBranch, token);
      return 1;
    case kOpenSquareBracket:
      fill_token(smiles, pos, 1, TokenKind::kOpenBracket, token);
      return 1;
    case kCloseSquareBracket:
      fill_token(smiles, pos, 1, TokenKind::kCloseBracket, token);
      return 1;
    case kDot:
      fill_token(smiles, pos, 1, TokenKind::kDot, token);
      return 1;
    case kSingleBondSymbol:
    case kDoubleBondSymbol:
    case kTripleBondSymbol:
    case kQuadrupleBondSymbol:
    case kAromaticBondSymbol:
    case kDirectionalUpSymbol:
    case kDirectionalDownSymbol:
      fill_token(smiles, pos, 1, TokenKind::kBond, token);
      token.value = c;
      return 1;
    case kPercent:
      return percent_ring_number(smiles, pos, token, error);
    case '*':
      fill_token(smiles, pos, 1, TokenKind::kOrganicAtom, token);
      return 1;
    default:
      break;
  }

  if (is_digit(c))
  {
    fill_token(smiles, pos, 1, TokenKind::kRingNumber, token);
    token.value = c - '0';
    return 1;
  }

  if (is_upper(c))
    return outside_bracket_uppercase(smiles, pos, token, error);

  if (is_lower(c))
  {
    const Element * e = get_element_from_aromatic_symbol(smiles.substr(pos, 1));
    if (nullptr != e && e->organic())
    {
      fill_token(smiles, pos, 1, TokenKind::kOrganicAtom, token);
      return 1;
    }
  }

  return unexpected_character(smiles, pos, error);
}

// '@', '@@' or '@' followed by two uppercase letters and a number.

static int
chirality_token(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  if (pos + 1 < n && '@' == smiles[pos + 1])
  {
    fill_token(smiles, pos, 2, TokenKind::kChirality, token);
    return 1;
  }

  if (pos + 3 < n && is_upper(smiles[pos + 1]) && is_upper(smiles[pos + 2]) &&
      is_digit(smiles[pos + 3]))
  {
    int value, ndigits;
    if (! digit_run(smiles, pos + 3, value, ndigits, error))
      return 0;

    fill_token(smiles, pos, 3 + ndigits, TokenKind::kChirality, token);
    token.chiral_tag = smiles.substr(pos + 1, 2);
    token.value = value;
    return 1;
  }

  fill_token(smiles, pos, 1, TokenKind::kChirality, token);

  return 1;
}

// Inside brackets a charge is either a run of the same sign, "+++",
// or a single sign followed by digits, "-2".

static int
charge_token(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  const char sign = smiles[pos];

  int nsigns = 1;
  while (pos + nsigns < n && sign == smiles[pos + nsigns])
  {
    nsigns++;
  }

  int value, ndigits;
  if (! digit_run(smiles, pos + nsigns, value, ndigits, error))
    return 0;

  fill_token(smiles, pos, nsigns + ndigits, TokenKind::kCharge, token);

  if (0 == ndigits)
    value = nsigns;
  else if (nsigns > 1)
    token.mixed_charge_form = 1;

  if ('-' == sign)
    value = -value;

  token.value = value;

  return 1;
}

static int
next_token_inside_bracket(std::string_view smiles, int pos, Token & token, ParseError & error)
{
  const char c = smiles[pos];

  if (is_digit(c))
  {
    int value, ndigits;
    if (! digit_run(smiles, pos, value, ndigits, error))
      return 0;

    fill_token(smiles, pos, ndigits, TokenKind::kNumber, token);
    token.value = value;
    return 1;
  }

  if (is_upper(c) || is_lower(c))
  {
    fill_token(smiles, pos, 1, TokenKind::kLetter, token);
    return 1;
  }

  switch (c)
  {
    case '*':
      fill_token(smiles, pos, 1, TokenKind::kWildcard, token);
      return 1;
    case '@':
      return chirality_token(smiles, pos, token, error);
    case '+':
    case '-':
      return charge_token(smiles, pos, token, error);
    case ':':
      fill_token(smiles, pos, 1, TokenKind::kColon, token);
      return 1;
    case kCloseSquareBracket:
      fill_token(smiles, pos, 1, TokenKind::kCloseBracket, token);
      return 1;
    case kOpenSquareBracket:
      fill_token(smiles, pos, 1, TokenKind::kOpenBracket, token);
      return 1;
    case kDoubleBondSymbol:
    case kTripleBondSymbol:
    case kQuadrupleBondSymbol:
    case kDirectionalUpSymbol:
    case kDirectionalDownSymbol:
    {
      std::string msg("bond symbol ");
      msg += describe_character(c);
      msg += " not allowed inside brackets";
      return error.Set(ParseErrorKind::kLexError, pos, msg);
    }
    default:
      break;
  }

  return unexpected_character(smiles, pos, error);
}

int
NextToken(std::string_view smiles, int pos, LexMode mode, Token & token, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  if (pos >= n)
  {
    fill_token(smiles, n, 0, TokenKind::kEnd, token);
    return 1;
  }

  if (LexMode::kOutsideBracket == mode)
    return next_token_outside_bracket(smiles, pos, token, error);

  return next_token_inside_bracket(smiles, pos, token, error);
}

}  // namespace smigraph
