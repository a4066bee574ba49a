#include <cctype>
#include <cstdlib>
#include <string>

#include "Molecule_Lib/bracket_atom.h"
#include "Molecule_Lib/chirality.h"
#include "Molecule_Lib/element.h"
#include "Molecule_Lib/smiles_lexer.h"

namespace smigraph {

namespace {

// The fields of a bracket atom, in the order they must appear.
enum BracketField {
  kIsotopeField,
  kSymbolField,
  kChiralField,
  kHcountField,
  kChargeField,
  kClassField
};

const char *
field_name(int f)
{
  switch (f)
  {
    case kIsotopeField:
      return "isotope";
    case kSymbolField:
      return "element symbol";
    case kChiralField:
      return "chirality";
    case kHcountField:
      return "hydrogen count";
    case kChargeField:
      return "charge";
    case kClassField:
      return "atom class";
  }

  return "field";
}

struct BracketContents {
  std::optional<isotope_t> isotope;
  const Element * element = nullptr;
  int aromatic = 0;
  Chirality chirality;
  std::optional<int> hcount;
  formal_charge_t charge = 0;
  std::optional<int> atom_class;

  // The last field seen, -1 if none.
  int last_field = -1;

  // Make sure that `f` can come next. `column` and `end` are the
  // span of the text that would be `f`.
  int check_field_order(int f, int column, int end, ParseError & error);
};

int
BracketContents::check_field_order(int f, int column, int end, ParseError & error)
{
  if (f > kSymbolField && last_field < kSymbolField)
  {
    std::string msg(field_name(f));
    msg += " before element symbol";
    return error.Set(ParseErrorKind::kSyntaxError, column, end, msg);
  }

  if (f == last_field)
  {
    if (kChargeField == f)
      return error.Set(ParseErrorKind::kSemanticError, column, end, "more than one charge specified");

    std::string msg("repeated ");
    msg += field_name(f);
    return error.Set(ParseErrorKind::kSyntaxError, column, end, msg);
  }

  if (f < last_field)
  {
    std::string msg(field_name(f));
    msg += " must come before ";
    msg += field_name(last_field);
    return error.Set(ParseErrorKind::kSyntaxError, column, end, msg);
  }

  last_field = f;

  return 1;
}

int
is_lower(char c)
{
  return c >= 'a' && c <= 'z';
}

std::string
capitalise(std::string_view s)
{
  std::string result(s);
  result[0] = std::toupper(result[0]);

  return result;
}

int
element_cannot_be_aromatic(const std::string & symbol, int column, int end, ParseError & error)
{
  std::string msg("element '");
  msg += symbol;
  msg += "' cannot be aromatic";

  return error.Set(ParseErrorKind::kSemanticError, column, end, msg);
}

int
unknown_element(std::string_view symbol, int column, int end, ParseError & error)
{
  std::string msg("unknown element '");
  msg += symbol;
  msg += '\'';

  return error.Set(ParseErrorKind::kSemanticError, column, end, msg);
}

// Two letter symbols take precedence when the pair is an element, so
// [Sc] is scandium. Lowercase symbols are aromatic.

int
parse_element_symbol(std::string_view smiles, int pos, BracketContents & contents,
                     int & symbol_length, ParseError & error)
{
  const int n = static_cast<int>(smiles.size());

  const char c = smiles[pos];
  const int two_letters = (pos + 1 < n && is_lower(smiles[pos + 1]));

  if (! is_lower(c))
  {
    if (two_letters)
    {
      if (const Element * e = get_element_from_symbol_no_case_conversion(smiles.substr(pos, 2)); e != nullptr)
      {
        contents.element = e;
        symbol_length = 2;
        return 1;
      }
    }

    if (const Element * e = get_element_from_symbol_no_case_conversion(smiles.substr(pos, 1)); e != nullptr)
    {
      contents.element = e;
      symbol_length = 1;
      return 1;
    }

    const int len = two_letters ? 2 : 1;
    return unknown_element(smiles.substr(pos, len), pos, pos + len, error);
  }

  if (two_letters)
  {
    const std::string_view s = smiles.substr(pos, 2);
    if (const Element * e = get_element_from_aromatic_symbol(s); e != nullptr)
    {
      contents.element = e;
      contents.aromatic = 1;
      symbol_length = 2;
      return 1;
    }

    const std::string upper = capitalise(s);
    if (nullptr != get_element_from_symbol_no_case_conversion(upper))
      return element_cannot_be_aromatic(upper, pos, pos + 2, error);
  }

  const std::string_view s = smiles.substr(pos, 1);
  if (const Element * e = get_element_from_aromatic_symbol(s); e != nullptr)
  {
    contents.element = e;
    contents.aromatic = 1;
    symbol_length = 1;
    return 1;
  }

  const std::string upper = capitalise(s);
  if (nullptr != get_element_from_symbol_no_case_conversion(upper))
    return element_cannot_be_aromatic(upper, pos, pos + 1, error);

  return unknown_element(s, pos, pos + 1, error);
}

int
process_chirality(const Token & token, BracketContents & contents, ParseError & error)
{
  if (token.chiral_tag.empty())
  {
    if (1 == token.length)
      contents.chirality = Chirality(ChiralClass::kAnticlockwise, 0);
    else
      contents.chirality = Chirality(ChiralClass::kClockwise, 0);
    return 1;
  }

  if (build_extended_chirality(token.chiral_tag, token.value, contents.chirality))
    return 1;

  const ChiralClass c = chiral_class_from_tag(token.chiral_tag);
  if (ChiralClass::kNone == c)
  {
    std::string msg("unknown chirality class '");
    msg += token.chiral_tag;
    msg += '\'';
    return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
  }

  std::string msg("chirality index ");
  msg += std::to_string(token.value);
  msg += " out of range for @";
  msg += token.chiral_tag;
  msg += ", must be 1-";
  msg += std::to_string(max_permutation(c));

  return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
}

int
process_charge(const Token & token, const BracketAtomLimits & limits,
               BracketContents & contents, ParseError & error)
{
  if (token.mixed_charge_form)
  {
    std::string msg("charge '");
    msg += token.text;
    msg += "' combines repeated signs with a number";
    return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
  }

  if (std::abs(token.value) > limits.max_formal_charge)
  {
    std::string msg("charge ");
    msg += std::to_string(token.value);
    msg += " exceeds maximum of ";
    msg += std::to_string(limits.max_formal_charge);
    return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
  }

  contents.charge = token.value;

  return 1;
}

}  // namespace

int
parse_bracket_atom(std::string_view smiles, int open_bracket,
                   const BracketAtomLimits & limits,
                   std::optional<Atom> & atom, int & next_position,
                   ParseError & error)
{
  atom.reset();

  BracketContents contents;

  int pos = open_bracket + 1;

  while (true)
  {
    Token token;
    if (! NextToken(smiles, pos, LexMode::kInsideBracket, token, error))
      return 0;

    switch (token.kind)
    {
      case TokenKind::kEnd:
        return error.Set(ParseErrorKind::kSyntaxError, open_bracket,
                         "unclosed bracket atom, missing ']'");

      case TokenKind::kOpenBracket:
        return error.Set(ParseErrorKind::kSyntaxError, token.column, "nested '[' inside bracket atom");

      case TokenKind::kCloseBracket:
      {
        if (contents.last_field < 0)
          return error.Set(ParseErrorKind::kSyntaxError, open_bracket, token.end(), "empty bracket atom");

        if (nullptr == contents.element)
          return error.Set(ParseErrorKind::kSyntaxError, open_bracket, token.end(),
                           "bracket atom has no element symbol");

        Atom a(contents.element);
        a.set_bracketed(1);
        a.set_aromatic(contents.aromatic);
        if (contents.isotope)
          a.set_isotope(*contents.isotope);
        a.set_chirality(contents.chirality);
        if (contents.hcount)
          a.set_explicit_hydrogens(*contents.hcount);
        a.set_formal_charge(contents.charge);
        if (contents.atom_class)
          a.set_atom_class(*contents.atom_class);
        a.set_column(open_bracket);
        a.set_length(token.end() - open_bracket);

        atom = a;
        next_position = token.end();
        return 1;
      }

      case TokenKind::kNumber:
        if (! contents.check_field_order(kIsotopeField, token.column, token.end(), error))
          return 0;
        if (token.value > kMaxIsotope)
        {
          std::string msg("isotope ");
          msg += std::to_string(token.value);
          msg += " exceeds maximum of ";
          msg += std::to_string(kMaxIsotope);
          return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
        }
        contents.isotope = token.value;
        pos = token.end();
        break;

      case TokenKind::kWildcard:
        if (! contents.check_field_order(kSymbolField, token.column, token.end(), error))
          return 0;
        contents.element = wildcard_element();
        pos = token.end();
        break;

      case TokenKind::kLetter:
        if (contents.last_field < kSymbolField)
        {
          if (! contents.check_field_order(kSymbolField, token.column, token.end(), error))
            return 0;
          int symbol_length = 0;
          if (! parse_element_symbol(smiles, token.column, contents, symbol_length, error))
            return 0;
          pos = token.column + symbol_length;
        }
        else if ('H' == token.text[0])
        {
          if (! contents.check_field_order(kHcountField, token.column, token.end(), error))
            return 0;

          Token digits;
          if (! NextToken(smiles, token.end(), LexMode::kInsideBracket, digits, error))
            return 0;

          if (TokenKind::kNumber != digits.kind)
          {
            contents.hcount = 1;
            pos = token.end();
            break;
          }

          if (digits.value > kMaxHcount)
          {
            std::string msg("hydrogen count ");
            msg += std::to_string(digits.value);
            msg += " exceeds maximum of ";
            msg += std::to_string(kMaxHcount);
            return error.Set(ParseErrorKind::kSemanticError, token.column, digits.end(), msg);
          }
          contents.hcount = digits.value;
          pos = digits.end();
        }
        else
        {
          std::string msg("unexpected '");
          msg += token.text;
          msg += "' in bracket atom";
          return error.Set(ParseErrorKind::kSyntaxError, token.column, msg);
        }
        break;

      case TokenKind::kChirality:
        if (! contents.check_field_order(kChiralField, token.column, token.end(), error))
          return 0;
        if (! process_chirality(token, contents, error))
          return 0;
        pos = token.end();
        break;

      case TokenKind::kCharge:
        if (! contents.check_field_order(kChargeField, token.column, token.end(), error))
          return 0;
        if (! process_charge(token, limits, contents, error))
          return 0;
        pos = token.end();
        break;

      case TokenKind::kColon:
      {
        if (! contents.check_field_order(kClassField, token.column, token.end(), error))
          return 0;

        Token digits;
        if (! NextToken(smiles, token.end(), LexMode::kInsideBracket, digits, error))
          return 0;

        if (TokenKind::kNumber != digits.kind)
          return error.Set(ParseErrorKind::kSyntaxError, token.column, "atom class ':' must be followed by digits");

        contents.atom_class = digits.value;
        pos = digits.end();
        break;
      }

      default:
        return error.Set(ParseErrorKind::kSyntaxError, token.column, token.end(),
                         "unexpected token in bracket atom");
    }
  }
}

}  // namespace smigraph
