#include <iostream>
#include <string>

#include "Molecule_Lib/branch_stack.h"
#include "Molecule_Lib/element.h"
#include "Molecule_Lib/ring_closure.h"
#include "Molecule_Lib/smiles_lexer.h"
#include "Molecule_Lib/smiles_parser.h"

namespace smigraph {

using std::cerr;

SmilesParser::SmilesParser()
{
  _display_error_messages = 1;
  _max_branch_depth = 0;
}

SmilesParser::SmilesParser(const SmilesParserOptions & proto) : SmilesParser()
{
  Initialise(proto);
}

int
SmilesParser::Initialise(const SmilesParserOptions & proto)
{
  if (proto.has_display_error_messages())
    _display_error_messages = proto.display_error_messages();

  if (proto.has_max_formal_charge())
    _bracket_atom_limits.max_formal_charge = proto.max_formal_charge();

  if (proto.has_max_branch_depth())
    _max_branch_depth = proto.max_branch_depth();

  if (proto.has_infer_hydrogens_on_bracket_atoms())
    _validator.set_infer_hydrogens_on_bracket_atoms(proto.infer_hydrogens_on_bracket_atoms());

  if (proto.has_compute_implicit_hydrogens())
    _validator.set_compute_implicit_hydrogens(proto.compute_implicit_hydrogens());

  return 1;
}

namespace {

// What the previous token did, decides what can come next.
enum class Previous {
  kNothing,       // start of input, or just after a '.'
  kAtom,
  kBond,
  kRingClosure,
  kOpenBranch,
  kCloseBranch
};

std::optional<Atom>
organic_atom(const Token & token)
{
  const Element * e;
  int aromatic = 0;

  if ("*" == token.text)
    e = wildcard_element();
  else if (token.text[0] >= 'a' && token.text[0] <= 'z')
  {
    e = get_element_from_aromatic_symbol(token.text);
    aromatic = 1;
  }
  else
    e = get_organic_subset_element(token.text);

  if (nullptr == e)
    return std::nullopt;

  Atom result(e);
  result.set_aromatic(aromatic);
  result.set_column(token.column);
  result.set_length(token.length);

  return result;
}

// Name a bond character in a message.
std::string
quoted(char c)
{
  std::string result("'");
  result += c;
  result += '\'';

  return result;
}

}  // namespace

int
SmilesParser::_build_from_smiles(std::string_view smiles, MoleculeGraph & m,
                                 ParseError & error) const
{
  const int n = static_cast<int>(smiles.size());

  RingClosureTable ring_closures;
  BranchStack branches;

  atom_number_t previous_atom = kInvalidAtomNumber;
  Previous previous_token_was = Previous::kNothing;

  // Bond character waiting for the next atom or ring number.
  char pending_bond = 0;
  int pending_bond_column = 0;
  // Set if the pending bond came straight after '(' or ')'.
  int pending_bond_follows_branch = 0;

  int dot_column = -1;

  int pos = 0;

  while (true)
  {
    Token token;
    if (! NextToken(smiles, pos, LexMode::kOutsideBracket, token, error))
      return 0;

    if (TokenKind::kEnd == token.kind)
      break;

    int next_position = token.end();

    switch (token.kind)
    {
      case TokenKind::kOrganicAtom:
      case TokenKind::kOpenBracket:
      {
        std::optional<Atom> a;
        if (TokenKind::kOrganicAtom == token.kind)
        {
          a = organic_atom(token);
          if (! a)
            return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(),
                             "unrecognised organic atom");
        }
        else if (! parse_bracket_atom(smiles, token.column, _bracket_atom_limits, a,
                                      next_position, error))
          return 0;

        const int aromatic = a->is_aromatic();
        const atom_number_t zatom = m.add_atom(*a);

        if (kInvalidAtomNumber != previous_atom)
        {
          BondType bt = BondType::kSingle;
          BondDirection direction = BondDirection::kNone;
          if (pending_bond)
            bond_from_symbol(pending_bond, bt, direction);
          else if (aromatic && m.atom(previous_atom).is_aromatic())
            bt = BondType::kAromatic;

          if (! m.add_bond(previous_atom, zatom, bt, direction))
            return error.Set(ParseErrorKind::kSemanticError, token.column, "cannot add bond");
        }

        previous_atom = zatom;
        previous_token_was = Previous::kAtom;
        pending_bond = 0;
        break;
      }

      case TokenKind::kBracketRequired:
      {
        std::string msg("element '");
        msg += token.text;
        msg += "' must be written in square brackets";
        return error.Set(ParseErrorKind::kSemanticError, token.column, token.end(), msg);
      }

      case TokenKind::kBond:
      {
        const char c = static_cast<char>(token.value);
        if (Previous::kNothing == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, token.column,
                           "bond " + quoted(c) + " with no preceding atom");

        if (Previous::kBond == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, pending_bond_column, token.end(),
                           "consecutive bond symbols");

        pending_bond_follows_branch = (Previous::kOpenBranch == previous_token_was ||
                                       Previous::kCloseBranch == previous_token_was);
        pending_bond = c;
        pending_bond_column = token.column;
        previous_token_was = Previous::kBond;
        break;
      }

      case TokenKind::kRingNumber:
      {
        const int ring_number = token.value;

        if (Previous::kNothing == previous_token_was ||
            Previous::kOpenBranch == previous_token_was ||
            Previous::kCloseBranch == previous_token_was ||
            (Previous::kBond == previous_token_was && pending_bond_follows_branch))
          return error.Set(ParseErrorKind::kSyntaxError, token.column, token.end(),
                           "ring number " + std::to_string(ring_number) + " with no preceding atom");

        const int bond_start = pending_bond ? pending_bond_column : token.column;

        RingOpening opening;
        if (ring_closures.encounter(ring_number, previous_atom, pending_bond, token.column, opening))
        {
          if (opening.atom == previous_atom)
            return error.Set(ParseErrorKind::kSemanticError, bond_start, token.end(),
                             "ring closure " + std::to_string(ring_number) + " bonds an atom to itself");

          if (m.are_bonded(opening.atom, previous_atom))
            return error.Set(ParseErrorKind::kSemanticError, bond_start, token.end(),
                             "ring closure " + std::to_string(ring_number) + " duplicates an existing bond");

          const int both_aromatic = m.atom(opening.atom).is_aromatic() && m.atom(previous_atom).is_aromatic();

          BondType bt;
          BondDirection direction;
          std::string msg;
          if (! resolve_ring_closure_bond(opening.bond_symbol, pending_bond, both_aromatic, bt, direction, msg))
            return error.Set(ParseErrorKind::kSemanticError, bond_start, token.end(), msg);

          if (! m.add_bond(opening.atom, previous_atom, bt, direction, 1))
            return error.Set(ParseErrorKind::kSemanticError, bond_start, token.end(), "cannot add ring closure bond");
        }

        pending_bond = 0;
        previous_token_was = Previous::kRingClosure;
        break;
      }

      case TokenKind::kOpenBranch:
        if (kInvalidAtomNumber == previous_atom)
          return error.Set(ParseErrorKind::kSyntaxError, token.column, "branch with no preceding atom");

        if (Previous::kBond == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, pending_bond_column, token.end(),
                           "bond symbol before '('");

        if (Previous::kOpenBranch == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, token.column, "branch cannot begin with '('");

        if (_max_branch_depth > 0 && branches.depth() >= _max_branch_depth)
          return error.Set(ParseErrorKind::kSyntaxError, token.column,
                           "branches nested deeper than " + std::to_string(_max_branch_depth));

        branches.push(previous_atom);
        previous_token_was = Previous::kOpenBranch;
        break;

      case TokenKind::kCloseBranch:
        if (branches.empty())
          return error.Set(ParseErrorKind::kSyntaxError, token.column, "unmatched ')'");

        if (Previous::kOpenBranch == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, token.column - 1, token.end(), "empty branch");

        if (Previous::kBond == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, pending_bond_column,
                           "bond symbol with no following atom");

        if (Previous::kNothing == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, dot_column, "'.' with no following atom");

        branches.pop(previous_atom);
        previous_token_was = Previous::kCloseBranch;
        break;

      case TokenKind::kDot:
        if (Previous::kNothing == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, token.column, "'.' with no preceding atom");

        if (Previous::kBond == previous_token_was)
          return error.Set(ParseErrorKind::kSyntaxError, pending_bond_column,
                           "bond symbol with no following atom");

        previous_atom = kInvalidAtomNumber;
        previous_token_was = Previous::kNothing;
        dot_column = token.column;
        break;

      case TokenKind::kCloseBracket:
        return error.Set(ParseErrorKind::kSyntaxError, token.column, "unmatched ']'");

      default:
        return error.Set(ParseErrorKind::kSyntaxError, token.column, token.end(), "unexpected token");
    }

    pos = next_position;
  }

  if (Previous::kBond == previous_token_was)
    return error.Set(ParseErrorKind::kSyntaxError, pending_bond_column, "bond symbol at end of input");

  if (Previous::kNothing == previous_token_was && dot_column >= 0)
    return error.Set(ParseErrorKind::kSyntaxError, dot_column, "'.' at end of input");

  if (! branches.empty())
    return error.Set(ParseErrorKind::kSyntaxError, n, "unclosed branch");

  if (int ring_number; ring_closures.first_open(ring_number))
    return error.Set(ParseErrorKind::kSemanticError, n,
                     "ring " + std::to_string(ring_number) + " never closed");

  return 1;
}

int
SmilesParser::Parse(std::string_view smiles, MoleculeGraph & m, ParseError & error) const
{
  error.clear();
  m.resize(static_cast<int>(smiles.size()));

  if (_build_from_smiles(smiles, m, error) && _validator.Process(m, error))
    return 1;

  m.resize(0);

  if (_display_error_messages)
  {
    cerr << "SmilesParser::Parse:invalid smiles, " << error << '\n';
    cerr << error.Render(smiles);
  }

  return 0;
}

std::optional<MoleculeGraph>
SmilesParser::Build(std::string_view smiles) const
{
  MoleculeGraph m;
  ParseError error;
  if (! Parse(smiles, m, error))
    return std::nullopt;

  return m;
}

int
ParseSmiles(std::string_view smiles, MoleculeGraph & m, ParseError & error)
{
  static const SmilesParser parser;

  return parser.Parse(smiles, m, error);
}

}  // namespace smigraph
