#ifndef MOLECULE_LIB_SMILES_LEXER_H_
#define MOLECULE_LIB_SMILES_LEXER_H_

#include <iostream>
#include <string_view>

#include "Molecule_Lib/parse_error.h"

namespace smigraph {

// The same character means different things inside and outside
// square brackets, '-' is a bond outside and a charge inside.
enum class LexMode {
  kOutsideBracket,
  kInsideBracket
};

enum class TokenKind {
  kEnd,

  // Outside brackets.
  kOrganicAtom,        // text is the symbol, "C", "Cl", "c", "*"
  kBracketRequired,    // a real element that is not in the organic subset
  kBond,               // value is the bond character
  kRingNumber,         // value is the ring number
  kOpenBranch,
  kCloseBranch,
  kDot,

  // Either mode.
  kOpenBracket,
  kCloseBracket,

  // Inside brackets.
  kNumber,             // value is the number
  kLetter,             // text is a single letter
  kWildcard,
  kChirality,          // "@" "@@" or "@XYn", see below
  kCharge,             // value is the signed charge
  kColon
};

extern const char * token_kind_name(TokenKind kind);

struct Token {
  TokenKind kind = TokenKind::kEnd;

  // First character of the token and the number of characters consumed.
  int column = 0;
  int length = 0;

  int value = 0;

  std::string_view text;

  // kChirality: the class tag of extended forms, empty for "@" and "@@".
  std::string_view chiral_tag;

  // kCharge: set when repeated signs are followed by digits, "++2".
  int mixed_charge_form = 0;

  int end() const { return column + length;}
};

extern std::ostream & operator<<(std::ostream &, const Token &);

// Read the token starting at `pos` in `smiles`. At the end of input
// the token is kEnd. Returns 0, with `error` filled, for a character
// that has no meaning in `mode`. Depends only on its arguments.
extern int NextToken(std::string_view smiles, int pos, LexMode mode, Token & token,
                     ParseError & error);

}  // namespace smigraph

#endif  // MOLECULE_LIB_SMILES_LEXER_H_
