#ifndef MOLECULE_LIB_BRACKET_ATOM_H_
#define MOLECULE_LIB_BRACKET_ATOM_H_

#include <optional>
#include <string_view>

#include "Molecule_Lib/atom.h"
#include "Molecule_Lib/parse_error.h"

namespace smigraph {

// Largest isotope and hydrogen count accepted inside brackets.
constexpr int kMaxIsotope = 999;
constexpr int kMaxHcount = 9;

// Limits that can be changed by the caller.
struct BracketAtomLimits {
  int max_formal_charge = 15;
};

// Parse [isotope? symbol chiral? hcount? charge? class?] where
// `open_bracket` is the position of the '['. On success `atom` holds
// the atom and `next_position` is just past the ']'.
extern int parse_bracket_atom(std::string_view smiles, int open_bracket,
                              const BracketAtomLimits & limits,
                              std::optional<Atom> & atom, int & next_position,
                              ParseError & error);

}  // namespace smigraph

#endif  // MOLECULE_LIB_BRACKET_ATOM_H_
