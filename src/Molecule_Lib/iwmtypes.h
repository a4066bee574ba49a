#ifndef MOLECULE_LIB_IWMTYPES_H_
#define MOLECULE_LIB_IWMTYPES_H_

/*
  Various typedef's and such used for molecular graphs.
*/

namespace smigraph {

typedef int atomic_number_t;     // proton count, 0 for the wildcard

typedef int formal_charge_t;

typedef int isotope_t;

typedef int atom_number_t;     // number of each atom within a graph, starts at 0

// Value for atom numbers which are invalid.

constexpr atom_number_t kInvalidAtomNumber = -1;

// Characters with fixed meaning in smiles.

constexpr char kSingleBondSymbol = '-';
constexpr char kDoubleBondSymbol = '=';
constexpr char kTripleBondSymbol = '#';
constexpr char kQuadrupleBondSymbol = '$';
constexpr char kAromaticBondSymbol = ':';
constexpr char kDirectionalUpSymbol = '/';
constexpr char kDirectionalDownSymbol = '\\';

constexpr char kOparen = '(';
constexpr char kCparen = ')';
constexpr char kOpenSquareBracket = '[';
constexpr char kCloseSquareBracket = ']';
constexpr char kDot = '.';
constexpr char kPercent = '%';

// Ring closure numbers are 0-99.
constexpr int kMaxRingNumber = 99;

}  // namespace smigraph

#endif  // MOLECULE_LIB_IWMTYPES_H_
