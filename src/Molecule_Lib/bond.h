#ifndef MOLECULE_LIB_BOND_H_
#define MOLECULE_LIB_BOND_H_

#include <iostream>

#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

enum class BondType {
  kSingle,
  kDouble,
  kTriple,
  kQuadruple,
  kAromatic
};

// Cis-trans markers. Up is '/', Down is '\', as read going from
// a1 to a2.
enum class BondDirection {
  kNone,
  kUp,
  kDown
};

// Twice the bond order, so that aromatic bonds (1.5) stay integral.
extern int twice_bond_order(BondType bt);

// The smiles symbol for `bt`.
extern char bond_symbol(BondType bt);

extern const char * bond_type_name(BondType bt);

extern BondDirection reverse_direction(BondDirection d);

class Bond {
  friend
    std::ostream & operator<<(std::ostream &, const Bond &);

  private:
    atom_number_t _a1;
    atom_number_t _a2;

    BondType _btype;
    BondDirection _direction;

    // Set if this bond came from a ring closure digit.
    int _ring_closure;

  public:
    Bond(atom_number_t a1, atom_number_t a2, BondType bt);

    int debug_print(std::ostream &) const;

    atom_number_t a1() const { return _a1;}
    atom_number_t a2() const { return _a2;}

    BondType btype() const { return _btype;}

    int is_single_bond() const { return BondType::kSingle == _btype;}
    int is_double_bond() const { return BondType::kDouble == _btype;}
    int is_triple_bond() const { return BondType::kTriple == _btype;}
    int is_quadruple_bond() const { return BondType::kQuadruple == _btype;}
    int is_aromatic() const { return BondType::kAromatic == _btype;}

    BondDirection direction() const { return _direction;}
    void set_direction(BondDirection d) { _direction = d;}
    int is_directional() const { return BondDirection::kNone != _direction;}

    int ring_closure() const { return _ring_closure;}
    void set_ring_closure(int s) { _ring_closure = s;}

    int involves(atom_number_t a) const { return a == _a1 || a == _a2;}
    int involves(atom_number_t a1, atom_number_t a2) const;

    // The atom at the other end from `a`.
    atom_number_t other(atom_number_t a) const;
};

}  // namespace smigraph

#endif  // MOLECULE_LIB_BOND_H_
