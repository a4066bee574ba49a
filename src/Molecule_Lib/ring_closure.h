#ifndef MOLECULE_LIB_RING_CLOSURE_H_
#define MOLECULE_LIB_RING_CLOSURE_H_

#include <array>
#include <iostream>
#include <string>

#include "Molecule_Lib/bond.h"
#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

// What we know about a ring number that has been opened but not closed.
struct RingOpening {
  atom_number_t atom = kInvalidAtomNumber;

  // The bond character written before the ring number, 0 if none.
  char bond_symbol = 0;

  // Column of the ring number.
  int column = 0;

  int is_open() const { return kInvalidAtomNumber != atom;}
};

// The ring numbers open during a single parse. A ring number can
// only be open once, but can be reused once it has closed.

class RingClosureTable {
  private:
    std::array<RingOpening, kMaxRingNumber + 1> _ring;

    int _nopen;

    // Rings opened, including those since closed.
    int _rings_encountered;

  public:
    RingClosureTable();

    void clear();

    int debug_print(std::ostream &) const;

    int is_open(int ring_number) const { return _ring[ring_number].is_open();}

    int number_open() const { return _nopen;}

    int rings_encountered() const { return _rings_encountered;}

    // If `ring_number` is not open, record an opening at atom `a` and
    // return 0. Otherwise the ring number is closed, `opening` gets what
    // was recorded at the opening, and we return 1.
    int encounter(int ring_number, atom_number_t a, char bond_symbol, int column,
                  RingOpening & opening);

    // The ring number still open that was opened first. Returns 0 if
    // nothing is open.
    int first_open(int & ring_number) const;
};

// Decide the bond formed by a ring closure from the bond characters
// written at the opening and the closing, 0 for none.
// The bond goes from the opening atom to the closing atom, so a
// directional character at the closing is reversed.
// Returns 0 if the two characters conflict, with a description
// in `msg`.
extern int resolve_ring_closure_bond(char opening_symbol, char closing_symbol,
                                     int both_aromatic, BondType & bt,
                                     BondDirection & direction, std::string & msg);

// Bond type and direction for a bond character.
extern int bond_from_symbol(char c, BondType & bt, BondDirection & direction);

}  // namespace smigraph

#endif  // MOLECULE_LIB_RING_CLOSURE_H_
