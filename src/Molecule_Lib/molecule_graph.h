#ifndef MOLECULE_LIB_MOLECULE_GRAPH_H_
#define MOLECULE_LIB_MOLECULE_GRAPH_H_

#include <iostream>
#include <vector>

#include "Molecule_Lib/atom.h"
#include "Molecule_Lib/bond.h"
#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

// Atoms and bonds as read from a smiles. Append only: atoms get
// sequential numbers starting at 0, nothing is ever removed.
// The graph owns all its atoms and bonds.

class MoleculeGraph {
  private:
    std::vector<Atom> _atoms;
    std::vector<Bond> _bonds;

    // For each atom, indices into _bonds.
    std::vector<std::vector<int>> _bonds_on_atom;

  public:
    MoleculeGraph();

    int debug_print(std::ostream &) const;

    int natoms() const { return static_cast<int>(_atoms.size());}
    int nedges() const { return static_cast<int>(_bonds.size());}

    int empty() const { return _atoms.empty();}

    void resize(int n);

    const Atom & atom(atom_number_t a) const { return _atoms[a];}
    const Atom & operator[](atom_number_t a) const { return _atoms[a];}
    const Bond & bondi(int b) const { return _bonds[b];}

    const std::vector<Atom> & atoms() const { return _atoms;}
    const std::vector<Bond> & bonds() const { return _bonds;}

    // Appends `a`, returning its atom number.
    atom_number_t add_atom(const Atom & a);

    // Returns 0 if the bond cannot be added: atoms out of range, the
    // same atom, or the atoms already bonded.
    int add_bond(atom_number_t a1, atom_number_t a2, BondType bt,
                 BondDirection direction = BondDirection::kNone,
                 int ring_closure = 0);

    // Nullptr if `a1` and `a2` are not bonded.
    const Bond * bond_between(atom_number_t a1, atom_number_t a2) const;

    int are_bonded(atom_number_t a1, atom_number_t a2) const {
      return nullptr != bond_between(a1, a2);
    }

    // Number of connections to `a`.
    int ncon(atom_number_t a) const { return static_cast<int>(_bonds_on_atom[a].size());}

    const std::vector<int> & bonds_on_atom(atom_number_t a) const { return _bonds_on_atom[a];}

    std::vector<atom_number_t> connections(atom_number_t a) const;

    // Sum of bond orders at `a`, doubled, aromatic bonds contributing 3.
    int twice_bond_order_sum(atom_number_t a) const;

    // Sum of bond orders at `a` with aromatic bonds counted as single.
    int integer_bond_order_sum(atom_number_t a) const;

    int aromatic_bond_count(atom_number_t a) const;

    // The valence pass is the only thing that changes an atom once added.
    void set_implicit_hydrogens(atom_number_t a, int h) {
      _atoms[a].set_implicit_hydrogens(h);
    }

    // Number of connected components.
    int number_fragments() const;

    // For each atom, the fragment it is in. Fragments are numbered in
    // order of their lowest atom number. Returns the number of fragments.
    int fragment_membership(std::vector<int> & fragment) const;

    int ring_closure_bond_count() const;

    int implicit_hydrogen_count() const;
};

}  // namespace smigraph

#endif  // MOLECULE_LIB_MOLECULE_GRAPH_H_
