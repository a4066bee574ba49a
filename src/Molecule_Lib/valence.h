#ifndef MOLECULE_LIB_VALENCE_H_
#define MOLECULE_LIB_VALENCE_H_

#include <vector>

#include "Molecule_Lib/element.h"
#include "Molecule_Lib/molecule_graph.h"
#include "Molecule_Lib/parse_error.h"

namespace smigraph {

// Final pass over a complete graph. Checks that no atom has more bonds
// than its element allows and assigns implicit hydrogens.

class Validator {
  private:
    // Bracket atoms with no H field get inferred hydrogens and are
    // valence checked. When off they are taken as written.
    int _infer_hydrogens_on_bracket_atoms;

    // When off, valences are still checked but no hydrogens are set.
    int _compute_implicit_hydrogens;

  // private functions

    int _check_and_assign(MoleculeGraph & m, atom_number_t zatom, ParseError & error) const;

  public:
    Validator();

    void set_infer_hydrogens_on_bracket_atoms(int s) { _infer_hydrogens_on_bracket_atoms = s;}
    void set_compute_implicit_hydrogens(int s) { _compute_implicit_hydrogens = s;}

    // Returns 0 on the first atom whose valence is exceeded.
    int Process(MoleculeGraph & m, ParseError & error) const;
};

// The valences allowed for `e` when it carries charge `q`. Outer shell
// electrons decide the direction, boron loses valence with positive
// charge, nitrogen gains it.
extern std::vector<int> charge_adjusted_valences(const Element & e, formal_charge_t q);

// The implicit hydrogen count for an atom given the sum of bond orders
// with aromatic bonds counted as 1, `twice_sum` the same with aromatic
// bonds counted 3/2 and doubled. `valences` in increasing order.
// Returns 0 if `bond_order_sum` exceeds every valence.
extern int implicit_hydrogens(const std::vector<int> & valences, int aromatic,
                              int bond_order_sum, int twice_sum, int & result);

}  // namespace smigraph

#endif  // MOLECULE_LIB_VALENCE_H_
