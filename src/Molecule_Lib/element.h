/*
  Elements are mostly defined by their atomic numbers.
  The table is built once, on first use, and is never modified afterwards.
*/

#ifndef MOLECULE_LIB_ELEMENT_H_
#define MOLECULE_LIB_ELEMENT_H_

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

#define HIGHEST_ATOMIC_NUMBER 118

#define REASONABLE_ATOMIC_NUMBER(z) ((z) >= 0 && (z) <= HIGHEST_ATOMIC_NUMBER)

#define VALENCE_NOT_DEFINED -5

#define OUTER_SHELL_ELECTRONS_NOT_KNOWN -1

class Element {
  private:
    atomic_number_t _atomic_number;
    std::string _symbol;
    std::string _aromatic_symbol;        // save doing run-time conversions

    // Only known for the elements that have valences.
    int _outer_shell_electrons;

    // Can be written unbracketed.
    int _organic;

    // Can be written with a lowercase symbol.
    int _can_be_aromatic;

    int _normal_valence;

    // Alternate valences are stored in increasing order.
    std::vector<int> _alternate_valence;

  public:
    Element(atomic_number_t z, const char * symbol);

    int debug_print(std::ostream &) const;

    atomic_number_t atomic_number() const { return _atomic_number;}

    const std::string & symbol() const { return _symbol;}
    const std::string & aromatic_symbol() const { return _aromatic_symbol;}

    int is_wildcard() const { return 0 == _atomic_number;}

    int organic() const { return _organic;}
    void set_organic(int s) { _organic = s;}

    int can_be_aromatic() const { return _can_be_aromatic;}
    void set_can_be_aromatic(int s) { _can_be_aromatic = s;}

    int outer_shell_electrons() const { return _outer_shell_electrons;}
    void set_outer_shell_electrons(int s) { _outer_shell_electrons = s;}

    int normal_valence() const { return _normal_valence;}
    void set_normal_valence(int v) { _normal_valence = v;}

    int has_valence() const { return VALENCE_NOT_DEFINED != _normal_valence;}

    int number_alternate_valences() const { return static_cast<int>(_alternate_valence.size());}
    int alternate_valence(int i) const { return _alternate_valence[i];}
    void add_alternate_valence(int v);

    // Is `v` either the normal or one of the alternate valences.
    int is_valid_valence(int v) const;

    // The largest of the normal and alternate valences.
    int highest_valence() const;

    // The smallest valence that is >= `bond_order_sum`. Returns 0 if
    // no valence is large enough.
    int smallest_valence_at_least(int bond_order_sum, int & result) const;
};

extern std::ostream & operator<<(std::ostream &, const Element &);

/*
  Lookups are case sensitive: "Si" is silicon, "SI" is not an element.
  All return nullptr when there is no match.
*/

extern const Element * get_element_from_symbol_no_case_conversion(std::string_view s);

extern const Element * get_element_from_atomic_number(atomic_number_t z);

// Lowercase symbols, "c", "se"... Only aromatic capable elements are found.
extern const Element * get_element_from_aromatic_symbol(std::string_view s);

// The '*' atom.
extern const Element * wildcard_element();

// Elements with an upper case single letter symbol that may appear
// outside square brackets: B C N O P S F I, plus Cl and Br.
extern const Element * get_organic_subset_element(std::string_view s);

}  // namespace smigraph

#endif  // MOLECULE_LIB_ELEMENT_H_
