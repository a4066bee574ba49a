#ifndef MOLECULE_LIB_ATOM_H_
#define MOLECULE_LIB_ATOM_H_

#include <iostream>
#include <optional>
#include <string>

#include "Molecule_Lib/chirality.h"
#include "Molecule_Lib/element.h"
#include "Molecule_Lib/iwmtypes.h"

namespace smigraph {

// An atom as written in a smiles. Atoms written outside square brackets
// only ever have an element and an aromatic flag, everything else is
// only available inside brackets.

class Atom {
  private:
    const Element * _element;

    int _aromatic;

    // Inside brackets only.
    int _bracketed;
    std::optional<isotope_t> _isotope;
    Chirality _chirality;
    std::optional<int> _explicit_hydrogens;
    formal_charge_t _formal_charge;
    std::optional<int> _atom_class;

    // Set by the valence pass once the graph is complete.
    int _implicit_hydrogens;

    // Index within the graph.
    atom_number_t _atom_number;

    // Column of the first character of this atom in the input, and
    // the number of characters it occupies, brackets included.
    int _column;
    int _length;

  public:
    explicit Atom(const Element * e);

    int debug_print(std::ostream &) const;

    const Element * element() const { return _element;}
    atomic_number_t atomic_number() const { return _element->atomic_number();}
    const std::string & symbol() const { return _element->symbol();}

    int is_wildcard() const { return _element->is_wildcard();}

    int is_aromatic() const { return _aromatic;}
    void set_aromatic(int s) { _aromatic = s;}

    int bracketed() const { return _bracketed;}
    void set_bracketed(int s) { _bracketed = s;}

    const std::optional<isotope_t> & isotope() const { return _isotope;}
    void set_isotope(isotope_t iso) { _isotope = iso;}

    const Chirality & chirality() const { return _chirality;}
    void set_chirality(const Chirality & c) { _chirality = c;}

    // The hydrogen count written inside the brackets, if any.
    const std::optional<int> & explicit_hydrogens() const { return _explicit_hydrogens;}
    void set_explicit_hydrogens(int h) { _explicit_hydrogens = h;}

    formal_charge_t formal_charge() const { return _formal_charge;}
    void set_formal_charge(formal_charge_t q) { _formal_charge = q;}

    const std::optional<int> & atom_class() const { return _atom_class;}
    void set_atom_class(int c) { _atom_class = c;}

    int implicit_hydrogens() const { return _implicit_hydrogens;}
    void set_implicit_hydrogens(int h) { _implicit_hydrogens = h;}

    // Explicit if written, otherwise whatever was inferred.
    int total_hydrogens() const {
      if (_explicit_hydrogens)
        return *_explicit_hydrogens;
      return _implicit_hydrogens;
    }

    atom_number_t atom_number() const { return _atom_number;}
    void set_atom_number(atom_number_t a) { _atom_number = a;}

    int column() const { return _column;}
    void set_column(int c) { _column = c;}

    int length() const { return _length;}
    void set_length(int s) { _length = s;}
};

extern std::ostream & operator<<(std::ostream &, const Atom &);

}  // namespace smigraph

#endif  // MOLECULE_LIB_ATOM_H_
