#include <cassert>

#include "Molecule_Lib/atom.h"

namespace smigraph {

Atom::Atom(const Element * e) : _element(e)
{
  assert(nullptr != e);

  _aromatic = 0;
  _bracketed = 0;
  _formal_charge = 0;
  _implicit_hydrogens = 0;
  _atom_number = kInvalidAtomNumber;
  _column = 0;
  _length = 1;
}

int
Atom::debug_print(std::ostream & output) const
{
  output << "Atom " << _atom_number << ' ' << *this;
  if (_aromatic)
    output << " aromatic";
  if (_chirality.is_chiral())
    output << " chiral " << _chirality;
  if (_atom_class)
    output << " class " << *_atom_class;
  output << " H " << total_hydrogens();
  output << " col " << _column << '\n';

  return output.good();
}

// Writes the atom as it might appear in a smiles.

std::ostream &
operator<<(std::ostream & output, const Atom & a)
{
  if (! a.bracketed())
  {
    if (a.is_aromatic())
      output << a.element()->aromatic_symbol();
    else
      output << a.symbol();
    return output;
  }

  output << '[';
  if (a.isotope())
    output << *a.isotope();

  if (a.is_aromatic())
    output << a.element()->aromatic_symbol();
  else
    output << a.symbol();

  output << a.chirality().ToString();

  if (a.explicit_hydrogens() && *a.explicit_hydrogens() > 0)
  {
    output << 'H';
    if (*a.explicit_hydrogens() > 1)
      output << *a.explicit_hydrogens();
  }

  const formal_charge_t q = a.formal_charge();
  if (q > 0)
    output << '+';
  else if (q < 0)
    output << '-';
  if (q > 1 || q < -1)
    output << (q > 0 ? q : -q);

  if (a.atom_class())
    output << ':' << *a.atom_class();

  output << ']';

  return output;
}

}  // namespace smigraph
