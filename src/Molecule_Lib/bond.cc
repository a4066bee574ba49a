#include <cassert>

#include "Molecule_Lib/bond.h"

namespace smigraph {

int
twice_bond_order(BondType bt)
{
  switch (bt)
  {
    case BondType::kSingle:
      return 2;
    case BondType::kDouble:
      return 4;
    case BondType::kTriple:
      return 6;
    case BondType::kQuadruple:
      return 8;
    case BondType::kAromatic:
      return 3;
  }

  return 2;
}

char
bond_symbol(BondType bt)
{
  switch (bt)
  {
    case BondType::kSingle:
      return kSingleBondSymbol;
    case BondType::kDouble:
      return kDoubleBondSymbol;
    case BondType::kTriple:
      return kTripleBondSymbol;
    case BondType::kQuadruple:
      return kQuadrupleBondSymbol;
    case BondType::kAromatic:
      return kAromaticBondSymbol;
  }

  return kSingleBondSymbol;
}

const char *
bond_type_name(BondType bt)
{
  switch (bt)
  {
    case BondType::kSingle:
      return "single";
    case BondType::kDouble:
      return "double";
    case BondType::kTriple:
      return "triple";
    case BondType::kQuadruple:
      return "quadruple";
    case BondType::kAromatic:
      return "aromatic";
  }

  return "unknown";
}

BondDirection
reverse_direction(BondDirection d)
{
  if (BondDirection::kUp == d)
    return BondDirection::kDown;
  if (BondDirection::kDown == d)
    return BondDirection::kUp;

  return BondDirection::kNone;
}

Bond::Bond(atom_number_t a1, atom_number_t a2, BondType bt) : _a1(a1), _a2(a2), _btype(bt)
{
  assert(a1 >= 0 && a2 >= 0 && a1 != a2);

  _direction = BondDirection::kNone;
  _ring_closure = 0;
}

int
Bond::involves(atom_number_t a1, atom_number_t a2) const
{
  if (a1 == _a1 && a2 == _a2)
    return 1;

  if (a1 == _a2 && a2 == _a1)
    return 1;

  return 0;
}

atom_number_t
Bond::other(atom_number_t a) const
{
  if (a == _a1)
    return _a2;

  assert(a == _a2);

  return _a1;
}

int
Bond::debug_print(std::ostream & output) const
{
  output << "Bond " << *this;
  if (_ring_closure)
    output << " ring closure";
  output << '\n';

  return output.good();
}

std::ostream &
operator<<(std::ostream & output, const Bond & b)
{
  output << b._a1;
  if (BondDirection::kUp == b._direction)
    output << kDirectionalUpSymbol;
  else if (BondDirection::kDown == b._direction)
    output << kDirectionalDownSymbol;
  else
    output << bond_symbol(b._btype);
  output << b._a2;

  return output;
}

}  // namespace smigraph
