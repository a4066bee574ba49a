#include <cassert>

#include "Molecule_Lib/ring_closure.h"

namespace smigraph {

RingClosureTable::RingClosureTable()
{
  _nopen = 0;
  _rings_encountered = 0;
}

void
RingClosureTable::clear()
{
  _ring.fill(RingOpening());

  _nopen = 0;
  _rings_encountered = 0;
}

int
RingClosureTable::debug_print(std::ostream & output) const
{
  output << "RingClosureTable " << _nopen << " open, " << _rings_encountered << " encountered\n";
  for (int i = 0; i <= kMaxRingNumber; ++i)
  {
    if (! _ring[i].is_open())
      continue;

    output << " ring " << i << " atom " << _ring[i].atom;
    if (_ring[i].bond_symbol)
      output << " bond '" << _ring[i].bond_symbol << '\'';
    output << " col " << _ring[i].column << '\n';
  }

  return output.good();
}

int
RingClosureTable::encounter(int ring_number, atom_number_t a, char bond_symbol, int column,
                            RingOpening & opening)
{
  assert(ring_number >= 0 && ring_number <= kMaxRingNumber);

  RingOpening & r = _ring[ring_number];

  if (r.is_open())
  {
    opening = r;
    r = RingOpening();
    _nopen--;
    return 1;
  }

  r.atom = a;
  r.bond_symbol = bond_symbol;
  r.column = column;

  _nopen++;
  _rings_encountered++;

  return 0;
}

int
RingClosureTable::first_open(int & ring_number) const
{
  ring_number = -1;

  for (int i = 0; i <= kMaxRingNumber; ++i)
  {
    if (! _ring[i].is_open())
      continue;

    if (ring_number < 0 || _ring[i].column < _ring[ring_number].column)
      ring_number = i;
  }

  return ring_number >= 0;
}

int
bond_from_symbol(char c, BondType & bt, BondDirection & direction)
{
  direction = BondDirection::kNone;

  switch (c)
  {
    case kSingleBondSymbol:
      bt = BondType::kSingle;
      return 1;
    case kDoubleBondSymbol:
      bt = BondType::kDouble;
      return 1;
    case kTripleBondSymbol:
      bt = BondType::kTriple;
      return 1;
    case kQuadrupleBondSymbol:
      bt = BondType::kQuadruple;
      return 1;
    case kAromaticBondSymbol:
      bt = BondType::kAromatic;
      return 1;
    case kDirectionalUpSymbol:
      bt = BondType::kSingle;
      direction = BondDirection::kUp;
      return 1;
    case kDirectionalDownSymbol:
      bt = BondType::kSingle;
      direction = BondDirection::kDown;
      return 1;
  }

  return 0;
}

int
resolve_ring_closure_bond(char opening_symbol, char closing_symbol,
                          int both_aromatic, BondType & bt,
                          BondDirection & direction, std::string & msg)
{
  if (0 == opening_symbol && 0 == closing_symbol)
  {
    bt = both_aromatic ? BondType::kAromatic : BondType::kSingle;
    direction = BondDirection::kNone;
    return 1;
  }

  BondType open_bt = BondType::kSingle;
  BondDirection open_dir = BondDirection::kNone;
  if (opening_symbol)
    bond_from_symbol(opening_symbol, open_bt, open_dir);

  BondType close_bt = BondType::kSingle;
  BondDirection close_dir = BondDirection::kNone;
  if (closing_symbol)
  {
    bond_from_symbol(closing_symbol, close_bt, close_dir);
    close_dir = reverse_direction(close_dir);
  }

  if (0 == closing_symbol)
  {
    bt = open_bt;
    direction = open_dir;
    return 1;
  }

  if (0 == opening_symbol)
  {
    bt = close_bt;
    direction = close_dir;
    return 1;
  }

  if (open_bt != close_bt)
  {
    msg = "ring closure bond mismatch: ";
    msg += bond_type_name(open_bt);
    msg += " vs ";
    msg += bond_type_name(close_bt);
    return 0;
  }

  if (BondDirection::kNone != open_dir && BondDirection::kNone != close_dir &&
      open_dir != close_dir)
  {
    msg = "ring closure bond has conflicting directions '";
    msg += opening_symbol;
    msg += "' and '";
    msg += closing_symbol;
    msg += '\'';
    return 0;
  }

  bt = open_bt;
  direction = (BondDirection::kNone != open_dir) ? open_dir : close_dir;

  return 1;
}

}  // namespace smigraph
