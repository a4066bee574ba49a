#include <cassert>

#include "Molecule_Lib/molecule_graph.h"

namespace smigraph {

MoleculeGraph::MoleculeGraph()
{
}

// Pre-allocate for about `n` atoms.

void
MoleculeGraph::resize(int n)
{
  _atoms.clear();
  _bonds.clear();
  _bonds_on_atom.clear();

  if (n > 0)
  {
    _atoms.reserve(n);
    _bonds.reserve(n);
    _bonds_on_atom.reserve(n);
  }
}

atom_number_t
MoleculeGraph::add_atom(const Atom & a)
{
  const atom_number_t rc = natoms();

  _atoms.push_back(a);
  _atoms.back().set_atom_number(rc);
  _bonds_on_atom.emplace_back();

  return rc;
}

int
MoleculeGraph::add_bond(atom_number_t a1, atom_number_t a2, BondType bt,
                        BondDirection direction, int ring_closure)
{
  const int matoms = natoms();
  if (a1 < 0 || a1 >= matoms || a2 < 0 || a2 >= matoms)
    return 0;

  if (a1 == a2)
    return 0;

  if (are_bonded(a1, a2))
    return 0;

  const int bond_number = nedges();

  _bonds.emplace_back(a1, a2, bt);
  Bond & b = _bonds.back();
  b.set_direction(direction);
  b.set_ring_closure(ring_closure);

  _bonds_on_atom[a1].push_back(bond_number);
  _bonds_on_atom[a2].push_back(bond_number);

  return 1;
}

const Bond *
MoleculeGraph::bond_between(atom_number_t a1, atom_number_t a2) const
{
  if (a1 < 0 || a1 >= natoms())
    return nullptr;

  for (int b : _bonds_on_atom[a1])
  {
    if (_bonds[b].involves(a1, a2))
      return &_bonds[b];
  }

  return nullptr;
}

std::vector<atom_number_t>
MoleculeGraph::connections(atom_number_t a) const
{
  std::vector<atom_number_t> result;
  result.reserve(_bonds_on_atom[a].size());

  for (int b : _bonds_on_atom[a])
  {
    result.push_back(_bonds[b].other(a));
  }

  return result;
}

int
MoleculeGraph::twice_bond_order_sum(atom_number_t a) const
{
  int rc = 0;
  for (int b : _bonds_on_atom[a])
  {
    rc += twice_bond_order(_bonds[b].btype());
  }

  return rc;
}

int
MoleculeGraph::integer_bond_order_sum(atom_number_t a) const
{
  int rc = 0;
  for (int b : _bonds_on_atom[a])
  {
    const BondType bt = _bonds[b].btype();
    if (BondType::kAromatic == bt)
      rc += 1;
    else
      rc += twice_bond_order(bt) / 2;
  }

  return rc;
}

int
MoleculeGraph::aromatic_bond_count(atom_number_t a) const
{
  int rc = 0;
  for (int b : _bonds_on_atom[a])
  {
    if (_bonds[b].is_aromatic())
      rc++;
  }

  return rc;
}

int
MoleculeGraph::fragment_membership(std::vector<int> & fragment) const
{
  const int matoms = natoms();

  fragment.assign(matoms, -1);

  int number_fragments = 0;

  std::vector<atom_number_t> stack;

  for (int i = 0; i < matoms; ++i)
  {
    if (fragment[i] >= 0)
      continue;

    fragment[i] = number_fragments;
    stack.push_back(i);

    while (! stack.empty())
    {
      const atom_number_t j = stack.back();
      stack.pop_back();

      for (int b : _bonds_on_atom[j])
      {
        const atom_number_t k = _bonds[b].other(j);
        if (fragment[k] >= 0)
          continue;

        fragment[k] = number_fragments;
        stack.push_back(k);
      }
    }

    number_fragments++;
  }

  return number_fragments;
}

int
MoleculeGraph::number_fragments() const
{
  std::vector<int> fragment;

  return fragment_membership(fragment);
}

int
MoleculeGraph::ring_closure_bond_count() const
{
  int rc = 0;
  for (const Bond & b : _bonds)
  {
    if (b.ring_closure())
      rc++;
  }

  return rc;
}

int
MoleculeGraph::implicit_hydrogen_count() const
{
  int rc = 0;
  for (const Atom & a : _atoms)
  {
    rc += a.total_hydrogens();
  }

  return rc;
}

int
MoleculeGraph::debug_print(std::ostream & output) const
{
  output << "MoleculeGraph with " << natoms() << " atoms and " << nedges() << " bonds\n";

  for (const Atom & a : _atoms)
  {
    a.debug_print(output);
  }

  for (const Bond & b : _bonds)
  {
    b.debug_print(output);
  }

  return output.good();
}

}  // namespace smigraph
