#include <algorithm>
#include <cstdlib>
#include <string>

#include "Molecule_Lib/valence.h"

namespace smigraph {

static std::vector<int>
all_valences(const Element & e)
{
  std::vector<int> result;
  if (! e.has_valence())
    return result;

  result.push_back(e.normal_valence());
  for (int i = 0; i < e.number_alternate_valences(); ++i)
  {
    result.push_back(e.alternate_valence(i));
  }

  std::sort(result.begin(), result.end());

  return result;
}

std::vector<int>
charge_adjusted_valences(const Element & e, formal_charge_t q)
{
  std::vector<int> valences = all_valences(e);
  if (0 == q || valences.empty())
    return valences;

  const int ose = e.outer_shell_electrons();
  if (OUTER_SHELL_ELECTRONS_NOT_KNOWN == ose)
    return valences;

  std::vector<int> result;
  result.reserve(valences.size());

  for (int v : valences)
  {
    int adjusted;
    if (ose < 4)
      adjusted = v - q;
    else if (4 == ose)
      adjusted = v - std::abs(q);
    else
      adjusted = v + q;

    if (adjusted >= 0)
      result.push_back(adjusted);
  }

  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());

  return result;
}

int
implicit_hydrogens(const std::vector<int> & valences, int aromatic,
                   int bond_order_sum, int twice_sum, int & result)
{
  result = 0;

  if (valences.empty())
    return 1;

  if (bond_order_sum > valences.back())
    return 0;

  if (aromatic)
  {
    result = valences.front() - twice_sum / 2;
    if (result < 0)
      result = 0;
    return 1;
  }

  for (int v : valences)
  {
    if (v >= bond_order_sum)
    {
      result = v - bond_order_sum;
      return 1;
    }
  }

  return 0;
}

Validator::Validator()
{
  _infer_hydrogens_on_bracket_atoms = 1;
  _compute_implicit_hydrogens = 1;
}

int
Validator::_check_and_assign(MoleculeGraph & m, atom_number_t zatom, ParseError & error) const
{
  const Atom & a = m.atom(zatom);
  const Element * e = a.element();

  if (a.is_wildcard() || ! e->has_valence())
    return 1;

  std::vector<int> valences;
  if (! a.bracketed())
    valences = all_valences(*e);
  else if (! _infer_hydrogens_on_bracket_atoms || a.explicit_hydrogens())
    return 1;
  else
    valences = charge_adjusted_valences(*e, a.formal_charge());

  const int bond_order_sum = m.integer_bond_order_sum(zatom);
  const int twice_sum = m.twice_bond_order_sum(zatom);

  int h;
  if (! implicit_hydrogens(valences, a.is_aromatic(), bond_order_sum, twice_sum, h))
  {
    std::string msg("valence exceeded on atom ");
    msg += std::to_string(zatom);
    msg += " '";
    msg += a.symbol();
    msg += "', bond order sum ";
    msg += std::to_string(bond_order_sum);
    msg += " exceeds ";
    msg += std::to_string(valences.back());

    return error.Set(ParseErrorKind::kSemanticError, a.column(), a.column() + a.length(), msg);
  }

  if (_compute_implicit_hydrogens)
    m.set_implicit_hydrogens(zatom, h);

  return 1;
}

int
Validator::Process(MoleculeGraph & m, ParseError & error) const
{
  const int matoms = m.natoms();

  for (int i = 0; i < matoms; ++i)
  {
    if (! _check_and_assign(m, i, error))
      return 0;
  }

  return 1;
}

}  // namespace smigraph
