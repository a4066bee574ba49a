#include <algorithm>
#include <cctype>
#include <memory>

#include "absl/container/flat_hash_map.h"

#include "Molecule_Lib/element.h"

namespace smigraph {

using std::cerr;

static const char * const element_symbols[HIGHEST_ATOMIC_NUMBER + 1] = {
  "*",
  "H", "He",
  "Li", "Be", "B", "C", "N", "O", "F", "Ne",
  "Na", "Mg", "Al", "Si", "P", "S", "Cl", "Ar",
  "K", "Ca", "Sc", "Ti", "V", "Cr", "Mn", "Fe", "Co", "Ni", "Cu", "Zn",
  "Ga", "Ge", "As", "Se", "Br", "Kr",
  "Rb", "Sr", "Y", "Zr", "Nb", "Mo", "Tc", "Ru", "Rh", "Pd", "Ag", "Cd",
  "In", "Sn", "Sb", "Te", "I", "Xe",
  "Cs", "Ba", "La", "Ce", "Pr", "Nd", "Pm", "Sm", "Eu", "Gd", "Tb", "Dy",
  "Ho", "Er", "Tm", "Yb", "Lu", "Hf", "Ta", "W", "Re", "Os", "Ir", "Pt",
  "Au", "Hg", "Tl", "Pb", "Bi", "Po", "At", "Rn",
  "Fr", "Ra", "Ac", "Th", "Pa", "U", "Np", "Pu", "Am", "Cm", "Bk", "Cf",
  "Es", "Fm", "Md", "No", "Lr", "Rf", "Db", "Sg", "Bh", "Hs", "Mt", "Ds",
  "Rg", "Cn", "Nh", "Fl", "Mc", "Lv", "Ts", "Og"
};

Element::Element(atomic_number_t z, const char * symbol) : _atomic_number(z), _symbol(symbol)
{
  _aromatic_symbol = _symbol;
  _aromatic_symbol[0] = std::tolower(_aromatic_symbol[0]);

  _outer_shell_electrons = OUTER_SHELL_ELECTRONS_NOT_KNOWN;
  _organic = 0;
  _can_be_aromatic = 0;
  _normal_valence = VALENCE_NOT_DEFINED;
}

int
Element::debug_print(std::ostream & output) const
{
  output << "Element " << _symbol << " z = " << _atomic_number;
  if (_organic)
    output << " organic";
  if (_can_be_aromatic)
    output << " aromatic '" << _aromatic_symbol << "'";

  if (has_valence())
  {
    output << " valence " << _normal_valence;
    for (int v : _alternate_valence)
      output << ',' << v;
  }
  output << '\n';

  return output.good();
}

std::ostream &
operator<<(std::ostream & output, const Element & e)
{
  return output << e.symbol();
}

void
Element::add_alternate_valence(int v)
{
  _alternate_valence.push_back(v);
  std::sort(_alternate_valence.begin(), _alternate_valence.end());
}

int
Element::is_valid_valence(int v) const
{
  if (! has_valence())
    return 0;

  if (v == _normal_valence)
    return 1;

  return std::find(_alternate_valence.begin(), _alternate_valence.end(), v) != _alternate_valence.end();
}

int
Element::highest_valence() const
{
  if (_alternate_valence.empty())
    return _normal_valence;

  return std::max(_normal_valence, _alternate_valence.back());
}

int
Element::smallest_valence_at_least(int bond_order_sum, int & result) const
{
  if (! has_valence())
    return 0;

  if (_normal_valence >= bond_order_sum)
  {
    result = _normal_valence;
    return 1;
  }

  for (int v : _alternate_valence)
  {
    if (v >= bond_order_sum)
    {
      result = v;
      return 1;
    }
  }

  return 0;
}

namespace {

// The default valences of the organic subset, see the OpenSMILES specification.
// Any other element has no valence and never gets implicit hydrogens.

struct OrganicSubsetMember {
  atomic_number_t z;
  int outer_shell_electrons;
  int normal_valence;
  int alternate[2];
  int can_be_aromatic;
};

constexpr OrganicSubsetMember organic_subset[] = {
  {5, 3, 3, {0, 0}, 1},     // B
  {6, 4, 4, {0, 0}, 1},     // C
  {7, 5, 3, {5, 0}, 1},     // N
  {8, 6, 2, {0, 0}, 1},     // O
  {9, 7, 1, {0, 0}, 0},     // F
  {15, 5, 3, {5, 0}, 1},    // P
  {16, 6, 2, {4, 6}, 1},    // S
  {17, 7, 1, {0, 0}, 0},    // Cl
  {35, 7, 1, {0, 0}, 0},    // Br
  {53, 7, 1, {0, 0}, 0},    // I
};

// Aromatic capable elements that must always be bracketed.
constexpr atomic_number_t other_aromatic_capable[] = {33, 34, 52};    // As Se Te

class PeriodicTable {
  private:
    std::vector<std::unique_ptr<Element>> _element;

    absl::flat_hash_map<std::string, const Element *> _symbol_to_element;
    absl::flat_hash_map<std::string, const Element *> _aromatic_symbol_to_element;

  public:
    PeriodicTable();

    const Element * from_symbol(std::string_view s) const;
    const Element * from_aromatic_symbol(std::string_view s) const;

    const Element * from_atomic_number(atomic_number_t z) const
    {
      if (! REASONABLE_ATOMIC_NUMBER(z))
        return nullptr;

      return _element[z].get();
    }
};

PeriodicTable::PeriodicTable()
{
  _element.reserve(HIGHEST_ATOMIC_NUMBER + 1);

  for (int z = 0; z <= HIGHEST_ATOMIC_NUMBER; ++z)
  {
    _element.push_back(std::make_unique<Element>(z, element_symbols[z]));
  }

  for (const OrganicSubsetMember & o : organic_subset)
  {
    Element * e = _element[o.z].get();
    e->set_organic(1);
    e->set_outer_shell_electrons(o.outer_shell_electrons);
    e->set_normal_valence(o.normal_valence);
    for (int v : o.alternate)
    {
      if (v > 0)
        e->add_alternate_valence(v);
    }
    e->set_can_be_aromatic(o.can_be_aromatic);
  }

  for (atomic_number_t z : other_aromatic_capable)
  {
    _element[z]->set_can_be_aromatic(1);
  }

  for (int z = 1; z <= HIGHEST_ATOMIC_NUMBER; ++z)
  {
    const Element * e = _element[z].get();
    _symbol_to_element.emplace(e->symbol(), e);
    if (e->can_be_aromatic())
      _aromatic_symbol_to_element.emplace(e->aromatic_symbol(), e);
  }
}

const Element *
PeriodicTable::from_symbol(std::string_view s) const
{
  const auto iter = _symbol_to_element.find(absl::string_view(s.data(), s.size()));
  if (iter == _symbol_to_element.end())
    return nullptr;

  return iter->second;
}

const Element *
PeriodicTable::from_aromatic_symbol(std::string_view s) const
{
  const auto iter = _aromatic_symbol_to_element.find(absl::string_view(s.data(), s.size()));
  if (iter == _aromatic_symbol_to_element.end())
    return nullptr;

  return iter->second;
}

const PeriodicTable &
periodic_table()
{
  static const PeriodicTable table;

  return table;
}

}  // namespace

const Element *
get_element_from_symbol_no_case_conversion(std::string_view s)
{
  if (s.empty())
    return nullptr;

  if ("*" == s)
    return wildcard_element();

  return periodic_table().from_symbol(s);
}

const Element *
get_element_from_atomic_number(atomic_number_t z)
{
  return periodic_table().from_atomic_number(z);
}

const Element *
get_element_from_aromatic_symbol(std::string_view s)
{
  return periodic_table().from_aromatic_symbol(s);
}

const Element *
wildcard_element()
{
  return periodic_table().from_atomic_number(0);
}

const Element *
get_organic_subset_element(std::string_view s)
{
  const Element * e = periodic_table().from_symbol(s);
  if (nullptr == e || ! e->organic())
    return nullptr;

  return e;
}

}  // namespace smigraph
