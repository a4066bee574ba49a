#include "Molecule_Lib/chirality.h"

namespace smigraph {

ChiralClass
chiral_class_from_tag(std::string_view tag)
{
  if ("TH" == tag)
    return ChiralClass::kTetrahedral;
  if ("AL" == tag)
    return ChiralClass::kAllene;
  if ("SP" == tag)
    return ChiralClass::kSquarePlanar;
  if ("TB" == tag)
    return ChiralClass::kTrigonalBipyramidal;
  if ("OH" == tag)
    return ChiralClass::kOctahedral;

  return ChiralClass::kNone;
}

int
max_permutation(ChiralClass c)
{
  switch (c)
  {
    case ChiralClass::kTetrahedral:
      return 2;
    case ChiralClass::kAllene:
      return 2;
    case ChiralClass::kSquarePlanar:
      return 3;
    case ChiralClass::kTrigonalBipyramidal:
      return 20;
    case ChiralClass::kOctahedral:
      return 30;
    case ChiralClass::kNone:
    case ChiralClass::kAnticlockwise:
    case ChiralClass::kClockwise:
      return 0;
  }

  return 0;
}

int
build_extended_chirality(std::string_view tag, int permutation, Chirality & result)
{
  const ChiralClass c = chiral_class_from_tag(tag);
  if (ChiralClass::kNone == c)
    return 0;

  if (permutation < 1 || permutation > max_permutation(c))
    return 0;

  result = Chirality(c, permutation);

  return 1;
}

static const char *
tag_for_class(ChiralClass c)
{
  switch (c)
  {
    case ChiralClass::kTetrahedral:
      return "TH";
    case ChiralClass::kAllene:
      return "AL";
    case ChiralClass::kSquarePlanar:
      return "SP";
    case ChiralClass::kTrigonalBipyramidal:
      return "TB";
    case ChiralClass::kOctahedral:
      return "OH";
    case ChiralClass::kNone:
    case ChiralClass::kAnticlockwise:
    case ChiralClass::kClockwise:
      return "";
  }

  return "";
}

std::string
Chirality::ToString() const
{
  switch (_class)
  {
    case ChiralClass::kNone:
      return "";
    case ChiralClass::kAnticlockwise:
      return "@";
    case ChiralClass::kClockwise:
      return "@@";
    default:
      break;
  }

  std::string result("@");
  result += tag_for_class(_class);
  result += std::to_string(_permutation);

  return result;
}

std::ostream &
operator<<(std::ostream & output, const Chirality & c)
{
  if (c.is_chiral())
    output << c.ToString();
  else
    output << "none";

  return output;
}

}  // namespace smigraph
