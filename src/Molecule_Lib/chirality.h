#ifndef MOLECULE_LIB_CHIRALITY_H_
#define MOLECULE_LIB_CHIRALITY_H_

#include <iostream>
#include <string>
#include <string_view>

namespace smigraph {

// What can follow the '@' in a bracket atom.
enum class ChiralClass {
  kNone,
  kAnticlockwise,   // @
  kClockwise,       // @@
  kTetrahedral,     // @TH1 @TH2
  kAllene,          // @AL1 @AL2
  kSquarePlanar,    // @SP1 .. @SP3
  kTrigonalBipyramidal,  // @TB1 .. @TB20
  kOctahedral       // @OH1 .. @OH30
};

class Chirality {
  private:
    ChiralClass _class;
    // Only meaningful for the extended classes.
    int _permutation;

  public:
    Chirality() : _class(ChiralClass::kNone), _permutation(0) {}
    Chirality(ChiralClass c, int permutation) : _class(c), _permutation(permutation) {}

    ChiralClass chiral_class() const { return _class;}
    int permutation() const { return _permutation;}

    int is_chiral() const { return ChiralClass::kNone != _class;}

    bool operator==(const Chirality & rhs) const {
      return _class == rhs._class && _permutation == rhs._permutation;
    }
    bool operator!=(const Chirality & rhs) const { return ! (*this == rhs);}

    // The smiles form, "@", "@@", "@TB7".
    std::string ToString() const;
};

extern std::ostream & operator<<(std::ostream &, const Chirality &);

// Map a two letter tag, "TH", "OH" to its class. Returns kNone for
// anything not recognised.
extern ChiralClass chiral_class_from_tag(std::string_view tag);

// The largest permutation index allowed for `c`. 0 for the
// classes that do not take an index.
extern int max_permutation(ChiralClass c);

// Build a Chirality from a tag and index, checking that the index is
// within range for the class. Returns 0 on failure.
extern int build_extended_chirality(std::string_view tag, int permutation, Chirality & result);

}  // namespace smigraph

#endif  // MOLECULE_LIB_CHIRALITY_H_
