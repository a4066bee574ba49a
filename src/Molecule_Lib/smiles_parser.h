#ifndef MOLECULE_LIB_SMILES_PARSER_H_
#define MOLECULE_LIB_SMILES_PARSER_H_

#include <optional>
#include <string_view>

#include "Molecule_Lib/bracket_atom.h"
#include "Molecule_Lib/molecule_graph.h"
#include "Molecule_Lib/parse_error.h"
#include "Molecule_Lib/smigraph_options.pb.h"
#include "Molecule_Lib/valence.h"

namespace smigraph {

// Reads a smiles, one pass left to right, building a MoleculeGraph.
// The first problem found stops the parse. Holds only settings, so
// one parser can be used from many threads at once.

class SmilesParser {
  private:
    int _display_error_messages;

    BracketAtomLimits _bracket_atom_limits;

    // 0 means no limit.
    int _max_branch_depth;

    Validator _validator;

  // private functions

    int _build_from_smiles(std::string_view smiles, MoleculeGraph & m, ParseError & error) const;

  public:
    SmilesParser();
    explicit SmilesParser(const SmilesParserOptions & proto);

    // Fields not set in `proto` are left unchanged.
    int Initialise(const SmilesParserOptions & proto);

    void set_display_error_messages(int s) { _display_error_messages = s;}
    void set_max_formal_charge(int s) { _bracket_atom_limits.max_formal_charge = s;}
    void set_max_branch_depth(int s) { _max_branch_depth = s;}
    void set_infer_hydrogens_on_bracket_atoms(int s) { _validator.set_infer_hydrogens_on_bracket_atoms(s);}
    void set_compute_implicit_hydrogens(int s) { _validator.set_compute_implicit_hydrogens(s);}

    int display_error_messages() const { return _display_error_messages;}
    int max_formal_charge() const { return _bracket_atom_limits.max_formal_charge;}
    int max_branch_depth() const { return _max_branch_depth;}

    // Returns 1 on success. On failure `m` is empty and `error`
    // describes the first problem.
    int Parse(std::string_view smiles, MoleculeGraph & m, ParseError & error) const;

    // For callers that do not need to know what went wrong.
    std::optional<MoleculeGraph> Build(std::string_view smiles) const;
};

// Parse with default settings.
extern int ParseSmiles(std::string_view smiles, MoleculeGraph & m, ParseError & error);

}  // namespace smigraph

#endif  // MOLECULE_LIB_SMILES_PARSER_H_
