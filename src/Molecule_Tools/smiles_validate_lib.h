#ifndef MOLECULE_TOOLS_SMILES_VALIDATE_LIB_H_
#define MOLECULE_TOOLS_SMILES_VALIDATE_LIB_H_

#include <array>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "Foundational/cmdline/cmdline.h"

#include "Molecule_Lib/parse_error.h"
#include "Molecule_Lib/smiles_parser.h"

namespace smiles_validate {

// Split an input line into the smiles and whatever follows it.
// Leading whitespace before the name is dropped.
void
SplitSmilesAndName(std::string_view line, std::string_view& smiles,
                   std::string_view& name);

// Everything smiles_validate needs, so it can be tested without main.
class Options {
  private:
    int _verbose;

    int _quiet;

    int _write_summary;

    smigraph::SmilesParser _parser;

    // Failing lines, each followed by a comment with the error.
    std::unique_ptr<std::ofstream> _failures_file;
    std::ostream* _stream_for_failures;

    int _lines_read;
    int _valid;
    // Indexed by ParseErrorKind.
    std::array<int, 4> _invalid;

  // private functions

    int WriteSummary(const smigraph::MoleculeGraph& m, std::string_view smiles,
                     std::string_view name, std::ostream& output) const;
    int ProcessFailure(std::string_view line, std::string_view name,
                       const smigraph::ParseError& error);

  public:
    Options();

    // Get user specified command line directives.
    int Initialise(Command_Line& cl);

    int verbose() const {
      return _verbose;
    }

    void set_quiet(int s);
    void set_write_summary(int s) {
      _write_summary = s;
    }
    void set_stream_for_failures(std::ostream* s) {
      _stream_for_failures = s;
    }

    smigraph::SmilesParser& parser() {
      return _parser;
    }

    int lines_read() const {
      return _lines_read;
    }
    int valid() const {
      return _valid;
    }
    int invalid() const;
    int invalid(smigraph::ParseErrorKind kind) const {
      return _invalid[static_cast<int>(kind)];
    }

    // Parse one `smiles name` line. Returns 0 only if output failed.
    int Process(std::string_view line, std::ostream& output);

    // Every line of `input`.
    int Process(std::istream& input, std::ostream& output);

    // After processing, report a summary of what has been done.
    int Report(std::ostream& output) const;
};

// Process `fname`, '-' means stdin.
int
SmilesValidate(Options& options, const std::string& fname, std::ostream& output);

}  // namespace smiles_validate

#endif  // MOLECULE_TOOLS_SMILES_VALIDATE_LIB_H_
