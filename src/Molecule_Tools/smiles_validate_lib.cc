// Check smiles files, one molecule per line.

#include <cctype>
#include <iostream>
#include <optional>

#include "Foundational/iwmisc/proto_support.h"

#include "Molecule_Lib/smigraph_options.pb.h"

#include "Molecule_Tools/smiles_validate_lib.h"

namespace smiles_validate {

using std::cerr;

using smigraph::MoleculeGraph;
using smigraph::ParseError;
using smigraph::ParseErrorKind;

void
SplitSmilesAndName(std::string_view line, std::string_view& smiles,
                   std::string_view& name) {
  size_t i = 0;
  while (i < line.size() && ! std::isspace(static_cast<unsigned char>(line[i]))) {
    ++i;
  }
  smiles = line.substr(0, i);

  while (i < line.size() && std::isspace(static_cast<unsigned char>(line[i]))) {
    ++i;
  }
  name = line.substr(i);
}

Options::Options() {
  _verbose = 0;
  _quiet = 0;
  _write_summary = 0;
  _stream_for_failures = nullptr;
  _lines_read = 0;
  _valid = 0;
  _invalid.fill(0);
}

void
Options::set_quiet(int s) {
  _quiet = s;
  if (_quiet) {
    _parser.set_display_error_messages(0);
  }
}

int
Options::Initialise(Command_Line& cl) {
  _verbose = cl.option_count('v');

  if (cl.option_present('C')) {
    const std::string fname = cl.string_value('C');
    std::optional<smigraph::SmilesParserOptions> proto =
        iwmisc::ReadTextProto<smigraph::SmilesParserOptions>(fname);
    if (! proto) {
      cerr << "Options::Initialise:cannot read parser options '" << fname << "'\n";
      return 0;
    }
    _parser.Initialise(*proto);
    if (_verbose) {
      cerr << "Parser options read from '" << fname << "'\n";
    }
  }

  // After -C so it wins over display_error_messages.
  if (cl.option_present('q')) {
    set_quiet(1);
    if (_verbose) {
      cerr << "Will not report individual failures\n";
    }
  }

  if (cl.option_present('S')) {
    _write_summary = 1;
    if (_verbose) {
      cerr << "Will write a summary of each molecule\n";
    }
  }

  if (cl.option_present('F')) {
    const std::string fname = cl.string_value('F');
    _failures_file = std::make_unique<std::ofstream>(fname);
    if (! _failures_file->good()) {
      cerr << "Cannot open stream for failures '" << fname << "'\n";
      return 0;
    }
    _stream_for_failures = _failures_file.get();
    if (_verbose) {
      cerr << "Failing smiles written to '" << fname << "'\n";
    }
  }

  return 1;
}

int
Options::invalid() const {
  int rc = 0;
  for (int n : _invalid) {
    rc += n;
  }

  return rc;
}

int
Options::WriteSummary(const MoleculeGraph& m, std::string_view smiles,
                      std::string_view name, std::ostream& output) const {
  if (name.empty()) {
    output << smiles;
  } else {
    output << name;
  }

  output << ' ' << m.natoms() << ' ' << m.nedges() << ' ' << m.number_fragments() <<
            ' ' << m.ring_closure_bond_count() << ' ' << m.implicit_hydrogen_count() << '\n';

  return output.good();
}

int
Options::ProcessFailure(std::string_view line, std::string_view name,
                        const ParseError& error) {
  ++_invalid[static_cast<int>(error.kind())];

  if (! _quiet && _verbose) {
    cerr << "Line " << _lines_read << ' ' << name << '\n';
  }

  if (_stream_for_failures == nullptr) {
    return 1;
  }

  *_stream_for_failures << line << '\n';
  *_stream_for_failures << "# " << error << '\n';

  return _stream_for_failures->good();
}

int
Options::Process(std::string_view line, std::ostream& output) {
  if (! line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  std::string_view smiles, name;
  SplitSmilesAndName(line, smiles, name);
  if (smiles.empty()) {
    return 1;
  }

  ++_lines_read;

  MoleculeGraph m;
  ParseError error;
  if (! _parser.Parse(smiles, m, error)) {
    return ProcessFailure(line, name, error);
  }

  ++_valid;

  if (_write_summary) {
    return WriteSummary(m, smiles, name, output);
  }

  return 1;
}

int
Options::Process(std::istream& input, std::ostream& output) {
  std::string buffer;
  while (std::getline(input, buffer)) {
    if (! Process(buffer, output)) {
      cerr << "Options::Process:cannot write results\n";
      return 0;
    }
  }

  return input.eof();
}

int
Options::Report(std::ostream& output) const {
  output << "Read " << _lines_read << " smiles, " << _valid << " valid, " <<
            invalid() << " invalid\n";

  for (ParseErrorKind kind : {ParseErrorKind::kLexError, ParseErrorKind::kSyntaxError,
                              ParseErrorKind::kSemanticError}) {
    if (invalid(kind) > 0) {
      output << invalid(kind) << ' ' << smigraph::parse_error_kind_name(kind) << '\n';
    }
  }

  return 1;
}

int
SmilesValidate(Options& options, const std::string& fname, std::ostream& output) {
  if (fname == "-") {
    return options.Process(std::cin, output);
  }

  std::ifstream input(fname);
  if (! input.good()) {
    cerr << "SmilesValidate:cannot open '" << fname << "'\n";
    return 0;
  }

  return options.Process(input, output);
}

}  // namespace smiles_validate
