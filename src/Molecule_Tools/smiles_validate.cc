// Read smiles, report the ones that are not valid.

#include <cstdlib>
#include <iostream>

#include "Foundational/cmdline/cmdline.h"

#include "Molecule_Tools/smiles_validate_lib.h"

namespace smiles_validate {

using std::cerr;

// By convention the Usage function tells how to use the tool.
void
Usage(int rc) {
// clang-format off
  cerr << __FILE__ << " compiled " << __DATE__ << " " << __TIME__ << '\n';
  cerr << R"(Checks that each smiles is valid, input lines are 'smiles name'.
 -C <fname>  smigraph::SmilesParserOptions text proto with parser settings.
 -q          do not report individual failures
 -F <fname>  write failing lines to <fname>, each followed by a comment with the error
 -S          write name, atoms, bonds, fragments, ring closures and implicit H
             for each valid molecule to stdout
 -v          verbose output, report counts of each kind of failure
Use '-' to read stdin.
)";
// clang-format on

  ::exit(rc);
}

int
Main(int argc, char** argv) {
  Command_Line cl(argc, argv, "vqC:F:S");

  if (cl.unrecognised_options_encountered()) {
    cerr << "Unrecognised options encountered\n";
    Usage(1);
  }

  const int verbose = cl.option_count('v');

  Options options;
  if (! options.Initialise(cl)) {
    cerr << "Cannot initialise options\n";
    return 1;
  }

  if (cl.empty()) {
    cerr << "Insufficient arguments\n";
    Usage(1);
  }

  for (int i = 0; i < cl.number_elements(); ++i) {
    if (! SmilesValidate(options, cl[i], std::cout)) {
      cerr << "SmilesValidate::fatal error processing '" << cl[i] << "'\n";
      return 1;
    }
  }

  std::cout.flush();

  if (verbose) {
    options.Report(cerr);
  }

  return 0;
}

}  // namespace smiles_validate

int
main(int argc, char ** argv) {

  int rc = smiles_validate::Main(argc, argv);

  return rc;
}
