#include <string>
#include <vector>

#include <benchmark/benchmark.h>

#include "Molecule_Lib/smiles_parser.h"

namespace smigraph {
namespace {

const std::vector<std::string> kSmiles = {
  "CCO",
  "c1ccccc1",
  "CC(=O)Oc1ccccc1C(=O)O",
  "CN1C=NC2=C1C(=O)N(C(=O)N2C)C",
  "C[C@@H](C(=O)O)N",
  "O=C(O)[C@@H]1CCCN1C(=O)[C@@H](N)Cc1ccc(O)cc1",
  "c1ccc2c(c1)ccc1ccccc12",
  "[Na+].[Cl-]",
  "C%10CCCCC%10C%11CCCCC%11",
  "CC(C)(C)c1ccc(cc1)S(=O)(=O)N"
};

static void BM_ParseSmiles(benchmark::State& state) {
  SmilesParser parser;
  parser.set_display_error_messages(0);
  const std::string & smiles = kSmiles[state.range(0)];

  MoleculeGraph m;
  ParseError error;
  for (auto _ : state) {
    benchmark::DoNotOptimize(parser.Parse(smiles, m, error));
  }
}
BENCHMARK(BM_ParseSmiles)->DenseRange(0, 9);

static void BM_ParseLongChain(benchmark::State& state) {
  SmilesParser parser;
  const std::string smiles(state.range(0), 'C');

  MoleculeGraph m;
  ParseError error;
  for (auto _ : state) {
    benchmark::DoNotOptimize(parser.Parse(smiles, m, error));
  }
}
BENCHMARK(BM_ParseLongChain)
->Arg(10)
->Arg(100)
->Arg(1000);

static void BM_ParseFailure(benchmark::State& state) {
  SmilesParser parser;
  parser.set_display_error_messages(0);
  const std::string smiles("CC(=O)Oc1ccccc1C(=O)O1");

  MoleculeGraph m;
  ParseError error;
  for (auto _ : state) {
    benchmark::DoNotOptimize(parser.Parse(smiles, m, error));
  }
}
BENCHMARK(BM_ParseFailure);

}  // namespace
}  // namespace smigraph

BENCHMARK_MAIN();
