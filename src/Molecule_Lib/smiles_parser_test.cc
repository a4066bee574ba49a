// Tests for SmilesParser

#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "google/protobuf/text_format.h"

#include "Molecule_Lib/smiles_parser.h"

namespace smigraph {
namespace {

using testing::UnorderedElementsAre;

class TestSmilesParser : public testing::Test {
  protected:
    SmilesParser _parser;
    MoleculeGraph _m;
    ParseError _error;

    void SetUp() override {
      _parser.set_display_error_messages(0);
    }
};

TEST_F(TestSmilesParser, Ethanol) {
  ASSERT_TRUE(_parser.Parse("CCO", _m, _error)) << _error;
  EXPECT_FALSE(_error.is_set());
  ASSERT_EQ(_m.natoms(), 3);
  EXPECT_EQ(_m.atom(0).symbol(), "C");
  EXPECT_EQ(_m.atom(1).symbol(), "C");
  EXPECT_EQ(_m.atom(2).symbol(), "O");
  ASSERT_EQ(_m.nedges(), 2);
  for (const Bond & b : _m.bonds()) {
    EXPECT_TRUE(b.is_single_bond());
    EXPECT_FALSE(b.ring_closure());
  }
  EXPECT_TRUE(_m.are_bonded(0, 1));
  EXPECT_TRUE(_m.are_bonded(1, 2));
  EXPECT_EQ(_m.ring_closure_bond_count(), 0);
  EXPECT_EQ(_m.atom(0).implicit_hydrogens(), 3);
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 2);
  EXPECT_EQ(_m.atom(2).implicit_hydrogens(), 1);
}

TEST_F(TestSmilesParser, Benzene) {
  ASSERT_TRUE(_parser.Parse("c1ccccc1", _m, _error)) << _error;
  ASSERT_EQ(_m.natoms(), 6);
  ASSERT_EQ(_m.nedges(), 6);
  for (const Atom & a : _m.atoms()) {
    EXPECT_TRUE(a.is_aromatic());
    EXPECT_EQ(a.implicit_hydrogens(), 1);
  }
  for (const Bond & b : _m.bonds()) {
    EXPECT_TRUE(b.is_aromatic());
  }
  EXPECT_EQ(_m.ring_closure_bond_count(), 1);
  const Bond * b = _m.bond_between(0, 5);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(b->ring_closure());
}

TEST_F(TestSmilesParser, CarboxylicAcidBranch) {
  ASSERT_TRUE(_parser.Parse("C(=O)O", _m, _error)) << _error;
  ASSERT_EQ(_m.natoms(), 3);
  ASSERT_EQ(_m.nedges(), 2);
  ASSERT_NE(_m.bond_between(0, 1), nullptr);
  EXPECT_TRUE(_m.bond_between(0, 1)->is_double_bond());
  ASSERT_NE(_m.bond_between(0, 2), nullptr);
  EXPECT_TRUE(_m.bond_between(0, 2)->is_single_bond());
  EXPECT_FALSE(_m.are_bonded(1, 2));
  EXPECT_EQ(_m.atom(0).implicit_hydrogens(), 1);
}

TEST_F(TestSmilesParser, Copper) {
  ASSERT_TRUE(_parser.Parse("[Cu+2]", _m, _error)) << _error;
  ASSERT_EQ(_m.natoms(), 1);
  EXPECT_EQ(_m.atom(0).symbol(), "Cu");
  EXPECT_EQ(_m.atom(0).formal_charge(), 2);
  EXPECT_EQ(_m.nedges(), 0);
}

TEST_F(TestSmilesParser, RingBondDoubleBothEnds) {
  ASSERT_TRUE(_parser.Parse("C=1CCCCC=1", _m, _error)) << _error;
  EXPECT_EQ(_m.natoms(), 6);
  EXPECT_EQ(_m.nedges(), 6);
  const Bond * b = _m.bond_between(0, 5);
  ASSERT_NE(b, nullptr);
  EXPECT_TRUE(b->is_double_bond());
  EXPECT_TRUE(b->ring_closure());
}

TEST_F(TestSmilesParser, RingBondOneSideExplicit) {
  ASSERT_TRUE(_parser.Parse("C=1CCCCC1", _m, _error)) << _error;
  EXPECT_TRUE(_m.bond_between(0, 5)->is_double_bond());

  ASSERT_TRUE(_parser.Parse("C1CCCCC=1", _m, _error)) << _error;
  EXPECT_TRUE(_m.bond_between(0, 5)->is_double_bond());
}

TEST_F(TestSmilesParser, RingBondMismatch) {
  ASSERT_FALSE(_parser.Parse("C=1CCCCC#1", _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSemanticError);
  EXPECT_EQ(_error.column(), 8);
  EXPECT_EQ(_error.message(), "ring closure bond mismatch: double vs triple");
  EXPECT_EQ(_m.natoms(), 0);
}

TEST_F(TestSmilesParser, RingNeverClosed) {
  ASSERT_FALSE(_parser.Parse("C1CCCCC", _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSemanticError);
  EXPECT_EQ(_error.column(), 7);
  EXPECT_EQ(_error.message(), "ring 1 never closed");
  EXPECT_EQ(_m.natoms(), 0);
  EXPECT_EQ(_m.nedges(), 0);
}

TEST_F(TestSmilesParser, UnclosedBranch) {
  ASSERT_FALSE(_parser.Parse("C(C", _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSyntaxError);
  EXPECT_EQ(_error.column(), 3);
  EXPECT_EQ(_error.message(), "unclosed branch");
}

TEST_F(TestSmilesParser, EmptyInput) {
  ASSERT_TRUE(_parser.Parse("", _m, _error));
  EXPECT_EQ(_m.natoms(), 0);
  EXPECT_EQ(_m.number_fragments(), 0);
}

TEST_F(TestSmilesParser, BranchRestoresCurrentAtom) {
  ASSERT_TRUE(_parser.Parse("CC(C)(C)C", _m, _error)) << _error;
  EXPECT_THAT(_m.connections(1), UnorderedElementsAre(0, 2, 3, 4));
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);
}

TEST_F(TestSmilesParser, NestedBranches) {
  ASSERT_TRUE(_parser.Parse("CC(C(C)C)O", _m, _error)) << _error;
  EXPECT_THAT(_m.connections(1), UnorderedElementsAre(0, 2, 5));
  EXPECT_THAT(_m.connections(2), UnorderedElementsAre(1, 3, 4));
}

TEST_F(TestSmilesParser, Fragments) {
  ASSERT_TRUE(_parser.Parse("[Na+].[Cl-]", _m, _error)) << _error;
  EXPECT_EQ(_m.natoms(), 2);
  EXPECT_EQ(_m.nedges(), 0);
  EXPECT_EQ(_m.number_fragments(), 2);
}

TEST_F(TestSmilesParser, RingNumberReused) {
  ASSERT_TRUE(_parser.Parse("C1CC1C1CC1", _m, _error)) << _error;
  EXPECT_EQ(_m.ring_closure_bond_count(), 2);
  EXPECT_TRUE(_m.are_bonded(0, 2));
  EXPECT_TRUE(_m.are_bonded(3, 5));
}

TEST_F(TestSmilesParser, FusedRings) {
  // Naphthalene
  ASSERT_TRUE(_parser.Parse("c1ccc2ccccc2c1", _m, _error)) << _error;
  EXPECT_EQ(_m.natoms(), 10);
  EXPECT_EQ(_m.nedges(), 11);
  EXPECT_EQ(_m.implicit_hydrogen_count(), 8);
}

TEST_F(TestSmilesParser, PercentRingNumbers) {
  ASSERT_TRUE(_parser.Parse("C%10CC%10", _m, _error)) << _error;
  EXPECT_TRUE(_m.are_bonded(0, 2));

  ASSERT_TRUE(_parser.Parse("C%99CC%99", _m, _error)) << _error;
  ASSERT_TRUE(_parser.Parse("C0CC0", _m, _error)) << _error;
}

TEST_F(TestSmilesParser, DefaultBondNotAromaticWhenOneSideAliphatic) {
  ASSERT_TRUE(_parser.Parse("Cc1ccccc1", _m, _error)) << _error;
  EXPECT_TRUE(_m.bond_between(0, 1)->is_single_bond());
  EXPECT_EQ(_m.atom(0).implicit_hydrogens(), 3);
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);
}

TEST_F(TestSmilesParser, Pyrrole) {
  ASSERT_TRUE(_parser.Parse("c1cc[nH]c1", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(3).total_hydrogens(), 1);
  EXPECT_TRUE(_m.atom(3).is_aromatic());
}

TEST_F(TestSmilesParser, DirectionalBonds) {
  ASSERT_TRUE(_parser.Parse("F/C=C/F", _m, _error)) << _error;
  EXPECT_EQ(_m.bond_between(0, 1)->direction(), BondDirection::kUp);
  EXPECT_TRUE(_m.bond_between(0, 1)->is_single_bond());
  EXPECT_EQ(_m.bond_between(2, 3)->direction(), BondDirection::kUp);

  ASSERT_TRUE(_parser.Parse("F\\C=C/F", _m, _error)) << _error;
  EXPECT_EQ(_m.bond_between(0, 1)->direction(), BondDirection::kDown);
}

TEST_F(TestSmilesParser, DirectionalRingClosure) {
  ASSERT_TRUE(_parser.Parse("C/1=C/CCCCC1", _m, _error)) << _error;
  const Bond * b = _m.bond_between(0, 6);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->a1(), 0);
  EXPECT_EQ(b->direction(), BondDirection::kUp);

  ASSERT_TRUE(_parser.Parse("C1=C/CCCCC/1", _m, _error)) << _error;
  b = _m.bond_between(0, 6);
  ASSERT_NE(b, nullptr);
  EXPECT_EQ(b->direction(), BondDirection::kDown);

  ASSERT_FALSE(_parser.Parse("C/1=C/CCCCC/1", _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSemanticError);
}

TEST_F(TestSmilesParser, QuadrupleBond) {
  ASSERT_TRUE(_parser.Parse("[Re]$[Re]", _m, _error)) << _error;
  EXPECT_TRUE(_m.bond_between(0, 1)->is_quadruple_bond());
}

TEST_F(TestSmilesParser, HigherValences) {
  ASSERT_TRUE(_parser.Parse("CS(=O)(=O)C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);

  ASSERT_TRUE(_parser.Parse("CS(=O)C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);

  ASSERT_TRUE(_parser.Parse("CP(C)(C)(C)C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);

  ASSERT_TRUE(_parser.Parse("CN(=O)=O", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);
}

TEST_F(TestSmilesParser, Wildcard) {
  ASSERT_TRUE(_parser.Parse("*C(*)*", _m, _error)) << _error;
  EXPECT_TRUE(_m.atom(0).is_wildcard());
  EXPECT_EQ(_m.atom(0).implicit_hydrogens(), 0);
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 1);
}

TEST_F(TestSmilesParser, ColumnsRecorded) {
  ASSERT_TRUE(_parser.Parse("C[NH4+]Cl", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(0).column(), 0);
  EXPECT_EQ(_m.atom(1).column(), 1);
  EXPECT_EQ(_m.atom(2).column(), 7);
}

TEST_F(TestSmilesParser, ParserReusable) {
  ASSERT_FALSE(_parser.Parse("C1CC", _m, _error));
  ASSERT_TRUE(_parser.Parse("C1CC1", _m, _error)) << _error;
  EXPECT_FALSE(_error.is_set());
  EXPECT_EQ(_m.natoms(), 3);
}

TEST_F(TestSmilesParser, Build) {
  std::optional<MoleculeGraph> m = _parser.Build("OCC");
  ASSERT_TRUE(m);
  EXPECT_EQ(m->natoms(), 3);

  EXPECT_EQ(_parser.Build("C1CC"), std::nullopt);
}

struct SmilesError {
  std::string smiles;
  ParseErrorKind kind;
  int column;
};

class TestSmilesErrors : public testing::TestWithParam<SmilesError> {
  protected:
    SmilesParser _parser;
    MoleculeGraph _m;
    ParseError _error;

    void SetUp() override {
      _parser.set_display_error_messages(0);
    }
};

TEST_P(TestSmilesErrors, TestSmilesErrors) {
  const auto & params = GetParam();
  EXPECT_FALSE(_parser.Parse(params.smiles, _m, _error)) << params.smiles;
  EXPECT_EQ(_error.kind(), params.kind) << params.smiles << ' ' << _error;
  EXPECT_EQ(_error.column(), params.column) << params.smiles << ' ' << _error;
  EXPECT_EQ(_m.natoms(), 0);
}
INSTANTIATE_TEST_SUITE_P(TestSmilesErrors, TestSmilesErrors, testing::Values(
  // Lex
  SmilesError{"C!C", ParseErrorKind::kLexError, 1},
  SmilesError{"C%1", ParseErrorKind::kLexError, 1},
  SmilesError{"C%", ParseErrorKind::kLexError, 1},
  SmilesError{"CC+", ParseErrorKind::kLexError, 2},
  SmilesError{"C[C=O]", ParseErrorKind::kLexError, 3},
  SmilesError{"c1cccxc1", ParseErrorKind::kLexError, 5},

  // Syntax
  SmilesError{"C)", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C(C))C", ParseErrorKind::kSyntaxError, 4},
  SmilesError{"(C)", ParseErrorKind::kSyntaxError, 0},
  SmilesError{"C()", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C((C))", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C=(C)", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C(", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C(C.)C", ParseErrorKind::kSyntaxError, 3},
  SmilesError{"C(.)C", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"=C", ParseErrorKind::kSyntaxError, 0},
  SmilesError{"C=", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C==C", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C.=C", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C(=)C", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C=.C", ParseErrorKind::kSyntaxError, 1},
  SmilesError{".C", ParseErrorKind::kSyntaxError, 0},
  SmilesError{"C.", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C..C", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"1CC1", ParseErrorKind::kSyntaxError, 0},
  SmilesError{"C(1CC1)", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C(C)1CC1", ParseErrorKind::kSyntaxError, 4},
  SmilesError{"C.1CC1", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"C(=1)CC1", ParseErrorKind::kSyntaxError, 3},
  SmilesError{"C]", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C[CH4", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"C[]", ParseErrorKind::kSyntaxError, 1},
  SmilesError{"[C[N]]", ParseErrorKind::kSyntaxError, 2},
  SmilesError{"[CH@]", ParseErrorKind::kSyntaxError, 3},

  // Semantic
  SmilesError{"Na", ParseErrorKind::kSemanticError, 0},
  SmilesError{"CSi", ParseErrorKind::kSemanticError, 1},
  SmilesError{"[Xx]", ParseErrorKind::kSemanticError, 1},
  SmilesError{"[f]", ParseErrorKind::kSemanticError, 1},
  SmilesError{"[C++2]", ParseErrorKind::kSemanticError, 2},
  SmilesError{"[C+2+]", ParseErrorKind::kSemanticError, 4},
  SmilesError{"[C@XY1]", ParseErrorKind::kSemanticError, 2},
  SmilesError{"C11", ParseErrorKind::kSemanticError, 2},
  SmilesError{"C1C1", ParseErrorKind::kSemanticError, 3},
  SmilesError{"C12CCC12", ParseErrorKind::kSemanticError, 7},
  SmilesError{"C=1CC-1", ParseErrorKind::kSemanticError, 5},
  SmilesError{"C1CC(C2)C1", ParseErrorKind::kSemanticError, 10},
  SmilesError{"C(F)(F)(F)(F)F", ParseErrorKind::kSemanticError, 0},
  SmilesError{"CC(C)(C)(C)C", ParseErrorKind::kSemanticError, 1},
  SmilesError{"O=O=O", ParseErrorKind::kSemanticError, 2},
  SmilesError{"C#C#C", ParseErrorKind::kSemanticError, 2},
  SmilesError{"FCl(F)", ParseErrorKind::kSemanticError, 1},
  SmilesError{"[C](C)(C)(C)(C)C", ParseErrorKind::kSemanticError, 0},
  SmilesError{"[O](C)(C)C", ParseErrorKind::kSemanticError, 0},
  SmilesError{"C[O+](C)(C)C", ParseErrorKind::kSemanticError, 1}
));

TEST_F(TestSmilesParser, ScanErrorsBeforeValence) {
  // The carbon has too many bonds, but the ring is never closed, and
  // scan errors take precedence.
  ASSERT_FALSE(_parser.Parse("C(F)(F)(F)(F)F1", _m, _error));
  EXPECT_EQ(_error.message(), "ring 1 never closed");
}

TEST_F(TestSmilesParser, FirstOpenRingReported) {
  ASSERT_FALSE(_parser.Parse("C1CC2CC", _m, _error));
  EXPECT_EQ(_error.message(), "ring 1 never closed");
}

TEST_F(TestSmilesParser, ErrorMessages) {
  ASSERT_FALSE(_parser.Parse("CNa", _m, _error));
  EXPECT_EQ(_error.message(), "element 'Na' must be written in square brackets");

  ASSERT_FALSE(_parser.Parse("C11", _m, _error));
  EXPECT_EQ(_error.message(), "ring closure 1 bonds an atom to itself");

  ASSERT_FALSE(_parser.Parse("C1C1", _m, _error));
  EXPECT_EQ(_error.message(), "ring closure 1 duplicates an existing bond");

  ASSERT_FALSE(_parser.Parse("C)", _m, _error));
  EXPECT_EQ(_error.message(), "unmatched ')'");

  ASSERT_FALSE(_parser.Parse("C]", _m, _error));
  EXPECT_EQ(_error.message(), "unmatched ']'");
}

TEST_F(TestSmilesParser, RenderedError) {
  ASSERT_FALSE(_parser.Parse("C(C", _m, _error));
  EXPECT_EQ(_error.Render("C(C"), "C(C\n   ^\nSyntaxError: unclosed branch\n");
}

TEST_F(TestSmilesParser, MaxBranchDepth) {
  _parser.set_max_branch_depth(2);
  EXPECT_TRUE(_parser.Parse("C(C(C))C", _m, _error)) << _error;
  EXPECT_FALSE(_parser.Parse("C(C(C(C)))C", _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSyntaxError);
  EXPECT_EQ(_error.column(), 5);
}

TEST_F(TestSmilesParser, MaxFormalCharge) {
  EXPECT_FALSE(_parser.Parse("[C+16]", _m, _error));
  _parser.set_max_formal_charge(20);
  EXPECT_TRUE(_parser.Parse("[C+16]", _m, _error)) << _error;
}

TEST_F(TestSmilesParser, InferBracketHydrogens) {
  ASSERT_TRUE(_parser.Parse("[NH4+]C[N+](C)(C)C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(0).total_hydrogens(), 4);
  EXPECT_EQ(_m.atom(2).total_hydrogens(), 0);

  ASSERT_TRUE(_parser.Parse("C[N+]", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 3);

  ASSERT_TRUE(_parser.Parse("C[O-]", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 0);

  ASSERT_TRUE(_parser.Parse("C[C]C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).implicit_hydrogens(), 2);

  ASSERT_TRUE(_parser.Parse("[Na+].[Cl-]", _m, _error)) << _error;
  EXPECT_EQ(_m.implicit_hydrogen_count(), 0);

  // No valence for copper.
  ASSERT_TRUE(_parser.Parse("[Cu+2](C)(C)(C)(C)(C)C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(0).total_hydrogens(), 0);
}

TEST_F(TestSmilesParser, BracketAtomsAsWritten) {
  _parser.set_infer_hydrogens_on_bracket_atoms(0);
  ASSERT_TRUE(_parser.Parse("C[C]C", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(1).total_hydrogens(), 0);
  EXPECT_TRUE(_parser.Parse("[O](C)(C)C", _m, _error)) << _error;
}

TEST_F(TestSmilesParser, ValenceErrorSpansBracketAtom) {
  const std::string smiles("C[13C@@](C)(C)(C)C");
  ASSERT_FALSE(_parser.Parse(smiles, _m, _error));
  EXPECT_EQ(_error.kind(), ParseErrorKind::kSemanticError);
  EXPECT_EQ(_error.column(), 1);
  EXPECT_EQ(_error.end(), 8);
  EXPECT_EQ(_error.Render(smiles).substr(smiles.size() + 1, 9), " ^^^^^^^\n");

  ASSERT_FALSE(_parser.Parse("ClCl(Cl)", _m, _error));
  EXPECT_EQ(_error.column(), 2);
  EXPECT_EQ(_error.end(), 4);
}

TEST_F(TestSmilesParser, OrganicThenAromaticLetter) {
  // Tin needs brackets, but S followed by aromatic n is two atoms.
  ASSERT_TRUE(_parser.Parse("Sn", _m, _error)) << _error;
  ASSERT_EQ(_m.natoms(), 2);
  EXPECT_EQ(_m.atom(0).symbol(), "S");
  EXPECT_TRUE(_m.atom(1).is_aromatic());

  ASSERT_FALSE(_parser.Parse("Si", _m, _error));
  EXPECT_EQ(_error.message(), "element 'Si' must be written in square brackets");
}

TEST_F(TestSmilesParser, DotInsideBranch) {
  ASSERT_TRUE(_parser.Parse("C(C.C)C", _m, _error)) << _error;
  EXPECT_EQ(_m.natoms(), 4);
  EXPECT_EQ(_m.nedges(), 2);
  EXPECT_EQ(_m.number_fragments(), 2);
  EXPECT_TRUE(_m.are_bonded(0, 1));
  EXPECT_TRUE(_m.are_bonded(0, 3));
  EXPECT_FALSE(_m.are_bonded(1, 2));
  EXPECT_FALSE(_m.are_bonded(2, 3));

  ASSERT_TRUE(_parser.Parse("C(.CC)O", _m, _error)) << _error;
  EXPECT_EQ(_m.number_fragments(), 2);
  EXPECT_TRUE(_m.are_bonded(0, 3));
  EXPECT_TRUE(_m.are_bonded(1, 2));
}

TEST_F(TestSmilesParser, OptionsFromTextProto) {
  SmilesParserOptions proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(R"pb(
    display_error_messages: false
    max_formal_charge: 4
    max_branch_depth: 1
    infer_hydrogens_on_bracket_atoms: true
  )pb", &proto));

  SmilesParser parser(proto);
  EXPECT_EQ(parser.display_error_messages(), 0);
  EXPECT_EQ(parser.max_formal_charge(), 4);
  EXPECT_EQ(parser.max_branch_depth(), 1);

  EXPECT_FALSE(parser.Parse("[C+5]", _m, _error));
  EXPECT_FALSE(parser.Parse("C(C(C))C", _m, _error));
  ASSERT_TRUE(parser.Parse("[C]", _m, _error)) << _error;
  EXPECT_EQ(_m.atom(0).implicit_hydrogens(), 4);
}

TEST_F(TestSmilesParser, UnsetOptionsKeepDefaults) {
  SmilesParserOptions proto;
  SmilesParser parser(proto);
  EXPECT_EQ(parser.display_error_messages(), 1);
  EXPECT_EQ(parser.max_formal_charge(), 15);
  EXPECT_EQ(parser.max_branch_depth(), 0);
}

TEST(TestParseSmiles, DefaultParser) {
  MoleculeGraph m;
  ParseError error;
  ASSERT_TRUE(ParseSmiles("CC(=O)Oc1ccccc1C(=O)O", m, error)) << error;
  EXPECT_EQ(m.natoms(), 13);
  EXPECT_EQ(m.nedges(), 13);
  EXPECT_EQ(m.number_fragments(), 1);
}

// Organic subset chains with no rings or branches are paths.
class TestLinearChains : public testing::TestWithParam<std::string> {
  protected:
    SmilesParser _parser;
    MoleculeGraph _m;
    ParseError _error;
};

TEST_P(TestLinearChains, TestLinearChains) {
  const auto & params = GetParam();
  ASSERT_TRUE(_parser.Parse(params, _m, _error)) << params << ' ' << _error;
  EXPECT_EQ(_m.nedges(), _m.natoms() - 1);
  EXPECT_EQ(_m.number_fragments(), 1);
  for (int i = 1; i < _m.natoms(); ++i) {
    EXPECT_TRUE(_m.are_bonded(i - 1, i));
  }
}
INSTANTIATE_TEST_SUITE_P(TestLinearChains, TestLinearChains, testing::Values(
  "C", "CC", "CCO", "ClCBr", "C=CC#N", "NCCCCN", "OCCO", "FC(F)", "BrCCI",
  "P", "S=S", "C$C", "c:c"
));

}  // namespace
}  // namespace smigraph
