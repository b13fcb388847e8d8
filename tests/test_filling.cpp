#include <gtest/gtest.h>

#include <vector>

#include "cpp_dftb/filling.hpp"

using namespace dftb;

namespace {

Eigen::VectorXd levels() {
  Eigen::VectorXd e(4);
  e << -0.6, -0.3, -0.25, 0.2;
  return e;
}

} // namespace

TEST(FillingTest, SmearingIsHalfAtTheFermiLevel) {
  EXPECT_DOUBLE_EQ(fermi_smearing(0.1, 0.1, 0.01), 0.5);
  EXPECT_DOUBLE_EQ(gaussian_smearing(0.1, 0.1, 0.01), 0.5);
  EXPECT_EQ(fermi_smearing(10.0, 0.0, 0.01), 0.0);
  EXPECT_EQ(fermi_smearing(-10.0, 0.0, 0.01), 1.0);
}

TEST(FillingTest, ZeroTemperatureMeansAufbau) {
  FillingSettings s{FillingScheme::gaussian, 0.0};
  EXPECT_EQ(s.effective(), FillingScheme::aufbau);
  s.temperature = 0.01;
  EXPECT_EQ(s.effective(), FillingScheme::gaussian);
}

TEST(FillingTest, AufbauFillsLowestStates) {
  const Eigen::VectorXd w = aufbau_filling(levels(), 3.0);
  EXPECT_DOUBLE_EQ(w(0), 1.0);
  EXPECT_DOUBLE_EQ(w(1), 0.5);
  EXPECT_DOUBLE_EQ(w(2), 0.0);

  const FillingSettings aufbau{FillingScheme::fermi, 0.0};
  EXPECT_DOUBLE_EQ(fermi_search(aufbau, levels(), 4.0), -0.275);
  EXPECT_EQ(entropy_term(aufbau, levels(), -0.275), 0.0);
}

TEST(FillingTest, FermiSearchConservesElectrons) {
  for (FillingScheme scheme : {FillingScheme::fermi, FillingScheme::gaussian}) {
    const FillingSettings s{scheme, 0.02};
    const double ef = fermi_search(s, levels(), 4.0);
    const Eigen::VectorXd w = fill(s, levels(), ef, 4.0);
    EXPECT_NEAR(2.0 * w.sum(), 4.0, 1e-9);
    EXPECT_GT(ef, -0.3);
    EXPECT_LT(ef, -0.25);
    EXPECT_GT(entropy_term(s, levels(), ef), 0.0);
  }
}

TEST(FillingTest, FermiSearchBracketsAnOddElectronCount) {
  const FillingSettings s{FillingScheme::fermi, 0.01};
  const double ef = fermi_search(s, levels(), 3.0);
  EXPECT_NEAR(2.0 * fill(s, levels(), ef, 3.0).sum(), 3.0, 1e-10);
  EXPECT_GT(ef, levels().minCoeff());
  EXPECT_LT(ef, levels().maxCoeff());
}

TEST(FillingTest, BatchOccupanciesLeavePaddingEmpty) {
  BatchVector eig(2, 4);
  eig.row(0) = levels();
  eig(1, 0) = -0.5;
  eig(1, 1) = 0.1;   // system 1 has two real states

  const FillingSettings s{FillingScheme::fermi, 0.01};
  const std::vector<double> n_e{4.0, 2.0};
  const std::vector<std::size_t> n_states{4, 2};
  const BatchVector occ = occupancies(s, eig, n_e, n_states);
  EXPECT_NEAR(occ.row(0).sum(), 4.0, 1e-9);
  EXPECT_NEAR(occ.row(1).sum(), 2.0, 1e-9);
  EXPECT_EQ(occ(1, 2), 0.0);
  EXPECT_EQ(occ(1, 3), 0.0);
}
