#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <vector>

#include "cpp_dftb/dftb.hpp"
#include "cpp_dftb/errors.hpp"
#include "cpp_dftb/properties.hpp"
#include "test_models.hpp"

using namespace dftb;

namespace {

DftbConfig tight_config() {
  DftbConfig config;
  config.mixer_settings.tolerance = 1e-8;
  return config;
}

Dftb2 make_dftb2(DftbConfig config = tight_config()) {
  return Dftb2(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed(),
               toy::hubbard_feed(), toy::repulsive_feed(), std::move(config));
}

} // namespace

TEST(CalculatorTest, MissingFeedsAreConfigurationErrors) {
  EXPECT_THROW(Dftb1(nullptr, toy::overlap_feed(), toy::occupation_feed()), ConfigurationError);
  EXPECT_THROW(Dftb1(toy::hamiltonian_feed(), toy::overlap_feed(), nullptr), ConfigurationError);
  EXPECT_THROW(Dftb2(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed(), nullptr),
               ConfigurationError);

  DftbConfig bad;
  bad.mixer = "pulay";
  EXPECT_THROW(make_dftb2(bad), ConfigurationError);
}

TEST(CalculatorTest, ResultLifecycle) {
  Dftb1 calc(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed());
  EXPECT_FALSE(calc.has_result());
  EXPECT_THROW(calc.result(), std::logic_error);

  const auto mols = std::vector<toy::Molecule>{toy::lih()};
  calc.compute(toy::geometry(mols), toy::orbitals(mols));
  EXPECT_TRUE(calc.has_result());
  calc.reset();
  EXPECT_FALSE(calc.has_result());
}

TEST(CalculatorTest, GeometryAndOrbitalsMustAgree) {
  Dftb1 calc(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed());
  EXPECT_THROW(calc.compute(toy::geometry({toy::lih()}), toy::orbitals({toy::h2()})),
               ConfigurationError);
  EXPECT_THROW(calc.compute(toy::geometry({toy::lih()}), toy::orbitals({toy::lih(), toy::h2()})),
               ConfigurationError);
}

TEST(Dftb1Test, SingleDiagonalisation) {
  Dftb1 calc(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed(),
             toy::repulsive_feed());
  const auto mols = std::vector<toy::Molecule>{toy::h2(), toy::h2o()};
  const DftbResult& r = calc.compute(toy::geometry(mols), toy::orbitals(mols));

  EXPECT_FALSE(r.scc);
  EXPECT_EQ(r.converged, (std::vector<bool>{true, true}));
  EXPECT_EQ(r.hamiltonian.data, r.core_hamiltonian.data);
  ASSERT_EQ(r.n_electrons.size(), 2u);
  EXPECT_NEAR(r.n_electrons[0], 2.0, 1e-12);
  EXPECT_NEAR(r.n_electrons[1], 8.0, 1e-12);
  EXPECT_EQ(r.eig_values(0, 2), 0.0);   // padding state of H2

  const BatchVector q = q_final(r, Resolution::atom);
  EXPECT_NEAR(q.row(0).sum(), 2.0, 1e-10);
  EXPECT_NEAR(q.row(1).sum(), 8.0, 1e-10);
  EXPECT_NEAR(q(0, 0), 1.0, 1e-10);      // symmetric molecule
}

TEST(Dftb2Test, ConvergesForAMixedBatch) {
  Dftb2 calc = make_dftb2();
  const auto mols = std::vector<toy::Molecule>{toy::h_atom(), toy::lih(), toy::h2o()};
  const DftbResult& r = calc.compute(toy::geometry(mols), toy::orbitals(mols));
  EXPECT_TRUE(r.scc);
  EXPECT_EQ(r.converged, (std::vector<bool>{true, true, true}));
  ASSERT_EQ(r.gamma.n, 3u);

  const BatchVector q = q_final(r, Resolution::atom);
  EXPECT_NEAR(q(1, 0), 0.533807, 1e-5);
  EXPECT_NEAR(q(2, 0), 6.9256, 1e-3);
  EXPECT_EQ(calc.mixer().name(), "anderson");
}

TEST(Dftb2Test, ZeroGammaReproducesDftb1) {
  const auto mols = std::vector<toy::Molecule>{toy::lih(), toy::h2o()};
  const Geometry geo = toy::geometry(mols);
  const OrbitalInfo orbs = toy::orbitals(mols);

  Dftb1 dftb1(toy::hamiltonian_feed(), toy::overlap_feed(), toy::occupation_feed());
  const DftbResult r1 = dftb1.compute(geo, orbs);

  Dftb2 dftb2 = make_dftb2();
  DftbCache cache;
  cache.gamma = BatchMatrix(orbs.n_systems(), orbs.res_matrix_size());
  const DftbResult& r2 = dftb2.compute(geo, orbs, &cache);

  EXPECT_EQ(r2.eig_values.data, r1.eig_values.data);
  const auto e1 = band_energy(r1), e2 = band_energy(r2);
  const auto s2 = scc_energy(r2);
  for (std::size_t b = 0; b < 2; ++b) {
    EXPECT_DOUBLE_EQ(e1[b], e2[b]);
    EXPECT_EQ(s2[b], 0.0);
  }
}

TEST(Dftb2Test, GradModes) {
  const auto mols = std::vector<toy::Molecule>{toy::lih()};
  const Geometry geo = toy::geometry(mols);
  const OrbitalInfo orbs = toy::orbitals(mols);

  DftbConfig direct = tight_config();
  direct.grad_mode = GradMode::direct;
  Dftb2 a = make_dftb2(direct);
  Dftb2 b = make_dftb2();
  const BatchVector qa = q_final(a.compute(geo, orbs), Resolution::atom);
  const BatchVector qb = q_final(b.compute(geo, orbs), Resolution::atom);
  EXPECT_NEAR(qa(0, 0), qb(0, 0), 1e-7);

  DftbConfig implicit = tight_config();
  implicit.grad_mode = GradMode::implicit;
  Dftb2 c = make_dftb2(implicit);
  EXPECT_THROW(c.compute(geo, orbs), NotImplementedError);
}

TEST(Dftb2Test, WarmStartFromCache) {
  const auto mols = std::vector<toy::Molecule>{toy::lih()};
  const Geometry geo = toy::geometry(mols);
  const OrbitalInfo orbs = toy::orbitals(mols);

  Dftb2 calc = make_dftb2();
  const BatchVector q = q_final(calc.compute(geo, orbs), Resolution::atom);

  DftbCache cache;
  cache.q_initial = q;
  const DftbResult& r = calc.compute(geo, orbs, &cache);
  EXPECT_TRUE(r.converged[0]);
  EXPECT_NEAR(q_final(r, Resolution::atom)(0, 0), q(0, 0), 1e-7);

  cache.q_initial = BatchVector(1, 4);
  EXPECT_THROW(calc.compute(geo, orbs, &cache), std::invalid_argument);
}

TEST(Dftb2Test, ConvergenceFailureIsOptIn) {
  const auto mols = std::vector<toy::Molecule>{toy::h_atom(), toy::lih()};
  const Geometry geo = toy::geometry(mols);
  const OrbitalInfo orbs = toy::orbitals(mols);

  DftbConfig config = tight_config();
  config.max_scc_iter = 2;
  Dftb2 strict = make_dftb2(config);
  EXPECT_THROW(strict.compute(geo, orbs), ConvergenceError);
  EXPECT_FALSE(strict.has_result());

  config.suppress_scc_error = true;
  Dftb2 lenient = make_dftb2(config);
  const DftbResult& r = lenient.compute(geo, orbs);
  EXPECT_EQ(r.converged, (std::vector<bool>{true, false}));
}

TEST(Dftb2Test, PreconfiguredMixerInstance) {
  DftbConfig config = tight_config();
  config.mixer_instance = std::make_shared<SimpleMixer>(true, 0.3, 1e-8);
  config.max_scc_iter = 400;
  Dftb2 calc = make_dftb2(config);
  EXPECT_EQ(calc.mixer().name(), "simple");

  const auto mols = std::vector<toy::Molecule>{toy::lih()};
  const DftbResult& r = calc.compute(toy::geometry(mols), toy::orbitals(mols));
  EXPECT_TRUE(r.converged[0]);
}

TEST(Dftb2Test, ShellResolvedGaussianGamma) {
  DftbConfig config = tight_config();
  config.gamma_scheme = GammaScheme::gaussian;
  config.filling_temp = 0.0036749;
  Dftb2 calc = make_dftb2(config);

  const auto mols = std::vector<toy::Molecule>{toy::h2o(), toy::h2()};
  const DftbResult& r = calc.compute(toy::geometry(mols), toy::orbitals(mols, true));
  EXPECT_EQ(r.converged, (std::vector<bool>{true, true}));
  ASSERT_EQ(r.gamma.n, 4u);
  const BatchVector shells = q_final(r, Resolution::shell);
  EXPECT_NEAR(shells.row(0).sum(), 8.0, 1e-9);
  EXPECT_NEAR(shells(1, 0), 1.0, 1e-8);
}
