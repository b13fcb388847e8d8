#include <gtest/gtest.h>

#include <vector>

#include "cpp_dftb/batch.hpp"
#include "cpp_dftb/geometry.hpp"
#include "cpp_dftb/errors.hpp"
#include "test_models.hpp"

using namespace dftb;

TEST(BatchTest, SelectReordersAndRetightens) {
  BatchVector v(3, 4);
  for (std::size_t b = 0; b < 3; ++b)
    for (std::size_t i = 0; i < 4; ++i) v(b, i) = 10.0 * b + i;

  const std::vector<std::size_t> idx{2, 0};
  BatchVector s = v.select(idx, 2);
  ASSERT_EQ(s.nbatch, 2u);
  ASSERT_EQ(s.n, 2u);
  EXPECT_EQ(s(0, 0), 20.0);
  EXPECT_EQ(s(0, 1), 21.0);
  EXPECT_EQ(s(1, 0), 0.0);
  EXPECT_EQ(s(1, 1), 1.0);

  // Widening zero-fills
  BatchVector w = v.select(idx, 6);
  EXPECT_EQ(w(0, 3), 23.0);
  EXPECT_EQ(w(0, 5), 0.0);
}

TEST(BatchTest, MatrixWriteSystemUsesOwnSize) {
  BatchMatrix src(1, 2);
  src(0, 0, 0) = 1.0; src(0, 0, 1) = 2.0;
  src(0, 1, 0) = 3.0; src(0, 1, 1) = 4.0;

  BatchMatrix dst(3, 4);
  dst.block(1).setConstant(-1.0);
  src.write_system(0, dst, 1, 2);
  EXPECT_EQ(dst(1, 1, 0), 3.0);
  EXPECT_EQ(dst(1, 3, 3), 0.0);
  EXPECT_EQ(dst(0, 0, 0), 0.0);

  EXPECT_THROW(src.write_system(0, dst, 3, 2), std::out_of_range);
  EXPECT_THROW(src.write_system(0, dst, 0, 3), std::out_of_range);
}

TEST(BatchTest, ExpandToOrbitals) {
  Eigen::VectorXd values(2);
  values << 0.5, -1.0;
  const Eigen::VectorXd out = expand_to_orbitals(values, {1, 3}, 6);
  ASSERT_EQ(out.size(), 6);
  EXPECT_EQ(out(0), 0.5);
  EXPECT_EQ(out(1), -1.0);
  EXPECT_EQ(out(3), -1.0);
  EXPECT_EQ(out(4), 0.0);
  EXPECT_THROW(expand_to_orbitals(values, {1, 3}, 3), std::out_of_range);
}

TEST(GeometryTest, DistancesArePaddedWithZeros) {
  const Geometry g = toy::geometry({toy::h_atom(), toy::h2o()});
  ASSERT_EQ(g.n_systems(), 2u);
  EXPECT_EQ(g.max_atoms(), 3u);

  const BatchMatrix r = g.distances();
  const BatchMatrix ir = g.inverse_distances();
  EXPECT_NEAR(r(1, 0, 1), 1.8, 1e-12);
  EXPECT_NEAR(ir(1, 1, 0), 1.0 / 1.8, 1e-12);
  EXPECT_EQ(r(0, 0, 0), 0.0);
  EXPECT_EQ(ir(0, 1, 1), 0.0);
  EXPECT_EQ(ir(1, 2, 2), 0.0);
}

TEST(GeometryTest, TrailingZerosArePadding) {
  const std::vector<Eigen::Vector3d> pos{Eigen::Vector3d(0.0, 0.0, 0.0),
                                         Eigen::Vector3d(1.4, 0.0, 0.0),
                                         Eigen::Vector3d(0.0, 0.0, 0.0)};
  const std::vector<std::vector<int>> padded{std::vector<int>{1, 1, 0}};
  const Geometry g(padded, std::vector<std::vector<Eigen::Vector3d>>{pos});
  EXPECT_EQ(g.n_atoms(0), 2u);

  const std::vector<std::vector<int>> interior{std::vector<int>{1, 0, 1}};
  EXPECT_THROW(Geometry(interior, std::vector<std::vector<Eigen::Vector3d>>{pos}),
               ConfigurationError);
}

TEST(GeometryTest, SelectKeepsListedSystemsInOrder) {
  const Geometry g = toy::geometry({toy::h2o(), toy::h_atom(), toy::lih()});
  const std::vector<std::size_t> idx{2, 1};
  const Geometry sub = g.select(idx);

  ASSERT_EQ(sub.n_systems(), 2u);
  EXPECT_EQ(sub.atomic_numbers(0), (std::vector<int>{3, 1}));
  EXPECT_EQ(sub.atomic_numbers(1), (std::vector<int>{1}));
  EXPECT_EQ(sub.max_atoms(), 2u);

  const BatchMatrix r = sub.distances();
  ASSERT_EQ(r.n, 2u);
  EXPECT_NEAR(r(0, 0, 1), 3.0, 1e-12);
  EXPECT_EQ(r(1, 0, 1), 0.0);
}
