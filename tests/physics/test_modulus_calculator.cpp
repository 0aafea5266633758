#include <gtest/gtest.h>
#include "beamvib/modulus.hpp"
#include "beamvib/constants.hpp"
#include "support/synthetic_signals.hpp"
#include <cmath>
#include <limits>

using namespace beamvib;
using namespace beamvib::physics;
using beamvib::testing::rig_geometry;

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();
constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

}  // namespace

// ─── Section properties ───────────────────────────────────────────────────────

TEST(Modulus_Section, SecondMomentOfArea) {
    // 25.5 mm × 0.8 mm: I = w·t³/12
    EXPECT_NEAR(ModulusCalculator::second_moment_of_area(rig_geometry()),
                0.0255 * 0.0008 * 0.0008 * 0.0008 / 12.0, 1e-25);
}

TEST(Modulus_Section, CrossSectionArea) {
    EXPECT_NEAR(ModulusCalculator::cross_section_area(rig_geometry()), 2.04e-5, 1e-18);
}

// ─── compute_modulus ──────────────────────────────────────────────────────────

TEST(Modulus_Compute, ReferenceValue) {
    const auto E = ModulusCalculator::compute_modulus(12.34, 0.12, rig_geometry());
    ASSERT_TRUE(E.has_value());
    EXPECT_NEAR(*E, 14558130110.515633, 14558130110.515633 * 1e-9);
}

TEST(Modulus_Compute, ScalesWithFrequencySquared) {
    const auto E1 = ModulusCalculator::compute_modulus(10.0, 0.15, rig_geometry());
    const auto E2 = ModulusCalculator::compute_modulus(20.0, 0.15, rig_geometry());
    ASSERT_TRUE(E1.has_value());
    ASSERT_TRUE(E2.has_value());
    EXPECT_NEAR(*E2 / *E1, 4.0, 1e-12);
}

TEST(Modulus_Compute, ScalesWithLengthToTheFourth) {
    const auto E1 = ModulusCalculator::compute_modulus(10.0, 0.1, rig_geometry());
    const auto E2 = ModulusCalculator::compute_modulus(10.0, 0.2, rig_geometry());
    ASSERT_TRUE(E1.has_value());
    ASSERT_TRUE(E2.has_value());
    EXPECT_NEAR(*E2 / *E1, 16.0, 1e-12);
}

TEST(Modulus_Compute, ThicknessEntersInverseSquare) {
    // ρA/I = 12ρ/t², independent of width.
    BeamGeometry thick = rig_geometry();
    thick.thickness_m *= 2.0;
    BeamGeometry wide = rig_geometry();
    wide.width_m *= 3.0;

    const auto E_ref   = ModulusCalculator::compute_modulus(10.0, 0.1, rig_geometry());
    const auto E_thick = ModulusCalculator::compute_modulus(10.0, 0.1, thick);
    const auto E_wide  = ModulusCalculator::compute_modulus(10.0, 0.1, wide);
    ASSERT_TRUE(E_ref && E_thick && E_wide);
    EXPECT_NEAR(*E_thick / *E_ref, 0.25, 1e-12);
    EXPECT_NEAR(*E_wide / *E_ref, 1.0, 1e-12);
}

TEST(Modulus_Compute, NonPositiveFrequencyRejected) {
    EXPECT_FALSE(ModulusCalculator::compute_modulus(0.0, 0.12, rig_geometry()).has_value());
    EXPECT_FALSE(ModulusCalculator::compute_modulus(-5.0, 0.12, rig_geometry()).has_value());
}

TEST(Modulus_Compute, NonPositiveLengthRejected) {
    EXPECT_FALSE(ModulusCalculator::compute_modulus(12.0, 0.0, rig_geometry()).has_value());
    EXPECT_FALSE(ModulusCalculator::compute_modulus(12.0, -0.1, rig_geometry()).has_value());
}

TEST(Modulus_Compute, NonFiniteInputsRejected) {
    EXPECT_FALSE(ModulusCalculator::compute_modulus(NaN, 0.12, rig_geometry()).has_value());
    EXPECT_FALSE(ModulusCalculator::compute_modulus(INF, 0.12, rig_geometry()).has_value());
    EXPECT_FALSE(ModulusCalculator::compute_modulus(12.0, NaN, rig_geometry()).has_value());
}

TEST(Modulus_Compute, InvalidGeometryRejected) {
    for (auto mutate : {+[](BeamGeometry& g) { g.width_m = 0.0; },
                        +[](BeamGeometry& g) { g.thickness_m = -0.001; },
                        +[](BeamGeometry& g) { g.density_kg_m3 = 0.0; },
                        +[](BeamGeometry& g) { g.density_kg_m3 = NaN; }}) {
        BeamGeometry g = rig_geometry();
        mutate(g);
        EXPECT_FALSE(ModulusCalculator::is_valid(g));
        EXPECT_FALSE(ModulusCalculator::compute_modulus(12.0, 0.12, g).has_value());
    }
}

TEST(Modulus_Compute, OverflowRejected) {
    EXPECT_FALSE(ModulusCalculator::compute_modulus(1e200, 1e100, rig_geometry()).has_value());
}

// ─── natural_frequency ────────────────────────────────────────────────────────

TEST(Modulus_NaturalFrequency, InvertsComputeModulus) {
    for (double L : {0.12, 0.16, 0.20}) {
        const auto f = ModulusCalculator::natural_frequency(200e9, L, rig_geometry());
        ASSERT_TRUE(f.has_value());
        const auto E = ModulusCalculator::compute_modulus(*f, L, rig_geometry());
        ASSERT_TRUE(E.has_value());
        EXPECT_NEAR(*E, 200e9, 200e9 * 1e-12) << "L=" << L;
    }
}

TEST(Modulus_NaturalFrequency, SteelBeamsOnTheRig) {
    const auto f120 = ModulusCalculator::natural_frequency(200e9, 0.12, rig_geometry());
    const auto f200 = ModulusCalculator::natural_frequency(200e9, 0.20, rig_geometry());
    ASSERT_TRUE(f120 && f200);
    EXPECT_NEAR(*f120, 45.738, 0.01);
    EXPECT_NEAR(*f200, 16.466, 0.01);
}

TEST(Modulus_NaturalFrequency, NonPositiveModulusRejected) {
    EXPECT_FALSE(ModulusCalculator::natural_frequency(0.0, 0.12, rig_geometry()).has_value());
}

// ─── to_gigapascals ───────────────────────────────────────────────────────────

TEST(Modulus_Units, PascalsToGigapascals) {
    static_assert(ModulusCalculator::to_gigapascals(2e9) == 2.0);
    EXPECT_DOUBLE_EQ(ModulusCalculator::to_gigapascals(14558130110.515633), 14.558130110515633);
}
