/**
 * @file test_tracers.cpp
 * @brief Unit tests for tracer initialization and the linear EOS
 */

#include <gtest/gtest.h>
#include "tracers.hpp"

using namespace itide;

TEST(LinearEos, ReferenceState) {
    LinearEos eos;
    EXPECT_DOUBLE_EQ(eos.density(10.0, 35.0), 1000.0);
    EXPECT_DOUBLE_EQ(eos.temperature(1000.0, 35.0), 10.0);
}

TEST(LinearEos, WarmerIsLighterSaltierIsDenser) {
    LinearEos eos;
    EXPECT_LT(eos.density(12.0, 35.0), eos.density(10.0, 35.0));
    EXPECT_GT(eos.density(10.0, 36.0), eos.density(10.0, 35.0));
    EXPECT_NEAR(eos.density(11.0, 35.0), 999.8, 1e-12);
}

TEST(LinearEos, TemperatureInvertsDensity) {
    LinearEos eos;
    const double rhos[] = {999.0, 1000.0, 1000.5, 1001.0};
    for (double rho : rhos)
        EXPECT_NEAR(eos.density(eos.temperature(rho, eos.Sref), eos.Sref), rho, 1e-10);
}

class TracerInitTest : public ::testing::Test {
protected:
    void SetUp() override {
        ref = build_reference_column(5000.0, 50);
        col = build_column(ref, 2550.0, 0.3);
        initialize_tracers(col, TracerParams{}, LinearEos{});
    }

    ReferenceColumn ref;
    CellColumn col;
};

TEST_F(TracerInitTest, ActiveLevelsFollowStratification) {
    ASSERT_EQ(col.maxLevel, 25);
    TracerParams tp;
    LinearEos eos;
    for (int k = 0; k <= col.maxLevel; ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_DOUBLE_EQ(col.salinity[i], 35.0);
        EXPECT_DOUBLE_EQ(col.density[i], tp.rho0 + tp.rhoz * col.zMid[i]);
        EXPECT_NEAR(eos.density(col.temperature[i], col.salinity[i]), col.density[i], 1e-10);
    }
}

TEST_F(TracerInitTest, DensityIncreasesWithDepth) {
    for (int k = 1; k <= col.maxLevel; ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_GT(col.density[i], col.density[i - 1]);
        EXPECT_GT(col.temperature[i - 1], col.temperature[i]);
    }
}

TEST_F(TracerInitTest, InactiveLevelsKeepFill) {
    for (int k = col.maxLevel + 1; k < ref.n_levels(); ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_DOUBLE_EQ(col.salinity[i], FILL_3D);
        EXPECT_DOUBLE_EQ(col.density[i], FILL_3D);
        EXPECT_DOUBLE_EQ(col.temperature[i], FILL_3D);
    }
}

TEST(TracerInit, CustomProfile) {
    ReferenceColumn ref = build_reference_column(1000.0, 10);
    CellColumn col = build_column(ref, 1000.0, 0.0);

    TracerParams tp;
    tp.S0 = 34.0;
    tp.rho0 = 1025.0;
    tp.rhoz = -1.0e-3;
    LinearEos eos;
    eos.Sref = 34.0;
    eos.densityRef = 1025.0;
    initialize_tracers(col, tp, eos);

    EXPECT_DOUBLE_EQ(col.zMid[0], -50.0);
    EXPECT_DOUBLE_EQ(col.density[0], 1025.05);
    EXPECT_DOUBLE_EQ(col.salinity[9], 34.0);
    EXPECT_NEAR(col.temperature[0], 10.0 - 0.05 / 0.2, 1e-10);
}

TEST(LinearEos, InversionAwayFromReferenceSalinity) {
    LinearEos eos;
    // S - Sref = -5 lowers density by beta * 5 = 4 kg/m^3 at fixed T
    EXPECT_NEAR(eos.temperature(996.0, 30.0), 10.0, 1e-12);
    EXPECT_NEAR(eos.density(eos.temperature(1000.21, 30.0), 30.0), 1000.21, 1e-10);
}

TEST(TracerInit, SalinityAwayFromReferenceStaysConsistent) {
    ReferenceColumn ref = build_reference_column(5000.0, 50);
    CellColumn col = build_column(ref, 4321.0, 0.2);

    TracerParams tp;
    tp.S0 = 30.0;
    LinearEos eos;
    initialize_tracers(col, tp, eos);

    for (int k = 0; k <= col.maxLevel; ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_DOUBLE_EQ(col.salinity[i], 30.0);
        EXPECT_DOUBLE_EQ(col.density[i], tp.rho0 + tp.rhoz * col.zMid[i]);
        EXPECT_NEAR(eos.density(col.temperature[i], col.salinity[i]), col.density[i], 1e-10)
            << "level " << k;
    }
}
