/**
 * @file test_column_builder.cpp
 * @brief Unit tests for partial-bottom-cell column construction
 */

#include <gtest/gtest.h>
#include "vertical_grid.hpp"

#include <stdexcept>

using namespace itide;

namespace {

double active_thickness(const CellColumn& col)
{
    double sum = 0.0;
    for (int k = 0; k <= col.maxLevel; ++k)
        sum += col.layerThickness[static_cast<std::size_t>(k)];
    return sum;
}

} // namespace

class ColumnBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        ref = build_reference_column(5000.0, 50);
    }

    ReferenceColumn ref;
};

TEST_F(ColumnBuilderTest, MaxLevelOnLayerBoundary) {
    // 4000 m sits exactly on the bottom of level 39, so level 39 is a full cell
    EXPECT_EQ(find_max_level(ref, 4000.0), 39);
    CellColumn col = build_column(ref, 4000.0, 0.0);
    EXPECT_EQ(col.maxLevel, 39);
    EXPECT_DOUBLE_EQ(col.layerThickness[39], 100.0);
    EXPECT_DOUBLE_EQ(col.zMid[39], -3950.0);
}

TEST_F(ColumnBuilderTest, PartialBottomCell) {
    CellColumn col = build_column(ref, 4050.0, 0.0);
    EXPECT_EQ(col.maxLevel, 40);
    EXPECT_DOUBLE_EQ(col.layerThickness[40], 50.0);
    EXPECT_DOUBLE_EQ(col.zMid[40], -4025.0);
    EXPECT_DOUBLE_EQ(col.zMid[39], -3950.0);
    EXPECT_DOUBLE_EQ(col.zMid[1], -150.0);
}

TEST_F(ColumnBuilderTest, ThicknessSumsToWaterColumn) {
    const double depths[] = {100.5, 150.0, 2345.6, 3999.9, 4000.0, 4731.25, 5000.0};
    const double sshs[]   = {0.0, 0.25, 1.0, -0.5};
    for (double d : depths) {
        for (double s : sshs) {
            CellColumn col = build_column(ref, d, s);
            EXPECT_NEAR(active_thickness(col), d + s, 1e-9) << "depth " << d << " ssh " << s;
        }
    }
}

TEST_F(ColumnBuilderTest, InteriorLevelsTakeReferenceThickness) {
    CellColumn col = build_column(ref, 3210.0, 0.4);
    ASSERT_EQ(col.maxLevel, 32);
    for (int k = 1; k < col.maxLevel; ++k)
        EXPECT_DOUBLE_EQ(col.layerThickness[static_cast<std::size_t>(k)], 100.0) << "level " << k;
    EXPECT_DOUBLE_EQ(col.layerThickness[0], 100.4);
    EXPECT_NEAR(col.layerThickness[32], 10.0, 1e-9);
}

TEST_F(ColumnBuilderTest, SurfaceLayerCarriesSsh) {
    const double ssh = 0.75;
    CellColumn col = build_column(ref, 4500.0, ssh);
    EXPECT_DOUBLE_EQ(col.layerThickness[0], 100.0 + ssh);
    EXPECT_NEAR(col.zMid[0], ssh - 0.5 * col.layerThickness[0], 1e-9);

    for (int k = 1; k <= col.maxLevel; ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_LT(col.zMid[i], col.zMid[i - 1]);
    }
}

TEST_F(ColumnBuilderTest, RestingThicknessRemovesSsh) {
    CellColumn col = build_column(ref, 4321.0, 0.6);
    EXPECT_DOUBLE_EQ(col.restingThickness[0], 100.0);
    for (int k = 1; k <= col.maxLevel; ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_DOUBLE_EQ(col.restingThickness[i], col.layerThickness[i]);
    }
    double resting = 0.0;
    for (int k = 0; k <= col.maxLevel; ++k)
        resting += col.restingThickness[static_cast<std::size_t>(k)];
    EXPECT_NEAR(resting, 4321.0, 1e-9);
}

TEST_F(ColumnBuilderTest, InactiveLevelsHoldFill) {
    CellColumn col = build_column(ref, 1050.0, 0.1);
    ASSERT_EQ(col.maxLevel, 10);
    for (int k = col.maxLevel + 1; k < ref.n_levels(); ++k) {
        const auto i = static_cast<std::size_t>(k);
        EXPECT_FALSE(col.is_active(k));
        EXPECT_DOUBLE_EQ(col.layerThickness[i], FILL_3D);
        EXPECT_DOUBLE_EQ(col.restingThickness[i], FILL_3D);
        EXPECT_DOUBLE_EQ(col.zMid[i], FILL_3D);
    }
}

TEST_F(ColumnBuilderTest, SeafloorInSecondLevel) {
    CellColumn col = build_column(ref, 100.5, 0.2);
    EXPECT_EQ(col.maxLevel, 1);
    EXPECT_NEAR(col.layerThickness[1], 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(col.layerThickness[0], 100.2);
    EXPECT_NEAR(active_thickness(col), 100.7, 1e-9);
}

TEST_F(ColumnBuilderTest, SeafloorBelowReferenceGridDeepensLastCell) {
    CellColumn col = build_column(ref, 6000.0, 0.0);
    EXPECT_EQ(col.maxLevel, 49);
    EXPECT_DOUBLE_EQ(col.layerThickness[49], 1100.0);
    EXPECT_NEAR(active_thickness(col), 6000.0, 1e-9);
}

TEST_F(ColumnBuilderTest, ShallowSeafloorIsRejected) {
    EXPECT_EQ(find_max_level(ref, 100.0), -1);
    EXPECT_EQ(find_max_level(ref, 20.0), -1);
    EXPECT_THROW(build_column(ref, 100.0, 0.0), std::domain_error);
    EXPECT_THROW(build_column(ref, 20.0, 0.5), std::domain_error);
}
