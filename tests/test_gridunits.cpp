#include <gtest/gtest.h>
#include <cmath>
#include "gridunits.hpp"
#include "utils.h"

namespace {

SampleTable positionsTable(const std::vector<double>& xs, const std::vector<double>& ys) {
    SampleTable t;
    SampleTable::Column cx, cy;
    for (double v : xs) cx.push_back(v);
    for (double v : ys) cy.push_back(v);
    t.addColumn("x [px]", cx);
    t.addColumn("y [px]", cy);
    return t;
}

// Coordinates of a full nx x ny grid at the given spacing and origin
SampleTable gridTable(int32_t nx, int32_t ny, double step, double x0, double y0) {
    std::vector<double> xs, ys;
    for (int32_t j = 0; j < ny; ++j) {
        for (int32_t i = 0; i < nx; ++i) {
            xs.push_back(x0 + i * step);
            ys.push_back(y0 + j * step);
        }
    }
    return positionsTable(xs, ys);
}

class GridUnitsTest : public ::testing::Test {
protected:
    void SetUp() override {
        logger::Logger::getInstance().setLevel(logger::LogLevel::WARNING);
    }
};

} // namespace

TEST_F(GridUnitsTest, GcdOfExactMultiples) {
    EXPECT_DOUBLE_EQ(gcdFp(3.0, 1.5), 1.5);
    EXPECT_DOUBLE_EQ(gcdFp(4.5, 3.0), 1.5);
    EXPECT_DOUBLE_EQ(gcdFp(12.0, 18.0), 6.0);
}

TEST_F(GridUnitsTest, GcdWithZero) {
    EXPECT_DOUBLE_EQ(gcdFp(0.0, 1.5), 1.5);
    EXPECT_DOUBLE_EQ(gcdFp(1.5, 0.0), 1.5);
}

TEST_F(GridUnitsTest, GcdRemainderFollowsDivisorSign) {
    EXPECT_DOUBLE_EQ(gcdFp(-3.0, 2.0), 1.0);
    EXPECT_DOUBLE_EQ(gcdFp(3.0, -2.0), -1.0);
    EXPECT_DOUBLE_EQ(gcdFp(-4.5, -3.0), -1.5);
}

TEST_F(GridUnitsTest, GcdRounding) {
    // 0.7 and 0.3 are not exact in binary; rounding recovers 0.1
    double g = gcdFp(0.7, 0.3, 1e-5, 1e-10, 12);
    EXPECT_DOUBLE_EQ(g, 0.1);
    double raw = gcdFp(0.7, 0.3);
    EXPECT_NEAR(raw, 0.1, 1e-9);
}

TEST_F(GridUnitsTest, ConversionFactorRoundTrip) {
    const std::vector<std::pair<double, double>> cases = {
        {0.65, 12.3}, {1.5, 2.0}, {0.1, 0.0}, {2.5, -7.25}, {0.325, 100.1}};
    for (const auto& c : cases) {
        SampleTable t = gridTable(40, 40, c.first, c.second, c.second);
        EXPECT_DOUBLE_EQ(findConversionFactor(t, "x [px]", "y [px]"), c.first)
            << "step " << c.first << " origin " << c.second;
    }
}

TEST_F(GridUnitsTest, ConversionFactorIgnoresRowOrder) {
    SampleTable t = positionsTable({6.5, 2, 5, 3.5}, {2.5, 1, 2.5, 1});
    EXPECT_DOUBLE_EQ(findConversionFactor(t, "x [px]", "y [px]"), 1.5);
}

TEST_F(GridUnitsTest, ConversionFactorAxesDisagree) {
    SampleTable t = positionsTable({0, 2, 4, 6}, {0, 3, 6, 9});
    EXPECT_THROW(findConversionFactor(t, "x [px]", "y [px]"), ConsistencyError);
}

TEST_F(GridUnitsTest, ConversionFactorDegenerate) {
    // all y identical: the y axis has no step
    SampleTable t = positionsTable({0, 1, 2, 3}, {5, 5, 5, 5});
    EXPECT_THROW(findConversionFactor(t, "x [px]", "y [px]"), DomainError);
    SampleTable one = positionsTable({1}, {1});
    EXPECT_THROW(findConversionFactor(one, "x [px]", "y [px]"), DomainError);
}

TEST_F(GridUnitsTest, ConversionFactorMissingColumn) {
    SampleTable t = positionsTable({0, 1}, {0, 1});
    EXPECT_THROW(findConversionFactor(t, "x [um]", "y [px]"), SchemaError);
}

TEST_F(GridUnitsTest, RescalePositions) {
    SampleTable t = positionsTable({2, 3.5, 5, 6.5}, {1, 1, 2.5, 2.5});
    SampleTable r = rescalePositions(t, GridScale::fromStepSize(3, 0.5).factor(), "x [px]", "y [px]");
    const std::vector<double> ex = {0, 1, 2, 3}, ey = {0, 0, 1, 1};
    for (size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(*r.column("x [px]")[i], ex[i]);
        EXPECT_EQ(*r.column("y [px]")[i], ey[i]);
    }
    // the input is left untouched
    EXPECT_EQ(*t.column("x [px]")[0], 2);
}

TEST_F(GridUnitsTest, RescaleValuesAreIntegers) {
    SampleTable t = gridTable(7, 5, 0.65, 12.3, 3.1);
    SampleTable r = GridScale::fromConversionFactor(0.65).rescale(t, ColumnNames());
    for (const auto& name : {"x [px]", "y [px]"}) {
        for (const auto& v : r.column(name)) {
            ASSERT_TRUE(v.has_value());
            EXPECT_EQ(*v, std::floor(*v));
        }
    }
    EXPECT_EQ(*r.column("x [px]").back(), 6);
    EXPECT_EQ(*r.column("y [px]").back(), 4);
}

TEST_F(GridUnitsTest, RescaleSnapsValuesJustBelowAnInteger) {
    SampleTable t = positionsTable({0, 2.9999999, 6}, {0, 3, 6});
    SampleTable r = rescalePositions(t, 3.0, "x [px]", "y [px]");
    EXPECT_EQ(*r.column("x [px]")[1], 1);
}

TEST_F(GridUnitsTest, RescaleWrongFactor) {
    SampleTable t = positionsTable({2, 3.5, 5, 6.5}, {1, 1, 2.5, 2.5});
    EXPECT_THROW(rescalePositions(t, 1.0, "x [px]", "y [px]"), DomainError);
}

TEST_F(GridUnitsTest, RescaleRejectsNonPositiveFactor) {
    SampleTable t = positionsTable({2, 3.5}, {1, 1});
    EXPECT_THROW(rescalePositions(t, 0.0, "x [px]", "y [px]"), DomainError);
    EXPECT_THROW(rescalePositions(t, -0.2, "x [px]", "y [px]"), DomainError);
    EXPECT_THROW(GridScale::fromStepSize(0, 0.5), DomainError);
    EXPECT_THROW(GridScale::fromStepSize(3, -0.2), DomainError);
    EXPECT_THROW(GridScale::fromConversionFactor(0.0), DomainError);
}

TEST_F(GridUnitsTest, RescaleRejectsMissingPositions) {
    SampleTable t;
    t.addColumn("x [px]", {0.0, std::nullopt, 2.0});
    t.addColumn("y [px]", {0.0, 1.0, 2.0});
    EXPECT_THROW(rescalePositions(t, 1.0, "x [px]", "y [px]"), DomainError);
}

TEST_F(GridUnitsTest, ResolvePrecedence) {
    SampleTable t = positionsTable({2, 3.5, 5, 6.5}, {1, 1, 2.5, 2.5});
    ColumnNames cols;
    GridScale legacy = GridScale::resolve(t, cols, 0.5, 3);
    EXPECT_DOUBLE_EQ(legacy.factor(), 1.5);
    EXPECT_FALSE(legacy.inferred());
    GridScale legacyPx = GridScale::resolve(t, cols, std::nullopt, 2);
    EXPECT_DOUBLE_EQ(legacyPx.factor(), 2.0);
    GridScale given = GridScale::resolve(t, cols, 0.75, std::nullopt);
    EXPECT_DOUBLE_EQ(given.factor(), 0.75);
    GridScale inferred = GridScale::resolve(t, cols, std::nullopt, std::nullopt);
    EXPECT_DOUBLE_EQ(inferred.factor(), 1.5);
    EXPECT_TRUE(inferred.inferred());
}
