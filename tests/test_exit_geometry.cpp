#include <gtest/gtest.h>
#include <cmath>
#include "domain.h"
#include "exit_geometry.h"

class ExitGeometryTest : public ::testing::Test {
protected:
    Domain unit;
    Domain strip;

    void SetUp() override {
        unit = Domain::from_bounds({0.0, 1.0}, {0.0, 1.0});
        strip = Domain::from_bounds({0.0, 1.0}, {-0.5, 0.5});
    }
};

// Test the reference crossing through the right edge
TEST_F(ExitGeometryTest, HorizontalStepThroughRightEdge) {
    double t = find_exit_point(0.5, 0.0, 1.5, 0.0, strip);
    EXPECT_DOUBLE_EQ(t, 0.5);

    double ix = 0.5 + t * 1.0;
    double iy = 0.0;
    EXPECT_NEAR(ix, 1.0, 1e-10);
    EXPECT_DOUBLE_EQ(iy, 0.0);

    BoundaryHit hit = identify_exit_boundary(ix, iy, strip);
    EXPECT_EQ(hit.boundary, Boundary::Right);
    EXPECT_DOUBLE_EQ(hit.value, 1.0);
    EXPECT_STREQ(boundary_label(hit.boundary), "right");
}

TEST_F(ExitGeometryTest, VerticalStepIgnoresUndefinedCandidates) {
    double t = find_exit_point(0.5, 0.5, 0.5, 1.5, unit);
    EXPECT_DOUBLE_EQ(t, 0.5);

    t = find_exit_point(0.25, 0.5, 0.25, -0.5, unit);
    EXPECT_DOUBLE_EQ(t, 0.5);
    EXPECT_EQ(identify_exit_boundary(0.25, 0.0, unit).boundary, Boundary::Bottom);
}

TEST_F(ExitGeometryTest, LeftExit) {
    double t = find_exit_point(0.2, 0.5, -0.2, 0.7, unit);
    EXPECT_DOUBLE_EQ(t, 0.5);
    BoundaryHit hit = identify_exit_boundary(0.2 + t * -0.4, 0.5 + t * 0.2, unit);
    EXPECT_EQ(hit.boundary, Boundary::Left);
    EXPECT_DOUBLE_EQ(hit.value, 0.0);
}

// Test that the first boundary crossed along the step wins
TEST_F(ExitGeometryTest, PicksFirstCrossing) {
    // Crosses x = 1 at t = 0.2 (y = 0.7); the y = 1 crossing at t = 0.5 is outside
    double t = find_exit_point(0.9, 0.5, 1.4, 1.5, unit);
    EXPECT_NEAR(t, 0.2, 1e-12);

    BoundaryHit hit = identify_exit_boundary(0.9 + t * 0.5, 0.5 + t * 1.0, unit);
    EXPECT_EQ(hit.boundary, Boundary::Right);
}

TEST_F(ExitGeometryTest, TopExitThroughSlantedStep) {
    double t = find_exit_point(0.5, 0.9, 0.7, 1.3, unit);
    EXPECT_NEAR(t, 0.25, 1e-12);
    BoundaryHit hit = identify_exit_boundary(0.5 + t * 0.2, 0.9 + t * 0.4, unit);
    EXPECT_EQ(hit.boundary, Boundary::Top);
    EXPECT_DOUBLE_EQ(hit.value, 1.0);
}

TEST_F(ExitGeometryTest, DiagonalThroughCornerIsRight) {
    double t = find_exit_point(0.5, 0.5, 1.5, 1.5, unit);
    EXPECT_DOUBLE_EQ(t, 0.5);
    BoundaryHit hit = identify_exit_boundary(1.0, 1.0, unit);
    EXPECT_EQ(hit.boundary, Boundary::Right);
}

// Test the left, right, bottom, top priority at a corner
TEST_F(ExitGeometryTest, CornerTieBreakOrder) {
    EXPECT_EQ(identify_exit_boundary(1.0, 0.5, strip).boundary, Boundary::Right);
    EXPECT_EQ(identify_exit_boundary(0.0, 0.5, strip).boundary, Boundary::Left);
    EXPECT_EQ(identify_exit_boundary(0.0, -0.5, strip).boundary, Boundary::Left);
    EXPECT_EQ(identify_exit_boundary(1.0 - 1e-11, 0.5 + 1e-11, strip).boundary, Boundary::Right);
    EXPECT_EQ(identify_exit_boundary(0.3, 0.5, strip).boundary, Boundary::Top);
}

// Test that a crossing whose recomputed x lands one ulp outside is still found
TEST_F(ExitGeometryTest, RoundingOnCrossingLineDoesNotRejectIt) {
    // 0.003 + t * (-0.016 - 0.003) evaluates to about -4.3e-19, not 0
    double t = find_exit_point(0.003, 0.5, -0.016, 0.5, unit);
    EXPECT_LT(t, 1.0);
    EXPECT_NEAR(t, 0.003 / 0.019, 1e-12);

    double ix = 0.003 + t * (-0.016 - 0.003);
    BoundaryHit hit = identify_exit_boundary(ix, 0.5, unit);
    EXPECT_EQ(hit.boundary, Boundary::Left);
}

TEST_F(ExitGeometryTest, FallsBackToEndpoint) {
    // Both points outside and the line never touches the domain
    EXPECT_DOUBLE_EQ(find_exit_point(2.0, 2.0, 3.0, 3.0, unit), 1.0);
    // Zero-length step
    EXPECT_DOUBLE_EQ(find_exit_point(0.5, 0.5, 0.5, 0.5, unit), 1.0);
}

TEST_F(ExitGeometryTest, ToleranceIsAbsolute) {
    EXPECT_EQ(identify_exit_boundary(1.0 + 5e-11, 0.3, unit).boundary, Boundary::Right);
    EXPECT_THROW(identify_exit_boundary(1.0 + 1e-9, 0.3, unit), GeometryError);
    EXPECT_EQ(identify_exit_boundary(1.0 + 1e-9, 0.3, unit, 1e-8).boundary, Boundary::Right);
}

TEST_F(ExitGeometryTest, InteriorPointIsGeometryError) {
    try {
        identify_exit_boundary(0.25, 0.75, unit);
        FAIL() << "expected GeometryError";
    } catch (const GeometryError& e) {
        EXPECT_DOUBLE_EQ(e.x(), 0.25);
        EXPECT_DOUBLE_EQ(e.y(), 0.75);
        EXPECT_NE(std::string(e.what()).find("0.25"), std::string::npos);
    }
}

TEST(BoundaryLabelTest, LabelsParseBack) {
    for (Boundary b : {Boundary::Left, Boundary::Right, Boundary::Bottom, Boundary::Top}) {
        auto parsed = parse_boundary(boundary_label(b));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, b);
    }
    EXPECT_FALSE(parse_boundary("middle").has_value());
    EXPECT_FALSE(parse_boundary("").has_value());
}

TEST(DomainTest, ContainsIsInclusive) {
    Domain d = Domain::from_bounds({-1.0, 2.0}, {0.0, 3.0});
    EXPECT_TRUE(d.contains(-1.0, 0.0));
    EXPECT_TRUE(d.contains(2.0, 3.0));
    EXPECT_TRUE(d.contains(0.5, 1.5));
    EXPECT_FALSE(d.contains(2.0 + 1e-12, 1.0));
    EXPECT_FALSE(d.contains(0.0, -1e-12));
    EXPECT_DOUBLE_EQ(d.width(), 3.0);
    EXPECT_DOUBLE_EQ(d.height(), 3.0);
}

TEST(DomainTest, RejectsEmptyOrInvertedBounds) {
    EXPECT_THROW(Domain::from_bounds({1.0, 1.0}, {0.0, 1.0}), ConfigurationError);
    EXPECT_THROW(Domain::from_bounds({2.0, 1.0}, {0.0, 1.0}), ConfigurationError);
    EXPECT_THROW(Domain::from_bounds({0.0, 1.0}, {0.5, -0.5}), ConfigurationError);
    EXPECT_THROW(Domain::from_bounds({0.0, INFINITY}, {0.0, 1.0}), ConfigurationError);
    EXPECT_THROW(Domain::from_bounds({0.0, 1.0}, {NAN, 1.0}), ConfigurationError);

    try {
        Domain::from_bounds({0.0, 1.0}, {3.5, 2.5});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("domain_y"), std::string::npos);
        EXPECT_NE(msg.find("3.5"), std::string::npos);
    }
}
