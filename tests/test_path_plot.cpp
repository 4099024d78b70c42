#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <string>
#include "path_plot.h"
#include "simulation.h"

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t n = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

Segment make_step(long long id, int step, Vec2D start, Vec2D end) {
    Segment s;
    s.path_id = id;
    s.step = step;
    s.start_x = start.x;
    s.start_y = start.y;
    s.end_x = end.x;
    s.end_y = end.y;
    return s;
}

} // namespace

class PathPlotTest : public ::testing::Test {
protected:
    walk_rng rng;
    Domain domain;
    std::vector<Segment> segments;

    void SetUp() override {
        rng = walk_rng(12345);
        domain = Domain::from_bounds({0.0, 1.0}, {0.0, 1.0});

        // Path 7 stored out of step order, path 3 never exits
        Segment exit = make_step(7, 3, {0.8, 0.5}, {1.2, 0.5});
        exit.has_exited = true;
        exit.intersection_x = 1.0;
        exit.intersection_y = 0.5;
        exit.exit_boundary = Boundary::Right;
        exit.boundary_value = 1.0;

        segments.push_back(make_step(7, 2, {0.6, 0.4}, {0.8, 0.5}));
        segments.push_back(make_step(3, 1, {0.2, 0.2}, {0.3, 0.3}));
        segments.push_back(exit);
        segments.push_back(make_step(7, 1, {0.5, 0.5}, {0.6, 0.4}));
    }
};

// Test that a trace follows step order regardless of storage order
TEST_F(PathPlotTest, TraceOrdersByStep) {
    PathTrace t = trace_path(segments, 7);
    ASSERT_EQ(t.points.size(), 4u);
    EXPECT_EQ(t.points[0], (Vec2D{0.5, 0.5}));
    EXPECT_EQ(t.points[1], (Vec2D{0.6, 0.4}));
    EXPECT_EQ(t.points[2], (Vec2D{0.8, 0.5}));
    EXPECT_EQ(t.points[3], (Vec2D{1.2, 0.5}));
    ASSERT_TRUE(t.intersection.has_value());
    EXPECT_EQ(*t.intersection, (Vec2D{1.0, 0.5}));
    ASSERT_TRUE(t.exit_point.has_value());
    EXPECT_EQ(*t.exit_point, (Vec2D{1.2, 0.5}));
}

TEST_F(PathPlotTest, TraceWithoutExitHasNoMarkers) {
    PathTrace t = trace_path(segments, 3);
    EXPECT_EQ(t.points.size(), 2u);
    EXPECT_FALSE(t.intersection.has_value());
    EXPECT_FALSE(t.exit_point.has_value());

    EXPECT_TRUE(trace_path(segments, 42).points.empty());
}

TEST_F(PathPlotTest, SelectsDistinctSortedIds) {
    auto ids = select_paths(segments, 1, rng);
    ASSERT_EQ(ids.size(), 1u);
    EXPECT_TRUE(ids[0] == 3 || ids[0] == 7);

    ids = select_paths(segments, 10, rng);
    EXPECT_EQ(ids, (std::vector<long long>{3, 7}));

    EXPECT_TRUE(select_paths(segments, 0, rng).empty());
    EXPECT_TRUE(select_paths({}, 5, rng).empty());
}

TEST_F(PathPlotTest, SelectionIsReproducibleForSameSeed) {
    SimulationParams params;
    params.max_global_exits = 40;
    params.paths_per_thread = 5;
    params.seed = 8;
    params.num_threads = 1;
    auto run = simulate(params);

    walk_rng a(77), b(77);
    auto first = select_paths(run, 5, a);
    auto second = select_paths(run, 5, b);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 5u);
    EXPECT_TRUE(std::is_sorted(first.begin(), first.end()));
    EXPECT_EQ(std::set<long long>(first.begin(), first.end()).size(), first.size());
}

TEST_F(PathPlotTest, RendersPathsMarkersAndLegend) {
    std::string svg = render_paths_svg(segments, {3, 7}, domain);

    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("<svg"), std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
    EXPECT_EQ(count_occurrences(svg, "class=\"path\""), 2u);
    EXPECT_EQ(count_occurrences(svg, "class=\"domain\""), 1u);
    EXPECT_NE(svg.find("data-path-id=\"7\""), std::string::npos);
    EXPECT_NE(svg.find(">Path 3<"), std::string::npos);
    EXPECT_NE(svg.find(">Domain<"), std::string::npos);
    EXPECT_NE(svg.find(">Start points<"), std::string::npos);
    EXPECT_NE(svg.find(">Intersection points<"), std::string::npos);
    EXPECT_NE(svg.find(">Exit points<"), std::string::npos);
    EXPECT_NE(svg.find("Brownian Motion Paths"), std::string::npos);

    // Two start circles plus the legend sample
    EXPECT_EQ(count_occurrences(svg, "<circle"), 3u);
    // One exited path: diamond + star, plus two legend samples
    EXPECT_EQ(count_occurrences(svg, "<polygon"), 4u);
}

TEST_F(PathPlotTest, TitleIsEscaped) {
    PlotOptions opt;
    opt.title = "x < y & z";
    std::string svg = render_paths_svg(segments, {7}, domain, opt);
    EXPECT_NE(svg.find("x &lt; y &amp; z"), std::string::npos);
}

TEST_F(PathPlotTest, RejectsPlotTooSmallForLegend) {
    PlotOptions opt;
    opt.width = 200;
    EXPECT_THROW(render_paths_svg(segments, {7}, domain, opt), ConfigurationError);

    opt.width = 800;
    opt.height = 90;
    EXPECT_THROW(render_paths_svg(segments, {7}, domain, opt), ConfigurationError);

    opt.height = 400;
    EXPECT_NO_THROW(render_paths_svg(segments, {7}, domain, opt));
}

TEST_F(PathPlotTest, SaveFailsForUnwritablePath) {
    EXPECT_THROW(save_paths_svg("/nonexistent/dir/plot.svg", segments, {7}, domain),
                 std::runtime_error);
}
