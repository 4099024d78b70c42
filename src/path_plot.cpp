// src/path_plot.cpp
#include "path_plot.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unordered_set>

namespace {

const char* const kPalette[] = {
    "#1F77B4", "#FF7F0E", "#2CA02C", "#D62728", "#9467BD",
    "#8C564B", "#E377C2", "#17BECF", "#BCBD22", "#7F7F7F"
};
constexpr size_t kPaletteSize = sizeof(kPalette) / sizeof(kPalette[0]);
constexpr double kPi = 3.14159265358979323846;

void append_float(std::string& s, double v, int precision = 2) {
    char buf[32];
    int len = std::snprintf(buf, sizeof(buf), "%.*f", precision, v);
    while (len > 0 && buf[len - 1] == '0') buf[--len] = '\0';
    if (len > 0 && buf[len - 1] == '.') buf[--len] = '\0';
    s += buf;
}

void append_points(std::string& s, const std::vector<Vec2D>& pts) {
    for (size_t k = 0; k < pts.size(); ++k) {
        if (k) s += " ";
        append_float(s, pts[k].x);
        s += ",";
        append_float(s, pts[k].y);
    }
}

std::string escape_xml(const std::string& text) {
    std::string out;
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            default: out += c;
        }
    }
    return out;
}

// Maps domain coordinates onto the plot area with equal aspect ratio
class Viewport {
public:
    Viewport(const Domain& domain, const PlotOptions& opt, double left, double top,
             double plot_w, double plot_h)
        : x_lo_(domain.x_min - opt.margin),
          y_hi_(domain.y_max + opt.margin),
          left_(left),
          top_(top) {
        const double range_x = domain.width() + 2 * opt.margin;
        const double range_y = domain.height() + 2 * opt.margin;
        scale_ = std::min(plot_w / range_x, plot_h / range_y);
        w_ = range_x * scale_;
        h_ = range_y * scale_;
    }

    Vec2D map(double x, double y) const {
        return {left_ + (x - x_lo_) * scale_, top_ + (y_hi_ - y) * scale_};
    }
    Vec2D map(const Vec2D& p) const { return map(p.x, p.y); }

    double left() const { return left_; }
    double top() const { return top_; }
    double width() const { return w_; }
    double height() const { return h_; }

private:
    double x_lo_, y_hi_;
    double left_, top_;
    double scale_ = 1.0;
    double w_ = 0.0, h_ = 0.0;
};

std::vector<Vec2D> domain_outline(const Domain& d, const Viewport& vp) {
    return {vp.map(d.x_min, d.y_min), vp.map(d.x_max, d.y_min),
            vp.map(d.x_max, d.y_max), vp.map(d.x_min, d.y_max),
            vp.map(d.x_min, d.y_min)};
}

void append_circle(std::string& s, const Vec2D& c, double r, const char* color) {
    s += "  <circle cx=\"";
    append_float(s, c.x);
    s += "\" cy=\"";
    append_float(s, c.y);
    s += "\" r=\"";
    append_float(s, r);
    s += "\" fill=\"";
    s += color;
    s += "\" stroke=\"#FFFFFF\" stroke-width=\"1\"/>\n";
}

void append_polygon_marker(std::string& s, const std::vector<Vec2D>& pts, const char* color,
                           double opacity = 1.0) {
    s += "  <polygon points=\"";
    append_points(s, pts);
    s += "\" fill=\"";
    s += color;
    s += "\" fill-opacity=\"";
    append_float(s, opacity);
    s += "\" stroke=\"#FFFFFF\" stroke-width=\"1\"/>\n";
}

std::vector<Vec2D> diamond(const Vec2D& c, double r) {
    return {{c.x, c.y - r}, {c.x + r, c.y}, {c.x, c.y + r}, {c.x - r, c.y}};
}

std::vector<Vec2D> star(const Vec2D& c, double r) {
    std::vector<Vec2D> pts;
    for (int k = 0; k < 10; ++k) {
        const double radius = (k % 2 == 0) ? r : r * 0.4;
        const double angle = -kPi / 2 + k * kPi / 5;
        pts.push_back({c.x + radius * std::cos(angle), c.y + radius * std::sin(angle)});
    }
    return pts;
}

} // namespace

std::vector<long long> select_paths(const std::vector<Segment>& segments, size_t n, walk_rng& rng) {
    std::vector<long long> ids;
    std::unordered_set<long long> seen;
    for (const auto& seg : segments) {
        if (seen.insert(seg.path_id).second) {
            ids.push_back(seg.path_id);
        }
    }
    std::sort(ids.begin(), ids.end());

    std::shuffle(ids.begin(), ids.end(), rng);
    ids.resize(std::min(n, ids.size()));
    std::sort(ids.begin(), ids.end());
    return ids;
}

PathTrace trace_path(const std::vector<Segment>& segments, long long path_id) {
    std::vector<const Segment*> steps;
    for (const auto& seg : segments) {
        if (seg.path_id == path_id) {
            steps.push_back(&seg);
        }
    }
    std::sort(steps.begin(), steps.end(),
              [](const Segment* a, const Segment* b) { return a->step < b->step; });

    PathTrace trace;
    trace.path_id = path_id;
    if (steps.empty()) {
        return trace;
    }

    trace.points.push_back({steps.front()->start_x, steps.front()->start_y});
    for (const Segment* seg : steps) {
        trace.points.push_back({seg->end_x, seg->end_y});
        if (seg->has_exited && !trace.exit_point) {
            if (seg->intersection_x && seg->intersection_y) {
                trace.intersection = Vec2D{*seg->intersection_x, *seg->intersection_y};
            }
            trace.exit_point = Vec2D{seg->end_x, seg->end_y};
        }
    }
    return trace;
}

std::string render_paths_svg(const std::vector<Segment>& segments,
                             const std::vector<long long>& path_ids,
                             const Domain& domain,
                             const PlotOptions& options) {
    const double legend_w = 170.0;
    const double pad = 50.0;
    const double title_h = 40.0;
    if (options.width <= 2 * pad + legend_w || options.height <= title_h + pad) {
        throw ConfigurationError("invalid plot size " + std::to_string(options.width) + "x" +
                                 std::to_string(options.height) + ": must exceed " +
                                 std::to_string(static_cast<int>(2 * pad + legend_w)) + "x" +
                                 std::to_string(static_cast<int>(title_h + pad)));
    }
    const Viewport vp(domain, options, pad, title_h,
                      options.width - 2 * pad - legend_w,
                      options.height - title_h - pad);

    std::vector<PathTrace> traces;
    traces.reserve(path_ids.size());
    for (long long id : path_ids) {
        traces.push_back(trace_path(segments, id));
    }

    std::string s;
    s.reserve(4096);
    s += "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    s += "<svg version=\"1.1\" xmlns=\"http://www.w3.org/2000/svg\" width=\"";
    s += std::to_string(options.width);
    s += "\" height=\"";
    s += std::to_string(options.height);
    s += "\">\n";
    s += "  <rect width=\"100%\" height=\"100%\" fill=\"#FFFFFF\"/>\n";

    // Title and frame
    s += "  <text x=\"";
    append_float(s, vp.left() + vp.width() / 2);
    s += "\" y=\"25\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"16\">";
    s += escape_xml(options.title);
    s += "</text>\n";
    s += "  <rect x=\"";
    append_float(s, vp.left());
    s += "\" y=\"";
    append_float(s, vp.top());
    s += "\" width=\"";
    append_float(s, vp.width());
    s += "\" height=\"";
    append_float(s, vp.height());
    s += "\" fill=\"none\" stroke=\"#000000\" stroke-width=\"1\"/>\n";
    s += "  <text x=\"";
    append_float(s, vp.left() + vp.width() / 2);
    s += "\" y=\"";
    append_float(s, vp.top() + vp.height() + 30);
    s += "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">x</text>\n";
    s += "  <text x=\"";
    append_float(s, vp.left() - 30);
    s += "\" y=\"";
    append_float(s, vp.top() + vp.height() / 2);
    s += "\" text-anchor=\"middle\" font-family=\"sans-serif\" font-size=\"12\">y</text>\n";

    // Domain boundary
    s += "  <polyline class=\"domain\" points=\"";
    append_points(s, domain_outline(domain, vp));
    s += "\" fill=\"none\" stroke=\"#000000\" stroke-width=\"1.5\" stroke-dasharray=\"6,4\"/>\n";

    // Paths first, markers on top of all of them
    for (size_t i = 0; i < traces.size(); ++i) {
        if (traces[i].points.empty()) continue;
        std::vector<Vec2D> pts;
        pts.reserve(traces[i].points.size());
        for (const auto& p : traces[i].points) pts.push_back(vp.map(p));

        s += "  <polyline class=\"path\" data-path-id=\"";
        s += std::to_string(traces[i].path_id);
        s += "\" points=\"";
        append_points(s, pts);
        s += "\" fill=\"none\" stroke=\"";
        s += kPalette[i % kPaletteSize];
        s += "\" stroke-width=\"1.5\" stroke-opacity=\"0.8\"/>\n";
    }

    for (size_t i = 0; i < traces.size(); ++i) {
        const PathTrace& t = traces[i];
        if (t.points.empty()) continue;
        const char* color = kPalette[i % kPaletteSize];

        append_circle(s, vp.map(t.points.front()), 4.0, color);
        if (t.intersection) {
            append_polygon_marker(s, diamond(vp.map(*t.intersection), 5.0), color);
        }
        if (t.exit_point) {
            append_polygon_marker(s, star(vp.map(*t.exit_point), 7.0), color);
        }
    }

    // Legend
    const double lx = vp.left() + vp.width() + 20;
    double ly = vp.top() + 10;
    auto legend_text = [&](const std::string& label) {
        s += "  <text x=\"";
        append_float(s, lx + 26);
        s += "\" y=\"";
        append_float(s, ly + 4);
        s += "\" font-family=\"sans-serif\" font-size=\"12\">";
        s += escape_xml(label);
        s += "</text>\n";
        ly += 20;
    };

    s += "  <line x1=\"";
    append_float(s, lx);
    s += "\" y1=\"";
    append_float(s, ly);
    s += "\" x2=\"";
    append_float(s, lx + 20);
    s += "\" y2=\"";
    append_float(s, ly);
    s += "\" stroke=\"#000000\" stroke-width=\"1.5\" stroke-dasharray=\"6,4\"/>\n";
    legend_text("Domain");

    for (size_t i = 0; i < traces.size(); ++i) {
        s += "  <line x1=\"";
        append_float(s, lx);
        s += "\" y1=\"";
        append_float(s, ly);
        s += "\" x2=\"";
        append_float(s, lx + 20);
        s += "\" y2=\"";
        append_float(s, ly);
        s += "\" stroke=\"";
        s += kPalette[i % kPaletteSize];
        s += "\" stroke-width=\"1.5\"/>\n";
        legend_text("Path " + std::to_string(traces[i].path_id));
    }

    append_circle(s, {lx + 10, ly}, 4.0, "#000000");
    legend_text("Start points");
    append_polygon_marker(s, diamond({lx + 10, ly}, 5.0), "#000000");
    legend_text("Intersection points");
    append_polygon_marker(s, star({lx + 10, ly}, 7.0), "#000000", 0.5);
    legend_text("Exit points");

    // Solid border over everything
    s += "  <polyline points=\"";
    append_points(s, domain_outline(domain, vp));
    s += "\" fill=\"none\" stroke=\"#000000\" stroke-width=\"1\"/>\n";

    s += "</svg>\n";
    return s;
}

void save_paths_svg(const std::string& filename,
                    const std::vector<Segment>& segments,
                    const std::vector<long long>& path_ids,
                    const Domain& domain,
                    const PlotOptions& options) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("cannot open " + filename + " for writing");
    }
    file << render_paths_svg(segments, path_ids, domain, options);
    if (!file) {
        throw std::runtime_error("error writing " + filename);
    }
}
