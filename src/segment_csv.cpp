// src/segment_csv.cpp
#include "segment_csv.h"
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

const char* const kSegmentColumns[11] = {
    "path_id", "step", "start_x", "start_y", "end_x", "end_y", "has_exited",
    "intersection_x", "intersection_y", "exit_boundary", "boundary_value"
};

namespace {

constexpr size_t kNumColumns = sizeof(kSegmentColumns) / sizeof(kSegmentColumns[0]);

void write_optional(std::ostream& out, const std::optional<double>& v) {
    if (v) out << *v;
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream ss(line);
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        fields.emplace_back();
    }
    return fields;
}

template <typename T>
T parse_number(const std::string& field, size_t line, const char* column) {
    std::istringstream ss(field);
    T value;
    if (!(ss >> value) || !(ss >> std::ws).eof()) {
        throw SegmentFormatError(line, std::string("bad ") + column + " value '" + field + "'");
    }
    return value;
}

std::optional<double> parse_optional(const std::string& field, size_t line, const char* column) {
    if (field.empty()) return std::nullopt;
    return parse_number<double>(field, line, column);
}

bool parse_bool(const std::string& field, size_t line) {
    if (field == "true") return true;
    if (field == "false") return false;
    throw SegmentFormatError(line, "bad has_exited value '" + field + "'");
}

} // namespace

SegmentFormatError::SegmentFormatError(size_t line, const std::string& what)
    : std::runtime_error("line " + std::to_string(line) + ": " + what), line_(line) {}

void write_segments_csv(std::ostream& out, const std::vector<Segment>& segments) {
    for (size_t i = 0; i < kNumColumns; ++i) {
        out << (i ? "," : "") << kSegmentColumns[i];
    }
    out << "\n";

    const std::streamsize old_precision = out.precision(std::numeric_limits<double>::max_digits10);
    for (const auto& seg : segments) {
        out << seg.path_id << ','
            << seg.step << ','
            << seg.start_x << ','
            << seg.start_y << ','
            << seg.end_x << ','
            << seg.end_y << ','
            << (seg.has_exited ? "true" : "false") << ',';
        write_optional(out, seg.intersection_x);
        out << ',';
        write_optional(out, seg.intersection_y);
        out << ',';
        if (seg.exit_boundary) out << boundary_label(*seg.exit_boundary);
        out << ',';
        write_optional(out, seg.boundary_value);
        out << "\n";
    }
    out.precision(old_precision);
}

void write_segments_csv(const std::string& filename, const std::vector<Segment>& segments) {
    std::ofstream file(filename);
    if (!file) {
        throw std::runtime_error("cannot open " + filename + " for writing");
    }
    write_segments_csv(file, segments);
    if (!file) {
        throw std::runtime_error("error writing " + filename);
    }
}

std::vector<Segment> read_segments_csv(std::istream& in) {
    std::vector<Segment> segments;
    std::string line;
    size_t line_no = 1;

    if (!std::getline(in, line)) {
        throw SegmentFormatError(line_no, "missing header");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const std::vector<std::string> header = split_fields(line);
    if (header.size() != kNumColumns) {
        throw SegmentFormatError(line_no, "expected " + std::to_string(kNumColumns) + " columns in header");
    }
    for (size_t i = 0; i < kNumColumns; ++i) {
        if (header[i] != kSegmentColumns[i]) {
            throw SegmentFormatError(line_no, "unexpected column '" + header[i] +
                                              "', expected '" + kSegmentColumns[i] + "'");
        }
    }

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const std::vector<std::string> f = split_fields(line);
        if (f.size() != kNumColumns) {
            throw SegmentFormatError(line_no, "expected " + std::to_string(kNumColumns) +
                                              " fields, got " + std::to_string(f.size()));
        }

        Segment seg;
        seg.path_id = parse_number<long long>(f[0], line_no, "path_id");
        seg.step = parse_number<int>(f[1], line_no, "step");
        seg.start_x = parse_number<double>(f[2], line_no, "start_x");
        seg.start_y = parse_number<double>(f[3], line_no, "start_y");
        seg.end_x = parse_number<double>(f[4], line_no, "end_x");
        seg.end_y = parse_number<double>(f[5], line_no, "end_y");
        seg.has_exited = parse_bool(f[6], line_no);
        seg.intersection_x = parse_optional(f[7], line_no, "intersection_x");
        seg.intersection_y = parse_optional(f[8], line_no, "intersection_y");
        if (!f[9].empty()) {
            seg.exit_boundary = parse_boundary(f[9]);
            if (!seg.exit_boundary) {
                throw SegmentFormatError(line_no, "unknown exit_boundary '" + f[9] + "'");
            }
        }
        seg.boundary_value = parse_optional(f[10], line_no, "boundary_value");
        segments.push_back(std::move(seg));
    }

    return segments;
}

std::vector<Segment> read_segments_csv(const std::string& filename) {
    std::ifstream file(filename);
    if (!file) {
        throw std::runtime_error("cannot open " + filename);
    }
    return read_segments_csv(file);
}
