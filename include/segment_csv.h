#ifndef SEGMENT_CSV_H
#define SEGMENT_CSV_H

#include <iosfwd>
#include <stdexcept>
#include <string>
#include <vector>
#include "segment.h"

class SegmentFormatError : public std::runtime_error {
public:
    SegmentFormatError(size_t line, const std::string& what);

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Column order of the segment table
extern const char* const kSegmentColumns[11];

// Absent values are written as empty fields, booleans as true/false
void write_segments_csv(std::ostream& out, const std::vector<Segment>& segments);
void write_segments_csv(const std::string& filename, const std::vector<Segment>& segments);

std::vector<Segment> read_segments_csv(std::istream& in);
std::vector<Segment> read_segments_csv(const std::string& filename);

#endif // SEGMENT_CSV_H
