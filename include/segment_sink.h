#ifndef SEGMENT_SINK_H
#define SEGMENT_SINK_H

#include <mutex>
#include <vector>
#include "segment.h"

// Append-only collection shared by all workers.
class SegmentSink {
public:
    void append(Segment segment);
    void append_batch(std::vector<Segment>&& batch);

    // Moves the collected segments out, leaving the sink empty.
    std::vector<Segment> take();

private:
    std::mutex mutex_;
    std::vector<Segment> segments_;
};

#endif // SEGMENT_SINK_H
