// src/segment_sink.cpp
#include "segment_sink.h"
#include <iterator>

void SegmentSink::append(Segment segment) {
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.push_back(std::move(segment));
}

void SegmentSink::append_batch(std::vector<Segment>&& batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    segments_.insert(segments_.end(),
                     std::make_move_iterator(batch.begin()),
                     std::make_move_iterator(batch.end()));
    batch.clear();
}

std::vector<Segment> SegmentSink::take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Segment> out = std::move(segments_);
    segments_.clear();
    return out;
}
