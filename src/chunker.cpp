#include "ocean_ros_driver/chunker.hpp"

#include <ros/console.h>

#include <algorithm>

namespace ocean {

constexpr size_t StreamChunker::kMaxBufferSize;

BinaryMatcher::BinaryMatcher(std::string name, std::vector<uint8_t> sync,
                             size_t length, std::vector<uint8_t> trailer)
    : name_(std::move(name)),
      sync_(std::move(sync)),
      length_(length),
      trailer_(std::move(trailer)) {}

void BinaryMatcher::findAll(const uint8_t* data, size_t n,
                            std::vector<Chunk>& out) const {
  const size_t frame = frameLength();
  size_t i = 0;
  while (i + sync_.size() <= n) {
    if (!std::equal(sync_.begin(), sync_.end(), data + i)) {
      ++i;
      continue;
    }
    // incomplete frame, wait for more data
    if (i + frame > n) break;

    if (!trailer_.empty() &&
        !std::equal(trailer_.begin(), trailer_.end(), data + i + length_)) {
      ++i;
      continue;
    }
    out.push_back(Chunk{i, i + frame});
    i += frame;
  }
}

size_t BinaryMatcher::incompleteFrom(const uint8_t* data, size_t n) const {
  const size_t frame = frameLength();
  size_t i = 0;
  while (i + sync_.size() <= n) {
    if (!std::equal(sync_.begin(), sync_.end(), data + i)) {
      ++i;
      continue;
    }
    if (i + frame > n) return i;
    if (!trailer_.empty() &&
        !std::equal(trailer_.begin(), trailer_.end(), data + i + length_)) {
      ++i;
      continue;
    }
    i += frame;
  }
  return n;
}

PatternMatcher::PatternMatcher(std::string name, MatchFn fn)
    : name_(std::move(name)), fn_(fn) {}

void PatternMatcher::findAll(const uint8_t* data, size_t n,
                             std::vector<Chunk>& out) const {
  size_t i = 0;
  while (i < n) {
    size_t len = fn_(data + i, n - i);
    if (len == 0) {
      ++i;
      continue;
    }
    out.push_back(Chunk{i, i + len});
    i += len;
  }
}

std::vector<Chunk> sieve(const uint8_t* data, size_t n,
                         const MatcherList& matchers) {
  std::vector<Chunk> found;
  for (const auto& m : matchers) {
    m->findAll(data, n, found);
  }

  // earliest first, longest first among equal starts
  std::sort(found.begin(), found.end(), [](const Chunk& a, const Chunk& b) {
    if (a.start != b.start) return a.start < b.start;
    return a.size() > b.size();
  });

  std::vector<Chunk> kept;
  kept.reserve(found.size());
  for (const Chunk& c : found) {
    if (kept.empty() || c.start >= kept.back().end) {
      kept.push_back(c);
      continue;
    }
    // 重叠时保留先出现的帧（同起点时排序已把最长的放在前面）
    ROS_DEBUG("sieve: dropping [%zu, %zu), overlaps [%zu, %zu)", c.start,
              c.end, kept.back().start, kept.back().end);
  }
  return kept;
}

StreamChunker::StreamChunker(MatcherList matchers, size_t max_size)
    : matchers_(std::move(matchers)), max_size_(max_size) {}

void StreamChunker::addData(const uint8_t* data, size_t n,
                            double port_timestamp) {
  if (n == 0) return;

  size_t start = buffer_.size();
  size_t end = start + n;
  if (end > max_size_) {
    size_t oversize = std::min(end - max_size_, buffer_.size());
    ROS_WARN(
        "Chunker buffer has grown beyond specified limit (%zu), truncating "
        "%zu bytes",
        max_size_, oversize);
    rebase(oversize);
    buffer_.erase(buffer_.begin(), buffer_.begin() + oversize);
    start -= oversize;
    end -= oversize;
  }

  timestamps_.push_back(TimedRange{start, end, port_timestamp});
  buffer_.insert(buffer_.end(), data, data + n);
  makeChunks();
}

bool StreamChunker::nextChunk(std::vector<uint8_t>& frame,
                              double& port_timestamp) {
  if (chunks_.empty()) return false;
  frame = std::move(chunks_.front().bytes);
  port_timestamp = chunks_.front().timestamp;
  chunks_.pop_front();
  return true;
}

void StreamChunker::clean() {
  buffer_.clear();
  timestamps_.clear();
  chunks_.clear();
}

void StreamChunker::makeChunks() {
  std::vector<Chunk> found = sieve(buffer_.data(), buffer_.size(), matchers_);
  if (found.empty()) return;

  // A frame whose sync has arrived but whose body has not may still contain
  // short patterns; nothing from its start on is released until it completes.
  size_t hold = buffer_.size();
  for (const auto& m : matchers_) {
    hold = std::min(hold, m->incompleteFrom(buffer_.data(), buffer_.size()));
  }

  size_t last = 0;
  for (const Chunk& c : found) {
    if (c.start >= hold) break;
    Extracted e;
    e.bytes.assign(buffer_.begin() + c.start, buffer_.begin() + c.end);
    e.timestamp = findTimestamp(c.start);
    chunks_.push_back(std::move(e));
    last = c.end;
  }
  if (last == 0) return;

  rebase(last);
  buffer_.erase(buffer_.begin(), buffer_.begin() + last);
}

void StreamChunker::rebase(size_t index) {
  std::vector<TimedRange> kept;
  for (const TimedRange& r : timestamps_) {
    if (r.end <= index) continue;
    TimedRange t = r;
    t.start = t.start > index ? t.start - index : 0;
    t.end -= index;
    kept.push_back(t);
  }
  timestamps_.swap(kept);
}

double StreamChunker::findTimestamp(size_t index) const {
  for (const TimedRange& r : timestamps_) {
    if (r.start <= index && index < r.end) return r.timestamp;
  }
  ROS_ERROR("Failed to find timestamp for chunk at %zu", index);
  return 0.0;
}

}  // namespace ocean
