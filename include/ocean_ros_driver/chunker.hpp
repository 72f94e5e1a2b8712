/*!
 *  \file         chunker.hpp
 *  \author       BW
 *  \date         06/12/2025
 *  \brief        Frame chunker for a continuous byte stream.
 *
 *  Finds instrument frames in an append-only buffer fed by the transport. Tolerates fragmented, combined and noisy reads and remembers the port timestamp of every appended range.
 *
 *  \section CodeCopyright Copyright Notice
 *  MIT License
 *
 *  Copyright (C) 2025, BEWIS SENSING. All rights reserved.
 *
 *  Permission is hereby granted, free of charge, to any person obtaining a copy
 *  of this software and associated documentation files (the "Software"), to
 * deal in the Software without restriction, including without limitation the
 * rights to use, copy, modify, merge, publish, distribute, sublicense, and/or
 * sell copies of the Software, and to permit persons to whom the Software is
 *  furnished to do so, subject to the following conditions:
 *
 *  The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 *  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 *  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 *  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 *  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 *  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING
 * FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS
 * IN THE SOFTWARE.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>

namespace ocean {

// Span [start, end) into a caller-owned buffer.
struct Chunk {
  size_t start;
  size_t end;

  size_t size() const { return end - start; }
  bool operator==(const Chunk& o) const {
    return start == o.start && end == o.end;
  }
};

class FrameMatcher {
 public:
  virtual ~FrameMatcher() = default;

  virtual const std::string& name() const = 0;

  // Appends every complete, non-overlapping frame of this type found in
  // data, in stream order.
  virtual void findAll(const uint8_t* data, size_t n,
                       std::vector<Chunk>& out) const = 0;

  // Offset of the first frame of this type that has started but not yet
  // fully arrived, or n when there is none.
  virtual size_t incompleteFrom(const uint8_t* data, size_t n) const {
    (void)data;
    return n;
  }
};

// Fixed-length frame identified by its sync bytes and an optional trailer.
class BinaryMatcher : public FrameMatcher {
 public:
  BinaryMatcher(std::string name, std::vector<uint8_t> sync, size_t length,
                std::vector<uint8_t> trailer = std::vector<uint8_t>());

  const std::string& name() const override { return name_; }
  void findAll(const uint8_t* data, size_t n,
               std::vector<Chunk>& out) const override;
  size_t incompleteFrom(const uint8_t* data, size_t n) const override;

  size_t frameLength() const { return length_ + trailer_.size(); }

 private:
  std::string name_;
  std::vector<uint8_t> sync_;
  size_t length_;
  std::vector<uint8_t> trailer_;
};

// Variable-length frame recognised by a function. The function returns the
// length of the frame starting at data[0], or 0 when there is none yet.
class PatternMatcher : public FrameMatcher {
 public:
  using MatchFn = size_t (*)(const uint8_t* data, size_t n);

  PatternMatcher(std::string name, MatchFn fn);

  const std::string& name() const override { return name_; }
  void findAll(const uint8_t* data, size_t n,
               std::vector<Chunk>& out) const override;

 private:
  std::string name_;
  MatchFn fn_;
};

using MatcherList = std::vector<std::shared_ptr<const FrameMatcher>>;

/*!
 * \brief Runs every matcher over data and returns non-overlapping chunks
 *        ordered by start offset.
 *
 * When two candidates overlap the earlier one is kept; among candidates
 * starting at the same offset the longest wins.
 */
std::vector<Chunk> sieve(const uint8_t* data, size_t n,
                         const MatcherList& matchers);

class StreamChunker {
 public:
  static constexpr size_t kMaxBufferSize = 65535;

  explicit StreamChunker(MatcherList matchers,
                         size_t max_size = kMaxBufferSize);

  /*!
   * \brief Appends a transport read and extracts any completed frames.
   *
   * \param[in] data           Bytes as read from the transport.
   * \param[in] n              Number of bytes.
   * \param[in] port_timestamp Time the bytes arrived at the port.
   */
  void addData(const uint8_t* data, size_t n, double port_timestamp);

  // Pops the oldest extracted frame. Returns false when none is pending.
  bool nextChunk(std::vector<uint8_t>& frame, double& port_timestamp);

  void clean();

  size_t buffered() const { return buffer_.size(); }
  size_t pending() const { return chunks_.size(); }

 private:
  struct TimedRange {
    size_t start;
    size_t end;
    double timestamp;
  };
  struct Extracted {
    std::vector<uint8_t> bytes;
    double timestamp;
  };

  void makeChunks();
  void rebase(size_t index);
  double findTimestamp(size_t index) const;

  MatcherList matchers_;
  size_t max_size_;
  std::vector<uint8_t> buffer_;
  std::vector<TimedRange> timestamps_;
  std::deque<Extracted> chunks_;
};

}  // namespace ocean
