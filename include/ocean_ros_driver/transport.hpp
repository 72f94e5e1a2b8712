/*!
 *  \file         transport.hpp
 *  \author       BW
 *  \date         09/12/2025
 *  \brief        Collaborators consumed by the protocol engine.
 *
 *  Byte transport towards the instrument and the timer service used for recurring maintenance jobs.
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

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace ocean {

class Transport {
 public:
  virtual ~Transport() = default;

  // Writes all bytes or throws.
  virtual void send(const std::vector<uint8_t>& bytes) = 0;
};

class Scheduler {
 public:
  virtual ~Scheduler() = default;

  // Replaces any job already registered under job_id.
  virtual void schedule(const std::string& job_id,
                        std::chrono::seconds interval,
                        std::function<void()> callback) = 0;
  // No-op for an unknown job_id.
  virtual void unschedule(const std::string& job_id) = 0;
};

}  // namespace ocean
