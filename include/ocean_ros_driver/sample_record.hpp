/*!
 *  \file         sample_record.hpp
 *  \author       BW
 *  \date         08/12/2025
 *  \brief        Published sample record and its JSON envelope.
 *
 *  Wraps a decoded record with port, driver and internal timestamps, a quality flag and the list of fields that failed to decode.
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
#include <string>
#include <vector>

#include "ocean_ros_driver/record_schema.hpp"
#include "ocean_ros_driver/value.hpp"

namespace ocean {

enum class QualityFlag { Ok, ChecksumFailed, OutOfRange, Invalid, Questionable };
enum class TimestampField { Port, Driver, Internal };

const char* toString(QualityFlag q);
const char* toString(TimestampField t);

// Seconds between 1900-01-01 and 1970-01-01.
constexpr double kNtpEpochOffset = 2208988800.0;

double toNtp(std::chrono::system_clock::time_point t);
double unixToNtp(double unix_seconds);

struct EnvelopeValue {
  std::string value_id;
  Value value;
  bool binary;
};

class SampleRecord {
 public:
  static constexpr const char* kFormatId = "JSON_Data";
  static constexpr int kFormatVersion = 1;
  static constexpr double kTimestampTolerance = 1e-6;

  /*!
   * \param[in] rec              Decoded frame.
   * \param[in] port_timestamp   Arrival time at the port, 0 when unknown.
   * \param[in] driver_timestamp Time this process built the record.
   * \param[in] preferred        Nominal authoritative timestamp.
   */
  SampleRecord(const DecodedRecord& rec, double port_timestamp,
               double driver_timestamp,
               TimestampField preferred = TimestampField::Port);

  const std::string& streamName() const { return stream_; }
  const std::vector<EnvelopeValue>& values() const { return values_; }
  const std::vector<std::string>& encodingErrors() const {
    return encoding_errors_;
  }
  const std::vector<uint8_t>& raw() const { return raw_; }

  double portTimestamp() const { return port_timestamp_; }
  double driverTimestamp() const { return driver_timestamp_; }
  bool hasInternalTimestamp() const { return has_internal_; }
  double internalTimestamp() const { return internal_timestamp_; }
  TimestampField preferredTimestamp() const { return preferred_; }
  QualityFlag quality() const { return quality_; }

  const Value* find(const std::string& value_id) const;

  std::string toJson() const;

  // Same raw bytes and internal timestamps within kTimestampTolerance.
  bool operator==(const SampleRecord& other) const;
  bool operator!=(const SampleRecord& other) const {
    return !(*this == other);
  }

 private:
  std::string stream_;
  std::vector<EnvelopeValue> values_;
  std::vector<std::string> encoding_errors_;
  std::vector<uint8_t> raw_;
  double port_timestamp_;
  double driver_timestamp_;
  bool has_internal_;
  double internal_timestamp_;
  TimestampField preferred_;
  QualityFlag quality_;
};

}  // namespace ocean
