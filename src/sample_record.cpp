#include "ocean_ros_driver/sample_record.hpp"

#include <cmath>
#include <cstdio>

namespace ocean {

constexpr const char* SampleRecord::kFormatId;
constexpr int SampleRecord::kFormatVersion;
constexpr double SampleRecord::kTimestampTolerance;

const char* toString(QualityFlag q) {
  switch (q) {
    case QualityFlag::Ok:
      return "ok";
    case QualityFlag::ChecksumFailed:
      return "checksum_failed";
    case QualityFlag::OutOfRange:
      return "out_of_range";
    case QualityFlag::Invalid:
      return "invalid";
    case QualityFlag::Questionable:
      return "questionable";
  }
  return "invalid";
}

const char* toString(TimestampField t) {
  switch (t) {
    case TimestampField::Port:
      return "port_timestamp";
    case TimestampField::Driver:
      return "driver_timestamp";
    case TimestampField::Internal:
      return "internal_timestamp";
  }
  return "port_timestamp";
}

double toNtp(std::chrono::system_clock::time_point t) {
  using std::chrono::duration;
  double unix_seconds =
      std::chrono::duration_cast<duration<double>>(t.time_since_epoch())
          .count();
  return unixToNtp(unix_seconds);
}

double unixToNtp(double unix_seconds) {
  return unix_seconds + kNtpEpochOffset;
}

SampleRecord::SampleRecord(const DecodedRecord& rec, double port_timestamp,
                           double driver_timestamp, TimestampField preferred)
    : stream_(rec.stream),
      encoding_errors_(rec.encoding_errors),
      raw_(rec.raw),
      port_timestamp_(port_timestamp),
      driver_timestamp_(driver_timestamp),
      has_internal_(rec.has_internal_timestamp),
      internal_timestamp_(rec.internal_timestamp),
      preferred_(preferred),
      quality_(rec.checksum_valid ? QualityFlag::Ok
                                  : QualityFlag::ChecksumFailed) {
  values_.reserve(rec.values.size());
  for (const auto& kv : rec.values) {
    EnvelopeValue v;
    v.value_id = kv.first;
    v.value = kv.second;
    v.binary = kv.second.type() == Value::Type::Bytes;
    values_.push_back(v);
  }

  // a port timestamp of 0 means the transport did not stamp the data
  if (preferred_ == TimestampField::Port && port_timestamp_ == 0.0 &&
      has_internal_) {
    preferred_ = TimestampField::Internal;
  }
}

const Value* SampleRecord::find(const std::string& value_id) const {
  for (const EnvelopeValue& v : values_) {
    if (v.value_id == value_id) return &v.value;
  }
  return nullptr;
}

std::string SampleRecord::toJson() const {
  char buf[64];
  std::string out = "{\"pkt_format_id\":\"";
  out += kFormatId;
  out += "\",\"pkt_version\":";
  out += std::to_string(kFormatVersion);
  out += ",\"stream_name\":\"" + jsonEscape(stream_) + "\"";

  if (port_timestamp_ != 0.0) {
    std::snprintf(buf, sizeof(buf), ",\"port_timestamp\":%.6f",
                  port_timestamp_);
    out += buf;
  }
  if (has_internal_ && internal_timestamp_ != 0.0) {
    std::snprintf(buf, sizeof(buf), ",\"internal_timestamp\":%.6f",
                  internal_timestamp_);
    out += buf;
  }
  std::snprintf(buf, sizeof(buf), ",\"driver_timestamp\":%.6f",
                driver_timestamp_);
  out += buf;

  out += ",\"preferred_timestamp\":\"";
  out += toString(preferred_);
  out += "\",\"quality_flag\":\"";
  out += toString(quality_);
  out += "\",\"values\":[";
  for (size_t i = 0; i < values_.size(); ++i) {
    const EnvelopeValue& v = values_[i];
    if (i) out += ",";
    out += "{\"value_id\":\"" + jsonEscape(v.value_id) + "\",\"value\":";
    out += v.value.toJson();
    out += v.binary ? ",\"binary\":true}" : ",\"binary\":false}";
  }
  out += "]}";
  return out;
}

bool SampleRecord::operator==(const SampleRecord& other) const {
  if (raw_ != other.raw_) return false;
  if (has_internal_ != other.has_internal_) return false;
  return std::fabs(internal_timestamp_ - other.internal_timestamp_) <=
         kTimestampTolerance;
}

}  // namespace ocean
