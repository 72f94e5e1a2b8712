#include "ocean_ros_driver/nortek_records.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include "ocean_ros_driver/bcd_utils.hpp"
#include "ocean_ros_driver/exceptions.hpp"
#include "ocean_ros_driver/sample_record.hpp"

namespace ocean {
namespace nortek {

namespace {

const std::vector<uint8_t> kVelocitySync = {0xA5, 0x01, 0x15, 0x00};
const std::vector<uint8_t> kUserConfigSync = {0xA5, 0x00, 0x00, 0x01};
const std::vector<uint8_t> kHardwareConfigSync = {0xA5, 0x05, 0x18, 0x00};
const std::vector<uint8_t> kHeadConfigSync = {0xA5, 0x04, 0x70, 0x00};
const std::vector<uint8_t> kAckTrailer = {0x06, 0x06};

// 设备时钟字节顺序: min sec day hour year month
enum ClockIndex { kMinute = 0, kSecond, kDay, kHour, kYear, kMonth };

bool clockToTm(const uint8_t* bcd, std::tm& tm) {
  int v[6];
  for (int i = 0; i < 6; ++i) {
    v[i] = bcdToInt(bcd[i]);
    if (v[i] < 0) return false;
  }
  if (v[kMonth] < 1 || v[kMonth] > 12 || v[kDay] < 1 || v[kDay] > 31 ||
      v[kHour] > 23 || v[kMinute] > 59 || v[kSecond] > 60) {
    return false;
  }
  std::memset(&tm, 0, sizeof(tm));
  tm.tm_year = 2000 + v[kYear] - 1900;
  tm.tm_mon = v[kMonth] - 1;
  tm.tm_mday = v[kDay];
  tm.tm_hour = v[kHour];
  tm.tm_min = v[kMinute];
  tm.tm_sec = v[kSecond];
  return true;
}

// Velocity record clock rendered as "YYYY-MM-DD hh:mm:ss".
Value decodeDateTime(const uint8_t* p, size_t len) {
  if (len != 6) throw std::length_error("clock field must be 6 bytes");
  std::tm tm;
  if (!clockToTm(p, tm)) {
    throw std::invalid_argument("invalid BCD clock");
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d %02d:%02d:%02d",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec);
  return Value::text(buf);
}

void encodeDateTime(const Value& v, uint8_t* out, size_t len) {
  if (len != 6) throw std::length_error("clock field must be 6 bytes");
  int year, month, day, hour, minute, second;
  if (std::sscanf(v.asText().c_str(), "%d-%d-%d %d:%d:%d", &year, &month,
                  &day, &hour, &minute, &second) != 6 ||
      year < 2000 || year > 2099) {
    throw std::invalid_argument("expected YYYY-MM-DD hh:mm:ss");
  }
  const int parts[6] = {minute, second, day, hour, year - 2000, month};
  for (int i = 0; i < 6; ++i) {
    if (parts[i] < 0 || parts[i] > 99) {
      throw std::out_of_range("clock element out of range");
    }
    out[i] = intToBcd(parts[i]);
  }
}

const FieldCodec kDateTime = {decodeDateTime, encodeDateTime, false};

bool velocityTimestamp(const uint8_t* frame, size_t len, double& ntp) {
  if (len < 10) return false;
  return clockToNtp(frame + 4, ntp);
}

void deriveVelocity(DecodedRecord& rec) {
  const Value* msb = rec.find("pressure_msb");
  const Value* lsw = rec.find("pressure_lsw");
  if (msb == nullptr || lsw == nullptr || msb->isNull() || lsw->isNull()) {
    rec.values.emplace_back("pressure_mbar", Value());
    return;
  }
  rec.values.emplace_back("pressure_mbar",
                          Value::integer(msb->asInt() * 0x10000 + lsw->asInt()));
}

FieldDescriptor reading(const char* name, size_t offset, size_t length,
                        const FieldCodec& codec) {
  return FieldDescriptor{name, offset, length, &codec, Mutability::ReadOnly,
                         Lifecycle::Runtime, Value()};
}

FieldDescriptor spare(const char* name, size_t offset, size_t length) {
  return FieldDescriptor{name, offset, length, &codec::kSpare,
                         Mutability::ReadOnly, Lifecycle::Runtime, Value()};
}

// 用户配置字段，默认为不可变、可在直通模式下修改
FieldDescriptor setting(const char* name, size_t offset, size_t length,
                        const FieldCodec& codec, Value def,
                        Mutability m = Mutability::Immutable,
                        Lifecycle lc = Lifecycle::DirectAccessEligible) {
  return FieldDescriptor{name, offset, length, &codec, m, lc, std::move(def)};
}

FieldDescriptor word(const char* name, size_t offset, Value def,
                     Mutability m = Mutability::Immutable,
                     Lifecycle lc = Lifecycle::DirectAccessEligible) {
  return setting(name, offset, 2, codec::kU16, std::move(def), m, lc);
}

BitFieldDescriptor flag(const char* name, const char* parent, unsigned bit,
                        Mutability m = Mutability::Immutable) {
  return BitFieldDescriptor{name, parent, BitRange{bit, 1}, m,
                            Lifecycle::DirectAccessEligible};
}

BitFieldDescriptor status(const char* name, const char* parent, unsigned bit) {
  return BitFieldDescriptor{name, parent, BitRange{bit, 1},
                            Mutability::ReadOnly, Lifecycle::Runtime};
}

std::shared_ptr<const RecordLayout> makeVelocity() {
  auto l = std::make_shared<RecordLayout>();
  l->stream = kVelocityStream;
  l->sync = kVelocitySync;
  l->total_length = kVelocityLength;
  l->has_checksum = true;
  l->fields = {
      reading("date_time_string", 4, 6, kDateTime),
      reading("error_code", 10, 2, codec::kU16),
      reading("analog1", 12, 2, codec::kU16),
      reading("battery_voltage_dv", 14, 2, codec::kU16),
      reading("sound_speed_dms", 16, 2, codec::kU16),
      reading("heading_decidegree", 18, 2, codec::kI16),
      reading("pitch_decidegree", 20, 2, codec::kI16),
      reading("roll_decidegree", 22, 2, codec::kI16),
      reading("pressure_msb", 24, 1, codec::kU8),
      reading("status", 25, 1, codec::kU8),
      reading("pressure_lsw", 26, 2, codec::kU16),
      reading("temperature_centidegree", 28, 2, codec::kI16),
      reading("velocity_beam1", 30, 2, codec::kI16),
      reading("velocity_beam2", 32, 2, codec::kI16),
      reading("velocity_beam3", 34, 2, codec::kI16),
      reading("amplitude_beam1", 36, 1, codec::kU8),
      reading("amplitude_beam2", 37, 1, codec::kU8),
      reading("amplitude_beam3", 38, 1, codec::kU8),
      spare("fill", 39, 1),
  };
  l->timestamp = velocityTimestamp;
  l->derive = deriveVelocity;
  return l;
}

std::shared_ptr<const RecordLayout> makeUserConfig() {
  const Mutability rw = Mutability::ReadWrite;
  const Lifecycle runtime = Lifecycle::Runtime;

  auto l = std::make_shared<RecordLayout>();
  l->stream = kUserConfigStream;
  l->sync = kUserConfigSync;
  l->total_length = kUserConfigLength;
  l->has_checksum = true;
  l->fields = {
      word("transmit_pulse_length", 4, Value::integer(125)),
      word("blanking_distance", 6, Value::integer(49), rw),
      word("receive_length", 8, Value::integer(32)),
      word("time_between_pings", 10, Value::integer(437)),
      word("time_between_bursts", 12, Value::integer(512)),
      word("number_pings", 14, Value::integer(1)),
      word("average_interval", 16, Value::integer(60), rw),
      word("number_beams", 18, Value::integer(3), Mutability::Immutable,
           runtime),
      word("timing_control_register", 20, Value::integer(130), rw, runtime),
      word("power_control_register", 22, Value::integer(0),
           Mutability::Immutable, runtime),
      spare("spare0", 24, 4),
      spare("spare1", 28, 2),
      word("compass_update_rate", 30, Value::integer(1)),
      word("coordinate_system", 32, Value::integer(2), rw),
      word("number_cells", 34, Value::integer(1)),
      word("cell_size", 36, Value::integer(7), rw),
      word("measurement_interval", 38, Value::integer(60), rw),
      setting("deployment_name", 40, 6, codec::kText, Value::text("")),
      word("wrap_mode", 46, Value::integer(0)),
      setting("deployment_start_time", 48, 6, codec::kBcdClock,
              Value::intList({0, 0, 0, 0, 0, 0})),
      setting("diagnostics_interval", 54, 4, codec::kU32,
              Value::integer(11250)),
      word("mode", 58, Value::integer(48)),
      word("sound_speed_adjust_factor", 60, Value::integer(1525)),
      word("number_diagnostics_samples", 62, Value::integer(20)),
      word("number_beams_per_cell", 64, Value::integer(1)),
      word("number_pings_diagnostic", 66, Value::integer(1)),
      word("mode_test", 68, Value::integer(4)),
      word("analog_input_address", 70, Value::integer(0)),
      word("software_version", 72, Value::integer(13902), Mutability::ReadOnly,
           runtime),
      spare("spare2", 74, 2),
      setting("velocity_adjustment_factor", 76, 180, codec::kBytes, Value(),
              Mutability::Immutable, runtime),
      setting("file_comments", 256, 180, codec::kText, Value::text("")),
      word("wave_mode", 436, Value()),
      word("percent_wave_cell_position", 438, Value()),
      word("wave_transmit_pulse", 440, Value()),
      word("fixed_wave_blanking_distance", 442, Value()),
      word("wave_measurement_cell_size", 444, Value()),
      word("number_diagnostics_per_wave", 446, Value()),
      spare("spare3", 448, 2),
      spare("spare4", 450, 2),
      word("number_samples_per_burst", 452, Value::integer(0)),
      word("sample_rate", 454, Value()),
      word("analog_scale_factor", 456, Value::integer(0)),
      word("correlation_threshold", 458, Value::integer(0)),
      spare("spare5", 460, 2),
      word("transmit_pulse_length_2nd", 462, Value::integer(2)),
      spare("spare6", 464, 30),
      setting("filter_constants", 494, 16, codec::kBytes, Value(),
              Mutability::Immutable, runtime),
  };
  l->bitfields = {
      flag("profile_type", "timing_control_register", 1, rw),
      flag("mode_type", "timing_control_register", 2, rw),
      flag("power_level_tcm1", "timing_control_register", 5, rw),
      flag("power_level_tcm2", "timing_control_register", 6, rw),
      flag("sync_out_position", "timing_control_register", 7, rw),
      flag("sample_on_sync", "timing_control_register", 8, rw),
      flag("start_on_sync", "timing_control_register", 9, rw),
      flag("power_level_pcr1", "power_control_register", 5),
      flag("power_level_pcr2", "power_control_register", 6),
      flag("use_specified_sound_speed", "mode", 0),
      flag("diagnostics_mode_enable", "mode", 1),
      flag("analog_output_enable", "mode", 2),
      flag("output_format_nortek", "mode", 3),
      flag("scaling", "mode", 4),
      flag("serial_output_enable", "mode", 5),
      flag("stage_enable", "mode", 7),
      flag("analog_power_output", "mode", 8),
      flag("use_dsp_filter", "mode_test", 0),
      flag("filter_data_output", "mode_test", 1),
      flag("wave_data_rate", "wave_mode", 0),
      flag("wave_cell_position", "wave_mode", 1),
      flag("dynamic_position_type", "wave_mode", 2),
  };
  return l;
}

std::shared_ptr<const RecordLayout> makeHardwareConfig() {
  auto l = std::make_shared<RecordLayout>();
  l->stream = kHardwareConfigStream;
  l->sync = kHardwareConfigSync;
  l->total_length = kHardwareConfigLength;
  l->has_checksum = true;
  l->trailer = kAckTrailer;
  l->fields = {
      reading("instrmt_type_serial_number", 4, 14, codec::kText),
      reading("board_config", 18, 2, codec::kU16),
      reading("board_frequency", 20, 2, codec::kU16),
      reading("pic_version", 22, 2, codec::kU16),
      reading("hardware_revision", 24, 2, codec::kU16),
      reading("recorder_size", 26, 2, codec::kU16),
      reading("board_status", 28, 2, codec::kU16),
      spare("spare", 30, 12),
      reading("firmware_version", 42, 4, codec::kText),
  };
  l->bitfields = {
      status("recorder_installed", "board_config", 0),
      status("compass_installed", "board_config", 1),
      status("velocity_range", "board_status", 0),
  };
  return l;
}

std::shared_ptr<const RecordLayout> makeHeadConfig() {
  auto l = std::make_shared<RecordLayout>();
  l->stream = kHeadConfigStream;
  l->sync = kHeadConfigSync;
  l->total_length = kHeadConfigLength;
  l->has_checksum = true;
  l->trailer = kAckTrailer;
  l->fields = {
      reading("head_config", 4, 2, codec::kU16),
      reading("head_frequency", 6, 2, codec::kU16),
      reading("head_type", 8, 2, codec::kU16),
      reading("head_serial_number", 10, 12, codec::kText),
      reading("system_data", 22, 176, codec::kBytes),
      spare("spare", 198, 22),
      reading("number_beams", 220, 2, codec::kU16),
  };
  l->bitfields = {
      status("pressure_sensor", "head_config", 0),
      status("magnetometer_sensor", "head_config", 1),
      status("tilt_sensor", "head_config", 2),
      status("tilt_sensor_mounting", "head_config", 3),
  };
  return l;
}

std::shared_ptr<const RecordLayout> makeClock() {
  auto l = std::make_shared<RecordLayout>();
  l->stream = kClockStream;
  l->total_length = 6;
  l->has_checksum = false;
  l->trailer = kAckTrailer;
  l->fields = {reading("date_time_array", 0, 6, codec::kBcdClock)};
  return l;
}

std::shared_ptr<const RecordLayout> makeBattery() {
  auto l = std::make_shared<RecordLayout>();
  l->stream = kBatteryStream;
  l->total_length = 2;
  l->has_checksum = false;
  l->trailer = kAckTrailer;
  l->fields = {reading("battery_voltage_mv", 0, 2, codec::kU16)};
  return l;
}

bool inRange(uint8_t b, uint8_t lo, uint8_t hi) { return b >= lo && b <= hi; }

bool isDigit(uint8_t b) { return b >= '0' && b <= '9'; }

// Length of the "AQD 1215      " 06 06 part, 0 when absent or incomplete.
size_t matchIdPrefix(const uint8_t* d, size_t n, size_t& text_end) {
  if (n < 3) return 0;
  if (std::memcmp(d, "AQD", 3) != 0 && std::memcmp(d, "VEC", 3) != 0) {
    return 0;
  }
  size_t pos = 3;
  if (pos < n && d[pos] == ' ') ++pos;
  size_t digits = 0;
  while (pos < n && digits < 5 && isDigit(d[pos])) {
    ++pos;
    ++digits;
  }
  if (digits < 4) return 0;
  text_end = pos;
  size_t spaces = 0;
  while (pos < n && spaces < 6 && d[pos] == ' ') {
    ++pos;
    ++spaces;
  }
  if (pos + 2 > n || d[pos] != 0x06 || d[pos + 1] != 0x06) return 0;
  return pos + 2;
}

const RecordSchema& schemaFor(std::shared_ptr<const RecordLayout> (*layout)()) {
  // 每种记录只构造一次
  static const RecordSchema velocity(velocityLayout());
  static const RecordSchema user(userConfigLayout());
  static const RecordSchema hardware(hardwareConfigLayout());
  static const RecordSchema head(headConfigLayout());
  static const RecordSchema clock(clockLayout());
  static const RecordSchema battery(batteryLayout());
  if (layout == velocityLayout) return velocity;
  if (layout == userConfigLayout) return user;
  if (layout == hardwareConfigLayout) return hardware;
  if (layout == headConfigLayout) return head;
  if (layout == clockLayout) return clock;
  return battery;
}

bool startsWith(const uint8_t* d, size_t n, const std::vector<uint8_t>& sync) {
  return n >= sync.size() && std::equal(sync.begin(), sync.end(), d);
}

}  // namespace

std::shared_ptr<const RecordLayout> velocityLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeVelocity();
  return l;
}

std::shared_ptr<const RecordLayout> userConfigLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeUserConfig();
  return l;
}

std::shared_ptr<const RecordLayout> hardwareConfigLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeHardwareConfig();
  return l;
}

std::shared_ptr<const RecordLayout> headConfigLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeHeadConfig();
  return l;
}

std::shared_ptr<const RecordLayout> clockLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeClock();
  return l;
}

std::shared_ptr<const RecordLayout> batteryLayout() {
  static const std::shared_ptr<const RecordLayout> l = makeBattery();
  return l;
}

std::shared_ptr<const FrameMatcher> velocityMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<BinaryMatcher>(kVelocityStream, kVelocitySync,
                                       kVelocityLength);
  return m;
}

std::shared_ptr<const FrameMatcher> userConfigMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<BinaryMatcher>(kUserConfigStream, kUserConfigSync,
                                       kUserConfigLength, kAckTrailer);
  return m;
}

std::shared_ptr<const FrameMatcher> hardwareConfigMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<BinaryMatcher>(kHardwareConfigStream,
                                       kHardwareConfigSync,
                                       kHardwareConfigLength, kAckTrailer);
  return m;
}

std::shared_ptr<const FrameMatcher> headConfigMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<BinaryMatcher>(kHeadConfigStream, kHeadConfigSync,
                                       kHeadConfigLength, kAckTrailer);
  return m;
}

std::shared_ptr<const FrameMatcher> clockMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<PatternMatcher>(kClockStream, matchClock);
  return m;
}

std::shared_ptr<const FrameMatcher> idBatteryMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<PatternMatcher>(kIdStream, matchIdBattery);
  return m;
}

std::shared_ptr<const FrameMatcher> modeMatcher() {
  static const std::shared_ptr<const FrameMatcher> m =
      std::make_shared<PatternMatcher>("mode", matchMode);
  return m;
}

MatcherList frameMatchers() {
  return MatcherList{userConfigMatcher(), hardwareConfigMatcher(),
                     headConfigMatcher(), idBatteryMatcher(),
                     clockMatcher(),      velocityMatcher()};
}

size_t matchClock(const uint8_t* d, size_t n) {
  if (n < 8) return 0;
  if (!inRange(d[kMinute], 0x00, 0x60) || !inRange(d[kSecond], 0x00, 0x60) ||
      !inRange(d[kDay], 0x01, 0x31) || !inRange(d[kHour], 0x00, 0x24) ||
      !inRange(d[kYear], 0x00, 0x99) || !inRange(d[kMonth], 0x01, 0x12)) {
    return 0;
  }
  if (d[6] != 0x06 || d[7] != 0x06) return 0;
  return 8;
}

size_t matchIdBattery(const uint8_t* d, size_t n) {
  size_t text_end = 0;
  size_t pos = matchIdPrefix(d, n, text_end);
  if (pos == 0) return 0;
  // ~5000 mV (0x1388) .. ~18000 mV (0x4650)
  if (pos + 4 > n || !inRange(d[pos + 1], 0x13, 0x46)) return 0;
  if (d[pos + 2] != 0x06 || d[pos + 3] != 0x06) return 0;
  return pos + 4;
}

size_t matchMode(const uint8_t* d, size_t n) {
  if (n < 4) return 0;
  if (d[0] > kModeConfirmation || d[0] == 3) return 0;
  if (d[1] != 0x00 || d[2] != 0x06 || d[3] != 0x06) return 0;
  return 4;
}

std::vector<DecodedRecord> decodeFrame(const uint8_t* frame, size_t n) {
  std::vector<DecodedRecord> out;
  if (startsWith(frame, n, kVelocitySync)) {
    out.push_back(schemaFor(velocityLayout).decode(frame, n));
  } else if (startsWith(frame, n, kUserConfigSync)) {
    out.push_back(schemaFor(userConfigLayout).decode(frame, n));
  } else if (startsWith(frame, n, kHardwareConfigSync)) {
    out.push_back(schemaFor(hardwareConfigLayout).decode(frame, n));
  } else if (startsWith(frame, n, kHeadConfigSync)) {
    out.push_back(schemaFor(headConfigLayout).decode(frame, n));
  } else if (matchIdBattery(frame, n) == n) {
    size_t text_end = 0;
    size_t id_end = matchIdPrefix(frame, n, text_end);
    DecodedRecord id;
    id.stream = kIdStream;
    id.raw.assign(frame, frame + id_end);
    id.values.emplace_back(
        "identification_string",
        Value::text(std::string(reinterpret_cast<const char*>(frame),
                                text_end)));
    out.push_back(id);
    out.push_back(schemaFor(batteryLayout).decode(frame + id_end, n - id_end));
  } else if (matchClock(frame, n) == n) {
    out.push_back(schemaFor(clockLayout).decode(frame, n));
  } else {
    throw SampleException("unrecognised frame of " + std::to_string(n) +
                          " bytes");
  }
  return out;
}

bool clockToTime(const uint8_t* bcd, std::time_t& t) {
  std::tm tm;
  if (!clockToTm(bcd, tm)) return false;
  t = timegm(&tm);
  return t != static_cast<std::time_t>(-1);
}

bool clockToNtp(const uint8_t* bcd, double& ntp) {
  std::time_t t;
  if (!clockToTime(bcd, t)) return false;
  ntp = unixToNtp(static_cast<double>(t));
  return true;
}

void timeToClock(std::time_t t, uint8_t out[6]) {
  std::tm tm;
  gmtime_r(&t, &tm);
  out[kMinute] = intToBcd(tm.tm_min);
  out[kSecond] = intToBcd(tm.tm_sec);
  out[kDay] = intToBcd(tm.tm_mday);
  out[kHour] = intToBcd(tm.tm_hour);
  out[kYear] = intToBcd(tm.tm_year % 100);
  out[kMonth] = intToBcd(tm.tm_mon + 1);
}

}  // namespace nortek
}  // namespace ocean
