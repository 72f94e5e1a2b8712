#include "ocean_ros_driver/nortek_protocol.hpp"

#include <ros/console.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <ctime>

#include "ocean_ros_driver/bcd_utils.hpp"
#include "ocean_ros_driver/checksum.hpp"
#include "ocean_ros_driver/nortek_records.hpp"

namespace ocean {

constexpr const char* NortekProtocol::kClockSyncInterval;
constexpr const char* NortekProtocol::kAcquireStatusInterval;
constexpr const char* NortekProtocol::kAll;

namespace {

struct Constraint {
  const char* name;
  int64_t minimum;
  int64_t maximum;
};

const Constraint kConstraints[] = {
    {"average_interval", 1, 65535},     {"cell_size", 1, 65535},
    {"blanking_distance", 1, 65535},    {"coordinate_system", 0, 2},
    {"measurement_interval", 0, 65535}, {"timing_control_register", 1, 65535},
};

StateException unhandled(ProtocolState s, ProtocolEvent e) {
  return StateException(std::string(toString(e)) + " is not handled in " +
                        toString(s));
}

// Sync, length and checksum of a configuration reply.
ResponseValidator validConfiguration(std::shared_ptr<const RecordLayout> l) {
  return [l](const Response& r) {
    const std::vector<uint8_t>& f = r.frame;
    if (f.size() < l->total_length ||
        !std::equal(l->sync.begin(), l->sync.end(), f.begin())) {
      throw ProtocolException(l->stream + ": malformed reply");
    }
    size_t at = l->total_length - 2;
    if (!validate(kChecksumSeed, f.data(), at, readU16Le(f.data() + at))) {
      throw ProtocolException(l->stream + ": checksum mismatch in reply");
    }
  };
}

std::vector<uint8_t> bytesOf(const std::string& s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

}  // namespace

NortekProtocol::NortekProtocol(Transport& transport, Scheduler& scheduler,
                               NortekConfig config)
    : InstrumentProtocol(transport, scheduler, nortek::frameMatchers()),
      config_(config),
      user_config_(nortek::userConfigLayout()),
      clock_sync_interval_("00:00:00"),
      acquire_status_interval_("00:00:00"),
      init_pending_(true) {
  start(ProtocolState::Unknown);
}

NortekProtocol::~NortekProtocol() {
  removeScheduledJob(ScheduledJob::ClockSync);
  removeScheduledJob(ScheduledJob::AcquireStatus);
}

ProtocolState NortekProtocol::discover() {
  handleEvent(ProtocolEvent::Discover);
  return state();
}

int NortekProtocol::readMode() {
  return handleEvent(ProtocolEvent::ReadMode).mode;
}

ValueMap NortekProtocol::getParams(const std::vector<std::string>& names) {
  EventArgs args;
  args.names = names;
  return handleEvent(ProtocolEvent::Get, args).values;
}

void NortekProtocol::setParams(const ValueMap& params, bool startup) {
  EventArgs args;
  args.params = params;
  args.startup = startup;
  handleEvent(ProtocolEvent::Set, args);
}

void NortekProtocol::acquireSample() {
  handleEvent(ProtocolEvent::AcquireSample);
}

void NortekProtocol::acquireStatus() {
  handleEvent(ProtocolEvent::AcquireStatus);
}

void NortekProtocol::startAutosample() {
  handleEvent(ProtocolEvent::StartAutosample);
}

void NortekProtocol::stopAutosample() {
  handleEvent(ProtocolEvent::StopAutosample);
}

void NortekProtocol::clockSync() { handleEvent(ProtocolEvent::ClockSync); }

void NortekProtocol::startDirect() { handleEvent(ProtocolEvent::StartDirect); }

void NortekProtocol::stopDirect() { handleEvent(ProtocolEvent::StopDirect); }

void NortekProtocol::executeDirect(const std::vector<uint8_t>& bytes) {
  EventArgs args;
  args.data = bytes;
  handleEvent(ProtocolEvent::ExecuteDirect, args);
}

void NortekProtocol::setStartupParams(const ValueMap& params) {
  startup_params_ = params;
}

std::string NortekProtocol::snapshot() {
  std::string encoded;
  exclusive([&] { encoded = user_config_.snapshot(); });
  return encoded;
}

void NortekProtocol::restore(const std::string& encoded) {
  exclusive([&] { user_config_.restore(encoded); });
}

std::chrono::seconds NortekProtocol::parseInterval(const std::string& s) {
  bool ok = s.size() == 8 && s[2] == ':' && s[5] == ':';
  for (size_t i = 0; ok && i < s.size(); ++i) {
    if (i != 2 && i != 5 && !std::isdigit(static_cast<unsigned char>(s[i]))) {
      ok = false;
    }
  }
  if (!ok) {
    throw ParameterException("interval '" + s + "' is not HH:MM:SS");
  }
  int h = std::stoi(s.substr(0, 2));
  int m = std::stoi(s.substr(3, 2));
  int sec = std::stoi(s.substr(6, 2));
  if (m > 59 || sec > 59) {
    throw ParameterException("interval '" + s + "' is not HH:MM:SS");
  }
  return std::chrono::seconds(h * 3600 + m * 60 + sec);
}

void NortekProtocol::enterState(ProtocolState s) {
  switch (s) {
    case ProtocolState::Command:
      if (init_pending_) {
        updateParams();
        initParams();
        init_pending_ = false;
      }
      installJobs();
      break;
    case ProtocolState::Autosample:
      if (init_pending_) {
        breakSequence();
        updateParams();
        initParams();
        startMeasurement();
        init_pending_ = false;
      }
      installJobs();
      break;
    case ProtocolState::DirectAccess:
      // 记录直通前的配置，退出后恢复
      pre_direct_values_.clear();
      for (const FieldDescriptor& f : user_config_.layout().fields) {
        if (f.codec->spare || f.lifecycle != Lifecycle::DirectAccessEligible) {
          continue;
        }
        pre_direct_values_[f.name] = user_config_.get(f.name);
      }
      break;
    case ProtocolState::Unknown:
    case ProtocolState::AcquiringSample:
      break;
  }
  driverEvent(DriverEvent::StateChange);
}

void NortekProtocol::exitState(ProtocolState s) {
  if (s == ProtocolState::Command || s == ProtocolState::Autosample) {
    removeScheduledJob(ScheduledJob::ClockSync);
    removeScheduledJob(ScheduledJob::AcquireStatus);
  }
}

EventResult NortekProtocol::dispatch(ProtocolState s, ProtocolEvent e,
                                     const EventArgs& args) {
  switch (s) {
    case ProtocolState::Unknown:
      return handleUnknown(e, args);
    case ProtocolState::Command:
      return handleCommand(e, args);
    case ProtocolState::Autosample:
      return handleAutosample(e, args);
    case ProtocolState::DirectAccess:
      return handleDirectAccess(e, args);
    case ProtocolState::AcquiringSample:
      break;
  }
  throw unhandled(s, e);
}

EventResult NortekProtocol::handleUnknown(ProtocolEvent e, const EventArgs&) {
  EventResult result;
  switch (e) {
    case ProtocolEvent::Discover:
      transitionTo(discoverState());
      break;
    case ProtocolEvent::ReadMode:
      result.mode = readModeUnknown();
      break;
    default:
      throw unhandled(ProtocolState::Unknown, e);
  }
  return result;
}

EventResult NortekProtocol::handleCommand(ProtocolEvent e,
                                          const EventArgs& args) {
  EventResult result;
  switch (e) {
    case ProtocolEvent::ReadMode:
      result.mode = readModeCommand();
      break;
    case ProtocolEvent::Get:
      result.values = getValues(args.names);
      break;
    case ProtocolEvent::Set:
      applyParams(args.params, args.startup);
      break;
    case ProtocolEvent::AcquireSample:
      doAcquireSample();
      break;
    case ProtocolEvent::AcquireStatus:
    case ProtocolEvent::ScheduledAcquireStatus:
      doAcquireStatus();
      break;
    case ProtocolEvent::ClockSync:
    case ProtocolEvent::ScheduledClockSync:
      doClockSync();
      break;
    case ProtocolEvent::StartAutosample:
      startMeasurement();
      transitionTo(ProtocolState::Autosample);
      break;
    case ProtocolEvent::StartDirect:
      transitionTo(ProtocolState::DirectAccess);
      break;
    default:
      throw unhandled(ProtocolState::Command, e);
  }
  return result;
}

EventResult NortekProtocol::handleAutosample(ProtocolEvent e,
                                             const EventArgs& args) {
  EventResult result;
  switch (e) {
    case ProtocolEvent::ReadMode:
      result.mode = readModeAutosample();
      break;
    case ProtocolEvent::Get:
      result.values = getValues(args.names);
      break;
    case ProtocolEvent::StopAutosample:
      breakSequence();
      transitionTo(ProtocolState::Command);
      break;
    case ProtocolEvent::AcquireStatus:
    case ProtocolEvent::ScheduledAcquireStatus:
      maintenance(&NortekProtocol::doAcquireStatus);
      break;
    case ProtocolEvent::ClockSync:
    case ProtocolEvent::ScheduledClockSync:
      maintenance(&NortekProtocol::doClockSync);
      break;
    case ProtocolEvent::StartDirect:
      transitionTo(ProtocolState::DirectAccess);
      break;
    default:
      throw unhandled(ProtocolState::Autosample, e);
  }
  return result;
}

EventResult NortekProtocol::handleDirectAccess(ProtocolEvent e,
                                               const EventArgs& args) {
  EventResult result;
  switch (e) {
    case ProtocolEvent::ExecuteDirect:
      sendRaw(args.data);
      break;
    case ProtocolEvent::ReadMode:
      result.mode = readModeUnknown();
      break;
    case ProtocolEvent::StopDirect:
      // The operator may have changed anything while in direct access.
      init_pending_ = true;
      transitionTo(discoverState());
      break;
    default:
      throw unhandled(ProtocolState::DirectAccess, e);
  }
  return result;
}

ProtocolState NortekProtocol::discoverState() {
  int mode = handleEvent(ProtocolEvent::ReadMode).mode;
  switch (mode) {
    case nortek::kModeFirmwareUpgrade:
      ROS_INFO("Firmware upgrade in progress");
      throw StateException("instrument is in firmware upgrade mode");
    case nortek::kModeMeasurement:
    case nortek::kModeDataRetrieval:
    case nortek::kModeConfirmation:
      ROS_DEBUG("Discovered mode %d, autosample", mode);
      return ProtocolState::Autosample;
    case nortek::kModeCommand:
      ROS_DEBUG("Discovered mode %d, command", mode);
      return ProtocolState::Command;
    default:
      break;
  }
  throw StateException("unknown instrument mode " + std::to_string(mode));
}

int NortekProtocol::readModeUnknown() {
  sendRaw(nortek::kAutosampleBreak);
  sleepFor(config_.break_delay);
  try {
    Response r = sendCommand(
        nortek::kSampleWhatMode,
        frame(nortek::modeMatcher(), config_.mode_inquiry_timeout));
    return r.frame[0];
  } catch (const TimeoutException&) {
    ROS_DEBUG("No response to \"%s\", sending \"%s\"", nortek::kSampleWhatMode,
              nortek::kCommandWhatMode);
  }
  return readModeCommand();
}

int NortekProtocol::readModeAutosample() {
  sendRaw(nortek::kAutosampleBreak);
  sleepFor(config_.break_delay);
  Response r = sendCommand(nortek::kSampleWhatMode,
                           frame(nortek::modeMatcher(), config_.command_timeout));
  return r.frame[0];
}

int NortekProtocol::readModeCommand() {
  Response r = sendCommand(nortek::kCommandWhatMode,
                           frame(nortek::modeMatcher(), config_.command_timeout));
  return r.frame[0];
}

void NortekProtocol::breakSequence() {
  sendRaw(nortek::kSoftBreakFirstHalf);
  sleepFor(config_.break_delay);

  CommandOptions opts;
  opts.timeout = config_.command_timeout;
  opts.matcher =
      expectPrompts({nortek::kConfirmationPrompt, nortek::kCommandModePrompt});
  Response r = sendCommand(nortek::kSoftBreakSecondHalf, opts);
  ROS_DEBUG("Break answered with '%s'", r.prompt.c_str());

  if (r.prompt == nortek::kConfirmationPrompt) {
    sendCommand(nortek::kConfirmBreak, ack(config_.command_timeout));
  }
}

void NortekProtocol::startMeasurement() {
  sendCommand(nortek::kStartMeasurement, ack(config_.sample_timeout));
}

void NortekProtocol::doAcquireSample() {
  transitionTo(ProtocolState::AcquiringSample);
  RestoreGuard back([this] { transitionTo(ProtocolState::Command); });
  sendCommand(nortek::kAcquireData,
              frame(nortek::velocityMatcher(), config_.sample_timeout));
  breakSequence();
  back.run();
}

void NortekProtocol::doAcquireStatus() {
  // ID 和 BV 一起发送，回复合并为一帧
  sendCommand(std::string(nortek::kReadId) + nortek::kReadBatteryVoltage,
              frame(nortek::idBatteryMatcher(), config_.status_timeout));
  sendCommand(nortek::kReadClock,
              frame(nortek::clockMatcher(), config_.command_timeout));

  CommandOptions hw =
      frame(nortek::hardwareConfigMatcher(), config_.command_timeout);
  hw.validator = validConfiguration(nortek::hardwareConfigLayout());
  sendCommand(nortek::kReadHardwareConfiguration, hw);

  CommandOptions head =
      frame(nortek::headConfigMatcher(), config_.command_timeout);
  head.validator = validConfiguration(nortek::headConfigLayout());
  sendCommand(nortek::kReadHeadConfiguration, head);

  CommandOptions user =
      frame(nortek::userConfigMatcher(), config_.command_timeout);
  user.validator = validConfiguration(nortek::userConfigLayout());
  sendCommand(nortek::kReadUserConfiguration, user);
}

void NortekProtocol::doClockSync() {
  using std::chrono::duration;
  using std::chrono::duration_cast;

  // 对齐到整秒
  auto t = now();
  auto since = t.time_since_epoch();
  double sub =
      duration<double>(since - duration_cast<std::chrono::seconds>(since))
          .count();
  if (sub > 0.1) {
    sleepFor(1.0 - sub);
    t = now();
  }

  std::time_t host = static_cast<std::time_t>(
      std::llround(duration<double>(t.time_since_epoch()).count()));
  std::time_t target =
      host + static_cast<std::time_t>(std::llround(config_.clock_sync_offset));

  uint8_t bcd[6];
  nortek::timeToClock(target, bcd);
  ROS_DEBUG("Setting clock to %02x:%02x:%02x %02x/%02x/%02x", bcd[3], bcd[0],
            bcd[1], bcd[2], bcd[5], bcd[4]);
  std::vector<uint8_t> cmd = bytesOf(nortek::kSetClock);
  cmd.insert(cmd.end(), bcd, bcd + 6);
  sendCommand(cmd, ack(config_.command_timeout));

  Response r = sendCommand(nortek::kReadClock,
                           frame(nortek::clockMatcher(), config_.command_timeout));
  std::time_t device = 0;
  if (!nortek::clockToTime(r.frame.data(), device)) {
    throw ProtocolException("clock reply is not a valid date");
  }

  double host_now = duration<double>(now().time_since_epoch()).count();
  double diff = std::fabs(host_now - static_cast<double>(device));
  ROS_DEBUG("Instrument clock differs from host by %.3f s", diff);
  if (diff > config_.clock_sync_max_drift) {
    throw CommandException("clock sync failed, instrument is off by " +
                           std::to_string(diff) + " s");
  }
}

void NortekProtocol::maintenance(void (NortekProtocol::*work)()) {
  breakSequence();
  RestoreGuard restart([this] { startMeasurement(); });
  (this->*work)();
  restart.run();
}

void NortekProtocol::updateParams() {
  CommandOptions opts =
      frame(nortek::userConfigMatcher(), config_.command_timeout);
  opts.validator = validConfiguration(nortek::userConfigLayout());
  Response r = sendCommand(nortek::kReadUserConfiguration, opts);
  try {
    user_config_.hydrate(r.frame.data(), r.frame.size());
  } catch (const SampleException& e) {
    throw ProtocolException(e.what());
  }
}

void NortekProtocol::initParams() {
  ValueMap values = pre_direct_values_;
  for (const auto& kv : startup_params_) {
    values[kv.first] = kv.second;
  }
  pre_direct_values_.clear();
  if (values.empty()) return;
  ROS_DEBUG("Applying %zu startup parameter(s)", values.size());
  applyParams(values, true);
}

void NortekProtocol::applyParams(const ValueMap& params, bool startup) {
  for (const auto& kv : params) {
    const std::string& name = kv.first;
    if (name == kClockSyncInterval || name == kAcquireStatusInterval) continue;
    if (!user_config_.has(name)) {
      throw ParameterException(name + " is not a valid parameter",
                               SetError::UnknownField);
    }
    Mutability m = user_config_.mutability(name);
    if (!startup && m != Mutability::ReadWrite) {
      throw ParameterException(
          "attempt to set " + std::string(toString(m)) + " parameter " + name,
          SetError::Protected);
    }
  }

  ValueMap old_config = fullConfig();
  RecordSchema working = user_config_;
  std::string clock_sync = clock_sync_interval_;
  std::string acquire_status = acquire_status_interval_;
  bool device_changed = false;

  for (const auto& kv : params) {
    const std::string& name = kv.first;
    const Value& value = kv.second;
    checkConstraint(name, value);

    if (name == kClockSyncInterval || name == kAcquireStatusInterval) {
      if (value.type() != Value::Type::Text) {
        throw ParameterException(name + " must be HH:MM:SS");
      }
      parseInterval(value.asText());
      if (name == kClockSyncInterval) {
        clock_sync = value.asText();
      } else {
        acquire_status = value.asText();
      }
      continue;
    }

    if (working.get(name) == value) continue;
    ROS_DEBUG("Setting %s to %s", name.c_str(), value.toString().c_str());
    SetError err = working.set(name, value, startup);
    if (err != SetError::None) {
      throw ParameterException("unable to set " + name + " to " +
                                   value.toString() + " (" + toString(err) +
                                   ")",
                               err);
    }
    device_changed = true;
  }

  if (device_changed) {
    std::vector<uint8_t> cmd = bytesOf(nortek::kConfigureInstrument);
    std::vector<uint8_t> block = working.serialize();
    cmd.insert(cmd.end(), block.begin(), block.end());

    CommandOptions opts;
    opts.timeout = config_.command_timeout;
    opts.write_delay = config_.write_delay;
    opts.matcher = expectPrompts({nortek::kAck, nortek::kNack});
    Response r = sendCommand(cmd, opts);
    if (config_.double_configure && r.prompt == nortek::kAck) {
      sleepFor(config_.write_delay);
      r = sendCommand(cmd, opts);
    }
    if (r.prompt == nortek::kNack) {
      updateParams();
      throw ParameterException("instrument rejected parameter change");
    }
    updateParams();
  }

  bool jobs_changed = clock_sync != clock_sync_interval_ ||
                      acquire_status != acquire_status_interval_;
  clock_sync_interval_ = clock_sync;
  acquire_status_interval_ = acquire_status;
  if (jobs_changed && (state() == ProtocolState::Command ||
                       state() == ProtocolState::Autosample)) {
    installJobs();
  }

  if (fullConfig() != old_config) {
    driverEvent(DriverEvent::ConfigChange);
  }
}

void NortekProtocol::checkConstraint(const std::string& name,
                                     const Value& v) const {
  for (const Constraint& c : kConstraints) {
    if (name != c.name) continue;
    std::string desc = "parameter " + name + " value " + v.toString() +
                       " minimum " + std::to_string(c.minimum) + " maximum " +
                       std::to_string(c.maximum);
    if (v.type() != Value::Type::Integer) {
      throw ParameterException("type mismatch: " + desc);
    }
    if (v.asInt() < c.minimum || v.asInt() > c.maximum) {
      throw ParameterException("out of range: " + desc);
    }
  }
}

ValueMap NortekProtocol::fullConfig() const {
  ValueMap out = user_config_.getConfig();
  out[kClockSyncInterval] = Value::text(clock_sync_interval_);
  out[kAcquireStatusInterval] = Value::text(acquire_status_interval_);
  return out;
}

ValueMap NortekProtocol::getValues(const std::vector<std::string>& names) const {
  if (names.empty() || (names.size() == 1 && names[0] == kAll)) {
    return fullConfig();
  }
  ValueMap out;
  for (const std::string& name : names) {
    if (name == kClockSyncInterval) {
      out[name] = Value::text(clock_sync_interval_);
    } else if (name == kAcquireStatusInterval) {
      out[name] = Value::text(acquire_status_interval_);
    } else {
      out[name] = user_config_.get(name);
    }
  }
  return out;
}

void NortekProtocol::installJobs() {
  scheduleJob(ScheduledJob::ClockSync, parseInterval(clock_sync_interval_),
              ProtocolEvent::ScheduledClockSync);
  scheduleJob(ScheduledJob::AcquireStatus,
              parseInterval(acquire_status_interval_),
              ProtocolEvent::ScheduledAcquireStatus);
}

CommandOptions NortekProtocol::ack(double timeout) const {
  CommandOptions opts;
  opts.timeout = timeout;
  opts.write_delay = config_.write_delay;
  opts.matcher = expectPrompts({nortek::kAck});
  return opts;
}

CommandOptions NortekProtocol::frame(std::shared_ptr<const FrameMatcher> m,
                                     double timeout) const {
  CommandOptions opts;
  opts.timeout = timeout;
  opts.write_delay = config_.write_delay;
  opts.matcher = expectFrame(std::move(m));
  return opts;
}

void NortekProtocol::gotChunk(const std::vector<uint8_t>& chunk,
                              double port_timestamp) {
  std::vector<DecodedRecord> records =
      nortek::decodeFrame(chunk.data(), chunk.size());
  double driver_timestamp = toNtp(now());
  for (const DecodedRecord& rec : records) {
    publish(SampleRecord(rec, port_timestamp, driver_timestamp));
  }
}

}  // namespace ocean
