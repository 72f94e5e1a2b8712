#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ocean_ros_driver/base64.hpp"
#include "ocean_ros_driver/nortek_protocol.hpp"
#include "ocean_ros_driver/nortek_records.hpp"
#include "test_helpers.hpp"

using ocean::DriverEvent;
using ocean::NortekConfig;
using ocean::NortekProtocol;
using ocean::ProtocolEvent;
using ocean::ProtocolState;
using ocean::RecordSchema;
using ocean::SampleRecord;
using ocean::Value;
using ocean::ValueMap;
using ocean_test::bytesOf;
using ocean_test::fromHex;
namespace nortek = ocean::nortek;

namespace {

const std::vector<uint8_t> kAck = {0x06, 0x06};
const std::vector<uint8_t> kNack = {0x15, 0x15};

std::vector<uint8_t> withAck(std::vector<uint8_t> bytes)
{
  bytes.insert(bytes.end(), kAck.begin(), kAck.end());
  return bytes;
}

class FakeScheduler : public ocean::Scheduler
{
public:
  struct Job
  {
    std::chrono::seconds interval;
    std::function<void()> callback;
  };

  void schedule(const std::string& job_id, std::chrono::seconds interval,
                std::function<void()> callback) override
  {
    jobs[job_id] = Job{interval, callback};
  }

  void unschedule(const std::string& job_id) override
  {
    jobs.erase(job_id);
  }

  std::map<std::string, Job> jobs;
};

// Runs callbacks on a timer thread of their own. unschedule() blocks while a
// callback of that job is running, the way ros::WallTimer::stop() does.
class TimerThreadScheduler : public ocean::Scheduler
{
public:
  ~TimerThreadScheduler() override { joinAll(); }

  void schedule(const std::string& job_id, std::chrono::seconds,
                std::function<void()> callback) override
  {
    std::lock_guard<std::mutex> lock(mutex);
    jobs[job_id] = callback;
  }

  void unschedule(const std::string& job_id) override
  {
    std::unique_lock<std::mutex> lock(mutex);
    if (!cv.wait_for(lock, std::chrono::seconds(2),
                     [&]() { return in_flight != job_id; }))
    {
      stalled = true;
    }
    jobs.erase(job_id);
  }

  // Starts the job's callback on its own thread. Returns true once it has
  // returned, false when it is still running after two seconds.
  bool fire(const std::string& job_id)
  {
    std::function<void()> callback;
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = jobs.find(job_id);
      if (it == jobs.end()) return false;
      callback = it->second;
      in_flight = job_id;
    }
    threads.emplace_back([this, callback]() {
      callback();
      std::lock_guard<std::mutex> lock(mutex);
      in_flight.clear();
      cv.notify_all();
    });
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, std::chrono::seconds(2),
                       [&]() { return in_flight.empty(); });
  }

  bool scheduled(const std::string& job_id)
  {
    std::lock_guard<std::mutex> lock(mutex);
    return jobs.count(job_id) == 1;
  }

  void joinAll()
  {
    for (std::thread& t : threads)
    {
      if (t.joinable()) t.join();
    }
    threads.clear();
  }

  std::mutex mutex;
  std::condition_variable cv;
  std::map<std::string, std::function<void()>> jobs;
  std::string in_flight;
  std::vector<std::thread> threads;
  bool stalled = false;
};

// Answers like an Aquadopp on the other end of the cable, synchronously.
class FakeAquadopp : public ocean::Transport
{
public:
  FakeAquadopp()
    : mode(nortek::kModeCommand),
      config(RecordSchema(nortek::userConfigLayout()).serialize()),
      clock(fromHex("090702111012")),
      velocity(fromHex(ocean_test::kVelocityHex)),
      hardware(fromHex(ocean_test::kHardwareConfigHex))
  {
    RecordSchema head_schema(nortek::headConfigLayout());
    ValueMap h;
    h["head_config"] = Value::integer(55);
    h["head_frequency"] = Value::integer(6000);
    h["number_beams"] = Value::integer(3);
    head = withAck(head_schema.encode(h));
  }

  void send(const std::vector<uint8_t>& bytes) override
  {
    sent.push_back(bytes);
    const std::string cmd(bytes.begin(), bytes.end());
    if (on_send) on_send(cmd);

    if (cmd == "I")
    {
      if (mode != nortek::kModeCommand) reply(modeReply());
    }
    else if (cmd == "II")
    {
      reply(modeReply());
    }
    else if (cmd == nortek::kSoftBreakSecondHalf)
    {
      if (confirm_break)
      {
        mode = nortek::kModeConfirmation;
        reply(bytesOf("\x06\x06\n\rConfirm:"));
      }
      else
      {
        mode = nortek::kModeCommand;
        reply(bytesOf("\n\rCommand mode\n\r"));
      }
    }
    else if (cmd == "MC")
    {
      mode = nortek::kModeCommand;
      reply(kAck);
    }
    else if (cmd == "ST")
    {
      mode = nortek::kModeMeasurement;
      reply(kAck);
    }
    else if (cmd == "AD")
    {
      if (!silent_sample) reply(velocity);
    }
    else if (cmd == "RC")
    {
      reply(withAck(clock));
    }
    else if (bytes.size() == 8 && cmd.compare(0, 2, "SC") == 0)
    {
      if (!freeze_clock) clock.assign(bytes.begin() + 2, bytes.end());
      reply(kAck);
    }
    else if (cmd == "GC")
    {
      reply(withAck(config));
    }
    else if (cmd == "GP")
    {
      reply(hardware);
    }
    else if (cmd == "GH")
    {
      reply(head);
    }
    else if (cmd == "IDBV")
    {
      reply(fromHex(ocean_test::kIdBatteryHex));
    }
    else if (bytes.size() == 514 && cmd.compare(0, 2, "CC") == 0)
    {
      if (nack_configure)
      {
        reply(kNack);
        return;
      }
      config.assign(bytes.begin() + 2, bytes.end());
      reply(kAck);
    }
  }

  void reply(const std::vector<uint8_t>& bytes)
  {
    if (protocol) protocol->onBytesReceived(bytes.data(), bytes.size(), 1.0);
  }

  std::vector<uint8_t> modeReply() const
  {
    return {static_cast<uint8_t>(mode), 0x00, 0x06, 0x06};
  }

  size_t count(const std::string& cmd) const
  {
    size_t n = 0;
    for (const auto& s : sent)
    {
      if (std::string(s.begin(), s.end()).compare(0, cmd.size(), cmd) == 0)
        ++n;
    }
    return n;
  }

  std::string command(size_t i) const
  {
    return std::string(sent.at(i).begin(), sent.at(i).end());
  }

  Value configValue(const std::string& name) const
  {
    RecordSchema s(nortek::userConfigLayout());
    s.hydrate(config.data(), config.size());
    return s.get(name);
  }

  void setConfigValue(const std::string& name, const Value& v)
  {
    RecordSchema s(nortek::userConfigLayout());
    s.hydrate(config.data(), config.size());
    ASSERT_EQ(ocean::SetError::None, s.set(name, v, true));
    config = s.serialize();
  }

  ocean::InstrumentProtocol* protocol = nullptr;
  int mode;
  std::vector<uint8_t> config;
  std::vector<uint8_t> clock;
  std::vector<uint8_t> velocity;
  std::vector<uint8_t> hardware;
  std::vector<uint8_t> head;
  std::vector<std::vector<uint8_t>> sent;

  bool confirm_break = false;
  bool freeze_clock = false;
  bool nack_configure = false;
  bool silent_sample = false;
  // Called with each command before the reply goes out.
  std::function<void(const std::string&)> on_send;
};

}  // namespace

class NortekProtocolTest : public ::testing::Test
{
protected:
  NortekProtocolTest()
    : now(std::chrono::system_clock::from_time_t(ocean_test::kVelocityTime))
  {
    config.command_timeout = 0.2;
    config.sample_timeout = 0.2;
    config.status_timeout = 0.2;
    config.mode_inquiry_timeout = 0.05;
  }

  void create() { create(scheduler); }

  void create(ocean::Scheduler& jobs)
  {
    proto.reset(new NortekProtocol(device, jobs, config));
    device.protocol = proto.get();
    proto->setClock([this]() { return now; });
    proto->setSleeper([this](double s) { sleeps.push_back(s); });
    proto->setSampleCallback(
        [this](const SampleRecord& r) { samples.push_back(r); });
    proto->setDriverEventCallback(
        [this](DriverEvent e) { events.push_back(e); });
    proto->setDirectAccessCallback([this](const std::vector<uint8_t>& b) {
      direct.insert(direct.end(), b.begin(), b.end());
    });
  }

  void discoverIn(int mode) { discoverIn(mode, scheduler); }

  void discoverIn(int mode, ocean::Scheduler& jobs)
  {
    device.mode = mode;
    create(jobs);
    proto->discover();
    device.sent.clear();
    samples.clear();
    events.clear();
    sleeps.clear();
  }

  size_t countEvents(DriverEvent e) const
  {
    return static_cast<size_t>(std::count(events.begin(), events.end(), e));
  }

  bool published(const std::string& stream) const
  {
    for (const SampleRecord& r : samples)
    {
      if (r.streamName() == stream) return true;
    }
    return false;
  }

  NortekConfig config;
  std::chrono::system_clock::time_point now;
  FakeScheduler scheduler;
  FakeAquadopp device;
  std::vector<SampleRecord> samples;
  std::vector<DriverEvent> events;
  std::vector<double> sleeps;
  std::vector<uint8_t> direct;
  std::unique_ptr<NortekProtocol> proto;
};

TEST_F(NortekProtocolTest, StartsUnknown)
{
  create();
  EXPECT_EQ(ProtocolState::Unknown, proto->state());
  EXPECT_TRUE(device.sent.empty());
}

TEST_F(NortekProtocolTest, DiscoverCommandModeFallsBackToVerboseInquiry)
{
  device.mode = nortek::kModeCommand;
  create();
  EXPECT_EQ(ProtocolState::Command, proto->discover());

  ASSERT_GE(device.sent.size(), 4u);
  EXPECT_EQ("@", device.command(0));
  EXPECT_EQ("I", device.command(1));
  EXPECT_EQ("II", device.command(2));
  EXPECT_EQ("GC", device.command(3));
  EXPECT_EQ(0u, device.count("ST"));
  EXPECT_EQ(1u, countEvents(DriverEvent::StateChange));
  EXPECT_TRUE(published(nortek::kUserConfigStream));
}

TEST_F(NortekProtocolTest, DiscoverAutosampleReinitialisesAndRestarts)
{
  device.mode = nortek::kModeMeasurement;
  create();
  EXPECT_EQ(ProtocolState::Autosample, proto->discover());

  std::vector<std::string> want = {"@", "I", "@@@@@@", "K1W%!Q", "GC", "ST"};
  ASSERT_EQ(want.size(), device.sent.size());
  for (size_t i = 0; i < want.size(); ++i)
  {
    EXPECT_EQ(want[i], device.command(i));
  }
  EXPECT_EQ(nortek::kModeMeasurement, device.mode);
}

TEST_F(NortekProtocolTest, FirmwareUpgradeModeIsFatal)
{
  device.mode = nortek::kModeFirmwareUpgrade;
  create();
  EXPECT_THROW(proto->discover(), ocean::StateException);
  EXPECT_EQ(ProtocolState::Unknown, proto->state());
}

TEST_F(NortekProtocolTest, EventsOutsideTheirStatesAreRejected)
{
  create();
  EXPECT_THROW(proto->acquireSample(), ocean::StateException);
  EXPECT_THROW(proto->handleEvent(ProtocolEvent::ScheduledClockSync),
               ocean::StateException);
  EXPECT_THROW(proto->executeDirect(bytesOf("x")), ocean::StateException);

  proto->discover();
  EXPECT_THROW(proto->discover(), ocean::StateException);
  EXPECT_THROW(proto->stopAutosample(), ocean::StateException);
  EXPECT_THROW(proto->executeDirect(bytesOf("x")), ocean::StateException);
}

TEST_F(NortekProtocolTest, ReadModeInEachState)
{
  discoverIn(nortek::kModeCommand);
  EXPECT_EQ(nortek::kModeCommand, proto->readMode());
  EXPECT_EQ("II", device.command(0));

  proto->startAutosample();
  device.sent.clear();
  EXPECT_EQ(nortek::kModeMeasurement, proto->readMode());
  EXPECT_EQ("@", device.command(0));
  EXPECT_EQ("I", device.command(1));
}

TEST_F(NortekProtocolTest, StartAndStopAutosample)
{
  discoverIn(nortek::kModeCommand);
  proto->startAutosample();
  EXPECT_EQ(ProtocolState::Autosample, proto->state());
  EXPECT_EQ("ST", device.command(0));
  EXPECT_EQ(nortek::kModeMeasurement, device.mode);

  proto->stopAutosample();
  EXPECT_EQ(ProtocolState::Command, proto->state());
  EXPECT_EQ(nortek::kModeCommand, device.mode);
  EXPECT_EQ(2u, countEvents(DriverEvent::StateChange));
}

TEST_F(NortekProtocolTest, BreakConfirmation)
{
  device.confirm_break = true;
  discoverIn(nortek::kModeMeasurement);
  proto->stopAutosample();
  EXPECT_EQ(ProtocolState::Command, proto->state());
  EXPECT_EQ(1u, device.count("MC"));
  EXPECT_EQ(nortek::kModeCommand, device.mode);
}

TEST_F(NortekProtocolTest, GetParameters)
{
  discoverIn(nortek::kModeCommand);
  ValueMap all = proto->getParams({});
  EXPECT_EQ(60, all.at("average_interval").asInt());
  EXPECT_EQ("00:00:00", all.at(NortekProtocol::kClockSyncInterval).asText());
  EXPECT_EQ(all, proto->getParams({NortekProtocol::kAll}));

  ValueMap some = proto->getParams({"cell_size", "profile_type"});
  ASSERT_EQ(2u, some.size());
  EXPECT_EQ(7, some.at("cell_size").asInt());
  EXPECT_EQ(1, some.at("profile_type").asInt());

  EXPECT_THROW(proto->getParams({"bogus"}), ocean::ParameterException);
  EXPECT_TRUE(device.sent.empty());
}

TEST_F(NortekProtocolTest, SetWritesConfigurationAndAnnouncesChange)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p["average_interval"] = Value::integer(30);
  p["power_level_tcm1"] = Value::integer(1);
  proto->setParams(p);

  EXPECT_EQ(1u, device.count("CC"));
  EXPECT_EQ(30, device.configValue("average_interval").asInt());
  EXPECT_EQ(1, device.configValue("power_level_tcm1").asInt());
  EXPECT_EQ(130 | 0x20, device.configValue("timing_control_register").asInt());
  EXPECT_EQ(30, proto->getParams({"average_interval"}).at("average_interval")
                    .asInt());
  EXPECT_EQ(1u, countEvents(DriverEvent::ConfigChange));
}

TEST_F(NortekProtocolTest, UnchangedValuesAreNotWritten)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p["average_interval"] = Value::integer(60);
  proto->setParams(p);
  EXPECT_EQ(0u, device.count("CC"));
  EXPECT_EQ(0u, countEvents(DriverEvent::ConfigChange));
}

TEST_F(NortekProtocolTest, ProtectedAndUnknownParameters)
{
  discoverIn(nortek::kModeCommand);
  ValueMap immutable;
  immutable["transmit_pulse_length"] = Value::integer(100);
  try
  {
    proto->setParams(immutable);
    FAIL() << "immutable parameter accepted";
  }
  catch (const ocean::ParameterException& e)
  {
    EXPECT_EQ(ocean::SetError::Protected, e.reason());
  }

  ValueMap unknown;
  unknown["bogus"] = Value::integer(1);
  unknown["average_interval"] = Value::integer(30);
  try
  {
    proto->setParams(unknown);
    FAIL() << "unknown parameter accepted";
  }
  catch (const ocean::ParameterException& e)
  {
    EXPECT_EQ(ocean::SetError::UnknownField, e.reason());
  }

  ValueMap read_only;
  read_only["software_version"] = Value::integer(1);
  EXPECT_THROW(proto->setParams(read_only, true), ocean::ParameterException);

  EXPECT_EQ(0u, device.count("CC"));
  EXPECT_EQ(60, proto->getParams({"average_interval"}).at("average_interval")
                    .asInt());
}

TEST_F(NortekProtocolTest, ConstraintsAreChecked)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p["cell_size"] = Value::integer(0);
  EXPECT_THROW(proto->setParams(p), ocean::ParameterException);

  p.clear();
  p["coordinate_system"] = Value::integer(3);
  EXPECT_THROW(proto->setParams(p), ocean::ParameterException);

  p.clear();
  p["average_interval"] = Value::text("60");
  EXPECT_THROW(proto->setParams(p), ocean::ParameterException);

  EXPECT_EQ(0u, device.count("CC"));
}

TEST_F(NortekProtocolTest, NackRereadsConfigurationAndRaises)
{
  discoverIn(nortek::kModeCommand);
  device.nack_configure = true;
  ValueMap p;
  p["average_interval"] = Value::integer(30);
  EXPECT_THROW(proto->setParams(p), ocean::ParameterException);

  EXPECT_EQ(1u, device.count("CC"));
  EXPECT_EQ(1u, device.count("GC"));
  EXPECT_EQ(60, proto->getParams({"average_interval"}).at("average_interval")
                    .asInt());
  EXPECT_EQ(0u, countEvents(DriverEvent::ConfigChange));
}

TEST_F(NortekProtocolTest, DoubleConfigureSendsTheBlockTwice)
{
  config.double_configure = true;
  config.write_delay = 0.25;
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p["cell_size"] = Value::integer(10);
  proto->setParams(p);
  EXPECT_EQ(2u, device.count("CC"));
  EXPECT_EQ(device.sent[0], device.sent[1]);
  EXPECT_NE(sleeps.end(), std::find(sleeps.begin(), sleeps.end(), 0.25));
}

TEST_F(NortekProtocolTest, IntervalsInstallScheduledJobs)
{
  discoverIn(nortek::kModeCommand);
  EXPECT_TRUE(scheduler.jobs.empty());

  ValueMap p;
  p[NortekProtocol::kClockSyncInterval] = Value::text("00:10:00");
  proto->setParams(p);
  EXPECT_EQ(0u, device.count("CC"));
  EXPECT_EQ(1u, countEvents(DriverEvent::ConfigChange));
  ASSERT_EQ(1u, scheduler.jobs.count("clock_sync"));
  EXPECT_EQ(600, scheduler.jobs.at("clock_sync").interval.count());
  EXPECT_EQ(0u, scheduler.jobs.count("acquire_status"));

  p[NortekProtocol::kClockSyncInterval] = Value::text("10 minutes");
  EXPECT_THROW(proto->setParams(p), ocean::ParameterException);
  EXPECT_EQ(1u, scheduler.jobs.count("clock_sync"));

  p[NortekProtocol::kClockSyncInterval] = Value::text("00:00:00");
  proto->setParams(p);
  EXPECT_TRUE(scheduler.jobs.empty());
}

TEST_F(NortekProtocolTest, ScheduledClockSyncRunsThroughTheStateMachine)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p[NortekProtocol::kClockSyncInterval] = Value::text("01:00:00");
  proto->setParams(p);
  ASSERT_EQ(1u, scheduler.jobs.count("clock_sync"));

  scheduler.jobs.at("clock_sync").callback();
  EXPECT_EQ(1u, device.count("SC"));
  EXPECT_EQ(1u, device.count("RC"));
}

TEST_F(NortekProtocolTest, TimerFiringDuringACommandDoesNotBlockTheTimer)
{
  TimerThreadScheduler timers;
  discoverIn(nortek::kModeCommand, timers);
  ValueMap p;
  p[NortekProtocol::kClockSyncInterval] = Value::text("01:00:00");
  proto->setParams(p);
  ASSERT_TRUE(timers.scheduled("clock_sync"));

  bool returned = false;
  device.on_send = [&](const std::string& cmd)
  {
    if (cmd == "ST") returned = timers.fire("clock_sync");
  };
  proto->startAutosample();
  device.on_send = nullptr;
  timers.joinAll();

  EXPECT_TRUE(returned);
  EXPECT_FALSE(timers.stalled);
  EXPECT_EQ(ProtocolState::Autosample, proto->state());
  // the pending run belonged to the job torn down when COMMAND was left
  EXPECT_EQ(0u, device.count("SC"));
  EXPECT_TRUE(timers.scheduled("clock_sync"));
}

TEST_F(NortekProtocolTest, DeferredScheduledEventRunsAfterTheCommand)
{
  TimerThreadScheduler timers;
  discoverIn(nortek::kModeCommand, timers);
  ValueMap p;
  p[NortekProtocol::kClockSyncInterval] = Value::text("01:00:00");
  proto->setParams(p);
  device.sent.clear();

  bool returned = false;
  device.on_send = [&](const std::string& cmd)
  {
    if (cmd == "GP") returned = timers.fire("clock_sync");
  };
  proto->acquireStatus();
  device.on_send = nullptr;
  timers.joinAll();

  EXPECT_TRUE(returned);
  EXPECT_FALSE(timers.stalled);
  ASSERT_EQ(1u, device.count("SC"));
  size_t gc = 0;
  size_t sc = 0;
  for (size_t i = 0; i < device.sent.size(); ++i)
  {
    if (device.command(i) == "GC") gc = i;
    if (device.command(i).compare(0, 2, "SC") == 0) sc = i;
  }
  EXPECT_LT(gc, sc);
  EXPECT_EQ(ProtocolState::Command, proto->state());
}

TEST_F(NortekProtocolTest, LeavingCommandRemovesJobs)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p[NortekProtocol::kAcquireStatusInterval] = Value::text("00:30:00");
  proto->setParams(p);
  ASSERT_EQ(1u, scheduler.jobs.count("acquire_status"));

  proto->startDirect();
  EXPECT_TRUE(scheduler.jobs.empty());
}

TEST_F(NortekProtocolTest, ClockSyncSetsHostTimePlusOffset)
{
  discoverIn(nortek::kModeCommand);
  proto->clockSync();

  ASSERT_EQ(2u, device.sent.size());
  std::vector<uint8_t> want = bytesOf("SC");
  std::vector<uint8_t> bcd = fromHex("102126221211");  // 22:10:21
  want.insert(want.end(), bcd.begin(), bcd.end());
  EXPECT_EQ(want, device.sent[0]);
  EXPECT_EQ("RC", device.command(1));
  EXPECT_EQ(bcd, device.clock);
  EXPECT_TRUE(published(nortek::kClockStream));
  EXPECT_TRUE(sleeps.empty());
}

TEST_F(NortekProtocolTest, ClockSyncWaitsForTheNextWholeSecond)
{
  discoverIn(nortek::kModeCommand);
  now += std::chrono::milliseconds(400);
  proto->clockSync();
  ASSERT_EQ(1u, sleeps.size());
  EXPECT_NEAR(0.6, sleeps[0], 1e-6);
}

TEST_F(NortekProtocolTest, ClockSyncDriftIsFatal)
{
  discoverIn(nortek::kModeCommand);
  device.freeze_clock = true;
  EXPECT_THROW(proto->clockSync(), ocean::CommandException);
  EXPECT_EQ(ProtocolState::Command, proto->state());
}

TEST_F(NortekProtocolTest, AcquireStatusPublishesEveryReply)
{
  discoverIn(nortek::kModeCommand);
  proto->acquireStatus();

  std::vector<std::string> want = {"IDBV", "RC", "GP", "GH", "GC"};
  ASSERT_EQ(want.size(), device.sent.size());
  for (size_t i = 0; i < want.size(); ++i)
  {
    EXPECT_EQ(want[i], device.command(i));
  }
  EXPECT_TRUE(published(nortek::kIdStream));
  EXPECT_TRUE(published(nortek::kBatteryStream));
  EXPECT_TRUE(published(nortek::kClockStream));
  EXPECT_TRUE(published(nortek::kHardwareConfigStream));
  EXPECT_TRUE(published(nortek::kHeadConfigStream));
  EXPECT_TRUE(published(nortek::kUserConfigStream));
  for (const SampleRecord& r : samples)
  {
    EXPECT_EQ(ocean::QualityFlag::Ok, r.quality()) << r.streamName();
  }
}

TEST_F(NortekProtocolTest, AcquireStatusRejectsCorruptConfiguration)
{
  discoverIn(nortek::kModeCommand);
  device.hardware[20] ^= 0xFF;
  EXPECT_THROW(proto->acquireStatus(), ocean::ProtocolException);
  EXPECT_EQ(0u, device.count("GH"));
}

TEST_F(NortekProtocolTest, AutosampleMaintenanceRestartsMeasurement)
{
  discoverIn(nortek::kModeMeasurement);
  proto->acquireStatus();

  EXPECT_EQ("@@@@@@", device.command(0));
  EXPECT_EQ("K1W%!Q", device.command(1));
  EXPECT_EQ("ST", device.command(device.sent.size() - 1));
  EXPECT_EQ(nortek::kModeMeasurement, device.mode);
  EXPECT_EQ(ProtocolState::Autosample, proto->state());
}

TEST_F(NortekProtocolTest, MaintenanceRestartsMeasurementAfterFailure)
{
  discoverIn(nortek::kModeMeasurement);
  device.hardware[20] ^= 0xFF;
  EXPECT_THROW(proto->acquireStatus(), ocean::ProtocolException);

  EXPECT_EQ("ST", device.command(device.sent.size() - 1));
  EXPECT_EQ(nortek::kModeMeasurement, device.mode);
  EXPECT_EQ(ProtocolState::Autosample, proto->state());

  device.sent.clear();
  device.freeze_clock = true;
  EXPECT_THROW(proto->clockSync(), ocean::CommandException);
  EXPECT_EQ("ST", device.command(device.sent.size() - 1));
}

TEST_F(NortekProtocolTest, AcquireSamplePublishesVelocity)
{
  discoverIn(nortek::kModeCommand);
  proto->acquireSample();

  EXPECT_EQ("AD", device.command(0));
  EXPECT_EQ(ProtocolState::Command, proto->state());
  EXPECT_EQ(2u, countEvents(DriverEvent::StateChange));

  ASSERT_TRUE(published(nortek::kVelocityStream));
  const SampleRecord& r = samples.front();
  EXPECT_EQ(1665, r.find("heading_decidegree")->asInt());
  EXPECT_EQ(147, r.find("battery_voltage_dv")->asInt());
  EXPECT_DOUBLE_EQ(1.0, r.portTimestamp());
  EXPECT_DOUBLE_EQ(ocean_test::kVelocityNtp, r.internalTimestamp());
  EXPECT_DOUBLE_EQ(ocean_test::kVelocityNtp, r.driverTimestamp());
}

TEST_F(NortekProtocolTest, AcquireSampleTimeoutReturnsToCommand)
{
  discoverIn(nortek::kModeCommand);
  device.silent_sample = true;
  EXPECT_THROW(proto->acquireSample(), ocean::TimeoutException);
  EXPECT_EQ(ProtocolState::Command, proto->state());
}

TEST_F(NortekProtocolTest, StartupParametersAreAppliedOnDiscover)
{
  device.mode = nortek::kModeCommand;
  create();
  ValueMap startup;
  startup["transmit_pulse_length"] = Value::integer(100);
  startup[NortekProtocol::kAcquireStatusInterval] = Value::text("01:00:00");
  proto->setStartupParams(startup);
  proto->discover();

  EXPECT_EQ(1u, device.count("CC"));
  EXPECT_EQ(100, device.configValue("transmit_pulse_length").asInt());
  ASSERT_EQ(1u, scheduler.jobs.count("acquire_status"));
  EXPECT_EQ(3600, scheduler.jobs.at("acquire_status").interval.count());
}

TEST_F(NortekProtocolTest, DirectAccessRelaysAndRestoresConfiguration)
{
  discoverIn(nortek::kModeCommand);
  proto->startDirect();
  EXPECT_EQ(ProtocolState::DirectAccess, proto->state());

  proto->executeDirect(bytesOf("hello"));
  EXPECT_EQ("hello", device.command(0));
  device.reply(bytesOf("abc"));
  EXPECT_EQ(bytesOf("abc"), direct);

  // the operator changes the instrument behind the driver's back
  device.setConfigValue("average_interval", Value::integer(99));
  device.sent.clear();
  proto->stopDirect();

  EXPECT_EQ(ProtocolState::Command, proto->state());
  EXPECT_EQ(1u, device.count("CC"));
  EXPECT_EQ(60, device.configValue("average_interval").asInt());
  EXPECT_EQ(60, proto->getParams({"average_interval"}).at("average_interval")
                    .asInt());
}

TEST_F(NortekProtocolTest, DirectAccessFromAutosampleRediscovers)
{
  discoverIn(nortek::kModeMeasurement);
  proto->startDirect();
  EXPECT_TRUE(scheduler.jobs.empty());
  proto->stopDirect();
  EXPECT_EQ(ProtocolState::Autosample, proto->state());
  EXPECT_EQ("ST", device.command(device.sent.size() - 1));
}

TEST_F(NortekProtocolTest, SnapshotAndRestore)
{
  discoverIn(nortek::kModeCommand);
  EXPECT_EQ(ocean::base64Encode(device.config), proto->snapshot());

  RecordSchema other(nortek::userConfigLayout());
  ASSERT_EQ(ocean::SetError::None, other.set("cell_size", Value::integer(42)));
  proto->restore(other.snapshot());
  EXPECT_EQ(42, proto->getParams({"cell_size"}).at("cell_size").asInt());
  EXPECT_EQ(other.snapshot(), proto->snapshot());
  EXPECT_EQ(0u, device.count("CC"));
}

TEST_F(NortekProtocolTest, RestoreWaitsForTheCommandInProgress)
{
  discoverIn(nortek::kModeCommand);
  RecordSchema other(nortek::userConfigLayout());
  ASSERT_EQ(ocean::SetError::None, other.set("cell_size", Value::integer(42)));
  const std::string encoded = other.snapshot();

  std::atomic<bool> restored(false);
  bool restored_mid_command = true;
  std::thread writer;
  device.on_send = [&](const std::string& cmd)
  {
    if (cmd != "GP") return;
    writer = std::thread([&]()
    {
      proto->restore(encoded);
      restored = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    restored_mid_command = restored;
  };
  proto->acquireStatus();
  device.on_send = nullptr;
  ASSERT_TRUE(writer.joinable());
  writer.join();

  EXPECT_FALSE(restored_mid_command);
  EXPECT_TRUE(restored);
  EXPECT_EQ(encoded, proto->snapshot());
}

TEST_F(NortekProtocolTest, DestructionRemovesJobs)
{
  discoverIn(nortek::kModeCommand);
  ValueMap p;
  p[NortekProtocol::kClockSyncInterval] = Value::text("00:01:00");
  proto->setParams(p);
  ASSERT_FALSE(scheduler.jobs.empty());
  proto.reset();
  EXPECT_TRUE(scheduler.jobs.empty());
}

TEST(NortekIntervals, Parse)
{
  EXPECT_EQ(3723, NortekProtocol::parseInterval("01:02:03").count());
  EXPECT_EQ(0, NortekProtocol::parseInterval("00:00:00").count());
  EXPECT_THROW(NortekProtocol::parseInterval("1:02:03"),
               ocean::ParameterException);
  EXPECT_THROW(NortekProtocol::parseInterval("00:60:00"),
               ocean::ParameterException);
  EXPECT_THROW(NortekProtocol::parseInterval(""), ocean::ParameterException);
}

TEST(ResponseMatching, PromptsInListOrder)
{
  ocean::ResponseMatcher m =
      ocean::expectPrompts({nortek::kConfirmationPrompt, nortek::kAck});
  ocean::Response r;
  EXPECT_FALSE(m(bytesOf("noise"), r));
  EXPECT_TRUE(m(bytesOf("\x06\x06\n\rConfirm:"), r));
  EXPECT_EQ(nortek::kConfirmationPrompt, r.prompt);
  EXPECT_TRUE(m(bytesOf("xx\x06\x06"), r));
  EXPECT_EQ(nortek::kAck, r.prompt);
}

TEST(ResponseMatching, FirstFrame)
{
  ocean::ResponseMatcher m = ocean::expectFrame(nortek::clockMatcher());
  ocean::Response r;
  std::vector<uint8_t> rx = bytesOf("zz");
  std::vector<uint8_t> clock = fromHex(ocean_test::kClockHex);
  EXPECT_FALSE(m(rx, r));
  rx.insert(rx.end(), clock.begin(), clock.end());
  EXPECT_TRUE(m(rx, r));
  EXPECT_EQ(clock, r.frame);
}

TEST(ResponseMatching, Printable)
{
  EXPECT_EQ("SC\\x10\\x06", ocean::printable({'S', 'C', 0x10, 0x06}));
}

TEST(RestoreGuard, RunsOnEveryExitPath)
{
  int runs = 0;
  {
    ocean::RestoreGuard g([&runs]() { ++runs; });
  }
  EXPECT_EQ(1, runs);

  {
    ocean::RestoreGuard g([&runs]() { ++runs; });
    g.run();
  }
  EXPECT_EQ(2, runs);

  {
    ocean::RestoreGuard g([&runs]() { ++runs; });
    g.dismiss();
  }
  EXPECT_EQ(2, runs);

  try
  {
    ocean::RestoreGuard g([&runs]() { ++runs; });
    throw ocean::ProtocolException("maintenance failed");
  }
  catch (const ocean::ProtocolException&)
  {
  }
  EXPECT_EQ(3, runs);
}

TEST(RestoreGuard, DestructorLogsRestoreFailure)
{
  EXPECT_NO_THROW({
    ocean::RestoreGuard g([]() { throw ocean::TimeoutException("no ack"); });
  });
  ocean::RestoreGuard g([]() { throw ocean::TimeoutException("no ack"); });
  EXPECT_THROW(g.run(), ocean::TimeoutException);
}
