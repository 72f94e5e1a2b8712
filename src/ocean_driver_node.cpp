#include <ros/ros.h>
#include <std_msgs/String.h>
#include <std_msgs/UInt8MultiArray.h>

#include <atomic>
#include <chrono>
#include <cerrno>
#include <cstdlib>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ocean_ros_driver/exceptions.hpp"
#include "ocean_ros_driver/nortek_protocol.hpp"
#include "ocean_ros_driver/ros_scheduler.hpp"
#include "ocean_ros_driver/serial_port.hpp"

using ocean::NortekConfig;
using ocean::NortekProtocol;
using ocean::SerialPort;
using ocean::Value;
using ocean::ValueMap;

namespace {

// "name=value"；数字按整数处理，其余按字符串
bool parseAssignment(const std::string& text, std::string& name, Value& v)
{
  size_t eq = text.find('=');
  if (eq == std::string::npos || eq == 0)
  {
    return false;
  }
  name = text.substr(0, eq);
  std::string raw = text.substr(eq + 1);
  char* end = nullptr;
  long long x = std::strtoll(raw.c_str(), &end, 0);
  if (!raw.empty() && end != nullptr && *end == '\0')
  {
    v = Value::integer(x);
  }
  else
  {
    v = Value::text(raw);
  }
  return true;
}

std::string configJson(const ValueMap& values)
{
  std::string out = "{";
  for (const auto& kv : values)
  {
    if (out.size() > 1)
    {
      out += ", ";
    }
    out += "\"" + ocean::jsonEscape(kv.first) + "\": " + kv.second.toJson();
  }
  return out + "}";
}

// 启动参数：~startup/<name>，整数或字符串
ValueMap readStartupParams(ros::NodeHandle& pnh, const NortekProtocol& proto)
{
  ValueMap out;
  std::vector<std::string> names = proto.userConfig().names();
  names.push_back(NortekProtocol::kClockSyncInterval);
  names.push_back(NortekProtocol::kAcquireStatusInterval);
  for (const std::string& name : names)
  {
    int i = 0;
    std::string s;
    if (pnh.getParam("startup/" + name, i))
    {
      out[name] = Value::integer(i);
    }
    else if (pnh.getParam("startup/" + name, s))
    {
      out[name] = Value::text(s);
    }
  }
  return out;
}

}  // namespace

int main(int argc, char** argv)
{
  ros::init(argc, argv, "ocean_ros_driver");
  ros::NodeHandle nh;        // 全局命名空间（便于发布到全局话题）
  ros::NodeHandle pnh("~");  // 私有参数

  std::string port = "/dev/ttyUSB0", topic = "/ocean/samples";
  std::string clock_sync_interval = "00:00:00";
  std::string acquire_status_interval = "00:00:00";
  int baud = 9600;
  bool debug = true, auto_discover = true;
  NortekConfig cfg;
  pnh.param("port", port, port);
  pnh.param("baud", baud, baud);
  pnh.param("topic", topic, topic);
  pnh.param("debug", debug, debug);
  pnh.param("auto_discover", auto_discover, auto_discover);
  pnh.param("command_timeout", cfg.command_timeout, cfg.command_timeout);
  pnh.param("sample_timeout", cfg.sample_timeout, cfg.sample_timeout);
  pnh.param("status_timeout", cfg.status_timeout, cfg.status_timeout);
  pnh.param("mode_inquiry_timeout", cfg.mode_inquiry_timeout,
            cfg.mode_inquiry_timeout);
  pnh.param("break_delay", cfg.break_delay, cfg.break_delay);
  pnh.param("write_delay", cfg.write_delay, cfg.write_delay);
  pnh.param("clock_sync_offset", cfg.clock_sync_offset, cfg.clock_sync_offset);
  pnh.param("clock_sync_max_drift", cfg.clock_sync_max_drift,
            cfg.clock_sync_max_drift);
  pnh.param("double_configure", cfg.double_configure, cfg.double_configure);
  pnh.param("clock_sync_interval", clock_sync_interval, clock_sync_interval);
  pnh.param("acquire_status_interval", acquire_status_interval,
            acquire_status_interval);

  SerialPort serial_port(port, baud);
  if (!serial_port.openSerial())
  {
    ROS_ERROR("Open %s failed", port.c_str());
    return 1;
  }
  ROS_INFO("Opened %s @ %d, publishing %s", port.c_str(), baud, topic.c_str());

  ros::Publisher pub = nh.advertise<std_msgs::String>(topic, 200);
  ros::Publisher event_pub = pnh.advertise<std_msgs::String>("events", 20);
  ros::Publisher direct_pub =
      pnh.advertise<std_msgs::UInt8MultiArray>("direct_out", 200);

  ocean::RosScheduler scheduler(nh);
  NortekProtocol proto(serial_port, scheduler, cfg);

  std::atomic<uint64_t> published(0);
  std::mutex last_mutex;
  std::string last_stream;

  proto.setSampleCallback([&](const ocean::SampleRecord& r) {
    std_msgs::String msg;
    msg.data = r.toJson();
    pub.publish(msg);
    ++published;
    std::lock_guard<std::mutex> lock(last_mutex);
    last_stream = r.streamName();
  });
  proto.setDriverEventCallback([&](ocean::DriverEvent e) {
    std_msgs::String msg;
    msg.data = std::string(ocean::toString(e)) + " " +
               ocean::toString(proto.state());
    event_pub.publish(msg);
  });
  proto.setDirectAccessCallback([&](const std::vector<uint8_t>& bytes) {
    std_msgs::UInt8MultiArray msg;
    msg.data = bytes;
    direct_pub.publish(msg);
  });

  ValueMap startup = readStartupParams(pnh, proto);
  startup[NortekProtocol::kClockSyncInterval] = Value::text(clock_sync_interval);
  startup[NortekProtocol::kAcquireStatusInterval] =
      Value::text(acquire_status_interval);
  proto.setStartupParams(startup);

  // 读线程：串口 -> 协议
  std::atomic<bool> running(true);
  std::thread reader([&]() {
    uint8_t tmp[512];
    while (running && ros::ok())
    {
      ssize_t n = serial_port.readSome(tmp, sizeof(tmp));
      if (n < 0)
      {
        ROS_WARN_THROTTLE(1.0, "read() error: %d, reopening %s", errno,
                          port.c_str());
        ros::WallDuration(0.5).sleep();
        serial_port.reOpenSerial();
        continue;
      }
      if (n > 0)
      {
        proto.onBytesReceived(tmp, static_cast<size_t>(n),
                              ocean::toNtp(std::chrono::system_clock::now()));
      }
    }
  });

  auto onCommand = [&](const std_msgs::String::ConstPtr& cmd) {
    const std::string& c = cmd->data;
    try
    {
      if (c == "discover")
        proto.discover();
      else if (c == "read_mode")
        ROS_INFO("Instrument mode %d", proto.readMode());
      else if (c == "start_autosample")
        proto.startAutosample();
      else if (c == "stop_autosample")
        proto.stopAutosample();
      else if (c == "acquire_sample")
        proto.acquireSample();
      else if (c == "acquire_status")
        proto.acquireStatus();
      else if (c == "clock_sync")
        proto.clockSync();
      else if (c == "start_direct")
        proto.startDirect();
      else if (c == "stop_direct")
        proto.stopDirect();
      else if (c == "snapshot")
        ROS_INFO("Configuration %s", proto.snapshot().c_str());
      else if (c.compare(0, 8, "restore ") == 0)
        proto.restore(c.substr(8));
      else if (c.compare(0, 3, "get") == 0)
      {
        std::vector<std::string> names;
        std::istringstream in(c.substr(3));
        std::string name;
        while (in >> name)
          names.push_back(name);
        ROS_INFO("%s", configJson(proto.getParams(names)).c_str());
      }
      else if (c.compare(0, 4, "set ") == 0)
      {
        ValueMap params;
        std::istringstream in(c.substr(4));
        std::string item, name;
        Value v;
        while (in >> item)
        {
          if (!parseAssignment(item, name, v))
          {
            ROS_WARN("Ignoring malformed assignment '%s'", item.c_str());
            continue;
          }
          params[name] = v;
        }
        proto.setParams(params);
      }
      else
        ROS_WARN("Unknown command '%s'", c.c_str());
    }
    catch (const ocean::DriverException& e)
    {
      ROS_ERROR("%s failed in %s: %s", c.c_str(),
                ocean::toString(proto.state()), e.what());
    }
  };
  ros::Subscriber cmd_sub =
      pnh.subscribe<std_msgs::String>("command", 10, onCommand);

  auto onDirect = [&](const std_msgs::UInt8MultiArray::ConstPtr& msg) {
    try
    {
      proto.executeDirect(msg->data);
    }
    catch (const ocean::DriverException& e)
    {
      ROS_ERROR("Direct access write failed: %s", e.what());
    }
  };
  ros::Subscriber direct_sub =
      pnh.subscribe<std_msgs::UInt8MultiArray>("direct_in", 50, onDirect);

  ros::AsyncSpinner spinner(2);
  spinner.start();

  if (auto_discover)
  {
    try
    {
      ocean::ProtocolState s = proto.discover();
      ROS_INFO("Instrument discovered in %s", ocean::toString(s));
    }
    catch (const ocean::DriverException& e)
    {
      ROS_ERROR("Discover failed: %s", e.what());
    }
  }

  uint64_t last_count = 0;
  ros::WallTime t0 = ros::WallTime::now();
  ros::WallRate idle(1);
  while (ros::ok())
  {
    if (debug)
    {
      // 每 ~1s 打印一次速率与状态
      const double dt = (ros::WallTime::now() - t0).toSec();
      const uint64_t count = published.load();
      const double hz = dt > 0.0 ? (count - last_count) / dt : 0.0;
      std::string stream;
      {
        std::lock_guard<std::mutex> lock(last_mutex);
        stream = last_stream;
      }
      ROS_INFO("%s %.2f rec/s  last=%s  (total=%lu)",
               ocean::toString(proto.state()), hz,
               stream.empty() ? "-" : stream.c_str(),
               static_cast<unsigned long>(count));
      last_count = count;
      t0 = ros::WallTime::now();
    }
    idle.sleep();
  }

  spinner.stop();
  running = false;
  reader.join();
  serial_port.closeSerial();
  return 0;
}
