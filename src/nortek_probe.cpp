// 此版本可用于测试串口通信，唤醒仪器并打印收到的所有帧

#include <ros/ros.h>

#include <cstdio>
#include <string>
#include <vector>

#include "ocean_ros_driver/bcd_utils.hpp"
#include "ocean_ros_driver/checksum.hpp"
#include "ocean_ros_driver/chunker.hpp"
#include "ocean_ros_driver/nortek_records.hpp"
#include "ocean_ros_driver/serial_port.hpp"

namespace {

bool sendText(ocean::SerialPort& sp, const std::string& s) {
  return sp.writeAll(reinterpret_cast<const uint8_t*>(s.data()), s.size()) >= 0;
}

// 带同步头的记录校验和；ASCII/BCD 帧没有校验和
const char* checksumStatus(const std::vector<uint8_t>& f) {
  if (f.size() < 4 || f[0] != 0xA5) return "--";
  size_t words = ocean::readU16Le(&f[2]);
  size_t len = words * 2;
  if (len < 4 || len > f.size()) return "BAD";
  bool ok = ocean::validate(ocean::kChecksumSeed, f.data(), len - 2,
                            ocean::readU16Le(&f[len - 2]));
  return ok ? "OK" : "BAD";
}

}  // namespace

int main(int argc, char** argv) {
  ros::init(argc, argv, "nortek_probe");
  ros::NodeHandle nh("~");
  std::string port = "/dev/ttyUSB0";
  int baud = 9600;
  double break_delay = 0.1;
  nh.param("port", port, port);
  nh.param("baud", baud, baud);
  nh.param("break_delay", break_delay, break_delay);

  ocean::SerialPort sp(port, baud);
  if (!sp.openSerial()) {
    ROS_ERROR("Open %s failed", port.c_str());
    return 1;
  }
  ROS_INFO("Probe opened %s @ %d", port.c_str(), baud);

  // 唤醒并查询模式
  const char* wake[] = {ocean::nortek::kSoftBreakFirstHalf,
                        ocean::nortek::kSoftBreakSecondHalf,
                        ocean::nortek::kCommandWhatMode};
  for (const char* cmd : wake) {
    if (!sendText(sp, cmd)) {
      ROS_ERROR("write() failed");
      return 1;
    }
    ros::WallDuration(break_delay).sleep();
  }

  ocean::MatcherList matchers = ocean::nortek::frameMatchers();
  matchers.push_back(ocean::nortek::modeMatcher());
  ocean::StreamChunker chunker(matchers);

  ros::Rate hz(100);
  while (ros::ok()) {
    uint8_t tmp[256];
    ssize_t n = sp.readSome(tmp, sizeof(tmp));
    if (n > 0) {
      chunker.addData(tmp, static_cast<size_t>(n),
                      ros::WallTime::now().toSec());
      std::vector<uint8_t> f;
      double ts = 0.0;
      while (chunker.nextChunk(f, ts)) {
        printf("[frame] ");
        for (size_t k = 0; k < f.size(); ++k) {
          printf("%02X ", f[k]);
        }
        printf(" | %s\n", checksumStatus(f));
      }
    }
    ros::spinOnce();
    hz.sleep();
  }
  sp.closeSerial();
  return 0;
}
