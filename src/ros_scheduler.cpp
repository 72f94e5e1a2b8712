#include "ocean_ros_driver/ros_scheduler.hpp"

#include <utility>

namespace ocean {

RosScheduler::RosScheduler(ros::NodeHandle nh) : nh_(std::move(nh)) {}

RosScheduler::~RosScheduler() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& kv : timers_) kv.second.stop();
  timers_.clear();
}

void RosScheduler::schedule(const std::string& job_id,
                            std::chrono::seconds interval,
                            std::function<void()> callback) {
  ros::WallTimer timer = nh_.createWallTimer(
      ros::WallDuration(static_cast<double>(interval.count())),
      [callback](const ros::WallTimerEvent&) { callback(); });

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timers_.find(job_id);
  if (it != timers_.end()) {
    it->second.stop();
    it->second = timer;
  } else {
    timers_.emplace(job_id, timer);
  }
  ROS_DEBUG("Job %s every %lld s", job_id.c_str(),
            static_cast<long long>(interval.count()));
}

void RosScheduler::unschedule(const std::string& job_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = timers_.find(job_id);
  if (it == timers_.end()) return;
  it->second.stop();
  timers_.erase(it);
}

}  // namespace ocean
