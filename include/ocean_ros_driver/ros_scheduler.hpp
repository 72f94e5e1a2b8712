/*!
 *  \file         ros_scheduler.hpp
 *  \author       BW
 *  \date         10/16/2025
 *  \brief        Scheduler backed by ROS wall timers.
 *
 *  Recurring maintenance jobs on ros::WallTimer, serviced by the node's spinner.
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

#include <ros/ros.h>

#include <map>
#include <mutex>
#include <string>

#include "ocean_ros_driver/transport.hpp"

namespace ocean {

class RosScheduler : public Scheduler {
 public:
  explicit RosScheduler(ros::NodeHandle nh);
  ~RosScheduler() override;

  void schedule(const std::string& job_id, std::chrono::seconds interval,
                std::function<void()> callback) override;
  void unschedule(const std::string& job_id) override;

 private:
  ros::NodeHandle nh_;
  std::mutex mutex_;
  std::map<std::string, ros::WallTimer> timers_;
};

}  // namespace ocean
