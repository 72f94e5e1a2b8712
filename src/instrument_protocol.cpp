#include "ocean_ros_driver/instrument_protocol.hpp"

#include <ros/console.h>

#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <thread>
#include <utility>

namespace ocean {

const char* toString(ProtocolState s) {
  switch (s) {
    case ProtocolState::Unknown:
      return "UNKNOWN";
    case ProtocolState::Command:
      return "COMMAND";
    case ProtocolState::Autosample:
      return "AUTOSAMPLE";
    case ProtocolState::AcquiringSample:
      return "ACQUIRING_SAMPLE";
    case ProtocolState::DirectAccess:
      return "DIRECT_ACCESS";
  }
  return "?";
}

const char* toString(ProtocolEvent e) {
  switch (e) {
    case ProtocolEvent::Enter:
      return "ENTER";
    case ProtocolEvent::Exit:
      return "EXIT";
    case ProtocolEvent::Discover:
      return "DISCOVER";
    case ProtocolEvent::ReadMode:
      return "READ_MODE";
    case ProtocolEvent::Get:
      return "GET";
    case ProtocolEvent::Set:
      return "SET";
    case ProtocolEvent::AcquireSample:
      return "ACQUIRE_SAMPLE";
    case ProtocolEvent::AcquireStatus:
      return "ACQUIRE_STATUS";
    case ProtocolEvent::StartAutosample:
      return "START_AUTOSAMPLE";
    case ProtocolEvent::StopAutosample:
      return "STOP_AUTOSAMPLE";
    case ProtocolEvent::ClockSync:
      return "CLOCK_SYNC";
    case ProtocolEvent::ScheduledClockSync:
      return "SCHEDULED_CLOCK_SYNC";
    case ProtocolEvent::ScheduledAcquireStatus:
      return "SCHEDULED_ACQUIRE_STATUS";
    case ProtocolEvent::StartDirect:
      return "START_DIRECT";
    case ProtocolEvent::StopDirect:
      return "STOP_DIRECT";
    case ProtocolEvent::ExecuteDirect:
      return "EXECUTE_DIRECT";
  }
  return "?";
}

const char* toString(DriverEvent e) {
  switch (e) {
    case DriverEvent::StateChange:
      return "STATE_CHANGE";
    case DriverEvent::ConfigChange:
      return "CONFIG_CHANGE";
  }
  return "?";
}

const char* jobId(ScheduledJob j) {
  switch (j) {
    case ScheduledJob::ClockSync:
      return "clock_sync";
    case ScheduledJob::AcquireStatus:
      return "acquire_status";
  }
  return "?";
}

std::string printable(const std::vector<uint8_t>& bytes) {
  std::string out;
  out.reserve(bytes.size());
  for (uint8_t b : bytes) {
    if (b >= 0x20 && b < 0x7F) {
      out.push_back(static_cast<char>(b));
    } else {
      char hex[5];
      std::snprintf(hex, sizeof(hex), "\\x%02X", b);
      out += hex;
    }
  }
  return out;
}

ResponseMatcher expectPrompts(std::vector<std::string> prompts) {
  return [prompts](const std::vector<uint8_t>& rx, Response& out) {
    for (const std::string& p : prompts) {
      auto it = std::search(rx.begin(), rx.end(), p.begin(), p.end(),
                            [](uint8_t a, char b) {
                              return a == static_cast<uint8_t>(b);
                            });
      if (it != rx.end()) {
        out.prompt = p;
        out.frame.clear();
        return true;
      }
    }
    return false;
  };
}

ResponseMatcher expectFrame(std::shared_ptr<const FrameMatcher> matcher) {
  return [matcher](const std::vector<uint8_t>& rx, Response& out) {
    std::vector<Chunk> found;
    matcher->findAll(rx.data(), rx.size(), found);
    if (found.empty()) return false;
    out.prompt.clear();
    out.frame.assign(rx.begin() + found.front().start,
                     rx.begin() + found.front().end);
    return true;
  };
}

RestoreGuard::RestoreGuard(std::function<void()> action)
    : action_(std::move(action)), done_(false) {}

RestoreGuard::~RestoreGuard() {
  if (done_) return;
  try {
    action_();
  } catch (const std::exception& e) {
    ROS_ERROR("Restore after failure did not complete: %s", e.what());
  }
}

void RestoreGuard::run() {
  done_ = true;
  action_();
}

InstrumentProtocol::InstrumentProtocol(Transport& transport,
                                       Scheduler& scheduler,
                                       MatcherList matchers)
    : transport_(transport),
      scheduler_(scheduler),
      state_(ProtocolState::Unknown),
      depth_(0),
      draining_(false),
      chunker_(std::move(matchers)) {}

InstrumentProtocol::~InstrumentProtocol() {
  scheduler_.unschedule(jobId(ScheduledJob::ClockSync));
  scheduler_.unschedule(jobId(ScheduledJob::AcquireStatus));
}

EventResult InstrumentProtocol::handleEvent(ProtocolEvent event,
                                            const EventArgs& args) {
  EventResult result;
  exclusive([&] {
    ProtocolState s = state_.load();
    ROS_DEBUG("%s in %s", toString(event), toString(s));
    result = dispatch(s, event, args);
  });
  return result;
}

void InstrumentProtocol::exclusive(const std::function<void()>& work) {
  try {
    std::lock_guard<std::recursive_mutex> gate(gate_);
    ++depth_;
    RestoreGuard leave([this] { --depth_; });
    work();
  } catch (...) {
    drainDeferred();
    throw;
  }
  drainDeferred();
}

void InstrumentProtocol::runScheduled(ScheduledJob job, ProtocolEvent event) {
  {
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    bool pending = std::any_of(
        deferred_.begin(), deferred_.end(),
        [job](const std::pair<ScheduledJob, ProtocolEvent>& d) {
          return d.first == job;
        });
    if (pending) {
      ROS_DEBUG("%s already pending", jobId(job));
    } else {
      deferred_.emplace_back(job, event);
    }
  }
  drainDeferred();
}

void InstrumentProtocol::drainDeferred() {
  for (;;) {
    {
      std::unique_lock<std::recursive_mutex> gate(gate_, std::try_to_lock);
      // 持有闸门的一方释放后会再来取
      if (!gate.owns_lock() || depth_ > 0 || draining_) return;
      draining_ = true;
      RestoreGuard done([this] { draining_ = false; });

      for (;;) {
        std::pair<ScheduledJob, ProtocolEvent> next;
        {
          std::lock_guard<std::mutex> lock(deferred_mutex_);
          if (deferred_.empty()) break;
          next = deferred_.front();
          deferred_.pop_front();
        }
        try {
          handleEvent(next.second);
        } catch (const DriverException& e) {
          ROS_ERROR("Scheduled %s failed: %s", jobId(next.first), e.what());
        }
      }
    }
    // 释放闸门前后之间可能有新的定时事件入队
    std::lock_guard<std::mutex> lock(deferred_mutex_);
    if (deferred_.empty()) return;
  }
}

void InstrumentProtocol::onBytesReceived(const uint8_t* data, size_t n,
                                         double port_timestamp) {
  if (n == 0) return;
  {
    std::lock_guard<std::mutex> lock(prompt_mutex_);
    prompt_buf_.insert(prompt_buf_.end(), data, data + n);
    if (prompt_buf_.size() > StreamChunker::kMaxBufferSize) {
      prompt_buf_.erase(prompt_buf_.begin(),
                        prompt_buf_.end() - static_cast<std::ptrdiff_t>(
                                                StreamChunker::kMaxBufferSize));
    }
  }
  prompt_cv_.notify_all();

  if (state_.load() == ProtocolState::DirectAccess && direct_cb_) {
    direct_cb_(std::vector<uint8_t>(data, data + n));
  }

  std::vector<std::pair<std::vector<uint8_t>, double>> frames;
  {
    std::lock_guard<std::mutex> lock(chunk_mutex_);
    chunker_.addData(data, n, port_timestamp);
    std::vector<uint8_t> frame;
    double ts = 0.0;
    while (chunker_.nextChunk(frame, ts)) {
      frames.emplace_back(frame, ts);
    }
  }

  for (const auto& f : frames) {
    try {
      gotChunk(f.first, f.second);
    } catch (const DriverException& e) {
      ROS_WARN("Dropped %zu byte frame: %s", f.first.size(), e.what());
    }
  }
}

void InstrumentProtocol::start(ProtocolState initial) {
  std::lock_guard<std::recursive_mutex> gate(gate_);
  state_.store(initial);
  enterState(initial);
}

void InstrumentProtocol::transitionTo(ProtocolState next) {
  std::lock_guard<std::recursive_mutex> gate(gate_);
  ProtocolState prev = state_.load();
  exitState(prev);
  state_.store(next);
  ROS_INFO("State %s -> %s", toString(prev), toString(next));
  enterState(next);
}

Response InstrumentProtocol::sendCommand(const std::vector<uint8_t>& bytes,
                                         const CommandOptions& opts) {
  std::lock_guard<std::recursive_mutex> gate(gate_);
  {
    std::lock_guard<std::mutex> lock(prompt_mutex_);
    prompt_buf_.clear();
  }
  ROS_DEBUG("Sending %s", printable(bytes).c_str());
  transport_.send(bytes);

  Response r;
  if (!opts.matcher) return r;
  if (opts.write_delay > 0.0) sleepFor(opts.write_delay);

  {
    std::unique_lock<std::mutex> lock(prompt_mutex_);
    auto deadline =
        std::chrono::steady_clock::now() +
        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            std::chrono::duration<double>(opts.timeout));
    bool ok = prompt_cv_.wait_until(lock, deadline, [&] {
      return opts.matcher(prompt_buf_, r);
    });
    if (!ok) {
      throw TimeoutException("no response to " + printable(bytes) +
                             " within " + std::to_string(opts.timeout) + " s");
    }
  }

  if (opts.validator) opts.validator(r);
  return r;
}

Response InstrumentProtocol::sendCommand(const std::string& cmd,
                                         const CommandOptions& opts) {
  return sendCommand(std::vector<uint8_t>(cmd.begin(), cmd.end()), opts);
}

void InstrumentProtocol::sendRaw(const std::vector<uint8_t>& bytes) {
  sendCommand(bytes, CommandOptions());
}

void InstrumentProtocol::sendRaw(const std::string& cmd) {
  sendRaw(std::vector<uint8_t>(cmd.begin(), cmd.end()));
}

void InstrumentProtocol::sleepFor(double seconds) {
  if (seconds <= 0.0) return;
  if (sleeper_) {
    sleeper_(seconds);
    return;
  }
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

std::chrono::system_clock::time_point InstrumentProtocol::now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

void InstrumentProtocol::scheduleJob(ScheduledJob job,
                                     std::chrono::seconds interval,
                                     ProtocolEvent event) {
  if (interval.count() <= 0) {
    removeScheduledJob(job);
    return;
  }
  ROS_INFO("Scheduling %s every %lld s", jobId(job),
           static_cast<long long>(interval.count()));
  scheduler_.schedule(jobId(job), interval,
                      [this, job, event]() { runScheduled(job, event); });
}

void InstrumentProtocol::removeScheduledJob(ScheduledJob job) {
  ROS_DEBUG("Removing scheduled job %s", jobId(job));
  scheduler_.unschedule(jobId(job));
  std::lock_guard<std::mutex> lock(deferred_mutex_);
  deferred_.erase(
      std::remove_if(deferred_.begin(), deferred_.end(),
                     [job](const std::pair<ScheduledJob, ProtocolEvent>& d) {
                       return d.first == job;
                     }),
      deferred_.end());
}

void InstrumentProtocol::driverEvent(DriverEvent e) {
  ROS_DEBUG("Driver event %s in %s", toString(e), toString(state_.load()));
  if (driver_event_cb_) driver_event_cb_(e);
}

void InstrumentProtocol::publish(const SampleRecord& r) {
  if (sample_cb_) sample_cb_(r);
}

}  // namespace ocean
