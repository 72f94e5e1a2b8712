/*!
 *  \file         instrument_protocol.hpp
 *  \author       BW
 *  \date         10/14/2025
 *  \brief        Instrument-agnostic command/response state machine.
 *
 *  Single-flight command transactions, prompt matching with timeout, scheduled jobs and state transitions shared by every instrument dialect.
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

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "ocean_ros_driver/chunker.hpp"
#include "ocean_ros_driver/exceptions.hpp"
#include "ocean_ros_driver/sample_record.hpp"
#include "ocean_ros_driver/transport.hpp"
#include "ocean_ros_driver/value.hpp"

namespace ocean {

enum class ProtocolState { Unknown, Command, Autosample, AcquiringSample, DirectAccess };

enum class ProtocolEvent {
  Enter,
  Exit,
  Discover,
  ReadMode,
  Get,
  Set,
  AcquireSample,
  AcquireStatus,
  StartAutosample,
  StopAutosample,
  ClockSync,
  ScheduledClockSync,
  ScheduledAcquireStatus,
  StartDirect,
  StopDirect,
  ExecuteDirect
};

enum class DriverEvent { StateChange, ConfigChange };

enum class ScheduledJob { ClockSync, AcquireStatus };

const char* toString(ProtocolState s);
const char* toString(ProtocolEvent e);
const char* toString(DriverEvent e);
const char* jobId(ScheduledJob j);

struct EventArgs {
  ValueMap params;                 // Set
  std::vector<std::string> names;  // Get
  std::vector<uint8_t> data;       // ExecuteDirect
  bool startup = false;
};

struct EventResult {
  ValueMap values;
  int mode = -1;  // ReadMode
};

struct Response {
  std::string prompt;          // matched prompt, empty for a frame
  std::vector<uint8_t> frame;  // matched frame, empty for a prompt
};

// Inspects everything received since the command was sent. Returns true and
// fills the response once the expected reply is complete.
using ResponseMatcher =
    std::function<bool(const std::vector<uint8_t>& received, Response& out)>;
// Throws ProtocolException on a reply that matched but is not acceptable.
using ResponseValidator = std::function<void(const Response& r)>;

// First prompt of the list present in the received bytes.
ResponseMatcher expectPrompts(std::vector<std::string> prompts);
// First complete frame recognised by the matcher.
ResponseMatcher expectFrame(std::shared_ptr<const FrameMatcher> matcher);

struct CommandOptions {
  double timeout = 15.0;      // seconds
  double write_delay = 0.0;   // settle time before the read wait starts
  ResponseMatcher matcher;    // empty: fire and forget
  ResponseValidator validator;
};

// Runs an action on every exit path of a scope. run() executes it early and
// lets its errors propagate; the destructor only logs them.
class RestoreGuard {
 public:
  explicit RestoreGuard(std::function<void()> action);
  ~RestoreGuard();

  RestoreGuard(const RestoreGuard&) = delete;
  RestoreGuard& operator=(const RestoreGuard&) = delete;

  void run();
  void dismiss() { done_ = true; }

 private:
  std::function<void()> action_;
  bool done_;
};

class InstrumentProtocol {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using Sleeper = std::function<void(double seconds)>;
  using DriverEventCallback = std::function<void(DriverEvent e)>;
  using SampleCallback = std::function<void(const SampleRecord& r)>;
  using DirectAccessCallback =
      std::function<void(const std::vector<uint8_t>& bytes)>;

  InstrumentProtocol(Transport& transport, Scheduler& scheduler,
                     MatcherList matchers);
  virtual ~InstrumentProtocol();

  InstrumentProtocol(const InstrumentProtocol&) = delete;
  InstrumentProtocol& operator=(const InstrumentProtocol&) = delete;

  ProtocolState state() const { return state_.load(); }

  /*!
   * \brief Runs one event through the state machine.
   *
   * Events are serialized with every command transaction, so a scheduled
   * job never interleaves bytes with a manual command. Scheduled events that
   * fired while the gate was held run here, after the gate is released.
   *
   * \throws StateException when the current state does not handle event.
   */
  EventResult handleEvent(ProtocolEvent event,
                          const EventArgs& args = EventArgs());

  /*!
   * \brief Feeds bytes read from the transport.
   *
   * Called from the transport's read thread. Never blocks on an in-flight
   * command.
   *
   * \param[in] data           Received bytes.
   * \param[in] n              Number of bytes.
   * \param[in] port_timestamp NTP arrival time, 0 when unknown.
   */
  void onBytesReceived(const uint8_t* data, size_t n, double port_timestamp);

  void setDriverEventCallback(DriverEventCallback cb) {
    driver_event_cb_ = std::move(cb);
  }
  void setSampleCallback(SampleCallback cb) { sample_cb_ = std::move(cb); }
  void setDirectAccessCallback(DirectAccessCallback cb) {
    direct_cb_ = std::move(cb);
  }
  void setClock(Clock clock) { clock_ = std::move(clock); }
  void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

 protected:
  // Sets the initial state and runs its Enter handler.
  void start(ProtocolState initial);
  void transitionTo(ProtocolState next);

  virtual void enterState(ProtocolState s) = 0;
  virtual void exitState(ProtocolState s) = 0;
  virtual EventResult dispatch(ProtocolState s, ProtocolEvent e,
                               const EventArgs& args) = 0;
  // A complete frame extracted from the stream.
  virtual void gotChunk(const std::vector<uint8_t>& frame,
                        double port_timestamp) = 0;

  /*!
   * \brief Sends a command and waits for its reply.
   *
   * \throws TimeoutException when no reply matches within opts.timeout.
   * \throws ProtocolException from the validator.
   */
  Response sendCommand(const std::vector<uint8_t>& bytes,
                       const CommandOptions& opts);
  Response sendCommand(const std::string& cmd, const CommandOptions& opts);
  void sendRaw(const std::vector<uint8_t>& bytes);
  void sendRaw(const std::string& cmd);

  void sleepFor(double seconds);
  std::chrono::system_clock::time_point now() const;

  // Installs a recurring job that raises event; an interval of zero removes
  // the job instead.
  void scheduleJob(ScheduledJob job, std::chrono::seconds interval,
                   ProtocolEvent event);
  // Also drops a pending run of the job that has not started yet.
  void removeScheduledJob(ScheduledJob job);

  // Runs work under the gate, then any scheduled events deferred meanwhile.
  void exclusive(const std::function<void()>& work);

  void driverEvent(DriverEvent e);
  void publish(const SampleRecord& r);

 private:
  Transport& transport_;
  Scheduler& scheduler_;

  std::atomic<ProtocolState> state_;
  // Held for the whole of an event or command transaction.
  std::recursive_mutex gate_;

  // Scheduled events never wait for the gate: a timer thread blocked on it
  // would deadlock the holder when it stops that timer. They queue here and
  // the gate holder runs them once it lets go.
  void runScheduled(ScheduledJob job, ProtocolEvent event);
  void drainDeferred();

  int depth_;       // nested exclusive() calls, guarded by gate_
  bool draining_;   // guarded by gate_
  std::mutex deferred_mutex_;
  std::deque<std::pair<ScheduledJob, ProtocolEvent>> deferred_;

  std::mutex prompt_mutex_;
  std::condition_variable prompt_cv_;
  std::vector<uint8_t> prompt_buf_;

  std::mutex chunk_mutex_;
  StreamChunker chunker_;

  Clock clock_;
  Sleeper sleeper_;
  DriverEventCallback driver_event_cb_;
  SampleCallback sample_cb_;
  DirectAccessCallback direct_cb_;
};

// Printable rendering of command bytes for the log.
std::string printable(const std::vector<uint8_t>& bytes);

}  // namespace ocean
