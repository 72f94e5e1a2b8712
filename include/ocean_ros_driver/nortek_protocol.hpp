/*!
 *  \file         nortek_protocol.hpp
 *  \author       BW
 *  \date         10/15/2025
 *  \brief        Nortek Aquadopp protocol driver.
 *
 *  Command, autosample, maintenance and direct access handling for the Nortek Aquadopp over the generic instrument protocol.
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

#include <chrono>
#include <string>
#include <vector>

#include "ocean_ros_driver/instrument_protocol.hpp"
#include "ocean_ros_driver/record_schema.hpp"

namespace ocean {

struct NortekConfig {
  double command_timeout = 15.0;
  double sample_timeout = 70.0;
  double status_timeout = 30.0;
  double mode_inquiry_timeout = 0.6;
  double break_delay = 0.1;
  double write_delay = 0.0;
  double clock_sync_offset = 2.0;
  double clock_sync_max_drift = 2.0;
  bool double_configure = false;
};

class NortekProtocol : public InstrumentProtocol {
 public:
  static constexpr const char* kClockSyncInterval = "ClockSyncInterval";
  static constexpr const char* kAcquireStatusInterval = "AcquireStatusInterval";
  static constexpr const char* kAll = "ALL";

  NortekProtocol(Transport& transport, Scheduler& scheduler,
                 NortekConfig config = NortekConfig());
  ~NortekProtocol() override;

  // Shorthands for handleEvent().
  ProtocolState discover();
  int readMode();
  ValueMap getParams(const std::vector<std::string>& names);
  void setParams(const ValueMap& params, bool startup = false);
  void acquireSample();
  void acquireStatus();
  void startAutosample();
  void stopAutosample();
  void clockSync();
  void startDirect();
  void stopDirect();
  void executeDirect(const std::vector<uint8_t>& bytes);

  // Values applied with startup privileges when the driver next configures
  // the instrument.
  void setStartupParams(const ValueMap& params);

  // Base64 of the encoded user configuration. Waits for any command in
  // progress, like restore().
  std::string snapshot();
  // Loads a snapshot into memory; the instrument is not written.
  void restore(const std::string& encoded);

  const RecordSchema& userConfig() const { return user_config_; }

  /*!
   * \brief Parses an "HH:MM:SS" interval.
   *
   * \throws ParameterException on any other format.
   */
  static std::chrono::seconds parseInterval(const std::string& hhmmss);

 protected:
  void enterState(ProtocolState s) override;
  void exitState(ProtocolState s) override;
  EventResult dispatch(ProtocolState s, ProtocolEvent e,
                       const EventArgs& args) override;
  void gotChunk(const std::vector<uint8_t>& chunk,
                double port_timestamp) override;

 private:
  EventResult handleUnknown(ProtocolEvent e, const EventArgs& args);
  EventResult handleCommand(ProtocolEvent e, const EventArgs& args);
  EventResult handleAutosample(ProtocolEvent e, const EventArgs& args);
  EventResult handleDirectAccess(ProtocolEvent e, const EventArgs& args);

  ProtocolState discoverState();
  int readModeUnknown();
  int readModeAutosample();
  int readModeCommand();

  void breakSequence();
  void startMeasurement();
  void doAcquireSample();
  void doAcquireStatus();
  void doClockSync();
  // Stops measurement, runs the work, and restarts measurement on every exit
  // path.
  void maintenance(void (NortekProtocol::*work)());

  void updateParams();
  void initParams();
  void applyParams(const ValueMap& params, bool startup);
  void checkConstraint(const std::string& name, const Value& v) const;
  ValueMap fullConfig() const;
  ValueMap getValues(const std::vector<std::string>& names) const;
  void installJobs();

  CommandOptions ack(double timeout) const;
  CommandOptions frame(std::shared_ptr<const FrameMatcher> m,
                       double timeout) const;

  NortekConfig config_;
  RecordSchema user_config_;
  std::string clock_sync_interval_;
  std::string acquire_status_interval_;
  ValueMap startup_params_;
  ValueMap pre_direct_values_;
  bool init_pending_;
};

}  // namespace ocean
