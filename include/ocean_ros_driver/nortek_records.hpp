/*!
 *  \file         nortek_records.hpp
 *  \author       BW
 *  \date         10/12/2025
 *  \brief        Nortek Aquadopp record catalog.
 *
 *  Field tables, frame matchers, commands and prompts of the Nortek Aquadopp dialect.
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

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <memory>
#include <vector>

#include "ocean_ros_driver/chunker.hpp"
#include "ocean_ros_driver/record_schema.hpp"

namespace ocean {
namespace nortek {

constexpr const char* kNewline = "\n\r";

// Commands
constexpr const char* kConfigureInstrument = "CC";
constexpr const char* kSoftBreakFirstHalf = "@@@@@@";
constexpr const char* kSoftBreakSecondHalf = "K1W%!Q";
constexpr const char* kAutosampleBreak = "@";
constexpr const char* kReadClock = "RC";
constexpr const char* kSetClock = "SC";
constexpr const char* kCommandWhatMode = "II";
constexpr const char* kSampleWhatMode = "I";
constexpr const char* kReadUserConfiguration = "GC";
constexpr const char* kReadHardwareConfiguration = "GP";
constexpr const char* kReadHeadConfiguration = "GH";
constexpr const char* kReadBatteryVoltage = "BV";
constexpr const char* kReadId = "ID";
constexpr const char* kStartMeasurement = "ST";
constexpr const char* kAcquireData = "AD";
constexpr const char* kConfirmBreak = "MC";

// Prompts
constexpr const char* kAck = "\x06\x06";
constexpr const char* kNack = "\x15\x15";
constexpr const char* kAwakeNacks = "\x15\x15\x15\x15\x15\x15";
constexpr const char* kCommandModePrompt = "Command mode";
constexpr const char* kConfirmationPrompt = "Confirm:";

// Streams
constexpr const char* kVelocityStream = "velpt_velocity_data";
constexpr const char* kHardwareConfigStream = "velpt_hardware_configuration";
constexpr const char* kHeadConfigStream = "velpt_head_configuration";
constexpr const char* kUserConfigStream = "velpt_user_configuration";
constexpr const char* kClockStream = "velpt_clock_data";
constexpr const char* kBatteryStream = "velpt_battery_voltage";
constexpr const char* kIdStream = "velpt_identification_string";

constexpr size_t kVelocityLength = 42;
constexpr size_t kHardwareConfigLength = 48;
constexpr size_t kHeadConfigLength = 224;
constexpr size_t kUserConfigLength = 512;

// Values reported by the "what mode" inquiry.
enum Mode {
  kModeFirmwareUpgrade = 0,
  kModeMeasurement = 1,
  kModeCommand = 2,
  kModeDataRetrieval = 4,
  kModeConfirmation = 5
};

std::shared_ptr<const RecordLayout> velocityLayout();
std::shared_ptr<const RecordLayout> userConfigLayout();
std::shared_ptr<const RecordLayout> hardwareConfigLayout();
std::shared_ptr<const RecordLayout> headConfigLayout();
std::shared_ptr<const RecordLayout> clockLayout();
std::shared_ptr<const RecordLayout> batteryLayout();

std::shared_ptr<const FrameMatcher> velocityMatcher();
std::shared_ptr<const FrameMatcher> userConfigMatcher();
std::shared_ptr<const FrameMatcher> hardwareConfigMatcher();
std::shared_ptr<const FrameMatcher> headConfigMatcher();
std::shared_ptr<const FrameMatcher> clockMatcher();
std::shared_ptr<const FrameMatcher> idBatteryMatcher();
std::shared_ptr<const FrameMatcher> modeMatcher();

// Every frame the instrument emits unsolicited or in reply to a command.
MatcherList frameMatchers();

// mm ss dd hh yy MM (BCD) + 06 06
size_t matchClock(const uint8_t* data, size_t n);
// "AQD 1215      " 06 06 <battery lo> <battery hi> 06 06
size_t matchIdBattery(const uint8_t* data, size_t n);
// <mode> 00 06 06
size_t matchMode(const uint8_t* data, size_t n);

/*!
 * \brief Decodes any frame produced by frameMatchers().
 *
 * The combined identification and battery frame yields two records.
 *
 * \throws SampleException when the frame is not a known record.
 */
std::vector<DecodedRecord> decodeFrame(const uint8_t* frame, size_t n);

// Device clock (6 BCD bytes, device order) <-> UTC.
bool clockToTime(const uint8_t* bcd, std::time_t& t);
bool clockToNtp(const uint8_t* bcd, double& ntp);
void timeToClock(std::time_t t, uint8_t out[6]);

}  // namespace nortek
}  // namespace ocean
