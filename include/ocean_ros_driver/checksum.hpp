/*!
 *  \file         checksum.hpp
 *  \author       BW
 *  \date         03/12/2025
 *  \brief        Record checksum of the Nortek family.
 *
 *  Seeded sum of little-endian 16-bit words, used to validate and build every fixed-layout record.
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

namespace ocean {

constexpr uint16_t kChecksumSeed = 0xB58C;

/*!
 * \brief Computes (seed + sum(words)) mod 0x10000.
 */
uint16_t checksum(uint16_t seed, const uint16_t* words, size_t count);

/*!
 * \brief Same as checksum() over a byte payload read as little-endian words.
 *
 * An odd trailing byte is treated as the low byte of a final word.
 */
uint16_t checksumBytes(uint16_t seed, const uint8_t* payload, size_t len);

// Recomputes the checksum of payload (checksum field excluded) and compares.
bool validate(uint16_t seed, const uint8_t* payload, size_t len,
              uint16_t claimed);

}  // namespace ocean
