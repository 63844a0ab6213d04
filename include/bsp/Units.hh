// OpenBSP, FPGA Board Support and SoC Composition
// Copyright (c) 2025, Parallax Software, Inc.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program. If not, see <https://www.gnu.org/licenses/>.
// 
// The origin of this software must not be misrepresented; you must not
// claim that you wrote the original software.
// 
// Altered source versions must be plainly marked as such, and must not be
// misrepresented as being the original software.
// 
// This notice may not be removed or altered from any source distribution.

#pragma once

#include <string>

namespace bsp {

// Print format for one quantity. Values are kept in internal units
// and divided by scale for printing.
class Unit
{
public:
  Unit(double scale,
       const char *suffix,
       int digits);
  double scale() const { return scale_; }
  // Suffix with the scale abbreviation (MHz, ns).
  const std::string &scaledSuffix() const { return scaled_suffix_; }
  int digits() const { return digits_; }
  // Value in user units without suffix.
  std::string asString(double value) const;
  // Value in user units with suffix.
  std::string asStringSuffix(double value) const;

private:
  const char *scaleAbbreviation() const;

  double scale_;		// multiplier from user units to internal units
  std::string scaled_suffix_;
  int digits_;			// print digits (after decimal pt)
};

// Internal units are Hz, seconds and degrees.
class Units
{
public:
  Units();
  const Unit *frequencyUnit() const { return &frequency_unit_; }
  const Unit *timeUnit() const { return &time_unit_; }
  const Unit *phaseUnit() const { return &phase_unit_; }

private:
  Unit frequency_unit_;
  Unit time_unit_;
  Unit phase_unit_;
};

} // namespace
