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

#include "Units.hh"

#include "StringUtil.hh"
#include "Fuzzy.hh"

namespace bsp {

Unit::Unit(double scale,
	   const char *suffix,
	   int digits) :
  scale_(scale),
  digits_(digits)
{
  scaled_suffix_ = scaleAbbreviation();
  scaled_suffix_ += suffix;
}

const char *
Unit::scaleAbbreviation() const
{
  if (fuzzyEqual(scale_, 1E+9))
    return "G";
  else if (fuzzyEqual(scale_, 1E+6))
    return "M";
  else if (fuzzyEqual(scale_, 1E+3))
    return "k";
  else if (fuzzyEqual(scale_, 1.0))
    return "";
  else if (fuzzyEqual(scale_, 1E-9))
    return "n";
  else if (fuzzyEqual(scale_, 1E-12))
    return "p";
  else
    return "?";
}

std::string
Unit::asString(double value) const
{
  double scaled_value = value / scale_;
  // prevent "-0.00"
  if (fuzzyZero(scaled_value))
    scaled_value = 0.0;
  return stdstrPrint("%.*f", digits_, scaled_value);
}

std::string
Unit::asStringSuffix(double value) const
{
  return asString(value) + " " + scaled_suffix_;
}

////////////////////////////////////////////////////////////////

Units::Units() :
  frequency_unit_(1E+6, "Hz", 2),
  time_unit_(1E-9, "s", 3),
  phase_unit_(1.0, "deg", 1)
{
}

} // namespace
