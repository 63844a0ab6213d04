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

#include "Fuzzy.hh"

#include <algorithm> // max
#include <cmath> // abs

namespace bsp {

using std::max;
using std::abs;

bool
fuzzyEqual(double v1,
	   double v2)
{
  return v1 == v2
    || abs(v1 - v2) < 1E-9 * max(abs(v1), abs(v2));
}

bool
fuzzyZero(double v)
{
  return v == 0.0
    || abs(v) < 1E-15;
}

} // namespace
