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

namespace bsp {

class Board;
class Platform;
class BspState;

Board *
makeLpddr4TestBoard(const BspState *bsp);
Board *
makeAntmicroLpddr4TestBoard(const BspState *bsp);
Board *
makeDigilentArty(const BspState *bsp);
Board *
makeEcp5DcScm(const BspState *bsp);
Board *
makeZcu104(const BspState *bsp);
Board *
makeArtixDcScm(const BspState *bsp);
Board *
makeForestKitten33(const BspState *bsp);

// Antmicro LPDDR4 test board (Kintex-7 xc7k70tfbg484-1).
Platform *
makeLpddr4TestPlatform(const BspState *bsp);

} // namespace
