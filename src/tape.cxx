/*
    Strictbf - A bounds-checked brainfuck interpreter
    Tape memory report
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include <simde/x86/sse2.h>

#include <cstddef>
#include <cstdint>
#include <vector>

#include "strictbf.hxx"

namespace strictbf {

std::vector<CellValue> Tape::nonZeroCells() const {
    std::vector<CellValue> found;
    const std::size_t end = furthest + 1;
    const simde__m128i zero = simde_mm_setzero_si128();
    std::size_t i = 0;
    // All-zero 16-byte blocks are skipped whole.
    for (; i + 16 <= end; i += 16) {
        const auto block =
            simde_mm_loadu_si128(reinterpret_cast<const simde__m128i*>(cells.data() + i));
        const uint32_t zeroMask =
            static_cast<uint32_t>(simde_mm_movemask_epi8(simde_mm_cmpeq_epi8(block, zero)));
        if (zeroMask == 0xFFFFu) continue;
        for (unsigned lane = 0; lane < 16; ++lane) {
            if (!((zeroMask >> lane) & 1u)) found.push_back({i + lane, cells[i + lane]});
        }
    }
    for (; i < end; ++i) {
        if (cells[i]) found.push_back({i, cells[i]});
    }
    return found;
}

}  // namespace strictbf
