#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include "strictbf/config.hxx"

namespace strictbf {
struct CellValue;

// Fixed 30000-cell byte tape. Every mutator refuses to leave the valid range and reports it
// instead of wrapping.
class Tape {
   public:
    static constexpr std::size_t size = STRICTBF_TAPE_SIZE;
    static constexpr std::uint8_t cellMax = STRICTBF_CELL_MAX;

    bool moveRight() noexcept {
        if (ptr == size - 1) [[unlikely]]
            return false;
        if (++ptr > furthest) furthest = ptr;
        return true;
    }
    bool moveLeft() noexcept {
        if (ptr == 0) [[unlikely]]
            return false;
        --ptr;
        return true;
    }
    bool increment() noexcept {
        if (cells[ptr] == cellMax) [[unlikely]]
            return false;
        ++cells[ptr];
        return true;
    }
    bool decrement() noexcept {
        if (cells[ptr] == 0) [[unlikely]]
            return false;
        --cells[ptr];
        return true;
    }

    std::uint8_t current() const noexcept { return cells[ptr]; }
    void store(std::uint8_t value) noexcept { cells[ptr] = value; }

    std::uint8_t at(std::size_t index) const { return cells.at(index); }
    std::size_t pointer() const noexcept { return ptr; }
    std::size_t furthestReached() const noexcept { return furthest; }

    // Non-zero cells in [0, furthestReached()], ascending by index.
    std::vector<CellValue> nonZeroCells() const;

   private:
    std::array<std::uint8_t, size> cells{};
    std::size_t ptr = 0;
    std::size_t furthest = 0;
};

}  // namespace strictbf
