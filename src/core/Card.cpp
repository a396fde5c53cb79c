#include "Card.hpp"

#include <utility>

namespace tableturf::core
{
    Card::Card(std::string name, uint32_t const priority, Grid const& grid, uint32_t const special) :
        name_{std::move(name)},
        priority_{priority},
        grid_{grid},
        special_{special}
    {
    }

    auto RotateCcw(Grid& g) noexcept -> void
    {
        constexpr size_t n = constants::CardWidth;
        for (size_t layer = 0; layer < n / 2; ++layer)
        {
            size_t const first = layer;
            size_t const last = n - 1 - layer;
            for (size_t i = first; i < last; ++i)
            {
                size_t const offset = i - first;
                CardSpace const top = g[first][i];
                g[first][i] = g[i][last];
                g[i][last] = g[last][last - offset];
                g[last][last - offset] = g[last - offset][first];
                g[last - offset][first] = top;
            }
        }
    }

    auto Rotated(Grid grid, Rotation const r) noexcept -> Grid
    {
        for (uint8_t i = 0; i < std::to_underlying(r); ++i)
        {
            RotateCcw(grid);
        }
        return grid;
    }
}
