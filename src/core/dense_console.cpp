#include "core/dense_console.h"

#include <algorithm>

namespace crt
{
DenseConsole::DenseConsole(int width, int height)
    : m_size{std::max(0, width), std::max(0, height)}
{
    m_cells.assign((std::size_t)m_size.width * (std::size_t)m_size.height, Cell{});
}

void DenseConsole::Set(int x, int y, const Cell& cell)
{
    if (!InBounds(m_size, x, y))
        return;
    Cell& dst = m_cells[(std::size_t)y * (std::size_t)m_size.width + (std::size_t)x];
    if (dst == cell)
        return;
    dst = cell;
    Touch();
}

std::optional<Cell> DenseConsole::Get(int x, int y) const
{
    if (!InBounds(m_size, x, y))
        return std::nullopt;
    return m_cells[(std::size_t)y * (std::size_t)m_size.width + (std::size_t)x];
}

void DenseConsole::Cls()
{
    std::fill(m_cells.begin(), m_cells.end(), Cell{});
    Touch();
}

void DenseConsole::BuildVertices(ConsoleGeometry& out) const
{
    BuildDenseGeometry(m_size.width, m_size.height, m_cells, out);
}
} // namespace crt
