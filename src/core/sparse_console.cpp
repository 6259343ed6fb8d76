#include "core/sparse_console.h"

#include <algorithm>

namespace crt
{
SparseConsole::SparseConsole(int width, int height)
    : m_size{std::max(0, width), std::max(0, height)}
{
}

void SparseConsole::Set(int x, int y, const Cell& cell)
{
    if (!InBounds(m_size, x, y))
        return;
    for (SparseEntry& e : m_entries)
    {
        if (e.x == x && e.y == y)
        {
            if (e.cell == cell)
                return;
            e.cell = cell;
            Touch();
            return;
        }
    }
    m_entries.push_back(SparseEntry{x, y, cell});
    Touch();
}

std::optional<Cell> SparseConsole::Get(int x, int y) const
{
    for (const SparseEntry& e : m_entries)
    {
        if (e.x == x && e.y == y)
            return e.cell;
    }
    return std::nullopt;
}

void SparseConsole::Erase(int x, int y)
{
    auto it = std::find_if(m_entries.begin(), m_entries.end(),
                           [&](const SparseEntry& e) { return e.x == x && e.y == y; });
    if (it == m_entries.end())
        return;
    m_entries.erase(it);
    Touch();
}

void SparseConsole::Cls()
{
    if (m_entries.empty())
        return;
    m_entries.clear();
    Touch();
}

void SparseConsole::BuildVertices(ConsoleGeometry& out) const
{
    BuildSparseGeometry(m_size.width, m_size.height, m_entries, out);
}
} // namespace crt
