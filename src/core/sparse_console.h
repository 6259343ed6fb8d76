#pragma once

#include <vector>

#include "core/console.h"

namespace crt
{
// Stores only occupied cells, in insertion order. Missing cells are transparent.
// Lookups are linear: sparse consoles are expected to hold few cells.
class SparseConsole final : public Console
{
public:
    SparseConsole(int width, int height);

    ConsoleKind Kind() const override { return ConsoleKind::Sparse; }
    GridSize CharSize() const override { return m_size; }

    // Replaces the entry at (x, y) if one exists, otherwise appends.
    void Set(int x, int y, const Cell& cell) override;
    std::optional<Cell> Get(int x, int y) const override;
    void Cls() override;
    void BuildVertices(ConsoleGeometry& out) const override;

    // Removes the entry at (x, y) (cell becomes transparent again).
    void Erase(int x, int y);

    const std::vector<SparseEntry>& Entries() const { return m_entries; }

private:
    GridSize m_size;
    std::vector<SparseEntry> m_entries;
};
} // namespace crt
