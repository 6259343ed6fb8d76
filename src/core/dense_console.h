#pragma once

#include <vector>

#include "core/console.h"

namespace crt
{
// Full width x height grid; cell (x, y) lives at y * width + x.
class DenseConsole final : public Console, public GridSource
{
public:
    DenseConsole(int width, int height);

    ConsoleKind Kind() const override { return ConsoleKind::Dense; }
    GridSize CharSize() const override { return m_size; }

    void Set(int x, int y, const Cell& cell) override;
    std::optional<Cell> Get(int x, int y) const override;
    void Cls() override;
    void BuildVertices(ConsoleGeometry& out) const override;

    const GridSource* AsGridSource() const override { return this; }

    // GridSource
    GridSize Size() const override { return m_size; }
    const std::vector<Cell>& Cells() const override { return m_cells; }

private:
    GridSize m_size;
    std::vector<Cell> m_cells;
};
} // namespace crt
