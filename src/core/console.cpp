#include "core/console.h"

namespace crt
{
void Console::Print(int x, int y, std::string_view text)
{
    const GridSize size = CharSize();
    int cx = x;
    for (char ch : text)
    {
        if (InBounds(size, cx, y))
        {
            Cell cell = Get(cx, y).value_or(Cell{});
            cell.glyph = (std::uint16_t)(unsigned char)ch;
            Set(cx, y, cell);
        }
        ++cx;
    }
}

void Console::PrintColor(int x, int y, const RGB& fg, const RGB& bg, std::string_view text)
{
    int cx = x;
    for (char ch : text)
    {
        Set(cx, y, Cell{(std::uint16_t)(unsigned char)ch, fg, bg});
        ++cx;
    }
}

void Console::SetBackground(int x, int y, const RGB& bg)
{
    if (!InBounds(CharSize(), x, y))
        return;
    Cell cell = Get(x, y).value_or(Cell{});
    cell.bg = bg;
    Set(x, y, cell);
}
} // namespace crt
