#include <csignal>
#include <cstdio>
#include <memory>
#include <string>

#include "core/dense_console.h"
#include "core/sparse_console.h"
#include "core/terminal.h"
#include "io/init_hints_json.h"
#include "io/paths.h"
#include "vk/native_session.h"

// Set when we receive SIGINT (Ctrl+C) so the frame loop can exit cleanly.
static volatile std::sig_atomic_t g_InterruptRequested = 0;

static void HandleInterruptSignal(int signal)
{
    if (signal == SIGINT)
        g_InterruptRequested = 1;
}

namespace
{
constexpr int kWidth = 80;
constexpr int kHeight = 50;

struct DemoState
{
    int player_x = kWidth / 2;
    int player_y = kHeight / 2;
    int ticks = 0;
    crt::VulkanBackend* backend = nullptr;
};

void DrawFrame(crt::Terminal& term, const DemoState& st)
{
    using crt::RGB;

    term.SetActiveConsole(0);
    term.Cls();
    for (int x = 0; x < kWidth; ++x)
    {
        term.Set(x, 0, crt::Cell{205, RGB::FromU8(90, 90, 200), RGB::Black()});
        term.Set(x, kHeight - 1, crt::Cell{205, RGB::FromU8(90, 90, 200), RGB::Black()});
    }
    term.PrintColor(2, 0, RGB::FromU8(255, 255, 0), RGB::Black(), " crtgrid ");
    term.Set(st.player_x, st.player_y, crt::Cell{'@', RGB::FromU8(255, 255, 0), RGB::Black()});

    const crt::InputSnapshot& in = term.input;
    term.Print(2, 2, "Arrows: move  F1: scanlines  F2: burn  F3: glow  F4: stats  Esc: quit");
    char line[96];
    std::snprintf(line, sizeof(line), "fps %5.1f  frame %6.2f ms  mouse %4d,%4d %s",
                  term.fps, term.frame_time_ms, in.mouse_x, in.mouse_y, in.left_click ? "[click]" : "       ");
    term.Print(2, 3, line);

    // Sparse overlay: a tooltip that follows the pointer (in cells).
    term.SetActiveConsole(1);
    term.Cls();
    const int cx = in.mouse_x / 8;
    const int cy = in.mouse_y / 8;
    term.PrintColor(cx + 1, cy, RGB::White(), RGB::FromU8(40, 40, 120), "here");
    term.SetActiveConsole(0);
}

void Tick(crt::Terminal& term, DemoState& st)
{
    if (g_InterruptRequested)
    {
        term.Quit();
        return;
    }
    ++st.ticks;

    if (term.input.key)
    {
        switch (*term.input.key)
        {
        case crt::Key::Left:  if (st.player_x > 0) --st.player_x; break;
        case crt::Key::Right: if (st.player_x < kWidth - 1) ++st.player_x; break;
        case crt::Key::Up:    if (st.player_y > 1) --st.player_y; break;
        case crt::Key::Down:  if (st.player_y < kHeight - 2) ++st.player_y; break;
        case crt::Key::F1:    term.post_scanlines = !term.post_scanlines; break;
        case crt::Key::F2:    term.post_screenburn = !term.post_screenburn; break;
        case crt::Key::F3:
            term.SetLayerStyle(1, term.Layer(1).style == crt::LayerStyle::Glow ? crt::LayerStyle::Standard
                                                                                : crt::LayerStyle::Glow);
            break;
        case crt::Key::F4:
            if (st.backend)
                st.backend->SetDebugOverlay(!st.backend->DebugOverlay());
            break;
        case crt::Key::Escape:
            term.Quit();
            return;
        default:
            break;
        }
    }
    DrawFrame(term, st);
}
} // namespace

int main(int argc, char** argv)
{
    std::signal(SIGINT, HandleInterruptSignal);

    const std::string font_path = (argc > 1) ? argv[1] : "assets/terminal8x8.png";

    // Persisted init hints (window/graphics/loop options).
    crt::InitHints hints;
    {
        std::string err;
        if (!crt::LoadInitHints(crt::ConfigPath("init_hints.json"), hints, err) && !err.empty())
            std::fprintf(stderr, "[config] %s\n", err.c_str());
    }

    crt::Error err;
    std::unique_ptr<crt::NativeSession> session =
        crt::Init(kWidth * 8, kHeight * 8, "crtgrid demo", hints, err);
    if (!session)
    {
        std::fprintf(stderr, "[crtgrid] init failed: %s\n", crt::FormatError(err).c_str());
        return 1;
    }

    crt::Terminal& term = session->terminal;
    const std::size_t font = term.AddFont(font_path, 8, 8);
    if (!term.AddConsole(std::make_unique<crt::DenseConsole>(kWidth, kHeight), font, err) ||
        !term.AddConsole(std::make_unique<crt::SparseConsole>(kWidth, kHeight), font, err))
    {
        std::fprintf(stderr, "[crtgrid] %s\n", crt::FormatError(err).c_str());
        return 1;
    }

    DemoState state;
    state.backend = session->backend.get();
    const bool ok = crt::Run(*session, [&state](crt::Terminal& t) { Tick(t, state); }, err);
    if (!ok)
    {
        std::fprintf(stderr, "[crtgrid] %s\n", crt::FormatError(err).c_str());
        return 1;
    }
    return 0;
}
