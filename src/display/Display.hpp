#pragma once

#include <SDL2/SDL.h>
#include "common/Types.hpp"
#include "rdp/RDP.hpp"

// ── Host commands raised from the keyboard ────────────────────────────────────
//   F5 start   F6 stop   F7 reset
enum class HostCommand : u8 { None, Start, Stop, Reset };

// ── Display ───────────────────────────────────────────────────────────────────
// Wraps an SDL2 window that presents RDP frames on each refresh event.
//
// Frames are 320×240 @ 0x00RRGGBB.  The window is scaled ×2 for a more
// comfortable 640×480 view; the texture stays at native size and SDL2's
// renderer scales it up.
//
// Usage:
//   Display display;
//   while (display.poll_events()) {
//       handle(display.take_command());
//       if (refresh_fired) display.present(sched.render_frame());
//   }
// ─────────────────────────────────────────────────────────────────────────────
class Display {
public:
    Display();
    ~Display();

    Display(const Display&)            = delete;
    Display& operator=(const Display&) = delete;

    // Process pending OS events and record hotkeys.
    // Returns false when the user closes the window.
    bool poll_events() noexcept;

    // Most recent hotkey since the last call, then cleared.
    [[nodiscard]] HostCommand take_command() noexcept {
        const HostCommand c = command_;
        command_ = HostCommand::None;
        return c;
    }

    // Blit a frame to the screen.  Called once per refresh event (~60 Hz).
    void present(const Frame& frame) noexcept;

    // Status line in the window title: "VI/s: n | AI/s: n | CPU: n%".
    void set_status(u32 fps, u32 utilization) noexcept;

private:
    SDL_Window*   window_   = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    SDL_Texture*  texture_  = nullptr;
    HostCommand   command_  = HostCommand::None;
};
