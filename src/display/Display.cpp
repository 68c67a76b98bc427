#include "Display.hpp"
#include <cstdio>

// ── Constants ─────────────────────────────────────────────────────────────────
// The display window is 2× the native frame size for legibility.
namespace {
    constexpr int kTexW = static_cast<int>(N64::FRAME_WIDTH);
    constexpr int kTexH = static_cast<int>(N64::FRAME_HEIGHT);
    constexpr int kWinW = kTexW * 2;
    constexpr int kWinH = kTexH * 2;
    constexpr const char* kTitle = "Ultra64";
}

Display::Display() {
    if (SDL_Init(SDL_INIT_VIDEO) != 0) {
        std::fprintf(stderr, "[Display] SDL_Init failed: %s\n", SDL_GetError());
        return;
    }

    window_ = SDL_CreateWindow(
        kTitle,
        SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
        kWinW, kWinH,
        SDL_WINDOW_SHOWN);
    if (!window_) {
        std::fprintf(stderr, "[Display] SDL_CreateWindow failed: %s\n", SDL_GetError());
        return;
    }

    // Vsync-less renderer — timing comes from the scheduler's refresh events.
    renderer_ = SDL_CreateRenderer(window_, -1, SDL_RENDERER_ACCELERATED);
    if (!renderer_) {
        std::fprintf(stderr, "[Display] SDL_CreateRenderer failed: %s\n", SDL_GetError());
        return;
    }

    // Nearest-neighbor scaling for pixel-art sharpness.
    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0");

    texture_ = SDL_CreateTexture(
        renderer_,
        SDL_PIXELFORMAT_ARGB8888,
        SDL_TEXTUREACCESS_STREAMING,
        kTexW, kTexH);
    if (!texture_) {
        std::fprintf(stderr, "[Display] SDL_CreateTexture failed: %s\n", SDL_GetError());
    }
}

Display::~Display() {
    if (texture_)  SDL_DestroyTexture(texture_);
    if (renderer_) SDL_DestroyRenderer(renderer_);
    if (window_)   SDL_DestroyWindow(window_);
    SDL_Quit();
}

bool Display::poll_events() noexcept {
    SDL_Event ev;
    while (SDL_PollEvent(&ev)) {
        if (ev.type == SDL_QUIT) return false;
        if (ev.type != SDL_KEYDOWN) continue;

        switch (ev.key.keysym.sym) {
        case SDLK_ESCAPE: return false;
        case SDLK_F5:     command_ = HostCommand::Start; break;
        case SDLK_F6:     command_ = HostCommand::Stop;  break;
        case SDLK_F7:     command_ = HostCommand::Reset; break;
        default: break;
        }
    }
    return true;
}

void Display::present(const Frame& frame) noexcept {
    if (!texture_) return;
    if (frame.width != N64::FRAME_WIDTH || frame.height != N64::FRAME_HEIGHT) return;

    // Lock the streaming texture to get a writable pixel buffer.
    void* pixels = nullptr;
    int   pitch  = 0;
    if (SDL_LockTexture(texture_, nullptr, &pixels, &pitch) != 0) return;

    auto* dst = static_cast<u32*>(pixels);
    const int row_words = pitch / static_cast<int>(sizeof(u32));

    for (int y = 0; y < kTexH; ++y) {
        for (int x = 0; x < kTexW; ++x) {
            // 0x00RRGGBB → ARGB8888, opaque.
            dst[y * row_words + x] =
                0xFF00'0000u | frame.at(static_cast<u32>(x), static_cast<u32>(y));
        }
    }

    SDL_UnlockTexture(texture_);

    SDL_RenderClear(renderer_);
    SDL_RenderCopy(renderer_, texture_, nullptr, nullptr);
    SDL_RenderPresent(renderer_);
}

void Display::set_status(u32 fps, u32 utilization) noexcept {
    if (!window_) return;

    // No audio interface is modeled; AI/s mirrors the VI rate.
    char title[96];
    std::snprintf(title, sizeof(title), "%s - VI/s: %u | AI/s: %u | CPU: %u%%",
                  kTitle, fps, fps, utilization);
    SDL_SetWindowTitle(window_, title);
}
