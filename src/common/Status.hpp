#pragma once

#include <string_view>
#include "common/Types.hpp"

// ── Host-facing result codes ──────────────────────────────────────────────────
// The only recoverable errors the core reports.  Everything that goes wrong
// inside the execution path is either a silent no-op or a CpuFault (strict
// mode); none of it is surfaced through Status.
enum class Status : u8 {
    Ok            = 0,
    ImageTooSmall = 1,   // load_image() given an empty buffer
    NoImageLoaded = 2,   // start() before any successful load_image()
};

[[nodiscard]] constexpr std::string_view to_string(Status s) noexcept {
    switch (s) {
    case Status::Ok:            return "ok";
    case Status::ImageTooSmall: return "image too small";
    case Status::NoImageLoaded: return "no image loaded";
    }
    return "unknown";
}
