#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstdio>
#include <cstdint>
#include <cstring>
#include <string>
#include <thread>

#include "mem/Rdram.hpp"
#include "rdp/RDP.hpp"
#include "rsp/RSP.hpp"
#include "rom/RomFile.hpp"
#include "sched/Scheduler.hpp"
#include "debug/Dump.hpp"
#include "display/Display.hpp"

// ── Frame PPM dump ────────────────────────────────────────────────────────────
// Writes an RDP frame as a binary PPM (P6) file.
static void dump_frame_ppm(const Frame& frame, const char* path) noexcept {
    FILE* f = std::fopen(path, "wb");
    if (!f) {
        std::fprintf(stderr, "[dump] cannot open '%s' for writing\n", path);
        return;
    }
    std::fprintf(f, "P6\n%u %u\n255\n",
                 static_cast<unsigned>(frame.width),
                 static_cast<unsigned>(frame.height));
    for (const u32 px : frame.pixels) {
        const u8 rgb[3] = {
            static_cast<u8>(px >> 16u),
            static_cast<u8>(px >>  8u),
            static_cast<u8>(px),
        };
        std::fwrite(rgb, 1u, sizeof(rgb), f);
    }
    std::fclose(f);
    std::fprintf(stdout, "[dump] frame written to '%s'\n", path);
}

static void usage() noexcept {
    std::fprintf(stderr,
        "Usage: ultra64 [--headless] [--frames N] [--cycles-per-frame N]\n"
        "               [--refresh-interval N] [--fps N] [--strict]\n"
        "               [--zero-extend-logical] [--dump-frame out.ppm] <rom.z64>\n");
}

// ── Headless run ──────────────────────────────────────────────────────────────
// Run until `frames` refresh events have fired (or the CPU faults), then print
// the register file and the first KiB of RDRAM.
static int run_headless(Scheduler& sched, u64 frames, const char* frame_path) {
    if (sched.start() != Status::Ok) {
        return EXIT_FAILURE;
    }

    // With refresh events disabled, count whole frames instead.
    const bool by_vi = sched.config().refresh_interval != 0u;
    const auto progress = [&] {
        const SchedulerStatus s = sched.status();
        return by_vi ? s.vi_count : s.frames;
    };

    while (sched.running() && progress() < frames) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    sched.stop();

    const SchedulerStatus st = sched.status();
    std::fprintf(stdout, "%s\n", format_registers(sched.dump_registers()).c_str());
    std::fprintf(stdout, "Memory 0x%08X-0x%08X:\n\n%s\n",
                 N64::RDRAM_BASE, N64::RDRAM_BASE + 0x400u,
                 format_memory(N64::RDRAM_BASE, sched.dump_memory(N64::RDRAM_BASE, 0x400u)).c_str());

    if (frame_path) {
        dump_frame_ppm(sched.render_frame(), frame_path);
    }

    std::fprintf(stdout, "Done (%llu cycles, %llu VI). Final PC=0x%08X\n",
                 static_cast<unsigned long long>(st.cycles),
                 static_cast<unsigned long long>(st.vi_count),
                 sched.dump_registers().pc);
    return EXIT_SUCCESS;
}

// ── Interactive SDL run ───────────────────────────────────────────────────────
// The scheduler thread only raises flags; all SDL calls stay on this thread.
static int run_interactive(Scheduler& sched) {
    Display display;

    std::atomic<bool> frame_ready{false};
    std::atomic<bool> status_ready{false};
    std::atomic<u32>  status_fps{0};
    std::atomic<u32>  status_util{0};

    sched.set_on_refresh([&] { frame_ready.store(true, std::memory_order_release); });
    sched.set_on_status([&](u32 fps, u32 util) {
        status_fps.store(fps, std::memory_order_relaxed);
        status_util.store(util, std::memory_order_relaxed);
        status_ready.store(true, std::memory_order_release);
    });

    if (sched.start() != Status::Ok) {
        return EXIT_FAILURE;
    }

    while (display.poll_events()) {
        switch (display.take_command()) {
        case HostCommand::Start:
            if (const Status s = sched.start(); s != Status::Ok) {
                std::fprintf(stderr, "Start failed: %s\n", std::string(to_string(s)).c_str());
            }
            break;
        case HostCommand::Stop:  sched.stop(); break;
        case HostCommand::Reset: sched.reset_and_reload(); break;
        case HostCommand::None:  break;
        }

        if (frame_ready.exchange(false, std::memory_order_acq_rel)) {
            display.present(sched.render_frame());
        }
        if (status_ready.exchange(false, std::memory_order_acq_rel)) {
            display.set_status(status_fps.load(std::memory_order_relaxed),
                               status_util.load(std::memory_order_relaxed));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    sched.stop();
    std::fprintf(stdout, "Emulation stopped.\n");
    return EXIT_SUCCESS;
}

// ── main ──────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    // ── Parse flags ───────────────────────────────────────────────────────────
    bool            headless   = false;
    uint64_t        frames     = 60u;
    const char*     frame_path = nullptr;
    SchedulerConfig sched_cfg{};
    CpuConfig       cpu_cfg{};

    int positional = 0;            // index into argv of the ROM path
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--headless") == 0) {
            headless = true;
        } else if (std::strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
            frames = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--cycles-per-frame") == 0 && i + 1 < argc) {
            sched_cfg.cycles_per_frame = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--refresh-interval") == 0 && i + 1 < argc) {
            sched_cfg.refresh_interval = std::strtoull(argv[++i], nullptr, 10);
        } else if (std::strcmp(argv[i], "--fps") == 0 && i + 1 < argc) {
            sched_cfg.target_fps = static_cast<u32>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            cpu_cfg.strict_addressing = true;
        } else if (std::strcmp(argv[i], "--zero-extend-logical") == 0) {
            cpu_cfg.zero_extend_logical_imm = true;
        } else if (std::strcmp(argv[i], "--dump-frame") == 0 && i + 1 < argc) {
            frame_path = argv[++i];
        } else if (positional == 0) {
            positional = i;
        }
    }

    if (positional == 0) {
        usage();
        return EXIT_FAILURE;
    }

    // ── Load the cartridge ────────────────────────────────────────────────────
    const auto rom = RomFile::load(argv[positional]);
    if (!rom) {
        std::fprintf(stderr, "Failed to read ROM '%s'\n", argv[positional]);
        return EXIT_FAILURE;
    }

    Rdram     rdram;
    RDP       rdp;
    RSP       rsp;
    Scheduler sched(rdram, rdp, rsp, sched_cfg, cpu_cfg);

    if (const Status s = sched.load_image(*rom); s != Status::Ok) {
        std::fprintf(stderr, "Failed to load ROM '%s': %s\n",
                     argv[positional], std::string(to_string(s)).c_str());
        return EXIT_FAILURE;
    }

    return headless ? run_headless(sched, frames, frame_path)
                    : run_interactive(sched);
}
