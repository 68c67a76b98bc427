#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <span>
#include <thread>
#include <vector>
#include "common/Types.hpp"
#include "common/Status.hpp"
#include "cpu/CPU.hpp"
#include "rdp/RDP.hpp"

class Rdram;
class RSP;

// ── Scheduler configuration ───────────────────────────────────────────────────
struct SchedulerConfig {
    u64 cycles_per_frame = N64::CYCLES_PER_FRAME;  // CPU steps per frame
    u64 refresh_interval = N64::VI_INTERVAL;       // steps between VI events, 0 = never
    u32 target_fps       = N64::REFRESH_HZ;        // frame-rate cap, 0 = unthrottled
};

// ── Snapshots handed to the host ──────────────────────────────────────────────
struct RegisterSnapshot {
    std::array<u32, 32> gpr{};
    u32 pc = 0;
    u32 hi = 0;
    u32 lo = 0;
};

struct SchedulerStatus {
    bool running       = false;
    u64  vi_count      = 0;   // refresh events since construction
    u64  frames        = 0;   // frames completed since construction
    u64  cycles        = 0;   // CPU steps since construction
    u32  fps           = 0;   // frames in the last reporting second
    u32  utilization   = 0;   // percent, 0–100
};

// ── Scheduler ─────────────────────────────────────────────────────────────────
// Owns the CPU and runs it on one background thread in frame-sized batches:
//
//   per frame:   cycles_per_frame × cpu.step()
//                every refresh_interval steps → ++vi, on_refresh()
//   per second:  on_status(fps, utilization)
//   then sleep to hold target_fps
//
// The loop thread is the only writer of CPU state while running.  The host
// reads registers through a snapshot the loop publishes after every refresh
// and every frame.  stop() is cooperative: the loop re-checks the running
// flag before each step, so at most the in-flight step completes.
//
// Callbacks run on the loop thread; install them before start().
class Scheduler {
public:
    using RefreshFn = std::function<void()>;
    using StatusFn  = std::function<void(u32 fps, u32 utilization)>;

    Scheduler(Rdram& mem, RDP& rdp, RSP& rsp,
              SchedulerConfig config = {}, CpuConfig cpu_config = {});
    ~Scheduler();

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // ── Lifecycle ─────────────────────────────────────────────────────────────
    [[nodiscard]] Status load_image(std::span<const u8> image);
    [[nodiscard]] Status start();
    void stop();
    void reset_and_reload();
    void unload_image();

    [[nodiscard]] bool running()   const noexcept { return running_.load(std::memory_order_acquire); }
    [[nodiscard]] bool has_image() const;

    // ── Notifications ─────────────────────────────────────────────────────────
    void set_on_refresh(RefreshFn fn) { on_refresh_ = std::move(fn); }
    void set_on_status (StatusFn fn)  { on_status_  = std::move(fn); }

    // ── Host queries (safe while running) ─────────────────────────────────────
    [[nodiscard]] Frame            render_frame() const;
    [[nodiscard]] RegisterSnapshot dump_registers() const;
    [[nodiscard]] std::vector<u8>  dump_memory(u32 vaddr, u32 len) const;
    [[nodiscard]] SchedulerStatus  status() const noexcept;

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

    // Coprocessors the host drives directly.
    [[nodiscard]] RDP& rdp() noexcept { return rdp_; }
    [[nodiscard]] RSP& rsp() noexcept { return rsp_; }

    // Executed-cycle count over the theoretical budget, as a percentage
    // clamped to [0, 100].  A zero budget reports 0.
    [[nodiscard]] static u32 utilization_percent(u64 executed, u64 budget) noexcept;

private:
    void run_loop();
    void publish_snapshot();

    Rdram& mem_;
    RDP&   rdp_;
    RSP&   rsp_;

    SchedulerConfig config_;
    CPU             cpu_;

    // Image kept for reset_and_reload().  Touched only from the control side.
    mutable std::mutex control_mutex_;
    std::vector<u8>    image_;
    bool               has_image_ = false;

    std::thread       worker_;
    std::atomic<bool> running_{false};

    RefreshFn on_refresh_;
    StatusFn  on_status_;

    mutable std::mutex snapshot_mutex_;
    RegisterSnapshot   snapshot_{};

    std::atomic<u64> vi_count_{0};
    std::atomic<u64> frames_{0};
    std::atomic<u64> cycles_{0};
    std::atomic<u32> fps_{0};
    std::atomic<u32> utilization_{0};
};
