#include "Scheduler.hpp"
#include "mem/Rdram.hpp"
#include "rsp/RSP.hpp"

#include <chrono>
#include <cstdio>

namespace {
    // Set for the lifetime of run_loop() on the loop thread.
    thread_local const Scheduler* t_loop_owner = nullptr;
}

Scheduler::Scheduler(Rdram& mem, RDP& rdp, RSP& rsp,
                     SchedulerConfig config, CpuConfig cpu_config)
    : mem_(mem)
    , rdp_(rdp)
    , rsp_(rsp)
    , config_(config)
    , cpu_(cpu_config)
{
    publish_snapshot();
}

Scheduler::~Scheduler() {
    stop();
}

// ── Lifecycle ─────────────────────────────────────────────────────────────────

Status Scheduler::load_image(std::span<const u8> image) {
    stop();

    std::lock_guard lock(control_mutex_);
    const Status st = mem_.load_image(image);
    if (st != Status::Ok) {
        return st;
    }

    image_.assign(image.begin(), image.end());
    has_image_ = true;
    cpu_.reset();
    publish_snapshot();
    return Status::Ok;
}

Status Scheduler::start() {
    // From a callback the loop thread is still alive and cannot join itself.
    // The host restarts once the callback has returned.
    if (t_loop_owner == this) {
        std::fprintf(stderr, "[Scheduler] start ignored on the loop thread\n");
        return Status::Ok;
    }

    std::lock_guard lock(control_mutex_);
    if (!has_image_) {
        std::fprintf(stderr, "[Scheduler] start requested with no image loaded\n");
        return Status::NoImageLoaded;
    }

    if (running_.load(std::memory_order_acquire)) {
        return Status::Ok;  // already running
    }

    // A loop that stopped itself (fault, or stop() from a callback) may still
    // be unwinding.  running_ stays false until it has been joined, so the old
    // loop cannot pick up the new flag.
    if (worker_.joinable()) worker_.join();

    std::fprintf(stdout, "[Scheduler] starting at PC=0x%08X\n", cpu_.pc());
    cpu_.set_running(true);
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&Scheduler::run_loop, this);
    return Status::Ok;
}

void Scheduler::stop() {
    running_.store(false, std::memory_order_release);

    // Called from on_refresh/on_status: the loop exits on its own once the
    // callback returns.  Joining here would deadlock.
    if (t_loop_owner == this) {
        return;
    }

    std::lock_guard lock(control_mutex_);
    if (worker_.joinable()) {
        worker_.join();
        std::fprintf(stdout, "[Scheduler] stopped at PC=0x%08X after %llu cycles\n",
                     cpu_.pc(), static_cast<unsigned long long>(cycles_.load()));
    }
    cpu_.set_running(false);
    publish_snapshot();
}

void Scheduler::reset_and_reload() {
    stop();

    std::lock_guard lock(control_mutex_);
    cpu_.reset();
    if (has_image_) {
        // The kept image already loaded once, so this cannot fail.
        if (mem_.load_image(image_) != Status::Ok) {
            std::fprintf(stderr, "[Scheduler] reload of the kept image failed\n");
        }
    }
    publish_snapshot();
}

void Scheduler::unload_image() {
    stop();

    std::lock_guard lock(control_mutex_);
    image_.clear();
    has_image_ = false;
}

bool Scheduler::has_image() const {
    std::lock_guard lock(control_mutex_);
    return has_image_;
}

// ── Host queries ──────────────────────────────────────────────────────────────

Frame Scheduler::render_frame() const {
    return rdp_.render_frame();
}

RegisterSnapshot Scheduler::dump_registers() const {
    std::lock_guard lock(snapshot_mutex_);
    return snapshot_;
}

// The CPU has no store instructions, so the loop never writes RDRAM and the
// host may read it while running.
std::vector<u8> Scheduler::dump_memory(u32 vaddr, u32 len) const {
    return mem_.dump(vaddr, len);
}

SchedulerStatus Scheduler::status() const noexcept {
    SchedulerStatus s;
    s.running     = running_.load(std::memory_order_acquire);
    s.vi_count    = vi_count_.load(std::memory_order_relaxed);
    s.frames      = frames_.load(std::memory_order_relaxed);
    s.cycles      = cycles_.load(std::memory_order_relaxed);
    s.fps         = fps_.load(std::memory_order_relaxed);
    s.utilization = utilization_.load(std::memory_order_relaxed);
    return s;
}

u32 Scheduler::utilization_percent(u64 executed, u64 budget) noexcept {
    if (budget == 0u) return 0u;
    if (executed >= budget) return 100u;
    return static_cast<u32>((executed * 100u) / budget);
}

void Scheduler::publish_snapshot() {
    RegisterSnapshot s;
    for (u32 i = 0; i < 32u; ++i) s.gpr[i] = cpu_.reg(i);
    s.pc = cpu_.pc();
    s.hi = cpu_.hi();
    s.lo = cpu_.lo();

    std::lock_guard lock(snapshot_mutex_);
    snapshot_ = s;
}

// ── Frame loop ────────────────────────────────────────────────────────────────
void Scheduler::run_loop() {
    using clock = std::chrono::steady_clock;
    t_loop_owner = this;

    const auto frame_period = config_.target_fps != 0u
        ? std::chrono::nanoseconds(1'000'000'000ll / config_.target_fps)
        : std::chrono::nanoseconds::zero();
    const u32 nominal_fps = config_.target_fps != 0u ? config_.target_fps : N64::REFRESH_HZ;

    auto second_start = clock::now();
    u64  second_cycles = 0;
    u32  second_frames = 0;

    while (running_.load(std::memory_order_acquire)) {
        const auto frame_start = clock::now();

        u64 executed = 0;
        while (executed < config_.cycles_per_frame
               && running_.load(std::memory_order_relaxed)) {
            if (!cpu_.step(mem_)) {
                std::fprintf(stderr, "[Scheduler] CPU faulted, halting loop\n");
                running_.store(false, std::memory_order_release);
                break;
            }
            ++executed;

            if (config_.refresh_interval != 0u && executed % config_.refresh_interval == 0u) {
                vi_count_.fetch_add(1u, std::memory_order_relaxed);
                publish_snapshot();
                if (on_refresh_) on_refresh_();
            }
        }

        cycles_.fetch_add(executed, std::memory_order_relaxed);
        frames_.fetch_add(1u, std::memory_order_relaxed);
        second_cycles += executed;
        ++second_frames;
        publish_snapshot();

        const auto now     = clock::now();
        const auto elapsed = now - second_start;
        if (elapsed >= std::chrono::seconds(1)) {
            const double secs   = std::chrono::duration<double>(elapsed).count();
            const auto   budget = static_cast<u64>(
                static_cast<double>(config_.cycles_per_frame) * nominal_fps * secs);
            const u32 util = utilization_percent(second_cycles, budget);

            fps_.store(second_frames, std::memory_order_relaxed);
            utilization_.store(util, std::memory_order_relaxed);
            if (on_status_) on_status_(second_frames, util);

            second_cycles = 0;
            second_frames = 0;
            second_start  = now;
        }

        if (frame_period > std::chrono::nanoseconds::zero()) {
            const auto spent = clock::now() - frame_start;
            if (spent < frame_period) {
                std::this_thread::sleep_for(frame_period - spent);
            }
        }
    }

    publish_snapshot();
    t_loop_owner = nullptr;
}
