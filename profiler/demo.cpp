/**
 * demo.cpp — profiler.hxx usage examples
 *
 * A toy simulation run goes through four stages per step:
 *
 *   assemble  →  solve  →  checkpoint (every few steps)  →  write
 *
 * Work is simulated with short sleeps so the focus stays on the profiler API.
 */

#include <chrono>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>

#include "profiler.hxx"

// Simulates a variable-duration operation.
static void work(int min_ms, int max_ms) {
    static std::mt19937 rng{42};
    std::uniform_int_distribution<int> dist{min_ms, max_ms};
    std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng)));
}

// ─────────────────────────────────────────────────────────────────────────────
// 1. start / stop
//
// The lowest-level API. Every start must be matched by a stop of the same
// name; unbalanced calls throw.
// ─────────────────────────────────────────────────────────────────────────────

void demo_start_stop(ProfileSession& prof) {
    std::cout << "── 1. start / stop ──────────────────────────────────────────\n";

    prof.start("setup");
    work(10, 10);
    double elapsed = prof.stop("setup");
    std::cout << "  setup took " << elapsed * 1000.0 << " ms\n";

    try {
        prof.stop("setup");
    } catch (const UnknownActionStop& e) {
        std::cout << "  second stop rejected: " << e.what() << "\n\n";
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 2. Scoped actions
//
// profile() returns a guard that stops the action when the scope ends, also
// when the scope is left by an exception.
// ─────────────────────────────────────────────────────────────────────────────

void assemble(ProfileSession& prof) {
    auto scope = prof.profile("assemble");
    work(2, 4);
}

void checkpoint(ProfileSession& prof, int step) {
    PROFILE_SCOPE(prof, "checkpoint");
    work(3, 6);
    if (step == 6) {
        throw std::runtime_error("disk quota exceeded");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// 3. Wrapped callables
//
// wrap() turns any callable into one that is timed on every call.
// ─────────────────────────────────────────────────────────────────────────────

void demo_run(ProfileSession& prof) {
    std::cout << "── 2/3. Scoped actions and wrapped callables ────────────────\n";

    auto solve = wrap(prof, "solve", [](int step) -> double {
        work(8, 14);
        return 1.0 / (1.0 + step);
    });
    auto write = wrap(prof, "write", [](double residual) { work(1, 3); return residual < 0.2; });

    for (int step = 0; step < 10; ++step) {
        assemble(prof);
        double residual = solve(step);
        if (step % 3 == 0) {
            try {
                checkpoint(prof, step);
            } catch (const std::exception& e) {
                std::cout << "  step " << step << ": checkpoint failed (" << e.what() << "), still timed\n";
            }
        }
        if (write(residual)) {
            std::cout << "  step " << step << ": converged\n";
        }
    }
    std::cout << "\n";
}

// ─────────────────────────────────────────────────────────────────────────────
// 4. Summary
// ─────────────────────────────────────────────────────────────────────────────

int main() {
    ProfileSession prof;

    demo_start_stop(prof);

    // Percentages are relative to the session start; leave setup out of them.
    prof.reset_start_time();
    demo_run(prof);

    std::cout << "── 4. Summary ───────────────────────────────────────────────\n";
    prof.print_summary();

    std::cout << "\n── 5. Summary through the logger ────────────────────────────\n";
    prof.log_summary();
    return 0;
}
