#pragma once

#include <cstdint>

namespace cfg {

// --- Random draw tracing (debug aids, off in normal builds) ---
constexpr bool kTraceRandomDraws = false;       // log every raw draw
constexpr bool kTraceRandomPermutations = false; // log each RandomInts result

// --- lcg_runner defaults ---
constexpr uint32_t kDefaultRunnerSeed = 0xC0FFEEu;
constexpr int kDefaultRunnerCount = 10;
constexpr int kMaxRunnerCount = 1000000;
constexpr int kDefaultRunnerRange = 10;

// --- Path sampling ---
constexpr double kDefaultCardioidRadius = 1.0;
constexpr double kPi = 3.14159265358979323846;

} // namespace cfg
