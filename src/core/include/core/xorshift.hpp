/* SPDX-FileCopyrightText: 2025 Goop Battle Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <array>
#include <cstdint>

namespace goop::core {

    /**
     * @brief xorshift128+ pseudo-random generator
     *
     * Vigna, "Further scramblings of Marsaglia's xorshift generators" (2014).
     * Deterministic for a given state, so a seed in the config reproduces a board.
     * Not for cryptographic use.
     */
    class XorShift128Plus {
    public:
        using result_type = uint64_t;

        explicit XorShift128Plus(const std::array<uint64_t, 2>& state) : state_(state) {}

        // Expands one seed into a non-zero state.
        static XorShift128Plus fromSeed(const uint64_t seed) {
            std::array<uint64_t, 2> state{seed, seed ^ 0x9E3779B97F4A7C15ull};
            if (state[0] == 0 && state[1] == 0)
                state[0] = 1;
            return XorShift128Plus(state);
        }

        uint64_t next_u64() {
            uint64_t s1 = state_[0];
            const uint64_t s0 = state_[1];
            state_[0] = s0;
            s1 ^= s1 << 23;
            state_[1] = s1 ^ s0 ^ (s1 >> 17) ^ (s0 >> 26);
            return state_[1] + s0;
        }

        uint32_t next_u32() { return static_cast<uint32_t>(next_u64() & 0xffffffffu); }

        uint64_t operator()() { return next_u64(); }
        static constexpr uint64_t min() { return 0; }
        static constexpr uint64_t max() { return UINT64_MAX; }

        const std::array<uint64_t, 2>& state() const { return state_; }

    private:
        std::array<uint64_t, 2> state_;
    };

} // namespace goop::core
