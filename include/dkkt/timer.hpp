// This file is part of DKKT.
//
// Copyright (c) 2024 EPFL
//
// This source code is licensed under the BSD 2-Clause License found in the
// LICENSE file in the root directory of this source tree.

#ifndef DKKT_TIMER_HPP
#define DKKT_TIMER_HPP

#include <chrono>

namespace dkkt
{

/**
 * Stopwatch accumulating the time of several start()/stop() laps.
 */
template<typename T>
class Timer
{
protected:
    using clock = std::chrono::steady_clock;

    clock::time_point m_start;
    T m_total = 0;

public:
    void start() noexcept
    {
        m_start = clock::now();
    }

    // ends the current lap, returns its duration in seconds
    T stop() noexcept
    {
        std::chrono::duration<T> lap = clock::now() - m_start;
        m_total += lap.count();
        return lap.count();
    }

    // sum of all laps since the last reset() in seconds
    T total() const noexcept { return m_total; }

    void reset() noexcept { m_total = 0; }
};

} // namespace dkkt

#endif //DKKT_TIMER_HPP
