/*
 * Copyright (C) 2023-2026 Ligero, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <chrono>
#include <string>

namespace zkpaillier {

/************************************************************
 * Scoped stopwatch. The elapsed time is added to the global
 * timer table under `name` when `stop()` is called or the
 * object goes out of scope, whichever comes first.
 *
 * Example usage:
 *     auto t = make_timer("prove");
 *     ...
 *     t.stop();
 *     show_timer();
 ************************************************************/
struct scoped_timer {
    using clock_type = std::chrono::steady_clock;

    explicit scoped_timer(std::string name)
        : name_(std::move(name)), start_(clock_type::now()), running_(true) { }

    scoped_timer(const scoped_timer&) = delete;
    scoped_timer& operator=(const scoped_timer&) = delete;

    scoped_timer(scoped_timer&& other) noexcept
        : name_(std::move(other.name_)), start_(other.start_), running_(other.running_)
    {
        other.running_ = false;
    }

    ~scoped_timer() { stop(); }

    void stop();

private:
    std::string name_;
    clock_type::time_point start_;
    bool running_;
};

inline scoped_timer make_timer(std::string name) {
    return scoped_timer{ std::move(name) };
}

/// Milliseconds recorded under `name`, zero if never recorded.
double timer_elapsed_ms(const std::string& name);

/// Log every recorded timer at info level.
void show_timer();

void clear_timers();

}  // namespace zkpaillier
