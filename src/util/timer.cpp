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

#include <map>

#include <zkpaillier/util/log.hpp>
#include <zkpaillier/util/timer.hpp>

namespace zkpaillier {

namespace {

struct timer_entry {
    double total_ms = 0.0;
    size_t count    = 0;
};

std::map<std::string, timer_entry>& timer_table() {
    static std::map<std::string, timer_entry> table;
    return table;
}

}  // namespace

void scoped_timer::stop() {
    if (!running_)
        return;

    running_ = false;
    std::chrono::duration<double, std::milli> elapsed = clock_type::now() - start_;

    auto& entry = timer_table()[name_];
    entry.total_ms += elapsed.count();
    ++entry.count;
}

double timer_elapsed_ms(const std::string& name) {
    auto& table = timer_table();
    auto it = table.find(name);
    return it == table.end() ? 0.0 : it->second.total_ms;
}

void show_timer() {
    for (const auto& [name, entry] : timer_table()) {
        ZKPAILLIER_LOG_INFO << "timer " << name << ": "
                            << entry.total_ms << " ms"
                            << " (" << entry.count << " calls)";
    }
}

void clear_timers() {
    timer_table().clear();
}

}  // namespace zkpaillier
