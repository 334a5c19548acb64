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

#include <stdexcept>
#include <string>

namespace zkpaillier {

/// Malformed circuit construction: bad bounds, values wider than their
/// declared bound, mismatched bit sequences. Programmer error.
struct structural_error : std::logic_error {
    using std::logic_error::logic_error;
};

/// The witnesses do not satisfy the relation being proven.
struct synthesis_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

/// Proof or key bytes could not be decoded.
struct deserialization_error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}  // namespace zkpaillier
