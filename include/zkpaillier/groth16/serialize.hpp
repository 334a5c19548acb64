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

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <boost/archive/archive_exception.hpp>
#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>

#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>

#include <zkpaillier/error.hpp>
#include <zkpaillier/groth16/point_codec.hpp>

namespace zkpaillier::groth16 {

/// Write `payload` to `path` as a gzip-compressed archive carrying a
/// format tag, a version and a SHA-256 digest of the payload.
void write_container(const std::string& path, std::string_view payload);

/// Read back a payload written by write_container. Unreadable files,
/// corrupt compression, foreign archives and digest mismatches all
/// raise deserialization_error.
std::string read_container(const std::string& path);

/************************************************************
 * Payload encoding of a saved object.
 *
 * The default is libsnark's stream encoding, used for proving
 * keys: the prover's own setup output. Proofs and verification
 * keys reach the verifier from outside and use the affine point
 * codec, whose decoder validates every point.
 ************************************************************/
template <typename T>
struct payload_codec {
    static std::string encode(const T& obj) {
        std::ostringstream ss;
        ss << obj;
        return ss.str();
    }

    static T decode(const std::string& payload) {
        std::istringstream ss(payload);

        T obj;
        ss >> obj;
        if (ss.fail()) {
            throw deserialization_error("malformed payload");
        }
        return obj;
    }
};

namespace codec {

/// Run `body` on a headerless binary archive over `payload`, mapping
/// archive failures and trailing bytes to deserialization_error
template <typename Body>
auto with_iarchive(const std::string& payload, Body&& body) {
    std::istringstream ss(payload);
    try {
        boost::archive::binary_iarchive ia(ss, boost::archive::no_header);
        auto out = std::forward<Body>(body)(ia);
        if (ss.peek() != std::char_traits<char>::eof()) {
            throw deserialization_error("trailing bytes after payload");
        }
        return out;
    }
    catch (const boost::archive::archive_exception& ex) {
        throw deserialization_error("boost.archive: " + std::string(ex.what()));
    }
}

template <typename Body>
std::string with_oarchive(Body&& body) {
    std::ostringstream ss;
    {
        boost::archive::binary_oarchive oa(ss, boost::archive::no_header);
        std::forward<Body>(body)(oa);
    }
    return ss.str();
}

}  // namespace codec

/// A, B, C as validated affine points
template <typename ppT>
struct payload_codec<libsnark::r1cs_gg_ppzksnark_proof<ppT>> {
    using proof_type = libsnark::r1cs_gg_ppzksnark_proof<ppT>;

    static std::string encode(const proof_type& pi) {
        return codec::with_oarchive([&](auto& oa) {
            codec::write_point(oa, pi.g_A);
            codec::write_point(oa, pi.g_B);
            codec::write_point(oa, pi.g_C);
        });
    }

    static proof_type decode(const std::string& payload) {
        return codec::with_iarchive(payload, [](auto& ia) {
            auto a = codec::read_point<libff::G1<ppT>>(ia);
            auto b = codec::read_point<libff::G2<ppT>>(ia);
            auto c = codec::read_point<libff::G1<ppT>>(ia);
            return proof_type(std::move(a), std::move(b), std::move(c));
        });
    }
};

/// alpha*beta pairing, gamma and delta in G2, then the input
/// accumulation vector: first point, domain size and sparse entries
template <typename ppT>
struct payload_codec<libsnark::r1cs_gg_ppzksnark_verification_key<ppT>> {
    using vk_type = libsnark::r1cs_gg_ppzksnark_verification_key<ppT>;

    static std::string encode(const vk_type& vk) {
        return codec::with_oarchive([&](auto& oa) {
            codec::write_field(oa, vk.alpha_g1_beta_g2);
            codec::write_point(oa, vk.gamma_g2);
            codec::write_point(oa, vk.delta_g2);
            codec::write_point(oa, vk.gamma_ABC_g1.first);

            const auto& rest = vk.gamma_ABC_g1.rest;
            const uint64_t domain_size = rest.domain_size_;
            const uint64_t count = rest.indices.size();
            oa << domain_size << count;
            for (size_t i = 0; i < rest.indices.size(); i++) {
                const uint64_t index = rest.indices[i];
                oa << index;
                codec::write_point(oa, rest.values[i]);
            }
        });
    }

    static vk_type decode(const std::string& payload) {
        return codec::with_iarchive(payload, [](auto& ia) {
            libff::GT<ppT> alpha_g1_beta_g2;
            codec::read_field(ia, alpha_g1_beta_g2);
            auto gamma_g2 = codec::read_point<libff::G2<ppT>>(ia);
            auto delta_g2 = codec::read_point<libff::G2<ppT>>(ia);
            auto first = codec::read_point<libff::G1<ppT>>(ia);

            uint64_t domain_size = 0, count = 0;
            ia >> domain_size >> count;
            if (count > domain_size) {
                throw deserialization_error("accumulation vector has more entries than its domain");
            }

            libsnark::sparse_vector<libff::G1<ppT>> rest;
            rest.domain_size_ = domain_size;
            for (uint64_t i = 0; i < count; i++) {
                uint64_t index = 0;
                ia >> index;
                if (index >= domain_size || (!rest.indices.empty() && index <= rest.indices.back())) {
                    throw deserialization_error("accumulation vector indices out of order");
                }
                rest.indices.push_back(index);
                rest.values.push_back(codec::read_point<libff::G1<ppT>>(ia));
            }

            return vk_type(alpha_g1_beta_g2, gamma_g2, delta_g2,
                           libsnark::accumulation_vector<libff::G1<ppT>>(std::move(first), std::move(rest)));
        });
    }
};

/// Save a key or proof
template <typename T>
void save(const std::string& path, const T& obj) {
    write_container(path, payload_codec<T>::encode(obj));
}

/// Load a key or proof. Every failure, including an invalid curve point,
/// raises deserialization_error naming `path`.
template <typename T>
T load(const std::string& path) {
    const std::string payload = read_container(path);

    T obj;
    try {
        obj = payload_codec<T>::decode(payload);
    }
    catch (const deserialization_error& ex) {
        throw deserialization_error(std::string(ex.what()) + " in \"" + path + "\"");
    }

    if constexpr (requires { obj.is_well_formed(); }) {
        if (!obj.is_well_formed())
            throw deserialization_error("ill-formed payload in \"" + path + "\"");
    }
    return obj;
}

}  // namespace zkpaillier::groth16
