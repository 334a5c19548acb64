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

#include <cstdint>
#include <fstream>
#include <new>
#include <stdexcept>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/binary_oarchive.hpp>
#include <boost/archive/archive_exception.hpp>
#include <boost/serialization/string.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include <openssl/evp.h>

#include <zkpaillier/groth16/serialize.hpp>
#include <zkpaillier/util/log.hpp>

namespace io = boost::iostreams;

namespace zkpaillier::groth16 {

namespace {

constexpr const char *format_tag = "zkpaillier-groth16";
constexpr uint32_t format_version = 1;
constexpr int gzip_compression_level = 6;

std::string sha256(std::string_view data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (1 != EVP_Digest(data.data(), data.size(), md, &md_len, EVP_sha256(), nullptr)) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return std::string(reinterpret_cast<const char*>(md), md_len);
}

}  // namespace

void write_container(const std::string& path, std::string_view payload) {
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("could not write to file \"" + path + "\"");
    }

    const std::string tag = format_tag;
    const std::string digest = sha256(payload);
    const std::string body(payload);

    {
        io::filtering_ostream out;
        out.push(io::gzip_compressor(io::gzip_params(gzip_compression_level)));
        out.push(file);

        boost::archive::binary_oarchive oa(out);
        oa << tag << format_version << digest << body;
    }

    if (!file) {
        throw std::runtime_error("error while writing \"" + path + "\"");
    }
    ZKPAILLIER_LOG_DEBUG << "wrote " << payload.size() << " payload bytes to " << path;
}

std::string read_container(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw deserialization_error("could not read from file \"" + path + "\"");
    }

    std::string tag, digest, body;
    uint32_t version = 0;
    try {
        io::filtering_istream in;
        in.push(io::gzip_decompressor());
        in.push(file);

        boost::archive::binary_iarchive ia(in);
        ia >> tag >> version >> digest >> body;
    }
    catch (const boost::archive::archive_exception& ex) {
        if (ex.code == boost::archive::archive_exception::unsupported_version) {
            throw deserialization_error("\"" + path + "\" was written by a newer Boost.Archive: "
                                        + ex.what());
        }
        throw deserialization_error("boost.archive: " + std::string(ex.what()));
    }
    catch (const std::ios_base::failure& ex) {
        throw deserialization_error("corrupt compressed data in \"" + path + "\": " + ex.what());
    }
    catch (const std::bad_alloc&) {
        throw deserialization_error("implausible length field in \"" + path + "\"");
    }
    catch (const std::length_error&) {
        throw deserialization_error("implausible length field in \"" + path + "\"");
    }

    if (tag != format_tag) {
        throw deserialization_error("\"" + path + "\" is not a zkpaillier key or proof");
    }
    if (version != format_version) {
        throw deserialization_error("unsupported format version " + std::to_string(version));
    }
    if (digest != sha256(body)) {
        throw deserialization_error("digest mismatch in \"" + path + "\"");
    }
    return body;
}

}  // namespace zkpaillier::groth16
