/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * This file is part of the Ferry Core project.
 */

#include "HashAccumulator.h"

#include <algorithm>
#include <climits>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <vector>

#include <boost/crc.hpp>
#include <openssl/evp.h>
#include <zlib.h>

#if defined(FERRY_WITH_XXHASH)
#include <xxhash.h>
#endif

#include "FileSystem/FileError.h"

namespace Ferry::Core::Hashing {

namespace {
    constexpr size_t kShake128OutputBytes = 32;
    constexpr size_t kShake256OutputBytes = 64;

    [[noreturn]] void throwUnavailable(HashAlgorithm algorithm, const char* reason) {
        auto info = IO::makeFileError(IO::FileError::UnknownAlgorithm,
                                      std::string("Hash algorithm '") + std::string(hashAlgorithmName(algorithm)) +
                                      "' " + reason);
        info.operation = "computeHash";
        throw IO::FileOperationError(std::move(info));
    }

    std::string toLowerHex(const unsigned char* data, size_t len) {
        static constexpr char kDigits[] = "0123456789abcdef";
        std::string out;
        out.resize(len * 2);
        for (size_t i = 0; i < len; ++i) {
            out[2 * i] = kDigits[data[i] >> 4];
            out[2 * i + 1] = kDigits[data[i] & 0x0F];
        }
        return out;
    }

    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };

    // libcrypto digest, including the SHAKE extendable-output functions
    class EvpAccumulator : public IHashAccumulator {
    public:
        EvpAccumulator(HashAlgorithm algorithm, const EVP_MD* md, size_t xofLength = 0)
            : _algorithm(algorithm), _ctx(EVP_MD_CTX_new()), _xofLength(xofLength) {
            if (!md || !_ctx || EVP_DigestInit_ex(_ctx.get(), md, nullptr) != 1) {
                throwUnavailable(algorithm, "could not be initialized by libcrypto");
            }
        }

        HashAlgorithm algorithm() const noexcept override { return _algorithm; }

    protected:
        void doUpdate(std::span<const std::byte> data) override {
            if (EVP_DigestUpdate(_ctx.get(), data.data(), data.size()) != 1) {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
        }

        std::string doFinalize() override {
            if (_xofLength > 0) {
                std::vector<unsigned char> out(_xofLength);
                if (EVP_DigestFinalXOF(_ctx.get(), out.data(), out.size()) != 1) {
                    throw std::runtime_error("EVP_DigestFinalXOF failed");
                }
                return toLowerHex(out.data(), out.size());
            }

            unsigned char out[EVP_MAX_MD_SIZE];
            unsigned int len = 0;
            if (EVP_DigestFinal_ex(_ctx.get(), out, &len) != 1) {
                throw std::runtime_error("EVP_DigestFinal_ex failed");
            }
            return toLowerHex(out, len);
        }

    private:
        HashAlgorithm _algorithm;
        std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> _ctx;
        size_t _xofLength;
    };

    class Crc32Accumulator : public IHashAccumulator {
    public:
        HashAlgorithm algorithm() const noexcept override { return HashAlgorithm::Crc32; }

    protected:
        void doUpdate(std::span<const std::byte> data) override {
            // zlib takes a uInt length
            auto* p = reinterpret_cast<const Bytef*>(data.data());
            size_t remaining = data.size();
            while (remaining > 0) {
                const uInt n = static_cast<uInt>(std::min<size_t>(remaining, UINT_MAX));
                _crc = ::crc32(_crc, p, n);
                p += n;
                remaining -= n;
            }
        }

        std::string doFinalize() override {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%08lx", static_cast<unsigned long>(_crc & 0xFFFFFFFFUL));
            return buf;
        }

    private:
        uLong _crc = ::crc32(0L, Z_NULL, 0);
    };

    // ISO 3309 polynomial 0x1B, reflected in and out, zero init, no final xor
    class Crc64Accumulator : public IHashAccumulator {
    public:
        HashAlgorithm algorithm() const noexcept override { return HashAlgorithm::Crc64; }

    protected:
        void doUpdate(std::span<const std::byte> data) override {
            _crc.process_bytes(data.data(), data.size());
        }

        std::string doFinalize() override {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%016llX", static_cast<unsigned long long>(_crc.checksum()));
            return buf;
        }

    private:
        boost::crc_optimal<64, 0x1BULL, 0, 0, true, true> _crc;
    };

#if defined(FERRY_WITH_XXHASH)
    class XxHash32Accumulator : public IHashAccumulator {
    public:
        XxHash32Accumulator() : _state(XXH32_createState()) {
            if (!_state || XXH32_reset(_state, 0) != XXH_OK) {
                XXH32_freeState(_state);
                throwUnavailable(HashAlgorithm::XxHash32, "could not be initialized");
            }
        }
        ~XxHash32Accumulator() override { XXH32_freeState(_state); }

        XxHash32Accumulator(const XxHash32Accumulator&) = delete;
        XxHash32Accumulator& operator=(const XxHash32Accumulator&) = delete;

        HashAlgorithm algorithm() const noexcept override { return HashAlgorithm::XxHash32; }

    protected:
        void doUpdate(std::span<const std::byte> data) override {
            if (XXH32_update(_state, data.data(), data.size()) != XXH_OK) {
                throw std::runtime_error("XXH32_update failed");
            }
        }

        std::string doFinalize() override {
            XXH32_canonical_t canonical;
            XXH32_canonicalFromHash(&canonical, XXH32_digest(_state));
            return toLowerHex(canonical.digest, sizeof(canonical.digest));
        }

    private:
        XXH32_state_t* _state;
    };

    class XxHash64Accumulator : public IHashAccumulator {
    public:
        XxHash64Accumulator() : _state(XXH64_createState()) {
            if (!_state || XXH64_reset(_state, 0) != XXH_OK) {
                XXH64_freeState(_state);
                throwUnavailable(HashAlgorithm::XxHash64, "could not be initialized");
            }
        }
        ~XxHash64Accumulator() override { XXH64_freeState(_state); }

        XxHash64Accumulator(const XxHash64Accumulator&) = delete;
        XxHash64Accumulator& operator=(const XxHash64Accumulator&) = delete;

        HashAlgorithm algorithm() const noexcept override { return HashAlgorithm::XxHash64; }

    protected:
        void doUpdate(std::span<const std::byte> data) override {
            if (XXH64_update(_state, data.data(), data.size()) != XXH_OK) {
                throw std::runtime_error("XXH64_update failed");
            }
        }

        std::string doFinalize() override {
            XXH64_canonical_t canonical;
            XXH64_canonicalFromHash(&canonical, XXH64_digest(_state));
            return toLowerHex(canonical.digest, sizeof(canonical.digest));
        }

    private:
        XXH64_state_t* _state;
    };
#endif
}

std::unique_ptr<IHashAccumulator> createHashAccumulator(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Crc32: return std::make_unique<Crc32Accumulator>();
        case HashAlgorithm::Crc64: return std::make_unique<Crc64Accumulator>();
        case HashAlgorithm::Md5: return std::make_unique<EvpAccumulator>(algorithm, EVP_md5());
        case HashAlgorithm::Sha1: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha1());
        case HashAlgorithm::Sha224: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha224());
        case HashAlgorithm::Sha256: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha256());
        case HashAlgorithm::Sha384: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha384());
        case HashAlgorithm::Sha512: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha512());
        case HashAlgorithm::Sha3_224: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha3_224());
        case HashAlgorithm::Sha3_256: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha3_256());
        case HashAlgorithm::Sha3_384: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha3_384());
        case HashAlgorithm::Sha3_512: return std::make_unique<EvpAccumulator>(algorithm, EVP_sha3_512());
        case HashAlgorithm::Shake128:
            return std::make_unique<EvpAccumulator>(algorithm, EVP_shake128(), kShake128OutputBytes);
        case HashAlgorithm::Shake256:
            return std::make_unique<EvpAccumulator>(algorithm, EVP_shake256(), kShake256OutputBytes);
        case HashAlgorithm::Blake2b: return std::make_unique<EvpAccumulator>(algorithm, EVP_blake2b512());
        case HashAlgorithm::Blake2s: return std::make_unique<EvpAccumulator>(algorithm, EVP_blake2s256());
#if defined(FERRY_WITH_XXHASH)
        case HashAlgorithm::XxHash32: return std::make_unique<XxHash32Accumulator>();
        case HashAlgorithm::XxHash64: return std::make_unique<XxHash64Accumulator>();
#else
        case HashAlgorithm::XxHash32:
        case HashAlgorithm::XxHash64:
            throwUnavailable(algorithm, "is unavailable in this build (xxHash not found)");
#endif
    }
    throwUnavailable(algorithm, "is not supported");
}

} // namespace Ferry::Core::Hashing
