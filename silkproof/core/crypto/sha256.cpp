// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace silkproof::crypto {

namespace {
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;
}  // namespace

Hash sha256(ByteView input) {
    EvpMdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        throw std::runtime_error("sha256: cannot allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
    }
    if (!input.empty() && EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1) {
        throw std::runtime_error("sha256: EVP_DigestUpdate failed");
    }
    Hash out;
    unsigned int out_length{0};
    if (EVP_DigestFinal_ex(ctx.get(), out.bytes, &out_length) != 1 || out_length != Hash::size()) {
        throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
    }
    return out;
}

Hash sha256(std::string_view input) {
    return sha256(ByteView{reinterpret_cast<const uint8_t*>(input.data()), input.size()});
}

}  // namespace silkproof::crypto
