// Copyright 2025 The Silkproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "sha256.hpp"

#include <catch2/catch_test_macros.hpp>

#include <silkproof/core/common/util.hpp>

namespace silkproof::crypto {

TEST_CASE("SHA256 of empty string") {
    CHECK(sha256(ByteView{}).to_hex(true) == "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    CHECK(sha256(std::string_view{}).to_hex(true) == "0xe3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 sample") {
    CHECK(sha256("abc"sv).to_hex() == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

    std::optional<Bytes> input{
        from_hex("1234567812345678123456781234567812345678123456781234567812345678123456781234567812345678123456781234"
                 "567812345678")};
    REQUIRE(input);
    CHECK(sha256(ByteView{*input}).to_hex(true) == "0x7303caef875be8c39b2c2f1905ea24adcc024bef6830a965fe05370f3170dc52");
}

}  // namespace silkproof::crypto
