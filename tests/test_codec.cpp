// tests/test_codec.cpp
#include <algorithm>
#include <cstdint>
#include <gtest/gtest.h>
#include <vector>
#include "codec.hpp"
#include "errors.hpp"
#include "galois.hpp"
#include "test_helpers.hpp"

using namespace tessera;
using testutil::gen_bytes;

TEST(Galois, MulInvIdentities)
{
    for (uint32_t a = 1; a < gf16::kFieldSize; a += 97)
    {
        uint16_t x = static_cast<uint16_t>(a);
        EXPECT_EQ(gf16::mul(x, gf16::inv(x)), 1u) << a;
        EXPECT_EQ(gf16::mul(x, 1), x);
        EXPECT_EQ(gf16::mul(x, 0), 0u);
        EXPECT_EQ(gf16::div(gf16::mul(x, 12345), 12345), x);
    }
}

TEST(Galois, MulCommutesAndDistributes)
{
    const uint16_t a = 0x1234, b = 0xBEEF, c = 0x0F0F;
    EXPECT_EQ(gf16::mul(a, b), gf16::mul(b, a));
    EXPECT_EQ(gf16::mul(a, b ^ c), gf16::mul(a, b) ^ gf16::mul(a, c));
}

TEST(Galois, RegionOps)
{
    std::vector<uint16_t> src = {1, 2, 0, 0xFFFF};
    std::vector<uint16_t> dst(4, 0);
    gf16::mul_add_region(dst.data(), src.data(), 7, src.size());
    for (size_t i = 0; i < src.size(); ++i)
        EXPECT_EQ(dst[i], gf16::mul(src[i], 7));
    gf16::mul_region(dst.data(), gf16::inv(7), dst.size());
    EXPECT_EQ(dst, src);
}

TEST(Codec, SystematicSourceSymbols)
{
    CauchyCodec  codec;
    auto         data = gen_bytes(1000);
    EncodedBlock enc;
    std::string  why;
    ASSERT_FALSE(codec.encode(data.data(), data.size(), 256, 2, enc, why)) << why;

    EXPECT_EQ(enc.source_symbols, 4u);
    EXPECT_EQ(enc.repair_symbols, 8u);
    ASSERT_EQ(enc.symbols.size(), 12u);
    EXPECT_EQ(enc.parameters.size(), kEncoderParametersBytes);
    EXPECT_EQ(codec.required_symbols(enc.parameters), 4u);

    // Source packets carry the data verbatim; the last one is truncated.
    for (uint32_t j = 0; j < 4; ++j)
    {
        const auto &pkt = enc.symbols[j];
        EXPECT_EQ(packet_esi(pkt), j);
        size_t n = j == 3 ? 1000 - 3 * 256 : 256;
        ASSERT_EQ(pkt.size(), kPacketHeaderBytes + n);
        EXPECT_TRUE(std::equal(pkt.begin() + kPacketHeaderBytes, pkt.end(),
                               data.begin() + j * 256));
    }
    for (uint32_t i = 4; i < 12; ++i)
    {
        EXPECT_EQ(packet_esi(enc.symbols[i]), i);
        EXPECT_EQ(enc.symbols[i].size(), kPacketHeaderBytes + 256);
    }
}

TEST(Codec, AnyKSymbolsDecode)
{
    CauchyCodec  codec;
    auto         data = gen_bytes(5 * 300 + 17, 3);
    EncodedBlock enc;
    std::string  why;
    ASSERT_FALSE(codec.encode(data.data(), data.size(), 300, 3, enc, why)) << why;
    const uint32_t k = enc.source_symbols;
    ASSERT_EQ(k, 6u);

    // Sliding windows of exactly K symbols mix source and repair differently.
    for (size_t start = 0; start + k <= enc.symbols.size(); start += 2)
    {
        std::vector<std::vector<uint8_t>> subset(enc.symbols.begin() + start,
                                                 enc.symbols.begin() + start + k);
        std::vector<uint8_t>              out;
        ASSERT_FALSE(codec.decode(enc.parameters, subset, out, why)) << start << ": " << why;
        EXPECT_EQ(out, data) << "window starting at " << start;
    }

    // Only repair symbols.
    std::vector<std::vector<uint8_t>> repair_only(enc.symbols.end() - k, enc.symbols.end());
    std::vector<uint8_t>              out;
    ASSERT_FALSE(codec.decode(enc.parameters, repair_only, out, why)) << why;
    EXPECT_EQ(out, data);
}

TEST(Codec, OddSymbolSizeAndShuffledInput)
{
    CauchyCodec  codec;
    auto         data = gen_bytes(4001, 9);
    EncodedBlock enc;
    std::string  why;
    ASSERT_FALSE(codec.encode(data.data(), data.size(), 333, 1, enc, why)) << why;
    const uint32_t k = enc.source_symbols;

    std::vector<std::vector<uint8_t>> subset;
    for (size_t i = 0; i < enc.symbols.size(); i += 2)
        subset.push_back(enc.symbols[i]);
    std::reverse(subset.begin(), subset.end());
    ASSERT_GE(subset.size(), k);

    std::vector<uint8_t> out;
    ASSERT_FALSE(codec.decode(enc.parameters, subset, out, why)) << why;
    EXPECT_EQ(out, data);
}

TEST(Codec, InsufficientSymbols)
{
    CauchyCodec  codec;
    auto         data = gen_bytes(2048);
    EncodedBlock enc;
    std::string  why;
    ASSERT_FALSE(codec.encode(data.data(), data.size(), 256, 1, enc, why));

    std::vector<std::vector<uint8_t>> subset(enc.symbols.begin() + 3,
                                             enc.symbols.begin() + 3 + enc.source_symbols - 1);
    // Duplicates do not count twice.
    subset.push_back(subset.front());
    std::vector<uint8_t> out;
    EXPECT_EQ(codec.decode(enc.parameters, subset, out, why), errc::insufficient_symbols);
    EXPECT_FALSE(why.empty());
}

TEST(Codec, EmptyBlock)
{
    CauchyCodec  codec;
    EncodedBlock enc;
    std::string  why;
    ASSERT_FALSE(codec.encode(nullptr, 0, 512, 4, enc, why));
    EXPECT_TRUE(enc.symbols.empty());
    EXPECT_EQ(codec.required_symbols(enc.parameters), 0u);

    std::vector<uint8_t> out{1, 2, 3};
    ASSERT_FALSE(codec.decode(enc.parameters, {}, out, why));
    EXPECT_TRUE(out.empty());
}

TEST(Codec, RejectsOversizedBlockAndBadParameters)
{
    CauchyCodec  codec;
    auto         data = gen_bytes(40000);
    EncodedBlock enc;
    std::string  why;
    // 40000 source symbols plus as many repair symbols exceed GF(2^16).
    EXPECT_EQ(codec.encode(data.data(), data.size(), 1, 1, enc, why), errc::encoding_failure);

    std::vector<uint8_t> out;
    EXPECT_EQ(codec.decode({1, 2, 3}, {}, out, why), errc::decoding_failure);
}

TEST(Codec, RejectsParametersBeyondTheField)
{
    CauchyCodec codec;
    // Transfer length 2^32 + 1, symbol size 1, one repair symbol.
    const std::vector<uint8_t> params = {0x00, 0x01, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01};
    EXPECT_EQ(codec.required_symbols(params), 0u);
    EXPECT_FALSE(codec.transfer_length(params).has_value());

    std::vector<std::vector<uint8_t>> symbols = {{0, 0, 0, 0, 0x42}};
    std::vector<uint8_t>              out;
    std::string                       why;
    EXPECT_EQ(codec.decode(params, symbols, out, why), errc::decoding_failure);
    EXPECT_TRUE(out.empty());

    auto         data = gen_bytes(777);
    EncodedBlock enc;
    ASSERT_FALSE(codec.encode(data.data(), data.size(), 100, 2, enc, why));
    ASSERT_TRUE(codec.transfer_length(enc.parameters).has_value());
    EXPECT_EQ(*codec.transfer_length(enc.parameters), 777u);
}
