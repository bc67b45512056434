#include "sigid/security/MemoryWiper.hpp"
#include "sigid/security/ScopeWipe.hpp"
#include "sigid/security/SecureBuffer.hpp"
#include "sigid/security/SecureEquals.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <gtest/gtest.h>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <span>
#include <vector>

namespace
{

using namespace sigid::security;

constexpr std::size_t g_bufferSize{ 32U };
constexpr std::uint8_t g_nonZeroByte{ 0xA5U };

struct NonTrivial
{
    std::unique_ptr<int> p;
};

template <typename T>
concept CanSecureWipe = requires(T buffer) { secureWipe(buffer); };

static_assert(CanSecureWipe<std::span<std::uint32_t>>);
static_assert(!CanSecureWipe<std::span<const std::uint32_t>>);
static_assert(!CanSecureWipe<std::span<NonTrivial>>);

void expectAllBytesEq(std::span<const std::uint8_t> buffer, std::uint8_t expected)
{
    for (const auto b : buffer)
    {
        EXPECT_EQ(b, expected);
    }
}

TEST(SecureEqualsTest, MismatchedSizesReturnFalse)
{
    const std::vector<std::uint8_t> a(4, 1U);
    const std::vector<std::uint8_t> b(2, 1U);
    EXPECT_FALSE(secureEquals(a, b));
}

TEST(SecureEqualsTest, DifferenceInLastByteIsDetected)
{
    const std::array<std::uint8_t, 4> a{ 0x75, 0x7F, 0x01, 0x02 };
    const std::array<std::uint8_t, 4> b{ 0x75, 0x7F, 0x01, 0x03 };
    EXPECT_FALSE(secureEquals(a, b));
    EXPECT_TRUE(secureEquals(a, a));
}

TEST(SecureEqualsTest, EmptySpansAreEqual)
{
    EXPECT_TRUE(secureEquals(std::span<const std::uint8_t>{}, std::span<const std::uint8_t>{}));
}

TEST(MemoryWiper, ZerosTypedSpan)
{
    std::array<std::uint32_t, 8> words{};
    words.fill(0xDEADBEEFU);

    secureWipe(std::span<std::uint32_t>{ words });

    for (const auto w : words)
    {
        EXPECT_EQ(w, 0U);
    }
}

TEST(MemoryWiper, EmptySpanIsNoOp)
{
    secureWipe(std::span<std::byte>{});
}

TEST(SecureBuffer, FromStringKeepsUtf8Bytes)
{
    const SecureBuffer buf{ secureBufferFrom("b\xC3\xA9t") };
    ASSERT_EQ(buf.size(), 4U);
    EXPECT_EQ(buf[0], 0x62U);
    EXPECT_EQ(buf[1], 0xC3U);
    EXPECT_EQ(buf[2], 0xA9U);
    EXPECT_EQ(buf[3], 0x74U);

    const auto view{ asSpan(buf) };
    EXPECT_EQ(view.data(), buf.data());
    EXPECT_EQ(view.size(), buf.size());
}

TEST(SecureBuffer, WritableBytesWipesInPlace)
{
    SecureBuffer buf(g_bufferSize, g_nonZeroByte);
    secureWipe(asWritableBytes(buf));
    EXPECT_EQ(buf.size(), g_bufferSize);
    expectAllBytesEq(asSpan(buf), 0U);
}

TEST(ScopeWipe, WipesOnDestruction)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const ScopeWipe guard{ objectBytes(buffer) };
        expectAllBytesEq(buffer, g_nonZeroByte);
    }

    expectAllBytesEq(buffer, 0U);
}

TEST(ScopeWipe, EmptyRangeLeavesNeighboursAlone)
{
    std::array<std::uint8_t, g_bufferSize> buffer{};
    buffer.fill(g_nonZeroByte);

    {
        const ScopeWipe guard{ std::as_writable_bytes(std::span{ buffer }).first(0) };
    }

    expectAllBytesEq(buffer, g_nonZeroByte);
}

TEST(WipingAllocatorTest, BacksGrowingBuffer)
{
    SecureBuffer buf{};
    for (std::size_t i{}; i < 1000U; ++i)
    {
        buf.push_back(static_cast<std::uint8_t>(i));
    }
    EXPECT_EQ(buf.size(), 1000U);
    EXPECT_EQ(buf[999], static_cast<std::uint8_t>(999U));
}

TEST(WipingAllocatorTest, AllInstancesCompareEqual)
{
    const WipingAllocator<std::uint8_t> a{};
    const WipingAllocator<std::uint32_t> b{ a };
    EXPECT_TRUE(a == b);
    static_assert(std::allocator_traits<WipingAllocator<std::uint8_t>>::is_always_equal::value);
}

TEST(WipingAllocatorTest, NullAndOversizeEdges)
{
    WipingAllocator<std::uint32_t> alloc{};
    alloc.deallocate(nullptr, 16U);
    EXPECT_THROW({ [[maybe_unused]] auto* ptr = alloc.allocate(std::numeric_limits<std::size_t>::max()); },
                 std::bad_alloc);
}

TEST(MemoryWiper, ObjectBytesCoversWholeObject)
{
    struct Context
    {
        std::uint64_t state[4];
        std::uint32_t counter;
    };
    Context ctx{ { 1U, 2U, 3U, 4U }, 5U };
    const auto bytes{ objectBytes(ctx) };
    EXPECT_EQ(bytes.size(), sizeof(Context));
    EXPECT_EQ(static_cast<const void*>(bytes.data()), static_cast<const void*>(&ctx));

    {
        const ScopeWipe guard{ bytes };
    }
    EXPECT_EQ(ctx.state[3], 0U);
    EXPECT_EQ(ctx.counter, 0U);
}

} // namespace
