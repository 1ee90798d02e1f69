#include <gtest/gtest.h>

#include <cstring>
#include <string>

#include "native_context_arena.hpp"

namespace {

TEST(NativeContextArenaTest, AllocateReturnsZeroedMemory) {
    NativeContextArena arena;
    gpointer handle = arena.allocate(ArenaSlot::UserContext, sizeof(SRUserContext));
    ASSERT_NE(handle, nullptr);

    const auto* bytes = static_cast<const unsigned char*>(handle);
    for (std::size_t i = 0; i < sizeof(SRUserContext); ++i) {
        EXPECT_EQ(bytes[i], 0u) << "byte " << i;
    }
    EXPECT_TRUE(arena.owns(handle));
    EXPECT_EQ(arena.handle(ArenaSlot::UserContext), handle);
    EXPECT_EQ(arena.allocateCount(), 1u);
}

TEST(NativeContextArenaTest, SecondAllocateOnBusySlotIsRefused) {
    NativeContextArena arena;
    gpointer first = arena.allocate(ArenaSlot::SessionId, sizeof(guint32));
    ASSERT_NE(first, nullptr);

    EXPECT_EQ(arena.allocate(ArenaSlot::SessionId, sizeof(guint32)), nullptr);
    EXPECT_EQ(arena.handle(ArenaSlot::SessionId), first);
    EXPECT_EQ(arena.allocateCount(), 1u);
}

TEST(NativeContextArenaTest, ZeroSizeIsRefused) {
    NativeContextArena arena;
    EXPECT_EQ(arena.allocate(ArenaSlot::SessionId, 0), nullptr);
    EXPECT_FALSE(arena.held(ArenaSlot::SessionId));
}

TEST(NativeContextArenaTest, ReleaseHappensExactlyOnce) {
    NativeContextArena arena;
    ASSERT_NE(arena.allocate(ArenaSlot::SessionId, sizeof(guint32)), nullptr);

    EXPECT_TRUE(arena.release(ArenaSlot::SessionId));
    EXPECT_FALSE(arena.release(ArenaSlot::SessionId));
    EXPECT_EQ(arena.releaseCount(), 1u);
    EXPECT_FALSE(arena.held(ArenaSlot::SessionId));
}

TEST(NativeContextArenaTest, SlotIsReusableAfterRelease) {
    NativeContextArena arena;
    ASSERT_NE(arena.allocate(ArenaSlot::SessionId, sizeof(guint32)), nullptr);
    ASSERT_TRUE(arena.release(ArenaSlot::SessionId));
    EXPECT_NE(arena.allocate(ArenaSlot::SessionId, sizeof(guint32)), nullptr);
    EXPECT_EQ(arena.allocateCount(), 2u);
}

TEST(NativeContextArenaTest, ReleaseAllBalancesCounters) {
    NativeContextArena arena;
    ASSERT_NE(arena.allocate(ArenaSlot::SessionId, sizeof(guint32)), nullptr);
    ASSERT_NE(arena.allocate(ArenaSlot::UserContext, sizeof(SRUserContext)), nullptr);

    arena.releaseAll();
    arena.releaseAll();
    EXPECT_EQ(arena.allocateCount(), 2u);
    EXPECT_EQ(arena.releaseCount(), 2u);
}

TEST(NativeContextArenaTest, UserContextRoundTripIsBitIdentical) {
    NativeContextArena arena;
    gpointer handle = arena.allocate(ArenaSlot::UserContext, sizeof(SRUserContext));
    ASSERT_TRUE(arena.writeUserContext(handle, 1234, "sr-demo"));

    SRUserContext expected;
    std::memset(&expected, 0, sizeof(expected));
    expected.sessionid = 1234;
    std::strcpy(expected.name, "sr-demo");
    EXPECT_EQ(std::memcmp(handle, &expected, sizeof(expected)), 0);

    UserContext decoded;
    ASSERT_TRUE(decodeUserContext(handle, decoded));
    EXPECT_EQ(decoded.sessionId, 1234);
    EXPECT_EQ(decoded.name, "sr-demo");
}

TEST(NativeContextArenaTest, LongNameKeepsTerminator) {
    NativeContextArena arena;
    gpointer handle = arena.allocate(ArenaSlot::UserContext, sizeof(SRUserContext));
    const std::string longName(40, 'x');
    ASSERT_TRUE(arena.writeUserContext(handle, 7, longName));

    const auto* ctx = static_cast<const SRUserContext*>(handle);
    EXPECT_EQ(ctx->name[kUserContextNameSize - 1], '\0');

    UserContext decoded;
    ASSERT_TRUE(decodeUserContext(handle, decoded));
    EXPECT_EQ(decoded.name, std::string(kUserContextNameSize - 1, 'x'));
}

TEST(NativeContextArenaTest, WriteRefusesForeignHandles) {
    NativeContextArena arena;
    SRUserContext outside;
    std::memset(&outside, 0, sizeof(outside));

    EXPECT_FALSE(arena.writeUserContext(&outside, 1, "x"));
    EXPECT_EQ(outside.sessionid, 0);

    // the session-id buffer is too small to hold a user context
    gpointer sessionId = arena.allocate(ArenaSlot::SessionId, sizeof(guint32));
    EXPECT_FALSE(arena.writeUserContext(sessionId, 1, "x"));
}

TEST(NativeContextArenaTest, DecodeReadsCopiesOfTheBuffer) {
    NativeContextArena arena;
    gpointer handle = arena.allocate(ArenaSlot::UserContext, sizeof(SRUserContext));
    ASSERT_TRUE(arena.writeUserContext(handle, 1234, "sr-demo"));

    SRUserContext copy;
    std::memcpy(&copy, handle, sizeof(copy));
    arena.releaseAll();

    UserContext decoded;
    ASSERT_TRUE(decodeUserContext(&copy, decoded));
    EXPECT_EQ(decoded.sessionId, 1234);
    EXPECT_EQ(decoded.name, "sr-demo");
    EXPECT_FALSE(decodeUserContext(nullptr, decoded));
}

}  // namespace
