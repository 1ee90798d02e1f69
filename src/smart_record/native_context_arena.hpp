#pragma once

// STL
#include <array>
#include <cstddef>
#include <string>

// Glib
#include <glib.h>           // gpointer, gint, gchar

constexpr std::size_t kUserContextNameSize = 32;

// Native layout of the user context handed to start-sr and echoed by sr-done.
struct SRUserContext {
    gint sessionid;
    gchar name[kUserContextNameSize];
};

// Decoded copy of an SRUserContext.
struct UserContext {
    gint sessionId = 0;
    std::string name;
};

// Reads any SRUserContext-shaped buffer, including the copy sr-done echoes
// back. Only a null handle is refused.
bool decodeUserContext(gconstpointer handle, UserContext& out);

enum class ArenaSlot {
    SessionId,      // NvDsSRSessionId written by the pipeline on start-sr
    UserContext,    // SRUserContext
};

const char* arenaSlotName(ArenaSlot slot);

// Owns the native buffers whose addresses cross into the pipeline.
// A slot holds at most one buffer; release happens exactly once per
// allocation. Anything still held is released by the destructor.
class NativeContextArena {
public:
    NativeContextArena() = default;
    ~NativeContextArena();

    NativeContextArena(const NativeContextArena&) = delete;
    NativeContextArena& operator=(const NativeContextArena&) = delete;

    // Zero-initialized buffer, nullptr if the slot is busy or size is 0.
    gpointer allocate(ArenaSlot slot, gsize sizeBytes);

    // Never throws. Returns false (and logs) when the slot is empty.
    bool release(ArenaSlot slot) noexcept;
    void releaseAll() noexcept;

    gpointer handle(ArenaSlot slot) const;
    bool held(ArenaSlot slot) const { return handle(slot) != nullptr; }
    bool owns(gconstpointer handle) const;

    // Only the UserContext slot buffer can be written.
    bool writeUserContext(gpointer handle, gint sessionId, const std::string& name);

    std::size_t allocateCount() const { return allocateCount_; }
    std::size_t releaseCount() const { return releaseCount_; }

private:
    struct Buffer {
        gpointer data = nullptr;
        gsize size = 0;
    };

    static std::size_t index(ArenaSlot slot) { return static_cast<std::size_t>(slot); }
    bool isUserContextBuffer(gconstpointer handle) const;

    std::array<Buffer, 2> slots_;
    std::size_t allocateCount_ = 0;
    std::size_t releaseCount_ = 0;
};
