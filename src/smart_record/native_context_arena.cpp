#include "native_context_arena.hpp"

// ===== C++ STL =====
#include <cstring>
#include <iostream>

const char* arenaSlotName(ArenaSlot slot) {
    switch (slot) {
        case ArenaSlot::SessionId:   return "session-id";
        case ArenaSlot::UserContext: return "user-context";
    }
    return "unknown";
}

NativeContextArena::~NativeContextArena() {
    releaseAll();
}

gpointer NativeContextArena::allocate(ArenaSlot slot, gsize sizeBytes) {
    Buffer& buf = slots_[index(slot)];
    if (buf.data) {
        std::cerr << "[Arena] slot " << arenaSlotName(slot) << " already allocated\n";
        return nullptr;
    }
    if (sizeBytes == 0) {
        std::cerr << "[Arena] refusing zero-size buffer for " << arenaSlotName(slot) << "\n";
        return nullptr;
    }

    // g_try_malloc0 so the caller can fail the session instead of aborting
    buf.data = g_try_malloc0(sizeBytes);
    if (!buf.data) {
        std::cerr << "[Arena] out of memory for " << arenaSlotName(slot)
                  << " (" << sizeBytes << " bytes)\n";
        return nullptr;
    }
    buf.size = sizeBytes;
    ++allocateCount_;
    return buf.data;
}

bool NativeContextArena::release(ArenaSlot slot) noexcept {
    Buffer& buf = slots_[index(slot)];
    if (!buf.data) {
        std::cerr << "[Arena] release of empty slot " << arenaSlotName(slot) << " ignored\n";
        return false;
    }
    g_free(buf.data);
    buf.data = nullptr;
    buf.size = 0;
    ++releaseCount_;
    return true;
}

void NativeContextArena::releaseAll() noexcept {
    for (ArenaSlot slot : {ArenaSlot::SessionId, ArenaSlot::UserContext}) {
        if (held(slot)) release(slot);
    }
}

gpointer NativeContextArena::handle(ArenaSlot slot) const {
    return slots_[index(slot)].data;
}

bool NativeContextArena::owns(gconstpointer handle) const {
    if (!handle) return false;
    for (const Buffer& buf : slots_) {
        if (buf.data == handle) return true;
    }
    return false;
}

bool NativeContextArena::isUserContextBuffer(gconstpointer handle) const {
    const Buffer& buf = slots_[index(ArenaSlot::UserContext)];
    return handle && buf.data == handle && buf.size >= sizeof(SRUserContext);
}

bool NativeContextArena::writeUserContext(gpointer handle, gint sessionId, const std::string& name) {
    if (!isUserContextBuffer(handle)) {
        std::cerr << "[Arena] write to unknown user context handle\n";
        return false;
    }
    auto* ctx = static_cast<SRUserContext*>(handle);
    std::memset(ctx, 0, sizeof(SRUserContext));
    ctx->sessionid = sessionId;
    // keep the trailing NUL, the pipeline treats name as a C string
    std::strncpy(ctx->name, name.c_str(), kUserContextNameSize - 1);
    return true;
}

bool decodeUserContext(gconstpointer handle, UserContext& out) {
    if (!handle) return false;
    const auto* ctx = static_cast<const SRUserContext*>(handle);
    out.sessionId = ctx->sessionid;
    const gchar* end = static_cast<const gchar*>(std::memchr(ctx->name, '\0', kUserContextNameSize));
    out.name.assign(ctx->name, end ? end : ctx->name + kUserContextNameSize);
    return true;
}
