#include "run_loop.hpp"

// ===== C++ STL =====
#include <exception>
#include <iostream>
#include <memory>
#include <utility>

using LoopCallback = std::function<void()>;

static gboolean runOnce(gpointer user_data) {
    auto* callback = static_cast<LoopCallback*>(user_data);
    try {
        (*callback)();
    } catch (const std::exception& e) {
        std::cerr << "[Main] loop callback error: " << e.what() << "\n";
    }
    return G_SOURCE_REMOVE;  // one-shot
}

// GLib owns the callback from attach until the source is destroyed.
static void destroyCallback(gpointer user_data) {
    std::unique_ptr<LoopCallback> owned(static_cast<LoopCallback*>(user_data));
}

GMainRunLoop::GMainRunLoop()
    : loop_(g_main_loop_new(nullptr, FALSE)) {}

GMainRunLoop::~GMainRunLoop() {
    g_main_loop_unref(loop_);
}

void GMainRunLoop::scheduleOnce(guint delaySec, std::function<void()> callback) {
    auto owned = std::make_unique<LoopCallback>(std::move(callback));
    g_timeout_add_seconds_full(G_PRIORITY_DEFAULT, delaySec, runOnce, owned.release(), destroyCallback);
}

void GMainRunLoop::post(std::function<void()> callback) {
    auto owned = std::make_unique<LoopCallback>(std::move(callback));
    // dispatched only by the thread running the loop
    GSource* source = g_idle_source_new();
    g_source_set_priority(source, G_PRIORITY_DEFAULT);
    g_source_set_callback(source, runOnce, owned.release(), destroyCallback);
    g_source_attach(source, g_main_loop_get_context(loop_));
    g_source_unref(source);
}

void GMainRunLoop::run() {
    g_main_loop_run(loop_);
}

void GMainRunLoop::quit() {
    g_main_loop_quit(loop_);
}
