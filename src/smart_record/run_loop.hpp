#pragma once

// STL
#include <functional>

// Glib
#include <glib.h>           // GMainLoop

// Single-threaded loop multiplexing one-shot timers and pipeline callbacks.
class RunLoop {
public:
    virtual ~RunLoop() = default;

    // Fire callback once, delaySec seconds from now.
    virtual void scheduleOnce(guint delaySec, std::function<void()> callback) = 0;
    // Safe from any thread. callback runs later on the loop thread.
    virtual void post(std::function<void()> callback) = 0;
    virtual void run() = 0;
    virtual void quit() = 0;
};

class GMainRunLoop : public RunLoop {
public:
    GMainRunLoop();
    ~GMainRunLoop() override;

    GMainRunLoop(const GMainRunLoop&) = delete;
    GMainRunLoop& operator=(const GMainRunLoop&) = delete;

    void scheduleOnce(guint delaySec, std::function<void()> callback) override;
    void post(std::function<void()> callback) override;
    void run() override;
    void quit() override;

private:
    GMainLoop* loop_;
};
