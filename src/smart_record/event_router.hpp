#pragma once

// STL
#include <string>

// GStreamer
#include <gst/gst.h>        // GstBus, GstMessage

#include "completion_reporter.hpp"
#include "run_loop.hpp"

// The three notification kinds a session reacts to.
class SessionEvents {
public:
    virtual ~SessionEvents() = default;

    virtual void onPipelineError(const std::string& source, const std::string& message,
                                 const std::string& debug) = 0;
    virtual void onEndOfStream() = 0;
    virtual void onRecordingComplete(const CompletionRecord& record) = 0;
};

// Turns bus messages and sr-done into SessionEvents calls. Exceptions
// never escape into GStreamer. SessionEvents are only ever called on the
// loop thread.
class EventRouter {
public:
    EventRouter(SessionEvents& events, RunLoop& loop) : events_(events), loop_(loop) {}
    ~EventRouter();

    EventRouter(const EventRouter&) = delete;
    EventRouter& operator=(const EventRouter&) = delete;

    // Installs a bus watch on the default main context.
    bool attach(GstBus* bus);
    void detach();

    // True when the message was one of ours.
    bool dispatch(GstMessage* msg);
    bool routeCompletion(const CompletionRecord& record);
    // Callable from pipeline worker threads; routeCompletion runs on the loop.
    void postCompletion(CompletionRecord record);

    static gboolean busCallback(GstBus* bus, GstMessage* msg, gpointer user_data);

private:
    SessionEvents& events_;
    RunLoop& loop_;
    GstBus* bus_ = nullptr;
};
