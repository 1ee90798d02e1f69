#pragma once

// Glib
#include <glib.h>           // gpointer, guint

// What the orchestrator needs from the media pipeline. Every call is a
// fire-and-forget signal; results come back later on the bus or via sr-done.
class SmartRecordPipeline {
public:
    virtual ~SmartRecordPipeline() = default;

    virtual bool play() = 0;
    // Stop media flow (NULL state). Safe to call more than once.
    virtual void halt() = 0;

    // Look-back cache capacity reported by the source, 0 if unknown.
    virtual guint cacheSeconds() const = 0;

    virtual bool startRecording(gpointer sessionIdHandle, guint backSec, guint frontSec,
                                gpointer userContextHandle) = 0;
    virtual bool stopRecording(guint reason) = 0;
};
