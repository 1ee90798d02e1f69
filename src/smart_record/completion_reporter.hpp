#pragma once

// STL
#include <iostream>
#include <string>

// Glib
#include <glib.h>

#include "native_context_arena.hpp"

// What the pipeline hands back when a recording is finalized.
// Empty strings mean the field was missing in the native payload.
struct CompletionRecord {
    std::string dirPath;
    std::string fileName;
    guint width = 0;
    guint height = 0;
    guint64 durationMs = 0;         // 0 when unknown

    // Copy of the echoed user context, taken while the native payload is
    // still valid. The record never points into the arena.
    bool hasUserContext = false;
    SRUserContext userContext{};
};

// Copies an SRUserContext-shaped buffer into the record. False for null.
bool captureUserContext(CompletionRecord& record, gconstpointer handle);

struct CompletionSummary {
    std::string dirPath;
    std::string fileName;
    guint width = 0;
    guint height = 0;
    bool hasUserContext = false;
    UserContext user;
};

class CompletionReporter {
public:
    explicit CompletionReporter(std::ostream& out = std::cout) : out_(out) {}

    // Best effort: missing fields become placeholder text, never an error.
    CompletionSummary report(const CompletionRecord& record) const;

private:
    std::ostream& out_;
};
