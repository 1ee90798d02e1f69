#pragma once

// STL
#include <string>

// Glib
#include <glib.h>

#include "completion_reporter.hpp"
#include "event_router.hpp"
#include "native_context_arena.hpp"
#include "record_config.hpp"
#include "run_loop.hpp"
#include "smart_record_pipeline.hpp"

enum class SessionState {
    Idle,
    Armed,
    Capturing,
    StoppingOrCompleted,
    Terminated,
};

enum class TerminalPath {
    None,
    Completed,
    WatchdogExpired,
    PipelineError,
    EndOfStream,
    SetupFailed,
    Interrupted,
};

const char* sessionStateName(SessionState state);
const char* terminalPathName(TerminalPath path);

// Drives one smart-record session:
//
//   Idle --start timer--> Armed --start-sr ok--> Capturing
//        --stop timer--> StoppingOrCompleted --sr-done | watchdog--> Terminated
//
// Errors and EOS jump straight to Terminated. Every route to Terminated
// goes through terminate(), which runs cleanup exactly once.
class SessionOrchestrator : public SessionEvents {
public:
    SessionOrchestrator(const RecordConfig& config, SmartRecordPipeline& pipeline,
                        NativeContextArena& arena, RunLoop& loop,
                        const CompletionReporter& reporter);

    // Schedules the start and stop timers relative to now.
    void begin();

    void startTrigger();
    void stopTrigger();
    void watchdogExpired();
    void interrupt();

    // SessionEvents
    void onPipelineError(const std::string& source, const std::string& message,
                         const std::string& debug) override;
    void onEndOfStream() override;
    void onRecordingComplete(const CompletionRecord& record) override;

    // Returns false when the session had already terminated.
    bool terminate(TerminalPath path);

    SessionState state() const { return state_; }
    TerminalPath terminalPath() const { return terminalPath_; }
    bool completed() const { return completed_; }
    // Pre-roll passed to the last start trigger, -1 before any.
    int effectivePreRollSec() const { return effectivePreRollSec_; }

private:
    bool armContext();

    const RecordConfig& config_;
    SmartRecordPipeline& pipeline_;
    NativeContextArena& arena_;
    RunLoop& loop_;
    const CompletionReporter& reporter_;

    SessionState state_ = SessionState::Idle;
    TerminalPath terminalPath_ = TerminalPath::None;
    bool completed_ = false;
    int effectivePreRollSec_ = -1;
};
