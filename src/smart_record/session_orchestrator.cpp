#include "session_orchestrator.hpp"

// ===== C++ STL =====
#include <algorithm>
#include <iostream>

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle:                return "Idle";
        case SessionState::Armed:               return "Armed";
        case SessionState::Capturing:           return "Capturing";
        case SessionState::StoppingOrCompleted: return "StoppingOrCompleted";
        case SessionState::Terminated:          return "Terminated";
    }
    return "Unknown";
}

const char* terminalPathName(TerminalPath path) {
    switch (path) {
        case TerminalPath::None:            return "none";
        case TerminalPath::Completed:       return "completed";
        case TerminalPath::WatchdogExpired: return "watchdog";
        case TerminalPath::PipelineError:   return "error";
        case TerminalPath::EndOfStream:     return "eos";
        case TerminalPath::SetupFailed:     return "setup-failed";
        case TerminalPath::Interrupted:     return "interrupted";
    }
    return "unknown";
}

SessionOrchestrator::SessionOrchestrator(const RecordConfig& config, SmartRecordPipeline& pipeline,
                                         NativeContextArena& arena, RunLoop& loop,
                                         const CompletionReporter& reporter)
    : config_(config),
      pipeline_(pipeline),
      arena_(arena),
      loop_(loop),
      reporter_(reporter) {}

void SessionOrchestrator::begin() {
    std::cout << "[Main] start trigger in " << config_.startDelaySec
              << "s, stop trigger in " << config_.stopDelaySec() << "s\n";
    loop_.scheduleOnce(static_cast<guint>(config_.startDelaySec), [this] { startTrigger(); });
    loop_.scheduleOnce(static_cast<guint>(config_.stopDelaySec()), [this] { stopTrigger(); });
}

bool SessionOrchestrator::armContext() {
    gpointer sessionId = arena_.allocate(ArenaSlot::SessionId, sizeof(guint32));
    gpointer userCtx = arena_.allocate(ArenaSlot::UserContext, sizeof(SRUserContext));
    if (!sessionId || !userCtx) return false;
    return arena_.writeUserContext(userCtx, config_.sessionId, config_.sessionName);
}

void SessionOrchestrator::startTrigger() {
    if (state_ != SessionState::Idle) return;
    state_ = SessionState::Armed;

    if (!armContext()) {
        std::cerr << "[SR] cannot allocate user context, giving up\n";
        terminate(TerminalPath::SetupFailed);
        return;
    }

    // never ask for more look-back than the cache holds
    guint reported = pipeline_.cacheSeconds();
    int capacity = reported > 0 ? static_cast<int>(reported) : config_.cacheSec;
    effectivePreRollSec_ = std::min(config_.preRollSec, capacity);

    bool issued = pipeline_.startRecording(arena_.handle(ArenaSlot::SessionId),
                                           static_cast<guint>(effectivePreRollSec_),
                                           static_cast<guint>(config_.postRollSec),
                                           arena_.handle(ArenaSlot::UserContext));
    if (!issued) {
        std::cerr << "[SR] start error: start-sr not issued, continuing without recording\n";
        return;
    }
    state_ = SessionState::Capturing;
    std::cout << "[SR] start: back=" << effectivePreRollSec_ << "s front=" << config_.postRollSec
              << "s (sessionid OK, user_ctx OK)\n";
}

void SessionOrchestrator::stopTrigger() {
    if (state_ == SessionState::Terminated || completed_) return;

    if (pipeline_.stopRecording(0)) {
        std::cout << "[SR] stop requested\n";
    } else {
        std::cerr << "[SR] stop error: stop-sr not issued\n";
    }
    state_ = SessionState::StoppingOrCompleted;
    loop_.scheduleOnce(static_cast<guint>(config_.watchdogSec), [this] { watchdogExpired(); });
}

void SessionOrchestrator::watchdogExpired() {
    if (completed_ || state_ == SessionState::Terminated) return;
    std::cerr << "[SR] sr-done not received; exiting by timeout\n";
    terminate(TerminalPath::WatchdogExpired);
}

void SessionOrchestrator::interrupt() {
    std::cout << "[Main] interrupted\n";
    terminate(TerminalPath::Interrupted);
}

void SessionOrchestrator::onPipelineError(const std::string& /*source*/, const std::string& /*message*/,
                                          const std::string& /*debug*/) {
    terminate(TerminalPath::PipelineError);
}

void SessionOrchestrator::onEndOfStream() {
    terminate(TerminalPath::EndOfStream);
}

void SessionOrchestrator::onRecordingComplete(const CompletionRecord& record) {
    if (state_ == SessionState::Terminated) {
        std::cerr << "[SR] sr-done after shutdown ignored\n";
        return;
    }
    if (completed_) return;

    reporter_.report(record);
    completed_ = true;
    state_ = SessionState::StoppingOrCompleted;
    loop_.scheduleOnce(static_cast<guint>(config_.completionFlushSec),
                       [this] { terminate(TerminalPath::Completed); });
}

bool SessionOrchestrator::terminate(TerminalPath path) {
    if (state_ == SessionState::Terminated) return false;
    state_ = SessionState::Terminated;
    terminalPath_ = path;

    std::cout << "[Main] bye (" << terminalPathName(path) << ")\n";
    pipeline_.halt();
    arena_.releaseAll();
    loop_.quit();
    return true;
}
