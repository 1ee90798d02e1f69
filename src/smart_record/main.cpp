// ===== GStreamer / Glib =====
#include <gst/gst.h>
#include <glib-unix.h>      // g_unix_signal_add

// ===== C++ STL =====
#include <csignal>
#include <iostream>
#include <string>

#include "completion_reporter.hpp"
#include "deepstream_pipeline.hpp"
#include "event_router.hpp"
#include "native_context_arena.hpp"
#include "record_config.hpp"
#include "run_loop.hpp"
#include "session_orchestrator.hpp"
#include "stream_negotiator.hpp"

namespace {

// Brings the pipeline to NULL before the objects its callbacks point at go away.
struct PipelineHalt {
    DeepStreamPipeline& pipeline;
    ~PipelineHalt() { pipeline.halt(); }
};

gboolean onUnixSignal(gpointer user_data) {
    static_cast<SessionOrchestrator*>(user_data)->interrupt();
    return G_SOURCE_CONTINUE;
}

int exitStatus(TerminalPath path) {
    switch (path) {
        case TerminalPath::PipelineError:
        case TerminalPath::SetupFailed:
            return 1;
        case TerminalPath::Interrupted:
            return 130;
        default:
            return 0;
    }
}

int runSession(const RecordConfig& config, DeepStreamPipeline& pipeline) {
    StreamGeometry fallback;
    fallback.width = config.width;
    fallback.height = config.height;
    StreamMuxStage stage(pipeline.pipeline(), pipeline.mux());
    StreamNegotiator negotiator(stage, fallback);
    pipeline.connectOutputDiscovered(negotiator);

    NativeContextArena arena;
    GMainRunLoop loop;
    CompletionReporter reporter;
    SessionOrchestrator session(config, pipeline, arena, loop, reporter);
    EventRouter router(session, loop);
    pipeline.connectCompletion(router);
    PipelineHalt halt{pipeline};

    GstBus* bus = pipeline.bus();
    bool watching = router.attach(bus);
    if (bus) gst_object_unref(bus);
    if (!watching) {
        std::cerr << "Failed to watch pipeline bus\n";
        return 1;
    }

    if (!pipeline.play()) return 1;

    guint sigint = g_unix_signal_add(SIGINT, onUnixSignal, &session);
    guint sigterm = g_unix_signal_add(SIGTERM, onUnixSignal, &session);

    session.begin();
    loop.run();

    g_source_remove(sigint);
    g_source_remove(sigterm);
    router.detach();

    std::cout << "[Main] session ended: " << terminalPathName(session.terminalPath())
              << " (allocated " << arena.allocateCount() << ", released "
              << arena.releaseCount() << ")\n";
    return exitStatus(session.terminalPath());
}

}  // namespace

int main(int argc, char* argv[])
{
    // strips --gst-* options before our own parsing
    gst_init(&argc, &argv);

    RecordConfig config = defaultRecordConfig();
    std::string error;
    if (!parseRecordConfig(argc, argv, config, error)) {
        std::cerr << "[Config] " << error << "\n";
        return 1;
    }
    error = config.validate();
    if (!error.empty()) {
        std::cerr << "[Config] " << error << "\n";
        return 1;
    }
    if (!ensureRecordDir(config, error)) {
        std::cerr << "[Config] " << error << "\n";
        return 1;
    }

    std::cout << "[Main] running... uri=" << config.uri << " dir=" << config.recordDir << "\n";

    DeepStreamPipeline pipeline;
    if (!pipeline.build(config, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    return runSession(config, pipeline);
}
