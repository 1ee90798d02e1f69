#pragma once

// STL
#include <string>

// Quick config for one smart-record run. Defaults match the demo setup,
// every field can be overridden from the command line.
struct RecordConfig {
    std::string uri = "rtsp://127.0.0.1:8554/stream";  // source locator
    std::string recordDir;                             // filled by defaultRecordConfig()
    std::string filePrefix = "test_";                  // empty = leave element default

    int preRollSec      = 3;    // look-back (<= cacheSec)
    int postRollSec     = 5;    // after the trigger
    int postRollLimitSec = 300; // upper bound accepted for postRollSec
    int cacheSec        = 30;   // ring buffer size
    int startDelaySec   = 5;    // delay before start trigger
    int watchdogSec     = 6;    // fallback after stop trigger
    int completionFlushSec = 1; // delay between sr-done and quit

    int width  = 1920;          // default mux geometry
    int height = 1080;
    int pushTimeoutUs = 40000;  // nvstreammux batched-push-timeout
    bool liveSource = false;
    bool fileLoop   = true;

    int sessionId = 1234;
    std::string sessionName = "sr-demo";

    // Seconds from process start when the stop trigger fires.
    int stopDelaySec() const { return startDelaySec + postRollSec + 1; }

    // Empty string when valid, otherwise the first problem found.
    std::string validate() const;
};

RecordConfig defaultRecordConfig();

// Parses GLib-style options into config. Returns false and fills error on
// unknown options or malformed values. argv is not modified.
bool parseRecordConfig(int argc, char** argv, RecordConfig& config, std::string& error);

// mkdir -p on config.recordDir.
bool ensureRecordDir(const RecordConfig& config, std::string& error);
