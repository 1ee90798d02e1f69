#include "record_config.hpp"
#include "native_context_arena.hpp"

// ===== Glib (GOptionContext, g_mkdir_with_parents) =====
#include <glib.h>

// ===== C++ STL =====
#include <cerrno>
#include <cstring>
#include <vector>

RecordConfig defaultRecordConfig() {
    RecordConfig config;
    gchar* dir = g_build_filename(g_get_home_dir(), "Desktop", "SmartRecTest", nullptr);
    config.recordDir = dir;
    g_free(dir);
    return config;
}

std::string RecordConfig::validate() const {
    if (uri.empty()) return "uri is empty";
    if (recordDir.empty()) return "record dir is empty";
    if (preRollSec < 0) return "pre-roll must be >= 0";
    if (postRollSec < 0) return "post-roll must be >= 0";
    if (postRollLimitSec < 0) return "post-roll limit must be >= 0";
    if (postRollSec > postRollLimitSec) {
        return "post-roll " + std::to_string(postRollSec) +
               "s exceeds limit " + std::to_string(postRollLimitSec) + "s";
    }
    if (cacheSec <= 0) return "cache must be > 0";
    if (startDelaySec < 0) return "start delay must be >= 0";
    if (watchdogSec <= 0) return "watchdog must be > 0";
    if (completionFlushSec < 0) return "completion flush delay must be >= 0";
    if (width <= 0 || height <= 0) return "width/height must be > 0";
    if (pushTimeoutUs < 0) return "push timeout must be >= 0";
    if (sessionName.size() >= kUserContextNameSize) {
        return "session name longer than " + std::to_string(kUserContextNameSize - 1) + " bytes";
    }
    return {};
}

static void takeString(gchar* value, std::string& out) {
    if (!value) return;
    out = value;
    g_free(value);
}

bool parseRecordConfig(int argc, char** argv, RecordConfig& config, std::string& error) {
    gchar* uri = nullptr;
    gchar* recordDir = nullptr;
    gchar* prefix = nullptr;
    gchar* sessionName = nullptr;
    gboolean liveSource = config.liveSource ? TRUE : FALSE;
    gboolean fileLoop = config.fileLoop ? TRUE : FALSE;

    GOptionEntry entries[] = {
        {"uri", 0, 0, G_OPTION_ARG_STRING, &uri, "Source URI", "URI"},
        {"record-dir", 0, 0, G_OPTION_ARG_FILENAME, &recordDir, "Smart record output directory", "DIR"},
        {"prefix", 0, 0, G_OPTION_ARG_STRING, &prefix, "Recording filename prefix", "PREFIX"},
        {"pre-roll", 0, 0, G_OPTION_ARG_INT, &config.preRollSec, "Seconds before the trigger", "SEC"},
        {"post-roll", 0, 0, G_OPTION_ARG_INT, &config.postRollSec, "Seconds after the trigger", "SEC"},
        {"post-roll-limit", 0, 0, G_OPTION_ARG_INT, &config.postRollLimitSec, "Largest accepted post-roll", "SEC"},
        {"cache", 0, 0, G_OPTION_ARG_INT, &config.cacheSec, "Look-back cache size", "SEC"},
        {"start-delay", 0, 0, G_OPTION_ARG_INT, &config.startDelaySec, "Delay before start trigger", "SEC"},
        {"watchdog", 0, 0, G_OPTION_ARG_INT, &config.watchdogSec, "Fallback after stop trigger", "SEC"},
        {"width", 0, 0, G_OPTION_ARG_INT, &config.width, "Default muxer width", "PX"},
        {"height", 0, 0, G_OPTION_ARG_INT, &config.height, "Default muxer height", "PX"},
        {"push-timeout", 0, 0, G_OPTION_ARG_INT, &config.pushTimeoutUs, "Muxer batched push timeout", "USEC"},
        {"live-source", 0, 0, G_OPTION_ARG_NONE, &liveSource, "Mark the source as live", nullptr},
        {"no-file-loop", 0, G_OPTION_FLAG_REVERSE, G_OPTION_ARG_NONE, &fileLoop, "Do not loop file sources", nullptr},
        {"session-id", 0, 0, G_OPTION_ARG_INT, &config.sessionId, "User context session id", "ID"},
        {"session-name", 0, 0, G_OPTION_ARG_STRING, &sessionName, "User context name", "NAME"},
        {nullptr, 0, 0, G_OPTION_ARG_NONE, nullptr, nullptr, nullptr}};

    // g_option_context_parse() shuffles argv, work on a private copy
    std::vector<gchar*> owned;
    for (int i = 0; i < argc; ++i) owned.push_back(g_strdup(argv[i]));
    std::vector<gchar*> args(owned);
    args.push_back(nullptr);
    gint argCount = argc;
    gchar** argPtr = args.data();

    GOptionContext* ctx = g_option_context_new("- triggered smart recording");
    g_option_context_add_main_entries(ctx, entries, nullptr);

    GError* err = nullptr;
    bool ok = g_option_context_parse(ctx, &argCount, &argPtr, &err);
    if (!ok) {
        error = err ? err->message : "option parsing failed";
    } else if (argCount > 1) {
        ok = false;
        error = std::string("unexpected argument '") + argPtr[1] + "'";
    }
    g_clear_error(&err);
    g_option_context_free(ctx);
    for (gchar* s : owned) g_free(s);

    takeString(uri, config.uri);
    takeString(recordDir, config.recordDir);
    takeString(prefix, config.filePrefix);
    takeString(sessionName, config.sessionName);
    config.liveSource = liveSource;
    config.fileLoop = fileLoop;
    return ok;
}

bool ensureRecordDir(const RecordConfig& config, std::string& error) {
    if (g_mkdir_with_parents(config.recordDir.c_str(), 0755) != 0) {
        error = "cannot create " + config.recordDir + ": " + std::strerror(errno);
        return false;
    }
    return true;
}
