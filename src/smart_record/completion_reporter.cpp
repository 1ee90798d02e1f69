#include "completion_reporter.hpp"

// ===== C++ STL =====
#include <cstring>

static const char* const kUnknown = "(unknown)";

// Names come from a fixed native field, repair anything that is not UTF-8.
static std::string printableName(const std::string& raw) {
    if (g_utf8_validate(raw.data(), static_cast<gssize>(raw.size()), nullptr)) return raw;
    gchar* fixed = g_utf8_make_valid(raw.data(), static_cast<gssize>(raw.size()));
    std::string out = fixed;
    g_free(fixed);
    return out;
}

bool captureUserContext(CompletionRecord& record, gconstpointer handle) {
    record.hasUserContext = handle != nullptr;
    if (record.hasUserContext) {
        std::memcpy(&record.userContext, handle, sizeof(SRUserContext));
    } else {
        std::memset(&record.userContext, 0, sizeof(SRUserContext));
    }
    return record.hasUserContext;
}

CompletionSummary CompletionReporter::report(const CompletionRecord& record) const {
    CompletionSummary summary;
    summary.dirPath = record.dirPath.empty() ? kUnknown : record.dirPath;
    summary.fileName = record.fileName.empty() ? kUnknown : record.fileName;
    summary.width = record.width;
    summary.height = record.height;

    UserContext user;
    if (record.hasUserContext && decodeUserContext(&record.userContext, user)) {
        summary.hasUserContext = true;
        summary.user.sessionId = user.sessionId;
        summary.user.name = printableName(user.name);
    }

    out_ << "====== SR DONE ======\n";
    out_ << "dir:  " << summary.dirPath << "\n";
    out_ << "file: " << summary.fileName << "\n";
    out_ << "size: " << summary.width << "x" << summary.height << "\n";
    if (record.durationMs > 0) {
        out_ << "duration: " << record.durationMs << " ms\n";
    }
    if (summary.hasUserContext) {
        out_ << "user.sessionid=" << summary.user.sessionId
             << "  user.name='" << summary.user.name << "'\n";
    } else {
        out_ << "user: (unavailable)\n";
    }
    out_.flush();
    return summary;
}
