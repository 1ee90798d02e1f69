#include "event_router.hpp"

// ===== C++ STL =====
#include <exception>
#include <iostream>
#include <utility>

EventRouter::~EventRouter() {
    detach();
}

bool EventRouter::attach(GstBus* bus) {
    if (bus_) detach();
    if (!bus) return false;
    if (!gst_bus_add_watch(bus, &EventRouter::busCallback, this)) {
        std::cerr << "[BUS] failed to add bus watch\n";
        return false;
    }
    bus_ = static_cast<GstBus*>(gst_object_ref(bus));
    return true;
}

void EventRouter::detach() {
    if (!bus_) return;
    if (!gst_bus_remove_watch(bus_)) std::cerr << "[BUS] no watch to remove\n";
    gst_object_unref(bus_);
    bus_ = nullptr;
}

bool EventRouter::dispatch(GstMessage* msg) {
    try {
        switch (GST_MESSAGE_TYPE(msg)) {
            case GST_MESSAGE_ERROR: {
                GError* err = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_error(msg, &err, &dbg);
                const gchar* name = GST_MESSAGE_SRC(msg) ? GST_OBJECT_NAME(GST_MESSAGE_SRC(msg)) : nullptr;
                std::string source = name ? name : "unknown";
                std::string message = err ? err->message : "unknown";
                std::string debug = dbg ? dbg : "";
                g_clear_error(&err);
                g_free(dbg);

                std::cerr << "[BUS] ERROR from " << source << ": " << message << "\n";
                if (!debug.empty()) std::cerr << "Debug: " << debug << "\n";
                events_.onPipelineError(source, message, debug);
                return true;
            }
            case GST_MESSAGE_WARNING: {
                GError* warn = nullptr;
                gchar* dbg = nullptr;
                gst_message_parse_warning(msg, &warn, &dbg);
                std::cerr << "[BUS] WARNING: " << (warn ? warn->message : "unknown") << "\n";
                if (dbg) { std::cerr << "Debug: " << dbg << "\n"; g_free(dbg); }
                g_clear_error(&warn);
                return false;
            }
            case GST_MESSAGE_EOS:
                std::cout << "[BUS] EOS\n";
                events_.onEndOfStream();
                return true;
            default:
                return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "[BUS] handler error: " << e.what() << "\n";
        return false;
    }
}

bool EventRouter::routeCompletion(const CompletionRecord& record) {
    try {
        events_.onRecordingComplete(record);
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[SR DONE] error: " << e.what() << "\n";
        return false;
    }
}

void EventRouter::postCompletion(CompletionRecord record) {
    loop_.post([this, record = std::move(record)] { routeCompletion(record); });
}

gboolean EventRouter::busCallback(GstBus* /*bus*/, GstMessage* msg, gpointer user_data) {
    static_cast<EventRouter*>(user_data)->dispatch(msg);
    return TRUE;  // keep the watch
}
