#include "deepstream_pipeline.hpp"
#include "event_router.hpp"
#include "stream_negotiator.hpp"

// ===== DeepStream smart record (NvDsSRRecordingInfo) =====
#include <gst-nvdssr.h>

// ===== C++ STL =====
#include <exception>
#include <iostream>
#include <utility>

static constexpr int kSmartRecordCloudAndLocal = 2;

static bool hasProperty(GstElement* element, const char* name) {
    return g_object_class_find_property(G_OBJECT_GET_CLASS(element), name) != nullptr;
}

static guint signalParamCount(GstElement* element, const char* signal, bool& found) {
    guint id = element ? g_signal_lookup(signal, G_OBJECT_TYPE(element)) : 0;
    found = id != 0;
    if (!found) return 0;
    GSignalQuery query;
    g_signal_query(id, &query);
    return query.n_params;
}

// sr-done: runs on the smart-record worker once the file is closed. info and
// userContext are only valid for the duration of the call.
static void onRecordingDone(GstElement* /*source*/, NvDsSRRecordingInfo* info,
                            gpointer userContext, gpointer user_data) {
    auto* router = static_cast<EventRouter*>(user_data);
    CompletionRecord record;
    try {
        if (info) {
            if (info->dirpath) record.dirPath = info->dirpath;
            if (info->filename) record.fileName = info->filename;
            record.width = info->width;
            record.height = info->height;
            record.durationMs = info->duration;
        }
    } catch (const std::exception& e) {
        std::cerr << "[SR DONE] decode error: " << e.what() << "\n";
    }
    captureUserContext(record, userContext);
    router->postCompletion(std::move(record));
}

DeepStreamPipeline::~DeepStreamPipeline() {
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        gst_object_unref(pipeline_);
    }
}

bool DeepStreamPipeline::build(const RecordConfig& config, std::string& error) {
    pipeline_ = gst_pipeline_new("sr-test");
    if (!pipeline_) {
        error = "Failed to create pipeline";
        return false;
    }

    source_ = gst_element_factory_make("nvurisrcbin", "uri-decode-bin");
    mux_    = gst_element_factory_make("nvstreammux", "mux");
    conv_   = gst_element_factory_make("nvvideoconvert", "conv");
    sink_   = gst_element_factory_make("fakesink", "sink");

    if (!source_) {
        error = "Failed to create nvurisrcbin";
    } else if (!mux_ || !conv_ || !sink_) {
        error = "Missing pipeline elements";
    }
    if (!error.empty()) {
        // nothing is parented yet, drop the floating refs
        for (GstElement* e : {source_, mux_, conv_, sink_}) {
            if (e) gst_object_unref(gst_object_ref_sink(e));
        }
        source_ = mux_ = conv_ = sink_ = nullptr;
        return false;
    }

    // nvurisrcbin (Smart Record)
    g_object_set(source_,
                 "uri", config.uri.c_str(),
                 "file-loop", config.fileLoop ? TRUE : FALSE,
                 "smart-record", kSmartRecordCloudAndLocal,
                 "smart-rec-dir-path", config.recordDir.c_str(),
                 "smart-rec-cache", static_cast<guint>(config.cacheSec),
                 nullptr);
    if (!config.filePrefix.empty()) {
        if (hasProperty(source_, "smart-rec-file-prefix")) {
            g_object_set(source_, "smart-rec-file-prefix", config.filePrefix.c_str(), nullptr);
        } else {
            std::cerr << "[Main] nvurisrcbin has no smart-rec-file-prefix, using default names\n";
        }
    }

    // nvstreammux
    g_object_set(mux_,
                 "batch-size", 1u,
                 "live-source", config.liveSource ? TRUE : FALSE,
                 "width", static_cast<guint>(config.width),
                 "height", static_cast<guint>(config.height),
                 "batched-push-timeout", static_cast<gint>(config.pushTimeoutUs),
                 nullptr);

    gst_bin_add_many(GST_BIN(pipeline_), source_, mux_, conv_, sink_, nullptr);
    if (!gst_element_link_many(mux_, conv_, sink_, nullptr)) {
        error = "Link mux->conv->sink FAILED";
        return false;
    }
    return true;
}

void DeepStreamPipeline::connectOutputDiscovered(StreamNegotiator& negotiator) {
    g_signal_connect(source_, "pad-added", G_CALLBACK(&StreamNegotiator::padAddedCallback), &negotiator);
}

void DeepStreamPipeline::connectCompletion(EventRouter& router) {
    g_signal_connect(source_, "sr-done", G_CALLBACK(onRecordingDone), &router);
}

GstBus* DeepStreamPipeline::bus() const {
    return pipeline_ ? gst_element_get_bus(pipeline_) : nullptr;
}

bool DeepStreamPipeline::play() {
    if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
        std::cerr << "Failed to set pipeline to PLAYING\n";
        return false;
    }
    return true;
}

void DeepStreamPipeline::halt() {
    if (pipeline_ && gst_element_set_state(pipeline_, GST_STATE_NULL) == GST_STATE_CHANGE_FAILURE) {
        std::cerr << "[Main] failed to set pipeline to NULL\n";
    }
}

guint DeepStreamPipeline::cacheSeconds() const {
    guint cache = 0;
    if (source_) g_object_get(source_, "smart-rec-cache", &cache, nullptr);
    return cache;
}

bool DeepStreamPipeline::startRecording(gpointer sessionIdHandle, guint backSec, guint frontSec,
                                        gpointer userContextHandle) {
    bool found = false;
    signalParamCount(source_, "start-sr", found);
    if (!found) {
        std::cerr << "[SR] nvurisrcbin has no start-sr signal\n";
        return false;
    }
    g_signal_emit_by_name(source_, "start-sr", sessionIdHandle, backSec, frontSec, userContextHandle);
    return true;
}

bool DeepStreamPipeline::stopRecording(guint reason) {
    bool found = false;
    guint params = signalParamCount(source_, "stop-sr", found);
    if (!found) {
        std::cerr << "[SR] nvurisrcbin has no stop-sr signal\n";
        return false;
    }
    // older releases declare stop-sr without the session argument
    if (params == 0) {
        g_signal_emit_by_name(source_, "stop-sr");
    } else {
        g_signal_emit_by_name(source_, "stop-sr", reason);
    }
    return true;
}
