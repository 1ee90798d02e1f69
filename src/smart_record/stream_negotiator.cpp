#include "stream_negotiator.hpp"

// ===== C++ STL =====
#include <exception>
#include <iostream>
#include <string>

static std::string capsToString(const GstCaps* caps) {
    if (!caps) return "<no caps>";
    gchar* s = gst_caps_to_string(caps);
    std::string out = s ? s : "<caps_to_string failed>";
    g_free(s);
    return out;
}

static bool hasProperty(GstElement* element, const char* name) {
    return g_object_class_find_property(G_OBJECT_GET_CLASS(element), name) != nullptr;
}

const char* negotiationStateName(NegotiationState state) {
    switch (state) {
        case NegotiationState::Unbound:     return "Unbound";
        case NegotiationState::Negotiating: return "Negotiating";
        case NegotiationState::Bound:       return "Bound";
    }
    return "Unknown";
}

// ===== StreamMuxStage =====

bool StreamMuxStage::configure(const StreamGeometry& geometry) {
    if (!mux_ || !hasProperty(mux_, "width") || !hasProperty(mux_, "height")) {
        std::cerr << "[Negotiator] muxer has no width/height properties\n";
        return false;
    }
    g_object_set(mux_,
                 "width", static_cast<guint>(geometry.width),
                 "height", static_cast<guint>(geometry.height),
                 nullptr);
    return true;
}

StreamGeometry StreamMuxStage::geometry() const {
    guint w = 0, h = 0;
    if (mux_) g_object_get(mux_, "width", &w, "height", &h, nullptr);
    StreamGeometry g;
    g.width = static_cast<gint>(w);
    g.height = static_cast<gint>(h);
    return g;
}

bool StreamMuxStage::linkInput(GstPad* srcPad) {
    gchar* queueName = g_strdup_printf("q_src_%u", nextSlot_);
    gchar* padName = g_strdup_printf("sink_%u", nextSlot_);
    GstElement* queue = gst_element_factory_make("queue", queueName);
    g_free(queueName);
    if (!queue) {
        std::cerr << "[Negotiator] failed to create queue for " << padName << "\n";
        g_free(padName);
        return false;
    }
    gst_bin_add(GST_BIN(pipeline_), queue);

    GstPad* muxSink = gst_element_request_pad_simple(mux_, padName);
    GstPad* queueSink = gst_element_get_static_pad(queue, "sink");
    GstPad* queueSrc = gst_element_get_static_pad(queue, "src");

    bool ok = true;
    if (!muxSink) {
        std::cerr << "[Negotiator] no " << padName << " pad on nvstreammux\n";
        ok = false;
    } else if (gst_pad_link(srcPad, queueSink) != GST_PAD_LINK_OK) {
        std::cerr << "[Negotiator] link source -> " << GST_ELEMENT_NAME(queue) << " FAILED\n";
        ok = false;
    } else if (gst_pad_link(queueSrc, muxSink) != GST_PAD_LINK_OK) {
        std::cerr << "[Negotiator] link " << GST_ELEMENT_NAME(queue) << " -> mux." << padName << " FAILED\n";
        gst_pad_unlink(srcPad, queueSink);
        ok = false;
    }

    if (ok) {
        gst_element_sync_state_with_parent(queue);
        ++nextSlot_;
    } else {
        if (muxSink) gst_element_release_request_pad(mux_, muxSink);
        gst_element_set_state(queue, GST_STATE_NULL);
        gst_bin_remove(GST_BIN(pipeline_), queue);  // drops the bin's ref
    }

    if (muxSink) gst_object_unref(muxSink);
    gst_object_unref(queueSink);
    gst_object_unref(queueSrc);
    g_free(padName);
    return ok;
}

// ===== StreamNegotiator =====

StreamGeometry StreamNegotiator::geometryFromCaps(const GstCaps* caps) const {
    StreamGeometry g = fallback_;
    if (!caps || gst_caps_is_any(caps) || gst_caps_is_empty(caps)) return g;

    const GstStructure* st = gst_caps_get_structure(caps, 0);
    gint value = 0;
    // ranges and other non-fixed values fail get_int and keep the default
    if (gst_structure_get_int(st, "width", &value) && value > 0) g.width = value;
    if (gst_structure_get_int(st, "height", &value) && value > 0) g.height = value;
    return g;
}

bool StreamNegotiator::negotiate(GstPad* pad, const GstCaps* caps) {
    state_ = NegotiationState::Negotiating;

    StreamGeometry g = geometryFromCaps(caps);
    std::cout << "[Negotiator] caps " << capsToString(caps)
              << " -> mux " << g.width << "x" << g.height << "\n";

    if (!stage_.configure(g)) {
        std::cerr << "[Negotiator] configure " << g.width << "x" << g.height << " FAILED\n";
        return false;
    }
    last_ = g;

    if (!stage_.linkInput(pad)) {
        std::cerr << "[Negotiator] link into aggregation stage FAILED\n";
        return false;
    }

    state_ = NegotiationState::Bound;
    return true;
}

void StreamNegotiator::onOutputDiscovered(GstPad* pad) {
    GstCaps* caps = gst_pad_get_current_caps(pad);
    if (!caps) caps = gst_pad_query_caps(pad, nullptr);

    negotiate(pad, caps);

    if (caps) gst_caps_unref(caps);
}

void StreamNegotiator::padAddedCallback(GstElement* /*element*/, GstPad* pad, gpointer user_data) {
    auto* self = static_cast<StreamNegotiator*>(user_data);
    try {
        self->onOutputDiscovered(pad);
    } catch (const std::exception& e) {
        std::cerr << "[Negotiator] pad-added error: " << e.what() << "\n";
    }
}
