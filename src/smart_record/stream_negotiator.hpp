#pragma once

// GStreamer
#include <gst/gst.h>        // GstPad, GstCaps, GstElement

struct StreamGeometry {
    gint width = 0;
    gint height = 0;

    bool operator==(const StreamGeometry& o) const { return width == o.width && height == o.height; }
    bool operator!=(const StreamGeometry& o) const { return !(*this == o); }
};

// Input side of the muxer that combines negotiated streams.
class AggregationStage {
public:
    virtual ~AggregationStage() = default;

    // Adopt the geometry of the stream about to be linked.
    virtual bool configure(const StreamGeometry& geometry) = 0;
    // Link srcPad into the next free input slot.
    virtual bool linkInput(GstPad* srcPad) = 0;
    virtual StreamGeometry geometry() const = 0;
};

// queue -> nvstreammux.sink_<n>, one queue per linked input.
class StreamMuxStage : public AggregationStage {
public:
    StreamMuxStage(GstElement* pipeline, GstElement* mux)
        : pipeline_(pipeline), mux_(mux) {}

    bool configure(const StreamGeometry& geometry) override;
    bool linkInput(GstPad* srcPad) override;
    StreamGeometry geometry() const override;

private:
    GstElement* pipeline_;  // not owned
    GstElement* mux_;       // not owned, lives in pipeline_
    guint nextSlot_ = 0;
};

enum class NegotiationState { Unbound, Negotiating, Bound };

const char* negotiationStateName(NegotiationState state);

// Reacts to pad-added: reads caps, reconfigures the stage, links.
class StreamNegotiator {
public:
    StreamNegotiator(AggregationStage& stage, const StreamGeometry& fallback)
        : stage_(stage), fallback_(fallback) {}

    // Entry point from pad-added. Queries caps on the pad itself.
    void onOutputDiscovered(GstPad* pad);

    // Same as onOutputDiscovered() with caps already in hand (may be null).
    bool negotiate(GstPad* pad, const GstCaps* caps);

    // Geometry from the first caps structure, per-field fallback.
    StreamGeometry geometryFromCaps(const GstCaps* caps) const;

    NegotiationState state() const { return state_; }
    StreamGeometry lastGeometry() const { return last_; }

    // pad-added trampoline, user_data is the StreamNegotiator.
    static void padAddedCallback(GstElement* element, GstPad* pad, gpointer user_data);

private:
    AggregationStage& stage_;
    StreamGeometry fallback_;
    StreamGeometry last_;
    NegotiationState state_ = NegotiationState::Unbound;
};
