#pragma once

// STL
#include <string>

// GStreamer
#include <gst/gst.h>

#include "record_config.hpp"
#include "smart_record_pipeline.hpp"

class EventRouter;
class StreamNegotiator;

// nvurisrcbin (smart record) ~> queue -> nvstreammux -> nvvideoconvert -> fakesink
//
// The source pad appears at runtime; StreamNegotiator links it into the
// muxer once its caps are known.
class DeepStreamPipeline : public SmartRecordPipeline {
public:
    DeepStreamPipeline() = default;
    ~DeepStreamPipeline() override;

    DeepStreamPipeline(const DeepStreamPipeline&) = delete;
    DeepStreamPipeline& operator=(const DeepStreamPipeline&) = delete;

    // Creates, configures and statically links every element.
    // Any failure here is fatal; error describes it.
    bool build(const RecordConfig& config, std::string& error);

    void connectOutputDiscovered(StreamNegotiator& negotiator);
    void connectCompletion(EventRouter& router);

    GstElement* pipeline() const { return pipeline_; }
    GstElement* mux() const { return mux_; }
    GstBus* bus() const;    // caller unrefs

    bool play() override;
    void halt() override;
    guint cacheSeconds() const override;
    bool startRecording(gpointer sessionIdHandle, guint backSec, guint frontSec,
                        gpointer userContextHandle) override;
    bool stopRecording(guint reason) override;

private:
    GstElement* pipeline_ = nullptr;
    GstElement* source_ = nullptr;  // nvurisrcbin
    GstElement* mux_ = nullptr;     // nvstreammux
    GstElement* conv_ = nullptr;    // nvvideoconvert
    GstElement* sink_ = nullptr;    // fakesink
};
