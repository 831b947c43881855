#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "frame_snapshot.hpp"
#include "frame_types.hpp"

namespace printmon {

class InferenceService {
public:
    virtual ~InferenceService() = default;

    // Throws InferenceError on timeout, transport failure or an unusable answer.
    virtual std::vector<Detection> detect(const Frame& frame) = 0;

    // Readiness probe, never throws.
    virtual bool healthy() = 0;
};

// Accepts {"detections": [...]} or a bare list. Entries are
// [label, confidence, [x, y, w, h]] or objects with label/confidence/box keys.
// Malformed entries are skipped; a malformed document throws InferenceError.
std::vector<Detection> parse_detections(const std::string& body);

nlohmann::json detections_to_json(const std::vector<Detection>& dets);

// Obico-style ML API: the service pulls the frame from `frame_url`, which this
// process serves out of the FrameSnapshot.
class HttpInferenceClient : public InferenceService {
public:
    HttpInferenceClient(std::string base_url,
                        std::string frame_url,
                        std::chrono::seconds timeout,
                        FrameSnapshot& snapshot);

    std::vector<Detection> detect(const Frame& frame) override;
    bool healthy() override;

private:
    std::string base_url_;
    std::string frame_url_;
    std::chrono::seconds timeout_;
    FrameSnapshot& snapshot_;
};

}  // namespace printmon
