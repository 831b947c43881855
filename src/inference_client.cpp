#include "printmon/inference_client.hpp"

#include <algorithm>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "printmon/errors.hpp"

namespace printmon {

using nlohmann::json;

namespace {

const json* find_key(const json& obj, std::initializer_list<const char*> keys) {
    for (const char* k : keys) {
        auto it = obj.find(k);
        if (it != obj.end()) return &*it;
    }
    return nullptr;
}

std::optional<cv::Rect> parse_box(const json* box) {
    if (!box || !box->is_array() || box->size() != 4) return std::nullopt;
    for (const auto& v : *box) {
        if (!v.is_number()) return std::nullopt;
    }
    return cv::Rect(static_cast<int>((*box)[0].get<double>()),
                    static_cast<int>((*box)[1].get<double>()),
                    static_cast<int>((*box)[2].get<double>()),
                    static_cast<int>((*box)[3].get<double>()));
}

std::string label_of(const json* v) {
    if (!v) return {};
    return v->is_string() ? v->get<std::string>() : v->dump();
}

}  // namespace

std::vector<Detection> parse_detections(const std::string& body) {
    json doc;
    try {
        doc = json::parse(body);
    } catch (const json::parse_error& e) {
        throw InferenceError(std::string("malformed inference response: ") + e.what());
    }

    const json* list = nullptr;
    if (doc.is_array()) {
        list = &doc;
    } else if (doc.is_object()) {
        list = find_key(doc, {"detections"});
        if (!list) throw InferenceError("inference response has no 'detections' field");
        if (list->is_null()) return {};
    }
    if (!list || !list->is_array()) throw InferenceError("inference detections are not a list");

    std::vector<Detection> out;
    for (const auto& entry : *list) {
        const json* label = nullptr;
        const json* conf = nullptr;
        const json* box = nullptr;

        if (entry.is_array()) {
            // [label, confidence, [x, y, w, h]]
            if (entry.size() >= 1) label = &entry[0];
            if (entry.size() >= 2) conf = &entry[1];
            if (entry.size() >= 3) box = &entry[2];
        } else if (entry.is_object()) {
            label = find_key(entry, {"label", "name", "class"});
            conf = find_key(entry, {"confidence", "conf", "score"});
            box = find_key(entry, {"box", "bbox", "bounding_box"});
        }

        if (!conf || !conf->is_number()) {
            spdlog::warn("[inference] skipping detection without numeric confidence: {}", entry.dump());
            continue;
        }

        Detection d;
        d.label = label_of(label);
        d.confidence = std::clamp(conf->get<float>(), 0.0f, 1.0f);
        d.bbox = parse_box(box);
        out.push_back(std::move(d));
    }
    return out;
}

json detections_to_json(const std::vector<Detection>& dets) {
    json arr = json::array();
    for (const auto& d : dets) {
        json box = nullptr;
        if (d.bbox) box = json::array({d.bbox->x, d.bbox->y, d.bbox->width, d.bbox->height});
        arr.push_back(json::array({d.label, d.confidence, box}));
    }
    return arr;
}

HttpInferenceClient::HttpInferenceClient(std::string base_url,
                                         std::string frame_url,
                                         std::chrono::seconds timeout,
                                         FrameSnapshot& snapshot)
    : base_url_(std::move(base_url)),
      frame_url_(std::move(frame_url)),
      timeout_(timeout),
      snapshot_(snapshot) {}

std::vector<Detection> HttpInferenceClient::detect(const Frame& frame) {
    snapshot_.publish(frame);

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(timeout_);
    cli.set_read_timeout(timeout_);

    auto res = cli.Get("/p/", httplib::Params{{"img", frame_url_}}, httplib::Headers{});
    if (!res) {
        throw InferenceError("ML API request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw InferenceError("ML API returned " + std::to_string(res->status) + " - " + res->body);
    }
    spdlog::debug("[inference] raw response: {}", res->body);
    return parse_detections(res->body);
}

bool HttpInferenceClient::healthy() {
    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::seconds(5));
    cli.set_read_timeout(std::chrono::seconds(5));

    auto res = cli.Get("/hc/");
    if (!res) {
        spdlog::debug("[inference] health check error: {}", httplib::to_string(res.error()));
        return false;
    }
    const bool ok = res->status == 200 && res->body == "ok";
    if (!ok) spdlog::warn("[inference] health check failed: {} - {}", res->status, res->body);
    return ok;
}

}  // namespace printmon
