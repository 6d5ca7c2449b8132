#include "inference/inference_provider.hpp"

#include "audit/logger.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace candlecast::inference {

HttpInferenceProvider::HttpInferenceProvider(HttpInferenceOptions options)
    : options_(std::move(options)) {
    if (options_.chunk_size == 0) options_.chunk_size = 5000;
    if (!options_.sleeper) options_.sleeper = core::sleep_for_ms;
}

core::Expected<int> HttpInferenceProvider::version_index(const std::string& version) {
    const int number = core::version_number(version);
    if (number < 1) {
        return core::make_error(core::ErrorCode::Invalid, "bad model version '" + version + "'");
    }
    return number - 1;
}

core::Status HttpInferenceProvider::parse_predictions(const std::string& body, size_t expected,
                                                      std::vector<Prediction>* out) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("predictions") || !doc["predictions"].is_array()) {
        return core::make_error(core::ErrorCode::Parse, "inference response has no predictions array");
    }
    const auto& predictions = doc["predictions"];
    if (predictions.size() != expected) {
        return core::make_error(core::ErrorCode::Proto, "inference returned " + std::to_string(predictions.size()) +
                                                            " predictions for " + std::to_string(expected) + " rows");
    }
    for (const auto& row : predictions) {
        Prediction prediction;
        if (row.is_number()) {
            prediction.push_back(row.get<double>());
        } else if (row.is_array()) {
            for (const auto& value : row) {
                if (!value.is_number()) {
                    return core::make_error(core::ErrorCode::Parse, "non-numeric prediction value");
                }
                prediction.push_back(value.get<double>());
            }
        } else {
            return core::make_error(core::ErrorCode::Parse, "prediction row is neither a number nor an array");
        }
        out->push_back(std::move(prediction));
    }
    return core::Status::ok();
}

core::Expected<bool> HttpInferenceProvider::is_model_available(const std::string& model, const std::string& version) {
    auto index = version_index(version);
    if (!index) return index.error_info();
    const nlohmann::json request{{"model_name", model}, {"version", index.value()}};
    auto response = core::retry_with_backoff(
        options_.retry,
        [&] { return http_.post_json(options_.base_url + "/is_model_available", request.dump(), options_.availability_timeout); },
        options_.sleeper);
    if (!response) return response.error_info();

    auto doc = nlohmann::json::parse(response.value().body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return core::make_error(core::ErrorCode::Parse, "availability response is not a JSON object");
    }
    auto it = doc.find("available");
    return it != doc.end() && it->is_boolean() && it->get<bool>();
}

core::Expected<std::vector<Prediction>> HttpInferenceProvider::predict(const std::string& model,
                                                                      const std::string& version,
                                                                      const std::vector<FeatureVector>& rows) {
    auto index = version_index(version);
    if (!index) return index.error_info();
    const std::string url = options_.base_url + "/predict?model_name=" + net::HttpClient::url_encode(model) +
                            "&version=" + std::to_string(index.value());

    std::vector<Prediction> predictions;
    predictions.reserve(rows.size());
    for (size_t offset = 0; offset < rows.size(); offset += options_.chunk_size) {
        const size_t end = std::min(rows.size(), offset + options_.chunk_size);
        nlohmann::json body = nlohmann::json::array();
        for (size_t i = offset; i < end; ++i) {
            body.push_back(rows[i]);
        }
        const std::string payload = body.dump();
        auto response = core::retry_with_backoff(
            options_.retry, [&] { return http_.post_json(url, payload, options_.predict_timeout); }, options_.sleeper);
        if (!response) {
            audit::log_error("Inference for " + model + " " + version + " failed on rows " + std::to_string(offset) +
                             "-" + std::to_string(end) + ": " + response.message());
            return response.error_info();
        }
        core::Status parsed = parse_predictions(response.value().body, end - offset, &predictions);
        if (!parsed) return parsed.error_info();
    }
    return predictions;
}

} // namespace candlecast::inference
