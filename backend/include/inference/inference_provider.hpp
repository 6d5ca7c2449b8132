#pragma once

#include "core/error.hpp"
#include "core/retry.hpp"
#include "net/http_client.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace candlecast::inference {

using FeatureVector = std::vector<double>;
using Prediction = std::vector<double>; // class probabilities

/**
 * @class InferenceProvider
 * @brief Scores feature vectors with one (model, version) pair.
 * predict() returns exactly one prediction per input row, in order.
 */
class InferenceProvider {
public:
    virtual ~InferenceProvider() = default;

    virtual core::Expected<bool> is_model_available(const std::string& model, const std::string& version) = 0;
    virtual core::Expected<std::vector<Prediction>> predict(const std::string& model, const std::string& version,
                                                            const std::vector<FeatureVector>& rows) = 0;
};

struct HttpInferenceOptions {
    std::string base_url = "http://localhost:8000";
    size_t chunk_size = 5000;
    std::chrono::seconds predict_timeout{300};
    std::chrono::seconds availability_timeout{10};
    core::RetryPolicy retry{};
    core::Sleeper sleeper = core::sleep_for_ms;
};

// Client of the model-serving endpoint (/predict, /is_model_available).
class HttpInferenceProvider final : public InferenceProvider {
public:
    explicit HttpInferenceProvider(HttpInferenceOptions options = {});

    core::Expected<bool> is_model_available(const std::string& model, const std::string& version) override;
    core::Expected<std::vector<Prediction>> predict(const std::string& model, const std::string& version,
                                                    const std::vector<FeatureVector>& rows) override;

    // Version query parameter is zero-based: "v1" -> 0.
    static core::Expected<int> version_index(const std::string& version);
    static core::Status parse_predictions(const std::string& body, size_t expected, std::vector<Prediction>* out);

private:
    HttpInferenceOptions options_;
    net::HttpClient http_;
};

} // namespace candlecast::inference
