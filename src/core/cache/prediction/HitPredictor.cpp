#include "core/cache/prediction/HitPredictor.hpp"
#include <algorithm>
#include <cmath>
#include <ctime>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include "core/logging/LoggerFactory.hpp"

namespace morph {
namespace core {
namespace cache {
namespace prediction {

namespace {

constexpr double kMillisecondsPerHour = 3600000.0;

struct Sample {
    HitPredictor::Features features;
    bool hit;
};

uint32_t hashKey(const std::string& key) {
    uint32_t hash = 0;
    for (unsigned char c : key) {
        hash = hash * 31 + c;
    }
    return hash;
}

double sigmoid(double z) {
    z = std::clamp(z, -50.0, 50.0);
    return 1.0 / (1.0 + std::exp(-z));
}

int utcHour(HitPredictor::Clock::time_point now) {
    std::time_t t = HitPredictor::Clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm.tm_hour;
}

} // namespace

// Реализация PIMPL
struct HitPredictor::Impl {
    PredictorConfig config;
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::deque<Clock::time_point>> history; // Окна обращений
    std::deque<Sample> samples;         // Буфер обучающих примеров
    Features weights{};                 // Веса модели
    double bias = 0.0;
    bool trained = false;
    size_t failures = 0;
    size_t runs = 0;
    std::shared_ptr<spdlog::logger> logger;

    explicit Impl(const PredictorConfig& cfg)
        : config(cfg)
        , logger(logging::LoggerFactory::get("kvcache")) {
    }

    Features features(const std::string& key, Clock::time_point now) const {
        const std::deque<Clock::time_point>* window = nullptr;
        auto it = history.find(key);
        if (it != history.end()) {
            window = &it->second;
        }

        double count = 0.0;
        double avgIntervalMs = 0.0;
        if (window) {
            auto cutoff = now - config.predictionWindow;
            std::vector<Clock::time_point> recent;
            for (const auto& t : *window) {
                if (t > cutoff) {
                    recent.push_back(t);
                }
            }
            count = static_cast<double>(recent.size());
            if (recent.size() > 1) {
                auto span = std::chrono::duration_cast<std::chrono::milliseconds>(recent.back() - recent.front());
                avgIntervalMs = static_cast<double>(span.count()) / (recent.size() - 1);
            }
        }

        return {
            (hashKey(key) % 1000) / 1000.0,
            utcHour(now) / 24.0,
            count / 100.0,
            avgIntervalMs / kMillisecondsPerHour,
            std::min(count / 10.0, 1.0)
        };
    }

    void trimSamples() {
        if (samples.size() > config.sampleCapacity) {
            // Отбрасываем старшую половину буфера
            size_t keep = config.sampleCapacity / 2;
            samples.erase(samples.begin(), samples.end() - keep);
        }
    }
};

HitPredictor::HitPredictor(const PredictorConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid predictor configuration");
    }
}

HitPredictor::~HitPredictor() = default;

void HitPredictor::recordAccess(const std::string& key, Clock::time_point now, bool hit) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->config.enabled) {
        return;
    }

    auto& window = pImpl->history[key];
    window.push_back(now);
    auto cutoff = now - pImpl->config.predictionWindow;
    while (!window.empty() && window.front() <= cutoff) {
        window.pop_front();
    }

    pImpl->samples.push_back({pImpl->features(key, now), hit});
    pImpl->trimSamples();
}

double HitPredictor::predict(const std::string& key, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (!pImpl->config.enabled || !pImpl->trained) {
        return 0.5;
    }

    Features x = pImpl->features(key, now);
    double z = pImpl->bias;
    for (size_t i = 0; i < kFeatureCount; ++i) {
        z += pImpl->weights[i] * x[i];
    }
    return sigmoid(z);
}

bool HitPredictor::train() {
    std::vector<Sample> batch;
    Features weights;
    double bias;
    PredictorConfig config;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        config = pImpl->config;
        if (!config.enabled || pImpl->samples.size() < config.minTrainingSamples) {
            return false;
        }
        size_t count = std::min(config.trainingBatch, pImpl->samples.size());
        batch.assign(pImpl->samples.end() - count, pImpl->samples.end());
        weights = pImpl->weights;
        bias = pImpl->bias;
    }

    try {
        for (size_t epoch = 0; epoch < config.epochs; ++epoch) {
            for (const auto& sample : batch) {
                double z = bias;
                for (size_t i = 0; i < kFeatureCount; ++i) {
                    z += weights[i] * sample.features[i];
                }
                double error = (sample.hit ? 1.0 : 0.0) - sigmoid(z);
                for (size_t i = 0; i < kFeatureCount; ++i) {
                    weights[i] += config.learningRate * error * sample.features[i];
                }
                bias += config.learningRate * error;
            }
        }

        bool finite = std::isfinite(bias) &&
            std::all_of(weights.begin(), weights.end(), [](double w) { return std::isfinite(w); });
        if (!finite) {
            throw std::runtime_error("non-finite model weights");
        }
    } catch (const std::exception& e) {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        ++pImpl->failures;
        pImpl->logger->warn("Hit predictor training failed, keeping previous weights: {}", e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->weights = weights;
    pImpl->bias = bias;
    pImpl->trained = true;
    ++pImpl->runs;
    pImpl->logger->debug("Hit predictor trained on {} samples (run {})", batch.size(), pImpl->runs);
    return true;
}

void HitPredictor::forget(const std::string& key) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->history.erase(key);
}

size_t HitPredictor::prune(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto cutoff = now - pImpl->config.predictionWindow;
    size_t removed = 0;
    for (auto it = pImpl->history.begin(); it != pImpl->history.end();) {
        if (it->second.empty() || it->second.back() <= cutoff) {
            it = pImpl->history.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    if (removed > 0) {
        pImpl->logger->debug("Hit predictor pruned {} idle keys", removed);
    }
    return removed;
}

void HitPredictor::clear() {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->history.clear();
    pImpl->samples.clear();
    pImpl->weights = Features{};
    pImpl->bias = 0.0;
    pImpl->trained = false;
}

void HitPredictor::setConfiguration(const PredictorConfig& config) {
    if (!config.validate()) {
        throw std::invalid_argument("Invalid predictor configuration");
    }
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->config = config;
    pImpl->trimSamples();
}

PredictorConfig HitPredictor::getConfiguration() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->config;
}

bool HitPredictor::isTrained() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->trained;
}

size_t HitPredictor::sampleCount() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->samples.size();
}

size_t HitPredictor::trackedKeys() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->history.size();
}

size_t HitPredictor::trainingFailures() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->failures;
}

size_t HitPredictor::trainingRuns() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->runs;
}

HitPredictor::Features HitPredictor::extractFeatures(const std::string& key, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->features(key, now);
}

} // namespace prediction
} // namespace cache
} // namespace core
} // namespace morph
