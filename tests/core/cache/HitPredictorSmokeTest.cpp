#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include "core/cache/prediction/HitPredictor.hpp"

using namespace morph::core::cache::prediction;
using namespace std::chrono_literals;

namespace {

// Начало суток UTC, чтобы признак часа был стабилен
const HitPredictor::Clock::time_point kEpoch{std::chrono::hours(24 * 365 * 50)};

bool inUnitRange(double p) {
    return p >= 0.0 && p <= 1.0;
}

} // namespace

void smokeTestUntrained() {
    HitPredictor predictor;
    assert(!predictor.isTrained());
    assert(predictor.predict("any", kEpoch) == 0.5);

    PredictorConfig disabled;
    disabled.enabled = false;
    HitPredictor off(disabled);
    off.recordAccess("k", kEpoch, true);
    assert(off.sampleCount() == 0);
    assert(off.predict("k", kEpoch) == 0.5);
    assert(!off.train());
    std::cout << "[OK] HitPredictor untrained test\n";
}

void smokeTestFeatures() {
    HitPredictor predictor;
    predictor.recordAccess("k", kEpoch, true);
    predictor.recordAccess("k", kEpoch + 10s, true);
    predictor.recordAccess("k", kEpoch + 20s, true);

    auto f = predictor.extractFeatures("k", kEpoch + 20s);
    assert(f[0] >= 0.0 && f[0] < 1.0);
    assert(f[1] == 0.0);
    assert(f[2] == 3 / 100.0);
    assert(std::fabs(f[3] - 10000.0 / 3600000.0) < 1e-12);
    assert(f[4] == 3 / 10.0);

    // Окно в один час: остаётся только последнее обращение
    auto later = predictor.extractFeatures("k", kEpoch + 1h + 15s);
    assert(later[2] == 1 / 100.0);
    assert(later[3] == 0.0);

    auto unseen = predictor.extractFeatures("unseen", kEpoch);
    assert(unseen[2] == 0.0 && unseen[4] == 0.0);
    std::cout << "[OK] HitPredictor features test\n";
}

void smokeTestTraining() {
    HitPredictor predictor;
    auto now = kEpoch;
    for (int i = 0; i < 60; ++i) {
        now += 1s;
        predictor.recordAccess("hot", now, true);
        predictor.recordAccess("cold-" + std::to_string(i), now, false);
    }
    assert(predictor.sampleCount() == 120);
    assert(predictor.trackedKeys() == 61);

    assert(predictor.train());
    assert(predictor.isTrained());
    assert(predictor.trainingRuns() == 1);
    assert(predictor.trainingFailures() == 0);

    double hot = predictor.predict("hot", now);
    double cold = predictor.predict("cold-0", now);
    assert(inUnitRange(hot) && inUnitRange(cold));
    assert(hot > cold);

    predictor.forget("hot");
    assert(predictor.trackedKeys() == 60);

    predictor.clear();
    assert(!predictor.isTrained());
    assert(predictor.sampleCount() == 0);
    assert(predictor.predict("hot", now) == 0.5);
    std::cout << "[OK] HitPredictor training test\n";
}

void smokeTestIdleKeysPruned() {
    PredictorConfig config;
    config.predictionWindow = 1h;
    HitPredictor predictor(config);
    auto now = kEpoch;
    for (int i = 0; i < 5000; ++i) {
        predictor.recordAccess("miss-" + std::to_string(i), now, false);
    }
    predictor.recordAccess("recent", now + 5h, true);
    assert(predictor.trackedKeys() == 5001);

    // Внутри окна ничего не удаляется
    assert(predictor.prune(now + 30min) == 0);
    assert(predictor.trackedKeys() == 5001);

    assert(predictor.prune(now + 5h) == 5000);
    assert(predictor.trackedKeys() == 1);
    assert(predictor.extractFeatures("recent", now + 5h)[2] == 0.01);
    assert(predictor.prune(now + 7h) == 1);
    assert(predictor.trackedKeys() == 0);
    // Обучающие примеры не затрагиваются
    assert(predictor.sampleCount() == 5001);
    std::cout << "[OK] HitPredictor idle keys pruned test\n";
}

void smokeTestLimitsAndFailures() {
    PredictorConfig small;
    small.sampleCapacity = 10;
    small.minTrainingSamples = 20;
    HitPredictor predictor(small);
    for (int i = 0; i < 11; ++i) {
        predictor.recordAccess("k" + std::to_string(i), kEpoch + std::chrono::seconds(i), i % 2 == 0);
    }
    assert(predictor.sampleCount() == 5);
    assert(!predictor.train());
    assert(predictor.trainingFailures() == 0);

    PredictorConfig diverging;
    diverging.minTrainingSamples = 1;
    diverging.learningRate = std::numeric_limits<double>::infinity();
    HitPredictor broken(diverging);
    for (int i = 0; i < 5; ++i) {
        broken.recordAccess("k", kEpoch + std::chrono::seconds(i), true);
    }
    assert(!broken.train());
    assert(broken.trainingFailures() == 1);
    assert(!broken.isTrained());
    assert(broken.predict("k", kEpoch) == 0.5);

    PredictorConfig invalid;
    invalid.confidenceThreshold = 1.5;
    bool threw = false;
    try {
        HitPredictor rejected(invalid);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        predictor.setConfiguration(invalid);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(predictor.getConfiguration().sampleCapacity == 10);
    std::cout << "[OK] HitPredictor limits and failures test\n";
}

int main() {
    smokeTestUntrained();
    smokeTestFeatures();
    smokeTestTraining();
    smokeTestIdleKeysPruned();
    smokeTestLimitsAndFailures();
    std::cout << "All HitPredictor tests passed!\n";
    return 0;
}
