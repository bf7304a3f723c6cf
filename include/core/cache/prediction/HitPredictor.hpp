#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace morph {
namespace core {
namespace cache {
namespace prediction {

/**
 * @brief Конфигурация предсказателя попаданий
 */
struct PredictorConfig {
    bool enabled = true;                                        ///< Предсказание включено
    std::chrono::milliseconds predictionWindow{3600000};        ///< Окно истории обращений
    double confidenceThreshold = 0.7;                           ///< Порог "уверенного" предсказания
    size_t sampleCapacity = 10000;                              ///< Максимум обучающих примеров
    size_t trainingBatch = 1000;                                ///< Примеров за одно обучение
    size_t minTrainingSamples = 50;                             ///< Минимум примеров для обучения
    size_t epochs = 20;                                         ///< Проходов по батчу
    double learningRate = 0.05;                                 ///< Шаг градиента

    bool validate() const {
        return predictionWindow.count() > 0 &&
               confidenceThreshold >= 0.0 && confidenceThreshold <= 1.0 &&
               sampleCapacity >= 2 && trainingBatch > 0 && epochs > 0 &&
               learningRate > 0.0;
    }
};

/**
 * @brief Онлайн-предсказатель вероятности будущего попадания по ключу.
 *
 * Хранит окно временных меток обращений для каждого ключа и ограниченный буфер
 * обучающих примеров. Модель: логистическая регрессия по пяти признакам
 * (хэш ключа, час суток UTC, частота, средний интервал, ограниченная частота),
 * дообучаемая от текущих весов. Используется только для начального приоритета
 * записи и не влияет на корректность кэша.
 *
 * @note Потокобезопасен. Обучение идёт на копии и не держит блокировку
 * на время градиентного спуска.
 */
class HitPredictor {
public:
    static constexpr size_t kFeatureCount = 5;
    using Clock = std::chrono::system_clock;
    using Features = std::array<double, kFeatureCount>;

    explicit HitPredictor(const PredictorConfig& config = PredictorConfig{});
    ~HitPredictor();

    HitPredictor(const HitPredictor&) = delete;
    HitPredictor& operator=(const HitPredictor&) = delete;

    /**
     * @brief Зафиксировать обращение к ключу.
     * @param key Ключ
     * @param now Момент обращения
     * @param hit Было ли обращение попаданием
     */
    void recordAccess(const std::string& key, Clock::time_point now, bool hit);

    /**
     * @brief Вероятность попадания для ключа, в [0, 1].
     * @return 0.5 если предсказание выключено или модель не обучена
     */
    double predict(const std::string& key, Clock::time_point now) const;

    /**
     * @brief Дообучить модель на последних примерах.
     * @return true если веса обновлены. При ошибке веса не меняются,
     * счётчик ошибок обучения увеличивается
     */
    bool train();

    // Удалить историю обращений ключа
    void forget(const std::string& key);

    /**
     * @brief Удалить ключи без обращений в пределах окна предсказания.
     * @return Количество удалённых ключей
     */
    size_t prune(Clock::time_point now);
    void clear();

    void setConfiguration(const PredictorConfig& config);
    PredictorConfig getConfiguration() const;

    bool isTrained() const;
    size_t sampleCount() const;
    size_t trackedKeys() const;
    size_t trainingFailures() const;
    size_t trainingRuns() const;

    // Признаки для ключа на момент now (для диагностики и тестов)
    Features extractFeatures(const std::string& key, Clock::time_point now) const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace prediction
} // namespace cache
} // namespace core
} // namespace morph
