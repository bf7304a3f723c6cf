#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/cache/base/CacheValue.hpp"

namespace morph {
namespace core {
namespace cache {

enum class QuantizationType : uint8_t {
    None,
    Int8,
    Fp8,
    Int4
};

const char* toString(QuantizationType type);
// Бросает std::invalid_argument для неизвестного имени
QuantizationType quantizationTypeFromString(const std::string& name);

// Ошибка кодирования или разбора квантизованного потока
class QuantizationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct QuantizationMetadata {
    QuantizationType type = QuantizationType::None;
    size_t originalSize = 0;    // Оценка размера исходного значения (байт)
    size_t encodedSize = 0;     // Размер закодированного потока (байт)
    double ratio = 1.0;         // originalSize / encodedSize
    std::string error;          // Причина отката на None, если квантизация не удалась

    nlohmann::json toJson() const {
        nlohmann::json j = {
            {"type", toString(type)},
            {"originalSize", originalSize},
            {"encodedSize", encodedSize},
            {"ratio", ratio}
        };
        if (!error.empty()) {
            j["error"] = error;
        }
        return j;
    }
};

struct QuantizedValue {
    std::vector<uint8_t> bytes;
    QuantizationMetadata metadata;

    bool quantized() const { return metadata.type != QuantizationType::None; }
};

/**
 * @brief Движок квантизации значений кэша.
 * @details Значение кодируется в байтовый поток, где каждый узел начинается с тега
 * (вид узла и способ кодирования листа), поэтому для декодирования достаточно
 * самих байтов и метаданных.
 *
 * - int8: строки как UTF-8 без потерь; целые из [-128, 127] точно в одном байте,
 *   прочие числа во float32 (потеря точности).
 * - fp8: числа округляются до двух знаков после запятой; остальные листья без изменений.
 * - int4: строки упаковываются по два старших полубайта в байт (с потерями),
 *   числа усекаются до 4 бит.
 *
 * Ошибки квантизации не выходят наружу: результат откатывается на None,
 * счётчик ошибок увеличивается.
 */
class QuantizationEngine {
public:
    // Максимальная глубина вложенности кодируемого значения
    static constexpr size_t kMaxDepth = 256;

    QuantizationEngine() = default;
    QuantizationEngine(const QuantizationEngine&) = delete;
    QuantizationEngine& operator=(const QuantizationEngine&) = delete;

    /**
     * @brief Квантизовать значение.
     * @param value Исходное значение
     * @param type Тип квантизации; None возвращает пустой поток
     * @return Поток и метаданные. При ошибке metadata.type == None
     */
    QuantizedValue quantize(const Value& value, QuantizationType type);

    /**
     * @brief Восстановить значение из потока.
     * @throws QuantizationError если поток повреждён или metadata.type == None
     */
    Value dequantize(const std::vector<uint8_t>& bytes, const QuantizationMetadata& metadata) const;

    size_t errorCount() const { return errors_.load(); }

private:
    std::atomic<size_t> errors_{0};
};

} // namespace cache
} // namespace core
} // namespace morph
