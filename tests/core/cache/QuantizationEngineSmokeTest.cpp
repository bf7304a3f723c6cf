#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/cache/quantization/QuantizationEngine.hpp"

using namespace morph::core::cache;

void smokeTestInt8() {
    QuantizationEngine engine;
    Value text(std::string(500, 'x'));
    auto q = engine.quantize(text, QuantizationType::Int8);
    assert(q.quantized());
    assert(q.metadata.type == QuantizationType::Int8);
    assert(q.metadata.originalSize == 1000);
    assert(q.metadata.encodedSize == q.bytes.size());
    assert(q.metadata.encodedSize < q.metadata.originalSize);
    assert(q.metadata.ratio > 1.0);
    assert(engine.dequantize(q.bytes, q.metadata) == text);

    Value record = Value::Object{
        {"file", "main.cpp"},
        {"line", 42},
        {"offset", -7},
        {"clean", true},
        {"owner", nullptr},
        {"tags", Value::Array{"perf", "style", 3}}
    };
    auto r = engine.quantize(record, QuantizationType::Int8);
    assert(r.quantized());
    assert(engine.dequantize(r.bytes, r.metadata) == record);

    auto f = engine.quantize(Value(1234.5678), QuantizationType::Int8);
    double restored = engine.dequantize(f.bytes, f.metadata).asNumber();
    assert(std::fabs(restored - 1234.5678) < 1e-3);
    std::cout << "[OK] QuantizationEngine int8 test\n";
}

void smokeTestFp8() {
    QuantizationEngine engine;
    auto q = engine.quantize(Value(3.14159), QuantizationType::Fp8);
    assert(q.quantized());
    assert(std::fabs(engine.dequantize(q.bytes, q.metadata).asNumber() - 3.14) < 1e-9);

    auto large = engine.quantize(Value(123456.789), QuantizationType::Fp8);
    assert(std::fabs(engine.dequantize(large.bytes, large.metadata).asNumber() - 123456.79) < 1e-6);

    auto huge = engine.quantize(Value(1e12), QuantizationType::Fp8);
    assert(engine.dequantize(huge.bytes, huge.metadata).asNumber() == 1e12);

    Value mixed = Value::Array{"unchanged", 2.005, false};
    auto m = engine.quantize(mixed, QuantizationType::Fp8);
    Value back = engine.dequantize(m.bytes, m.metadata);
    assert(back.asArray()[0].asString() == "unchanged");
    assert(back.asArray()[2].asBool() == false);
    std::cout << "[OK] QuantizationEngine fp8 test\n";
}

void smokeTestInt4() {
    QuantizationEngine engine;
    auto n = engine.quantize(Value::Array{17, -1, 5}, QuantizationType::Int4);
    Value numbers = engine.dequantize(n.bytes, n.metadata);
    assert(numbers.asArray()[0].asNumber() == 1);
    assert(numbers.asArray()[1].asNumber() == 15);
    assert(numbers.asArray()[2].asNumber() == 5);

    auto s = engine.quantize(Value("hello"), QuantizationType::Int4);
    std::string packed = engine.dequantize(s.bytes, s.metadata).asString();
    assert(packed.size() == 5);
    assert(static_cast<unsigned char>(packed[0]) == 0x60);   // 'h' = 0x68
    assert(static_cast<unsigned char>(packed[4]) == 0x60);   // 'o' = 0x6F

    Value longText(std::string(1000, 'a'));
    auto l = engine.quantize(longText, QuantizationType::Int4);
    auto i8 = engine.quantize(longText, QuantizationType::Int8);
    assert(l.metadata.encodedSize < i8.metadata.encodedSize);
    std::cout << "[OK] QuantizationEngine int4 test\n";
}

void smokeTestNoneAndErrors() {
    QuantizationEngine engine;
    Value text("plain");
    auto none = engine.quantize(text, QuantizationType::None);
    assert(!none.quantized());
    assert(none.bytes.empty());
    assert(none.metadata.encodedSize == none.metadata.originalSize);

    bool threw = false;
    try {
        engine.dequantize(none.bytes, none.metadata);
    } catch (const QuantizationError&) {
        threw = true;
    }
    assert(threw);

    auto q = engine.quantize(Value("truncate me"), QuantizationType::Int8);
    std::vector<uint8_t> truncated(q.bytes.begin(), q.bytes.end() - 3);
    threw = false;
    try {
        engine.dequantize(truncated, q.metadata);
    } catch (const QuantizationError&) {
        threw = true;
    }
    assert(threw);

    std::vector<uint8_t> trailing = q.bytes;
    trailing.push_back(0x00);
    threw = false;
    try {
        engine.dequantize(trailing, q.metadata);
    } catch (const QuantizationError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        engine.dequantize({0x7F}, q.metadata);
    } catch (const QuantizationError&) {
        threw = true;
    }
    assert(threw);

    // Слишком глубокая вложенность: откат на None
    Value deep = Value::Array{};
    for (size_t i = 0; i < QuantizationEngine::kMaxDepth + 10; ++i) {
        deep = Value::Array{deep};
    }
    assert(engine.errorCount() == 0);
    auto fallback = engine.quantize(deep, QuantizationType::Int8);
    assert(!fallback.quantized());
    assert(!fallback.metadata.error.empty());
    assert(engine.errorCount() == 1);
    std::cout << "[OK] QuantizationEngine error handling test\n";
}

void smokeTestTypeNames() {
    assert(std::string(toString(QuantizationType::Fp8)) == "fp8");
    assert(quantizationTypeFromString("int4") == QuantizationType::Int4);
    assert(quantizationTypeFromString("none") == QuantizationType::None);
    bool threw = false;
    try {
        quantizationTypeFromString("int2");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[OK] QuantizationEngine type names test\n";
}

int main() {
    smokeTestInt8();
    smokeTestFp8();
    smokeTestInt4();
    smokeTestNoneAndErrors();
    smokeTestTypeNames();
    std::cout << "All QuantizationEngine tests passed!\n";
    return 0;
}
