#include "core/cache/quantization/QuantizationEngine.hpp"
#include <cmath>
#include <cstring>
#include <limits>
#include "core/logging/LoggerFactory.hpp"

namespace morph {
namespace core {
namespace cache {

namespace {

enum class Tag : uint8_t {
    Null = 0x00,
    False = 0x01,
    True = 0x02,
    Int8 = 0x10,
    Float32 = 0x11,
    Float64 = 0x12,
    Fixed16 = 0x13,
    Fixed32 = 0x14,
    Nibble = 0x15,
    String = 0x20,
    PackedString = 0x21,
    Array = 0x30,
    Object = 0x31
};

class ByteWriter {
public:
    void putTag(Tag tag) { out_.push_back(static_cast<uint8_t>(tag)); }
    void putByte(uint8_t byte) { out_.push_back(byte); }

    // LEB128
    void putVarint(uint64_t value) {
        while (value >= 0x80) {
            out_.push_back(static_cast<uint8_t>(value | 0x80));
            value >>= 7;
        }
        out_.push_back(static_cast<uint8_t>(value));
    }

    void putBytes(const std::string& bytes) {
        out_.insert(out_.end(), bytes.begin(), bytes.end());
    }

    void putLittleEndian(uint64_t bits, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            out_.push_back(static_cast<uint8_t>(bits >> (8 * i)));
        }
    }

    void putFloat32(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        putLittleEndian(bits, 4);
    }

    void putFloat64(double value) {
        uint64_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        putLittleEndian(bits, 8);
    }

    std::vector<uint8_t> take() { return std::move(out_); }

private:
    std::vector<uint8_t> out_;
};

class ByteReader {
public:
    explicit ByteReader(const std::vector<uint8_t>& in) : in_(in) {}

    bool done() const { return pos_ == in_.size(); }

    uint8_t getByte() {
        require(1);
        return in_[pos_++];
    }

    Tag getTag() { return static_cast<Tag>(getByte()); }

    uint64_t getVarint() {
        uint64_t value = 0;
        for (int shift = 0; shift < 64; shift += 7) {
            uint8_t byte = getByte();
            value |= static_cast<uint64_t>(byte & 0x7F) << shift;
            if ((byte & 0x80) == 0) {
                return value;
            }
        }
        throw QuantizationError("varint overflow");
    }

    std::string getBytes(uint64_t count) {
        require(count);
        std::string result(in_.begin() + pos_, in_.begin() + pos_ + count);
        pos_ += count;
        return result;
    }

    uint64_t getLittleEndian(size_t width) {
        require(width);
        uint64_t bits = 0;
        for (size_t i = 0; i < width; ++i) {
            bits |= static_cast<uint64_t>(in_[pos_ + i]) << (8 * i);
        }
        pos_ += width;
        return bits;
    }

    float getFloat32() {
        uint32_t bits = static_cast<uint32_t>(getLittleEndian(4));
        float value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

    double getFloat64() {
        uint64_t bits = getLittleEndian(8);
        double value;
        std::memcpy(&value, &bits, sizeof(value));
        return value;
    }

private:
    void require(uint64_t count) const {
        if (count > in_.size() - pos_) {
            throw QuantizationError("truncated quantized stream at offset " + std::to_string(pos_));
        }
    }

    const std::vector<uint8_t>& in_;
    size_t pos_ = 0;
};

void encodeNumber(ByteWriter& out, double value, QuantizationType type) {
    switch (type) {
        case QuantizationType::Int8:
            if (std::isfinite(value) && value == std::trunc(value) && value >= -128.0 && value <= 127.0) {
                out.putTag(Tag::Int8);
                out.putByte(static_cast<uint8_t>(static_cast<int8_t>(value)));
            } else {
                out.putTag(Tag::Float32);
                out.putFloat32(static_cast<float>(value));
            }
            return;
        case QuantizationType::Fp8: {
            double scaled = std::round(value * 100.0);
            if (std::isfinite(scaled) && std::fabs(scaled) <= std::numeric_limits<int16_t>::max()) {
                out.putTag(Tag::Fixed16);
                out.putLittleEndian(static_cast<uint16_t>(static_cast<int16_t>(scaled)), 2);
            } else if (std::isfinite(scaled) && std::fabs(scaled) <= std::numeric_limits<int32_t>::max()) {
                out.putTag(Tag::Fixed32);
                out.putLittleEndian(static_cast<uint32_t>(static_cast<int32_t>(scaled)), 4);
            } else {
                out.putTag(Tag::Float64);
                out.putFloat64(std::isfinite(scaled) ? scaled / 100.0 : value);
            }
            return;
        }
        case QuantizationType::Int4: {
            // round(v) & 0xF для дополнительного кода, без переполнения на больших значениях
            double nibble = std::isfinite(value) ? std::fmod(std::round(value), 16.0) : 0.0;
            if (nibble < 0) {
                nibble += 16.0;
            }
            out.putTag(Tag::Nibble);
            out.putByte(static_cast<uint8_t>(nibble));
            return;
        }
        case QuantizationType::None:
            break;
    }
    throw QuantizationError("number encoding requested without quantization type");
}

void encodeString(ByteWriter& out, const std::string& text, QuantizationType type) {
    if (type != QuantizationType::Int4) {
        out.putTag(Tag::String);
        out.putVarint(text.size());
        out.putBytes(text);
        return;
    }

    out.putTag(Tag::PackedString);
    out.putVarint(text.size());
    for (size_t i = 0; i < text.size(); i += 2) {
        uint8_t high = static_cast<uint8_t>(text[i]) >> 4;
        uint8_t low = i + 1 < text.size() ? static_cast<uint8_t>(text[i + 1]) >> 4 : 0;
        out.putByte(static_cast<uint8_t>((high << 4) | low));
    }
}

void encode(ByteWriter& out, const Value& value, QuantizationType type, size_t depth) {
    if (depth > QuantizationEngine::kMaxDepth) {
        throw QuantizationError("value nesting exceeds " + std::to_string(QuantizationEngine::kMaxDepth));
    }

    switch (value.kind()) {
        case Value::Kind::Null:
            out.putTag(Tag::Null);
            break;
        case Value::Kind::Bool:
            out.putTag(value.asBool() ? Tag::True : Tag::False);
            break;
        case Value::Kind::Number:
            encodeNumber(out, value.asNumber(), type);
            break;
        case Value::Kind::String:
            encodeString(out, value.asString(), type);
            break;
        case Value::Kind::Array:
            out.putTag(Tag::Array);
            out.putVarint(value.asArray().size());
            for (const auto& item : value.asArray()) {
                encode(out, item, type, depth + 1);
            }
            break;
        case Value::Kind::Object:
            out.putTag(Tag::Object);
            out.putVarint(value.asObject().size());
            for (const auto& [key, item] : value.asObject()) {
                out.putVarint(key.size());
                out.putBytes(key);
                encode(out, item, type, depth + 1);
            }
            break;
    }
}

Value decode(ByteReader& in, size_t depth) {
    if (depth > QuantizationEngine::kMaxDepth) {
        throw QuantizationError("quantized stream nesting exceeds limit");
    }

    Tag tag = in.getTag();
    switch (tag) {
        case Tag::Null:
            return Value();
        case Tag::False:
            return Value(false);
        case Tag::True:
            return Value(true);
        case Tag::Int8:
            return Value(static_cast<int8_t>(in.getByte()));
        case Tag::Float32:
            return Value(static_cast<double>(in.getFloat32()));
        case Tag::Float64:
            return Value(in.getFloat64());
        case Tag::Fixed16:
            return Value(static_cast<int16_t>(in.getLittleEndian(2)) / 100.0);
        case Tag::Fixed32:
            return Value(static_cast<int32_t>(in.getLittleEndian(4)) / 100.0);
        case Tag::Nibble:
            return Value(in.getByte() & 0x0F);
        case Tag::String:
            return Value(in.getBytes(in.getVarint()));
        case Tag::PackedString: {
            uint64_t length = in.getVarint();
            std::string packed = in.getBytes((length + 1) / 2);
            std::string text;
            text.reserve(length);
            for (char byte : packed) {
                uint8_t p = static_cast<uint8_t>(byte);
                text.push_back(static_cast<char>(p & 0xF0));
                text.push_back(static_cast<char>((p & 0x0F) << 4));
            }
            text.resize(length);
            return Value(std::move(text));
        }
        case Tag::Array: {
            uint64_t count = in.getVarint();
            Value::Array items;
            for (uint64_t i = 0; i < count; ++i) {
                items.push_back(decode(in, depth + 1));
            }
            return Value(std::move(items));
        }
        case Tag::Object: {
            uint64_t count = in.getVarint();
            Value::Object fields;
            for (uint64_t i = 0; i < count; ++i) {
                std::string key = in.getBytes(in.getVarint());
                fields.emplace(std::move(key), decode(in, depth + 1));
            }
            return Value(std::move(fields));
        }
    }
    throw QuantizationError("unknown tag " + std::to_string(static_cast<int>(tag)));
}

} // namespace

const char* toString(QuantizationType type) {
    switch (type) {
        case QuantizationType::None: return "none";
        case QuantizationType::Int8: return "int8";
        case QuantizationType::Fp8: return "fp8";
        case QuantizationType::Int4: return "int4";
    }
    return "none";
}

QuantizationType quantizationTypeFromString(const std::string& name) {
    if (name == "none") return QuantizationType::None;
    if (name == "int8") return QuantizationType::Int8;
    if (name == "fp8") return QuantizationType::Fp8;
    if (name == "int4") return QuantizationType::Int4;
    throw std::invalid_argument("Unknown quantization type: " + name);
}

QuantizedValue QuantizationEngine::quantize(const Value& value, QuantizationType type) {
    QuantizedValue result;
    result.metadata.originalSize = value.estimatedSize();
    if (type == QuantizationType::None) {
        result.metadata.encodedSize = result.metadata.originalSize;
        return result;
    }

    try {
        ByteWriter out;
        encode(out, value, type, 0);
        result.bytes = out.take();
        result.metadata.type = type;
        result.metadata.encodedSize = result.bytes.size();
        result.metadata.ratio = result.bytes.empty()
            ? 1.0
            : static_cast<double>(result.metadata.originalSize) / result.bytes.size();
    } catch (const std::exception& e) {
        ++errors_;
        logging::LoggerFactory::get("kvcache")->warn("Quantization to {} failed: {}", toString(type), e.what());
        result.bytes.clear();
        result.metadata.type = QuantizationType::None;
        result.metadata.encodedSize = result.metadata.originalSize;
        result.metadata.ratio = 1.0;
        result.metadata.error = e.what();
    }
    return result;
}

Value QuantizationEngine::dequantize(const std::vector<uint8_t>& bytes, const QuantizationMetadata& metadata) const {
    if (metadata.type == QuantizationType::None) {
        throw QuantizationError("dequantize called for unquantized value");
    }
    ByteReader in(bytes);
    Value value = decode(in, 0);
    if (!in.done()) {
        throw QuantizationError("trailing bytes in quantized stream");
    }
    return value;
}

} // namespace cache
} // namespace core
} // namespace morph
