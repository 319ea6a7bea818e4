#pragma once
#include <simdjson.h>
#include <algorithm>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Deepvale {

template<typename T>
class DecodeResult {
public:
    std::optional<T> value;
    std::string error;

    static DecodeResult success(T val) {
        DecodeResult result;
        result.value = std::move(val);
        return result;
    }

    static DecodeResult failure(const std::string& err) {
        DecodeResult result;
        result.error = err;
        return result;
    }

    bool isSuccess() const { return value.has_value(); }
    bool isError() const { return !value.has_value(); }
};

// Composable JSON decoder over simdjson's on-demand API
template<typename T>
class Codec {
public:
    using DecodeFunc = std::function<DecodeResult<T>(simdjson::ondemand::value)>;

    explicit Codec(DecodeFunc decoder) : m_decoder(std::move(decoder)) {}

    DecodeResult<T> decode(simdjson::ondemand::value json) const {
        return m_decoder(json);
    }

    template<typename U>
    Codec<U> map(std::function<U(T)> mapper) const {
        return Codec<U>([decoder = m_decoder, mapper](simdjson::ondemand::value json) -> DecodeResult<U> {
            auto result = decoder(json);
            if (result.isError()) {
                return DecodeResult<U>::failure(result.error);
            }
            return DecodeResult<U>::success(mapper(std::move(result.value.value())));
        });
    }

    // Clamps decoded values into [minValue, maxValue]
    Codec<T> clamped(T minValue, T maxValue) const {
        return Codec<T>([decoder = m_decoder, minValue, maxValue](simdjson::ondemand::value json) -> DecodeResult<T> {
            auto result = decoder(json);
            if (result.isSuccess()) {
                result.value = std::clamp(result.value.value(), minValue, maxValue);
            }
            return result;
        });
    }

private:
    DecodeFunc m_decoder;
};

class Codecs {
public:
    static Codec<float> FLOAT() {
        return Codec<float>([](simdjson::ondemand::value json) -> DecodeResult<float> {
            double val;
            auto error = json.get_double().get(val);
            if (error) {
                return DecodeResult<float>::failure("Expected number");
            }
            return DecodeResult<float>::success(static_cast<float>(val));
        });
    }

    static Codec<int32_t> INT32() {
        return Codec<int32_t>([](simdjson::ondemand::value json) -> DecodeResult<int32_t> {
            int64_t val;
            auto error = json.get_int64().get(val);
            if (error) {
                return DecodeResult<int32_t>::failure("Expected integer");
            }
            if (val < INT32_MIN || val > INT32_MAX) {
                return DecodeResult<int32_t>::failure("Integer out of range: " + std::to_string(val));
            }
            return DecodeResult<int32_t>::success(static_cast<int32_t>(val));
        });
    }

    static Codec<std::string> STRING() {
        return Codec<std::string>([](simdjson::ondemand::value json) -> DecodeResult<std::string> {
            std::string_view val;
            auto error = json.get_string().get(val);
            if (error) {
                return DecodeResult<std::string>::failure("Expected string");
            }
            return DecodeResult<std::string>::success(std::string(val));
        });
    }

    static Codec<bool> BOOL() {
        return Codec<bool>([](simdjson::ondemand::value json) -> DecodeResult<bool> {
            bool val;
            auto error = json.get_bool().get(val);
            if (error) {
                return DecodeResult<bool>::failure("Expected bool");
            }
            return DecodeResult<bool>::success(val);
        });
    }

    template<typename T>
    static Codec<std::vector<T>> list(const Codec<T>& elementCodec) {
        return Codec<std::vector<T>>([elementCodec](simdjson::ondemand::value json) -> DecodeResult<std::vector<T>> {
            simdjson::ondemand::array arr;
            auto error = json.get_array().get(arr);
            if (error) {
                return DecodeResult<std::vector<T>>::failure("Expected array");
            }

            std::vector<T> result;
            size_t index = 0;
            for (auto element : arr) {
                simdjson::ondemand::value elementValue;
                if (element.get(elementValue)) {
                    return DecodeResult<std::vector<T>>::failure("Malformed array element " + std::to_string(index));
                }
                auto decoded = elementCodec.decode(elementValue);
                if (decoded.isError()) {
                    return DecodeResult<std::vector<T>>::failure(
                        "Array element " + std::to_string(index) + ": " + decoded.error);
                }
                result.push_back(std::move(decoded.value.value()));
                index++;
            }
            return DecodeResult<std::vector<T>>::success(std::move(result));
        });
    }
};

// A named object field, optionally with a default used when the field is absent
template<typename T>
class FieldCodec {
public:
    std::string fieldName;
    Codec<T> codec;
    std::optional<T> defaultValue;

    FieldCodec(std::string name, Codec<T> c)
        : fieldName(std::move(name)), codec(std::move(c)) {}

    FieldCodec(std::string name, Codec<T> c, T defVal)
        : fieldName(std::move(name)), codec(std::move(c)), defaultValue(std::move(defVal)) {}

    DecodeResult<T> decode(simdjson::ondemand::object& obj) const {
        simdjson::ondemand::value val;
        auto error = obj[fieldName].get(val);

        if (error) {
            if (defaultValue.has_value()) {
                return DecodeResult<T>::success(defaultValue.value());
            }
            return DecodeResult<T>::failure("Missing required field: " + fieldName);
        }

        auto result = codec.decode(val);
        if (result.isError()) {
            return DecodeResult<T>::failure("Field '" + fieldName + "': " + result.error);
        }
        return result;
    }

    // Writes into `out`; on failure records the message in `error` and returns false
    bool decodeInto(simdjson::ondemand::object& obj, T& out, std::string& error) const {
        auto result = decode(obj);
        if (result.isError()) {
            error = result.error;
            return false;
        }
        out = std::move(result.value.value());
        return true;
    }
};

template<typename T>
FieldCodec<T> field(const std::string& name, const Codec<T>& codec) {
    return FieldCodec<T>(name, codec);
}

template<typename T>
FieldCodec<T> optionalField(const std::string& name, const Codec<T>& codec, T defaultValue) {
    return FieldCodec<T>(name, codec, std::move(defaultValue));
}

} // namespace Deepvale
