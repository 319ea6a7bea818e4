#pragma once

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <magic_enum/magic_enum.hpp>

namespace Deepvale {

/**
 * A named, validated configuration value.
 * Rejected values fall back to the default and are logged, never thrown.
 */
template<typename T>
class SimpleOption {
public:
    using ChangeCallback = std::function<void(const T&)>;
    using Validator = std::function<std::optional<T>(const T&)>;

    SimpleOption(
        std::string key,
        T defaultValue,
        Validator validator = nullptr,
        ChangeCallback changeCallback = nullptr
    ) : m_key(std::move(key)),
        m_defaultValue(defaultValue),
        m_value(defaultValue),
        m_validator(std::move(validator)),
        m_changeCallback(std::move(changeCallback)) {}

    const T& getValue() const { return m_value; }
    const T& getDefaultValue() const { return m_defaultValue; }
    operator const T&() const { return m_value; }

    bool operator==(const T& other) const { return m_value == other; }

    SimpleOption& operator=(const T& value) {
        setValue(value);
        return *this;
    }

    void setValue(const T& value) {
        T validated = value;

        if (m_validator) {
            auto result = m_validator(value);
            if (!result.has_value()) {
                spdlog::warn("Invalid value for option '{}', using default {}", m_key, serialize(m_defaultValue));
                validated = m_defaultValue;
            } else {
                validated = *result;
            }
        }

        if (m_value != validated) {
            m_value = validated;
            if (m_changeCallback) {
                m_changeCallback(m_value);
            }
        }
    }

    void reset() { setValue(m_defaultValue); }
    bool isDefault() const { return m_value == m_defaultValue; }

    const std::string& getKey() const { return m_key; }

    // JSON literal for the current value
    std::string serialize() const { return serialize(m_value); }

    /**
     * Read the value from a simdjson element (dom::element or ondemand::value).
     * Returns false, keeping the current value, when the JSON type does not match.
     */
    template<typename JsonType>
    bool deserialize(JsonType json) {
        std::optional<T> result;

        if constexpr (std::is_same_v<T, bool>) {
            bool val;
            if (!json.get_bool().get(val)) {
                result = val;
            }
        } else if constexpr (std::is_same_v<T, int32_t>) {
            int64_t val;
            if (!json.get_int64().get(val) &&
                val >= std::numeric_limits<int32_t>::min() &&
                val <= std::numeric_limits<int32_t>::max()) {
                result = static_cast<int32_t>(val);
            }
        } else if constexpr (std::is_same_v<T, float>) {
            double val;
            if (!json.get_double().get(val)) {
                result = static_cast<float>(val);
            }
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::string_view sv;
            if (!json.get_string().get(sv)) {
                result = std::string(sv);
            }
        } else if constexpr (std::is_enum_v<T>) {
            std::string_view sv;
            if (!json.get_string().get(sv)) {
                result = magic_enum::enum_cast<T>(sv);
            }
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for SimpleOption");
        }

        if (!result.has_value()) {
            spdlog::warn("Option '{}' has the wrong JSON type, keeping {}", m_key, serialize());
            return false;
        }

        setValue(*result);
        return true;
    }

private:
    static std::string serialize(const T& value) {
        if constexpr (std::is_same_v<T, bool>) {
            return value ? "true" : "false";
        } else if constexpr (std::is_integral_v<T>) {
            return std::to_string(value);
        } else if constexpr (std::is_floating_point_v<T>) {
            return fmt::format("{}", value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + value + "\"";
        } else if constexpr (std::is_enum_v<T>) {
            return "\"" + std::string(magic_enum::enum_name(value)) + "\"";
        } else {
            static_assert(sizeof(T) == 0, "Unsupported type for SimpleOption");
        }
    }

    std::string m_key;
    T m_defaultValue;
    T m_value;
    Validator m_validator;
    ChangeCallback m_changeCallback;
};

inline SimpleOption<bool> ofBoolean(std::string key, bool defaultValue) {
    return SimpleOption<bool>(std::move(key), defaultValue);
}

/**
 * Integer option accepting values in [minValue, maxValue]
 */
inline SimpleOption<int32_t> ofInt(std::string key, int32_t defaultValue, int32_t minValue, int32_t maxValue) {
    auto validator = [minValue, maxValue](int32_t val) -> std::optional<int32_t> {
        if (val >= minValue && val <= maxValue) return val;
        return std::nullopt;
    };
    return SimpleOption<int32_t>(std::move(key), defaultValue, validator);
}

/**
 * Float option accepting values in [minValue, maxValue]
 */
inline SimpleOption<float> ofFloat(std::string key, float defaultValue, float minValue, float maxValue) {
    auto validator = [minValue, maxValue](float val) -> std::optional<float> {
        if (val >= minValue && val <= maxValue) return val;
        return std::nullopt;
    };
    return SimpleOption<float>(std::move(key), defaultValue, validator);
}

inline SimpleOption<std::string> ofString(std::string key, std::string defaultValue) {
    return SimpleOption<std::string>(std::move(key), std::move(defaultValue));
}

template<typename E>
inline SimpleOption<E> ofEnum(std::string key, E defaultValue) {
    return SimpleOption<E>(std::move(key), defaultValue);
}

} // namespace Deepvale

template<typename T>
struct fmt::formatter<Deepvale::SimpleOption<T>> : fmt::formatter<std::string_view> {
    template<typename FormatContext>
    auto format(const Deepvale::SimpleOption<T>& opt, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(opt.serialize(), ctx);
    }
};
