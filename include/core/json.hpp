#pragma once

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace alertwatch {

/**
 * @brief Thin wrapper around glz::json_t for read-only DOM navigation
 *
 * Stores json_t by value. Const operator[] returns copies, and a missing
 * key or a lookup on a non-object yields a null value instead of
 * throwing, so log-line consumers can probe optional fields freely.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // ===== Constructors =====

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }

    [[nodiscard]] bool is_number_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    // ===== Container Properties =====

    [[nodiscard]] bool empty() const { return data_.empty(); }
    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    // ===== Const Element Access (returns copy) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_same_v<T, double>) {
            return data_.get<double>();
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores all numbers as double; cast to target integral type
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /**
     * @brief Render a scalar as plain text: strings verbatim, integral
     * numbers without a fractional part, booleans as true/false.
     * Containers and null render as an empty string.
     */
    [[nodiscard]] std::string to_text() const {
        if (data_.is_string()) return data_.get<std::string>();
        if (data_.is_boolean()) return data_.get<bool>() ? "true" : "false";
        if (data_.is_number()) {
            const double d = data_.get<double>();
            if (is_number_integer() && std::fabs(d) < 9.0e15) {
                return std::format("{}", static_cast<int64_t>(d));
            }
            return std::format("{}", d);
        }
        return {};
    }

    // ===== Array Iteration =====

    [[nodiscard]] const array_t& elements() const {
        static const array_t empty_arr;
        return data_.is_array() ? data_.get_array() : empty_arr;
    }

    // ===== Static Factories =====

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        // glaze reads from a null-terminated buffer
        const std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error(std::format("JSON parse error: {}", glz::format_error(ec, buffer)));
        }
        return JsonValue(std::move(result));
    }

private:
    glz::json_t data_{};
};

} // namespace alertwatch
