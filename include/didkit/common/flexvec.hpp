#pragma once

#include <datapod/datapod.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

// dp::String <-> JSON string
namespace nlohmann {
    template <> struct adl_serializer<dp::String> {
        static void to_json(json &j, const dp::String &value) { j = std::string(value.c_str()); }
        static void from_json(const json &j, dp::String &value) {
            value = dp::String(j.get<std::string>().c_str());
        }
    };
} // namespace nlohmann

namespace didkit {

    /// Element-wise equality for datapod vectors
    template <typename T> inline bool sameSequence(const dp::Vector<T> &a, const dp::Vector<T> &b) {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); i++) {
            if (!(a[i] == b[i])) {
                return false;
            }
        }
        return true;
    }

    template <typename T>
    inline bool sameSequence(const std::optional<dp::Vector<T>> &a, const std::optional<dp::Vector<T>> &b) {
        if (a.has_value() != b.has_value()) {
            return false;
        }
        return !a.has_value() || sameSequence(*a, *b);
    }

} // namespace didkit

/// Single-or-list JSON encoding.
///
/// Output is compact: a list holding exactly one element is written as that
/// element, anything else as an array. Input is permissive: a bare string, a
/// bare object, an array mixing strings and objects, or a string holding an
/// encoded JSON array all decode to an ordered list.
namespace didkit::flex {

    /// Recovers a list element from its bare-string shorthand. Element types
    /// without a shorthand keep this primary template and reject strings.
    template <typename T> struct StringForm {
        static T parse(const std::string &value) {
            throw std::invalid_argument("string form not accepted for this element: " + value);
        }
    };

    template <> struct StringForm<dp::String> {
        static dp::String parse(const std::string &value) { return dp::String(value.c_str()); }
    };

    template <typename T> inline nlohmann::json toJson(const dp::Vector<T> &values) {
        if (values.size() == 1) {
            return nlohmann::json(values[0]);
        }
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &v : values) {
            arr.push_back(nlohmann::json(v));
        }
        return arr;
    }

    /// Encode a list as an array regardless of length
    template <typename T> inline nlohmann::json toArray(const dp::Vector<T> &values) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &v : values) {
            arr.push_back(nlohmann::json(v));
        }
        return arr;
    }

    template <typename T> inline T element(const nlohmann::json &j) {
        if (j.is_string()) {
            return StringForm<T>::parse(j.get<std::string>());
        }
        if (j.is_object()) {
            return j.get<T>();
        }
        throw std::invalid_argument("cannot deserialize list element: expected string or object");
    }

    /// Decode any accepted shape. Throws on element types that cannot be decoded.
    template <typename T> inline dp::Vector<T> fromJson(const nlohmann::json &j) {
        dp::Vector<T> out;
        if (j.is_array()) {
            for (const auto &e : j) {
                out.push_back(element<T>(e));
            }
            return out;
        }
        if (j.is_string()) {
            const auto value = j.get<std::string>();
            if (!value.empty() && value[0] == '[') {
                // Unparseable embedded arrays decode to an empty list
                auto embedded = nlohmann::json::parse(value, nullptr, false);
                if (embedded.is_discarded() || !embedded.is_array()) {
                    return out;
                }
                return fromJson<T>(embedded);
            }
            out.push_back(StringForm<T>::parse(value));
            return out;
        }
        if (j.is_object()) {
            out.push_back(j.get<T>());
            return out;
        }
        throw std::invalid_argument("cannot deserialize list: expected string, object or array");
    }

    /// Write an optional list under `key`, omitting it when absent
    template <typename T>
    inline void put(nlohmann::json &j, const char *key, const std::optional<dp::Vector<T>> &values) {
        if (values) {
            j[key] = toJson(*values);
        }
    }

    /// Read an optional list from `key`; a missing or null member is absent
    template <typename T> inline std::optional<dp::Vector<T>> get(const nlohmann::json &j, const char *key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) {
            return std::nullopt;
        }
        return fromJson<T>(*it);
    }

} // namespace didkit::flex
