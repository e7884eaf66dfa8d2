#pragma once

#include <datapod/datapod.hpp>

namespace didkit {

    // ===========================================
    // didkit-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_INVALID_PATCH = 100;
    constexpr dp::u32 ERR_INVALID_INPUT = 101;
    constexpr dp::u32 ERR_MISSING_PAYLOAD = 102;
    constexpr dp::u32 ERR_SERIALIZATION_FAILED = 103;
    constexpr dp::u32 ERR_DESERIALIZATION_FAILED = 104;
    constexpr dp::u32 ERR_NOT_SUPPORTED = 105;
    constexpr dp::u32 ERR_KEY_UNAVAILABLE = 106;

    // ===========================================
    // Error factory functions
    // ===========================================

    /// Patch is the wrong shape for its action (wrong setter, missing payload, duplicate id)
    inline dp::Error invalid_patch(const dp::String &msg = "Invalid patch") {
        return dp::Error{ERR_INVALID_PATCH, msg};
    }

    /// Malformed identifier or duplicate purpose
    inline dp::Error invalid_input(const dp::String &msg = "Invalid input") {
        return dp::Error{ERR_INVALID_INPUT, msg};
    }

    inline dp::Error missing_payload(const dp::String &msg = "Patch payload missing") {
        return dp::Error{ERR_MISSING_PAYLOAD, msg};
    }

    inline dp::Error serialization_failed(const dp::String &msg = "Serialization failed") {
        return dp::Error{ERR_SERIALIZATION_FAILED, msg};
    }

    inline dp::Error deserialization_failed(const dp::String &msg = "Deserialization failed") {
        return dp::Error{ERR_DESERIALIZATION_FAILED, msg};
    }

    inline dp::Error not_supported(const dp::String &msg = "Operation not supported") {
        return dp::Error{ERR_NOT_SUPPORTED, msg};
    }

    inline dp::Error key_unavailable(const dp::String &msg = "No key material available") {
        return dp::Error{ERR_KEY_UNAVAILABLE, msg};
    }

} // namespace didkit
