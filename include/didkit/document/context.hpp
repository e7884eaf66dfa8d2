#pragma once

#include <datapod/datapod.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace didkit {

    /// Base JSON-LD context for DID documents
    constexpr const char *DID_CONTEXT = "https://www.w3.org/ns/did/v1";

    /// A JSON-LD context entry: a URL or an inline term map
    struct Context {
        std::optional<dp::String> url;
        nlohmann::json url_map; // null unless the entry is a map

        Context() = default;

        inline static Context fromUrl(const std::string &url) {
            Context ctx;
            ctx.url = dp::String(url.c_str());
            return ctx;
        }

        inline static Context fromMap(const nlohmann::json &map) {
            Context ctx;
            ctx.url_map = map;
            return ctx;
        }

        inline std::string getUrl() const { return url ? std::string(url->c_str()) : ""; }

        inline bool operator==(const Context &other) const {
            if (url.has_value() != other.url.has_value()) {
                return false;
            }
            if (url && !(*url == *other.url)) {
                return false;
            }
            return url_map == other.url_map;
        }

        inline bool operator!=(const Context &other) const { return !(*this == other); }
    };

} // namespace didkit
