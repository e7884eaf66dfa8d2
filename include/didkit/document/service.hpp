#pragma once

#include <datapod/datapod.hpp>
#include <didkit/common/flexvec.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace didkit {

    /// A service endpoint: a single URL or a structured map
    struct Endpoint {
        std::optional<dp::String> url;
        nlohmann::json url_map; // null unless the endpoint is a map

        Endpoint() = default;

        inline static Endpoint fromUrl(const std::string &url) {
            Endpoint ep;
            ep.url = dp::String(url.c_str());
            return ep;
        }

        inline static Endpoint fromMap(const nlohmann::json &map) {
            Endpoint ep;
            ep.url_map = map;
            return ep;
        }

        inline bool isUrl() const { return url.has_value(); }

        inline std::string getUrl() const { return url ? std::string(url->c_str()) : ""; }

        inline bool operator==(const Endpoint &other) const {
            if (url.has_value() != other.url.has_value()) {
                return false;
            }
            if (url && !(*url == *other.url)) {
                return false;
            }
            return url_map == other.url_map;
        }

        inline bool operator!=(const Endpoint &other) const { return !(*this == other); }
    };

    /// A service endpoint for communication with the DID subject
    /// Following W3C DID Core v1.0 specification
    struct Service {
        dp::String id;                        // e.g. "did:example:123#linked-domain"
        dp::Vector<dp::String> type;          // one or more type tags
        dp::Vector<Endpoint> service_endpoint; // one or more endpoints

        Service() = default;

        /// Create a service with one type and one URL endpoint
        inline Service(const std::string &id, const std::string &type_name, const std::string &endpoint)
            : id(dp::String(id.c_str())) {
            type.push_back(dp::String(type_name.c_str()));
            service_endpoint.push_back(Endpoint::fromUrl(endpoint));
        }

        inline std::string getId() const { return std::string(id.c_str()); }

        /// First type tag, or empty
        inline std::string getTypeString() const { return type.empty() ? "" : std::string(type[0].c_str()); }

        /// First endpoint URL, or empty
        inline std::string getServiceEndpoint() const {
            return service_endpoint.empty() ? "" : service_endpoint[0].getUrl();
        }

        inline bool operator==(const Service &other) const {
            return id == other.id && sameSequence(type, other.type) &&
                   sameSequence(service_endpoint, other.service_endpoint);
        }

        inline bool operator!=(const Service &other) const { return !(*this == other); }
    };

} // namespace didkit
