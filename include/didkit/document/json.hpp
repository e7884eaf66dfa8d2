#pragma once

/// JSON wire format for documents and patches (nlohmann/json ADL hooks).
/// Members are camelCase; absent optional members are omitted.

#include "context.hpp"
#include "did_document.hpp"
#include "relationship.hpp"
#include "service.hpp"
#include "verification_method.hpp"
#include <datapod/datapod.hpp>
#include <didkit/common/flexvec.hpp>
#include <didkit/patch/patch.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace didkit {

    void to_json(nlohmann::json &j, KeyPurpose purpose);
    void from_json(const nlohmann::json &j, KeyPurpose &purpose);

    void to_json(nlohmann::json &j, Action action);
    void from_json(const nlohmann::json &j, Action &action);

    void to_json(nlohmann::json &j, const PublicKeyJwk &jwk);
    void from_json(const nlohmann::json &j, PublicKeyJwk &jwk);

    void to_json(nlohmann::json &j, const VerificationMethod &vm);
    void from_json(const nlohmann::json &j, VerificationMethod &vm);

    /// A reference is written as its key ID, an embedded entry as the method object
    void to_json(nlohmann::json &j, const VmRelationship &rel);
    void from_json(const nlohmann::json &j, VmRelationship &rel);

    void to_json(nlohmann::json &j, const Context &ctx);
    void from_json(const nlohmann::json &j, Context &ctx);

    void to_json(nlohmann::json &j, const Endpoint &ep);
    void from_json(const nlohmann::json &j, Endpoint &ep);

    void to_json(nlohmann::json &j, const Service &svc);
    void from_json(const nlohmann::json &j, Service &svc);

    /// Method members flattened alongside "purposes"
    void to_json(nlohmann::json &j, const VmWithPurpose &key);
    void from_json(const nlohmann::json &j, VmWithPurpose &key);

    void to_json(nlohmann::json &j, const PatchDocument &doc);
    void from_json(const nlohmann::json &j, PatchDocument &doc);

    void to_json(nlohmann::json &j, const Patch &patch);
    void from_json(const nlohmann::json &j, Patch &patch);

    void to_json(nlohmann::json &j, const DidDocument &doc);
    void from_json(const nlohmann::json &j, DidDocument &doc);

    /// Parse a single patch object
    dp::Result<Patch, dp::Error> parsePatch(const std::string &text);

    /// Parse a patch list (array, or a single patch object)
    dp::Result<std::vector<Patch>, dp::Error> parsePatches(const std::string &text);

    /// Serialize a patch list as a JSON array
    std::string patchesToJson(const std::vector<Patch> &patches, int indent = -1);

} // namespace didkit

// Bare-string shorthands accepted in single-or-list fields
namespace didkit::flex {

    template <> struct StringForm<Context> {
        static Context parse(const std::string &value) { return Context::fromUrl(value); }
    };

    template <> struct StringForm<Endpoint> {
        static Endpoint parse(const std::string &value) { return Endpoint::fromUrl(value); }
    };

    template <> struct StringForm<VmRelationship> {
        static VmRelationship parse(const std::string &value) { return VmRelationship::reference(value); }
    };

    template <> struct StringForm<KeyPurpose> {
        static KeyPurpose parse(const std::string &value) {
            auto result = keyPurposeFromString(value);
            if (result.is_err()) {
                throw std::invalid_argument(result.error().message.c_str());
            }
            return result.value();
        }
    };

} // namespace didkit::flex
