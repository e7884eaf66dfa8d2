#include <didkit/document/json.hpp>
#include <stdexcept>

namespace didkit {

    namespace {

        inline void putString(nlohmann::json &j, const char *key, const dp::String &value) {
            if (!value.empty()) {
                j[key] = std::string(value.c_str());
            }
        }

        inline dp::String getString(const nlohmann::json &j, const char *key) {
            auto it = j.find(key);
            if (it == j.end() || it->is_null()) {
                return dp::String();
            }
            return dp::String(it->get<std::string>().c_str());
        }

        template <typename T> inline std::optional<dp::Vector<T>> collapse(std::optional<dp::Vector<T>> values) {
            if (values && values->empty()) {
                return std::nullopt;
            }
            return values;
        }

        template <typename T> inline void putArray(nlohmann::json &j, const char *key,
                                                   const std::optional<dp::Vector<T>> &values) {
            if (values) {
                j[key] = flex::toArray(*values);
            }
        }

    } // namespace

    // === Enumerations ===

    void to_json(nlohmann::json &j, KeyPurpose purpose) { j = keyPurposeToString(purpose); }

    void from_json(const nlohmann::json &j, KeyPurpose &purpose) {
        purpose = flex::StringForm<KeyPurpose>::parse(j.get<std::string>());
    }

    void to_json(nlohmann::json &j, Action action) { j = actionToString(action); }

    void from_json(const nlohmann::json &j, Action &action) {
        auto result = actionFromString(j.get<std::string>());
        if (result.is_err()) {
            throw std::invalid_argument(result.error().message.c_str());
        }
        action = result.value();
    }

    // === Key material ===

    void to_json(nlohmann::json &j, const PublicKeyJwk &jwk) {
        j = nlohmann::json::object();
        putString(j, "kty", jwk.kty);
        putString(j, "crv", jwk.crv);
        putString(j, "x", jwk.x);
        putString(j, "y", jwk.y);
        putString(j, "alg", jwk.alg);
        putString(j, "use", jwk.use);
        putString(j, "kid", jwk.kid);
    }

    void from_json(const nlohmann::json &j, PublicKeyJwk &jwk) {
        jwk.kty = getString(j, "kty");
        jwk.crv = getString(j, "crv");
        jwk.x = getString(j, "x");
        jwk.y = getString(j, "y");
        jwk.alg = getString(j, "alg");
        jwk.use = getString(j, "use");
        jwk.kid = getString(j, "kid");
    }

    void to_json(nlohmann::json &j, const VerificationMethod &vm) {
        j = nlohmann::json::object();
        j["id"] = vm.getId();
        j["controller"] = vm.getController();
        j["type"] = vm.getType();
        switch (vm.getPublicKeyFormat()) {
        case PublicKeyFormat::Jwk:
            j["publicKeyJwk"] = *vm.public_key_jwk;
            break;
        case PublicKeyFormat::Multibase:
            j["publicKeyMultibase"] = vm.getPublicKeyMultibase();
            break;
        case PublicKeyFormat::None:
            break;
        }
    }

    void from_json(const nlohmann::json &j, VerificationMethod &vm) {
        vm = VerificationMethod();
        vm.id = getString(j, "id");
        vm.controller = getString(j, "controller");
        vm.type = getString(j, "type");
        if (j.contains("publicKeyJwk") && !j.at("publicKeyJwk").is_null()) {
            vm.setPublicKeyJwk(j.at("publicKeyJwk").get<PublicKeyJwk>());
        } else if (j.contains("publicKeyMultibase") && !j.at("publicKeyMultibase").is_null()) {
            vm.setPublicKeyMultibase(j.at("publicKeyMultibase").get<std::string>());
        }
    }

    void to_json(nlohmann::json &j, const VmRelationship &rel) {
        if (rel.getKind() == RelationshipKind::Embedded) {
            j = *rel.verification_method;
        } else {
            j = rel.getKeyId();
        }
    }

    void from_json(const nlohmann::json &j, VmRelationship &rel) {
        if (j.is_string()) {
            rel = VmRelationship::reference(j.get<std::string>());
            return;
        }
        rel = VmRelationship::embedded(j.get<VerificationMethod>());
    }

    // === Context and services ===

    void to_json(nlohmann::json &j, const Context &ctx) {
        if (ctx.url) {
            j = ctx.getUrl();
        } else if (ctx.url_map.is_null()) {
            j = nlohmann::json::object();
        } else {
            j = ctx.url_map;
        }
    }

    void from_json(const nlohmann::json &j, Context &ctx) {
        if (j.is_string()) {
            ctx = Context::fromUrl(j.get<std::string>());
            return;
        }
        if (!j.is_object()) {
            throw std::invalid_argument("context entry must be a string or an object");
        }
        ctx = Context::fromMap(j);
    }

    void to_json(nlohmann::json &j, const Endpoint &ep) {
        if (ep.url) {
            j = ep.getUrl();
        } else if (ep.url_map.is_null()) {
            j = nlohmann::json::object();
        } else {
            j = ep.url_map;
        }
    }

    void from_json(const nlohmann::json &j, Endpoint &ep) {
        if (j.is_string()) {
            ep = Endpoint::fromUrl(j.get<std::string>());
            return;
        }
        if (!j.is_object()) {
            throw std::invalid_argument("service endpoint must be a string or an object");
        }
        ep = Endpoint::fromMap(j);
    }

    void to_json(nlohmann::json &j, const Service &svc) {
        j = nlohmann::json::object();
        j["id"] = svc.getId();
        j["type"] = flex::toJson(svc.type);
        j["serviceEndpoint"] = flex::toJson(svc.service_endpoint);
    }

    void from_json(const nlohmann::json &j, Service &svc) {
        svc = Service();
        svc.id = getString(j, "id");
        if (auto type = flex::get<dp::String>(j, "type")) {
            svc.type = *type;
        }
        if (auto endpoints = flex::get<Endpoint>(j, "serviceEndpoint")) {
            svc.service_endpoint = *endpoints;
        }
    }

    // === Patches ===

    void to_json(nlohmann::json &j, const VmWithPurpose &key) {
        j = key.verification_method;
        putArray(j, "purposes", key.purposes);
    }

    void from_json(const nlohmann::json &j, VmWithPurpose &key) {
        key = VmWithPurpose(j.get<VerificationMethod>());
        key.purposes = flex::get<KeyPurpose>(j, "purposes");
    }

    void to_json(nlohmann::json &j, const PatchDocument &doc) {
        j = nlohmann::json::object();
        putArray(j, "publicKeys", doc.public_keys);
        putArray(j, "services", doc.services);
    }

    void from_json(const nlohmann::json &j, PatchDocument &doc) {
        doc = PatchDocument();
        doc.public_keys = flex::get<VmWithPurpose>(j, "publicKeys");
        doc.services = flex::get<Service>(j, "services");
    }

    void to_json(nlohmann::json &j, const Patch &patch) {
        j = nlohmann::json::object();
        j["action"] = patch.action;
        if (patch.document) {
            j["document"] = *patch.document;
        }
        putArray(j, "services", patch.services);
        putArray(j, "ids", patch.ids);
        putArray(j, "publicKeys", patch.public_keys);
    }

    void from_json(const nlohmann::json &j, Patch &patch) {
        patch = Patch();
        patch.action = j.at("action").get<Action>();
        if (j.contains("document") && !j.at("document").is_null()) {
            patch.document = j.at("document").get<PatchDocument>();
        }
        patch.services = flex::get<Service>(j, "services");
        patch.ids = flex::get<dp::String>(j, "ids");
        patch.public_keys = flex::get<VmWithPurpose>(j, "publicKeys");
    }

    dp::Result<Patch, dp::Error> parsePatch(const std::string &text) {
        try {
            auto j = nlohmann::json::parse(text);
            return dp::Result<Patch, dp::Error>::ok(j.get<Patch>());
        } catch (const std::exception &e) {
            return dp::Result<Patch, dp::Error>::err(deserialization_failed(dp::String(e.what())));
        }
    }

    dp::Result<std::vector<Patch>, dp::Error> parsePatches(const std::string &text) {
        try {
            auto j = nlohmann::json::parse(text);
            std::vector<Patch> patches;
            if (j.is_object()) {
                patches.push_back(j.get<Patch>());
            } else if (j.is_array()) {
                for (const auto &p : j) {
                    patches.push_back(p.get<Patch>());
                }
            } else {
                return dp::Result<std::vector<Patch>, dp::Error>::err(
                    deserialization_failed("Patch list must be an object or an array"));
            }
            return dp::Result<std::vector<Patch>, dp::Error>::ok(patches);
        } catch (const std::exception &e) {
            return dp::Result<std::vector<Patch>, dp::Error>::err(deserialization_failed(dp::String(e.what())));
        }
    }

    std::string patchesToJson(const std::vector<Patch> &patches, int indent) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto &p : patches) {
            arr.push_back(p);
        }
        return arr.dump(indent);
    }

    // === Document ===

    void to_json(nlohmann::json &j, const DidDocument &doc) {
        j = nlohmann::json::object();
        j["@context"] = flex::toJson(doc.getContext());
        j["id"] = doc.getId();

        auto controllers = doc.getControllers();
        if (!controllers.empty()) {
            j["controller"] = controllers.size() == 1 ? nlohmann::json(controllers[0]) : nlohmann::json(controllers);
        }
        auto akas = doc.getAlsoKnownAs();
        if (!akas.empty()) {
            j["alsoKnownAs"] = akas;
        }

        putArray(j, "verificationMethod", doc.getVerificationMethods());
        flex::put(j, "authentication", doc.getAuthentication());
        flex::put(j, "assertionMethod", doc.getAssertionMethod());
        flex::put(j, "keyAgreement", doc.getKeyAgreement());
        flex::put(j, "capabilityDelegation", doc.getCapabilityDelegation());
        flex::put(j, "capabilityInvocation", doc.getCapabilityInvocation());
        putArray(j, "service", doc.getServices());
    }

    void from_json(const nlohmann::json &j, DidDocument &doc) {
        doc = DidDocument();
        doc.id_ = getString(j, "id");
        if (auto context = flex::get<Context>(j, "@context")) {
            doc.context_ = *context;
        }
        doc.controller_ = collapse(flex::get<dp::String>(j, "controller"));
        doc.also_known_as_ = collapse(flex::get<dp::String>(j, "alsoKnownAs"));
        doc.verification_method_ = flex::get<VerificationMethod>(j, "verificationMethod");
        doc.authentication_ = collapse(flex::get<VmRelationship>(j, "authentication"));
        doc.assertion_method_ = collapse(flex::get<VmRelationship>(j, "assertionMethod"));
        doc.key_agreement_ = collapse(flex::get<VmRelationship>(j, "keyAgreement"));
        doc.capability_delegation_ = collapse(flex::get<VmRelationship>(j, "capabilityDelegation"));
        doc.capability_invocation_ = collapse(flex::get<VmRelationship>(j, "capabilityInvocation"));
        doc.service_ = flex::get<Service>(j, "service");
    }

    nlohmann::json DidDocument::toJson() const { return nlohmann::json(*this); }

    std::string DidDocument::toJsonString(int indent) const { return toJson().dump(indent); }

    dp::Result<DidDocument, dp::Error> DidDocument::fromJson(const nlohmann::json &j) {
        if (!j.is_object()) {
            return dp::Result<DidDocument, dp::Error>::err(deserialization_failed("DID document must be an object"));
        }
        try {
            return dp::Result<DidDocument, dp::Error>::ok(j.get<DidDocument>());
        } catch (const std::exception &e) {
            return dp::Result<DidDocument, dp::Error>::err(deserialization_failed(dp::String(e.what())));
        }
    }

    dp::Result<DidDocument, dp::Error> DidDocument::fromJsonString(const std::string &text) {
        try {
            return fromJson(nlohmann::json::parse(text));
        } catch (const std::exception &e) {
            return dp::Result<DidDocument, dp::Error>::err(deserialization_failed(dp::String(e.what())));
        }
    }

} // namespace didkit
