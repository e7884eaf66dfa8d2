#pragma once

#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <optional>
#include <string>

namespace didkit {

    /// Verification relationship a key is registered under
    enum class KeyPurpose : dp::u8 {
        Authentication = 0,       // Prove control of DID
        AssertionMethod = 1,      // Issue claims/credentials
        KeyAgreement = 2,         // Establish encrypted channel
        CapabilityDelegation = 3, // Delegate capabilities
        CapabilityInvocation = 4, // Invoke capabilities
    };

    /// Get the JSON property name for a key purpose
    inline std::string keyPurposeToString(KeyPurpose purpose) {
        switch (purpose) {
        case KeyPurpose::Authentication:
            return "authentication";
        case KeyPurpose::AssertionMethod:
            return "assertionMethod";
        case KeyPurpose::KeyAgreement:
            return "keyAgreement";
        case KeyPurpose::CapabilityDelegation:
            return "capabilityDelegation";
        case KeyPurpose::CapabilityInvocation:
            return "capabilityInvocation";
        default:
            return "unknown";
        }
    }

    /// Parse a key purpose from its JSON property name
    inline dp::Result<KeyPurpose, dp::Error> keyPurposeFromString(const std::string &value) {
        if (value == "authentication") {
            return dp::Result<KeyPurpose, dp::Error>::ok(KeyPurpose::Authentication);
        }
        if (value == "assertionMethod") {
            return dp::Result<KeyPurpose, dp::Error>::ok(KeyPurpose::AssertionMethod);
        }
        if (value == "keyAgreement") {
            return dp::Result<KeyPurpose, dp::Error>::ok(KeyPurpose::KeyAgreement);
        }
        if (value == "capabilityDelegation") {
            return dp::Result<KeyPurpose, dp::Error>::ok(KeyPurpose::CapabilityDelegation);
        }
        if (value == "capabilityInvocation") {
            return dp::Result<KeyPurpose, dp::Error>::ok(KeyPurpose::CapabilityInvocation);
        }
        return dp::Result<KeyPurpose, dp::Error>::err(
            invalid_input(dp::String(("Unknown key purpose: " + value).c_str())));
    }

    /// Which kind of key material a verification method carries
    enum class PublicKeyFormat : dp::u8 {
        None = 0,
        Jwk = 1,
        Multibase = 2,
    };

    /// Public key in JSON Web Key form. Empty members are not serialized.
    struct PublicKeyJwk {
        dp::String kty; // Key type, e.g. "OKP" or "EC"
        dp::String crv; // Curve, e.g. "Ed25519"
        dp::String x;   // base64url X coordinate
        dp::String y;   // base64url Y coordinate (EC keys only)
        dp::String alg;
        dp::String use;
        dp::String kid;

        PublicKeyJwk() = default;

        inline PublicKeyJwk(const std::string &kty, const std::string &crv, const std::string &x,
                            const std::string &y = "")
            : kty(dp::String(kty.c_str())), crv(dp::String(crv.c_str())), x(dp::String(x.c_str())),
              y(dp::String(y.c_str())) {}

        inline std::string getKty() const { return std::string(kty.c_str()); }
        inline std::string getCrv() const { return std::string(crv.c_str()); }
        inline std::string getX() const { return std::string(x.c_str()); }
        inline std::string getY() const { return std::string(y.c_str()); }

        inline bool operator==(const PublicKeyJwk &other) const {
            return kty == other.kty && crv == other.crv && x == other.x && y == other.y && alg == other.alg &&
                   use == other.use && kid == other.kid;
        }

        inline bool operator!=(const PublicKeyJwk &other) const { return !(*this == other); }
    };

    /// A verification method represents cryptographic material for DID operations
    /// Following W3C DID Core v1.0 specification
    struct VerificationMethod {
        dp::String id;         // e.g. "did:example:123#key-1" or a bare fragment
        dp::String controller; // DID that controls this key
        dp::String type;       // e.g. "Ed25519VerificationKey2020", "JsonWebKey2020"
        std::optional<PublicKeyJwk> public_key_jwk;
        std::optional<dp::String> public_key_multibase;

        VerificationMethod() = default;

        inline VerificationMethod(const std::string &id, const std::string &type, const std::string &controller)
            : id(dp::String(id.c_str())), controller(dp::String(controller.c_str())), type(dp::String(type.c_str())) {}

        /// Create a method carrying a JWK
        inline static VerificationMethod withJwk(const std::string &id, const std::string &type,
                                                 const std::string &controller, const PublicKeyJwk &jwk) {
            VerificationMethod vm(id, type, controller);
            vm.setPublicKeyJwk(jwk);
            return vm;
        }

        /// Create a method carrying a multibase-encoded key
        inline static VerificationMethod withMultibase(const std::string &id, const std::string &type,
                                                       const std::string &controller, const std::string &multibase) {
            VerificationMethod vm(id, type, controller);
            vm.setPublicKeyMultibase(multibase);
            return vm;
        }

        inline std::string getId() const { return std::string(id.c_str()); }

        inline std::string getController() const { return std::string(controller.c_str()); }

        inline std::string getType() const { return std::string(type.c_str()); }

        /// Key material is one of JWK or multibase; setting one clears the other
        inline void setPublicKeyJwk(const PublicKeyJwk &jwk) {
            public_key_jwk = jwk;
            public_key_multibase.reset();
        }

        inline void setPublicKeyMultibase(const std::string &multibase) {
            public_key_multibase = dp::String(multibase.c_str());
            public_key_jwk.reset();
        }

        inline PublicKeyFormat getPublicKeyFormat() const {
            if (public_key_jwk) {
                return PublicKeyFormat::Jwk;
            }
            if (public_key_multibase) {
                return PublicKeyFormat::Multibase;
            }
            return PublicKeyFormat::None;
        }

        inline std::string getPublicKeyMultibase() const {
            return public_key_multibase ? std::string(public_key_multibase->c_str()) : "";
        }

        inline bool operator==(const VerificationMethod &other) const {
            if (!(id == other.id && controller == other.controller && type == other.type)) {
                return false;
            }
            if (public_key_jwk.has_value() != other.public_key_jwk.has_value() ||
                public_key_multibase.has_value() != other.public_key_multibase.has_value()) {
                return false;
            }
            if (public_key_jwk && *public_key_jwk != *other.public_key_jwk) {
                return false;
            }
            return !public_key_multibase || *public_key_multibase == *other.public_key_multibase;
        }

        inline bool operator!=(const VerificationMethod &other) const { return !(*this == other); }
    };

} // namespace didkit
