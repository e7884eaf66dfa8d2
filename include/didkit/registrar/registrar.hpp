#pragma once

#include "key.hpp"
#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <didkit/document/did_document.hpp>
#include <didkit/patch/builder.hpp>
#include <memory>
#include <string>
#include <vector>

namespace didkit {

    /// How a registrar encodes the public key of a new verification method
    enum class PublicKeyEncoding : dp::u8 {
        Jwk = 0,
        Multibase = 1,
    };

    /// Registrar configuration
    struct RegistrarConfig {
        // Controller written into new verification methods
        std::string controller;

        // Relationships the initial key is registered under
        std::vector<KeyPurpose> purposes = {KeyPurpose::Authentication, KeyPurpose::AssertionMethod};

        std::string key_type = "Ed25519VerificationKey2020";
        PublicKeyEncoding encoding = PublicKeyEncoding::Jwk;
    };

    /// Creates and updates DID documents through patches.
    ///
    /// Documents are returned without an ID: assigning one and publishing the
    /// document belong to the DID method's hosting layer.
    class Registrar {
      public:
        inline explicit Registrar(std::shared_ptr<KeyRing> keyring, const RegistrarConfig &config = RegistrarConfig{})
            : keyring_(std::move(keyring)), config_(config) {}

        /// Create a document with one new key and the given services
        inline dp::Result<DidDocument, dp::Error> create(const std::vector<Service> &services = {}) const {
            if (!keyring_) {
                return dp::Result<DidDocument, dp::Error>::err(key_unavailable("Registrar has no key ring"));
            }
            auto key_result = keyring_->nextKey();
            if (key_result.is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(key_result.error());
            }
            const auto &key = key_result.value();

            DidDocument doc("");

            auto key_patch = Patch::builder(Action::AddPublicKeys);
            auto add = key_patch.publicKey(VmWithPurpose(methodFor(key), config_.purposes));
            if (add.is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(add.error());
            }
            auto patch = key_patch.build();
            if (patch.is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(patch.error());
            }
            doc.applyPatches({patch.value()});

            if (!services.empty()) {
                auto service_patch = Patch::builder(Action::AddServices);
                for (const auto &s : services) {
                    auto added = service_patch.service(s);
                    if (added.is_err()) {
                        return dp::Result<DidDocument, dp::Error>::err(added.error());
                    }
                }
                auto built = service_patch.build();
                if (built.is_err()) {
                    return dp::Result<DidDocument, dp::Error>::err(built.error());
                }
                doc.applyPatches({built.value()});
            }

            return dp::Result<DidDocument, dp::Error>::ok(doc);
        }

        /// Apply patches to a copy of `doc` and return the copy
        inline dp::Result<DidDocument, dp::Error> update(const DidDocument &doc, const std::vector<Patch> &patches,
                                                         const ApplyOptions &options = ApplyOptions{}) const {
            DidDocument updated = doc;
            auto result = updated.applyPatches(patches, options);
            if (result.is_err()) {
                return dp::Result<DidDocument, dp::Error>::err(result.error());
            }
            return dp::Result<DidDocument, dp::Error>::ok(updated);
        }

        /// Deactivation is done by the hosting layer
        inline dp::Result<void, dp::Error> deactivate(const std::string &did) const {
            return dp::Result<void, dp::Error>::err(
                not_supported(dp::String(("Deactivation is not supported by this registrar: " + did).c_str())));
        }

        /// Recovery is done by the hosting layer
        inline dp::Result<void, dp::Error> recover(const DidDocument &doc) const {
            return dp::Result<void, dp::Error>::err(
                not_supported(dp::String(("Recovery is not supported by this registrar: " + doc.getId()).c_str())));
        }

        inline const RegistrarConfig &getConfig() const { return config_; }

      private:
        /// Verification method for a new key; the ID is the first 16 hex digits of the key hash
        inline VerificationMethod methodFor(const Key &key) const {
            auto id = key.getId().substr(0, 16);
            if (config_.encoding == PublicKeyEncoding::Multibase) {
                return VerificationMethod::withMultibase(id, config_.key_type, config_.controller,
                                                         key.getPublicKeyMultibase());
            }
            return VerificationMethod::withJwk(id, config_.key_type, config_.controller, key.getPublicKeyJwk());
        }

        std::shared_ptr<KeyRing> keyring_;
        RegistrarConfig config_;
    };

} // namespace didkit
