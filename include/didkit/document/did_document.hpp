#pragma once

#include "context.hpp"
#include "relationship.hpp"
#include "service.hpp"
#include "verification_method.hpp"
#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <didkit/patch/patch.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace didkit {

    /// DID Document following W3C DID Core v1.0
    ///
    /// Verification methods, the five verification relationships and services
    /// change only through applyPatches(). An absent list and an empty list are
    /// never both possible: patching collapses empty lists to absent.
    class DidDocument {
      public:
        DidDocument() = default;

        /// Create an empty document for `id` with the base DID context
        inline explicit DidDocument(const std::string &id) : id_(dp::String(id.c_str())) {
            context_.push_back(Context::fromUrl(DID_CONTEXT));
        }

        // === Core Properties ===

        inline std::string getId() const { return std::string(id_.c_str()); }

        inline void setId(const std::string &id) { id_ = dp::String(id.c_str()); }

        inline const dp::Vector<Context> &getContext() const { return context_; }

        inline void addContext(const Context &context) { context_.push_back(context); }

        /// Get controller DIDs as strings
        inline std::vector<std::string> getControllers() const {
            std::vector<std::string> result;
            if (controller_) {
                for (const auto &c : *controller_) {
                    result.push_back(std::string(c.c_str()));
                }
            }
            return result;
        }

        /// Set controller - replaces existing
        inline void setController(const std::string &controller) {
            controller_ = dp::Vector<dp::String>();
            controller_->push_back(dp::String(controller.c_str()));
        }

        inline void addController(const std::string &controller) {
            if (!controller_) {
                controller_ = dp::Vector<dp::String>();
            }
            controller_->push_back(dp::String(controller.c_str()));
        }

        inline bool isController(const std::string &did) const {
            for (const auto &c : getControllers()) {
                if (c == did) {
                    return true;
                }
            }
            return false;
        }

        inline std::vector<std::string> getAlsoKnownAs() const {
            std::vector<std::string> result;
            if (also_known_as_) {
                for (const auto &aka : *also_known_as_) {
                    result.push_back(std::string(aka.c_str()));
                }
            }
            return result;
        }

        inline void addAlsoKnownAs(const std::string &aka) {
            if (!also_known_as_) {
                also_known_as_ = dp::Vector<dp::String>();
            }
            also_known_as_->push_back(dp::String(aka.c_str()));
        }

        // === Verification Methods ===

        inline const std::optional<dp::Vector<VerificationMethod>> &getVerificationMethods() const {
            return verification_method_;
        }

        inline dp::Result<VerificationMethod, dp::Error> getVerificationMethod(const std::string &id) const {
            if (verification_method_) {
                for (const auto &vm : *verification_method_) {
                    if (vm.getId() == id) {
                        return dp::Result<VerificationMethod, dp::Error>::ok(vm);
                    }
                }
            }
            return dp::Result<VerificationMethod, dp::Error>::err(
                dp::Error::not_found("Verification method not found"));
        }

        inline bool hasVerificationMethod(const std::string &id) const { return getVerificationMethod(id).is_ok(); }

        // === Verification Relationships ===

        /// Get the entries registered under a purpose; absent when there are none
        inline const std::optional<dp::Vector<VmRelationship>> &getRelationship(KeyPurpose purpose) const {
            switch (purpose) {
            case KeyPurpose::Authentication:
                return authentication_;
            case KeyPurpose::AssertionMethod:
                return assertion_method_;
            case KeyPurpose::KeyAgreement:
                return key_agreement_;
            case KeyPurpose::CapabilityDelegation:
                return capability_delegation_;
            case KeyPurpose::CapabilityInvocation:
                return capability_invocation_;
            }
            return authentication_;
        }

        inline const std::optional<dp::Vector<VmRelationship>> &getAuthentication() const { return authentication_; }

        inline const std::optional<dp::Vector<VmRelationship>> &getAssertionMethod() const {
            return assertion_method_;
        }

        inline const std::optional<dp::Vector<VmRelationship>> &getKeyAgreement() const { return key_agreement_; }

        inline const std::optional<dp::Vector<VmRelationship>> &getCapabilityDelegation() const {
            return capability_delegation_;
        }

        inline const std::optional<dp::Vector<VmRelationship>> &getCapabilityInvocation() const {
            return capability_invocation_;
        }

        /// Key IDs referenced under a purpose, in order (embedded entries excluded)
        inline std::vector<std::string> getRelationshipKeyIds(KeyPurpose purpose) const {
            std::vector<std::string> result;
            const auto &entries = getRelationship(purpose);
            if (entries) {
                for (const auto &rel : *entries) {
                    if (rel.isReference()) {
                        result.push_back(rel.getKeyId());
                    }
                }
            }
            return result;
        }

        inline bool hasRelationship(KeyPurpose purpose, const std::string &key_id) const {
            for (const auto &id : getRelationshipKeyIds(purpose)) {
                if (id == key_id) {
                    return true;
                }
            }
            return false;
        }

        /// Check if a key is used for authentication
        inline bool canAuthenticate(const std::string &key_id) const {
            return hasRelationship(KeyPurpose::Authentication, key_id);
        }

        /// Check if a key is used for assertions
        inline bool canAssert(const std::string &key_id) const {
            return hasRelationship(KeyPurpose::AssertionMethod, key_id);
        }

        // === Services ===

        inline const std::optional<dp::Vector<Service>> &getServices() const { return service_; }

        inline dp::Result<Service, dp::Error> getService(const std::string &id) const {
            if (service_) {
                for (const auto &s : *service_) {
                    if (s.getId() == id) {
                        return dp::Result<Service, dp::Error>::ok(s);
                    }
                }
            }
            return dp::Result<Service, dp::Error>::err(dp::Error::not_found("Service not found"));
        }

        inline bool hasService(const std::string &id) const { return getService(id).is_ok(); }

        // === Patching ===

        /// Apply patches in order. A patch missing its payload is skipped and
        /// nothing after the first replace patch is applied.
        void applyPatches(const std::vector<Patch> &patches);

        /// Apply patches with options. In strict mode a missing payload is
        /// reported and the document is left unchanged.
        dp::Result<void, dp::Error> applyPatches(const std::vector<Patch> &patches, const ApplyOptions &options);

        // === Serialization ===

        /// Serialize to a JSON-LD object
        nlohmann::json toJson() const;

        /// Serialize to JSON text; indent < 0 gives compact output
        std::string toJsonString(int indent = -1) const;

        static dp::Result<DidDocument, dp::Error> fromJson(const nlohmann::json &j);

        static dp::Result<DidDocument, dp::Error> fromJsonString(const std::string &text);

        bool operator==(const DidDocument &other) const;

        inline bool operator!=(const DidDocument &other) const { return !(*this == other); }

      private:
        friend class RelationshipSet;
        friend void from_json(const nlohmann::json &j, DidDocument &doc);

        void applyInOrder(const std::vector<Patch> &patches, bool log_skipped);
        void applyReplace(const Patch &patch);
        void applyAddKeys(const Patch &patch);
        void applyRemoveKeys(const Patch &patch);
        void applyAddServices(const Patch &patch);
        void applyRemoveServices(const Patch &patch);

        dp::String id_;
        dp::Vector<Context> context_;
        std::optional<dp::Vector<dp::String>> controller_;
        std::optional<dp::Vector<dp::String>> also_known_as_;
        std::optional<dp::Vector<VerificationMethod>> verification_method_;
        std::optional<dp::Vector<VmRelationship>> authentication_;
        std::optional<dp::Vector<VmRelationship>> assertion_method_;
        std::optional<dp::Vector<VmRelationship>> key_agreement_;
        std::optional<dp::Vector<VmRelationship>> capability_delegation_;
        std::optional<dp::Vector<VmRelationship>> capability_invocation_;
        std::optional<dp::Vector<Service>> service_;
    };

} // namespace didkit
