#pragma once

#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <didkit/common/flexvec.hpp>
#include <didkit/document/service.hpp>
#include <didkit/document/verification_method.hpp>
#include <optional>
#include <string>

namespace didkit {

    class DidDocument;
    class PatchBuilder;

    /// Types of patches (updates) that can be applied to a DID document
    enum class Action : dp::u8 {
        Replace = 0,          // Create a document or replace all keys and services
        AddPublicKeys = 1,    // Add one or more public keys
        RemovePublicKeys = 2, // Remove public keys by ID
        AddServices = 3,      // Add one or more services
        RemoveServices = 4,   // Remove services by ID
    };

    /// Get the wire tag for an action
    inline std::string actionToString(Action action) {
        switch (action) {
        case Action::Replace:
            return "replace";
        case Action::AddPublicKeys:
            return "add-public-keys";
        case Action::RemovePublicKeys:
            return "remove-public-keys";
        case Action::AddServices:
            return "add-services";
        case Action::RemoveServices:
            return "remove-services";
        default:
            return "unknown";
        }
    }

    /// Parse an action from its wire tag
    inline dp::Result<Action, dp::Error> actionFromString(const std::string &value) {
        if (value == "replace") {
            return dp::Result<Action, dp::Error>::ok(Action::Replace);
        }
        if (value == "add-public-keys") {
            return dp::Result<Action, dp::Error>::ok(Action::AddPublicKeys);
        }
        if (value == "remove-public-keys") {
            return dp::Result<Action, dp::Error>::ok(Action::RemovePublicKeys);
        }
        if (value == "add-services") {
            return dp::Result<Action, dp::Error>::ok(Action::AddServices);
        }
        if (value == "remove-services") {
            return dp::Result<Action, dp::Error>::ok(Action::RemoveServices);
        }
        return dp::Result<Action, dp::Error>::err(invalid_input(dp::String(("Unknown patch action: " + value).c_str())));
    }

    /// Verification method with the relationships it should be registered under
    struct VmWithPurpose {
        VerificationMethod verification_method;
        std::optional<dp::Vector<KeyPurpose>> purposes;

        VmWithPurpose() = default;

        inline explicit VmWithPurpose(const VerificationMethod &vm) : verification_method(vm) {}

        inline VmWithPurpose(const VerificationMethod &vm, const std::vector<KeyPurpose> &key_purposes)
            : verification_method(vm), purposes(dp::Vector<KeyPurpose>(key_purposes.begin(), key_purposes.end())) {}

        inline std::string getId() const { return verification_method.getId(); }

        inline bool operator==(const VmWithPurpose &other) const {
            return verification_method == other.verification_method && sameSequence(purposes, other.purposes);
        }

        inline bool operator!=(const VmWithPurpose &other) const { return !(*this == other); }
    };

    /// Keys and services that make up a whole document, carried by a replace patch
    struct PatchDocument {
        std::optional<dp::Vector<VmWithPurpose>> public_keys;
        std::optional<dp::Vector<Service>> services;

        PatchDocument() = default;

        /// Build a replace payload from an existing document. Methods are
        /// carried without purposes.
        static PatchDocument fromDocument(const DidDocument &doc);

        inline bool operator==(const PatchDocument &other) const {
            return sameSequence(public_keys, other.public_keys) && sameSequence(services, other.services);
        }

        inline bool operator!=(const PatchDocument &other) const { return !(*this == other); }
    };

    /// A single typed update to a DID document. Only the field matching the
    /// action is populated:
    ///   Replace          -> document
    ///   AddPublicKeys    -> public_keys
    ///   RemovePublicKeys -> ids
    ///   AddServices      -> services
    ///   RemoveServices   -> ids
    struct Patch {
        Action action{Action::Replace};
        std::optional<PatchDocument> document;
        std::optional<dp::Vector<Service>> services;
        std::optional<dp::Vector<dp::String>> ids;
        std::optional<dp::Vector<VmWithPurpose>> public_keys;

        Patch() = default;

        /// Start building a validated patch for `action`
        static PatchBuilder builder(Action action);

        /// Whether the field this patch's action reads is present
        inline bool hasPayload() const {
            switch (action) {
            case Action::Replace:
                return document.has_value();
            case Action::AddPublicKeys:
                return public_keys.has_value();
            case Action::RemovePublicKeys:
            case Action::RemoveServices:
                return ids.has_value();
            case Action::AddServices:
                return services.has_value();
            }
            return false;
        }

        inline bool operator==(const Patch &other) const {
            if (action != other.action || document.has_value() != other.document.has_value()) {
                return false;
            }
            if (document && *document != *other.document) {
                return false;
            }
            return sameSequence(services, other.services) && sameSequence(ids, other.ids) &&
                   sameSequence(public_keys, other.public_keys);
        }

        inline bool operator!=(const Patch &other) const { return !(*this == other); }
    };

    /// Patch application settings
    struct ApplyOptions {
        // Reject a patch whose action payload is missing instead of skipping it
        bool strict = false;
        // Print a line for every patch skipped or ignored
        bool log_skipped = false;
    };

} // namespace didkit
