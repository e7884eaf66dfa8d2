#pragma once

#include "verification_method.hpp"
#include <datapod/datapod.hpp>
#include <optional>
#include <string>

namespace didkit {

    /// How a relationship entry names its verification method
    enum class RelationshipKind : dp::u8 {
        Reference = 0, // Key ID pointing into the document's verificationMethod list
        Embedded = 1,  // Full verification method inline
    };

    /// An entry in one of the five verification relationship lists.
    ///
    /// Patching only ever creates and removes Reference entries. Embedded
    /// entries survive patching untouched: they carry no key ID, so removal
    /// requests never match them.
    struct VmRelationship {
        dp::String key_id;
        std::optional<VerificationMethod> verification_method;

        VmRelationship() = default;

        /// Reference to a key by ID
        inline static VmRelationship reference(const std::string &key_id) {
            VmRelationship rel;
            rel.key_id = dp::String(key_id.c_str());
            return rel;
        }

        /// Reference to an existing verification method
        inline static VmRelationship reference(const VerificationMethod &vm) { return reference(vm.getId()); }

        /// Verification method embedded in the relationship list
        inline static VmRelationship embedded(const VerificationMethod &vm) {
            VmRelationship rel;
            rel.verification_method = vm;
            return rel;
        }

        inline RelationshipKind getKind() const {
            return verification_method ? RelationshipKind::Embedded : RelationshipKind::Reference;
        }

        inline bool isReference() const { return getKind() == RelationshipKind::Reference; }

        inline std::string getKeyId() const { return std::string(key_id.c_str()); }

        /// Entries are the same when their key IDs match
        inline bool operator==(const VmRelationship &other) const { return key_id == other.key_id; }

        inline bool operator!=(const VmRelationship &other) const { return !(*this == other); }
    };

} // namespace didkit
