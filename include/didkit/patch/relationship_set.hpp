#pragma once

#include <datapod/datapod.hpp>
#include <didkit/document/did_document.hpp>
#include <didkit/document/relationship.hpp>
#include <optional>

namespace didkit {

    /// Scratch copy of a document's five verification relationship lists.
    ///
    /// Built from a document, edited with push()/remove(), then flushed back
    /// in one go. Lives for a single patch only.
    class RelationshipSet {
      public:
        RelationshipSet() = default;

        /// Copy the document's relationship lists; absent lists start empty
        inline static RelationshipSet fromDocument(const DidDocument &doc) {
            RelationshipSet set;
            set.authentication_ = copyOf(doc.authentication_);
            set.assertion_method_ = copyOf(doc.assertion_method_);
            set.key_agreement_ = copyOf(doc.key_agreement_);
            set.capability_delegation_ = copyOf(doc.capability_delegation_);
            set.capability_invocation_ = copyOf(doc.capability_invocation_);
            return set;
        }

        /// Append an entry under a purpose. Duplicates are kept.
        inline void push(KeyPurpose purpose, const VmRelationship &entry) { list(purpose).push_back(entry); }

        /// Drop every reference entry matching `entry`'s key ID from all five lists
        inline void remove(const VmRelationship &entry) {
            removeFrom(authentication_, entry);
            removeFrom(assertion_method_, entry);
            removeFrom(key_agreement_, entry);
            removeFrom(capability_delegation_, entry);
            removeFrom(capability_invocation_, entry);
        }

        /// Write the lists back; an empty list becomes absent
        inline void flushInto(DidDocument &doc) const {
            doc.authentication_ = collapse(authentication_);
            doc.assertion_method_ = collapse(assertion_method_);
            doc.key_agreement_ = collapse(key_agreement_);
            doc.capability_delegation_ = collapse(capability_delegation_);
            doc.capability_invocation_ = collapse(capability_invocation_);
        }

        inline const dp::Vector<VmRelationship> &get(KeyPurpose purpose) const {
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

      private:
        inline dp::Vector<VmRelationship> &list(KeyPurpose purpose) {
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

        inline static dp::Vector<VmRelationship> copyOf(const std::optional<dp::Vector<VmRelationship>> &entries) {
            return entries ? *entries : dp::Vector<VmRelationship>();
        }

        inline static std::optional<dp::Vector<VmRelationship>> collapse(const dp::Vector<VmRelationship> &entries) {
            if (entries.empty()) {
                return std::nullopt;
            }
            return entries;
        }

        inline static void removeFrom(dp::Vector<VmRelationship> &entries, const VmRelationship &entry) {
            dp::Vector<VmRelationship> kept;
            for (const auto &e : entries) {
                if (e.isReference() && e == entry) {
                    continue;
                }
                kept.push_back(e);
            }
            entries = kept;
        }

        dp::Vector<VmRelationship> authentication_;
        dp::Vector<VmRelationship> assertion_method_;
        dp::Vector<VmRelationship> key_agreement_;
        dp::Vector<VmRelationship> capability_delegation_;
        dp::Vector<VmRelationship> capability_invocation_;
    };

} // namespace didkit
