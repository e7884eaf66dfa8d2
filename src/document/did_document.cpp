#include <didkit/document/did_document.hpp>

namespace didkit {

    bool DidDocument::operator==(const DidDocument &other) const {
        return id_ == other.id_ && sameSequence(context_, other.context_) &&
               sameSequence(controller_, other.controller_) && sameSequence(also_known_as_, other.also_known_as_) &&
               sameSequence(verification_method_, other.verification_method_) &&
               sameSequence(authentication_, other.authentication_) &&
               sameSequence(assertion_method_, other.assertion_method_) &&
               sameSequence(key_agreement_, other.key_agreement_) &&
               sameSequence(capability_delegation_, other.capability_delegation_) &&
               sameSequence(capability_invocation_, other.capability_invocation_) &&
               sameSequence(service_, other.service_);
    }

} // namespace didkit
