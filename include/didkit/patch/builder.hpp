#pragma once

#include "patch.hpp"
#include <datapod/datapod.hpp>
#include <didkit/common/error.hpp>
#include <optional>
#include <string>

namespace didkit {

    /// Builds and validates a patch.
    ///
    /// The action is fixed at construction and decides which setters are
    /// legal. A setter called for the wrong action fails straight away with
    /// ERR_INVALID_PATCH; malformed IDs and duplicate purposes fail with
    /// ERR_INVALID_INPUT. A failed setter leaves the builder unchanged.
    class PatchBuilder {
      public:
        explicit PatchBuilder(Action action);

        inline Action getAction() const { return action_; }

        /// Set the replacement keys and services. Replace only.
        dp::Result<void, dp::Error> document(const PatchDocument &document);

        /// Add a service. AddServices only.
        dp::Result<void, dp::Error> service(const Service &service);

        /// Add a public key with its purposes. AddPublicKeys only. The key ID
        /// must be well formed, unique within this builder, and the purposes
        /// must not repeat.
        dp::Result<void, dp::Error> publicKey(const VmWithPurpose &key);

        /// Add a key or service ID to remove. RemovePublicKeys or RemoveServices only.
        dp::Result<void, dp::Error> id(const std::string &id);

        /// Produce the patch with only the action's field populated
        dp::Result<Patch, dp::Error> build() const;

        /// Check an ID uses only characters valid in a DID URL or path fragment:
        /// alphanumerics and _-?#:/=&+%
        static dp::Result<void, dp::Error> checkKeyId(const std::string &id);

      private:
        Action action_;
        std::optional<PatchDocument> document_;
        dp::Vector<Service> services_;
        dp::Vector<dp::String> ids_;
        dp::Vector<VmWithPurpose> public_keys_;
    };

} // namespace didkit
