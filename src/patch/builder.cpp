#include <didkit/patch/builder.hpp>

namespace didkit {

    namespace {

        inline bool isKeyIdChar(char c) {
            if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) {
                return true;
            }
            switch (c) {
            case '_':
            case '-':
            case '?':
            case '#':
            case ':':
            case '/':
            case '=':
            case '&':
            case '+':
            case '%':
                return true;
            default:
                return false;
            }
        }

        inline dp::Result<void, dp::Error> wrongAction(const std::string &what, Action action) {
            return dp::Result<void, dp::Error>::err(
                invalid_patch(dp::String((what + " cannot be added to a " + actionToString(action) + " patch").c_str())));
        }

    } // namespace

    PatchBuilder Patch::builder(Action action) { return PatchBuilder(action); }

    PatchBuilder::PatchBuilder(Action action) : action_(action) {}

    dp::Result<void, dp::Error> PatchBuilder::document(const PatchDocument &document) {
        if (action_ != Action::Replace) {
            return wrongAction("A document", action_);
        }
        document_ = document;
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> PatchBuilder::service(const Service &service) {
        if (action_ != Action::AddServices) {
            return wrongAction("A service", action_);
        }
        services_.push_back(service);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> PatchBuilder::publicKey(const VmWithPurpose &key) {
        if (action_ != Action::AddPublicKeys) {
            return wrongAction("A public key", action_);
        }

        auto check = checkKeyId(key.getId());
        if (check.is_err()) {
            return check;
        }

        // Purposes must not repeat within one key
        if (key.purposes) {
            bool seen[5] = {false, false, false, false, false};
            for (const auto &p : *key.purposes) {
                auto slot = static_cast<size_t>(p);
                if (slot >= 5) {
                    return dp::Result<void, dp::Error>::err(invalid_input("Unknown key purpose"));
                }
                if (seen[slot]) {
                    return dp::Result<void, dp::Error>::err(
                        invalid_input(dp::String(("Duplicate key purpose: " + keyPurposeToString(p)).c_str())));
                }
                seen[slot] = true;
            }
        }

        for (const auto &k : public_keys_) {
            if (k.getId() == key.getId()) {
                return dp::Result<void, dp::Error>::err(
                    invalid_patch(dp::String(("Duplicate key ID: " + key.getId()).c_str())));
            }
        }

        public_keys_.push_back(key);
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<void, dp::Error> PatchBuilder::id(const std::string &id) {
        if (action_ != Action::RemovePublicKeys && action_ != Action::RemoveServices) {
            return wrongAction("An ID", action_);
        }

        auto check = checkKeyId(id);
        if (check.is_err()) {
            return check;
        }

        for (const auto &existing : ids_) {
            if (std::string(existing.c_str()) == id) {
                return dp::Result<void, dp::Error>::err(invalid_patch(dp::String(("Duplicate ID: " + id).c_str())));
            }
        }

        ids_.push_back(dp::String(id.c_str()));
        return dp::Result<void, dp::Error>::ok();
    }

    dp::Result<Patch, dp::Error> PatchBuilder::build() const {
        Patch patch;
        patch.action = action_;

        switch (action_) {
        case Action::Replace:
            if (!document_) {
                return dp::Result<Patch, dp::Error>::err(
                    invalid_patch("A replace patch must contain a patch document"));
            }
            patch.document = document_;
            break;
        case Action::AddPublicKeys:
            if (public_keys_.empty()) {
                return dp::Result<Patch, dp::Error>::err(
                    invalid_patch("An add-public-keys patch must contain at least one key"));
            }
            patch.public_keys = public_keys_;
            break;
        case Action::RemovePublicKeys:
            if (ids_.empty()) {
                return dp::Result<Patch, dp::Error>::err(
                    invalid_patch("A remove-public-keys patch must contain at least one ID"));
            }
            patch.ids = ids_;
            break;
        case Action::AddServices:
            if (services_.empty()) {
                return dp::Result<Patch, dp::Error>::err(
                    invalid_patch("An add-services patch must contain at least one service"));
            }
            patch.services = services_;
            break;
        case Action::RemoveServices:
            if (ids_.empty()) {
                return dp::Result<Patch, dp::Error>::err(
                    invalid_patch("A remove-services patch must contain at least one ID"));
            }
            patch.ids = ids_;
            break;
        }

        return dp::Result<Patch, dp::Error>::ok(patch);
    }

    dp::Result<void, dp::Error> PatchBuilder::checkKeyId(const std::string &id) {
        for (char c : id) {
            if (!isKeyIdChar(c)) {
                return dp::Result<void, dp::Error>::err(invalid_input(
                    dp::String(("ID contains invalid characters for a key. Must be a DID URL or path fragment: " + id)
                                   .c_str())));
            }
        }
        return dp::Result<void, dp::Error>::ok();
    }

} // namespace didkit
