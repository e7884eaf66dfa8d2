#include <didkit/document/did_document.hpp>
#include <didkit/patch/relationship_set.hpp>
#include <iostream>

namespace didkit {

    namespace {

        inline bool containsId(const dp::Vector<dp::String> &ids, const dp::String &id) {
            for (const auto &i : ids) {
                if (i == id) {
                    return true;
                }
            }
            return false;
        }

        template <typename T> inline std::optional<dp::Vector<T>> collapse(const dp::Vector<T> &items) {
            if (items.empty()) {
                return std::nullopt;
            }
            return items;
        }

    } // namespace

    PatchDocument PatchDocument::fromDocument(const DidDocument &doc) {
        PatchDocument patch_doc;
        patch_doc.services = doc.getServices();

        dp::Vector<VmWithPurpose> public_keys;
        if (doc.getVerificationMethods()) {
            for (const auto &vm : *doc.getVerificationMethods()) {
                public_keys.push_back(VmWithPurpose(vm));
            }
        }
        patch_doc.public_keys = collapse(public_keys);
        return patch_doc;
    }

    void DidDocument::applyPatches(const std::vector<Patch> &patches) { applyInOrder(patches, false); }

    dp::Result<void, dp::Error> DidDocument::applyPatches(const std::vector<Patch> &patches,
                                                          const ApplyOptions &options) {
        if (options.strict) {
            // Only patches up to the first replace are ever applied
            for (size_t i = 0; i < patches.size(); i++) {
                if (!patches[i].hasPayload()) {
                    auto msg = "Patch " + std::to_string(i) + " (" + actionToString(patches[i].action) +
                               ") has no payload";
                    if (options.log_skipped) {
                        std::cout << "Rejected patches: " << msg << std::endl;
                    }
                    return dp::Result<void, dp::Error>::err(missing_payload(dp::String(msg.c_str())));
                }
                if (patches[i].action == Action::Replace) {
                    break;
                }
            }
        }

        applyInOrder(patches, options.log_skipped);
        return dp::Result<void, dp::Error>::ok();
    }

    void DidDocument::applyInOrder(const std::vector<Patch> &patches, bool log_skipped) {
        for (size_t i = 0; i < patches.size(); i++) {
            const auto &patch = patches[i];

            if (log_skipped && !patch.hasPayload()) {
                std::cout << "Skipping " << actionToString(patch.action) << " patch " << i << ": no payload"
                          << std::endl;
            }

            switch (patch.action) {
            case Action::Replace:
                applyReplace(patch);
                // A replace is total: nothing after it in the batch is applied
                if (log_skipped && i + 1 < patches.size()) {
                    std::cout << "Ignoring " << (patches.size() - i - 1) << " patch(es) after replace" << std::endl;
                }
                return;
            case Action::AddPublicKeys:
                applyAddKeys(patch);
                break;
            case Action::RemovePublicKeys:
                applyRemoveKeys(patch);
                break;
            case Action::AddServices:
                applyAddServices(patch);
                break;
            case Action::RemoveServices:
                applyRemoveServices(patch);
                break;
            }
        }
    }

    void DidDocument::applyReplace(const Patch &patch) {
        if (!patch.document) {
            return;
        }
        const auto &replacement = *patch.document;

        if (replacement.public_keys) {
            dp::Vector<VerificationMethod> methods;
            RelationshipSet relationships;
            for (const auto &k : *replacement.public_keys) {
                methods.push_back(k.verification_method);
                if (k.purposes) {
                    auto ref = VmRelationship::reference(k.verification_method);
                    for (const auto &p : *k.purposes) {
                        relationships.push(p, ref);
                    }
                }
            }
            verification_method_ = collapse(methods);
            relationships.flushInto(*this);
        }

        if (replacement.services) {
            service_ = collapse(*replacement.services);
        }
    }

    void DidDocument::applyAddKeys(const Patch &patch) {
        if (!patch.public_keys) {
            return;
        }

        dp::Vector<VerificationMethod> methods;
        if (verification_method_) {
            methods = *verification_method_;
        }
        auto relationships = RelationshipSet::fromDocument(*this);

        for (const auto &k : *patch.public_keys) {
            methods.push_back(k.verification_method);
            if (k.purposes) {
                auto ref = VmRelationship::reference(k.verification_method);
                for (const auto &p : *k.purposes) {
                    relationships.push(p, ref);
                }
            }
        }

        verification_method_ = collapse(methods);
        relationships.flushInto(*this);
    }

    void DidDocument::applyRemoveKeys(const Patch &patch) {
        if (!patch.ids) {
            return;
        }
        const auto &ids = *patch.ids;

        auto relationships = RelationshipSet::fromDocument(*this);

        if (verification_method_) {
            dp::Vector<VerificationMethod> kept;
            for (const auto &vm : *verification_method_) {
                if (!containsId(ids, vm.id)) {
                    kept.push_back(vm);
                }
            }
            verification_method_ = collapse(kept);
        }

        for (const auto &id : ids) {
            relationships.remove(VmRelationship::reference(std::string(id.c_str())));
        }
        relationships.flushInto(*this);
    }

    void DidDocument::applyAddServices(const Patch &patch) {
        if (!patch.services) {
            return;
        }

        dp::Vector<Service> services;
        if (service_) {
            services = *service_;
        }
        for (const auto &s : *patch.services) {
            services.push_back(s);
        }
        service_ = collapse(services);
    }

    void DidDocument::applyRemoveServices(const Patch &patch) {
        if (!patch.ids || !service_) {
            return;
        }

        dp::Vector<Service> kept;
        for (const auto &s : *service_) {
            if (!containsId(*patch.ids, s.id)) {
                kept.push_back(s);
            }
        }
        service_ = collapse(kept);
    }

} // namespace didkit
