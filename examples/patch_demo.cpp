/// Patch Demo
/// Demonstrates building, applying and serializing DID document patches

#include <didkit.hpp>
#include <iostream>

using namespace didkit;

namespace {

    void printDocument(const DidDocument &doc) {
        std::cout << doc.toJsonString(2) << std::endl;
        std::cout << std::endl;
    }

} // namespace

int main() {
    std::cout << "=== didkit Patch Demo ===" << std::endl;
    std::cout << std::endl;

    const std::string did = "did:example:123456789abcdefghi";

    // === Part 1: Initial document via a replace patch ===
    std::cout << "--- Part 1: Replace ---" << std::endl;

    auto key1 = VerificationMethod::withJwk("key-1", "JsonWebKey2020", did,
                                            PublicKeyJwk("OKP", "Ed25519", "VCpo2LMLhn6iWku8MKvSLg2ZAoC-nlOyPVQaO3FxVeQ"));

    PatchDocument initial;
    initial.public_keys = dp::Vector<VmWithPurpose>();
    initial.public_keys->push_back(VmWithPurpose(key1, {KeyPurpose::Authentication, KeyPurpose::AssertionMethod}));
    initial.services = dp::Vector<Service>();
    initial.services->push_back(Service("hub", "IdentityHub", "https://hub.example.com/"));

    auto replace = Patch::builder(Action::Replace);
    if (auto r = replace.document(initial); r.is_err()) {
        std::cerr << "Failed to set document: " << r.error().message.c_str() << std::endl;
        return 1;
    }
    auto replace_patch = replace.build();
    if (replace_patch.is_err()) {
        std::cerr << "Failed to build patch: " << replace_patch.error().message.c_str() << std::endl;
        return 1;
    }

    DidDocument doc(did);
    doc.setController(did);
    doc.applyPatches({replace_patch.value()});
    printDocument(doc);

    // === Part 2: Add a key, drop the service ===
    std::cout << "--- Part 2: Add key and remove service ---" << std::endl;

    auto key2 = VerificationMethod::withMultibase("key-2", "Ed25519VerificationKey2020", did,
                                                  "z6MkhaXgBZDvotDkL5257faiztiGiC2QtKLGpbnnEGta2doK");
    auto add_keys = Patch::builder(Action::AddPublicKeys);
    if (auto r = add_keys.publicKey(VmWithPurpose(key2, {KeyPurpose::KeyAgreement})); r.is_err()) {
        std::cerr << "Failed to add key: " << r.error().message.c_str() << std::endl;
        return 1;
    }
    auto remove_services = Patch::builder(Action::RemoveServices);
    if (auto r = remove_services.id("hub"); r.is_err()) {
        std::cerr << "Failed to add ID: " << r.error().message.c_str() << std::endl;
        return 1;
    }

    std::vector<Patch> patches = {add_keys.build().value(), remove_services.build().value()};
    std::cout << "Patches on the wire:" << std::endl;
    std::cout << patchesToJson(patches, 2) << std::endl;

    doc.applyPatches(patches);
    printDocument(doc);

    // === Part 3: Builder validation ===
    std::cout << "--- Part 3: Validation ---" << std::endl;

    auto bad = Patch::builder(Action::RemovePublicKeys);
    auto bad_id = bad.id("key 1");
    std::cout << "ID with a space: " << (bad_id.is_err() ? bad_id.error().message.c_str() : "accepted") << std::endl;

    auto wrong = bad.service(Service("x", "T", "https://x.example.com/"));
    std::cout << "Service on a remove patch: " << (wrong.is_err() ? wrong.error().message.c_str() : "accepted")
              << std::endl;
    std::cout << std::endl;

    // === Part 4: Patches from JSON ===
    std::cout << "--- Part 4: Parse and apply ---" << std::endl;

    auto parsed = parsePatches(R"({"action": "remove-public-keys", "ids": "key-1"})");
    if (parsed.is_err()) {
        std::cerr << "Failed to parse patches: " << parsed.error().message.c_str() << std::endl;
        return 1;
    }

    ApplyOptions options;
    options.log_skipped = true;
    Patch empty;
    empty.action = Action::AddServices;
    auto with_empty = parsed.value();
    with_empty.push_back(empty);

    auto applied = doc.applyPatches(with_empty, options);
    if (applied.is_err()) {
        std::cerr << "Failed to apply patches: " << applied.error().message.c_str() << std::endl;
        return 1;
    }
    printDocument(doc);

    std::cout << "=== Demo complete ===" << std::endl;
    return 0;
}
