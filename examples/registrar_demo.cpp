/// Registrar Demo
/// Creates a DID document from a fresh Ed25519 key, then updates it with patches

#include <didkit.hpp>
#include <iostream>

using namespace didkit;

int main() {
    std::cout << "=== didkit Registrar Demo ===" << std::endl;
    std::cout << std::endl;

    // === Part 1: Create ===
    std::cout << "--- Part 1: Creating a document ---" << std::endl;

    RegistrarConfig config;
    config.encoding = PublicKeyEncoding::Multibase;
    auto keyring = std::make_shared<LocalKeyRing>();
    Registrar registrar(keyring, config);

    auto created = registrar.create({Service("dwn", "DecentralizedWebNode", "https://dwn.example.com/")});
    if (created.is_err()) {
        std::cerr << "Failed to create document: " << created.error().message.c_str() << std::endl;
        return 1;
    }
    auto doc = created.value();
    const auto first_key = (*doc.getVerificationMethods())[0];

    std::cout << "Keys issued: " << keyring->getIssuedCount() << std::endl;
    std::cout << "  Key: " << first_key.getId() << " " << first_key.getPublicKeyMultibase() << std::endl;
    std::cout << "  Authentication: " << (doc.canAuthenticate(first_key.getId()) ? "yes" : "no") << std::endl;
    std::cout << doc.toJsonString(2) << std::endl;
    std::cout << std::endl;

    // === Part 2: Rotate the key ===
    std::cout << "--- Part 2: Rotating the key ---" << std::endl;

    auto next = keyring->nextKey();
    if (next.is_err()) {
        std::cerr << "Failed to get key: " << next.error().message.c_str() << std::endl;
        return 1;
    }
    auto next_key = next.value();
    auto next_id = next_key.getId().substr(0, 16);

    auto add = Patch::builder(Action::AddPublicKeys);
    auto added = add.publicKey(VmWithPurpose(
        VerificationMethod::withJwk(next_id, "JsonWebKey2020", "", next_key.getPublicKeyJwk()),
        {KeyPurpose::Authentication, KeyPurpose::AssertionMethod}));
    if (added.is_err()) {
        std::cerr << "Failed to add key: " << added.error().message.c_str() << std::endl;
        return 1;
    }
    auto remove = Patch::builder(Action::RemovePublicKeys);
    auto removed = remove.id(first_key.getId());
    if (removed.is_err()) {
        std::cerr << "Failed to remove key: " << removed.error().message.c_str() << std::endl;
        return 1;
    }

    ApplyOptions options;
    options.strict = true;
    auto updated = registrar.update(doc, {add.build().value(), remove.build().value()}, options);
    if (updated.is_err()) {
        std::cerr << "Failed to update document: " << updated.error().message.c_str() << std::endl;
        return 1;
    }
    std::cout << updated.value().toJsonString(2) << std::endl;
    std::cout << std::endl;

    // === Part 3: Lifecycle operations ===
    std::cout << "--- Part 3: Deactivation ---" << std::endl;

    auto deactivated = registrar.deactivate("did:example:123");
    if (deactivated.is_err()) {
        std::cout << "Deactivate: " << deactivated.error().message.c_str() << std::endl;
    }

    std::cout << std::endl;
    std::cout << "=== Demo complete ===" << std::endl;
    return 0;
}
