#include "didkit/document/json.hpp"
#include "didkit/patch/builder.hpp"
#include <doctest/doctest.h>

using namespace didkit;

namespace {

    VerificationMethod makeKey(const std::string &id) {
        return VerificationMethod::withJwk(id, "JsonWebKey2020", "did:example:123",
                                           PublicKeyJwk("OKP", "Ed25519", "VCpo2LMLhn6iWku8MKvSLg2ZAoC-nlOyPVQaO3FxVeQ"));
    }

} // namespace

TEST_SUITE("Patch Serialization Tests") {

    TEST_CASE("Action wire tags") {
        CHECK(actionToString(Action::Replace) == "replace");
        CHECK(actionToString(Action::AddPublicKeys) == "add-public-keys");
        CHECK(actionToString(Action::RemovePublicKeys) == "remove-public-keys");
        CHECK(actionToString(Action::AddServices) == "add-services");
        CHECK(actionToString(Action::RemoveServices) == "remove-services");

        for (auto action : {Action::Replace, Action::AddPublicKeys, Action::RemovePublicKeys, Action::AddServices,
                            Action::RemoveServices}) {
            auto parsed = actionFromString(actionToString(action));
            REQUIRE(parsed.is_ok());
            CHECK(parsed.value() == action);
        }

        auto bad = actionFromString("ietf-json-patch");
        REQUIRE(bad.is_err());
        CHECK(bad.error().code == ERR_INVALID_INPUT);
    }

    TEST_CASE("Add-public-keys patch layout") {
        auto builder = Patch::builder(Action::AddPublicKeys);
        REQUIRE(builder.publicKey(VmWithPurpose(makeKey("key-1"), {KeyPurpose::Authentication,
                                                                   KeyPurpose::KeyAgreement}))
                    .is_ok());
        nlohmann::json j = builder.build().value();

        CHECK(j["action"] == "add-public-keys");
        REQUIRE(j["publicKeys"].is_array());
        const auto &key = j["publicKeys"][0];
        CHECK(key["id"] == "key-1");
        CHECK(key["type"] == "JsonWebKey2020");
        CHECK(key["publicKeyJwk"]["crv"] == "Ed25519");
        CHECK(key["purposes"] == nlohmann::json::array({"authentication", "keyAgreement"}));
        CHECK_FALSE(j.contains("ids"));
        CHECK_FALSE(j.contains("services"));
        CHECK_FALSE(j.contains("document"));
    }

    TEST_CASE("Key without purposes omits the member") {
        nlohmann::json j = VmWithPurpose(makeKey("key-1"));
        CHECK_FALSE(j.contains("purposes"));
        CHECK(j["id"] == "key-1");
    }

    TEST_CASE("Replace patch layout") {
        PatchDocument replacement;
        replacement.services = dp::Vector<Service>();
        replacement.services->push_back(Service("hub", "IdentityHub", "https://hub.example.com/"));
        auto builder = Patch::builder(Action::Replace);
        REQUIRE(builder.document(replacement).is_ok());

        nlohmann::json j = builder.build().value();

        CHECK(j["action"] == "replace");
        REQUIRE(j["document"].is_object());
        CHECK_FALSE(j["document"].contains("publicKeys"));
        REQUIRE(j["document"]["services"].is_array());
        CHECK(j["document"]["services"][0]["serviceEndpoint"] == "https://hub.example.com/");
    }

    TEST_CASE("Patch list round trip") {
        PatchDocument replacement;
        replacement.public_keys = dp::Vector<VmWithPurpose>();
        replacement.public_keys->push_back(VmWithPurpose(makeKey("key-9"), {KeyPurpose::CapabilityInvocation}));

        auto add = Patch::builder(Action::AddPublicKeys);
        REQUIRE(add.publicKey(VmWithPurpose(makeKey("key-1"), {KeyPurpose::Authentication})).is_ok());
        auto remove = Patch::builder(Action::RemoveServices);
        REQUIRE(remove.id("hub").is_ok());
        auto replace = Patch::builder(Action::Replace);
        REQUIRE(replace.document(replacement).is_ok());

        std::vector<Patch> patches = {add.build().value(), remove.build().value(), replace.build().value()};

        auto parsed = parsePatches(patchesToJson(patches));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().size() == 3);
        for (size_t i = 0; i < patches.size(); i++) {
            CHECK(parsed.value()[i] == patches[i]);
        }
    }

    TEST_CASE("Parse a single patch object") {
        auto parsed = parsePatches(R"({"action": "remove-public-keys", "ids": "key-1"})");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().size() == 1);

        const auto &patch = parsed.value()[0];
        CHECK(patch.action == Action::RemovePublicKeys);
        REQUIRE(patch.ids.has_value());
        REQUIRE(patch.ids->size() == 1);
        CHECK(std::string((*patch.ids)[0].c_str()) == "key-1");
    }

    TEST_CASE("Parse a patch from an external writer") {
        auto parsed = parsePatch(R"({
            "action": "add-services",
            "services": [{
                "id": "dwn",
                "type": ["DecentralizedWebNode", "IdentityHub"],
                "serviceEndpoint": ["https://dwn.example.com", {"nodes": ["https://n1.example.com"]}]
            }]
        })");
        REQUIRE(parsed.is_ok());

        const auto &patch = parsed.value();
        CHECK(patch.action == Action::AddServices);
        REQUIRE(patch.services.has_value());
        const auto &svc = (*patch.services)[0];
        CHECK(svc.type.size() == 2);
        REQUIRE(svc.service_endpoint.size() == 2);
        CHECK(svc.service_endpoint[0].getUrl() == "https://dwn.example.com");
        CHECK_FALSE(svc.service_endpoint[1].isUrl());
    }

    TEST_CASE("Parsed patch without payload is skipped when applied") {
        auto parsed = parsePatch(R"({"action": "add-public-keys"})");
        REQUIRE(parsed.is_ok());
        CHECK_FALSE(parsed.value().hasPayload());

        DidDocument doc("did:example:123");
        auto original = doc;
        doc.applyPatches({parsed.value()});
        CHECK(doc == original);
    }

    TEST_CASE("Purposes accept a bare string") {
        auto parsed = parsePatch(R"({
            "action": "add-public-keys",
            "publicKeys": {"id": "key-1", "type": "Multikey", "controller": "did:example:123",
                           "publicKeyMultibase": "z6Mk", "purposes": "assertionMethod"}
        })");
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed.value().public_keys.has_value());

        const auto &key = (*parsed.value().public_keys)[0];
        REQUIRE(key.purposes.has_value());
        REQUIRE(key.purposes->size() == 1);
        CHECK((*key.purposes)[0] == KeyPurpose::AssertionMethod);
    }

    TEST_CASE("Malformed patches are rejected") {
        auto no_action = parsePatch(R"({"ids": ["key-1"]})");
        REQUIRE(no_action.is_err());
        CHECK(no_action.error().code == ERR_DESERIALIZATION_FAILED);

        auto bad_action = parsePatch(R"({"action": "merge"})");
        REQUIRE(bad_action.is_err());
        CHECK(bad_action.error().code == ERR_DESERIALIZATION_FAILED);

        auto bad_purpose = parsePatch(
            R"({"action": "add-public-keys", "publicKeys": [{"id": "k", "purposes": ["signing"]}]})");
        REQUIRE(bad_purpose.is_err());
        CHECK(bad_purpose.error().code == ERR_DESERIALIZATION_FAILED);

        auto scalar = parsePatches("42");
        REQUIRE(scalar.is_err());
        CHECK(scalar.error().code == ERR_DESERIALIZATION_FAILED);
    }
}
