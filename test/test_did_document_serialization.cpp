#include "didkit/document/json.hpp"
#include "didkit/patch/builder.hpp"
#include <doctest/doctest.h>

using namespace didkit;

namespace {

    const char *ION_DOCUMENT = R"({
        "@context": ["https://www.w3.org/ns/did/v1", {"@base": "did:ion:EiAs"}],
        "id": "did:ion:EiAs",
        "controller": "did:ion:EiAs",
        "alsoKnownAs": ["https://example.com/alice"],
        "verificationMethod": [{
            "id": "#key-1",
            "controller": "did:ion:EiAs",
            "type": "EcdsaSecp256k1VerificationKey2019",
            "publicKeyJwk": {"kty": "EC", "crv": "secp256k1", "x": "smmFWI4q", "y": "rxp_kiiX"}
        }],
        "authentication": "#key-1",
        "assertionMethod": ["#key-1"],
        "service": [{
            "id": "#linked-domain",
            "type": "LinkedDomains",
            "serviceEndpoint": {"origins": ["https://alice.example.com/"]}
        }]
    })";

    DidDocument parse(const std::string &text) {
        auto result = DidDocument::fromJsonString(text);
        REQUIRE(result.is_ok());
        return result.value();
    }

} // namespace

TEST_SUITE("DID Document Serialization Tests") {

    TEST_CASE("Parse a full document") {
        auto doc = parse(ION_DOCUMENT);

        CHECK(doc.getId() == "did:ion:EiAs");
        REQUIRE(doc.getContext().size() == 2);
        CHECK(doc.getContext()[0].getUrl() == DID_CONTEXT);
        CHECK(doc.getContext()[1].url_map["@base"] == "did:ion:EiAs");
        CHECK(doc.getControllers() == std::vector<std::string>{"did:ion:EiAs"});
        CHECK(doc.getAlsoKnownAs() == std::vector<std::string>{"https://example.com/alice"});

        auto vm = doc.getVerificationMethod("#key-1");
        REQUIRE(vm.is_ok());
        CHECK(vm.value().getPublicKeyFormat() == PublicKeyFormat::Jwk);
        CHECK(vm.value().public_key_jwk->getY() == "rxp_kiiX");

        CHECK(doc.canAuthenticate("#key-1"));
        CHECK(doc.canAssert("#key-1"));
        CHECK_FALSE(doc.getKeyAgreement().has_value());

        auto svc = doc.getService("#linked-domain");
        REQUIRE(svc.is_ok());
        CHECK(svc.value().getTypeString() == "LinkedDomains");
        REQUIRE(svc.value().service_endpoint.size() == 1);
        CHECK_FALSE(svc.value().service_endpoint[0].isUrl());
    }

    TEST_CASE("Round trip preserves the document") {
        auto doc = parse(ION_DOCUMENT);

        auto again = parse(doc.toJsonString());
        CHECK(again == doc);

        auto pretty = parse(doc.toJsonString(2));
        CHECK(pretty == doc);
    }

    TEST_CASE("Single-element lists are written bare") {
        auto j = parse(ION_DOCUMENT).toJson();

        CHECK(j["controller"] == "did:ion:EiAs");
        CHECK(j["authentication"] == "#key-1");
        CHECK(j["assertionMethod"] == "#key-1");

        // Methods and services are always arrays
        CHECK(j["verificationMethod"].is_array());
        CHECK(j["service"].is_array());
        CHECK(j["service"][0]["type"] == "LinkedDomains");
        CHECK(j["service"][0]["serviceEndpoint"].is_object());
    }

    TEST_CASE("Multi-element lists are written as arrays") {
        auto doc = parse(R"({
            "@context": "https://www.w3.org/ns/did/v1",
            "id": "did:example:123",
            "controller": ["did:example:a", "did:example:b"],
            "keyAgreement": ["k1", "k2"]
        })");
        auto j = doc.toJson();

        CHECK(j["@context"] == DID_CONTEXT);
        CHECK(j["controller"] == nlohmann::json::array({"did:example:a", "did:example:b"}));
        CHECK(j["keyAgreement"] == nlohmann::json::array({"k1", "k2"}));
    }

    TEST_CASE("Absent members are omitted") {
        DidDocument doc("did:example:123");
        auto j = doc.toJson();

        CHECK(j["id"] == "did:example:123");
        CHECK(j.contains("@context"));
        for (const char *key : {"controller", "alsoKnownAs", "verificationMethod", "authentication", "assertionMethod",
                                "keyAgreement", "capabilityDelegation", "capabilityInvocation", "service"}) {
            CHECK_FALSE(j.contains(key));
        }
    }

    TEST_CASE("Empty relationship lists read as absent") {
        auto doc = parse(R"({"id": "did:example:123", "authentication": [], "controller": []})");

        CHECK_FALSE(doc.getAuthentication().has_value());
        CHECK(doc.getControllers().empty());
        CHECK_FALSE(doc.toJson().contains("authentication"));
    }

    TEST_CASE("Relationship list encoded as a string") {
        auto doc = parse(R"({"id": "did:example:123", "authentication": "[\"k1\", \"k2\"]"})");

        CHECK(doc.getRelationshipKeyIds(KeyPurpose::Authentication) == std::vector<std::string>{"k1", "k2"});
    }

    TEST_CASE("Embedded relationship entries round trip as objects") {
        auto doc = parse(R"({
            "id": "did:example:123",
            "capabilityInvocation": [{"id": "emb", "controller": "did:example:123", "type": "Multikey",
                                      "publicKeyMultibase": "z6Mkemb"}]
        })");

        REQUIRE(doc.getCapabilityInvocation().has_value());
        CHECK((*doc.getCapabilityInvocation())[0].getKind() == RelationshipKind::Embedded);

        auto j = doc.toJson();
        CHECK(j["capabilityInvocation"].is_object());
        CHECK(j["capabilityInvocation"]["publicKeyMultibase"] == "z6Mkemb");
        CHECK(parse(j.dump()) == doc);
    }

    TEST_CASE("Patched document serializes compactly") {
        DidDocument doc("did:example:123");
        auto builder = Patch::builder(Action::AddPublicKeys);
        REQUIRE(builder
                    .publicKey(VmWithPurpose(VerificationMethod::withMultibase("k1", "Multikey", "did:example:123",
                                                                               "z6Mkk1"),
                                             {KeyPurpose::Authentication}))
                    .is_ok());
        doc.applyPatches({builder.build().value()});

        auto j = doc.toJson();
        CHECK(j["authentication"] == "k1");
        REQUIRE(j["verificationMethod"].is_array());
        CHECK(j["verificationMethod"][0]["publicKeyMultibase"] == "z6Mkk1");
        CHECK_FALSE(j["verificationMethod"][0].contains("publicKeyJwk"));
    }

    TEST_CASE("JWK members that are empty are omitted") {
        auto vm = VerificationMethod::withJwk("k1", "JsonWebKey2020", "did:example:123",
                                              PublicKeyJwk("OKP", "Ed25519", "abc"));
        nlohmann::json j = vm;

        CHECK(j["publicKeyJwk"]["kty"] == "OKP");
        CHECK_FALSE(j["publicKeyJwk"].contains("y"));
        CHECK_FALSE(j.contains("publicKeyMultibase"));
    }

    TEST_CASE("Malformed input is rejected") {
        auto not_json = DidDocument::fromJsonString("{not json");
        REQUIRE(not_json.is_err());
        CHECK(not_json.error().code == ERR_DESERIALIZATION_FAILED);

        auto not_object = DidDocument::fromJsonString("[1, 2, 3]");
        REQUIRE(not_object.is_err());
        CHECK(not_object.error().code == ERR_DESERIALIZATION_FAILED);

        auto bad_relationship = DidDocument::fromJsonString(R"({"id": "did:example:123", "authentication": 7})");
        REQUIRE(bad_relationship.is_err());
        CHECK(bad_relationship.error().code == ERR_DESERIALIZATION_FAILED);

        auto bad_service = DidDocument::fromJsonString(R"({"id": "did:example:123", "service": "hub"})");
        REQUIRE(bad_service.is_err());
        CHECK(bad_service.error().code == ERR_DESERIALIZATION_FAILED);
    }
}
