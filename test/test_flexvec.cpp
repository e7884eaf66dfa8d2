#include "didkit/document/json.hpp"
#include <doctest/doctest.h>

using namespace didkit;

TEST_SUITE("Single-or-list Encoding Tests") {

    TEST_CASE("One element is written bare") {
        dp::Vector<dp::String> one;
        one.push_back(dp::String("a"));

        CHECK(flex::toJson(one) == nlohmann::json("a"));
        CHECK(flex::toArray(one) == nlohmann::json::array({"a"}));
    }

    TEST_CASE("Zero or several elements are written as an array") {
        dp::Vector<dp::String> none;
        CHECK(flex::toJson(none) == nlohmann::json::array());

        dp::Vector<dp::String> two;
        two.push_back(dp::String("a"));
        two.push_back(dp::String("b"));
        CHECK(flex::toJson(two) == nlohmann::json::array({"a", "b"}));
    }

    TEST_CASE("Bare string decodes to a one-element list") {
        auto values = flex::fromJson<dp::String>(nlohmann::json("a"));
        REQUIRE(values.size() == 1);
        CHECK(std::string(values[0].c_str()) == "a");
    }

    TEST_CASE("Array decodes in order") {
        auto values = flex::fromJson<dp::String>(nlohmann::json::parse(R"(["a", "b", "c"])"));
        REQUIRE(values.size() == 3);
        CHECK(std::string(values[2].c_str()) == "c");
    }

    TEST_CASE("String holding an encoded array is parsed") {
        auto values = flex::fromJson<dp::String>(nlohmann::json(R"(["a", "b"])"));
        REQUIRE(values.size() == 2);
        CHECK(std::string(values[0].c_str()) == "a");
        CHECK(std::string(values[1].c_str()) == "b");
    }

    TEST_CASE("Unparseable encoded array decodes to an empty list") {
        CHECK(flex::fromJson<dp::String>(nlohmann::json("[not json")).empty());
    }

    TEST_CASE("Mixed strings and objects decode to relationship entries") {
        auto values = flex::fromJson<VmRelationship>(nlohmann::json::parse(
            R"(["k1", {"id": "k2", "controller": "did:example:123", "type": "Multikey", "publicKeyMultibase": "z6Mk"}])"));

        REQUIRE(values.size() == 2);
        CHECK(values[0].isReference());
        CHECK(values[0].getKeyId() == "k1");
        CHECK(values[1].getKind() == RelationshipKind::Embedded);
        CHECK(values[1].verification_method->getId() == "k2");
    }

    TEST_CASE("Bare object decodes to a one-element list") {
        auto values = flex::fromJson<Endpoint>(nlohmann::json::parse(R"({"origins": ["https://a.example.com"]})"));
        REQUIRE(values.size() == 1);
        CHECK_FALSE(values[0].isUrl());
        CHECK(values[0].url_map["origins"][0] == "https://a.example.com");
    }

    TEST_CASE("Element types without a string form reject strings") {
        CHECK_THROWS(flex::fromJson<Service>(nlohmann::json("hub")));
        CHECK_THROWS(flex::fromJson<dp::String>(nlohmann::json(42)));
        CHECK_THROWS(flex::fromJson<dp::String>(nlohmann::json::parse("[1, 2]")));
    }

    TEST_CASE("Unknown purpose strings are rejected") {
        CHECK_THROWS(flex::fromJson<KeyPurpose>(nlohmann::json("signing")));

        auto purposes = flex::fromJson<KeyPurpose>(nlohmann::json("keyAgreement"));
        REQUIRE(purposes.size() == 1);
        CHECK(purposes[0] == KeyPurpose::KeyAgreement);
    }

    TEST_CASE("Get and put optional members") {
        nlohmann::json j = nlohmann::json::object();
        std::optional<dp::Vector<dp::String>> absent;
        flex::put(j, "controller", absent);
        CHECK_FALSE(j.contains("controller"));

        dp::Vector<dp::String> one;
        one.push_back(dp::String("did:example:1"));
        flex::put(j, "controller", std::optional<dp::Vector<dp::String>>(one));
        CHECK(j["controller"] == "did:example:1");

        CHECK(flex::get<dp::String>(j, "controller")->size() == 1);
        CHECK_FALSE(flex::get<dp::String>(j, "missing").has_value());
        CHECK_FALSE(flex::get<dp::String>(nlohmann::json::parse(R"({"x": null})"), "x").has_value());
    }

    TEST_CASE("Sequence equality") {
        dp::Vector<dp::String> a;
        a.push_back(dp::String("x"));
        dp::Vector<dp::String> b;
        b.push_back(dp::String("x"));

        CHECK(sameSequence(a, b));
        b.push_back(dp::String("y"));
        CHECK_FALSE(sameSequence(a, b));

        std::optional<dp::Vector<dp::String>> none;
        std::optional<dp::Vector<dp::String>> empty = dp::Vector<dp::String>();
        CHECK(sameSequence(none, none));
        CHECK_FALSE(sameSequence(none, empty));
    }
}
