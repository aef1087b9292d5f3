//
// DocumentTest.cc
//
// Copyright 2016-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "VersaStoreTest.hh"
#include "StructuredDocument.hh"
#include "EmbeddedForm.hh"
#include "ValueClassifier.hh"
#include "DocumentIdentity.hh"
#include <cstdlib>

using namespace std;

TEST_CASE("StructuredDocument records", "[Document]") {
    StructuredDocument doc("Hello\nWorld\n");
    doc.put("FIELD", {{"name", "Color"}, {"value", "red"}});
    doc.put("FIELD", {{"name", "Size"}, {"value", "9"}});
    doc.put("FIELD", {{"name", "Color"}, {"value", "blue"}});
    doc.put("TOPICPARENT", {{"name", "Home"}});

    REQUIRE(doc.recordsOfType("FIELD").size() == 2);
    CHECK(doc.recordsOfType("FIELD")[0].name() == "Color");
    CHECK(*doc.find("FIELD", "Color")->get("value") == "blue");
    CHECK(doc.find("FIELD", "Weight") == nullptr);
    CHECK(doc.recordsOfType("FORM").empty());

    CHECK(doc.remove("FIELD", "Color"));
    CHECK_FALSE(doc.remove("FIELD", "Color"));
    CHECK(doc.recordsOfType("FIELD").size() == 1);
    doc.removeAll("FIELD");
    CHECK(doc.records().size() == 1);
}

TEST_CASE("StructuredDocument JSON", "[Document]") {
    auto doc = StructuredDocument::fromJSON(R"({"text": "Body", "meta": {
        "FIELD": [{"name": "Count", "value": 12}, {"name": "Flag", "value": true}],
        "FORM": [{"name": "PersonForm"}]}})");
    CHECK(doc.text() == "Body");
    REQUIRE(doc.recordsOfType("FIELD").size() == 2);
    CHECK(*doc.find("FIELD", "Count")->get("value") == "12");
    CHECK(*doc.find("FIELD", "Flag")->get("value") == "true");

    alloc_slice json  = doc.toJSON();
    auto        again = StructuredDocument::fromJSON(json);
    CHECK(again == doc);

    ExpectException(error::VersaStore, error::WrongFormat, [] { StructuredDocument::fromJSON("{\"text\": "); });
    ExpectException(error::VersaStore, error::InvalidParameter, [] { StructuredDocument::fromJSON("[1, 2]"); });
    ExpectException(error::VersaStore, error::InvalidParameter,
                    [] { StructuredDocument::fromJSON(R"({"meta": {"FIELD": {"name": "x"}}})"); });
}

TEST_CASE("EmbeddedForm value encoding", "[EmbeddedForm]") {
    CHECK(EmbeddedForm::encodeValue("100% \"sure\"\n{x}") == "100%25 %22sure%22%0a%7bx%7d");
    CHECK(EmbeddedForm::decodeValue("100%25 %22sure%22%0a%7bx%7d") == "100% \"sure\"\n{x}");
    CHECK(EmbeddedForm::decodeValue("50%") == "50%");
    CHECK(EmbeddedForm::decodeValue("%zz") == "%zz");
}

TEST_CASE("EmbeddedForm render and parse", "[EmbeddedForm]") {
    StructuredDocument doc("First line\n   * Set X = 1\n");
    doc.append("FIELD", {{"name", "Color"}, {"title", "Colour"}, {"value", "red"}});
    doc.append("FORM", {{"name", "ThingForm"}});
    doc.append("TOPICPARENT", {{"name", "Home"}});
    doc.append("_PREF_SET", {{"name", "X"}, {"value", "1"}});

    Record info{{"author", "alice"}, {"version", "2"}};
    auto   lines = EmbeddedForm::render(doc, &info);
    REQUIRE(lines.size() == 6);
    CHECK(lines[0] == R"(%META:TOPICINFO{author="alice" version="2"}%)");
    CHECK(lines[1] == R"(%META:TOPICPARENT{name="Home"}%)");
    CHECK(lines[2] == "First line");
    CHECK(lines[3] == "   * Set X = 1");
    CHECK(lines[4] == R"(%META:FORM{name="ThingForm"}%)");
    CHECK(lines[5] == R"(%META:FIELD{name="Color" title="Colour" value="red"}%)");

    string text;
    for ( auto& line : lines ) text += line + "\n";
    text.pop_back();
    auto parsed = EmbeddedForm::parse(text);
    CHECK(parsed.text() == "First line\n   * Set X = 1");
    CHECK(*parsed.find("FIELD", "Color")->get("title") == "Colour");
    CHECK(*parsed.find("TOPICINFO")->get("author") == "alice");
    CHECK(parsed.recordsOfType("_PREF_SET").empty());
}

TEST_CASE("DocumentIdentity validity", "[Document]") {
    CHECK(DocumentIdentity{"Main", "Home"}.isValid());
    CHECK(DocumentIdentity{"Main/Sub", "Home"}.isValid());
    CHECK_FALSE(DocumentIdentity{"", "Home"}.isValid());
    CHECK_FALSE(DocumentIdentity{"Main", ""}.isValid());
    CHECK_FALSE(DocumentIdentity{"Main", "Bad\nName"}.isValid());
    CHECK_FALSE(DocumentIdentity{"Main", string("Bad\xff")}.isValid());
    CHECK(DocumentIdentity{"Main", "Home"}.description() == "Main.Home");
}

#pragma mark - CLASSIFIER:

TEST_CASE("Number parsing", "[Classifier]") {
    CHECK(ValueClassifier::parseNumber("42") == 42.0);
    CHECK(ValueClassifier::parseNumber(" -3.5 ") == -3.5);
    CHECK(ValueClassifier::parseNumber(".5") == 0.5);
    CHECK(ValueClassifier::parseNumber("1e3") == 1000.0);
    CHECK_FALSE(ValueClassifier::parseNumber(""));
    CHECK_FALSE(ValueClassifier::parseNumber("12abc"));
    CHECK_FALSE(ValueClassifier::parseNumber("1.2.3"));
    CHECK_FALSE(ValueClassifier::parseNumber("1e999"));
    CHECK_FALSE(ValueClassifier::parseNumber("inf"));
}

TEST_CASE("Classification with the default date parser", "[Classifier]") {
    ValueClassifier classifier;
    CHECK(DuckTypeOf(classifier.classify("hello", FieldType::Value)) == DuckType::Opaque);
    CHECK(DuckTypeOf(classifier.classify("", FieldType::Value)) == DuckType::Opaque);

    auto n = classifier.classify("2001", FieldType::Value);
    REQUIRE(holds_alternative<NumericValue>(n));
    CHECK(get<NumericValue>(n).number == 2001.0);

    auto d = classifier.classify("31 Dec 2001", FieldType::Value);
    REQUIRE(holds_alternative<DateValue>(d));
    CHECK(get<DateValue>(d).date == 1009756800);
    CHECK(DuckTypeOf(classifier.classify("31 Dec 2001", FieldType::Value, false)) == DuckType::Opaque);

    auto nd = classifier.classify("1009756800", FieldType::EpochDate);
    REQUIRE(holds_alternative<NumericAndDateValue>(nd));
    CHECK(get<NumericAndDateValue>(nd).date == 1009756800);
    CHECK(DuckTypeOf(nd) == DuckType::NumericAndDate);

    // Epoch values too large for a timestamp are only numbers:
    for ( const char* huge : {"1e300", "-1e30", "9223372036854775808"} ) {
        auto c = classifier.classify(huge, FieldType::EpochDate);
        REQUIRE(holds_alternative<NumericValue>(c));
        CHECK(get<NumericValue>(c).number == strtod(huge, nullptr));
    }
    CHECK(DuckTypeOf(classifier.classify("-4e18", FieldType::EpochDate)) == DuckType::NumericAndDate);
}

TEST_CASE("A number is never offered to the date parser", "[Classifier]") {
    vector<string>  offered;
    ValueClassifier classifier([&](string_view str) -> optional<timestamp_t> {
        offered.emplace_back(str);
        return 7;  // accepts anything
    });

    CHECK(DuckTypeOf(classifier.classify("12", FieldType::Value)) == DuckType::Numeric);
    CHECK(offered.empty());

    auto c = classifier.classify("next tuesday", FieldType::Value);
    REQUIRE(holds_alternative<DateValue>(c));
    CHECK(get<DateValue>(c).date == 7);
    CHECK(offered == vector<string>{"next tuesday"});

    // Only a bounded prefix is offered:
    string longValue(200, 'x');
    offered.clear();
    (void)classifier.classify(longValue, FieldType::Value);
    REQUIRE(offered.size() == 1);
    CHECK(offered[0].size() == ValueClassifier::kMaxDateLength);
}
