/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for literal formatting
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <limits>
#include <stdexcept>
#include <string>

#include <boost/test/unit_test.hpp>
#include <rapidjson/document.h>

#include "ecrdf/rdf/Literal.h"

using namespace ecrdf::rdf;
using std::string;
using std::invalid_argument;
using rapidjson::Document;
using rapidjson::Value;

static void parse(Document& doc, const char* json) {
    doc.Parse(json);
    BOOST_REQUIRE(!doc.HasParseError());
}

BOOST_AUTO_TEST_SUITE(Literal_test)

BOOST_AUTO_TEST_CASE( quote ) {
    BOOST_CHECK_EQUAL("\"Acme\"", literal::quote("Acme"));
    BOOST_CHECK_EQUAL("\"A \\\"quoted\\\" gadget\"",
                      literal::quote("A \"quoted\" gadget"));
    BOOST_CHECK_EQUAL("\"line\\nbreak\\\\\"", literal::quote("line\nbreak\\"));
    BOOST_CHECK_EQUAL("\"\"", literal::quote(""));
}

BOOST_AUTO_TEST_CASE( tokens ) {
    Document doc;
    parse(doc, "{\"s\":\"2020-01-01T00:00:00Z\",\"i\":-7,\"d\":0.5,"
          "\"b\":false,\"o\":{\"a\":[1,\"b\"]}}");
    BOOST_CHECK_EQUAL("2020-01-01T00:00:00Z", literal::toToken(doc["s"]));
    BOOST_CHECK_EQUAL("-7", literal::toToken(doc["i"]));
    BOOST_CHECK_EQUAL("0.5", literal::toToken(doc["d"]));
    BOOST_CHECK_EQUAL("false", literal::toToken(doc["b"]));
    BOOST_CHECK_EQUAL("{\"a\":[1,\"b\"]}", literal::toToken(doc["o"]));
    BOOST_CHECK_EQUAL("\"2020-01-01T00:00:00Z\"", literal::toJson(doc["s"]));
}

BOOST_AUTO_TEST_CASE( unencodable ) {
    BOOST_CHECK_THROW(literal::quote("bad \xff byte"), invalid_argument);
    BOOST_CHECK_THROW(literal::quote("cut \xc3"), invalid_argument);
    BOOST_CHECK_EQUAL("\"caf\xc3\xa9\"", literal::quote("caf\xc3\xa9"));

    Value text(rapidjson::StringRef("bad \xc3\x28 text"));
    BOOST_CHECK_THROW(literal::toJson(text), invalid_argument);
    BOOST_CHECK_THROW(literal::toToken(text), invalid_argument);

    Value nan(std::numeric_limits<double>::quiet_NaN());
    BOOST_CHECK_THROW(literal::toToken(nan), invalid_argument);
    Value inf(std::numeric_limits<double>::infinity());
    BOOST_CHECK_THROW(literal::toJson(inf), invalid_argument);

    Document doc;
    doc.SetObject();
    doc.AddMember("x", 1, doc.GetAllocator());
    Value y(-std::numeric_limits<double>::infinity());
    doc.AddMember("y", y, doc.GetAllocator());
    BOOST_CHECK_THROW(literal::formatPoint(doc, false), invalid_argument);
}

BOOST_AUTO_TEST_CASE( points ) {
    Document doc;
    parse(doc, "{\"p3\":{\"z\":-3,\"y\":2.5,\"x\":1},"
          "\"a2\":[4,5],"
          "\"a3\":[4,5,6],"
          "\"short\":[4],"
          "\"text\":{\"x\":\"1\",\"y\":2},"
          "\"scalar\":7}");

    BOOST_CHECK_EQUAL("{\"x\":1,\"y\":2.5,\"z\":-3}",
                      literal::formatPoint(doc["p3"], true));
    BOOST_CHECK_EQUAL("{\"x\":1,\"y\":2.5}",
                      literal::formatPoint(doc["p3"], false));
    BOOST_CHECK_EQUAL("{\"x\":4,\"y\":5}",
                      literal::formatPoint(doc["a2"], false));
    BOOST_CHECK_EQUAL("{\"x\":4,\"y\":5,\"z\":6}",
                      literal::formatPoint(doc["a3"], true));
    BOOST_CHECK_THROW(literal::formatPoint(doc["a2"], true), invalid_argument);
    BOOST_CHECK_THROW(literal::formatPoint(doc["short"], false),
                      invalid_argument);
    BOOST_CHECK_THROW(literal::formatPoint(doc["text"], false),
                      invalid_argument);
    BOOST_CHECK_THROW(literal::formatPoint(doc["scalar"], false),
                      invalid_argument);
}

BOOST_AUTO_TEST_CASE( quotedPoint ) {
    Document doc;
    parse(doc, "{\"x\":1,\"y\":2.5,\"z\":-3}");
    string object = literal::quote(literal::formatPoint(doc, true));
    BOOST_CHECK_EQUAL("\"{\\\"x\\\":1,\\\"y\\\":2.5,\\\"z\\\":-3}\"", object);

    // decoding the literal gives back the point
    Document outer;
    parse(outer, object.c_str());
    BOOST_REQUIRE(outer.IsString());
    Document inner;
    parse(inner, outer.GetString());
    BOOST_REQUIRE(inner.IsObject());
    BOOST_CHECK_EQUAL(1, inner["x"].GetInt());
    BOOST_CHECK_EQUAL(2.5, inner["y"].GetDouble());
    BOOST_CHECK_EQUAL(-3, inner["z"].GetInt());
}

BOOST_AUTO_TEST_SUITE_END()
