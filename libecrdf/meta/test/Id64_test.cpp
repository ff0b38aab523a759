/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for identifier helpers
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/test/unit_test.hpp>
#include <rapidjson/document.h>

#include "ecrdf/meta/Id64.h"

using namespace ecrdf::meta;
using boost::optional;
using std::string;

BOOST_AUTO_TEST_SUITE(Id64_test)

BOOST_AUTO_TEST_CASE( valid ) {
    BOOST_CHECK(id64::isValid("0x1"));
    BOOST_CHECK(id64::isValid("0x20000000a1"));
    BOOST_CHECK(id64::isValid("0xffffffffffffffff"));
    BOOST_CHECK(!id64::isValid("0x1ffffffffffffffff"));
    BOOST_CHECK(!id64::isValid("0"));
    BOOST_CHECK(!id64::isValid("0x"));
    BOOST_CHECK(!id64::isValid("0x0"));
    BOOST_CHECK(!id64::isValid("0x01"));
    BOOST_CHECK(!id64::isValid("0xABC"));
    BOOST_CHECK(!id64::isValid("0xg1"));
    BOOST_CHECK(!id64::isValid("1234"));
    BOOST_CHECK(!id64::isValid(""));
}

BOOST_AUTO_TEST_CASE( numeric ) {
    BOOST_CHECK_EQUAL("0x2a", id64::fromUInt64(42));
    BOOST_CHECK_EQUAL("0xdeadbeef", id64::fromUInt64(0xdeadbeefULL));
    BOOST_CHECK_EQUAL("0", id64::fromUInt64(0));
}

static optional<string> parse(const char* json) {
    rapidjson::Document doc;
    doc.Parse(json);
    BOOST_REQUIRE(!doc.HasParseError());
    return id64::fromJson(doc);
}

BOOST_AUTO_TEST_CASE( json ) {
    BOOST_CHECK_EQUAL("0x20", parse("\"0x20\"").get());
    BOOST_CHECK_EQUAL("0x20", parse("32").get());
    BOOST_CHECK_EQUAL("0x20", parse("{\"id\":\"0x20\",\"relClassName\":\"x\"}").get());
    BOOST_CHECK_EQUAL("0x20", parse("{\"id\":32}").get());
    BOOST_CHECK(!parse("\"0\""));
    BOOST_CHECK(!parse("0"));
    BOOST_CHECK(!parse("-5"));
    BOOST_CHECK(!parse("1.5"));
    BOOST_CHECK(!parse("true"));
    BOOST_CHECK(!parse("{\"relClassName\":\"x\"}"));
    BOOST_CHECK(!parse("{\"id\":{\"id\":\"0x20\"}}"));
    BOOST_CHECK(!parse("[\"0x20\"]"));
}

BOOST_AUTO_TEST_SUITE_END()
