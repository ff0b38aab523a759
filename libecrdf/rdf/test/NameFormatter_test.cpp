/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for NameFormatter class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>
#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "ecrdf/rdf/NameFormatter.h"
#include "ecrdf/rdf/Errors.h"
#include "TurtleFixture.h"

using namespace ecrdf::rdf;
using std::string;
using std::vector;
using std::invalid_argument;

BOOST_AUTO_TEST_SUITE(NameFormatter_test)

BOOST_AUTO_TEST_CASE( names ) {
    BOOST_CHECK_EQUAL("ts:Widget",
                      NameFormatter::formatClassName("ts", "Widget"));
    BOOST_CHECK_EQUAL("ts:Widget-Name",
                      NameFormatter::formatPropertyName("ts:Widget", "Name"));
    BOOST_CHECK_EQUAL("ts:Widget.Name",
                      NameFormatter::formatPropertyLabel("ts:Widget", "Name"));
    BOOST_CHECK_THROW(NameFormatter::formatClassName("", "Widget"),
                      invalid_argument);
    BOOST_CHECK_THROW(NameFormatter::formatClassName("ts", ""),
                      invalid_argument);
    BOOST_CHECK_THROW(NameFormatter::formatPropertyName("ts:Widget", ""),
                      invalid_argument);
}

BOOST_AUTO_TEST_CASE( instanceIds ) {
    BOOST_CHECK_EQUAL("elementId:e0x20",
                      NameFormatter::formatInstanceId(NameFormatter::ELEMENT,
                                                      "0x20"));
    BOOST_CHECK_EQUAL("modelId:m0x1",
                      NameFormatter::formatInstanceId(NameFormatter::MODEL,
                                                      "0x1"));
    BOOST_CHECK_EQUAL("aspectId:a0x3",
                      NameFormatter::formatInstanceId(NameFormatter::ASPECT,
                                                      "0x3"));
    BOOST_CHECK_EQUAL("codeSpecId:c0x4",
                      NameFormatter::formatInstanceId(NameFormatter::CODESPEC,
                                                      "0x4"));
    BOOST_CHECK_EQUAL("relationshipId:r0x5",
                      NameFormatter::
                      formatInstanceId(NameFormatter::RELATIONSHIP, "0x5"));
    BOOST_CHECK_THROW(NameFormatter::formatInstanceId(NameFormatter::ELEMENT,
                                                      ""),
                      invalid_argument);
    BOOST_CHECK_EQUAL(string("relationshipId"),
                      NameFormatter::
                      getInstancePrefix(NameFormatter::RELATIONSHIP));
}

BOOST_FIXTURE_TEST_CASE( instancePrefixes, TurtleFixture ) {
    NameFormatter::declareInstancePrefixes(writer,
                                           "http://www.example.org/imodel/");
    vector<string> l = lines();
    BOOST_REQUIRE_EQUAL(5, l.size());
    BOOST_CHECK_EQUAL("@prefix codeSpecId: "
                      "<http://www.example.org/imodel/codeSpec#> .", l[0]);
    BOOST_CHECK_EQUAL("@prefix aspectId: "
                      "<http://www.example.org/imodel/aspect#> .", l[1]);
    BOOST_CHECK_EQUAL("@prefix elementId: "
                      "<http://www.example.org/imodel/element#> .", l[2]);
    BOOST_CHECK_EQUAL("@prefix modelId: "
                      "<http://www.example.org/imodel/model#> .", l[3]);
    BOOST_CHECK_EQUAL("@prefix relationshipId: "
                      "<http://www.example.org/imodel/relationship#> .",
                      l[4]);
}

BOOST_FIXTURE_TEST_CASE( schemaItems, ecrdf::meta::MDFixture ) {
    NameFormatter formatter(md);
    BOOST_CHECK_EQUAL("ts:Gadget", formatter.formatSchemaItem(md.getClass(11)));
    BOOST_CHECK_EQUAL("ts:Color",
                      formatter.formatSchemaItem(md.getEnumeration(1)));
    BOOST_CHECK_EQUAL("bis:Element", formatter.formatClass(1));
    BOOST_CHECK_THROW(formatter.formatClass(99), UnresolvedReference);

    BOOST_CHECK_EQUAL("bis:Element",
                      formatter.formatSchemaItemFullName("BisCore:Element"));
    BOOST_CHECK_EQUAL("bis:Element",
                      formatter.formatSchemaItemFullName("bis.element"));
    BOOST_CHECK_EQUAL("ts:Color",
                      formatter.formatSchemaItemFullName("TestSchema:Color"));
    BOOST_CHECK_THROW(formatter.formatSchemaItemFullName("BisCore:Missing"),
                      UnresolvedReference);
    BOOST_CHECK_THROW(formatter.formatSchemaItemFullName("Element"),
                      UnresolvedReference);
}

BOOST_AUTO_TEST_SUITE_END()
