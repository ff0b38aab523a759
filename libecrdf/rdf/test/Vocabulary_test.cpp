/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for the upper vocabulary
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <string>
#include <vector>

#include <boost/test/unit_test.hpp>

#include "ecrdf/rdf/Vocabulary.h"
#include "TurtleFixture.h"

using namespace ecrdf::rdf;
using std::string;
using std::vector;

BOOST_AUTO_TEST_SUITE(Vocabulary_test)

BOOST_FIXTURE_TEST_CASE( declare, TurtleFixture ) {
    vocab::declareVocabulary(writer);
    vector<string> l = lines();

    BOOST_REQUIRE_EQUAL(60, l.size());
    BOOST_CHECK_EQUAL(4, writer.getPrefixCount());
    BOOST_CHECK_EQUAL(56, writer.getTripleCount());

    BOOST_CHECK_EQUAL("@prefix rdf: "
                      "<http://www.w3.org/1999/02/22-rdf-syntax-ns#> .",
                      l[0]);
    BOOST_CHECK_EQUAL("@prefix rdfs: <http://www.w3.org/2000/01/rdf-schema#> .",
                      l[1]);
    BOOST_CHECK_EQUAL("@prefix xsd: <http://www.w3.org/2001/XMLSchema#> .",
                      l[2]);
    BOOST_CHECK_EQUAL("@prefix ec: <http://www.example.org/ec#> .", l[3]);
    BOOST_CHECK_EQUAL("ec:Class rdfs:subClassOf rdfs:Class .", l[4]);
    BOOST_CHECK_EQUAL("ec:EntityClass rdfs:subClassOf ec:Class .", l[5]);
    BOOST_CHECK_EQUAL("ec:Enumeration rdfs:subClassOf rdfs:Class .", l[9]);

    BOOST_CHECK_EQUAL("ec:EntityClass-Id rdfs:subClassOf "
                      "ec:PrimitiveProperty .", l[10]);
    BOOST_CHECK_EQUAL("ec:EntityClass-Id rdfs:domain ec:EntityClass .",
                      l[11]);
    BOOST_CHECK_EQUAL("ec:EntityClass-Id rdfs:range ec:Id64String .", l[12]);
    BOOST_CHECK_EQUAL("ec:EntityClass-Id rdfs:label "
                      "\"ec:EntityClass.Id\" .", l[13]);
    BOOST_CHECK_EQUAL("ec:EntityClass-Id rdfs:comment "
                      "\"Id of the entity instance\" .", l[14]);
    BOOST_CHECK_EQUAL(1, count("ec:RelationshipClass-Source rdfs:range "
                               "ec:EntityClass ."));
    BOOST_CHECK_EQUAL(1, count("ec:RelationshipClass-Target rdfs:range "
                               "ec:EntityClass ."));

    BOOST_CHECK_EQUAL("ec:Property rdfs:subClassOf rdf:Property .", l[30]);
    BOOST_CHECK_EQUAL("ec:Point3d rdfs:subClassOf ec:JsonString .", l[40]);

    BOOST_CHECK_EQUAL("ec:Class rdfs:label \"ec:Class\" .", l[41]);
    BOOST_CHECK_EQUAL("ec:GuidString rdfs:label \"ec:GuidString\" .", l[59]);
    BOOST_CHECK_EQUAL(19, vocab::EC_TERM_COUNT);
}

BOOST_FIXTURE_TEST_CASE( stable, TurtleFixture ) {
    vocab::declareVocabulary(writer);
    string first = out.str();
    clear();
    vocab::declareVocabulary(writer);
    BOOST_CHECK_EQUAL(first, out.str());
}

BOOST_FIXTURE_TEST_CASE( terms, TurtleFixture ) {
    BOOST_REQUIRE_EQUAL(19, vocab::EC_TERM_COUNT);
    BOOST_CHECK_EQUAL(vocab::EC_CLASS, vocab::EC_TERMS[0]);
    BOOST_CHECK_EQUAL(vocab::EC_IGEOMETRY, vocab::EC_TERMS[5]);
    BOOST_CHECK_EQUAL(vocab::EC_NAVIGATIONPROPERTY, vocab::EC_TERMS[12]);
    BOOST_CHECK_EQUAL(vocab::EC_GUIDSTRING, vocab::EC_TERMS[18]);

    // every term is labelled with its own name
    vocab::declareVocabulary(writer);
    for (size_t i = 0; i < vocab::EC_TERM_COUNT; ++i) {
        string term(vocab::EC_TERMS[i]);
        BOOST_CHECK_EQUAL(0, term.compare(0, 3, "ec:"));
        BOOST_CHECK_EQUAL(1, count(term + " rdfs:label \"" + term + "\" ."));
    }
}

BOOST_AUTO_TEST_SUITE_END()
