/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for SchemaMapper class.
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
#include <boost/assign/list_of.hpp>

#include "ecrdf/rdf/SchemaMapper.h"
#include "ecrdf/rdf/Errors.h"
#include "ecrdf/rdf/Vocabulary.h"
#include "TurtleFixture.h"

using namespace ecrdf::rdf;
using namespace ecrdf::meta;
using namespace boost::assign;
using std::string;
using std::vector;

BOOST_AUTO_TEST_SUITE(SchemaMapper_test)

BOOST_FIXTURE_TEST_CASE( entityClass, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(10));

    vector<string> expected = list_of
        ("ts:Widget rdfs:subClassOf ec:EntityClass .")
        ("ts:Widget rdfs:label \"ts:Widget\" .")
        ("ts:Widget-Name rdfs:subClassOf ec:PrimitiveProperty .")
        ("ts:Widget-Name rdfs:domain ts:Widget .")
        ("ts:Widget-Name rdfs:range xsd:string .")
        ("ts:Widget-Name rdfs:label \"ts:Widget.Name\" .")
        ("ts:Widget-Count rdfs:subClassOf ec:PrimitiveProperty .")
        ("ts:Widget-Count rdfs:domain ts:Widget .")
        ("ts:Widget-Count rdfs:range xsd:integer .")
        ("ts:Widget-Count rdfs:label \"ts:Widget.Count\" .");
    vector<string> l = lines();
    BOOST_CHECK_EQUAL_COLLECTIONS(expected.begin(), expected.end(),
                                  l.begin(), l.end());
}

BOOST_FIXTURE_TEST_CASE( derivedClass, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(11));
    vector<string> l = lines();

    BOOST_REQUIRE(l.size() > 3);
    BOOST_CHECK_EQUAL("ts:Gadget rdfs:subClassOf ts:Widget .", l[0]);
    BOOST_CHECK_EQUAL("ts:Gadget rdfs:label \"Gadget Thing\" .", l[1]);
    BOOST_CHECK_EQUAL("ts:Gadget rdfs:comment \"A \\\"quoted\\\" gadget\" .",
                      l[2]);
    // inherited properties are declared by the base class only
    BOOST_CHECK_EQUAL(0, count("ts:Gadget-Name"));
    BOOST_CHECK_EQUAL(0, count("ts:Widget-Name"));
}

BOOST_FIXTURE_TEST_CASE( primitiveRanges, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(11));

    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Data rdfs:range xsd:base64Binary ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Guid rdfs:range ec:GuidString ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Origin rdfs:range ec:Point3d ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Location rdfs:range ec:Point2d ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Meta rdfs:range ec:JsonString ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-RefId rdfs:range xsd:long ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Total rdfs:range xsd:long ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-When rdfs:range xsd:dateTime ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Ratio rdfs:range xsd:double ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Flag rdfs:range xsd:boolean ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Geom rdfs:range ec:IGeometry ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Ratio rdfs:comment "
                               "\"Aspect \\\"ratio\\\"\" ."));
}

BOOST_FIXTURE_TEST_CASE( enumerationRanges, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(11));

    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Color rdfs:subClassOf "
                               "ec:PrimitiveProperty ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Color rdfs:range ts:Color ."));
    // an enumeration that does not resolve falls back to its backing type
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Shade rdfs:range xsd:string ."));
}

BOOST_FIXTURE_TEST_CASE( navigationRanges, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(11));

    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Owner rdfs:subClassOf "
                               "ec:NavigationProperty ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Owner rdfs:range ts:Widget ."));
    // the first target class wins
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Partner rdfs:range ts:Widget ."));
    BOOST_CHECK_EQUAL(0, count("ts:Gadget-Partner rdfs:range ts:Gadget ."));

    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Dangling rdfs:subClassOf "
                               "ec:NavigationProperty ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Dangling rdfs:label "
                               "\"ts:Gadget.Dangling\" ."));
    BOOST_CHECK_EQUAL(0, count("ts:Gadget-Dangling rdfs:range"));
}

BOOST_FIXTURE_TEST_CASE( compositeProperties, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(11));

    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Tags rdfs:subClassOf "
                               "ec:PrimitiveArrayProperty ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Tags rdfs:range rdf:List ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Shape rdfs:subClassOf "
                               "ec:StructProperty ."));
    BOOST_CHECK_EQUAL(0, count("ts:Gadget-Shape rdfs:range"));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Shapes rdfs:subClassOf "
                               "ec:StructArrayProperty ."));
    BOOST_CHECK_EQUAL(1, count("ts:Gadget-Shapes rdfs:range rdf:List ."));
}

BOOST_FIXTURE_TEST_CASE( relationships, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    BOOST_CHECK(mapper.isNavigationRelationship(md.getClass(4)));
    BOOST_CHECK(!mapper.isNavigationRelationship(md.getClass(5)));
    BOOST_CHECK(mapper.isNavigationRelationship(md.getClass(12)));
    BOOST_CHECK(!mapper.isNavigationRelationship(md.getClass(13)));
    BOOST_CHECK(!mapper.isNavigationRelationship(md.getClass(10)));

    mapper.writeClass(md.getClass(12));
    BOOST_CHECK_EQUAL("", out.str());

    mapper.writeClass(md.getClass(5));
    mapper.writeClass(md.getClass(13));
    BOOST_CHECK_EQUAL(1, count("bis:ElementRefersToElements rdfs:subClassOf "
                               "ec:RelationshipClass ."));
    BOOST_CHECK_EQUAL(1, count("bis:ElementRefersToElements-MemberPriority "
                               "rdfs:range xsd:integer ."));
    BOOST_CHECK_EQUAL(1, count("ts:WidgetRefersToWidgets rdfs:subClassOf "
                               "bis:ElementRefersToElements ."));
}

BOOST_FIXTURE_TEST_CASE( defaultBaseClasses, TurtleFixture ) {
    SchemaMapper mapper(md, writer);
    mapper.writeClass(md.getClass(6));
    mapper.writeClass(md.getClass(7));
    BOOST_CHECK_EQUAL(1, count("bis:ClassHasHandler rdfs:subClassOf "
                               "ec:CustomAttributeClass ."));
    BOOST_CHECK_EQUAL(1, count("bis:ISubModeledElement rdfs:subClassOf "
                               "ec:Mixin ."));
    BOOST_CHECK_EQUAL(string(vocab::EC_ENUMERATION),
                      SchemaMapper::getDefaultBaseClass(ClassInfo::ENUMERATION));
}

BOOST_FIXTURE_TEST_CASE( schema, TurtleFixture ) {
    SchemaMapper mapper(md, writer, "http://www.example.org/s/");
    mapper.writeSchema(md.getSchema(2));
    vector<string> l = lines();

    BOOST_REQUIRE(l.size() > 3);
    BOOST_CHECK_EQUAL("@prefix ts: "
                      "<http://www.example.org/s/TestSchema.01.00.02#> .",
                      l[0]);
    BOOST_CHECK_EQUAL("ts:Color rdfs:subClassOf ec:Enumeration .", l[1]);
    BOOST_CHECK_EQUAL("ts:Color rdfs:label \"Colour\" .", l[2]);
    BOOST_CHECK_EQUAL("ts:Widget rdfs:subClassOf ec:EntityClass .", l[3]);
    BOOST_CHECK_EQUAL(1, writer.getPrefixCount());
    BOOST_CHECK_EQUAL(0, count("ts:WidgetOwnsGadgets"));
    BOOST_CHECK_EQUAL(1, count("ts:WidgetRefersToWidgets rdfs:label"));

    string first = out.str();
    clear();
    mapper.writeSchema(md.getSchema(2));
    BOOST_CHECK_EQUAL(first, out.str());
}

BOOST_FIXTURE_TEST_CASE( unsupported, TurtleFixture ) {
    ModelMetadata bad("bad");
    bad.addSchema(SchemaInfo(1, "Bad", "bad", "01.00.00"));
    bad.addClass(ClassInfo(1, static_cast<ClassInfo::class_type_t>(42),
                           "Strange", 1, vector<PropertyInfo>()));
    bad.addClass(ClassInfo(2, ClassInfo::ENTITY, "Odd", 1,
                           list_of
                           (PropertyInfo("Value",
                                         static_cast<PrimitiveType>(99),
                                         PropertyInfo::SCALAR))));

    SchemaMapper mapper(bad, writer);
    BOOST_CHECK_THROW(mapper.writeClass(bad.getClass(1)),
                      UnsupportedClassKind);
    BOOST_CHECK_THROW(mapper.writeClass(bad.getClass(2)),
                      UnsupportedPrimitiveType);
    BOOST_CHECK_THROW(mapper.writeSchema(bad.getSchema(1)),
                      UnsupportedClassKind);
}

BOOST_AUTO_TEST_SUITE_END()
