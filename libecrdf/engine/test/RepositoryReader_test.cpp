/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for RepositoryReader class.
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

#include "ecrdf/engine/RepositoryReader.h"
#include "ecrdf/rdf/Errors.h"
#include "RepositoryFixture.h"

using namespace ecrdf::engine;
using namespace ecrdf::meta;
using ecrdf::rdf::UnsupportedClassKind;
using ecrdf::rdf::UnsupportedPrimitiveType;
using ecrdf::rdf::IOFailure;
using std::string;
using std::invalid_argument;

static void readJson(const string& json) {
    Repository repository;
    RepositoryReader reader(repository);
    reader.readString(json);
}

static string schemaWith(const string& items) {
    return "{\"schemas\": [{\"name\": \"A\", \"alias\": \"a\", "
        "\"version\": \"01.00.00\", \"items\": [" + items + "]}]}";
}

BOOST_AUTO_TEST_SUITE(RepositoryReader_test)

BOOST_FIXTURE_TEST_CASE( schemas, RepositoryFixture ) {
    const ModelMetadata& md = repository.getMetadata();
    BOOST_CHECK_EQUAL("a1b2", repository.getId());
    BOOST_CHECK_EQUAL("Test Repository", repository.getName());

    BOOST_REQUIRE_EQUAL(2, md.getSchemas().size());
    BOOST_CHECK_EQUAL("TestSchema", md.getSchemas()[0].getName());
    BOOST_CHECK_EQUAL("TestSchema.01.00.02",
                      md.getSchemas()[0].getSchemaKey());
    BOOST_CHECK_EQUAL("Schema for tests",
                      md.getSchemas()[0].getDescription().get());
    BOOST_CHECK_EQUAL(5, md.getSchemas()[0].getItems().size());
    BOOST_CHECK_EQUAL(SchemaItem::ENUMERATION,
                      md.getSchemas()[0].getItems()[0].type);
    BOOST_CHECK_EQUAL(9, md.getClasses().size());
}

BOOST_FIXTURE_TEST_CASE( references, RepositoryFixture ) {
    const ModelMetadata& md = repository.getMetadata();
    const ClassInfo* widget = md.findClass("ts:Widget");
    const ClassInfo* gadget = md.findClass("TestSchema:Gadget");
    const ClassInfo* element = md.findClass("BisCore:Element");
    const ClassInfo* owns = md.findClass("ts:WidgetOwnsGadgets");
    const ClassInfo* refers = md.findClass("ts:WidgetRefersToWidgets");
    const EnumInfo* color = md.findEnumeration("ts:Color");
    BOOST_REQUIRE(widget != NULL);
    BOOST_REQUIRE(gadget != NULL);
    BOOST_REQUIRE(element != NULL);
    BOOST_REQUIRE(owns != NULL);
    BOOST_REQUIRE(refers != NULL);
    BOOST_REQUIRE(color != NULL);

    // declared later in another schema
    BOOST_CHECK_EQUAL(element->getId(), widget->getBaseClass().get());
    BOOST_CHECK_EQUAL(widget->getId(), gadget->getBaseClass().get());
    BOOST_CHECK_EQUAL("Gadget Thing", gadget->getLabel().get());

    const PropertyInfo* owner = gadget->findProperty("Owner");
    BOOST_REQUIRE(owner != NULL);
    BOOST_CHECK_EQUAL(PropertyInfo::NAVIGATION, owner->getKind());
    BOOST_CHECK_EQUAL(owns->getId(), owner->getRelationshipClass().get());
    BOOST_CHECK_EQUAL(PropertyInfo::BACKWARD, owner->getDirection());
    BOOST_CHECK(gadget->findProperty("Tags")->isArray());
    BOOST_CHECK_EQUAL(POINT3D,
                      gadget->findProperty("Origin")->getPrimitiveType());

    const PropertyInfo* colorProp = widget->findProperty("Color");
    BOOST_REQUIRE(colorProp != NULL);
    BOOST_CHECK_EQUAL(PropertyInfo::ENUMERATION, colorProp->getKind());
    BOOST_CHECK_EQUAL(color->getId(), colorProp->getEnumeration().get());
    BOOST_CHECK_EQUAL(INTEGER, colorProp->getPrimitiveType());
    BOOST_CHECK_EQUAL("1", color->getValueByName("Green"));
    BOOST_CHECK_EQUAL("Colour", color->getLabel().get());

    BOOST_CHECK_EQUAL(widget->getId(),
                      owns->getSource().getFirstClass().get());
    // the unknown constraint class is dropped
    BOOST_CHECK_EQUAL(2, refers->getTarget().getClasses().size());
    BOOST_CHECK(md.getRootClass(refers->getId())
                .hasCustomAttribute(LINK_TABLE_RELATIONSHIP_MAP));
}

BOOST_FIXTURE_TEST_CASE( instances, RepositoryFixture ) {
    BOOST_CHECK_EQUAL(1, repository.getCodeSpecs().size());
    BOOST_CHECK_EQUAL(1, repository.getModels().size());
    BOOST_CHECK_EQUAL(3, repository.getElements().size());
    BOOST_CHECK_EQUAL(2, repository.getAspects().size());
    BOOST_CHECK_EQUAL(1, repository.getRelationships().size());
    BOOST_CHECK_EQUAL(8, repository.getInstanceCount());
    BOOST_CHECK_EQUAL(2, reader.getDroppedCount());

    BOOST_CHECK_EQUAL("Test:Widget", repository.getCodeSpecs()[0]->getName());
    BOOST_CHECK_EQUAL("Widgets", repository.getModels()[0]->getName());
    // false carries no value
    BOOST_CHECK(!repository.getModels()[0]->isSet("IsPrivate"));

    const Instance& widget = *repository.getElements()[0];
    BOOST_CHECK_EQUAL("0x20", widget.getId());
    BOOST_CHECK_EQUAL("0x10", widget.getModelId());
    BOOST_CHECK_EQUAL("0x1", widget.getCode().spec);
    BOOST_CHECK_EQUAL("0x1", widget.getCode().scope);
    BOOST_CHECK_EQUAL("W-1", widget.getCode().value);
    BOOST_CHECK_EQUAL("Acme", string(widget.getProperty("Name")->GetString()));
    BOOST_CHECK(widget.getProperty("Model")->IsObject());

    BOOST_CHECK_EQUAL("0x10", repository.getElements()[1]->getModelId());
    BOOST_CHECK_EQUAL("0x20", repository.getAspects()[0]->getElementId());

    const Instance& rel = *repository.getRelationships()[0];
    BOOST_CHECK_EQUAL("0x20", rel.getSourceId());
    BOOST_CHECK_EQUAL("0x22", rel.getTargetId());
}

BOOST_AUTO_TEST_CASE( malformed ) {
    BOOST_CHECK_THROW(readJson("[]"), invalid_argument);
    BOOST_CHECK_THROW(readJson("{\"schemas\": "), invalid_argument);
    BOOST_CHECK_THROW(readJson("{\"schemas\": {}}"), invalid_argument);
    BOOST_CHECK_THROW(readJson("{\"id\": \"bad \xc3\x28\"}"),
                      invalid_argument);
    BOOST_CHECK_THROW(readJson("{\"schemas\": [{\"name\": \"A\"}]}"),
                      invalid_argument);
    BOOST_CHECK_THROW(readJson("{\"schemas\": ["
                               "{\"name\": \"A\", \"alias\": \"a\", "
                               "\"version\": \"01.00.00\"},"
                               "{\"name\": \"A\", \"alias\": \"b\", "
                               "\"version\": \"01.00.00\"}]}"),
                      invalid_argument);
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"EntityClass\", "
                                          "\"name\": \"C\"},"
                                          "{\"type\": \"Mixin\", "
                                          "\"name\": \"c\"}")),
                      invalid_argument);
}

BOOST_AUTO_TEST_CASE( classErrors ) {
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"StructClass\", "
                                          "\"name\": \"S\"}")),
                      UnsupportedClassKind);
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"EntityClass\", "
                                          "\"name\": \"C\", "
                                          "\"properties\": [{\"name\": \"P\", "
                                          "\"type\": \"decimal\"}]}")),
                      UnsupportedPrimitiveType);
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"EntityClass\", "
                                          "\"name\": \"C\", "
                                          "\"baseClass\": \"a:Missing\"}")),
                      invalid_argument);
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"EntityClass\", "
                                          "\"name\": \"C\", "
                                          "\"baseClass\": \"a:D\"},"
                                          "{\"type\": \"EntityClass\", "
                                          "\"name\": \"D\", "
                                          "\"baseClass\": \"a:C\"}")),
                      invalid_argument);
    BOOST_CHECK_THROW(readJson(schemaWith("{\"type\": \"EntityClass\", "
                                          "\"name\": \"C\", "
                                          "\"properties\": [{\"name\": \"P\", "
                                          "\"kind\": \"navigation\", "
                                          "\"direction\": \"up\"}]}")),
                      invalid_argument);
}

BOOST_AUTO_TEST_CASE( droppedReferences ) {
    Repository repository;
    RepositoryReader reader(repository);
    reader.readString(schemaWith("{\"type\": \"EntityClass\", "
                                 "\"name\": \"C\", "
                                 "\"properties\": ["
                                 "{\"name\": \"N\", \"kind\": \"navigation\", "
                                 "\"relationshipClass\": \"a:Missing\"},"
                                 "{\"name\": \"E\", "
                                 "\"kind\": \"enumeration\", "
                                 "\"enumeration\": \"a:Missing\", "
                                 "\"type\": \"string\"}]}"));
    const ClassInfo* c = repository.getMetadata().findClass("a:C");
    BOOST_REQUIRE(c != NULL);
    BOOST_CHECK(!c->findProperty("N")->getRelationshipClass());
    BOOST_CHECK(!c->findProperty("E")->getEnumeration());
    BOOST_CHECK_EQUAL(STRING, c->findProperty("E")->getPrimitiveType());
}

BOOST_AUTO_TEST_CASE( missingFile ) {
    Repository repository;
    RepositoryReader reader(repository);
    BOOST_CHECK_THROW(reader.readFile("/nonexistent/repository.json"),
                      IOFailure);
}

BOOST_AUTO_TEST_SUITE_END()
