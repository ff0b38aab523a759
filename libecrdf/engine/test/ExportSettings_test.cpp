/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Test suite for ExportSettings class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sstream>
#include <stdexcept>

#include <boost/test/unit_test.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "ecrdf/engine/ExportSettings.h"
#include "ecrdf/logging/LogHandler.h"

using namespace ecrdf::engine;
using ecrdf::logging::LogHandler;
using boost::property_tree::ptree;

class SettingsFixture {
public:
    SettingsFixture()
        : savedLevel(LogHandler::getHandler()->getLevel()) {}

    ~SettingsFixture() {
        LogHandler::getHandler()->setLevel(savedLevel);
    }

    void apply(const char* json) {
        std::istringstream is(json);
        ptree properties;
        boost::property_tree::read_json(is, properties);
        settings.setProperties(properties);
    }

    ExportSettings settings;
    LogHandler::Level savedLevel;
};

BOOST_AUTO_TEST_SUITE(ExportSettings_test)

BOOST_FIXTURE_TEST_CASE( defaults, SettingsFixture ) {
    BOOST_CHECK_EQUAL("http://www.example.org/schemas/",
                      settings.getSchemaBaseIri());
    BOOST_CHECK_EQUAL("http://www.example.org/iModel/abc/",
                      settings.getInstanceBaseIri("abc"));
    BOOST_CHECK_EQUAL("BisCore:Element", settings.getElementClass());
    BOOST_CHECK_EQUAL("BisCore:CodeSpec", settings.getCodeSpecClass());
    BOOST_CHECK(settings.isExportInstances());
    BOOST_CHECK(!settings.getLogLevel());

    apply("{}");
    BOOST_CHECK_EQUAL("http://www.example.org/schemas/",
                      settings.getSchemaBaseIri());
    BOOST_CHECK(settings.isExportInstances());
}

BOOST_FIXTURE_TEST_CASE( overrides, SettingsFixture ) {
    apply("{\"schema-base-iri\": \"urn:s/\","
          " \"instance-base-iri\": \"urn:i/\","
          " \"element-class\": \"Core:Thing\","
          " \"codespec-class\": \"Core:Spec\","
          " \"export\": {\"instances\": false}}");

    BOOST_CHECK_EQUAL("urn:s/", settings.getSchemaBaseIri());
    BOOST_CHECK_EQUAL("urn:i/", settings.getInstanceBaseIri("abc"));
    BOOST_CHECK_EQUAL("Core:Thing", settings.getElementClass());
    BOOST_CHECK_EQUAL("Core:Spec", settings.getCodeSpecClass());
    BOOST_CHECK(!settings.isExportInstances());

    // later trees only change what they name
    apply("{\"export\": {\"instances\": true}}");
    BOOST_CHECK(settings.isExportInstances());
    BOOST_CHECK_EQUAL("urn:s/", settings.getSchemaBaseIri());
}

BOOST_FIXTURE_TEST_CASE( logLevel, SettingsFixture ) {
    apply("{\"log\": {\"level\": \"warning\"}}");
    BOOST_REQUIRE(settings.getLogLevel());
    BOOST_CHECK_EQUAL("warning", settings.getLogLevel().get());
    BOOST_CHECK_EQUAL(LogHandler::WARNING,
                      LogHandler::getHandler()->getLevel());
}

BOOST_FIXTURE_TEST_CASE( invalid, SettingsFixture ) {
    BOOST_CHECK_THROW(apply("{\"log\": {\"level\": \"loud\"}}"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(apply("{\"export\": {\"instances\": \"maybe\"}}"),
                      boost::property_tree::ptree_bad_data);
}

BOOST_AUTO_TEST_SUITE_END()
