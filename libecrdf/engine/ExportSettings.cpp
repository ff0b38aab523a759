/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for ExportSettings class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <string>

#include <boost/optional.hpp>

#include "ecrdf/engine/ExportSettings.h"
#include "ecrdf/rdf/SchemaMapper.h"
#include "ecrdf/rdf/InstanceMapper.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace engine {

using std::string;
using boost::optional;
using logging::LogHandler;

ExportSettings::ExportSettings()
    : schemaBaseIri(rdf::DEFAULT_SCHEMA_BASE_IRI),
      elementClass(rdf::DEFAULT_ELEMENT_CLASS),
      codeSpecClass(rdf::DEFAULT_CODESPEC_CLASS),
      exportInstances(true) {

}

void ExportSettings::
setProperties(const boost::property_tree::ptree& properties) {
    static const string LOG_LEVEL("log.level");
    static const string SCHEMA_BASE_IRI("schema-base-iri");
    static const string INSTANCE_BASE_IRI("instance-base-iri");
    static const string ELEMENT_CLASS("element-class");
    static const string CODESPEC_CLASS("codespec-class");
    static const string EXPORT_INSTANCES("export.instances");

    optional<string> logLvl =
        properties.get_optional<string>(LOG_LEVEL);
    if (logLvl) {
        LogHandler::getHandler()->
            setLevel(LogHandler::parseLevel(logLvl.get()));
        logLevel = logLvl;
    }

    optional<string> schemaIri =
        properties.get_optional<string>(SCHEMA_BASE_IRI);
    if (schemaIri) schemaBaseIri = schemaIri.get();
    optional<string> instanceIri =
        properties.get_optional<string>(INSTANCE_BASE_IRI);
    if (instanceIri) instanceBaseIri = instanceIri;

    optional<string> elemClass =
        properties.get_optional<string>(ELEMENT_CLASS);
    if (elemClass) elementClass = elemClass.get();
    optional<string> specClass =
        properties.get_optional<string>(CODESPEC_CLASS);
    if (specClass) codeSpecClass = specClass.get();

    optional<const boost::property_tree::ptree&> instances =
        properties.get_child_optional(EXPORT_INSTANCES);
    if (instances) {
        exportInstances = properties.get<bool>(EXPORT_INSTANCES);
    }

    LOG(DEBUG) << "Schema base IRI " << schemaBaseIri
               << ", element class " << elementClass
               << ", code spec class " << codeSpecClass
               << ", export instances " << exportInstances;
}

string ExportSettings::getInstanceBaseIri(const string& repositoryId) const {
    if (instanceBaseIri) return instanceBaseIri.get();
    return "http://www.example.org/iModel/" + repositoryId + "/";
}

} /* namespace engine */
} /* namespace ecrdf */
