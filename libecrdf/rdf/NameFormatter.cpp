/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for NameFormatter class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include <boost/lexical_cast.hpp>

#include "ecrdf/rdf/NameFormatter.h"
#include "ecrdf/rdf/TripleSink.h"
#include "ecrdf/rdf/Errors.h"

namespace ecrdf {
namespace rdf {

using meta::ModelMetadata;
using meta::ClassInfo;
using meta::EnumInfo;

/**
 * An instance namespace: its prefix, the tag its local names start
 * with, and its path under the instance base IRI
 */
struct InstanceNamespace {
    const char* prefix;
    char tag;
    const char* path;
};

static const InstanceNamespace INSTANCE_NAMESPACES[] = {
    { "codeSpecId", 'c', "codeSpec#" },
    { "aspectId", 'a', "aspect#" },
    { "elementId", 'e', "element#" },
    { "modelId", 'm', "model#" },
    { "relationshipId", 'r', "relationship#" }
};

NameFormatter::NameFormatter(const ModelMetadata& md_) : md(md_) {

}

std::string NameFormatter::formatClassName(const std::string& schemaAlias,
                                           const std::string& className) {
    if (schemaAlias.empty())
        throw std::invalid_argument("Empty schema alias for " + className);
    if (className.empty())
        throw std::invalid_argument("Empty class name in " + schemaAlias);
    return schemaAlias + ":" + className;
}

std::string
NameFormatter::formatPropertyName(const std::string& classRdfName,
                                  const std::string& propertyName) {
    if (classRdfName.empty() || propertyName.empty())
        throw std::invalid_argument("Empty property name component");
    return classRdfName + "-" + propertyName;
}

std::string
NameFormatter::formatPropertyLabel(const std::string& classRdfName,
                                   const std::string& propertyName) {
    return classRdfName + "." + propertyName;
}

std::string NameFormatter::formatInstanceId(instance_prefix_t prefix,
                                            const std::string& id) {
    if (id.empty())
        throw std::invalid_argument("Empty instance ID");
    const InstanceNamespace& ns = INSTANCE_NAMESPACES[prefix];
    std::string result(ns.prefix);
    result += ':';
    result += ns.tag;
    result += id;
    return result;
}

const char* NameFormatter::getInstancePrefix(instance_prefix_t prefix) {
    return INSTANCE_NAMESPACES[prefix].prefix;
}

void NameFormatter::declareInstancePrefixes(TripleSink& sink,
                                            const std::string& baseIri) {
    for (size_t i = 0;
         i < sizeof(INSTANCE_NAMESPACES)/sizeof(INSTANCE_NAMESPACES[0]);
         ++i) {
        sink.writePrefix(INSTANCE_NAMESPACES[i].prefix,
                         baseIri + INSTANCE_NAMESPACES[i].path);
    }
}

std::string NameFormatter::formatSchemaItem(const ClassInfo& classInfo) const {
    return formatClassName(md.getSchema(classInfo.getSchemaId()).getAlias(),
                           classInfo.getName());
}

std::string NameFormatter::formatSchemaItem(const EnumInfo& enumInfo) const {
    return formatClassName(md.getSchema(enumInfo.getSchemaId()).getAlias(),
                           enumInfo.getName());
}

std::string NameFormatter::formatClass(meta::class_id_t classId) const {
    if (!md.hasClass(classId))
        throw UnresolvedReference("Unknown class ID " +
                                  boost::lexical_cast<std::string>(classId));
    return formatSchemaItem(md.getClass(classId));
}

std::string
NameFormatter::formatSchemaItemFullName(const std::string& fullName) const {
    const ClassInfo* ci = md.findClass(fullName);
    if (ci != NULL) return formatSchemaItem(*ci);
    const EnumInfo* ei = md.findEnumeration(fullName);
    if (ei != NULL) return formatSchemaItem(*ei);
    throw UnresolvedReference("Unknown schema item " + fullName);
}

} /* namespace rdf */
} /* namespace ecrdf */
