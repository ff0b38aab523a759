/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for SchemaMapper class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

#include "ecrdf/rdf/SchemaMapper.h"
#include "ecrdf/rdf/Vocabulary.h"
#include "ecrdf/rdf/Errors.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace rdf {

using std::string;
using boost::optional;
using meta::ModelMetadata;
using meta::SchemaInfo;
using meta::SchemaItem;
using meta::ClassInfo;
using meta::EnumInfo;
using meta::PropertyInfo;

const char* const DEFAULT_SCHEMA_BASE_IRI = "http://www.example.org/schemas/";

SchemaMapper::SchemaMapper(const ModelMetadata& md_,
                           TripleSink& sink_,
                           const std::string& schemaBaseIri_)
    : md(md_), sink(sink_), formatter(md_), schemaBaseIri(schemaBaseIri_) {

}

void SchemaMapper::writeSchema(const SchemaInfo& schema) {
    LOG(DEBUG) << "Writing schema " << schema.getSchemaKey();
    sink.writePrefix(schema.getAlias(),
                     schemaBaseIri + schema.getSchemaKey() + "#");
    BOOST_FOREACH(const SchemaItem& item, schema.getItems()) {
        switch (item.type) {
        case SchemaItem::CLASS:
            writeClass(md.getClass(item.id));
            break;
        case SchemaItem::ENUMERATION:
            writeEnumeration(md.getEnumeration(item.id));
            break;
        }
    }
}

const char* SchemaMapper::getDefaultBaseClass(ClassInfo::class_type_t type) {
    switch (type) {
    case ClassInfo::CUSTOM_ATTRIBUTE:
        return vocab::EC_CUSTOMATTRIBUTECLASS;
    case ClassInfo::ENTITY:
        return vocab::EC_ENTITYCLASS;
    case ClassInfo::ENUMERATION:
        return vocab::EC_ENUMERATION;
    case ClassInfo::MIXIN:
        return vocab::EC_MIXIN;
    case ClassInfo::RELATIONSHIP:
        return vocab::EC_RELATIONSHIPCLASS;
    }
    throw UnsupportedClassKind("Unexpected class kind " +
                               boost::lexical_cast<string>(type));
}

bool SchemaMapper::isNavigationRelationship(const ClassInfo& classInfo) const {
    return md.isNavigationRelationship(classInfo.getId());
}

void SchemaMapper::writeClass(const ClassInfo& classInfo) {
    if (isNavigationRelationship(classInfo)) {
        // surfaces only through navigation properties
        LOG(DEBUG2) << "Skipping navigation relationship "
                    << classInfo.getName();
        return;
    }

    const string classRdfName = formatter.formatSchemaItem(classInfo);
    const optional<meta::class_id_t>& base = classInfo.getBaseClass();
    string parent;
    if (base) {
        parent = formatter.formatClass(base.get());
    } else {
        try {
            parent = getDefaultBaseClass(classInfo.getType());
        } catch (const UnsupportedClassKind& e) {
            throw UnsupportedClassKind(string(e.what()) + " for class " +
                                       classRdfName);
        }
    }

    sink.writeTriple(classRdfName, vocab::RDFS_SUBCLASSOF, parent);
    sink.writeLabel(classRdfName,
                    classInfo.getLabel().get_value_or(classRdfName));
    if (classInfo.getDescription())
        sink.writeComment(classRdfName, classInfo.getDescription().get());

    BOOST_FOREACH(const PropertyInfo& property, classInfo.getProperties()) {
        writeProperty(classRdfName, property);
    }
}

void SchemaMapper::writeEnumeration(const EnumInfo& enumInfo) {
    const string enumRdfName = formatter.formatSchemaItem(enumInfo);
    sink.writeTriple(enumRdfName, vocab::RDFS_SUBCLASSOF,
                     vocab::EC_ENUMERATION);
    sink.writeLabel(enumRdfName, enumInfo.getLabel().get_value_or(enumRdfName));
    if (enumInfo.getDescription())
        sink.writeComment(enumRdfName, enumInfo.getDescription().get());
}

const char* SchemaMapper::getPrimitiveRange(const PropertyInfo& property) {
    switch (property.getPrimitiveType()) {
    case meta::BINARY:
        if (property.hasExtendedType("beguid"))
            return vocab::EC_GUIDSTRING;
        return vocab::XSD_BASE64BINARY;
    case meta::BOOLEAN:
        return vocab::XSD_BOOLEAN;
    case meta::DATETIME:
        return vocab::XSD_DATETIME;
    case meta::DOUBLE:
        return vocab::XSD_DOUBLE;
    case meta::GEOMETRY:
        return vocab::EC_IGEOMETRY;
    case meta::INTEGER:
        return vocab::XSD_INTEGER;
    case meta::LONG:
        return vocab::XSD_LONG;
    case meta::POINT2D:
        return vocab::EC_POINT2D;
    case meta::POINT3D:
        return vocab::EC_POINT3D;
    case meta::STRING:
        if (property.hasExtendedType("json"))
            return vocab::EC_JSONSTRING;
        return vocab::XSD_STRING;
    }
    throw UnsupportedPrimitiveType("Unexpected primitive type " +
                                   boost::lexical_cast<string>
                                   (property.getPrimitiveType()) +
                                   " for property " + property.getName());
}

string SchemaMapper::getNavigationRange(const PropertyInfo& property) const {
    const optional<meta::class_id_t>& relId = property.getRelationshipClass();
    if (!relId || !md.hasClass(relId.get()))
        throw UnresolvedReference("Unresolved relationship class for "
                                  "navigation property " +
                                  property.getName());
    const ClassInfo& rel = md.getClass(relId.get());
    if (rel.getType() != ClassInfo::RELATIONSHIP)
        throw UnresolvedReference(rel.getName() +
                                  " is not a relationship class");

    optional<meta::class_id_t> constraintClass;
    switch (property.getDirection()) {
    case PropertyInfo::FORWARD:
        constraintClass = rel.getTarget().getFirstClass();
        break;
    case PropertyInfo::BACKWARD:
        constraintClass = rel.getSource().getFirstClass();
        break;
    }
    if (!constraintClass)
        return vocab::EC_ENTITYCLASS;
    return formatter.formatClass(constraintClass.get());
}

void SchemaMapper::writeProperty(const string& classRdfName,
                                 const PropertyInfo& property) {
    const string& name = property.getName();
    const optional<string>& comment = property.getDescription();

    if (property.isArray()) {
        sink.writePropertyTriples(classRdfName, name,
                                  property.isPrimitive()
                                  ? vocab::EC_PRIMITIVEARRAYPROPERTY
                                  : vocab::EC_STRUCTARRAYPROPERTY,
                                  string(vocab::RDF_LIST), comment);
        return;
    }

    switch (property.getKind()) {
    case PropertyInfo::ENUMERATION:
        if (property.getEnumeration()) {
            try {
                const EnumInfo& ei =
                    md.getEnumeration(property.getEnumeration().get());
                sink.writePropertyTriples(classRdfName, name,
                                          vocab::EC_PRIMITIVEPROPERTY,
                                          formatter.formatSchemaItem(ei),
                                          comment);
                break;
            } catch (const std::out_of_range& e) {
                LOG(DEBUG) << "Enumeration of " << classRdfName << "."
                           << name << " not found; using its primitive type";
            }
        }
        sink.writePropertyTriples(classRdfName, name,
                                  vocab::EC_PRIMITIVEPROPERTY,
                                  string(getPrimitiveRange(property)),
                                  comment);
        break;
    case PropertyInfo::NAVIGATION:
        {
            optional<string> range;
            try {
                range = getNavigationRange(property);
            } catch (const UnresolvedReference& e) {
                LOG(WARNING) << "No range for " << classRdfName << "."
                             << name << ": " << e.what();
            }
            sink.writePropertyTriples(classRdfName, name,
                                      vocab::EC_NAVIGATIONPROPERTY,
                                      range, comment);
        }
        break;
    case PropertyInfo::STRUCT:
        sink.writePropertyTriples(classRdfName, name,
                                  vocab::EC_STRUCTPROPERTY,
                                  boost::none, comment);
        break;
    case PropertyInfo::PRIMITIVE:
        sink.writePropertyTriples(classRdfName, name,
                                  vocab::EC_PRIMITIVEPROPERTY,
                                  string(getPrimitiveRange(property)),
                                  comment);
        break;
    }
}

} /* namespace rdf */
} /* namespace ecrdf */
