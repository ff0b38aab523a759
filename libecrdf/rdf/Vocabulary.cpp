/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for the upper vocabulary
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <string>

#include "ecrdf/rdf/Vocabulary.h"
#include "ecrdf/rdf/TripleSink.h"

namespace ecrdf {
namespace rdf {
namespace vocab {

const Namespace RDF =
    { "rdf", "http://www.w3.org/1999/02/22-rdf-syntax-ns#" };
const Namespace RDFS =
    { "rdfs", "http://www.w3.org/2000/01/rdf-schema#" };
const Namespace XSD =
    { "xsd", "http://www.w3.org/2001/XMLSchema#" };
const Namespace EC =
    { "ec", "http://www.example.org/ec#" };

const char* const RDF_TYPE = "rdf:type";
const char* const RDF_PROPERTY = "rdf:Property";
const char* const RDF_LIST = "rdf:List";

const char* const RDFS_CLASS = "rdfs:Class";
const char* const RDFS_SUBCLASSOF = "rdfs:subClassOf";
const char* const RDFS_LITERAL = "rdfs:Literal";
const char* const RDFS_LABEL = "rdfs:label";
const char* const RDFS_COMMENT = "rdfs:comment";
const char* const RDFS_RANGE = "rdfs:range";
const char* const RDFS_DOMAIN = "rdfs:domain";

const char* const XSD_BASE64BINARY = "xsd:base64Binary";
const char* const XSD_BOOLEAN = "xsd:boolean";
const char* const XSD_DATETIME = "xsd:dateTime";
const char* const XSD_DOUBLE = "xsd:double";
const char* const XSD_INTEGER = "xsd:integer";
const char* const XSD_LONG = "xsd:long";
const char* const XSD_STRING = "xsd:string";

const char* const EC_CLASS = "ec:Class";
const char* const EC_ENTITYCLASS = "ec:EntityClass";
const char* const EC_RELATIONSHIPCLASS = "ec:RelationshipClass";
const char* const EC_CUSTOMATTRIBUTECLASS = "ec:CustomAttributeClass";
const char* const EC_ENUMERATION = "ec:Enumeration";
const char* const EC_IGEOMETRY = "ec:IGeometry";
const char* const EC_MIXIN = "ec:Mixin";
const char* const EC_PROPERTY = "ec:Property";
const char* const EC_PRIMITIVEPROPERTY = "ec:PrimitiveProperty";
const char* const EC_STRUCTPROPERTY = "ec:StructProperty";
const char* const EC_PRIMITIVEARRAYPROPERTY = "ec:PrimitiveArrayProperty";
const char* const EC_STRUCTARRAYPROPERTY = "ec:StructArrayProperty";
const char* const EC_NAVIGATIONPROPERTY = "ec:NavigationProperty";
const char* const EC_POINT2D = "ec:Point2d";
const char* const EC_POINT3D = "ec:Point3d";
const char* const EC_EXTENDEDTYPE = "ec:ExtendedType";
const char* const EC_ID64STRING = "ec:Id64String";
const char* const EC_JSONSTRING = "ec:JsonString";
const char* const EC_GUIDSTRING = "ec:GuidString";

static const char* const EC_TERM_TABLE[] = {
    EC_CLASS,
    EC_ENTITYCLASS,
    EC_RELATIONSHIPCLASS,
    EC_CUSTOMATTRIBUTECLASS,
    EC_ENUMERATION,
    EC_IGEOMETRY,
    EC_MIXIN,
    EC_PROPERTY,
    EC_PRIMITIVEPROPERTY,
    EC_STRUCTPROPERTY,
    EC_PRIMITIVEARRAYPROPERTY,
    EC_STRUCTARRAYPROPERTY,
    EC_NAVIGATIONPROPERTY,
    EC_POINT2D,
    EC_POINT3D,
    EC_EXTENDEDTYPE,
    EC_ID64STRING,
    EC_JSONSTRING,
    EC_GUIDSTRING
};

const char* const* const EC_TERMS = EC_TERM_TABLE;
const size_t EC_TERM_COUNT =
    sizeof(EC_TERM_TABLE)/sizeof(EC_TERM_TABLE[0]);

/**
 * A subclass statement of the upper vocabulary
 */
struct SubClass {
    const char* subject;
    const char* parent;
};

static const SubClass CLASS_HIERARCHY[] = {
    { EC_CLASS, RDFS_CLASS },
    { EC_ENTITYCLASS, EC_CLASS },
    { EC_RELATIONSHIPCLASS, EC_CLASS },
    { EC_CUSTOMATTRIBUTECLASS, EC_CLASS },
    { EC_MIXIN, EC_CLASS },
    { EC_ENUMERATION, RDFS_CLASS }
};

static const SubClass PROPERTY_HIERARCHY[] = {
    { EC_PROPERTY, RDF_PROPERTY },
    { EC_PRIMITIVEPROPERTY, EC_PROPERTY },
    { EC_PRIMITIVEARRAYPROPERTY, EC_PROPERTY },
    { EC_STRUCTPROPERTY, EC_PROPERTY },
    { EC_STRUCTARRAYPROPERTY, EC_PROPERTY },
    { EC_NAVIGATIONPROPERTY, EC_PROPERTY },
    { EC_GUIDSTRING, XSD_STRING },
    { EC_ID64STRING, XSD_STRING },
    { EC_JSONSTRING, XSD_STRING },
    { EC_POINT2D, EC_JSONSTRING },
    { EC_POINT3D, EC_JSONSTRING }
};

/**
 * A property that every entity or relationship instance carries
 */
struct BuiltinProperty {
    const char* classRdfName;
    const char* name;
    const char* subClassOf;
    const char* range;
    const char* comment;
};

static const BuiltinProperty BUILTIN_PROPERTIES[] = {
    { EC_ENTITYCLASS, "Id", EC_PRIMITIVEPROPERTY, EC_ID64STRING,
      "Id of the entity instance" },
    { EC_RELATIONSHIPCLASS, "Id", EC_PRIMITIVEPROPERTY, EC_ID64STRING,
      "Id of the relationship instance" },
    { EC_RELATIONSHIPCLASS, "Source", EC_NAVIGATIONPROPERTY,
      EC_ENTITYCLASS, "The source of the relationship" },
    { EC_RELATIONSHIPCLASS, "Target", EC_NAVIGATIONPROPERTY,
      EC_ENTITYCLASS, "The target of the relationship" }
};

#define ARRAY_SIZE(a) (sizeof(a)/sizeof((a)[0]))

void declareVocabulary(TripleSink& sink) {
    sink.writePrefix(RDF.prefix, RDF.iri);
    sink.writePrefix(RDFS.prefix, RDFS.iri);
    sink.writePrefix(XSD.prefix, XSD.iri);
    sink.writePrefix(EC.prefix, EC.iri);

    for (size_t i = 0; i < ARRAY_SIZE(CLASS_HIERARCHY); ++i) {
        sink.writeTriple(CLASS_HIERARCHY[i].subject, RDFS_SUBCLASSOF,
                         CLASS_HIERARCHY[i].parent);
    }
    for (size_t i = 0; i < ARRAY_SIZE(BUILTIN_PROPERTIES); ++i) {
        const BuiltinProperty& p = BUILTIN_PROPERTIES[i];
        sink.writePropertyTriples(p.classRdfName, p.name, p.subClassOf,
                                  std::string(p.range),
                                  std::string(p.comment));
    }
    for (size_t i = 0; i < ARRAY_SIZE(PROPERTY_HIERARCHY); ++i) {
        sink.writeTriple(PROPERTY_HIERARCHY[i].subject, RDFS_SUBCLASSOF,
                         PROPERTY_HIERARCHY[i].parent);
    }
    for (size_t i = 0; i < EC_TERM_COUNT; ++i) {
        sink.writeLabel(EC_TERMS[i]);
    }
}

} /* namespace vocab */
} /* namespace rdf */
} /* namespace ecrdf */
