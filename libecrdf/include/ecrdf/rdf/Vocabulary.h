/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Vocabulary.h
 * @brief The fixed upper vocabulary that mapped schemas derive from
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_VOCABULARY_H
#define ECRDF_RDF_VOCABULARY_H

#include <cstddef>

namespace ecrdf {
namespace rdf {

class TripleSink;

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

/**
 * Terms of the RDF, RDF Schema, XSD and EC vocabularies, as prefixed
 * names
 */
namespace vocab {

/**
 * A namespace prefix and the IRI it stands for
 */
struct Namespace {
    /** the prefix, without the colon */
    const char* prefix;
    /** the IRI */
    const char* iri;
};

/** RDF */
extern const Namespace RDF;
/** RDF Schema */
extern const Namespace RDFS;
/** XML Schema datatypes */
extern const Namespace XSD;
/** The EC extension vocabulary */
extern const Namespace EC;

extern const char* const RDF_TYPE;
extern const char* const RDF_PROPERTY;
extern const char* const RDF_LIST;

extern const char* const RDFS_CLASS;
extern const char* const RDFS_SUBCLASSOF;
extern const char* const RDFS_LITERAL;
extern const char* const RDFS_LABEL;
extern const char* const RDFS_COMMENT;
extern const char* const RDFS_RANGE;
extern const char* const RDFS_DOMAIN;

extern const char* const XSD_BASE64BINARY;
extern const char* const XSD_BOOLEAN;
extern const char* const XSD_DATETIME;
extern const char* const XSD_DOUBLE;
extern const char* const XSD_INTEGER;
extern const char* const XSD_LONG;
extern const char* const XSD_STRING;

extern const char* const EC_CLASS;
extern const char* const EC_ENTITYCLASS;
extern const char* const EC_RELATIONSHIPCLASS;
extern const char* const EC_CUSTOMATTRIBUTECLASS;
extern const char* const EC_ENUMERATION;
extern const char* const EC_IGEOMETRY;
extern const char* const EC_MIXIN;
extern const char* const EC_PROPERTY;
extern const char* const EC_PRIMITIVEPROPERTY;
extern const char* const EC_STRUCTPROPERTY;
extern const char* const EC_PRIMITIVEARRAYPROPERTY;
extern const char* const EC_STRUCTARRAYPROPERTY;
extern const char* const EC_NAVIGATIONPROPERTY;
extern const char* const EC_POINT2D;
extern const char* const EC_POINT3D;
extern const char* const EC_EXTENDEDTYPE;
extern const char* const EC_ID64STRING;
extern const char* const EC_JSONSTRING;
extern const char* const EC_GUIDSTRING;

/**
 * Every term of the EC vocabulary, in declaration order
 */
extern const char* const* const EC_TERMS;

/**
 * The number of entries in EC_TERMS
 */
extern const size_t EC_TERM_COUNT;

/**
 * Write the complete upper vocabulary: the four prefix declarations,
 * the EC class hierarchy, the built-in instance properties, the EC
 * property hierarchy, the EC primitive refinements and a label for
 * every EC term.  The content is the same on every call.
 *
 * @param sink the sink to write to
 */
void declareVocabulary(TripleSink& sink);

} /* namespace vocab */

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_VOCABULARY_H */
