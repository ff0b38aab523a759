/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file SchemaMapper.h
 * @brief Interface definition file for SchemaMapper
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_SCHEMAMAPPER_H
#define ECRDF_RDF_SCHEMAMAPPER_H

#include <string>

#include <boost/optional.hpp>

#include "ecrdf/meta/ModelMetadata.h"
#include "ecrdf/rdf/NameFormatter.h"
#include "ecrdf/rdf/TripleSink.h"

namespace ecrdf {
namespace rdf {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

/**
 * The IRI schema namespaces are placed under unless configured
 * otherwise
 */
extern const char* const DEFAULT_SCHEMA_BASE_IRI;

/**
 * @brief Maps the classes, enumerations and properties of a schema
 * into the upper vocabulary.
 *
 * Each class is expected to be written once per export; nothing is
 * remembered between calls.
 */
class SchemaMapper {
public:
    /**
     * Construct a schema mapper
     *
     * @param md the metadata to resolve references against
     * @param sink the sink to write to
     * @param schemaBaseIri the IRI schema namespaces are placed under
     */
    SchemaMapper(const meta::ModelMetadata& md,
                 TripleSink& sink,
                 const std::string& schemaBaseIri = DEFAULT_SCHEMA_BASE_IRI);

    /**
     * Write the prefix of a schema followed by all of its classes
     * and enumerations in declaration order
     *
     * @throws UnsupportedClassKind if a class has an unknown kind
     * @throws UnsupportedPrimitiveType if a property has an unknown
     * primitive type
     */
    void writeSchema(const meta::SchemaInfo& schema);

    /**
     * Write a class and the properties it declares.  Navigation
     * relationships are skipped.
     *
     * @throws UnsupportedClassKind if the class has an unknown kind
     * @throws UnsupportedPrimitiveType if a property has an unknown
     * primitive type
     */
    void writeClass(const meta::ClassInfo& classInfo);

    /**
     * Write an enumeration
     */
    void writeEnumeration(const meta::EnumInfo& enumInfo);

    /**
     * Write the declaration of one property
     *
     * @param classRdfName the RDF name of the declaring class
     * @param property the property
     * @throws UnsupportedPrimitiveType if the property has an unknown
     * primitive type
     */
    void writeProperty(const std::string& classRdfName,
                       const meta::PropertyInfo& property);

    /**
     * Check whether a class is a relationship without a link table
     * of its own.  Only the root of the inheritance chain is checked
     * for the link table marker.
     */
    bool isNavigationRelationship(const meta::ClassInfo& classInfo) const;

    /**
     * Get the range of a primitive property
     *
     * @throws UnsupportedPrimitiveType if the primitive type is not
     * known
     */
    static const char* getPrimitiveRange(const meta::PropertyInfo& property);

    /**
     * Get the upper vocabulary class a class without a base class
     * derives from
     *
     * @throws UnsupportedClassKind if the kind is not known
     */
    static const char* getDefaultBaseClass(meta::ClassInfo::class_type_t type);

private:
    const meta::ModelMetadata& md;
    TripleSink& sink;
    NameFormatter formatter;
    std::string schemaBaseIri;

    std::string getNavigationRange(const meta::PropertyInfo& property) const;
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_SCHEMAMAPPER_H */
