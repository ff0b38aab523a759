/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file NameFormatter.h
 * @brief Interface definition file for NameFormatter
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_NAMEFORMATTER_H
#define ECRDF_RDF_NAMEFORMATTER_H

#include <string>

#include "ecrdf/meta/ModelMetadata.h"

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
 * @brief Formats the RDF names of schema items, properties and
 * instances.
 *
 * Schema items are named "alias:Name".  Properties are named after
 * their declaring class as "alias:Class-Property".  Instances are
 * named "prefix:<tag><id>", with a one-letter tag per kind of
 * instance.
 */
class NameFormatter {
public:

    /**
     * The instance namespaces
     */
    enum instance_prefix_t {
        CODESPEC,
        ASPECT,
        ELEMENT,
        MODEL,
        RELATIONSHIP
    };

    /**
     * Construct a formatter that resolves names against the given
     * model.  The model must outlive the formatter.
     */
    explicit NameFormatter(const meta::ModelMetadata& md);

    /**
     * Format "alias:name"
     *
     * @throws std::invalid_argument if the alias or name is empty
     */
    static std::string formatClassName(const std::string& schemaAlias,
                                       const std::string& className);

    /**
     * Format "classRdfName-propertyName"
     *
     * @throws std::invalid_argument if either part is empty
     */
    static std::string formatPropertyName(const std::string& classRdfName,
                                          const std::string& propertyName);

    /**
     * Format the label of a property, "classRdfName.propertyName"
     */
    static std::string formatPropertyLabel(const std::string& classRdfName,
                                           const std::string& propertyName);

    /**
     * Format "prefix:<tag><id>" for an instance
     *
     * @throws std::invalid_argument if the identifier is empty
     */
    static std::string formatInstanceId(instance_prefix_t prefix,
                                        const std::string& id);

    /**
     * Get the prefix name of an instance namespace, such as
     * "elementId"
     */
    static const char* getInstancePrefix(instance_prefix_t prefix);

    /**
     * Write the prefix declarations of all instance namespaces
     *
     * @param sink the sink to write to
     * @param baseIri the IRI the namespaces are placed under; it
     * should end with a slash
     */
    static void declareInstancePrefixes(TripleSink& sink,
                                        const std::string& baseIri);

    /**
     * Format the RDF name of a class
     *
     * @throws std::out_of_range if the owning schema is unknown
     */
    std::string formatSchemaItem(const meta::ClassInfo& classInfo) const;

    /**
     * Format the RDF name of an enumeration
     *
     * @throws std::out_of_range if the owning schema is unknown
     */
    std::string formatSchemaItem(const meta::EnumInfo& enumInfo) const;

    /**
     * Format the RDF name of a class given by ID
     *
     * @throws UnresolvedReference if there is no such class
     */
    std::string formatClass(meta::class_id_t classId) const;

    /**
     * Format the RDF name of a class or enumeration given by its full
     * name, "Schema:Item" or "Schema.Item"
     *
     * @throws UnresolvedReference if there is no such item
     */
    std::string formatSchemaItemFullName(const std::string& fullName) const;

private:
    const meta::ModelMetadata& md;
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_NAMEFORMATTER_H */
