/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file InstanceMapper.h
 * @brief Interface definition file for InstanceMapper
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_INSTANCEMAPPER_H
#define ECRDF_RDF_INSTANCEMAPPER_H

#include <string>

#include <rapidjson/document.h>

#include "ecrdf/meta/ModelMetadata.h"
#include "ecrdf/meta/Instance.h"
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
 * The class whose properties carry the code of an element unless
 * configured otherwise
 */
extern const char* const DEFAULT_ELEMENT_CLASS;

/**
 * The class of code spec instances unless configured otherwise
 */
extern const char* const DEFAULT_CODESPEC_CLASS;

/**
 * @brief Maps instances to a type statement followed by one statement
 * per property value.
 *
 * Properties are taken from the class of the instance and each of its
 * base classes in turn, and each value is written with the predicate
 * of the class that declares the property.  A property without a
 * value produces no statement.  A value that cannot be written is
 * logged and skipped without affecting the rest of the instance.
 */
class InstanceMapper {
public:
    /**
     * Construct an instance mapper
     *
     * @param md the metadata to resolve classes against
     * @param sink the sink to write to
     * @param elementClass the full name of the class that declares
     * the code properties of elements
     * @param codeSpecClass the full name of the class of code specs
     */
    InstanceMapper(const meta::ModelMetadata& md,
                   TripleSink& sink,
                   const std::string& elementClass = DEFAULT_ELEMENT_CLASS,
                   const std::string& codeSpecClass = DEFAULT_CODESPEC_CLASS);

    /**
     * Write an instance of any kind
     *
     * @return true if the instance was written, false if it was
     * skipped because its class is unknown
     * @throws UnsupportedPrimitiveType if a property of its class has
     * an unknown primitive type
     */
    bool writeInstance(const meta::Instance& instance);

    /**
     * Write a code spec: its type and its name
     */
    bool writeCodeSpec(const meta::Instance& codeSpec);

    /**
     * Write an element: its type, its code if it has one, and its
     * property values
     */
    bool writeElement(const meta::Instance& element);

    /**
     * Write an element aspect: its type and its property values
     */
    bool writeAspect(const meta::Instance& aspect);

    /**
     * Write a model: its type and its property values
     */
    bool writeModel(const meta::Instance& model);

    /**
     * Write a relationship: its type, its source and target, and its
     * property values
     */
    bool writeRelationship(const meta::Instance& relationship);

    /**
     * Write the statement for one property value.  Nothing is written
     * for struct and array properties.
     *
     * @param subject the RDF name of the instance
     * @param predicate the RDF name of the property
     * @param property the property
     * @param value the value, which must be present
     * @throws UnresolvedReference if the value refers to an invalid
     * identifier
     * @throws std::invalid_argument if the value is malformed
     * @throws UnsupportedPrimitiveType if the primitive type is not
     * known
     */
    void writePropertyValue(const std::string& subject,
                            const std::string& predicate,
                            const meta::PropertyInfo& property,
                            const rapidjson::Value& value);

private:
    const meta::ModelMetadata& md;
    TripleSink& sink;
    NameFormatter formatter;
    std::string elementClass;
    std::string codeSpecClass;

    const meta::ClassInfo* writeType(const meta::Instance& instance,
                                     NameFormatter::instance_prefix_t prefix,
                                     std::string& subject);
    void writeCode(const std::string& subject, const meta::Code& code);
    void writeEndpoint(const std::string& subject,
                       const std::string& predicate,
                       const std::string& id);
    void writeProperties(const meta::Instance& instance,
                         const meta::ClassInfo& classInfo,
                         const std::string& subject);
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_INSTANCEMAPPER_H */
