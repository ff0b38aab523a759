/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file RepositoryReader.h
 * @brief Interface definition file for RepositoryReader
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_REPOSITORYREADER_H
#define ECRDF_ENGINE_REPOSITORYREADER_H

#include <cstdio>
#include <string>
#include <map>
#include <vector>

#include <boost/optional.hpp>
#include <rapidjson/document.h>

#include "ecrdf/engine/Repository.h"

namespace ecrdf {
namespace engine {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup engine
 * @{
 */

/**
 * @brief Load a repository from a JSON document.
 *
 * The document is an object with the members "id", "name",
 * "schemas", "codeSpecs", "models", "elements", "aspects" and
 * "relationships".  Schemas are read in two passes, so a schema item
 * may refer to an item declared later or in another schema.
 *
 * Errors in the schemas are fatal.  Instances that cannot be loaded,
 * and references inside schemas that do not resolve, are dropped
 * with a warning.
 */
class RepositoryReader {
public:
    /**
     * Construct a reader that loads into the given repository
     */
    RepositoryReader(Repository& repository);

    /**
     * Read a repository from a file
     *
     * @throws rdf::IOFailure if the file could not be opened
     * @throws std::invalid_argument if the document is malformed
     * @throws rdf::UnsupportedClassKind if a class has an unknown kind
     * @throws rdf::UnsupportedPrimitiveType if a property has an
     * unknown primitive type
     */
    void readFile(const std::string& fileName);

    /**
     * Read a repository from a string
     *
     * @see readFile
     */
    void readString(const std::string& json);

    /**
     * Read a repository from a parsed document
     *
     * @see readFile
     */
    void read(const rapidjson::Value& document);

    /**
     * Get the number of instances dropped so far
     */
    size_t getDroppedCount() const { return dropped; }

private:
    Repository& repository;
    size_t dropped;

    /* IDs assigned in the first pass, by lower case "Schema.Item" */
    std::map<std::string, uint32_t> classIds;
    std::map<std::string, uint32_t> enumIds;

    void readSchemaNames(const rapidjson::Value& schemas);
    void readSchemaItems(const rapidjson::Value& schemas);
    void readClass(meta::schema_id_t schemaId,
                   const rapidjson::Value& item);
    void readEnumeration(meta::schema_id_t schemaId,
                         const rapidjson::Value& item);
    std::vector<meta::class_id_t>
    readConstraint(const rapidjson::Value& item, const char* end,
                   const std::string& fullName) const;
    meta::PropertyInfo readProperty(const std::string& className,
                                    const rapidjson::Value& prop);
    void readInstances(const rapidjson::Value& document,
                       const char* member,
                       meta::Instance::instance_kind_t kind);
    void readInstance(const rapidjson::Value& inst,
                      meta::Instance::instance_kind_t kind);

    std::string getKey(const std::string& fullName) const;
    boost::optional<meta::class_id_t>
    resolveClass(const std::string& fullName) const;
    boost::optional<meta::enum_id_t>
    resolveEnumeration(const std::string& fullName) const;
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_REPOSITORYREADER_H */
