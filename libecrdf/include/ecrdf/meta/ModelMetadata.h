/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file ModelMetadata.h
 * @brief Interface definition file for ModelMetadata
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_MODELMETADATA_H
#define ECRDF_META_MODELMETADATA_H

#include <string>
#include <vector>
#include <map>

#include <boost/noncopyable.hpp>

#include "ecrdf/meta/SchemaInfo.h"
#include "ecrdf/meta/ClassInfo.h"
#include "ecrdf/meta/EnumInfo.h"

namespace ecrdf {
namespace meta {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup meta
 * @{
 */

/**
 * @brief The metadata for a set of schemas.
 *
 * Owns every schema, class and enumeration and indexes them by ID.
 * Classes refer to each other by ID, so the inheritance graph is
 * resolved by walking through this object rather than by following
 * pointers.
 */
class ModelMetadata : private boost::noncopyable {
public:
    /**
     * Construct an empty model
     *
     * @param name the name of the model
     */
    ModelMetadata(const std::string& name);

    ~ModelMetadata();

    /**
     * Get the name of the model
     */
    const std::string& getName() const { return name; }

    /**
     * Add a schema.  Its items are ignored; they are filled in as
     * classes and enumerations are added.
     *
     * @throws std::invalid_argument if a schema with the same ID,
     * name or alias already exists
     */
    void addSchema(const SchemaInfo& schema);

    /**
     * Add a class and register it with its owning schema
     *
     * @throws std::out_of_range if the owning schema does not exist
     * @throws std::invalid_argument if the class ID is taken or the
     * schema already owns an item with the same name
     */
    void addClass(const ClassInfo& class_info);

    /**
     * Add an enumeration and register it with its owning schema
     *
     * @throws std::out_of_range if the owning schema does not exist
     * @throws std::invalid_argument if the enumeration ID is taken or
     * the schema already owns an item with the same name
     */
    void addEnumeration(const EnumInfo& enum_info);

    /**
     * Get all schemas in the order they were added
     */
    const std::vector<SchemaInfo>& getSchemas() const { return schemas; }

    /**
     * Get all classes in the order they were added
     */
    const std::vector<ClassInfo>& getClasses() const { return classes; }

    /**
     * Get a schema by ID
     *
     * @throws std::out_of_range if there is no such schema
     */
    const SchemaInfo& getSchema(schema_id_t schema_id) const;

    /**
     * Get a class by ID
     *
     * @throws std::out_of_range if there is no such class
     */
    const ClassInfo& getClass(class_id_t class_id) const;

    /**
     * Get an enumeration by ID
     *
     * @throws std::out_of_range if there is no such enumeration
     */
    const EnumInfo& getEnumeration(enum_id_t enum_id) const;

    /**
     * Check whether a class with the given ID exists
     */
    bool hasClass(class_id_t class_id) const;

    /**
     * Find a schema by its name or alias, ignoring case
     *
     * @return the schema, or NULL if there is none
     */
    const SchemaInfo* findSchema(const std::string& name_or_alias) const;

    /**
     * Find a class by its full name, "Schema:Class" or "Schema.Class",
     * where Schema is the name or alias of the owning schema
     *
     * @return the class, or NULL if there is none
     */
    const ClassInfo* findClass(const std::string& full_name) const;

    /**
     * Find a class by schema and class name
     *
     * @return the class, or NULL if there is none
     */
    const ClassInfo* findClass(const std::string& schema_name,
                               const std::string& class_name) const;

    /**
     * Find an enumeration by its full name, as for findClass()
     *
     * @return the enumeration, or NULL if there is none
     */
    const EnumInfo* findEnumeration(const std::string& full_name) const;

    /**
     * Get the inheritance chain of a class: the class itself followed
     * by each base class up to the root.
     *
     * @throws std::out_of_range if a class on the chain does not exist
     * @throws std::invalid_argument if the chain contains a cycle
     */
    std::vector<class_id_t> getClassChain(class_id_t class_id) const;

    /**
     * Get the root of the inheritance chain of a class
     *
     * @throws as for getClassChain()
     */
    const ClassInfo& getRootClass(class_id_t class_id) const;

    /**
     * Check whether a class is the given base class or derives from
     * it
     */
    bool isSubclassOf(class_id_t class_id, class_id_t base_id) const;

    /**
     * Check whether a class is a relationship without a link table
     * of its own.  Instances of such a relationship are carried by
     * the navigation properties of its endpoints.  Only the root of
     * the inheritance chain is checked for the link table marker.
     *
     * @throws as for getClassChain()
     */
    bool isNavigationRelationship(class_id_t class_id) const;

    /**
     * Check every class for a cycle or a dangling reference on its
     * inheritance chain
     *
     * @throws std::out_of_range or std::invalid_argument as for
     * getClassChain()
     */
    void checkClassHierarchy() const;

private:
    std::string name;
    std::vector<SchemaInfo> schemas;
    std::vector<ClassInfo> classes;
    std::vector<EnumInfo> enums;

    typedef std::map<uint32_t, size_t> index_map_t;
    index_map_t schema_index;
    index_map_t class_index;
    index_map_t enum_index;

    // lowercase schema name and alias to schema index
    std::map<std::string, size_t> schema_names;
    // lowercase "schema.item" to class or enumeration index
    std::map<std::string, size_t> class_names;
    std::map<std::string, size_t> enum_names;

    SchemaInfo& registerItem(schema_id_t schema_id,
                             const std::string& item_name,
                             std::string& key);
    const SchemaInfo* splitFullName(const std::string& full_name,
                                    std::string& item_name) const;
};

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_MODELMETADATA_H */
