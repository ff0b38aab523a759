/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file SchemaInfo.h
 * @brief Interface definition file for SchemaInfo
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_SCHEMAINFO_H
#define ECRDF_META_SCHEMAINFO_H

#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "ecrdf/meta/PropertyInfo.h"

namespace ecrdf {
namespace meta {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup meta
 * @{
 */

/**
 * @brief A reference to a class or enumeration owned by a schema
 */
struct SchemaItem {
    /**
     * The kind of schema item
     */
    enum item_type_t {
        CLASS,
        ENUMERATION
    };

    SchemaItem(item_type_t type_, uint32_t id_) : type(type_), id(id_) {}

    /** the kind of item */
    item_type_t type;
    /** the class ID or enumeration ID */
    uint32_t id;
};

/**
 * @brief Metadata for a schema: a namespace of classes and
 * enumerations with a unique alias and a versioned key.
 */
class SchemaInfo {
public:
    /**
     * Construct a schema info object
     *
     * @param schema_id the unique schema ID
     * @param name the schema name
     * @param alias the unique short alias of the schema
     * @param version the version string, such as "01.00.03"
     */
    SchemaInfo(schema_id_t schema_id,
               const std::string& name,
               const std::string& alias,
               const std::string& version);

    ~SchemaInfo();

    /**
     * Get the unique schema ID
     */
    schema_id_t getId() const { return schema_id; }

    /**
     * Get the schema name
     */
    const std::string& getName() const { return name; }

    /**
     * Get the schema alias
     */
    const std::string& getAlias() const { return alias; }

    /**
     * Get the version string
     */
    const std::string& getVersion() const { return version; }

    /**
     * Get the full versioned key of the schema, of the form
     * "Name.Version"
     */
    std::string getSchemaKey() const;

    /**
     * Get the description, if any
     */
    const boost::optional<std::string>& getDescription() const {
        return description;
    }

    /**
     * Set the description
     */
    SchemaInfo& setDescription(const std::string& description_) {
        description = description_;
        return *this;
    }

    /**
     * Get the classes and enumerations owned by the schema in
     * declaration order
     */
    const std::vector<SchemaItem>& getItems() const { return items; }

    /**
     * Add an owned class
     */
    SchemaInfo& addClass(class_id_t class_id) {
        items.push_back(SchemaItem(SchemaItem::CLASS, class_id));
        return *this;
    }

    /**
     * Add an owned enumeration
     */
    SchemaInfo& addEnumeration(enum_id_t enum_id) {
        items.push_back(SchemaItem(SchemaItem::ENUMERATION, enum_id));
        return *this;
    }

private:
    schema_id_t schema_id;
    std::string name;
    std::string alias;
    std::string version;
    boost::optional<std::string> description;
    std::vector<SchemaItem> items;
};

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_SCHEMAINFO_H */
