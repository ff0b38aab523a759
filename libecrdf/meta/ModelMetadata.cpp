/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for ModelMetadata class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <set>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/foreach.hpp>

#include "ecrdf/meta/ModelMetadata.h"

namespace ecrdf {
namespace meta {

using boost::algorithm::to_lower_copy;

ModelMetadata::ModelMetadata(const std::string& name_)
    : name(name_) {

}

ModelMetadata::~ModelMetadata() {
}

void ModelMetadata::addSchema(const SchemaInfo& schema) {
    if (schema_index.find(schema.getId()) != schema_index.end())
        throw std::invalid_argument("Duplicate schema ID for " +
                                    schema.getName());
    std::string lname = to_lower_copy(schema.getName());
    std::string lalias = to_lower_copy(schema.getAlias());
    if (schema_names.find(lname) != schema_names.end())
        throw std::invalid_argument("Duplicate schema " + schema.getName());
    if (schema_names.find(lalias) != schema_names.end())
        throw std::invalid_argument("Duplicate schema alias " +
                                    schema.getAlias());

    size_t index = schemas.size();
    schemas.push_back(SchemaInfo(schema.getId(), schema.getName(),
                                 schema.getAlias(), schema.getVersion()));
    if (schema.getDescription())
        schemas.back().setDescription(schema.getDescription().get());
    schema_index[schema.getId()] = index;
    schema_names[lname] = index;
    schema_names[lalias] = index;
}

SchemaInfo& ModelMetadata::registerItem(schema_id_t schema_id,
                                        const std::string& item_name,
                                        std::string& key) {
    SchemaInfo& schema = schemas.at(schema_index.at(schema_id));
    key = to_lower_copy(schema.getName() + "." + item_name);
    if (class_names.find(key) != class_names.end() ||
        enum_names.find(key) != enum_names.end())
        throw std::invalid_argument("Duplicate schema item " +
                                    schema.getName() + ":" + item_name);
    return schema;
}

void ModelMetadata::addClass(const ClassInfo& class_info) {
    if (class_index.find(class_info.getId()) != class_index.end())
        throw std::invalid_argument("Duplicate class ID for " +
                                    class_info.getName());
    std::string key;
    SchemaInfo& schema =
        registerItem(class_info.getSchemaId(), class_info.getName(), key);

    size_t index = classes.size();
    classes.push_back(class_info);
    class_index[class_info.getId()] = index;
    class_names[key] = index;
    schema.addClass(class_info.getId());
}

void ModelMetadata::addEnumeration(const EnumInfo& enum_info) {
    if (enum_index.find(enum_info.getId()) != enum_index.end())
        throw std::invalid_argument("Duplicate enumeration ID for " +
                                    enum_info.getName());
    std::string key;
    SchemaInfo& schema =
        registerItem(enum_info.getSchemaId(), enum_info.getName(), key);

    size_t index = enums.size();
    enums.push_back(enum_info);
    enum_index[enum_info.getId()] = index;
    enum_names[key] = index;
    schema.addEnumeration(enum_info.getId());
}

const SchemaInfo& ModelMetadata::getSchema(schema_id_t schema_id) const {
    return schemas.at(schema_index.at(schema_id));
}

const ClassInfo& ModelMetadata::getClass(class_id_t class_id) const {
    return classes.at(class_index.at(class_id));
}

const EnumInfo& ModelMetadata::getEnumeration(enum_id_t enum_id) const {
    return enums.at(enum_index.at(enum_id));
}

bool ModelMetadata::hasClass(class_id_t class_id) const {
    return class_index.find(class_id) != class_index.end();
}

const SchemaInfo*
ModelMetadata::findSchema(const std::string& name_or_alias) const {
    std::map<std::string, size_t>::const_iterator it =
        schema_names.find(to_lower_copy(name_or_alias));
    if (it == schema_names.end()) return NULL;
    return &schemas[it->second];
}

const SchemaInfo*
ModelMetadata::splitFullName(const std::string& full_name,
                             std::string& item_name) const {
    size_t sep = full_name.find_first_of(":.");
    if (sep == std::string::npos || sep == 0 || sep + 1 >= full_name.size())
        return NULL;
    item_name = full_name.substr(sep + 1);
    return findSchema(full_name.substr(0, sep));
}

const ClassInfo*
ModelMetadata::findClass(const std::string& full_name) const {
    std::string item_name;
    const SchemaInfo* schema = splitFullName(full_name, item_name);
    if (schema == NULL) return NULL;
    return findClass(schema->getName(), item_name);
}

const ClassInfo*
ModelMetadata::findClass(const std::string& schema_name,
                         const std::string& class_name) const {
    const SchemaInfo* schema = findSchema(schema_name);
    if (schema == NULL) return NULL;
    std::map<std::string, size_t>::const_iterator it =
        class_names.find(to_lower_copy(schema->getName() + "." + class_name));
    if (it == class_names.end()) return NULL;
    return &classes[it->second];
}

const EnumInfo*
ModelMetadata::findEnumeration(const std::string& full_name) const {
    std::string item_name;
    const SchemaInfo* schema = splitFullName(full_name, item_name);
    if (schema == NULL) return NULL;
    std::map<std::string, size_t>::const_iterator it =
        enum_names.find(to_lower_copy(schema->getName() + "." + item_name));
    if (it == enum_names.end()) return NULL;
    return &enums[it->second];
}

std::vector<class_id_t>
ModelMetadata::getClassChain(class_id_t class_id) const {
    std::vector<class_id_t> chain;
    std::set<class_id_t> seen;
    boost::optional<class_id_t> current = class_id;
    while (current) {
        if (!seen.insert(current.get()).second)
            throw std::invalid_argument("Inheritance cycle at class " +
                                        getClass(current.get()).getName());
        const ClassInfo& ci = getClass(current.get());
        chain.push_back(ci.getId());
        current = ci.getBaseClass();
    }
    return chain;
}

const ClassInfo& ModelMetadata::getRootClass(class_id_t class_id) const {
    return getClass(getClassChain(class_id).back());
}

bool ModelMetadata::isSubclassOf(class_id_t class_id,
                                 class_id_t base_id) const {
    BOOST_FOREACH(class_id_t id, getClassChain(class_id)) {
        if (id == base_id) return true;
    }
    return false;
}

bool ModelMetadata::isNavigationRelationship(class_id_t class_id) const {
    if (getClass(class_id).getType() != ClassInfo::RELATIONSHIP)
        return false;
    return !getRootClass(class_id)
        .hasCustomAttribute(LINK_TABLE_RELATIONSHIP_MAP);
}

void ModelMetadata::checkClassHierarchy() const {
    BOOST_FOREACH(const ClassInfo& ci, classes) {
        getClassChain(ci.getId());
    }
}

} /* namespace meta */
} /* namespace ecrdf */
