/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file EnumInfo.h
 * @brief Interface definition file for EnumInfo
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_ENUMINFO_H
#define ECRDF_META_ENUMINFO_H

#include <string>
#include <vector>
#include <map>

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
 * @brief A single named value of an enumeration
 */
class ConstInfo {
public:
    /**
     * Construct an enumerator
     *
     * @param name_ the name of the enumerator
     * @param value_ its value in serialized form
     */
    ConstInfo(const std::string& name_, const std::string& value_)
        : name(name_), value(value_) {}

    /**
     * Get the name of the enumerator
     */
    const std::string& getName() const { return name; }

    /**
     * Get the serialized value of the enumerator
     */
    const std::string& getValue() const { return value; }

private:
    std::string name;
    std::string value;
};

/**
 * @brief Metadata for an enumeration owned by a schema.
 */
class EnumInfo {
public:
    /**
     * Construct an enumeration
     *
     * @param enum_id the unique ID of the enumeration
     * @param schema_id the owning schema
     * @param name the name of the enumeration within its schema
     * @param backing_type the primitive type of the enumerator values
     * @param consts the enumerators in declaration order
     */
    EnumInfo(enum_id_t enum_id,
             schema_id_t schema_id,
             const std::string& name,
             PrimitiveType backing_type,
             const std::vector<ConstInfo>& consts);

    ~EnumInfo();

    /**
     * Get the unique ID of the enumeration
     */
    enum_id_t getId() const { return enum_id; }

    /**
     * Get the owning schema
     */
    schema_id_t getSchemaId() const { return schema_id; }

    /**
     * Get the name of the enumeration
     */
    const std::string& getName() const { return name; }

    /**
     * Get the primitive type of the enumerator values
     */
    PrimitiveType getBackingType() const { return backing_type; }

    /**
     * Get the enumerators in declaration order
     */
    const std::vector<ConstInfo>& getConsts() const { return consts; }

    /**
     * Get the enumerator value for the given name
     *
     * @throws std::out_of_range if there is no such enumerator
     */
    const std::string& getValueByName(const std::string& name) const;

    /**
     * Get the enumerator name for the given value
     *
     * @throws std::out_of_range if there is no such enumerator
     */
    const std::string& getNameByValue(const std::string& value) const;

    /**
     * Get the display label, if any
     */
    const boost::optional<std::string>& getLabel() const { return label; }

    /**
     * Set the display label
     */
    EnumInfo& setLabel(const std::string& label_) {
        label = label_;
        return *this;
    }

    /**
     * Get the description, if any
     */
    const boost::optional<std::string>& getDescription() const {
        return description;
    }

    /**
     * Set the description
     */
    EnumInfo& setDescription(const std::string& description_) {
        description = description_;
        return *this;
    }

private:
    enum_id_t enum_id;
    schema_id_t schema_id;
    std::string name;
    PrimitiveType backing_type;
    std::vector<ConstInfo> consts;
    std::map<std::string, std::string> const_name_map;
    std::map<std::string, std::string> const_value_map;
    boost::optional<std::string> label;
    boost::optional<std::string> description;
};

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_ENUMINFO_H */
