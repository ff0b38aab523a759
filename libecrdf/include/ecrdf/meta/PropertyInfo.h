/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file PropertyInfo.h
 * @brief Interface definition file for PropertyInfo
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_PROPERTYINFO_H
#define ECRDF_META_PROPERTYINFO_H

#include <string>

#include <boost/cstdint.hpp>
#include <boost/optional.hpp>

namespace ecrdf {
namespace meta {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup meta
 * @{
 */

/**
 * A unique ID for a schema in a model
 */
typedef uint32_t schema_id_t;

/**
 * A unique ID for a class in a model
 */
typedef uint32_t class_id_t;

/**
 * A unique ID for an enumeration in a model
 */
typedef uint32_t enum_id_t;

/**
 * The primitive types a primitive property can carry
 */
enum PrimitiveType {
    BINARY,
    BOOLEAN,
    DATETIME,
    DOUBLE,
    GEOMETRY,
    INTEGER,
    LONG,
    POINT2D,
    POINT3D,
    STRING
};

/**
 * Get the name used for a primitive type in serialized metadata
 */
const char* getPrimitiveTypeName(PrimitiveType type);

/**
 * Parse a serialized primitive type name such as "string" or
 * "point3d".  The comparison is case-insensitive.
 *
 * @param name the name to parse
 * @return the primitive type, or boost::none if the name is not
 * a known primitive type
 */
boost::optional<PrimitiveType> parsePrimitiveType(const std::string& name);

/**
 * @brief Metadata for a property of a class.
 *
 * A property is owned by exactly one class.  Its kind decides which
 * of the remaining fields are meaningful: primitive and enumeration
 * properties carry a primitive type and an extended type name,
 * navigation properties carry a relationship class and a direction,
 * and enumeration properties carry a reference to their enumeration.
 */
class PropertyInfo {
public:

    /**
     * The kind of value a property holds
     */
    enum property_kind_t {
        /** A primitive value */
        PRIMITIVE,
        /** An embedded struct value */
        STRUCT,
        /** A pointer to a related entity through a relationship */
        NAVIGATION,
        /** A primitive value constrained by an enumeration */
        ENUMERATION
    };

    /**
     * The shape of a property value
     */
    enum cardinality_t {
        /** A single value */
        SCALAR,
        /** An ordered array of values */
        VECTOR
    };

    /**
     * The direction a navigation property follows its relationship
     */
    enum direction_t {
        /** Resolve against the relationship's target constraint */
        FORWARD,
        /** Resolve against the relationship's source constraint */
        BACKWARD
    };

    /**
     * Default constructor for containers
     */
    PropertyInfo()
        : kind(PRIMITIVE), cardinality(SCALAR), primitive_type(STRING),
          direction(FORWARD) {}

    /**
     * Construct a primitive property
     *
     * @param property_name the name of the property
     * @param primitive_type the primitive type
     * @param cardinality scalar or array
     * @param extended_type the extended type hint, or empty
     */
    PropertyInfo(const std::string& property_name,
                 PrimitiveType primitive_type,
                 cardinality_t cardinality,
                 const std::string& extended_type = "");

    /**
     * Construct a struct property
     *
     * @param property_name the name of the property
     * @param cardinality scalar or array
     */
    PropertyInfo(const std::string& property_name,
                 cardinality_t cardinality);

    /**
     * Construct a navigation property
     *
     * @param property_name the name of the property
     * @param relationship_class the relationship class, or boost::none
     * if it could not be resolved
     * @param direction the direction followed through the relationship
     */
    PropertyInfo(const std::string& property_name,
                 const boost::optional<class_id_t>& relationship_class,
                 direction_t direction);

    /**
     * Construct an enumeration property
     *
     * @param property_name the name of the property
     * @param enumeration the enumeration, or boost::none if it could
     * not be resolved
     * @param backing_type the underlying primitive type
     * @param cardinality scalar or array
     */
    PropertyInfo(const std::string& property_name,
                 const boost::optional<enum_id_t>& enumeration,
                 PrimitiveType backing_type,
                 cardinality_t cardinality);

    ~PropertyInfo();

    /**
     * Get the name of the property
     */
    const std::string& getName() const { return property_name; }

    /**
     * Get the kind of the property
     */
    property_kind_t getKind() const { return kind; }

    /**
     * Get the cardinality of the property
     */
    cardinality_t getCardinality() const { return cardinality; }

    /**
     * Check whether the property is array-shaped
     */
    bool isArray() const { return cardinality == VECTOR; }

    /**
     * Check whether the property carries a primitive value, either
     * directly or through an enumeration
     */
    bool isPrimitive() const {
        return kind == PRIMITIVE || kind == ENUMERATION;
    }

    /**
     * Get the primitive type.  Only meaningful when isPrimitive()
     * is true.
     */
    PrimitiveType getPrimitiveType() const { return primitive_type; }

    /**
     * Get the extended type name, or an empty string if none is set
     */
    const std::string& getExtendedTypeName() const { return extended_type; }

    /**
     * Check the extended type name against the given lowercase name,
     * ignoring case
     *
     * @param name the lowercase extended type to check for
     */
    bool hasExtendedType(const std::string& name) const;

    /**
     * Get the relationship class of a navigation property
     */
    const boost::optional<class_id_t>& getRelationshipClass() const {
        return relationship_class;
    }

    /**
     * Get the direction of a navigation property
     */
    direction_t getDirection() const { return direction; }

    /**
     * Get the enumeration of an enumeration property
     */
    const boost::optional<enum_id_t>& getEnumeration() const {
        return enumeration;
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
    PropertyInfo& setDescription(const std::string& description_) {
        description = description_;
        return *this;
    }

    /**
     * Get the display label, if any
     */
    const boost::optional<std::string>& getLabel() const {
        return label;
    }

    /**
     * Set the display label
     */
    PropertyInfo& setLabel(const std::string& label_) {
        label = label_;
        return *this;
    }

private:
    std::string property_name;
    property_kind_t kind;
    cardinality_t cardinality;
    PrimitiveType primitive_type;
    std::string extended_type;
    boost::optional<class_id_t> relationship_class;
    direction_t direction;
    boost::optional<enum_id_t> enumeration;
    boost::optional<std::string> description;
    boost::optional<std::string> label;
};

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_PROPERTYINFO_H */
