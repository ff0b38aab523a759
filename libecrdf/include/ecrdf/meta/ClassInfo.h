/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file ClassInfo.h
 * @brief Interface definition file for ClassInfo
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_CLASSINFO_H
#define ECRDF_META_CLASSINFO_H

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
 * The custom attribute that marks a relationship class as having its
 * own link table
 */
extern const char* const LINK_TABLE_RELATIONSHIP_MAP;

/**
 * @brief One end of a relationship class.
 *
 * The constraint classes are kept in declaration order.  The first
 * one is used when a single class must stand for the whole
 * constraint.
 */
class RelationshipConstraint {
public:
    RelationshipConstraint() {}

    /**
     * Construct a constraint over the given classes
     *
     * @param classes_ the constraint classes in declaration order
     */
    RelationshipConstraint(const std::vector<class_id_t>& classes_)
        : classes(classes_) {}

    /**
     * Get the constraint classes in declaration order
     */
    const std::vector<class_id_t>& getClasses() const { return classes; }

    /**
     * Get the first constraint class, if there is one
     */
    boost::optional<class_id_t> getFirstClass() const {
        if (classes.empty()) return boost::none;
        return classes.front();
    }

private:
    std::vector<class_id_t> classes;
};

/**
 * @brief Metadata for a class in a schema.
 *
 * Classes refer to their base class and to other classes by ID only;
 * resolution goes through the owning ModelMetadata.
 */
class ClassInfo {
public:

    /**
     * The kind of class
     */
    enum class_type_t {
        /** A class whose instances are elements, models or aspects */
        ENTITY,
        /** A class whose instances relate two entities */
        RELATIONSHIP,
        /** A class applied to other schema items as an annotation */
        CUSTOM_ATTRIBUTE,
        /** A class that adds properties to entity classes */
        MIXIN,
        /** An enumeration declared in class position */
        ENUMERATION
    };

    /**
     * Construct a class info object
     *
     * @param class_id the unique class ID
     * @param class_type the kind of class
     * @param class_name the name of the class within its schema
     * @param schema_id the owning schema
     * @param properties the properties declared directly on the class
     */
    ClassInfo(class_id_t class_id,
              class_type_t class_type,
              const std::string& class_name,
              schema_id_t schema_id,
              const std::vector<PropertyInfo>& properties);

    ~ClassInfo();

    /**
     * Get the unique class ID
     */
    class_id_t getId() const { return class_id; }

    /**
     * Get the kind of class
     */
    class_type_t getType() const { return class_type; }

    /**
     * Get the name of the class
     */
    const std::string& getName() const { return class_name; }

    /**
     * Get the owning schema
     */
    schema_id_t getSchemaId() const { return schema_id; }

    /**
     * Get the properties declared directly on this class, in
     * declaration order
     */
    const std::vector<PropertyInfo>& getProperties() const {
        return properties;
    }

    /**
     * Find a property declared directly on this class
     *
     * @param name the property name
     * @return the property, or NULL if this class does not declare it
     */
    const PropertyInfo* findProperty(const std::string& name) const;

    /**
     * Get the base class, if any
     */
    const boost::optional<class_id_t>& getBaseClass() const {
        return base_class;
    }

    /**
     * Set the base class
     */
    ClassInfo& setBaseClass(class_id_t base_class_) {
        base_class = base_class_;
        return *this;
    }

    /**
     * Get the display label, if any
     */
    const boost::optional<std::string>& getLabel() const { return label; }

    /**
     * Set the display label
     */
    ClassInfo& setLabel(const std::string& label_) {
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
    ClassInfo& setDescription(const std::string& description_) {
        description = description_;
        return *this;
    }

    /**
     * Get the full names of the custom attributes applied to this
     * class
     */
    const std::vector<std::string>& getCustomAttributes() const {
        return custom_attributes;
    }

    /**
     * Apply a custom attribute by its full name, such as
     * "ECDbMap.LinkTableRelationshipMap"
     */
    ClassInfo& addCustomAttribute(const std::string& name) {
        custom_attributes.push_back(name);
        return *this;
    }

    /**
     * Check whether a custom attribute is applied directly to this
     * class.  Full names compare case-insensitively, with either ':'
     * or '.' as the separator.
     *
     * @param name the full name of the custom attribute
     */
    bool hasCustomAttribute(const std::string& name) const;

    /**
     * Get the source constraint of a relationship class
     */
    const RelationshipConstraint& getSource() const { return source; }

    /**
     * Get the target constraint of a relationship class
     */
    const RelationshipConstraint& getTarget() const { return target; }

    /**
     * Set the source and target constraint classes of a relationship
     * class, each in declaration order
     */
    ClassInfo& setConstraints(const std::vector<class_id_t>& source_,
                              const std::vector<class_id_t>& target_) {
        source = RelationshipConstraint(source_);
        target = RelationshipConstraint(target_);
        return *this;
    }

private:
    class_id_t class_id;
    class_type_t class_type;
    std::string class_name;
    schema_id_t schema_id;
    std::vector<PropertyInfo> properties;
    std::map<std::string, size_t> prop_names;
    boost::optional<class_id_t> base_class;
    boost::optional<std::string> label;
    boost::optional<std::string> description;
    std::vector<std::string> custom_attributes;
    RelationshipConstraint source;
    RelationshipConstraint target;
};

/**
 * Get the name of a class kind as used in serialized metadata
 */
const char* getClassTypeName(ClassInfo::class_type_t type);

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_CLASSINFO_H */
