/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Instance.h
 * @brief Interface definition file for Instance
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_META_INSTANCE_H
#define ECRDF_META_INSTANCE_H

#include <string>
#include <vector>

#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <rapidjson/document.h>

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
 * @brief The code of an element: its human-meaningful name, unique
 * within a scope under the rules of a code spec.
 *
 * An empty value means that the element has no code.
 */
struct Code {
    /** the code spec ID */
    std::string spec;
    /** the ID of the scope element */
    std::string scope;
    /** the code value */
    std::string value;

    /**
     * Check whether the code is set
     */
    bool isSet() const { return !value.empty(); }
};

/**
 * @brief One runtime record of a class.
 *
 * Property values are held as JSON values keyed by property name.
 * Which of the other fields are meaningful depends on the kind of
 * instance.  Identifiers are kept in their string form; an empty
 * string means the identifier is not set.
 */
class Instance : private boost::noncopyable {
public:

    /**
     * The kind of instance
     */
    enum instance_kind_t {
        ELEMENT,
        MODEL,
        RELATIONSHIP,
        ASPECT,
        CODESPEC
    };

    /**
     * Construct an instance with no property values
     *
     * @param kind the kind of instance
     * @param id the identifier of the instance
     * @param class_id the class of the instance
     */
    Instance(instance_kind_t kind,
             const std::string& id,
             class_id_t class_id);

    ~Instance();

    /**
     * Get the kind of instance
     */
    instance_kind_t getKind() const { return kind; }

    /**
     * Get the identifier of the instance
     */
    const std::string& getId() const { return id; }

    /**
     * Get the class of the instance
     */
    class_id_t getClassId() const { return class_id; }

    /**
     * Check whether a property has a value.  A property has no value
     * when it is missing, null, false, a number equal to zero or not
     * a number, an empty string, an empty array or an empty object.
     *
     * @param name the property name
     */
    bool isSet(const std::string& name) const;

    /**
     * Get the value of a property
     *
     * @param name the property name
     * @return the value, or NULL if the property has no value
     */
    const rapidjson::Value* getProperty(const std::string& name) const;

    /**
     * Get the names of all properties that carry a value, present or
     * absent, in the order they were set
     */
    std::vector<std::string> getPropertyNames() const;

    /**
     * Set a property to a string value
     */
    Instance& setString(const std::string& name, const std::string& value);

    /**
     * Set a property to a signed integer value
     */
    Instance& setInt64(const std::string& name, int64_t value);

    /**
     * Set a property to an unsigned integer value
     */
    Instance& setUInt64(const std::string& name, uint64_t value);

    /**
     * Set a property to a floating point value
     */
    Instance& setDouble(const std::string& name, double value);

    /**
     * Set a property to a boolean value
     */
    Instance& setBool(const std::string& name, bool value);

    /**
     * Set a property to a copy of a JSON value
     */
    Instance& setValue(const std::string& name,
                       const rapidjson::Value& value);

    /**
     * Set a property to a value given as serialized JSON
     *
     * @throws std::invalid_argument if the text is not valid JSON
     */
    Instance& setJson(const std::string& name, const std::string& json);

    /**
     * Remove a property value
     */
    Instance& unset(const std::string& name);

    /**
     * Get the model an element belongs to
     */
    const std::string& getModelId() const { return model_id; }

    /**
     * Set the model an element belongs to
     */
    Instance& setModelId(const std::string& model_id_) {
        model_id = model_id_;
        return *this;
    }

    /**
     * Get the parent of an element
     */
    const std::string& getParentId() const { return parent_id; }

    /**
     * Set the parent of an element
     */
    Instance& setParentId(const std::string& parent_id_) {
        parent_id = parent_id_;
        return *this;
    }

    /**
     * Get the code of an element
     */
    const Code& getCode() const { return code; }

    /**
     * Set the code of an element
     */
    Instance& setCode(const Code& code_) {
        code = code_;
        return *this;
    }

    /**
     * Get the source of a relationship
     */
    const std::string& getSourceId() const { return source_id; }

    /**
     * Get the target of a relationship
     */
    const std::string& getTargetId() const { return target_id; }

    /**
     * Set the source and target of a relationship
     */
    Instance& setEndpoints(const std::string& source_id_,
                           const std::string& target_id_) {
        source_id = source_id_;
        target_id = target_id_;
        return *this;
    }

    /**
     * Get the element that owns an aspect
     */
    const std::string& getElementId() const { return element_id; }

    /**
     * Set the element that owns an aspect
     */
    Instance& setElementId(const std::string& element_id_) {
        element_id = element_id_;
        return *this;
    }

    /**
     * Get the name of a model or code spec
     */
    const std::string& getName() const { return name; }

    /**
     * Set the name of a model or code spec
     */
    Instance& setName(const std::string& name_) {
        name = name_;
        return *this;
    }

private:
    instance_kind_t kind;
    std::string id;
    class_id_t class_id;
    rapidjson::Document props;

    std::string model_id;
    std::string parent_id;
    Code code;
    std::string source_id;
    std::string target_id;
    std::string element_id;
    std::string name;

    Instance& set(const std::string& name, rapidjson::Value& value);
};

/**
 * A shared pointer to an instance
 */
typedef boost::shared_ptr<const Instance> InstancePtr;

/**
 * Get the name of an instance kind, for log messages
 */
const char* getInstanceKindName(Instance::instance_kind_t kind);

/* @} meta */
/* @} cpp */

} /* namespace meta */
} /* namespace ecrdf */

#endif /* ECRDF_META_INSTANCE_H */
