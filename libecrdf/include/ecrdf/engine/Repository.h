/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Repository.h
 * @brief Interface definition file for Repository
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_REPOSITORY_H
#define ECRDF_ENGINE_REPOSITORY_H

#include <string>
#include <vector>

#include <boost/noncopyable.hpp>

#include "ecrdf/meta/ModelMetadata.h"
#include "ecrdf/meta/Instance.h"

namespace ecrdf {
namespace engine {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup engine
 * @{
 */

/**
 * A repository to export: the metadata of its schemas and its
 * instances, kept per kind in load order
 */
class Repository : private boost::noncopyable {
public:
    /**
     * A list of instances
     */
    typedef std::vector<meta::InstancePtr> instance_list_t;

    /**
     * Construct an empty repository
     *
     * @param id the repository ID
     * @param name the name of the repository
     */
    Repository(const std::string& id = "", const std::string& name = "");

    /**
     * Get the repository ID
     */
    const std::string& getId() const { return id; }

    /**
     * Set the repository ID
     */
    Repository& setId(const std::string& id_) {
        id = id_;
        return *this;
    }

    /**
     * Get the name of the repository
     */
    const std::string& getName() const { return name; }

    /**
     * Set the name of the repository
     */
    Repository& setName(const std::string& name_) {
        name = name_;
        return *this;
    }

    /**
     * Get the metadata of the repository
     */
    meta::ModelMetadata& getMetadata() { return md; }

    /**
     * Get the metadata of the repository
     */
    const meta::ModelMetadata& getMetadata() const { return md; }

    /**
     * Add an instance to the list for its kind
     */
    void addInstance(const meta::InstancePtr& instance);

    /**
     * Get the code specs
     */
    const instance_list_t& getCodeSpecs() const { return codeSpecs; }

    /**
     * Get the models
     */
    const instance_list_t& getModels() const { return models; }

    /**
     * Get the elements
     */
    const instance_list_t& getElements() const { return elements; }

    /**
     * Get the element aspects
     */
    const instance_list_t& getAspects() const { return aspects; }

    /**
     * Get the link table relationships
     */
    const instance_list_t& getRelationships() const { return relationships; }

    /**
     * Get the total number of instances
     */
    size_t getInstanceCount() const;

private:
    std::string id;
    std::string name;
    meta::ModelMetadata md;

    instance_list_t codeSpecs;
    instance_list_t models;
    instance_list_t elements;
    instance_list_t aspects;
    instance_list_t relationships;
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_REPOSITORY_H */
