/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file ExportSettings.h
 * @brief Interface definition file for ExportSettings
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_EXPORTSETTINGS_H
#define ECRDF_ENGINE_EXPORTSETTINGS_H

#include <string>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

namespace ecrdf {
namespace engine {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup engine
 * @{
 */

/**
 * Settings for a Turtle export.  Each setting has a default, so an
 * export can run without any configuration.
 */
class ExportSettings {
public:
    ExportSettings();

    /**
     * Apply the settings found in a property tree, as read from a
     * JSON configuration file.  Settings absent from the tree keep
     * their current value, so several trees can be applied in turn.
     *
     * The recognized keys are:
     * - schema-base-iri
     * - instance-base-iri
     * - element-class
     * - codespec-class
     * - export.instances
     * - log.level
     *
     * @throws std::invalid_argument if the log level is not valid
     * @throws boost::property_tree::ptree_bad_data if a value has
     * the wrong type
     */
    void setProperties(const boost::property_tree::ptree& properties);

    /**
     * Get the IRI under which schema namespaces are placed
     */
    const std::string& getSchemaBaseIri() const { return schemaBaseIri; }

    /**
     * Set the IRI under which schema namespaces are placed
     */
    ExportSettings& setSchemaBaseIri(const std::string& iri) {
        schemaBaseIri = iri;
        return *this;
    }

    /**
     * Get the IRI under which instance namespaces are placed for the
     * given repository.  Unless it was configured this is derived
     * from the repository ID.
     */
    std::string getInstanceBaseIri(const std::string& repositoryId) const;

    /**
     * Set the IRI under which instance namespaces are placed
     */
    ExportSettings& setInstanceBaseIri(const std::string& iri) {
        instanceBaseIri = iri;
        return *this;
    }

    /**
     * Get the full name of the class that declares the code
     * properties of elements
     */
    const std::string& getElementClass() const { return elementClass; }

    /**
     * Set the full name of the class that declares the code
     * properties of elements
     */
    ExportSettings& setElementClass(const std::string& name) {
        elementClass = name;
        return *this;
    }

    /**
     * Get the full name of the class of code specs
     */
    const std::string& getCodeSpecClass() const { return codeSpecClass; }

    /**
     * Set the full name of the class of code specs
     */
    ExportSettings& setCodeSpecClass(const std::string& name) {
        codeSpecClass = name;
        return *this;
    }

    /**
     * Check whether instances are exported in addition to the
     * vocabulary and the schemas
     */
    bool isExportInstances() const { return exportInstances; }

    /**
     * Choose whether instances are exported
     */
    ExportSettings& setExportInstances(bool exportInstances_) {
        exportInstances = exportInstances_;
        return *this;
    }

    /**
     * Get the configured log level, if any
     */
    const boost::optional<std::string>& getLogLevel() const {
        return logLevel;
    }

private:
    std::string schemaBaseIri;
    boost::optional<std::string> instanceBaseIri;
    std::string elementClass;
    std::string codeSpecClass;
    bool exportInstances;
    boost::optional<std::string> logLevel;
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_EXPORTSETTINGS_H */
