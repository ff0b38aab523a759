/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file TurtleExporter.h
 * @brief Interface definition file for TurtleExporter
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_TURTLEEXPORTER_H
#define ECRDF_ENGINE_TURTLEEXPORTER_H

#include <string>

#include "ecrdf/engine/ExportHandler.h"
#include "ecrdf/engine/ExportSettings.h"
#include "ecrdf/engine/Repository.h"
#include "ecrdf/rdf/TripleSink.h"
#include "ecrdf/rdf/SchemaMapper.h"
#include "ecrdf/rdf/InstanceMapper.h"

namespace ecrdf {
namespace engine {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup engine
 * @{
 */

/**
 * @brief An export handler that writes a repository as Turtle.
 *
 * Schemas go to the schema mapper and instances to the instance
 * mapper.  Use exportRepository() to run a complete export.
 */
class TurtleExporter : public ExportHandler {
public:
    /**
     * Construct a Turtle exporter
     *
     * @param repository the repository being exported
     * @param sink the sink to write to
     * @param settings the export settings
     */
    TurtleExporter(const Repository& repository,
                   rdf::TripleSink& sink,
                   const ExportSettings& settings);

    /**
     * Export a repository to a file.  The file is created or
     * truncated first.
     *
     * @param repository the repository to export
     * @param fileName the file to write
     * @param settings the export settings
     * @return the number of statements written
     * @throws rdf::IOFailure if the file cannot be written
     * @throws rdf::UnsupportedClassKind if a class has an unknown kind
     * @throws rdf::UnsupportedPrimitiveType if a property has an
     * unknown primitive type
     */
    static size_t exportRepository(const Repository& repository,
                                   const std::string& fileName,
                                   const ExportSettings& settings);

    /**
     * Export a repository to a sink: the vocabulary, the schemas,
     * the instance prefixes and, unless disabled in the settings,
     * the instances
     *
     * @see exportRepository(const Repository&, const std::string&,
     * const ExportSettings&)
     */
    static void exportRepository(const Repository& repository,
                                 rdf::TripleSink& sink,
                                 const ExportSettings& settings);

    // ExportHandler
    virtual void onExportSchema(const meta::SchemaInfo& schema);
    virtual void onExportCodeSpec(const meta::Instance& codeSpec);
    virtual void onExportModel(const meta::Instance& model);
    virtual void onExportElement(const meta::Instance& element);
    virtual void onExportAspect(const meta::Instance& aspect);
    virtual void onExportRelationship(const meta::Instance& relationship);

    /**
     * Get the number of instances skipped so far because their class
     * is unknown
     */
    size_t getSkippedCount() const { return skipped; }

private:
    rdf::SchemaMapper schemaMapper;
    rdf::InstanceMapper instanceMapper;
    size_t skipped;

    void count(bool written);
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_TURTLEEXPORTER_H */
