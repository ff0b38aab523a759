/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for TurtleExporter class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "ecrdf/engine/TurtleExporter.h"
#include "ecrdf/engine/Exporter.h"
#include "ecrdf/rdf/TurtleWriter.h"
#include "ecrdf/rdf/Vocabulary.h"
#include "ecrdf/rdf/NameFormatter.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace engine {

using std::string;
using meta::SchemaInfo;
using meta::Instance;
using rdf::TripleSink;
using rdf::TurtleWriter;
using rdf::NameFormatter;

TurtleExporter::TurtleExporter(const Repository& repository,
                               TripleSink& sink,
                               const ExportSettings& settings)
    : schemaMapper(repository.getMetadata(), sink,
                   settings.getSchemaBaseIri()),
      instanceMapper(repository.getMetadata(), sink,
                     settings.getElementClass(),
                     settings.getCodeSpecClass()),
      skipped(0) {

}

void TurtleExporter::exportRepository(const Repository& repository,
                                      TripleSink& sink,
                                      const ExportSettings& settings) {
    TurtleExporter handler(repository, sink, settings);
    Exporter exporter(repository, handler);

    rdf::vocab::declareVocabulary(sink);
    exporter.exportSchemas();
    const string instanceBaseIri =
        settings.getInstanceBaseIri(repository.getId());
    NameFormatter::declareInstancePrefixes(sink, instanceBaseIri);
    if (settings.isExportInstances()) {
        exporter.exportAll();
    } else {
        LOG(INFO) << "Skipping instances";
    }

    if (handler.getSkippedCount() > 0)
        LOG(WARNING) << "Skipped " << handler.getSkippedCount()
                     << " instances of unknown classes";
}

size_t TurtleExporter::exportRepository(const Repository& repository,
                                        const string& fileName,
                                        const ExportSettings& settings) {
    TurtleWriter writer(fileName);
    exportRepository(repository, writer, settings);
    LOG(INFO) << "Exported repository " << repository.getId()
              << " to " << fileName << ": "
              << writer.getTripleCount() << " statements";
    return writer.getTripleCount();
}

void TurtleExporter::count(bool written) {
    if (!written) skipped += 1;
}

void TurtleExporter::onExportSchema(const SchemaInfo& schema) {
    schemaMapper.writeSchema(schema);
}

void TurtleExporter::onExportCodeSpec(const Instance& codeSpec) {
    count(instanceMapper.writeCodeSpec(codeSpec));
}

void TurtleExporter::onExportModel(const Instance& model) {
    count(instanceMapper.writeModel(model));
}

void TurtleExporter::onExportElement(const Instance& element) {
    count(instanceMapper.writeElement(element));
}

void TurtleExporter::onExportAspect(const Instance& aspect) {
    count(instanceMapper.writeAspect(aspect));
}

void TurtleExporter::onExportRelationship(const Instance& relationship) {
    count(instanceMapper.writeRelationship(relationship));
}

} /* namespace engine */
} /* namespace ecrdf */
