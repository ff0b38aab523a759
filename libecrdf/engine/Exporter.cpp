/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Exporter class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <map>
#include <set>
#include <stdexcept>
#include <string>

#include <boost/foreach.hpp>

#include "ecrdf/engine/Exporter.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace engine {

using std::string;
using meta::ModelMetadata;
using meta::SchemaInfo;
using meta::SchemaItem;
using meta::ClassInfo;
using meta::PropertyInfo;
using meta::InstancePtr;

typedef std::multimap<string, InstancePtr> instance_index_t;
typedef std::pair<instance_index_t::const_iterator,
                  instance_index_t::const_iterator> index_range_t;

Exporter::Exporter(const Repository& repository_, ExportHandler& handler_)
    : repository(repository_), handler(handler_) {

}

static void addClassSchema(const ModelMetadata& md, meta::class_id_t classId,
                           std::set<meta::schema_id_t>& deps) {
    if (md.hasClass(classId))
        deps.insert(md.getClass(classId).getSchemaId());
}

static void getDependencies(const ModelMetadata& md,
                            const SchemaInfo& schema,
                            std::set<meta::schema_id_t>& deps) {
    BOOST_FOREACH(const SchemaItem& item, schema.getItems()) {
        if (item.type != SchemaItem::CLASS) continue;
        const ClassInfo& ci = md.getClass(item.id);
        if (ci.getBaseClass())
            addClassSchema(md, ci.getBaseClass().get(), deps);
        BOOST_FOREACH(meta::class_id_t c, ci.getSource().getClasses()) {
            addClassSchema(md, c, deps);
        }
        BOOST_FOREACH(meta::class_id_t c, ci.getTarget().getClasses()) {
            addClassSchema(md, c, deps);
        }
        BOOST_FOREACH(const PropertyInfo& prop, ci.getProperties()) {
            if (prop.getRelationshipClass())
                addClassSchema(md, prop.getRelationshipClass().get(), deps);
            if (!prop.getEnumeration()) continue;
            try {
                deps.insert(md.getEnumeration(prop.getEnumeration().get())
                            .getSchemaId());
            } catch (const std::out_of_range& e) {
                LOG(DEBUG) << "Unknown enumeration of property "
                           << ci.getName() << "." << prop.getName();
            }
        }
    }
    deps.erase(schema.getId());
}

static void visitSchema(const ModelMetadata& md, ExportHandler& handler,
                        const SchemaInfo& schema,
                        std::set<meta::schema_id_t>& visited) {
    if (!visited.insert(schema.getId()).second) return;

    std::set<meta::schema_id_t> deps;
    getDependencies(md, schema, deps);
    // referenced schemas first, in load order
    BOOST_FOREACH(const SchemaInfo& other, md.getSchemas()) {
        if (deps.count(other.getId()))
            visitSchema(md, handler, other, visited);
    }
    handler.onExportSchema(schema);
}

void Exporter::exportSchemas() {
    const ModelMetadata& md = repository.getMetadata();
    std::set<meta::schema_id_t> visited;
    BOOST_FOREACH(const SchemaInfo& schema, md.getSchemas()) {
        visitSchema(md, handler, schema, visited);
    }
}

static void exportElement(ExportHandler& handler,
                          const InstancePtr& element,
                          const instance_index_t& aspectsByElement) {
    handler.onExportElement(*element);
    index_range_t range = aspectsByElement.equal_range(element->getId());
    for (instance_index_t::const_iterator it = range.first;
         it != range.second; ++it) {
        handler.onExportAspect(*it->second);
    }
}

void Exporter::exportAll() {
    BOOST_FOREACH(const InstancePtr& codeSpec, repository.getCodeSpecs()) {
        handler.onExportCodeSpec(*codeSpec);
    }

    // equal keys keep their insertion order
    instance_index_t elementsByModel;
    instance_index_t aspectsByElement;
    std::set<string> modelIds;
    std::set<string> elementIds;
    BOOST_FOREACH(const InstancePtr& model, repository.getModels()) {
        modelIds.insert(model->getId());
    }
    BOOST_FOREACH(const InstancePtr& element, repository.getElements()) {
        elementIds.insert(element->getId());
        elementsByModel.insert(std::make_pair(element->getModelId(),
                                              element));
    }
    BOOST_FOREACH(const InstancePtr& aspect, repository.getAspects()) {
        aspectsByElement.insert(std::make_pair(aspect->getElementId(),
                                               aspect));
    }

    BOOST_FOREACH(const InstancePtr& model, repository.getModels()) {
        handler.onExportModel(*model);
        index_range_t range = elementsByModel.equal_range(model->getId());
        for (instance_index_t::const_iterator it = range.first;
             it != range.second; ++it) {
            exportElement(handler, it->second, aspectsByElement);
        }
    }

    size_t orphans = 0;
    BOOST_FOREACH(const InstancePtr& element, repository.getElements()) {
        if (modelIds.count(element->getModelId())) continue;
        exportElement(handler, element, aspectsByElement);
        orphans += 1;
    }
    BOOST_FOREACH(const InstancePtr& aspect, repository.getAspects()) {
        if (elementIds.count(aspect->getElementId())) continue;
        handler.onExportAspect(*aspect);
        orphans += 1;
    }
    if (orphans > 0)
        LOG(DEBUG) << "Exported " << orphans
                   << " elements or aspects without a known owner";

    const ModelMetadata& md = repository.getMetadata();
    BOOST_FOREACH(const InstancePtr& relationship,
                  repository.getRelationships()) {
        meta::class_id_t classId = relationship->getClassId();
        if (md.hasClass(classId) && md.isNavigationRelationship(classId)) {
            // already carried by the navigation property of its source
            LOG(DEBUG) << "Skipping relationship " << relationship->getId()
                       << " of navigation relationship "
                       << md.getClass(classId).getName();
            continue;
        }
        handler.onExportRelationship(*relationship);
    }
}

} /* namespace engine */
} /* namespace ecrdf */
