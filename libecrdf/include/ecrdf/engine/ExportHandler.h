/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file ExportHandler.h
 * @brief Interface definition file for ExportHandler
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_EXPORTHANDLER_H
#define ECRDF_ENGINE_EXPORTHANDLER_H

#include "ecrdf/meta/SchemaInfo.h"
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
 * Receives the schemas and instances of a repository from an
 * Exporter.  Every callback does nothing by default.
 */
class ExportHandler {
public:
    virtual ~ExportHandler() {}

    /**
     * Called once for each schema
     */
    virtual void onExportSchema(const meta::SchemaInfo& schema) {}

    /**
     * Called once for each code spec
     */
    virtual void onExportCodeSpec(const meta::Instance& codeSpec) {}

    /**
     * Called once for each model, before its elements
     */
    virtual void onExportModel(const meta::Instance& model) {}

    /**
     * Called once for each element, before its aspects
     */
    virtual void onExportElement(const meta::Instance& element) {}

    /**
     * Called once for each element aspect
     */
    virtual void onExportAspect(const meta::Instance& aspect) {}

    /**
     * Called once for each link table relationship
     */
    virtual void onExportRelationship(const meta::Instance& relationship) {}
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_EXPORTHANDLER_H */
