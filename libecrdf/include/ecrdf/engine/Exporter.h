/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Exporter.h
 * @brief Interface definition file for Exporter
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_ENGINE_EXPORTER_H
#define ECRDF_ENGINE_EXPORTER_H

#include "ecrdf/engine/Repository.h"
#include "ecrdf/engine/ExportHandler.h"

namespace ecrdf {
namespace engine {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup engine
 * @{
 */

/**
 * @brief Walks a repository and hands its contents to an
 * ExportHandler.
 *
 * Callbacks run synchronously on the calling thread, each one to
 * completion before the next.  To stop early, stop calling the
 * exporter.
 */
class Exporter {
public:
    /**
     * Construct an exporter
     *
     * @param repository the repository to walk
     * @param handler the handler to call
     */
    Exporter(const Repository& repository, ExportHandler& handler);

    /**
     * Visit every schema once in load order, except that a schema is
     * visited after the schemas its classes refer to.  A cycle of
     * references between schemas is broken at the schema loaded
     * first.
     */
    void exportSchemas();

    /**
     * Visit every instance once: the code specs, then each model
     * followed by its elements with each element followed by its
     * aspects, then the elements whose model is not in the
     * repository, then the relationships.  Aspects whose element is
     * not in the repository are visited after the elements.
     * Relationships of a class without a link table are skipped.
     */
    void exportAll();

private:
    const Repository& repository;
    ExportHandler& handler;
};

/* @} engine */
/* @} cpp */

} /* namespace engine */
} /* namespace ecrdf */

#endif /* ECRDF_ENGINE_EXPORTER_H */
