/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file Errors.h
 * @brief Exceptions raised while mapping metadata and instances
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_ERRORS_H
#define ECRDF_RDF_ERRORS_H

#include <stdexcept>
#include <string>

namespace ecrdf {
namespace rdf {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

/**
 * A class kind outside the set the mapper knows.  Fatal for the
 * whole export.
 */
class UnsupportedClassKind : public std::runtime_error {
public:
    explicit UnsupportedClassKind(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * A primitive type outside the set the mapper knows.  Fatal for the
 * whole export.
 */
class UnsupportedPrimitiveType : public std::runtime_error {
public:
    explicit UnsupportedPrimitiveType(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * A class, relationship, constraint or identifier that could not be
 * resolved.  Only the triple that needed it is skipped.
 */
class UnresolvedReference : public std::runtime_error {
public:
    explicit UnresolvedReference(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * The output could not be opened or written.  Fatal; output already
 * written is left in place.
 */
class IOFailure : public std::runtime_error {
public:
    explicit IOFailure(const std::string& what)
        : std::runtime_error(what) {}
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_ERRORS_H */
