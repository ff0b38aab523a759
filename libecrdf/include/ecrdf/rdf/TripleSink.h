/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file TripleSink.h
 * @brief Interface definition file for TripleSink
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_TRIPLESINK_H
#define ECRDF_RDF_TRIPLESINK_H

#include <string>

#include <boost/optional.hpp>

namespace ecrdf {
namespace rdf {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

/**
 * @brief An append-only destination for Turtle statements.
 *
 * Statements are written in call order and never rewritten.  The
 * subject, predicate and object are written exactly as given, so
 * literals must already be quoted.
 */
class TripleSink {
public:
    virtual ~TripleSink() {}

    /**
     * Append a statement "subject predicate object ."
     *
     * @throws IOFailure if the statement could not be written
     */
    virtual void writeTriple(const std::string& subject,
                             const std::string& predicate,
                             const std::string& object) = 0;

    /**
     * Append a prefix declaration "@prefix prefix: <iri> ."
     *
     * @throws IOFailure if the declaration could not be written
     */
    virtual void writePrefix(const std::string& prefix,
                             const std::string& iri) = 0;

    /**
     * Write an rdfs:label statement.  The label is quoted and
     * escaped.
     *
     * @param rdfName the subject
     * @param label the label text
     */
    void writeLabel(const std::string& rdfName, const std::string& label);

    /**
     * Write an rdfs:label statement labelling a name with itself
     */
    void writeLabel(const std::string& rdfName) {
        writeLabel(rdfName, rdfName);
    }

    /**
     * Write an rdfs:comment statement.  The comment is quoted and
     * escaped.
     */
    void writeComment(const std::string& rdfName, const std::string& comment);

    /**
     * Declare a property of a class: its place in the property
     * hierarchy, its domain, its range if it has one, its label and
     * its comment if it has one.
     *
     * @param classRdfName the RDF name of the declaring class
     * @param propertyName the name of the property
     * @param subClassOf the property term to derive from
     * @param range the range, if any
     * @param comment the description, if any
     */
    void writePropertyTriples(const std::string& classRdfName,
                              const std::string& propertyName,
                              const std::string& subClassOf,
                              const boost::optional<std::string>& range,
                              const boost::optional<std::string>& comment);
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_TRIPLESINK_H */
