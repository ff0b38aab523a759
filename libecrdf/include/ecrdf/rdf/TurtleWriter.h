/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*!
 * @file TurtleWriter.h
 * @brief Interface definition file for TurtleWriter
 */
/*
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#ifndef ECRDF_RDF_TURTLEWRITER_H
#define ECRDF_RDF_TURTLEWRITER_H

#include <ostream>
#include <fstream>
#include <string>

#include <boost/noncopyable.hpp>
#include <boost/scoped_ptr.hpp>

#include "ecrdf/rdf/TripleSink.h"

namespace ecrdf {
namespace rdf {

/**
 * \addtogroup cpp
 * @{
 * \addtogroup rdf
 * @{
 */

/**
 * @brief A triple sink that writes line-oriented Turtle to a stream
 * or a file.
 *
 * Each statement is written as one line and flushed before the call
 * returns, so the output is valid Turtle up to the last completed
 * line.  Not thread safe.
 */
class TurtleWriter : public TripleSink, private boost::noncopyable {
public:
    /**
     * Write to an existing stream.  The stream must outlive the
     * writer.
     */
    explicit TurtleWriter(std::ostream& out);

    /**
     * Create or truncate the given file and write to it
     *
     * @throws IOFailure if the file could not be opened
     */
    explicit TurtleWriter(const std::string& fileName);

    virtual ~TurtleWriter();

    // TripleSink
    virtual void writeTriple(const std::string& subject,
                             const std::string& predicate,
                             const std::string& object);
    virtual void writePrefix(const std::string& prefix,
                             const std::string& iri);

    /**
     * Get the number of statements written so far, excluding prefix
     * declarations
     */
    size_t getTripleCount() const { return tripleCount; }

    /**
     * Get the number of prefix declarations written so far
     */
    size_t getPrefixCount() const { return prefixCount; }

private:
    boost::scoped_ptr<std::ofstream> file;
    std::ostream& out;
    std::string name;
    size_t tripleCount;
    size_t prefixCount;

    void writeLine(const std::string& first,
                   const std::string& second,
                   const std::string& third);
};

/* @} rdf */
/* @} cpp */

} /* namespace rdf */
} /* namespace ecrdf */

#endif /* ECRDF_RDF_TURTLEWRITER_H */
