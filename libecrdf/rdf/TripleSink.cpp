/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for TripleSink class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include "ecrdf/rdf/TripleSink.h"
#include "ecrdf/rdf/Vocabulary.h"
#include "ecrdf/rdf/NameFormatter.h"
#include "ecrdf/rdf/Literal.h"

namespace ecrdf {
namespace rdf {

void TripleSink::writeLabel(const std::string& rdfName,
                            const std::string& label) {
    writeTriple(rdfName, vocab::RDFS_LABEL, literal::quote(label));
}

void TripleSink::writeComment(const std::string& rdfName,
                              const std::string& comment) {
    writeTriple(rdfName, vocab::RDFS_COMMENT, literal::quote(comment));
}

void TripleSink::
writePropertyTriples(const std::string& classRdfName,
                     const std::string& propertyName,
                     const std::string& subClassOf,
                     const boost::optional<std::string>& range,
                     const boost::optional<std::string>& comment) {
    const std::string propertyRdfName =
        NameFormatter::formatPropertyName(classRdfName, propertyName);
    writeTriple(propertyRdfName, vocab::RDFS_SUBCLASSOF, subClassOf);
    writeTriple(propertyRdfName, vocab::RDFS_DOMAIN, classRdfName);
    if (range)
        writeTriple(propertyRdfName, vocab::RDFS_RANGE, range.get());
    writeLabel(propertyRdfName,
               NameFormatter::formatPropertyLabel(classRdfName, propertyName));
    if (comment)
        writeComment(propertyRdfName, comment.get());
}

} /* namespace rdf */
} /* namespace ecrdf */
