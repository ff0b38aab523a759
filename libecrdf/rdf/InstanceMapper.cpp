/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for InstanceMapper class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>
#include <vector>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/foreach.hpp>
#include <boost/lexical_cast.hpp>

#include "ecrdf/rdf/InstanceMapper.h"
#include "ecrdf/rdf/Vocabulary.h"
#include "ecrdf/rdf/Literal.h"
#include "ecrdf/rdf/Errors.h"
#include "ecrdf/meta/Id64.h"
#include "ecrdf/logging/internal/logging.hpp"

namespace ecrdf {
namespace rdf {

using std::string;
using std::vector;
using boost::optional;
using rapidjson::Value;
using meta::ModelMetadata;
using meta::ClassInfo;
using meta::PropertyInfo;
using meta::Instance;
using meta::Code;
namespace id64 = meta::id64;

const char* const DEFAULT_ELEMENT_CLASS = "BisCore:Element";
const char* const DEFAULT_CODESPEC_CLASS = "BisCore:CodeSpec";

InstanceMapper::InstanceMapper(const ModelMetadata& md_,
                               TripleSink& sink_,
                               const std::string& elementClass_,
                               const std::string& codeSpecClass_)
    : md(md_), sink(sink_), formatter(md_),
      elementClass(elementClass_), codeSpecClass(codeSpecClass_) {

}

bool InstanceMapper::writeInstance(const Instance& instance) {
    switch (instance.getKind()) {
    case Instance::ELEMENT:
        return writeElement(instance);
    case Instance::MODEL:
        return writeModel(instance);
    case Instance::RELATIONSHIP:
        return writeRelationship(instance);
    case Instance::ASPECT:
        return writeAspect(instance);
    case Instance::CODESPEC:
        return writeCodeSpec(instance);
    }
    return false;
}

bool InstanceMapper::writeCodeSpec(const Instance& codeSpec) {
    string classRdfName;
    try {
        classRdfName = formatter.formatSchemaItemFullName(codeSpecClass);
    } catch (const UnresolvedReference& e) {
        LOG(WARNING) << "Skipping code spec " << codeSpec.getId()
                     << ": " << e.what();
        return false;
    }

    const string subject =
        NameFormatter::formatInstanceId(NameFormatter::CODESPEC,
                                        codeSpec.getId());
    sink.writeTriple(subject, vocab::RDF_TYPE, classRdfName);
    sink.writeTriple(subject,
                     NameFormatter::formatPropertyName(classRdfName, "Name"),
                     literal::quote(codeSpec.getName()));
    return true;
}

const ClassInfo*
InstanceMapper::writeType(const Instance& instance,
                          NameFormatter::instance_prefix_t prefix,
                          std::string& subject) {
    if (!md.hasClass(instance.getClassId())) {
        LOG(WARNING) << "Skipping "
                     << meta::getInstanceKindName(instance.getKind())
                     << " " << instance.getId() << " of unknown class "
                     << instance.getClassId();
        return NULL;
    }
    const ClassInfo& ci = md.getClass(instance.getClassId());
    subject = NameFormatter::formatInstanceId(prefix, instance.getId());
    sink.writeTriple(subject, vocab::RDF_TYPE, formatter.formatSchemaItem(ci));
    return &ci;
}

bool InstanceMapper::writeElement(const Instance& element) {
    string subject;
    const ClassInfo* ci = writeType(element, NameFormatter::ELEMENT, subject);
    if (ci == NULL) return false;
    if (element.getCode().isSet())
        writeCode(subject, element.getCode());
    writeProperties(element, *ci, subject);
    return true;
}

bool InstanceMapper::writeAspect(const Instance& aspect) {
    string subject;
    const ClassInfo* ci = writeType(aspect, NameFormatter::ASPECT, subject);
    if (ci == NULL) return false;
    writeProperties(aspect, *ci, subject);
    return true;
}

bool InstanceMapper::writeModel(const Instance& model) {
    string subject;
    const ClassInfo* ci = writeType(model, NameFormatter::MODEL, subject);
    if (ci == NULL) return false;
    writeProperties(model, *ci, subject);
    return true;
}

bool InstanceMapper::writeRelationship(const Instance& relationship) {
    string subject;
    const ClassInfo* ci =
        writeType(relationship, NameFormatter::RELATIONSHIP, subject);
    if (ci == NULL) return false;
    writeEndpoint(subject,
                  NameFormatter::formatPropertyName(vocab::EC_RELATIONSHIPCLASS,
                                                    "Source"),
                  relationship.getSourceId());
    writeEndpoint(subject,
                  NameFormatter::formatPropertyName(vocab::EC_RELATIONSHIPCLASS,
                                                    "Target"),
                  relationship.getTargetId());
    writeProperties(relationship, *ci, subject);
    return true;
}

void InstanceMapper::writeEndpoint(const string& subject,
                                   const string& predicate,
                                   const string& id) {
    if (!id64::isValid(id)) {
        LOG(DEBUG) << "Invalid relationship endpoint \"" << id
                   << "\" for " << subject;
        return;
    }
    sink.writeTriple(subject, predicate,
                     NameFormatter::formatInstanceId(NameFormatter::ELEMENT,
                                                     id));
}

void InstanceMapper::writeCode(const string& subject, const Code& code) {
    string classRdfName;
    try {
        classRdfName = formatter.formatSchemaItemFullName(elementClass);
    } catch (const UnresolvedReference& e) {
        LOG(WARNING) << "Skipping code of " << subject << ": " << e.what();
        return;
    }

    if (id64::isValid(code.spec)) {
        sink.writeTriple(subject,
                         NameFormatter::formatPropertyName(classRdfName,
                                                           "CodeSpec"),
                         NameFormatter::formatInstanceId(NameFormatter::CODESPEC,
                                                         code.spec));
    } else {
        LOG(DEBUG) << "Invalid code spec \"" << code.spec << "\" for "
                   << subject;
    }
    if (id64::isValid(code.scope)) {
        sink.writeTriple(subject,
                         NameFormatter::formatPropertyName(classRdfName,
                                                           "CodeScope"),
                         NameFormatter::formatInstanceId(NameFormatter::ELEMENT,
                                                         code.scope));
    } else {
        LOG(DEBUG) << "Invalid code scope \"" << code.scope << "\" for "
                   << subject;
    }
    sink.writeTriple(subject,
                     NameFormatter::formatPropertyName(classRdfName,
                                                       "CodeValue"),
                     literal::quote(code.value));
}

void InstanceMapper::writeProperties(const Instance& instance,
                                     const ClassInfo& classInfo,
                                     const string& subject) {
    vector<meta::class_id_t> chain = md.getClassChain(classInfo.getId());
    BOOST_FOREACH(meta::class_id_t classId, chain) {
        const ClassInfo& ci = md.getClass(classId);
        const string classRdfName = formatter.formatSchemaItem(ci);
        BOOST_FOREACH(const PropertyInfo& property, ci.getProperties()) {
            const Value* value = instance.getProperty(property.getName());
            if (value == NULL) continue;

            const string predicate =
                NameFormatter::formatPropertyName(classRdfName,
                                                  property.getName());
            try {
                writePropertyValue(subject, predicate, property, *value);
            } catch (const UnresolvedReference& e) {
                LOG(DEBUG) << "Skipping " << predicate << " of " << subject
                           << ": " << e.what();
            } catch (const std::invalid_argument& e) {
                LOG(DEBUG) << "Skipping malformed " << predicate << " of "
                           << subject << ": " << e.what();
            }
        }
    }
}

static string resolveId(const Value& value, const PropertyInfo& property) {
    optional<string> id = id64::fromJson(value);
    if (!id)
        throw UnresolvedReference("Invalid identifier " +
                                  literal::toJson(value) + " in " +
                                  property.getName());
    return id.get();
}

void InstanceMapper::writePropertyValue(const string& subject,
                                        const string& predicate,
                                        const PropertyInfo& property,
                                        const Value& value) {
    // struct and array values are not expanded
    if (property.isArray()) return;

    switch (property.getKind()) {
    case PropertyInfo::STRUCT:
        return;
    case PropertyInfo::NAVIGATION:
        {
            string id = resolveId(value, property);
            NameFormatter::instance_prefix_t prefix =
                boost::algorithm::ends_with(property.getName(), "Model")
                ? NameFormatter::MODEL
                : NameFormatter::ELEMENT;
            sink.writeTriple(subject, predicate,
                             NameFormatter::formatInstanceId(prefix, id));
        }
        return;
    case PropertyInfo::PRIMITIVE:
    case PropertyInfo::ENUMERATION:
        break;
    }

    switch (property.getPrimitiveType()) {
    case meta::BINARY:
        if (property.hasExtendedType("beguid"))
            sink.writeTriple(subject, predicate,
                             literal::quote(literal::toToken(value)));
        return;
    case meta::POINT2D:
        sink.writeTriple(subject, predicate,
                         literal::quote(literal::formatPoint(value, false)));
        return;
    case meta::POINT3D:
        sink.writeTriple(subject, predicate,
                         literal::quote(literal::formatPoint(value, true)));
        return;
    case meta::STRING:
        if (property.hasExtendedType("json")) {
            sink.writeTriple(subject, predicate,
                             literal::quote(literal::toJson(value)));
        } else {
            sink.writeTriple(subject, predicate,
                             literal::quote(literal::toToken(value)));
        }
        return;
    case meta::LONG:
        if (property.hasExtendedType("id")) {
            sink.writeTriple(subject, predicate,
                             NameFormatter::
                             formatInstanceId(NameFormatter::ELEMENT,
                                              resolveId(value, property)));
        } else {
            sink.writeTriple(subject, predicate, literal::toToken(value));
        }
        return;
    case meta::BOOLEAN:
    case meta::DATETIME:
    case meta::DOUBLE:
    case meta::GEOMETRY:
    case meta::INTEGER:
        sink.writeTriple(subject, predicate, literal::toToken(value));
        return;
    }
    throw UnsupportedPrimitiveType("Unexpected primitive type " +
                                   boost::lexical_cast<string>
                                   (property.getPrimitiveType()) +
                                   " for property " + property.getName());
}

} /* namespace rdf */
} /* namespace ecrdf */
