/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for PropertyInfo class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/algorithm/string/predicate.hpp>

#include "ecrdf/meta/PropertyInfo.h"

namespace ecrdf {
namespace meta {

static const char* const PRIMITIVE_TYPE_NAMES[] = {
    "binary",
    "boolean",
    "dateTime",
    "double",
    "IGeometry",
    "int",
    "long",
    "point2d",
    "point3d",
    "string"
};

const char* getPrimitiveTypeName(PrimitiveType type) {
    return PRIMITIVE_TYPE_NAMES[type];
}

boost::optional<PrimitiveType> parsePrimitiveType(const std::string& name) {
    for (size_t i = 0;
         i < sizeof(PRIMITIVE_TYPE_NAMES)/sizeof(PRIMITIVE_TYPE_NAMES[0]);
         ++i) {
        if (boost::algorithm::iequals(name, PRIMITIVE_TYPE_NAMES[i]))
            return static_cast<PrimitiveType>(i);
    }
    // common aliases
    if (boost::algorithm::iequals(name, "integer"))
        return INTEGER;
    if (boost::algorithm::iequals(name, "bool"))
        return BOOLEAN;
    if (boost::algorithm::iequals(name, "geometry") ||
        boost::algorithm::iequals(name, "Bentley.Geometry.Common.IGeometry"))
        return GEOMETRY;
    return boost::none;
}

PropertyInfo::PropertyInfo(const std::string& property_name_,
                           PrimitiveType primitive_type_,
                           cardinality_t cardinality_,
                           const std::string& extended_type_)
    : property_name(property_name_),
      kind(PRIMITIVE),
      cardinality(cardinality_),
      primitive_type(primitive_type_),
      extended_type(extended_type_),
      direction(FORWARD) {

}

PropertyInfo::PropertyInfo(const std::string& property_name_,
                           cardinality_t cardinality_)
    : property_name(property_name_),
      kind(STRUCT),
      cardinality(cardinality_),
      primitive_type(STRING),
      direction(FORWARD) {

}

PropertyInfo::PropertyInfo(const std::string& property_name_,
                           const boost::optional<class_id_t>& relationship_class_,
                           direction_t direction_)
    : property_name(property_name_),
      kind(NAVIGATION),
      cardinality(SCALAR),
      primitive_type(LONG),
      relationship_class(relationship_class_),
      direction(direction_) {

}

PropertyInfo::PropertyInfo(const std::string& property_name_,
                           const boost::optional<enum_id_t>& enumeration_,
                           PrimitiveType backing_type_,
                           cardinality_t cardinality_)
    : property_name(property_name_),
      kind(ENUMERATION),
      cardinality(cardinality_),
      primitive_type(backing_type_),
      direction(FORWARD),
      enumeration(enumeration_) {

}

PropertyInfo::~PropertyInfo() {

}

bool PropertyInfo::hasExtendedType(const std::string& name) const {
    return boost::algorithm::iequals(extended_type, name);
}

} /* namespace meta */
} /* namespace ecrdf */
