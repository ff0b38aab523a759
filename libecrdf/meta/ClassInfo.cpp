/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for ClassInfo class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/foreach.hpp>

#include "ecrdf/meta/ClassInfo.h"

namespace ecrdf {
namespace meta {

const char* const LINK_TABLE_RELATIONSHIP_MAP =
    "ECDbMap.LinkTableRelationshipMap";

static const char* const CLASS_TYPE_NAMES[] = {
    "EntityClass",
    "RelationshipClass",
    "CustomAttributeClass",
    "Mixin",
    "Enumeration"
};

const char* getClassTypeName(ClassInfo::class_type_t type) {
    return CLASS_TYPE_NAMES[type];
}

ClassInfo::ClassInfo(class_id_t class_id_,
                     class_type_t class_type_,
                     const std::string& class_name_,
                     schema_id_t schema_id_,
                     const std::vector<PropertyInfo>& properties_)
    : class_id(class_id_),
      class_type(class_type_),
      class_name(class_name_),
      schema_id(schema_id_),
      properties(properties_) {
    for (size_t i = 0; i < properties.size(); ++i) {
        prop_names[properties[i].getName()] = i;
    }
}

ClassInfo::~ClassInfo() {
}

const PropertyInfo* ClassInfo::findProperty(const std::string& name) const {
    std::map<std::string, size_t>::const_iterator it = prop_names.find(name);
    if (it == prop_names.end()) return NULL;
    return &properties[it->second];
}

bool ClassInfo::hasCustomAttribute(const std::string& name) const {
    std::string wanted = boost::algorithm::replace_all_copy(name, ":", ".");
    BOOST_FOREACH(const std::string& ca, custom_attributes) {
        if (boost::algorithm::iequals(
                boost::algorithm::replace_all_copy(ca, ":", "."), wanted))
            return true;
    }
    return false;
}

} /* namespace meta */
} /* namespace ecrdf */
