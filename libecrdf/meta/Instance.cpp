/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Instance class.
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include "ecrdf/meta/Instance.h"

namespace ecrdf {
namespace meta {

using rapidjson::Value;

static const char* const INSTANCE_KIND_NAMES[] = {
    "element",
    "model",
    "relationship",
    "aspect",
    "codespec"
};

const char* getInstanceKindName(Instance::instance_kind_t kind) {
    return INSTANCE_KIND_NAMES[kind];
}

Instance::Instance(instance_kind_t kind_,
                   const std::string& id_,
                   class_id_t class_id_)
    : kind(kind_), id(id_), class_id(class_id_) {
    props.SetObject();
}

Instance::~Instance() {
}

const Value* Instance::getProperty(const std::string& name) const {
    Value::ConstMemberIterator it = props.FindMember(name.c_str());
    if (it == props.MemberEnd()) return NULL;

    const Value& v = it->value;
    if (v.IsNull()) return NULL;
    if (v.IsBool() && !v.GetBool()) return NULL;
    // zero and NaN
    if (v.IsNumber() && !(v.GetDouble() < 0 || v.GetDouble() > 0))
        return NULL;
    if (v.IsString() && v.GetStringLength() == 0) return NULL;
    if (v.IsArray() && v.Empty()) return NULL;
    if (v.IsObject() && v.MemberCount() == 0) return NULL;
    return &v;
}

bool Instance::isSet(const std::string& name) const {
    return getProperty(name) != NULL;
}

std::vector<std::string> Instance::getPropertyNames() const {
    std::vector<std::string> names;
    Value::ConstMemberIterator it;
    for (it = props.MemberBegin(); it != props.MemberEnd(); ++it) {
        names.push_back(std::string(it->name.GetString(),
                                    it->name.GetStringLength()));
    }
    return names;
}

Instance& Instance::set(const std::string& name, Value& value) {
    Value::MemberIterator it = props.FindMember(name.c_str());
    if (it != props.MemberEnd()) {
        it->value = value;
    } else {
        Value key(name.c_str(), name.size(), props.GetAllocator());
        props.AddMember(key, value, props.GetAllocator());
    }
    return *this;
}

Instance& Instance::setString(const std::string& name,
                              const std::string& value) {
    Value v(value.c_str(), value.size(), props.GetAllocator());
    return set(name, v);
}

Instance& Instance::setInt64(const std::string& name, int64_t value) {
    Value v(value);
    return set(name, v);
}

Instance& Instance::setUInt64(const std::string& name, uint64_t value) {
    Value v(value);
    return set(name, v);
}

Instance& Instance::setDouble(const std::string& name, double value) {
    Value v(value);
    return set(name, v);
}

Instance& Instance::setBool(const std::string& name, bool value) {
    Value v(value);
    return set(name, v);
}

Instance& Instance::setValue(const std::string& name, const Value& value) {
    Value v(value, props.GetAllocator());
    return set(name, v);
}

Instance& Instance::setJson(const std::string& name,
                            const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError())
        throw std::invalid_argument("Malformed JSON value for property " +
                                    name);
    return setValue(name, doc);
}

Instance& Instance::unset(const std::string& name) {
    props.RemoveMember(name.c_str());
    return *this;
}

} /* namespace meta */
} /* namespace ecrdf */
