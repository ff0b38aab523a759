/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for 64-bit identifier helpers
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <sstream>

#include "ecrdf/meta/Id64.h"

namespace ecrdf {
namespace meta {
namespace id64 {

static bool isLowerHex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

bool isValid(const std::string& id) {
    if (id.size() < 3 || id.size() > 18) return false;
    if (id[0] != '0' || id[1] != 'x') return false;
    if (id[2] == '0') return false;
    for (size_t i = 2; i < id.size(); ++i) {
        if (!isLowerHex(id[i])) return false;
    }
    return true;
}

std::string fromUInt64(uint64_t id) {
    if (id == 0) return "0";
    std::ostringstream str;
    str << "0x" << std::hex << id;
    return str.str();
}

boost::optional<std::string> fromJson(const rapidjson::Value& value) {
    std::string id;
    if (value.IsString()) {
        id.assign(value.GetString(), value.GetStringLength());
    } else if (value.IsUint64()) {
        id = fromUInt64(value.GetUint64());
    } else if (value.IsObject()) {
        rapidjson::Value::ConstMemberIterator it = value.FindMember("id");
        if (it == value.MemberEnd() || it->value.IsObject())
            return boost::none;
        return fromJson(it->value);
    } else {
        return boost::none;
    }

    if (!isValid(id)) return boost::none;
    return id;
}

} /* namespace id64 */
} /* namespace meta */
} /* namespace ecrdf */
