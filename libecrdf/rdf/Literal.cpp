/* -*- C++ -*-; c-basic-offset: 4; indent-tabs-mode: nil */
/*
 * Implementation for Turtle literal formatting
 *
 * Copyright (c) 2014 Cisco Systems, Inc. and others.  All rights reserved.
 *
 * This program and the accompanying materials are made available under the
 * terms of the Eclipse Public License v1.0 which accompanies this distribution,
 * and is available at http://www.eclipse.org/legal/epl-v10.html
 */

#include <stdexcept>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "ecrdf/rdf/Literal.h"

namespace ecrdf {
namespace rdf {
namespace literal {

using rapidjson::Value;
using rapidjson::StringBuffer;

typedef rapidjson::Writer<StringBuffer, rapidjson::UTF8<>, rapidjson::UTF8<>,
                          rapidjson::CrtAllocator,
                          rapidjson::kWriteValidateEncodingFlag> JsonWriter;

std::string quote(const std::string& value) {
    StringBuffer buffer;
    JsonWriter writer(buffer);
    if (!writer.String(value.c_str(),
                       static_cast<rapidjson::SizeType>(value.size())))
        throw std::invalid_argument("String is not valid UTF-8");
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string toJson(const Value& value) {
    StringBuffer buffer;
    JsonWriter writer(buffer);
    if (!value.Accept(writer))
        throw std::invalid_argument("Value contains invalid UTF-8 or a "
                                    "non-finite number");
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::string toToken(const Value& value) {
    if (value.IsString()) {
        std::string token(value.GetString(), value.GetStringLength());
        // rejects invalid UTF-8
        quote(token);
        return token;
    }
    return toJson(value);
}

static void writeCoordinate(JsonWriter& writer,
                            const char* axis,
                            const Value& coord) {
    if (!coord.IsNumber())
        throw std::invalid_argument(std::string("Point coordinate ") +
                                    axis + " is not a number");
    writer.String(axis);
    if (!coord.Accept(writer))
        throw std::invalid_argument(std::string("Point coordinate ") +
                                    axis + " is not finite");
}

static const Value& getCoordinate(const Value& value, const char* axis,
                                  size_t index) {
    if (value.IsArray()) {
        if (index >= value.Size())
            throw std::invalid_argument(std::string("Point has no ") + axis);
        return value[static_cast<rapidjson::SizeType>(index)];
    }
    Value::ConstMemberIterator it = value.FindMember(axis);
    if (it == value.MemberEnd())
        throw std::invalid_argument(std::string("Point has no ") + axis);
    return it->value;
}

std::string formatPoint(const Value& value, bool is3d) {
    if (!value.IsObject() && !value.IsArray())
        throw std::invalid_argument("Point is not an object or array");

    StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    writeCoordinate(writer, "x", getCoordinate(value, "x", 0));
    writeCoordinate(writer, "y", getCoordinate(value, "y", 1));
    if (is3d)
        writeCoordinate(writer, "z", getCoordinate(value, "z", 2));
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

} /* namespace literal */
} /* namespace rdf */
} /* namespace ecrdf */
