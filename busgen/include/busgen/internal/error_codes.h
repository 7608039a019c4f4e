/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <string>

namespace busgen
{
    namespace error
    {
        int OK();

        // signature grammar
        int SIGNATURE_UNEXPECTED_END();
        int SIGNATURE_UNKNOWN_TYPE_CODE();
        int SIGNATURE_UNMATCHED_CONTAINER();
        int SIGNATURE_NESTING_TOO_DEEP();
        int SIGNATURE_TOO_LONG();
        int SIGNATURE_EMPTY_STRUCT();
        int SIGNATURE_INVALID_DICT_ENTRY();

        // interface model construction
        int MODEL_INVALID_IDENTIFIER();
        int MODEL_DUPLICATE_MEMBER();
        int MODEL_CONFLICTING_PROPERTY();
        int MODEL_INVALID_DIRECTION();
        int MODEL_CONST_PROPERTY_WRITABLE();

        // introspection documents
        int XML_PARSE_ERROR();
        int XML_MISSING_ATTRIBUTE();
        int XML_INVALID_ATTRIBUTE();

        // runtime
        int DECODE_FAILED();
        int TYPE_MISMATCH();
        int CALL_FAILED();
        int TRANSPORT_ERROR();
        int UNKNOWN_OBJECT();
        int UNKNOWN_INTERFACE();
        int UNKNOWN_METHOD();
        int UNKNOWN_PROPERTY();
        int PROPERTY_READ_ONLY();
        int INVALID_ARGS();
        int NOT_SUBSCRIBED();
        int OBJECT_ALREADY_REGISTERED();

        int MIN();
        int MAX();

        const char* to_string(int err);

        bool is_signature_error(int err);
        bool is_model_error(int err);
        bool is_xml_error(int err);

        // maps a code onto the org.freedesktop.DBus.Error.* name carried by error replies
        std::string to_dbus_error_name(int err);
        int from_dbus_error_name(const std::string& name);
    }
}
