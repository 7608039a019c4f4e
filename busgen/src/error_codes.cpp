/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#include <busgen/internal/error_codes.h>

namespace busgen
{
    namespace error
    {
        namespace
        {
            constexpr int offset_val = 4000;
            constexpr int signature_first = offset_val + 1;
            constexpr int signature_last = offset_val + 7;
            constexpr int model_first = offset_val + 8;
            constexpr int model_last = offset_val + 12;
            constexpr int xml_first = offset_val + 13;
            constexpr int xml_last = offset_val + 15;
        }

        int OK()
        {
            return 0;
        }
        int SIGNATURE_UNEXPECTED_END()
        {
            return offset_val + 1;
        }
        int SIGNATURE_UNKNOWN_TYPE_CODE()
        {
            return offset_val + 2;
        }
        int SIGNATURE_UNMATCHED_CONTAINER()
        {
            return offset_val + 3;
        }
        int SIGNATURE_NESTING_TOO_DEEP()
        {
            return offset_val + 4;
        }
        int SIGNATURE_TOO_LONG()
        {
            return offset_val + 5;
        }
        int SIGNATURE_EMPTY_STRUCT()
        {
            return offset_val + 6;
        }
        int SIGNATURE_INVALID_DICT_ENTRY()
        {
            return offset_val + 7;
        }
        int MODEL_INVALID_IDENTIFIER()
        {
            return offset_val + 8;
        }
        int MODEL_DUPLICATE_MEMBER()
        {
            return offset_val + 9;
        }
        int MODEL_CONFLICTING_PROPERTY()
        {
            return offset_val + 10;
        }
        int MODEL_INVALID_DIRECTION()
        {
            return offset_val + 11;
        }
        int MODEL_CONST_PROPERTY_WRITABLE()
        {
            return offset_val + 12;
        }
        int XML_PARSE_ERROR()
        {
            return offset_val + 13;
        }
        int XML_MISSING_ATTRIBUTE()
        {
            return offset_val + 14;
        }
        int XML_INVALID_ATTRIBUTE()
        {
            return offset_val + 15;
        }
        int DECODE_FAILED()
        {
            return offset_val + 16;
        }
        int TYPE_MISMATCH()
        {
            return offset_val + 17;
        }
        int CALL_FAILED()
        {
            return offset_val + 18;
        }
        int TRANSPORT_ERROR()
        {
            return offset_val + 19;
        }
        int UNKNOWN_OBJECT()
        {
            return offset_val + 20;
        }
        int UNKNOWN_INTERFACE()
        {
            return offset_val + 21;
        }
        int UNKNOWN_METHOD()
        {
            return offset_val + 22;
        }
        int UNKNOWN_PROPERTY()
        {
            return offset_val + 23;
        }
        int PROPERTY_READ_ONLY()
        {
            return offset_val + 24;
        }
        int INVALID_ARGS()
        {
            return offset_val + 25;
        }
        int NOT_SUBSCRIBED()
        {
            return offset_val + 26;
        }
        int OBJECT_ALREADY_REGISTERED()
        {
            return offset_val + 27;
        }

        int MIN()
        {
            return offset_val + 1;
        }
        int MAX()
        {
            return OBJECT_ALREADY_REGISTERED();
        }

        const char* to_string(int err)
        {
            if (err == OK())
                return "OK";
            if (err == SIGNATURE_UNEXPECTED_END())
                return "signature ended unexpectedly";
            if (err == SIGNATURE_UNKNOWN_TYPE_CODE())
                return "unknown type code in signature";
            if (err == SIGNATURE_UNMATCHED_CONTAINER())
                return "unmatched container in signature";
            if (err == SIGNATURE_NESTING_TOO_DEEP())
                return "signature nesting too deep";
            if (err == SIGNATURE_TOO_LONG())
                return "signature too long";
            if (err == SIGNATURE_EMPTY_STRUCT())
                return "empty struct in signature";
            if (err == SIGNATURE_INVALID_DICT_ENTRY())
                return "invalid dict entry in signature";
            if (err == MODEL_INVALID_IDENTIFIER())
                return "invalid identifier";
            if (err == MODEL_DUPLICATE_MEMBER())
                return "duplicate member name";
            if (err == MODEL_CONFLICTING_PROPERTY())
                return "property getter and setter disagree";
            if (err == MODEL_INVALID_DIRECTION())
                return "invalid argument direction";
            if (err == MODEL_CONST_PROPERTY_WRITABLE())
                return "constant property cannot be writable";
            if (err == XML_PARSE_ERROR())
                return "malformed introspection document";
            if (err == XML_MISSING_ATTRIBUTE())
                return "missing required attribute";
            if (err == XML_INVALID_ATTRIBUTE())
                return "invalid attribute value";
            if (err == DECODE_FAILED())
                return "signal body does not match the declared arguments";
            if (err == TYPE_MISMATCH())
                return "reply signature does not match the expected type";
            if (err == CALL_FAILED())
                return "remote call failed";
            if (err == TRANSPORT_ERROR())
                return "transport error";
            if (err == UNKNOWN_OBJECT())
                return "unknown object";
            if (err == UNKNOWN_INTERFACE())
                return "unknown interface";
            if (err == UNKNOWN_METHOD())
                return "unknown method";
            if (err == UNKNOWN_PROPERTY())
                return "unknown property";
            if (err == PROPERTY_READ_ONLY())
                return "property is read only";
            if (err == INVALID_ARGS())
                return "invalid arguments";
            if (err == NOT_SUBSCRIBED())
                return "subscription is not active";
            if (err == OBJECT_ALREADY_REGISTERED())
                return "interface already registered at this path";
            return "unknown error";
        }

        bool is_signature_error(int err)
        {
            return err >= signature_first && err <= signature_last;
        }

        bool is_model_error(int err)
        {
            return err >= model_first && err <= model_last;
        }

        bool is_xml_error(int err)
        {
            return err >= xml_first && err <= xml_last;
        }

        std::string to_dbus_error_name(int err)
        {
            if (err == UNKNOWN_OBJECT())
                return "org.freedesktop.DBus.Error.UnknownObject";
            if (err == UNKNOWN_INTERFACE())
                return "org.freedesktop.DBus.Error.UnknownInterface";
            if (err == UNKNOWN_METHOD())
                return "org.freedesktop.DBus.Error.UnknownMethod";
            if (err == UNKNOWN_PROPERTY())
                return "org.freedesktop.DBus.Error.UnknownProperty";
            if (err == PROPERTY_READ_ONLY())
                return "org.freedesktop.DBus.Error.PropertyReadOnly";
            if (err == INVALID_ARGS() || err == TYPE_MISMATCH() || err == DECODE_FAILED())
                return "org.freedesktop.DBus.Error.InvalidArgs";
            return "org.freedesktop.DBus.Error.Failed";
        }

        int from_dbus_error_name(const std::string& name)
        {
            if (name == "org.freedesktop.DBus.Error.UnknownObject")
                return UNKNOWN_OBJECT();
            if (name == "org.freedesktop.DBus.Error.UnknownInterface")
                return UNKNOWN_INTERFACE();
            if (name == "org.freedesktop.DBus.Error.UnknownMethod")
                return UNKNOWN_METHOD();
            if (name == "org.freedesktop.DBus.Error.UnknownProperty")
                return UNKNOWN_PROPERTY();
            if (name == "org.freedesktop.DBus.Error.PropertyReadOnly")
                return PROPERTY_READ_ONLY();
            if (name == "org.freedesktop.DBus.Error.InvalidArgs")
                return INVALID_ARGS();
            return CALL_FAILED();
        }
    }
}
