/*
 *   Copyright (c) 2026 Edward Boggis-Rolfe
 *   All rights reserved.
 */
#pragma once

#include <busgen/version.h>

#include <busgen/internal/coroutine_support.h>
#include <busgen/internal/error_codes.h>
#include <busgen/internal/logger.h>

#include <busgen/internal/signature.h>
#include <busgen/internal/value.h>
#include <busgen/internal/marshal.h>

#include <busgen/internal/naming.h>
#include <busgen/internal/interface_spec.h>
#include <busgen/internal/interface_builder.h>
#include <busgen/internal/introspection.h>

#include <busgen/internal/message.h>
#include <busgen/internal/transport.h>
#include <busgen/internal/signal_matcher.h>
#include <busgen/internal/proxy.h>
#include <busgen/internal/dispatcher.h>
#include <busgen/internal/object_server.h>
#include <busgen/internal/standard_interfaces.h>
