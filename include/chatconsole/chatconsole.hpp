// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file chatconsole.hpp
/// @brief Master include for the chat console library
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <chatconsole/activity.hpp>
#include <chatconsole/activity_stream.hpp>
#include <chatconsole/adaptive_card.hpp>
#include <chatconsole/agent_client.hpp>
#include <chatconsole/batch_report.hpp>
#include <chatconsole/bridge_client.hpp>
#include <chatconsole/console_input.hpp>
#include <chatconsole/jsonrpc.hpp>
#include <chatconsole/logging.hpp>
#include <chatconsole/mode_selector.hpp>
#include <chatconsole/process.hpp>
#include <chatconsole/reply_printer.hpp>
#include <chatconsole/session_runner.hpp>
#include <chatconsole/settings.hpp>
#include <chatconsole/transport.hpp>
#include <chatconsole/workbook.hpp>
#include <chatconsole/zip_archive.hpp>

namespace chatconsole
{

/// Library version string
inline constexpr const char* kVersion = "0.1.0";

} // namespace chatconsole
