#pragma once

/**
 * @file warden.hpp
 * @brief Main convenience header for Warden
 *
 * Include this single header to get access to all public Warden APIs.
 *
 * Warden is a header-only C++17 engine that dispatches tool calls arriving
 * over duplex channels, runs multi-step workflow tools with an optional
 * expert-analysis step against an external model provider, and guarantees
 * every call a single terminal outcome within a nested timeout budget.
 *
 * Quick Start:
 * @code
 * #include <warden/warden.hpp>
 *
 * int main() {
 *     warden::Config config;
 *     config.timeouts.base = std::chrono::seconds(45);
 *
 *     auto server = warden::Server::create(config, nullptr);
 *     if (!server) {
 *         std::cerr << "Error: " << server.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     auto outcome = (*server)->call(warden::ToolCall::make("1", "echo", {{"text", "hi"}}));
 *     std::cout << outcome.to_json().dump() << std::endl;
 *     return 0;
 * }
 * @endcode
 *
 * Key Components:
 * - warden::Server: wires everything from one Config
 * - warden::engine::TimeoutBudgetCalculator: nested session/dispatch/step/provider budget
 * - warden::engine::ProviderCallGuard: deadline-bounded provider calls
 * - warden::engine::RequestDispatcher: tool lookup and Outcome classification
 * - warden::engine::WorkflowStateMachine: step sequencing and expert-analysis gating
 * - warden::session::SessionManager: per-channel sessions, concurrency limits
 * - warden::engine::OutcomeObserver: off-path scoring and audit
 *
 * Thread Safety:
 * - calls run on a fixed pool of worker threads per channel
 * - provider calls run on guard-owned worker threads
 * - log callbacks may be invoked from any thread
 */

// Core types
#include "types.hpp"
#include "log.hpp"
#include "config.hpp"

// Public API
#include "server.hpp"

// Provider interface (for custom implementations and testing)
#include "provider/interface.hpp"

// Engine components (optional, for advanced usage)
#include "engine/timeout_budget.hpp"
#include "engine/cancellation.hpp"
#include "engine/provider_guard.hpp"
#include "engine/expert_analysis.hpp"
#include "engine/workflow.hpp"
#include "engine/workflow_tool.hpp"
#include "engine/tool_registry.hpp"
#include "engine/dispatcher.hpp"
#include "engine/outcome_observer.hpp"
#include "engine/audit_log.hpp"

// Sessions and transports
#include "session/session_manager.hpp"
#include "session/transport/stdio_channel.hpp"

/**
 * @namespace warden
 * @brief Main namespace for Warden
 *
 * - warden::provider - Provider interface
 * - warden::engine - Dispatch, timeout and workflow machinery
 * - warden::session - Channel sessions, wire protocol and transports
 * - warden::tools - Built-in tools
 */
