#pragma once

/**
 * @file quarry.hpp
 * @brief Main convenience header for the Quarry agent core
 *
 * Include this single header to get access to all public Quarry APIs.
 *
 * Quarry is the tool-calling core of a job-search assistant: it advertises
 * a typed tool catalogue to a language model, dispatches the model's tool
 * calls to context-gathering handlers, decodes the model's structured
 * replies and tracks long-running AI operations.
 *
 * Quick Start:
 * @code
 * #include <quarry/quarry.hpp>
 *
 * int main() {
 *     quarry::Config config;
 *     auto core = quarry::AgentCore::create(config, std::make_shared<MyContextProvider>());
 *     if (!core) {
 *         std::cerr << "Error: " << core.error().to_string() << std::endl;
 *         return 1;
 *     }
 *
 *     std::cout << (*core)->tool_schemas().dump(2) << std::endl;
 *     std::cout << (*core)->execute("suggest_networking_actions", "{}") << std::endl;
 *
 *     auto reply = (*core)->decode<quarry::decode::JobRecommendation>(model_text);
 *     if (!reply && quarry::is_validation_error(reply.error().code)) {
 *         // well-formed but unusable: ask the model again
 *     }
 *     return 0;
 * }
 * @endcode
 */

// Core types and error handling
#include "log.hpp"
#include "types.hpp"

// Schema compilation
#include "schema/schema_node.hpp"
#include "schema/schema_compiler.hpp"
#include "schema/schema_loader.hpp"

// Tools
#include "tools/context_provider.hpp"
#include "tools/tool_arguments.hpp"
#include "tools/tool_result.hpp"
#include "tools/tool_registry.hpp"
#include "tools/invocation_queue.hpp"
#include "tools/tool_dispatcher.hpp"
#include "tools/discovery_tools.hpp"

// Structured decoding
#include "decode/uuid.hpp"
#include "decode/field_reader.hpp"
#include "decode/json_extractor.hpp"
#include "decode/responses.hpp"
#include "decode/structured_decoder.hpp"

// Operation tracking
#include "tracking/operation.hpp"
#include "tracking/operation_tracker.hpp"

// Facade
#include "agent_core.hpp"
