#pragma once
/*
 * Core commands
 *
 * Purpose: the built-in markdown workspace command set (document, navigation,
 *          appearance, info, history).
 * Usage: call once after CommandRegistry::init(); throws CommandError if a
 *        name or alias is already taken.
 */
#include "cmd_registry.hpp"
#include "workspace.hpp"

void register_core_commands(CommandRegistry& registry, Workspace& ws, bool& should_quit);
