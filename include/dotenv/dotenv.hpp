#pragma once

/**
 * @file dotenv.hpp
 * @brief Convenience header pulling in the whole dotenv library
 *
 * Pipeline: content -> Tokenizer -> parse_entry -> EnvironmentTable
 *           tables + ambient environment -> merge -> exec::execute
 *
 * Launcher wraps the pipeline for one invocation.
 */

#include "dotenv/result.hpp"
#include "dotenv/types.hpp"
#include "dotenv/tokenizer.hpp"
#include "dotenv/entry_parser.hpp"
#include "dotenv/environment_table.hpp"
#include "dotenv/merge.hpp"
#include "dotenv/loader.hpp"
#include "dotenv/platform.hpp"
#include "dotenv/exec.hpp"
#include "dotenv/launcher.hpp"
