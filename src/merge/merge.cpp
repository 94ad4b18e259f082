#include "dotenv/merge.hpp"

#include <spdlog/spdlog.h>

namespace dotenv {

EnvironmentTable layer_tables(const std::vector<EnvironmentTable>& tables) {
    EnvironmentTable effective;
    for (const auto& table : tables) {
        effective.merge_from(table);
    }
    return effective;
}

Result<MergeResult> merge(const EnvironmentList& ambient,
                          const std::vector<EnvironmentTable>& tables,
                          const Invocation& invocation) {
    MergeResult result;
    EnvironmentTable effective = layer_tables(tables);

    // Alias: the aliased command runs, the typed command becomes its first argument
    auto alias = effective.command_alias();
    effective.erase(KEY_COMMAND);
    if (alias && !alias->empty()) {
        result.command = *alias;
        result.aliased = true;
        if (invocation.command) {
            result.args.push_back(*invocation.command);
        }
        result.args.insert(result.args.end(), invocation.args.begin(), invocation.args.end());
        spdlog::debug("{} aliased to {}", KEY_COMMAND, result.command);
    } else if (invocation.command && !invocation.command->empty()) {
        result.command = *invocation.command;
        result.args = invocation.args;
    } else {
        return Result<MergeResult>::err(
            Error(ErrorCode::CONFIG_ERROR, "no command to execute"));
    }

    result.strict = invocation.strict;
    if (effective.forces_strict()) {
        if (!result.strict) {
            spdlog::debug("strict mode enabled by {}", KEY_STRICT);
        }
        result.strict = true;
    }
    effective.erase(KEY_STRICT);

    if (!result.strict) {
        for (const auto& kv : ambient) {
            std::string key = kv_key(kv);
            // DOTENV_CONFIG_DIR configures this launcher, not the child
            if (is_control_key(key) || key == CONFIG_DIR_ENV || effective.contains(key)) {
                continue;
            }
            result.environment.push_back(kv);
        }
    }

    for (const auto& var : effective) {
        result.environment.push_back(to_kv_string(var.name, var.value));
    }

    return Result<MergeResult>::ok(std::move(result));
}

} // namespace dotenv
