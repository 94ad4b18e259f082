#include "dotenv/environment_table.hpp"
#include "dotenv/entry_parser.hpp"
#include "dotenv/tokenizer.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>

namespace dotenv {

void EnvironmentTable::set(const std::string& name, const std::string& value) {
    auto it = index_.find(name);
    if (it != index_.end()) {
        entries_[it->second].value = value;
        return;
    }
    index_[name] = entries_.size();
    entries_.push_back({name, value});
}

bool EnvironmentTable::erase(const std::string& name) {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return false;
    }
    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(it->second));
    reindex();
    return true;
}

bool EnvironmentTable::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

std::optional<std::string> EnvironmentTable::get(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return entries_[it->second].value;
}

void EnvironmentTable::merge_from(const EnvironmentTable& other) {
    for (const auto& var : other.entries_) {
        set(var.name, var.value);
    }
}

std::optional<std::string> EnvironmentTable::command_alias() const {
    return get(KEY_COMMAND);
}

std::optional<std::string> EnvironmentTable::strict_override() const {
    return get(KEY_STRICT);
}

bool EnvironmentTable::forces_strict() const {
    auto value = strict_override();
    return value && !value->empty();
}

void EnvironmentTable::reindex() {
    index_.clear();
    for (size_t i = 0; i < entries_.size(); ++i) {
        index_[entries_[i].name] = i;
    }
}

Result<EnvironmentTable> parse(const std::string& content) {
    EnvironmentTable table;
    Tokenizer tokenizer(content);

    while (true) {
        auto next = tokenizer.next();
        if (next.isErr()) {
            return Result<EnvironmentTable>::err(next.error());
        }
        if (!next.value()) {
            break;
        }

        auto var = parse_entry(*next.value());
        if (!var) {
            continue;
        }
        if (table.contains(var->name)) {
            spdlog::debug("line {}: {} redefined", next.value()->line, var->name);
        }
        table.set(var->name, var->value);
    }

    return Result<EnvironmentTable>::ok(std::move(table));
}

} // namespace dotenv
