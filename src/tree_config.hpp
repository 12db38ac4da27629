#pragma once

#include <string>
#include "avl_node.hpp"

namespace searchtree {

/**
 * TreeConfig - Process-wide settings, read from the environment
 *
 *   SEARCHTREE_DEBUG_LOG   path of the debug log file (unset/empty: off)
 *   SEARCHTREE_VALIDATE    0/1/true/false/on/off/yes/no; check invariants
 *                          after every mutation of a tree holder
 *   SEARCHTREE_DUPLICATES  "replace" (default) or "keep"
 *
 * Invalid values raise std::invalid_argument naming the variable.
 */
struct TreeConfig {
    std::string debugLogPath;
    bool validate = false;
    DuplicatePolicy duplicates = DuplicatePolicy::Replace;

    // Null pointers mean "unset"
    static TreeConfig parse(const char* debugLogPath, const char* validate, const char* duplicates);
    static TreeConfig fromEnvironment();
};

bool parseBool(const std::string& name, const std::string& value);
DuplicatePolicy parseDuplicatePolicy(const std::string& name, const std::string& value);
const char* duplicatePolicyName(DuplicatePolicy policy);

// Loaded from the environment on first use
TreeConfig currentConfig();

// Replaces the process-wide configuration (tests, embedding applications)
void setCurrentConfig(const TreeConfig& config);

}  // namespace searchtree
