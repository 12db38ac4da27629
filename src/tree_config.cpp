#include "tree_config.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <stdexcept>

namespace searchtree {

static std::mutex config_mutex;
static std::unique_ptr<TreeConfig> config_instance;

static std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parseBool(const std::string& name, const std::string& value) {
    std::string v = toLower(value);
    if (v == "1" || v == "true" || v == "on" || v == "yes") return true;
    if (v == "0" || v == "false" || v == "off" || v == "no" || v.empty()) return false;
    throw std::invalid_argument(name + ": expected a boolean, got '" + value + "'");
}

DuplicatePolicy parseDuplicatePolicy(const std::string& name, const std::string& value) {
    std::string v = toLower(value);
    if (v.empty() || v == "replace") return DuplicatePolicy::Replace;
    if (v == "keep") return DuplicatePolicy::Keep;
    throw std::invalid_argument(name + ": expected 'replace' or 'keep', got '" + value + "'");
}

const char* duplicatePolicyName(DuplicatePolicy policy) {
    return policy == DuplicatePolicy::Keep ? "keep" : "replace";
}

TreeConfig TreeConfig::parse(const char* debugLogPath, const char* validate, const char* duplicates) {
    TreeConfig config;
    if (debugLogPath) config.debugLogPath = debugLogPath;
    if (validate) config.validate = parseBool("SEARCHTREE_VALIDATE", validate);
    if (duplicates) config.duplicates = parseDuplicatePolicy("SEARCHTREE_DUPLICATES", duplicates);
    return config;
}

TreeConfig TreeConfig::fromEnvironment() {
    return parse(std::getenv("SEARCHTREE_DEBUG_LOG"),
                 std::getenv("SEARCHTREE_VALIDATE"),
                 std::getenv("SEARCHTREE_DUPLICATES"));
}

TreeConfig currentConfig() {
    std::lock_guard<std::mutex> lock(config_mutex);
    if (!config_instance) {
        config_instance.reset(new TreeConfig(TreeConfig::fromEnvironment()));
    }
    return *config_instance;
}

void setCurrentConfig(const TreeConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex);
    config_instance.reset(new TreeConfig(config));
}

}  // namespace searchtree
