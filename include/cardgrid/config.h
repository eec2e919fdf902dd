#pragma once

#include <cardgrid/result.hpp>
#include <cardgrid/layout-config.h>
#include <cardgrid/record.h>
#include <yaml-cpp/yaml.h>
#include <string>
#include <optional>
#include <filesystem>
#include <memory>

namespace cardgrid {

//=============================================================================
// Config - layered YAML configuration
//
// Layers, lowest first: built-in defaults, config file, CARDGRID_* environment
// variables, command line overrides. Keys are slash paths into the merged tree
// ("grid/elements-per-row"). Keys that are not part of the defaults tree are
// rejected when the typed configuration is extracted.
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Load from a file. An empty path falls back to the XDG config file when
    // one exists, otherwise defaults only.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Load from an in-memory YAML document
    static Result<Ptr> fromString(const std::string& yaml,
                                  const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by slash path; nullopt if missing or not convertible
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    // Typed views. Both reject unknown keys and wrongly-typed values.
    Result<LayoutConfig> layoutConfig() const;
    Result<InputColumns> inputColumns() const;

    // $XDG_CONFIG_HOME/cardgrid/config.yaml
    static std::filesystem::path getXDGConfigPath();

    // Environment variable prefix
    static constexpr const char* ENV_PREFIX = "CARDGRID_";

    // Common config keys
    static constexpr const char* KEY_ELEMENTS_PER_ROW = "grid/elements-per-row";
    static constexpr const char* KEY_FLOW = "grid/flow";
    static constexpr const char* KEY_SECTION_ORDER = "grid/section-order";
    static constexpr const char* KEY_SECTION_ORDER_DIRECTION = "grid/section-order-direction";
    static constexpr const char* KEY_MERGE_SECTIONS = "grid/merge-sections";
    static constexpr const char* KEY_HEAD_ORIENTATION = "section-head/orientation";
    static constexpr const char* KEY_HEAD_SIZE = "section-head/size";
    static constexpr const char* KEY_CARD_HEIGHT = "card/height";
    static constexpr const char* KEY_PAGE_WIDTH = "page/width";

private:
    explicit Config(const YAML::Node& cmdOverrides) noexcept;

    Result<void> init(const std::string& configPath, const std::string& inlineYaml) noexcept;

    Result<void> loadFile(const std::string& path);
    Result<void> loadString(const std::string& yaml);

    // Apply CARDGRID_* overrides for every scalar default
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    void applyOverrides(const YAML::Node& overrides);

    YAML::Node getNode(const std::string& path) const;

    Result<void> checkUnknownKeys() const;

    // "grid/elements-per-row" -> "CARDGRID_GRID_ELEMENTS_PER_ROW"
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    static YAML::Node defaults();

    YAML::Node _config;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

} // namespace cardgrid
