#include "cardgrid/config.h"
#include <ytrace/ytrace.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <utility>

namespace cardgrid {

// ─── Defaults ────────────────────────────────────────────────────────────────

static const char* DEFAULTS_YAML = R"(
input:
  section-column: section
  title-column: title
  subtitle-column: subtitle
  image-column: image
page:
  width: 800
  margin: {top: 10, right: 10, bottom: 10, left: 10}
  background-color: white
  font-family: Open Sans
grid:
  elements-per-row: 5
  flow: regular
  section-order: count
  section-order-direction: auto
  merge-sections: []
section-head:
  orientation: top
  size: 35
  vertical-align: top
  text: {size: 20, weight: 600, style: normal}
  text-color: black
  background-color: white
  padding: {top: 5, right: 5, bottom: 5, left: 5}
  show-totals: false
card:
  height: 50
  title-position: bottom
  text-anchor: middle
  title: {size: 10, weight: 400, style: normal, color: black}
  subtitle: {size: 8, weight: 400, style: normal, color: black}
  circle-stroke-color: "#c1c5c8"
  circle-stroke-width: 2
  background-color: white
  margin: {top: 2, right: 2, bottom: 2, left: 2}
  circle-padding: {top: 2, right: 2, bottom: 2, left: 2}
  placeholder-color: "#e0e0e0"
)";

YAML::Node Config::defaults() {
    return YAML::Load(DEFAULTS_YAML);
}

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// Const lookup; never inserts into the tree
static YAML::Node child(const YAML::Node& node, const std::string& key) {
    return node[key];
}

// Navigate to a node by path (returns an undefined node if not found)
static YAML::Node navigateNode(const YAML::Node& root, const std::vector<std::string>& parts) {
    YAML::Node current = YAML::Clone(root);
    for (const auto& p : parts) {
        if (!current.IsMap()) return YAML::Node(YAML::NodeType::Undefined);
        YAML::Node next = child(current, p);
        if (!next.IsDefined()) return YAML::Node(YAML::NodeType::Undefined);
        current.reset(next);
    }
    return current;
}

// ─── TreeReader: typed extraction with first-error capture ──────────────────

namespace {

class TreeReader {
public:
    explicit TreeReader(const YAML::Node& root) : _root(root) {}

    template<typename T>
    void scalar(const std::string& path, T& out) {
        read(path, out);
    }

    // Returns false when the key is absent or the value was rejected
    template<typename T>
    bool read(const std::string& path, T& out) {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull()) return false;
        if (!node.IsScalar()) {
            fail(path, "expected a scalar value");
            return false;
        }
        try {
            out = node.as<T>();
        } catch (const YAML::Exception&) {
            fail(path, "cannot convert '" + node.Scalar() + "'");
            return false;
        }
        return true;
    }

    template<typename E>
    void choice(const std::string& path, E& out,
                std::initializer_list<std::pair<const char*, E>> table) {
        std::string value;
        if (!read(path, value)) return;
        for (const auto& [name, e] : table) {
            if (value == name) {
                out = e;
                return;
            }
        }
        std::string allowed;
        for (const auto& [name, e] : table) {
            if (!allowed.empty()) allowed += "|";
            allowed += name;
        }
        fail(path, "'" + value + "' is not one of " + allowed);
    }

    void edges(const std::string& path, Edges& out) {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull()) return;
        if (node.IsScalar()) {
            float v = 0;
            scalar(path, v);
            out = Edges::uniform(v);
            return;
        }
        scalar(path + "/top", out.top);
        scalar(path + "/right", out.right);
        scalar(path + "/bottom", out.bottom);
        scalar(path + "/left", out.left);
    }

    void textStyle(const std::string& path, TextStyle& out) {
        scalar(path + "/size", out.size);
        scalar(path + "/weight", out.weight);
        scalar(path + "/style", out.style);
    }

    void color(const std::string& path, ColorSource& out) {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull()) return;
        if (node.IsScalar()) {
            out = UniformColor{node.as<std::string>()};
            return;
        }
        if (!node.IsMap()) {
            fail(path, "expected a colour or {by-key, fallback}");
            return;
        }
        KeyedColor keyed;
        keyed.fallback = "black";
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto key = it->first.as<std::string>();
            if (key == "fallback") {
                scalar(path + "/fallback", keyed.fallback);
            } else if (key == "by-key") {
                if (!it->second.IsMap()) {
                    fail(path + "/by-key", "expected a map of section name to colour");
                    return;
                }
                for (auto kv = it->second.begin(); kv != it->second.end(); ++kv) {
                    if (!kv->second.IsScalar()) {
                        fail(path + "/by-key", "colours must be scalars");
                        return;
                    }
                    keyed.colors[kv->first.as<std::string>()] = kv->second.as<std::string>();
                }
            } else {
                fail(path + "/" + key, "unknown key");
                return;
            }
        }
        out = std::move(keyed);
    }

    void stringList(const std::string& path, std::vector<std::string>& out) {
        YAML::Node node = lookup(path);
        if (!node.IsDefined() || node.IsNull()) return;
        if (!node.IsSequence()) {
            fail(path, "expected a list");
            return;
        }
        out.clear();
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                fail(path, "list entries must be scalars");
                return;
            }
            out.push_back(item.as<std::string>());
        }
    }

    YAML::Node lookup(const std::string& path) const {
        return navigateNode(_root, splitPath(path));
    }

    void fail(const std::string& path, const std::string& what) {
        if (!_error) {
            _error = Error("config key '" + path + "': " + what, ErrorCode::InvalidConfig);
        }
    }

    Result<void> status() const {
        if (_error) return Result<void>(*_error);
        return Ok();
    }

private:
    const YAML::Node& _root;
    std::optional<Error> _error;
};

} // namespace

// ─── Config ─────────────────────────────────────────────────────────────────

Config::Config(const YAML::Node& cmdOverrides) noexcept
    : _config(defaults()), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(cmdOverrides));
    if (auto res = config->init(configPath, ""); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::fromString(const std::string& yaml,
                                       const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(cmdOverrides));
    if (auto res = config->init("", yaml); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init(const std::string& configPath, const std::string& inlineYaml) noexcept {
    if (!inlineYaml.empty()) {
        if (auto res = loadString(inlineYaml); !res) {
            return res;
        }
    } else {
        std::string effectivePath = configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                effectivePath = xdgPath.string();
            }
        }
        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                return res;
            }
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && !_cmdOverrides.IsNull()) {
        applyOverrides(_cmdOverrides);
    }
    return Ok();
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open config file: " + path, ErrorCode::Io);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (auto res = loadString(ss.str()); !res) {
        return Err<void>("Config file " + path, res);
    }
    return Ok();
}

Result<void> Config::loadString(const std::string& yaml) {
    try {
        YAML::Node fileConfig = YAML::Load(yaml);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err<void>("config document must be a map", ErrorCode::InvalidConfig);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()), ErrorCode::Parse);
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }
    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        YAML::Node value = node[key];
        if (value.IsMap()) {
            applyEnvOverrides(value, fullPath);
            continue;
        }
        if (!value.IsScalar()) continue;

        std::string envVar = pathToEnvVar(fullPath);
        const char* val = std::getenv(envVar.c_str());
        if (val) {
            node[key] = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::applyOverrides(const YAML::Node& overrides) {
    if (!overrides.IsMap()) {
        ywarn("Ignoring command line overrides: not a map");
        return;
    }
    mergeNodes(_config, overrides);
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        YAML::Node value = it->second;
        YAML::Node existing = child(target, key);
        if (value.IsMap() && existing.IsDefined() && existing.IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    return navigateNode(_config, splitPath(path));
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node.IsDefined() && !node.IsNull();
}

Result<void> Config::checkUnknownKeys() const {
    // Recurse only where the default is a map; scalar and list defaults
    // accept any shape and are checked during typed extraction.
    std::function<Result<void>(const YAML::Node&, const YAML::Node&, const std::string&)> walk =
        [&](const YAML::Node& node, const YAML::Node& schema, const std::string& prefix) -> Result<void> {
            for (auto it = node.begin(); it != node.end(); ++it) {
                std::string key = it->first.as<std::string>();
                std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
                YAML::Node expected = child(schema, key);
                if (!expected.IsDefined()) {
                    return Err<void>("unknown config key '" + fullPath + "'", ErrorCode::InvalidConfig);
                }
                if (expected.IsMap() && it->second.IsMap()) {
                    if (auto res = walk(it->second, expected, fullPath); !res) {
                        return res;
                    }
                }
            }
            return Ok();
        };
    return walk(_config, defaults(), "");
}

Result<InputColumns> Config::inputColumns() const {
    if (auto res = checkUnknownKeys(); !res) {
        return Err<InputColumns>("Invalid configuration", res);
    }
    InputColumns columns;
    TreeReader reader(_config);
    reader.scalar("input/section-column", columns.section);
    reader.scalar("input/title-column", columns.title);
    reader.scalar("input/subtitle-column", columns.subtitle);
    reader.scalar("input/image-column", columns.image);
    if (auto res = reader.status(); !res) {
        return Err<InputColumns>("Invalid configuration", res);
    }
    return Ok(std::move(columns));
}

Result<LayoutConfig> Config::layoutConfig() const {
    if (auto res = checkUnknownKeys(); !res) {
        return Err<LayoutConfig>("Invalid configuration", res);
    }

    LayoutConfig cfg;
    TreeReader reader(_config);

    // page
    reader.scalar(KEY_PAGE_WIDTH, cfg.page.width);
    reader.edges("page/margin", cfg.page.margin);
    reader.scalar("page/background-color", cfg.page.backgroundColor);
    reader.scalar("page/font-family", cfg.page.fontFamily);

    // grid
    int elementsPerRow = static_cast<int>(cfg.grid.elementsPerRow);
    reader.scalar("grid/elements-per-row", elementsPerRow);
    if (elementsPerRow <= 0) {
        reader.fail("grid/elements-per-row", "must be positive");
    } else {
        cfg.grid.elementsPerRow = static_cast<uint32_t>(elementsPerRow);
    }
    reader.choice(KEY_FLOW, cfg.grid.flow,
                  {{"regular", FlowMode::Regular}, {"offset", FlowMode::Offset}});

    YAML::Node orderNode = reader.lookup(KEY_SECTION_ORDER);
    if (orderNode.IsSequence()) {
        std::vector<std::string> names;
        reader.stringList(KEY_SECTION_ORDER, names);
        cfg.grid.order = SectionOrder::explicitly(std::move(names));
    } else {
        auto kind = SectionOrder::Kind::Count;
        reader.choice(KEY_SECTION_ORDER, kind,
                      {{"name", SectionOrder::Kind::Name}, {"count", SectionOrder::Kind::Count}});
        cfg.grid.order = kind == SectionOrder::Kind::Name ? SectionOrder::byName()
                                                          : SectionOrder::byCount();
        std::string direction;
        bool hasDirection = reader.read(KEY_SECTION_ORDER_DIRECTION, direction);
        if (direction == "ascending") {
            cfg.grid.order.direction = SortDirection::Ascending;
        } else if (direction == "descending") {
            cfg.grid.order.direction = SortDirection::Descending;
        } else if (hasDirection && direction != "auto") {
            reader.fail(KEY_SECTION_ORDER_DIRECTION,
                        "'" + direction + "' is not one of auto|ascending|descending");
        }
    }
    reader.stringList(KEY_MERGE_SECTIONS, cfg.grid.mergeSections);

    // section-head
    reader.choice(KEY_HEAD_ORIENTATION, cfg.head.orientation,
                  {{"left", HeadOrientation::Left}, {"top", HeadOrientation::Top}});
    reader.scalar(KEY_HEAD_SIZE, cfg.head.size);
    reader.choice("section-head/vertical-align", cfg.head.align,
                  {{"top", VerticalAlign::Top}, {"center", VerticalAlign::Center},
                   {"bottom", VerticalAlign::Bottom}});
    reader.textStyle("section-head/text", cfg.head.text);
    reader.color("section-head/text-color", cfg.head.textColor);
    reader.scalar("section-head/background-color", cfg.head.backgroundColor);
    reader.edges("section-head/padding", cfg.head.padding);
    reader.scalar("section-head/show-totals", cfg.head.showTotals);

    // card
    reader.scalar(KEY_CARD_HEIGHT, cfg.card.height);
    reader.choice("card/title-position", cfg.card.titlePosition,
                  {{"top", TitlePosition::Top}, {"bottom", TitlePosition::Bottom}});
    reader.choice("card/text-anchor", cfg.card.anchor,
                  {{"start", TextAnchor::Start}, {"middle", TextAnchor::Middle},
                   {"end", TextAnchor::End}});
    reader.textStyle("card/title", cfg.card.title);
    reader.color("card/title/color", cfg.card.titleColor);
    reader.textStyle("card/subtitle", cfg.card.subtitle);
    reader.color("card/subtitle/color", cfg.card.subtitleColor);
    reader.color("card/circle-stroke-color", cfg.card.circleStrokeColor);
    reader.scalar("card/circle-stroke-width", cfg.card.circleStrokeWidth);
    reader.scalar("card/background-color", cfg.card.backgroundColor);
    reader.edges("card/margin", cfg.card.margin);
    reader.edges("card/circle-padding", cfg.card.circlePadding);
    reader.scalar("card/placeholder-color", cfg.card.placeholderColor);

    if (auto res = reader.status(); !res) {
        return Err<LayoutConfig>("Invalid configuration", res);
    }
    if (auto res = cfg.validate(); !res) {
        return Err<LayoutConfig>("Invalid configuration", res);
    }
    return Ok(std::move(cfg));
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "cardgrid" / "config.yaml";
}

} // namespace cardgrid
