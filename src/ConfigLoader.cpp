// ConfigLoader.cpp – Parses the registry XML configuration into a RegistryConfig.
// Uses pugixml for robust, zero-copy XML parsing.

#include "RegistryCodec/ConfigLoader.hpp"

#include <pugixml.hpp>

#include <charconv>
#include <cstdint>
#include <cstring>
#include <string>
#include <utility>

namespace registry {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static uint64_t parseU64(const char* s, const char* ctx) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || ptr != s + std::strlen(s))
        throw ConfigLoadError(std::string(ctx) + ": cannot parse uint '" + s + "'");
    return v;
}

// ─── Parse a single <Field> or <Spare> node into a FieldDef ──────────────────

static FieldDef parseFieldNode(pugi::xml_node node) {
    FieldDef f;

    if (strcmp(node.name(), "Spare") == 0) {
        f.is_spare = true;
        f.width    = parseU64(node.attribute("width").as_string("0"), "Spare.width");
        return f;
    }

    // <Field>
    f.name  = node.attribute("name").as_string("");
    f.width = parseU64(node.attribute("width").as_string("0"), "Field.width");
    if (f.name.empty())
        throw ConfigLoadError("<Field> missing 'name' attribute");
    return f;
}

static std::vector<FieldDef> parseColumns(pugi::xml_node node) {
    std::vector<FieldDef> cols;
    for (auto child : node.children()) {
        if (strcmp(child.name(), "Field") == 0 || strcmp(child.name(), "Spare") == 0)
            cols.push_back(parseFieldNode(child));
    }
    return cols;
}

// ─── Parse <Layout> ───────────────────────────────────────────────────────────

static LayoutDef parseLayout(pugi::xml_node node) {
    LayoutDef def;
    def.total_width = parseU64(node.attribute("width").as_string("0"), "Layout.width");

    auto head = node.child("Head");
    if (!head)
        throw ConfigLoadError("<Layout> has no <Head> element");
    def.head = parseColumns(head);
    if (def.head.empty())
        throw ConfigLoadError("<Head> declares no columns");

    // <Officers> is optional: a layout without an officer tail is valid.
    if (auto officers = node.child("Officers")) {
        def.max_officers = parseU64(officers.attribute("max").as_string("0"), "Officers.max");
        def.officer      = parseColumns(officers);
    }
    return def;
}

// ─── Parse <Normalizer> ───────────────────────────────────────────────────────

static NormalizerConfig parseNormalizer(pugi::xml_node node) {
    NormalizerConfig cfg;
    for (auto s : node.children("Suffix")) {
        auto token = s.attribute("token");
        if (!token)
            throw ConfigLoadError("<Suffix> missing 'token' attribute");
        cfg.suffixes.emplace_back(token.as_string());
    }
    return cfg;
}

// ─── Parse <Batch> ────────────────────────────────────────────────────────────

static BatchConfig parseBatch(pugi::xml_node node) {
    BatchConfig cfg;
    if (auto a = node.attribute("chunk"); a)
        cfg.chunk_size = parseU64(a.as_string(), "Batch.chunk");
    if (cfg.chunk_size == 0)
        throw ConfigLoadError("<Batch chunk=\"...\"> must be positive");
    if (auto a = node.attribute("prefix"); a)
        cfg.prefix = a.as_string();
    if (cfg.prefix.empty())
        throw ConfigLoadError("<Batch prefix=\"...\"> must not be empty");
    return cfg;
}

// ─── Document root ────────────────────────────────────────────────────────────

static RegistryConfig parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("Registry");
    if (!root)
        throw ConfigLoadError("XML root element must be <Registry>");

    auto layout_node = root.child("Layout");
    if (!layout_node)
        throw ConfigLoadError("No <Layout> element found");

    RegistryConfig cfg{
        root.attribute("name").as_string(""),
        root.attribute("edition").as_string(""),
        FieldLayout(parseLayout(layout_node)),
        NormalizerConfig::defaults(),
        BatchConfig{},
    };

    if (auto n = root.child("Normalizer"))
        cfg.normalizer = parseNormalizer(n);
    if (auto b = root.child("Batch"))
        cfg.batch = parseBatch(b);

    return cfg;
}

// ─── Public entry points ──────────────────────────────────────────────────────

RegistryConfig defaultConfig() {
    return RegistryConfig{"cordata", "", cordataLayout(), NormalizerConfig::defaults(), BatchConfig{}};
}

RegistryConfig loadConfig(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return parseDocument(doc);
}

RegistryConfig parseConfig(std::string_view xml_text) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml_text.data(), xml_text.size());
    if (!result)
        throw ConfigLoadError(std::string("Failed to parse XML text: ") + result.description());
    return parseDocument(doc);
}

} // namespace registry
