#include <cardgrid/svg-writer.h>
#include <ytrace/ytrace.hpp>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <sstream>

namespace cardgrid::scene {

namespace {

const char* anchorName(TextAnchor anchor) {
    switch (anchor) {
        case TextAnchor::Start:  return "start";
        case TextAnchor::Middle: return "middle";
        case TextAnchor::End:    return "end";
    }
    return "start";
}

const char* baselineName(Baseline baseline) {
    return baseline == Baseline::Hanging ? "hanging" : "auto";
}

// Walks the scene tree and appends one element per node
class Emitter {
public:
    Emitter(std::ostringstream& out, int precision, bool pretty)
        : _out(out), _precision(precision), _pretty(pretty) {}

    void node(const Node& n) {
        std::visit([this](const auto& v) { emit(v); }, n.value);
    }

    void open(const std::string& text) {
        line(text);
        _depth++;
    }

    void close(const std::string& text) {
        _depth--;
        line(text);
    }

    void line(const std::string& text) {
        if (_pretty) {
            _out << std::string(_depth * 2, ' ') << text << '\n';
        } else {
            _out << text;
        }
    }

private:
    std::string num(float v) const { return SvgWriter::formatNumber(v, _precision); }

    std::string attr(const char* name, const std::string& value) const {
        return std::string(" ") + name + "=\"" + SvgWriter::escape(value) + "\"";
    }

    std::string attr(const char* name, float value) const {
        return std::string(" ") + name + "=\"" + num(value) + "\"";
    }

    std::string paint(const std::string& fill, const std::string& stroke, float strokeWidth) const {
        std::string s = attr("fill", fill.empty() ? "none" : fill);
        if (!stroke.empty() && strokeWidth > 0) {
            s += attr("stroke", stroke) + attr("stroke-width", strokeWidth);
        }
        return s;
    }

    void emit(const RectNode& r) {
        line("<rect" + attr("x", r.x) + attr("y", r.y) + attr("width", r.width) +
             attr("height", r.height) + paint(r.fill, r.stroke, r.strokeWidth) + "/>");
    }

    void emit(const CircleNode& c) {
        line("<circle" + attr("cx", c.cx) + attr("cy", c.cy) + attr("r", c.r) +
             paint(c.fill, c.stroke, c.strokeWidth) + "/>");
    }

    void emit(const ClippedImageNode& img) {
        std::string id = "clip-" + std::to_string(_nextClip++);
        open("<clipPath" + attr("id", id) + ">");
        line("<circle" + attr("cx", img.clipCx) + attr("cy", img.clipCy) + attr("r", img.clipR) + "/>");
        close("</clipPath>");
        line("<image" + attr("x", img.x) + attr("y", img.y) + attr("width", img.width) +
             attr("height", img.height) + attr("href", img.href) +
             attr("xlink:href", img.href) +
             attr("preserveAspectRatio", "xMidYMid slice") +
             attr("clip-path", "url(#" + id + ")") + "/>");
    }

    void emit(const TextNode& t) {
        std::string s = "<text" + attr("x", t.x) + attr("y", t.y) +
                        attr("font-family", t.fontFamily) + attr("font-size", t.fontSize) +
                        attr("font-weight", std::to_string(t.fontWeight));
        if (t.fontStyle != "normal") {
            s += attr("font-style", t.fontStyle);
        }
        s += attr("fill", t.fill) + attr("text-anchor", anchorName(t.anchor)) +
             attr("dominant-baseline", baselineName(t.baseline)) + ">" +
             SvgWriter::escape(t.text) + "</text>";
        line(s);
    }

    void emit(const GroupNode& g) {
        if (g.transform) {
            open("<g transform=\"translate(" + num(g.transform->dx) + "," +
                 num(g.transform->dy) + ")\">");
        } else {
            open("<g>");
        }
        for (const auto& child : g.children) {
            node(child);
        }
        close("</g>");
    }

    std::ostringstream& _out;
    int _precision;
    bool _pretty;
    int _depth = 0;
    uint32_t _nextClip = 0;
};

} // namespace

Result<SvgWriter::Ptr> SvgWriter::create() {
    return create(Options{});
}

Result<SvgWriter::Ptr> SvgWriter::create(const Options& options) {
    if (options.precision < 0 || options.precision > 9) {
        return Err<Ptr>("SvgWriter: precision must be within [0, 9]", ErrorCode::InvalidConfig);
    }
    return Ok(Ptr(new SvgWriter(options)));
}

std::string SvgWriter::escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&':  out += "&amp;"; break;
            case '<':  out += "&lt;"; break;
            case '>':  out += "&gt;"; break;
            case '"':  out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default:   out += c; break;
        }
    }
    return out;
}

std::string SvgWriter::formatNumber(float value, int precision) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", precision, static_cast<double>(value));
    std::string s = buf;
    if (s.find('.') != std::string::npos) {
        while (!s.empty() && s.back() == '0') s.pop_back();
        if (!s.empty() && s.back() == '.') s.pop_back();
    }
    if (s == "-0") s = "0";
    return s;
}

Result<std::string> SvgWriter::write(const Scene& scene) const {
    std::ostringstream out;
    Emitter emitter(out, _options.precision, _options.pretty);

    const std::string w = formatNumber(scene.width, _options.precision);
    const std::string h = formatNumber(scene.height, _options.precision);
    emitter.line("<?xml version=\"1.0\" encoding=\"UTF-8\"?>");
    emitter.open("<svg xmlns=\"http://www.w3.org/2000/svg\" "
                 "xmlns:xlink=\"http://www.w3.org/1999/xlink\" version=\"1.1\" width=\"" + w +
                 "\" height=\"" + h + "\" viewBox=\"0 0 " + w + " " + h + "\">");

    if (!scene.fonts.empty()) {
        emitter.open("<defs>");
        emitter.open("<style>");
        for (const auto& font : scene.fonts) {
            emitter.line("text { font-family: '" + escape(font.family) + "', sans-serif; }");
        }
        emitter.close("</style>");
        emitter.close("</defs>");
    }

    emitter.node(Node{scene.root});
    emitter.close("</svg>");
    return Ok(out.str());
}

Result<void> SvgWriter::writeFile(const Scene& scene, const std::string& path) const {
    auto svg = write(scene);
    if (!svg) {
        return Err("SvgWriter: failed to serialise scene", svg);
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Err("SvgWriter: cannot open " + path + " for writing", ErrorCode::Io);
    }
    out << *svg;
    if (!out) {
        return Err("SvgWriter: failed to write " + path, ErrorCode::Io);
    }
    yinfo("SvgWriter: wrote {} ({} bytes)", path, svg->size());
    return Ok();
}

} // namespace cardgrid::scene
