#pragma once

#include <cardgrid/result.hpp>
#include <cardgrid/scene.h>
#include <memory>
#include <string>

namespace cardgrid::scene {

//=============================================================================
// SvgWriter - serialises a Scene to SVG 1.1 text
//
// Coordinates are written as given. Image hrefs are written as references
// and never opened.
//=============================================================================
class SvgWriter {
public:
    using Ptr = std::shared_ptr<SvgWriter>;

    struct Options {
        int precision = 3;            // max fractional digits, trailing zeros dropped
        bool pretty = true;           // one element per line, indented
    };

    static Result<Ptr> create();
    static Result<Ptr> create(const Options& options);

    Result<std::string> write(const Scene& scene) const;

    // Errors: Io when the file cannot be written
    Result<void> writeFile(const Scene& scene, const std::string& path) const;

    static std::string escape(const std::string& text);
    static std::string formatNumber(float value, int precision);

private:
    explicit SvgWriter(const Options& options) : _options(options) {}

    Options _options;
};

} // namespace cardgrid::scene
