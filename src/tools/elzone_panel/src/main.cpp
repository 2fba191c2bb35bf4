#include "color/log_curve.hpp"
#include "color/zone_classifier.hpp"
#include "color/zone_table.hpp"
#include "core/log.hpp"
#include "draw/painter.hpp"
#include "image/qt_bridge.hpp"
#include "panel/engine.hpp"
#include "panel/zone_inset.hpp"

#include <QtGui/QGuiApplication>
#include <QtGui/QImage>
#include <QtGui/QImageReader>

#include <iostream>
#include <string>

namespace {
    constexpr int kJpegQuality = 95;

    void usage() {
        std::cout << "Usage: elzone_panel [--curve NAME] [--size WxH] [--scope WxH] [--painter auto|qt|raster]\n"
                     "                    [--inset PATH] [--json] [--verbose] <input-image> <output.jpg>\n"
                     "Curves:";
        for(auto c : elz::color::supported_log_curves()) std::cout << ' ' << elz::color::log_curve_name(c);
        std::cout << '\n';
    }

    bool save_jpeg(const QImage& img, const std::string& path) {
        return img.save(QString::fromStdString(path), "JPG", kJpegQuality);
    }
}

int main(int argc, char** argv) {
    QGuiApplication app(argc, argv);
    using namespace elz;

    panel::EngineConfig config;
    std::string input;
    std::string output;
    std::string inset_path;

    for(int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        auto next = [&]() -> std::string { return (i + 1 < argc) ? std::string(argv[++i]) : std::string(); };
        if(a == "--json") { log::set_json_mode(true); continue; }
        if(a == "--verbose") { log::set_level(log::Level::Debug); continue; }
        if(a == "--help" || a == "-h") { usage(); return 0; }
        if(a == "--curve") { config.curve = color::parse_log_curve(next()); continue; }
        if(a == "--size" || a == "--scope") {
            const std::string v = next();
            const auto size = panel::parse_size(v);
            if(!size) { std::cerr << "Bad " << a << " value '" << v << "'\n"; return 1; }
            (a == "--size" ? config.output_size : config.scope_size) = *size;
            continue;
        }
        if(a == "--painter") {
            const std::string v = next();
            if(v == "qt") config.painter = draw::Backend::Qt;
            else if(v == "raster") config.painter = draw::Backend::Raster;
            else config.painter = draw::Backend::Auto;
            continue;
        }
        if(a == "--inset") { inset_path = next(); continue; }
        if(input.empty()) input = a; else output = a;
    }
    if(input.empty() || output.empty()) { usage(); return 1; }

    log::info("elzone_panel: " + input + " (" + color::log_curve_display_name(config.curve) + ")");

    QImageReader reader(QString::fromStdString(input));
    reader.setAutoTransform(true);
    const QImage source = reader.read();
    if(source.isNull()) {
        log::error("Cannot read " + input + ": " + reader.errorString().toStdString());
        return 2;
    }
    auto frame = image::frame_from_qimage(source);
    if(!frame) {
        log::error("Cannot use " + input + ": " + frame.error().message);
        return 2;
    }

    const color::ZoneTable zones;
    const auto painter = draw::make_painter(config.painter);
    const panel::Engine engine(config, zones, *painter);

    auto layout = engine.process(*frame);
    if(!layout) {
        log::error(std::string("Processing failed (") + core::error_code_name(layout.error().code) + "): " +
                   layout.error().message);
        return 3;
    }
    if(!save_jpeg(image::to_qimage(layout->canvas), output)) {
        log::error("Cannot write " + output);
        return 4;
    }
    log::info("Wrote " + output);

    if(!inset_path.empty()) {
        const image::Frame linear = color::decode_frame(*frame, engine.config().curve);
        const image::Frame zone_map = color::ZoneClassifier(zones).classify(linear);
        if(!save_jpeg(image::to_qimage(panel::make_zone_inset(zone_map)), inset_path)) {
            log::error("Cannot write " + inset_path);
            return 4;
        }
        log::info("Wrote " + inset_path);
    }
    return 0;
}
