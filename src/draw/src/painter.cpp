#include "draw/painter.hpp"
#include "draw/raster_painter.hpp"
#include "core/log.hpp"

#ifndef ELZ_HAVE_QT
#define ELZ_HAVE_QT 0
#endif

#if ELZ_HAVE_QT
#include "draw/qt_painter.hpp"
#endif

namespace elz::draw {

bool qt_backend_built() noexcept { return ELZ_HAVE_QT != 0; }

std::unique_ptr<Painter> make_painter(Backend preferred) {
    if(preferred != Backend::Raster) {
#if ELZ_HAVE_QT
        if(QtPainter::usable()) {
            return std::make_unique<QtPainter>();
        }
        log::warn_once("draw.qt_unusable",
                       "No QGuiApplication running; using raster painter (aliased graticule, built-in font)");
#else
        log::warn_once("draw.qt_missing",
                       "Built without Qt; using raster painter (aliased graticule, built-in font)");
#endif
    }
    return std::make_unique<RasterPainter>();
}

} // namespace elz::draw
