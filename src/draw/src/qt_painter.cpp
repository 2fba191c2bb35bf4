#include "draw/qt_painter.hpp"
#include "core/log.hpp"

#include <QtGui/QColor>
#include <QtGui/QFontDatabase>
#include <QtGui/QFontMetrics>
#include <QtGui/QGuiApplication>
#include <QtGui/QImage>
#include <QtGui/QPainter>
#include <QtGui/QPen>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <string>

namespace elz::draw {

namespace {
    // Preferred label fonts, first installed one wins
    const char* const kMonospaceFamilies[] = {
        "Courier New", "Monaco", "Menlo", "DejaVu Sans Mono", "Liberation Mono"
    };
    constexpr int kLabelPixelSize = 12;

    QFont pick_label_font() {
        const QStringList installed = QFontDatabase::families();
        for(const char* family : kMonospaceFamilies) {
            if(installed.contains(QString::fromLatin1(family))) {
                QFont f(QString::fromLatin1(family));
                f.setPixelSize(kLabelPixelSize);
                return f;
            }
        }
        QFont f = QFontDatabase::systemFont(QFontDatabase::FixedFont);
        f.setStyleHint(QFont::Monospace);
        f.setPixelSize(kLabelPixelSize);
        log::info(std::string("No preferred monospace font installed, using ") + f.family().toStdString());
        return f;
    }

    QImage wrap(image::Canvas& canvas) {
        return QImage(canvas.data.data(), canvas.width, canvas.height, canvas.stride(), QImage::Format_RGB888);
    }

    QColor to_qcolor(image::Rgb8 c) { return QColor(c.r, c.g, c.b); }
}

QtPainter::QtPainter()
    : font_(pick_label_font()) {}

bool QtPainter::usable() noexcept {
    return QGuiApplication::instance() != nullptr;
}

void QtPainter::draw_line(image::Canvas& canvas, image::Point a, image::Point b, image::Rgb8 color) const {
    if(canvas.empty()) return;
    QImage img = wrap(canvas);
    QPainter painter(&img);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setPen(QPen(to_qcolor(color), 1));
    painter.drawLine(a.x, a.y, b.x, b.y);
}

void QtPainter::draw_circle(image::Canvas& canvas, image::Point center, int32_t radius,
                            image::Rgb8 color, bool filled) const {
    if(canvas.empty()) return;
    QImage img = wrap(canvas);
    QPainter painter(&img);
    painter.setRenderHint(QPainter::Antialiasing);
    if(filled) {
        painter.setPen(Qt::NoPen);
        painter.setBrush(to_qcolor(color));
    } else {
        painter.setPen(QPen(to_qcolor(color), 1));
        painter.setBrush(Qt::NoBrush);
    }
    painter.drawEllipse(QPoint(center.x, center.y), radius, radius);
}

TextExtent QtPainter::measure_text(std::string_view text) const {
    const QFontMetrics fm(font_);
    const QString s = QString::fromUtf8(text.data(), static_cast<int>(text.size()));
    return {fm.horizontalAdvance(s), fm.height()};
}

void QtPainter::draw_text(image::Canvas& canvas, image::Point top_left, std::string_view text,
                          image::Rgb8 color, const image::Rect& clip) const {
    if(canvas.empty() || text.empty() || clip.empty()) return;
    QImage img = wrap(canvas);
    QPainter painter(&img);
    painter.setClipRect(clip.x, clip.y, clip.width, clip.height);
    painter.setFont(font_);
    painter.setPen(to_qcolor(color));
    const QFontMetrics fm(font_);
    painter.drawText(top_left.x, top_left.y + fm.ascent(),
                     QString::fromUtf8(text.data(), static_cast<int>(text.size())));
}

} // namespace elz::draw
