// Shared helpers for the QtCsvTable tests
#pragma once
#include "QtCsvTable/TextMeasurer.hpp"
#include <QByteArray>
#include <QString>
#include <cstdlib>

namespace testsupport {

/** Monospace stand-in for font metrics: every character advances fontSize/2, lines are fontSize tall. */
class FixedAdvanceMeasurer : public QtCsvTable::TextMeasurer {
public:
    std::optional<QSizeF> measure(const QString &text, qreal fontSize) const override {
        return QSizeF(text.size() * fontSize / 2, fontSize);
    }
};

/** Fails on one given text, measures everything else like FixedAdvanceMeasurer. */
class FailingMeasurer : public FixedAdvanceMeasurer {
public:
    explicit FailingMeasurer(QString poison) : m_poison(std::move(poison)) {}
    std::optional<QSizeF> measure(const QString &text, qreal fontSize) const override {
        if(text == m_poison) return std::nullopt;
        return FixedAdvanceMeasurer::measure(text, fontSize);
    }
private:
    QString m_poison;
};

/** Drawing tests run headless. Call before constructing QGuiApplication. */
inline void useOffscreenPlatform() {
    if(qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) qputenv("QT_QPA_PLATFORM", QByteArray("offscreen"));
}

} // namespace testsupport
