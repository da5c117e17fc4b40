#include "QtCsvTable/CsvDocument.hpp"
#include "QtCsvTable/Source.hpp"
#include "engine/ImageRenderer.hpp"
#include "engine/PdfRenderer.hpp"
#include <QDebug>
#include <QElapsedTimer>
#include <QEventLoop>
#include <QFile>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>
#include <cmath>

namespace QtCsvTable {

namespace {
// Result handed back by the worker; errors travel as text, never as exceptions
struct RenderOutcome {
    std::optional<Artifact> artifact;
    QString error;
};
} // namespace

CsvDocument::CsvDocument(Table table, ExportTarget target, QObject *parent)
    : QObject(parent),
      m_table(std::move(table)),
      m_target(target),
      m_imageRenderer(std::make_shared<engine::ImageRenderer>(DefaultFontSize)),
      m_pdfRenderer(std::make_shared<engine::PdfRenderer>(DefaultFontSize)) {
    m_pool.setMaxThreadCount(1);
}

CsvDocument::~CsvDocument() {
    m_pool.waitForDone();
}

std::unique_ptr<CsvDocument> CsvDocument::fromString(const QString &rawText, const BuildOptions &options, ExportTarget target) {
    auto doc = std::make_unique<CsvDocument>(buildTable(rawText, options), target);
    doc->m_rawText = rawText;
    return doc;
}

std::unique_ptr<CsvDocument> CsvDocument::fromFile(const QString &path, const BuildOptions &options, Error *error) {
    auto text = readLocalText(path, error);
    if(!text) return nullptr;
    return fromString(*text, options);
}

std::unique_ptr<CsvDocument> CsvDocument::fromUrl(const QUrl &url, const BuildOptions &options, Error *error) {
    auto text = readNetworkText(url, error);
    if(!text) return nullptr;
    return fromString(*text, options);
}

bool CsvDocument::setColumns(std::vector<Column> columns) {
    if(isLoading()) { qWarning("CsvDocument: columns not replaced, generation in progress"); return false; }
    m_table.setColumns(std::move(columns));
    return true;
}

bool CsvDocument::setRows(std::vector<Row> rows) {
    if(isLoading()) { qWarning("CsvDocument: rows not replaced, generation in progress"); return false; }
    m_table.setRows(std::move(rows));
    return true;
}

qreal CsvDocument::fontSize(ExportTarget target) const {
    switch(target) {
    case ExportTarget::Png: return m_imageRenderer->fontSize();
    case ExportTarget::Pdf: return m_pdfRenderer->fontSize();
    }
    return DefaultFontSize;
}

std::optional<int> CsvDocument::maximumRowsPerUnit() const { return m_imageRenderer->maximumRowsPerUnit(); }

void CsvDocument::setMaximumRowsPerUnit(std::optional<int> rows) {
    m_imageRenderer->setMaximumRowsPerUnit(rows);
    m_pdfRenderer->setMaximumRowsPerUnit(rows);
}

PdfMetadata CsvDocument::pdfMetadata() const { return m_pdfRenderer->metadata(); }

void CsvDocument::setPdfMetadata(const PdfMetadata &metadata) { m_pdfRenderer->setMetadata(metadata); }

void CsvDocument::setTextMeasurer(std::shared_ptr<const TextMeasurer> measurer) {
    m_imageRenderer->setTextMeasurer(measurer);
    m_pdfRenderer->setTextMeasurer(std::move(measurer));
}

void CsvDocument::setFontFamily(const QString &family) {
    m_imageRenderer->setFontFamily(family);
    m_pdfRenderer->setFontFamily(family);
}

const Artifact * CsvDocument::latestArtifact(ExportTarget target) const {
    auto it = m_latest.find(target);
    return it == m_latest.end() ? nullptr : &it->second;
}

void CsvDocument::setLoading(bool loading) {
    m_loading.store(loading);
    emit loadingChanged(loading);
}

void CsvDocument::applyProgress(quint64 run, double value) {
    // late updates of a finished run and out-of-order values are dropped
    if(run == 0 || run != m_activeRun) return;
    value = qBound(0.0, value, 1.0);
    if(value <= m_progress.load()) return;
    m_progress.store(value);
    emit progressChanged(value);
}

void CsvDocument::setError(ErrorCode code, const QString &message) {
    m_lastError = code;
    m_errorString = message;
}

std::optional<Artifact> CsvDocument::generate(std::optional<qreal> fontSize, ExportTarget target) {
    bool idle = false;
    if(!m_loading.compare_exchange_strong(idle, true)) {
        qWarning("CsvDocument: generation already in progress");
        setError(ErrorCode::GenerationInProgress, QStringLiteral("generation already in progress"));
        return std::nullopt;
    }
    m_progress.store(0.0);
    emit loadingChanged(true);
    emit progressChanged(0.0);

    // every exit path below goes through finish(), which returns to Idle
    auto finish = [this](std::optional<Artifact> result) {
        m_activeRun = 0;
        setLoading(false);
        return result;
    };

    if(m_table.isEmpty()) {
        qWarning("CsvDocument: nothing to render (%d columns, %d rows)", m_table.columnCount(), m_table.rowCount());
        setError(ErrorCode::EmptyData, QStringLiteral("table has %1 columns and %2 rows").arg(m_table.columnCount()).arg(m_table.rowCount()));
        return finish(std::nullopt);
    }

    std::shared_ptr<engine::Renderer> renderer;
    switch(target) {
    case ExportTarget::Png: renderer = m_imageRenderer; break;
    case ExportTarget::Pdf: renderer = m_pdfRenderer; break;
    }
    if(!renderer) {
        qWarning("CsvDocument: unsupported export target %d", static_cast<int>(target));
        setError(ErrorCode::UnsupportedExportTarget, QStringLiteral("no renderer for export target %1").arg(static_cast<int>(target)));
        return finish(std::nullopt);
    }
    if(fontSize && !(*fontSize > 0 && std::isfinite(*fontSize))) {
        qWarning("CsvDocument: rejected font size %g", *fontSize);
        setError(ErrorCode::RenderFailure, QStringLiteral("invalid font size %1").arg(*fontSize));
        return finish(std::nullopt);
    }
    if(fontSize) renderer->setFontSize(*fontSize);
    m_target = target;

    const quint64 run = ++m_runCounter;
    m_activeRun = run;
    QElapsedTimer timer;
    timer.start();

    // The worker only sees copies: setters called from the waiting loop below
    // affect the next run. Progress is posted back to this object; queued calls
    // to a destroyed receiver are discarded by Qt.
    std::shared_ptr<const engine::Renderer> job = renderer->clone();
    const Table snapshot = m_table;
    auto onProgress = [this, run](double value) {
        QMetaObject::invokeMethod(this, [this, run, value]{ applyProgress(run, value); }, Qt::QueuedConnection);
    };
    QFuture<RenderOutcome> future = QtConcurrent::run(&m_pool, [job, snapshot, onProgress]() {
        RenderOutcome outcome;
        outcome.artifact = job->make(snapshot, onProgress, &outcome.error);
        return outcome;
    });

    // Progress events are posted before the watcher's finished notification,
    // so all of them are delivered by this loop.
    QFutureWatcher<RenderOutcome> watcher;
    QEventLoop loop;
    connect(&watcher, &QFutureWatcherBase::finished, &loop, &QEventLoop::quit);
    watcher.setFuture(future);
    loop.exec();

    RenderOutcome outcome = future.result();
    if(!outcome.artifact) {
        qWarning("CsvDocument: %s generation failed: %s", qUtf8Printable(fileExtension(target)), qUtf8Printable(outcome.error));
        setError(ErrorCode::RenderFailure, outcome.error);
        return finish(std::nullopt);
    }
    applyProgress(run, 1.0);
    m_latest.insert_or_assign(target, *outcome.artifact);
    clearError();
    qDebug("CsvDocument: %s generated in %lld ms (%d rows)", qUtf8Printable(fileExtension(target)), timer.elapsed(), m_table.rowCount());
    return finish(std::move(outcome.artifact));
}

std::optional<QByteArray> CsvDocument::write(const QString &path) {
    const Artifact *artifact = latestArtifact(m_target);
    if(!artifact) {
        setError(ErrorCode::NothingToPersist, QStringLiteral("no %1 generated yet").arg(fileExtension(m_target)));
        return std::nullopt;
    }
    QByteArray bytes;
    switch(artifact->target()) {
    case ExportTarget::Png: bytes = artifact->toBytes(); break;
    case ExportTarget::Pdf: bytes = artifact->document()->data; break;
    }
    if(bytes.isEmpty()) {
        setError(ErrorCode::WriteFailed, QStringLiteral("could not encode the %1 output").arg(fileExtension(m_target)));
        return std::nullopt;
    }
    QFile file(path);
    if(!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(bytes) != bytes.size()) {
        qWarning("CsvDocument: cannot write %s: %s", qUtf8Printable(path), qUtf8Printable(file.errorString()));
        setError(ErrorCode::WriteFailed, QStringLiteral("cannot write %1: %2").arg(path, file.errorString()));
        return std::nullopt;
    }
    clearError();
    return bytes;
}

} // namespace QtCsvTable
