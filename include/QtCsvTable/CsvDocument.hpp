/** \file CsvDocument.hpp
 *  Public façade: owns a parsed table, renders it to a PNG image or a PDF on a
 *  private worker thread, and persists the most recent result.
 */
#pragma once
#include "QtCsvTable/Export.hpp"
#include "QtCsvTable/Artifact.hpp"
#include "QtCsvTable/Error.hpp"
#include "QtCsvTable/ExportTarget.hpp"
#include "QtCsvTable/Table.hpp"
#include "QtCsvTable/TableBuilder.hpp"
#include "QtCsvTable/TextMeasurer.hpp"
#include <QObject>
#include <QString>
#include <QThreadPool>
#include <QUrl>
#include <atomic>
#include <map>
#include <memory>
#include <optional>

namespace QtCsvTable {

// Forward declarations & internal includes
namespace engine { class ImageRenderer; class PdfRenderer; }

/** Generation pipeline for one table.
 *  Thread-safety: all member functions must be called from the thread owning the
 *  object, except isLoading() and progress() which may be read from any thread.
 *  Generating requires a QGuiApplication (fonts and painting).
 */
class QTCSVTABLE_EXPORT CsvDocument : public QObject {
    Q_OBJECT
public:
    /** Default font size, in points, of both renderers. */
    static constexpr qreal DefaultFontSize = 12;

    explicit CsvDocument(Table table, ExportTarget target = ExportTarget::Png, QObject *parent = nullptr);
    ~CsvDocument() override;

    /** Parse raw text (see buildTable) into a new document. */
    static std::unique_ptr<CsvDocument> fromString(const QString &rawText, const BuildOptions &options = {}, ExportTarget target = ExportTarget::Png);
    /** Read, decode and parse a local file. nullptr (and error filled) if the file cannot be used. */
    static std::unique_ptr<CsvDocument> fromFile(const QString &path, const BuildOptions &options = {}, Error *error = nullptr);
    /** Fetch, decode and parse a URL. nullptr (and error filled) on failure. */
    static std::unique_ptr<CsvDocument> fromUrl(const QUrl &url, const BuildOptions &options = {}, Error *error = nullptr);

    const Table & table() const { return m_table; }
    /** Text the table was parsed from; empty when constructed from a Table. */
    const QString & rawText() const { return m_rawText; }

    /** Replace the columns. Rejected (returns false) while a generation is running. */
    bool setColumns(std::vector<Column> columns);
    /** Replace the rows. Rejected (returns false) while a generation is running. */
    bool setRows(std::vector<Row> rows);

    /** Target used by write(); set by every generate() that reaches a renderer, even if rendering then fails. */
    ExportTarget exportTarget() const { return m_target; }
    void setExportTarget(ExportTarget target) { m_target = target; }

    qreal fontSize(ExportTarget target) const;
    std::optional<int> maximumRowsPerUnit() const;
    /** Split rows into pages (PDF) or strips (PNG) of at most rows rows. */
    void setMaximumRowsPerUnit(std::optional<int> rows);
    PdfMetadata pdfMetadata() const;
    void setPdfMetadata(const PdfMetadata &metadata);
    /** Replace the font metrics provider of both renderers (nullptr restores the default). */
    void setTextMeasurer(std::shared_ptr<const TextMeasurer> measurer);
    /** Font family used to measure and draw; empty selects the system font. */
    void setFontFamily(const QString &family);

    bool isLoading() const { return m_loading.load(); }
    /** Completed fraction of the current (or last) generation, in [0,1]. */
    double progress() const { return m_progress.load(); }

    /** Render the table for target. fontSize, when given, becomes the renderer's font size;
     *  a non-positive or non-finite value fails with RenderFailure and is not kept.
     *  Blocks the caller in a local event loop while the worker renders, so queued
     *  progress updates are delivered meanwhile. Configuration changed meanwhile
     *  applies to the next call. Returns std::nullopt on failure
     *  (see lastError()); GenerationInProgress is returned without touching the state.
     */
    std::optional<Artifact> generate(std::optional<qreal> fontSize = std::nullopt, ExportTarget target = ExportTarget::Png);

    /** Most recent artifact generated for target, or nullptr. */
    const Artifact * latestArtifact(ExportTarget target) const;

    /** Write the most recent artifact of exportTarget() to path (created or overwritten)
     *  and return its bytes. std::nullopt with NothingToPersist if nothing was generated.
     */
    std::optional<QByteArray> write(const QString &path);

    /** Last error code set during an operation; std::nullopt after a success. */
    std::optional<ErrorCode> lastError() const { return m_lastError; }
    /** Human readable description of lastError(). */
    const QString & errorString() const { return m_errorString; }
    void clearError() { m_lastError.reset(); m_errorString.clear(); }

signals:
    void loadingChanged(bool loading);
    void progressChanged(double progress);

private:
    void setLoading(bool loading);
    void applyProgress(quint64 run, double value);
    void setError(ErrorCode code, const QString &message);

    Table m_table;
    QString m_rawText;
    ExportTarget m_target;
    std::shared_ptr<engine::ImageRenderer> m_imageRenderer; // shared_ptr works with incomplete type
    std::shared_ptr<engine::PdfRenderer> m_pdfRenderer;
    std::map<ExportTarget, Artifact> m_latest;
    std::atomic<bool> m_loading{false};
    std::atomic<double> m_progress{0.0};
    quint64 m_runCounter{0};
    quint64 m_activeRun{0}; // 0 when idle
    std::optional<ErrorCode> m_lastError;
    QString m_errorString;
    QThreadPool m_pool; // private one-thread render queue; last so it is destroyed (and drained) first
};

} // namespace QtCsvTable
