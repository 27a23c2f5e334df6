#include "main_window.hpp"

#include "audio/audio_loader.hpp"
#include "model/model_catalog.hpp"
#include "transcript/transcript_format.hpp"

#include <QCloseEvent>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QProgressBar>
#include <QPushButton>
#include <QSaveFile>
#include <QSignalBlocker>
#include <QStringList>
#include <QTextCharFormat>
#include <QTextCursor>
#include <QTextEdit>
#include <QTimer>
#include <QVBoxLayout>
#include <print>

namespace {

const QColor kBackground("#2b2b2b");
const QColor kHeader("#88c0d0");
const QColor kTimestamp("#a3be8c");
const QColor kText("#ffffff");

QTextCharFormat block_format(transcript::BlockStyle style) {
    QTextCharFormat fmt;
    QFont font("Courier", 11);
    font.setStyleHint(QFont::Monospace);
    fmt.setBackground(kBackground);

    switch (style) {
        case transcript::BlockStyle::Header:
            font.setPointSize(12);
            font.setBold(true);
            fmt.setForeground(kHeader);
            break;
        case transcript::BlockStyle::Timestamp:
            fmt.setForeground(kTimestamp);
            break;
        case transcript::BlockStyle::Text:
        case transcript::BlockStyle::Spacing:
            fmt.setForeground(kText);
            break;
    }
    fmt.setFont(font);
    return fmt;
}

QString audio_filter() {
    QStringList patterns;
    for (auto ext : audio::supported_extensions()) {
        patterns << QStringLiteral("*.") + QString::fromUtf8(ext.data(), static_cast<qsizetype>(ext.size()));
    }
    return QStringLiteral("Audio Files (%1);;All Files (*)").arg(patterns.join(' '));
}

} // namespace

MainWindow::MainWindow(Config config, bool verbose, QWidget* parent)
    : QMainWindow(parent), config_(std::move(config)), verbose_(verbose) {
    setWindowTitle("Whisper Transcription");
    resize(900, 700);
    build_ui();

    if (config_.history.enabled && !history_db_.open(HistoryDb::default_path())) {
        std::println(stderr, "Warning: history DB failed to open, history disabled");
    }

    auto transcriber = Transcriber::create(config_, verbose_);
    if (!transcriber) {
        set_status(QStringLiteral("Error initializing: %1").arg(QString::fromStdString(transcriber.error())));
        update_controls();
        return;
    }

    core_ = std::make_unique<AppCore>(
        std::move(*transcriber), &history_db_,
        // NotifyCallback: hop from the worker thread to the UI thread
        [this]() {
            QMetaObject::invokeMethod(this, [this]() { on_worker_complete(); }, Qt::QueuedConnection);
        },
        // ProgressCallback
        [this](const AppCore::Progress& p) {
            QMetaObject::invokeMethod(this, [this, p]() { on_progress(p); }, Qt::QueuedConnection);
        },
        verbose_);

    QTimer::singleShot(0, this, &MainWindow::start);
}

MainWindow::~MainWindow() {
    if (core_) core_->shutdown();
}

void MainWindow::build_ui() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);
    layout->setContentsMargins(20, 20, 20, 20);

    auto* title = new QLabel("Whisper Audio Transcription", central);
    QFont title_font("Helvetica", 24);
    title_font.setBold(true);
    title->setFont(title_font);
    title->setAlignment(Qt::AlignCenter);
    layout->addWidget(title);
    layout->addSpacing(20);

    // Model selection
    auto* model_box = new QGroupBox("Model Selection", central);
    auto* controls = new QHBoxLayout(model_box);

    auto* model_label = new QLabel("Model:", model_box);
    QFont header_font("Helvetica", 12);
    header_font.setBold(true);
    model_label->setFont(header_font);
    controls->addWidget(model_label);

    model_combo_ = new QComboBox(model_box);
    model_combo_->setMinimumWidth(160);
    for (const auto& entry : catalog::selectable(config_.model.default_name)) {
        QString name = QString::fromStdString(entry);
        if (auto info = catalog::find(entry)) {
            QString params = QString::fromUtf8(info->params.data(), static_cast<qsizetype>(info->params.size()));
            model_combo_->addItem(QStringLiteral("%1 (%2)").arg(name, params), name);
        } else {
            model_combo_->addItem(name, name);
        }
    }
    // The configured model always has an entry, so picking any other one
    // after a failed start fires a change
    int default_index = model_combo_->findData(QString::fromStdString(config_.model.default_name));
    model_combo_->setCurrentIndex(default_index >= 0 ? default_index : 0);
    controls->addWidget(model_combo_);
    controls->addStretch(1);

    select_button_ = new QPushButton("Select Audio File", model_box);
    select_button_->setEnabled(false);
    controls->addWidget(select_button_);

    cancel_button_ = new QPushButton("Cancel", model_box);
    cancel_button_->setEnabled(false);
    controls->addWidget(cancel_button_);

    layout->addWidget(model_box);
    layout->addSpacing(10);

    progress_ = new QProgressBar(central);
    progress_->setRange(0, 100);
    progress_->setValue(0);
    progress_->setTextVisible(false);
    layout->addWidget(progress_);

    // Output
    auto* output_box = new QGroupBox("Transcription Output", central);
    auto* output_layout = new QVBoxLayout(output_box);
    output_ = new QTextEdit(output_box);
    output_->setReadOnly(true);
    output_->setLineWrapMode(QTextEdit::WidgetWidth);
    output_->setStyleSheet(
        "QTextEdit { background-color: #2b2b2b; color: #ffffff; border: 0;"
        " selection-background-color: #404040; selection-color: #ffffff; padding: 10px; }");
    output_->setFont(QFont("Courier", 11));
    output_layout->addWidget(output_);

    save_button_ = new QPushButton("Save Transcript...", output_box);
    save_button_->setEnabled(false);
    output_layout->addWidget(save_button_, 0, Qt::AlignRight);
    layout->addWidget(output_box, 1);

    status_ = new QLabel(central);
    QFont status_font("Helvetica", 10);
    status_font.setItalic(true);
    status_->setFont(status_font);
    layout->addWidget(status_);

    setCentralWidget(central);

    connect(model_combo_, &QComboBox::currentIndexChanged, this, &MainWindow::on_model_changed);
    connect(select_button_, &QPushButton::clicked, this, &MainWindow::on_select_file);
    connect(save_button_, &QPushButton::clicked, this, &MainWindow::on_save_transcript);
    connect(cancel_button_, &QPushButton::clicked, this, [this]() {
        if (core_) core_->cancel();
    });
}

void MainWindow::start() {
    core_->select_model(model_combo_->currentData().toString().toStdString());
    set_status(QString::fromStdString(core_->status()));
    update_controls();
}

void MainWindow::on_model_changed(int index) {
    if (!core_ || index < 0) return;

    auto name = model_combo_->itemData(index).toString().toStdString();
    if (!core_->select_model(name)) {
        // Busy: put the combo back on the model that is loading or loaded
        QSignalBlocker block(model_combo_);
        int current = model_combo_->findData(QString::fromStdString(core_->session().model()));
        if (current >= 0) model_combo_->setCurrentIndex(current);
        return;
    }
    progress_->setValue(0);
    set_status(QString::fromStdString(core_->status()));
    update_controls();
}

void MainWindow::on_select_file() {
    if (!core_) return;

    QString path = QFileDialog::getOpenFileName(this, "Select Audio File", QString(), audio_filter());
    if (path.isEmpty()) return;

    core_->transcribe_file(path.toStdString());
    set_status(QString::fromStdString(core_->status()));
    update_controls();
}

void MainWindow::on_save_transcript() {
    if (!core_ || !core_->last_transcript()) return;

    QFileInfo source(QString::fromStdString(core_->last_file()));
    QString suggested = source.absolutePath() + "/" + source.completeBaseName() + ".txt";
    QString selected_filter;
    QString path = QFileDialog::getSaveFileName(
        this, "Save Transcript", suggested,
        "Text (*.txt);;SubRip (*.srt);;WebVTT (*.vtt);;JSON (*.json)", &selected_filter);
    if (path.isEmpty()) return;

    auto format = transcript::parse_format(QFileInfo(path).suffix().toLower().toStdString());
    if (!format) {
        if (selected_filter.startsWith("SubRip")) format = OutputFormat::Srt;
        else if (selected_filter.startsWith("WebVTT")) format = OutputFormat::Vtt;
        else if (selected_filter.startsWith("JSON")) format = OutputFormat::Json;
        else format = OutputFormat::Text;
        path += "." + QString::fromUtf8(transcript::format_extension(*format).data());
    }

    auto rendered = transcript::render(*core_->last_transcript(), *format);
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) ||
        file.write(rendered.data(), static_cast<qint64>(rendered.size())) < 0 ||
        !file.commit()) {
        QMessageBox::warning(this, "Save Transcript",
                             QStringLiteral("Could not save %1: %2").arg(path, file.errorString()));
        return;
    }
    set_status(QStringLiteral("Saved %1").arg(QFileInfo(path).fileName()));
}

void MainWindow::on_worker_complete() {
    if (!core_) return;

    if (core_->on_worker_complete()) {
        render_transcript(*core_->last_transcript());
    }

    progress_->setRange(0, 100);
    progress_->setValue(0);
    set_status(QString::fromStdString(core_->status()));
    update_controls();
}

void MainWindow::on_progress(const AppCore::Progress& p) {
    if (!core_ || !core_->session().busy()) return;

    if (p.percent < 0) {
        progress_->setRange(0, 0); // busy indicator
        return;
    }
    progress_->setRange(0, 100);
    progress_->setValue(p.percent);

    if (p.kind == AppCore::Progress::Kind::Download && p.total > 0) {
        set_status(QStringLiteral("Downloading %1 model... %2% of %3 MB")
                       .arg(QString::fromStdString(core_->session().model()))
                       .arg(p.percent)
                       .arg(static_cast<double>(p.total) / (1024.0 * 1024.0), 0, 'f', 1));
    }
}

void MainWindow::update_controls() {
    const bool ready = core_ && core_->session().can_select_file();
    const bool can_change = core_ && core_->session().can_change_model();
    const bool busy = core_ && core_->session().busy();

    select_button_->setEnabled(ready);
    model_combo_->setEnabled(can_change);
    cancel_button_->setEnabled(busy);
    save_button_->setEnabled(core_ && core_->last_transcript().has_value() && !busy);

    if (busy && core_->state() == SessionState::Transcribing) {
        progress_->setRange(0, 0);
    }
}

void MainWindow::render_transcript(const Transcript& t) {
    output_->clear();
    QTextCursor cursor = output_->textCursor();
    cursor.movePosition(QTextCursor::End);
    for (const auto& block : transcript::display_blocks(t)) {
        cursor.insertText(QString::fromStdString(block.content), block_format(block.style));
    }
    output_->moveCursor(QTextCursor::Start);
}

void MainWindow::set_status(const QString& text) {
    status_->setText(text);
}

void MainWindow::closeEvent(QCloseEvent* event) {
    if (core_) core_->shutdown();
    event->accept();
}
